#include "crc32.hpp"

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace zipbundle::zip {

std::uint32_t crc32_update(std::uint32_t crc, std::span<const std::uint8_t> data) {
    uLong value = crc;

    // zlib takes uInt lengths; feed large buffers in chunks.
    const std::uint8_t* ptr = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        const std::size_t chunk = std::min<std::size_t>(left, std::numeric_limits<uInt>::max());
        value = ::crc32(value, ptr, static_cast<uInt>(chunk));
        ptr += chunk;
        left -= chunk;
    }

    return static_cast<std::uint32_t>(value);
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    return crc32_update(0, data);
}

} // namespace zipbundle::zip
