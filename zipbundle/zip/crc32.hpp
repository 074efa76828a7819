#pragma once

#include <cstdint>
#include <span>

namespace zipbundle::zip {

// CRC-32 (IEEE 802.3, reflected 0xEDB88320) as stored in ZIP headers.
std::uint32_t crc32(std::span<const std::uint8_t> data);

// Continue a running checksum; start with `crc = 0`.
std::uint32_t crc32_update(std::uint32_t crc, std::span<const std::uint8_t> data);

} // namespace zipbundle::zip
