#pragma once

/**
 * @file zip_test_utils.hpp
 * @brief Byte-level helpers and temporary directories for archive tests.
 */

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace test_helpers {

// =============================================================================
// Byte helpers
// =============================================================================

/** @brief Bytes of a string, without terminator. */
inline std::vector<std::uint8_t> bytes_of(std::string_view s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

/** @brief Little-endian u16 at `offset`. */
inline std::uint16_t le16(const std::vector<std::uint8_t>& data, std::size_t offset) {
    return static_cast<std::uint16_t>(data.at(offset) | (data.at(offset + 1) << 8));
}

/** @brief Little-endian u32 at `offset`. */
inline std::uint32_t le32(const std::vector<std::uint8_t>& data, std::size_t offset) {
    return static_cast<std::uint32_t>(data.at(offset))
         | (static_cast<std::uint32_t>(data.at(offset + 1)) << 8)
         | (static_cast<std::uint32_t>(data.at(offset + 2)) << 16)
         | (static_cast<std::uint32_t>(data.at(offset + 3)) << 24);
}

/** @brief Deterministic pseudo-random payload of `size` bytes. */
inline std::vector<std::uint8_t> pattern_bytes(std::size_t size, std::uint32_t seed) {
    std::vector<std::uint8_t> out(size);
    std::uint32_t x = seed * 2654435761u + 1;
    for (auto& b : out) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        b = static_cast<std::uint8_t>(x);
    }
    return out;
}

// =============================================================================
// Filesystem helpers
// =============================================================================

/** @brief Temporary directory removed on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "zipbundle_test") {
        path_ = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(std::rand()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    void create_file(const std::string& relativePath, const std::string& content) {
        std::filesystem::path fullPath = path_ / relativePath;
        std::filesystem::create_directories(fullPath.parent_path());
        std::ofstream ofs(fullPath, std::ios::binary);
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    std::vector<std::uint8_t> read_file(const std::string& relativePath) const {
        std::ifstream ifs(path_ / relativePath, std::ios::binary);
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path path_;
};

} // namespace test_helpers
