#pragma once

#include "archive.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace zipbundle::zip {

// Sizes that decide an entry's footprint in the archive.
struct EntryExtent {
    std::uint64_t nameLength{0};
    std::uint64_t payloadSize{0};
};

// Byte positions of every region, computed before anything is encoded.
struct ArchiveLayout {
    std::vector<std::uint32_t> localHeaderOffsets;  // One per entry.
    std::uint32_t directoryOffset{0};
    std::uint32_t directorySize{0};
    std::uint64_t totalSize{0};
};

// Folds the running offset over the entries in order and checks that every
// offset and size fits its 32-bit (or 16-bit) field.
// On failure returns false and fills outError with SizeLimitExceeded.
bool plan_layout(std::span<const EntryExtent> extents,
                 ArchiveLayout* outLayout,
                 ArchiveError* outError = nullptr);

// Builds the complete archive: local entries, central directory, trailer.
// Pure: the archive is not modified and identical inputs give identical bytes.
// @return Archive bytes, or std::nullopt with outError filled.
std::optional<std::vector<std::uint8_t>> assemble(const Archive& archive,
                                                  const ArchiveOptions& options = {},
                                                  ArchiveError* outError = nullptr);

// assemble() then write the result to `path`, replacing any existing file.
// A partially written file is removed on failure.
bool write_archive_file(const Archive& archive,
                        const std::filesystem::path& path,
                        const ArchiveOptions& options = {},
                        ArchiveError* outError = nullptr);

} // namespace zipbundle::zip
