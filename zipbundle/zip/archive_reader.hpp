#pragma once

#include "archive.hpp"
#include "zip_format.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace zipbundle::zip {

// ZIP archive reader.
// Loads an archive into memory, indexes its central directory and extracts
// stored entries with CRC verification.
class ArchiveReader {
public:
    ArchiveReader();
    ~ArchiveReader();

    // Non-copyable, movable.
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ArchiveReader(ArchiveReader&& other) noexcept;
    ArchiveReader& operator=(ArchiveReader&& other) noexcept;

    // Open a ZIP file from disk.
    // @return true on success; see last_error() otherwise.
    bool open(const std::filesystem::path& archivePath);

    // Open an archive already held in memory (e.g., the result of assemble()).
    bool open_memory(std::vector<std::uint8_t> data);

    // Close the archive and release resources.
    void close();

    bool is_open() const { return open_; }

    // Get archive file path (empty for in-memory archives).
    const std::filesystem::path& path() const { return archivePath_; }

    // Central directory record, as stored.
    struct FileEntry {
        std::string name;
        std::uint16_t flags{0};
        std::uint16_t method{0};
        DosDateTime modified{};
        std::uint32_t crc32{0};
        std::uint32_t compressedSize{0};
        std::uint32_t size{0};
        std::uint32_t localHeaderOffset{0};
    };

    // Entries in central directory order.
    const std::vector<FileEntry>& entries() const { return entries_; }

    bool has_file(const std::string& path) const;

    // Get file entry by path. First match wins for duplicated names.
    const FileEntry* get_entry(const std::string& path) const;

    // Extract file contents and verify the CRC-32.
    // @return File data, or std::nullopt on error (see last_error()).
    std::optional<std::vector<std::uint8_t>> extract(const std::string& path);

    // List files in a directory within the archive.
    // @param dirPath  Directory path (e.g., "images/"). Empty string for root.
    // @return Sorted entry names (files end without '/', dirs end with '/').
    std::vector<std::string> list_directory(const std::string& dirPath) const;

    // End-of-directory fields.
    std::uint32_t directory_offset() const { return directoryOffset_; }
    std::uint32_t directory_size() const { return directorySize_; }

    const ArchiveError& last_error() const { return lastError_; }

private:
    bool parse();
    bool read_end_of_directory(std::uint16_t* outEntryCount);
    bool read_central_directory(std::uint16_t entryCount);
    std::optional<std::vector<std::uint8_t>> extract_entry(const FileEntry& entry);

    std::filesystem::path archivePath_;
    std::vector<std::uint8_t> data_;
    std::vector<FileEntry> entries_;
    std::unordered_map<std::string, std::size_t> pathIndex_;  // path -> index in entries_

    std::uint32_t directoryOffset_{0};
    std::uint32_t directorySize_{0};
    bool open_{false};

    ArchiveError lastError_;
};

} // namespace zipbundle::zip
