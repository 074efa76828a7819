#include "archive_reader.hpp"

#include "../core/byte_buffer.hpp"
#include "crc32.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace zipbundle::zip {

ArchiveReader::ArchiveReader() = default;

ArchiveReader::~ArchiveReader() {
    close();
}

ArchiveReader::ArchiveReader(ArchiveReader&& other) noexcept
    : archivePath_(std::move(other.archivePath_))
    , data_(std::move(other.data_))
    , entries_(std::move(other.entries_))
    , pathIndex_(std::move(other.pathIndex_))
    , directoryOffset_(other.directoryOffset_)
    , directorySize_(other.directorySize_)
    , open_(other.open_)
    , lastError_(std::move(other.lastError_)) {
    other.open_ = false;
}

ArchiveReader& ArchiveReader::operator=(ArchiveReader&& other) noexcept {
    if (this != &other) {
        close();
        archivePath_ = std::move(other.archivePath_);
        data_ = std::move(other.data_);
        entries_ = std::move(other.entries_);
        pathIndex_ = std::move(other.pathIndex_);
        directoryOffset_ = other.directoryOffset_;
        directorySize_ = other.directorySize_;
        open_ = other.open_;
        lastError_ = std::move(other.lastError_);
        other.open_ = false;
    }
    return *this;
}

bool ArchiveReader::open(const std::filesystem::path& archivePath) {
    close();

    std::ifstream src(archivePath, std::ios::binary | std::ios::ate);
    if (!src) {
        return fail(&lastError_, ArchiveErrorKind::IoError, "failed to open " + archivePath.string());
    }

    const auto size = static_cast<std::size_t>(src.tellg());
    src.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(size);
    if (size > 0) {
        if (!src.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
            return fail(&lastError_, ArchiveErrorKind::IoError, "failed to read " + archivePath.string());
        }
    }

    data_ = std::move(data);
    archivePath_ = archivePath;

    if (!parse()) {
        const ArchiveError error = lastError_;
        close();
        lastError_ = error;
        return false;
    }
    return true;
}

bool ArchiveReader::open_memory(std::vector<std::uint8_t> data) {
    close();

    data_ = std::move(data);

    if (!parse()) {
        const ArchiveError error = lastError_;
        close();
        lastError_ = error;
        return false;
    }
    return true;
}

void ArchiveReader::close() {
    data_.clear();
    data_.shrink_to_fit();
    entries_.clear();
    pathIndex_.clear();
    archivePath_.clear();
    directoryOffset_ = 0;
    directorySize_ = 0;
    open_ = false;
    lastError_ = ArchiveError{};
}

bool ArchiveReader::parse() {
    try {
        std::uint16_t entryCount = 0;
        if (!read_end_of_directory(&entryCount)) {
            return false;
        }
        if (!read_central_directory(entryCount)) {
            return false;
        }
    } catch (const std::runtime_error& e) {
        return fail(&lastError_, ArchiveErrorKind::Malformed, std::string("truncated record: ") + e.what());
    }

    open_ = true;
    return true;
}

bool ArchiveReader::read_end_of_directory(std::uint16_t* outEntryCount) {
    if (data_.size() < END_OF_DIRECTORY_SIZE) {
        return fail(&lastError_, ArchiveErrorKind::Malformed, "file too small for an end-of-directory record");
    }

    // The record sits at the very end unless followed by a comment.
    const std::size_t last = data_.size() - END_OF_DIRECTORY_SIZE;
    const std::size_t first = last > ZIP_MAX_COMMENT_LENGTH ? last - ZIP_MAX_COMMENT_LENGTH : 0;

    const std::span<const std::uint8_t> bytes(data_);

    for (std::size_t pos = last + 1; pos-- > first;) {
        core::ByteReader reader(bytes.subspan(pos));
        if (reader.read_u32() != END_OF_DIRECTORY_SIGNATURE) {
            continue;
        }

        const std::uint16_t diskNumber = reader.read_u16();
        const std::uint16_t directoryDisk = reader.read_u16();
        const std::uint16_t diskEntries = reader.read_u16();
        const std::uint16_t totalEntries = reader.read_u16();
        const std::uint32_t directorySize = reader.read_u32();
        const std::uint32_t directoryOffset = reader.read_u32();
        const std::uint16_t commentLength = reader.read_u16();

        if (commentLength != reader.remaining()) {
            // Signature bytes inside a comment or payload; keep scanning.
            continue;
        }

        if (diskNumber != 0 || directoryDisk != 0 || diskEntries != totalEntries) {
            return fail(&lastError_, ArchiveErrorKind::Unsupported, "multi-disk archives are not supported");
        }
        if (totalEntries == ZIP_MAX_FIELD_U16 || directorySize == ZIP_MAX_FIELD_U32 ||
            directoryOffset == ZIP_MAX_FIELD_U32) {
            return fail(&lastError_, ArchiveErrorKind::Unsupported, "Zip64 archives are not supported");
        }
        if (static_cast<std::uint64_t>(directoryOffset) + directorySize > pos) {
            return fail(&lastError_, ArchiveErrorKind::Malformed, "central directory overlaps the trailer");
        }

        directoryOffset_ = directoryOffset;
        directorySize_ = directorySize;
        *outEntryCount = totalEntries;
        return true;
    }

    return fail(&lastError_, ArchiveErrorKind::Malformed, "end-of-directory record not found");
}

bool ArchiveReader::read_central_directory(std::uint16_t entryCount) {
    core::ByteReader reader(std::span<const std::uint8_t>(data_).subspan(directoryOffset_, directorySize_));

    entries_.reserve(entryCount);
    pathIndex_.reserve(entryCount);

    for (std::uint16_t i = 0; i < entryCount; ++i) {
        if (reader.read_u32() != CENTRAL_HEADER_SIGNATURE) {
            return fail(&lastError_, ArchiveErrorKind::Malformed,
                        "bad central directory signature at record " + std::to_string(i));
        }

        FileEntry entry;
        reader.skip(2);  // version made by
        reader.skip(2);  // version needed
        entry.flags = reader.read_u16();
        entry.method = reader.read_u16();
        entry.modified.time = reader.read_u16();
        entry.modified.date = reader.read_u16();
        entry.crc32 = reader.read_u32();
        entry.compressedSize = reader.read_u32();
        entry.size = reader.read_u32();
        const std::uint16_t nameLength = reader.read_u16();
        const std::uint16_t extraLength = reader.read_u16();
        const std::uint16_t commentLength = reader.read_u16();
        reader.skip(2);  // disk number start
        reader.skip(2);  // internal attributes
        reader.skip(4);  // external attributes
        entry.localHeaderOffset = reader.read_u32();
        entry.name = reader.read_chars(nameLength);
        reader.skip(extraLength);
        reader.skip(commentLength);

        if (static_cast<std::uint64_t>(entry.localHeaderOffset) + LOCAL_HEADER_SIZE > directoryOffset_) {
            return fail(&lastError_, ArchiveErrorKind::Malformed,
                        "local header of '" + entry.name + "' lies past the central directory");
        }

        pathIndex_.emplace(entry.name, entries_.size());
        entries_.push_back(std::move(entry));
    }

    return true;
}

bool ArchiveReader::has_file(const std::string& path) const {
    return pathIndex_.find(path) != pathIndex_.end();
}

const ArchiveReader::FileEntry* ArchiveReader::get_entry(const std::string& path) const {
    auto it = pathIndex_.find(path);
    if (it == pathIndex_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::optional<std::vector<std::uint8_t>> ArchiveReader::extract(const std::string& path) {
    if (!is_open()) {
        fail(&lastError_, ArchiveErrorKind::IoError, "archive is not open");
        return std::nullopt;
    }

    const FileEntry* entry = get_entry(path);
    if (!entry) {
        fail(&lastError_, ArchiveErrorKind::InvalidEntry, "no such entry: " + path);
        return std::nullopt;
    }

    try {
        return extract_entry(*entry);
    } catch (const std::runtime_error& e) {
        fail(&lastError_, ArchiveErrorKind::Malformed, "truncated entry '" + path + "': " + e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<std::uint8_t>> ArchiveReader::extract_entry(const FileEntry& entry) {
    if (entry.flags & FlagEncrypted) {
        fail(&lastError_, ArchiveErrorKind::Unsupported, "entry '" + entry.name + "' is encrypted");
        return std::nullopt;
    }
    if (entry.method != static_cast<std::uint16_t>(CompressionMethod::Store)) {
        fail(&lastError_, ArchiveErrorKind::Unsupported,
             "entry '" + entry.name + "' uses compression method " + std::to_string(entry.method));
        return std::nullopt;
    }
    if (entry.compressedSize != entry.size) {
        fail(&lastError_, ArchiveErrorKind::Malformed, "stored entry '" + entry.name + "' has mismatched sizes");
        return std::nullopt;
    }

    // Local headers end where the central directory begins.
    const std::span<const std::uint8_t> localRegion =
        std::span<const std::uint8_t>(data_).first(directoryOffset_);
    core::ByteReader reader(localRegion.subspan(entry.localHeaderOffset));

    if (reader.read_u32() != LOCAL_HEADER_SIGNATURE) {
        fail(&lastError_, ArchiveErrorKind::Malformed, "bad local header signature for '" + entry.name + "'");
        return std::nullopt;
    }

    reader.skip(2);   // version needed
    reader.skip(2);   // flags
    reader.skip(2);   // method
    reader.skip(4);   // time, date
    reader.skip(12);  // crc, sizes (may be zero with a data descriptor)
    const std::uint16_t nameLength = reader.read_u16();
    const std::uint16_t extraLength = reader.read_u16();

    if (reader.read_chars(nameLength) != entry.name) {
        fail(&lastError_, ArchiveErrorKind::Malformed, "local and central names differ for '" + entry.name + "'");
        return std::nullopt;
    }
    reader.skip(extraLength);

    const auto payload = reader.read_bytes(entry.size);
    if (crc32(payload) != entry.crc32) {
        fail(&lastError_, ArchiveErrorKind::Malformed, "CRC mismatch for '" + entry.name + "'");
        return std::nullopt;
    }

    return std::vector<std::uint8_t>(payload.begin(), payload.end());
}

std::vector<std::string> ArchiveReader::list_directory(const std::string& dirPath) const {
    std::vector<std::string> result;

    std::string prefix = dirPath;
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }
    if (prefix == "/") {
        prefix.clear();
    }

    const std::size_t prefixLen = prefix.length();

    for (const auto& entry : entries_) {
        if (entry.name.length() <= prefixLen) {
            continue;
        }
        if (prefixLen > 0 && entry.name.compare(0, prefixLen, prefix) != 0) {
            continue;
        }

        std::string_view remainder(entry.name.data() + prefixLen, entry.name.length() - prefixLen);
        auto slashPos = remainder.find('/');

        std::string childName;
        if (slashPos == std::string_view::npos) {
            childName = std::string(remainder);
        } else {
            // Nested item; report the directory with a trailing slash.
            childName = std::string(remainder.substr(0, slashPos + 1));
        }

        if (std::find(result.begin(), result.end(), childName) == result.end()) {
            result.push_back(std::move(childName));
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

} // namespace zipbundle::zip
