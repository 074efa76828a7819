#include "archive_writer.hpp"

#include "../core/byte_buffer.hpp"
#include "crc32.hpp"
#include "dos_time.hpp"
#include "record_encoder.hpp"

#include <cstdio>
#include <string>
#include <system_error>

namespace zipbundle::zip {

namespace {

bool exceeds_u32(std::uint64_t value) {
    return value > ZIP_MAX_FIELD_U32;
}

} // namespace

bool plan_layout(std::span<const EntryExtent> extents,
                 ArchiveLayout* outLayout,
                 ArchiveError* outError) {
    if (extents.size() > ZIP_MAX_ENTRIES) {
        return fail(outError, ArchiveErrorKind::SizeLimitExceeded,
                    "too many entries: " + std::to_string(extents.size()) + " (max " +
                        std::to_string(ZIP_MAX_ENTRIES) + ")");
    }

    ArchiveLayout layout;
    layout.localHeaderOffsets.reserve(extents.size());

    std::uint64_t offset = 0;
    std::uint64_t directorySize = 0;

    for (std::size_t i = 0; i < extents.size(); ++i) {
        const EntryExtent& extent = extents[i];

        if (extent.nameLength > ZIP_MAX_NAME_LENGTH) {
            return fail(outError, ArchiveErrorKind::SizeLimitExceeded,
                        "entry " + std::to_string(i) + ": name is " + std::to_string(extent.nameLength) +
                            " bytes (max " + std::to_string(ZIP_MAX_NAME_LENGTH) + ")");
        }
        if (exceeds_u32(extent.payloadSize)) {
            return fail(outError, ArchiveErrorKind::SizeLimitExceeded,
                        "entry " + std::to_string(i) + ": payload of " + std::to_string(extent.payloadSize) +
                            " bytes needs Zip64");
        }
        if (exceeds_u32(offset)) {
            return fail(outError, ArchiveErrorKind::SizeLimitExceeded,
                        "entry " + std::to_string(i) + ": local header offset " + std::to_string(offset) +
                            " needs Zip64");
        }

        layout.localHeaderOffsets.push_back(static_cast<std::uint32_t>(offset));
        offset += local_entry_size(extent.nameLength, extent.payloadSize);
        directorySize += central_record_size(extent.nameLength);
    }

    if (exceeds_u32(offset)) {
        return fail(outError, ArchiveErrorKind::SizeLimitExceeded,
                    "central directory offset " + std::to_string(offset) + " needs Zip64");
    }
    if (exceeds_u32(directorySize)) {
        return fail(outError, ArchiveErrorKind::SizeLimitExceeded,
                    "central directory size " + std::to_string(directorySize) + " needs Zip64");
    }

    const std::uint64_t totalSize = offset + directorySize + END_OF_DIRECTORY_SIZE;
    if (exceeds_u32(totalSize)) {
        return fail(outError, ArchiveErrorKind::SizeLimitExceeded,
                    "archive size " + std::to_string(totalSize) + " needs Zip64");
    }

    layout.directoryOffset = static_cast<std::uint32_t>(offset);
    layout.directorySize = static_cast<std::uint32_t>(directorySize);
    layout.totalSize = totalSize;

    if (outLayout) {
        *outLayout = std::move(layout);
    }
    return true;
}

std::optional<std::vector<std::uint8_t>> assemble(const Archive& archive,
                                                  const ArchiveOptions& options,
                                                  ArchiveError* outError) {
    const std::vector<Entry>& entries = archive.entries();

    if (entries.empty() && !options.allowEmpty) {
        fail(outError, ArchiveErrorKind::EmptyArchiveState, "archive has no entries");
        return std::nullopt;
    }

    std::vector<EntryExtent> extents;
    extents.reserve(entries.size());
    for (const auto& entry : entries) {
        extents.push_back({entry.name.size(), entry.payload.size()});
    }

    ArchiveLayout layout;
    if (!plan_layout(extents, &layout, outError)) {
        return std::nullopt;
    }

    const DosDateTime modified = options.modifiedTime ? to_dos_date_time(*options.modifiedTime) : DOS_EPOCH;

    std::vector<EntryRecord> records;
    records.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const Entry& entry = entries[i];

        EntryRecord record;
        record.name = entry.name;
        record.payload = entry.payload;
        record.crc32 = crc32(entry.payload);
        record.flags = entry_flags(entry.name, options.utf8Names);
        record.method = CompressionMethod::Store;
        record.modified = modified;
        record.localHeaderOffset = layout.localHeaderOffsets[i];
        records.push_back(record);
    }

    core::ByteWriter out(static_cast<std::size_t>(layout.totalSize));

    // Pass 1: local entries, at the offsets planned above.
    for (const auto& record : records) {
        encode_local_entry(out, record);
    }

    // Pass 2: central directory.
    const std::size_t directoryStart = out.size();
    for (const auto& record : records) {
        encode_central_record(out, record);
    }

    EndOfDirectory eod;
    eod.entryCount = static_cast<std::uint16_t>(records.size());
    eod.directorySize = static_cast<std::uint32_t>(out.size() - directoryStart);
    eod.directoryOffset = static_cast<std::uint32_t>(directoryStart);
    encode_end_of_directory(out, eod);

    return out.take();
}

bool write_archive_file(const Archive& archive,
                        const std::filesystem::path& path,
                        const ArchiveOptions& options,
                        ArchiveError* outError) {
    auto bytes = assemble(archive, options, outError);
    if (!bytes) {
        return false;
    }

    const std::string pathStr = path.string();
    FILE* file = std::fopen(pathStr.c_str(), "wb");
    if (!file) {
        return fail(outError, ArchiveErrorKind::IoError, "failed to open output file: " + pathStr);
    }

    bool ok = std::fwrite(bytes->data(), 1, bytes->size(), file) == bytes->size();
    if (std::fclose(file) != 0) {
        ok = false;
    }

    if (!ok) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return fail(outError, ArchiveErrorKind::IoError, "failed to write archive: " + pathStr);
    }

    return true;
}

} // namespace zipbundle::zip
