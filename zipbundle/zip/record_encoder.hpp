#pragma once

#include "../core/byte_buffer.hpp"
#include "zip_format.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace zipbundle::zip {

// Everything the per-entry encoders need, resolved by the assembler.
// The name and payload views must outlive the encode call.
struct EntryRecord {
    std::string_view name;
    std::span<const std::uint8_t> payload;
    std::uint32_t crc32{0};
    std::uint16_t flags{FlagNone};
    CompressionMethod method{CompressionMethod::Store};
    DosDateTime modified{};
    std::uint32_t localHeaderOffset{0};  // Only used by the central record.
};

struct EndOfDirectory {
    std::uint16_t entryCount{0};
    std::uint32_t directorySize{0};
    std::uint32_t directoryOffset{0};
};

// Byte length of the local header plus payload.
constexpr std::uint64_t local_entry_size(std::uint64_t nameLength, std::uint64_t payloadSize) {
    return LOCAL_HEADER_SIZE + nameLength + payloadSize;
}

constexpr std::uint64_t central_record_size(std::uint64_t nameLength) {
    return CENTRAL_HEADER_SIZE + nameLength;
}

// Local file header followed by the raw payload.
void encode_local_entry(core::ByteWriter& out, const EntryRecord& record);

// Central directory record pointing at record.localHeaderOffset.
void encode_central_record(core::ByteWriter& out, const EntryRecord& record);

// Fixed 22-byte trailer.
void encode_end_of_directory(core::ByteWriter& out, const EndOfDirectory& eod);

} // namespace zipbundle::zip
