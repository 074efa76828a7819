#include "record_encoder.hpp"

namespace zipbundle::zip {

void encode_local_entry(core::ByteWriter& out, const EntryRecord& record) {
    const auto size = static_cast<std::uint32_t>(record.payload.size());

    out.write_u32(LOCAL_HEADER_SIGNATURE);
    out.write_u16(ZIP_VERSION_NEEDED);
    out.write_u16(record.flags);
    out.write_u16(static_cast<std::uint16_t>(record.method));
    out.write_u16(record.modified.time);
    out.write_u16(record.modified.date);
    out.write_u32(record.crc32);
    out.write_u32(size);  // compressed size (stored)
    out.write_u32(size);
    out.write_u16(static_cast<std::uint16_t>(record.name.size()));
    out.write_u16(0);     // extra field length
    out.write_chars(record.name);
    out.write_bytes(record.payload);
}

void encode_central_record(core::ByteWriter& out, const EntryRecord& record) {
    const auto size = static_cast<std::uint32_t>(record.payload.size());

    out.write_u32(CENTRAL_HEADER_SIGNATURE);
    out.write_u16(ZIP_VERSION_MADE_BY);
    out.write_u16(ZIP_VERSION_NEEDED);
    out.write_u16(record.flags);
    out.write_u16(static_cast<std::uint16_t>(record.method));
    out.write_u16(record.modified.time);
    out.write_u16(record.modified.date);
    out.write_u32(record.crc32);
    out.write_u32(size);
    out.write_u32(size);
    out.write_u16(static_cast<std::uint16_t>(record.name.size()));
    out.write_u16(0);  // extra field length
    out.write_u16(0);  // file comment length
    out.write_u16(0);  // disk number start
    out.write_u16(0);  // internal attributes
    out.write_u32(0);  // external attributes
    out.write_u32(record.localHeaderOffset);
    out.write_chars(record.name);
}

void encode_end_of_directory(core::ByteWriter& out, const EndOfDirectory& eod) {
    out.write_u32(END_OF_DIRECTORY_SIGNATURE);
    out.write_u16(0);  // this disk
    out.write_u16(0);  // disk holding the directory
    out.write_u16(eod.entryCount);
    out.write_u16(eod.entryCount);
    out.write_u32(eod.directorySize);
    out.write_u32(eod.directoryOffset);
    out.write_u16(0);  // comment length
}

} // namespace zipbundle::zip
