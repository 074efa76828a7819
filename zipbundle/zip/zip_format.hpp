#pragma once

// ZIP archive format (PKWARE APPNOTE, store-only subset)
//
// Single-disk archive without Zip64 extensions. All integers little-endian.
//
// Layout:
// ┌─────────────────────────────────────┐
// │ Local entry (once per file)         │
// │   signature     : u32 = 0x04034b50  │
// │   versionNeeded : u16 = 20          │
// │   flags         : u16               │
// │   method        : u16 = 0 (store)   │
// │   modTime       : u16               │
// │   modDate       : u16               │
// │   crc32         : u32               │
// │   compSize      : u32               │
// │   size          : u32               │
// │   nameLength    : u16               │
// │   extraLength   : u16 = 0           │
// │   name          : char[nameLength]  │
// │   data          : u8[size]          │
// ├─────────────────────────────────────┤
// │ Central directory (once per file)   │
// │   signature     : u32 = 0x02014b50  │
// │   versionMadeBy : u16 = 20          │
// │   ...local header fields...         │
// │   commentLength : u16 = 0           │
// │   diskStart     : u16 = 0           │
// │   internalAttr  : u16 = 0           │
// │   externalAttr  : u32 = 0           │
// │   localOffset   : u32               │
// │   name          : char[nameLength]  │
// ├─────────────────────────────────────┤
// │ End of central directory (22 bytes) │
// │   signature     : u32 = 0x06054b50  │
// │   diskNumber    : u16 = 0           │
// │   directoryDisk : u16 = 0           │
// │   diskEntries   : u16               │
// │   totalEntries  : u16               │
// │   directorySize : u32               │
// │   directoryOfs  : u32               │
// │   commentLength : u16 = 0           │
// └─────────────────────────────────────┘

#include <cstddef>
#include <cstdint>

namespace zipbundle::zip {

constexpr std::uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;      // "PK\3\4"
constexpr std::uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;    // "PK\1\2"
constexpr std::uint32_t END_OF_DIRECTORY_SIGNATURE = 0x06054b50;  // "PK\5\6"

// "2.0": minimum for stored entries and directories.
constexpr std::uint16_t ZIP_VERSION_NEEDED = 20;
constexpr std::uint16_t ZIP_VERSION_MADE_BY = 20;

constexpr std::size_t LOCAL_HEADER_SIZE = 30;
constexpr std::size_t CENTRAL_HEADER_SIZE = 46;
constexpr std::size_t END_OF_DIRECTORY_SIZE = 22;

// Limits of the classic (non-Zip64) record fields.
constexpr std::uint64_t ZIP_MAX_FIELD_U16 = 0xFFFF;
constexpr std::uint64_t ZIP_MAX_FIELD_U32 = 0xFFFFFFFF;

constexpr std::size_t ZIP_MAX_NAME_LENGTH = ZIP_MAX_FIELD_U16;
constexpr std::size_t ZIP_MAX_COMMENT_LENGTH = ZIP_MAX_FIELD_U16;
constexpr std::size_t ZIP_MAX_ENTRIES = ZIP_MAX_FIELD_U16;

// General purpose bit flags.
enum GeneralPurposeFlag : std::uint16_t {
    FlagNone = 0,
    FlagEncrypted = 1 << 0,
    FlagDataDescriptor = 1 << 3,
    FlagUtf8Name = 1 << 11,  // Name (and comment) are UTF-8.
};

enum class CompressionMethod : std::uint16_t {
    Store = 0,
    Deflate = 8,  // Recognized by the reader only.
};

// Packed MS-DOS timestamp.
struct DosDateTime {
    std::uint16_t time{0};
    std::uint16_t date{0};
};

} // namespace zipbundle::zip
