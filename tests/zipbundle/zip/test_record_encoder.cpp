/**
 * @file test_record_encoder.cpp
 * @brief Field-by-field layout of the three ZIP record types.
 */

#include <catch2/catch_test_macros.hpp>

#include "core/byte_buffer.hpp"
#include "zip/dos_time.hpp"
#include "zip/record_encoder.hpp"

#include "zip_test_utils.hpp"

#include <string>

using namespace zipbundle::zip;
using zipbundle::core::ByteWriter;
using test_helpers::bytes_of;
using test_helpers::le16;
using test_helpers::le32;

namespace {

std::vector<std::uint8_t> encoded(void (*encode)(ByteWriter&, const EntryRecord&), const EntryRecord& record) {
    ByteWriter out;
    encode(out, record);
    return out.take();
}

} // namespace

TEST_CASE("Local entry header layout", "[zip][encoder]") {
    const auto payload = bytes_of("hi!");

    EntryRecord record;
    record.name = "a.txt";
    record.payload = payload;
    record.crc32 = 0xDEADBEEF;
    record.modified = DosDateTime{0x6B2F, 0x586F};

    const auto bytes = encoded(&encode_local_entry, record);

    REQUIRE(bytes.size() == local_entry_size(5, 3));
    REQUIRE(bytes.size() == 30 + 5 + 3);

    REQUIRE(bytes[0] == 0x50);
    REQUIRE(bytes[1] == 0x4B);
    REQUIRE(bytes[2] == 0x03);
    REQUIRE(bytes[3] == 0x04);
    REQUIRE(le16(bytes, 4) == 20);          // version needed
    REQUIRE(le16(bytes, 6) == 0);           // flags
    REQUIRE(le16(bytes, 8) == 0);           // store
    REQUIRE(le16(bytes, 10) == 0x6B2F);     // time
    REQUIRE(le16(bytes, 12) == 0x586F);     // date
    REQUIRE(le32(bytes, 14) == 0xDEADBEEF);
    REQUIRE(le32(bytes, 18) == 3);          // compressed
    REQUIRE(le32(bytes, 22) == 3);          // uncompressed
    REQUIRE(le16(bytes, 26) == 5);
    REQUIRE(le16(bytes, 28) == 0);
    REQUIRE(std::string(bytes.begin() + 30, bytes.begin() + 35) == "a.txt");
    REQUIRE(std::string(bytes.begin() + 35, bytes.end()) == "hi!");
}

TEST_CASE("Local entry carries the UTF-8 flag", "[zip][encoder][utf8]") {
    EntryRecord record;
    record.name = "r\xC3\xA9port.txt";
    record.flags = FlagUtf8Name;

    const auto bytes = encoded(&encode_local_entry, record);
    REQUIRE(le16(bytes, 6) == 0x0800);
    REQUIRE(le16(bytes, 26) == 11);
}

TEST_CASE("Central directory record layout", "[zip][encoder]") {
    const auto payload = bytes_of("0123456789");

    EntryRecord record;
    record.name = "dir/b.bin";
    record.payload = payload;
    record.crc32 = 0x01020304;
    record.flags = FlagUtf8Name;
    record.modified = DOS_EPOCH;
    record.localHeaderOffset = 0x00ABCDEF;

    const auto bytes = encoded(&encode_central_record, record);

    REQUIRE(bytes.size() == central_record_size(9));
    REQUIRE(bytes.size() == 46 + 9);

    REQUIRE(le32(bytes, 0) == CENTRAL_HEADER_SIGNATURE);
    REQUIRE(le16(bytes, 4) == 20);          // made by
    REQUIRE(le16(bytes, 6) == 20);          // needed
    REQUIRE(le16(bytes, 8) == 0x0800);
    REQUIRE(le16(bytes, 10) == 0);
    REQUIRE(le16(bytes, 12) == 0x0000);
    REQUIRE(le16(bytes, 14) == 0x0021);
    REQUIRE(le32(bytes, 16) == 0x01020304);
    REQUIRE(le32(bytes, 20) == 10);
    REQUIRE(le32(bytes, 24) == 10);
    REQUIRE(le16(bytes, 28) == 9);
    REQUIRE(le16(bytes, 30) == 0);          // extra
    REQUIRE(le16(bytes, 32) == 0);          // comment
    REQUIRE(le16(bytes, 34) == 0);          // disk start
    REQUIRE(le16(bytes, 36) == 0);          // internal attributes
    REQUIRE(le32(bytes, 38) == 0);          // external attributes
    REQUIRE(le32(bytes, 42) == 0x00ABCDEF);
    REQUIRE(std::string(bytes.begin() + 46, bytes.end()) == "dir/b.bin");
}

TEST_CASE("End-of-directory record layout", "[zip][encoder]") {
    EndOfDirectory eod;
    eod.entryCount = 3;
    eod.directorySize = 150;
    eod.directoryOffset = 4000;

    ByteWriter out;
    encode_end_of_directory(out, eod);
    const auto bytes = out.take();

    REQUIRE(bytes.size() == END_OF_DIRECTORY_SIZE);
    REQUIRE(bytes.size() == 22);
    REQUIRE(le32(bytes, 0) == 0x06054b50);
    REQUIRE(le16(bytes, 4) == 0);
    REQUIRE(le16(bytes, 6) == 0);
    REQUIRE(le16(bytes, 8) == 3);
    REQUIRE(le16(bytes, 10) == 3);
    REQUIRE(le32(bytes, 12) == 150);
    REQUIRE(le32(bytes, 16) == 4000);
    REQUIRE(le16(bytes, 20) == 0);
}
