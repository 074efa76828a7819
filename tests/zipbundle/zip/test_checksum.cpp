/**
 * @file test_checksum.cpp
 * @brief CRC-32 and DOS timestamp helpers.
 */

#include <catch2/catch_test_macros.hpp>

#include "zip/crc32.hpp"
#include "zip/dos_time.hpp"

#include "zip_test_utils.hpp"

#include <ctime>
#include <span>

using namespace zipbundle::zip;
using test_helpers::bytes_of;

// =============================================================================
// CRC-32
// =============================================================================

TEST_CASE("crc32 matches the IEEE check value", "[zip][crc32]") {
    REQUIRE(crc32(bytes_of("123456789")) == 0xCBF43926u);
}

TEST_CASE("crc32 of known short inputs", "[zip][crc32]") {
    REQUIRE(crc32(bytes_of("")) == 0u);
    REQUIRE(crc32(bytes_of("hello")) == 0x3610A686u);
    REQUIRE(crc32(bytes_of("The quick brown fox jumps over the lazy dog")) == 0x414FA339u);
}

TEST_CASE("crc32_update continues a running checksum", "[zip][crc32]") {
    const auto data = test_helpers::pattern_bytes(4096, 7);
    const std::span<const std::uint8_t> all(data);

    std::uint32_t crc = 0;
    crc = crc32_update(crc, all.first(1000));
    crc = crc32_update(crc, all.subspan(1000, 3000));
    crc = crc32_update(crc, all.subspan(4000));

    REQUIRE(crc == crc32(data));
}

// =============================================================================
// DOS date/time
// =============================================================================

TEST_CASE("DOS epoch sentinel is 1980-01-01 00:00", "[zip][dostime]") {
    REQUIRE(DOS_EPOCH.time == 0x0000);
    REQUIRE(DOS_EPOCH.date == 0x0021);  // year 0, month 1, day 1
}

TEST_CASE("to_dos_date_time packs local calendar fields", "[zip][dostime]") {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;  // March
    tm.tm_mday = 15;
    tm.tm_hour = 13;
    tm.tm_min = 45;
    tm.tm_sec = 31;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);

    const DosDateTime dos = to_dos_date_time(t);
    REQUIRE(dos.date == ((44 << 9) | (3 << 5) | 15));
    REQUIRE(dos.time == ((13 << 11) | (45 << 5) | 15));

    SECTION("round trip drops the odd second") {
        REQUIRE(from_dos_date_time(dos) == t - 1);
    }
}

TEST_CASE("to_dos_date_time clamps times before 1980", "[zip][dostime]") {
    std::tm tm{};
    tm.tm_year = 1975 - 1900;
    tm.tm_mon = 5;
    tm.tm_mday = 1;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    const DosDateTime dos = to_dos_date_time(std::mktime(&tm));

    REQUIRE(dos.time == DOS_EPOCH.time);
    REQUIRE(dos.date == DOS_EPOCH.date);
}

TEST_CASE("format_dos_date_time renders listing timestamps", "[zip][dostime]") {
    REQUIRE(format_dos_date_time(DOS_EPOCH) == "1980-01-01 00:00:00");

    const DosDateTime dos{static_cast<std::uint16_t>((13 << 11) | (45 << 5) | 15),
                          static_cast<std::uint16_t>((44 << 9) | (3 << 5) | 15)};
    REQUIRE(format_dos_date_time(dos) == "2024-03-15 13:45:30");
}
