/**
 * @file test_result_bundle.cpp
 * @brief Generation result bundles: payload decoding, naming and export.
 */

#include <catch2/catch_test_macros.hpp>

#include "bundle/result_bundle.hpp"
#include "zip/archive_reader.hpp"

#include "zip_test_utils.hpp"

#include <string>

using namespace zipbundle;
using namespace zipbundle::bundle;
using test_helpers::bytes_of;

namespace {

GenerationResult sample_result() {
    GenerationResult result;
    result.id = "42";
    result.originalImage = "data:image/png;base64,b3JpZ2luYWw=";  // "original"
    result.generatedImages = {
        {"ZnJvbnQ=", "\xE6\xAD\xA3\xE9\x9D\xA2 view"},  // "front", "正面 view"
        {"data:image/jpeg;base64,c2lkZQ==", "Side-Left!"},  // "side"
    };
    return result;
}

} // namespace

// =============================================================================
// Payload decoding
// =============================================================================

TEST_CASE("Data URL prefix is stripped", "[bundle][decode]") {
    REQUIRE(strip_data_url_prefix("data:image/png;base64,AAAA") == "AAAA");
    REQUIRE(strip_data_url_prefix("data:image/webp;base64,") == "");
    REQUIRE(strip_data_url_prefix("AAAA") == "AAAA");
    REQUIRE(strip_data_url_prefix("data:image/;base64,AAAA") == "data:image/;base64,AAAA");
    REQUIRE(strip_data_url_prefix("data:text/plain;base64,AAAA") == "data:text/plain;base64,AAAA");
}

TEST_CASE("Base64 image payloads decode", "[bundle][decode]") {
    SECTION("padded") {
        auto data = decode_image_payload("aGVsbG8=");
        REQUIRE(data.has_value());
        REQUIRE(*data == bytes_of("hello"));
    }

    SECTION("unpadded") {
        auto data = decode_image_payload("aGVsbG8");
        REQUIRE(data.has_value());
        REQUIRE(*data == bytes_of("hello"));
    }

    SECTION("with data URL and whitespace") {
        auto data = decode_image_payload("data:image/png;base64,aGVs\r\nbG8g d29y bGQ=");
        REQUIRE(data.has_value());
        REQUIRE(*data == bytes_of("hello world"));
    }

    SECTION("empty text is an empty image") {
        auto data = decode_image_payload("");
        REQUIRE(data.has_value());
        REQUIRE(data->empty());
    }

    SECTION("prefix only") {
        auto data = decode_image_payload("data:image/png;base64,");
        REQUIRE(data.has_value());
        REQUIRE(data->empty());
    }

    SECTION("binary bytes") {
        auto data = decode_image_payload("iVBORw0KGgo=");
        REQUIRE(data.has_value());
        REQUIRE(*data == std::vector<std::uint8_t>{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A});
    }
}

TEST_CASE("Invalid image payloads are rejected", "[bundle][decode][errors]") {
    zip::ArchiveError error;

    SECTION("bad length") {
        REQUIRE_FALSE(decode_image_payload("aGVsb", &error).has_value());
        REQUIRE(error.kind == zip::ArchiveErrorKind::InvalidEntry);
    }

    SECTION("bad characters") {
        REQUIRE_FALSE(decode_image_payload("aGV$bG8=", &error).has_value());
        REQUIRE(error.kind == zip::ArchiveErrorKind::InvalidEntry);
    }

    SECTION("padding only") {
        REQUIRE_FALSE(decode_image_payload(" \n==", &error).has_value());
        REQUIRE(error.kind == zip::ArchiveErrorKind::InvalidEntry);
    }

    SECTION("padding in the middle") {
        REQUIRE_FALSE(decode_image_payload("aG=sbG8=", &error).has_value());
        REQUIRE(error.kind == zip::ArchiveErrorKind::InvalidEntry);
    }
}

// =============================================================================
// Naming
// =============================================================================

TEST_CASE("Perspective names are sanitized", "[bundle][names]") {
    REQUIRE(sanitize_perspective_name("front") == "front");
    REQUIRE(sanitize_perspective_name("Top-Down!") == "Top_Down_");
    REQUIRE(sanitize_perspective_name("\xE6\xAD\xA3\xE9\x9D\xA2 view") == "\xE6\xAD\xA3\xE9\x9D\xA2_view");
    REQUIRE(sanitize_perspective_name("caf\xC3\xA9") == "caf_");
    REQUIRE(sanitize_perspective_name("under_score") == "under_score");
    REQUIRE(sanitize_perspective_name("") == "");
}

TEST_CASE("Characters outside the BMP become two underscores", "[bundle][names]") {
    // U+1F600 and U+20000 (CJK Extension B) are surrogate pairs in UTF-16.
    REQUIRE(sanitize_perspective_name("\xE6\xAD\xA3\xF0\x9F\x98\x80") == "\xE6\xAD\xA3__");
    REQUIRE(sanitize_perspective_name("\xF0\xA0\x80\x80") == "__");
    REQUIRE(sanitize_perspective_name("a\xF0\x9F\x98\x80" "b") == "a__b");
    REQUIRE(generated_image_file_name(0, "\xE6\xAD\xA3\xE9\x9D\xA2\xF0\x9F\x98\x80") ==
            "1_\xE6\xAD\xA3\xE9\x9D\xA2__.png");

    // Characters just inside the BMP still map to one.
    REQUIRE(sanitize_perspective_name("\xEF\xBF\xBD") == "_");
}

TEST_CASE("Bundle file names", "[bundle][names]") {
    REQUIRE(generated_image_file_name(0, "front") == "1_front.png");
    REQUIRE(generated_image_file_name(9, "Back View") == "10_Back_View.png");
    REQUIRE(bundle_file_name("abc123") == "ai-generated-abc123.zip");
    REQUIRE(ORIGINAL_IMAGE_NAME == "original.png");
}

// =============================================================================
// Building and exporting
// =============================================================================

TEST_CASE("Bundle archive lists the original first", "[bundle][build]") {
    zip::Archive archive;
    zip::ArchiveError error;
    REQUIRE(build_bundle_archive(sample_result(), &archive, &error));

    const auto& entries = archive.entries();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].name == "original.png");
    REQUIRE(entries[0].payload == bytes_of("original"));
    REQUIRE(entries[1].name == "1_\xE6\xAD\xA3\xE9\x9D\xA2_view.png");
    REQUIRE(entries[1].payload == bytes_of("front"));
    REQUIRE(entries[2].name == "2_Side_Left_.png");
    REQUIRE(entries[2].payload == bytes_of("side"));
}

TEST_CASE("Empty image text becomes a zero-length entry", "[bundle][build]") {
    GenerationResult result = sample_result();
    result.originalImage.clear();

    zip::Archive archive;
    REQUIRE(build_bundle_archive(result, &archive));
    REQUIRE(archive.entry_count() == 3);
    REQUIRE(archive.entries()[0].name == "original.png");
    REQUIRE(archive.entries()[0].payload.empty());
}

TEST_CASE("Result without generated images holds only the original", "[bundle][build]") {
    GenerationResult result = sample_result();
    result.generatedImages.clear();

    zip::Archive archive;
    REQUIRE(build_bundle_archive(result, &archive));
    REQUIRE(archive.entry_count() == 1);
}

TEST_CASE("Undecodable image leaves the archive untouched", "[bundle][build][errors]") {
    GenerationResult result = sample_result();
    result.generatedImages[1].image = "not base64!";

    zip::Archive archive;
    REQUIRE(archive.add_entry("keep.txt", bytes_of("keep")));

    zip::ArchiveError error;
    REQUIRE_FALSE(build_bundle_archive(result, &archive, &error));
    REQUIRE(error.kind == zip::ArchiveErrorKind::InvalidEntry);
    REQUIRE(error.message.find("2_Side_Left_.png") != std::string::npos);

    REQUIRE(archive.entry_count() == 1);
    REQUIRE(archive.entries()[0].name == "keep.txt");
}

TEST_CASE("Exported bundle reads back", "[bundle][export]") {
    test_helpers::TempDir tempDir;
    const auto outputDir = tempDir.path() / "downloads";

    zip::ArchiveError error;
    auto path = export_bundle(sample_result(), outputDir, {}, &error);
    INFO(error.message);
    REQUIRE(path.has_value());
    REQUIRE(*path == outputDir / "ai-generated-42.zip");

    zip::ArchiveReader reader;
    REQUIRE(reader.open(*path));
    REQUIRE(reader.entries().size() == 3);
    REQUIRE(reader.entries()[1].flags == zip::FlagUtf8Name);
    REQUIRE(reader.extract("original.png") == bytes_of("original"));
    REQUIRE(reader.extract("1_\xE6\xAD\xA3\xE9\x9D\xA2_view.png") == bytes_of("front"));
    REQUIRE(reader.extract("2_Side_Left_.png") == bytes_of("side"));
}

TEST_CASE("Failed export writes nothing", "[bundle][export][errors]") {
    test_helpers::TempDir tempDir;
    GenerationResult result = sample_result();
    result.originalImage = "data:image/png;base64,%%%%";

    zip::ArchiveError error;
    REQUIRE_FALSE(export_bundle(result, tempDir.path(), {}, &error).has_value());
    REQUIRE(error.kind == zip::ArchiveErrorKind::InvalidEntry);
    REQUIRE_FALSE(std::filesystem::exists(tempDir.path() / "ai-generated-42.zip"));
}
