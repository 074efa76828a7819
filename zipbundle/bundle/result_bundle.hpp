#pragma once

#include "../zip/archive.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zipbundle::bundle {

// One generated perspective, as delivered by the generation backend.
struct GeneratedImage {
    std::string image;            // Base64 PNG, optionally a data: URL.
    std::string perspectiveName;  // Display name, may contain CJK text.
};

// A finished generation: the uploaded image plus every generated view.
struct GenerationResult {
    std::string id;
    std::string originalImage;  // Base64 PNG, optionally a data: URL.
    std::vector<GeneratedImage> generatedImages;
};

inline constexpr std::string_view ORIGINAL_IMAGE_NAME = "original.png";

// Removes a leading "data:image/<type>;base64," if present.
std::string_view strip_data_url_prefix(std::string_view text);

// Decodes base64 image text (with or without data URL prefix).
// ASCII whitespace is ignored and missing '=' padding is tolerated. Empty
// text decodes to an empty payload.
// @return Raw bytes, or std::nullopt with InvalidEntry on invalid input.
std::optional<std::vector<std::uint8_t>> decode_image_payload(std::string_view text,
                                                              zip::ArchiveError* outError = nullptr);

// Keeps ASCII letters, digits and CJK ideographs U+4E00..U+9FA5. Every other
// UTF-16 unit becomes '_', so characters above U+FFFF give "__" and each
// invalid UTF-8 byte gives one '_'.
std::string sanitize_perspective_name(const std::string& name);

// "<index + 1>_<sanitized perspective>.png"
std::string generated_image_file_name(std::size_t index, const std::string& perspectiveName);

// "ai-generated-<resultId>.zip"
std::string bundle_file_name(const std::string& resultId);

// Fills outArchive with original.png followed by every generated image in
// order. outArchive is only modified on success.
bool build_bundle_archive(const GenerationResult& result,
                          zip::Archive* outArchive,
                          zip::ArchiveError* outError = nullptr);

// Builds the bundle and writes it to outputDir / bundle_file_name(result.id).
// @return Path of the written archive, or std::nullopt on failure.
std::optional<std::filesystem::path> export_bundle(const GenerationResult& result,
                                                   const std::filesystem::path& outputDir,
                                                   const zip::ArchiveOptions& options = {},
                                                   zip::ArchiveError* outError = nullptr);

} // namespace zipbundle::bundle
