#include "result_bundle.hpp"

#include "../zip/archive_writer.hpp"

#include <cctype>
#include <system_error>

#include <raylib.h>

namespace zipbundle::bundle {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

} // namespace

std::string_view strip_data_url_prefix(std::string_view text) {
    constexpr std::string_view kScheme = "data:image/";
    constexpr std::string_view kEncoding = ";base64,";

    if (text.substr(0, kScheme.size()) != kScheme) {
        return text;
    }

    std::size_t pos = kScheme.size();
    while (pos < text.size() && is_word_char(text[pos])) {
        ++pos;
    }
    if (pos == kScheme.size() || text.substr(pos, kEncoding.size()) != kEncoding) {
        return text;
    }

    return text.substr(pos + kEncoding.size());
}

std::optional<std::vector<std::uint8_t>> decode_image_payload(std::string_view text, zip::ArchiveError* outError) {
    const std::string_view body = strip_data_url_prefix(text);

    std::string normalized;
    normalized.reserve(body.size() + 3);
    for (char c : body) {
        if (!is_ascii_space(c)) {
            normalized.push_back(c);
        }
    }

    // Same acceptance rules as a browser's atob(): up to two '=' when the
    // length is a multiple of four, otherwise no padding at all.
    if (normalized.size() % 4 == 0) {
        for (int i = 0; i < 2 && !normalized.empty() && normalized.back() == '='; ++i) {
            normalized.pop_back();
        }
    }
    if (normalized.empty()) {
        // Nothing to decode: a zero-length image.
        return std::vector<std::uint8_t>{};
    }
    if (normalized.size() % 4 == 1) {
        zip::fail(outError, zip::ArchiveErrorKind::InvalidEntry, "image payload has an invalid base64 length");
        return std::nullopt;
    }
    for (char c : normalized) {
        if (!is_base64_char(c)) {
            zip::fail(outError, zip::ArchiveErrorKind::InvalidEntry, "image payload is not valid base64");
            return std::nullopt;
        }
    }
    while (normalized.size() % 4 != 0) {
        normalized.push_back('=');
    }

    int size = 0;
    unsigned char* decoded = DecodeDataBase64(reinterpret_cast<const unsigned char*>(normalized.c_str()), &size);
    if (!decoded || size <= 0) {
        if (decoded) {
            MemFree(decoded);
        }
        zip::fail(outError, zip::ArchiveErrorKind::InvalidEntry, "image payload failed to decode");
        return std::nullopt;
    }

    std::vector<std::uint8_t> data(decoded, decoded + size);
    MemFree(decoded);
    return data;
}

std::string sanitize_perspective_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());

    const char* text = name.c_str();
    std::size_t pos = 0;
    while (pos < name.size()) {
        int codepointSize = 0;
        const int codepoint = GetCodepointNext(text + pos, &codepointSize);
        if (codepointSize <= 0) {
            codepointSize = 1;
        }

        const bool asciiAlnum = codepoint < 0x80 && std::isalnum(codepoint) != 0;
        const bool cjk = codepoint >= 0x4E00 && codepoint <= 0x9FA5;

        if (asciiAlnum || cjk) {
            out.append(name, pos, static_cast<std::size_t>(codepointSize));
        } else if (codepoint > 0xFFFF) {
            // One '_' per UTF-16 unit: characters outside the BMP take two.
            out.append("__");
        } else {
            out.push_back('_');
        }
        pos += static_cast<std::size_t>(codepointSize);
    }

    return out;
}

std::string generated_image_file_name(std::size_t index, const std::string& perspectiveName) {
    return std::to_string(index + 1) + "_" + sanitize_perspective_name(perspectiveName) + ".png";
}

std::string bundle_file_name(const std::string& resultId) {
    return "ai-generated-" + resultId + ".zip";
}

bool build_bundle_archive(const GenerationResult& result, zip::Archive* outArchive, zip::ArchiveError* outError) {
    if (!outArchive) {
        return zip::fail(outError, zip::ArchiveErrorKind::InvalidEntry, "outArchive is null");
    }

    zip::Archive archive;

    auto original = decode_image_payload(result.originalImage, outError);
    if (!original) {
        if (outError) outError->message = "original image: " + outError->message;
        TraceLog(LOG_WARNING, "[bundle] result %s: original image is not decodable", result.id.c_str());
        return false;
    }
    if (!archive.add_entry(std::string(ORIGINAL_IMAGE_NAME), std::move(original), outError)) {
        return false;
    }

    for (std::size_t i = 0; i < result.generatedImages.size(); ++i) {
        const GeneratedImage& image = result.generatedImages[i];
        const std::string fileName = generated_image_file_name(i, image.perspectiveName);

        auto data = decode_image_payload(image.image, outError);
        if (!data) {
            if (outError) outError->message = fileName + ": " + outError->message;
            TraceLog(LOG_WARNING, "[bundle] result %s: %s is not decodable", result.id.c_str(), fileName.c_str());
            return false;
        }
        if (!archive.add_entry(fileName, std::move(data), outError)) {
            return false;
        }
    }

    *outArchive = std::move(archive);
    return true;
}

std::optional<std::filesystem::path> export_bundle(const GenerationResult& result,
                                                   const std::filesystem::path& outputDir,
                                                   const zip::ArchiveOptions& options,
                                                   zip::ArchiveError* outError) {
    zip::Archive archive;
    if (!build_bundle_archive(result, &archive, outError)) {
        return std::nullopt;
    }

    std::error_code ec;
    if (!outputDir.empty() && !std::filesystem::exists(outputDir, ec)) {
        std::filesystem::create_directories(outputDir, ec);
        if (ec) {
            zip::fail(outError, zip::ArchiveErrorKind::IoError,
                      "cannot create output directory " + outputDir.string() + ": " + ec.message());
            TraceLog(LOG_ERROR, "[bundle] cannot create %s: %s", outputDir.string().c_str(), ec.message().c_str());
            return std::nullopt;
        }
    }

    const std::filesystem::path path = outputDir / bundle_file_name(result.id);
    zip::ArchiveError error;
    if (!zip::write_archive_file(archive, path, options, &error)) {
        TraceLog(LOG_ERROR, "[bundle] failed to write %s: %s", path.string().c_str(), error.message.c_str());
        if (outError) *outError = std::move(error);
        return std::nullopt;
    }

    TraceLog(LOG_INFO, "[bundle] wrote %s (%zu images)", path.string().c_str(), archive.entry_count());
    return path;
}

} // namespace zipbundle::bundle
