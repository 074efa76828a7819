// pack_zip - CLI tool for packing a directory into a .zip archive.
//
// Usage:
//   pack_zip --input <dir> --output <file.zip> [options]
//   pack_zip --list <file.zip>
//
// Options:
//   --input, -i <dir>     Source directory.
//   --output, -o <file>   Output .zip file path.
//   --list, -l <file>     Print size, timestamp, CRC and name of each entry.
//   --exclude <pattern>   Pattern for files to exclude (can be repeated).
//   --config, -c <file>   INI settings ([logging], [archive]).
//   --verbose, -v         Print files being added.
//   --help, -h            Show this help message.

#include "core/config.hpp"
#include "core/logger.hpp"
#include "zip/archive_reader.hpp"
#include "zip/archive_writer.hpp"
#include "zip/dos_time.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <raylib.h>

namespace fs = std::filesystem;

namespace {

struct Options {
    fs::path inputDir;
    fs::path outputFile;
    fs::path listFile;
    fs::path configFile;
    std::vector<std::string> excludePatterns;
    bool verbose{false};
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --input <dir> --output <file.zip> [options]\n"
              << "       " << program << " --list <file.zip>\n"
              << "\n"
              << "Options:\n"
              << "  --input, -i <dir>     Source directory.\n"
              << "  --output, -o <file>   Output .zip file path.\n"
              << "  --list, -l <file>     Print size, timestamp, CRC and name of each entry.\n"
              << "  --exclude <pattern>   Pattern for files to exclude (can be repeated).\n"
              << "  --config, -c <file>   INI settings ([logging], [archive]).\n"
              << "  --verbose, -v         Print files being added.\n"
              << "  --help, -h            Show this help message.\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--input" || arg == "-i") {
            if (++i >= argc) {
                std::cerr << "Error: --input requires a directory path.\n";
                return false;
            }
            opts.inputDir = argv[i];
        } else if (arg == "--output" || arg == "-o") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires a file path.\n";
                return false;
            }
            opts.outputFile = argv[i];
        } else if (arg == "--list" || arg == "-l") {
            if (++i >= argc) {
                std::cerr << "Error: --list requires a file path.\n";
                return false;
            }
            opts.listFile = argv[i];
        } else if (arg == "--config" || arg == "-c") {
            if (++i >= argc) {
                std::cerr << "Error: --config requires a file path.\n";
                return false;
            }
            opts.configFile = argv[i];
        } else if (arg == "--exclude") {
            if (++i >= argc) {
                std::cerr << "Error: --exclude requires a pattern.\n";
                return false;
            }
            opts.excludePatterns.push_back(argv[i]);
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    if (!opts.listFile.empty()) {
        return true;
    }

    if (opts.inputDir.empty()) {
        std::cerr << "Error: --input is required.\n";
        return false;
    }
    if (opts.outputFile.empty()) {
        std::cerr << "Error: --output is required.\n";
        return false;
    }

    return true;
}

bool matches_pattern(const std::string& filename, const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }

    if (pattern[0] == '*') {
        std::string suffix = pattern.substr(1);
        if (filename.length() >= suffix.length()) {
            return filename.compare(filename.length() - suffix.length(), suffix.length(), suffix) == 0;
        }
        return false;
    }

    return filename == pattern;
}

bool should_exclude(const std::string& relativePath, const std::vector<std::string>& patterns) {
    fs::path p(relativePath);
    std::string filename = p.filename().string();

    for (const auto& pattern : patterns) {
        if (matches_pattern(filename, pattern) || matches_pattern(relativePath, pattern)) {
            return true;
        }
    }
    return false;
}

std::optional<std::vector<std::uint8_t>> read_file(const fs::path& path) {
    std::ifstream src(path, std::ios::binary | std::ios::ate);
    if (!src) {
        return std::nullopt;
    }

    const auto size = static_cast<std::size_t>(src.tellg());
    src.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(size);
    if (size > 0) {
        if (!src.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
            return std::nullopt;
        }
    }
    return data;
}

int list_archive(const fs::path& path) {
    zipbundle::zip::ArchiveReader reader;
    if (!reader.open(path)) {
        TraceLog(LOG_ERROR, "[pack_zip] cannot read %s: %s", path.string().c_str(),
                 reader.last_error().message.c_str());
        return 1;
    }

    std::uint64_t totalSize = 0;
    for (const auto& entry : reader.entries()) {
        std::cout << std::setw(10) << entry.size << "  "
                  << zipbundle::zip::format_dos_date_time(entry.modified) << "  "
                  << std::hex << std::setw(8) << std::setfill('0') << entry.crc32
                  << std::dec << std::setfill(' ') << "  " << entry.name << "\n";
        totalSize += entry.size;
    }

    std::cout << reader.entries().size() << " entries, " << totalSize << " bytes\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    auto& config = zipbundle::core::Config::instance();
    if (!opts.configFile.empty() && !config.load_from_file(opts.configFile.string())) {
        std::cerr << "Error: Cannot read config file: " << opts.configFile << "\n";
        return 1;
    }

    auto& logger = zipbundle::core::Logger::instance();
    if (!logger.init(config.logging())) {
        std::cerr << "Warning: cannot open log file " << config.logging().file << "\n";
    }

    if (!opts.listFile.empty()) {
        const int rc = list_archive(opts.listFile);
        logger.shutdown();
        return rc;
    }

    std::error_code ec;
    if (!fs::is_directory(opts.inputDir, ec) || ec) {
        TraceLog(LOG_ERROR, "[pack_zip] input directory does not exist: %s", opts.inputDir.string().c_str());
        logger.shutdown();
        return 1;
    }

    struct FileEntry {
        fs::path absolutePath;
        std::string archivePath;
    };
    std::vector<FileEntry> files;

    for (const auto& entry : fs::recursive_directory_iterator(opts.inputDir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }

        std::error_code relEc;
        fs::path relativePath = fs::relative(entry.path(), opts.inputDir, relEc);
        if (relEc) {
            TraceLog(LOG_WARNING, "[pack_zip] skipping %s: %s", entry.path().string().c_str(),
                     relEc.message().c_str());
            continue;
        }

        // generic_u8string keeps non-ASCII names as UTF-8 on every platform.
        const auto u8 = relativePath.generic_u8string();
        std::string archivePath(u8.begin(), u8.end());

        if (should_exclude(archivePath, opts.excludePatterns)) {
            if (opts.verbose) {
                std::cout << "Excluding: " << archivePath << "\n";
            }
            continue;
        }

        files.push_back({entry.path(), archivePath});
    }
    if (ec) {
        TraceLog(LOG_ERROR, "[pack_zip] error iterating directory: %s", ec.message().c_str());
        logger.shutdown();
        return 1;
    }

    if (files.empty() && !config.archive().allowEmpty) {
        TraceLog(LOG_ERROR, "[pack_zip] no files to pack");
        logger.shutdown();
        return 1;
    }

    if (config.archive().sort) {
        std::sort(files.begin(), files.end(),
                  [](const FileEntry& a, const FileEntry& b) { return a.archivePath < b.archivePath; });
    }

    zipbundle::zip::Archive archive;
    zipbundle::zip::ArchiveError error;
    std::uint64_t totalSize = 0;

    for (const auto& file : files) {
        auto data = read_file(file.absolutePath);
        if (!data) {
            TraceLog(LOG_ERROR, "[pack_zip] failed to read %s", file.absolutePath.string().c_str());
            logger.shutdown();
            return 1;
        }

        totalSize += data->size();

        if (!archive.add_entry(file.archivePath, std::move(data), &error)) {
            TraceLog(LOG_ERROR, "[pack_zip] failed to add %s: %s", file.archivePath.c_str(), error.message.c_str());
            logger.shutdown();
            return 1;
        }

        if (opts.verbose) {
            std::cout << file.archivePath << "\n";
        }
    }

    fs::path outputDir = opts.outputFile.parent_path();
    if (!outputDir.empty() && !fs::exists(outputDir, ec)) {
        fs::create_directories(outputDir, ec);
        if (ec) {
            TraceLog(LOG_ERROR, "[pack_zip] cannot create output directory: %s", ec.message().c_str());
            logger.shutdown();
            return 1;
        }
    }

    if (!zipbundle::zip::write_archive_file(archive, opts.outputFile, config.archive_options(), &error)) {
        TraceLog(LOG_ERROR, "[pack_zip] %s: %s", zipbundle::zip::to_string(error.kind), error.message.c_str());
        logger.shutdown();
        return 1;
    }

    // Report.
    auto outputSize = fs::file_size(opts.outputFile, ec);
    if (ec) {
        outputSize = 0;
    }

    std::cout << "Packed " << archive.entry_count() << " files into " << opts.outputFile << "\n";
    std::cout << "  Input size:  " << (totalSize / 1024) << " KB\n";
    std::cout << "  Output size: " << (outputSize / 1024) << " KB\n";
    if (logger.warning_count() > 0) {
        std::cout << "  Warnings:    " << logger.warning_count() << "\n";
    }

    logger.shutdown();
    return 0;
}
