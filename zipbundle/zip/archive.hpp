#pragma once

#include "zip_format.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace zipbundle::zip {

enum class ArchiveErrorKind : std::uint8_t {
    None = 0,
    InvalidEntry,       // Empty name or missing payload.
    SizeLimitExceeded,  // Field would not fit without Zip64.
    EmptyArchiveState,  // No entries and empty archives are disallowed.
    IoError,
    Malformed,          // Reader: structure is inconsistent.
    Unsupported,        // Reader: valid ZIP feature this project does not handle.
};

const char* to_string(ArchiveErrorKind kind);

struct ArchiveError {
    ArchiveErrorKind kind{ArchiveErrorKind::None};
    std::string message;
};

// Fills outError (if provided). Always returns false for `return fail(...)`.
bool fail(ArchiveError* outError, ArchiveErrorKind kind, std::string message);

// One named payload. Derived fields (size, checksum, offset) are computed
// during assembly.
struct Entry {
    std::string name;  // UTF-8, forward slashes.
    std::vector<std::uint8_t> payload;
};

enum class Utf8Names : std::uint8_t {
    Auto = 0,  // Flag only names containing bytes >= 0x80.
    Always,
    Never,
};

struct ArchiveOptions {
    Utf8Names utf8Names{Utf8Names::Auto};

    // Unset: every entry carries the DOS epoch (1980-01-01 00:00:00), which
    // keeps output byte-identical across runs.
    std::optional<std::time_t> modifiedTime{};

    // When false, assembling an archive without entries fails with
    // EmptyArchiveState instead of producing a bare end-of-directory record.
    bool allowEmpty{true};
};

// Ordered collection of entries. Insertion order is both the physical order
// of the local entries and the listing order of the central directory.
class Archive {
public:
    Archive() = default;

    // Append an entry.
    // @param name     Path inside the archive (e.g., "images/1_front.png").
    // @param payload  File contents; std::nullopt is rejected.
    // @return true on success; on failure fills outError with InvalidEntry.
    bool add_entry(std::string name,
                   std::optional<std::vector<std::uint8_t>> payload,
                   ArchiveError* outError = nullptr);

    const std::vector<Entry>& entries() const { return entries_; }
    std::size_t entry_count() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void clear() { entries_.clear(); }

private:
    std::vector<Entry> entries_;
};

// True if any byte of `name` is outside 7-bit ASCII.
bool needs_utf8_flag(const std::string& name);

// General purpose flags for an entry name under the given policy.
std::uint16_t entry_flags(const std::string& name, Utf8Names policy);

} // namespace zipbundle::zip
