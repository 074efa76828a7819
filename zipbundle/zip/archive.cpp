#include "archive.hpp"

#include <algorithm>

namespace zipbundle::zip {

const char* to_string(ArchiveErrorKind kind) {
    switch (kind) {
        case ArchiveErrorKind::None: return "none";
        case ArchiveErrorKind::InvalidEntry: return "invalid entry";
        case ArchiveErrorKind::SizeLimitExceeded: return "size limit exceeded";
        case ArchiveErrorKind::EmptyArchiveState: return "empty archive";
        case ArchiveErrorKind::IoError: return "i/o error";
        case ArchiveErrorKind::Malformed: return "malformed archive";
        case ArchiveErrorKind::Unsupported: return "unsupported";
        default: break;
    }
    return "unknown";
}

bool fail(ArchiveError* outError, ArchiveErrorKind kind, std::string message) {
    if (outError) {
        outError->kind = kind;
        outError->message = std::move(message);
    }
    return false;
}

bool Archive::add_entry(std::string name,
                        std::optional<std::vector<std::uint8_t>> payload,
                        ArchiveError* outError) {
    if (name.empty()) {
        return fail(outError, ArchiveErrorKind::InvalidEntry, "entry name is empty");
    }
    if (!payload) {
        return fail(outError, ArchiveErrorKind::InvalidEntry, "entry '" + name + "' has no payload");
    }

    Entry entry;
    entry.name = std::move(name);
    entry.payload = std::move(*payload);
    entries_.push_back(std::move(entry));
    return true;
}

bool needs_utf8_flag(const std::string& name) {
    return std::any_of(name.begin(), name.end(),
                       [](char c) { return static_cast<unsigned char>(c) >= 0x80; });
}

std::uint16_t entry_flags(const std::string& name, Utf8Names policy) {
    switch (policy) {
        case Utf8Names::Always: return FlagUtf8Name;
        case Utf8Names::Never: return FlagNone;
        case Utf8Names::Auto:
        default:
            break;
    }
    return needs_utf8_flag(name) ? FlagUtf8Name : FlagNone;
}

} // namespace zipbundle::zip
