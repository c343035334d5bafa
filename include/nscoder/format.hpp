#pragma once

// Keyed archive wire constants and the on-disk property list format.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace nscoder {

// ============================================================================
// Keyed archive wire format
// ============================================================================

namespace keyed_format {

// Only the keyed variant is supported; "NSArchiver" archives are rejected.
inline constexpr const char* ARCHIVER = "NSKeyedArchiver";
inline constexpr uint64_t VERSION = 100000;

inline constexpr const char* NULL_SENTINEL = "$null";
inline constexpr const char* ROOT_NAME = "root";

// Envelope keys
inline constexpr const char* KEY_ARCHIVER = "$archiver";
inline constexpr const char* KEY_OBJECTS  = "$objects";
inline constexpr const char* KEY_TOP      = "$top";
inline constexpr const char* KEY_VERSION  = "$version";

// Object record / class info keys
inline constexpr const char* KEY_CLASS     = "$class";
inline constexpr const char* KEY_CLASSES   = "$classes";
inline constexpr const char* KEY_CLASSNAME = "$classname";

} // namespace keyed_format

// ============================================================================
// Property list container format
// ============================================================================

enum class archive_format {
    binary,
    xml,
};

inline auto to_string(archive_format f) -> const char* {
    switch (f) {
        case archive_format::binary: return "binary";
        case archive_format::xml:    return "xml";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<archive_format>, const std::string& s) -> archive_format {
    if (s == "binary") return archive_format::binary;
    if (s == "xml")    return archive_format::xml;
    throw std::runtime_error("unknown archive format: " + s);
}

inline auto infer_format_from_filename(std::string_view filename) -> archive_format {
    if (filename.ends_with(".plist") || filename.ends_with(".bplist")) return archive_format::binary;
    if (filename.ends_with(".xml")) return archive_format::xml;
    throw std::runtime_error(std::string("cannot infer format from filename: ") + std::string(filename));
}

} // namespace nscoder
