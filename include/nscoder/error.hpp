#pragma once

// Error taxonomy for archive decoding and the plist collaborator.

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace nscoder {

// ============================================================================
// Error kinds
// ============================================================================

enum class error_kind {
    malformed_data,
    unsupported_archiver,
    no_root_object,
    malformed_object,
    unknown_class,
};

inline auto to_string(error_kind k) -> const char* {
    switch (k) {
        case error_kind::malformed_data:       return "malformed_data";
        case error_kind::unsupported_archiver: return "unsupported_archiver";
        case error_kind::no_root_object:       return "no_root_object";
        case error_kind::malformed_object:     return "malformed_object";
        case error_kind::unknown_class:        return "unknown_class";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<error_kind>, const std::string& s) -> error_kind {
    if (s == "malformed_data")       return error_kind::malformed_data;
    if (s == "unsupported_archiver") return error_kind::unsupported_archiver;
    if (s == "no_root_object")       return error_kind::no_root_object;
    if (s == "malformed_object")     return error_kind::malformed_object;
    if (s == "unknown_class")        return error_kind::unknown_class;
    throw std::runtime_error("unknown error kind: " + s);
}

// ============================================================================
// archive_error - base of everything the decode entry points throw
// ============================================================================

class archive_error : public std::runtime_error {
public:
    archive_error(error_kind kind, const std::string& message, std::string detail = {})
        : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

    auto kind() const -> error_kind { return kind_; }

    // Archiver name for unsupported_archiver, class name for unknown_class,
    // collaborator message for malformed_data; empty otherwise.
    auto detail() const -> const std::string& { return detail_; }

private:
    error_kind kind_;
    std::string detail_;
};

class malformed_data : public archive_error {
public:
    explicit malformed_data(const std::string& reason)
        : archive_error(error_kind::malformed_data, "archive data is malformed: " + reason, reason) {}
};

class unsupported_archiver : public archive_error {
public:
    explicit unsupported_archiver(const std::string& name)
        : archive_error(error_kind::unsupported_archiver, "archiver `" + name + "` is not supported", name) {}
};

class no_root_object : public archive_error {
public:
    no_root_object()
        : archive_error(error_kind::no_root_object, "root object is not found") {}
};

class malformed_object : public archive_error {
public:
    malformed_object()
        : archive_error(error_kind::malformed_object, "structure of the decoding object is malformed") {}
};

class unknown_class : public archive_error {
public:
    explicit unknown_class(const std::string& name)
        : archive_error(error_kind::unknown_class,
                        "decoding class `" + name + "` is unknown, did you forget to register?", name) {}
};

namespace detail {

// Engine invariant violations are defects in this library, never bad input.
[[noreturn]] void invariant_failure(const char* what);

inline void check_invariant(bool condition, const char* what) {
    if (!condition) invariant_failure(what);
}

} // namespace detail

} // namespace nscoder
