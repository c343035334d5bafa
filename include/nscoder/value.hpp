#pragma once

// Thin RAII layer over libplist: the value tree every archive is parsed into
// and serialized from.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <plist/plist.h>

#include "format.hpp"

namespace nscoder {

// ============================================================================
// Node kinds
// ============================================================================

enum class value_kind {
    null,
    boolean,
    integer,
    real,
    string,
    date,
    data,
    array,
    dictionary,
    uid,
};

auto to_string(value_kind k) -> const char*;

class value;

// ============================================================================
// value_ref - non-owning view of a node
// ============================================================================

class value_ref {
public:
    value_ref() = default;
    explicit value_ref(plist_t node) : node_(node) {}

    explicit operator bool() const { return node_ != nullptr; }
    auto node() const -> plist_t { return node_; }

    // --- Kind tests ---

    auto kind() const -> value_kind;
    auto is(value_kind k) const -> bool { return node_ && kind() == k; }

    // --- Narrowing (nullopt on kind mismatch) ---

    auto as_boolean() const -> std::optional<bool>;
    auto as_integer() const -> std::optional<int64_t>;
    auto as_real() const -> std::optional<double>;
    auto as_string() const -> std::optional<std::string>;
    auto as_uid() const -> std::optional<uint64_t>;

    // --- Containers ---

    // Item count of an array or dictionary, 0 for scalars.
    auto size() const -> std::size_t;

    // Array element, or an empty ref when out of range or not an array.
    auto at(std::size_t index) const -> value_ref;

    // Dictionary member, or an empty ref when missing or not a dictionary.
    auto get(const char* key) const -> value_ref;

    void for_each_member(const std::function<void(const std::string&, value_ref)>& visit) const;

    // --- Mutation (takes ownership of item) ---

    // Replaces any previous member under key.
    void set(const char* key, value item) const;
    void append(value item) const;

private:
    plist_t node_ = nullptr;
};

// ============================================================================
// value - owning handle
// ============================================================================

class value {
public:
    value() = default;
    explicit value(plist_t node) : node_(node) {}
    ~value();

    value(const value&) = delete;
    value& operator=(const value&) = delete;
    value(value&& other) noexcept;
    value& operator=(value&& other) noexcept;

    explicit operator bool() const { return node_ != nullptr; }
    auto ref() const -> value_ref { return value_ref{node_}; }
    auto clone() const -> value;

    // Hands the node over to the caller, leaving this handle empty.
    auto release() -> plist_t;

    // --- Factories ---

    static auto dictionary() -> value;
    static auto array() -> value;
    static auto string(const std::string& s) -> value;
    static auto integer(int64_t i) -> value;
    static auto uid(uint64_t index) -> value;

    // --- Codec (throws malformed_data) ---

    // Binary and XML property lists are both accepted.
    static auto parse(std::span<const uint8_t> bytes) -> value;
    static auto read_file(const std::filesystem::path& path) -> value;

    auto to_bytes(archive_format fmt = archive_format::binary) const -> std::vector<uint8_t>;
    void write_file(const std::filesystem::path& path, archive_format fmt = archive_format::binary) const;

private:
    plist_t node_ = nullptr;
};

} // namespace nscoder
