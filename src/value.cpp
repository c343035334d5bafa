// value.cpp - libplist binding for value and value_ref

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include "nscoder/error.hpp"
#include "nscoder/value.hpp"

namespace nscoder {

auto to_string(value_kind k) -> const char* {
    switch (k) {
        case value_kind::null:       return "null";
        case value_kind::boolean:    return "boolean";
        case value_kind::integer:    return "integer";
        case value_kind::real:       return "real";
        case value_kind::string:     return "string";
        case value_kind::date:       return "date";
        case value_kind::data:       return "data";
        case value_kind::array:      return "array";
        case value_kind::dictionary: return "dictionary";
        case value_kind::uid:        return "uid";
    }
    return "unknown";
}

namespace {

// Takes ownership of a libplist-allocated string.
auto adopt_string(char* s) -> std::string {
    auto result = s ? std::string(s) : std::string{};
    plist_mem_free(s);
    return result;
}

auto describe(plist_err_t err) -> std::string {
    switch (err) {
        case PLIST_ERR_SUCCESS:     return "success";
        case PLIST_ERR_INVALID_ARG: return "invalid argument";
        case PLIST_ERR_FORMAT:      return "unrecognized property list format";
        case PLIST_ERR_PARSE:       return "property list parse error";
        case PLIST_ERR_NO_MEM:      return "out of memory";
        case PLIST_ERR_IO:          return "i/o error";
        default:                    return "libplist error " + std::to_string(static_cast<int>(err));
    }
}

} // namespace

// =============================================================================
// value_ref
// =============================================================================

auto value_ref::kind() const -> value_kind {
    switch (plist_get_node_type(node_)) {
        case PLIST_BOOLEAN: return value_kind::boolean;
        case PLIST_INT:     return value_kind::integer;
        case PLIST_REAL:    return value_kind::real;
        case PLIST_STRING:
        case PLIST_KEY:     return value_kind::string;
        case PLIST_DATE:    return value_kind::date;
        case PLIST_DATA:    return value_kind::data;
        case PLIST_ARRAY:   return value_kind::array;
        case PLIST_DICT:    return value_kind::dictionary;
        case PLIST_UID:     return value_kind::uid;
        default:            return value_kind::null;
    }
}

auto value_ref::as_boolean() const -> std::optional<bool> {
    if (!is(value_kind::boolean)) return std::nullopt;
    uint8_t b = 0;
    plist_get_bool_val(node_, &b);
    return b != 0;
}

auto value_ref::as_integer() const -> std::optional<int64_t> {
    if (!is(value_kind::integer)) return std::nullopt;
    if (plist_int_val_is_negative(node_)) {
        int64_t i = 0;
        plist_get_int_val(node_, &i);
        return i;
    }
    uint64_t u = 0;
    plist_get_uint_val(node_, &u);
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<int64_t>(u);
}

auto value_ref::as_real() const -> std::optional<double> {
    if (!is(value_kind::real)) return std::nullopt;
    double d = 0.0;
    plist_get_real_val(node_, &d);
    return d;
}

auto value_ref::as_string() const -> std::optional<std::string> {
    if (!is(value_kind::string)) return std::nullopt;
    char* s = nullptr;
    if (plist_get_node_type(node_) == PLIST_KEY) {
        plist_get_key_val(node_, &s);
    } else {
        plist_get_string_val(node_, &s);
    }
    return adopt_string(s);
}

auto value_ref::as_uid() const -> std::optional<uint64_t> {
    if (!is(value_kind::uid)) return std::nullopt;
    uint64_t index = 0;
    plist_get_uid_val(node_, &index);
    return index;
}

auto value_ref::size() const -> std::size_t {
    if (is(value_kind::array)) return plist_array_get_size(node_);
    if (is(value_kind::dictionary)) return plist_dict_get_size(node_);
    return 0;
}

auto value_ref::at(std::size_t index) const -> value_ref {
    if (!is(value_kind::array) || index >= size()) return value_ref{};
    return value_ref{plist_array_get_item(node_, static_cast<uint32_t>(index))};
}

auto value_ref::get(const char* key) const -> value_ref {
    if (!is(value_kind::dictionary)) return value_ref{};
    return value_ref{plist_dict_get_item(node_, key)};
}

void value_ref::for_each_member(const std::function<void(const std::string&, value_ref)>& visit) const {
    if (!is(value_kind::dictionary)) return;

    plist_dict_iter raw = nullptr;
    plist_dict_new_iter(node_, &raw);
    if (!raw) return;

    // visit may throw; the iterator is released either way
    auto iter = std::unique_ptr<void, void (*)(void*)>(raw, plist_mem_free);

    while (true) {
        char* key = nullptr;
        plist_t item = nullptr;
        plist_dict_next_item(node_, iter.get(), &key, &item);
        if (!key) break;
        auto name = adopt_string(key);
        visit(name, value_ref{item});
    }
}

void value_ref::set(const char* key, value item) const {
    detail::check_invariant(is(value_kind::dictionary), "value_ref::set on a non-dictionary node");
    plist_dict_set_item(node_, key, item.release());
}

void value_ref::append(value item) const {
    detail::check_invariant(is(value_kind::array), "value_ref::append on a non-array node");
    plist_array_append_item(node_, item.release());
}

// =============================================================================
// value
// =============================================================================

value::~value() {
    if (node_) plist_free(node_);
}

value::value(value&& other) noexcept : node_(other.node_) {
    other.node_ = nullptr;
}

value& value::operator=(value&& other) noexcept {
    if (this != &other) {
        if (node_) plist_free(node_);
        node_ = other.node_;
        other.node_ = nullptr;
    }
    return *this;
}

auto value::clone() const -> value {
    return value{node_ ? plist_copy(node_) : nullptr};
}

auto value::release() -> plist_t {
    auto node = node_;
    node_ = nullptr;
    return node;
}

auto value::dictionary() -> value { return value{plist_new_dict()}; }
auto value::array() -> value { return value{plist_new_array()}; }
auto value::string(const std::string& s) -> value { return value{plist_new_string(s.c_str())}; }
auto value::integer(int64_t i) -> value { return value{plist_new_int(i)}; }
auto value::uid(uint64_t index) -> value { return value{plist_new_uid(index)}; }

auto value::parse(std::span<const uint8_t> bytes) -> value {
    if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
        throw malformed_data("property list exceeds 4 GiB");
    }
    plist_t node = nullptr;
    auto err = plist_from_memory(reinterpret_cast<const char*>(bytes.data()),
                                 static_cast<uint32_t>(bytes.size()), &node, nullptr);
    if (err != PLIST_ERR_SUCCESS || !node) {
        if (node) plist_free(node);
        throw malformed_data(describe(err));
    }
    return value{node};
}

auto value::read_file(const std::filesystem::path& path) -> value {
    auto file = std::ifstream(path, std::ios::binary);
    if (!file) {
        throw malformed_data("cannot open " + path.string());
    }
    auto bytes = std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return parse(bytes);
}

auto value::to_bytes(archive_format fmt) const -> std::vector<uint8_t> {
    char* data = nullptr;
    uint32_t length = 0;
    auto err = fmt == archive_format::xml
        ? plist_to_xml(node_, &data, &length)
        : plist_to_bin(node_, &data, &length);
    if (err != PLIST_ERR_SUCCESS || !data) {
        plist_mem_free(data);
        throw malformed_data(describe(err));
    }
    auto result = std::vector<uint8_t>(reinterpret_cast<uint8_t*>(data),
                                       reinterpret_cast<uint8_t*>(data) + length);
    plist_mem_free(data);
    return result;
}

void value::write_file(const std::filesystem::path& path, archive_format fmt) const {
    auto bytes = to_bytes(fmt);
    auto file = std::ofstream(path, std::ios::binary);
    if (!file) {
        throw malformed_data("cannot open " + path.string() + " for writing");
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw malformed_data("failed writing " + path.string());
    }
}

} // namespace nscoder
