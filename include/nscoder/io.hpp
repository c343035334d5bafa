#pragma once

// Entry points: decode a root object from bytes, a file, or an already
// parsed property list; encode a root object to a property list, bytes, or
// a file.

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "archiver.hpp"
#include "format.hpp"
#include "object.hpp"
#include "registry.hpp"
#include "value.hpp"

namespace nscoder {

// ============================================================================
// Decoding (throws archive_error)
// ============================================================================

auto from_bytes(std::span<const uint8_t> bytes, const type_registry& registry) -> any_object;

auto from_file(const std::filesystem::path& path, const type_registry& registry) -> any_object;

// For callers that already parsed the property list for their own purposes.
// The tree is expected to come from a keyed archiver; it is not modified.
auto from_value(value_ref root, const type_registry& registry) -> any_object;

// ============================================================================
// Encoding
// ============================================================================

namespace detail {

auto archive_root(const std::function<void(encoder&)>& encode, std::vector<std::string> classes) -> value;

} // namespace detail

auto to_value(const any_object& object) -> value;

template <Archivable T>
auto to_value(const T& object) -> value {
    return detail::archive_root([&object](encoder& ar) { object.encode(ar); }, ancestor_chain<T>());
}

// Throws malformed_data if the collaborator fails to serialize.
template <typename T>
    requires Archivable<T> || std::same_as<T, any_object>
auto to_bytes(const T& object, archive_format fmt = archive_format::binary) -> std::vector<uint8_t> {
    return to_value(object).to_bytes(fmt);
}

template <typename T>
    requires Archivable<T> || std::same_as<T, any_object>
void to_file(const std::filesystem::path& path, const T& object, archive_format fmt = archive_format::binary) {
    to_value(object).write_file(path, fmt);
}

} // namespace nscoder
