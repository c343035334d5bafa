// io.cpp - archive entry points

#include <utility>
#include "nscoder/envelope.hpp"
#include "nscoder/io.hpp"
#include "nscoder/unarchiver.hpp"

namespace nscoder {

auto from_value(value_ref root, const type_registry& registry) -> any_object {
    auto env = read_envelope(root);
    auto ar = unarchiver{env, registry};
    return ar.unarchive_root_object();
}

auto from_bytes(std::span<const uint8_t> bytes, const type_registry& registry) -> any_object {
    auto root = value::parse(bytes);
    return from_value(root.ref(), registry);
}

auto from_file(const std::filesystem::path& path, const type_registry& registry) -> any_object {
    auto root = value::read_file(path);
    return from_value(root.ref(), registry);
}

namespace detail {

auto archive_root(const std::function<void(encoder&)>& encode, std::vector<std::string> classes) -> value {
    auto ar = archiver{};
    auto root = ar.encode_new_object([&](encoder& e) {
        encode(e);
        return std::move(classes);
    });
    return write_envelope(std::move(ar).seal(root));
}

} // namespace detail

auto to_value(const any_object& object) -> value {
    return detail::archive_root([&object](encoder& ar) { object.encode(ar); }, object.classes());
}

} // namespace nscoder
