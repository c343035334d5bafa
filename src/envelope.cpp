// envelope.cpp - conversion between envelope and its property list form

#include <string>
#include <utility>
#include "nscoder/envelope.hpp"
#include "nscoder/error.hpp"
#include "nscoder/format.hpp"

namespace nscoder {

namespace kf = keyed_format;

auto read_envelope(value_ref root) -> envelope {
    if (!root.is(value_kind::dictionary)) {
        throw malformed_data("archive root is not a dictionary");
    }

    auto env = envelope{};

    auto archiver = root.get(kf::KEY_ARCHIVER).as_string();
    if (!archiver) {
        throw malformed_data(std::string("missing or non-string ") + kf::KEY_ARCHIVER);
    }
    env.archiver = std::move(*archiver);

    auto objects = root.get(kf::KEY_OBJECTS);
    if (!objects.is(value_kind::array)) {
        throw malformed_data(std::string("missing or non-array ") + kf::KEY_OBJECTS);
    }
    env.objects = value{plist_copy(objects.node())};

    auto top = root.get(kf::KEY_TOP);
    if (!top.is(value_kind::dictionary)) {
        throw malformed_data(std::string("missing or non-dictionary ") + kf::KEY_TOP);
    }
    top.for_each_member([&env](const std::string& name, value_ref item) {
        auto index = item.as_uid();
        if (!index) {
            throw malformed_data(std::string(kf::KEY_TOP) + " entry `" + name + "` is not a reference");
        }
        env.top.emplace(name, *index);
    });

    auto version = root.get(kf::KEY_VERSION).as_integer();
    if (!version || *version < 0) {
        throw malformed_data(std::string("missing or invalid ") + kf::KEY_VERSION);
    }
    env.version = static_cast<uint64_t>(*version);

    return env;
}

auto write_envelope(envelope env) -> value {
    auto root = value::dictionary();
    auto top = value::dictionary();
    for (const auto& [name, index] : env.top) {
        top.ref().set(name.c_str(), value::uid(index));
    }
    root.ref().set(kf::KEY_ARCHIVER, value::string(env.archiver));
    root.ref().set(kf::KEY_OBJECTS, std::move(env.objects));
    root.ref().set(kf::KEY_TOP, std::move(top));
    root.ref().set(kf::KEY_VERSION, value::integer(static_cast<int64_t>(env.version)));
    return root;
}

} // namespace nscoder
