// archiver.cpp - implementation of archiver

#include <string>
#include <utility>
#include "nscoder/archiver.hpp"
#include "nscoder/error.hpp"
#include "nscoder/format.hpp"
#include "nscoder/log.hpp"

namespace nscoder {

namespace kf = keyed_format;

// =============================================================================
// object_encoder - encoder bound to one record slot
// =============================================================================

class archiver::object_encoder : public encoder {
public:
    object_encoder(archiver& owner, uint64_t index) : ar(owner), index(index) {}

    void encode_i32(int32_t i, const char* key) override {
        encode_i64(i, key);
    }

    void encode_i64(int64_t i, const char* key) override {
        ar.record(index).set(key, value::integer(i));
    }

    void encode_string(const std::string& s, const char* key) override {
        auto string_index = ar.append(value::string(s));
        ar.record(index).set(key, value::uid(string_index));
    }

    void encode_object(const any_object& object, const char* key) override {
        auto object_index = ar.encode_new_object([&object](encoder& nested) {
            object.encode(nested);
            return object.classes();
        });
        ar.record(index).set(key, value::uid(object_index));
    }

    void link_class(uint64_t class_index) {
        ar.record(index).set(kf::KEY_CLASS, value::uid(class_index));
    }

private:
    archiver& ar;
    uint64_t index;
};

// =============================================================================
// archiver
// =============================================================================

archiver::archiver() : objects(value::array()) {
    objects.ref().append(value::string(kf::NULL_SENTINEL));
}

auto archiver::encode_new_object(const build_fn& build) -> uint64_t {
    auto index = append(value::dictionary());
    auto context = object_encoder{*this, index};

    auto classes = build(context);
    detail::check_invariant(!classes.empty(), "archived object has no class name");

    auto names = value::array();
    for (const auto& name : classes) {
        names.ref().append(value::string(name));
    }
    auto class_info = value::dictionary();
    class_info.ref().set(kf::KEY_CLASSES, std::move(names));
    class_info.ref().set(kf::KEY_CLASSNAME, value::string(classes.front()));

    context.link_class(append(std::move(class_info)));
    return index;
}

auto archiver::seal(uint64_t root_index) && -> envelope {
    detail::check_invariant(root_index < object_count(), "root index outside the object table");
    log("sealed archive with " + std::to_string(object_count()) + " table entries");

    auto env = envelope{};
    env.archiver = kf::ARCHIVER;
    env.objects = std::move(objects);
    env.top.emplace(kf::ROOT_NAME, root_index);
    env.version = kf::VERSION;
    return env;
}

auto archiver::append(value item) -> uint64_t {
    objects.ref().append(std::move(item));
    return object_count() - 1;
}

auto archiver::record(uint64_t index) const -> value_ref {
    detail::check_invariant(index < object_count(), "record index outside the object table");
    auto slot = objects.ref().at(index);
    detail::check_invariant(slot.is(value_kind::dictionary), "record slot is not a dictionary");
    return slot;
}

} // namespace nscoder
