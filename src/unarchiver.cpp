// unarchiver.cpp - implementation of unarchiver

#include <string>
#include <utility>
#include "nscoder/error.hpp"
#include "nscoder/format.hpp"
#include "nscoder/log.hpp"
#include "nscoder/unarchiver.hpp"

namespace nscoder {

namespace kf = keyed_format;

// =============================================================================
// object_decoder - decoder bound to one record slot
// =============================================================================

class unarchiver::object_decoder : public decoder {
public:
    object_decoder(const unarchiver& owner, uint64_t index) : ar(owner), index(index) {}

    auto decode_i32(const char* key) const -> int32_t override {
        return static_cast<int32_t>(decode_i64(key));
    }

    auto decode_i64(const char* key) const -> int64_t override {
        return field(key).as_integer().value_or(0);
    }

    auto decode_string(const char* key) const -> std::optional<std::string> override {
        auto target = reference(key);
        if (!target) return std::nullopt;
        return ar.entry(*target).as_string();
    }

    auto decode_object(const char* key) const -> std::optional<any_object> override {
        auto target = reference(key);
        if (!target) return std::nullopt;
        try {
            return ar.decode_object_at(*target);
        } catch (const archive_error& e) {
            log(std::string("field `") + key + "` dropped: " + e.what());
            return std::nullopt;
        }
    }

private:
    auto field(const char* key) const -> value_ref {
        return ar.entry(index).get(key);
    }

    // The table index a field refers to, if it is an in-range reference.
    auto reference(const char* key) const -> std::optional<uint64_t> {
        auto target = field(key).as_uid();
        if (!target || !ar.contains(*target)) return std::nullopt;
        return target;
    }

    const unarchiver& ar;
    uint64_t index;
};

// =============================================================================
// unarchiver
// =============================================================================

auto unarchiver::unarchive_root_object() const -> any_object {
    try {
        if (env.archiver != kf::ARCHIVER) {
            throw unsupported_archiver(env.archiver);
        }

        auto root = env.top.find(kf::ROOT_NAME);
        if (root == env.top.end()) {
            throw no_root_object();
        }
        if (!contains(root->second)) {
            throw malformed_object();
        }
        return decode_object_at(root->second);
    } catch (const archive_error& e) {
        log(std::string("unarchive failed: ") + e.what());
        throw;
    }
}

auto unarchiver::decode_object_at(uint64_t index) const -> any_object {
    auto record = entry(index);
    if (!record.is(value_kind::dictionary)) {
        throw malformed_object();
    }

    auto class_index = record.get(kf::KEY_CLASS).as_uid();
    if (!class_index || !contains(*class_index)) {
        throw malformed_object();
    }

    auto class_name = entry(*class_index).get(kf::KEY_CLASSNAME).as_string();
    if (!class_name) {
        throw malformed_object();
    }

    const auto* unarchive = registry.find(*class_name);
    if (!unarchive) {
        throw unknown_class(*class_name);
    }

    auto context = object_decoder{*this, index};
    auto object = (*unarchive)(context);
    if (!object) {
        throw malformed_object();
    }
    return std::move(*object);
}

auto unarchiver::entry(uint64_t index) const -> value_ref {
    detail::check_invariant(contains(index), "table index outside the object table");
    return env.object(index);
}

} // namespace nscoder
