#pragma once

// unarchiver - walks the object table of one envelope, reconstructing objects
// through the type registry.
//
// Only unarchive_root_object reports errors. A nested object that fails to
// decode reads as a missing field; the enclosing type's decode decides
// whether that is fatal for it.

#include <cstdint>

#include "coder.hpp"
#include "envelope.hpp"
#include "registry.hpp"

namespace nscoder {

class unarchiver {
public:
    // Both are borrowed for the unarchiver's lifetime.
    unarchiver(const envelope& env, const type_registry& registry)
        : env(env), registry(registry) {}

    unarchiver(const unarchiver&) = delete;
    unarchiver& operator=(const unarchiver&) = delete;

    // Throws unsupported_archiver, no_root_object, malformed_object or
    // unknown_class.
    auto unarchive_root_object() const -> any_object;

private:
    class object_decoder;

    // Dispatches the record at index on its recorded class name.
    auto decode_object_at(uint64_t index) const -> any_object;

    auto contains(uint64_t index) const -> bool { return index < env.object_count(); }
    auto entry(uint64_t index) const -> value_ref;

    const envelope& env;
    const type_registry& registry;
};

} // namespace nscoder
