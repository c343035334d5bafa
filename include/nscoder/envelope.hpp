#pragma once

// The keyed archive envelope: archiver name, object table, top-level names
// and version, as laid out on the wire.

#include <cstdint>
#include <map>
#include <string>

#include "value.hpp"

namespace nscoder {

struct envelope {
    std::string archiver;
    value objects;                          // $objects, an array node
    std::map<std::string, uint64_t> top;    // $top, name -> table index
    uint64_t version = 0;

    auto object_count() const -> std::size_t { return objects.ref().size(); }
    auto object(uint64_t index) const -> value_ref { return objects.ref().at(index); }
};

// Reads the four envelope fields out of a parsed property list. Throws
// malformed_data when the tree does not have the envelope's shape; the
// archiver name and the presence of a root entry are left for the
// unarchiver to judge.
auto read_envelope(value_ref root) -> envelope;

// Builds the $archiver/$objects/$top/$version dictionary, consuming the
// object table.
auto write_envelope(envelope env) -> value;

} // namespace nscoder
