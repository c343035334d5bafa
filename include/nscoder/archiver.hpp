#pragma once

// archiver - builds the object table for one encode call.
//
// Each object being encoded gets its own record slot and its own encoder
// context bound to that slot, so nested encode_object calls never disturb
// the enclosing object's context. Usage:
//
//   auto ar = nscoder::archiver{};
//   auto root = ar.encode_new_object([&](nscoder::encoder& e) {
//       object.encode(e);
//       return nscoder::ancestor_chain<T>();
//   });
//   auto env = std::move(ar).seal(root);

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "coder.hpp"
#include "envelope.hpp"
#include "value.hpp"

namespace nscoder {

class archiver {
public:
    // Fills the record's fields through the encoder and returns the class
    // chain (most-derived first) to record for it.
    using build_fn = std::function<std::vector<std::string>(encoder&)>;

    archiver();

    archiver(const archiver&) = delete;
    archiver& operator=(const archiver&) = delete;
    archiver(archiver&&) = default;
    archiver& operator=(archiver&&) = default;

    // Reserves the record slot before any field is written, so the new
    // object's index is fixed while its children are appended after it.
    auto encode_new_object(const build_fn& build) -> uint64_t;

    auto object_count() const -> std::size_t { return objects.ref().size(); }

    auto seal(uint64_t root_index) && -> envelope;

private:
    class object_encoder;

    auto append(value item) -> uint64_t;
    auto record(uint64_t index) const -> value_ref;

    value objects;
};

} // namespace nscoder
