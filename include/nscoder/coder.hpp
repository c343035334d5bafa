#pragma once

// Field-level encode/decode interfaces handed to archivable types.
//
// Both operate on one object record at a time: the record currently being
// built (encoder) or read (decoder). Keys are plain field names such as
// "FirstName"; keys starting with '$' are reserved by the wire format.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "object.hpp"

namespace nscoder {

// =============================================================================
// encoder
// =============================================================================

class encoder {
public:
    virtual ~encoder() = default;

    // Integers are stored inline. Writing the same key twice keeps the last
    // value.
    virtual void encode_i32(int32_t value, const char* key) = 0;
    virtual void encode_i64(int64_t value, const char* key) = 0;

    // Strings get their own table slot and are stored by reference.
    virtual void encode_string(const std::string& value, const char* key) = 0;

    // Nested objects get their own record and class info slots.
    virtual void encode_object(const any_object& object, const char* key) = 0;

    template <Archivable T>
    void encode_archivable(const T& object, const char* key) {
        encode_object(any_object::erasing(object), key);
    }
};

// =============================================================================
// decoder
// =============================================================================

class decoder {
public:
    virtual ~decoder() = default;

    // 0 when the key is missing or not an integer.
    virtual auto decode_i32(const char* key) const -> int32_t = 0;
    virtual auto decode_i64(const char* key) const -> int64_t = 0;

    // nullopt when the key is missing, is not a reference, or points outside
    // the table or at something other than a string.
    virtual auto decode_string(const char* key) const -> std::optional<std::string> = 0;

    // nullopt on the same conditions as decode_string, or when the nested
    // object fails to decode for any reason. Nested failures never escape as
    // errors.
    virtual auto decode_object(const char* key) const -> std::optional<any_object> = 0;

    template <typename T>
    auto decode_as(const char* key) const -> std::optional<T> {
        auto object = decode_object(key);
        if (!object) return std::nullopt;
        return std::move(*object).template downcast<T>();
    }
};

} // namespace nscoder
