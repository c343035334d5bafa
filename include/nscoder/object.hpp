#pragma once

// Archivable type declarations, class ancestry, and the type-erased
// any_object handle.
//
// An archivable type names its Cocoa class and superclass statically and
// knows how to encode and decode its own fields:
//
//   struct person {
//       using super = nscoder::root_object;
//       static constexpr const char* class_name = "RCDPerson";
//
//       int age = 0;
//       std::string first_name;
//
//       void encode(nscoder::encoder& ar) const {
//           ar.encode_i32(age, "Age");
//           ar.encode_string(first_name, "FirstName");
//       }
//
//       static auto decode(const nscoder::decoder& ar) -> std::optional<person> {
//           auto first_name = ar.decode_string("FirstName");
//           if (!first_name) return std::nullopt;
//           return person{ar.decode_i32("Age"), *first_name};
//       }
//   };
//
// Superclass fields are never decoded implicitly. A type whose superclass
// carries data encodes and decodes those fields itself.

#include <any>
#include <concepts>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace nscoder {

class encoder;
class decoder;

// ============================================================================
// Archivable concept
// ============================================================================

template <typename T>
concept Archivable = std::copy_constructible<T> && requires(const T& t, encoder& ar, const decoder& dr) {
    typename T::super;
    { T::class_name } -> std::convertible_to<const char*>;
    { T::super::class_name } -> std::convertible_to<const char*>;
    t.encode(ar);
    { T::decode(dr) } -> std::same_as<std::optional<T>>;
};

template <typename T>
concept Streamable = requires(std::ostream& os, const T& t) {
    { os << t } -> std::convertible_to<std::ostream&>;
};

// ============================================================================
// root_object - NSObject, the top of every class chain
// ============================================================================

struct root_object {
    using super = root_object;
    static constexpr const char* class_name = "NSObject";

    void encode(encoder&) const {}

    static auto decode(const decoder&) -> std::optional<root_object> {
        return root_object{};
    }
};

// The root class is the one that names itself as its superclass.
template <Archivable T>
constexpr bool is_root_class = std::is_same_v<typename T::super, T>;

// Class name followed by every superclass name, most-derived first.
template <Archivable T>
auto ancestor_chain() -> std::vector<std::string> {
    auto classes = std::vector<std::string>{T::class_name};
    if constexpr (!is_root_class<T>) {
        auto rest = ancestor_chain<typename T::super>();
        classes.insert(classes.end(), rest.begin(), rest.end());
    }
    return classes;
}

// ============================================================================
// any_object - owns one archivable value of any type
// ============================================================================

class any_object {
public:
    template <Archivable T>
    static auto erasing(T object) -> any_object {
        auto result = any_object{};
        result.object_ = std::move(object);
        result.class_name_ = T::class_name;
        result.debug_fn_ = [](const std::any& a, std::ostream& os) {
            const auto& t = std::any_cast<const T&>(a);
            if constexpr (Streamable<T>) {
                os << t;
            } else {
                os << '<' << T::class_name << '>';
            }
        };
        result.encode_fn_ = [](const std::any& a, encoder& ar) {
            std::any_cast<const T&>(a).encode(ar);
        };
        result.classes_fn_ = &ancestor_chain<T>;
        return result;
    }

    auto class_name() const -> const char* { return class_name_; }
    auto classes() const -> std::vector<std::string> { return classes_fn_(); }
    auto type() const -> const std::type_info& { return object_.type(); }

    void encode(encoder& ar) const { encode_fn_(object_, ar); }

    template <typename T>
    auto is() const -> bool {
        return object_.type() == typeid(T);
    }

    // Borrowing downcast; nullptr on type mismatch.
    template <typename T>
    auto get() const -> const T* {
        return std::any_cast<T>(&object_);
    }

    template <typename T>
    auto get() -> T* {
        return std::any_cast<T>(&object_);
    }

    // Owning downcast. On mismatch returns nullopt and leaves this handle
    // untouched so the caller can try another type.
    template <typename T>
    auto downcast() && -> std::optional<T> {
        if (!is<T>()) return std::nullopt;
        return std::any_cast<T>(std::move(object_));
    }

    friend auto operator<<(std::ostream& os, const any_object& object) -> std::ostream& {
        object.debug_fn_(object.object_, os);
        return os;
    }

private:
    any_object() = default;

    std::any object_;
    const char* class_name_ = nullptr;
    void (*debug_fn_)(const std::any&, std::ostream&) = nullptr;
    void (*encode_fn_)(const std::any&, encoder&) = nullptr;
    auto (*classes_fn_)() -> std::vector<std::string> = nullptr;
};

} // namespace nscoder
