#pragma once

// type_registry - maps recorded class names to reconstruction functions.

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "coder.hpp"

namespace nscoder {

class type_registry {
public:
    using unarchive_fn = std::function<std::optional<any_object>(const decoder&)>;

    // Registers T and, walking up its superclass chain, every ancestor under
    // its own name. A name that is already present keeps its first
    // registration.
    template <Archivable T>
    void register_type() {
        if constexpr (!is_root_class<T>) {
            register_type<typename T::super>();
        }
        register_class(T::class_name, [](const decoder& ar) -> std::optional<any_object> {
            auto object = T::decode(ar);
            if (!object) return std::nullopt;
            return any_object::erasing(std::move(*object));
        });
    }

    // Returns false, leaving the registry unchanged, when the name is taken.
    auto register_class(const std::string& class_name, unarchive_fn fn) -> bool {
        return unarchive_fns.try_emplace(class_name, std::move(fn)).second;
    }

    auto find(const std::string& class_name) const -> const unarchive_fn* {
        auto it = unarchive_fns.find(class_name);
        return it == unarchive_fns.end() ? nullptr : &it->second;
    }

    auto contains(const std::string& class_name) const -> bool {
        return unarchive_fns.contains(class_name);
    }

    auto size() const -> std::size_t { return unarchive_fns.size(); }

    auto class_names() const -> std::vector<std::string> {
        auto names = std::vector<std::string>{};
        names.reserve(unarchive_fns.size());
        for (const auto& [name, fn] : unarchive_fns) {
            names.push_back(name);
        }
        return names;
    }

private:
    std::map<std::string, unarchive_fn> unarchive_fns;
};

} // namespace nscoder
