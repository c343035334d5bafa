#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include "nscoder/nscoder.hpp"

using namespace nscoder;

// =============================================================================
// Archivable classes
// =============================================================================

struct person_t {
    using super = root_object;
    static constexpr const char* class_name = "RCDPerson";

    int age = 0;
    std::string first_name;
    std::string last_name;

    void encode(encoder& ar) const {
        ar.encode_i32(age, "Age");
        ar.encode_string(first_name, "FirstName");
        ar.encode_string(last_name, "LastName");
    }

    static auto decode(const decoder& ar) -> std::optional<person_t> {
        auto first_name = ar.decode_string("FirstName");
        auto last_name = ar.decode_string("LastName");
        if (!first_name || !last_name) return std::nullopt;
        return person_t{ar.decode_i32("Age"), *first_name, *last_name};
    }
};

inline auto operator<<(std::ostream& os, const person_t& p) -> std::ostream& {
    return os << p.first_name << " " << p.last_name << " (" << p.age << ")";
}

struct team_t {
    using super = root_object;
    static constexpr const char* class_name = "RCDTeam";

    std::string name;
    std::optional<person_t> lead;

    void encode(encoder& ar) const {
        ar.encode_string(name, "Name");
        if (lead) ar.encode_archivable(*lead, "Lead");
    }

    static auto decode(const decoder& ar) -> std::optional<team_t> {
        auto name = ar.decode_string("Name");
        if (!name) return std::nullopt;
        return team_t{*name, ar.decode_as<person_t>("Lead")};
    }
};

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    auto filename = std::string(argc > 1 ? argv[1] : "team.plist");

    try {
        set_log_stream(&std::cerr);

        auto team = team_t{"Rendering", person_t{26, "Cyan", "Yang"}};
        to_file(filename, team, infer_format_from_filename(filename));
        std::cout << "Wrote " << filename << "\n";

        auto registry = type_registry{};
        registry.register_type<team_t>();
        registry.register_type<person_t>();

        auto object = from_file(filename, registry);
        std::cout << "Root class: " << object.class_name() << "\n";

        if (const auto* t = object.get<team_t>()) {
            std::cout << "Team: " << t->name << "\n";
            if (t->lead) {
                std::cout << "Lead: " << *t->lead << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
