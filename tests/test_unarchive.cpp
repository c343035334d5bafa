#include <cassert>
#include <cstdio>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "nscoder/nscoder.hpp"

using namespace nscoder;

#ifndef NSCODER_FIXTURE_DIR
#define NSCODER_FIXTURE_DIR "tests/fixtures"
#endif

// =============================================================================
// Test classes
// =============================================================================

// A file record from an iOS backup manifest.
struct backup_file_t {
    using super = root_object;
    static constexpr const char* class_name = "MBFile";

    std::string relative_path;
    int64_t birth = 0;
    int32_t mode = 0;
    int64_t inode_number = 0;
    int32_t user_id = 0;
    int32_t group_id = 0;
    int64_t size = 0;

    void encode(encoder& ar) const {
        ar.encode_string(relative_path, "RelativePath");
        ar.encode_i64(birth, "Birth");
        ar.encode_i32(mode, "Mode");
        ar.encode_i64(inode_number, "InodeNumber");
        ar.encode_i32(user_id, "UserID");
        ar.encode_i32(group_id, "GroupID");
        ar.encode_i64(size, "Size");
    }

    static auto decode(const decoder& ar) -> std::optional<backup_file_t> {
        auto relative_path = ar.decode_string("RelativePath");
        if (!relative_path) return std::nullopt;
        return backup_file_t{
            *relative_path,
            ar.decode_i64("Birth"),
            ar.decode_i32("Mode"),
            ar.decode_i64("InodeNumber"),
            ar.decode_i32("UserID"),
            ar.decode_i32("GroupID"),
            ar.decode_i64("Size"),
        };
    }
};

struct label_t {
    using super = root_object;
    static constexpr const char* class_name = "RCDLabel";

    std::string text;

    void encode(encoder& ar) const { ar.encode_string(text, "Text"); }

    static auto decode(const decoder& ar) -> std::optional<label_t> {
        auto text = ar.decode_string("Text");
        if (!text) return std::nullopt;
        return label_t{*text};
    }
};

// Tolerates every field being absent and records what it saw.
struct probe_t {
    using super = root_object;
    static constexpr const char* class_name = "RCDProbe";

    int32_t number = -1;
    std::optional<std::string> text;
    std::optional<label_t> label;

    void encode(encoder&) const {}

    static auto decode(const decoder& ar) -> std::optional<probe_t> {
        return probe_t{ar.decode_i32("Number"), ar.decode_string("Text"), ar.decode_as<label_t>("Label")};
    }
};

// =============================================================================
// Helpers for hand-built archives
// =============================================================================

auto class_info(const std::string& name) -> value {
    auto classes = value::array();
    classes.ref().append(value::string(name));
    classes.ref().append(value::string("NSObject"));
    auto info = value::dictionary();
    info.ref().set("$classes", std::move(classes));
    info.ref().set("$classname", value::string(name));
    return info;
}

auto make_archive(std::vector<value> objects, std::optional<uint64_t> root = 1,
                  const std::string& archiver = "NSKeyedArchiver") -> value {
    auto table = value::array();
    for (auto& item : objects) {
        table.ref().append(std::move(item));
    }
    auto top = value::dictionary();
    if (root) top.ref().set("root", value::uid(*root));

    auto archive = value::dictionary();
    archive.ref().set("$archiver", value::string(archiver));
    archive.ref().set("$objects", std::move(table));
    archive.ref().set("$top", std::move(top));
    archive.ref().set("$version", value::integer(100000));
    return archive;
}

template <typename... Items>
auto objects_of(Items... items) -> std::vector<value> {
    auto result = std::vector<value>{};
    (result.push_back(std::move(items)), ...);
    return result;
}

auto record(std::initializer_list<std::pair<const char*, uint64_t>> refs) -> value {
    auto dict = value::dictionary();
    for (const auto& [key, index] : refs) {
        dict.ref().set(key, value::uid(index));
    }
    return dict;
}

auto make_registry() -> type_registry {
    auto registry = type_registry{};
    registry.register_type<backup_file_t>();
    registry.register_type<label_t>();
    registry.register_type<probe_t>();
    return registry;
}

template <typename Error>
auto expect_error(const value& archive, const type_registry& registry) -> Error {
    try {
        from_value(archive.ref(), registry);
    } catch (const Error& e) {
        return e;
    }
    throw std::logic_error("expected an archive error was not thrown");
}

// =============================================================================
// Tests
// =============================================================================

void test_backup_fixture() {
    std::cout << "Testing foreign archive fixture... ";

    auto registry = make_registry();
    auto object = from_file(NSCODER_FIXTURE_DIR "/mobilesync_backup.plist", registry);
    assert(std::string(object.class_name()) == "MBFile");

    const auto* file = object.get<backup_file_t>();
    assert(file);
    assert(file->relative_path == "Library/PersistentStores");
    assert(file->birth == 1545812340);
    assert(file->mode == 16877);
    assert(file->inode_number == 228000);
    assert(file->user_id == 501);
    assert(file->group_id == 501);
    assert(file->size == 0);

    std::cout << "PASSED\n";
}

void test_unsupported_archiver() {
    std::cout << "Testing unsupported archiver... ";

    auto archive = make_archive(objects_of(value::string("$null")), 1, "NSArchiver");
    auto e = expect_error<unsupported_archiver>(archive, make_registry());
    assert(e.kind() == error_kind::unsupported_archiver);
    assert(e.detail() == "NSArchiver");

    std::cout << "PASSED\n";
}

void test_missing_root() {
    std::cout << "Testing missing root entry... ";

    auto archive = make_archive(objects_of(value::string("$null")), std::nullopt);
    auto e = expect_error<no_root_object>(archive, make_registry());
    assert(e.kind() == error_kind::no_root_object);

    std::cout << "PASSED\n";
}

void test_unknown_class() {
    std::cout << "Testing unknown class... ";

    auto archive = make_archive(objects_of(
        value::string("$null"),
        record({{"$class", 2}}),
        class_info("Foo")));

    auto e = expect_error<unknown_class>(archive, type_registry{});
    assert(e.kind() == error_kind::unknown_class);
    assert(e.detail() == "Foo");

    std::cout << "PASSED\n";
}

void test_malformed_objects() {
    std::cout << "Testing malformed records... ";

    auto registry = make_registry();

    // Root index outside the table
    auto out_of_bounds = make_archive(objects_of(value::string("$null")), 5);
    expect_error<malformed_object>(out_of_bounds, registry);

    // Root record is not a dictionary
    auto not_a_record = make_archive(objects_of(value::string("$null"), value::string("nope")));
    expect_error<malformed_object>(not_a_record, registry);

    // Root record has no $class
    auto no_class = make_archive(objects_of(value::string("$null"), value::dictionary()));
    expect_error<malformed_object>(no_class, registry);

    // $class points past the table
    auto dangling_class = make_archive(objects_of(value::string("$null"), record({{"$class", 9}})));
    expect_error<malformed_object>(dangling_class, registry);

    // $classname is not a string
    auto bad_info = value::dictionary();
    bad_info.ref().set("$classname", value::integer(3));
    auto bad_name = make_archive(objects_of(value::string("$null"), record({{"$class", 2}}), std::move(bad_info)));
    expect_error<malformed_object>(bad_name, registry);

    // Registered type rejects the record
    auto rejected = make_archive(objects_of(value::string("$null"), record({{"$class", 2}}), class_info("RCDLabel")));
    auto e = expect_error<malformed_object>(rejected, registry);
    assert(e.kind() == error_kind::malformed_object);

    std::cout << "PASSED\n";
}

void test_missing_fields_default() {
    std::cout << "Testing missing fields decode to defaults... ";

    auto archive = make_archive(objects_of(value::string("$null"), record({{"$class", 2}}), class_info("RCDProbe")));
    auto probe = from_value(archive.ref(), make_registry()).downcast<probe_t>();
    assert(probe);
    assert(probe->number == 0);
    assert(!probe->text);
    assert(!probe->label);

    std::cout << "PASSED\n";
}

void test_wrong_kind_fields() {
    std::cout << "Testing wrong-kind and dangling fields... ";

    // Number is a reference, Text refers to a record, Label points outside
    auto probe_record = record({{"$class", 2}, {"Number", 0}, {"Text", 2}, {"Label", 40}});
    auto archive = make_archive(objects_of(value::string("$null"), std::move(probe_record), class_info("RCDProbe")));

    auto probe = from_value(archive.ref(), make_registry()).downcast<probe_t>();
    assert(probe);
    assert(probe->number == 0);
    assert(!probe->text);
    assert(!probe->label);

    // Text stored inline instead of by reference
    auto inline_record = record({{"$class", 2}});
    inline_record.ref().set("Text", value::string("inline"));
    auto inline_archive = make_archive(objects_of(value::string("$null"), std::move(inline_record), class_info("RCDProbe")));
    auto inline_probe = from_value(inline_archive.ref(), make_registry()).downcast<probe_t>();
    assert(inline_probe && !inline_probe->text);

    std::cout << "PASSED\n";
}

void test_nested_failure_is_absent() {
    std::cout << "Testing nested failures collapse to absent... ";

    auto registry = make_registry();

    // Label record is missing its Text, and Text refers to a real string
    auto archive = make_archive(objects_of(
        value::string("$null"),
        record({{"$class", 2}, {"Label", 3}, {"Text", 5}}),
        class_info("RCDProbe"),
        record({{"$class", 4}}),
        class_info("RCDLabel"),
        value::string("kept")));

    auto probe = from_value(archive.ref(), registry).downcast<probe_t>();
    assert(probe);
    assert(!probe->label);
    assert(probe->text == std::string("kept"));

    // Unknown nested class is dropped the same way
    auto unknown = make_archive(objects_of(
        value::string("$null"),
        record({{"$class", 2}, {"Label", 3}}),
        class_info("RCDProbe"),
        record({{"$class", 4}}),
        class_info("RCDMystery")));

    auto unknown_probe = from_value(unknown.ref(), registry).downcast<probe_t>();
    assert(unknown_probe && !unknown_probe->label);

    std::cout << "PASSED\n";
}

void test_malformed_data() {
    std::cout << "Testing malformed data... ";

    auto registry = make_registry();

    auto threw = false;
    try {
        auto garbage = std::vector<uint8_t>{'b', 'p', 'l', 'i', 's', 't', '0', '0', 0xff};
        from_bytes(garbage, registry);
    } catch (const malformed_data& e) {
        threw = e.kind() == error_kind::malformed_data;
    }
    assert(threw);

    // A valid property list whose root is not a dictionary
    auto not_a_dict = value::array();
    threw = false;
    try {
        from_value(not_a_dict.ref(), registry);
    } catch (const malformed_data&) {
        threw = true;
    }
    assert(threw);

    // $objects missing altogether
    auto no_objects = value::dictionary();
    no_objects.ref().set("$archiver", value::string("NSKeyedArchiver"));
    threw = false;
    try {
        from_value(no_objects.ref(), registry);
    } catch (const malformed_data&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_errors_share_base() {
    std::cout << "Testing error base class... ";

    auto archive = make_archive(objects_of(value::string("$null")), std::nullopt);
    auto threw = false;
    try {
        from_value(archive.ref(), make_registry());
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "root object is not found";
    }
    assert(threw);

    assert(from_string(std::type_identity<error_kind>{}, "unknown_class") == error_kind::unknown_class);
    assert(std::string(to_string(error_kind::malformed_data)) == "malformed_data");

    std::cout << "PASSED\n";
}

void test_log_stream() {
    std::cout << "Testing diagnostic log... ";

    auto sink = std::ostringstream{};
    set_log_stream(&sink);
    assert(log_enabled());

    auto archive = make_archive(objects_of(value::string("$null"), record({{"$class", 2}}), class_info("Foo")));
    auto threw = false;
    try {
        from_value(archive.ref(), make_registry());
    } catch (const unknown_class&) {
        threw = true;
    }
    assert(threw);

    set_log_stream(nullptr);
    assert(!log_enabled());
    assert(sink.str().find("nscoder: unarchive failed") != std::string::npos);
    assert(sink.str().find("Foo") != std::string::npos);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Keyed Unarchiving ===\n\n";

    test_backup_fixture();
    test_unsupported_archiver();
    test_missing_root();
    test_unknown_class();
    test_malformed_objects();
    test_missing_fields_default();
    test_wrong_kind_fields();
    test_nested_failure_is_absent();
    test_malformed_data();
    test_errors_share_base();
    test_log_stream();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
