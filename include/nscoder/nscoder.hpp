#pragma once

// ============================================================================
// nscoder - C++20 keyed archiving compatible with NSKeyedArchiver
// ============================================================================
//
// Reads and writes the $archiver/$objects/$top/$version property lists that
// Foundation's NSKeyedArchiver produces, without Foundation:
// - Every object is stored once in a flat table and referenced by index
// - Decoding dispatches on the recorded class name through a type_registry
// - Heterogeneous objects travel through one any_object handle
// - Missing fields decode to defaults for forward/backward compatibility
//
// Basic usage:
//
//   #include "nscoder/nscoder.hpp"
//
//   struct person {
//       using super = nscoder::root_object;
//       static constexpr const char* class_name = "RCDPerson";
//
//       int age = 0;
//       std::string first_name;
//       std::string last_name;
//
//       void encode(nscoder::encoder& ar) const {
//           ar.encode_i32(age, "Age");
//           ar.encode_string(first_name, "FirstName");
//           ar.encode_string(last_name, "LastName");
//       }
//
//       static auto decode(const nscoder::decoder& ar) -> std::optional<person> {
//           auto first_name = ar.decode_string("FirstName");
//           auto last_name = ar.decode_string("LastName");
//           if (!first_name || !last_name) return std::nullopt;
//           return person{ar.decode_i32("Age"), *first_name, *last_name};
//       }
//   };
//
//   // Write
//   auto bytes = nscoder::to_bytes(person{26, "Cyan", "Yang"});
//
//   // Read
//   auto registry = nscoder::type_registry{};
//   registry.register_type<person>();
//   auto object = nscoder::from_bytes(bytes, registry);
//   if (const auto* p = object.get<person>()) {
//       std::cout << p->first_name << "\n";
//   }
//
// ============================================================================

#include "archiver.hpp"
#include "coder.hpp"
#include "envelope.hpp"
#include "error.hpp"
#include "format.hpp"
#include "io.hpp"
#include "log.hpp"
#include "object.hpp"
#include "registry.hpp"
#include "unarchiver.hpp"
#include "value.hpp"
