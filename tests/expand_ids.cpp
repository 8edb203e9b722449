#include "flyodb/memory_backend.hpp"
#include "flyodb/odb.hpp"

#include "support.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using flyodb::ErrorCode;
using flyodb::ObjectType;
using ExpandId = flyodb::Odb::ExpandId;

static ExpandId short_id(std::string_view hex, ObjectType type = ObjectType::Any) {
  ExpandId e;
  if (!flyodb::from_hex_prefix(hex, e.id)) {
    throw std::runtime_error("bad test prefix " + std::string(hex));
  }
  e.hex_len = hex.size();
  e.type = type;
  return e;
}

int main() {
  try {
    auto odb = flyodb::Odb::create();
    odb.add_backend(std::make_unique<flyodb::MemoryBackend>());
    const auto hello = odb.write(ObjectType::Blob, std::string_view("hello\n"));
    const auto tree = odb.write(ObjectType::Tree, std::string_view("hello\n"));
    (void)odb.write(ObjectType::Blob, std::string_view("payload 2698\n")); // a08bb347...
    (void)odb.write(ObjectType::Blob, std::string_view("payload 4739\n")); // a08bb3d2...

    std::vector<ExpandId> ids = {
        short_id("ce01"),                        // 0: unique, any kind
        short_id("a08bb3"),                      // 1: ambiguous
        short_id("0000"),                        // 2: no match
        short_id("ce0136", ObjectType::Commit),  // 3: kind mismatch
        short_id("149e5b", ObjectType::Tree),    // 4: unique, kind matches
        short_id("ce"),                          // 5: too short
        short_id(hello.hex()),                   // 6: full length
        short_id("a08bb34"),                     // 7: unique after one more digit
    };
    odb.expand_ids(ids);

    const auto ok = [&ids](std::size_t i, const flyodb::Oid &want, ObjectType type) {
      const auto &e = ids[i];
      if (e.result != ErrorCode::Ok || e.id != want || e.hex_len != 40 || e.type != type) {
        std::cerr << "entry " << i << " not expanded: " << flyodb::error_code_name(e.result)
                  << " " << e.id << "\n";
        return false;
      }
      return true;
    };
    const auto failed = [&ids](std::size_t i, ErrorCode code) {
      const auto &e = ids[i];
      if (e.result != code || e.hex_len != 0 || e.type != ObjectType::Invalid ||
          !e.id.is_zero()) {
        std::cerr << "entry " << i << " expected " << flyodb::error_code_name(code) << ", got "
                  << flyodb::error_code_name(e.result) << " len " << e.hex_len << "\n";
        return false;
      }
      return true;
    };

    if (!ok(0, hello, ObjectType::Blob) || !failed(1, ErrorCode::AmbiguousReference) ||
        !failed(2, ErrorCode::NotFound) || !failed(3, ErrorCode::NotFound) ||
        !ok(4, tree, ObjectType::Tree) || !failed(5, ErrorCode::NotFound) ||
        !ok(6, hello, ObjectType::Blob) || !ok(7, ids[7].id, ObjectType::Blob)) {
      return 1;
    }
    if (ids[7].id.hex() != "a08bb3470339f49cc3cfe21a85a91e83bd4ec661") {
      std::cerr << "a08bb34 expanded to " << ids[7].id << "\n";
      return 1;
    }

    // Empty batch is fine; a store without backends is not
    std::vector<ExpandId> none;
    odb.expand_ids(none);
    auto bare = flyodb::Odb::create();
    std::vector<ExpandId> one = {short_id("ce01")};
    if (!testsupport::throws_code(ErrorCode::InvalidState, [&bare, &one] { bare.expand_ids(one); })) {
      std::cerr << "expand_ids on bare store not rejected\n";
      return 1;
    }

    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
}
