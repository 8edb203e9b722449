#include "flyodb/memory_backend.hpp"
#include "flyodb/odb.hpp"

#include "support.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using flyodb::ErrorCode;
using flyodb::ObjectType;
using testsupport::bytes;
using testsupport::throws_code;

int main() {
  try {
    // 1) A store without backends exists but cannot do anything useful
    auto bare = flyodb::Odb::create();
    const auto hello_id = flyodb::Odb::hash(ObjectType::Blob, bytes("hello\n"));
    if (bare.num_backends() != 0 || bare.exists(hello_id)) {
      std::cerr << "bare store not empty\n";
      return 1;
    }
    if (!throws_code(ErrorCode::InvalidState, [&bare, &hello_id] { (void)bare.read(hello_id); }) ||
        !throws_code(ErrorCode::InvalidState,
                     [&bare] { (void)bare.write(ObjectType::Blob, std::string_view("x")); }) ||
        !throws_code(ErrorCode::InvalidState, [&bare] { (void)bare.objects(); }) ||
        !throws_code(ErrorCode::InvalidState, [&bare] { (void)bare.exists_prefix("ce01"); })) {
      std::cerr << "bare store operations not rejected\n";
      return 1;
    }

    auto odb = flyodb::Odb::create();
    odb.add_backend(std::make_unique<flyodb::MemoryBackend>());

    // 2) Round trip for every kind, binary payloads included
    const std::string binary("a\0b\0\xff\n", 6);
    const std::vector<std::pair<ObjectType, std::string>> cases = {
        {ObjectType::Blob, "hello\n"},
        {ObjectType::Blob, binary},
        {ObjectType::Blob, ""},
        {ObjectType::Tree, std::string("100644 a\0", 9) + std::string(20, '\x11')},
        {ObjectType::Commit, "tree 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n\nmsg\n"},
        {ObjectType::Tag, "object 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n"},
    };
    for (const auto &[type, data] : cases) {
      const auto id = odb.write(type, data);
      const auto obj = odb.read(id);
      if (obj.str() != data || obj.type() != type || obj.size() != data.size() || obj.id() != id) {
        std::cerr << "round trip failed for " << type << " of size " << data.size() << "\n";
        return 1;
      }
      const auto hdr = odb.read_header(id);
      if (hdr.size != data.size() || hdr.type != type) {
        std::cerr << "header mismatch for " << type << "\n";
        return 1;
      }
    }

    // 3) Idempotent writes
    const auto count = odb.objects().size();
    const auto a = odb.write(ObjectType::Blob, std::string_view("hello\n"));
    const auto b = odb.write(ObjectType::Blob, std::string_view("hello\n"));
    if (a != b || a != hello_id || !odb.exists(a) || odb.objects().size() != count) {
      std::cerr << "write not idempotent\n";
      return 1;
    }
    // Same bytes, different kind -> different object
    if (odb.write(ObjectType::Tree, std::string_view("hello\n")) == a) {
      std::cerr << "kind ignored in id\n";
      return 1;
    }

    // 4) Marker kinds are rejected and create nothing
    const auto before = odb.objects();
    for (const auto t : {ObjectType::Any, ObjectType::Invalid, ObjectType::OfsDelta,
                         ObjectType::RefDelta}) {
      if (!throws_code(ErrorCode::InvalidArgument,
                       [&odb, t] { (void)odb.write(t, std::string_view("payload\n")); })) {
        std::cerr << "write accepted kind " << t << "\n";
        return 1;
      }
    }
    if (odb.objects() != before) {
      std::cerr << "rejected writes changed the store\n";
      return 1;
    }

    // 5) Misses
    const auto missing = flyodb::Odb::hash(ObjectType::Blob, bytes("not stored\n"));
    if (odb.exists(missing) || odb.exists(missing, flyodb::Odb::kLookupNoRefresh)) {
      std::cerr << "exists true for missing object\n";
      return 1;
    }
    if (!throws_code(ErrorCode::NotFound, [&odb, &missing] { (void)odb.read(missing); }) ||
        !throws_code(ErrorCode::NotFound, [&odb, &missing] { (void)odb.read_header(missing); })) {
      std::cerr << "missing read not NotFound\n";
      return 1;
    }

    // 6) Enumeration is repeatable and can stop early
    if (odb.objects() != odb.objects()) {
      std::cerr << "enumeration not repeatable\n";
      return 1;
    }
    int visited = 0;
    odb.for_each([&visited](const flyodb::Oid &) { return ++visited < 2; });
    if (visited != 2) {
      std::cerr << "for_each did not stop early: " << visited << "\n";
      return 1;
    }

    // 7) Writes land in the primary, never in an alternate
    auto alt = std::make_unique<flyodb::MemoryBackend>();
    auto *alt_view = alt.get();
    const auto alt_id = alt->insert(ObjectType::Blob, bytes("world\n"));
    odb.add_alternate(std::move(alt));
    (void)odb.write(ObjectType::Blob, std::string_view("fresh\n"));
    if (alt_view->size() != 1 || !odb.exists(alt_id) || odb.read(alt_id).str() != "world\n") {
      std::cerr << "alternate handling wrong\n";
      return 1;
    }
    // Already in an alternate: write returns the id without copying it
    const auto primary_count = dynamic_cast<const flyodb::MemoryBackend &>(odb.backend(0)).size();
    if (odb.write(ObjectType::Blob, std::string_view("world\n")) != alt_id ||
        dynamic_cast<const flyodb::MemoryBackend &>(odb.backend(0)).size() != primary_count) {
      std::cerr << "write duplicated an alternate's object\n";
      return 1;
    }

    // 8) A primary added later still sits ahead of the alternates
    odb.add_backend(std::make_unique<flyodb::MemoryBackend>());
    if (odb.num_backends() != 3 || odb.is_alternate(0) || odb.is_alternate(1) ||
        !odb.is_alternate(2)) {
      std::cerr << "chain order wrong\n";
      return 1;
    }
    if (!throws_code(ErrorCode::InvalidArgument, [&odb] { (void)odb.backend(3); })) {
      std::cerr << "backend() range not checked\n";
      return 1;
    }
    if (!throws_code(ErrorCode::InvalidArgument, [&odb] {
          odb.add_backend(std::make_unique<flyodb::MemoryBackend>(flyodb::HashAlgorithm::Sha256));
        })) {
      std::cerr << "mixed-algorithm backend accepted\n";
      return 1;
    }

    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
}
