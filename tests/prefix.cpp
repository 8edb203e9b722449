#include "flyodb/memory_backend.hpp"
#include "flyodb/odb.hpp"

#include "support.hpp"

#include <iostream>
#include <memory>
#include <string>

using flyodb::ErrorCode;
using flyodb::ObjectType;
using testsupport::bytes;
using testsupport::throws_code;

int main() {
  try {
    auto odb = flyodb::Odb::create();
    odb.add_backend(std::make_unique<flyodb::MemoryBackend>());

    // Two blobs sharing the first six hex digits:
    //   a08bb3470339f49cc3cfe21a85a91e83bd4ec661  "payload 2698\n"
    //   a08bb3d2ebf909015617f075a87352673fd21df8  "payload 4739\n"
    const auto p1 = odb.write(ObjectType::Blob, std::string_view("payload 2698\n"));
    const auto p2 = odb.write(ObjectType::Blob, std::string_view("payload 4739\n"));
    const auto hello = odb.write(ObjectType::Blob, std::string_view("hello\n"));
    if (p1.hex() != "a08bb3470339f49cc3cfe21a85a91e83bd4ec661" ||
        p2.hex() != "a08bb3d2ebf909015617f075a87352673fd21df8") {
      std::cerr << "unexpected payload ids: " << p1 << " " << p2 << "\n";
      return 1;
    }

    // 1) Shared prefixes are ambiguous, one more digit resolves
    for (const std::string_view hex : {"a08b", "a08bb", "a08bb3", "A08BB3"}) {
      if (!throws_code(ErrorCode::AmbiguousReference, [&odb, hex] { (void)odb.exists_prefix(hex); }) ||
          !throws_code(ErrorCode::AmbiguousReference, [&odb, hex] { (void)odb.read_prefix(hex); })) {
        std::cerr << "prefix not ambiguous: " << hex << "\n";
        return 1;
      }
    }
    if (odb.exists_prefix("a08bb34") != p1 || odb.exists_prefix("a08bb3d") != p2) {
      std::cerr << "seven-digit prefixes did not resolve\n";
      return 1;
    }
    const auto obj = odb.read_prefix("a08bb3d2");
    if (obj.id() != p2 || obj.str() != "payload 4739\n" || obj.type() != ObjectType::Blob) {
      std::cerr << "read_prefix returned the wrong object\n";
      return 1;
    }

    // 2) Every length from the minimum to the full id resolves hello
    const std::string hello_hex = hello.hex();
    for (std::size_t len = 4; len <= hello_hex.size(); ++len) {
      const auto prefix = hello_hex.substr(0, len);
      if (odb.exists_prefix(prefix) != hello || odb.read_prefix(prefix).str() != "hello\n") {
        std::cerr << "prefix of length " << len << " did not resolve hello\n";
        return 1;
      }
    }

    // 3) The (Oid, len) form agrees with the hex form
    if (odb.exists_prefix(hello.truncated(6), 6) != hello ||
        odb.read_prefix(p1.truncated(7), 7).id() != p1) {
      std::cerr << "oid-prefix overloads disagree\n";
      return 1;
    }
    if (!throws_code(ErrorCode::AmbiguousReference,
                     [&odb, &p1] { (void)odb.exists_prefix(p1.truncated(6), 6); })) {
      std::cerr << "oid-prefix ambiguity not reported\n";
      return 1;
    }

    // 4) Bad input
    for (const std::string_view hex : {"ce0", "", "zzzz", "ce01-", "ce013625030ba8dba906f756967f9e9ca394464a0"}) {
      if (!throws_code(ErrorCode::InvalidArgument, [&odb, hex] { (void)odb.exists_prefix(hex); })) {
        std::cerr << "bad prefix accepted: '" << hex << "'\n";
        return 1;
      }
    }
    if (!throws_code(ErrorCode::InvalidArgument,
                     [&odb, &hello] { (void)odb.exists_prefix(hello.truncated(3), 3); }) ||
        !throws_code(ErrorCode::InvalidArgument,
                     [&odb, &hello] { (void)odb.exists_prefix(hello, 41); })) {
      std::cerr << "bad prefix length accepted\n";
      return 1;
    }

    // 5) Misses
    if (!throws_code(ErrorCode::NotFound, [&odb] { (void)odb.exists_prefix("0000"); }) ||
        !throws_code(ErrorCode::NotFound, [&odb] { (void)odb.read_prefix("ffffff"); }) ||
        !throws_code(ErrorCode::NotFound, [&odb] {
          (void)odb.exists_prefix("0000000000000000000000000000000000000001");
        })) {
      std::cerr << "missing prefix not NotFound\n";
      return 1;
    }

    // 6) Ambiguity spans the whole chain:
    //   76a40d4f8f1fd401e5dad000d8f0c0cf9eeb3f05  "payload 36\n"   (primary)
    //   76a45c15b579ed2a356e29be467cc865a27c2123  "payload 296\n"  (alternate)
    auto alt = std::make_unique<flyodb::MemoryBackend>();
    const auto in_alt = alt->insert(ObjectType::Blob, bytes("payload 296\n"));
    // Same object in both backends counts once
    (void)alt->insert(ObjectType::Blob, bytes("hello\n"));
    odb.add_alternate(std::move(alt));
    const auto in_primary = odb.write(ObjectType::Blob, std::string_view("payload 36\n"));

    if (!throws_code(ErrorCode::AmbiguousReference, [&odb] { (void)odb.exists_prefix("76a4"); })) {
      std::cerr << "cross-backend ambiguity not reported\n";
      return 1;
    }
    if (odb.exists_prefix("76a40") != in_primary || odb.exists_prefix("76a45") != in_alt) {
      std::cerr << "cross-backend prefixes did not resolve\n";
      return 1;
    }
    if (odb.exists_prefix(hello_hex.substr(0, 4)) != hello) {
      std::cerr << "duplicate across backends reported as ambiguous\n";
      return 1;
    }

    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
}
