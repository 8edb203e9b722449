#pragma once
#include "flyodb/hash.hpp"

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>

namespace flyodb {

// Numeric values follow the on-disk pack type codes.
enum class ObjectType : std::int8_t {
  Any = -2,     // lookup wildcard
  Invalid = -1,
  Commit = 1,
  Tree = 2,
  Blob = 3,
  Tag = 4,
  OfsDelta = 6, // storage encodings, never the kind of a logical object
  RefDelta = 7,
};

// "commit", "tree", "blob", "tag"; markers get descriptive names.
std::string_view type_name(ObjectType type);

// Parse a logical kind name; anything else yields ObjectType::Invalid.
ObjectType type_from_name(std::string_view name);

// True for the four kinds an object may actually have.
bool is_loose_type(ObjectType type);

std::ostream &operator<<(std::ostream &os, ObjectType type);

struct ObjectHeader {
  std::size_t size = 0;
  ObjectType type = ObjectType::Invalid;
};

/**
 * An object as read from the store: id, kind and raw payload (no header).
 * Owned exclusively by whoever received it; spans and views returned by
 * data()/str() are valid only while the object is alive.
 */
class OdbObject {
public:
  // Throws OdbError{Corrupt} if `type` is not a loose type.
  OdbObject(Oid id, ObjectType type, std::vector<std::uint8_t> data);

  OdbObject(const OdbObject &) = delete;
  OdbObject &operator=(const OdbObject &) = delete;
  OdbObject(OdbObject &&) noexcept = default;
  OdbObject &operator=(OdbObject &&) noexcept = default;
  ~OdbObject() = default;

  [[nodiscard]] const Oid &id() const { return id_; }
  [[nodiscard]] ObjectType type() const { return type_; }
  [[nodiscard]] std::size_t size() const { return data_.size(); }
  [[nodiscard]] std::span<const std::uint8_t> data() const { return data_; }
  [[nodiscard]] std::string_view str() const {
    return {reinterpret_cast<const char *>(data_.data()), data_.size()};
  }
  [[nodiscard]] ObjectHeader header() const { return {.size = data_.size(), .type = type_}; }

private:
  Oid id_;
  ObjectType type_;
  std::vector<std::uint8_t> data_;
};

// OdbObject{oid: <hex>, type: <name>, size: <n>}
std::ostream &operator<<(std::ostream &os, const OdbObject &obj);

} // namespace flyodb
