#include "flyodb/object.hpp"

#include "flyodb/consts.hpp"
#include "flyodb/error.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace flyodb {

std::string_view type_name(ObjectType type) {
  switch (type) {
  case ObjectType::Commit:
    return consts::kTypeCommit;
  case ObjectType::Tree:
    return consts::kTypeTree;
  case ObjectType::Blob:
    return consts::kTypeBlob;
  case ObjectType::Tag:
    return consts::kTypeTag;
  case ObjectType::Any:
    return "any";
  case ObjectType::OfsDelta:
    return "ofs-delta";
  case ObjectType::RefDelta:
    return "ref-delta";
  case ObjectType::Invalid:
    break;
  }
  return "invalid";
}

ObjectType type_from_name(std::string_view name) {
  if (name == consts::kTypeBlob) {
    return ObjectType::Blob;
  }
  if (name == consts::kTypeTree) {
    return ObjectType::Tree;
  }
  if (name == consts::kTypeCommit) {
    return ObjectType::Commit;
  }
  if (name == consts::kTypeTag) {
    return ObjectType::Tag;
  }
  return ObjectType::Invalid;
}

bool is_loose_type(ObjectType type) {
  switch (type) {
  case ObjectType::Commit:
  case ObjectType::Tree:
  case ObjectType::Blob:
  case ObjectType::Tag:
    return true;
  default:
    return false;
  }
}

std::ostream &operator<<(std::ostream &os, ObjectType type) { return os << type_name(type); }

OdbObject::OdbObject(Oid id, ObjectType type, std::vector<std::uint8_t> data)
    : id_(id), type_(type), data_(std::move(data)) {
  if (!is_loose_type(type_)) {
    fail(ErrorCode::Corrupt, "odb object",
         "object " + to_hex(id_) + " has non-object type " + std::string(type_name(type_)));
  }
}

std::ostream &operator<<(std::ostream &os, const OdbObject &obj) {
  return os << "OdbObject{oid: " << obj.id() << ", type: " << obj.type()
            << ", size: " << obj.size() << "}";
}

} // namespace flyodb
