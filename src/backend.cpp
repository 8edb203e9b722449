#include "flyodb/backend.hpp"

#include "flyodb/error.hpp"

namespace flyodb {

std::optional<ObjectHeader> Backend::read_header(const Oid &id) {
  auto obj = read(id);
  if (!obj) {
    return std::nullopt;
  }
  return obj->header();
}

std::unique_ptr<WriteSink> Backend::open_write(std::size_t /*size*/, ObjectType /*type*/) {
  fail(ErrorCode::InvalidState, "backend " + describe(), "backend is read-only");
}

} // namespace flyodb
