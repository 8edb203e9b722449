#include "flyodb/error.hpp"

#include <string>

namespace flyodb {

std::string_view error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "ok";
  case ErrorCode::NotFound:
    return "not found";
  case ErrorCode::AmbiguousReference:
    return "ambiguous reference";
  case ErrorCode::Corrupt:
    return "corrupt";
  case ErrorCode::InvalidArgument:
    return "invalid argument";
  case ErrorCode::InvalidState:
    return "invalid state";
  case ErrorCode::Io:
    return "io";
  }
  return "unknown";
}

void fail(ErrorCode code, std::string_view where, std::string_view what) {
  std::string msg;
  msg.reserve(where.size() + 2 + what.size());
  msg.append(where);
  msg.append(": ");
  msg.append(what);
  throw OdbError(code, msg);
}

} // namespace flyodb
