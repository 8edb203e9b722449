#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace flyodb {

enum class ErrorCode : std::uint8_t {
  Ok,
  NotFound,           // no backend has the object / prefix
  AmbiguousReference, // prefix matches two or more objects
  Corrupt,            // payload failed verification against its id
  InvalidArgument,    // bad kind, bad hex, prefix length out of range
  InvalidState,       // no usable backend, stream used after finalize/abort
  Io,                 // filesystem, zlib or digest failure below a backend
};

std::string_view error_code_name(ErrorCode code);

class OdbError : public std::runtime_error {
public:
  OdbError(ErrorCode code, const std::string &what) : std::runtime_error(what), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

// Throw an OdbError whose message reads "<where>: <what>".
[[noreturn]] void fail(ErrorCode code, std::string_view where, std::string_view what);

} // namespace flyodb
