#include "flyodb/write_stream.hpp"

#include "flyodb/error.hpp"

#include <exception>
#include <string>
#include <utility>

namespace flyodb {

WriteStream::WriteStream(std::unique_ptr<WriteSink> sink, HashAlgorithm algo, std::size_t size,
                         ObjectType type)
    : sink_(std::move(sink)), hasher_(algo), size_(size), type_(type) {
  if (!sink_) {
    fail(ErrorCode::InvalidState, "write stream", "no backend sink");
  }
  hasher_.update(object_header(type_name(type_), size_));
}

WriteStream::~WriteStream() { abort(); }

void WriteStream::require_open(std::string_view op) const {
  if (state_ != State::Open || !sink_) {
    fail(ErrorCode::InvalidState, "write stream " + std::string(op),
         state_ == State::Finalized ? "stream already finalized" : "stream was aborted");
  }
}

void WriteStream::abort() noexcept {
  if (state_ == State::Open && sink_) {
    sink_->abort();
    sink_.reset();
    state_ = State::Aborted;
  }
}

void WriteStream::write(std::span<const std::uint8_t> chunk) {
  require_open("write");
  if (chunk.size() > size_ - written_) {
    const std::string detail = "write of " + std::to_string(chunk.size()) + " bytes exceeds " +
                               "declared size " + std::to_string(size_) + " (" +
                               std::to_string(written_) + " already written)";
    abort();
    fail(ErrorCode::InvalidArgument, "write stream write", detail);
  }
  try {
    sink_->write(chunk);
    hasher_.update(chunk);
  } catch (const std::exception &) {
    abort();
    throw;
  }
  written_ += chunk.size();
}

Oid WriteStream::finalize() {
  require_open("finalize");
  if (written_ != size_) {
    const std::string detail = "only " + std::to_string(written_) + " of " +
                               std::to_string(size_) + " declared bytes written";
    abort();
    fail(ErrorCode::InvalidArgument, "write stream finalize", detail);
  }
  try {
    const Oid id = hasher_.finish();
    sink_->commit(id);
    sink_.reset();
    state_ = State::Finalized;
    return id;
  } catch (const std::exception &) {
    abort();
    throw;
  }
}

} // namespace flyodb
