#pragma once
#include "flyodb/backend.hpp"
#include "flyodb/hash.hpp"
#include "flyodb/object.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace flyodb {

/**
 * Sequential write of one object whose total size is declared up front.
 *
 *   auto ws = odb.open_wstream(payload.size(), ObjectType::Blob);
 *   ws.write(first_half);
 *   ws.write(second_half);
 *   Oid id = ws.finalize();
 *
 * Open -> Finalized once exactly declared_size() bytes were written and the
 * backend committed the object; Open -> Aborted on overflow, short finalize
 * or any backend failure (the backend's partial output is discarded).
 * Destroying an Open stream aborts it.
 */
class WriteStream {
public:
  enum class State : std::uint8_t { Open, Finalized, Aborted };

  WriteStream(std::unique_ptr<WriteSink> sink, HashAlgorithm algo, std::size_t size,
              ObjectType type);
  ~WriteStream();

  WriteStream(const WriteStream &) = delete;
  WriteStream &operator=(const WriteStream &) = delete;
  WriteStream(WriteStream &&) noexcept = default;
  WriteStream &operator=(WriteStream &&) noexcept = default;

  void write(std::span<const std::uint8_t> chunk);
  void write(std::string_view chunk) {
    write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(chunk.data()),
                                        chunk.size()));
  }

  Oid finalize();

  // Discard everything written so far. No-op unless Open.
  void abort() noexcept;

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] std::size_t declared_size() const { return size_; }
  [[nodiscard]] std::size_t written() const { return written_; }
  [[nodiscard]] ObjectType type() const { return type_; }

private:
  void require_open(std::string_view op) const;

  std::unique_ptr<WriteSink> sink_;
  Hasher hasher_;
  std::size_t size_;
  std::size_t written_ = 0;
  ObjectType type_;
  State state_ = State::Open;
};

} // namespace flyodb
