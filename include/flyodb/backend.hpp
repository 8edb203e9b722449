#pragma once
#include "flyodb/hash.hpp"
#include "flyodb/object.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>

namespace flyodb {

/**
 * Destination of a streamed write, provided by a writable backend.
 * The write stream feeds it the payload (without header), then either
 * commit()s it under the id computed over header + payload, or abort()s it.
 * Exactly one of commit/abort ends a sink's life; destroying an unfinished
 * sink must behave like abort().
 */
class WriteSink {
public:
  virtual ~WriteSink() = default;

  virtual void write(std::span<const std::uint8_t> chunk) = 0;
  // Make the object durable under `id`. Succeeds quietly if it already exists.
  virtual void commit(const Oid& id) = 0;
  virtual void abort() noexcept = 0;
};

// Visitor for enumeration; return false to stop the walk.
using OidVisitor = std::function<bool(const Oid&)>;

/**
 * Storage provider queried by Odb. Absence is reported with false/nullopt;
 * exceptions are reserved for real failures (Corrupt, Io).
 */
class Backend {
public:
  virtual ~Backend() = default;

  [[nodiscard]] virtual HashAlgorithm algorithm() const = 0;
  // Human-readable location for error messages ("loose:/path", "memory").
  [[nodiscard]] virtual std::string describe() const = 0;

  virtual bool exists(const Oid& id) = 0;
  virtual std::optional<OdbObject> read(const Oid& id) = 0;
  // Default reads the whole object; backends override to skip the payload.
  virtual std::optional<ObjectHeader> read_header(const Oid& id);

  // Add every id whose first hex_len digits equal short_id's to `matches`.
  virtual void find_prefix(const Oid& short_id, std::size_t hex_len, std::set<Oid>& matches) = 0;

  // Visit every id; returns false if the visitor stopped early.
  virtual bool for_each(const OidVisitor& visit) = 0;

  [[nodiscard]] virtual bool writable() const { return false; }
  // Throws OdbError{InvalidState} unless writable().
  virtual std::unique_ptr<WriteSink> open_write(std::size_t size, ObjectType type);

  // Drop cached state so objects added by other processes become visible.
  virtual void refresh() {}
};

} // namespace flyodb
