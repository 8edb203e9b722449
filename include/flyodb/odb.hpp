#pragma once
#include "flyodb/backend.hpp"
#include "flyodb/error.hpp"
#include "flyodb/hash.hpp"
#include "flyodb/object.hpp"
#include "flyodb/options.hpp"
#include "flyodb/write_stream.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <span>
#include <string_view>
#include <vector>

namespace flyodb {

/**
 * Object database: an ordered chain of backends queried front to back.
 *
 * Primary backends (add_backend) come first and receive writes; alternates
 * (add_alternate, add_disk_alternate) follow and are only ever read.
 * An Odb owns its backends and is move-only. Not thread-safe: serialize
 * access to one instance, or use one instance per thread.
 */
class Odb {
public:
  // exists()/read() flag: do not refresh backends and retry on a miss.
  static constexpr unsigned kLookupNoRefresh = 1U << 0;

  // One abbreviated id for expand_ids(). See expand_ids for the annotation rules.
  struct ExpandId {
    Oid id;
    std::size_t hex_len = 0;
    ObjectType type = ObjectType::Any;
    ErrorCode result = ErrorCode::Ok;
  };

  // Store with no backends; reads fail with InvalidState until one is added.
  static Odb create(HashAlgorithm algo = HashAlgorithm::Sha1);
  static Odb create(const OdbOptions &options);

  // Loose backend over objects_dir, options from <objects_dir>/info/config,
  // alternates from <objects_dir>/info/alternates (missing directories skipped).
  static Odb open(const std::filesystem::path &objects_dir);
  static Odb open(const std::filesystem::path &objects_dir, const OdbOptions &options);

  Odb(Odb &&) noexcept = default;
  Odb &operator=(Odb &&) noexcept = default;
  Odb(const Odb &) = delete;
  Odb &operator=(const Odb &) = delete;
  ~Odb() = default;

  [[nodiscard]] HashAlgorithm algorithm() const { return options_.algorithm; }
  [[nodiscard]] const OdbOptions &options() const { return options_; }

  // Backend chain
  void add_backend(std::unique_ptr<Backend> backend);
  void add_alternate(std::unique_ptr<Backend> backend);
  void add_disk_alternate(const std::filesystem::path &objects_dir);
  [[nodiscard]] std::size_t num_backends() const { return chain_.size(); }
  [[nodiscard]] const Backend &backend(std::size_t pos) const;
  [[nodiscard]] bool is_alternate(std::size_t pos) const;

  // Lookup
  [[nodiscard]] bool exists(const Oid &id, unsigned flags = 0);
  [[nodiscard]] Oid exists_prefix(const Oid &short_id, std::size_t hex_len);
  [[nodiscard]] Oid exists_prefix(std::string_view hex);

  [[nodiscard]] OdbObject read(const Oid &id);
  [[nodiscard]] OdbObject read_prefix(const Oid &short_id, std::size_t hex_len);
  [[nodiscard]] OdbObject read_prefix(std::string_view hex);
  [[nodiscard]] ObjectHeader read_header(const Oid &id);

  /**
   * Resolve a batch of abbreviated ids in place. For each entry:
   *  - unique match: id = full id, hex_len = full width, type = object type,
   *    result = Ok;
   *  - no match, a type other than Any that differs from the object's, or a
   *    hex_len outside [4, full]: id = zero, hex_len = 0, type = Invalid,
   *    result = NotFound;
   *  - several matches: id = zero, hex_len = 0, type = Invalid,
   *    result = AmbiguousReference.
   * Throws only for store-level failures (no backends, Io, Corrupt).
   */
  void expand_ids(std::vector<ExpandId> &ids);

  // Write
  Oid write(ObjectType type, std::span<const std::uint8_t> data);
  Oid write(ObjectType type, std::string_view data) {
    return write(type, std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t *>(data.data()), data.size()));
  }
  [[nodiscard]] WriteStream open_wstream(std::size_t size, ObjectType type);

  // Id a write of (type, data) would produce; nothing is stored.
  static Oid hash(ObjectType type, std::span<const std::uint8_t> data,
                  HashAlgorithm algo = HashAlgorithm::Sha1);

  // Enumeration
  // Visits each distinct id once; false from the visitor stops the walk.
  void for_each(const OidVisitor &visit);
  [[nodiscard]] std::vector<Oid> objects();

  void refresh();

private:
  struct Slot {
    std::unique_ptr<Backend> backend;
    bool alternate = false;
  };

  explicit Odb(const OdbOptions &options) : options_(options) {}

  void attach(std::unique_ptr<Backend> backend, bool alternate);
  bool attach_disk(const std::filesystem::path &objects_dir, bool alternate);
  void load_alternates(const std::filesystem::path &objects_dir, int depth);
  void require_backends(std::string_view op) const;
  Backend &primary(std::string_view op);
  void check_prefix(const Oid &short_id, std::size_t hex_len, std::string_view op) const;
  std::set<Oid> collect_prefix(const Oid &short_id, std::size_t hex_len);
  Oid resolve_prefix(const Oid &short_id, std::size_t hex_len, std::string_view op);
  Oid parse_prefix(std::string_view hex, std::string_view op) const;

  OdbOptions options_;
  std::vector<Slot> chain_;
  std::vector<std::filesystem::path> disk_roots_; // canonical, to skip repeated alternates
};

} // namespace flyodb
