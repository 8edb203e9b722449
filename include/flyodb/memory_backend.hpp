#pragma once
#include "flyodb/backend.hpp"

#include <map>
#include <string>
#include <vector>

namespace flyodb {

// Objects kept in an ordered map; nothing touches disk.
class MemoryBackend : public Backend {
public:
  explicit MemoryBackend(HashAlgorithm algo = HashAlgorithm::Sha1) : algo_(algo) {}

  [[nodiscard]] HashAlgorithm algorithm() const override { return algo_; }
  [[nodiscard]] std::string describe() const override { return "memory"; }

  // Store an object directly, bypassing any Odb. Throws on non-object types.
  Oid insert(ObjectType type, std::span<const std::uint8_t> data);

  [[nodiscard]] std::size_t size() const { return objects_.size(); }

  bool exists(const Oid &id) override { return objects_.contains(id); }
  std::optional<OdbObject> read(const Oid &id) override;
  std::optional<ObjectHeader> read_header(const Oid &id) override;

  void find_prefix(const Oid &short_id, std::size_t hex_len, std::set<Oid> &matches) override;
  bool for_each(const OidVisitor &visit) override;

  [[nodiscard]] bool writable() const override { return true; }
  std::unique_ptr<WriteSink> open_write(std::size_t size, ObjectType type) override;

private:
  friend class MemoryWriteSink;

  struct Entry {
    ObjectType type;
    std::vector<std::uint8_t> data;
  };

  HashAlgorithm algo_;
  std::map<Oid, Entry> objects_;
};

} // namespace flyodb
