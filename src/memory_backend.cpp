#include "flyodb/memory_backend.hpp"

#include "flyodb/error.hpp"

#include <algorithm>
#include <utility>

namespace flyodb {

// Buffers the payload; commit moves it into the map.
class MemoryWriteSink : public WriteSink {
public:
  MemoryWriteSink(MemoryBackend &owner, std::size_t size, ObjectType type)
      : owner_(owner), type_(type) {
    data_.reserve(size);
  }

  void write(std::span<const std::uint8_t> chunk) override {
    data_.insert(data_.end(), chunk.begin(), chunk.end());
  }

  void commit(const Oid &id) override {
    owner_.objects_.try_emplace(id, MemoryBackend::Entry{.type = type_, .data = std::move(data_)});
    data_.clear();
  }

  void abort() noexcept override {
    data_.clear();
    data_.shrink_to_fit();
  }

private:
  MemoryBackend &owner_;
  ObjectType type_;
  std::vector<std::uint8_t> data_;
};

Oid MemoryBackend::insert(ObjectType type, std::span<const std::uint8_t> data) {
  if (!is_loose_type(type)) {
    fail(ErrorCode::InvalidArgument, "memory insert",
         "not an object type: " + std::string(type_name(type)));
  }
  Hasher h{algo_};
  h.update(object_header(type_name(type), data.size()));
  h.update(data);
  const Oid id = h.finish();
  objects_.try_emplace(id, Entry{.type = type, .data = {data.begin(), data.end()}});
  return id;
}

std::optional<OdbObject> MemoryBackend::read(const Oid &id) {
  const auto it = objects_.find(id);
  if (it == objects_.end()) {
    return std::nullopt;
  }
  return OdbObject(id, it->second.type, it->second.data);
}

std::optional<ObjectHeader> MemoryBackend::read_header(const Oid &id) {
  const auto it = objects_.find(id);
  if (it == objects_.end()) {
    return std::nullopt;
  }
  return ObjectHeader{.size = it->second.data.size(), .type = it->second.type};
}

void MemoryBackend::find_prefix(const Oid &short_id, std::size_t hex_len, std::set<Oid> &matches) {
  for (auto it = objects_.lower_bound(short_id.truncated(hex_len));
       it != objects_.end() && it->first.matches_prefix(short_id, hex_len); ++it) {
    matches.insert(it->first);
  }
}

bool MemoryBackend::for_each(const OidVisitor &visit) {
  std::vector<Oid> ids;
  ids.reserve(objects_.size());
  for (const auto &[id, entry] : objects_) {
    ids.push_back(id);
  }
  return std::ranges::all_of(ids, visit);
}

std::unique_ptr<WriteSink> MemoryBackend::open_write(std::size_t size, ObjectType type) {
  return std::make_unique<MemoryWriteSink>(*this, size, type);
}

} // namespace flyodb
