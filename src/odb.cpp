#include "flyodb/odb.hpp"

#include "flyodb/consts.hpp"
#include "flyodb/fs.hpp"
#include "flyodb/loose_backend.hpp"
#include "flyodb/util.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

namespace stdfs = std::filesystem;
namespace gfs = flyodb::fs;

namespace {

stdfs::path canonical_or_self(const stdfs::path &p) {
  std::error_code ec;
  auto c = stdfs::weakly_canonical(p, ec);
  return ec ? p : c;
}

} // namespace

namespace flyodb {

// Construction

Odb Odb::create(HashAlgorithm algo) { return Odb{OdbOptions{.algorithm = algo}}; }

Odb Odb::create(const OdbOptions &options) { return Odb{options}; }

Odb Odb::open(const stdfs::path &objects_dir) {
  return open(objects_dir, load_options(objects_dir / consts::kInfoDir / consts::kConfigFile));
}

Odb Odb::open(const stdfs::path &objects_dir, const OdbOptions &options) {
  Odb odb{options};
  odb.attach_disk(objects_dir, false);
  odb.load_alternates(objects_dir, 0);
  return odb;
}

// Backend chain

void Odb::attach(std::unique_ptr<Backend> backend, bool alternate) {
  if (!backend) {
    fail(ErrorCode::InvalidArgument, "odb add backend", "null backend");
  }
  if (backend->algorithm() != algorithm()) {
    fail(ErrorCode::InvalidArgument, "odb add backend",
         backend->describe() + " uses " + std::string(algorithm_name(backend->algorithm())) +
             ", store uses " + std::string(algorithm_name(algorithm())));
  }
  if (alternate) {
    chain_.push_back(Slot{.backend = std::move(backend), .alternate = true});
    return;
  }
  // Primaries stay in front of every alternate.
  const auto first_alt =
      std::ranges::find_if(chain_, [](const Slot &s) { return s.alternate; });
  chain_.insert(first_alt, Slot{.backend = std::move(backend), .alternate = false});
}

bool Odb::attach_disk(const stdfs::path &objects_dir, bool alternate) {
  const stdfs::path key = canonical_or_self(objects_dir);
  if (std::ranges::find(disk_roots_, key) != disk_roots_.end()) {
    return false;
  }
  attach(std::make_unique<LooseBackend>(objects_dir, options_), alternate);
  disk_roots_.push_back(key);
  return true;
}

void Odb::add_backend(std::unique_ptr<Backend> backend) { attach(std::move(backend), false); }

void Odb::add_alternate(std::unique_ptr<Backend> backend) { attach(std::move(backend), true); }

void Odb::add_disk_alternate(const stdfs::path &objects_dir) {
  if (!gfs::is_directory(objects_dir)) {
    fail(ErrorCode::InvalidArgument, "odb add alternate",
         "not an objects directory: " + objects_dir.string());
  }
  if (attach_disk(objects_dir, true)) {
    load_alternates(objects_dir, 1);
  }
}

// info/alternates: one objects directory per line, relative ones resolved
// against the directory holding the file's objects. Entries that are not
// directories are skipped.
void Odb::load_alternates(const stdfs::path &objects_dir, int depth) {
  const stdfs::path file = objects_dir / consts::kInfoDir / consts::kAlternatesFile;
  if (depth > consts::kAlternatesMaxDepth || !gfs::exists(file)) {
    return;
  }
  const auto bytes = gfs::read_file(file);
  std::istringstream iss(std::string(bytes.begin(), bytes.end()));
  std::string line;
  while (std::getline(iss, line)) {
    line = strutil::trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    stdfs::path alt{line};
    if (alt.is_relative())
      alt = objects_dir / alt;
    if (!gfs::is_directory(alt)) {
      continue; // moved or deleted alternate
    }
    if (attach_disk(alt, true)) {
      load_alternates(alt, depth + 1);
    }
  }
}

const Backend &Odb::backend(std::size_t pos) const {
  if (pos >= chain_.size()) {
    fail(ErrorCode::InvalidArgument, "odb backend",
         "position " + std::to_string(pos) + " out of range (" + std::to_string(chain_.size()) +
             " backends)");
  }
  return *chain_[pos].backend;
}

bool Odb::is_alternate(std::size_t pos) const {
  (void)backend(pos); // range check
  return chain_[pos].alternate;
}

void Odb::require_backends(std::string_view op) const {
  if (chain_.empty()) {
    fail(ErrorCode::InvalidState, op, "object database has no backends");
  }
}

Backend &Odb::primary(std::string_view op) {
  require_backends(op);
  for (auto &slot : chain_) {
    if (!slot.alternate && slot.backend->writable()) {
      return *slot.backend;
    }
  }
  fail(ErrorCode::InvalidState, op, "no writable backend");
}

void Odb::refresh() {
  for (auto &slot : chain_) {
    slot.backend->refresh();
  }
}

// Lookup

bool Odb::exists(const Oid &id, unsigned flags) {
  if (id.algorithm() != algorithm()) {
    return false;
  }
  for (int attempt = 0; attempt < 2; ++attempt) {
    for (auto &slot : chain_) {
      if (slot.backend->exists(id)) {
        return true;
      }
    }
    if ((flags & kLookupNoRefresh) != 0 || chain_.empty()) {
      break;
    }
    refresh();
  }
  return false;
}

OdbObject Odb::read(const Oid &id) {
  require_backends("odb read");
  if (id.algorithm() != algorithm()) {
    fail(ErrorCode::InvalidArgument, "odb read",
         std::string(algorithm_name(id.algorithm())) + " id in a " +
             std::string(algorithm_name(algorithm())) + " store: " + to_hex(id));
  }
  for (int attempt = 0; attempt < 2; ++attempt) {
    for (auto &slot : chain_) {
      if (auto obj = slot.backend->read(id)) {
        return std::move(*obj);
      }
    }
    refresh();
  }
  fail(ErrorCode::NotFound, "odb read", "object not found: " + to_hex(id));
}

ObjectHeader Odb::read_header(const Oid &id) {
  require_backends("odb read header");
  if (id.algorithm() != algorithm()) {
    fail(ErrorCode::InvalidArgument, "odb read header",
         std::string(algorithm_name(id.algorithm())) + " id in a " +
             std::string(algorithm_name(algorithm())) + " store: " + to_hex(id));
  }
  for (int attempt = 0; attempt < 2; ++attempt) {
    for (auto &slot : chain_) {
      if (auto hdr = slot.backend->read_header(id)) {
        return *hdr;
      }
    }
    refresh();
  }
  fail(ErrorCode::NotFound, "odb read header", "object not found: " + to_hex(id));
}

// Prefix resolution

void Odb::check_prefix(const Oid &short_id, std::size_t hex_len, std::string_view op) const {
  if (short_id.algorithm() != algorithm()) {
    fail(ErrorCode::InvalidArgument, op,
         std::string(algorithm_name(short_id.algorithm())) + " prefix in a " +
             std::string(algorithm_name(algorithm())) + " store");
  }
  if (hex_len < consts::kMinPrefixHexLen || hex_len > hex_size(algorithm())) {
    fail(ErrorCode::InvalidArgument, op,
         "prefix length " + std::to_string(hex_len) + " outside [" +
             std::to_string(consts::kMinPrefixHexLen) + ", " +
             std::to_string(hex_size(algorithm())) + "]");
  }
}

Oid Odb::parse_prefix(std::string_view hex, std::string_view op) const {
  Oid short_id;
  if (!from_hex_prefix(hex, short_id, algorithm())) {
    fail(ErrorCode::InvalidArgument, op, "bad hex prefix: '" + std::string(hex) + "'");
  }
  return short_id;
}

std::set<Oid> Odb::collect_prefix(const Oid &short_id, std::size_t hex_len) {
  std::set<Oid> matches;
  for (auto &slot : chain_) {
    slot.backend->find_prefix(short_id, hex_len, matches);
  }
  return matches;
}

// Distinct matches are gathered from the whole chain; the same id in
// several backends counts once, two different ids anywhere are ambiguous.
Oid Odb::resolve_prefix(const Oid &short_id, std::size_t hex_len, std::string_view op) {
  require_backends(op);
  check_prefix(short_id, hex_len, op);
  const std::string shown = to_hex(short_id).substr(0, hex_len);

  if (hex_len == hex_size(algorithm())) {
    if (!exists(short_id)) {
      fail(ErrorCode::NotFound, op, "no object matches " + shown);
    }
    return short_id;
  }

  auto matches = collect_prefix(short_id, hex_len);
  if (matches.empty()) {
    refresh();
    matches = collect_prefix(short_id, hex_len);
  }
  if (matches.empty()) {
    fail(ErrorCode::NotFound, op, "no object matches prefix " + shown);
  }
  if (matches.size() > 1) {
    fail(ErrorCode::AmbiguousReference, op,
         "prefix " + shown + " matches " + std::to_string(matches.size()) + " objects");
  }
  return *matches.begin();
}

Oid Odb::exists_prefix(const Oid &short_id, std::size_t hex_len) {
  return resolve_prefix(short_id, hex_len, "odb exists prefix");
}

Oid Odb::exists_prefix(std::string_view hex) {
  return resolve_prefix(parse_prefix(hex, "odb exists prefix"), hex.size(), "odb exists prefix");
}

OdbObject Odb::read_prefix(const Oid &short_id, std::size_t hex_len) {
  return read(resolve_prefix(short_id, hex_len, "odb read prefix"));
}

OdbObject Odb::read_prefix(std::string_view hex) {
  return read(resolve_prefix(parse_prefix(hex, "odb read prefix"), hex.size(), "odb read prefix"));
}

void Odb::expand_ids(std::vector<ExpandId> &ids) {
  require_backends("odb expand ids");
  const std::size_t full = hex_size(algorithm());

  auto matches_for = [this, full](const ExpandId &e) {
    if (e.hex_len == full) {
      return exists(e.id, kLookupNoRefresh) ? std::set<Oid>{e.id} : std::set<Oid>{};
    }
    return collect_prefix(e.id, e.hex_len);
  };

  std::vector<std::set<Oid>> found(ids.size());
  bool missed = false;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    const auto &e = ids[i];
    if (e.id.algorithm() != algorithm() || e.hex_len < consts::kMinPrefixHexLen ||
        e.hex_len > full) {
      continue;
    }
    found[i] = matches_for(e);
    missed = missed || found[i].empty();
  }
  if (missed) {
    refresh();
    for (std::size_t i = 0; i < ids.size(); ++i) {
      const auto &e = ids[i];
      if (found[i].empty() && e.id.algorithm() == algorithm() &&
          e.hex_len >= consts::kMinPrefixHexLen && e.hex_len <= full) {
        found[i] = matches_for(e);
      }
    }
  }

  for (std::size_t i = 0; i < ids.size(); ++i) {
    auto &e = ids[i];
    ErrorCode result = ErrorCode::NotFound;
    if (found[i].size() > 1) {
      result = ErrorCode::AmbiguousReference;
    } else if (found[i].size() == 1) {
      const Oid id = *found[i].begin();
      const ObjectHeader hdr = read_header(id);
      if (e.type == ObjectType::Any || e.type == hdr.type) {
        e.id = id;
        e.hex_len = full;
        e.type = hdr.type;
        e.result = ErrorCode::Ok;
        continue;
      }
    }
    e.id = Oid::zero(algorithm());
    e.hex_len = 0;
    e.type = ObjectType::Invalid;
    e.result = result;
  }
}

// Write

Oid Odb::hash(ObjectType type, std::span<const std::uint8_t> data, HashAlgorithm algo) {
  if (!is_loose_type(type)) {
    fail(ErrorCode::InvalidArgument, "odb hash",
         "invalid object type '" + std::string(type_name(type)) + "'");
  }
  Hasher h{algo};
  h.update(object_header(type_name(type), data.size()));
  h.update(data);
  return h.finish();
}

WriteStream Odb::open_wstream(std::size_t size, ObjectType type) {
  if (!is_loose_type(type)) {
    fail(ErrorCode::InvalidArgument, "odb open write stream",
         "invalid object type '" + std::string(type_name(type)) + "'");
  }
  Backend &target = primary("odb open write stream");
  return WriteStream(target.open_write(size, type), algorithm(), size, type);
}

Oid Odb::write(ObjectType type, std::span<const std::uint8_t> data) {
  if (!is_loose_type(type)) {
    fail(ErrorCode::InvalidArgument, "odb write",
         "invalid object type '" + std::string(type_name(type)) + "'");
  }
  (void)primary("odb write");

  const Oid id = hash(type, data, algorithm());
  if (exists(id, kLookupNoRefresh)) {
    return id;
  }
  auto stream = open_wstream(data.size(), type);
  stream.write(data);
  return stream.finalize();
}

// Enumeration

void Odb::for_each(const OidVisitor &visit) {
  require_backends("odb foreach");
  std::set<Oid> seen;
  for (auto &slot : chain_) {
    const bool keep_going = slot.backend->for_each([&seen, &visit](const Oid &id) {
      if (!seen.insert(id).second) {
        return true;
      }
      return visit(id);
    });
    if (!keep_going) {
      return;
    }
  }
}

std::vector<Oid> Odb::objects() {
  std::vector<Oid> out;
  for_each([&out](const Oid &id) {
    out.push_back(id);
    return true;
  });
  std::ranges::sort(out);
  return out;
}

} // namespace flyodb
