#include "flyodb/loose_backend.hpp"

#include "flyodb/consts.hpp"
#include "flyodb/error.hpp"
#include "flyodb/fs.hpp"
#include "flyodb/util.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <vector>

namespace gfs = flyodb::fs;
namespace stdfs = std::filesystem;

namespace flyodb {

namespace {

// Longest "<type> <size>\0" we accept: "commit " + 20 digits + NUL.
constexpr std::size_t kMaxHeaderLen = 64;

struct ParsedHeader {
  ObjectHeader header;
  std::size_t payload_off = 0;
};

std::optional<ParsedHeader> parse_header(std::span<const std::uint8_t> store) {
  const auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    return std::nullopt;
  }
  const auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    return std::nullopt;
  }
  const std::string type(store.begin(), it_space);
  const std::string size_str(it_space + 1, it_nul);

  std::size_t size = 0;
  const auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + size_str.size(), size);
  if (size_str.empty() || ec != std::errc{} || ptr != size_str.data() + size_str.size()) {
    return std::nullopt;
  }
  const ObjectType t = type_from_name(type);
  if (!is_loose_type(t)) {
    return std::nullopt;
  }
  return ParsedHeader{.header = {.size = size, .type = t},
                      .payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1};
}

// Inflate the start of a loose file until the header's NUL shows up.
std::vector<std::uint8_t> inflate_header(const stdfs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    fail(ErrorCode::Io, "open for read failed", p.string());
  }
  gfs::Inflater inf;
  std::vector<std::uint8_t> out;
  std::array<std::uint8_t, 256> chunk{};
  while (std::ranges::find(out, static_cast<std::uint8_t>(consts::kNul)) == out.end()) {
    if (inf.done() || out.size() > kMaxHeaderLen) {
      fail(ErrorCode::Corrupt, "header", "no terminator");
    }
    ifs.read(reinterpret_cast<char *>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    const auto got = static_cast<std::size_t>(ifs.gcount());
    if (got == 0) {
      fail(ErrorCode::Corrupt, "header", "truncated object file");
    }
    inf.update(std::span<const std::uint8_t>(chunk.data(), got), out);
  }
  return out;
}

} // namespace

// Write sink: deflates "<header>" + chunks straight into a temp file in the
// objects directory, renamed into the fanout on commit.
class LooseWriteSink : public WriteSink {
public:
  LooseWriteSink(LooseBackend &owner, std::size_t size, ObjectType type)
      : owner_(owner), tmp_(gfs::unique_temp_path(owner.objects_dir_, consts::kTmpObjectPrefix)),
        deflater_(owner.options_.compression_level) {
    ofs_.open(tmp_, std::ios::binary | std::ios::trunc);
    if (!ofs_) {
      fail(ErrorCode::Io, "loose write", "open temp for write failed: " + tmp_.string());
    }
    open_ = true;
    const std::string hdr = object_header(type_name(type), size);
    try {
      deflater_.update(std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t *>(hdr.data()), hdr.size()),
                       buf_);
      drain();
    } catch (const OdbError &) {
      abort();
      throw;
    }
  }

  ~LooseWriteSink() override {
    if (open_) {
      abort();
    }
  }

  void write(std::span<const std::uint8_t> chunk) override {
    deflater_.update(chunk, buf_);
    drain();
  }

  void commit(const Oid &id) override {
    deflater_.finish(buf_);
    drain();
    ofs_.close();
    if (!ofs_) {
      fail(ErrorCode::Io, "loose write", "close temp failed: " + tmp_.string());
    }

    const stdfs::path dest = owner_.path_for_oid(id);
    std::error_code ec;
    if (gfs::exists(dest)) {
      stdfs::remove(tmp_, ec);
    } else {
      gfs::ensure_parent_dir(dest);
      stdfs::rename(tmp_, dest, ec);
      if (ec) {
        fail(ErrorCode::Io, "loose write", "rename into place failed: " + dest.string() + ": " +
                                               ec.message());
      }
    }
    open_ = false;
    owner_.remember(id);
  }

  void abort() noexcept override {
    if (ofs_.is_open()) {
      ofs_.close();
    }
    std::error_code ec;
    stdfs::remove(tmp_, ec);
    open_ = false;
  }

private:
  void drain() {
    if (buf_.empty()) {
      return;
    }
    ofs_.write(reinterpret_cast<const char *>(buf_.data()),
               static_cast<std::streamsize>(buf_.size()));
    buf_.clear();
    if (!ofs_) {
      fail(ErrorCode::Io, "loose write", "write temp failed: " + tmp_.string());
    }
  }

  LooseBackend &owner_;
  stdfs::path tmp_;
  std::ofstream ofs_;
  gfs::Deflater deflater_;
  std::vector<std::uint8_t> buf_;
  bool open_ = false;
};

LooseBackend::LooseBackend(stdfs::path objects_dir, const OdbOptions &options)
    : objects_dir_(std::move(objects_dir)), options_(options) {
  if (!gfs::exists(objects_dir_)) {
    fail(ErrorCode::NotFound, "loose backend", "no such objects directory: " + objects_dir_.string());
  }
  if (!gfs::is_directory(objects_dir_)) {
    fail(ErrorCode::InvalidState, "loose backend", "not a directory: " + objects_dir_.string());
  }
}

std::string LooseBackend::describe() const { return "loose:" + objects_dir_.string(); }

stdfs::path LooseBackend::path_for_oid(const Oid &id) const {
  const std::string hex = to_hex(id);
  const stdfs::path dir = objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

bool LooseBackend::exists(const Oid &id) {
  return id.algorithm() == algorithm() && gfs::exists(path_for_oid(id));
}

std::optional<OdbObject> LooseBackend::read(const Oid &id) {
  if (!exists(id)) {
    return std::nullopt;
  }
  const std::string where = "loose read " + to_hex(id);

  std::vector<std::uint8_t> store;
  try {
    store = gfs::z_decompress(gfs::read_file(path_for_oid(id)));
  } catch (const OdbError &e) {
    fail(e.code(), where, e.what());
  }

  const auto parsed = parse_header(store);
  if (!parsed) {
    fail(ErrorCode::Corrupt, where, "invalid header");
  }
  if (store.size() - parsed->payload_off != parsed->header.size) {
    fail(ErrorCode::Corrupt, where,
         "size mismatch: header says " + std::to_string(parsed->header.size) + ", payload has " +
             std::to_string(store.size() - parsed->payload_off));
  }
  if (options_.verify_reads && digest(algorithm(), store) != id) {
    fail(ErrorCode::Corrupt, where, "content does not hash to its id");
  }

  store.erase(store.begin(), store.begin() + static_cast<std::ptrdiff_t>(parsed->payload_off));
  return OdbObject(id, parsed->header.type, std::move(store));
}

std::optional<ObjectHeader> LooseBackend::read_header(const Oid &id) {
  if (!exists(id)) {
    return std::nullopt;
  }
  const std::string where = "loose read header " + to_hex(id);

  std::vector<std::uint8_t> out;
  try {
    out = inflate_header(path_for_oid(id));
  } catch (const OdbError &e) {
    fail(e.code(), where, e.what());
  }
  const auto parsed = parse_header(out);
  if (!parsed) {
    fail(ErrorCode::Corrupt, where, "invalid header");
  }
  return parsed->header;
}

std::unique_ptr<WriteSink> LooseBackend::open_write(std::size_t size, ObjectType type) {
  return std::make_unique<LooseWriteSink>(*this, size, type);
}

// Listing

std::set<Oid> LooseBackend::scan() const {
  std::set<Oid> out;
  const std::size_t rest_len = hex_size(algorithm()) - consts::kFanoutDirHexLen;

  std::error_code ec;
  stdfs::directory_iterator dirs(objects_dir_, ec);
  if (ec) {
    fail(ErrorCode::Io, "loose scan", objects_dir_.string() + ": " + ec.message());
  }
  for (; dirs != stdfs::directory_iterator(); dirs.increment(ec)) {
    if (ec) {
      fail(ErrorCode::Io, "loose scan", objects_dir_.string() + ": " + ec.message());
    }
    const std::string dir_name = dirs->path().filename().string();
    if (dir_name.size() != consts::kFanoutDirHexLen || !looks_hex(dir_name) ||
        !dirs->is_directory(ec)) {
      continue; // info/, pack/, temp files
    }
    stdfs::directory_iterator files(dirs->path(), ec);
    if (ec) {
      fail(ErrorCode::Io, "loose scan", dirs->path().string() + ": " + ec.message());
    }
    for (; files != stdfs::directory_iterator(); files.increment(ec)) {
      if (ec) {
        fail(ErrorCode::Io, "loose scan", dirs->path().string() + ": " + ec.message());
      }
      const std::string file_name = files->path().filename().string();
      if (file_name.size() != rest_len) {
        continue;
      }
      Oid id;
      if (from_hex(dir_name + file_name, id, algorithm())) {
        out.insert(id);
      }
    }
  }
  return out;
}

const std::set<Oid> &LooseBackend::listing() {
  if (!listing_) {
    listing_ = scan();
  }
  return *listing_;
}

void LooseBackend::remember(const Oid &id) {
  if (listing_) {
    listing_->insert(id);
  }
}

void LooseBackend::find_prefix(const Oid &short_id, std::size_t hex_len, std::set<Oid> &matches) {
  if (short_id.algorithm() != algorithm()) {
    return;
  }
  const auto &ids = listing();
  for (auto it = ids.lower_bound(short_id.truncated(hex_len));
       it != ids.end() && it->matches_prefix(short_id, hex_len); ++it) {
    matches.insert(*it);
  }
}

bool LooseBackend::for_each(const OidVisitor &visit) {
  // Snapshot, so a visitor may write or refresh without invalidating the walk.
  const std::vector<Oid> ids(listing().begin(), listing().end());
  return std::ranges::all_of(ids, visit);
}

} // namespace flyodb
