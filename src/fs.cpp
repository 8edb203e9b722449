#include "flyodb/fs.hpp"

#include "flyodb/error.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <zlib.h>

namespace flyodb::fs {

namespace {

constexpr std::size_t kChunk = 16 * 1024;
constexpr std::size_t kSlice = 1U << 30;

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

bool is_directory(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    fail(ErrorCode::Io, "mkdir -p", p.parent_path().string() + ": " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    fail(ErrorCode::Io, "open for read failed", p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    fail(ErrorCode::Io, "read failed", p.string());
  return buf;
}

std::filesystem::path unique_temp_path(const std::filesystem::path &dir, std::string_view prefix) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  for (int attempt = 0; attempt < 16; ++attempt) {
    std::ostringstream name;
    name << prefix << std::hex << rng();
    auto p = dir / name.str();
    if (!fs::exists(p))
      return p;
  }
  fail(ErrorCode::Io, "temp file", "could not pick a free name in " + dir.string());
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      fail(ErrorCode::Io, "open temp for write failed", tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      fail(ErrorCode::Io, "flush temp failed", tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      fail(ErrorCode::Io, "atomic replace failed", p.string() + ": " + ec.message());
    }
  }
}

// Deflater

void DeflateStreamDeleter::operator()(z_stream_s *zs) const {
  deflateEnd(zs);
  std::default_delete<z_stream>{}(zs);
}

void InflateStreamDeleter::operator()(z_stream_s *zs) const {
  inflateEnd(zs);
  std::default_delete<z_stream>{}(zs);
}

Deflater::Deflater(int level) : zs_(std::make_unique<z_stream>().release()) {
  if (deflateInit(zs_.get(), level) != Z_OK) {
    fail(ErrorCode::Io, "zlib", "deflateInit failed (level " + std::to_string(level) + ")");
  }
}

void Deflater::pump(std::span<const std::uint8_t> in, int flush, std::vector<std::uint8_t> &out) {
  zs_->next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(in.data()));
  zs_->avail_in = static_cast<uInt>(in.size());
  std::array<std::uint8_t, kChunk> buf{};
  int rc = Z_OK;
  do {
    zs_->next_out = buf.data();
    zs_->avail_out = static_cast<uInt>(buf.size());
    rc = deflate(zs_.get(), flush);
    if (rc == Z_STREAM_ERROR)
      fail(ErrorCode::Io, "zlib", "deflate failed");
    out.insert(out.end(), buf.begin(), buf.begin() + (buf.size() - zs_->avail_out));
  } while (zs_->avail_out == 0 || (flush == Z_FINISH && rc != Z_STREAM_END));
}

void Deflater::update(std::span<const std::uint8_t> in, std::vector<std::uint8_t> &out) {
  // avail_in is 32-bit; feed very large spans in slices
  while (in.size() > kSlice) {
    pump(in.first(kSlice), Z_NO_FLUSH, out);
    in = in.subspan(kSlice);
  }
  pump(in, Z_NO_FLUSH, out);
}

void Deflater::finish(std::vector<std::uint8_t> &out) { pump({}, Z_FINISH, out); }

// Inflater

Inflater::Inflater() : zs_(std::make_unique<z_stream>().release()) {
  if (inflateInit(zs_.get()) != Z_OK) {
    fail(ErrorCode::Io, "zlib", "inflateInit failed");
  }
}

bool Inflater::update(std::span<const std::uint8_t> in, std::vector<std::uint8_t> &out) {
  // Same 32-bit avail_in limit as Deflater::update
  while (!done_ && in.size() > kSlice) {
    pump(in.first(kSlice), out);
    in = in.subspan(kSlice);
  }
  return done_ || pump(in, out);
}

bool Inflater::pump(std::span<const std::uint8_t> in, std::vector<std::uint8_t> &out) {
  zs_->next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(in.data()));
  zs_->avail_in = static_cast<uInt>(in.size());
  std::array<std::uint8_t, kChunk> buf{};
  while (true) {
    zs_->next_out = buf.data();
    zs_->avail_out = static_cast<uInt>(buf.size());
    const int rc = inflate(zs_.get(), Z_NO_FLUSH);
    out.insert(out.end(), buf.begin(), buf.begin() + (buf.size() - zs_->avail_out));
    if (rc == Z_STREAM_END) {
      done_ = true;
      return true;
    }
    if (rc == Z_DATA_ERROR || rc == Z_NEED_DICT)
      fail(ErrorCode::Corrupt, "zlib", "invalid compressed data");
    if (rc == Z_MEM_ERROR)
      fail(ErrorCode::Io, "zlib", "out of memory");
    // Z_BUF_ERROR: no progress possible until more input arrives
    if (rc == Z_BUF_ERROR || (zs_->avail_in == 0 && zs_->avail_out != 0))
      return false;
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data, int level) {
  std::vector<std::uint8_t> out;
  out.reserve(compressBound(static_cast<uLong>(data.size())));
  Deflater d{level};
  d.update(data, out);
  d.finish(out);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  std::vector<std::uint8_t> out;
  out.reserve(std::max<std::size_t>(data.size() * 3, 64));
  Inflater inf;
  if (!inf.update(data, out))
    fail(ErrorCode::Corrupt, "zlib", "truncated compressed data");
  return out;
}

} // namespace flyodb::fs
