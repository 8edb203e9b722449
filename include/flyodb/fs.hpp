#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct z_stream_s; // zlib z_stream

namespace flyodb::fs {

bool exists(const std::filesystem::path& p);
bool is_directory(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
inline void write_file_atomic(const std::filesystem::path& p, std::string_view text) {
  write_file_atomic(p, std::span<const std::uint8_t>(
                           reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

// Fresh, not yet existing path "<dir>/<prefix><random>".
std::filesystem::path unique_temp_path(const std::filesystem::path& dir, std::string_view prefix);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data, int level);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

// Release a z_stream set up by deflateInit / inflateInit.
struct DeflateStreamDeleter {
  void operator()(z_stream_s* zs) const;
};
struct InflateStreamDeleter {
  void operator()(z_stream_s* zs) const;
};

// Streaming zlib compressor; output is appended to the caller's buffer.
class Deflater {
public:
  explicit Deflater(int level);
  Deflater(const Deflater&) = delete;
  Deflater& operator=(const Deflater&) = delete;

  void update(std::span<const std::uint8_t> in, std::vector<std::uint8_t>& out);
  void finish(std::vector<std::uint8_t>& out);

private:
  void pump(std::span<const std::uint8_t> in, int flush, std::vector<std::uint8_t>& out);

  std::unique_ptr<z_stream_s, DeflateStreamDeleter> zs_;
};

// Streaming zlib decompressor.
class Inflater {
public:
  Inflater();
  Inflater(const Inflater&) = delete;
  Inflater& operator=(const Inflater&) = delete;

  // Feed compressed bytes, appending what they decode to. Returns true once
  // the end of the zlib stream has been reached.
  bool update(std::span<const std::uint8_t> in, std::vector<std::uint8_t>& out);

  [[nodiscard]] bool done() const { return done_; }

private:
  bool pump(std::span<const std::uint8_t> in, std::vector<std::uint8_t>& out);

  std::unique_ptr<z_stream_s, InflateStreamDeleter> zs_;
  bool done_ = false;
};

} // namespace flyodb::fs
