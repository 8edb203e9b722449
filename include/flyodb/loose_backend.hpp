#pragma once
#include "flyodb/backend.hpp"
#include "flyodb/options.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace flyodb {

/**
 * One zlib-deflated file per object under an objects directory:
 *   <objects>/ab/cdef...   holding   deflate("<type> <size>\0" + payload)
 *
 * exists/read go straight to the filesystem. Prefix lookups and enumeration
 * use a listing of the fanout directories that is built on first use and
 * kept until refresh(); objects written through this backend are added to it.
 */
class LooseBackend : public Backend {
public:
  // Throws OdbError{NotFound} if objects_dir is missing, {InvalidState} if
  // it is not a directory.
  explicit LooseBackend(std::filesystem::path objects_dir, const OdbOptions &options = {});

  [[nodiscard]] HashAlgorithm algorithm() const override { return options_.algorithm; }
  [[nodiscard]] std::string describe() const override;
  [[nodiscard]] const std::filesystem::path &objects_dir() const { return objects_dir_; }

  // Get filesystem path for an oid.
  [[nodiscard]] std::filesystem::path path_for_oid(const Oid &id) const;

  bool exists(const Oid &id) override;
  std::optional<OdbObject> read(const Oid &id) override;
  // Inflates only as much of the file as the header needs.
  std::optional<ObjectHeader> read_header(const Oid &id) override;

  void find_prefix(const Oid &short_id, std::size_t hex_len, std::set<Oid> &matches) override;
  bool for_each(const OidVisitor &visit) override;

  [[nodiscard]] bool writable() const override { return true; }
  std::unique_ptr<WriteSink> open_write(std::size_t size, ObjectType type) override;

  void refresh() override { listing_.reset(); }

private:
  friend class LooseWriteSink;

  const std::set<Oid> &listing();
  std::set<Oid> scan() const;
  void remember(const Oid &id);

  std::filesystem::path objects_dir_;
  OdbOptions options_;
  std::optional<std::set<Oid>> listing_;
};

} // namespace flyodb
