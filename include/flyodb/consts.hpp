#pragma once
#include <cstddef>
#include <string_view>

namespace flyodb::consts {

// Directory and file names (relative to an objects directory)
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kInfoDir       = "info";
inline constexpr std::string_view kAlternatesFile = "alternates";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kTmpObjectPrefix = "tmp_obj_";

// Object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";
inline constexpr std::string_view kTypeTag    = "tag";

// ——— Object ID sizes ———
inline constexpr std::size_t kSha1RawLen   = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kSha256RawLen = 32;  // 32 bytes (SHA-256)
inline constexpr std::size_t kMaxRawLen    = kSha256RawLen;

// Shortest abbreviated id accepted by prefix lookups
inline constexpr std::size_t kMinPrefixHexLen = 4;

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// info/alternates nesting limit
inline constexpr int kAlternatesMaxDepth = 5;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace flyodb::consts
