#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "core/crypto/Sha256.hpp"

namespace alib {

constexpr size_t kTreeHashBlock = 1024 * 1024;

// SHA-256 tree hash as verified by the vault.
//
// Input is cut into 1 MiB leaves no matter how update() is called, so feeding
// the same bytes through any chunk plan yields the same root. Leaves are
// combined pairwise per level; an odd digest at the end of a level moves up
// unchanged.
class TreeHasher {
public:
  TreeHasher() = default;

  void update(std::string_view bytes);
  Digest finish();
  std::string finishHex();

  uint64_t bytesSeen() const { return total_; }

  static Digest combine(std::vector<Digest> level);

private:
  void flushLeaf();

  std::vector<Digest> leaves_;
  std::string pending_;
  uint64_t total_ = 0;
};

std::string tree_hash_hex(std::string_view bytes);
std::string tree_hash_file(const std::string& path);

} // namespace alib
