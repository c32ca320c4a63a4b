#include "TreeHasher.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace alib {

void TreeHasher::update(std::string_view bytes) {
  total_ += bytes.size();
  while (!bytes.empty()) {
    // Hash whole leaves straight from the input when nothing is buffered.
    if (pending_.empty() && bytes.size() >= kTreeHashBlock) {
      leaves_.push_back(sha256(bytes.substr(0, kTreeHashBlock)));
      bytes.remove_prefix(kTreeHashBlock);
      continue;
    }
    const size_t take = std::min(kTreeHashBlock - pending_.size(), bytes.size());
    pending_.append(bytes.data(), take);
    bytes.remove_prefix(take);
    if (pending_.size() == kTreeHashBlock) flushLeaf();
  }
}

void TreeHasher::flushLeaf() {
  leaves_.push_back(sha256(pending_));
  pending_.clear();
}

Digest TreeHasher::finish() {
  if (!pending_.empty()) flushLeaf();
  if (leaves_.empty()) return sha256(std::string_view());
  return combine(std::move(leaves_));
}

std::string TreeHasher::finishHex() { return to_hex(finish()); }

Digest TreeHasher::combine(std::vector<Digest> level) {
  if (level.empty()) throw std::invalid_argument("tree hash over zero digests");
  while (level.size() > 1) {
    std::vector<Digest> next;
    next.reserve((level.size() + 1) / 2);
    size_t i = 0;
    for (; i + 1 < level.size(); i += 2) next.push_back(sha256_pair(level[i], level[i + 1]));
    if (i < level.size()) next.push_back(level[i]);
    level = std::move(next);
  }
  return level.front();
}

std::string tree_hash_hex(std::string_view bytes) {
  TreeHasher h;
  h.update(bytes);
  return h.finishHex();
}

std::string tree_hash_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open for hashing: " + path);
  TreeHasher h;
  std::string buf(kTreeHashBlock, '\0');
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = in.gcount();
    if (got > 0) h.update(std::string_view(buf.data(), static_cast<size_t>(got)));
  }
  if (in.bad()) throw std::runtime_error("read failed while hashing: " + path);
  return h.finishHex();
}

} // namespace alib
