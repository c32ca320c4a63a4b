#include "ReferenceIndex.hpp"

#include <algorithm>
#include <utility>

namespace alib {

ReferenceIndex::ReferenceIndex(std::vector<std::string> ids) : ids_(std::move(ids)) {
  std::sort(ids_.begin(), ids_.end());
  ids_.erase(std::unique(ids_.begin(), ids_.end()), ids_.end());
}

bool ReferenceIndex::insert(const std::string& id) {
  auto it = std::lower_bound(ids_.begin(), ids_.end(), id);
  if (it != ids_.end() && *it == id) return false;
  ids_.insert(it, id);
  return true;
}

bool ReferenceIndex::contains(const std::string& id) const {
  return std::binary_search(ids_.begin(), ids_.end(), id);
}

std::vector<std::string> ReferenceIndex::matching(const std::string& prefix) const {
  std::vector<std::string> out;
  for (auto it = std::lower_bound(ids_.begin(), ids_.end(), prefix); it != ids_.end(); ++it) {
    if (it->compare(0, prefix.size(), prefix) != 0) break;
    out.push_back(*it);
  }
  return out;
}

} // namespace alib
