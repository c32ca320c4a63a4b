#pragma once
#include <string>
#include <vector>

namespace alib {

// Sorted identifier array. Prefix lookups are a binary search to the first
// candidate followed by a linear walk over the matches.
class ReferenceIndex {
public:
  ReferenceIndex() = default;
  explicit ReferenceIndex(std::vector<std::string> ids);

  bool insert(const std::string& id);   // false if already present
  bool contains(const std::string& id) const;

  // All identifiers starting with prefix, in sorted order.
  std::vector<std::string> matching(const std::string& prefix) const;

  size_t size() const { return ids_.size(); }

private:
  std::vector<std::string> ids_;
};

} // namespace alib
