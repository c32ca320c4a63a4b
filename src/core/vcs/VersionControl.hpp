#pragma once
#include <string>

namespace alib {

// Where ledger snapshots are committed after each change. The librarian
// never looks at history or branches.
class VersionControl {
public:
  virtual ~VersionControl() = default;

  // Returns the new commit's id.
  virtual std::string commit(const std::string& ledgerSnapshot) = 0;
  virtual void push() = 0;
};

} // namespace alib
