#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace alib {

// Local payload store keyed by archive identifier. Payloads start under the
// pending root and move to the confirmed root once the vault has them.
class BlobStore {
public:
  BlobStore(std::string pendingRoot, std::string confirmedRoot);

  // Writes bytes as the pending payload of id; returns its full path.
  std::string put(const std::string& id, std::string_view bytes);
  // Copies an existing file in as the pending payload of id.
  std::string stageFile(const std::string& id, const std::string& srcPath);
  // Moves the payload to the confirmed root. No-op if already there.
  std::string promote(const std::string& id);
  void remove(const std::string& id);

  bool exists(const std::string& id) const;
  bool isConfirmed(const std::string& id) const;
  std::string path(const std::string& id) const;   // NotFoundError if absent
  uint64_t size(const std::string& id) const;
  std::string read(const std::string& id, uint64_t offset, uint64_t length) const;

private:
  std::string pendingRoot_;
  std::string confirmedRoot_;
};

} // namespace alib
