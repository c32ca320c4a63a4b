#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "core/ledger/ArchiveRecord.hpp"

namespace alib {

// What can be rebuilt from a vault-side description alone.
struct DecodedDescriptor {
  int         version = 0;
  std::string id;
  uint64_t    file_count = 0;
  std::string checksum;
  std::string description;
  bool        description_truncated = false;
  std::optional<int64_t>     created_at;
  std::optional<std::string> source_path;
};

// Marks a description that was cut to fit the vault's description cap.
constexpr char kTruncationMarker = '~';

// Printable ASCII, at most kMaxDescriptorBytes. Identical records always
// encode to identical text.
std::string encode_descriptor(const ArchiveRecord& record);

// Unknown tags are skipped. Throws ValidationError if id, file count or
// checksum cannot be recovered.
DecodedDescriptor decode_descriptor(const std::string& text);

} // namespace alib
