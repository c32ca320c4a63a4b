#include "DescriptorCodec.hpp"

#include <spdlog/spdlog.h>
#include <cctype>
#include <stdexcept>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/Errors.hpp"

namespace alib {

namespace {

constexpr int kDescriptorVersion = 2;

bool plain(unsigned char c) {
  if (c < 0x20 || c > 0x7E) return false;
  return c != '%' && c != ';' && c != '=' && c != static_cast<unsigned char>(kTruncationMarker);
}

// Percent-encodes byte by byte; each element is one encoded unit so a cut
// never splits an escape.
std::vector<std::string> encode_units(const std::string& v) {
  static const char* k = "0123456789ABCDEF";
  std::vector<std::string> units;
  units.reserve(v.size());
  for (unsigned char c : v) {
    if (plain(c)) units.emplace_back(1, static_cast<char>(c));
    else units.push_back({'%', k[c >> 4], k[c & 0xF]});
  }
  return units;
}

std::string encode_value(const std::string& v) {
  std::string out;
  for (const auto& u : encode_units(v)) out += u;
  return out;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string decode_value(const std::string& v) {
  std::string out;
  out.reserve(v.size());
  for (size_t i = 0; i < v.size(); ++i) {
    if (v[i] == '%' && i + 2 < v.size()) {
      const int hi = hex_value(v[i + 1]), lo = hex_value(v[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(v[i]);
  }
  return out;
}

void append_field(std::string& out, const char* tag, const std::string& encoded) {
  if (!out.empty()) out.push_back(';');
  out += tag;
  out.push_back('=');
  out += encoded;
}

} // namespace

std::string encode_descriptor(const ArchiveRecord& record) {
  std::string head;
  append_field(head, "v", std::to_string(kDescriptorVersion));
  append_field(head, "id", encode_value(record.id));
  append_field(head, "n", std::to_string(record.files.size()));
  append_field(head, "sum", encode_value(record.payload_checksum));
  if (head.size() > kMaxDescriptorBytes)
    throw ValidationError("structural descriptor fields exceed " + std::to_string(kMaxDescriptorBytes) + " bytes");

  const std::string ts  = record.created_at ? std::to_string(record.created_at) : std::string();
  const std::string src = encode_value(record.source_path);
  const auto desc_units = encode_units(record.description);
  size_t desc_len = 0;
  for (const auto& u : desc_units) desc_len += u.size();

  auto field_len = [](const char* tag, const std::string& v) {
    return v.empty() ? 0 : std::char_traits<char>::length(tag) + 2 + v.size();
  };
  const size_t desc_field = desc_units.empty() ? 0 : 3 + desc_len; // ";d="

  // Optional fields go first, in this order, before the description is cut.
  bool keep_src = !src.empty();
  bool keep_ts  = !ts.empty();
  auto total = [&]() {
    return head.size() + (keep_ts ? field_len("ts", ts) : 0) +
           (keep_src ? field_len("src", src) : 0) + desc_field;
  };
  if (total() > kMaxDescriptorBytes) keep_src = false;
  if (total() > kMaxDescriptorBytes) keep_ts = false;

  std::string out = head;
  if (keep_ts) append_field(out, "ts", ts);
  if (keep_src) append_field(out, "src", src);

  if (!desc_units.empty()) {
    if (out.size() + desc_field <= kMaxDescriptorBytes) {
      std::string d;
      for (const auto& u : desc_units) d += u;
      append_field(out, "d", d);
    } else if (out.size() + 4 <= kMaxDescriptorBytes) {
      const size_t room = kMaxDescriptorBytes - out.size() - 4; // ";d=" + marker
      std::string d;
      for (const auto& u : desc_units) {
        if (d.size() + u.size() > room) break;
        d += u;
      }
      d.push_back(kTruncationMarker);
      append_field(out, "d", d);
      spdlog::debug("descriptor for {} truncated description to {} bytes", record.id, d.size() - 1);
    }
  }
  return out;
}

DecodedDescriptor decode_descriptor(const std::string& text) {
  DecodedDescriptor out;
  bool have_id = false, have_n = false, have_sum = false;

  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find(';', pos);
    if (end == std::string::npos) end = text.size();
    const std::string field = text.substr(pos, end - pos);
    pos = end + 1;

    const size_t eq = field.find('=');
    if (eq == std::string::npos) continue;
    const std::string tag = field.substr(0, eq);
    std::string raw = field.substr(eq + 1);

    try {
      if (tag == "v") {
        out.version = std::stoi(raw);
      } else if (tag == "id" || tag == "archive") {
        out.id = decode_value(raw);
        have_id = !out.id.empty();
      } else if (tag == "n" || tag == "files") {
        out.file_count = std::stoull(raw);
        have_n = true;
      } else if (tag == "sum" || tag == "checksum") {
        out.checksum = decode_value(raw);
        have_sum = !out.checksum.empty();
      } else if (tag == "ts") {
        out.created_at = std::stoll(raw);
      } else if (tag == "src") {
        out.source_path = decode_value(raw);
      } else if (tag == "d" || tag == "desc") {
        if (!raw.empty() && raw.back() == kTruncationMarker) {
          raw.pop_back();
          out.description_truncated = true;
        }
        out.description = decode_value(raw);
      }
    } catch (const std::logic_error&) {
      spdlog::warn("descriptor field '{}' has an unreadable value, skipped", tag);
    }
  }

  if (out.version == 0) out.version = 1;
  if (!have_id || !have_n || !have_sum)
    throw ValidationError("descriptor is missing id, file count or checksum");
  return out;
}

} // namespace alib
