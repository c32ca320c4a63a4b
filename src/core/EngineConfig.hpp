#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace alib {

constexpr uint64_t kMiB = 1024ULL * 1024ULL;
constexpr uint64_t kGiB = 1024ULL * kMiB;

// Remote descriptions are capped at this many ASCII bytes.
constexpr size_t kMaxDescriptorBytes = 1024;

struct PartLimits {
  uint64_t min_part_size = 1 * kMiB;
  uint64_t max_part_size = 4 * kGiB;
  uint64_t max_parts     = 10000;
};

struct RetryPolicy {
  int max_attempts = 5;
  std::chrono::milliseconds backoff_base{200};
  std::chrono::milliseconds backoff_max{30000};
};

// Everything the engine needs to know, passed in explicitly.
struct EngineConfig {
  std::string vault_name     = "seedbank";
  int         id_hex_length  = 16;
  uint64_t    single_part_threshold = 100 * kMiB;
  PartLimits  part_limits;
  RetryPolicy retry;
  int         workers = 4;             // per multi-part job
  int         global_concurrency = 8;  // part transfers across all jobs
};

// Throws ValidationError when a value is out of range.
void validate(const EngineConfig& config);

} // namespace alib
