#pragma once
#include <cstdint>
#include <vector>

#include "core/EngineConfig.hpp"

namespace alib {

struct ChunkSpan {
  uint32_t index;
  uint64_t offset;
  uint64_t length;
};

struct ChunkPlan {
  uint64_t total_size = 0;
  uint64_t part_size  = 0;
  std::vector<ChunkSpan> parts;
};

// Part size is the smallest min_part_size * 2^k (<= max_part_size) that keeps
// the part count within max_parts. Throws ValidationError if none does.
// Smallest, not largest: 10 MiB with a 5 MiB minimum must split into two
// 5 MiB parts. The same case needs min_part_size values that are not powers
// of two; with the default 1 MiB minimum every part size is one.
ChunkPlan plan_chunks(uint64_t total_size, const PartLimits& limits);

// Same partitioning for a fixed, already chosen part size.
ChunkPlan plan_chunks_with_size(uint64_t total_size, uint64_t part_size);

} // namespace alib
