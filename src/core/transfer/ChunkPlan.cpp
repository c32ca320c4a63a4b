#include "ChunkPlan.hpp"
#include "core/Errors.hpp"

#include <string>

namespace alib {

static uint64_t parts_needed(uint64_t total, uint64_t part_size) {
  return total / part_size + (total % part_size ? 1 : 0);
}

ChunkPlan plan_chunks_with_size(uint64_t total_size, uint64_t part_size) {
  if (part_size == 0) throw ValidationError("part size must be positive");

  ChunkPlan plan;
  plan.total_size = total_size;
  plan.part_size = part_size;
  plan.parts.reserve(static_cast<size_t>(parts_needed(total_size, part_size)));

  uint32_t index = 0;
  for (uint64_t off = 0; off < total_size; off += part_size) {
    const uint64_t len = (total_size - off < part_size) ? total_size - off : part_size;
    plan.parts.push_back({index++, off, len});
  }
  return plan;
}

ChunkPlan plan_chunks(uint64_t total_size, const PartLimits& limits) {
  if (limits.min_part_size == 0 || limits.max_part_size < limits.min_part_size)
    throw ValidationError("invalid part size range");

  uint64_t size = limits.min_part_size;
  while (parts_needed(total_size, size) > limits.max_parts) {
    if (size > limits.max_part_size / 2) {
      throw ValidationError("payload of " + std::to_string(total_size) +
                            " bytes needs more than " + std::to_string(limits.max_parts) +
                            " parts at the largest part size");
    }
    size *= 2;
  }
  return plan_chunks_with_size(total_size, size);
}

} // namespace alib
