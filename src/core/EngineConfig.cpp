#include "EngineConfig.hpp"
#include "Errors.hpp"

namespace alib {

void validate(const EngineConfig& config) {
  if (config.vault_name.empty())
    throw ValidationError("vault name must not be empty");
  if (config.id_hex_length < 4 || config.id_hex_length > 64)
    throw ValidationError("id_hex_length must be within [4, 64]");

  const auto& limits = config.part_limits;
  if (limits.min_part_size == 0 || limits.max_part_size < limits.min_part_size)
    throw ValidationError("part size range is empty");
  if (limits.max_parts == 0)
    throw ValidationError("max_parts must be positive");

  if (config.retry.max_attempts < 1)
    throw ValidationError("retry.max_attempts must be at least 1");
  if (config.workers < 1 || config.global_concurrency < 1)
    throw ValidationError("worker counts must be positive");
}

} // namespace alib
