#pragma once

#include <string>

namespace chunkyard::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief True when value is a UUID in canonical 8-4-4-4-12 hex form.
bool IsCanonicalUuid(const std::string& value);

}  // namespace chunkyard::core
