#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace auditgate::util {

/*
  UUID helpers

  Used for request ids when the caller does not supply one.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateRequestId() {
  return ToString(GenerateUUID());
}

} // namespace auditgate::util
