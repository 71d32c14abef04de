#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace finq::util {

/*
  Task ids are RFC4122 version 4 UUIDs in canonical text form
  (8-4-4-4-12 lower-case hex).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string GenerateUUIDString();

} // namespace finq::util
