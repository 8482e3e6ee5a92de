#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace vidpipe::util {

/*
  UUID helpers

  Video, job and lease ids are RFC4122 v4 UUIDs in canonical
  36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace vidpipe::util
