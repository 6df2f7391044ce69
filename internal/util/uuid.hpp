#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace catalog::util {

/*
  UUID helpers

  entity_id is an RFC4122 version 4 UUID in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Canonical text of a fresh UUID, the usual entity_id.
std::string NewEntityId();

} // namespace catalog::util
