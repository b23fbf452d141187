#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace swarm::util {

/*
  UUID helpers

  Session, proposal and healing action ids are random RFC4122 v4 UUIDs
  in canonical text form, optionally prefixed ("sess-", "prop-", "heal-").
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string GenerateId(std::string_view prefix);

} // namespace swarm::util
