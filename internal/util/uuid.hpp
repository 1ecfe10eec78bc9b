#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace epicflow::util {

/*
  UUID helpers

  Branch events are identified by random RFC4122 v4 UUIDs, carried in
  their canonical 36 character text form (8-4-4-4-12, lowercase hex).
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// True for the canonical text form, any version.
bool IsCanonicalUUID(std::string_view text);

std::string NewEventId();

} // namespace epicflow::util
