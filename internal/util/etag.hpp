#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace twingraph::util {

/*
  Entity tags

  An etag is W/"<guid>" where the guid is the MD5 digest of
  "<entity id>-<ISO-8601 write time>", laid out like a .NET Guid
  (first three groups little-endian).
*/

using Digest = std::array<uint8_t, 16>;

Digest Md5(std::string_view input);

std::string FormatGuid(const Digest& bytes);

std::string GenerateEtag(std::string_view entity_id, TimePoint last_update_time);

// Etag that differs from `previous`; advances write_time by one 100ns tick
// until it does, so the stamped time and the etag stay consistent.
std::string NextEtag(std::string_view entity_id, TimePoint& write_time, std::string_view previous);

} // namespace twingraph::util
