#pragma once

#include <string>
#include <string_view>

namespace twingraph::util {

std::string Base64Encode(std::string_view data);

// Throws InvalidArgument on malformed input.
std::string Base64Decode(std::string_view encoded);

} // namespace twingraph::util
