#pragma once

#include <nlohmann/json.hpp>

namespace twingraph::util {

// Property bags keep insertion order so stored twins read back the way they were written.
using Json = nlohmann::ordered_json;

} // namespace twingraph::util
