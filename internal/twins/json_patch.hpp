#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/util/json.hpp"

namespace twingraph::twins {

using util::Json;

enum class PatchOp {
  Add,
  Replace,
  Remove
};

struct PatchOperation {
  PatchOp                  op = PatchOp::Add;
  std::string              pointer;
  // Decoded reference tokens; empty for the whole document.
  std::vector<std::string> path;
  std::optional<Json>      value;

  const std::string& Root() const {
    static const std::string kEmpty;
    return path.empty() ? kEmpty : path.front();
  }
};

/*
  JSON Patch (RFC 6902) restricted to add, replace and remove.

  ParsePatch throws InvalidArgument for a malformed document and
  Unsupported for move/copy/test or unknown operations.
*/
std::vector<PatchOperation> ParsePatch(const Json& patch);

// Throws ValidationFailed when an operation does not apply to target.
Json ApplyPatch(const Json& target, const std::vector<PatchOperation>& operations);

std::vector<std::string> DecodePointer(const std::string& pointer);

} // namespace twingraph::twins
