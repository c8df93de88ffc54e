#include "internal/twins/json_patch.hpp"

#include "internal/util/errors.hpp"

namespace twingraph::twins {

namespace {

std::string Unescape(const std::string& token) {
  std::string out;
  out.reserve(token.size());
  for (std::size_t i = 0; i < token.size(); ++i) {
    if (token[i] == '~' && i + 1 < token.size() && (token[i + 1] == '0' || token[i + 1] == '1')) {
      out += token[i + 1] == '1' ? '/' : '~';
      ++i;
      continue;
    }
    out += token[i];
  }
  return out;
}

const char* Name(PatchOp op) {
  switch (op) {
    case PatchOp::Add:
      return "add";
    case PatchOp::Replace:
      return "replace";
    case PatchOp::Remove:
      return "remove";
  }
  return "add";
}

} // namespace

std::vector<std::string> DecodePointer(const std::string& pointer) {
  if (pointer.empty()) return {};
  if (pointer.front() != '/') {
    throw util::InvalidArgument("Invalid JSON pointer '" + pointer + "'");
  }

  std::vector<std::string> tokens;
  std::size_t              start = 1;
  while (true) {
    const auto slash = pointer.find('/', start);
    tokens.push_back(Unescape(pointer.substr(start, slash == std::string::npos ? std::string::npos : slash - start)));
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  return tokens;
}

std::vector<PatchOperation> ParsePatch(const Json& patch) {
  if (!patch.is_array()) {
    throw util::InvalidArgument("JSON Patch must be an array of operations");
  }

  std::vector<PatchOperation> operations;
  for (const auto& item : patch) {
    if (!item.is_object() || !item.contains("op") || !item["op"].is_string() || !item.contains("path") ||
        !item["path"].is_string()) {
      throw util::InvalidArgument("Each JSON Patch operation needs string 'op' and 'path' members");
    }

    PatchOperation operation;
    const auto     op = item["op"].get<std::string>();
    if (op == "add") {
      operation.op = PatchOp::Add;
    } else if (op == "replace") {
      operation.op = PatchOp::Replace;
    } else if (op == "remove") {
      operation.op = PatchOp::Remove;
    } else {
      const auto value = item.contains("value") ? item["value"].dump() : std::string();
      throw util::Unsupported("Operation '" + op + "' with value '" + value + "' is not supported");
    }

    operation.pointer = item["path"].get<std::string>();
    operation.path    = DecodePointer(operation.pointer);

    if (operation.op != PatchOp::Remove) {
      if (!item.contains("value")) {
        throw util::InvalidArgument("Operation '" + op + "' on '" + operation.pointer + "' has no value");
      }
      operation.value = item["value"];
    }
    operations.push_back(std::move(operation));
  }
  return operations;
}

Json ApplyPatch(const Json& target, const std::vector<PatchOperation>& operations) {
  Json document = Json::array();
  for (const auto& operation : operations) {
    Json item = {{"op", Name(operation.op)}, {"path", operation.pointer}};
    if (operation.value) item["value"] = *operation.value;
    document.push_back(std::move(item));
  }

  try {
    return target.patch(document);
  } catch (const Json::exception& e) {
    throw util::ValidationFailed(std::string("Failed to apply patch: ") + e.what());
  }
}

} // namespace twingraph::twins
