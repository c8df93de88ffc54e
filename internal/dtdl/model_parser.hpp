#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/dtdl/object_model.hpp"

namespace twingraph::dtdl {

// Fetches definition documents for interface ids the submitted documents
// reference but do not define. Ids it cannot find are simply omitted.
using ModelResolver = std::function<std::vector<std::string>(const std::vector<std::string>& dtmis)>;

/*
  ModelParser

  Turns interface definition documents into a resolved object model.
  All problems found in one call are reported together as a
  ModelParsingError.
*/
class ModelParser {
 public:
  virtual ~ModelParser() = default;

  virtual ObjectModel Parse(const std::vector<std::string>& documents, const ModelResolver& resolver) const = 0;
};

class DtdlModelParser final : public ModelParser {
 public:
  static constexpr int kMaxExtendsDepth = 10;

  ObjectModel Parse(const std::vector<std::string>& documents, const ModelResolver& resolver) const override;
};

bool IsValidDtmi(std::string_view id);

} // namespace twingraph::dtdl
