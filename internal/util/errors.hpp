#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace twingraph::util {

/*
  Central error types.

  Store result codes are translated into these by the service layer.
  The client facade logs and rethrows them unchanged.
*/

class CompileError : public std::runtime_error {
 public:
  explicit CompileError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationFailed : public std::runtime_error {
 public:
  explicit ValidationFailed(const std::string& msg) : std::runtime_error(msg), violations_{msg} {
  }

  explicit ValidationFailed(std::vector<std::string> violations)
      : std::runtime_error(Join(violations)), violations_(std::move(violations)) {
  }

  const std::vector<std::string>& violations() const {
    return violations_;
  }

 private:
  static std::string Join(const std::vector<std::string>& violations) {
    std::string joined;
    for (const auto& v : violations) {
      if (!joined.empty()) {
        joined += " AND ";
      }
      joined += v;
    }
    return joined;
  }

  std::vector<std::string> violations_;
};

class ModelParsingError : public ValidationFailed {
 public:
  explicit ModelParsingError(std::vector<std::string> errors) : ValidationFailed(std::move(errors)) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TwinNotFound : public NotFound {
 public:
  explicit TwinNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class RelationshipNotFound : public NotFound {
 public:
  explicit RelationshipNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class ModelNotFound : public NotFound {
 public:
  explicit ModelNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class ComponentNotFound : public NotFound {
 public:
  explicit ComponentNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ModelAlreadyExists : public AlreadyExists {
 public:
  explicit ModelAlreadyExists(const std::string& msg) : AlreadyExists(msg) {
  }
};

class PreconditionFailed : public std::runtime_error {
 public:
  explicit PreconditionFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ReferentialIntegrityError : public std::runtime_error {
 public:
  explicit ReferentialIntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace twingraph::util
