#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace annoschema::util {

/*
  Central error types.

  Compilation is all-or-nothing per table: any of these aborts the table
  being compiled and propagates to the caller unmodified.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// One or more requested schema names are not registered.
class UnknownSchemaError : public std::runtime_error {
 public:
  explicit UnknownSchemaError(std::vector<std::string> names);

  const std::vector<std::string>& names() const {
    return names_;
  }

 private:
  std::vector<std::string> names_;
};

// A field shape the compiler cannot flatten into a fixed set of columns.
class InvalidSchemaFieldError : public std::runtime_error {
 public:
  InvalidSchemaFieldError(std::string field, const std::string& msg)
      : std::runtime_error("field '" + field + "': " + msg), field_(std::move(field)) {
  }

  const std::string& field() const {
    return field_;
  }

 private:
  std::string field_;
};

// A field kind with no column mapping that is not a recognized composite.
class UnsupportedFieldTypeError : public InvalidSchemaFieldError {
 public:
  UnsupportedFieldTypeError(std::string field, std::string kind)
      : InvalidSchemaFieldError(std::move(field), "field type " + kind + " not supported"), kind_(std::move(kind)) {
  }

  const std::string& kind() const {
    return kind_;
  }

 private:
  std::string kind_;
};

class MalformedNameError : public std::runtime_error {
 public:
  MalformedNameError(std::string name, const std::string& msg)
      : std::runtime_error("malformed table name '" + name + "': " + msg), name_(std::move(name)) {
  }

  const std::string& name() const {
    return name_;
  }

 private:
  std::string name_;
};

inline std::string JoinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out;
}

inline UnknownSchemaError::UnknownSchemaError(std::vector<std::string> names)
    : std::runtime_error("[" + JoinNames(names) + "] are invalid types"), names_(std::move(names)) {
}

} // namespace annoschema::util
