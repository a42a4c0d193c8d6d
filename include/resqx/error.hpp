#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace resqx {

// Error categories reported by every layer of the library
enum class ErrorCode {
  NotFound,               // OID or part absent
  Validation,             // schema or field violation
  DanglingReference,      // reference to a removed or absent OID
  ShapeMismatch,          // array shape or dtype disagreement
  Corruption,             // container structurally unreadable or inconsistent
  ConcurrentModification, // conflicting in-place update
  Io                      // file system failure
};

std::string_view toString(ErrorCode code);

// Structured error with enough context to localize the problem
struct Error {
  ErrorCode code = ErrorCode::Io;
  std::string message;
  std::string oid;   // canonical OID of the object concerned, if any
  std::string part;  // part name inside the container, if any
  std::string field; // field path inside the document, if any

  Error() = default;
  Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

  Error &withOid(std::string value) {
    oid = std::move(value);
    return *this;
  }

  Error &withPart(std::string value) {
    part = std::move(value);
    return *this;
  }

  Error &withField(std::string value) {
    field = std::move(value);
    return *this;
  }

  // Human readable rendering: "<code>: <message> [part=..., oid=..., field=...]"
  std::string describe() const;
};

// Stores error in outError when the caller asked for it. Always returns false
// so that call sites can write `return fail(outError, ...);`
inline bool fail(Error *outError, Error error) {
  if (outError) {
    *outError = std::move(error);
  }
  return false;
}

using ErrorList = std::vector<Error>;

// First error of a non-empty list, noting how many more there are
inline Error firstError(const ErrorList &errors) {
  Error first = errors.front();
  if (errors.size() > 1) {
    first.message += " (and " + std::to_string(errors.size() - 1) + " more)";
  }
  return first;
}

} // namespace resqx
