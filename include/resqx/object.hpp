#pragma once

#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <nlohmann/json.hpp>

#include "document.hpp"
#include "error.hpp"
#include "oid.hpp"
#include "types.hpp"

namespace resqx {

// Common capability set of every typed object kind.
//
// An object wraps the metadata document it serializes to. Kinds add typed
// accessors and the checks their schema cannot express; the storage layers
// only ever see the Document.
class Object {
public:
  virtual ~Object() = default;

  const Oid &identifier() const { return document_.oid; }

  const std::string &kind() const { return document_.type; }

  const std::string &title() const { return document_.citation.title; }
  void setTitle(std::string title) { document_.citation.title = std::move(title); }

  const Citation &citation() const { return document_.citation; }

  uint64_t revision() const { return document_.revision; }

  // Checks specific to the kind, beyond what its schema expresses
  virtual ErrorList validate() const { return {}; }

  // Metadata document of the object
  virtual Document serialize() const { return document_; }

  std::vector<Oid> referencedObjects() const { return document_.referencedOids(); }

  std::vector<ArrayHandle> referencedArrays() const;

  // Replace the object state with a stored document of the same kind
  bool load(Document document, Error *outError = nullptr);

  const nlohmann::json &fields() const { return document_.fields; }

  void setField(const std::string &name, nlohmann::json value);

  void clearField(const std::string &name);

  // Typed field value; empty when absent or of another JSON type
  template <typename T> std::optional<T> field(const std::string &name) const {
    auto it = document_.fields.find(name);
    if (it == document_.fields.end()) {
      return std::nullopt;
    }
    if constexpr (std::is_same_v<T, bool>) {
      if (!it->is_boolean()) {
        return std::nullopt;
      }
    } else if constexpr (std::is_integral_v<T>) {
      if (!it->is_number_integer()) {
        return std::nullopt;
      }
    } else if constexpr (std::is_floating_point_v<T>) {
      if (!it->is_number()) {
        return std::nullopt;
      }
    } else if constexpr (std::is_same_v<T, std::string>) {
      if (!it->is_string()) {
        return std::nullopt;
      }
    } else {
      static_assert(std::is_same_v<T, nlohmann::json>, "unsupported field type");
    }
    return it->get<T>();
  }

  // First target of a reference field
  std::optional<Oid> reference(const std::string &name) const;

  std::vector<Oid> references(const std::string &name) const;

  void setReference(const std::string &name, const Oid &target);

  void setReferences(const std::string &name, std::vector<Oid> targets);

  void clearReference(const std::string &name);

  std::optional<ArrayHandle> array(const std::string &name) const;

  // Declare an array; the payload itself lives in the array store
  void setArrayHandle(ArrayHandle handle);

  const std::map<std::string, std::string> &extraMetadata() const {
    return document_.extraMetadata;
  }

  void setExtraMetadata(const std::string &key, std::string value);

protected:
  explicit Object(std::string kind);

  // Validation error for a field path of this object
  Error invalid(std::string field, std::string message) const;

  Document document_;
};

} // namespace resqx
