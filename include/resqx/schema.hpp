#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "error.hpp"
#include "types.hpp"

namespace resqx {

struct Document;

enum class FieldType {
  String,
  Integer,
  Real,     // Any JSON number
  Boolean,
  Enum,     // String restricted to enumValues
  RealList, // Array of numbers, optionally of fixed length
  StringMap // Object with string values
};

std::string_view toString(FieldType type);

struct FieldSpec {
  std::string name;
  FieldType type = FieldType::String;
  bool required = true;
  std::vector<std::string> enumValues;
  std::optional<double> minimum; // Inclusive, Integer and Real only
  std::optional<double> maximum;
  size_t length = 0;             // RealList only; 0 = any length
};

struct ReferenceSpec {
  std::string name;
  bool required = true;
  std::vector<std::string> targetTypes; // Empty = any type
  size_t maxCount = 1;                  // 0 = unbounded
  bool acyclic = false;                 // Following this field must never return to the source
};

struct ArraySpec {
  std::string name;
  bool required = true;
  std::vector<Dtype> dtypes; // Empty = any dtype
};

// Declared fields, references and arrays of one object type
struct TypeSchema {
  std::string type;
  std::vector<FieldSpec> fields;
  std::vector<ReferenceSpec> references;
  std::vector<ArraySpec> arrays;

  // Rules the declared specs cannot express, run once the declared checks pass
  std::function<ErrorList(const Document &)> check;

  const FieldSpec *field(std::string_view name) const;
  const ReferenceSpec *reference(std::string_view name) const;
  const ArraySpec *array(std::string_view name) const;

  // Check the scalar fields of a document: no unknown names, required present,
  // value types and domains. Errors carry the field path.
  ErrorList validateFields(const nlohmann::json &fields) const;
};

// Type tag to schema; the metadata store consults it and knows nothing else about types
class SchemaRegistry {
public:
  // Fails with Validation on an empty or already registered type
  bool add(TypeSchema schema, Error *outError = nullptr);

  const TypeSchema *find(std::string_view type) const;

  bool contains(std::string_view type) const { return find(type) != nullptr; }

  std::vector<std::string> types() const;

  size_t size() const { return schemas_.size(); }

private:
  std::map<std::string, TypeSchema, std::less<>> schemas_;
};

} // namespace resqx
