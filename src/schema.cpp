#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <resqx/schema.hpp>

namespace resqx {

using nlohmann::json;

namespace {

Error invalid(std::string_view field, std::string message) {
  Error error(ErrorCode::Validation, std::move(message));
  error.withField(fmt::format("fields.{}", field));
  return error;
}

bool inDomain(const FieldSpec &spec, double value) {
  return (!spec.minimum || value >= *spec.minimum) && (!spec.maximum || value <= *spec.maximum);
}

std::string domainString(const FieldSpec &spec) {
  return fmt::format("[{}, {}]", spec.minimum ? fmt::format("{}", *spec.minimum) : "-inf",
                     spec.maximum ? fmt::format("{}", *spec.maximum) : "+inf");
}

} // namespace

std::string_view toString(FieldType type) {
  switch (type) {
  case FieldType::String:
    return "string";
  case FieldType::Integer:
    return "integer";
  case FieldType::Real:
    return "real";
  case FieldType::Boolean:
    return "boolean";
  case FieldType::Enum:
    return "enum";
  case FieldType::RealList:
    return "real list";
  case FieldType::StringMap:
    return "string map";
  }
  return "unknown";
}

const FieldSpec *TypeSchema::field(std::string_view name) const {
  auto it = std::find_if(fields.begin(), fields.end(),
                         [&](const FieldSpec &spec) { return spec.name == name; });
  return it == fields.end() ? nullptr : &*it;
}

const ReferenceSpec *TypeSchema::reference(std::string_view name) const {
  auto it = std::find_if(references.begin(), references.end(),
                         [&](const ReferenceSpec &spec) { return spec.name == name; });
  return it == references.end() ? nullptr : &*it;
}

const ArraySpec *TypeSchema::array(std::string_view name) const {
  auto it = std::find_if(arrays.begin(), arrays.end(),
                         [&](const ArraySpec &spec) { return spec.name == name; });
  return it == arrays.end() ? nullptr : &*it;
}

ErrorList TypeSchema::validateFields(const json &values) const {
  ErrorList errors;
  if (!values.is_object()) {
    Error error(ErrorCode::Validation, "fields must be a JSON object");
    errors.push_back(error.withField("fields"));
    return errors;
  }

  for (const auto &[name, value] : values.items()) {
    if (!field(name)) {
      errors.push_back(invalid(name, fmt::format("unknown field for type {}", type)));
    }
  }

  for (const auto &spec : fields) {
    auto it = values.find(spec.name);
    if (it == values.end() || it->is_null()) {
      if (spec.required) {
        errors.push_back(invalid(spec.name, "required field missing"));
      }
      continue;
    }

    const json &value = *it;
    switch (spec.type) {
    case FieldType::String:
      if (!value.is_string()) {
        errors.push_back(invalid(spec.name, "expected a string"));
      }
      break;
    case FieldType::Integer:
      if (!value.is_number_integer()) {
        errors.push_back(invalid(spec.name, "expected an integer"));
      } else if (!inDomain(spec, value.get<double>())) {
        errors.push_back(invalid(spec.name, fmt::format("value {} outside {}", value.dump(),
                                                        domainString(spec))));
      }
      break;
    case FieldType::Real:
      if (!value.is_number()) {
        errors.push_back(invalid(spec.name, "expected a number"));
      } else if (!inDomain(spec, value.get<double>())) {
        errors.push_back(invalid(spec.name, fmt::format("value {} outside {}", value.dump(),
                                                        domainString(spec))));
      }
      break;
    case FieldType::Boolean:
      if (!value.is_boolean()) {
        errors.push_back(invalid(spec.name, "expected a boolean"));
      }
      break;
    case FieldType::Enum:
      if (!value.is_string() ||
          std::find(spec.enumValues.begin(), spec.enumValues.end(), value.get<std::string>()) ==
              spec.enumValues.end()) {
        errors.push_back(invalid(spec.name, fmt::format("expected one of {}",
                                                        fmt::join(spec.enumValues, ", "))));
      }
      break;
    case FieldType::RealList:
      if (!value.is_array() ||
          !std::all_of(value.begin(), value.end(), [](const json &v) { return v.is_number(); })) {
        errors.push_back(invalid(spec.name, "expected a list of numbers"));
      } else if (spec.length != 0 && value.size() != spec.length) {
        errors.push_back(invalid(spec.name, fmt::format("expected {} numbers, got {}",
                                                        spec.length, value.size())));
      }
      break;
    case FieldType::StringMap:
      if (!value.is_object() || !std::all_of(value.begin(), value.end(),
                                              [](const json &v) { return v.is_string(); })) {
        errors.push_back(invalid(spec.name, "expected an object of strings"));
      }
      break;
    }
  }
  return errors;
}

bool SchemaRegistry::add(TypeSchema schema, Error *outError) {
  if (schema.type.empty()) {
    return fail(outError, Error(ErrorCode::Validation, "Schema has no type name"));
  }
  // The type names the root element of the metadata document
  bool usable = std::isalpha(static_cast<unsigned char>(schema.type.front())) &&
                std::all_of(schema.type.begin(), schema.type.end(), [](char c) {
                  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
                });
  if (!usable) {
    return fail(outError, Error(ErrorCode::Validation,
                                fmt::format("Schema type name '{}' is not a valid identifier",
                                            schema.type)));
  }
  if (schemas_.contains(schema.type)) {
    return fail(outError, Error(ErrorCode::Validation,
                                fmt::format("Schema for type {} already registered", schema.type)));
  }
  std::string type = schema.type;
  schemas_.emplace(std::move(type), std::move(schema));
  return true;
}

const TypeSchema *SchemaRegistry::find(std::string_view type) const {
  auto it = schemas_.find(type);
  return it == schemas_.end() ? nullptr : &it->second;
}

std::vector<std::string> SchemaRegistry::types() const {
  std::vector<std::string> result;
  result.reserve(schemas_.size());
  for (const auto &[type, schema] : schemas_) {
    result.push_back(type);
  }
  return result;
}

} // namespace resqx
