#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "object.hpp"
#include "schema.hpp"

namespace resqx {

// Kind name to schema and factory. Adding a kind registers it here and never
// touches the catalog, stores or package.
class KindRegistry {
public:
  using Factory = std::function<std::unique_ptr<Object>()>;

  bool add(TypeSchema schema, Factory factory, Error *outError = nullptr);

  // Register a kind class exposing `static TypeSchema schema()`
  template <typename T> bool add(Error *outError = nullptr) {
    return add(T::schema(), [] { return std::make_unique<T>(); }, outError);
  }

  // Empty object of the given kind
  std::unique_ptr<Object> make(std::string_view kind, Error *outError = nullptr) const;

  bool contains(std::string_view kind) const { return factories_.contains(kind); }

  const SchemaRegistry &schemas() const { return schemas_; }

  // Registry of the built-in kinds, populated on first use
  static const KindRegistry &builtin();

private:
  SchemaRegistry schemas_;
  std::map<std::string, Factory, std::less<>> factories_;
};

// Local engineering coordinate reference system with depth axis
class LocalDepth3dCrs : public Object {
public:
  static constexpr std::string_view kindName = "LocalDepth3dCrs";
  static TypeSchema schema();

  LocalDepth3dCrs() : Object(std::string(kindName)) {}

  std::string xyUom() const { return field<std::string>("xyUom").value_or(""); }
  std::string zUom() const { return field<std::string>("zUom").value_or(""); }
  bool zIncreasingDownward() const { return field<bool>("zIncreasingDownward").value_or(true); }
};

// Regular IJK grid with optional explicit corner points
class IjkGridRepresentation : public Object {
public:
  static constexpr std::string_view kindName = "IjkGridRepresentation";
  static TypeSchema schema();

  IjkGridRepresentation() : Object(std::string(kindName)) {}

  int64_t ni() const { return field<int64_t>("ni").value_or(0); }
  int64_t nj() const { return field<int64_t>("nj").value_or(0); }
  int64_t nk() const { return field<int64_t>("nk").value_or(0); }
  uint64_t cellCount() const;

  std::optional<Oid> crs() const { return reference("crs"); }

  // Shape the points array must have: [nk + 1, nj + 1, ni + 1, 3]
  Shape pointsShape() const;

  ErrorList validate() const override;
};

class PropertyKind : public Object {
public:
  static constexpr std::string_view kindName = "PropertyKind";
  static TypeSchema schema();

  PropertyKind() : Object(std::string(kindName)) {}

  bool isAbstract() const { return field<bool>("isAbstract").value_or(false); }
  std::optional<Oid> parent() const { return reference("parentPropertyKind"); }
};

// Integer key to string table for categorical properties
class StringTableLookup : public Object {
public:
  static constexpr std::string_view kindName = "StringTableLookup";
  static TypeSchema schema();

  StringTableLookup() : Object(std::string(kindName)) {}

  std::map<int64_t, std::string> entries() const;
  void setEntries(const std::map<int64_t, std::string> &entries);

  std::optional<std::string> lookup(int64_t key) const;

  ErrorList validate() const override;
};

// Continuous, discrete and categorical properties share one class; the kind
// name picks the schema
class Property : public Object {
public:
  static constexpr std::string_view continuousKind = "ContinuousProperty";
  static constexpr std::string_view discreteKind = "DiscreteProperty";
  static constexpr std::string_view categoricalKind = "CategoricalProperty";

  static TypeSchema continuousSchema();
  static TypeSchema discreteSchema();
  static TypeSchema categoricalSchema();

  explicit Property(std::string_view kind) : Object(std::string(kind)) {}

  std::string keyword() const { return field<std::string>("keyword").value_or(""); }
  std::string indexableElement() const {
    return field<std::string>("indexableElement").value_or("");
  }
  int64_t count() const { return field<int64_t>("count").value_or(1); }

  std::optional<Oid> supportingRepresentation() const {
    return reference("supportingRepresentation");
  }

  bool isContinuous() const { return kind() == continuousKind; }
  bool isCategorical() const { return kind() == categoricalKind; }

  ErrorList validate() const override;
};

class WellboreFeature : public Object {
public:
  static constexpr std::string_view kindName = "WellboreFeature";
  static TypeSchema schema();

  WellboreFeature() : Object(std::string(kindName)) {}
};

class WellboreInterpretation : public Object {
public:
  static constexpr std::string_view kindName = "WellboreInterpretation";
  static TypeSchema schema();

  WellboreInterpretation() : Object(std::string(kindName)) {}

  std::optional<Oid> interpretedFeature() const { return reference("interpretedFeature"); }
};

// Measured depth datum of a wellbore
class MdDatum : public Object {
public:
  static constexpr std::string_view kindName = "MdDatum";
  static TypeSchema schema();

  MdDatum() : Object(std::string(kindName)) {}

  std::optional<Oid> crs() const { return reference("crs"); }
};

class WellboreTrajectoryRepresentation : public Object {
public:
  static constexpr std::string_view kindName = "WellboreTrajectoryRepresentation";
  static TypeSchema schema();

  WellboreTrajectoryRepresentation() : Object(std::string(kindName)) {}

  double startMd() const { return field<double>("startMd").value_or(0.0); }
  double finishMd() const { return field<double>("finishMd").value_or(0.0); }

  std::optional<Oid> mdDatum() const { return reference("mdDatum"); }

  ErrorList validate() const override;
};

} // namespace resqx
