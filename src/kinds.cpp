#include <charconv>

#include <fmt/format.h>

#include <resqx/kinds.hpp>
#include <resqx/log.hpp>

namespace resqx {

namespace {

FieldSpec realField(std::string name, bool required = true) {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = FieldType::Real;
  spec.required = required;
  return spec;
}

FieldSpec integerField(std::string name, std::optional<double> minimum, bool required = true) {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = FieldType::Integer;
  spec.required = required;
  spec.minimum = minimum;
  return spec;
}

FieldSpec stringField(std::string name, bool required = true) {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = FieldType::String;
  spec.required = required;
  return spec;
}

FieldSpec booleanField(std::string name, bool required = true) {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = FieldType::Boolean;
  spec.required = required;
  return spec;
}

FieldSpec enumField(std::string name, std::vector<std::string> values, bool required = true) {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = FieldType::Enum;
  spec.required = required;
  spec.enumValues = std::move(values);
  return spec;
}

ReferenceSpec referenceTo(std::string name, std::vector<std::string> targets,
                          bool required = true) {
  ReferenceSpec spec;
  spec.name = std::move(name);
  spec.targetTypes = std::move(targets);
  spec.required = required;
  return spec;
}

const std::vector<std::string> kLengthUnits = {"m", "ft"};

const std::vector<std::string> kIndexableElements = {"cells", "nodes",   "faces",    "edges",
                                                     "columns", "layers", "intervals"};

const std::vector<Dtype> kIntegerDtypes = {Dtype::Int8,  Dtype::Int16,  Dtype::Int32,
                                           Dtype::Int64, Dtype::UInt8,  Dtype::UInt16,
                                           Dtype::UInt32, Dtype::UInt64};

std::optional<int64_t> parseKey(std::string_view text) {
  int64_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

// Fields, references and arrays shared by every property kind
TypeSchema propertySchema(std::string_view kind) {
  TypeSchema schema;
  schema.type = std::string(kind);
  schema.fields = {stringField("keyword"), stringField("propertyKind"),
                   enumField("indexableElement", kIndexableElements),
                   integerField("count", 1.0)};
  schema.references = {
      referenceTo("supportingRepresentation",
                  {std::string(IjkGridRepresentation::kindName),
                   std::string(WellboreTrajectoryRepresentation::kindName)}),
      referenceTo("localPropertyKind", {std::string(PropertyKind::kindName)}, false)};
  schema.arrays = {ArraySpec{"values", true, {}}};
  return schema;
}

} // namespace

bool KindRegistry::add(TypeSchema schema, Factory factory, Error *outError) {
  std::string kind = schema.type;
  if (!factory) {
    return fail(outError, Error(ErrorCode::Validation,
                                fmt::format("Kind {} registered without a factory", kind)));
  }
  if (!schema.check) {
    schema.check = [factory](const Document &document) {
      auto object = factory();
      Error error;
      if (!object->load(document, &error)) {
        return ErrorList{error};
      }
      return object->validate();
    };
  }
  if (!schemas_.add(std::move(schema), outError)) {
    return false;
  }
  factories_.emplace(std::move(kind), std::move(factory));
  return true;
}

std::unique_ptr<Object> KindRegistry::make(std::string_view kind, Error *outError) const {
  auto it = factories_.find(kind);
  if (it == factories_.end()) {
    Error error(ErrorCode::Validation, fmt::format("Unknown object kind '{}'", kind));
    fail(outError, error.withField("type"));
    return nullptr;
  }
  return it->second();
}

const KindRegistry &KindRegistry::builtin() {
  static const KindRegistry registry = [] {
    std::vector<std::pair<TypeSchema, Factory>> builtins = {
        {LocalDepth3dCrs::schema(), [] { return std::make_unique<LocalDepth3dCrs>(); }},
        {IjkGridRepresentation::schema(),
         [] { return std::make_unique<IjkGridRepresentation>(); }},
        {PropertyKind::schema(), [] { return std::make_unique<PropertyKind>(); }},
        {StringTableLookup::schema(), [] { return std::make_unique<StringTableLookup>(); }},
        {Property::continuousSchema(),
         [] { return std::make_unique<Property>(Property::continuousKind); }},
        {Property::discreteSchema(),
         [] { return std::make_unique<Property>(Property::discreteKind); }},
        {Property::categoricalSchema(),
         [] { return std::make_unique<Property>(Property::categoricalKind); }},
        {WellboreFeature::schema(), [] { return std::make_unique<WellboreFeature>(); }},
        {WellboreInterpretation::schema(),
         [] { return std::make_unique<WellboreInterpretation>(); }},
        {MdDatum::schema(), [] { return std::make_unique<MdDatum>(); }},
        {WellboreTrajectoryRepresentation::schema(),
         [] { return std::make_unique<WellboreTrajectoryRepresentation>(); }}};

    KindRegistry kinds;
    for (auto &[schema, factory] : builtins) {
      Error error;
      if (!kinds.add(std::move(schema), std::move(factory), &error)) {
        logger()->error("Built-in kind not registered: {}", error.describe());
      }
    }
    return kinds;
  }();
  return registry;
}

// LocalDepth3dCrs

TypeSchema LocalDepth3dCrs::schema() {
  TypeSchema schema;
  schema.type = std::string(kindName);
  FieldSpec rotation = realField("rotation");
  rotation.minimum = 0.0;
  rotation.maximum = 360.0;
  schema.fields = {realField("xOffset"),
                   realField("yOffset"),
                   realField("zOffset"),
                   rotation,
                   enumField("xyUom", kLengthUnits),
                   enumField("zUom", kLengthUnits),
                   booleanField("zIncreasingDownward"),
                   integerField("epsgCode", 1.0, false)};
  return schema;
}

// IjkGridRepresentation

TypeSchema IjkGridRepresentation::schema() {
  TypeSchema schema;
  schema.type = std::string(kindName);

  FieldSpec origin;
  origin.name = "origin";
  origin.type = FieldType::RealList;
  origin.length = 3;

  schema.fields = {integerField("ni", 1.0), integerField("nj", 1.0), integerField("nk", 1.0),
                   origin};
  for (const char *name : {"dx", "dy", "dz"}) {
    FieldSpec size = realField(name);
    size.minimum = 0.0;
    schema.fields.push_back(size);
  }
  schema.references = {referenceTo("crs", {std::string(LocalDepth3dCrs::kindName)})};
  schema.arrays = {ArraySpec{"points", false, {Dtype::Float64}}};
  return schema;
}

uint64_t IjkGridRepresentation::cellCount() const {
  return static_cast<uint64_t>(ni()) * static_cast<uint64_t>(nj()) * static_cast<uint64_t>(nk());
}

Shape IjkGridRepresentation::pointsShape() const {
  return {static_cast<uint64_t>(nk() + 1), static_cast<uint64_t>(nj() + 1),
          static_cast<uint64_t>(ni() + 1), 3};
}

ErrorList IjkGridRepresentation::validate() const {
  ErrorList errors;
  auto points = array("points");
  if (points && points->shape != pointsShape()) {
    errors.push_back(invalid("arrays.points",
                             fmt::format("points have shape {}, grid needs {}",
                                         shapeString(points->shape), shapeString(pointsShape()))));
  }
  return errors;
}

// PropertyKind

TypeSchema PropertyKind::schema() {
  TypeSchema schema;
  schema.type = std::string(kindName);
  schema.fields = {booleanField("isAbstract"), stringField("parentKind", false)};
  ReferenceSpec parent = referenceTo("parentPropertyKind", {std::string(kindName)}, false);
  parent.acyclic = true;
  schema.references = {parent};
  return schema;
}

// StringTableLookup

TypeSchema StringTableLookup::schema() {
  TypeSchema schema;
  schema.type = std::string(kindName);
  FieldSpec entries;
  entries.name = "entries";
  entries.type = FieldType::StringMap;
  schema.fields = {entries};
  return schema;
}

std::map<int64_t, std::string> StringTableLookup::entries() const {
  std::map<int64_t, std::string> result;
  auto table = field<nlohmann::json>("entries");
  if (!table || !table->is_object()) {
    return result;
  }
  for (const auto &[key, value] : table->items()) {
    auto parsed = parseKey(key);
    if (parsed && value.is_string()) {
      result[*parsed] = value.get<std::string>();
    }
  }
  return result;
}

void StringTableLookup::setEntries(const std::map<int64_t, std::string> &entries) {
  nlohmann::json table = nlohmann::json::object();
  for (const auto &[key, value] : entries) {
    table[std::to_string(key)] = value;
  }
  setField("entries", std::move(table));
}

std::optional<std::string> StringTableLookup::lookup(int64_t key) const {
  auto table = entries();
  auto it = table.find(key);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

ErrorList StringTableLookup::validate() const {
  ErrorList errors;
  auto table = field<nlohmann::json>("entries");
  if (!table || !table->is_object()) {
    return errors;
  }
  for (const auto &[key, value] : table->items()) {
    if (!parseKey(key)) {
      errors.push_back(invalid(fmt::format("fields.entries.{}", key), "key is not an integer"));
    }
  }
  return errors;
}

// Property

TypeSchema Property::continuousSchema() {
  TypeSchema schema = propertySchema(continuousKind);
  schema.fields.push_back(stringField("uom"));
  schema.arrays = {ArraySpec{"values", true, {Dtype::Float32, Dtype::Float64}}};
  return schema;
}

TypeSchema Property::discreteSchema() {
  TypeSchema schema = propertySchema(discreteKind);
  schema.fields.push_back(integerField("nullValue", std::nullopt, false));
  schema.arrays = {ArraySpec{"values", true, kIntegerDtypes}};
  return schema;
}

TypeSchema Property::categoricalSchema() {
  TypeSchema schema = discreteSchema();
  schema.type = std::string(categoricalKind);
  schema.references.push_back(
      referenceTo("stringLookup", {std::string(StringTableLookup::kindName)}));
  return schema;
}

ErrorList Property::validate() const {
  ErrorList errors;
  auto values = array("values");
  if (values && count() > 1 && values->shape.back() != static_cast<uint64_t>(count())) {
    errors.push_back(invalid("arrays.values",
                             fmt::format("last dimension of values is {}, count is {}",
                                         values->shape.back(), count())));
  }
  return errors;
}

// WellboreFeature

TypeSchema WellboreFeature::schema() {
  TypeSchema schema;
  schema.type = std::string(kindName);
  return schema;
}

// WellboreInterpretation

TypeSchema WellboreInterpretation::schema() {
  TypeSchema schema;
  schema.type = std::string(kindName);
  schema.fields = {enumField("domain", {"depth", "time", "mixed"})};
  schema.references = {
      referenceTo("interpretedFeature", {std::string(WellboreFeature::kindName)})};
  return schema;
}

// MdDatum

TypeSchema MdDatum::schema() {
  TypeSchema schema;
  schema.type = std::string(kindName);
  schema.fields = {realField("x"), realField("y"), realField("z"),
                   enumField("mdReference",
                             {"ground level", "kelly bushing", "mean sea level", "derrick floor",
                              "casing flange", "arbitrary point", "crown valve", "rotary bushing",
                              "rotary table", "sea floor", "lowest astronomical tide",
                              "mean higher high water", "mean high water",
                              "mean lower low water", "mean low water", "mean tide level",
                              "kickoff point"})};
  schema.references = {referenceTo("crs", {std::string(LocalDepth3dCrs::kindName)})};
  return schema;
}

// WellboreTrajectoryRepresentation

TypeSchema WellboreTrajectoryRepresentation::schema() {
  TypeSchema schema;
  schema.type = std::string(kindName);
  schema.fields = {enumField("mdUom", kLengthUnits), realField("startMd"), realField("finishMd")};
  schema.references = {
      referenceTo("mdDatum", {std::string(MdDatum::kindName)}),
      referenceTo("crs", {std::string(LocalDepth3dCrs::kindName)}, false),
      referenceTo("interpretation", {std::string(WellboreInterpretation::kindName)}, false)};
  schema.arrays = {ArraySpec{"mds", true, {Dtype::Float64}},
                   ArraySpec{"controlPoints", true, {Dtype::Float64}}};
  return schema;
}

ErrorList WellboreTrajectoryRepresentation::validate() const {
  ErrorList errors;
  if (startMd() > finishMd()) {
    errors.push_back(invalid("fields.startMd", fmt::format("start md {} beyond finish md {}",
                                                           startMd(), finishMd())));
  }

  auto mds = array("mds");
  auto points = array("controlPoints");
  if (mds && mds->shape.size() != 1) {
    errors.push_back(invalid("arrays.mds", "measured depths must be one-dimensional"));
  } else if (mds && points && points->shape != Shape{mds->shape[0], 3}) {
    errors.push_back(invalid("arrays.controlPoints",
                             fmt::format("control points have shape {}, expected [{}, 3]",
                                         shapeString(points->shape), mds->shape[0])));
  }
  return errors;
}

} // namespace resqx
