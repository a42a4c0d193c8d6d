#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <resqx/package.hpp>
#include <resqx/reader.hpp>
#include <resqx/writer.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

resqx::SchemaRegistry gridSchemas() {
  resqx::SchemaRegistry schemas;

  resqx::TypeSchema grid;
  grid.type = "Grid";
  grid.fields = {{.name = "ni", .type = resqx::FieldType::Integer}};
  grid.arrays = {resqx::ArraySpec{"points", false, {resqx::Dtype::Float64}}};
  EXPECT_TRUE(schemas.add(grid));

  resqx::TypeSchema property;
  property.type = "Property";
  property.fields = {{.name = "uom", .type = resqx::FieldType::String, .required = false}};
  property.references = {resqx::ReferenceSpec{.name = "grid", .targetTypes = {"Grid"}}};
  property.arrays = {resqx::ArraySpec{"values", true, {}}};
  EXPECT_TRUE(schemas.add(property));
  return schemas;
}

resqx::Document gridDocument(const std::string &title, int64_t ni = 2) {
  resqx::Document document;
  document.type = "Grid";
  document.citation.title = title;
  document.fields = json{{"ni", ni}};
  return document;
}

resqx::Document propertyDocument(const resqx::Oid &grid, const std::string &title = "Porosity") {
  resqx::Document document;
  document.type = "Property";
  document.citation.title = title;
  document.fields = json{{"uom", "m3/m3"}};
  document.references["grid"] = {grid};
  return document;
}

resqx::ArrayData points() {
  return resqx::ArrayData::from<double>({2, 3}, std::vector<double>{0, 1, 2, 3, 4, 5});
}

resqx::ArrayData porosity() {
  return resqx::ArrayData::from<float>({4}, std::vector<float>{0.1f, 0.2f, 0.25f, 0.3f});
}

} // namespace

class PackageTest : public ::testing::Test {
protected:
  void SetUp() override {
    // One directory per test, so that tests may run in parallel
    tempDir_ = fs::temp_directory_path() /
               (std::string("resqx_test_package_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(tempDir_);
    package_ = resqx::Package::create({}, gridSchemas());
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  resqx::Oid addGrid(const std::string &title = "Grid A") {
    resqx::Error error;
    auto oid = package_.addPart(gridDocument(title), {{"points", points()}}, &error);
    EXPECT_TRUE(oid.has_value()) << error.describe();
    return oid.value_or(resqx::Oid{});
  }

  resqx::Oid addProperty(const resqx::Oid &grid) {
    resqx::Error error;
    auto oid = package_.addPart(propertyDocument(grid), {{"values", porosity()}}, &error);
    EXPECT_TRUE(oid.has_value()) << error.describe();
    return oid.value_or(resqx::Oid{});
  }

  std::optional<resqx::Package> reopen(const fs::path &path, resqx::LoadReport *report = nullptr,
                                       resqx::PackageOptions options = {}) {
    resqx::Error error;
    auto package = resqx::Package::open(path, options, gridSchemas(), report, &error);
    EXPECT_TRUE(package.has_value()) << error.describe();
    return package;
  }

  static std::vector<uint8_t> readFile(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), {});
  }

  fs::path tempDir_;
  resqx::Package package_;
};

TEST_F(PackageTest, SaveAndReopen) {
  resqx::Oid grid = addGrid();
  resqx::Oid property = addProperty(grid);

  resqx::PackageProperties properties;
  properties.creator = "resqx tests";
  properties.title = "Round trip";
  package_.setProperties(properties);

  fs::path path = tempDir_ / "model.epc";
  resqx::Error error;
  ASSERT_TRUE(package_.save(path, &error)) << error.describe();
  EXPECT_EQ(package_.path(), path);

  resqx::LoadReport report;
  auto loaded = reopen(path, &report);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(report.clean());
  EXPECT_EQ(report.objectCount, 2);
  EXPECT_EQ(report.arrayCount, 2);
  EXPECT_EQ(report.partCount, 9);
  EXPECT_EQ(loaded->size(), 2);
  EXPECT_EQ(loaded->properties(), properties);

  auto document = loaded->document(property, &error);
  ASSERT_TRUE(document.has_value()) << error.describe();
  EXPECT_EQ(document->citation.title, "Porosity");
  EXPECT_EQ(document->fields["uom"], "m3/m3");
  EXPECT_EQ(document->references.at("grid"), std::vector<resqx::Oid>{grid});
  EXPECT_EQ(loaded->catalog().referencing(grid), std::set<resqx::Oid>{property});

  // Arrays stay in the container until asked for
  EXPECT_EQ(loaded->arrays().stats().payloadReads, 0);
  auto values = loaded->getArray(property, "values", &error);
  ASSERT_NE(values, nullptr) << error.describe();
  EXPECT_EQ(*values, porosity());
  EXPECT_EQ(loaded->arrays().stats().payloadReads, 1);

  auto gridPoints = loaded->getArray(grid, "points", &error);
  ASSERT_NE(gridPoints, nullptr) << error.describe();
  EXPECT_EQ(*gridPoints, points());
}

// Saved containers are OPC zip archives: content types, package relationships,
// core properties, one XML part per object with its relationships, stored arrays
TEST_F(PackageTest, SavedContainerLayout) {
  resqx::Oid grid = addGrid();
  resqx::Oid property = addProperty(grid);
  fs::path path = tempDir_ / "layout.epc";
  resqx::Error error;
  ASSERT_TRUE(package_.save(path, &error)) << error.describe();

  auto reader = resqx::ContainerReader::open(path, &error);
  ASSERT_TRUE(reader.has_value()) << error.describe();
  EXPECT_EQ(reader->parts().front().name, resqx::kContentTypesPart);

  const auto *typesPart = reader->findPart(resqx::kContentTypesPart);
  ASSERT_NE(typesPart, nullptr);
  auto typesBytes = reader->extractToMemory(*typesPart, &error);
  ASSERT_TRUE(typesBytes.has_value()) << error.describe();
  auto contentTypes = resqx::ContentTypes::decode(*typesBytes, &error);
  ASSERT_TRUE(contentTypes.has_value()) << error.describe();

  std::string gridPart = *package_.partName(grid);
  std::string propertyPart = *package_.partName(property);
  EXPECT_EQ(contentTypes->classify(gridPart), resqx::PartKind::Metadata);
  EXPECT_EQ(contentTypes->lookup(propertyPart), resqx::objectContentType("Property"));
  EXPECT_EQ(contentTypes->classify(resqx::kPropertiesPart), resqx::PartKind::Properties);
  EXPECT_EQ(contentTypes->classify(resqx::kRelationshipsPart), resqx::PartKind::Relationships);

  const auto *metadata = reader->findPart(propertyPart);
  ASSERT_NE(metadata, nullptr);
  EXPECT_EQ(metadata->method, resqx::ZipMethod::Deflate);

  std::string arrayPath = package_.document(property)->arrays.at("values").path;
  const auto *array = reader->findPart(arrayPath);
  ASSERT_NE(array, nullptr);
  EXPECT_EQ(array->method, resqx::ZipMethod::Stored);
  EXPECT_EQ(contentTypes->classify(arrayPath), resqx::PartKind::Array);

  const auto *relsPart = reader->findPart(resqx::relationshipsPartName(propertyPart));
  ASSERT_NE(relsPart, nullptr);
  auto relsBytes = reader->extractToMemory(*relsPart, &error);
  ASSERT_TRUE(relsBytes.has_value()) << error.describe();
  auto relationships = resqx::decodeRelationships(*relsBytes, &error);
  ASSERT_TRUE(relationships.has_value()) << error.describe();
  ASSERT_EQ(relationships->size(), 1);
  EXPECT_EQ(relationships->front().type, resqx::kDestinationObjectRelationship);
  EXPECT_EQ(resqx::resolveTarget(propertyPart, relationships->front().target), gridPart);

  auto packageRels = reader->findPart(resqx::kRelationshipsPart);
  ASSERT_NE(packageRels, nullptr);
  relsBytes = reader->extractToMemory(*packageRels, &error);
  ASSERT_TRUE(relsBytes.has_value()) << error.describe();
  relationships = resqx::decodeRelationships(*relsBytes, &error);
  ASSERT_TRUE(relationships.has_value()) << error.describe();
  ASSERT_EQ(relationships->size(), 1);
  EXPECT_EQ(relationships->front().type, resqx::kCorePropertiesRelationship);
  EXPECT_EQ(resqx::resolveTarget({}, relationships->front().target), resqx::kPropertiesPart);
}

// A removal that would leave a reference behind is refused and names the referrer
TEST_F(PackageTest, StrictRemovalAfterReload) {
  resqx::Oid grid = addGrid();
  resqx::Oid property = addProperty(grid);
  fs::path path = tempDir_ / "strict.epc";
  ASSERT_TRUE(package_.save(path));

  auto loaded = reopen(path);
  ASSERT_TRUE(loaded.has_value());

  resqx::Error error;
  EXPECT_FALSE(loaded->removePart(grid, resqx::RemoveMode::Strict, nullptr, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::DanglingReference);
  EXPECT_EQ(error.part, loaded->partName(property));
  EXPECT_TRUE(loaded->document(grid).has_value());

  ASSERT_TRUE(loaded->removePart(property, resqx::RemoveMode::Strict, nullptr, &error))
      << error.describe();
  ASSERT_TRUE(loaded->removePart(grid, resqx::RemoveMode::Strict, nullptr, &error))
      << error.describe();
  EXPECT_EQ(loaded->size(), 0);
  EXPECT_EQ(loaded->arrays().size(), 0);
}

// Cascade removal leaves the referrer invalid, and an invalid package cannot be saved
TEST_F(PackageTest, CascadeRemovalBlocksSave) {
  resqx::Oid grid = addGrid();
  resqx::Oid property = addProperty(grid);

  resqx::RemovalReport report;
  resqx::Error error;
  ASSERT_TRUE(package_.removePart(grid, resqx::RemoveMode::Cascade, &report, &error))
      << error.describe();
  EXPECT_EQ(report.invalidated, std::vector<resqx::Oid>{property});
  EXPECT_FALSE(package_.catalog().resolve(property)->valid);

  EXPECT_FALSE(package_.validate().empty());
  EXPECT_FALSE(package_.save(tempDir_ / "cascade.epc", &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::DanglingReference);
  EXPECT_EQ(error.oid, property.str());
  EXPECT_FALSE(fs::exists(tempDir_ / "cascade.epc"));

  // Removing the invalid object as well makes the package saveable again
  ASSERT_TRUE(package_.removePart(property, resqx::RemoveMode::Strict));
  EXPECT_TRUE(package_.addPart(gridDocument("Replacement")).has_value());
  EXPECT_TRUE(package_.save(tempDir_ / "cascade.epc", &error)) << error.describe();
}

// An interrupted save leaves the previous container untouched
TEST_F(PackageTest, InterruptedSaveIsAtomic) {
  addGrid();
  fs::path path = tempDir_ / "atomic.epc";
  ASSERT_TRUE(package_.save(path));
  std::vector<uint8_t> before = readFile(path);

  addGrid("Grid B");
  package_.setProgressHook([](const resqx::PartEntry &, size_t index) { return index < 2; });

  resqx::Error error;
  EXPECT_FALSE(package_.save(&error));
  EXPECT_EQ(error.code, resqx::ErrorCode::Io);
  EXPECT_EQ(readFile(path), before);

  auto previous = reopen(path);
  ASSERT_TRUE(previous.has_value());
  EXPECT_EQ(previous->size(), 1);

  package_.setProgressHook({});
  ASSERT_TRUE(package_.save(&error)) << error.describe();
  auto current = reopen(path);
  ASSERT_TRUE(current.has_value());
  EXPECT_EQ(current->size(), 2);
}

TEST_F(PackageTest, SaveWithoutPath) {
  addGrid();
  resqx::Error error;
  EXPECT_FALSE(package_.save(&error));
  EXPECT_EQ(error.code, resqx::ErrorCode::Validation);
}

// Saving twice to the same path rewrites the container that backs the arrays
TEST_F(PackageTest, ResaveOverOwnContainer) {
  resqx::Oid grid = addGrid();
  fs::path path = tempDir_ / "resave.epc";
  ASSERT_TRUE(package_.save(path));

  auto loaded = reopen(path);
  ASSERT_TRUE(loaded.has_value());

  resqx::Error error;
  auto property = loaded->addPart(propertyDocument(grid), {{"values", porosity()}}, &error);
  ASSERT_TRUE(property.has_value()) << error.describe();
  ASSERT_TRUE(loaded->save(&error)) << error.describe();

  auto gridPoints = loaded->getArray(grid, "points", &error);
  ASSERT_NE(gridPoints, nullptr) << error.describe();
  EXPECT_EQ(*gridPoints, points());

  auto again = reopen(path);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->size(), 2);
  auto values = again->getArray(*property, "values", &error);
  ASSERT_NE(values, nullptr) << error.describe();
  EXPECT_EQ(*values, porosity());
}

TEST_F(PackageTest, AddPartFailuresLeaveNoTrace) {
  resqx::Oid grid = addGrid();
  size_t arrayCount = package_.arrays().size();

  // Required array missing
  resqx::Error error;
  EXPECT_FALSE(package_.addPart(propertyDocument(grid), {}, &error).has_value());
  EXPECT_EQ(error.field, "arrays.values");

  // Array written, then the document fails validation
  EXPECT_FALSE(package_.addPart(propertyDocument(resqx::Oid::generate()),
                                {{"values", porosity()}}, &error)
                   .has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::DanglingReference);
  EXPECT_EQ(package_.arrays().size(), arrayCount);

  resqx::Document duplicate = gridDocument("Duplicate");
  duplicate.oid = grid;
  EXPECT_FALSE(package_.addPart(duplicate, {}, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Validation);
  EXPECT_EQ(package_.size(), 1);
}

TEST_F(PackageTest, UpdateAndSetArray) {
  resqx::Oid grid = addGrid();
  resqx::Oid property = addProperty(grid);

  auto document = package_.document(property);
  ASSERT_TRUE(document.has_value());
  auto stale = *document;
  document->fields["uom"] = "percent";

  resqx::Error error;
  ASSERT_TRUE(package_.updatePart(*document, &error)) << error.describe();
  EXPECT_EQ(document->citation.version, 2);

  stale.fields["uom"] = "fraction";
  EXPECT_FALSE(package_.updatePart(stale, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::ConcurrentModification);
  EXPECT_EQ(package_.document(property)->fields["uom"], "percent");

  // Same shape and dtype overwrite in place
  auto updated = resqx::ArrayData::from<float>({4}, std::vector<float>{1, 2, 3, 4});
  ASSERT_TRUE(package_.setArray(property, "values", updated, &error)) << error.describe();
  EXPECT_EQ(*package_.getArray(property, "values"), updated);

  auto wrongShape = resqx::ArrayData::from<float>({2}, std::vector<float>{1, 2});
  EXPECT_FALSE(package_.setArray(property, "values", wrongShape, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::ShapeMismatch);
  EXPECT_EQ(*package_.getArray(property, "values"), updated);

  EXPECT_EQ(package_.getArray(property, "missing", &error), nullptr);
  EXPECT_EQ(error.code, resqx::ErrorCode::NotFound);
}

TEST_F(PackageTest, RenamePart) {
  resqx::Oid grid = addGrid();

  resqx::Error error;
  ASSERT_TRUE(package_.renamePart(grid, "grids/main.xml", &error)) << error.describe();
  EXPECT_EQ(package_.partName(grid), "grids/main.xml");

  for (const char *reserved : {"arrays/main.xml", "_rels/main.xml", "DocProps/main.xml",
                               "grids/_rels/main.xml", "[content_types].xml"}) {
    EXPECT_FALSE(package_.renamePart(grid, reserved, &error)) << reserved;
    EXPECT_EQ(error.code, resqx::ErrorCode::Validation);
  }

  fs::path path = tempDir_ / "renamed.epc";
  ASSERT_TRUE(package_.save(path, &error)) << error.describe();
  auto loaded = reopen(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->partName(grid), "grids/main.xml");
}

TEST_F(PackageTest, PartQueries) {
  resqx::Oid north = addGrid("North Block");
  resqx::Oid south = addGrid("South Block");
  resqx::Oid fault = addGrid("north fault zone");
  resqx::Oid property = addProperty(north);

  EXPECT_EQ(package_.oids(), (std::vector<resqx::Oid>{north, south, fault, property}));
  EXPECT_EQ(package_.oids("Grid", "north block"), std::vector<resqx::Oid>{north});
  EXPECT_EQ(package_.oids("Grid", "NORTH", resqx::TitleMode::StartsWith),
            (std::vector<resqx::Oid>{north, fault}));
  EXPECT_EQ(package_.oids({}, "block", resqx::TitleMode::EndsWith),
            (std::vector<resqx::Oid>{north, south}));
  EXPECT_EQ(package_.oids("Property"), std::vector<resqx::Oid>{property});
  EXPECT_TRUE(package_.oids("Horizon").empty());

  auto parts = package_.parts("Grid");
  ASSERT_EQ(parts.size(), 3);
  EXPECT_EQ(parts[1], *package_.partName(south));
  EXPECT_FALSE(package_.partName(resqx::Oid::generate()).has_value());
}

TEST_F(PackageTest, ReferenceGraph) {
  resqx::Oid grid = addGrid();
  resqx::Oid property = addProperty(grid);
  resqx::Oid isolated = addGrid("Isolated");

  auto graph = package_.graph();
  ASSERT_EQ(graph.nodes.size(), 3);
  EXPECT_EQ(graph.nodes[property].type, "Property");
  EXPECT_EQ(graph.nodes[isolated].title, "Isolated");
  ASSERT_EQ(graph.edges.size(), 1);
  EXPECT_EQ(*graph.edges.begin(), (std::pair<resqx::Oid, resqx::Oid>(std::minmax(grid, property))));

  std::set<resqx::Oid> subset{grid, isolated};
  auto partial = package_.graph(&subset);
  EXPECT_EQ(partial.nodes.size(), 2);
  EXPECT_TRUE(partial.edges.empty());
}

TEST_F(PackageTest, CopyAllParts) {
  resqx::Oid grid = addGrid();
  resqx::Oid property = addProperty(grid);

  resqx::Package target = resqx::Package::create({}, gridSchemas());
  std::map<resqx::Oid, resqx::Oid> mapping;
  resqx::Error error;
  ASSERT_TRUE(target.copyAllPartsFrom(package_, false, &mapping, &error)) << error.describe();

  EXPECT_EQ(target.size(), 2);
  EXPECT_EQ(mapping.at(grid), grid);
  EXPECT_EQ(mapping.at(property), property);
  EXPECT_EQ(target.catalog().referencing(grid), std::set<resqx::Oid>{property});
  EXPECT_EQ(*target.getArray(property, "values"), porosity());

  // Arrays are copied, not shared
  EXPECT_NE(target.document(grid)->arrays.at("points").path,
            package_.document(grid)->arrays.at("points").path);

  // Copying the same objects again adds nothing
  ASSERT_TRUE(target.copyAllPartsFrom(package_, false, nullptr, &error)) << error.describe();
  EXPECT_EQ(target.size(), 2);

  EXPECT_FALSE(target.copyAllPartsFrom(target, false, nullptr, &error));
}

// Equivalent objects are merged and references to them redirected
TEST_F(PackageTest, CopyAllPartsConsolidates) {
  resqx::Oid grid = addGrid("Local grid");

  resqx::Package other = resqx::Package::create({}, gridSchemas());
  auto otherGrid = other.addPart(gridDocument("Imported grid"), {{"points", points()}});
  ASSERT_TRUE(otherGrid.has_value());
  auto otherProperty =
      other.addPart(propertyDocument(*otherGrid), {{"values", porosity()}});
  ASSERT_TRUE(otherProperty.has_value());
  auto different = other.addPart(gridDocument("Different", 7), {{"points", points()}});
  ASSERT_TRUE(different.has_value());

  std::map<resqx::Oid, resqx::Oid> mapping;
  resqx::Error error;
  ASSERT_TRUE(package_.copyAllPartsFrom(other, true, &mapping, &error)) << error.describe();

  EXPECT_EQ(mapping.at(*otherGrid), grid);
  EXPECT_EQ(mapping.at(*otherProperty), *otherProperty);
  EXPECT_EQ(mapping.at(*different), *different);
  EXPECT_EQ(package_.size(), 3);
  EXPECT_FALSE(package_.document(*otherGrid).has_value());
  EXPECT_EQ(package_.document(*otherProperty)->references.at("grid"),
            std::vector<resqx::Oid>{grid});
  EXPECT_TRUE(package_.validate().empty());
}

TEST_F(PackageTest, OpenMissingFile) {
  resqx::Error error;
  EXPECT_FALSE(resqx::Package::open(tempDir_ / "absent.epc", {}, gridSchemas(), nullptr, &error)
                   .has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Io);
}

// Containers written by hand to exercise the load diagnostics
class PackageLoadTest : public PackageTest {
protected:
  void SetUp() override {
    PackageTest::SetUp();
    grid_ = gridDocument("Grid A");
    grid_.oid = resqx::Oid::generate();
    property_ = propertyDocument(resqx::Oid::generate());
    property_.oid = resqx::Oid::generate();
  }

  // Content types and metadata parts, each document under its default part name
  static void addDocuments(resqx::ContainerWriter &writer,
                           const std::vector<resqx::Document> &documents) {
    resqx::ContentTypes contentTypes;
    contentTypes.addDefault("rels", resqx::kRelationshipsContentType);
    contentTypes.addDefault("bin", resqx::kArrayContentType);
    for (const auto &document : documents) {
      contentTypes.addOverride(document.defaultPartName(),
                               resqx::objectContentType(document.type));
    }
    EXPECT_TRUE(writer.addPart(resqx::kContentTypesPart, resqx::ZipMethod::Deflate,
                               contentTypes.encode()));
    for (const auto &document : documents) {
      EXPECT_TRUE(writer.addPart(document.defaultPartName(), resqx::ZipMethod::Deflate,
                                 document.encode()));
    }
  }

  // Relationships of document towards the other documents, in both directions
  static std::vector<resqx::Relationship>
  relationshipsOf(const resqx::Document &document, const std::vector<resqx::Document> &documents) {
    std::vector<resqx::Relationship> relationships;
    for (const auto &other : documents) {
      if (other.oid == document.oid) {
        continue;
      }
      auto refers = [](const resqx::Document &from, const resqx::Oid &to) {
        auto oids = from.referencedOids();
        return std::find(oids.begin(), oids.end(), to) != oids.end();
      };
      std::string target =
          resqx::relativeTarget(document.defaultPartName(), other.defaultPartName());
      if (refers(document, other.oid)) {
        relationships.push_back({"d" + other.oid.str(),
                                 std::string(resqx::kDestinationObjectRelationship), target});
      }
      if (refers(other, document.oid)) {
        relationships.push_back(
            {"s" + other.oid.str(), std::string(resqx::kSourceObjectRelationship), target});
      }
    }
    return relationships;
  }

  fs::path writeContainer(const std::vector<resqx::Document> &documents,
                          bool withRelationships = true) {
    resqx::ContainerWriter writer;
    addDocuments(writer, documents);
    if (withRelationships) {
      for (const auto &document : documents) {
        auto relationships = relationshipsOf(document, documents);
        if (!relationships.empty()) {
          EXPECT_TRUE(writer.addPart(resqx::relationshipsPartName(document.defaultPartName()),
                                     resqx::ZipMethod::Deflate,
                                     resqx::encodeRelationships(relationships)));
        }
      }
    }
    fs::path path = tempDir_ / "handmade.epc";
    resqx::Error error;
    EXPECT_TRUE(writer.write(path, &error)) << error.describe();
    return path;
  }

  static bool hasCorruptionAt(const resqx::LoadReport &report, const std::string &part) {
    return std::any_of(report.diagnostics.begin(), report.diagnostics.end(),
                       [&](const resqx::Error &diagnostic) {
                         return diagnostic.code == resqx::ErrorCode::Corruption &&
                                diagnostic.part == part;
                       });
  }

  resqx::Document grid_;
  resqx::Document property_;
};

// Relationship parts written alongside each object are accepted as is
TEST_F(PackageLoadTest, ConsistentRelationshipsLoadClean) {
  property_.references["grid"] = {grid_.oid};
  resqx::PackageOptions options;
  options.strictLoad = false;
  resqx::LoadReport report;
  auto package = reopen(writeContainer({grid_, property_}), &report, options);
  ASSERT_TRUE(package.has_value());

  // Only the missing required array of the property is reported
  ASSERT_EQ(report.diagnostics.size(), 1);
  EXPECT_EQ(report.diagnostics.front().field, "arrays.values");
  EXPECT_EQ(package->catalog().referencing(grid_.oid), std::set<resqx::Oid>{property_.oid});
}

TEST_F(PackageLoadTest, DanglingReferenceFailsStrictLoad) {
  fs::path path = writeContainer({grid_, property_});

  resqx::LoadReport report;
  resqx::Error error;
  EXPECT_FALSE(resqx::Package::open(path, {}, gridSchemas(), &report, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::DanglingReference);
  EXPECT_EQ(error.part, property_.defaultPartName());
  EXPECT_EQ(error.oid, property_.oid.str());
  EXPECT_FALSE(report.clean());
}

// Without strict loading the offending object is flagged invalid and the rest is usable
TEST_F(PackageLoadTest, SalvageFlagsInvalidObjects) {
  fs::path path = writeContainer({grid_, property_});

  resqx::PackageOptions options;
  options.strictLoad = false;
  resqx::LoadReport report;
  auto package = reopen(path, &report, options);
  ASSERT_TRUE(package.has_value());

  EXPECT_EQ(report.invalidated, std::vector<resqx::Oid>{property_.oid});
  EXPECT_FALSE(report.clean());
  for (const auto &diagnostic : report.diagnostics) {
    EXPECT_EQ(diagnostic.part, property_.defaultPartName()) << diagnostic.describe();
  }
  EXPECT_FALSE(package->catalog().resolve(property_.oid)->valid);
  EXPECT_TRUE(package->catalog().resolve(grid_.oid)->valid);
  EXPECT_TRUE(package->document(grid_.oid).has_value());

  resqx::Error error;
  EXPECT_FALSE(package->save(tempDir_ / "salvaged.epc", &error));
}

TEST_F(PackageLoadTest, MissingContentTypes) {
  resqx::ContainerWriter writer;
  ASSERT_TRUE(writer.addPart(grid_.defaultPartName(), resqx::ZipMethod::Deflate, grid_.encode()));
  fs::path path = tempDir_ / "notypes.epc";
  ASSERT_TRUE(writer.write(path));

  resqx::PackageOptions options;
  options.strictLoad = false;
  resqx::Error error;
  EXPECT_FALSE(resqx::Package::open(path, options, gridSchemas(), nullptr, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
  EXPECT_EQ(error.part, resqx::kContentTypesPart);
}

// The content type of a metadata part must name the type its document holds
TEST_F(PackageLoadTest, ContentTypeMismatch) {
  resqx::ContainerWriter writer;
  resqx::ContentTypes contentTypes;
  contentTypes.addOverride(grid_.defaultPartName(), resqx::objectContentType("Property"));
  ASSERT_TRUE(writer.addPart(resqx::kContentTypesPart, resqx::ZipMethod::Deflate,
                             contentTypes.encode()));
  ASSERT_TRUE(writer.addPart(grid_.defaultPartName(), resqx::ZipMethod::Deflate, grid_.encode()));
  fs::path path = tempDir_ / "mismatch.epc";
  ASSERT_TRUE(writer.write(path));

  resqx::Error error;
  EXPECT_FALSE(resqx::Package::open(path, {}, gridSchemas(), nullptr, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
  EXPECT_EQ(error.part, grid_.defaultPartName());
}

TEST_F(PackageLoadTest, MissingRelationshipsPart) {
  property_.references["grid"] = {grid_.oid};
  fs::path path = writeContainer({grid_, property_}, false);

  resqx::PackageOptions options;
  options.strictLoad = false;
  resqx::LoadReport report;
  auto package = reopen(path, &report, options);
  ASSERT_TRUE(package.has_value());

  EXPECT_TRUE(hasCorruptionAt(report, resqx::relationshipsPartName(property_.defaultPartName())));
  EXPECT_TRUE(hasCorruptionAt(report, resqx::relationshipsPartName(grid_.defaultPartName())));
}

TEST_F(PackageLoadTest, MismatchedRelationshipsPart) {
  property_.references["grid"] = {grid_.oid};
  std::vector<resqx::Document> documents{grid_, property_};
  resqx::ContainerWriter writer;
  addDocuments(writer, documents);
  // The grid lists its referrer, the property omits its target
  ASSERT_TRUE(writer.addPart(resqx::relationshipsPartName(grid_.defaultPartName()),
                             resqx::ZipMethod::Deflate,
                             resqx::encodeRelationships(relationshipsOf(grid_, documents))));
  ASSERT_TRUE(writer.addPart(resqx::relationshipsPartName(property_.defaultPartName()),
                             resqx::ZipMethod::Deflate, resqx::encodeRelationships({})));
  fs::path path = tempDir_ / "mismatch.epc";
  ASSERT_TRUE(writer.write(path));

  resqx::PackageOptions options;
  options.strictLoad = false;
  resqx::LoadReport report;
  auto package = reopen(path, &report, options);
  ASSERT_TRUE(package.has_value());

  EXPECT_TRUE(hasCorruptionAt(report, resqx::relationshipsPartName(property_.defaultPartName())));
  EXPECT_FALSE(hasCorruptionAt(report, resqx::relationshipsPartName(grid_.defaultPartName())));
}

TEST_F(PackageLoadTest, DuplicateOid) {
  resqx::Document copy = grid_;
  copy.citation.title = "Copy";
  resqx::ContainerWriter writer;
  resqx::ContentTypes contentTypes;
  contentTypes.addOverride("first.xml", resqx::objectContentType("Grid"));
  contentTypes.addOverride("second.xml", resqx::objectContentType("Grid"));
  ASSERT_TRUE(writer.addPart(resqx::kContentTypesPart, resqx::ZipMethod::Deflate,
                             contentTypes.encode()));
  ASSERT_TRUE(writer.addPart("first.xml", resqx::ZipMethod::Deflate, grid_.encode()));
  ASSERT_TRUE(writer.addPart("second.xml", resqx::ZipMethod::Deflate, copy.encode()));
  fs::path path = tempDir_ / "duplicate.epc";
  ASSERT_TRUE(writer.write(path));

  resqx::Error error;
  EXPECT_FALSE(resqx::Package::open(path, {}, gridSchemas(), nullptr, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Validation);
  EXPECT_EQ(error.part, "second.xml");
}

TEST_F(PackageLoadTest, MalformedMetadataPart) {
  resqx::ContainerWriter writer;
  resqx::ContentTypes contentTypes;
  contentTypes.addOverride("broken.xml", resqx::objectContentType("Grid"));
  ASSERT_TRUE(writer.addPart(resqx::kContentTypesPart, resqx::ZipMethod::Deflate,
                             contentTypes.encode()));
  std::string text = "<resqml2:obj_Grid uuid=";
  ASSERT_TRUE(writer.addPart("broken.xml", resqx::ZipMethod::Deflate,
                             std::vector<uint8_t>(text.begin(), text.end())));
  fs::path path = tempDir_ / "broken.epc";
  ASSERT_TRUE(writer.write(path));

  resqx::Error error;
  EXPECT_FALSE(resqx::Package::open(path, {}, gridSchemas(), nullptr, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
  EXPECT_EQ(error.part, "broken.xml");
}

// An unreadable array payload invalidates only the object that owns it
TEST_F(PackageLoadTest, MissingArrayPayload) {
  resqx::ArrayHandle handle;
  handle.name = "points";
  handle.shape = {2, 3};
  handle.dtype = resqx::Dtype::Float64;
  handle.path = "arrays/missing.bin";
  grid_.arrays["points"] = handle;
  fs::path path = writeContainer({grid_});

  resqx::Error error;
  EXPECT_FALSE(resqx::Package::open(path, {}, gridSchemas(), nullptr, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::NotFound);
  EXPECT_EQ(error.part, grid_.defaultPartName());
  EXPECT_EQ(error.field, "arrays.points");
}

// Array payloads must be stored so they can be read in place
TEST_F(PackageLoadTest, CompressedArrayPayload) {
  resqx::Package source = resqx::Package::create({}, gridSchemas());
  auto grid = source.addPart(gridDocument("Grid A"), {{"points", points()}});
  ASSERT_TRUE(grid.has_value());
  resqx::Document document = *source.document(*grid);
  std::string arrayPath = document.arrays.at("points").path;
  auto payload = source.arrays().encode(document.arrays.at("points"));
  ASSERT_TRUE(payload.has_value());

  resqx::ContainerWriter writer;
  addDocuments(writer, {document});
  auto bytes = payload->bytes();
  ASSERT_TRUE(writer.addPart(arrayPath, resqx::ZipMethod::Deflate,
                             std::vector<uint8_t>(bytes.begin(), bytes.end())));
  fs::path path = tempDir_ / "deflated.epc";
  ASSERT_TRUE(writer.write(path));

  resqx::Error error;
  EXPECT_FALSE(resqx::Package::open(path, {}, gridSchemas(), nullptr, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::Corruption);
  EXPECT_EQ(error.part, document.defaultPartName());
  EXPECT_EQ(error.field, "arrays.points");
}
