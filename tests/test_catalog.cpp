#include <resqx/catalog.hpp>

#include <gtest/gtest.h>

class CatalogTest : public ::testing::Test {
protected:
  resqx::Oid add(const std::string &type, const std::set<resqx::Oid> &references = {}) {
    resqx::Error error;
    auto oid = catalog_.registerObject(type, references, {}, {}, &error);
    EXPECT_TRUE(oid.has_value()) << error.describe();
    return oid.value_or(resqx::Oid{});
  }

  resqx::Catalog catalog_;
};

TEST_F(CatalogTest, RegisterAndResolve) {
  resqx::Citation citation;
  citation.title = "Main grid";

  resqx::Error error;
  auto oid = catalog_.registerObject("Grid", {}, citation, {}, &error);
  ASSERT_TRUE(oid.has_value()) << error.describe();

  const auto *entry = catalog_.resolve(*oid, &error);
  ASSERT_NE(entry, nullptr) << error.describe();
  EXPECT_EQ(entry->type, "Grid");
  EXPECT_EQ(entry->citation.title, "Main grid");
  EXPECT_EQ(entry->partName, "obj_Grid_" + oid->str() + ".xml");
  EXPECT_TRUE(entry->valid);
  EXPECT_TRUE(catalog_.contains(*oid));
  EXPECT_EQ(catalog_.size(), 1);
}

TEST_F(CatalogTest, ResolveUnknown) {
  resqx::Oid unknown = resqx::Oid::generate();
  resqx::Error error;
  EXPECT_EQ(catalog_.resolve(unknown, &error), nullptr);
  EXPECT_EQ(error.code, resqx::ErrorCode::NotFound);
  EXPECT_EQ(error.oid, unknown.str());
}

// Forward references are stored; reverse references follow every mutation
TEST_F(CatalogTest, ReverseReferences) {
  resqx::Oid grid = add("Grid");
  resqx::Oid porosity = add("Property", {grid});
  resqx::Oid permeability = add("Property", {grid});

  EXPECT_EQ(catalog_.referencing(grid), (std::set<resqx::Oid>{porosity, permeability}));
  EXPECT_TRUE(catalog_.referencing(porosity).empty());

  resqx::Oid other = add("Grid");
  ASSERT_TRUE(catalog_.updateReferences(permeability, {other}));
  EXPECT_EQ(catalog_.referencing(grid), std::set<resqx::Oid>{porosity});
  EXPECT_EQ(catalog_.referencing(other), std::set<resqx::Oid>{permeability});
  EXPECT_EQ(catalog_.resolve(permeability)->references, std::set<resqx::Oid>{other});
}

TEST_F(CatalogTest, RegisterWithDanglingReference) {
  resqx::Oid missing = resqx::Oid::generate();
  resqx::Error error;
  EXPECT_FALSE(catalog_.registerObject("Property", {missing}, {}, {}, &error).has_value());
  EXPECT_EQ(error.code, resqx::ErrorCode::DanglingReference);
  EXPECT_TRUE(catalog_.empty());
}

// A failed reference update leaves the previous set in place
TEST_F(CatalogTest, UpdateReferencesIsAllOrNothing) {
  resqx::Oid grid = add("Grid");
  resqx::Oid property = add("Property", {grid});

  resqx::Error error;
  EXPECT_FALSE(catalog_.updateReferences(property, {grid, resqx::Oid::generate()}, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::DanglingReference);
  EXPECT_EQ(catalog_.resolve(property)->references, std::set<resqx::Oid>{grid});
  EXPECT_EQ(catalog_.referencing(grid), std::set<resqx::Oid>{property});
}

TEST_F(CatalogTest, InsertRejectsDuplicates) {
  resqx::Oid grid = add("Grid");

  resqx::CatalogEntry sameOid;
  sameOid.oid = grid;
  sameOid.type = "Grid";
  sameOid.partName = "other.xml";
  resqx::Error error;
  EXPECT_FALSE(catalog_.insert(sameOid, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::Validation);

  resqx::CatalogEntry samePart;
  samePart.oid = resqx::Oid::generate();
  samePart.type = "Grid";
  samePart.partName = "OBJ_GRID_" + grid.str() + ".JSON";
  EXPECT_FALSE(catalog_.insert(samePart, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::Validation);
  EXPECT_EQ(error.part, samePart.partName);

  resqx::CatalogEntry nilOid;
  nilOid.type = "Grid";
  nilOid.partName = "nil.xml";
  EXPECT_FALSE(catalog_.insert(nilOid, &error));

  EXPECT_EQ(catalog_.size(), 1);
}

TEST_F(CatalogTest, SelfReference) {
  resqx::CatalogEntry entry;
  entry.oid = resqx::Oid::generate();
  entry.type = "PropertyKind";
  entry.partName = "self.xml";
  entry.references = {entry.oid};

  resqx::Error error;
  ASSERT_TRUE(catalog_.insert(entry, &error)) << error.describe();
  EXPECT_EQ(catalog_.referencing(entry.oid), std::set<resqx::Oid>{entry.oid});

  // A self-reference does not block removal
  EXPECT_TRUE(catalog_.remove(entry.oid, resqx::RemoveMode::Strict, nullptr, &error))
      << error.describe();
}

TEST_F(CatalogTest, StrictRemovalNamesReferencingPart) {
  resqx::Oid grid = add("Grid");
  resqx::Oid property = add("Property", {grid});

  resqx::Error error;
  EXPECT_FALSE(catalog_.remove(grid, resqx::RemoveMode::Strict, nullptr, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::DanglingReference);
  EXPECT_EQ(error.oid, grid.str());
  EXPECT_EQ(error.part, catalog_.resolve(property)->partName);
  EXPECT_NE(error.message.find(catalog_.resolve(property)->partName), std::string::npos);
  EXPECT_TRUE(catalog_.contains(grid));
}

TEST_F(CatalogTest, CascadeRemovalReportsInvalidated) {
  resqx::Oid grid = add("Grid");
  resqx::Oid a = add("Property", {grid});
  resqx::Oid b = add("Property", {grid});
  resqx::Oid unrelated = add("Grid");

  resqx::RemovalReport report;
  resqx::Error error;
  ASSERT_TRUE(catalog_.remove(grid, resqx::RemoveMode::Cascade, &report, &error))
      << error.describe();

  EXPECT_EQ(report.removed, grid);
  EXPECT_EQ(std::set<resqx::Oid>(report.invalidated.begin(), report.invalidated.end()),
            (std::set<resqx::Oid>{a, b}));
  ASSERT_EQ(report.invalidatedParts.size(), 2);

  EXPECT_FALSE(catalog_.contains(grid));
  for (const auto &oid : {a, b}) {
    const auto *entry = catalog_.resolve(oid);
    ASSERT_NE(entry, nullptr);
    EXPECT_FALSE(entry->valid);
    EXPECT_TRUE(entry->references.empty());
  }
  EXPECT_TRUE(catalog_.resolve(unrelated)->valid);
  EXPECT_EQ(catalog_.findPart("obj_Grid_" + grid.str() + ".xml"), nullptr);
}

// Removing a referrer clears it from the reverse set of its targets
TEST_F(CatalogTest, RemoveReferrer) {
  resqx::Oid grid = add("Grid");
  resqx::Oid property = add("Property", {grid});

  ASSERT_TRUE(catalog_.remove(property, resqx::RemoveMode::Strict));
  EXPECT_TRUE(catalog_.referencing(grid).empty());
  EXPECT_TRUE(catalog_.remove(grid, resqx::RemoveMode::Strict));
  EXPECT_TRUE(catalog_.empty());
}

TEST_F(CatalogTest, RenameAndFindPart) {
  resqx::Oid grid = add("Grid");
  resqx::Oid other = add("Grid");

  resqx::Error error;
  ASSERT_TRUE(catalog_.rename(grid, "grids\\main.xml", &error)) << error.describe();
  EXPECT_EQ(catalog_.resolve(grid)->partName, "grids/main.xml");
  EXPECT_EQ(catalog_.findPart("GRIDS/MAIN.JSON")->oid, grid);
  EXPECT_EQ(catalog_.findPart("obj_Grid_" + grid.str() + ".xml"), nullptr);

  EXPECT_FALSE(catalog_.rename(other, "Grids/Main.xml", &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::Validation);
  EXPECT_FALSE(catalog_.rename(other, "", &error));

  // Renaming to its own name is allowed
  EXPECT_TRUE(catalog_.rename(grid, "grids/main.xml"));
}

TEST_F(CatalogTest, InsertionOrderAndTypeFilter) {
  resqx::Oid g1 = add("Grid");
  resqx::Oid p1 = add("Property", {g1});
  resqx::Oid g2 = add("Grid");

  EXPECT_EQ(catalog_.oids(), (std::vector<resqx::Oid>{g1, p1, g2}));
  EXPECT_EQ(catalog_.oids("Grid"), (std::vector<resqx::Oid>{g1, g2}));
  EXPECT_TRUE(catalog_.oids("Horizon").empty());

  auto entries = catalog_.entries();
  ASSERT_EQ(entries.size(), 3);
  EXPECT_EQ(entries[1]->oid, p1);

  catalog_.clear();
  EXPECT_TRUE(catalog_.empty());
  EXPECT_EQ(catalog_.findPart(entries.empty() ? "" : "anything"), nullptr);
}

TEST_F(CatalogTest, UpdateCitationAndValidity) {
  resqx::Oid grid = add("Grid");

  resqx::Citation citation;
  citation.title = "Renamed";
  citation.version = 3;
  ASSERT_TRUE(catalog_.updateCitation(grid, citation));
  EXPECT_EQ(catalog_.resolve(grid)->citation, citation);

  ASSERT_TRUE(catalog_.setValid(grid, false));
  EXPECT_FALSE(catalog_.resolve(grid)->valid);

  resqx::Error error;
  EXPECT_FALSE(catalog_.setValid(resqx::Oid::generate(), true, &error));
  EXPECT_EQ(error.code, resqx::ErrorCode::NotFound);
}
