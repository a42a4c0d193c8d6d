#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "array_store.hpp"
#include "catalog.hpp"
#include "document.hpp"
#include "error.hpp"
#include "metadata_store.hpp"
#include "opc.hpp"
#include "options.hpp"
#include "schema.hpp"
#include "writer.hpp"

namespace resqx {

// Per-part diagnostics collected while opening a container
struct LoadReport {
  size_t partCount = 0;
  size_t objectCount = 0;
  size_t arrayCount = 0;
  ErrorList diagnostics;        // Each names the offending part
  std::vector<Oid> invalidated; // Objects flagged invalid (salvage mode)

  bool clean() const { return diagnostics.empty(); }
};

enum class TitleMode { Exact, StartsWith, EndsWith };

struct GraphNode {
  std::string type;
  std::string title;
};

// Reference graph of a package; edges are undirected, stored with the smaller OID first
struct ObjectGraph {
  std::map<Oid, GraphNode> nodes;
  std::set<std::pair<Oid, Oid>> edges;
};

// An earth-model package: catalog, metadata documents and array payloads,
// persisted as one container file
class Package {
public:
  Package();
  ~Package();

  // Delete copy, enable move
  Package(const Package &) = delete;
  Package &operator=(const Package &) = delete;
  Package(Package &&) noexcept;
  Package &operator=(Package &&) noexcept;

  // New empty package
  static Package create(PackageOptions options = {}, SchemaRegistry schemas = {});

  // Open a container. Every part is checked and each problem recorded in report
  // with the part it concerns. With options.strictLoad the open fails if any
  // diagnostic was raised; otherwise the offending objects are flagged invalid.
  static std::optional<Package> open(const std::filesystem::path &path,
                                     PackageOptions options = {}, SchemaRegistry schemas = {},
                                     LoadReport *report = nullptr, Error *outError = nullptr);

  // Commit the package to destination atomically. On any failure the previous
  // container at destination is left untouched.
  bool save(const std::filesystem::path &destination, Error *outError = nullptr);

  // Save to the container the package was opened from or last saved to
  bool save(Error *outError = nullptr);

  // Called before each part is written during save; returning false aborts the save
  void setProgressHook(ContainerWriter::ProgressHook hook);

  // Every problem that would make save fail
  ErrorList validate() const;

  // Add a document with its arrays. A nil OID is replaced by a fresh one; each
  // array is allocated, written and recorded under its name. All or nothing.
  std::optional<Oid> addPart(Document document, const std::map<std::string, ArrayData> &arrays = {},
                             Error *outError = nullptr);

  // Replace a stored document; see MetadataStore::put
  bool updatePart(Document &document, Error *outError = nullptr);

  // Remove an object together with the arrays it owns
  bool removePart(const Oid &oid, RemoveMode mode = RemoveMode::Strict,
                  RemovalReport *report = nullptr, Error *outError = nullptr);

  // Give an object a new part name; reserved prefixes are refused
  bool renamePart(const Oid &oid, std::string_view newName, Error *outError = nullptr);

  std::optional<Document> document(const Oid &oid, Error *outError = nullptr) const;

  // Write an array of an object, allocating its handle on first use.
  // An existing handle keeps its shape and dtype (ShapeMismatch otherwise).
  bool setArray(const Oid &oid, const std::string &name, const ArrayData &data,
                Error *outError = nullptr);

  std::shared_ptr<const ArrayData> getArray(const Oid &oid, const std::string &name,
                                            Error *outError = nullptr);

  // Part names of matching objects, in insertion order. Title matching is
  // case-insensitive; an empty type or title matches everything.
  std::vector<std::string> parts(std::string_view type = {}, std::string_view title = {},
                                 TitleMode mode = TitleMode::Exact) const;

  std::vector<Oid> oids(std::string_view type = {}, std::string_view title = {},
                        TitleMode mode = TitleMode::Exact) const;

  std::optional<std::string> partName(const Oid &oid) const;

  // Reference graph, optionally restricted to a subset of objects
  ObjectGraph graph(const std::set<Oid> *subset = nullptr) const;

  // Copy every object of other into this package. With consolidate, an object
  // equivalent to one already present (same type, fields, references, extra
  // metadata and array contents) is not copied and references to it are
  // redirected. mapping receives source OID to OID in this package. All or nothing.
  bool copyAllPartsFrom(const Package &other, bool consolidate = false,
                        std::map<Oid, Oid> *mapping = nullptr, Error *outError = nullptr);

  const PackageProperties &properties() const;
  void setProperties(PackageProperties properties);

  const Catalog &catalog() const;
  MetadataStore &metadata();
  const MetadataStore &metadata() const;
  ArrayStore &arrays();
  const ArrayStore &arrays() const;
  SchemaRegistry &schemas();
  const SchemaRegistry &schemas() const;
  const PackageOptions &options() const;

  // Container backing this package; empty for a package never saved
  const std::filesystem::path &path() const;

  size_t size() const;

private:
  struct State;

  explicit Package(std::unique_ptr<State> state);

  bool arrayShared(const std::string &path, const Oid &except) const;

  std::unique_ptr<State> state_;
};

} // namespace resqx
