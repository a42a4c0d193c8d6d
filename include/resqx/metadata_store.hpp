#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "array_store.hpp"
#include "catalog.hpp"
#include "document.hpp"
#include "error.hpp"
#include "schema.hpp"

namespace resqx {

// Typed metadata documents of one package.
//
// Every document change and the matching catalog update happen under the
// package mutex in one lock scope, so the stored documents and the catalog's
// reference sets never disagree.
class MetadataStore {
public:
  MetadataStore(Catalog &catalog, const ArrayStore &arrays, const SchemaRegistry &schemas,
                std::recursive_mutex &mutex);

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;

  // Validate and store a document, creating its catalog entry on first put.
  // Replacing a stored document requires document.revision to equal the stored
  // revision (ConcurrentModification otherwise). On success the stored copy
  // gets the next revision and citation version, and document is updated to
  // match it. On failure nothing changes.
  bool put(Document &document, std::string partName = {}, Error *outError = nullptr);

  std::optional<Document> get(const Oid &oid, Error *outError = nullptr) const;

  bool contains(const Oid &oid) const;

  // Every schema violation of a document, each with OID, part and field path
  ErrorList validate(const Document &document) const;

  // Remove the document and its catalog entry; see Catalog::remove for modes.
  // Returns the removed document.
  std::optional<Document> remove(const Oid &oid, RemoveMode mode, RemovalReport *report = nullptr,
                                 Error *outError = nullptr);

  // Store a document whose catalog entry the caller already inserted, without
  // validation. Used while loading a container.
  void restore(Document document);

  size_t size() const;

  const SchemaRegistry &schemas() const { return schemas_; }

  void clear();

private:
  void validateReferences(const Document &document, const TypeSchema &schema,
                          ErrorList &errors) const;
  void validateArrays(const Document &document, const TypeSchema &schema, ErrorList &errors) const;
  bool reachesThrough(const Oid &start, const Document &document, const std::string &field) const;

  Catalog &catalog_;
  const ArrayStore &arrays_;
  const SchemaRegistry &schemas_;
  std::recursive_mutex &mutex_;
  std::unordered_map<Oid, Document> documents_;
};

} // namespace resqx
