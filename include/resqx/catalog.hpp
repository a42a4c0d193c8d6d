#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "document.hpp"
#include "error.hpp"
#include "oid.hpp"

namespace resqx {

struct CatalogEntry {
  Oid oid;
  std::string type;
  std::string partName;
  Citation citation;
  std::set<Oid> references;   // OIDs this entry references
  std::set<Oid> referencedBy; // Derived; never persisted
  bool valid = true;          // Cleared by cascading removal or a failed load check
};

enum class RemoveMode {
  Strict, // Refuse while other entries reference the target
  Cascade // Remove anyway and invalidate every referencing entry
};

// Outcome of a removal
struct RemovalReport {
  Oid removed;
  std::vector<Oid> invalidated;              // Entries flagged invalid by a cascade
  std::vector<std::string> invalidatedParts; // Their part names, same order
};

// Identity catalog: the single authority on which OIDs exist in a package.
// Holds a plain OID-keyed adjacency structure; forward references are stored,
// reverse references are kept in step by every mutation.
//
// Not synchronized; the owning Package serializes access.
class Catalog {
public:
  // Register a new object under a fresh OID.
  // Every reference must resolve (DanglingReference otherwise). An empty
  // partName defaults to the metadata part name of the new object.
  std::optional<Oid> registerObject(std::string type, const std::set<Oid> &references,
                                    Citation citation = {}, std::string partName = {},
                                    Error *outError = nullptr);

  // Insert an entry carrying a known OID. Duplicate OIDs and part names are
  // rejected with Validation, unresolved references with DanglingReference.
  bool insert(CatalogEntry entry, Error *outError = nullptr);

  // Entry for oid, or nullptr with NotFound
  const CatalogEntry *resolve(const Oid &oid, Error *outError = nullptr) const;

  bool contains(const Oid &oid) const { return entries_.contains(oid); }

  // Entry stored under a part name (case-insensitive)
  const CatalogEntry *findPart(std::string_view partName) const;

  // OIDs of the entries that reference oid
  std::set<Oid> referencing(const Oid &oid) const;

  // Replace the forward references of oid; all or nothing
  bool updateReferences(const Oid &oid, std::set<Oid> references, Error *outError = nullptr);

  bool updateCitation(const Oid &oid, Citation citation, Error *outError = nullptr);

  bool setValid(const Oid &oid, bool valid, Error *outError = nullptr);

  // Strict removal fails with DanglingReference naming the referencing parts.
  // Cascading removal drops the entry, removes it from the forward sets of its
  // referrers and flags those referrers invalid; they are listed in the report.
  bool remove(const Oid &oid, RemoveMode mode, RemovalReport *report = nullptr,
              Error *outError = nullptr);

  // Move an entry to a new part name (unique, case-insensitive)
  bool rename(const Oid &oid, std::string partName, Error *outError = nullptr);

  // OIDs in insertion order, optionally restricted to one type
  std::vector<Oid> oids(std::string_view type = {}) const;

  // Entries in insertion order
  std::vector<const CatalogEntry *> entries() const;

  size_t size() const { return entries_.size(); }

  bool empty() const { return entries_.empty(); }

  void clear();

private:
  bool checkReferences(const Oid &source, const std::set<Oid> &references, Error *outError) const;

  std::unordered_map<Oid, CatalogEntry> entries_;
  std::vector<Oid> order_;
  std::unordered_map<std::string, Oid> parts_; // lowercase part name -> OID
};

} // namespace resqx
