#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.hpp"
#include "oid.hpp"
#include "types.hpp"

namespace resqx {

// Authorship and versioning of one object
struct Citation {
  std::string title;
  std::string originator;
  std::string creation;   // ISO 8601 UTC
  std::string lastUpdate; // ISO 8601 UTC, empty until first replacement
  std::string format = "resqx";
  std::string description;
  int64_t version = 1; // Incremented on every replacement of the document

  friend bool operator==(const Citation &, const Citation &) = default;
};

// Current UTC time as "YYYY-MM-DDThh:mm:ssZ"
std::string utcTimestamp();

// Type and title of a referenced object, written beside its UUID
struct ReferenceTarget {
  std::string type;
  std::string title;
};

using ReferenceLookup = std::function<std::optional<ReferenceTarget>(const Oid &)>;

// Metadata document of one typed object
struct Document {
  static constexpr std::string_view schemaVersion = "2.0";

  std::string type;
  Oid oid;
  Citation citation;
  nlohmann::json fields = nlohmann::json::object();        // Scalar and structured fields
  std::map<std::string, std::vector<Oid>> references;     // Reference fields
  std::map<std::string, ArrayHandle> arrays;              // Array handles by logical name
  std::map<std::string, std::string> extraMetadata;

  // Optimistic concurrency token; not persisted
  uint64_t revision = 0;

  // Every OID named by a reference field, without duplicates
  std::vector<Oid> referencedOids() const;

  // "obj_<type>_<oid>.xml"
  std::string defaultPartName() const;

  // XML metadata part: root element obj_<type>, an eml:Citation, then one
  // element per field, reference target and array. References carry the
  // content type and title of their target when lookup knows it.
  std::vector<uint8_t> encode(const ReferenceLookup &lookup = {}) const;

  // Malformed XML or content is reported as Corruption naming the field concerned
  static std::optional<Document> decode(std::span<const uint8_t> bytes, Error *outError = nullptr);

  // Same content, ignoring OID, citation and revision
  bool equivalentTo(const Document &other) const;
};

// Part name for a metadata document of the given type and OID
std::string metadataPartName(std::string_view type, const Oid &oid);

} // namespace resqx
