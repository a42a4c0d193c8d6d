#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace resqx {

// Open Packaging Conventions layer of a container: content types, relationship
// parts and core properties, all XML

inline constexpr std::string_view kRelationshipsContentType =
    "application/vnd.openxmlformats-package.relationships+xml";
inline constexpr std::string_view kCorePropertiesContentType =
    "application/vnd.openxmlformats-package.core-properties+xml";
inline constexpr std::string_view kArrayContentType = "application/x-resqx-array";

inline constexpr std::string_view kCorePropertiesRelationship =
    "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties";
inline constexpr std::string_view kDestinationObjectRelationship =
    "http://schemas.energistics.org/package/2012/relationships/destinationObject";
inline constexpr std::string_view kSourceObjectRelationship =
    "http://schemas.energistics.org/package/2012/relationships/sourceObject";

// Role of a part, decided by its content type
enum class PartKind : uint8_t {
  Metadata = 1,      // XML metadata document for one object
  Array = 2,         // Encoded array payload
  Relationships = 3, // _rels/*.rels
  Properties = 4,    // docProps/core.xml
  ContentTypes = 5,  // [Content_Types].xml
  Other = 6          // Anything else; ignored on load
};

std::string_view toString(PartKind kind);

// "application/x-resqml+xml;version=2.0;type=obj_<type>"
std::string objectContentType(std::string_view type);

// Object type named by a metadata content type; nullopt for any other content type
std::optional<std::string> objectTypeOf(std::string_view contentType);

// [Content_Types].xml: a content type per extension, overridden per part
class ContentTypes {
public:
  void addDefault(std::string_view extension, std::string_view contentType);
  void addOverride(std::string_view partName, std::string_view contentType);

  // Override first, then the default for the extension; empty if neither applies
  std::string lookup(std::string_view partName) const;

  PartKind classify(std::string_view partName) const;

  std::vector<uint8_t> encode() const;
  static std::optional<ContentTypes> decode(std::span<const uint8_t> bytes,
                                            Error *outError = nullptr);

private:
  struct Override {
    std::string partName; // Original case, no leading slash
    std::string contentType;
  };

  std::map<std::string, std::string> defaults_; // Lowercase extension
  std::map<std::string, Override> overrides_;   // Lowercase part name
};

struct Relationship {
  std::string id;
  std::string type;   // Relationship type URI
  std::string target; // Relative to the folder of the source part

  friend bool operator==(const Relationship &, const Relationship &) = default;
};

// "<folder>/_rels/<file>.rels" for a part; kRelationshipsPart for the package itself
std::string relationshipsPartName(std::string_view partName);

// Target of a relationship from sourcePart to targetPart, relative to the source folder
std::string relativeTarget(std::string_view sourcePart, std::string_view targetPart);

// Part named by a relationship target of sourcePart; an empty source means the package root
std::string resolveTarget(std::string_view sourcePart, std::string_view target);

std::vector<uint8_t> encodeRelationships(const std::vector<Relationship> &relationships);
std::optional<std::vector<Relationship>> decodeRelationships(std::span<const uint8_t> bytes,
                                                             Error *outError = nullptr);

// Package level properties, stored in docProps/core.xml
struct PackageProperties {
  std::string creator;
  std::string created;
  std::string title;
  std::string description;
  std::string version;

  friend bool operator==(const PackageProperties &, const PackageProperties &) = default;
};

std::vector<uint8_t> encodeCoreProperties(const PackageProperties &properties);
std::optional<PackageProperties> decodeCoreProperties(std::span<const uint8_t> bytes,
                                                      Error *outError = nullptr);

} // namespace resqx
