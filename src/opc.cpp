#include <cctype>

#include <fmt/format.h>

#include <resqx/opc.hpp>
#include <resqx/types.hpp>
#include <resqx/xml.hpp>

namespace resqx {

namespace {

constexpr const char *kContentTypesNamespace =
    "http://schemas.openxmlformats.org/package/2006/content-types";
constexpr const char *kRelationshipsNamespace =
    "http://schemas.openxmlformats.org/package/2006/relationships";
constexpr const char *kCorePropertiesNamespace =
    "http://schemas.openxmlformats.org/package/2006/metadata/core-properties";

constexpr std::string_view kObjectMediaType = "application/x-resqml+xml";

std::string lowerExtension(std::string_view partName) {
  std::string lowered = lowercasePartName(partName);
  size_t slash = lowered.rfind('/');
  size_t dot = lowered.rfind('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return {};
  }
  return lowered.substr(dot + 1);
}

std::vector<std::string> pathComponents(std::string_view path) {
  std::vector<std::string> components;
  size_t start = 0;
  while (start <= path.size()) {
    size_t slash = path.find('/', start);
    size_t stop = slash == std::string_view::npos ? path.size() : slash;
    if (stop > start) {
      components.emplace_back(path.substr(start, stop - start));
    }
    start = stop + 1;
  }
  return components;
}

std::string joinComponents(const std::vector<std::string> &components, size_t first = 0) {
  std::string result;
  for (size_t i = first; i < components.size(); ++i) {
    if (!result.empty()) {
      result += '/';
    }
    result += components[i];
  }
  return result;
}

Error malformed(std::string_view part, std::string message) {
  Error error(ErrorCode::Corruption, std::move(message));
  error.withPart(std::string(part));
  return error;
}

} // namespace

std::string_view toString(PartKind kind) {
  switch (kind) {
  case PartKind::Metadata:
    return "metadata";
  case PartKind::Array:
    return "array";
  case PartKind::Relationships:
    return "relationships";
  case PartKind::Properties:
    return "properties";
  case PartKind::ContentTypes:
    return "content types";
  case PartKind::Other:
    return "other";
  }
  return "unknown";
}

std::string objectContentType(std::string_view type) {
  return fmt::format("{};version=2.0;type=obj_{}", kObjectMediaType, type);
}

std::optional<std::string> objectTypeOf(std::string_view contentType) {
  if (!contentType.starts_with(kObjectMediaType)) {
    return std::nullopt;
  }
  // Parameters follow the media type, separated by ';'
  size_t pos = kObjectMediaType.size();
  while (pos < contentType.size() && contentType[pos] == ';') {
    size_t next = contentType.find(';', pos + 1);
    std::string_view parameter =
        contentType.substr(pos + 1, next == std::string_view::npos ? next : next - pos - 1);
    if (parameter.starts_with("type=obj_") && parameter.size() > 9) {
      return std::string(parameter.substr(9));
    }
    pos = next == std::string_view::npos ? contentType.size() : next;
  }
  return std::nullopt;
}

void ContentTypes::addDefault(std::string_view extension, std::string_view contentType) {
  std::string key(extension);
  for (char &c : key) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  defaults_[key] = std::string(contentType);
}

void ContentTypes::addOverride(std::string_view partName, std::string_view contentType) {
  std::string normalized = normalizePartName(partName);
  overrides_[lowercasePartName(normalized)] = Override{normalized, std::string(contentType)};
}

std::string ContentTypes::lookup(std::string_view partName) const {
  if (auto it = overrides_.find(lowercasePartName(partName)); it != overrides_.end()) {
    return it->second.contentType;
  }
  if (auto it = defaults_.find(lowerExtension(partName)); it != defaults_.end()) {
    return it->second;
  }
  return {};
}

PartKind ContentTypes::classify(std::string_view partName) const {
  if (lowercasePartName(partName) == lowercasePartName(kContentTypesPart)) {
    return PartKind::ContentTypes;
  }
  std::string contentType = lookup(partName);
  if (objectTypeOf(contentType)) {
    return PartKind::Metadata;
  }
  if (contentType == kRelationshipsContentType) {
    return PartKind::Relationships;
  }
  if (contentType == kCorePropertiesContentType) {
    return PartKind::Properties;
  }
  if (contentType == kArrayContentType) {
    return PartKind::Array;
  }
  return PartKind::Other;
}

std::vector<uint8_t> ContentTypes::encode() const {
  pugi::xml_document document;
  startXml(document);
  pugi::xml_node root = document.append_child("Types");
  root.append_attribute("xmlns") = kContentTypesNamespace;

  for (const auto &[extension, contentType] : defaults_) {
    pugi::xml_node node = root.append_child("Default");
    node.append_attribute("Extension") = extension.c_str();
    node.append_attribute("ContentType") = contentType.c_str();
  }
  for (const auto &[key, entry] : overrides_) {
    pugi::xml_node node = root.append_child("Override");
    node.append_attribute("PartName") = ("/" + entry.partName).c_str();
    node.append_attribute("ContentType") = entry.contentType.c_str();
  }
  return xmlBytes(document);
}

std::optional<ContentTypes> ContentTypes::decode(std::span<const uint8_t> bytes, Error *outError) {
  pugi::xml_document document;
  Error error;
  if (!parseXml(bytes, document, &error)) {
    fail(outError, error.withPart(std::string(kContentTypesPart)));
    return std::nullopt;
  }
  pugi::xml_node root = document.document_element();
  if (localName(root.name()) != "Types") {
    fail(outError, malformed(kContentTypesPart, "Content types part has no Types element"));
    return std::nullopt;
  }

  ContentTypes types;
  for (pugi::xml_node node = root.first_child(); node; node = node.next_sibling()) {
    std::string_view name = localName(node.name());
    std::string_view contentType = node.attribute("ContentType").value();
    if (name == "Default") {
      std::string_view extension = node.attribute("Extension").value();
      if (extension.empty() || contentType.empty()) {
        fail(outError, malformed(kContentTypesPart, "Default lacks Extension or ContentType"));
        return std::nullopt;
      }
      types.addDefault(extension, contentType);
    } else if (name == "Override") {
      std::string_view partName = node.attribute("PartName").value();
      if (partName.empty() || contentType.empty()) {
        fail(outError, malformed(kContentTypesPart, "Override lacks PartName or ContentType"));
        return std::nullopt;
      }
      types.addOverride(partName, contentType);
    }
  }
  return types;
}

std::string relationshipsPartName(std::string_view partName) {
  std::string normalized = normalizePartName(partName);
  if (normalized.empty()) {
    return std::string(kRelationshipsPart);
  }
  size_t slash = normalized.rfind('/');
  std::string folder = slash == std::string::npos ? std::string() : normalized.substr(0, slash + 1);
  std::string file = slash == std::string::npos ? normalized : normalized.substr(slash + 1);
  return fmt::format("{}_rels/{}.rels", folder, file);
}

std::string relativeTarget(std::string_view sourcePart, std::string_view targetPart) {
  std::vector<std::string> folder = pathComponents(normalizePartName(sourcePart));
  if (!folder.empty()) {
    folder.pop_back();
  }
  std::vector<std::string> target = pathComponents(normalizePartName(targetPart));

  size_t common = 0;
  while (common < folder.size() && common + 1 < target.size() &&
         folder[common] == target[common]) {
    ++common;
  }

  std::string result;
  for (size_t i = common; i < folder.size(); ++i) {
    result += "../";
  }
  return result + joinComponents(target, common);
}

std::string resolveTarget(std::string_view sourcePart, std::string_view target) {
  std::vector<std::string> components;
  if (!target.starts_with('/')) {
    components = pathComponents(normalizePartName(sourcePart));
    if (!components.empty()) {
      components.pop_back();
    }
  }
  for (auto &component : pathComponents(normalizePartName(target))) {
    if (component == ".") {
      continue;
    }
    if (component == "..") {
      if (!components.empty()) {
        components.pop_back();
      }
      continue;
    }
    components.push_back(std::move(component));
  }
  return joinComponents(components);
}

std::vector<uint8_t> encodeRelationships(const std::vector<Relationship> &relationships) {
  pugi::xml_document document;
  startXml(document);
  pugi::xml_node root = document.append_child("Relationships");
  root.append_attribute("xmlns") = kRelationshipsNamespace;

  for (const auto &relationship : relationships) {
    pugi::xml_node node = root.append_child("Relationship");
    node.append_attribute("Id") = relationship.id.c_str();
    node.append_attribute("Type") = relationship.type.c_str();
    node.append_attribute("Target") = relationship.target.c_str();
  }
  return xmlBytes(document);
}

std::optional<std::vector<Relationship>> decodeRelationships(std::span<const uint8_t> bytes,
                                                             Error *outError) {
  pugi::xml_document document;
  if (!parseXml(bytes, document, outError)) {
    return std::nullopt;
  }
  pugi::xml_node root = document.document_element();
  if (localName(root.name()) != "Relationships") {
    fail(outError, Error(ErrorCode::Corruption, "Relationships part has no Relationships element"));
    return std::nullopt;
  }

  std::vector<Relationship> relationships;
  for (pugi::xml_node node = root.first_child(); node; node = node.next_sibling()) {
    if (node.type() != pugi::node_element || localName(node.name()) != "Relationship") {
      continue;
    }
    Relationship relationship{node.attribute("Id").value(), node.attribute("Type").value(),
                              node.attribute("Target").value()};
    if (relationship.id.empty() || relationship.type.empty() || relationship.target.empty()) {
      fail(outError, Error(ErrorCode::Corruption, "Relationship lacks a required attribute"));
      return std::nullopt;
    }
    relationships.push_back(std::move(relationship));
  }
  return relationships;
}

std::vector<uint8_t> encodeCoreProperties(const PackageProperties &properties) {
  pugi::xml_document document;
  startXml(document);
  pugi::xml_node root = document.append_child("cp:coreProperties");
  root.append_attribute("xmlns:cp") = kCorePropertiesNamespace;
  root.append_attribute("xmlns:dc") = "http://purl.org/dc/elements/1.1/";
  root.append_attribute("xmlns:dcterms") = "http://purl.org/dc/terms/";
  root.append_attribute("xmlns:xsi") = "http://www.w3.org/2001/XMLSchema-instance";

  if (!properties.creator.empty()) {
    appendText(root, "dc:creator", properties.creator);
  }
  if (!properties.created.empty()) {
    appendText(root, "dcterms:created", properties.created)
        .append_attribute("xsi:type") = "dcterms:W3CDTF";
  }
  if (!properties.title.empty()) {
    appendText(root, "dc:title", properties.title);
  }
  if (!properties.description.empty()) {
    appendText(root, "dc:description", properties.description);
  }
  if (!properties.version.empty()) {
    appendText(root, "cp:version", properties.version);
  }
  return xmlBytes(document);
}

std::optional<PackageProperties> decodeCoreProperties(std::span<const uint8_t> bytes,
                                                      Error *outError) {
  pugi::xml_document document;
  if (!parseXml(bytes, document, outError)) {
    return std::nullopt;
  }
  pugi::xml_node root = document.document_element();
  if (localName(root.name()) != "coreProperties") {
    fail(outError,
         Error(ErrorCode::Corruption, "Package properties part has no coreProperties element"));
    return std::nullopt;
  }

  PackageProperties properties;
  properties.creator = childText(root, "creator");
  properties.created = childText(root, "created");
  properties.title = childText(root, "title");
  properties.description = childText(root, "description");
  properties.version = childText(root, "version");
  return properties;
}

} // namespace resqx
