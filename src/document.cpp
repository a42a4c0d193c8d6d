#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <resqx/document.hpp>
#include <resqx/opc.hpp>
#include <resqx/xml.hpp>

namespace resqx {

using nlohmann::json;

namespace {

constexpr const char *kResqmlNamespace = "http://www.energistics.org/energyml/data/resqmlv2";
constexpr const char *kEmlNamespace = "http://www.energistics.org/energyml/data/commonv2";
constexpr const char *kXsiNamespace = "http://www.w3.org/2001/XMLSchema-instance";
constexpr const char *kXsdNamespace = "http://www.w3.org/2001/XMLSchema";

Error malformed(std::string message, std::string field) {
  Error error(ErrorCode::Corruption, std::move(message));
  error.withField(std::move(field));
  return error;
}

template <typename T> bool parseInteger(std::string_view text, T &value) {
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && end == text.data() + text.size();
}

std::optional<double> parseDouble(std::string_view text) {
  if (text == "NaN") {
    return std::nan("");
  }
  if (text == "INF") {
    return HUGE_VAL;
  }
  if (text == "-INF") {
    return -HUGE_VAL;
  }
  double value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string formatDouble(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0 ? "INF" : "-INF";
  }
  return fmt::format("{}", value);
}

std::vector<std::string_view> splitWhitespace(std::string_view text) {
  std::vector<std::string_view> tokens;
  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
      ++pos;
    }
    size_t start = pos;
    while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
      ++pos;
    }
    if (pos > start) {
      tokens.push_back(text.substr(start, pos - start));
    }
  }
  return tokens;
}

void setText(pugi::xml_node node, std::string_view text) {
  node.append_child(pugi::node_pcdata).set_value(std::string(text).c_str());
}

void setType(pugi::xml_node node, const char *type) {
  node.append_attribute("xsi:type") = type;
}

// Names such as "cellCount" become the element resqml2:CellCount; any other
// name is kept verbatim in a name attribute of resqml2:Named
bool plainName(std::string_view name) {
  if (name.empty() || !std::islower(static_cast<unsigned char>(name[0]))) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

pugi::xml_node appendNamed(pugi::xml_node &parent, std::string_view name) {
  if (plainName(name)) {
    std::string element = fmt::format("resqml2:{}", name);
    element[8] = static_cast<char>(std::toupper(static_cast<unsigned char>(element[8])));
    return parent.append_child(element.c_str());
  }
  pugi::xml_node node = parent.append_child("resqml2:Named");
  node.append_attribute("name") = std::string(name).c_str();
  return node;
}

std::string nameOf(const pugi::xml_node &node) {
  if (pugi::xml_attribute attribute = node.attribute("name")) {
    return attribute.value();
  }
  std::string name(localName(node.name()));
  if (!name.empty()) {
    name[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
  }
  return name;
}

bool isNil(const pugi::xml_node &node) {
  return std::string_view(node.attribute("xsi:nil").value()) == "true";
}

void appendValue(pugi::xml_node node, const json &value) {
  switch (value.type()) {
  case json::value_t::string:
    setType(node, "xsd:string");
    setText(node, value.get_ref<const std::string &>());
    break;
  case json::value_t::boolean:
    setType(node, "xsd:boolean");
    setText(node, value.get<bool>() ? "true" : "false");
    break;
  case json::value_t::number_integer:
    setType(node, "xsd:long");
    setText(node, fmt::format("{}", value.get<int64_t>()));
    break;
  case json::value_t::number_unsigned:
    setType(node, "xsd:unsignedLong");
    setText(node, fmt::format("{}", value.get<uint64_t>()));
    break;
  case json::value_t::number_float:
    setType(node, "xsd:double");
    setText(node, formatDouble(value.get<double>()));
    break;
  case json::value_t::array:
    if (!value.empty() &&
        std::all_of(value.begin(), value.end(), [](const json &v) { return v.is_number_float(); })) {
      std::vector<std::string> items;
      for (const auto &item : value) {
        items.push_back(formatDouble(item.get<double>()));
      }
      setType(node, "resqml2:DoubleList");
      setText(node, fmt::format("{}", fmt::join(items, " ")));
    } else {
      setType(node, "resqml2:List");
      for (const auto &item : value) {
        appendValue(node.append_child("resqml2:Item"), item);
      }
    }
    break;
  case json::value_t::object:
    setType(node, "resqml2:Record");
    for (const auto &[key, member] : value.items()) {
      pugi::xml_node child = node.append_child("resqml2:Member");
      child.append_attribute("name") = key.c_str();
      appendValue(child, member);
    }
    break;
  default:
    node.append_attribute("xsi:nil") = "true";
    break;
  }
}

std::optional<json> readValue(const pugi::xml_node &node, const std::string &path,
                              Error *outError) {
  auto bad = [&](std::string message) -> std::optional<json> {
    fail(outError, malformed(std::move(message), path));
    return std::nullopt;
  };

  if (isNil(node)) {
    return json(nullptr);
  }
  std::string_view type = localName(node.attribute("xsi:type").value());
  std::string_view text = node.child_value();

  if (type == "string") {
    return json(std::string(text));
  }
  if (type == "boolean") {
    if (text == "true" || text == "1") {
      return json(true);
    }
    if (text == "false" || text == "0") {
      return json(false);
    }
    return bad("expected a boolean");
  }
  if (type == "long") {
    int64_t value = 0;
    if (!parseInteger(text, value)) {
      return bad(fmt::format("'{}' is not a 64-bit integer", text));
    }
    return json(value);
  }
  if (type == "unsignedLong") {
    uint64_t value = 0;
    if (!parseInteger(text, value)) {
      return bad(fmt::format("'{}' is not an unsigned 64-bit integer", text));
    }
    return json(value);
  }
  if (type == "double") {
    auto value = parseDouble(text);
    if (!value) {
      return bad(fmt::format("'{}' is not a number", text));
    }
    return json(*value);
  }
  if (type == "DoubleList") {
    json list = json::array();
    for (std::string_view token : splitWhitespace(text)) {
      auto value = parseDouble(token);
      if (!value) {
        return bad(fmt::format("'{}' is not a number", token));
      }
      list.push_back(*value);
    }
    return list;
  }
  if (type == "List") {
    json list = json::array();
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
      if (child.type() != pugi::node_element) {
        continue;
      }
      auto item = readValue(child, fmt::format("{}[{}]", path, list.size()), outError);
      if (!item) {
        return std::nullopt;
      }
      list.push_back(std::move(*item));
    }
    return list;
  }
  if (type == "Record") {
    json object = json::object();
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
      if (child.type() != pugi::node_element) {
        continue;
      }
      std::string key = child.attribute("name").value();
      auto member = readValue(child, fmt::format("{}.{}", path, key), outError);
      if (!member) {
        return std::nullopt;
      }
      object[key] = std::move(*member);
    }
    return object;
  }
  return bad(fmt::format("unsupported value type '{}'", node.attribute("xsi:type").value()));
}

void appendCitation(pugi::xml_node &root, const Citation &citation) {
  pugi::xml_node node = root.append_child("eml:Citation");
  appendText(node, "eml:Title", citation.title);
  appendText(node, "eml:Originator", citation.originator);
  appendText(node, "eml:Creation", citation.creation);
  appendText(node, "eml:Format", citation.format);
  if (!citation.lastUpdate.empty()) {
    appendText(node, "eml:LastUpdate", citation.lastUpdate);
  }
  appendText(node, "eml:VersionString", fmt::format("{}", citation.version));
  if (!citation.description.empty()) {
    appendText(node, "eml:Description", citation.description);
  }
}

bool readCitation(const pugi::xml_node &node, Citation &citation, Error *outError) {
  std::pair<const char *, std::string *> members[] = {
      {"Title", &citation.title},           {"Originator", &citation.originator},
      {"Creation", &citation.creation},     {"LastUpdate", &citation.lastUpdate},
      {"Format", &citation.format},         {"Description", &citation.description}};
  for (auto &[name, target] : members) {
    if (pugi::xml_node child = childElement(node, name)) {
      *target = child.child_value();
    }
  }

  if (pugi::xml_node version = childElement(node, "VersionString")) {
    if (!parseInteger(std::string_view(version.child_value()), citation.version)) {
      return fail(outError, malformed(fmt::format("version '{}' is not a 64-bit integer",
                                                  version.child_value()),
                                      "citation.version"));
    }
  }
  return true;
}

void appendReference(pugi::xml_node &root, const std::string &name, const Oid &target,
                     const ReferenceLookup &lookup) {
  pugi::xml_node node = appendNamed(root, name);
  setType(node, "eml:DataObjectReference");
  if (auto known = lookup ? lookup(target) : std::nullopt) {
    appendText(node, "eml:ContentType", objectContentType(known->type));
    appendText(node, "eml:Title", known->title);
  }
  appendText(node, "eml:UUID", target.str());
}

void appendArray(pugi::xml_node &root, const ArrayHandle &handle) {
  pugi::xml_node node = appendNamed(root, handle.name);
  setType(node, "resqml2:ExternalDataArray");
  appendText(node, "resqml2:Dtype", toString(handle.dtype));
  appendText(node, "resqml2:Shape", fmt::format("{}", fmt::join(handle.shape, " ")));
  appendText(node, "resqml2:Compression", toString(handle.compression));
  appendText(node, "eml:PathInExternalFile", handle.path);
}

std::optional<ArrayHandle> readArray(const pugi::xml_node &node, const std::string &name,
                                     Error *outError) {
  std::string field = fmt::format("arrays.{}", name);
  ArrayHandle handle;
  handle.name = name;

  for (std::string_view token : splitWhitespace(childText(node, "Shape"))) {
    uint64_t dim = 0;
    if (!parseInteger(token, dim) || dim == 0) {
      fail(outError, malformed("dimensions must be positive integers", field + ".shape"));
      return std::nullopt;
    }
    handle.shape.push_back(dim);
  }
  if (handle.shape.empty()) {
    fail(outError, malformed("expected a non-empty shape", field + ".shape"));
    return std::nullopt;
  }

  auto dtype = parseDtype(childText(node, "Dtype"));
  if (!dtype) {
    fail(outError, malformed("unknown dtype", field + ".dtype"));
    return std::nullopt;
  }
  handle.dtype = *dtype;

  handle.path = normalizePartName(childText(node, "PathInExternalFile"));
  if (handle.path.empty()) {
    fail(outError, malformed("expected a payload path", field + ".path"));
    return std::nullopt;
  }

  if (pugi::xml_node compression = childElement(node, "Compression")) {
    auto parsed = parseCompression(compression.child_value());
    if (!parsed) {
      fail(outError, malformed("unknown compression", field + ".compression"));
      return std::nullopt;
    }
    handle.compression = *parsed;
  }
  return handle;
}

} // namespace

std::string utcTimestamp() {
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(std::time(nullptr)));
}

std::string metadataPartName(std::string_view type, const Oid &oid) {
  return fmt::format("obj_{}_{}.xml", type, oid.str());
}

std::vector<Oid> Document::referencedOids() const {
  std::vector<Oid> result;
  for (const auto &[name, targets] : references) {
    result.insert(result.end(), targets.begin(), targets.end());
  }
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

std::string Document::defaultPartName() const {
  return metadataPartName(type, oid);
}

std::vector<uint8_t> Document::encode(const ReferenceLookup &lookup) const {
  pugi::xml_document xml;
  startXml(xml);

  std::string rootName = fmt::format("resqml2:obj_{}", type);
  pugi::xml_node root = xml.append_child(rootName.c_str());
  root.append_attribute("xmlns:resqml2") = kResqmlNamespace;
  root.append_attribute("xmlns:eml") = kEmlNamespace;
  root.append_attribute("xmlns:xsi") = kXsiNamespace;
  root.append_attribute("xmlns:xsd") = kXsdNamespace;
  root.append_attribute("uuid") = oid.str().c_str();
  root.append_attribute("schemaVersion") = std::string(schemaVersion).c_str();

  appendCitation(root, citation);
  for (const auto &[name, value] : extraMetadata) {
    pugi::xml_node node = root.append_child("resqml2:ExtraMetadata");
    appendText(node, "resqml2:Name", name);
    appendText(node, "resqml2:Value", value);
  }
  if (fields.is_object()) {
    for (const auto &[name, value] : fields.items()) {
      appendValue(appendNamed(root, name), value);
    }
  }
  for (const auto &[name, targets] : references) {
    for (const auto &target : targets) {
      appendReference(root, name, target, lookup);
    }
  }
  for (const auto &[name, handle] : arrays) {
    appendArray(root, handle);
  }
  return xmlBytes(xml);
}

std::optional<Document> Document::decode(std::span<const uint8_t> bytes, Error *outError) {
  pugi::xml_document xml;
  if (!parseXml(bytes, xml, outError)) {
    return std::nullopt;
  }
  pugi::xml_node root = xml.document_element();

  Document document;
  std::string_view rootName = localName(root.name());
  if (!rootName.starts_with("obj_") || rootName.size() == 4) {
    fail(outError, malformed(fmt::format("root element {} does not name an object type",
                                         root.name()),
                             "type"));
    return std::nullopt;
  }
  document.type = std::string(rootName.substr(4));

  auto oid = Oid::parse(root.attribute("uuid").value());
  if (!oid) {
    fail(outError, malformed("missing or malformed uuid", "uuid"));
    return std::nullopt;
  }
  document.oid = *oid;

  if (pugi::xml_attribute version = root.attribute("schemaVersion")) {
    std::string_view text = version.value();
    if (text != schemaVersion && !text.starts_with(fmt::format("{}.", schemaVersion))) {
      fail(outError, malformed(fmt::format("unsupported schema version '{}'", text),
                               "schemaVersion"));
      return std::nullopt;
    }
  }

  for (pugi::xml_node child = root.first_child(); child; child = child.next_sibling()) {
    if (child.type() != pugi::node_element) {
      continue;
    }
    std::string_view element = localName(child.name());
    std::string_view type = localName(child.attribute("xsi:type").value());

    if (type.empty() && !isNil(child)) {
      if (element == "Citation") {
        if (!readCitation(child, document.citation, outError)) {
          return std::nullopt;
        }
      } else if (element == "ExtraMetadata") {
        std::string key = childText(child, "Name");
        if (key.empty()) {
          fail(outError, malformed("extra metadata without a name", "extraMetadata"));
          return std::nullopt;
        }
        document.extraMetadata[key] = childText(child, "Value");
      } else {
        fail(outError, malformed(fmt::format("element {} has no xsi:type", child.name()),
                                 nameOf(child)));
        return std::nullopt;
      }
      continue;
    }

    std::string name = nameOf(child);
    if (type == "DataObjectReference") {
      auto target = Oid::parse(childText(child, "UUID"));
      if (!target) {
        fail(outError, malformed("malformed uuid", fmt::format("references.{}", name)));
        return std::nullopt;
      }
      document.references[name].push_back(*target);
    } else if (type == "ExternalDataArray") {
      if (document.arrays.contains(name)) {
        fail(outError, malformed("array declared twice", fmt::format("arrays.{}", name)));
        return std::nullopt;
      }
      auto handle = readArray(child, name, outError);
      if (!handle) {
        return std::nullopt;
      }
      document.arrays[name] = std::move(*handle);
    } else {
      std::string field = fmt::format("fields.{}", name);
      if (document.fields.contains(name)) {
        fail(outError, malformed("field given twice", field));
        return std::nullopt;
      }
      auto value = readValue(child, field, outError);
      if (!value) {
        return std::nullopt;
      }
      document.fields[name] = std::move(*value);
    }
  }

  return document;
}

bool Document::equivalentTo(const Document &other) const {
  if (type != other.type || fields != other.fields || references != other.references ||
      extraMetadata != other.extraMetadata || arrays.size() != other.arrays.size()) {
    return false;
  }
  // Array payloads live under distinct paths, so compare declarations only
  for (const auto &[name, handle] : arrays) {
    auto it = other.arrays.find(name);
    if (it == other.arrays.end() || it->second.shape != handle.shape ||
        it->second.dtype != handle.dtype) {
      return false;
    }
  }
  return true;
}

} // namespace resqx
