#include <fmt/format.h>

#include <resqx/xml.hpp>

namespace resqx {

namespace {

struct ByteWriter : pugi::xml_writer {
  std::vector<uint8_t> bytes;

  void write(const void *data, size_t size) override {
    const uint8_t *p = static_cast<const uint8_t *>(data);
    bytes.insert(bytes.end(), p, p + size);
  }
};

} // namespace

bool parseXml(std::span<const uint8_t> bytes, pugi::xml_document &out, Error *outError) {
  // Keep whitespace-only text, so that string values survive unchanged
  unsigned int flags = pugi::parse_default | pugi::parse_ws_pcdata_single;
  flags &= ~pugi::parse_doctype;

  const pugi::xml_parse_result result =
      out.load_buffer(bytes.data(), bytes.size(), flags, pugi::encoding_utf8);
  if (!result) {
    return fail(outError, Error(ErrorCode::Corruption,
                                fmt::format("Malformed XML at offset {}: {}", result.offset,
                                            result.description())));
  }
  if (!out.document_element()) {
    return fail(outError, Error(ErrorCode::Corruption, "XML part has no root element"));
  }
  return true;
}

void startXml(pugi::xml_document &document) {
  document.reset();
  pugi::xml_node declaration = document.append_child(pugi::node_declaration);
  declaration.append_attribute("version") = "1.0";
  declaration.append_attribute("encoding") = "UTF-8";
  declaration.append_attribute("standalone") = "yes";
}

std::vector<uint8_t> xmlBytes(const pugi::xml_document &document) {
  ByteWriter writer;
  document.save(writer, "  ", pugi::format_default, pugi::encoding_utf8);
  return std::move(writer.bytes);
}

std::string_view localName(std::string_view qualified) {
  size_t colon = qualified.find(':');
  return colon == std::string_view::npos ? qualified : qualified.substr(colon + 1);
}

pugi::xml_node childElement(const pugi::xml_node &parent, std::string_view name) {
  for (pugi::xml_node child = parent.first_child(); child; child = child.next_sibling()) {
    if (child.type() == pugi::node_element && localName(child.name()) == name) {
      return child;
    }
  }
  return {};
}

std::string childText(const pugi::xml_node &parent, std::string_view name) {
  return childElement(parent, name).child_value();
}

pugi::xml_node appendText(pugi::xml_node &parent, const char *name, std::string_view text) {
  pugi::xml_node child = parent.append_child(name);
  child.append_child(pugi::node_pcdata).set_value(std::string(text).c_str());
  return child;
}

} // namespace resqx
