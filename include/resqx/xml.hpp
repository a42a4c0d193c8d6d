#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <pugixml.hpp>

#include "error.hpp"

namespace resqx {

// Parse one XML part into out. Malformed text is reported as Corruption with
// the byte offset pugixml stopped at; a document without a root element is refused.
bool parseXml(std::span<const uint8_t> bytes, pugi::xml_document &out, Error *outError = nullptr);

// Empty document holding only the XML declaration
void startXml(pugi::xml_document &document);

// Indented UTF-8 serialization of a document
std::vector<uint8_t> xmlBytes(const pugi::xml_document &document);

// "eml:Title" -> "Title"
std::string_view localName(std::string_view qualified);

// First child element with the given local name, whatever its prefix; empty node if none
pugi::xml_node childElement(const pugi::xml_node &parent, std::string_view name);

// Text of childElement(parent, name); empty if absent
std::string childText(const pugi::xml_node &parent, std::string_view name);

// Child element holding text
pugi::xml_node appendText(pugi::xml_node &parent, const char *name, std::string_view text);

} // namespace resqx
