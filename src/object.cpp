#include <fmt/format.h>

#include <resqx/object.hpp>

namespace resqx {

Object::Object(std::string kind) {
  document_.type = std::move(kind);
}

std::vector<ArrayHandle> Object::referencedArrays() const {
  std::vector<ArrayHandle> result;
  result.reserve(document_.arrays.size());
  for (const auto &[name, handle] : document_.arrays) {
    result.push_back(handle);
  }
  return result;
}

bool Object::load(Document document, Error *outError) {
  if (document.type != document_.type) {
    Error error(ErrorCode::Validation, fmt::format("Cannot load a {} document into a {} object",
                                                   document.type, document_.type));
    return fail(outError, error.withOid(document.oid.str()).withField("type"));
  }
  document_ = std::move(document);
  return true;
}

void Object::setField(const std::string &name, nlohmann::json value) {
  document_.fields[name] = std::move(value);
}

void Object::clearField(const std::string &name) {
  document_.fields.erase(name);
}

std::optional<Oid> Object::reference(const std::string &name) const {
  auto it = document_.references.find(name);
  if (it == document_.references.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.front();
}

std::vector<Oid> Object::references(const std::string &name) const {
  auto it = document_.references.find(name);
  return it == document_.references.end() ? std::vector<Oid>{} : it->second;
}

void Object::setReference(const std::string &name, const Oid &target) {
  document_.references[name] = {target};
}

void Object::setReferences(const std::string &name, std::vector<Oid> targets) {
  document_.references[name] = std::move(targets);
}

void Object::clearReference(const std::string &name) {
  document_.references.erase(name);
}

std::optional<ArrayHandle> Object::array(const std::string &name) const {
  auto it = document_.arrays.find(name);
  if (it == document_.arrays.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Object::setArrayHandle(ArrayHandle handle) {
  std::string name = handle.name;
  document_.arrays[name] = std::move(handle);
}

void Object::setExtraMetadata(const std::string &key, std::string value) {
  document_.extraMetadata[key] = std::move(value);
}

Error Object::invalid(std::string field, std::string message) const {
  Error error(ErrorCode::Validation, std::move(message));
  error.withOid(document_.oid.str()).withField(std::move(field));
  return error;
}

} // namespace resqx
