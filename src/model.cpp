#include <fmt/format.h>

#include <resqx/log.hpp>
#include <resqx/model.hpp>

namespace resqx {

Model::Model(PackageOptions options, const KindRegistry &kinds)
    : package_(Package::create(std::move(options), kinds.schemas())), kinds_(&kinds) {}

Model::Model(Package package, const KindRegistry &kinds)
    : package_(std::move(package)), kinds_(&kinds) {
  for (const auto &type : kinds.schemas().types()) {
    if (package_.schemas().contains(type)) {
      continue;
    }
    Error error;
    if (!package_.schemas().add(*kinds.schemas().find(type), &error)) {
      logger()->warn("Schema of kind {} not added: {}", type, error.describe());
    }
  }
}

std::optional<Model> Model::load(const std::filesystem::path &path, PackageOptions options,
                                 LoadReport *report, Error *outError, const KindRegistry &kinds) {
  auto package = Package::open(path, std::move(options), kinds.schemas(), report, outError);
  if (!package) {
    return std::nullopt;
  }
  return Model(std::move(*package), kinds);
}

bool Model::save(const std::filesystem::path &path, Error *outError) {
  return package_.save(path, outError);
}

std::optional<Oid> Model::create(std::string_view kind, ObjectSpec spec, Error *outError) {
  auto object = kinds_->make(kind, outError);
  if (!object) {
    return std::nullopt;
  }
  if (!spec.fields.is_object()) {
    Error error(ErrorCode::Validation, "fields must be a JSON object");
    fail(outError, error.withField("fields"));
    return std::nullopt;
  }

  object->setTitle(std::move(spec.title));
  for (const auto &[name, value] : spec.fields.items()) {
    object->setField(name, value);
  }
  for (auto &[name, targets] : spec.references) {
    object->setReferences(name, std::move(targets));
  }
  for (auto &[key, value] : spec.extraMetadata) {
    object->setExtraMetadata(key, std::move(value));
  }
  return add(*object, spec.arrays, outError);
}

std::optional<Oid> Model::add(Object &object, const std::map<std::string, ArrayData> &arrays,
                              Error *outError) {
  if (!kinds_->contains(object.kind())) {
    Error error(ErrorCode::Validation, fmt::format("Unknown object kind '{}'", object.kind()));
    fail(outError, error.withField("type"));
    return std::nullopt;
  }

  auto oid = package_.addPart(object.serialize(), arrays, outError);
  if (!oid) {
    return std::nullopt;
  }
  auto stored = package_.document(*oid, outError);
  if (!stored || !object.load(std::move(*stored), outError)) {
    return std::nullopt;
  }
  return oid;
}

bool Model::update(Object &object, Error *outError) {
  Document document = object.serialize();
  if (!package_.updatePart(document, outError)) {
    return false;
  }
  return object.load(std::move(document), outError);
}

std::unique_ptr<Object> Model::get(const Oid &oid, Error *outError) const {
  auto document = package_.document(oid, outError);
  if (!document) {
    return nullptr;
  }
  auto object = kinds_->make(document->type, outError);
  if (!object || !object->load(std::move(*document), outError)) {
    return nullptr;
  }
  return object;
}

bool Model::setField(const Oid &oid, const std::string &name, nlohmann::json value,
                     Error *outError) {
  auto object = get(oid, outError);
  if (!object) {
    return false;
  }
  object->setField(name, std::move(value));
  return update(*object, outError);
}

std::shared_ptr<const ArrayData> Model::getArray(const Oid &oid, const std::string &name,
                                                 Error *outError) {
  return package_.getArray(oid, name, outError);
}

bool Model::setArray(const Oid &oid, const std::string &name, const ArrayData &data,
                     Error *outError) {
  auto object = get(oid, outError);
  if (!object) {
    return false;
  }

  // A new array must satisfy the kind checks before anything is written
  if (!object->array(name)) {
    ArrayHandle proposed;
    proposed.name = name;
    proposed.shape = data.shape;
    proposed.dtype = data.dtype;
    object->setArrayHandle(proposed);
    ErrorList errors = object->validate();
    if (!errors.empty()) {
      return fail(outError, firstError(errors));
    }
  }
  return package_.setArray(oid, name, data, outError);
}

bool Model::remove(const Oid &oid, RemoveMode mode, RemovalReport *report, Error *outError) {
  return package_.removePart(oid, mode, report, outError);
}

std::vector<Oid> Model::objects(std::string_view kind) const {
  return package_.oids(kind);
}

} // namespace resqx
