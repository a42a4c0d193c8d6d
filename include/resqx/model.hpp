#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.hpp"
#include "kinds.hpp"
#include "object.hpp"
#include "package.hpp"

namespace resqx {

// Content of a new object for Model::create
struct ObjectSpec {
  std::string title;
  nlohmann::json fields = nlohmann::json::object();
  std::map<std::string, std::vector<Oid>> references;
  std::map<std::string, ArrayData> arrays;
  std::map<std::string, std::string> extraMetadata;
};

// Typed object API over one package. Collaborators work with Object kinds,
// OIDs and arrays only; catalog and package internals stay behind it.
class Model {
public:
  explicit Model(PackageOptions options = {},
                 const KindRegistry &kinds = KindRegistry::builtin());

  Model(Package package, const KindRegistry &kinds = KindRegistry::builtin());

  // Delete copy, enable move
  Model(const Model &) = delete;
  Model &operator=(const Model &) = delete;
  Model(Model &&) noexcept = default;
  Model &operator=(Model &&) noexcept = default;

  static std::optional<Model> load(const std::filesystem::path &path, PackageOptions options = {},
                                   LoadReport *report = nullptr, Error *outError = nullptr,
                                   const KindRegistry &kinds = KindRegistry::builtin());

  bool save(const std::filesystem::path &path, Error *outError = nullptr);

  // Build, validate and add a new object of the given kind
  std::optional<Oid> create(std::string_view kind, ObjectSpec spec, Error *outError = nullptr);

  // Add an object built by the caller. On success the object holds its stored
  // state (OID, revision, array handles).
  std::optional<Oid> add(Object &object, const std::map<std::string, ArrayData> &arrays = {},
                         Error *outError = nullptr);

  // Store changes made to an object read through get(). Fails with
  // ConcurrentModification if the object changed in the package since.
  bool update(Object &object, Error *outError = nullptr);

  std::unique_ptr<Object> get(const Oid &oid, Error *outError = nullptr) const;

  template <typename T> std::unique_ptr<T> getAs(const Oid &oid, Error *outError = nullptr) const {
    auto object = get(oid, outError);
    if (!object) {
      return nullptr;
    }
    if (!dynamic_cast<T *>(object.get())) {
      Error error(ErrorCode::Validation, "Object has a different kind: " + object->kind());
      fail(outError, error.withOid(oid.str()));
      return nullptr;
    }
    return std::unique_ptr<T>(static_cast<T *>(object.release()));
  }

  bool setField(const Oid &oid, const std::string &name, nlohmann::json value,
                Error *outError = nullptr);

  std::shared_ptr<const ArrayData> getArray(const Oid &oid, const std::string &name,
                                            Error *outError = nullptr);

  bool setArray(const Oid &oid, const std::string &name, const ArrayData &data,
                Error *outError = nullptr);

  bool remove(const Oid &oid, RemoveMode mode = RemoveMode::Strict,
              RemovalReport *report = nullptr, Error *outError = nullptr);

  // OIDs of every object of a kind (all objects when empty), in insertion order
  std::vector<Oid> objects(std::string_view kind = {}) const;

  Package &package() { return package_; }
  const Package &package() const { return package_; }

  const KindRegistry &kinds() const { return *kinds_; }

private:
  Package package_;
  const KindRegistry *kinds_;
};

} // namespace resqx
