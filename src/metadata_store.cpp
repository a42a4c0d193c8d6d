#include <algorithm>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <resqx/log.hpp>
#include <resqx/metadata_store.hpp>

namespace resqx {

MetadataStore::MetadataStore(Catalog &catalog, const ArrayStore &arrays,
                             const SchemaRegistry &schemas, std::recursive_mutex &mutex)
    : catalog_(catalog), arrays_(arrays), schemas_(schemas), mutex_(mutex) {}

ErrorList MetadataStore::validate(const Document &document) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  ErrorList errors;

  const TypeSchema *schema = schemas_.find(document.type);
  if (!schema) {
    Error error(ErrorCode::Validation, fmt::format("Unknown object type '{}'", document.type));
    errors.push_back(error.withField("type"));
  }
  if (document.oid.isNil()) {
    Error error(ErrorCode::Validation, "Object has no OID");
    errors.push_back(error.withField("uuid"));
  }

  if (schema) {
    for (auto &error : schema->validateFields(document.fields)) {
      errors.push_back(std::move(error));
    }
    validateReferences(document, *schema, errors);
    validateArrays(document, *schema, errors);
    if (errors.empty() && schema->check) {
      for (auto &error : schema->check(document)) {
        errors.push_back(std::move(error));
      }
    }
  }

  const CatalogEntry *entry = catalog_.resolve(document.oid);
  std::string part = entry ? entry->partName : document.defaultPartName();
  for (auto &error : errors) {
    error.withOid(document.oid.str());
    if (error.part.empty()) {
      error.withPart(part);
    }
  }
  return errors;
}

void MetadataStore::validateReferences(const Document &document, const TypeSchema &schema,
                                       ErrorList &errors) const {
  for (const auto &[name, targets] : document.references) {
    std::string field = fmt::format("references.{}", name);
    const ReferenceSpec *spec = schema.reference(name);
    if (!spec) {
      Error error(ErrorCode::Validation, fmt::format("unknown reference for type {}", schema.type));
      errors.push_back(error.withField(field));
      continue;
    }
    if (spec->maxCount != 0 && targets.size() > spec->maxCount) {
      Error error(ErrorCode::Validation, fmt::format("at most {} target(s) allowed, got {}",
                                                     spec->maxCount, targets.size()));
      errors.push_back(error.withField(field));
    }

    for (const auto &target : targets) {
      std::string targetType;
      if (target == document.oid) {
        targetType = document.type;
      } else if (const CatalogEntry *entry = catalog_.resolve(target)) {
        targetType = entry->type;
      } else {
        Error error(ErrorCode::DanglingReference,
                    fmt::format("reference to unknown object {}", target.str()));
        errors.push_back(error.withField(field));
        continue;
      }

      if (!spec->targetTypes.empty() &&
          std::find(spec->targetTypes.begin(), spec->targetTypes.end(), targetType) ==
              spec->targetTypes.end()) {
        Error error(ErrorCode::Validation,
                    fmt::format("target {} has type {}, expected {}", target.str(), targetType,
                                fmt::join(spec->targetTypes, " or ")));
        errors.push_back(error.withField(field));
      }
    }

    if (spec->acyclic) {
      for (const auto &target : targets) {
        if (target == document.oid || reachesThrough(target, document, name)) {
          Error error(ErrorCode::Validation,
                      fmt::format("reference cycle through {}", name));
          errors.push_back(error.withField(field));
          break;
        }
      }
    }
  }

  for (const auto &spec : schema.references) {
    auto it = document.references.find(spec.name);
    if (spec.required && (it == document.references.end() || it->second.empty())) {
      Error error(ErrorCode::Validation, "required reference missing");
      errors.push_back(error.withField(fmt::format("references.{}", spec.name)));
    }
  }
}

// True if following field from start, over stored documents, leads back to document
bool MetadataStore::reachesThrough(const Oid &start, const Document &document,
                                   const std::string &field) const {
  std::set<Oid> visited;
  std::vector<Oid> pending{start};
  while (!pending.empty()) {
    Oid current = pending.back();
    pending.pop_back();
    if (current == document.oid) {
      return true;
    }
    if (!visited.insert(current).second) {
      continue;
    }
    auto it = documents_.find(current);
    if (it == documents_.end()) {
      continue;
    }
    if (auto refs = it->second.references.find(field); refs != it->second.references.end()) {
      pending.insert(pending.end(), refs->second.begin(), refs->second.end());
    }
  }
  return false;
}

void MetadataStore::validateArrays(const Document &document, const TypeSchema &schema,
                                   ErrorList &errors) const {
  for (const auto &[name, handle] : document.arrays) {
    std::string field = fmt::format("arrays.{}", name);
    const ArraySpec *spec = schema.array(name);
    if (!spec) {
      Error error(ErrorCode::Validation, fmt::format("unknown array for type {}", schema.type));
      errors.push_back(error.withField(field));
      continue;
    }
    if (!spec->dtypes.empty() &&
        std::find(spec->dtypes.begin(), spec->dtypes.end(), handle.dtype) == spec->dtypes.end()) {
      Error error(ErrorCode::Validation,
                  fmt::format("dtype {} not allowed", toString(handle.dtype)));
      errors.push_back(error.withField(field));
    }

    auto stored = arrays_.find(handle.path);
    if (!stored) {
      Error error(ErrorCode::NotFound, "array handle has no entry in the array store");
      errors.push_back(error.withField(field).withPart(handle.path));
    } else if (stored->shape != handle.shape || stored->dtype != handle.dtype) {
      Error error(ErrorCode::ShapeMismatch,
                  fmt::format("handle declares {} of {}, array store holds {} of {}",
                              shapeString(handle.shape), toString(handle.dtype),
                              shapeString(stored->shape), toString(stored->dtype)));
      errors.push_back(error.withField(field).withPart(handle.path));
    }
  }

  for (const auto &spec : schema.arrays) {
    if (spec.required && !document.arrays.contains(spec.name)) {
      Error error(ErrorCode::Validation, "required array missing");
      errors.push_back(error.withField(fmt::format("arrays.{}", spec.name)));
    }
  }
}

bool MetadataStore::put(Document &document, std::string partName, Error *outError) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  ErrorList errors = validate(document);
  if (!errors.empty()) {
    return fail(outError, firstError(errors));
  }

  auto refs = document.referencedOids();
  std::set<Oid> references(refs.begin(), refs.end());
  Document stored = document;

  auto existing = documents_.find(document.oid);
  if (existing != documents_.end()) {
    const Document &current = existing->second;
    if (current.revision != document.revision) {
      Error error(ErrorCode::ConcurrentModification,
                  fmt::format("Document changed since it was read (revision {}, stored {})",
                              document.revision, current.revision));
      return fail(outError, error.withOid(document.oid.str()));
    }
    if (current.type != document.type) {
      Error error(ErrorCode::Validation, "Object type cannot change");
      return fail(outError, error.withOid(document.oid.str()).withField("type"));
    }

    stored.revision = current.revision + 1;
    stored.citation.version = current.citation.version + 1;
    stored.citation.lastUpdate = utcTimestamp();
    if (stored.citation.creation.empty()) {
      stored.citation.creation = current.citation.creation;
    }

    if (!catalog_.updateReferences(document.oid, std::move(references), outError) ||
        !catalog_.updateCitation(document.oid, stored.citation, outError) ||
        !catalog_.setValid(document.oid, true, outError)) {
      return false;
    }
    existing->second = stored;
    logger()->debug("Replaced {} {} (revision {})", stored.type, stored.oid.str(),
                    stored.revision);
  } else {
    stored.revision = 0;
    if (stored.citation.creation.empty()) {
      stored.citation.creation = utcTimestamp();
    }

    CatalogEntry entry;
    entry.oid = stored.oid;
    entry.type = stored.type;
    entry.partName = partName.empty() ? stored.defaultPartName() : std::move(partName);
    entry.citation = stored.citation;
    entry.references = std::move(references);
    if (!catalog_.insert(std::move(entry), outError)) {
      return false;
    }
    documents_.emplace(stored.oid, stored);
    logger()->debug("Added {} {}", stored.type, stored.oid.str());
  }

  document = std::move(stored);
  return true;
}

std::optional<Document> MetadataStore::get(const Oid &oid, Error *outError) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto it = documents_.find(oid);
  if (it == documents_.end()) {
    fail(outError, Error(ErrorCode::NotFound, "No metadata document").withOid(oid.str()));
    return std::nullopt;
  }
  return it->second;
}

bool MetadataStore::contains(const Oid &oid) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return documents_.contains(oid);
}

std::optional<Document> MetadataStore::remove(const Oid &oid, RemoveMode mode,
                                              RemovalReport *report, Error *outError) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (!catalog_.remove(oid, mode, report, outError)) {
    return std::nullopt;
  }

  std::optional<Document> removed;
  if (auto it = documents_.find(oid); it != documents_.end()) {
    removed = std::move(it->second);
    documents_.erase(it);
  }
  if (!removed) {
    fail(outError, Error(ErrorCode::NotFound, "No metadata document").withOid(oid.str()));
  }
  return removed;
}

void MetadataStore::restore(Document document) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  Oid oid = document.oid;
  documents_.insert_or_assign(oid, std::move(document));
}

size_t MetadataStore::size() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return documents_.size();
}

void MetadataStore::clear() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  documents_.clear();
}

} // namespace resqx
