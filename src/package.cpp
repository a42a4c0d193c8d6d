#include <algorithm>
#include <cctype>
#include <deque>
#include <functional>
#include <mutex>

#include <fmt/format.h>

#include <resqx/log.hpp>
#include <resqx/package.hpp>
#include <resqx/reader.hpp>

namespace resqx {

namespace {

// Array payloads of a saved container, served as zero-copy views of the mapping
class ContainerPayloadSource : public PayloadSource {
public:
  explicit ContainerPayloadSource(ContainerReader reader) : reader_(std::move(reader)) {}

  std::optional<std::span<const uint8_t>> payload(std::string_view path,
                                                  Error *outError) const override {
    const PartEntry *entry = reader_.findPart(path);
    if (!entry) {
      Error error(ErrorCode::NotFound, "Array payload part missing from container");
      fail(outError, error.withPart(std::string(path)));
      return std::nullopt;
    }
    if (entry->method != ZipMethod::Stored) {
      Error error(ErrorCode::Corruption, "Array payload part is compressed");
      fail(outError, error.withPart(entry->name));
      return std::nullopt;
    }
    auto bytes = reader_.view(*entry);
    if (bytes.size() != entry->compressedSize) {
      Error error(ErrorCode::Corruption, "Array payload part out of bounds");
      fail(outError, error.withPart(entry->name));
      return std::nullopt;
    }
    return bytes;
  }

  const ContainerReader &reader() const { return reader_; }

private:
  ContainerReader reader_;
};

std::string lowered(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

bool titleMatches(const std::string &title, std::string_view wanted, TitleMode mode) {
  if (wanted.empty()) {
    return true;
  }
  std::string haystack = lowered(title);
  std::string needle = lowered(wanted);
  switch (mode) {
  case TitleMode::Exact:
    return haystack == needle;
  case TitleMode::StartsWith:
    return haystack.starts_with(needle);
  case TitleMode::EndsWith:
    return haystack.ends_with(needle);
  }
  return false;
}

// Release a handle that is no longer referenced by any document
void dropArray(ArrayStore &arrays, const ArrayHandle &handle) {
  Error error;
  if (!arrays.release(handle, &error)) {
    logger()->warn("Could not release array: {}", error.describe());
  }
}

// Lowercase part names an object's relationship part should list, per direction
struct ObjectRelationships {
  std::set<std::string> destinations; // Objects it references
  std::set<std::string> sources;      // Objects referencing it
};

ObjectRelationships expectedRelationships(const Catalog &catalog, const CatalogEntry &entry) {
  ObjectRelationships result;
  for (const auto &target : entry.references) {
    const CatalogEntry *targetEntry = catalog.resolve(target);
    if (target != entry.oid && targetEntry) {
      result.destinations.insert(lowercasePartName(targetEntry->partName));
    }
  }
  for (const auto &source : catalog.referencing(entry.oid)) {
    const CatalogEntry *sourceEntry = catalog.resolve(source);
    if (source != entry.oid && sourceEntry) {
      result.sources.insert(lowercasePartName(sourceEntry->partName));
    }
  }
  return result;
}

std::vector<Relationship> objectRelationships(const Catalog &catalog, const CatalogEntry &entry) {
  std::vector<Relationship> relationships;
  auto add = [&](const Oid &oid, std::string_view type) {
    const CatalogEntry *other = catalog.resolve(oid);
    if (oid == entry.oid || !other) {
      return;
    }
    relationships.push_back(Relationship{fmt::format("rId{}", relationships.size() + 1),
                                         std::string(type),
                                         relativeTarget(entry.partName, other->partName)});
  };
  for (const auto &target : entry.references) {
    add(target, kDestinationObjectRelationship);
  }
  for (const auto &source : catalog.referencing(entry.oid)) {
    add(source, kSourceObjectRelationship);
  }
  return relationships;
}

} // namespace

struct Package::State {
  State(PackageOptions packageOptions, SchemaRegistry registry)
      : options(std::move(packageOptions)), schemas(std::move(registry)), arrays(options),
        metadata(catalog, arrays, schemas, mutex) {}

  PackageOptions options;
  SchemaRegistry schemas;
  std::recursive_mutex mutex; // Guards catalog and metadata together
  Catalog catalog;
  ArrayStore arrays;
  MetadataStore metadata;
  PackageProperties properties;
  std::filesystem::path path;
  std::shared_ptr<const ContainerPayloadSource> source;
  ContainerWriter::ProgressHook progressHook;
};

Package::Package() : state_(std::make_unique<State>(PackageOptions{}, SchemaRegistry{})) {}

Package::Package(std::unique_ptr<State> state) : state_(std::move(state)) {}

Package::~Package() = default;

Package::Package(Package &&) noexcept = default;

Package &Package::operator=(Package &&) noexcept = default;

Package Package::create(PackageOptions options, SchemaRegistry schemas) {
  auto state = std::make_unique<State>(std::move(options), std::move(schemas));
  state->properties.created = utcTimestamp();
  return Package(std::move(state));
}

std::optional<Package> Package::open(const std::filesystem::path &path, PackageOptions options,
                                     SchemaRegistry schemas, LoadReport *report,
                                     Error *outError) {
  auto reader = ContainerReader::open(path, outError);
  if (!reader) {
    return std::nullopt;
  }
  auto source = std::make_shared<const ContainerPayloadSource>(std::move(*reader));
  const ContainerReader &container = source->reader();

  auto state = std::make_unique<State>(std::move(options), std::move(schemas));
  state->path = path;
  state->source = source;

  LoadReport localReport;
  LoadReport &load = report ? *report : localReport;
  load = LoadReport{};
  load.partCount = container.partCount();

  auto diagnose = [&](Error error) {
    logger()->warn("{}: {}", path.string(), error.describe());
    load.diagnostics.push_back(std::move(error));
  };

  // Step 1: Content types decide the role of every part
  const PartEntry *typesPart = container.findPart(kContentTypesPart);
  if (!typesPart) {
    Error error(ErrorCode::Corruption, "Content types part missing");
    fail(outError, error.withPart(std::string(kContentTypesPart)));
    return std::nullopt;
  }
  Error typesError;
  auto typesBytes = container.extractToMemory(*typesPart, &typesError);
  auto contentTypes = typesBytes ? ContentTypes::decode(*typesBytes, &typesError) : std::nullopt;
  if (!contentTypes) {
    fail(outError, typesError.withPart(typesPart->name));
    return std::nullopt;
  }

  // Step 2: Catalog every metadata part
  std::vector<Document> documents;
  for (const auto &entry : container.parts()) {
    Error error;
    switch (contentTypes->classify(entry.name)) {
    case PartKind::Metadata: {
      auto bytes = container.extractToMemory(entry, &error);
      auto document = bytes ? Document::decode(*bytes, &error) : std::nullopt;
      if (!document) {
        diagnose(error.withPart(entry.name));
        break;
      }
      auto declared = objectTypeOf(contentTypes->lookup(entry.name));
      if (declared != document->type) {
        Error mismatch(ErrorCode::Corruption,
                       fmt::format("Content type declares '{}', document holds '{}'",
                                   declared.value_or(""), document->type));
        diagnose(mismatch.withOid(document->oid.str()).withPart(entry.name));
        break;
      }

      CatalogEntry catalogEntry;
      catalogEntry.oid = document->oid;
      catalogEntry.type = document->type;
      catalogEntry.partName = entry.name;
      catalogEntry.citation = document->citation;
      if (!state->catalog.insert(std::move(catalogEntry), &error)) {
        diagnose(error.withPart(entry.name));
        break;
      }
      documents.push_back(std::move(*document));
      break;
    }
    case PartKind::Array:
      ++load.arrayCount;
      break;
    case PartKind::Properties: {
      auto bytes = container.extractToMemory(entry, &error);
      auto properties = bytes ? decodeCoreProperties(*bytes, &error) : std::nullopt;
      if (!properties) {
        diagnose(error.withPart(entry.name));
        break;
      }
      state->properties = std::move(*properties);
      break;
    }
    case PartKind::Relationships:
    case PartKind::ContentTypes:
    case PartKind::Other:
      break;
    }
  }
  load.objectCount = documents.size();

  // Step 3: Attach array payloads and resolvable references
  std::set<std::string> failedArrays;
  std::map<Oid, ErrorList> problems;
  for (auto &document : documents) {
    for (const auto &[name, handle] : document.arrays) {
      Error error;
      if (!state->arrays.attach(handle, source, &error)) {
        failedArrays.insert(handle.path);
        error.message += fmt::format(" ({})", handle.path);
        error.withOid(document.oid.str()).withField(fmt::format("arrays.{}", name));
        problems[document.oid].push_back(std::move(error));
      }
    }

    std::set<Oid> resolvable;
    for (const auto &target : document.referencedOids()) {
      if (target == document.oid || state->catalog.contains(target)) {
        resolvable.insert(target);
      }
    }
    Error error;
    if (!state->catalog.updateReferences(document.oid, std::move(resolvable), &error)) {
      problems[document.oid].push_back(std::move(error));
    }
  }
  for (auto &document : documents) {
    state->metadata.restore(document);
  }

  // Step 4: Validate every document against its schema and the catalog
  for (const auto &document : documents) {
    for (auto &error : state->metadata.validate(document)) {
      if (error.code == ErrorCode::NotFound && failedArrays.contains(error.part)) {
        continue;
      }
      problems[document.oid].push_back(std::move(error));
    }
  }
  for (const auto &document : documents) {
    auto it = problems.find(document.oid);
    if (it == problems.end()) {
      continue;
    }
    std::string partName = state->catalog.resolve(document.oid)->partName;
    for (auto &error : it->second) {
      if (!error.part.empty() && error.part != partName) {
        error.message += fmt::format(" ({})", error.part);
      }
      error.part = partName;
      diagnose(std::move(error));
    }
    Error error;
    if (!state->catalog.setValid(document.oid, false, &error)) {
      diagnose(error);
    }
    load.invalidated.push_back(document.oid);
  }

  // Step 5: Each object's relationship part must match its references
  for (const auto &document : documents) {
    const CatalogEntry *entry = state->catalog.resolve(document.oid);
    ObjectRelationships expected = expectedRelationships(state->catalog, *entry);
    std::string relsName = relationshipsPartName(entry->partName);
    const PartEntry *relsPart = container.findPart(relsName);
    if (!relsPart) {
      if (!expected.destinations.empty() || !expected.sources.empty()) {
        Error error(ErrorCode::Corruption, "Relationships part missing");
        diagnose(error.withOid(document.oid.str()).withPart(relsName));
      }
      continue;
    }

    Error error;
    auto bytes = container.extractToMemory(*relsPart, &error);
    auto stored = bytes ? decodeRelationships(*bytes, &error) : std::nullopt;
    if (!stored) {
      diagnose(error.withOid(document.oid.str()).withPart(relsPart->name));
      continue;
    }
    ObjectRelationships found;
    for (const auto &relationship : *stored) {
      std::string target = resolveTarget(entry->partName, relationship.target);
      if (!state->catalog.findPart(target)) {
        continue;
      }
      if (relationship.type == kDestinationObjectRelationship) {
        found.destinations.insert(lowercasePartName(target));
      } else if (relationship.type == kSourceObjectRelationship) {
        found.sources.insert(lowercasePartName(target));
      }
    }
    if (found.destinations != expected.destinations || found.sources != expected.sources) {
      Error mismatch(ErrorCode::Corruption,
                     fmt::format("Relationships part lists {} destination(s) and {} source(s), "
                                 "references give {} and {}",
                                 found.destinations.size(), found.sources.size(),
                                 expected.destinations.size(), expected.sources.size()));
      diagnose(mismatch.withOid(document.oid.str()).withPart(relsPart->name));
    }
  }

  if (state->options.strictLoad && !load.clean()) {
    fail(outError, load.diagnostics.front());
    return std::nullopt;
  }

  logger()->info("Opened package {} ({} objects, {} arrays, {} diagnostics)", path.string(),
                 load.objectCount, load.arrayCount, load.diagnostics.size());
  return Package(std::move(state));
}

ErrorList Package::validate() const {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  ErrorList errors;

  for (const CatalogEntry *entry : state_->catalog.entries()) {
    auto document = state_->metadata.get(entry->oid);
    if (!document) {
      Error error(ErrorCode::NotFound, "Catalog entry has no metadata document");
      errors.push_back(error.withOid(entry->oid.str()).withPart(entry->partName));
      continue;
    }

    ErrorList documentErrors = state_->metadata.validate(*document);
    for (const auto &[name, handle] : document->arrays) {
      if (state_->arrays.contains(handle.path) && !state_->arrays.hasPayload(handle)) {
        Error error(ErrorCode::Validation, "array was allocated but never written");
        documentErrors.push_back(error.withOid(entry->oid.str())
                                     .withPart(entry->partName)
                                     .withField(fmt::format("arrays.{}", name)));
      }
    }
    if (!entry->valid && documentErrors.empty()) {
      Error error(ErrorCode::Validation, "object is flagged invalid");
      documentErrors.push_back(error.withOid(entry->oid.str()).withPart(entry->partName));
    }

    errors.insert(errors.end(), std::make_move_iterator(documentErrors.begin()),
                  std::make_move_iterator(documentErrors.end()));
  }
  return errors;
}

bool Package::save(const std::filesystem::path &destination, Error *outError) {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);

  ErrorList errors = validate();
  if (!errors.empty()) {
    return fail(outError, firstError(errors));
  }

  ContainerWriter writer;
  writer.setCompressionLevel(state_->options.compressionLevel);
  const Catalog &catalog = state_->catalog;

  // Step 1: Content types, package relationships and core properties
  ContentTypes contentTypes;
  contentTypes.addDefault("rels", kRelationshipsContentType);
  contentTypes.addDefault("bin", kArrayContentType);
  contentTypes.addOverride(kPropertiesPart, kCorePropertiesContentType);
  for (const CatalogEntry *entry : catalog.entries()) {
    contentTypes.addOverride(entry->partName, objectContentType(entry->type));
  }
  std::vector<Relationship> packageRelationships{
      {"rId1", std::string(kCorePropertiesRelationship),
       relativeTarget({}, kPropertiesPart)}};
  if (!writer.addPart(kContentTypesPart, ZipMethod::Deflate, contentTypes.encode(), outError) ||
      !writer.addPart(kRelationshipsPart, ZipMethod::Deflate,
                      encodeRelationships(packageRelationships), outError) ||
      !writer.addPart(kPropertiesPart, ZipMethod::Deflate,
                      encodeCoreProperties(state_->properties), outError)) {
    return false;
  }

  // Step 2: Metadata parts with their relationships, then array payloads stored as is
  ReferenceLookup lookup = [&catalog](const Oid &oid) -> std::optional<ReferenceTarget> {
    const CatalogEntry *entry = catalog.resolve(oid);
    if (!entry) {
      return std::nullopt;
    }
    return ReferenceTarget{entry->type, entry->citation.title};
  };
  std::deque<EncodedPayload> payloads; // Must outlive writer.write()
  std::vector<std::string> arrayPaths;
  std::set<std::string> written;
  for (const CatalogEntry *entry : catalog.entries()) {
    auto document = state_->metadata.get(entry->oid, outError);
    if (!document ||
        !writer.addPart(entry->partName, ZipMethod::Deflate, document->encode(lookup), outError)) {
      return false;
    }
    auto relationships = objectRelationships(catalog, *entry);
    if (!relationships.empty() &&
        !writer.addPart(relationshipsPartName(entry->partName), ZipMethod::Deflate,
                        encodeRelationships(relationships), outError)) {
      return false;
    }

    for (const auto &[name, handle] : document->arrays) {
      if (!written.insert(lowercasePartName(handle.path)).second) {
        continue;
      }
      Error error;
      auto payload = state_->arrays.encode(handle, &error);
      if (!payload) {
        return fail(outError, error.withOid(entry->oid.str()));
      }
      payloads.push_back(std::move(*payload));
      if (!writer.addBorrowedPart(handle.path, ZipMethod::Stored, payloads.back().bytes(),
                                  outError)) {
        return false;
      }
      arrayPaths.push_back(handle.path);
    }
  }

  // Step 3: Commit
  if (state_->progressHook) {
    writer.setProgressHook(state_->progressHook);
  }
  if (!writer.write(destination, outError)) {
    return false;
  }

  // Step 4: Rebind clean payloads to the new container
  auto reader = ContainerReader::open(destination, outError);
  if (!reader) {
    logger()->error("Saved container {} could not be reopened", destination.string());
    return false;
  }
  auto source = std::make_shared<const ContainerPayloadSource>(std::move(*reader));
  state_->arrays.markSaved(source, arrayPaths);
  state_->source = std::move(source);
  state_->path = destination;

  logger()->info("Saved package {} ({} objects, {} arrays)", destination.string(),
                 state_->catalog.size(), arrayPaths.size());
  return true;
}

bool Package::save(Error *outError) {
  if (state_->path.empty()) {
    return fail(outError, Error(ErrorCode::Validation, "Package has no container path yet"));
  }
  std::filesystem::path destination = state_->path;
  return save(destination, outError);
}

void Package::setProgressHook(ContainerWriter::ProgressHook hook) {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  state_->progressHook = std::move(hook);
}

std::optional<Oid> Package::addPart(Document document, const std::map<std::string, ArrayData> &arrays,
                                    Error *outError) {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);

  if (document.oid.isNil()) {
    do {
      document.oid = Oid::generate();
    } while (state_->catalog.contains(document.oid));
  } else if (state_->catalog.contains(document.oid)) {
    Error error(ErrorCode::Validation, "Duplicate OID in package");
    fail(outError, error.withOid(document.oid.str()));
    return std::nullopt;
  }

  std::vector<ArrayHandle> allocated;
  auto rollback = [&] {
    for (const auto &handle : allocated) {
      dropArray(state_->arrays, handle);
    }
  };

  for (const auto &[name, data] : arrays) {
    std::optional<Compression> compression;
    if (auto it = document.arrays.find(name); it != document.arrays.end()) {
      compression = it->second.compression;
    }

    Error error;
    auto handle = state_->arrays.allocate(data.shape, data.dtype, compression, &error);
    if (handle) {
      handle->name = name;
      allocated.push_back(*handle);
    }
    if (!handle || !state_->arrays.write(*handle, data, &error)) {
      rollback();
      fail(outError, error.withOid(document.oid.str()).withField(fmt::format("arrays.{}", name)));
      return std::nullopt;
    }
    document.arrays[name] = *handle;
  }

  if (!state_->metadata.put(document, {}, outError)) {
    rollback();
    return std::nullopt;
  }
  return document.oid;
}

bool Package::updatePart(Document &document, Error *outError) {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  if (!state_->catalog.contains(document.oid)) {
    Error error(ErrorCode::NotFound, "Unknown object");
    return fail(outError, error.withOid(document.oid.str()));
  }
  return state_->metadata.put(document, {}, outError);
}

bool Package::arrayShared(const std::string &path, const Oid &except) const {
  for (const auto &oid : state_->catalog.oids()) {
    if (oid == except) {
      continue;
    }
    auto document = state_->metadata.get(oid);
    if (!document) {
      continue;
    }
    for (const auto &[name, handle] : document->arrays) {
      if (handle.path == path) {
        return true;
      }
    }
  }
  return false;
}

bool Package::removePart(const Oid &oid, RemoveMode mode, RemovalReport *report,
                         Error *outError) {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  auto removed = state_->metadata.remove(oid, mode, report, outError);
  if (!removed) {
    return false;
  }

  for (const auto &[name, handle] : removed->arrays) {
    if (!arrayShared(handle.path, oid)) {
      dropArray(state_->arrays, handle);
    }
  }
  logger()->debug("Removed {} {}", removed->type, oid.str());
  return true;
}

bool Package::renamePart(const Oid &oid, std::string_view newName, Error *outError) {
  std::string normalized = normalizePartName(newName);
  std::string lowerName = lowercasePartName(normalized);
  for (std::string_view reserved : {kArrayPrefix, std::string_view("_rels/"),
                                    std::string_view("docprops/")}) {
    if (lowerName.starts_with(reserved)) {
      Error error(ErrorCode::Validation, fmt::format("Part names under '{}' are reserved", reserved));
      return fail(outError, error.withOid(oid.str()).withPart(normalized));
    }
  }
  if (lowerName == lowercasePartName(kContentTypesPart) ||
      lowerName.find("/_rels/") != std::string::npos) {
    Error error(ErrorCode::Validation, "Part name is reserved for packaging");
    return fail(outError, error.withOid(oid.str()).withPart(normalized));
  }

  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  return state_->catalog.rename(oid, std::move(normalized), outError);
}

std::optional<Document> Package::document(const Oid &oid, Error *outError) const {
  return state_->metadata.get(oid, outError);
}

bool Package::setArray(const Oid &oid, const std::string &name, const ArrayData &data,
                       Error *outError) {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  auto document = state_->metadata.get(oid, outError);
  if (!document) {
    return false;
  }

  Error error;
  if (auto it = document->arrays.find(name); it != document->arrays.end()) {
    if (!state_->arrays.write(it->second, data, &error)) {
      return fail(outError, error.withOid(oid.str()).withField(fmt::format("arrays.{}", name)));
    }
    return true;
  }

  auto handle = state_->arrays.allocate(data.shape, data.dtype, std::nullopt, &error);
  if (!handle) {
    return fail(outError, error.withOid(oid.str()).withField(fmt::format("arrays.{}", name)));
  }
  handle->name = name;
  if (!state_->arrays.write(*handle, data, &error)) {
    dropArray(state_->arrays, *handle);
    return fail(outError, error.withOid(oid.str()).withField(fmt::format("arrays.{}", name)));
  }

  document->arrays[name] = *handle;
  if (!state_->metadata.put(*document, {}, outError)) {
    dropArray(state_->arrays, *handle);
    return false;
  }
  return true;
}

std::shared_ptr<const ArrayData> Package::getArray(const Oid &oid, const std::string &name,
                                                   Error *outError) {
  auto document = state_->metadata.get(oid, outError);
  if (!document) {
    return nullptr;
  }
  auto it = document->arrays.find(name);
  if (it == document->arrays.end()) {
    Error error(ErrorCode::NotFound, "Object has no such array");
    fail(outError, error.withOid(oid.str()).withField(fmt::format("arrays.{}", name)));
    return nullptr;
  }

  Error error;
  auto data = state_->arrays.read(it->second, &error);
  if (!data) {
    fail(outError, error.withOid(oid.str()).withField(fmt::format("arrays.{}", name)));
  }
  return data;
}

std::vector<std::string> Package::parts(std::string_view type, std::string_view title,
                                        TitleMode mode) const {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  std::vector<std::string> result;
  for (const CatalogEntry *entry : state_->catalog.entries()) {
    if ((type.empty() || entry->type == type) &&
        titleMatches(entry->citation.title, title, mode)) {
      result.push_back(entry->partName);
    }
  }
  return result;
}

std::vector<Oid> Package::oids(std::string_view type, std::string_view title,
                               TitleMode mode) const {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  std::vector<Oid> result;
  for (const CatalogEntry *entry : state_->catalog.entries()) {
    if ((type.empty() || entry->type == type) &&
        titleMatches(entry->citation.title, title, mode)) {
      result.push_back(entry->oid);
    }
  }
  return result;
}

std::optional<std::string> Package::partName(const Oid &oid) const {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  const CatalogEntry *entry = state_->catalog.resolve(oid);
  if (!entry) {
    return std::nullopt;
  }
  return entry->partName;
}

ObjectGraph Package::graph(const std::set<Oid> *subset) const {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  ObjectGraph graph;
  for (const CatalogEntry *entry : state_->catalog.entries()) {
    if (!subset || subset->contains(entry->oid)) {
      graph.nodes[entry->oid] = GraphNode{entry->type, entry->citation.title};
    }
  }
  for (const auto &[oid, node] : graph.nodes) {
    for (const auto &target : state_->catalog.resolve(oid)->references) {
      if (target != oid && graph.nodes.contains(target)) {
        graph.edges.insert(std::minmax(oid, target));
      }
    }
  }
  return graph;
}

bool Package::copyAllPartsFrom(const Package &other, bool consolidate, std::map<Oid, Oid> *mapping,
                               Error *outError) {
  if (&other == this) {
    return fail(outError, Error(ErrorCode::Validation, "Cannot copy a package into itself"));
  }
  std::scoped_lock lock(state_->mutex, other.state_->mutex);
  State &source = *other.state_;

  // Referenced objects first, so that consolidation sees remapped references
  std::vector<Oid> order;
  std::set<Oid> visited;
  std::function<void(const Oid &)> visit = [&](const Oid &oid) {
    if (!visited.insert(oid).second) {
      return;
    }
    if (const CatalogEntry *entry = source.catalog.resolve(oid)) {
      for (const auto &target : entry->references) {
        visit(target);
      }
      order.push_back(oid);
    }
  };
  for (const auto &oid : source.catalog.oids()) {
    visit(oid);
  }

  auto sameArrays = [&](const Document &mine, const Document &theirs) {
    for (const auto &[name, handle] : mine.arrays) {
      Error error;
      auto a = state_->arrays.read(handle, &error);
      auto b = a ? source.arrays.read(theirs.arrays.at(name), &error) : nullptr;
      if (!a || !b) {
        logger()->debug("Not consolidating {}: {}", theirs.oid.str(), error.describe());
        return false;
      }
      if (*a != *b) {
        return false;
      }
    }
    return true;
  };

  std::map<Oid, Oid> remap;
  auto remapReferences = [&](Document &document) {
    for (auto &[name, targets] : document.references) {
      for (auto &target : targets) {
        if (auto it = remap.find(target); it != remap.end()) {
          target = it->second;
        }
      }
    }
  };

  std::vector<Document> pending;
  for (const auto &oid : order) {
    if (state_->catalog.contains(oid)) {
      remap[oid] = oid;
      continue;
    }
    auto document = source.metadata.get(oid, outError);
    if (!document) {
      return false;
    }
    remapReferences(*document);

    std::optional<Oid> match;
    if (consolidate) {
      for (const auto &candidate : state_->catalog.oids(document->type)) {
        auto existing = state_->metadata.get(candidate);
        if (existing && existing->equivalentTo(*document) && sameArrays(*existing, *document)) {
          match = candidate;
          break;
        }
      }
    }
    remap[oid] = match.value_or(oid);
    if (!match) {
      pending.push_back(std::move(*document));
    }
  }

  // Insert with empty reference sets first; cycles are then resolved in one pass
  std::vector<Oid> inserted;
  std::vector<ArrayHandle> allocated;
  auto rollback = [&] {
    for (auto it = inserted.rbegin(); it != inserted.rend(); ++it) {
      Error error;
      if (!state_->metadata.remove(*it, RemoveMode::Cascade, nullptr, &error)) {
        logger()->warn("Rollback of copied object failed: {}", error.describe());
      }
    }
    for (const auto &handle : allocated) {
      dropArray(state_->arrays, handle);
    }
  };

  for (auto &document : pending) {
    remapReferences(document);
    document.revision = 0;
    const CatalogEntry *sourceEntry = source.catalog.resolve(document.oid);

    for (auto &[name, handle] : document.arrays) {
      Error error;
      auto data = source.arrays.read(handle, &error);
      auto copy = data ? state_->arrays.allocate(handle.shape, handle.dtype, handle.compression,
                                                 &error)
                       : std::nullopt;
      if (copy) {
        copy->name = name;
        allocated.push_back(*copy);
      }
      if (!copy || !state_->arrays.write(*copy, *data, &error)) {
        rollback();
        return fail(outError, error.withOid(document.oid.str()));
      }
      handle = *copy;
    }

    CatalogEntry entry;
    entry.oid = document.oid;
    entry.type = document.type;
    entry.partName = sourceEntry->partName;
    if (state_->catalog.findPart(entry.partName)) {
      entry.partName = document.defaultPartName();
    }
    entry.citation = document.citation;
    entry.valid = sourceEntry->valid;
    Error error;
    if (!state_->catalog.insert(std::move(entry), &error)) {
      rollback();
      return fail(outError, error);
    }
    inserted.push_back(document.oid);
    state_->metadata.restore(document);
  }

  for (const auto &document : pending) {
    auto refs = document.referencedOids();
    Error error;
    if (!state_->catalog.updateReferences(document.oid, std::set<Oid>(refs.begin(), refs.end()),
                                          &error)) {
      rollback();
      return fail(outError, error);
    }
  }
  for (const auto &document : pending) {
    ErrorList errors = state_->metadata.validate(document);
    if (!errors.empty()) {
      rollback();
      return fail(outError, firstError(errors));
    }
  }

  if (mapping) {
    *mapping = std::move(remap);
  }
  logger()->debug("Copied {} object(s) from {}", pending.size(),
                  source.path.empty() ? std::string("an unsaved package") : source.path.string());
  return true;
}

const PackageProperties &Package::properties() const {
  return state_->properties;
}

void Package::setProperties(PackageProperties properties) {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  state_->properties = std::move(properties);
}

const Catalog &Package::catalog() const {
  return state_->catalog;
}

MetadataStore &Package::metadata() {
  return state_->metadata;
}

const MetadataStore &Package::metadata() const {
  return state_->metadata;
}

ArrayStore &Package::arrays() {
  return state_->arrays;
}

const ArrayStore &Package::arrays() const {
  return state_->arrays;
}

SchemaRegistry &Package::schemas() {
  return state_->schemas;
}

const SchemaRegistry &Package::schemas() const {
  return state_->schemas;
}

const PackageOptions &Package::options() const {
  return state_->options;
}

const std::filesystem::path &Package::path() const {
  return state_->path;
}

size_t Package::size() const {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  return state_->catalog.size();
}

} // namespace resqx
