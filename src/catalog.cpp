#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <resqx/catalog.hpp>
#include <resqx/log.hpp>

namespace resqx {

namespace {

Error notFound(const Oid &oid) {
  Error error(ErrorCode::NotFound, "Unknown object");
  return error.withOid(oid.str());
}

} // namespace

bool Catalog::checkReferences(const Oid &source, const std::set<Oid> &references,
                              Error *outError) const {
  for (const auto &target : references) {
    if (target == source) {
      continue;
    }
    if (!entries_.contains(target)) {
      Error error(ErrorCode::DanglingReference,
                  fmt::format("Reference to unknown object {}", target.str()));
      return fail(outError, error.withOid(source.str()));
    }
  }
  return true;
}

std::optional<Oid> Catalog::registerObject(std::string type, const std::set<Oid> &references,
                                           Citation citation, std::string partName,
                                           Error *outError) {
  CatalogEntry entry;
  do {
    entry.oid = Oid::generate();
  } while (entries_.contains(entry.oid));

  entry.type = std::move(type);
  entry.partName = partName.empty() ? metadataPartName(entry.type, entry.oid) : std::move(partName);
  entry.citation = std::move(citation);
  entry.references = references;

  Oid oid = entry.oid;
  if (!insert(std::move(entry), outError)) {
    return std::nullopt;
  }
  return oid;
}

bool Catalog::insert(CatalogEntry entry, Error *outError) {
  if (entry.oid.isNil()) {
    return fail(outError, Error(ErrorCode::Validation, "Object has no OID"));
  }
  if (entries_.contains(entry.oid)) {
    Error error(ErrorCode::Validation, "Duplicate OID in package");
    return fail(outError, error.withOid(entry.oid.str()).withPart(entry.partName));
  }

  entry.partName = normalizePartName(entry.partName);
  std::string lowered = lowercasePartName(entry.partName);
  if (lowered.empty() || parts_.contains(lowered)) {
    Error error(ErrorCode::Validation, lowered.empty() ? "Empty part name" : "Duplicate part name");
    return fail(outError, error.withOid(entry.oid.str()).withPart(entry.partName));
  }
  if (!checkReferences(entry.oid, entry.references, outError)) {
    return false;
  }

  entry.referencedBy.clear();
  for (const auto &target : entry.references) {
    if (target == entry.oid) {
      entry.referencedBy.insert(entry.oid);
    } else {
      entries_.at(target).referencedBy.insert(entry.oid);
    }
  }

  Oid oid = entry.oid;
  parts_[lowered] = oid;
  order_.push_back(oid);
  entries_.emplace(oid, std::move(entry));
  return true;
}

const CatalogEntry *Catalog::resolve(const Oid &oid, Error *outError) const {
  auto it = entries_.find(oid);
  if (it == entries_.end()) {
    fail(outError, notFound(oid));
    return nullptr;
  }
  return &it->second;
}

const CatalogEntry *Catalog::findPart(std::string_view partName) const {
  auto it = parts_.find(lowercasePartName(partName));
  if (it == parts_.end()) {
    return nullptr;
  }
  return &entries_.at(it->second);
}

std::set<Oid> Catalog::referencing(const Oid &oid) const {
  auto it = entries_.find(oid);
  if (it == entries_.end()) {
    return {};
  }
  return it->second.referencedBy;
}

bool Catalog::updateReferences(const Oid &oid, std::set<Oid> references, Error *outError) {
  auto it = entries_.find(oid);
  if (it == entries_.end()) {
    return fail(outError, notFound(oid));
  }
  if (!checkReferences(oid, references, outError)) {
    return false;
  }

  CatalogEntry &entry = it->second;
  for (const auto &target : entry.references) {
    if (auto targetIt = entries_.find(target); targetIt != entries_.end()) {
      targetIt->second.referencedBy.erase(oid);
    }
  }
  entry.references = std::move(references);
  for (const auto &target : entry.references) {
    entries_.at(target).referencedBy.insert(oid);
  }
  return true;
}

bool Catalog::updateCitation(const Oid &oid, Citation citation, Error *outError) {
  auto it = entries_.find(oid);
  if (it == entries_.end()) {
    return fail(outError, notFound(oid));
  }
  it->second.citation = std::move(citation);
  return true;
}

bool Catalog::setValid(const Oid &oid, bool valid, Error *outError) {
  auto it = entries_.find(oid);
  if (it == entries_.end()) {
    return fail(outError, notFound(oid));
  }
  it->second.valid = valid;
  return true;
}

bool Catalog::remove(const Oid &oid, RemoveMode mode, RemovalReport *report, Error *outError) {
  auto it = entries_.find(oid);
  if (it == entries_.end()) {
    return fail(outError, notFound(oid));
  }

  std::vector<Oid> referrers;
  for (const auto &source : it->second.referencedBy) {
    if (source != oid) {
      referrers.push_back(source);
    }
  }

  if (!referrers.empty() && mode == RemoveMode::Strict) {
    std::vector<std::string> parts;
    for (const auto &source : referrers) {
      parts.push_back(entries_.at(source).partName);
    }
    Error error(ErrorCode::DanglingReference,
                fmt::format("Object is still referenced by {}", fmt::join(parts, ", ")));
    error.withOid(oid.str()).withPart(parts.front());
    return fail(outError, error);
  }

  if (report) {
    *report = RemovalReport{};
    report->removed = oid;
  }

  for (const auto &source : referrers) {
    CatalogEntry &referrer = entries_.at(source);
    referrer.references.erase(oid);
    referrer.valid = false;
    logger()->warn("Object {} ({}) invalidated by removal of {}", source.str(), referrer.partName,
                   oid.str());
    if (report) {
      report->invalidated.push_back(source);
      report->invalidatedParts.push_back(referrer.partName);
    }
  }

  for (const auto &target : it->second.references) {
    if (auto targetIt = entries_.find(target); targetIt != entries_.end()) {
      targetIt->second.referencedBy.erase(oid);
    }
  }

  parts_.erase(lowercasePartName(it->second.partName));
  order_.erase(std::remove(order_.begin(), order_.end(), oid), order_.end());
  entries_.erase(it);
  return true;
}

bool Catalog::rename(const Oid &oid, std::string partName, Error *outError) {
  auto it = entries_.find(oid);
  if (it == entries_.end()) {
    return fail(outError, notFound(oid));
  }

  std::string normalized = normalizePartName(partName);
  std::string lowered = lowercasePartName(normalized);
  if (lowered.empty()) {
    return fail(outError, Error(ErrorCode::Validation, "Empty part name").withOid(oid.str()));
  }
  if (auto existing = parts_.find(lowered); existing != parts_.end() && existing->second != oid) {
    Error error(ErrorCode::Validation, "Duplicate part name");
    return fail(outError, error.withOid(oid.str()).withPart(normalized));
  }

  parts_.erase(lowercasePartName(it->second.partName));
  parts_[lowered] = oid;
  it->second.partName = std::move(normalized);
  return true;
}

std::vector<Oid> Catalog::oids(std::string_view type) const {
  std::vector<Oid> result;
  for (const auto &oid : order_) {
    if (type.empty() || entries_.at(oid).type == type) {
      result.push_back(oid);
    }
  }
  return result;
}

std::vector<const CatalogEntry *> Catalog::entries() const {
  std::vector<const CatalogEntry *> result;
  result.reserve(order_.size());
  for (const auto &oid : order_) {
    result.push_back(&entries_.at(oid));
  }
  return result;
}

void Catalog::clear() {
  entries_.clear();
  order_.clear();
  parts_.clear();
}

} // namespace resqx
