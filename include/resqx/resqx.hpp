#pragma once

// resqx
// A C++20 library for reading, manipulating and writing earth-model packages:
// typed objects that reference each other by OID, stored as XML parts of one
// OPC zip container, with large numeric arrays as separate stored parts.

#include "array_store.hpp"
#include "catalog.hpp"
#include "document.hpp"
#include "error.hpp"
#include "kinds.hpp"
#include "log.hpp"
#include "metadata_store.hpp"
#include "model.hpp"
#include "object.hpp"
#include "oid.hpp"
#include "opc.hpp"
#include "options.hpp"
#include "package.hpp"
#include "reader.hpp"
#include "schema.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides three levels of abstraction:
//
// 1. Low-level: ContainerReader / ContainerWriter / ContentTypes / ArrayCodec
//    - Direct access to the zip container, its packaging parts and array payloads
//
// 2. Package level: Package with its Catalog, MetadataStore and ArrayStore
//    - Generic documents validated against registered schemas
//    - Use Package::open() to load, Package::create() for a new package
//
// 3. Typed level: Model over the built-in kinds (or a custom KindRegistry)
//
// Example usage:
//
//   // Listing the objects of a package
//   auto model = resqx::Model::load("field.epc");
//   if (model) {
//     for (const auto &oid : model->objects("IjkGridRepresentation")) {
//       auto grid = model->getAs<resqx::IjkGridRepresentation>(oid);
//       std::cout << grid->title() << ": " << grid->cellCount() << " cells\n";
//     }
//   }
//
//   // Creating a package
//   resqx::Model model;
//   auto crs = model.create("LocalDepth3dCrs", {.title = "local", .fields = {...}});
//   model.save("field.epc");

namespace resqx {}
