#pragma once

// flatdata runtime
// Zero-copy storage of large, read-mostly, structurally typed datasets as
// bit-packed fixed-size records grouped into schema-checked archives.

#include "archive.hpp"
#include "array_view.hpp"
#include "external_vector.hpp"
#include "file_storage.hpp"
#include "memory_storage.hpp"
#include "multi_vector.hpp"
#include "schema.hpp"
#include "storage.hpp"
#include "struct_view.hpp"
#include "types.hpp"
#include "vector.hpp"

// The library is organised in three layers:
//
// 1. Records: Field / StructView / View<T>
//    - Bit-level access to fields of fixed-size records (bit_codec.hpp)
//    - Struct types are tables emitted by the schema compiler: a NAME,
//      sizeInBytes and one Field<T> per field
//
// 2. Resources: ResourceStorage and the containers stored in it
//    - ArrayView<T> reads vectors, MultiArrayView reads multivectors
//    - Vector<T> assembles data in memory, ExternalVector<T> and
//      MultiVector stream data into storage
//
// 3. Archives: Archive / ArchiveBuilder
//    - A named set of resources plus the "<Name>.archive" signature
//
// Example usage:
//
//   auto storage = std::make_shared<flatdata::MemoryResourceStorage>();
//   auto builder = GraphBuilder::create(storage);
//   auto vertices = builder->startVertices();
//   vertices->grow().set(Character::name_ref, 5);
//   vertices->close();
//   ...
//   auto graph = Graph::open(storage);
//   uint32_t ref = graph->vertices().at(0).get(Character::name_ref);

namespace flatdata {}
