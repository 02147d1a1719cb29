#pragma once
// Sutra: knowledge-graph retrieval over a catalog of building blocks
//
// Usage:
//   sutra::GraphStore store({"graph.db"});
//   sutra::HashingEmbedder embedder;
//   sutra::GraphBuilder(store, embedder).build_from_file("catalog.json");
//
//   sutra::QueryEngine engine(store, std::make_shared<sutra::HashingEmbedder>());
//   auto result = engine.hybrid("send a chat message", 5);

#include "version.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include "schema.hpp"
#include "graph_store.hpp"
#include "embedding.hpp"
#include "catalog.hpp"
#include "extractor.hpp"
#include "relationships.hpp"
#include "builder.hpp"
#include "traversal.hpp"
#include "explanation.hpp"
#include "query_engine.hpp"
#include "exporter.hpp"
#include "config.hpp"
#include "json_io.hpp"
