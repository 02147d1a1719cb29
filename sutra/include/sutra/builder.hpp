#pragma once
// GraphBuilder: catalog → committed graph, four stages
//
//   1. extract    records → entities (bad records skipped and counted)
//   2. embed      label + description per entity, batched, retried;
//                 persistent failure leaves a null embedding
//   3. relate     RelationshipInferrer over the extracted set
//   4. commit     one rebuild transaction, swapped live atomically
//
// The rebuild transaction is opened first and held for the whole run, so
// a second concurrent build fails fast with BuildInProgressError while
// readers keep the previous snapshot. Any exception before commit
// discards the staging area.

#include "catalog.hpp"
#include "embedding.hpp"
#include "errors.hpp"
#include "extractor.hpp"
#include "graph_store.hpp"
#include "log.hpp"
#include "relationships.hpp"
#include <chrono>
#include <cmath>
#include <iostream>

namespace sutra {

struct BuilderConfig {
    ExtractionRules rules = ExtractionRules::defaults();
    InferenceConfig inference;
    size_t batch_size = 32;
    RetryPolicy retry;
};

struct BuildReport {
    size_t records_total = 0;
    size_t records_skipped = 0;
    size_t entities = 0;
    size_t embeddings = 0;
    size_t null_embeddings = 0;
    size_t edges = 0;
    InferenceReport relations;
    std::vector<std::string> problems;
    std::string embedding_model;
    uint32_t catalog_hash = 0;
    uint64_t snapshot_version = 0;
    double duration_ms = 0.0;
};

// Build facts recorded as store metadata
namespace build_key {
constexpr const char* BUILD_TIMESTAMP = "build_timestamp";
constexpr const char* ENTITIES_TOTAL = "entities_total";
constexpr const char* RELATIONSHIPS_TOTAL = "relationships_total";
constexpr const char* EMBEDDINGS_TOTAL = "embeddings_total";
constexpr const char* NULL_EMBEDDINGS = "null_embeddings";
constexpr const char* RECORDS_SKIPPED = "records_skipped";
constexpr const char* EMBEDDING_MODEL = "embedding_model";
constexpr const char* CATALOG_HASH = "catalog_hash";
constexpr const char* BUILD_DURATION_MS = "build_duration_ms";
} // namespace build_key

class GraphBuilder {
public:
    GraphBuilder(GraphStore& store, EmbeddingProvider& embedder, BuilderConfig config = {})
        : store_(store), embedder_(embedder), config_(std::move(config)),
          extractor_(config_.rules), inferrer_(config_.inference) {}

    BuildReport build(const Catalog& catalog) {
        auto started = std::chrono::steady_clock::now();
        if (embedder_.dimension() != store_.dimension()) {
            throw ValidationError("embedder dimension " + std::to_string(embedder_.dimension()) +
                                  " does not match store dimension " +
                                  std::to_string(store_.dimension()));
        }

        auto tx = store_.begin_rebuild();

        BuildReport report;
        report.records_total = catalog.total_records;
        report.records_skipped = catalog.skipped;
        report.problems = catalog.problems;
        report.catalog_hash = catalog.hash;
        report.embedding_model = embedder_.model_id();

        // 1. extract
        std::map<EntityId, Entity> entities;
        for (const auto& record : catalog.records) {
            try {
                Entity e = extractor_.extract(record);
                entities.emplace(e.id, std::move(e));
            } catch (const ValidationError& e) {
                report.records_skipped++;
                std::string problem = record.id + ": " + e.what();
                if (log::enabled()) std::cerr << "[Builder] skipped " << problem << "\n";
                report.problems.push_back(std::move(problem));
            }
        }
        if (entities.empty()) {
            throw ValidationError("catalog produced no entities (" +
                                  std::to_string(catalog.total_records) + " records, " +
                                  std::to_string(report.records_skipped) + " skipped)");
        }

        // 2. embed
        embed_all(entities, report);

        // 3. relate
        auto edges = inferrer_.infer(entities, catalog.patterns, catalog.records,
                                     &report.relations);

        // 4. commit
        for (auto& [_, e] : entities) tx.put_entity(e);
        for (auto& r : edges) tx.put_edge(std::move(r));
        report.entities = entities.size();
        report.edges = edges.size();

        report.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();

        tx.set_metadata(build_key::BUILD_TIMESTAMP, static_cast<double>(now()));
        tx.set_metadata(build_key::ENTITIES_TOTAL, static_cast<double>(report.entities));
        tx.set_metadata(build_key::RELATIONSHIPS_TOTAL, static_cast<double>(report.edges));
        tx.set_metadata(build_key::EMBEDDINGS_TOTAL, static_cast<double>(report.embeddings));
        tx.set_metadata(build_key::NULL_EMBEDDINGS, static_cast<double>(report.null_embeddings));
        tx.set_metadata(build_key::RECORDS_SKIPPED, static_cast<double>(report.records_skipped));
        tx.set_metadata(build_key::EMBEDDING_MODEL, report.embedding_model);
        tx.set_metadata(build_key::CATALOG_HASH, static_cast<double>(report.catalog_hash));
        tx.set_metadata(build_key::BUILD_DURATION_MS, report.duration_ms);
        report.snapshot_version = tx.commit();

        if (log::enabled()) {
            std::cerr << "[Builder] built v" << report.snapshot_version << ": "
                      << report.entities << " entities, " << report.edges << " edges, "
                      << report.null_embeddings << " without embedding, "
                      << report.records_skipped << " skipped ("
                      << static_cast<int64_t>(report.duration_ms) << " ms)\n";
        }
        return report;
    }

    BuildReport build_from_file(const std::string& path) {
        return build(load_catalog(path));
    }

    static std::string embedding_text(const Entity& e) {
        if (e.description.empty()) return e.label;
        return e.label + ". " + e.description;
    }

private:
    bool usable(const Vector& v) const {
        if (v.size() != store_.dimension()) return false;
        for (float x : v.data) {
            if (!std::isfinite(x)) return false;
        }
        return true;
    }

    void embed_all(std::map<EntityId, Entity>& entities, BuildReport& report) {
        std::vector<Entity*> order;
        for (auto& [_, e] : entities) order.push_back(&e);

        size_t batch = std::max<size_t>(1, config_.batch_size);
        for (size_t start = 0; start < order.size(); start += batch) {
            size_t end = std::min(order.size(), start + batch);
            std::vector<std::string> texts;
            for (size_t i = start; i < end; ++i) texts.push_back(embedding_text(*order[i]));

            std::vector<Vector> vectors;
            try {
                vectors = with_retry(config_.retry, [&] {
                    auto out = embedder_.embed_batch(texts);
                    if (out.size() != texts.size()) {
                        throw EmbeddingUnavailable("batch returned " + std::to_string(out.size()) +
                                                   " vectors for " + std::to_string(texts.size()));
                    }
                    return out;
                });
            } catch (const EmbeddingUnavailable& e) {
                if (log::enabled()) {
                    std::cerr << "[Builder] batch embedding failed, falling back per entity: "
                              << e.what() << "\n";
                }
                vectors.clear();
            }

            for (size_t i = start; i < end; ++i) {
                Entity& entity = *order[i];
                std::optional<Vector> v;
                if (!vectors.empty()) {
                    v = std::move(vectors[i - start]);
                } else {
                    try {
                        v = with_retry(config_.retry, [&] { return embedder_.embed(texts[i - start]); });
                    } catch (const EmbeddingUnavailable& e) {
                        if (log::enabled()) {
                            std::cerr << "[Builder] no embedding for " << entity.id << ": "
                                      << e.what() << "\n";
                        }
                    }
                }

                if (v && usable(*v)) {
                    entity.embedding = std::move(v);
                    entity.embedding_model = embedder_.model_id();
                    report.embeddings++;
                } else {
                    if (v && log::enabled()) {
                        std::cerr << "[Builder] discarded malformed embedding for " << entity.id << "\n";
                    }
                    entity.embedding.reset();
                    entity.embedding_model.clear();
                    report.null_embeddings++;
                }
            }
        }
    }

    GraphStore& store_;
    EmbeddingProvider& embedder_;
    BuilderConfig config_;
    EntityExtractor extractor_;
    RelationshipInferrer inferrer_;
};

} // namespace sutra
