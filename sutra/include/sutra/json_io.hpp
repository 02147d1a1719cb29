#pragma once
// JSON views of engine results for the CLI and protocol layers

#include "builder.hpp"
#include "codec.hpp"
#include "explanation.hpp"
#include "graph_store.hpp"
#include "query_engine.hpp"

namespace sutra {

inline json to_json(const QueryMeta& m) {
    json j = {
        {"requested_strategy", m.requested_strategy},
        {"strategy", m.strategy},
        {"degraded", m.degraded},
        {"truncated", m.truncated},
        {"snapshot_version", m.snapshot_version},
        {"latency_ms", m.latency_ms}
    };
    if (m.degraded) j["degraded_reason"] = m.degraded_reason;
    return j;
}

inline json to_json(const SearchHit& h) {
    json j = {
        {"id", h.id},
        {"label", h.label},
        {"category", h.category},
        {"score", h.score},
        {"semantic_score", h.semantic_score},
        {"keyword_score", h.keyword_score},
        {"graph_boost", h.graph_boost}
    };
    if (!h.boosted_by.empty()) j["boosted_by"] = h.boosted_by;
    return j;
}

inline json to_json(const SearchResult& r) {
    json hits = json::array();
    for (const auto& h : r.hits) hits.push_back(to_json(h));
    return json{{"results", std::move(hits)}, {"meta", to_json(r.meta)}};
}

inline json to_json(const NeighborsResult& r) {
    json hits = json::array();
    for (const auto& h : r.hits) {
        hits.push_back({
            {"id", h.id},
            {"distance", h.distance},
            {"via", h.via},
            {"relation", relation_name(h.relation)},
            {"strength", h.strength}
        });
    }
    return json{{"neighbors", std::move(hits)}, {"meta", to_json(r.meta)}};
}

inline json to_json(const GraphPath& p) {
    json edges = json::array();
    for (const auto& e : p.edges) edges.push_back(relationship_to_json(e));
    return json{
        {"nodes", p.nodes},
        {"edges", std::move(edges)},
        {"hops", p.hops()},
        {"confidence", p.confidence}
    };
}

inline json to_json(const PathExplanation& x) {
    json steps = json::array();
    for (const auto& s : x.steps) {
        json j = {
            {"from", s.from},
            {"to", s.to},
            {"relation", relation_name(s.type)},
            {"strength", s.strength},
            {"reasoning", s.reasoning}
        };
        if (!s.hints.empty()) j["hints"] = hints_to_json(s.hints);
        steps.push_back(std::move(j));
    }
    return json{
        {"summary", x.summary},
        {"steps", std::move(steps)},
        {"reasons", x.reasons},
        {"caveats", x.caveats},
        {"next_steps", x.next_steps},
        {"confidence", x.confidence},
        {"text", x.text()}
    };
}

inline json to_json(const PathsResult& r) {
    json paths = json::array();
    for (size_t i = 0; i < r.paths.size(); ++i) {
        json p = to_json(r.paths[i]);
        if (i < r.explanations.size()) p["explanation"] = to_json(r.explanations[i]);
        paths.push_back(std::move(p));
    }
    return json{{"paths", std::move(paths)}, {"expanded", r.expanded}, {"meta", to_json(r.meta)}};
}

inline json to_json(const AlternativesResult& r) {
    json hits = json::array();
    for (const auto& h : r.hits) {
        hits.push_back({
            {"id", h.id},
            {"label", h.label},
            {"category", h.category},
            {"score", h.score},
            {"basis", h.basis}
        });
    }
    return json{
        {"alternatives", std::move(hits)},
        {"explanation", {
            {"summary", r.explanation.summary},
            {"reasons", r.explanation.reasons},
            {"options", r.explanation.options},
            {"next_steps", r.explanation.next_steps},
            {"text", r.explanation.text()}
        }},
        {"meta", to_json(r.meta)}
    };
}

inline json to_json(const Explanation& x) {
    json connections = json::array();
    for (const auto& c : x.connections) {
        json j = {
            {"other", c.other},
            {"relation", relation_name(c.type)},
            {"strength", c.strength},
            {"reasoning", c.reasoning}
        };
        if (!c.hints.empty()) j["hints"] = hints_to_json(c.hints);
        connections.push_back(std::move(j));
    }
    json j = {
        {"id", x.id},
        {"summary", x.summary},
        {"matched_terms", x.matched_terms},
        {"matched_use_cases", x.matched_use_cases},
        {"reasons", x.reasons},
        {"connections", std::move(connections)},
        {"caveats", x.caveats},
        {"score", x.scores.score},
        {"text", x.text()}
    };
    if (x.success_rate) j["success_rate"] = *x.success_rate;
    return j;
}

inline json to_json(const StoreStats& s) {
    return json{
        {"entities", s.entities},
        {"edges", s.edges},
        {"embeddings", s.embeddings},
        {"average_strength", s.average_strength},
        {"per_category", s.per_category},
        {"per_relation", s.per_relation},
        {"snapshot_version", s.snapshot_version},
        {"content_hash", s.content_hash},
        {"dimension", s.dimension},
        {"embedding_model", s.embedding_model}
    };
}

inline json to_json(const QueryTrace& t) {
    return json{
        {"query", t.query},
        {"strategy", t.strategy},
        {"result_count", t.result_count},
        {"latency_ms", t.latency_ms},
        {"degraded", t.degraded},
        {"timestamp", t.timestamp}
    };
}

inline json to_json(const BuildReport& r) {
    return json{
        {"records_total", r.records_total},
        {"records_skipped", r.records_skipped},
        {"entities", r.entities},
        {"embeddings", r.embeddings},
        {"null_embeddings", r.null_embeddings},
        {"edges", r.edges},
        {"edges_per_type", r.relations.per_type},
        {"edge_candidates", r.relations.candidates},
        {"dropped_by_cap", r.relations.dropped_by_cap},
        {"dangling_skipped", r.relations.dangling_skipped},
        {"problems", r.problems},
        {"embedding_model", r.embedding_model},
        {"catalog_hash", r.catalog_hash},
        {"snapshot_version", r.snapshot_version},
        {"duration_ms", r.duration_ms}
    };
}

} // namespace sutra
