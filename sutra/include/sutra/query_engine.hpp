#pragma once
// QueryEngine: read-only answers over the current snapshot
//
//   semantic      embed the query, cosine top-k
//   keyword       BM25 over label, description, category, keywords, use cases
//   hybrid        w_sem·semantic + w_kw·keyword, plus a one-time graph boost
//                 for candidates adjacent to the top semantic seeds
//   neighbors     bounded BFS
//   paths         bounded simple-path BFS, streamable, explained per path
//   alternatives  similar-to neighbors and same-category entities
//   explain       deterministic template text
//
// Each call pins one snapshot for its whole duration. The embedding call
// is the only blocking step. It runs under one deadline; fast failures get
// a bounded number of attempts inside it, and whatever still fails degrades
// the call to keyword-only instead of raising. QueryMeta reports the
// strategy that actually ran.

#include "embedding.hpp"
#include "errors.hpp"
#include "explanation.hpp"
#include "graph_store.hpp"
#include "log.hpp"
#include "traversal.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <unordered_map>

namespace sutra {

struct HybridWeights {
    double semantic = 0.6;
    double keyword = 0.25;
    double graph = 0.15;

    void validate() const {
        for (double w : {semantic, keyword, graph}) {
            if (!std::isfinite(w) || w < 0.0) {
                throw ValidationError("hybrid weights must be finite and non-negative");
            }
        }
        if (semantic + keyword > 1.0 + 1e-9) {
            throw ValidationError("semantic + keyword weight exceeds 1");
        }
    }
};

struct QueryConfig {
    HybridWeights weights;
    size_t graph_seeds = 5;              // top semantic hits whose neighbors get boosted
    size_t candidate_multiplier = 3;     // per-strategy pool = k * multiplier
    size_t max_neighbor_results = 1000;
    std::chrono::milliseconds embed_timeout{2000};
    size_t embed_attempts = 2;           // fast failures retried inside the timeout
    size_t embed_workers = 2;
};

struct SearchFilter {
    std::optional<std::string> category;
};

struct QueryMeta {
    std::string requested_strategy;
    std::string strategy;                // what actually ran
    bool degraded = false;
    std::string degraded_reason;
    bool truncated = false;
    uint64_t snapshot_version = 0;
    double latency_ms = 0.0;
};

struct SearchHit {
    EntityId id;
    std::string label;
    std::string category;
    double score = 0.0;
    double semantic_score = 0.0;
    double keyword_score = 0.0;
    double graph_boost = 0.0;
    std::vector<EntityId> boosted_by;

    ScoreBreakdown breakdown() const {
        return {score, semantic_score, keyword_score, graph_boost, boosted_by};
    }
};

struct SearchResult {
    std::vector<SearchHit> hits;
    QueryMeta meta;
};

struct NeighborsResult {
    std::vector<NeighborHit> hits;
    QueryMeta meta;
};

struct PathsResult {
    std::vector<GraphPath> paths;
    std::vector<PathExplanation> explanations;   // one per path
    size_t expanded = 0;
    QueryMeta meta;
};

struct AlternativesResult {
    std::vector<AlternativeHit> hits;
    AlternativesExplanation explanation;
    QueryMeta meta;
};

class QueryEngine {
public:
    // `embedder` may be null: every query then runs keyword-only
    QueryEngine(GraphStore& store, std::shared_ptr<EmbeddingProvider> embedder,
                QueryConfig config = {})
        : store_(store), config_(std::move(config))
    {
        config_.weights.validate();
        if (embedder) {
            embedder_ = std::make_shared<DeadlineEmbedder>(std::move(embedder),
                                                           config_.embed_timeout,
                                                           config_.embed_workers);
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Search
    // ═══════════════════════════════════════════════════════════════════════

    SearchResult semantic(const std::string& text, size_t k, const SearchFilter& filter = {}) {
        Timer timer;
        require_text(text);
        auto snap = store_.snapshot();
        SearchResult result;
        begin_meta(result.meta, "semantic", *snap);
        if (snap->empty()) return finish(result, text, timer);
        k = clamp_k(k, *snap);
        auto accept = make_filter(*snap, filter);

        auto qv = embed_query(text, *snap, result.meta);
        if (!qv) {
            result.hits = keyword_hits(*snap, text, k, accept);
            return finish(result, text, timer);
        }
        for (const auto& s : snap->vectors().search(*qv, k, accept)) {
            SearchHit hit = make_hit(*snap, s.slot);
            hit.semantic_score = s.score;
            hit.score = s.score;
            result.hits.push_back(std::move(hit));
        }
        return finish(result, text, timer);
    }

    SearchResult keyword(const std::string& text, size_t k, const SearchFilter& filter = {}) {
        Timer timer;
        require_text(text);
        auto snap = store_.snapshot();
        SearchResult result;
        begin_meta(result.meta, "keyword", *snap);
        if (snap->empty()) return finish(result, text, timer);
        k = clamp_k(k, *snap);
        result.hits = keyword_hits(*snap, text, k, make_filter(*snap, filter));
        return finish(result, text, timer);
    }

    SearchResult hybrid(const std::string& text, size_t k,
                        std::optional<HybridWeights> weights = std::nullopt,
                        const SearchFilter& filter = {}) {
        Timer timer;
        require_text(text);
        HybridWeights w = weights.value_or(config_.weights);
        w.validate();

        auto snap = store_.snapshot();
        SearchResult result;
        begin_meta(result.meta, "hybrid", *snap);
        if (snap->empty()) return finish(result, text, timer);
        k = clamp_k(k, *snap);
        result.hits = rank_hybrid(*snap, text, k, w, make_filter(*snap, filter), result.meta);
        return finish(result, text, timer);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Traversal
    // ═══════════════════════════════════════════════════════════════════════

    NeighborsResult neighbors(const EntityId& id, int depth) {
        Timer timer;
        auto snap = store_.snapshot();
        NeighborsResult result;
        begin_meta(result.meta, "neighbors", *snap);
        auto found = sutra::neighbors(*snap, id, depth, config_.max_neighbor_results);
        result.hits = std::move(found.hits);
        result.meta.truncated = found.truncated;
        result.meta.latency_ms = timer.elapsed_ms();
        trace(id, result.meta, result.hits.size());
        return result;
    }

    // Incremental form: the caller pulls paths one at a time
    PathStream path_stream(const EntityId& source, const EntityId& target,
                           int max_hops, int max_paths) {
        return PathStream(store_.snapshot(), source, target, max_hops, max_paths);
    }

    PathsResult paths(const EntityId& source, const EntityId& target,
                      int max_hops, int max_paths) {
        Timer timer;
        auto snap = store_.snapshot();
        PathsResult result;
        begin_meta(result.meta, "paths", *snap);
        PathStream stream(snap, source, target, max_hops, max_paths);
        result.paths = stream.collect();
        for (const auto& p : result.paths) result.explanations.push_back(explain_path(*snap, p));
        result.expanded = stream.expanded();
        result.meta.truncated = stream.truncated();
        result.meta.latency_ms = timer.elapsed_ms();
        trace(source + " -> " + target, result.meta, result.paths.size());
        return result;
    }

    // Entities that can stand in for `id`: similar-to neighbors score by edge
    // strength, other members of its category by embedding cosine (keyword
    // overlap when it has no embedding). Best score per entity, ties by id.
    AlternativesResult alternatives(const EntityId& id, size_t k) {
        Timer timer;
        auto snap = store_.snapshot();
        auto slot = snap->slot_of(id);
        if (!slot) throw NotFound("entity not found: " + id);
        AlternativesResult result;
        begin_meta(result.meta, "alternatives", *snap);
        k = std::max<size_t>(k, 1);

        std::unordered_map<Slot, AlternativeHit> found;
        auto offer = [&](Slot other, double score, const char* basis) {
            if (other == *slot) return;
            auto it = found.find(other);
            if (it == found.end()) {
                AlternativeHit hit;
                hit.id = snap->at(other).id;
                hit.label = snap->at(other).label;
                hit.category = snap->at(other).category;
                hit.score = score;
                hit.basis = basis;
                found.emplace(other, std::move(hit));
            } else if (score > it->second.score) {
                it->second.score = score;
                if (it->second.basis != "similar-to") it->second.basis = basis;
            }
        };

        for (const auto* list : {&snap->out_edges(*slot), &snap->in_edges(*slot)}) {
            for (size_t e : *list) {
                const auto& r = snap->edges()[e];
                if (r.type != RelationType::SimilarTo) continue;
                offer(*snap->slot_of(r.other(id)), r.strength, "similar-to");
            }
        }

        const Entity& self = snap->at(*slot);
        const CategoryIndex& categories = snap->categories();
        std::string category = self.category;
        Slot own = *slot;
        auto same_category = [&categories, category, own](Slot s) {
            return s != own && categories.contains(category, s);
        };
        size_t pool = std::min(snap->size(), k * std::max<size_t>(1, config_.candidate_multiplier));
        if (self.has_embedding()) {
            for (const auto& s : snap->vectors().search(*self.embedding, pool, same_category)) {
                offer(s.slot, std::max(0.0, static_cast<double>(s.score)), "same-category");
            }
        } else {
            for (const auto& s : snap->keywords().search(self.label + " " + self.description,
                                                         pool, same_category)) {
                offer(s.slot, s.score, "same-category");
            }
        }

        std::vector<std::pair<Slot, AlternativeHit>> ranked(found.begin(), found.end());
        std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            if (a.second.score != b.second.score) return a.second.score > b.second.score;
            return a.first < b.first;
        });
        if (ranked.size() > k) ranked.resize(k);
        for (auto& [_, hit] : ranked) result.hits.push_back(std::move(hit));

        result.explanation = explain_alternatives(*snap, id, result.hits);
        result.meta.latency_ms = timer.elapsed_ms();
        trace(id, result.meta, result.hits.size());
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Explanation
    // ═══════════════════════════════════════════════════════════════════════

    // Explains a hit returned by hybrid()/semantic()/keyword()
    Explanation explain(const std::string& query, const SearchHit& hit) {
        auto snap = store_.snapshot();
        auto slot = snap->slot_of(hit.id);
        if (!slot) throw NotFound("entity not found: " + hit.id);
        auto scores = hit.breakdown();
        return explain_entity(*snap, query, *slot, &scores);
    }

    // Ranks the query over the pinned snapshot to recover the entity's scores.
    // Writes no query-log entry.
    Explanation explain(const std::string& query, const EntityId& id) {
        require_text(query);
        auto snap = store_.snapshot();
        auto slot = snap->slot_of(id);
        if (!slot) throw NotFound("entity not found: " + id);

        QueryMeta meta;
        begin_meta(meta, "hybrid", *snap);
        auto ranked = rank_hybrid(*snap, query, snap->size(), config_.weights, nullptr, meta);
        for (const auto& hit : ranked) {
            if (hit.id == id) {
                auto scores = hit.breakdown();
                return explain_entity(*snap, query, *slot, &scores);
            }
        }
        return explain_entity(*snap, query, *slot, nullptr);
    }

    const QueryConfig& config() const { return config_; }

private:
    struct Timer {
        std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
        double elapsed_ms() const {
            return std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start).count();
        }
    };

    static void require_text(const std::string& text) {
        if (trim(text).empty()) throw ValidationError("query text must not be empty");
    }

    static size_t clamp_k(size_t k, const GraphSnapshot& snap) {
        return std::min(std::max<size_t>(k, 1), snap.size());
    }

    static void begin_meta(QueryMeta& meta, const char* strategy, const GraphSnapshot& snap) {
        meta.requested_strategy = strategy;
        meta.strategy = strategy;
        meta.snapshot_version = snap.version();
    }

    static std::function<bool(Slot)> make_filter(const GraphSnapshot& snap,
                                                 const SearchFilter& filter) {
        if (!filter.category) return nullptr;
        std::string category = *filter.category;
        const CategoryIndex* index = &snap.categories();
        return [index, category](Slot slot) { return index->contains(category, slot); };
    }

    static SearchHit make_hit(const GraphSnapshot& snap, Slot slot) {
        const Entity& e = snap.at(slot);
        SearchHit hit;
        hit.id = e.id;
        hit.label = e.label;
        hit.category = e.category;
        return hit;
    }

    std::vector<SearchHit> keyword_hits(const GraphSnapshot& snap, const std::string& text,
                                        size_t k, const std::function<bool(Slot)>& accept) const {
        std::vector<SearchHit> hits;
        for (const auto& s : snap.keywords().search(text, k, accept)) {
            SearchHit hit = make_hit(snap, s.slot);
            hit.keyword_score = s.score;
            hit.score = s.score;
            hits.push_back(std::move(hit));
        }
        return hits;
    }

    // Fused ranking over one pinned snapshot. Falls back to keyword hits
    // when the query cannot be embedded; the reason lands in meta.
    std::vector<SearchHit> rank_hybrid(const GraphSnapshot& snap, const std::string& text,
                                       size_t k, const HybridWeights& w,
                                       const std::function<bool(Slot)>& accept,
                                       QueryMeta& meta) {
        auto qv = embed_query(text, snap, meta);
        if (!qv) return keyword_hits(snap, text, k, accept);

        size_t pool = std::min(snap.size(), k * std::max<size_t>(1, config_.candidate_multiplier));
        std::unordered_map<Slot, SearchHit> candidates;
        auto semantic_hits = snap.vectors().search(*qv, pool, accept);
        for (const auto& s : semantic_hits) {
            auto& hit = candidates[s.slot];
            hit.semantic_score = std::max(0.0, static_cast<double>(s.score));
        }
        for (const auto& s : snap.keywords().search(text, pool, accept)) {
            candidates[s.slot].keyword_score = s.score;
        }
        for (auto& [slot, hit] : candidates) {
            hit.score = w.semantic * hit.semantic_score + w.keyword * hit.keyword_score;
        }

        // Graph boost: once per candidate adjacent to a top semantic seed
        size_t seeds = std::min(config_.graph_seeds, semantic_hits.size());
        if (w.graph > 0.0) {
            for (size_t i = 0; i < seeds; ++i) {
                Slot seed = semantic_hits[i].slot;
                for (const auto& hop : snap.hops(seed)) {
                    auto it = candidates.find(hop.neighbor);
                    if (it == candidates.end()) continue;
                    auto& hit = it->second;
                    if (hit.boosted_by.empty()) {
                        hit.graph_boost = w.graph;
                        hit.score += w.graph;
                    }
                    hit.boosted_by.push_back(snap.at(seed).id);
                }
            }
        }

        std::vector<std::pair<Slot, SearchHit>> ranked(candidates.begin(), candidates.end());
        std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            if (a.second.score != b.second.score) return a.second.score > b.second.score;
            if (a.second.semantic_score != b.second.semantic_score) {
                return a.second.semantic_score > b.second.semantic_score;
            }
            return a.first < b.first;   // slot order = id order
        });
        if (ranked.size() > k) ranked.resize(k);

        std::vector<SearchHit> hits;
        for (auto& [slot, partial] : ranked) {
            SearchHit hit = make_hit(snap, slot);
            hit.score = partial.score;
            hit.semantic_score = partial.semantic_score;
            hit.keyword_score = partial.keyword_score;
            hit.graph_boost = partial.graph_boost;
            hit.boosted_by = std::move(partial.boosted_by);
            hits.push_back(std::move(hit));
        }
        return hits;
    }

    // Null when the call must degrade; the reason lands in meta
    std::optional<Vector> embed_query(const std::string& text, const GraphSnapshot& snap,
                                      QueryMeta& meta) {
        auto degrade = [&](const std::string& reason) -> std::optional<Vector> {
            meta.degraded = true;
            meta.degraded_reason = reason;
            meta.strategy = "keyword";
            if (log::enabled()) std::cerr << "[Query] degraded to keyword-only: " << reason << "\n";
            return std::nullopt;
        };

        if (!embedder_ || !embedder_->ready()) return degrade("embedding provider unavailable");
        if (snap.embedding_count() == 0) return degrade("store has no embeddings");

        // One timeout covers every attempt; a timeout itself is not retried
        auto deadline = std::chrono::steady_clock::now() + config_.embed_timeout;
        size_t attempts = std::max<size_t>(1, config_.embed_attempts);
        for (size_t attempt = 1;; ++attempt) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            try {
                Vector v = embedder_->embed_within(text, std::max(remaining,
                                                                  std::chrono::milliseconds(1)));
                if (v.size() != store_.dimension()) {
                    return degrade("query vector has dimension " + std::to_string(v.size()));
                }
                return v;
            } catch (const EmbeddingTimeout& e) {
                return degrade(e.what());
            } catch (const EmbeddingUnavailable& e) {
                if (attempt >= attempts || std::chrono::steady_clock::now() >= deadline) {
                    return degrade(e.what());
                }
                if (log::debug()) {
                    std::cerr << "[Query] embedding attempt " << attempt << "/" << attempts
                              << " failed, retrying: " << e.what() << "\n";
                }
            }
        }
    }

    SearchResult& finish(SearchResult& result, const std::string& text, const Timer& timer) {
        result.meta.latency_ms = timer.elapsed_ms();
        trace(text, result.meta, result.hits.size());
        return result;
    }

    void trace(const std::string& query, const QueryMeta& meta, size_t count) {
        QueryTrace t;
        t.query = query;
        t.strategy = meta.strategy;
        t.result_count = count;
        t.latency_ms = meta.latency_ms;
        t.degraded = meta.degraded;
        t.timestamp = now();
        store_.record_query(std::move(t));
    }

    GraphStore& store_;
    QueryConfig config_;
    std::shared_ptr<DeadlineEmbedder> embedder_;
};

} // namespace sutra
