#pragma once
// Snapshot: an immutable, versioned view of the whole graph
//
// Writers stage changes in GraphData, then freeze it into a GraphSnapshot.
// Readers hold shared_ptr<const GraphSnapshot>; a commit swaps the pointer
// and nothing a reader can see is ever mutated.

#include "category_index.hpp"
#include "keyword_index.hpp"
#include "schema.hpp"
#include "vector_index.hpp"
#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sutra {

// ═══════════════════════════════════════════════════════════════════════════
// Staging data (mutable, owned by one writer)
// ═══════════════════════════════════════════════════════════════════════════

struct GraphData {
    std::map<EntityId, Entity> entities;
    std::vector<Relationship> edges;              // insertion order
    std::map<EdgeKey, size_t> edge_positions;     // key -> index in edges
    Metadata metadata;                            // store-wide facts

    bool has_entity(const EntityId& id) const {
        return entities.count(id) > 0;
    }

    // Insert or replace in place by logical key. Returns the edge position.
    size_t upsert_edge(Relationship r) {
        r = canonical(std::move(r));
        auto key = edge_key(r);
        auto it = edge_positions.find(key);
        if (it != edge_positions.end()) {
            edges[it->second] = std::move(r);
            return it->second;
        }
        size_t pos = edges.size();
        edges.push_back(std::move(r));
        edge_positions.emplace(std::move(key), pos);
        return pos;
    }

    void clear() {
        entities.clear();
        edges.clear();
        edge_positions.clear();
        metadata.clear();
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content hash: CRC32 over a canonical encoding of entities and edges
// ═══════════════════════════════════════════════════════════════════════════

class ContentHasher {
public:
    void bytes(const void* data, size_t n) {
        crc_ = crc32_update(crc_, static_cast<const uint8_t*>(data), n);
    }

    void u64(uint64_t v) { bytes(&v, sizeof(v)); }
    void f32(float v) { bytes(&v, sizeof(v)); }
    void f64(double v) { bytes(&v, sizeof(v)); }

    void str(const std::string& s) {
        u64(s.size());
        bytes(s.data(), s.size());
    }

    void strings(const std::vector<std::string>& list) {
        u64(list.size());
        for (const auto& s : list) str(s);
    }

    void metadata(const Metadata& m) {
        u64(m.size());
        for (const auto& [key, value] : m) {
            str(key);
            u64(value.index());
            if (auto* s = std::get_if<std::string>(&value)) str(*s);
            else if (auto* d = std::get_if<double>(&value)) f64(*d);
            else strings(std::get<std::vector<std::string>>(value));
        }
    }

    void entity(const Entity& e) {
        str(e.id);
        str(e.label);
        str(e.description);
        str(e.category);
        strings(e.keywords);
        metadata(e.metadata);
        if (e.has_embedding()) {
            u64(e.embedding->size());
            bytes(e.embedding->as_ptr(), e.embedding->size() * sizeof(float));
            str(e.embedding_model);
        } else {
            u64(0);
        }
    }

    void edge(const Relationship& r) {
        str(r.source);
        str(r.target);
        u64(static_cast<uint64_t>(r.type));
        f32(r.strength);
        str(r.reasoning);
        str(r.hints.mapping);
        strings(r.hints.pitfalls);
    }

    uint32_t value() const { return crc_; }

private:
    uint32_t crc_ = 0;
};

// Entities in id order, then edges in insertion order
template <typename EntityRange>
uint32_t content_hash(const EntityRange& entities, const std::vector<Relationship>& edges) {
    ContentHasher h;
    for (const Entity& e : entities) h.entity(e);
    h.u64(edges.size());
    for (const auto& r : edges) h.edge(r);
    return h.value();
}

inline uint32_t content_hash(const GraphData& data) {
    ContentHasher h;
    for (const auto& [_, e] : data.entities) h.entity(e);
    h.u64(data.edges.size());
    for (const auto& r : data.edges) h.edge(r);
    return h.value();
}

// One traversal step: neighbor reached through the strongest connecting edge
struct Hop {
    Slot neighbor;
    size_t edge;  // index into GraphSnapshot::edges()
};

// ═══════════════════════════════════════════════════════════════════════════
// Immutable snapshot
// ═══════════════════════════════════════════════════════════════════════════

class GraphSnapshot {
public:
    GraphSnapshot(GraphData data, uint64_t version)
        : version_(version), committed_at_(now())
    {
        entities_.reserve(data.entities.size());
        for (auto& [id, e] : data.entities) {
            slots_.emplace(id, static_cast<Slot>(entities_.size()));
            entities_.push_back(std::move(e));
        }
        edges_ = std::move(data.edges);
        metadata_ = std::move(data.metadata);

        build_adjacency();
        build_indices();
        hash_ = ::sutra::content_hash(entities_, edges_);
    }

    GraphSnapshot(const GraphSnapshot&) = delete;
    GraphSnapshot& operator=(const GraphSnapshot&) = delete;

    uint64_t version() const { return version_; }
    Timestamp committed_at() const { return committed_at_; }
    uint32_t content_hash() const { return hash_; }

    size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }

    // Entities in ascending id order; index = slot
    const std::vector<Entity>& entities() const { return entities_; }
    const Entity& at(Slot slot) const { return entities_[slot]; }

    std::optional<Slot> slot_of(const EntityId& id) const {
        auto it = slots_.find(id);
        if (it == slots_.end()) return std::nullopt;
        return it->second;
    }

    const Entity* find(const EntityId& id) const {
        auto slot = slot_of(id);
        return slot ? &entities_[*slot] : nullptr;
    }

    const std::vector<Relationship>& edges() const { return edges_; }

    // Edge indices where slot is the stored source / target, insertion order
    const std::vector<size_t>& out_edges(Slot slot) const { return out_[slot]; }
    const std::vector<size_t>& in_edges(Slot slot) const { return in_[slot]; }

    // Traversable neighbors: directed edges forward, symmetric edges both
    // ways; one hop per neighbor using its strongest edge
    const std::vector<Hop>& hops(Slot slot) const { return hops_[slot]; }

    const CategoryIndex& categories() const { return categories_; }
    const KeywordIndex& keywords() const { return keywords_; }
    const VectorIndex& vectors() const { return *vectors_; }
    const Metadata& metadata() const { return metadata_; }

    size_t embedding_count() const { return vectors_->size(); }

    // Copy back into staging form (begin of an incremental transaction)
    GraphData to_data() const {
        GraphData data;
        for (const auto& e : entities_) {
            data.entities.emplace(e.id, e);
        }
        data.edges = edges_;
        for (size_t i = 0; i < edges_.size(); ++i) {
            data.edge_positions.emplace(edge_key(edges_[i]), i);
        }
        data.metadata = metadata_;
        return data;
    }

private:
    void build_adjacency() {
        out_.assign(entities_.size(), {});
        in_.assign(entities_.size(), {});
        for (size_t i = 0; i < edges_.size(); ++i) {
            Slot s = slots_.at(edges_[i].source);
            Slot t = slots_.at(edges_[i].target);
            out_[s].push_back(i);
            in_[t].push_back(i);
        }

        hops_.assign(entities_.size(), {});
        for (Slot slot = 0; slot < entities_.size(); ++slot) {
            // Candidate edges in insertion order
            std::vector<size_t> candidates = out_[slot];
            for (size_t e : in_[slot]) {
                if (is_symmetric(edges_[e].type)) candidates.push_back(e);
            }
            std::sort(candidates.begin(), candidates.end());

            std::unordered_map<Slot, size_t> best;  // neighbor -> position in hops
            auto& hops = hops_[slot];
            for (size_t e : candidates) {
                const auto& r = edges_[e];
                Slot other = slots_.at(r.source == entities_[slot].id ? r.target : r.source);
                if (other == slot) continue;
                auto it = best.find(other);
                if (it == best.end()) {
                    best.emplace(other, hops.size());
                    hops.push_back({other, e});
                } else if (r.strength > edges_[hops[it->second].edge].strength) {
                    hops[it->second].edge = e;
                }
            }
        }
    }

    void build_indices() {
        std::vector<const Vector*> vectors(entities_.size(), nullptr);
        for (Slot slot = 0; slot < entities_.size(); ++slot) {
            const auto& e = entities_[slot];
            categories_.add(e.category, slot);

            std::string doc = e.label + " " + e.description + " " + e.category;
            for (const auto& kw : e.keywords) doc += " " + kw;
            for (const auto& uc : meta_list(e.metadata, meta::USE_CASES)) doc += " " + uc;
            keywords_.add(slot, doc);

            if (e.has_embedding()) vectors[slot] = &*e.embedding;
        }
        keywords_.finalize();

        vectors_ = std::make_unique<BruteForceIndex>();
        vectors_->build(vectors);
    }

    uint64_t version_;
    Timestamp committed_at_;
    uint32_t hash_ = 0;

    std::vector<Entity> entities_;
    std::unordered_map<EntityId, Slot> slots_;
    std::vector<Relationship> edges_;
    Metadata metadata_;

    std::vector<std::vector<size_t>> out_;
    std::vector<std::vector<size_t>> in_;
    std::vector<std::vector<Hop>> hops_;

    CategoryIndex categories_;
    KeywordIndex keywords_;
    std::unique_ptr<VectorIndex> vectors_;
};

using SnapshotPtr = std::shared_ptr<const GraphSnapshot>;

} // namespace sutra
