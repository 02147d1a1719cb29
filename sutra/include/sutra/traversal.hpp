#pragma once
// Graph traversal over an immutable snapshot
//
// Directed edges are followed forward, symmetric edges both ways (see
// GraphSnapshot::hops). Both walks are breadth-first with explicit bounds,
// so every call terminates without cancellation machinery.
//
//   neighbors()   every node within `depth` hops, at minimum distance
//   PathStream    simple paths source → target, yielded as found,
//                 shallowest first; order among equal-depth paths follows
//                 the frontier and carries no meaning

#include "errors.hpp"
#include "snapshot.hpp"
#include <deque>
#include <optional>

namespace sutra {

struct NeighborHit {
    EntityId id;
    int distance = 0;
    EntityId via;                 // predecessor on a shortest route
    RelationType relation = RelationType::CompatibleWith;
    float strength = 0.0f;        // strength of the edge from `via`
};

struct NeighborResult {
    std::vector<NeighborHit> hits;   // BFS order
    bool truncated = false;          // max_results cut the set short
};

// Throws ValidationError for depth <= 0, NotFound for an unknown id
inline NeighborResult neighbors(const GraphSnapshot& snap, const EntityId& id,
                                int depth, size_t max_results = 1000) {
    if (depth <= 0) throw ValidationError("depth must be at least 1");
    auto start = snap.slot_of(id);
    if (!start) throw NotFound("entity not found: " + id);

    NeighborResult result;
    std::vector<int> distance(snap.size(), -1);
    distance[*start] = 0;
    std::deque<Slot> frontier{*start};

    while (!frontier.empty()) {
        Slot u = frontier.front();
        frontier.pop_front();
        if (distance[u] >= depth) continue;

        for (const auto& hop : snap.hops(u)) {
            if (distance[hop.neighbor] >= 0) continue;
            if (result.hits.size() >= max_results) {
                result.truncated = true;
                return result;
            }
            distance[hop.neighbor] = distance[u] + 1;
            const auto& edge = snap.edges()[hop.edge];
            result.hits.push_back({snap.at(hop.neighbor).id, distance[hop.neighbor],
                                   snap.at(u).id, edge.type, edge.strength});
            frontier.push_back(hop.neighbor);
        }
    }
    return result;
}

struct GraphPath {
    std::vector<EntityId> nodes;
    std::vector<Relationship> edges;
    double confidence = 1.0;      // product of edge strengths

    size_t hops() const { return edges.size(); }
};

// Pull-based path producer. Each next() call does only the expansion
// needed to surface one more path.
class PathStream {
public:
    PathStream(SnapshotPtr snap, const EntityId& source, const EntityId& target,
               int max_hops, int max_paths)
        : snap_(std::move(snap))
    {
        if (max_hops <= 0) throw ValidationError("max_hops must be at least 1");
        if (max_paths <= 0) throw ValidationError("max_paths must be at least 1");
        auto s = snap_->slot_of(source);
        if (!s) throw NotFound("entity not found: " + source);
        auto t = snap_->slot_of(target);
        if (!t) throw NotFound("entity not found: " + target);

        max_hops_ = static_cast<size_t>(max_hops);
        max_paths_ = static_cast<size_t>(max_paths);
        target_ = *t;

        Partial root;
        root.nodes.push_back(*s);
        if (*s == *t) {
            ready_.push_back(std::move(root));
        } else {
            queue_.push_back(std::move(root));
        }
    }

    std::optional<GraphPath> next() {
        if (emitted_ >= max_paths_) {
            if (!ready_.empty() || !queue_.empty()) truncated_ = true;
            return std::nullopt;
        }
        while (ready_.empty() && !queue_.empty()) expand();
        if (ready_.empty()) return std::nullopt;

        Partial found = std::move(ready_.front());
        ready_.pop_front();
        emitted_++;
        return materialize(found);
    }

    // Drain up to the path bound
    std::vector<GraphPath> collect() {
        std::vector<GraphPath> paths;
        while (auto p = next()) paths.push_back(std::move(*p));
        // Look one step further so truncation is known
        next();
        return paths;
    }

    bool truncated() const { return truncated_; }
    size_t emitted() const { return emitted_; }
    const GraphSnapshot& snapshot() const { return *snap_; }
    size_t expanded() const { return expanded_; }

private:
    struct Partial {
        std::vector<Slot> nodes;
        std::vector<size_t> edges;
    };

    void expand() {
        Partial path = std::move(queue_.front());
        queue_.pop_front();
        Slot u = path.nodes.back();
        const auto& hops = snap_->hops(u);
        if (path.edges.size() >= max_hops_) {
            if (!hops.empty()) truncated_ = true;
            return;
        }
        expanded_++;
        for (const auto& hop : hops) {
            if (std::find(path.nodes.begin(), path.nodes.end(), hop.neighbor) != path.nodes.end()) {
                continue;
            }
            Partial extended = path;
            extended.nodes.push_back(hop.neighbor);
            extended.edges.push_back(hop.edge);
            if (hop.neighbor == target_) {
                ready_.push_back(std::move(extended));
            } else {
                queue_.push_back(std::move(extended));
            }
        }
    }

    GraphPath materialize(const Partial& p) const {
        GraphPath path;
        for (Slot s : p.nodes) path.nodes.push_back(snap_->at(s).id);
        for (size_t e : p.edges) {
            const auto& r = snap_->edges()[e];
            path.confidence *= r.strength;
            path.edges.push_back(r);
        }
        return path;
    }

    SnapshotPtr snap_;
    Slot target_ = 0;
    size_t max_hops_ = 0;
    size_t max_paths_ = 0;
    std::deque<Partial> queue_;
    std::deque<Partial> ready_;
    size_t emitted_ = 0;
    size_t expanded_ = 0;
    bool truncated_ = false;
};

} // namespace sutra
