#pragma once
// VectorIndex: nearest-neighbor search over entity embeddings
//
// Callers see only the abstract interface, so an approximate index can
// replace the exact scan later. The exact scan is the default: at hundreds
// to low thousands of entities it is fast and fully deterministic.

#include "keyword_index.hpp"
#include "types.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <vector>

namespace sutra {

class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    // Index one vector per slot; null entries have no embedding
    virtual void build(const std::vector<const Vector*>& vectors) = 0;

    // Top-k by descending cosine; ties broken by ascending slot
    virtual std::vector<ScoredSlot> search(const Vector& query, size_t k,
        const std::function<bool(Slot)>& accept = nullptr) const = 0;

    // Number of slots that carry a vector
    virtual size_t size() const = 0;
};

class BruteForceIndex : public VectorIndex {
public:
    void build(const std::vector<const Vector*>& vectors) override {
        entries_.clear();
        for (size_t i = 0; i < vectors.size(); ++i) {
            if (!vectors[i] || vectors[i]->empty()) continue;
            Entry e;
            e.slot = static_cast<Slot>(i);
            e.vector = vectors[i];
            e.norm = vectors[i]->norm();
            entries_.push_back(e);
        }
    }

    std::vector<ScoredSlot> search(const Vector& query, size_t k,
        const std::function<bool(Slot)>& accept = nullptr) const override
    {
        std::vector<ScoredSlot> results;
        if (k == 0 || entries_.empty()) return results;

        float qn = query.norm();
        results.reserve(entries_.size());
        for (const auto& e : entries_) {
            if (accept && !accept(e.slot)) continue;
            float sim = 0.0f;
            if (qn > 0.0f && e.norm > 0.0f) {
                sim = query.dot(*e.vector) / (qn * e.norm);
            }
            results.push_back({e.slot, sim});
        }

        auto better = [](const ScoredSlot& a, const ScoredSlot& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.slot < b.slot;
        };
        if (results.size() > k) {
            std::partial_sort(results.begin(), results.begin() + k, results.end(), better);
            results.resize(k);
        } else {
            std::sort(results.begin(), results.end(), better);
        }
        return results;
    }

    size_t size() const override { return entries_.size(); }

private:
    struct Entry {
        Slot slot = 0;
        const Vector* vector = nullptr;  // owned by the snapshot
        float norm = 0.0f;
    };
    std::vector<Entry> entries_;
};

} // namespace sutra
