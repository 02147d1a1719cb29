#pragma once
// KeywordIndex: BM25 sparse retrieval over entity text
//
// Documents are label, description, keywords and use cases of one entity.
// Built once per snapshot; search scores are normalized to [0, 1] by the
// best hit so they can be fused with cosine scores.

#include "text.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sutra {

struct BM25Config {
    float k1 = 1.5f;   // Term frequency saturation
    float b = 0.75f;   // Length normalization
};

struct Posting {
    Slot doc;
    float tf;  // Term frequency (raw count)

    Posting(Slot d, float freq) : doc(d), tf(freq) {}
};

struct ScoredSlot {
    Slot slot;
    float score;
};

class KeywordIndex {
public:
    explicit KeywordIndex(BM25Config config = {}) : config_(config) {}

    // Documents must be added once each, in any order
    void add(Slot doc, const std::string& text) {
        auto tokens = tokenize(text);
        if (tokens.empty()) return;

        doc_lengths_[doc] = tokens.size();
        total_length_ += tokens.size();
        doc_count_++;

        std::unordered_map<std::string, size_t> term_freq;
        for (const auto& token : tokens) {
            term_freq[token]++;
        }

        for (const auto& [term, freq] : term_freq) {
            postings_[term].emplace_back(doc, static_cast<float>(freq));
            doc_freqs_[term]++;
        }
    }

    // Compute IDF table; call once after the last add()
    void finalize() {
        idf_.clear();
        for (const auto& [term, df] : doc_freqs_) {
            float df_f = static_cast<float>(df);
            idf_[term] = std::log((doc_count_ - df_f + 0.5f) / (df_f + 0.5f) + 1.0f);
        }
    }

    // Top `limit` documents, best first; ties broken by ascending slot.
    // `accept` filters documents (null = accept all).
    std::vector<ScoredSlot> search(const std::string& query, size_t limit,
                                   const std::function<bool(Slot)>& accept = nullptr) const {
        auto query_tokens = tokenize(query);
        if (query_tokens.empty() || doc_count_ == 0 || limit == 0) return {};

        // Repeated query terms count once
        std::sort(query_tokens.begin(), query_tokens.end());
        query_tokens.erase(std::unique(query_tokens.begin(), query_tokens.end()),
                           query_tokens.end());

        float avg_dl = static_cast<float>(total_length_) / doc_count_;
        std::unordered_map<Slot, float> scores;

        for (const auto& qt : query_tokens) {
            auto pit = postings_.find(qt);
            if (pit == postings_.end()) continue;
            auto idf_it = idf_.find(qt);
            if (idf_it == idf_.end()) continue;
            float idf = idf_it->second;

            for (const auto& posting : pit->second) {
                if (accept && !accept(posting.doc)) continue;
                float dl = static_cast<float>(doc_lengths_.at(posting.doc));
                float numerator = posting.tf * (config_.k1 + 1.0f);
                float denominator = posting.tf + config_.k1 * (1.0f - config_.b +
                                    config_.b * dl / avg_dl);
                scores[posting.doc] += idf * numerator / denominator;
            }
        }

        std::vector<ScoredSlot> results;
        results.reserve(scores.size());
        for (const auto& [doc, score] : scores) {
            results.push_back({doc, score});
        }

        auto better = [](const ScoredSlot& a, const ScoredSlot& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.slot < b.slot;
        };
        if (results.size() > limit) {
            std::partial_sort(results.begin(), results.begin() + limit, results.end(), better);
            results.resize(limit);
        } else {
            std::sort(results.begin(), results.end(), better);
        }

        if (!results.empty() && results.front().score > 0.0f) {
            float top = results.front().score;
            for (auto& r : results) r.score /= top;
        }
        return results;
    }

    size_t size() const { return doc_count_; }
    size_t vocab_size() const { return postings_.size(); }

private:
    BM25Config config_;
    size_t doc_count_ = 0;
    size_t total_length_ = 0;

    // Inverted index: term -> posting list
    std::unordered_map<std::string, std::vector<Posting>> postings_;
    std::unordered_map<Slot, size_t> doc_lengths_;
    std::unordered_map<std::string, size_t> doc_freqs_;
    std::unordered_map<std::string, float> idf_;
};

} // namespace sutra
