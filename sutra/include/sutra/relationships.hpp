#pragma once
// RelationshipInferrer: entities + patterns → typed, weighted edges
//
// Candidate pairs come from four sources:
//   same category          → belongs-to-category (symmetric)
//   pattern co-occurrence  → used-in-pattern (symmetric), consecutive
//                            members → compatible-with (directed),
//                            members after a trigger → triggered-by
//   pair rules             → compatible-with with authored hints
//   cosine ≥ threshold     → similar-to (symmetric)
// plus typed relations declared on catalog records.
//
// strength = clamp(prior + w_sim·sim' + w_cooc·f, 0, 1)
//   sim' = cosine when ≥ similarity_floor, else 0
//   f    = shared patterns / max(1, min(patterns(a), patterns(b)))
//
// Duplicates merge by edge identity keeping the strongest. A degree cap
// then admits edges greedily by strength so no entity ends up with more
// than fan_out_cap incident edges.

#include "catalog.hpp"
#include "category_index.hpp"
#include "log.hpp"
#include "schema.hpp"
#include "text.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <map>
#include <set>

namespace sutra {

struct PairRule {
    std::string from;       // id-suffix prefix of the producing entity
    std::string to;         // id-suffix prefix of the consuming entity
    float strength;
    std::string mapping;
    std::vector<std::string> pitfalls;
};

struct InferenceConfig {
    double similarity_floor = 0.6;
    double similar_threshold = 0.85;
    size_t fan_out_cap = 30;

    double similarity_weight = 0.5;
    double cooccurrence_weight = 0.5;

    double category_prior = 0.3;
    double pattern_prior = 0.4;
    double compatible_prior = 0.4;
    double trigger_prior = 0.4;
    double similar_prior = 0.5;
    float explicit_strength = 0.8f;

    std::string trigger_category = "trigger";
    std::vector<PairRule> pair_rules = default_pair_rules();

    static std::vector<PairRule> default_pair_rules() {
        return {
            {"http", "set", 0.95f, "{{$json.data}} -> fields",
             {"HTTP response may be nested, use .data or .body",
              "Check response structure with a test run first"}},
            {"set", "slack", 0.94f, "{{$json.message}} -> text",
             {"Slack expects 'text' or 'blocks', not both"}},
            {"http", "slack", 0.92f, "{{$json.body}} -> text",
             {"Format response for Slack (mrkdwn or blocks)",
              "Handle errors in the HTTP response"}},
            {"schedule", "http", 0.93f, "trigger -> request",
             {"Schedule may fire multiple times, ensure idempotency",
              "Check timezone settings"}},
            {"webhook", "set", 0.90f, "{{$json.body}} -> fields",
             {"Webhook payload structure varies by sender"}},
            {"postgres", "set", 0.92f, "{{$json.rows}} -> fields",
             {"Database returns an array of rows"}},
            {"set", "email", 0.91f, "{{$json.subject}}, {{$json.body}} -> email fields",
             {"Email may need HTML formatting"}},
            {"filter", "set", 0.89f, "filtered items -> fields",
             {"Filter may return an empty array"}},
        };
    }
};

struct InferenceReport {
    std::map<std::string, size_t> per_type;   // committed edges by relation name
    size_t candidates = 0;                    // distinct edges before the cap
    size_t dropped_by_cap = 0;
    size_t dangling_skipped = 0;              // references to unknown ids
};

class RelationshipInferrer {
public:
    explicit RelationshipInferrer(InferenceConfig config = {}) : config_(std::move(config)) {}

    // `entities` must already carry category and embedding. Pattern members
    // and record relations naming unknown ids are skipped, never committed.
    std::vector<Relationship> infer(const std::map<EntityId, Entity>& entities,
                                    const std::vector<Pattern>& patterns,
                                    const std::vector<CatalogRecord>& records,
                                    InferenceReport* report = nullptr) const {
        InferenceReport local;
        InferenceReport& rep = report ? *report : local;
        rep = InferenceReport{};

        std::vector<const Entity*> by_slot;
        std::map<EntityId, Slot> slot_of;
        for (const auto& [id, e] : entities) {
            slot_of.emplace(id, static_cast<Slot>(by_slot.size()));
            by_slot.push_back(&e);
        }

        // Resolve patterns to slots, dropping unknown members
        std::vector<std::vector<Slot>> members(patterns.size());
        std::vector<std::set<size_t>> membership(by_slot.size());
        for (size_t p = 0; p < patterns.size(); ++p) {
            for (const auto& id : patterns[p].members) {
                auto it = slot_of.find(id);
                if (it == slot_of.end()) {
                    rep.dangling_skipped++;
                    if (log::debug()) {
                        std::cerr << "[Relations] pattern " << patterns[p].id
                                  << " names unknown id " << id << "\n";
                    }
                    continue;
                }
                members[p].push_back(it->second);
                membership[it->second].insert(p);
            }
        }

        std::map<EdgeKey, Relationship> merged;
        auto offer = [&](Relationship r) {
            r = canonical(std::move(r));
            auto key = edge_key(r);
            auto it = merged.find(key);
            if (it == merged.end()) {
                merged.emplace(std::move(key), std::move(r));
                return;
            }
            if (r.strength > it->second.strength) {
                if (r.hints.empty()) r.hints = it->second.hints;
                it->second = std::move(r);
            } else if (it->second.hints.empty() && !r.hints.empty()) {
                it->second.hints = std::move(r.hints);
            }
        };

        auto similarity = [&](Slot a, Slot b) -> double {
            const Entity* ea = by_slot[a];
            const Entity* eb = by_slot[b];
            if (!ea->has_embedding() || !eb->has_embedding()) return 0.0;
            return ea->embedding->cosine(*eb->embedding);
        };

        auto cooccurrence = [&](Slot a, Slot b) -> double {
            const auto& pa = membership[a];
            const auto& pb = membership[b];
            size_t shared = 0;
            for (size_t p : pa) shared += pb.count(p);
            size_t denom = std::max<size_t>(1, std::min(pa.size(), pb.size()));
            return static_cast<double>(shared) / static_cast<double>(denom);
        };

        auto strength = [&](double prior, Slot a, Slot b) -> float {
            double sim = similarity(a, b);
            double sim_term = sim >= config_.similarity_floor ? sim : 0.0;
            double s = prior + config_.similarity_weight * sim_term +
                       config_.cooccurrence_weight * cooccurrence(a, b);
            return static_cast<float>(std::clamp(s, 0.0, 1.0));
        };

        auto make = [&](Slot a, Slot b, RelationType type, float s, std::string reasoning) {
            Relationship r;
            r.source = by_slot[a]->id;
            r.target = by_slot[b]->id;
            r.type = type;
            r.strength = s;
            r.reasoning = std::move(reasoning);
            return r;
        };

        // ── Same category ───────────────────────────────────────────────────
        CategoryIndex categories;
        for (Slot s = 0; s < by_slot.size(); ++s) categories.add(by_slot[s]->category, s);
        for (const auto& category : categories.categories()) {
            auto slots = categories.slots(category);
            for (size_t i = 0; i < slots.size(); ++i) {
                for (size_t j = i + 1; j < slots.size(); ++j) {
                    offer(make(slots[i], slots[j], RelationType::BelongsToCategory,
                               strength(config_.category_prior, slots[i], slots[j]),
                               "Both are " + category + " blocks"));
                }
            }
        }

        // ── Pattern co-occurrence ───────────────────────────────────────────
        for (size_t p = 0; p < patterns.size(); ++p) {
            const auto& list = members[p];
            const std::string& name = patterns[p].name;
            for (size_t i = 0; i < list.size(); ++i) {
                for (size_t j = i + 1; j < list.size(); ++j) {
                    if (list[i] == list[j]) continue;
                    offer(make(list[i], list[j], RelationType::UsedInPattern,
                               strength(config_.pattern_prior, list[i], list[j]),
                               "Used together in pattern '" + name + "'"));
                }
            }
            for (size_t i = 0; i + 1 < list.size(); ++i) {
                Slot a = list[i], b = list[i + 1];
                if (a == b) continue;
                offer(make(a, b, RelationType::CompatibleWith,
                           strength(config_.compatible_prior, a, b),
                           by_slot[a]->label + " feeds " + by_slot[b]->label +
                           " in pattern '" + name + "'"));
            }
            for (size_t i = 0; i < list.size(); ++i) {
                if (by_slot[list[i]]->category != config_.trigger_category) continue;
                for (size_t j = i + 1; j < list.size(); ++j) {
                    Slot later = list[j];
                    if (later == list[i]) continue;
                    if (by_slot[later]->category == config_.trigger_category) continue;
                    offer(make(later, list[i], RelationType::TriggeredBy,
                               strength(config_.trigger_prior, later, list[i]),
                               by_slot[later]->label + " is started by " +
                               by_slot[list[i]]->label + " in pattern '" + name + "'"));
                }
            }
        }

        // ── Pair rules ──────────────────────────────────────────────────────
        for (const auto& rule : config_.pair_rules) {
            std::vector<Slot> producers, consumers;
            for (Slot s = 0; s < by_slot.size(); ++s) {
                std::string key = node_key(by_slot[s]->id);
                if (starts_with(key, rule.from)) producers.push_back(s);
                if (starts_with(key, rule.to)) consumers.push_back(s);
            }
            for (Slot a : producers) {
                for (Slot b : consumers) {
                    if (a == b) continue;
                    Relationship r = make(a, b, RelationType::CompatibleWith,
                                          std::clamp(rule.strength, 0.0f, 1.0f),
                                          by_slot[a]->label + " output commonly flows into " +
                                          by_slot[b]->label);
                    r.hints.mapping = rule.mapping;
                    r.hints.pitfalls = rule.pitfalls;
                    offer(std::move(r));
                }
            }
        }

        // ── High similarity ─────────────────────────────────────────────────
        for (Slot a = 0; a < by_slot.size(); ++a) {
            if (!by_slot[a]->has_embedding()) continue;
            for (Slot b = a + 1; b < by_slot.size(); ++b) {
                double sim = similarity(a, b);
                if (sim < config_.similar_threshold) continue;
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%.2f", sim);
                offer(make(a, b, RelationType::SimilarTo,
                           strength(config_.similar_prior, a, b),
                           std::string("Descriptions are highly similar (cosine ") + buf + ")"));
            }
        }

        // ── Declared relations ──────────────────────────────────────────────
        for (const auto& record : records) {
            auto src = slot_of.find(record.id);
            if (src == slot_of.end()) continue;
            for (const auto& rel : record.relations) {
                auto type = parse_relation(rel.type);
                auto dst = slot_of.find(rel.target);
                if (!type || dst == slot_of.end() || dst->second == src->second) {
                    rep.dangling_skipped++;
                    if (log::enabled()) {
                        std::cerr << "[Relations] dropped declared relation " << record.id
                                  << " " << rel.type << " " << rel.target << "\n";
                    }
                    continue;
                }
                offer(make(src->second, dst->second, *type, config_.explicit_strength,
                           "Declared in catalog: " + record.id + " " + rel.type + " " +
                           rel.target));
            }
        }

        rep.candidates = merged.size();
        auto edges = apply_cap(merged, slot_of, rep);
        for (const auto& r : edges) rep.per_type[relation_name(r.type)]++;

        if (log::enabled()) {
            std::cerr << "[Relations] " << edges.size() << " edges from " << rep.candidates
                      << " candidates (" << rep.dropped_by_cap << " over cap)\n";
        }
        return edges;
    }

    const InferenceConfig& config() const { return config_; }

private:
    static bool starts_with(const std::string& s, const std::string& prefix) {
        return !prefix.empty() && s.compare(0, prefix.size(), prefix) == 0;
    }

    std::vector<Relationship> apply_cap(std::map<EdgeKey, Relationship>& merged,
                                        const std::map<EntityId, Slot>& slot_of,
                                        InferenceReport& rep) const {
        std::vector<Relationship> ordered;
        ordered.reserve(merged.size());
        for (auto& [_, r] : merged) ordered.push_back(std::move(r));

        std::sort(ordered.begin(), ordered.end(), [](const Relationship& a, const Relationship& b) {
            if (a.strength != b.strength) return a.strength > b.strength;
            if (a.type != b.type) return a.type < b.type;
            if (a.source != b.source) return a.source < b.source;
            return a.target < b.target;
        });

        std::vector<size_t> degree(slot_of.size(), 0);
        std::vector<Relationship> accepted;
        for (auto& r : ordered) {
            Slot s = slot_of.at(r.source);
            Slot t = slot_of.at(r.target);
            if (degree[s] >= config_.fan_out_cap || degree[t] >= config_.fan_out_cap) {
                rep.dropped_by_cap++;
                continue;
            }
            degree[s]++;
            degree[t]++;
            accepted.push_back(std::move(r));
        }
        return accepted;
    }

    InferenceConfig config_;
};

} // namespace sutra
