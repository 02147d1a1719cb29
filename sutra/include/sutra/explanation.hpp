#pragma once
// Explanation: why an entity answers a query
//
// Template text assembled only from fields already on the entity and its
// edges: matched keywords and use cases for direct hits, the connecting
// edge and its reasoning for graph-boosted hits, pitfalls and
// prerequisites as caveats. Same snapshot + same inputs = same text.
//
//   explain_entity()        why one entity answers a query
//   explain_path()          how the entities along a path combine
//   explain_alternatives()  what else can stand in for an entity

#include "errors.hpp"
#include "snapshot.hpp"
#include "text.hpp"
#include "traversal.hpp"
#include <cstdio>
#include <set>
#include <sstream>

namespace sutra {

// Score components of one ranked hit
struct ScoreBreakdown {
    double score = 0.0;
    double semantic_score = 0.0;
    double keyword_score = 0.0;
    double graph_boost = 0.0;
    std::vector<EntityId> boosted_by;   // seeds whose 1-hop edge boosted the hit
};

struct ExplainedEdge {
    EntityId other;
    std::string other_label;
    RelationType type = RelationType::CompatibleWith;
    float strength = 0.0f;
    std::string reasoning;
    EdgeHints hints;
};

struct Explanation {
    EntityId id;
    std::string summary;
    std::vector<std::string> matched_terms;
    std::vector<std::string> matched_use_cases;
    std::vector<std::string> reasons;
    std::vector<ExplainedEdge> connections;
    std::vector<std::string> caveats;
    std::optional<double> success_rate;
    ScoreBreakdown scores;

    std::string text() const {
        std::ostringstream out;
        out << summary << "\n";
        for (const auto& r : reasons) out << "  - " << r << "\n";
        for (const auto& c : connections) {
            out << "  - Connected to " << c.other_label << " (" << relation_name(c.type)
                << ", strength " << format_fixed(c.strength, 2) << "): " << c.reasoning << "\n";
            if (!c.hints.mapping.empty()) out << "      mapping: " << c.hints.mapping << "\n";
        }
        if (!caveats.empty()) {
            out << "  Watch out:\n";
            for (const auto& c : caveats) out << "    * " << c << "\n";
        }
        return out.str();
    }

    static std::string format_fixed(double value, int digits) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.*f", digits, value);
        return buf;
    }
};

// `scores` may be null when the entity was not ranked for this query
inline Explanation explain_entity(const GraphSnapshot& snap, const std::string& query,
                                  Slot slot, const ScoreBreakdown* scores) {
    const Entity& e = snap.at(slot);
    Explanation x;
    x.id = e.id;
    x.summary = "Recommended: " + e.label + " (" + e.category + ")";
    if (scores) x.scores = *scores;

    // Query terms present on the entity, in query order
    std::set<std::string> vocabulary;
    for (const auto& t : tokenize(e.label + " " + e.description)) vocabulary.insert(t);
    for (const auto& kw : e.keywords) {
        for (const auto& t : tokenize(kw)) vocabulary.insert(t);
    }
    auto use_cases = meta_list(e.metadata, meta::USE_CASES);
    for (const auto& uc : use_cases) {
        for (const auto& t : tokenize(uc)) vocabulary.insert(t);
    }
    auto terms = content_terms(query);
    for (const auto& t : terms) {
        if (vocabulary.count(t)) x.matched_terms.push_back(t);
    }

    std::set<std::string> matched(x.matched_terms.begin(), x.matched_terms.end());
    for (const auto& uc : use_cases) {
        for (const auto& t : tokenize(uc)) {
            if (matched.count(t)) {
                x.matched_use_cases.push_back(uc);
                break;
            }
        }
    }

    if (x.scores.semantic_score > 0.0) {
        x.reasons.push_back("Semantic similarity " +
                            Explanation::format_fixed(x.scores.semantic_score, 2) +
                            " to the query");
    }
    if (!x.matched_terms.empty()) {
        x.reasons.push_back("Matches query terms: " + join(x.matched_terms, ", "));
    }
    for (const auto& uc : x.matched_use_cases) x.reasons.push_back("Use case: " + uc);
    if (x.reasons.empty() && !use_cases.empty()) {
        x.reasons.push_back("Typical use: " + use_cases.front());
    }

    x.success_rate = meta_number(e.metadata, meta::SUCCESS_RATE);
    if (x.success_rate) {
        x.reasons.push_back("Observed success rate " +
                            Explanation::format_fixed(*x.success_rate * 100.0, 0) + "%");
    }

    // Connecting edges for graph-boosted hits
    for (const auto& seed_id : x.scores.boosted_by) {
        auto seed = snap.slot_of(seed_id);
        if (!seed) continue;
        for (const auto& hop : snap.hops(*seed)) {
            if (hop.neighbor != slot) continue;
            const auto& r = snap.edges()[hop.edge];
            ExplainedEdge c;
            c.other = seed_id;
            c.other_label = snap.at(*seed).label;
            c.type = r.type;
            c.strength = r.strength;
            c.reasoning = r.reasoning;
            c.hints = r.hints;
            x.connections.push_back(std::move(c));
            break;
        }
    }

    for (const auto& p : meta_list(e.metadata, meta::PITFALLS)) x.caveats.push_back(p);
    for (const auto& p : meta_list(e.metadata, meta::PREREQUISITES)) {
        x.caveats.push_back("Requires: " + p);
    }
    return x;
}

// ═══════════════════════════════════════════════════════════════════════════
// Paths
// ═══════════════════════════════════════════════════════════════════════════

// Paths longer than this get a "consider a shorter route" caveat
constexpr size_t LONG_PATH_HOPS = 3;
// Paths below this confidence get a "test thoroughly" caveat
constexpr double MODERATE_CONFIDENCE = 0.7;

// One hop, oriented along the path even when the stored edge is symmetric
// and written the other way round
struct PathStep {
    EntityId from;
    EntityId to;
    std::string from_label;
    std::string to_label;
    RelationType type = RelationType::CompatibleWith;
    float strength = 0.0f;
    std::string reasoning;
    EdgeHints hints;
};

struct PathExplanation {
    std::string summary;
    std::vector<PathStep> steps;
    std::vector<std::string> reasons;
    std::vector<std::string> caveats;
    std::vector<std::string> next_steps;
    double confidence = 0.0;

    std::string text() const {
        std::ostringstream out;
        out << summary << "\n";
        for (const auto& r : reasons) out << "  - " << r << "\n";
        for (size_t i = 0; i < steps.size(); ++i) {
            const auto& s = steps[i];
            out << "  " << (i + 1) << ". " << s.from_label << " -> " << s.to_label << " ("
                << relation_name(s.type) << ", strength "
                << Explanation::format_fixed(s.strength, 2) << ")";
            if (!s.reasoning.empty()) out << ": " << s.reasoning;
            out << "\n";
            if (!s.hints.mapping.empty()) out << "      mapping: " << s.hints.mapping << "\n";
        }
        if (!caveats.empty()) {
            out << "  Watch out:\n";
            for (const auto& c : caveats) out << "    * " << c << "\n";
        }
        if (!next_steps.empty()) {
            out << "  Next:\n";
            for (const auto& n : next_steps) out << "    > " << n << "\n";
        }
        return out.str();
    }
};

// Throws NotFound when the path names an entity this snapshot lacks,
// ValidationError when nodes and edges do not line up
inline PathExplanation explain_path(const GraphSnapshot& snap, const GraphPath& path) {
    if (path.nodes.empty() || path.nodes.size() != path.edges.size() + 1) {
        throw ValidationError("path has " + std::to_string(path.nodes.size()) + " nodes and " +
                              std::to_string(path.edges.size()) + " edges");
    }
    std::vector<std::string> labels;
    for (const auto& id : path.nodes) {
        const Entity* e = snap.find(id);
        if (!e) throw NotFound("entity not found: " + id);
        labels.push_back(e->label);
    }

    PathExplanation x;
    x.confidence = path.confidence;
    x.summary = "Integration path: " + labels.front() + " -> " + labels.back();
    if (path.hops() == 0) {
        x.reasons.push_back("Source and target are the same entity");
        return x;
    }

    size_t weakest = 0;
    for (size_t i = 0; i < path.edges.size(); ++i) {
        const auto& r = path.edges[i];
        PathStep step;
        step.from = path.nodes[i];
        step.to = path.nodes[i + 1];
        step.from_label = labels[i];
        step.to_label = labels[i + 1];
        step.type = r.type;
        step.strength = r.strength;
        step.reasoning = r.reasoning;
        step.hints = r.hints;
        if (r.strength < path.edges[weakest].strength) weakest = i;

        for (const auto& p : r.hints.pitfalls) {
            x.caveats.push_back(step.from_label + " -> " + step.to_label + ": " + p);
        }
        x.steps.push_back(std::move(step));
    }

    x.reasons.push_back("Path with " + std::to_string(path.hops()) +
                        (path.hops() == 1 ? " connection" : " connections") + ": " +
                        join(labels, " -> "));
    x.reasons.push_back("Total confidence " + Explanation::format_fixed(path.confidence * 100.0, 0) +
                        "% (product of edge strengths)");
    if (path.hops() > 1) {
        const auto& w = x.steps[weakest];
        x.reasons.push_back("Weakest link: " + w.from_label + " -> " + w.to_label + " (" +
                            Explanation::format_fixed(w.strength, 2) + ")");
    }

    if (path.hops() > LONG_PATH_HOPS) {
        x.caveats.push_back("Long path; a shorter route may exist");
    }
    if (path.confidence < MODERATE_CONFIDENCE) {
        x.caveats.push_back("Moderate confidence; test each step before relying on the chain");
    }

    if (labels.size() > 2) {
        std::vector<std::string> middle(labels.begin() + 1, labels.end() - 1);
        x.next_steps.push_back("Use " + join(middle, ", ") + " as intermediate steps");
    }
    for (const auto& s : x.steps) {
        if (s.type == RelationType::CompatibleWith || s.type == RelationType::TriggeredBy) {
            x.next_steps.push_back("Map " + s.from_label + " output to " + s.to_label + " input");
        }
    }
    x.next_steps.push_back("Test each step on sample data before running the whole chain");
    return x;
}

// ═══════════════════════════════════════════════════════════════════════════
// Alternatives
// ═══════════════════════════════════════════════════════════════════════════

// An entity that can stand in for another. `basis` is "similar-to" when a
// similar-to edge links the two, "same-category" otherwise.
struct AlternativeHit {
    EntityId id;
    std::string label;
    std::string category;
    double score = 0.0;
    std::string basis;
};

struct AlternativesExplanation {
    EntityId id;
    std::string summary;
    std::vector<std::string> reasons;
    std::vector<std::string> options;     // one line per alternative, rank order
    std::vector<std::string> next_steps;

    std::string text() const {
        std::ostringstream out;
        out << summary << "\n";
        for (const auto& r : reasons) out << "  - " << r << "\n";
        for (size_t i = 0; i < options.size(); ++i) {
            out << "  " << (i + 1) << ". " << options[i] << "\n";
        }
        if (!next_steps.empty()) {
            out << "  Next:\n";
            for (const auto& n : next_steps) out << "    > " << n << "\n";
        }
        return out.str();
    }
};

inline AlternativesExplanation explain_alternatives(const GraphSnapshot& snap,
                                                    const EntityId& id,
                                                    const std::vector<AlternativeHit>& hits) {
    const Entity* original = snap.find(id);
    if (!original) throw NotFound("entity not found: " + id);

    AlternativesExplanation x;
    x.id = id;
    x.summary = "Alternatives to " + original->label;
    if (hits.empty()) {
        x.reasons.push_back("No similar or same-category entity in the graph");
        return x;
    }

    size_t similar = 0;
    for (const auto& h : hits) {
        if (h.basis == "similar-to") similar++;
    }
    x.reasons.push_back("Found " + std::to_string(hits.size()) +
                        (hits.size() == 1 ? " alternative" : " alternatives"));
    if (similar > 0) {
        x.reasons.push_back(std::to_string(similar) + " linked by a similar-to edge");
    }
    if (similar < hits.size()) {
        x.reasons.push_back(std::to_string(hits.size() - similar) + " from the same category (" +
                            original->category + ")");
    }

    std::set<std::string> own_uses;
    for (const auto& uc : meta_list(original->metadata, meta::USE_CASES)) own_uses.insert(uc);

    for (const auto& h : hits) {
        std::string line = h.label + " (" + h.basis + ", " +
                           Explanation::format_fixed(h.score, 2) + ")";
        if (const Entity* e = snap.find(h.id)) {
            for (const auto& uc : meta_list(e->metadata, meta::USE_CASES)) {
                if (!own_uses.count(uc)) {
                    line += ": also " + lowercase(uc);
                    break;
                }
            }
        }
        x.options.push_back(std::move(line));
    }

    x.next_steps.push_back("Compare the use cases of each alternative against your workflow");
    x.next_steps.push_back("Check prerequisites before swapping " + original->label + " out");
    return x;
}

} // namespace sutra
