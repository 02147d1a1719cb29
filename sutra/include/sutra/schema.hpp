#pragma once
// Schema: entities, relationships, metadata
//
// One fixed schema. Entities are typed nodes with a small metadata map;
// relationships are typed, weighted and either directed or symmetric.

#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace sutra {

// Metadata values are one of three kinds, never nested
using MetadataValue = std::variant<std::string, double, std::vector<std::string>>;
using Metadata = std::map<std::string, MetadataValue>;

// Well-known entity metadata keys
namespace meta {
constexpr const char* USE_CASES = "use_cases";
constexpr const char* PREREQUISITES = "prerequisites";
constexpr const char* PITFALLS = "pitfalls";
constexpr const char* TIPS = "tips";
constexpr const char* PRESETS = "presets";
constexpr const char* PATTERNS = "patterns";
constexpr const char* COMPLEXITY = "complexity";
constexpr const char* LEARNING_CURVE = "learning_curve";
constexpr const char* SUCCESS_RATE = "success_rate";   // absent = unknown
constexpr const char* USAGE_COUNT = "usage_count";     // absent = unknown
constexpr const char* RATING = "rating";
} // namespace meta

inline std::optional<double> meta_number(const Metadata& m, const std::string& key) {
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    if (auto* d = std::get_if<double>(&it->second)) return *d;
    return std::nullopt;
}

inline std::optional<std::string> meta_string(const Metadata& m, const std::string& key) {
    auto it = m.find(key);
    if (it == m.end()) return std::nullopt;
    if (auto* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

inline std::vector<std::string> meta_list(const Metadata& m, const std::string& key) {
    auto it = m.find(key);
    if (it == m.end()) return {};
    if (auto* l = std::get_if<std::vector<std::string>>(&it->second)) return *l;
    return {};
}

// A graph node: one domain building block
struct Entity {
    EntityId id;
    std::string label;
    std::string description;
    std::string category;
    std::vector<std::string> keywords;
    Metadata metadata;
    std::optional<Vector> embedding;
    std::string embedding_model;  // model that produced `embedding`

    bool has_embedding() const { return embedding.has_value() && !embedding->empty(); }
};

// ═══════════════════════════════════════════════════════════════════════════
// Relationships
// ═══════════════════════════════════════════════════════════════════════════

enum class RelationType : uint8_t {
    CompatibleWith = 0,
    BelongsToCategory = 1,
    UsedInPattern = 2,
    Solves = 3,
    Requires = 4,
    TriggeredBy = 5,
    SimilarTo = 6
};

constexpr RelationType ALL_RELATION_TYPES[] = {
    RelationType::CompatibleWith, RelationType::BelongsToCategory,
    RelationType::UsedInPattern, RelationType::Solves, RelationType::Requires,
    RelationType::TriggeredBy, RelationType::SimilarTo
};

inline const char* relation_name(RelationType type) {
    switch (type) {
        case RelationType::CompatibleWith:    return "compatible-with";
        case RelationType::BelongsToCategory: return "belongs-to-category";
        case RelationType::UsedInPattern:     return "used-in-pattern";
        case RelationType::Solves:            return "solves";
        case RelationType::Requires:          return "requires";
        case RelationType::TriggeredBy:       return "triggered-by";
        case RelationType::SimilarTo:         return "similar-to";
    }
    return "unknown";
}

inline std::optional<RelationType> parse_relation(const std::string& name) {
    for (auto type : ALL_RELATION_TYPES) {
        if (name == relation_name(type)) return type;
    }
    return std::nullopt;
}

// Symmetric types: (A,B) and (B,A) are one logical edge
inline bool is_symmetric(RelationType type) {
    return type == RelationType::BelongsToCategory ||
           type == RelationType::UsedInPattern ||
           type == RelationType::SimilarTo;
}

// Authored guidance attached to an edge; opaque text, never parsed
struct EdgeHints {
    std::string mapping;                 // data-field mapping example
    std::vector<std::string> pitfalls;

    bool empty() const { return mapping.empty() && pitfalls.empty(); }
};

struct Relationship {
    EntityId source;
    EntityId target;
    RelationType type = RelationType::CompatibleWith;
    float strength = 0.0f;
    std::string reasoning;
    EdgeHints hints;

    // Other endpoint as seen from `id`
    const EntityId& other(const EntityId& id) const {
        return id == source ? target : source;
    }
};

// Identity of a logical edge: symmetric edges are keyed with the smaller id first
using EdgeKey = std::tuple<EntityId, EntityId, RelationType>;

inline EdgeKey edge_key(const Relationship& r) {
    if (is_symmetric(r.type) && r.target < r.source) {
        return EdgeKey{r.target, r.source, r.type};
    }
    return EdgeKey{r.source, r.target, r.type};
}

// Store symmetric edges in canonical orientation
inline Relationship canonical(Relationship r) {
    if (is_symmetric(r.type) && r.target < r.source) {
        std::swap(r.source, r.target);
    }
    return r;
}

} // namespace sutra
