#pragma once
// Codec: JSON encoding of schema types
//
// Used by the SQLite store for metadata/keyword columns and by the
// snapshot exporter for whole entities and edges.

#include "errors.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

namespace sutra {

using json = nlohmann::json;

inline json metadata_value_to_json(const MetadataValue& value) {
    if (auto* s = std::get_if<std::string>(&value)) return *s;
    if (auto* d = std::get_if<double>(&value)) return *d;
    return std::get<std::vector<std::string>>(value);
}

// Accepts string, number or array of strings; anything else is rejected
inline MetadataValue metadata_value_from_json(const json& j) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_number()) return j.get<double>();
    if (j.is_array()) {
        std::vector<std::string> list;
        for (const auto& item : j) {
            if (!item.is_string()) {
                throw ValidationError("metadata lists may only hold strings");
            }
            list.push_back(item.get<std::string>());
        }
        return list;
    }
    throw ValidationError("unsupported metadata value: " + j.dump());
}

inline json metadata_to_json(const Metadata& m) {
    json j = json::object();
    for (const auto& [key, value] : m) {
        j[key] = metadata_value_to_json(value);
    }
    return j;
}

inline Metadata metadata_from_json(const json& j) {
    Metadata m;
    if (j.is_null()) return m;
    if (!j.is_object()) throw ValidationError("metadata must be an object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        m[it.key()] = metadata_value_from_json(it.value());
    }
    return m;
}

inline json hints_to_json(const EdgeHints& h) {
    json j = json::object();
    if (!h.mapping.empty()) j["mapping"] = h.mapping;
    if (!h.pitfalls.empty()) j["pitfalls"] = h.pitfalls;
    return j;
}

inline EdgeHints hints_from_json(const json& j) {
    EdgeHints h;
    if (!j.is_object()) return h;
    h.mapping = j.value("mapping", "");
    if (j.contains("pitfalls")) h.pitfalls = j.at("pitfalls").get<std::vector<std::string>>();
    return h;
}

inline json vector_to_json(const Vector& v) {
    return json(v.data);
}

inline Vector vector_from_json(const json& j) {
    if (!j.is_array()) throw ValidationError("embedding must be an array of numbers");
    std::vector<float> data;
    data.reserve(j.size());
    for (const auto& x : j) {
        if (!x.is_number()) throw ValidationError("embedding must be an array of numbers");
        data.push_back(x.get<float>());
    }
    return Vector(std::move(data));
}

inline json relationship_to_json(const Relationship& r) {
    json j = {
        {"source", r.source},
        {"target", r.target},
        {"type", relation_name(r.type)},
        {"strength", r.strength},
        {"reasoning", r.reasoning}
    };
    if (!r.hints.empty()) j["hints"] = hints_to_json(r.hints);
    return j;
}

inline Relationship relationship_from_json(const json& j) {
    Relationship r;
    r.source = j.at("source").get<std::string>();
    r.target = j.at("target").get<std::string>();
    auto type_name = j.at("type").get<std::string>();
    auto type = parse_relation(type_name);
    if (!type) throw ValidationError("unknown relationship type: " + type_name);
    r.type = *type;
    r.strength = j.at("strength").get<float>();
    r.reasoning = j.value("reasoning", "");
    if (j.contains("hints")) r.hints = hints_from_json(j.at("hints"));
    return r;
}

// Embedding travels separately in snapshots (see exporter)
inline json entity_to_json(const Entity& e) {
    return json{
        {"id", e.id},
        {"label", e.label},
        {"description", e.description},
        {"category", e.category},
        {"keywords", e.keywords},
        {"metadata", metadata_to_json(e.metadata)}
    };
}

inline Entity entity_from_json(const json& j) {
    Entity e;
    e.id = j.at("id").get<std::string>();
    e.label = j.value("label", e.id);
    e.description = j.value("description", "");
    e.category = j.value("category", "");
    if (j.contains("keywords")) e.keywords = j.at("keywords").get<std::vector<std::string>>();
    if (j.contains("metadata")) e.metadata = metadata_from_json(j.at("metadata"));
    return e;
}

} // namespace sutra
