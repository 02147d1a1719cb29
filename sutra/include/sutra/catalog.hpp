#pragma once
// Catalog: the flat input the builder turns into a graph
//
// JSON shape:
//   {
//     "entities": [
//       {"id": "...", "label": "...", "description": "...",
//        "category": "...",                      (optional)
//        "patterns": ["pattern-id", ...],        (optional)
//        "success_rate": 0.9, "usage_count": 12, (optional)
//        "rating": 4.5,                          (optional)
//        "relations": [{"type": "requires", "target": "other-id"}]}
//     ],
//     "patterns": [
//       ["id-a", "id-b"],                                   (anonymous)
//       {"id": "p1", "name": "Data Sync", "members": [...]}
//     ]
//   }
// A bare top-level array is read as the entity list. Malformed records are
// skipped and counted, never fatal.

#include "codec.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "text.hpp"
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>

namespace sutra {

struct CatalogRelation {
    std::string type;
    EntityId target;
};

struct CatalogRecord {
    EntityId id;
    std::string label;
    std::string description;
    std::optional<std::string> category;
    std::vector<std::string> patterns;        // pattern ids this record joins
    std::optional<double> success_rate;
    std::optional<int64_t> usage_count;
    std::optional<double> rating;
    std::vector<CatalogRelation> relations;
};

struct Pattern {
    std::string id;
    std::string name;
    std::vector<EntityId> members;   // order matters: data flows left to right
};

struct Catalog {
    std::vector<CatalogRecord> records;
    std::vector<Pattern> patterns;
    size_t total_records = 0;
    size_t skipped = 0;
    std::vector<std::string> problems;
    uint32_t hash = 0;               // CRC32 of the canonical JSON text
};

namespace detail {

inline std::optional<std::string> opt_string(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) throw ValidationError(std::string(key) + " must be a string");
    return j.at(key).get<std::string>();
}

inline std::optional<double> opt_number(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_number()) throw ValidationError(std::string(key) + " must be a number");
    return j.at(key).get<double>();
}

inline std::vector<std::string> string_list(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return {};
    const auto& list = j.at(key);
    if (!list.is_array()) throw ValidationError(std::string(key) + " must be an array");
    std::vector<std::string> out;
    for (const auto& item : list) {
        if (!item.is_string()) throw ValidationError(std::string(key) + " must hold strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

inline CatalogRecord parse_record(const json& j) {
    if (!j.is_object()) throw ValidationError("record is not an object");
    auto id = opt_string(j, "id");
    if (!id || trim(*id).empty()) throw ValidationError("missing id");

    CatalogRecord r;
    r.id = trim(*id);
    r.label = opt_string(j, "label").value_or(r.id);
    if (trim(r.label).empty()) r.label = r.id;
    r.description = opt_string(j, "description").value_or("");
    r.category = opt_string(j, "category");
    r.patterns = string_list(j, "patterns");
    r.success_rate = opt_number(j, "success_rate");
    if (r.success_rate && (*r.success_rate < 0.0 || *r.success_rate > 1.0)) {
        throw ValidationError("success_rate outside [0,1]");
    }
    if (auto usage = opt_number(j, "usage_count")) {
        if (*usage < 0.0) throw ValidationError("usage_count is negative");
        r.usage_count = static_cast<int64_t>(*usage);
    }
    r.rating = opt_number(j, "rating");

    if (j.contains("relations") && !j.at("relations").is_null()) {
        const auto& rels = j.at("relations");
        if (!rels.is_array()) throw ValidationError("relations must be an array");
        for (const auto& rel : rels) {
            if (!rel.is_object()) throw ValidationError("relation is not an object");
            auto type = opt_string(rel, "type");
            auto target = opt_string(rel, "target");
            if (!type || !target) throw ValidationError("relation needs type and target");
            r.relations.push_back({*type, *target});
        }
    }
    return r;
}

} // namespace detail

inline Catalog parse_catalog(const json& root) {
    Catalog catalog;
    const json* entities = nullptr;
    const json* patterns = nullptr;

    if (root.is_array()) {
        entities = &root;
    } else if (root.is_object()) {
        if (root.contains("entities")) entities = &root.at("entities");
        else if (root.contains("nodes")) entities = &root.at("nodes");
        if (root.contains("patterns")) patterns = &root.at("patterns");
    }
    if (!entities || !entities->is_array()) {
        throw ValidationError("catalog has no entity list");
    }

    std::set<EntityId> seen;
    size_t index = 0;
    for (const auto& item : *entities) {
        ++index;
        catalog.total_records++;
        try {
            auto record = detail::parse_record(item);
            if (!seen.insert(record.id).second) {
                throw ValidationError("duplicate id " + record.id);
            }
            catalog.records.push_back(std::move(record));
        } catch (const ValidationError& e) {
            catalog.skipped++;
            std::string problem = "record " + std::to_string(index) + ": " + e.what();
            if (log::enabled()) std::cerr << "[Builder] skipped " << problem << "\n";
            catalog.problems.push_back(std::move(problem));
        } catch (const json::exception& e) {
            catalog.skipped++;
            std::string problem = "record " + std::to_string(index) + ": " + e.what();
            if (log::enabled()) std::cerr << "[Builder] skipped " << problem << "\n";
            catalog.problems.push_back(std::move(problem));
        }
    }

    // Explicit pattern list
    std::map<std::string, size_t> by_id;
    if (patterns && patterns->is_array()) {
        size_t anonymous = 0;
        for (const auto& p : *patterns) {
            Pattern pattern;
            if (p.is_array()) {
                pattern.id = "pattern-" + std::to_string(++anonymous);
                for (const auto& m : p) {
                    if (m.is_string()) pattern.members.push_back(m.get<std::string>());
                }
            } else if (p.is_object() && p.contains("members") && p.at("members").is_array()) {
                pattern.id = p.value("id", "pattern-" + std::to_string(++anonymous));
                pattern.name = p.value("name", "");
                for (const auto& m : p.at("members")) {
                    if (m.is_string()) pattern.members.push_back(m.get<std::string>());
                }
            } else {
                catalog.problems.push_back("malformed pattern entry skipped");
                continue;
            }
            if (pattern.name.empty()) pattern.name = pattern.id;
            if (by_id.count(pattern.id)) {
                catalog.problems.push_back("duplicate pattern id " + pattern.id);
                continue;
            }
            by_id[pattern.id] = catalog.patterns.size();
            catalog.patterns.push_back(std::move(pattern));
        }
    }

    // Memberships declared on records join (or create) patterns in record order
    for (const auto& record : catalog.records) {
        for (const auto& pid : record.patterns) {
            auto it = by_id.find(pid);
            if (it == by_id.end()) {
                Pattern pattern;
                pattern.id = pid;
                pattern.name = pid;
                it = by_id.emplace(pid, catalog.patterns.size()).first;
                catalog.patterns.push_back(std::move(pattern));
            }
            auto& members = catalog.patterns[it->second].members;
            if (std::find(members.begin(), members.end(), record.id) == members.end()) {
                members.push_back(record.id);
            }
        }
    }

    catalog.hash = crc32(root.dump());
    return catalog;
}

inline Catalog load_catalog(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ValidationError("cannot open catalog " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    json root;
    try {
        root = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ValidationError("catalog " + path + " is not valid JSON: " + e.what());
    }
    return parse_catalog(root);
}

} // namespace sutra
