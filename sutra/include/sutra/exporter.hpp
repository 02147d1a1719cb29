#pragma once
// CatalogExporter: portable snapshot file for distribution and backup
//
// File layout (JSON):
//   {
//     "manifest": {format_version, build_timestamp, counts, embedding
//                  model and dimension, content_hash, ...},
//     "entities": [{...entity..., "embedding": [...], "embedding_model": "..."}],
//     "edges":    [{source, target, type, strength, reasoning, hints}],
//     "metadata": {...store metadata...}
//   }
//
// Edges keep their stored order and entities carry their exact float
// embeddings, so an import reproduces the content hash bit for bit and
// answers every query the same way. Import goes through a full rebuild
// transaction: any mismatch leaves the previous graph live.

#include "builder.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "graph_store.hpp"
#include "log.hpp"
#include "version.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

namespace sutra {

struct SnapshotManifest {
    int format_version = SUTRA_SNAPSHOT_FORMAT_VERSION;
    std::string sutra_version = SUTRA_VERSION;
    double build_timestamp = 0.0;
    size_t entities = 0;
    size_t edges = 0;
    size_t embeddings = 0;
    std::string embedding_model;
    size_t embedding_dimension = 0;
    uint32_t content_hash = 0;
    uint64_t snapshot_version = 0;
    Timestamp exported_at = 0;

    json to_json() const {
        return json{
            {"format_version", format_version},
            {"sutra_version", sutra_version},
            {"build_timestamp", build_timestamp},
            {"entities", entities},
            {"edges", edges},
            {"embeddings", embeddings},
            {"embedding_model", embedding_model},
            {"embedding_dimension", embedding_dimension},
            {"content_hash", content_hash},
            {"snapshot_version", snapshot_version},
            {"exported_at", exported_at}
        };
    }

    static SnapshotManifest from_json(const json& j) {
        SnapshotManifest m;
        m.format_version = j.at("format_version").get<int>();
        m.sutra_version = j.value("sutra_version", "");
        m.build_timestamp = j.value("build_timestamp", 0.0);
        m.entities = j.at("entities").get<size_t>();
        m.edges = j.at("edges").get<size_t>();
        m.embeddings = j.value("embeddings", static_cast<size_t>(0));
        m.embedding_model = j.value("embedding_model", "");
        m.embedding_dimension = j.at("embedding_dimension").get<size_t>();
        m.content_hash = j.at("content_hash").get<uint32_t>();
        m.snapshot_version = j.value("snapshot_version", static_cast<uint64_t>(0));
        m.exported_at = j.value("exported_at", static_cast<Timestamp>(0));
        return m;
    }
};

class CatalogExporter {
public:
    explicit CatalogExporter(GraphStore& store) : store_(store) {}

    json to_json() const {
        auto snap = store_.snapshot();

        SnapshotManifest manifest;
        manifest.build_timestamp =
            meta_number(snap->metadata(), build_key::BUILD_TIMESTAMP).value_or(0.0);
        manifest.entities = snap->size();
        manifest.edges = snap->edges().size();
        manifest.embeddings = snap->embedding_count();
        manifest.embedding_model =
            meta_string(snap->metadata(), build_key::EMBEDDING_MODEL).value_or("");
        manifest.embedding_dimension = store_.dimension();
        manifest.content_hash = snap->content_hash();
        manifest.snapshot_version = snap->version();
        manifest.exported_at = now();

        json entities = json::array();
        for (const auto& e : snap->entities()) {
            json j = entity_to_json(e);
            if (e.has_embedding()) {
                j["embedding"] = vector_to_json(*e.embedding);
                j["embedding_model"] = e.embedding_model;
            }
            entities.push_back(std::move(j));
        }

        json edges = json::array();
        for (const auto& r : snap->edges()) edges.push_back(relationship_to_json(r));

        return json{
            {"manifest", manifest.to_json()},
            {"entities", std::move(entities)},
            {"edges", std::move(edges)},
            {"metadata", metadata_to_json(snap->metadata())}
        };
    }

    // Atomic write (temp file + rename). Throws StorageError on I/O failure.
    SnapshotManifest export_to(const std::string& path) const {
        json doc = to_json();
        std::string text = doc.dump(1);
        write_atomically(path, [&](FILE* f) {
            return std::fwrite(text.data(), 1, text.size(), f) == text.size();
        });

        auto manifest = SnapshotManifest::from_json(doc.at("manifest"));
        if (log::enabled()) {
            std::cerr << "[Export] wrote " << path << " (" << manifest.entities << " entities, "
                      << manifest.edges << " edges)\n";
        }
        return manifest;
    }

    // Replaces the whole graph. Throws StorageCorruptionError when the file
    // disagrees with its own manifest, ValidationError when it cannot fit
    // this store.
    SnapshotManifest import_json(const json& doc) {
        SnapshotManifest manifest;
        try {
            manifest = SnapshotManifest::from_json(doc.at("manifest"));
        } catch (const json::exception& e) {
            throw StorageCorruptionError(std::string("snapshot manifest unreadable: ") + e.what());
        }
        if (!version::snapshot_compatible(manifest.format_version)) {
            throw ValidationError("unsupported snapshot format " +
                                  std::to_string(manifest.format_version));
        }
        if (manifest.embedding_dimension != store_.dimension()) {
            throw ValidationError("snapshot dimension " +
                                  std::to_string(manifest.embedding_dimension) +
                                  " does not match store dimension " +
                                  std::to_string(store_.dimension()));
        }

        auto tx = store_.begin_rebuild();
        size_t embeddings = 0;
        try {
            for (const auto& j : doc.at("entities")) {
                Entity e = entity_from_json(j);
                if (j.contains("embedding")) {
                    e.embedding = vector_from_json(j.at("embedding"));
                    e.embedding_model = j.value("embedding_model", manifest.embedding_model);
                    embeddings++;
                }
                tx.put_entity(std::move(e));
            }
            for (const auto& j : doc.at("edges")) tx.put_edge(relationship_from_json(j));
            if (doc.contains("metadata")) {
                for (const auto& [key, value] : metadata_from_json(doc.at("metadata"))) {
                    tx.set_metadata(key, value);
                }
            }
        } catch (const json::exception& e) {
            throw StorageCorruptionError(std::string("snapshot body unreadable: ") + e.what());
        } catch (const DanglingReferenceError& e) {
            throw StorageCorruptionError(std::string("snapshot has dangling edge: ") + e.what());
        }

        const auto& data = tx.data();
        if (data.entities.size() != manifest.entities || data.edges.size() != manifest.edges ||
            embeddings != manifest.embeddings) {
            throw StorageCorruptionError("snapshot counts disagree with its manifest");
        }
        uint32_t hash = content_hash(data);
        if (hash != manifest.content_hash) {
            throw StorageCorruptionError("snapshot content hash mismatch (manifest " +
                                         std::to_string(manifest.content_hash) + ", computed " +
                                         std::to_string(hash) + ")");
        }

        uint64_t version = tx.commit();
        if (log::enabled()) {
            std::cerr << "[Export] imported snapshot as v" << version << " ("
                      << manifest.entities << " entities, " << manifest.edges << " edges)\n";
        }
        return manifest;
    }

    SnapshotManifest import_from(const std::string& path) {
        return import_json(read_file(path));
    }

    static SnapshotManifest read_manifest(const std::string& path) {
        json doc = read_file(path);
        try {
            return SnapshotManifest::from_json(doc.at("manifest"));
        } catch (const json::exception& e) {
            throw StorageCorruptionError(std::string("snapshot manifest unreadable: ") + e.what());
        }
    }

private:
    static json read_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw NotFound("snapshot file not found: " + path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        try {
            return json::parse(buffer.str());
        } catch (const json::parse_error& e) {
            throw StorageCorruptionError("snapshot " + path + " is not valid JSON: " + e.what());
        }
    }

    GraphStore& store_;
};

} // namespace sutra
