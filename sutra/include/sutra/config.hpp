#pragma once
// Configuration: one JSON file, every field optional
//
//   {
//     "log_level": "info",
//     "store":    {"path": "sutra.db", "dimension": 384, "query_log_flush": 64},
//     "embedder": {"kind": "hash" | "onnx", "model_path": "...", "vocab_path": "...",
//                  "timeout_ms": 2000, "cache_size": 10000,
//                  "retry": {"max_attempts": 3, "initial_backoff_ms": 50, "multiplier": 2.0}},
//     "builder":  {"batch_size": 32, "similarity_floor": 0.6, "similar_threshold": 0.85,
//                  "fan_out_cap": 30, "similarity_weight": 0.5, "cooccurrence_weight": 0.5,
//                  "min_use_cases": 2, "max_use_cases": 6},
//     "query":    {"semantic_weight": 0.6, "keyword_weight": 0.25, "graph_weight": 0.15,
//                  "graph_seeds": 5, "candidate_multiplier": 3, "max_neighbor_results": 1000}
//   }
//
// Unknown keys are reported and ignored; out-of-range values are errors.

#include "builder.hpp"
#include "embedding.hpp"
#include "errors.hpp"
#include "graph_store.hpp"
#include "log.hpp"
#include "query_engine.hpp"
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

#ifdef SUTRA_WITH_ONNX
#include "embedding_onnx.hpp"
#endif

namespace sutra {

struct EmbedderConfig {
    std::string kind = "hash";
    std::string model_path;
    std::string vocab_path;
    std::string model_name = "all-MiniLM-L6-v2";
    std::chrono::milliseconds timeout{2000};
    size_t cache_size = 10000;
    RetryPolicy retry;
};

struct SutraConfig {
    log::Level log_level = log::Level::Info;
    StoreConfig store;
    EmbedderConfig embedder;
    BuilderConfig builder;
    QueryConfig query;
};

namespace detail {

inline void warn_unknown(const json& section, const std::string& where,
                         std::initializer_list<const char*> known) {
    std::set<std::string> names(known.begin(), known.end());
    for (const auto& [key, _] : section.items()) {
        if (!names.count(key)) {
            std::cerr << "[Config] ignoring unknown key " << where << key << "\n";
        }
    }
}

inline double read_number(const json& section, const char* key, double fallback,
                          double min, double max) {
    if (!section.contains(key)) return fallback;
    const auto& v = section.at(key);
    if (!v.is_number()) throw ValidationError(std::string("config ") + key + " must be a number");
    double x = v.get<double>();
    if (!std::isfinite(x) || x < min || x > max) {
        throw ValidationError(std::string("config ") + key + " out of range");
    }
    return x;
}

inline size_t read_count(const json& section, const char* key, size_t fallback,
                         size_t min, size_t max) {
    double x = read_number(section, key, static_cast<double>(fallback),
                           static_cast<double>(min), static_cast<double>(max));
    if (x != std::floor(x)) throw ValidationError(std::string("config ") + key + " must be whole");
    return static_cast<size_t>(x);
}

inline std::string read_string(const json& section, const char* key, const std::string& fallback) {
    if (!section.contains(key)) return fallback;
    if (!section.at(key).is_string()) {
        throw ValidationError(std::string("config ") + key + " must be a string");
    }
    return section.at(key).get<std::string>();
}

inline const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    if (!root.contains(name)) return empty;
    if (!root.at(name).is_object()) {
        throw ValidationError(std::string("config section ") + name + " must be an object");
    }
    return root.at(name);
}

} // namespace detail

inline log::Level parse_log_level(const std::string& name) {
    if (name == "quiet") return log::Level::Quiet;
    if (name == "info") return log::Level::Info;
    if (name == "debug") return log::Level::Debug;
    throw ValidationError("unknown log level: " + name);
}

inline SutraConfig config_from_json(const json& root) {
    if (!root.is_object()) throw ValidationError("config must be a JSON object");
    using namespace detail;
    SutraConfig c;
    warn_unknown(root, "", {"log_level", "store", "embedder", "builder", "query"});
    c.log_level = parse_log_level(read_string(root, "log_level", "info"));

    const auto& store = section(root, "store");
    warn_unknown(store, "store.", {"path", "dimension", "query_log_flush", "query_log_buffer_max"});
    c.store.path = read_string(store, "path", c.store.path);
    c.store.dimension = read_count(store, "dimension", c.store.dimension, 1, 65536);
    c.store.query_log_flush = read_count(store, "query_log_flush", c.store.query_log_flush, 1, 1 << 20);
    c.store.query_log_buffer_max =
        read_count(store, "query_log_buffer_max", c.store.query_log_buffer_max, 1, 1 << 24);

    const auto& emb = section(root, "embedder");
    warn_unknown(emb, "embedder.", {"kind", "model_path", "vocab_path", "model_name",
                                    "timeout_ms", "cache_size", "retry"});
    c.embedder.kind = read_string(emb, "kind", c.embedder.kind);
    if (c.embedder.kind != "hash" && c.embedder.kind != "onnx") {
        throw ValidationError("embedder kind must be 'hash' or 'onnx'");
    }
    c.embedder.model_path = read_string(emb, "model_path", "");
    c.embedder.vocab_path = read_string(emb, "vocab_path", "");
    c.embedder.model_name = read_string(emb, "model_name", c.embedder.model_name);
    c.embedder.timeout = std::chrono::milliseconds(
        read_count(emb, "timeout_ms", static_cast<size_t>(c.embedder.timeout.count()), 1, 600000));
    c.embedder.cache_size = read_count(emb, "cache_size", c.embedder.cache_size, 0, 1 << 24);
    const auto& retry = section(emb, "retry");
    warn_unknown(retry, "embedder.retry.", {"max_attempts", "initial_backoff_ms", "multiplier"});
    c.embedder.retry.max_attempts =
        static_cast<int>(read_count(retry, "max_attempts", 3, 1, 100));
    c.embedder.retry.initial_backoff = std::chrono::milliseconds(
        read_count(retry, "initial_backoff_ms", 50, 0, 60000));
    c.embedder.retry.multiplier = read_number(retry, "multiplier", 2.0, 1.0, 10.0);
    c.builder.retry = c.embedder.retry;

    const auto& b = section(root, "builder");
    warn_unknown(b, "builder.", {"batch_size", "similarity_floor", "similar_threshold",
                                 "fan_out_cap", "similarity_weight", "cooccurrence_weight",
                                 "min_use_cases", "max_use_cases"});
    auto& inf = c.builder.inference;
    c.builder.batch_size = read_count(b, "batch_size", c.builder.batch_size, 1, 4096);
    inf.similarity_floor = read_number(b, "similarity_floor", inf.similarity_floor, -1.0, 1.0);
    inf.similar_threshold = read_number(b, "similar_threshold", inf.similar_threshold, -1.0, 1.0);
    if (inf.similar_threshold < inf.similarity_floor) {
        throw ValidationError("similar_threshold must not be below similarity_floor");
    }
    inf.fan_out_cap = read_count(b, "fan_out_cap", inf.fan_out_cap, 1, 100000);
    inf.similarity_weight = read_number(b, "similarity_weight", inf.similarity_weight, 0.0, 1.0);
    inf.cooccurrence_weight =
        read_number(b, "cooccurrence_weight", inf.cooccurrence_weight, 0.0, 1.0);
    auto& rules = c.builder.rules;
    rules.min_use_cases = read_count(b, "min_use_cases", rules.min_use_cases, 0, 64);
    rules.max_use_cases = read_count(b, "max_use_cases", rules.max_use_cases, 1, 64);
    if (rules.min_use_cases > rules.max_use_cases) {
        throw ValidationError("min_use_cases exceeds max_use_cases");
    }

    const auto& q = section(root, "query");
    warn_unknown(q, "query.", {"semantic_weight", "keyword_weight", "graph_weight",
                               "graph_seeds", "candidate_multiplier", "max_neighbor_results",
                               "embed_attempts", "embed_workers"});
    c.query.weights.semantic = read_number(q, "semantic_weight", c.query.weights.semantic, 0.0, 1.0);
    c.query.weights.keyword = read_number(q, "keyword_weight", c.query.weights.keyword, 0.0, 1.0);
    c.query.weights.graph = read_number(q, "graph_weight", c.query.weights.graph, 0.0, 1.0);
    c.query.weights.validate();
    c.query.graph_seeds = read_count(q, "graph_seeds", c.query.graph_seeds, 0, 1000);
    c.query.candidate_multiplier =
        read_count(q, "candidate_multiplier", c.query.candidate_multiplier, 1, 100);
    c.query.max_neighbor_results =
        read_count(q, "max_neighbor_results", c.query.max_neighbor_results, 1, 1 << 24);
    c.query.embed_attempts = read_count(q, "embed_attempts", c.query.embed_attempts, 1, 10);
    c.query.embed_workers = read_count(q, "embed_workers", c.query.embed_workers, 1, 64);
    c.query.embed_timeout = c.embedder.timeout;
    return c;
}

inline SutraConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ValidationError("cannot open config " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return config_from_json(json::parse(buffer.str()));
    } catch (const json::parse_error& e) {
        throw ValidationError("config " + path + " is not valid JSON: " + e.what());
    }
}

// Provider for the configured kind, producing `dimension`-length vectors
inline std::shared_ptr<EmbeddingProvider> make_embedder(const EmbedderConfig& config,
                                                        size_t dimension) {
    std::shared_ptr<EmbeddingProvider> provider;
    if (config.kind == "hash") {
        provider = std::make_shared<HashingEmbedder>(dimension);
    } else if (config.kind == "onnx") {
#ifdef SUTRA_WITH_ONNX
        OnnxEmbedder::Config oc;
        oc.model_name = config.model_name;
        auto onnx = std::make_shared<OnnxEmbedder>(oc);
        onnx->load(config.model_path, config.vocab_path);
        if (onnx->dimension() != dimension) {
            throw ValidationError("model dimension " + std::to_string(onnx->dimension()) +
                                  " does not match store dimension " + std::to_string(dimension));
        }
        provider = onnx;
#else
        throw ValidationError("this build has no ONNX support (rebuild with SUTRA_WITH_ONNX)");
#endif
    } else {
        throw ValidationError("unknown embedder kind: " + config.kind);
    }

    if (config.cache_size > 0) {
        provider = std::make_shared<CachingEmbedder>(provider, config.cache_size);
    }
    return provider;
}

} // namespace sutra
