// sutra: command-line interface to the knowledge-graph engine
//
// Usage: sutra <command> [args] [options]
//
// Commands:
//   build      Build the graph from a catalog file
//   search     Hybrid search
//   semantic   Embedding search
//   keyword    Lexical search
//   neighbors  Entities within N hops
//   paths      Paths between two entities
//   alternatives  Entities that can stand in for another
//   explain    Why an entity answers a query
//   export     Write a portable snapshot
//   import     Replace the graph from a snapshot
//   stats      Store statistics and recent queries
//   feedback   Record observed success rate / usage count
//   help       Show this help

#include <sutra/sutra.hpp>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace sutra;

namespace {

const char* prog_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "sutra " << SUTRA_VERSION << " - knowledge-graph retrieval\n\n"
              << "Usage: " << name << " <command> [args] [options]\n\n"
              << "Commands:\n"
              << "  build <catalog.json>        Build the graph from a catalog\n"
              << "  search <query>              Hybrid search (semantic + keyword + graph)\n"
              << "  semantic <query>            Embedding similarity search\n"
              << "  keyword <query>             Lexical (BM25) search\n"
              << "  neighbors <id>              Entities within --depth hops\n"
              << "  paths <source> <target>     Paths between two entities\n"
              << "  alternatives <id>           Similar and same-category entities\n"
              << "  explain <query> <id>        Explain why an entity matches\n"
              << "  explain <id> --alternatives Explain what can replace an entity\n"
              << "  export <file>               Write a portable snapshot\n"
              << "  import <file>               Replace the graph from a snapshot\n"
              << "  stats                       Store statistics and recent queries\n"
              << "  feedback <id>               Record --success-rate / --usage\n"
              << "  help                        Show this help\n\n"
              << "Options:\n"
              << "  --path PATH          Store file (default: sutra.db)\n"
              << "  --config PATH        JSON configuration file\n"
              << "  --limit N            Result count (default: 5)\n"
              << "  --category SLUG      Restrict search to one category\n"
              << "  --weights S,K,G      Hybrid weights (default: 0.6,0.25,0.15)\n"
              << "  --depth N            Neighbor depth (default: 1)\n"
              << "  --max-hops N         Path length bound (default: 3)\n"
              << "  --max-paths N        Path count bound (default: 5)\n"
              << "  --timeout-ms N       Query embedding timeout\n"
              << "  --success-rate X     Feedback: observed success rate in [0,1]\n"
              << "  --usage N            Feedback: usage count\n"
              << "  --queries N          Stats: recent queries to show (default: 10)\n"
              << "  --alternatives       Explain: what can replace the entity\n"
              << "  --json               Output as JSON\n"
              << "  --verbose            Debug logging\n"
              << "  --quiet              No diagnostic logging\n"
              << "  -v, --version        Show version\n"
#ifdef SUTRA_WITH_ONNX
              << "  --model PATH         ONNX model path (selects the onnx embedder)\n"
              << "  --vocab PATH         Vocabulary file path\n"
#endif
              ;
}

HybridWeights parse_weights(const std::string& text) {
    HybridWeights w;
    std::vector<double> parts;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        parts.push_back(std::stod(text.substr(start, comma - start)));
        start = comma + 1;
    }
    if (parts.size() < 2 || parts.size() > 3) {
        throw ValidationError("--weights takes S,K or S,K,G");
    }
    w.semantic = parts[0];
    w.keyword = parts[1];
    if (parts.size() == 3) w.graph = parts[2];
    w.validate();
    return w;
}

void print_hits(const std::string& query, const SearchResult& result) {
    if (result.meta.degraded) {
        std::cout << "(degraded to " << result.meta.strategy << ": "
                  << result.meta.degraded_reason << ")\n";
    }
    if (result.hits.empty()) {
        std::cout << "No results found for: " << query << "\n";
        return;
    }
    std::cout << "Results for: " << query << "  [" << result.meta.strategy << "]\n";
    std::cout << "═══════════════════════════════\n";
    for (size_t i = 0; i < result.hits.size(); ++i) {
        const auto& h = result.hits[i];
        std::cout << "\n[" << (i + 1) << "] " << h.label << " (" << h.category << ")  score "
                  << std::fixed << std::setprecision(3) << h.score << "\n";
        std::cout << "    id: " << h.id << "\n";
        std::cout << "    semantic " << h.semantic_score << "  keyword " << h.keyword_score;
        if (h.graph_boost > 0.0) std::cout << "  graph +" << h.graph_boost;
        std::cout << "\n";
    }
}

int cmd_build(GraphStore& store, EmbeddingProvider& embedder, const BuilderConfig& config,
              const std::string& catalog_path, bool json_output) {
    GraphBuilder builder(store, embedder, config);
    auto report = builder.build_from_file(catalog_path);
    if (json_output) {
        std::cout << to_json(report).dump(2) << "\n";
        return 0;
    }
    std::cout << "Built snapshot v" << report.snapshot_version << "\n";
    std::cout << "  Records:     " << report.records_total << " (" << report.records_skipped
              << " skipped)\n";
    std::cout << "  Entities:    " << report.entities << "\n";
    std::cout << "  Embeddings:  " << report.embeddings << " (" << report.null_embeddings
              << " missing)\n";
    std::cout << "  Edges:       " << report.edges << " (" << report.relations.dropped_by_cap
              << " over fan-out cap)\n";
    for (const auto& [type, count] : report.relations.per_type) {
        std::cout << "    " << std::left << std::setw(22) << type << count << "\n";
    }
    std::cout << "  Model:       " << report.embedding_model << "\n";
    std::cout << "  Duration:    " << static_cast<int64_t>(report.duration_ms) << " ms\n";
    return 0;
}

int cmd_neighbors(QueryEngine& engine, const std::string& id, int depth, bool json_output) {
    auto result = engine.neighbors(id, depth);
    if (json_output) {
        std::cout << to_json(result).dump(2) << "\n";
        return 0;
    }
    std::cout << "Neighbors of " << id << " (depth " << depth << ")";
    if (result.meta.truncated) std::cout << " [truncated]";
    std::cout << "\n";
    for (const auto& h : result.hits) {
        std::cout << "  " << h.distance << "  " << h.id << "  via " << h.via << " ("
                  << relation_name(h.relation) << ", " << std::fixed << std::setprecision(2)
                  << h.strength << ")\n";
    }
    return 0;
}

int cmd_paths(QueryEngine& engine, const std::string& source, const std::string& target,
              int max_hops, int max_paths, bool json_output) {
    if (json_output) {
        std::cout << to_json(engine.paths(source, target, max_hops, max_paths)).dump(2) << "\n";
        return 0;
    }
    // Print paths as the stream yields them
    auto stream = engine.path_stream(source, target, max_hops, max_paths);
    size_t n = 0;
    while (auto path = stream.next()) {
        std::cout << "[" << ++n << "] confidence " << std::fixed << std::setprecision(3)
                  << path->confidence << "\n    ";
        for (size_t i = 0; i < path->nodes.size(); ++i) {
            if (i > 0) std::cout << " -(" << relation_name(path->edges[i - 1].type) << ")-> ";
            std::cout << path->nodes[i];
        }
        std::cout << "\n";
        std::cout << explain_path(stream.snapshot(), *path).text();
    }
    if (n == 0) std::cout << "No path within " << max_hops << " hops\n";
    stream.next();
    if (stream.truncated()) std::cout << "(more paths exist beyond the bounds)\n";
    return 0;
}

int cmd_alternatives(QueryEngine& engine, const std::string& id, size_t limit,
                     bool explain_only, bool json_output) {
    auto result = engine.alternatives(id, limit);
    if (json_output) {
        std::cout << to_json(result).dump(2) << "\n";
        return 0;
    }
    if (!explain_only) {
        for (const auto& h : result.hits) {
            std::cout << "  " << std::fixed << std::setprecision(3) << h.score << "  " << h.id
                      << "  " << h.label << " [" << h.basis << "]\n";
        }
        std::cout << "\n";
    }
    std::cout << result.explanation.text();
    return 0;
}

int cmd_stats(GraphStore& store, size_t recent, bool json_output) {
    auto stats = store.stats();
    auto queries = store.recent_queries(recent);
    if (json_output) {
        json j = to_json(stats);
        j["version"] = SUTRA_VERSION;
        j["recent_queries"] = json::array();
        for (const auto& q : queries) j["recent_queries"].push_back(to_json(q));
        std::cout << j.dump(2) << "\n";
        return 0;
    }
    std::cout << "Sutra " << SUTRA_VERSION << "\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "  Snapshot:    v" << stats.snapshot_version << " (hash " << stats.content_hash
              << ")\n";
    std::cout << "  Entities:    " << stats.entities << "\n";
    std::cout << "  Edges:       " << stats.edges << " (avg strength " << std::fixed
              << std::setprecision(3) << stats.average_strength << ")\n";
    std::cout << "  Embeddings:  " << stats.embeddings << " x " << stats.dimension << "  "
              << stats.embedding_model << "\n";
    std::cout << "\nCategories:\n";
    for (const auto& [category, count] : stats.per_category) {
        std::cout << "  " << std::left << std::setw(16) << category << count << "\n";
    }
    std::cout << "\nRelations:\n";
    for (const auto& [type, count] : stats.per_relation) {
        std::cout << "  " << std::left << std::setw(22) << type << count << "\n";
    }
    if (!queries.empty()) {
        std::cout << "\nRecent queries:\n";
        for (const auto& q : queries) {
            std::cout << "  " << std::left << std::setw(10) << q.strategy << std::right
                      << std::setw(4) << q.result_count << "  " << std::setprecision(1)
                      << q.latency_ms << " ms  " << q.query << (q.degraded ? "  (degraded)" : "")
                      << "\n";
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string store_path;
    std::string config_path;
    std::string model_path;
    std::string vocab_path;
    std::string command;
    std::vector<std::string> args;

    size_t limit = 5;
    int depth = 1;
    int max_hops = 3;
    int max_paths = 5;
    size_t recent = 10;
    int64_t timeout_ms = 0;
    std::string category;
    std::string weights_text;
    std::optional<double> success_rate;
    std::optional<int64_t> usage;
    bool json_output = false;
    bool want_alternatives = false;
    std::optional<log::Level> level;

    try {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
                store_path = argv[++i];
            } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
                config_path = argv[++i];
            } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
                model_path = argv[++i];
            } else if (std::strcmp(argv[i], "--vocab") == 0 && i + 1 < argc) {
                vocab_path = argv[++i];
            } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
                limit = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (std::strcmp(argv[i], "--category") == 0 && i + 1 < argc) {
                category = argv[++i];
            } else if (std::strcmp(argv[i], "--weights") == 0 && i + 1 < argc) {
                weights_text = argv[++i];
            } else if (std::strcmp(argv[i], "--depth") == 0 && i + 1 < argc) {
                depth = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--max-hops") == 0 && i + 1 < argc) {
                max_hops = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--max-paths") == 0 && i + 1 < argc) {
                max_paths = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
                timeout_ms = std::stoll(argv[++i]);
            } else if (std::strcmp(argv[i], "--success-rate") == 0 && i + 1 < argc) {
                success_rate = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--usage") == 0 && i + 1 < argc) {
                usage = std::stoll(argv[++i]);
            } else if (std::strcmp(argv[i], "--queries") == 0 && i + 1 < argc) {
                recent = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (std::strcmp(argv[i], "--json") == 0) {
                json_output = true;
            } else if (std::strcmp(argv[i], "--alternatives") == 0) {
                want_alternatives = true;
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                level = log::Level::Debug;
            } else if (std::strcmp(argv[i], "--quiet") == 0) {
                level = log::Level::Quiet;
            } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
                std::cout << "sutra " << SUTRA_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-') {
                if (command.empty()) {
                    command = argv[i];
                } else {
                    args.push_back(argv[i]);
                }
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad option value (" << e.what() << ")\n";
        return 1;
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    auto need_args = [&](size_t n, const char* usage_line) {
        if (args.size() >= n) return true;
        std::cerr << "Usage: " << prog_name(argv[0]) << " " << usage_line << "\n";
        return false;
    };

    try {
        SutraConfig config;
        if (!config_path.empty()) config = load_config(config_path);

        // Flags override the file
        log::set_level(level.value_or(config.log_level));
        if (!store_path.empty()) config.store.path = store_path;
        if (config.store.path.empty()) config.store.path = "sutra.db";
        if (!model_path.empty()) {
            config.embedder.kind = "onnx";
            config.embedder.model_path = model_path;
        }
        if (!vocab_path.empty()) config.embedder.vocab_path = vocab_path;
        if (timeout_ms > 0) {
            config.embedder.timeout = std::chrono::milliseconds(timeout_ms);
            config.query.embed_timeout = config.embedder.timeout;
        }

        GraphStore store(config.store);
        if (store.corrupted() && command != "build" && command != "import") {
            std::cerr << "Error [storage_corruption]: " << store.corruption_reason() << "\n"
                      << "Rebuild (sutra build) or import a snapshot to recover.\n";
            return 1;
        }

        if (command == "build") {
            if (!need_args(1, "build <catalog.json>")) return 1;
            auto embedder = make_embedder(config.embedder, config.store.dimension);
            return cmd_build(store, *embedder, config.builder, args[0], json_output);
        }
        if (command == "export") {
            if (!need_args(1, "export <file>")) return 1;
            auto manifest = CatalogExporter(store).export_to(args[0]);
            if (json_output) std::cout << manifest.to_json().dump(2) << "\n";
            else std::cout << "Exported " << manifest.entities << " entities, "
                           << manifest.edges << " edges to " << args[0] << "\n";
            return 0;
        }
        if (command == "import") {
            if (!need_args(1, "import <file>")) return 1;
            auto manifest = CatalogExporter(store).import_from(args[0]);
            if (json_output) std::cout << manifest.to_json().dump(2) << "\n";
            else std::cout << "Imported " << manifest.entities << " entities, "
                           << manifest.edges << " edges from " << args[0] << "\n";
            return 0;
        }
        if (command == "stats") {
            return cmd_stats(store, recent, json_output);
        }
        if (command == "feedback") {
            if (!need_args(1, "feedback <id> [--success-rate X] [--usage N]")) return 1;
            store.update_usage(args[0], success_rate, usage);
            std::cout << "Updated " << args[0] << "\n";
            return 0;
        }

        std::shared_ptr<EmbeddingProvider> embedder;
        try {
            embedder = make_embedder(config.embedder, config.store.dimension);
        } catch (const EmbeddingUnavailable& e) {
            // Queries still run keyword-only
            std::cerr << "[sutra] embedder unavailable: " << e.what() << "\n";
        }
        QueryEngine engine(store, embedder, config.query);

        SearchFilter filter;
        if (!category.empty()) filter.category = category;

        if (command == "search" || command == "semantic" || command == "keyword") {
            if (!need_args(1, (command + " <query>").c_str())) return 1;
            const std::string& query = args[0];
            SearchResult result;
            if (command == "search") {
                std::optional<HybridWeights> weights;
                if (!weights_text.empty()) weights = parse_weights(weights_text);
                result = engine.hybrid(query, limit, weights, filter);
            } else if (command == "semantic") {
                result = engine.semantic(query, limit, filter);
            } else {
                result = engine.keyword(query, limit, filter);
            }
            if (json_output) std::cout << to_json(result).dump(2) << "\n";
            else print_hits(query, result);
            return 0;
        }
        if (command == "neighbors") {
            if (!need_args(1, "neighbors <id> [--depth N]")) return 1;
            return cmd_neighbors(engine, args[0], depth, json_output);
        }
        if (command == "paths") {
            if (!need_args(2, "paths <source> <target> [--max-hops N] [--max-paths N]")) return 1;
            return cmd_paths(engine, args[0], args[1], max_hops, max_paths, json_output);
        }
        if (command == "alternatives") {
            if (!need_args(1, "alternatives <id> [--limit N]")) return 1;
            return cmd_alternatives(engine, args[0], limit, false, json_output);
        }
        if (command == "explain" && want_alternatives) {
            if (!need_args(1, "explain <id> --alternatives")) return 1;
            return cmd_alternatives(engine, args[0], limit, true, json_output);
        }
        if (command == "explain") {
            if (!need_args(2, "explain <query> <id>")) return 1;
            auto x = engine.explain(args[0], args[1]);
            if (json_output) std::cout << to_json(x).dump(2) << "\n";
            else std::cout << x.text();
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const Error& e) {
        std::cerr << "Error [" << e.code() << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
