#pragma once
// GraphStore: durable single-writer, many-reader graph storage
//
// State lives in one SQLite file (entities, edges, embeddings, metadata,
// query log) and in memory as an immutable GraphSnapshot. Readers copy the
// snapshot pointer under a shared lock and never block each other. Writers
// serialize through one mutex held by a Transaction:
//
//   begin()          stage changes on a copy of the live graph
//   begin_rebuild()  stage a full replacement starting from empty
//   commit()         persist in one SQLite transaction, then swap pointer
//
// A Transaction destroyed without commit() discards its staging area, so
// any failure leaves the previous snapshot live.
//
// At open the store verifies schema version, SQLite integrity and a CRC32
// content hash. On mismatch it refuses reads (StorageCorruptionError) until
// a full rebuild or import commits.

#include "codec.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "snapshot.hpp"
#include "sqlite.hpp"
#include "version.hpp"
#include <atomic>
#include <cmath>
#include <iostream>
#include <mutex>
#include <set>
#include <shared_mutex>

namespace sutra {

struct StoreConfig {
    std::string path;                        // empty = in-memory
    size_t dimension = DEFAULT_EMBED_DIM;
    size_t query_log_flush = 64;             // buffered traces per flush attempt
    size_t query_log_buffer_max = 4096;      // oldest traces dropped beyond this
};

struct StoreStats {
    size_t entities = 0;
    size_t edges = 0;
    size_t embeddings = 0;
    double average_strength = 0.0;
    std::map<std::string, uint64_t> per_category;
    std::map<std::string, size_t> per_relation;
    uint64_t snapshot_version = 0;
    uint32_t content_hash = 0;
    size_t dimension = 0;
    std::string embedding_model;
};

// Observability record of one query; never read on the query path
struct QueryTrace {
    std::string query;
    std::string strategy;
    size_t result_count = 0;
    double latency_ms = 0.0;
    bool degraded = false;
    Timestamp timestamp = 0;
};

struct ScoredEntity {
    EntityId id;
    float score;
};

// Store-wide metadata keys written by the store itself
namespace store_key {
constexpr const char* SNAPSHOT_VERSION = "snapshot_version";
constexpr const char* CONTENT_HASH = "content_hash";
constexpr const char* EMBEDDING_DIM = "embedding_dim";
constexpr const char* SCHEMA_VERSION = "schema_version";
} // namespace store_key

class GraphStore {
public:
    // ═══════════════════════════════════════════════════════════════════════
    // Transaction: exclusive staging area
    // ═══════════════════════════════════════════════════════════════════════

    class Transaction {
    public:
        Transaction(Transaction&& other) noexcept
            : store_(other.store_),
              lock_(std::move(other.lock_)),
              data_(std::move(other.data_)),
              rebuild_(other.rebuild_),
              committed_(other.committed_),
              dirty_entities_(std::move(other.dirty_entities_)),
              dirty_edges_(std::move(other.dirty_edges_)),
              dirty_metadata_(std::move(other.dirty_metadata_))
        {
            other.store_ = nullptr;
        }

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        Transaction& operator=(Transaction&&) = delete;

        ~Transaction() {
            if (!store_ || committed_) return;
            if (rebuild_) store_->rebuilding_.store(false);
            if (log::debug()) {
                std::cerr << "[GraphStore] discarded uncommitted "
                          << (rebuild_ ? "rebuild" : "transaction") << "\n";
            }
        }

        // Overwrite by id. Existing edges of the entity are kept.
        void put_entity(Entity e) {
            store_->validate_entity(e);
            if (e.label.empty()) e.label = e.id;
            if (!e.has_embedding()) {
                e.embedding.reset();
                e.embedding_model.clear();
            }
            EntityId id = e.id;
            data_.entities[id] = std::move(e);
            dirty_entities_.insert(id);
        }

        // Replace (or drop) the embedding of one entity without touching
        // the rest of it
        void set_embedding(const EntityId& id, std::optional<Vector> vector,
                           const std::string& model) {
            auto it = data_.entities.find(id);
            if (it == data_.entities.end()) throw NotFound("entity not found: " + id);
            if (vector) store_->validate_vector(id, *vector);
            it->second.embedding = std::move(vector);
            it->second.embedding_model = it->second.embedding ? model : "";
            dirty_entities_.insert(id);
        }

        // Same (source, target, type) replaces in place, keeping its position
        void put_edge(Relationship r) {
            if (!std::isfinite(r.strength) || r.strength < 0.0f || r.strength > 1.0f) {
                throw ValidationError("edge strength out of range [0,1]: " +
                                      std::to_string(r.strength));
            }
            if (r.source == r.target) {
                throw ValidationError("self-referencing edge on " + r.source);
            }
            if (!data_.has_entity(r.source)) {
                throw DanglingReferenceError("edge source does not exist: " + r.source);
            }
            if (!data_.has_entity(r.target)) {
                throw DanglingReferenceError("edge target does not exist: " + r.target);
            }
            dirty_edges_.insert(data_.upsert_edge(std::move(r)));
        }

        void set_metadata(const std::string& key, MetadataValue value) {
            if (key.empty()) throw ValidationError("metadata key must not be empty");
            data_.metadata[key] = std::move(value);
            dirty_metadata_.insert(key);
        }

        const Entity* find(const EntityId& id) const {
            auto it = data_.entities.find(id);
            return it == data_.entities.end() ? nullptr : &it->second;
        }

        const GraphData& data() const { return data_; }
        bool is_rebuild() const { return rebuild_; }

        // Persist and publish. Returns the new snapshot version.
        uint64_t commit() {
            if (!store_ || committed_) {
                throw ValidationError("transaction already committed");
            }
            uint64_t version = store_->version_counter_ + 1;
            set_metadata(store_key::SNAPSHOT_VERSION, static_cast<double>(version));
            set_metadata(store_key::EMBEDDING_DIM, static_cast<double>(store_->config_.dimension));
            set_metadata(store_key::SCHEMA_VERSION, static_cast<double>(SUTRA_SCHEMA_VERSION));
            set_metadata(store_key::CONTENT_HASH, static_cast<double>(content_hash(data_)));

            auto snap = std::make_shared<const GraphSnapshot>(std::move(data_), version);
            store_->persist(*snap, rebuild_, dirty_entities_, dirty_edges_, dirty_metadata_);
            store_->install(std::move(snap), rebuild_);
            store_->version_counter_ = version;

            committed_ = true;
            if (rebuild_) store_->rebuilding_.store(false);
            return version;
        }

    private:
        friend class GraphStore;

        Transaction(GraphStore* store, std::unique_lock<std::mutex> lock,
                    GraphData data, bool rebuild)
            : store_(store), lock_(std::move(lock)), data_(std::move(data)), rebuild_(rebuild) {}

        GraphStore* store_;
        std::unique_lock<std::mutex> lock_;
        GraphData data_;
        bool rebuild_ = false;
        bool committed_ = false;
        std::set<EntityId> dirty_entities_;
        std::set<size_t> dirty_edges_;
        std::set<std::string> dirty_metadata_;
    };

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    explicit GraphStore(StoreConfig config = {}) : config_(std::move(config)) {
        if (config_.dimension == 0) {
            throw ValidationError("store dimension must be positive");
        }
        open();
    }

    ~GraphStore() {
        try {
            flush_query_log(true);
        } catch (const StorageError& e) {
            std::cerr << "[GraphStore] query log lost at close: " << e.what() << "\n";
        }
    }

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Snapshots and transactions
    // ═══════════════════════════════════════════════════════════════════════

    // Current committed snapshot; throws while the store is corrupted
    SnapshotPtr snapshot() const {
        std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
        if (corrupted_) {
            throw StorageCorruptionError("store refuses to serve: " + corruption_reason_);
        }
        return current_;
    }

    Transaction begin() {
        std::unique_lock<std::mutex> lock(write_mutex_);
        SnapshotPtr base;
        {
            std::shared_lock<std::shared_mutex> slock(snapshot_mutex_);
            if (corrupted_) {
                throw StorageCorruptionError("store is corrupted; only a full rebuild or import can commit");
            }
            base = current_;
        }
        return Transaction(this, std::move(lock), base->to_data(), false);
    }

    // Full replacement; rejects a second concurrent rebuild
    Transaction begin_rebuild() {
        bool expected = false;
        if (!rebuilding_.compare_exchange_strong(expected, true)) {
            throw BuildInProgressError("a rebuild is already in progress");
        }
        std::unique_lock<std::mutex> lock(write_mutex_);
        return Transaction(this, std::move(lock), GraphData{}, true);
    }

    bool rebuild_in_progress() const { return rebuilding_.load(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Single-call operations (each one an atomic transaction)
    // ═══════════════════════════════════════════════════════════════════════

    void put_entity(Entity e) {
        auto tx = begin();
        tx.put_entity(std::move(e));
        tx.commit();
    }

    void put_edge(Relationship r) {
        auto tx = begin();
        tx.put_edge(std::move(r));
        tx.commit();
    }

    Entity get_entity(const EntityId& id) const {
        auto snap = snapshot();
        const Entity* e = snap->find(id);
        if (!e) throw NotFound("entity not found: " + id);
        return *e;
    }

    bool contains(const EntityId& id) const {
        return snapshot()->find(id) != nullptr;
    }

    // Edges leaving `id`, insertion order. A symmetric edge keeps its stored
    // (canonical) orientation but is reported from both of its endpoints.
    std::vector<Relationship> edges_from(const EntityId& id) const {
        auto snap = snapshot();
        auto slot = snap->slot_of(id);
        if (!slot) throw NotFound("entity not found: " + id);
        return incident(*snap, snap->out_edges(*slot), snap->in_edges(*slot));
    }

    // Edges entering `id`, insertion order; symmetric edges as in edges_from()
    std::vector<Relationship> edges_to(const EntityId& id) const {
        auto snap = snapshot();
        auto slot = snap->slot_of(id);
        if (!slot) throw NotFound("entity not found: " + id);
        return incident(*snap, snap->in_edges(*slot), snap->out_edges(*slot));
    }

    // Top-k by descending cosine, ties by ascending id. Entities without an
    // embedding never appear.
    std::vector<ScoredEntity> nearest_neighbors(const Vector& query, size_t k) const {
        if (query.size() != config_.dimension) {
            throw ValidationError("query vector has dimension " + std::to_string(query.size()) +
                                  ", store expects " + std::to_string(config_.dimension));
        }
        if (k == 0) throw ValidationError("k must be at least 1");
        auto snap = snapshot();
        std::vector<ScoredEntity> result;
        for (const auto& hit : snap->vectors().search(query, k)) {
            result.push_back({snap->at(hit.slot).id, hit.score});
        }
        return result;
    }

    void set_metadata(const std::string& key, MetadataValue value) {
        auto tx = begin();
        tx.set_metadata(key, std::move(value));
        tx.commit();
    }

    std::optional<MetadataValue> get_metadata(const std::string& key) const {
        auto snap = snapshot();
        auto it = snap->metadata().find(key);
        if (it == snap->metadata().end()) return std::nullopt;
        return it->second;
    }

    Metadata metadata() const {
        return snapshot()->metadata();
    }

    StoreStats stats() const {
        auto snap = snapshot();
        StoreStats s;
        s.entities = snap->size();
        s.edges = snap->edges().size();
        s.embeddings = snap->embedding_count();
        double total = 0.0;
        for (const auto& r : snap->edges()) {
            total += r.strength;
            s.per_relation[relation_name(r.type)]++;
        }
        s.average_strength = s.edges ? total / s.edges : 0.0;
        s.per_category = snap->categories().counts();
        s.snapshot_version = snap->version();
        s.content_hash = snap->content_hash();
        s.dimension = config_.dimension;
        s.embedding_model = meta_string(snap->metadata(), "embedding_model").value_or("");
        return s;
    }

    // Narrow feedback API: adjust observed success rate / usage count of one
    // entity. At least one value must be given.
    void update_usage(const EntityId& id, std::optional<double> success_rate,
                      std::optional<int64_t> usage_count) {
        if (!success_rate && !usage_count) {
            throw ValidationError("update_usage needs success_rate or usage_count");
        }
        if (success_rate && (!std::isfinite(*success_rate) ||
                             *success_rate < 0.0 || *success_rate > 1.0)) {
            throw ValidationError("success_rate must be in [0,1]");
        }
        if (usage_count && *usage_count < 0) {
            throw ValidationError("usage_count must not be negative");
        }

        auto tx = begin();
        const Entity* current = tx.find(id);
        if (!current) throw NotFound("entity not found: " + id);
        Entity updated = *current;
        if (success_rate) updated.metadata[meta::SUCCESS_RATE] = *success_rate;
        if (usage_count) updated.metadata[meta::USAGE_COUNT] = static_cast<double>(*usage_count);
        tx.put_entity(std::move(updated));
        tx.commit();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Query log
    // ═══════════════════════════════════════════════════════════════════════

    // Buffered; flushed opportunistically so callers never wait on the writer
    void record_query(QueryTrace trace) {
        bool flush = false;
        {
            std::lock_guard<std::mutex> lock(log_mutex_);
            pending_.push_back(std::move(trace));
            if (pending_.size() > config_.query_log_buffer_max) {
                pending_.erase(pending_.begin());
            }
            flush = pending_.size() >= config_.query_log_flush;
        }
        if (!flush) return;
        try {
            flush_query_log(false);
        } catch (const StorageError& e) {
            std::cerr << "[GraphStore] query log flush failed: " << e.what() << "\n";
        }
    }

    // wait=false gives up immediately when the database is busy
    void flush_query_log(bool wait = true) {
        std::unique_lock<std::mutex> db_lock(db_mutex_, std::defer_lock);
        if (wait) {
            db_lock.lock();
        } else if (!db_lock.try_lock()) {
            return;
        }

        std::vector<QueryTrace> batch;
        {
            std::lock_guard<std::mutex> lock(log_mutex_);
            batch.swap(pending_);
        }
        if (batch.empty()) return;

        sqlite::Transaction tx(db_);
        auto stmt = db_.prepare(
            "INSERT INTO query_log (query, strategy, result_count, latency_ms, degraded, timestamp) "
            "VALUES (?, ?, ?, ?, ?, ?)");
        for (const auto& t : batch) {
            stmt.bind(1, t.query)
                .bind(2, t.strategy)
                .bind(3, static_cast<int64_t>(t.result_count))
                .bind(4, t.latency_ms)
                .bind(5, static_cast<int64_t>(t.degraded ? 1 : 0))
                .bind(6, static_cast<int64_t>(t.timestamp));
            stmt.run();
            stmt.reset();
        }
        tx.commit();
    }

    // Most recent first
    std::vector<QueryTrace> recent_queries(size_t limit) {
        flush_query_log(true);
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        auto stmt = db_.prepare(
            "SELECT query, strategy, result_count, latency_ms, degraded, timestamp "
            "FROM query_log ORDER BY id DESC LIMIT ?");
        stmt.bind(1, static_cast<int64_t>(limit));
        std::vector<QueryTrace> result;
        while (stmt.step()) {
            QueryTrace t;
            t.query = stmt.text(0);
            t.strategy = stmt.text(1);
            t.result_count = static_cast<size_t>(stmt.integer(2));
            t.latency_ms = stmt.real(3);
            t.degraded = stmt.integer(4) != 0;
            t.timestamp = stmt.integer(5);
            result.push_back(std::move(t));
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Introspection
    // ═══════════════════════════════════════════════════════════════════════

    bool corrupted() const {
        std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
        return corrupted_;
    }

    std::string corruption_reason() const {
        std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
        return corruption_reason_;
    }

    size_t dimension() const { return config_.dimension; }
    const StoreConfig& config() const { return config_; }

private:
    // `primary` plus the symmetric edges of `other`, merged by edge index
    static std::vector<Relationship> incident(const GraphSnapshot& snap,
                                              const std::vector<size_t>& primary,
                                              const std::vector<size_t>& other) {
        std::vector<size_t> picked = primary;
        for (size_t e : other) {
            const auto& r = snap.edges()[e];
            if (is_symmetric(r.type) && r.source != r.target) picked.push_back(e);
        }
        std::sort(picked.begin(), picked.end());
        std::vector<Relationship> result;
        result.reserve(picked.size());
        for (size_t e : picked) result.push_back(snap.edges()[e]);
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Validation
    // ═══════════════════════════════════════════════════════════════════════

    void validate_vector(const EntityId& id, const Vector& v) const {
        if (v.size() != config_.dimension) {
            throw ValidationError("embedding of " + id + " has dimension " +
                                  std::to_string(v.size()) + ", store expects " +
                                  std::to_string(config_.dimension));
        }
        for (float x : v.data) {
            if (!std::isfinite(x)) throw ValidationError("embedding of " + id + " is not finite");
        }
    }

    void validate_entity(const Entity& e) const {
        if (e.id.empty()) throw ValidationError("entity id must not be empty");
        if (e.category.empty()) throw ValidationError("entity " + e.id + " has no category");
        if (e.has_embedding()) validate_vector(e.id, *e.embedding);
        if (auto rate = meta_number(e.metadata, meta::SUCCESS_RATE)) {
            if (*rate < 0.0 || *rate > 1.0) {
                throw ValidationError("success_rate of " + e.id + " outside [0,1]");
            }
        }
        if (auto count = meta_number(e.metadata, meta::USAGE_COUNT)) {
            if (*count < 0.0) throw ValidationError("usage_count of " + e.id + " is negative");
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════

    void create_schema() {
        db_.exec(
            "CREATE TABLE IF NOT EXISTS schema_info (version INTEGER NOT NULL);"
            "CREATE TABLE IF NOT EXISTS entities ("
            "  id TEXT PRIMARY KEY,"
            "  label TEXT NOT NULL,"
            "  description TEXT NOT NULL,"
            "  category TEXT NOT NULL,"
            "  keywords TEXT NOT NULL,"
            "  metadata TEXT NOT NULL);"
            "CREATE TABLE IF NOT EXISTS edges ("
            "  position INTEGER PRIMARY KEY,"
            "  source TEXT NOT NULL,"
            "  target TEXT NOT NULL,"
            "  type TEXT NOT NULL,"
            "  strength REAL NOT NULL,"
            "  reasoning TEXT NOT NULL,"
            "  hints TEXT NOT NULL,"
            "  UNIQUE (source, target, type));"
            "CREATE TABLE IF NOT EXISTS embeddings ("
            "  entity_id TEXT PRIMARY KEY,"
            "  vector BLOB NOT NULL,"
            "  dimension INTEGER NOT NULL,"
            "  model TEXT NOT NULL);"
            "CREATE TABLE IF NOT EXISTS graph_metadata ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL);"
            "CREATE TABLE IF NOT EXISTS query_log ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  query TEXT NOT NULL,"
            "  strategy TEXT NOT NULL,"
            "  result_count INTEGER NOT NULL,"
            "  latency_ms REAL NOT NULL,"
            "  degraded INTEGER NOT NULL,"
            "  timestamp INTEGER NOT NULL);"
            "CREATE INDEX IF NOT EXISTS idx_edges_source ON edges(source);"
            "CREATE INDEX IF NOT EXISTS idx_edges_target ON edges(target);");
    }

    void open() {
        std::string path = config_.path.empty() ? ":memory:" : config_.path;
        db_.open(path);

        GraphData data;
        std::string problem;
        try {
            create_schema();
            problem = check_integrity();
            if (problem.empty()) {
                data = load();
                problem = verify_hash(data);
            }
        } catch (const StorageError& e) {
            problem = e.what();
        } catch (const json::exception& e) {
            problem = std::string("unreadable column: ") + e.what();
        }

        if (!problem.empty()) {
            std::cerr << "[GraphStore] integrity check failed for " << path << ": "
                      << problem << "\n";
            corrupted_ = true;
            corruption_reason_ = problem;
            current_ = std::make_shared<const GraphSnapshot>(GraphData{}, 0);
            return;
        }

        version_counter_ = static_cast<uint64_t>(
            meta_number(data.metadata, store_key::SNAPSHOT_VERSION).value_or(0.0));
        size_t n = data.entities.size();
        size_t m = data.edges.size();
        current_ = std::make_shared<const GraphSnapshot>(std::move(data), version_counter_);
        if (log::enabled() && n > 0) {
            std::cerr << "[GraphStore] opened " << path << " v" << version_counter_
                      << " (" << n << " entities, " << m << " edges)\n";
        }
    }

    // Empty string when healthy
    std::string check_integrity() {
        {
            auto stmt = db_.prepare("SELECT version FROM schema_info LIMIT 1");
            if (stmt.step()) {
                int stored = static_cast<int>(stmt.integer(0));
                if (!version::schema_compatible(stored)) {
                    return "unsupported schema version " + std::to_string(stored);
                }
            } else {
                auto insert = db_.prepare("INSERT INTO schema_info (version) VALUES (?)");
                insert.bind(1, static_cast<int64_t>(SUTRA_SCHEMA_VERSION));
                insert.run();
            }
        }
        auto stmt = db_.prepare("PRAGMA integrity_check");
        if (stmt.step()) {
            std::string result = stmt.text(0);
            if (result != "ok") return "sqlite integrity_check: " + result;
        }
        return "";
    }

    GraphData load() {
        GraphData data;

        auto meta = db_.prepare("SELECT key, value FROM graph_metadata");
        while (meta.step()) {
            data.metadata[meta.text(0)] = column_value(meta.text(1));
        }

        if (auto dim = meta_number(data.metadata, store_key::EMBEDDING_DIM)) {
            if (static_cast<size_t>(*dim) != config_.dimension) {
                throw ValidationError("store " + config_.path + " holds " +
                                      std::to_string(static_cast<size_t>(*dim)) +
                                      "-d embeddings; configured dimension is " +
                                      std::to_string(config_.dimension));
            }
        }

        auto ents = db_.prepare(
            "SELECT id, label, description, category, keywords, metadata FROM entities");
        while (ents.step()) {
            Entity e;
            e.id = ents.text(0);
            e.label = ents.text(1);
            e.description = ents.text(2);
            e.category = ents.text(3);
            e.keywords = json::parse(ents.text(4)).get<std::vector<std::string>>();
            e.metadata = column_metadata(ents.text(5));
            EntityId id = e.id;
            data.entities.emplace(std::move(id), std::move(e));
        }

        auto embs = db_.prepare("SELECT entity_id, vector, dimension, model FROM embeddings");
        while (embs.step()) {
            EntityId id = embs.text(0);
            auto it = data.entities.find(id);
            if (it == data.entities.end()) {
                throw StorageError("embedding for missing entity " + id);
            }
            auto bytes = embs.blob(1);
            size_t dim = static_cast<size_t>(embs.integer(2));
            if (dim != config_.dimension || bytes.size() != dim * sizeof(float)) {
                throw StorageError("embedding of " + id + " has wrong size");
            }
            std::vector<float> v(dim);
            std::memcpy(v.data(), bytes.data(), bytes.size());
            it->second.embedding = Vector(std::move(v));
            it->second.embedding_model = embs.text(3);
        }

        auto edges = db_.prepare(
            "SELECT source, target, type, strength, reasoning, hints FROM edges ORDER BY position");
        while (edges.step()) {
            Relationship r;
            r.source = edges.text(0);
            r.target = edges.text(1);
            auto type = parse_relation(edges.text(2));
            if (!type) throw StorageError("unknown relationship type " + edges.text(2));
            r.type = *type;
            r.strength = static_cast<float>(edges.real(3));
            r.reasoning = edges.text(4);
            r.hints = hints_from_json(json::parse(edges.text(5)));
            if (!data.has_entity(r.source) || !data.has_entity(r.target)) {
                throw StorageError("dangling edge " + r.source + " -> " + r.target);
            }
            data.upsert_edge(std::move(r));
        }
        return data;
    }

    // Malformed stored values are corruption, not caller errors
    static MetadataValue column_value(const std::string& text) {
        try {
            return metadata_value_from_json(json::parse(text));
        } catch (const ValidationError& e) {
            throw StorageError(std::string("bad metadata value: ") + e.what());
        }
    }

    static Metadata column_metadata(const std::string& text) {
        try {
            return metadata_from_json(json::parse(text));
        } catch (const ValidationError& e) {
            throw StorageError(std::string("bad entity metadata: ") + e.what());
        }
    }

    std::string verify_hash(const GraphData& data) const {
        auto stored = meta_number(data.metadata, store_key::CONTENT_HASH);
        if (!stored) {
            if (data.entities.empty() && data.edges.empty()) return "";
            return "content hash missing";
        }
        uint32_t actual = content_hash(data);
        if (static_cast<uint32_t>(*stored) != actual) {
            return "content hash mismatch (stored " +
                   std::to_string(static_cast<uint32_t>(*stored)) +
                   ", computed " + std::to_string(actual) + ")";
        }
        return "";
    }

    void write_entity(const Entity& e) {
        auto stmt = db_.prepare(
            "INSERT OR REPLACE INTO entities (id, label, description, category, keywords, metadata) "
            "VALUES (?, ?, ?, ?, ?, ?)");
        stmt.bind(1, e.id)
            .bind(2, e.label)
            .bind(3, e.description)
            .bind(4, e.category)
            .bind(5, json(e.keywords).dump())
            .bind(6, metadata_to_json(e.metadata).dump());
        stmt.run();

        if (e.has_embedding()) {
            auto emb = db_.prepare(
                "INSERT OR REPLACE INTO embeddings (entity_id, vector, dimension, model) "
                "VALUES (?, ?, ?, ?)");
            emb.bind(1, e.id)
               .bind_blob(2, e.embedding->as_ptr(), e.embedding->size() * sizeof(float))
               .bind(3, static_cast<int64_t>(e.embedding->size()))
               .bind(4, e.embedding_model);
            emb.run();
        } else {
            auto del = db_.prepare("DELETE FROM embeddings WHERE entity_id = ?");
            del.bind(1, e.id);
            del.run();
        }
    }

    void write_edge(const Relationship& r, size_t position) {
        auto stmt = db_.prepare(
            "INSERT OR REPLACE INTO edges (position, source, target, type, strength, reasoning, hints) "
            "VALUES (?, ?, ?, ?, ?, ?, ?)");
        stmt.bind(1, static_cast<int64_t>(position))
            .bind(2, r.source)
            .bind(3, r.target)
            .bind(4, std::string(relation_name(r.type)))
            .bind(5, static_cast<double>(r.strength))
            .bind(6, r.reasoning)
            .bind(7, hints_to_json(r.hints).dump());
        stmt.run();
    }

    void write_metadata(const std::string& key, const MetadataValue& value) {
        auto stmt = db_.prepare("INSERT OR REPLACE INTO graph_metadata (key, value) VALUES (?, ?)");
        stmt.bind(1, key).bind(2, metadata_value_to_json(value).dump());
        stmt.run();
    }

    void persist(const GraphSnapshot& snap, bool full,
                 const std::set<EntityId>& entities,
                 const std::set<size_t>& edges,
                 const std::set<std::string>& metadata) {
        std::lock_guard<std::mutex> db_lock(db_mutex_);
        sqlite::Transaction tx(db_);

        if (full) {
            db_.exec("DELETE FROM edges; DELETE FROM embeddings; "
                     "DELETE FROM entities; DELETE FROM graph_metadata;");
            for (const auto& e : snap.entities()) write_entity(e);
            for (size_t i = 0; i < snap.edges().size(); ++i) write_edge(snap.edges()[i], i);
            for (const auto& [key, value] : snap.metadata()) write_metadata(key, value);
        } else {
            for (const auto& id : entities) {
                if (const Entity* e = snap.find(id)) write_entity(*e);
            }
            for (size_t pos : edges) write_edge(snap.edges()[pos], pos);
            for (const auto& key : metadata) {
                write_metadata(key, snap.metadata().at(key));
            }
        }
        tx.commit();
    }

    void install(SnapshotPtr snap, bool full) {
        std::unique_lock<std::shared_mutex> lock(snapshot_mutex_);
        if (log::enabled() && full) {
            std::cerr << "[GraphStore] committed snapshot v" << snap->version() << " ("
                      << snap->size() << " entities, " << snap->edges().size() << " edges)\n";
        }
        current_ = std::move(snap);
        if (full && corrupted_) {
            corrupted_ = false;
            corruption_reason_.clear();
        }
    }

    StoreConfig config_;
    sqlite::Database db_;
    std::mutex db_mutex_;                 // guards db_ connection use

    mutable std::shared_mutex snapshot_mutex_;
    SnapshotPtr current_;
    bool corrupted_ = false;
    std::string corruption_reason_;

    std::mutex write_mutex_;              // single writer
    std::atomic<bool> rebuilding_{false};
    uint64_t version_counter_ = 0;        // guarded by write_mutex_

    std::mutex log_mutex_;
    std::vector<QueryTrace> pending_;
};

} // namespace sutra
