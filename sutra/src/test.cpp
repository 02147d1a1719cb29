#include <sutra/sutra.hpp>
#include <sutra/sqlite.hpp>
#include <iostream>
#include <atomic>
#include <cassert>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <thread>
#include <chrono>
#include <condition_variable>
#include <random>
#include <dirent.h>
#include <unistd.h>

using namespace sutra;

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════════════

const char* SAMPLE_CATALOG = R"({
  "entities": [
    {"id": "n8n-nodes-base.slack", "label": "Slack",
     "description": "Send messages to Slack channels and users. Supports blocks and threads.",
     "success_rate": 0.92, "usage_count": 1200},
    {"id": "n8n-nodes-base.httpRequest", "label": "HTTP Request",
     "description": "Make HTTP requests to any REST API endpoint.", "category": "API"},
    {"id": "n8n-nodes-base.set", "label": "Set",
     "description": "Set, rename and transform field values on items."},
    {"id": "n8n-nodes-base.scheduleTrigger", "label": "Schedule Trigger",
     "description": "Start a workflow on a cron schedule or fixed interval.", "category": "trigger"},
    {"id": "n8n-nodes-base.webhook", "label": "Webhook",
     "description": "Start a workflow when an HTTP webhook call arrives.", "category": "trigger"},
    {"id": "n8n-nodes-base.postgres", "label": "Postgres",
     "description": "Query and insert rows in a Postgres database.",
     "relations": [{"type": "requires", "target": "n8n-nodes-base.set"}]},
    {"id": "n8n-nodes-base.emailSend", "label": "Send Email",
     "description": "Send email messages through an SMTP server.", "category": "Communication"},
    {"id": "n8n-nodes-base.filter", "label": "Filter",
     "description": "Filter items by a condition and keep only matching ones."},
    {"id": "n8n-nodes-base.if", "label": "IF",
     "description": "Route items to different branches based on a condition."},
    {"id": "n8n-nodes-base.openAi", "label": "OpenAI",
     "description": "Generate text and classify content with OpenAI GPT models.", "category": "AI/ML"},
    {"id": "n8n-nodes-base.googleSheets", "label": "Google Sheets",
     "description": "Read and append rows in a Google Sheets spreadsheet."},
    {"id": "n8n-nodes-base.discord", "label": "Discord",
     "description": "Post chat messages to a Discord channel.", "patterns": ["alerts"]}
  ],
  "patterns": [
    {"id": "alerts", "name": "API alerts",
     "members": ["n8n-nodes-base.scheduleTrigger", "n8n-nodes-base.httpRequest",
                 "n8n-nodes-base.set", "n8n-nodes-base.slack"]},
    {"id": "intake", "name": "Form intake",
     "members": ["n8n-nodes-base.webhook", "n8n-nodes-base.set",
                 "n8n-nodes-base.postgres", "n8n-nodes-base.emailSend"]},
    ["n8n-nodes-base.filter", "n8n-nodes-base.if", "n8n-nodes-base.discord"]
  ]
})";

// Three entities: two messaging blocks and one http block used together with A
const char* ABC_CATALOG = R"({
  "entities": [
    {"id": "app.chat-sender", "label": "Chat Sender",
     "description": "Send chat messages to a team channel", "category": "messaging"},
    {"id": "app.chat-notifier", "label": "Chat Notifier",
     "description": "Send chat message notifications to users", "category": "messaging"},
    {"id": "app.web-fetch", "label": "Web Fetch",
     "description": "Fetch JSON data from a REST endpoint", "category": "http"}
  ],
  "patterns": [["app.chat-sender", "app.web-fetch"]]
})";

const std::string A = "app.chat-sender";
const std::string B = "app.chat-notifier";
const std::string C = "app.web-fetch";

Catalog catalog_from(const char* text) {
    return parse_catalog(json::parse(text));
}

BuilderConfig fast_builder() {
    BuilderConfig config;
    config.retry.max_attempts = 2;
    config.retry.initial_backoff = std::chrono::milliseconds(1);
    return config;
}

std::string temp_path(const std::string& name) {
    return "/tmp/sutra_test_" + std::to_string(::getpid()) + "_" + name;
}

Entity make_entity(const std::string& id, const std::string& category) {
    Entity e;
    e.id = id;
    e.label = id;
    e.category = category;
    return e;
}

Vector unit(size_t dim, size_t axis) {
    Vector v(dim);
    v[axis] = 1.0f;
    return v;
}

bool has_edge(const GraphSnapshot& snap, const std::string& a, const std::string& b,
              RelationType type) {
    for (const auto& r : snap.edges()) {
        if (r.type != type) continue;
        if (r.source == a && r.target == b) return true;
        if (is_symmetric(type) && r.source == b && r.target == a) return true;
    }
    return false;
}

// Blocks until released; used to hold a build open
class GateEmbedder : public EmbeddingProvider {
public:
    Vector embed(const std::string& text) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return released_; });
        }
        return inner_.embed(text);
    }

    void wait_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    size_t dimension() const override { return inner_.dimension(); }
    std::string model_id() const override { return inner_.model_id(); }
    bool ready() const override { return true; }

private:
    HashingEmbedder inner_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
};

class SlowEmbedder : public EmbeddingProvider {
public:
    Vector embed(const std::string&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return Vector(DEFAULT_EMBED_DIM);
    }
    size_t dimension() const override { return DEFAULT_EMBED_DIM; }
    std::string model_id() const override { return "slow"; }
    bool ready() const override { return true; }
};

class FailingEmbedder : public EmbeddingProvider {
public:
    Vector embed(const std::string&) override {
        calls++;
        throw EmbeddingUnavailable("model offline");
    }
    size_t dimension() const override { return DEFAULT_EMBED_DIM; }
    std::string model_id() const override { return "failing"; }
    bool ready() const override { return true; }

    std::atomic<int> calls{0};
};

// Fails the first call, then behaves
class FlakyEmbedder : public EmbeddingProvider {
public:
    Vector embed(const std::string& text) override {
        if (calls++ == 0) throw EmbeddingUnavailable("transient hiccup");
        return inner_.embed(text);
    }
    size_t dimension() const override { return inner_.dimension(); }
    std::string model_id() const override { return inner_.model_id(); }
    bool ready() const override { return true; }

    std::atomic<int> calls{0};

private:
    HashingEmbedder inner_;
};

// Threads in this process, from /proc/self/task
size_t thread_count() {
    DIR* dir = ::opendir("/proc/self/task");
    assert(dir != nullptr);
    size_t n = 0;
    while (dirent* entry = ::readdir(dir)) {
        if (entry->d_name[0] != '.') n++;
    }
    ::closedir(dir);
    return n;
}

// ═══════════════════════════════════════════════════════════════════════════
// Primitives
// ═══════════════════════════════════════════════════════════════════════════

void test_text_helpers() {
    std::cout << "Testing text helpers..." << std::endl;

    auto tokens = tokenize("Send a Chat-Message, NOW!");
    assert(tokens.size() == 4);
    assert(tokens[0] == "send");
    assert(tokens[2] == "message");

    assert(slugify("AI/ML") == "ai-ml");
    assert(slugify("  Workflow Control ") == "workflow-control");
    assert(node_key("n8n-nodes-base.httpRequest") == "httprequest");
    assert(first_sentence("One thing. Another.") == "One thing");

    auto terms = content_terms("send the message to the team team");
    assert(terms.size() == 3);
    assert(terms[0] == "send");

    std::cout << "  PASS" << std::endl;
}

void test_vector_cosine() {
    std::cout << "Testing Vector cosine..." << std::endl;

    Vector a(std::vector<float>{1.0f, 0.0f, 0.0f});
    Vector b(std::vector<float>{1.0f, 1.0f, 0.0f});
    Vector zero(3);
    assert(std::abs(a.cosine(a) - 1.0f) < 1e-6f);
    assert(std::abs(a.cosine(b) - 0.70710678f) < 1e-5f);
    assert(a.cosine(zero) == 0.0f);

    b.normalize();
    assert(std::abs(b.norm() - 1.0f) < 1e-6f);

    std::cout << "  PASS" << std::endl;
}

void test_errors_carry_codes() {
    std::cout << "Testing error codes..." << std::endl;

    assert(ValidationError("x").code() == "validation");
    assert(NotFound("x").code() == "not_found");
    assert(DanglingReferenceError("x").code() == "dangling_reference");
    assert(EmbeddingUnavailable("x").code() == "embedding_unavailable");
    assert(BuildInProgressError("x").code() == "build_in_progress");
    assert(StorageCorruptionError("x").code() == "storage_corruption");

    std::cout << "  PASS" << std::endl;
}

void test_relation_names() {
    std::cout << "Testing relation names..." << std::endl;

    for (auto type : ALL_RELATION_TYPES) {
        auto parsed = parse_relation(relation_name(type));
        assert(parsed && *parsed == type);
    }
    assert(!parse_relation("likes"));
    assert(is_symmetric(RelationType::SimilarTo));
    assert(!is_symmetric(RelationType::CompatibleWith));

    Relationship r;
    r.source = "b";
    r.target = "a";
    r.type = RelationType::UsedInPattern;
    assert(canonical(r).source == "a");
    r.type = RelationType::Requires;
    assert(canonical(r).source == "b");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Embedding
// ═══════════════════════════════════════════════════════════════════════════

void test_hashing_embedder() {
    std::cout << "Testing HashingEmbedder..." << std::endl;

    HashingEmbedder embedder(64);
    auto v1 = embedder.embed("send chat messages");
    auto v2 = embedder.embed("send chat messages");
    assert(v1.size() == 64);
    assert(v1 == v2);
    assert(std::abs(v1.norm() - 1.0f) < 1e-5f);

    auto related = embedder.embed("send chat message");
    auto unrelated = embedder.embed("postgres database rows");
    assert(v1.cosine(related) > v1.cosine(unrelated));

    auto batch = embedder.embed_batch({"one thing", "another thing"});
    assert(batch.size() == 2);
    assert(embedder.model_id() == "sutra-hash-v1/64");

    std::cout << "  PASS" << std::endl;
}

void test_caching_embedder_lru() {
    std::cout << "Testing CachingEmbedder LRU..." << std::endl;

    auto inner = std::make_shared<HashingEmbedder>(32);
    CachingEmbedder cache(inner, 2);
    auto first = cache.embed("alpha");
    cache.embed("beta");
    cache.embed("alpha");      // refresh alpha
    cache.embed("gamma");      // evicts beta
    assert(cache.size() == 2);
    assert(cache.embed("alpha") == first);

    auto batch = cache.embed_batch({"alpha", "delta"});
    assert(batch.size() == 2);
    assert(batch[0] == first);

    std::cout << "  PASS" << std::endl;
}

void test_retry_policy() {
    std::cout << "Testing retry policy..." << std::endl;

    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_backoff = std::chrono::milliseconds(1);

    int calls = 0;
    int value = with_retry(policy, [&] {
        if (++calls < 3) throw EmbeddingUnavailable("flaky");
        return 7;
    });
    assert(value == 7);
    assert(calls == 3);

    calls = 0;
    bool threw = false;
    try {
        with_retry(policy, [&]() -> int {
            ++calls;
            throw EmbeddingUnavailable("down");
        });
    } catch (const EmbeddingUnavailable&) {
        threw = true;
    }
    assert(threw);
    assert(calls == 3);

    std::cout << "  PASS" << std::endl;
}

void test_deadline_embedder() {
    std::cout << "Testing DeadlineEmbedder..." << std::endl;

    DeadlineEmbedder fast(std::make_shared<HashingEmbedder>(16), std::chrono::milliseconds(2000));
    assert(fast.embed("hello world").size() == 16);

    DeadlineEmbedder slow(std::make_shared<SlowEmbedder>(), std::chrono::milliseconds(20));
    bool threw = false;
    try {
        slow.embed("hello");
    } catch (const EmbeddingUnavailable&) {
        threw = true;
    }
    assert(threw);

    DeadlineEmbedder failing(std::make_shared<FailingEmbedder>(), std::chrono::milliseconds(2000));
    threw = false;
    try {
        failing.embed("hello");
    } catch (const EmbeddingUnavailable& e) {
        threw = std::string(e.what()).find("model offline") != std::string::npos;
    }
    assert(threw);

    // A hung provider pins the worker pool; it never grows past its size
    auto hung = std::make_shared<GateEmbedder>();
    size_t before = thread_count();
    {
        DeadlineEmbedder bounded(hung, std::chrono::milliseconds(1), 2, 4);
        assert(bounded.workers() == 2);
        int timed_out = 0;
        for (int i = 0; i < 300; ++i) {
            try {
                bounded.embed("hello");
            } catch (const EmbeddingTimeout&) {
                timed_out++;
            }
        }
        assert(timed_out == 300);
        assert(thread_count() <= before + 2);
        hung->release();
    }
    // Joined workers can linger in /proc for a moment
    for (int i = 0; i < 100 && thread_count() > before; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(thread_count() == before);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Graph Store
// ═══════════════════════════════════════════════════════════════════════════

void test_store_validation() {
    std::cout << "Testing GraphStore validation..." << std::endl;

    StoreConfig config;
    config.dimension = 4;
    GraphStore store(config);

    Entity bad = make_entity("x", "other");
    bad.embedding = Vector(3);
    bad.embedding->data[0] = 1.0f;
    bool threw = false;
    try { store.put_entity(bad); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    store.put_entity(make_entity("a", "other"));
    store.put_entity(make_entity("b", "other"));

    Relationship r;
    r.source = "a";
    r.target = "ghost";
    r.strength = 0.5f;
    threw = false;
    try { store.put_edge(r); } catch (const DanglingReferenceError&) { threw = true; }
    assert(threw);

    r.target = "b";
    r.strength = 1.5f;
    threw = false;
    try { store.put_edge(r); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    r.strength = NAN;
    threw = false;
    try { store.put_edge(r); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    r.target = "a";
    r.strength = 0.5f;
    threw = false;
    try { store.put_edge(r); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    threw = false;
    try { store.get_entity("missing"); } catch (const NotFound&) { threw = true; }
    assert(threw);

    threw = false;
    try { store.edges_from("missing"); } catch (const NotFound&) { threw = true; }
    assert(threw);

    // Rejected writes leave nothing behind
    assert(store.stats().edges == 0);
    assert(store.stats().entities == 2);

    threw = false;
    try { GraphStore zero(StoreConfig{"", 0}); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_store_edges_insertion_order() {
    std::cout << "Testing GraphStore edge order and overwrite..." << std::endl;

    StoreConfig config;
    config.dimension = 4;
    GraphStore store(config);
    for (const char* id : {"a", "b", "c", "d"}) store.put_entity(make_entity(id, "other"));

    auto edge = [](const char* s, const char* t, RelationType type, float strength) {
        Relationship r;
        r.source = s;
        r.target = t;
        r.type = type;
        r.strength = strength;
        return r;
    };

    auto tx = store.begin();
    tx.put_edge(edge("a", "d", RelationType::Requires, 0.4f));
    tx.put_edge(edge("a", "b", RelationType::CompatibleWith, 0.6f));
    tx.put_edge(edge("a", "c", RelationType::Solves, 0.2f));
    tx.put_edge(edge("a", "d", RelationType::Requires, 0.9f));   // replaces in place
    tx.commit();

    auto out = store.edges_from("a");
    assert(out.size() == 3);
    assert(out[0].target == "d");
    assert(out[0].strength == 0.9f);
    assert(out[1].target == "b");
    assert(out[2].target == "c");
    assert(store.edges_to("b").size() == 1);

    // Symmetric edges are one logical edge whichever way they are written
    store.put_edge(edge("c", "b", RelationType::SimilarTo, 0.7f));
    store.put_edge(edge("b", "c", RelationType::SimilarTo, 0.8f));
    auto stats = store.stats();
    assert(stats.edges == 4);
    assert(stats.per_relation["similar-to"] == 1);

    // ...and are listed from both endpoints, in insertion order
    auto from_c = store.edges_from("c");
    assert(from_c.size() == 1);
    assert(from_c[0].type == RelationType::SimilarTo);
    assert(from_c[0].strength == 0.8f);
    auto from_b = store.edges_from("b");
    assert(from_b.size() == 1);
    assert(from_b[0].type == RelationType::SimilarTo);
    auto to_b = store.edges_to("b");
    assert(to_b.size() == 2);
    assert(to_b[0].type == RelationType::CompatibleWith);
    assert(to_b[1].type == RelationType::SimilarTo);
    auto to_c = store.edges_to("c");
    assert(to_c.size() == 2);
    assert(to_c[0].type == RelationType::Solves);
    assert(to_c[1].type == RelationType::SimilarTo);
    assert(store.edges_from("a").size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_nearest_neighbor_ties() {
    std::cout << "Testing nearest neighbor determinism..." << std::endl;

    StoreConfig config;
    config.dimension = 4;
    GraphStore store(config);

    auto tx = store.begin();
    for (const char* id : {"c", "a", "b"}) {
        Entity e = make_entity(id, "other");
        e.embedding = unit(4, 0);
        tx.put_entity(e);
    }
    Entity d = make_entity("d", "other");
    d.embedding = unit(4, 1);
    tx.put_entity(d);
    tx.put_entity(make_entity("e", "other"));   // no embedding
    tx.commit();

    for (int round = 0; round < 5; ++round) {
        auto hits = store.nearest_neighbors(unit(4, 0), 3);
        assert(hits.size() == 3);
        assert(hits[0].id == "a");
        assert(hits[1].id == "b");
        assert(hits[2].id == "c");
    }

    auto all = store.nearest_neighbors(unit(4, 0), 10);
    assert(all.size() == 4);           // "e" has no embedding
    assert(all.back().id == "d");

    bool threw = false;
    try { store.nearest_neighbors(unit(4, 0), 0); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { store.nearest_neighbors(unit(3, 0), 2); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_store_metadata_and_usage() {
    std::cout << "Testing metadata and usage feedback..." << std::endl;

    StoreConfig config;
    config.dimension = 4;
    GraphStore store(config);
    store.put_entity(make_entity("a", "other"));

    store.set_metadata("owner", std::string("ops"));
    auto owner = store.get_metadata("owner");
    assert(owner && std::get<std::string>(*owner) == "ops");
    assert(!store.get_metadata("nothing"));

    // Unknown until observed
    assert(!meta_number(store.get_entity("a").metadata, meta::SUCCESS_RATE));

    store.update_usage("a", 0.75, 12);
    auto e = store.get_entity("a");
    assert(*meta_number(e.metadata, meta::SUCCESS_RATE) == 0.75);
    assert(*meta_number(e.metadata, meta::USAGE_COUNT) == 12.0);

    store.update_usage("a", std::nullopt, 13);
    e = store.get_entity("a");
    assert(*meta_number(e.metadata, meta::SUCCESS_RATE) == 0.75);
    assert(*meta_number(e.metadata, meta::USAGE_COUNT) == 13.0);

    bool threw = false;
    try { store.update_usage("a", 1.5, std::nullopt); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { store.update_usage("a", std::nullopt, std::nullopt); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { store.update_usage("zzz", 0.5, std::nullopt); } catch (const NotFound&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_isolation() {
    std::cout << "Testing snapshot isolation..." << std::endl;

    StoreConfig config;
    config.dimension = 4;
    GraphStore store(config);
    store.put_entity(make_entity("a", "other"));

    auto before = store.snapshot();
    {
        auto tx = store.begin();
        tx.put_entity(make_entity("b", "other"));
        // Not visible until commit
        assert(!store.contains("b"));
        // Destroyed without commit: discarded
    }
    assert(!store.contains("b"));

    store.put_entity(make_entity("b", "other"));
    assert(store.contains("b"));
    assert(before->size() == 1);       // old handle unchanged
    assert(store.snapshot()->version() > before->version());

    std::cout << "  PASS" << std::endl;
}

void test_store_persistence() {
    std::cout << "Testing GraphStore persistence..." << std::endl;

    std::string path = temp_path("persist.db");
    std::remove(path.c_str());
    uint32_t hash = 0;
    {
        StoreConfig config{path, 4};
        GraphStore store(config);
        auto tx = store.begin();
        Entity a = make_entity("a", "other");
        a.embedding = unit(4, 2);
        a.embedding_model = "test-model";
        a.metadata[meta::USE_CASES] = std::vector<std::string>{"one", "two"};
        a.metadata[meta::SUCCESS_RATE] = 0.5;
        tx.put_entity(a);
        tx.put_entity(make_entity("b", "other"));
        Relationship r;
        r.source = "a";
        r.target = "b";
        r.type = RelationType::CompatibleWith;
        r.strength = 0.3f;
        r.hints.mapping = "x -> y";
        tx.put_edge(r);
        tx.commit();
        hash = store.stats().content_hash;
    }
    {
        StoreConfig config{path, 4};
        GraphStore store(config);
        assert(!store.corrupted());
        auto a = store.get_entity("a");
        assert(a.has_embedding());
        assert(*a.embedding == unit(4, 2));
        assert(a.embedding_model == "test-model");
        assert(meta_list(a.metadata, meta::USE_CASES).size() == 2);
        auto edges = store.edges_from("a");
        assert(edges.size() == 1);
        assert(edges[0].strength == 0.3f);
        assert(edges[0].hints.mapping == "x -> y");
        assert(store.stats().content_hash == hash);
    }
    {
        // Reopening with another dimension is a configuration error
        StoreConfig config{path, 8};
        bool threw = false;
        try { GraphStore store(config); } catch (const ValidationError&) { threw = true; }
        assert(threw);
    }
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_corruption_detection() {
    std::cout << "Testing corruption detection..." << std::endl;

    std::string path = temp_path("corrupt.db");
    std::remove(path.c_str());
    {
        GraphStore store(StoreConfig{path});
        HashingEmbedder embedder;
        GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));
    }
    {
        sqlite::Database db;
        db.open(path);
        db.exec("UPDATE entities SET label = 'Tampered' WHERE id = 'app.chat-sender'");
        db.close();
    }
    {
        GraphStore store(StoreConfig{path});
        assert(store.corrupted());
        bool threw = false;
        try { store.snapshot(); } catch (const StorageCorruptionError&) { threw = true; }
        assert(threw);
        threw = false;
        try { store.get_entity(A); } catch (const StorageCorruptionError&) { threw = true; }
        assert(threw);
        threw = false;
        try { store.begin(); } catch (const StorageCorruptionError&) { threw = true; }
        assert(threw);

        // A full rebuild recovers
        HashingEmbedder embedder;
        GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));
        assert(!store.corrupted());
        assert(store.get_entity(A).label == "Chat Sender");
    }
    {
        GraphStore store(StoreConfig{path});
        assert(!store.corrupted());
        assert(store.stats().entities == 3);
    }
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_query_log() {
    std::cout << "Testing query log..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));

    QueryEngine engine(store, std::make_shared<HashingEmbedder>());
    engine.keyword("chat", 2);
    engine.hybrid("send a chat message", 2);

    auto recent = store.recent_queries(10);
    assert(recent.size() == 2);
    assert(recent[0].strategy == "hybrid");
    assert(recent[0].query == "send a chat message");
    assert(recent[1].strategy == "keyword");
    assert(recent[1].result_count > 0);

    // Explaining ranks internally but records nothing
    engine.explain("send a chat message", A);
    assert(store.recent_queries(10).size() == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Catalog and extraction
// ═══════════════════════════════════════════════════════════════════════════

void test_catalog_parsing() {
    std::cout << "Testing catalog parsing..." << std::endl;

    auto catalog = catalog_from(R"({
      "entities": [
        {"id": "a", "label": "A", "patterns": ["p-extra"]},
        {"label": "no id"},
        {"id": "a", "label": "duplicate"},
        {"id": "b", "success_rate": 2.0},
        {"id": "c", "usage_count": 3, "description": 12},
        "not an object",
        {"id": "d", "category": "Messaging", "success_rate": 0.5, "usage_count": 4}
      ],
      "patterns": [["a", "d"], {"id": "named", "name": "Named", "members": ["d", "a"]}]
    })");

    assert(catalog.total_records == 7);
    assert(catalog.records.size() == 2);
    assert(catalog.skipped == 5);
    assert(catalog.problems.size() >= 5);

    assert(catalog.patterns.size() == 3);
    assert(catalog.patterns[0].id == "pattern-1");
    assert(catalog.patterns[1].name == "Named");
    assert(catalog.patterns[2].id == "p-extra");
    assert(catalog.patterns[2].members.size() == 1);

    const auto& d = catalog.records[1];
    assert(d.success_rate && *d.success_rate == 0.5);
    assert(d.usage_count && *d.usage_count == 4);
    assert(!catalog.records[0].success_rate);

    // Bare array form
    auto bare = catalog_from(R"([{"id": "x"}, {"id": "y"}])");
    assert(bare.records.size() == 2);
    assert(bare.patterns.empty());

    bool threw = false;
    try { catalog_from(R"({"something": 1})"); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_entity_extraction() {
    std::cout << "Testing entity extraction..." << std::endl;

    EntityExtractor extractor;

    CatalogRecord slack;
    slack.id = "n8n-nodes-base.slack";
    slack.label = "Slack";
    slack.description = "Send messages to Slack channels and users.";
    auto e = extractor.extract(slack);
    assert(e.category == "messaging");
    auto use_cases = meta_list(e.metadata, meta::USE_CASES);
    assert(use_cases.size() >= 2 && use_cases.size() <= 6);
    assert(use_cases[0] == "Send notifications to team");
    auto prereqs = meta_list(e.metadata, meta::PREREQUISITES);
    assert(!prereqs.empty() && prereqs.size() <= 4);
    assert(prereqs[0] == "Must authenticate with service");
    assert(meta_list(e.metadata, meta::TIPS).size() == 3);
    assert(!meta_list(e.metadata, meta::PITFALLS).empty());
    assert(!meta_list(e.metadata, meta::PRESETS).empty());
    assert(meta_string(e.metadata, meta::COMPLEXITY) == std::string("simple"));
    assert(meta_string(e.metadata, meta::LEARNING_CURVE) == std::string("easy"));
    assert(std::find(e.keywords.begin(), e.keywords.end(), "slack") != e.keywords.end());
    assert(std::find(e.keywords.begin(), e.keywords.end(), "channels") != e.keywords.end());
    assert(e.keywords.size() <= 15);

    // Unknown metrics stay unknown; known ones carry over
    assert(!meta_number(e.metadata, meta::SUCCESS_RATE));
    assert(!meta_number(e.metadata, meta::USAGE_COUNT));
    slack.success_rate = 0.0;
    slack.usage_count = 0;
    e = extractor.extract(slack);
    assert(meta_number(e.metadata, meta::SUCCESS_RATE) == 0.0);
    assert(meta_number(e.metadata, meta::USAGE_COUNT) == 0.0);

    // Explicit categories: alias accepted, unknown replaced by the rule result
    CatalogRecord mail;
    mail.id = "mailer";
    mail.label = "Mailer";
    mail.description = "Deliver email";
    mail.category = "Communication";
    assert(extractor.extract(mail).category == "messaging");
    mail.category = "Banana";
    assert(extractor.extract(mail).category == "messaging");

    CatalogRecord plain;
    plain.id = "widget";
    plain.label = "Widget";
    plain.description = "Does something rather unusual.";
    auto w = extractor.extract(plain);
    assert(w.category == "other");
    auto generated = meta_list(w.metadata, meta::USE_CASES);
    assert(generated.size() == 2);
    assert(generated[0] == "Use for does something rather unusual");

    CatalogRecord empty;
    bool threw = false;
    try { extractor.extract(empty); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Relationship inference
// ═══════════════════════════════════════════════════════════════════════════

void test_pair_rules_and_triggers() {
    std::cout << "Testing pair rules and trigger edges..." << std::endl;

    std::map<EntityId, Entity> entities;
    for (auto [id, category] : std::vector<std::pair<std::string, std::string>>{
             {"n8n-nodes-base.httpRequest", "http"},
             {"n8n-nodes-base.set", "data"},
             {"n8n-nodes-base.scheduleTrigger", "trigger"},
             {"n8n-nodes-base.slack", "messaging"}}) {
        entities.emplace(id, make_entity(id, category));
    }

    Pattern p;
    p.id = "p";
    p.name = "Alerts";
    p.members = {"n8n-nodes-base.scheduleTrigger", "n8n-nodes-base.httpRequest",
                 "n8n-nodes-base.slack", "n8n-nodes-base.ghost"};

    RelationshipInferrer inferrer;
    InferenceReport report;
    auto edges = inferrer.infer(entities, {p}, {}, &report);

    assert(report.dangling_skipped == 1);
    bool found_rule = false;
    size_t triggered = 0;
    for (const auto& r : edges) {
        assert(entities.count(r.source) && entities.count(r.target));
        assert(r.strength >= 0.0f && r.strength <= 1.0f);
        if (r.type == RelationType::CompatibleWith && r.source == "n8n-nodes-base.httpRequest" &&
            r.target == "n8n-nodes-base.set") {
            found_rule = true;
            assert(r.strength == 0.95f);
            assert(!r.hints.mapping.empty());
            assert(!r.hints.pitfalls.empty());
        }
        if (r.type == RelationType::TriggeredBy) {
            assert(r.target == "n8n-nodes-base.scheduleTrigger");
            triggered++;
        }
    }
    assert(found_rule);
    assert(triggered == 2);

    std::cout << "  PASS" << std::endl;
}

void test_fan_out_cap() {
    std::cout << "Testing fan-out cap..." << std::endl;

    std::map<EntityId, Entity> entities;
    for (int i = 0; i < 10; ++i) {
        std::string id = "node-" + std::to_string(i);
        entities.emplace(id, make_entity(id, "data"));
    }

    InferenceConfig config;
    config.fan_out_cap = 3;
    config.pair_rules.clear();
    RelationshipInferrer inferrer(config);
    InferenceReport report;
    auto edges = inferrer.infer(entities, {}, {}, &report);

    std::map<EntityId, size_t> degree;
    for (const auto& r : edges) {
        degree[r.source]++;
        degree[r.target]++;
    }
    for (const auto& [id, d] : degree) assert(d <= 3);
    assert(report.candidates == 45);
    assert(report.dropped_by_cap > 0);
    assert(edges.size() + report.dropped_by_cap == report.candidates);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Builder
// ═══════════════════════════════════════════════════════════════════════════

void test_abc_scenario() {
    std::cout << "Testing A/B/C scenario..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    auto report = GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));
    assert(report.entities == 3);
    assert(report.null_embeddings == 0);

    auto snap = store.snapshot();
    assert(has_edge(*snap, A, B, RelationType::BelongsToCategory));
    assert(has_edge(*snap, A, C, RelationType::UsedInPattern));
    assert(!has_edge(*snap, B, C, RelationType::BelongsToCategory));

    float sim = snap->find(A)->embedding->cosine(*snap->find(B)->embedding);
    assert(has_edge(*snap, A, B, RelationType::SimilarTo) == (sim >= 0.85f));

    QueryEngine engine(store, std::make_shared<HashingEmbedder>());
    auto result = engine.hybrid("send a chat message", 2);
    assert(!result.meta.degraded);
    assert(result.meta.strategy == "hybrid");
    assert(result.hits.size() == 2);
    assert(result.hits[0].id != C);
    bool messaging_first = result.hits[0].id == A || result.hits[0].id == B;
    assert(messaging_first);

    auto near = engine.neighbors(A, 1);
    assert(near.hits.size() == 2);
    std::set<std::string> ids;
    for (const auto& h : near.hits) {
        ids.insert(h.id);
        assert(h.distance == 1);
    }
    assert(ids.count(B) && ids.count(C));

    bool threw = false;
    try { engine.neighbors(A, 0); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { engine.neighbors("nobody", 1); } catch (const NotFound&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_build_report_and_metadata() {
    std::cout << "Testing build report..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    auto report = GraphBuilder(store, embedder, fast_builder()).build(catalog_from(SAMPLE_CATALOG));

    assert(report.records_total == 12);
    assert(report.records_skipped == 0);
    assert(report.entities == 12);
    assert(report.embeddings == 12);
    assert(report.edges > 0);
    assert(report.relations.per_type.count("compatible-with"));
    assert(report.relations.per_type.count("triggered-by"));
    assert(report.relations.per_type.count("requires"));

    auto stats = store.stats();
    assert(stats.entities == 12);
    assert(stats.edges == report.edges);
    assert(stats.embeddings == 12);
    assert(stats.embedding_model == embedder.model_id());
    assert(stats.per_category["trigger"] == 2);
    assert(stats.per_category["messaging"] >= 3);
    assert(stats.per_category["ai"] == 1);

    auto meta = store.metadata();
    assert(meta_number(meta, build_key::ENTITIES_TOTAL) == 12.0);
    assert(meta_number(meta, build_key::RELATIONSHIPS_TOTAL) == static_cast<double>(report.edges));
    assert(meta_number(meta, build_key::BUILD_TIMESTAMP));

    auto slack = store.get_entity("n8n-nodes-base.slack");
    assert(meta_number(slack.metadata, meta::SUCCESS_RATE) == 0.92);
    assert(!meta_number(store.get_entity("n8n-nodes-base.set").metadata, meta::SUCCESS_RATE));

    std::cout << "  PASS" << std::endl;
}

void test_no_dangling_edges_fuzz() {
    std::cout << "Testing no dangling edges (fuzz)..." << std::endl;

    std::mt19937 rng(42);
    const char* words[] = {"send", "chat", "fetch", "http", "data", "merge", "cron",
                           "email", "table", "rows", "file", "upload", "classify"};
    const char* types[] = {"requires", "solves", "triggered-by", "compatible-with", "bogus"};

    for (int round = 0; round < 5; ++round) {
        json root;
        root["entities"] = json::array();
        int n = 8 + static_cast<int>(rng() % 8);
        for (int i = 0; i < n; ++i) {
            json rec = {{"id", "e" + std::to_string(i)}};
            std::string description;
            for (int w = 0; w < 6; ++w) description += std::string(words[rng() % 13]) + " ";
            rec["description"] = description;
            rec["relations"] = json::array();
            for (int k = 0; k < 2; ++k) {
                int target = static_cast<int>(rng() % (n + 4));   // some past the end
                rec["relations"].push_back({{"type", types[rng() % 5]},
                                            {"target", "e" + std::to_string(target)}});
            }
            root["entities"].push_back(rec);
        }
        root["patterns"] = json::array();
        for (int p = 0; p < 4; ++p) {
            json members = json::array();
            for (int m = 0; m < 4; ++m) {
                members.push_back("e" + std::to_string(rng() % (n + 5)));
            }
            root["patterns"].push_back(members);
        }

        GraphStore store;
        HashingEmbedder embedder;
        auto report = GraphBuilder(store, embedder, fast_builder()).build(parse_catalog(root));
        assert(report.entities == static_cast<size_t>(n));

        auto snap = store.snapshot();
        for (const auto& r : snap->edges()) {
            assert(snap->find(r.source) != nullptr);
            assert(snap->find(r.target) != nullptr);
            assert(r.source != r.target);
            assert(r.strength >= 0.0f && r.strength <= 1.0f);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_idempotent_rebuild() {
    std::cout << "Testing idempotent rebuild..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder builder(store, embedder, fast_builder());
    auto catalog = catalog_from(SAMPLE_CATALOG);

    builder.build(catalog);
    auto first = store.snapshot();
    builder.build(catalog);
    auto second = store.snapshot();

    assert(second->version() == first->version() + 1);
    assert(first->size() == second->size());
    assert(first->edges().size() == second->edges().size());
    for (size_t i = 0; i < first->edges().size(); ++i) {
        const auto& a = first->edges()[i];
        const auto& b = second->edges()[i];
        assert(edge_key(a) == edge_key(b));
        assert(std::abs(a.strength - b.strength) < 1e-6f);
    }
    assert(first->content_hash() == second->content_hash());

    std::cout << "  PASS" << std::endl;
}

void test_build_in_progress() {
    std::cout << "Testing build exclusivity..." << std::endl;

    GraphStore store;
    HashingEmbedder plain;
    GraphBuilder(store, plain, fast_builder()).build(catalog_from(ABC_CATALOG));
    uint64_t before = store.snapshot()->version();

    GateEmbedder gate;
    BuilderConfig config = fast_builder();
    config.batch_size = 1;
    std::thread worker([&] {
        GraphBuilder(store, gate, config).build(catalog_from(SAMPLE_CATALOG));
    });
    gate.wait_entered();

    bool threw = false;
    try {
        GraphBuilder(store, plain, fast_builder()).build(catalog_from(ABC_CATALOG));
    } catch (const BuildInProgressError&) {
        threw = true;
    }
    assert(threw);
    assert(store.rebuild_in_progress());

    // Readers keep the previous snapshot during the build
    QueryEngine engine(store, std::make_shared<HashingEmbedder>());
    auto result = engine.keyword("chat", 3);
    assert(result.meta.snapshot_version == before);
    assert(store.snapshot()->size() == 3);

    gate.release();
    worker.join();
    assert(!store.rebuild_in_progress());
    assert(store.snapshot()->version() == before + 1);
    assert(store.snapshot()->size() == 12);

    std::cout << "  PASS" << std::endl;
}

void test_build_failures() {
    std::cout << "Testing build failure handling..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));
    uint64_t version = store.snapshot()->version();

    // Zero entities: build fails, previous graph stays live
    bool threw = false;
    try {
        GraphBuilder(store, embedder, fast_builder())
            .build(catalog_from(R"({"entities": [{"label": "no id"}]})"));
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    assert(store.snapshot()->version() == version);
    assert(store.contains(A));
    assert(!store.rebuild_in_progress());

    // Embedder dimension must match the store
    HashingEmbedder small(16);
    threw = false;
    try {
        GraphBuilder(store, small, fast_builder()).build(catalog_from(ABC_CATALOG));
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    // Persistent embedding failure: entities kept with null embeddings
    FailingEmbedder failing;
    auto report = GraphBuilder(store, failing, fast_builder()).build(catalog_from(ABC_CATALOG));
    assert(report.entities == 3);
    assert(report.null_embeddings == 3);
    assert(report.embeddings == 0);
    assert(failing.calls > 0);
    assert(!store.get_entity(A).has_embedding());
    assert(store.stats().embeddings == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Query engine
// ═══════════════════════════════════════════════════════════════════════════

void test_query_validation() {
    std::cout << "Testing query validation..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));
    QueryEngine engine(store, std::make_shared<HashingEmbedder>());

    bool threw = false;
    try { engine.semantic("   ", 3); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    threw = false;
    try { engine.hybrid("chat", 3, HybridWeights{0.8, 0.5, 0.1}); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    threw = false;
    try { engine.hybrid("chat", 3, HybridWeights{-0.1, 0.5, 0.1}); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    // k clamped to [1, n]
    assert(engine.semantic("chat", 0).hits.size() == 1);
    assert(engine.semantic("chat", 50).hits.size() == 3);

    // Category filter
    SearchFilter filter;
    filter.category = std::string("http");
    auto filtered = engine.semantic("chat", 3, filter);
    assert(filtered.hits.size() == 1);
    assert(filtered.hits[0].id == C);

    std::cout << "  PASS" << std::endl;
}

void test_semantic_determinism() {
    std::cout << "Testing semantic determinism..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(SAMPLE_CATALOG));
    QueryEngine engine(store, std::make_shared<HashingEmbedder>());

    auto first = engine.semantic("post a message to a channel", 5);
    for (int i = 0; i < 5; ++i) {
        auto again = engine.semantic("post a message to a channel", 5);
        assert(again.hits.size() == first.hits.size());
        for (size_t j = 0; j < first.hits.size(); ++j) {
            assert(again.hits[j].id == first.hits[j].id);
            assert(again.hits[j].score == first.hits[j].score);
        }
    }
    for (size_t j = 1; j < first.hits.size(); ++j) {
        assert(first.hits[j - 1].score >= first.hits[j].score);
    }

    std::cout << "  PASS" << std::endl;
}

void test_timeout_degrades_to_keyword() {
    std::cout << "Testing embedding timeout degradation..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));

    QueryConfig config;
    config.embed_timeout = std::chrono::milliseconds(50);
    QueryEngine engine(store, std::make_shared<SlowEmbedder>(), config);

    auto result = engine.semantic("send a chat message", 2);
    assert(result.meta.degraded);
    assert(result.meta.requested_strategy == "semantic");
    assert(result.meta.strategy == "keyword");
    assert(!result.meta.degraded_reason.empty());
    assert(!result.hits.empty());
    assert(result.hits[0].id != C);

    auto hybrid = engine.hybrid("send a chat message", 2);
    assert(hybrid.meta.degraded);
    assert(!hybrid.hits.empty());

    // No provider at all behaves the same
    QueryEngine keyword_only(store, nullptr);
    auto plain = keyword_only.hybrid("chat", 3);
    assert(plain.meta.degraded);
    assert(!plain.hits.empty());

    std::cout << "  PASS" << std::endl;
}

void test_query_embedding_retry() {
    std::cout << "Testing query embedding retry..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));

    // A fast transient failure is retried inside the same timeout
    auto flaky = std::make_shared<FlakyEmbedder>();
    QueryEngine recovers(store, flaky);
    auto result = recovers.semantic("send a chat message", 2);
    assert(!result.meta.degraded);
    assert(result.meta.strategy == "semantic");
    assert(flaky->calls == 2);

    // A persistent failure degrades after the bounded attempts
    auto failing = std::make_shared<FailingEmbedder>();
    QueryConfig config;
    config.embed_attempts = 3;
    QueryEngine gives_up(store, failing, config);
    auto degraded = gives_up.hybrid("send a chat message", 2);
    assert(degraded.meta.degraded);
    assert(degraded.meta.degraded_reason.find("model offline") != std::string::npos);
    assert(failing->calls == 3);

    // A timeout is not retried
    QueryConfig slow_config;
    slow_config.embed_timeout = std::chrono::milliseconds(50);
    slow_config.embed_attempts = 3;
    QueryEngine slow(store, std::make_shared<SlowEmbedder>(), slow_config);
    auto t0 = std::chrono::steady_clock::now();
    auto timed_out = slow.semantic("send a chat message", 2);
    auto waited = std::chrono::steady_clock::now() - t0;
    assert(timed_out.meta.degraded);
    assert(waited < std::chrono::milliseconds(250));

    std::cout << "  PASS" << std::endl;
}

void test_hybrid_monotonicity() {
    std::cout << "Testing hybrid weight monotonicity..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(SAMPLE_CATALOG));
    QueryEngine engine(store, std::make_shared<HashingEmbedder>());
    size_t n = store.snapshot()->size();

    for (const char* query : {"send chat messages", "fetch rows from a database",
                              "start workflow on schedule", "classify text"}) {
        auto low = engine.hybrid(query, n, HybridWeights{0.4, 0.4, 0.15});
        auto high = engine.hybrid(query, n, HybridWeights{0.6, 0.2, 0.15});

        auto rank = [](const SearchResult& r, const std::string& id) {
            for (size_t i = 0; i < r.hits.size(); ++i) {
                if (r.hits[i].id == id) return i;
            }
            return r.hits.size();
        };

        for (const auto& x : low.hits) {
            if (!(x.semantic_score > x.keyword_score)) continue;
            for (const auto& y : low.hits) {
                if (!(y.keyword_score > y.semantic_score)) continue;
                if (rank(low, x.id) < rank(low, y.id)) {
                    assert(rank(high, x.id) < rank(high, y.id));
                }
            }
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_graph_boost() {
    std::cout << "Testing graph boost..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));
    QueryEngine engine(store, std::make_shared<HashingEmbedder>());

    auto result = engine.hybrid("send a chat message", 3);
    for (const auto& hit : result.hits) {
        // The boost is applied at most once and only to candidates
        assert(hit.graph_boost == 0.0 || hit.graph_boost == engine.config().weights.graph);
        if (hit.graph_boost > 0.0) assert(!hit.boosted_by.empty());
        double expected = 0.6 * hit.semantic_score + 0.25 * hit.keyword_score + hit.graph_boost;
        assert(std::abs(hit.score - expected) < 1e-9);
    }

    auto no_graph = engine.hybrid("send a chat message", 3, HybridWeights{0.6, 0.25, 0.0});
    for (const auto& hit : no_graph.hits) assert(hit.graph_boost == 0.0);

    std::cout << "  PASS" << std::endl;
}

void test_paths() {
    std::cout << "Testing path search..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));
    QueryEngine engine(store, std::make_shared<HashingEmbedder>());

    auto self = engine.paths(A, A, 3, 5);
    assert(self.paths.size() == 1);
    assert(self.paths[0].hops() == 0);
    assert(self.paths[0].confidence == 1.0);

    auto bc = engine.paths(B, C, 3, 10);
    assert(!bc.paths.empty());
    assert(bc.paths.size() <= 10);
    assert(bc.paths[0].nodes.front() == B);
    assert(bc.paths[0].nodes.back() == C);
    double product = 1.0;
    for (const auto& e : bc.paths[0].edges) product *= e.strength;
    assert(std::abs(bc.paths[0].confidence - product) < 1e-9);
    for (size_t i = 1; i < bc.paths.size(); ++i) {
        assert(bc.paths[i - 1].hops() <= bc.paths[i].hops());   // shallowest first
    }

    auto bounded = engine.paths(B, C, 3, 1);
    assert(bounded.paths.size() == 1);

    auto short_hops = engine.paths(B, C, 1, 5);
    assert(short_hops.paths.empty());
    assert(short_hops.meta.truncated);

    // Streaming: paths are available one at a time
    auto stream = engine.path_stream(B, C, 3, 2);
    auto first = stream.next();
    assert(first.has_value());
    assert(stream.emitted() == 1);

    bool threw = false;
    try { engine.paths(A, C, 0, 5); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { engine.paths(A, C, 3, 0); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    threw = false;
    try { engine.paths(A, "nobody", 3, 5); } catch (const NotFound&) { threw = true; }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_neighbors_depth() {
    std::cout << "Testing neighbor depth and distance..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(SAMPLE_CATALOG));
    auto snap = store.snapshot();

    auto one = neighbors(*snap, "n8n-nodes-base.set", 1);
    auto two = neighbors(*snap, "n8n-nodes-base.set", 2);
    assert(two.hits.size() >= one.hits.size());

    std::set<std::string> seen;
    for (const auto& h : two.hits) {
        assert(h.id != "n8n-nodes-base.set");
        assert(h.distance >= 1 && h.distance <= 2);
        assert(seen.insert(h.id).second);     // each node once, at minimum distance
    }
    for (const auto& h : one.hits) {
        for (const auto& h2 : two.hits) {
            if (h2.id == h.id) assert(h2.distance == 1);
        }
    }

    auto capped = neighbors(*snap, "n8n-nodes-base.set", 2, 1);
    assert(capped.hits.size() == 1);
    assert(capped.truncated);

    std::cout << "  PASS" << std::endl;
}

void test_explanation() {
    std::cout << "Testing explanations..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(SAMPLE_CATALOG));
    QueryEngine engine(store, std::make_shared<HashingEmbedder>());

    auto x1 = engine.explain("send notifications to my team", "n8n-nodes-base.slack");
    auto x2 = engine.explain("send notifications to my team", "n8n-nodes-base.slack");
    assert(x1.text() == x2.text());
    assert(x1.summary == "Recommended: Slack (messaging)");
    assert(std::find(x1.matched_terms.begin(), x1.matched_terms.end(), "send") !=
           x1.matched_terms.end());
    assert(!x1.matched_use_cases.empty());
    assert(x1.success_rate && *x1.success_rate == 0.92);
    assert(!x1.caveats.empty());

    // Connections only name edges that exist
    auto result = engine.hybrid("send notifications to my team", 12);
    auto snap = store.snapshot();
    for (const auto& hit : result.hits) {
        auto x = engine.explain("send notifications to my team", hit);
        assert(x.connections.size() <= hit.boosted_by.size());
        for (const auto& c : x.connections) {
            assert(snap->find(c.other) != nullptr);
            assert(!c.reasoning.empty());
        }
    }

    bool threw = false;
    try { engine.explain("anything", std::string("nobody")); } catch (const NotFound&) { threw = true; }
    assert(threw);

    // Alternatives: similar or same-category entities, best first
    auto alt = engine.alternatives("n8n-nodes-base.slack", 3);
    assert(!alt.hits.empty() && alt.hits.size() <= 3);
    for (size_t i = 0; i < alt.hits.size(); ++i) {
        const auto& h = alt.hits[i];
        assert(h.id != "n8n-nodes-base.slack");
        assert(h.basis == "similar-to" || h.category == "messaging");
        if (i > 0) assert(alt.hits[i - 1].score >= h.score);
    }
    assert(alt.explanation.summary == "Alternatives to Slack");
    assert(alt.explanation.options.size() == alt.hits.size());
    assert(alt.explanation.text() == engine.alternatives("n8n-nodes-base.slack", 3).explanation.text());
    threw = false;
    try { engine.alternatives("nobody", 3); } catch (const NotFound&) { threw = true; }
    assert(threw);

    // Paths: a four-hop chain with one authored hint
    StoreConfig config;
    config.dimension = 4;
    GraphStore chain(config);
    for (const char* id : {"a", "b", "c", "d", "e"}) chain.put_entity(make_entity(id, "other"));
    auto link = [&](const char* s, const char* t) {
        Relationship r;
        r.source = s;
        r.target = t;
        r.type = RelationType::CompatibleWith;
        r.strength = 0.9f;
        r.reasoning = std::string(s) + " feeds " + t;
        if (std::strcmp(s, "b") == 0) {
            r.hints.mapping = "x -> y";
            r.hints.pitfalls = {"watch the field types"};
        }
        chain.put_edge(r);
    };
    link("a", "b");
    link("b", "c");
    link("c", "d");
    link("d", "e");

    QueryEngine walker(chain, nullptr);
    auto found = walker.paths("a", "e", 5, 3);
    assert(found.paths.size() == 1);
    assert(found.explanations.size() == 1);
    const auto& px = found.explanations[0];
    assert(px.summary == "Integration path: a -> e");
    assert(px.steps.size() == 4);
    for (size_t i = 0; i < px.steps.size(); ++i) {
        assert(px.steps[i].from == found.paths[0].nodes[i]);
        assert(px.steps[i].to == found.paths[0].nodes[i + 1]);
    }
    assert(px.steps[1].reasoning == "b feeds c");
    assert(std::abs(px.confidence - found.paths[0].confidence) < 1e-12);
    auto has_caveat = [&](const std::string& needle) {
        for (const auto& c : px.caveats) {
            if (c.find(needle) != std::string::npos) return true;
        }
        return false;
    };
    assert(has_caveat("Long path"));                   // 4 hops
    assert(has_caveat("Moderate confidence"));         // 0.9^4 < 0.7
    assert(has_caveat("b -> c: watch the field types"));
    assert(px.next_steps[0] == "Use b, c, d as intermediate steps");
    assert(px.text().find("mapping: x -> y") != std::string::npos);
    assert(px.text() == explain_path(*chain.snapshot(), found.paths[0]).text());

    auto short_path = walker.paths("a", "b", 1, 1);
    assert(short_path.explanations[0].caveats.empty());

    GraphPath broken = found.paths[0];
    broken.edges.pop_back();
    threw = false;
    try { explain_path(*chain.snapshot(), broken); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    broken = found.paths[0];
    broken.nodes[2] = "gone";
    threw = false;
    try { explain_path(*chain.snapshot(), broken); } catch (const NotFound&) { threw = true; }
    assert(threw);

    // A similar-to edge makes a linked alternative, scored by its strength
    Relationship similar;
    similar.source = "e";
    similar.target = "a";
    similar.type = RelationType::SimilarTo;
    similar.strength = 0.8f;
    chain.put_edge(similar);
    auto linked = walker.alternatives("a", 5);
    assert(linked.hits.size() == 1);
    assert(linked.hits[0].id == "e");
    assert(linked.hits[0].basis == "similar-to");
    assert(linked.hits[0].score == static_cast<double>(0.8f));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Concurrency
// ═══════════════════════════════════════════════════════════════════════════

// Readers query while a writer keeps swapping between two catalogs. Every
// result must come wholly from the snapshot its meta names.
void test_concurrent_readers() {
    std::cout << "Testing concurrent readers during rebuilds..." << std::endl;

    GraphStore store;
    HashingEmbedder embedder;
    GraphBuilder(store, embedder, fast_builder()).build(catalog_from(SAMPLE_CATALOG));
    const uint64_t base = store.snapshot()->version();

    // Versions base, base+2, ... hold the sample catalog; odd offsets hold ABC
    auto prefix_for = [base](uint64_t version) -> std::string {
        return (version - base) % 2 == 1 ? "app." : "n8n-nodes-base.";
    };
    auto from_version = [&](const std::string& id, uint64_t version) {
        return id.rfind(prefix_for(version), 0) == 0;
    };

    QueryEngine engine(store, std::make_shared<HashingEmbedder>());
    std::atomic<bool> done{false};
    std::atomic<int> bad{0};
    std::atomic<int> answered{0};

    auto reader = [&](int seed) {
        const char* queries[] = {"send a chat message", "http request", "schedule workflow"};
        for (int i = 0; !done || i < 20; ++i) {
            auto hits = engine.hybrid(queries[(seed + i) % 3], 5);
            uint64_t v = hits.meta.snapshot_version;
            if (v < base || hits.hits.size() > 5) bad++;
            std::set<std::string> ids;
            for (size_t j = 0; j < hits.hits.size(); ++j) {
                const auto& h = hits.hits[j];
                if (!from_version(h.id, v) || !ids.insert(h.id).second) bad++;
                if (j > 0 && hits.hits[j - 1].score < h.score) bad++;
            }

            const std::string& id = (i % 2 == 0) ? A : std::string("n8n-nodes-base.set");
            try {
                auto near = engine.neighbors(id, 2);
                if (!from_version(id, near.meta.snapshot_version)) bad++;
                for (const auto& h : near.hits) {
                    if (!from_version(h.id, near.meta.snapshot_version)) bad++;
                }
            } catch (const NotFound&) {
                // id belongs to the other catalog in the live snapshot
            }

            try {
                auto found = engine.paths(B, C, 3, 3);
                if (found.paths.size() != found.explanations.size()) bad++;
                for (const auto& p : found.paths) {
                    for (const auto& n : p.nodes) {
                        if (!from_version(n, found.meta.snapshot_version)) bad++;
                    }
                }
            } catch (const NotFound&) {
                // the sample catalog has neither endpoint
            }
            answered++;
        }
    };

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) readers.emplace_back(reader, t);

    std::thread writer([&] {
        for (int round = 0; round < 6; ++round) {
            const char* catalog = (round % 2 == 0) ? ABC_CATALOG : SAMPLE_CATALOG;
            GraphBuilder(store, embedder, fast_builder()).build(catalog_from(catalog));
        }
        done = true;
    });

    writer.join();
    for (auto& t : readers) t.join();

    assert(bad == 0);
    assert(answered >= 4 * 20);
    assert(store.snapshot()->version() == base + 6);
    assert(store.contains("n8n-nodes-base.slack"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Export / import
// ═══════════════════════════════════════════════════════════════════════════

void test_export_import_round_trip() {
    std::cout << "Testing export/import round trip..." << std::endl;

    std::string path = temp_path("snapshot.json");
    GraphStore source;
    HashingEmbedder embedder;
    GraphBuilder(source, embedder, fast_builder()).build(catalog_from(SAMPLE_CATALOG));
    auto manifest = CatalogExporter(source).export_to(path);
    assert(manifest.entities == 12);
    assert(manifest.embedding_dimension == DEFAULT_EMBED_DIM);

    auto read = CatalogExporter::read_manifest(path);
    assert(read.content_hash == manifest.content_hash);

    GraphStore target;
    CatalogExporter(target).import_from(path);
    assert(target.stats().content_hash == source.stats().content_hash);
    assert(target.stats().edges == source.stats().edges);

    QueryEngine a(source, std::make_shared<HashingEmbedder>());
    QueryEngine b(target, std::make_shared<HashingEmbedder>());

    const char* words[] = {"send", "chat", "message", "http", "request", "schedule", "cron",
                           "database", "rows", "email", "filter", "condition", "spreadsheet",
                           "classify", "webhook", "transform", "field", "discord", "api",
                           "workflow"};
    auto ids = source.snapshot()->entities();
    for (int q = 0; q < 50; ++q) {
        std::string query = std::string(words[q % 20]) + " " + words[(q * 7 + 3) % 20];

        auto qv = embedder.embed(query);
        auto na = source.nearest_neighbors(qv, 5);
        auto nb = target.nearest_neighbors(qv, 5);
        assert(na.size() == nb.size());
        for (size_t i = 0; i < na.size(); ++i) {
            assert(na[i].id == nb[i].id);
            assert(na[i].score == nb[i].score);
        }

        auto ha = a.hybrid(query, 5);
        auto hb = b.hybrid(query, 5);
        assert(!ha.meta.degraded && !hb.meta.degraded);
        assert(ha.hits.size() == hb.hits.size());
        for (size_t i = 0; i < ha.hits.size(); ++i) {
            assert(ha.hits[i].id == hb.hits[i].id);
            assert(ha.hits[i].score == hb.hits[i].score);
        }

        const auto& id = ids[q % ids.size()].id;
        auto ga = a.neighbors(id, 2);
        auto gb = b.neighbors(id, 2);
        assert(ga.hits.size() == gb.hits.size());
        for (size_t i = 0; i < ga.hits.size(); ++i) {
            assert(ga.hits[i].id == gb.hits[i].id);
            assert(ga.hits[i].distance == gb.hits[i].distance);
        }
    }
    std::remove(path.c_str());

    // Unwritable destination: StorageError carrying the errno text
    std::string missing_dir = temp_path("no_such_dir") + "/snapshot.json";
    bool threw = false;
    try {
        CatalogExporter(source).export_to(missing_dir);
    } catch (const StorageError& e) {
        threw = true;
        assert(std::string(e.what()).find(std::strerror(ENOENT)) != std::string::npos);
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_import_rejects_tampering() {
    std::cout << "Testing import verification..." << std::endl;

    GraphStore source;
    HashingEmbedder embedder;
    GraphBuilder(source, embedder, fast_builder()).build(catalog_from(ABC_CATALOG));
    json doc = CatalogExporter(source).to_json();

    GraphStore target;
    GraphBuilder(target, embedder, fast_builder()).build(catalog_from(SAMPLE_CATALOG));
    uint64_t version = target.snapshot()->version();

    json tampered = doc;
    tampered["entities"][0]["label"] = "Something else";
    bool threw = false;
    try { CatalogExporter(target).import_json(tampered); } catch (const StorageCorruptionError&) { threw = true; }
    assert(threw);

    json short_doc = doc;
    short_doc["edges"].erase(0);
    threw = false;
    try { CatalogExporter(target).import_json(short_doc); } catch (const StorageCorruptionError&) { threw = true; }
    assert(threw);

    json wrong_dim = doc;
    wrong_dim["manifest"]["embedding_dimension"] = 16;
    threw = false;
    try { CatalogExporter(target).import_json(wrong_dim); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    // Failed imports leave the live graph alone
    assert(target.snapshot()->version() == version);
    assert(target.snapshot()->size() == 12);

    CatalogExporter(target).import_json(doc);
    assert(target.snapshot()->size() == 3);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

void test_config() {
    std::cout << "Testing configuration..." << std::endl;

    auto config = config_from_json(json::parse(R"({
      "store": {"dimension": 128},
      "embedder": {"timeout_ms": 500, "retry": {"max_attempts": 5}},
      "builder": {"fan_out_cap": 12, "similar_threshold": 0.9},
      "query": {"semantic_weight": 0.5, "keyword_weight": 0.3, "embed_attempts": 3,
                "embed_workers": 4},
      "mystery": true
    })"));
    assert(config.store.dimension == 128);
    assert(config.embedder.timeout.count() == 500);
    assert(config.query.embed_timeout.count() == 500);
    assert(config.builder.retry.max_attempts == 5);
    assert(config.builder.inference.fan_out_cap == 12);
    assert(config.builder.inference.similar_threshold == 0.9);
    assert(config.query.weights.semantic == 0.5);
    assert(config.query.weights.graph == 0.15);
    assert(config.query.embed_attempts == 3);
    assert(config.query.embed_workers == 4);

    bool threw = false;
    try {
        config_from_json(json::parse(R"({"query": {"semantic_weight": 0.8, "keyword_weight": 0.5}})"));
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try { config_from_json(json::parse(R"({"store": {"dimension": 0}})")); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    threw = false;
    try { config_from_json(json::parse(R"({"embedder": {"kind": "magic"}})")); } catch (const ValidationError&) { threw = true; }
    assert(threw);

    auto provider = make_embedder(config.embedder, 128);
    assert(provider->dimension() == 128);
    assert(provider->embed("hello there").size() == 128);

#ifndef SUTRA_WITH_ONNX
    EmbedderConfig onnx;
    onnx.kind = "onnx";
    threw = false;
    try { make_embedder(onnx, 384); } catch (const ValidationError&) { threw = true; }
    assert(threw);
#endif

    std::cout << "  PASS" << std::endl;
}

int main() {
    log::set_level(log::Level::Quiet);

    std::cout << "=== Sutra C++ Tests ===" << std::endl;
    std::cout << "DEFAULT_EMBED_DIM = " << DEFAULT_EMBED_DIM << std::endl;
    std::cout << std::endl;

    test_text_helpers();
    test_vector_cosine();
    test_errors_carry_codes();
    test_relation_names();

    test_hashing_embedder();
    test_caching_embedder_lru();
    test_retry_policy();
    test_deadline_embedder();

    test_store_validation();
    test_store_edges_insertion_order();
    test_nearest_neighbor_ties();
    test_store_metadata_and_usage();
    test_snapshot_isolation();
    test_store_persistence();
    test_corruption_detection();
    test_query_log();

    test_catalog_parsing();
    test_entity_extraction();
    test_pair_rules_and_triggers();
    test_fan_out_cap();

    test_abc_scenario();
    test_build_report_and_metadata();
    test_no_dangling_edges_fuzz();
    test_idempotent_rebuild();
    test_build_in_progress();
    test_build_failures();

    test_query_validation();
    test_semantic_determinism();
    test_timeout_degrades_to_keyword();
    test_query_embedding_retry();
    test_hybrid_monotonicity();
    test_graph_boost();
    test_paths();
    test_neighbors_depth();
    test_explanation();
    test_concurrent_readers();

    test_export_import_round_trip();
    test_import_rejects_tampering();

    test_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
