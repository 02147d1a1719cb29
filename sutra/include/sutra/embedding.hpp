#pragma once
// Embedding: text → fixed-length dense vector
//
// EmbeddingProvider is the swappable interface. Providers throw
// EmbeddingUnavailable when they cannot produce a vector.
//
//   HashingEmbedder   deterministic feature hashing, no model files
//   CachingEmbedder   LRU memo in front of any provider
//   DeadlineEmbedder  bounds each call by a timeout
//   with_retry()      bounded retry with exponential backoff

#include "errors.hpp"
#include "log.hpp"
#include "text.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sutra {

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual Vector embed(const std::string& text) = 0;

    // Batch form; providers that can batch natively override this
    virtual std::vector<Vector> embed_batch(const std::vector<std::string>& texts) {
        std::vector<Vector> results;
        results.reserve(texts.size());
        for (const auto& text : texts) {
            results.push_back(embed(text));
        }
        return results;
    }

    virtual size_t dimension() const = 0;

    // Identifies the model version that produced a vector
    virtual std::string model_id() const = 0;

    virtual bool ready() const = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// HashingEmbedder: signed feature hashing of words and character trigrams
// ═══════════════════════════════════════════════════════════════════════════

class HashingEmbedder : public EmbeddingProvider {
public:
    explicit HashingEmbedder(size_t dim = DEFAULT_EMBED_DIM) : dim_(dim) {}

    Vector embed(const std::string& text) override {
        Vector v(dim_);
        for (const auto& token : tokenize(text)) {
            if (stopwords().count(token)) continue;
            add_feature(v, "w:" + token, 1.0f);

            std::string padded = "#" + token + "#";
            for (size_t i = 0; i + 3 <= padded.size(); ++i) {
                add_feature(v, "c:" + padded.substr(i, 3), 0.35f);
            }
        }
        v.normalize();
        return v;
    }

    size_t dimension() const override { return dim_; }
    std::string model_id() const override { return "sutra-hash-v1/" + std::to_string(dim_); }
    bool ready() const override { return true; }

private:
    // FNV-1a 64
    static uint64_t hash(const std::string& s) {
        uint64_t h = 1469598103934665603ULL;
        for (unsigned char c : s) {
            h ^= c;
            h *= 1099511628211ULL;
        }
        return h;
    }

    void add_feature(Vector& v, const std::string& feature, float weight) const {
        uint64_t h = hash(feature);
        size_t bucket = static_cast<size_t>(h % dim_);
        float sign = ((h >> 63) & 1) ? -1.0f : 1.0f;
        v[bucket] += sign * weight;
    }

    size_t dim_;
};

// ═══════════════════════════════════════════════════════════════════════════
// CachingEmbedder: least-recently-used memo
// ═══════════════════════════════════════════════════════════════════════════

class CachingEmbedder : public EmbeddingProvider {
public:
    CachingEmbedder(std::shared_ptr<EmbeddingProvider> inner, size_t capacity = 10000)
        : inner_(std::move(inner)), capacity_(capacity) {}

    Vector embed(const std::string& text) override {
        if (auto hit = recall(text)) return *hit;
        Vector v = inner_->embed(text);
        remember(text, v);
        return v;
    }

    std::vector<Vector> embed_batch(const std::vector<std::string>& texts) override {
        std::vector<Vector> results(texts.size());
        std::vector<std::string> to_compute;
        std::vector<size_t> compute_indices;

        for (size_t i = 0; i < texts.size(); ++i) {
            if (auto hit = recall(texts[i])) {
                results[i] = std::move(*hit);
            } else {
                to_compute.push_back(texts[i]);
                compute_indices.push_back(i);
            }
        }

        if (!to_compute.empty()) {
            auto computed = inner_->embed_batch(to_compute);
            if (computed.size() != to_compute.size()) {
                throw EmbeddingUnavailable("provider returned " + std::to_string(computed.size()) +
                                           " vectors for " + std::to_string(to_compute.size()) +
                                           " texts");
            }
            for (size_t i = 0; i < computed.size(); ++i) {
                remember(to_compute[i], computed[i]);
                results[compute_indices[i]] = std::move(computed[i]);
            }
        }
        return results;
    }

    size_t dimension() const override { return inner_->dimension(); }
    std::string model_id() const override { return inner_->model_id(); }
    bool ready() const override { return inner_->ready(); }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

private:
    std::optional<Vector> recall(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(text);
        if (it == index_.end()) return std::nullopt;
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }

    void remember(const std::string& text, const Vector& v) {
        if (capacity_ == 0) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(text);
        if (it != index_.end()) {
            it->second->second = v;
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        if (index_.size() >= capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
        }
        order_.emplace_front(text, v);
        index_[text] = order_.begin();
    }

    std::shared_ptr<EmbeddingProvider> inner_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::list<std::pair<std::string, Vector>> order_;  // most recent first
    std::unordered_map<std::string, std::list<std::pair<std::string, Vector>>::iterator> index_;
};

// ═══════════════════════════════════════════════════════════════════════════
// DeadlineEmbedder: bounded wait on the inner provider
// ═══════════════════════════════════════════════════════════════════════════

// A fixed pool of worker threads, owned by the embedder and joined in its
// destructor, runs the inner calls. The caller waits up to the timeout and
// then gets EmbeddingTimeout while the worker finishes in the background.
// When every worker has been busy for longer than the timeout, or the queue
// is full, new calls fail at once instead of piling up behind a hung
// provider. The destructor waits for the call in flight to return.
class DeadlineEmbedder : public EmbeddingProvider {
public:
    DeadlineEmbedder(std::shared_ptr<EmbeddingProvider> inner,
                     std::chrono::milliseconds timeout,
                     size_t workers = 1, size_t max_queued = 16)
        : inner_(std::move(inner)), timeout_(timeout),
          max_queued_(std::max<size_t>(1, max_queued)),
          busy_since_(std::max<size_t>(1, workers))
    {
        for (size_t i = 0; i < busy_since_.size(); ++i) {
            workers_.emplace_back([this, i] { work(i); });
        }
    }

    ~DeadlineEmbedder() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_) t.join();
    }

    DeadlineEmbedder(const DeadlineEmbedder&) = delete;
    DeadlineEmbedder& operator=(const DeadlineEmbedder&) = delete;

    Vector embed(const std::string& text) override {
        return embed_within(text, timeout_);
    }

    Vector embed_within(const std::string& text, std::chrono::milliseconds timeout) {
        auto job = std::make_shared<Job>();
        auto inner = inner_;
        job->task = std::packaged_task<Vector()>([inner, text] { return inner->embed(text); });
        auto result = job->task.get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stalled()) {
                throw EmbeddingTimeout("embedding provider stalled on an earlier call");
            }
            if (queue_.size() >= max_queued_) {
                throw EmbeddingTimeout("embedding queue full (" + std::to_string(queue_.size()) +
                                       " waiting)");
            }
            queue_.push_back(job);
        }
        cv_.notify_one();

        if (result.wait_for(timeout) != std::future_status::ready) {
            job->abandoned = true;
            throw EmbeddingTimeout("embedding timed out after " +
                                   std::to_string(timeout.count()) + " ms");
        }
        try {
            return result.get();
        } catch (const EmbeddingUnavailable&) {
            throw;
        } catch (const std::exception& e) {
            throw EmbeddingUnavailable(std::string("embedding failed: ") + e.what());
        }
    }

    size_t dimension() const override { return inner_->dimension(); }
    std::string model_id() const override { return inner_->model_id(); }
    bool ready() const override { return inner_->ready(); }

    std::chrono::milliseconds timeout() const { return timeout_; }
    size_t workers() const { return workers_.size(); }

private:
    using Clock = std::chrono::steady_clock;

    struct Job {
        std::packaged_task<Vector()> task;
        std::atomic<bool> abandoned{false};
    };

    // Caller holds mutex_
    bool stalled() const {
        auto limit = Clock::now() - timeout_;
        for (const auto& since : busy_since_) {
            if (!since || *since > limit) return false;
        }
        return true;
    }

    void work(size_t index) {
        for (;;) {
            std::shared_ptr<Job> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) return;   // stopping and drained
                job = std::move(queue_.front());
                queue_.pop_front();
                if (job->abandoned) continue;
                busy_since_[index] = Clock::now();
            }
            job->task();   // exceptions land in the future
            std::lock_guard<std::mutex> lock(mutex_);
            busy_since_[index].reset();
        }
    }

    std::shared_ptr<EmbeddingProvider> inner_;
    std::chrono::milliseconds timeout_;
    size_t max_queued_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<Job>> queue_;
    std::vector<std::optional<Clock::time_point>> busy_since_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Retry with bounded exponential backoff
// ═══════════════════════════════════════════════════════════════════════════

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{50};
    double multiplier = 2.0;
};

// Calls fn until it succeeds or attempts run out. Only EmbeddingUnavailable
// and provider std::exceptions are retried; the last failure is rethrown as
// EmbeddingUnavailable.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, Fn&& fn) -> decltype(fn()) {
    auto backoff = policy.initial_backoff;
    int attempts = std::max(1, policy.max_attempts);
    std::string last_error;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            return fn();
        } catch (const std::exception& e) {
            last_error = e.what();
            if (log::debug()) {
                std::cerr << "[Embed] attempt " << attempt << "/" << attempts
                          << " failed: " << last_error << "\n";
            }
        }
        if (attempt < attempts) {
            std::this_thread::sleep_for(backoff);
            backoff = std::chrono::milliseconds(
                static_cast<int64_t>(backoff.count() * policy.multiplier));
        }
    }
    throw EmbeddingUnavailable("gave up after " + std::to_string(attempts) +
                               " attempts: " + last_error);
}

} // namespace sutra
