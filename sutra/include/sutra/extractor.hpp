#pragma once
// EntityExtractor: catalog record → enriched Entity
//
// Fixed keyword and phrase tables, no generative model. Every derived
// field is a deterministic function of the record and ExtractionRules:
//   category        explicit (if in the closed set) or best keyword match
//   keywords        label, salient description words, id suffix
//   use cases       table lookup, padded with templates to 2..6 entries
//   prerequisites   rule triggers on id/label
//   tips, pitfalls  table lookup with generic fallbacks
//   presets         common configuration snippets
//   complexity      description length; learning curve from wording
// Observed metrics are carried over when present and otherwise left
// absent (unknown), never defaulted.

#include "catalog.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "schema.hpp"
#include "text.hpp"
#include <cstdint>
#include <iostream>
#include <set>

namespace sutra {

struct CategoryRule {
    std::string slug;
    std::vector<std::string> keywords;
    std::vector<std::string> aliases;   // accepted spellings of explicit categories
};

// Lines attached to entities whose key (id suffix or label word) contains `key`
struct PhraseRule {
    std::string key;
    std::vector<std::string> lines;
};

// Lines attached when any trigger appears in the id or label
struct PrerequisiteRule {
    std::vector<std::string> triggers;
    std::vector<std::string> lines;
};

struct ExtractionRules {
    std::vector<CategoryRule> categories;
    std::string fallback_category = "other";
    std::vector<PhraseRule> use_cases;
    std::vector<PhraseRule> tips;
    std::vector<PhraseRule> failure_modes;
    std::vector<PhraseRule> presets;
    std::vector<PrerequisiteRule> prerequisites;

    size_t min_use_cases = 2;
    size_t max_use_cases = 6;
    size_t max_keywords = 15;
    size_t max_description_words = 10;
    size_t max_prerequisites = 4;
    size_t max_tips = 3;
    size_t max_pitfalls = 3;

    bool has_category(const std::string& slug) const {
        if (slug == fallback_category) return true;
        for (const auto& c : categories) {
            if (c.slug == slug) return true;
        }
        return false;
    }

    // Map an explicit category (slug, alias or display name) into the set
    std::optional<std::string> resolve_category(const std::string& raw) const {
        std::string slug = slugify(raw);
        if (slug.empty()) return std::nullopt;
        if (slug == fallback_category) return slug;
        for (const auto& c : categories) {
            if (c.slug == slug) return c.slug;
            for (const auto& alias : c.aliases) {
                if (alias == slug) return c.slug;
            }
        }
        return std::nullopt;
    }

    static ExtractionRules defaults();
};

inline ExtractionRules ExtractionRules::defaults() {
    ExtractionRules r;
    r.categories = {
        {"messaging", {"slack", "email", "discord", "telegram", "teams", "chat", "message",
                       "messages", "notification", "notify", "sms", "mattermost"},
                      {"communication", "messages"}},
        {"trigger", {"schedule", "cron", "interval", "trigger", "webhook", "timer", "poll"},
                    {"triggers"}},
        {"http", {"http", "rest", "api", "request", "requests", "oauth", "endpoint", "graphql"},
                 {"api", "apis"}},
        {"database", {"postgres", "mysql", "mongodb", "redis", "sql", "database", "sqlite",
                      "table", "rows"},
                     {"databases", "db"}},
        {"data", {"set", "merge", "sort", "filter", "extract", "transform", "function",
                  "json", "csv", "aggregate", "format", "fields"},
                 {"data-transformation", "transform"}},
        {"file", {"file", "files", "upload", "download", "ftp", "sftp", "pdf", "spreadsheet"},
                 {"file-operations", "files"}},
        {"cloud", {"aws", "azure", "google", "dropbox", "gdrive", "s3", "bucket"},
                  {"cloud-services"}},
        {"flow-control", {"switch", "loop", "condition", "wait", "if", "branch", "router",
                          "error", "retry"},
                         {"workflow-control", "flow", "control"}},
        {"ai", {"openai", "huggingface", "nlp", "ml", "ai", "llm", "gpt", "embedding",
                "classify", "summarize"},
               {"ai-ml", "machine-learning"}},
        {"social", {"twitter", "facebook", "linkedin", "instagram", "youtube"},
                   {"social-media"}},
        {"crm", {"salesforce", "crm", "hubspot", "pipedrive", "customer", "lead", "leads"}, {}},
        {"analytics", {"analytics", "segment", "mixpanel", "amplitude", "tracking", "metrics"},
                      {}},
    };

    r.use_cases = {
        {"slack", {"Send notifications to team", "Alert on workflow errors", "Post daily reports",
                   "Share metrics and dashboards", "Update team channels"}},
        {"http", {"Fetch data from external APIs", "Make REST API calls",
                  "Poll external services", "Integrate with third-party systems",
                  "Send data to webhooks"}},
        {"schedule", {"Run workflows on schedule", "Execute periodic tasks",
                      "Trigger workflows daily/hourly", "Set up recurring automation",
                      "Schedule background jobs"}},
        {"database", {"Store workflow data", "Query historical information",
                      "Log execution results", "Fetch configuration data", "Archive old data"}},
        {"email", {"Send email notifications", "Generate email reports", "Email team updates",
                   "Send alerts via email", "Deliver automation results"}},
        {"webhook", {"Receive events from external services", "Start workflows from HTTP callbacks",
                     "Accept form submissions"}},
    };

    r.tips = {
        {"slack", {"Use blocks for rich formatting", "Set channel OR channel_id, not both",
                   "Test with @channel first before production",
                   "Slack has rate limits - batch messages if sending many"}},
        {"http", {"Check authentication method (basic, oauth, api key)",
                  "Set correct Content-Type header", "Test endpoint before using in workflow",
                  "Handle rate limiting with appropriate delays"}},
        {"set", {"Use dot notation to access nested properties",
                 "Combine multiple fields in one Set node when possible",
                 "Remember to escape special characters in JSON"}},
        {"schedule", {"Cron format: minute hour day month dayofweek",
                      "Use simple intervals for testing", "Remember timezone settings"}},
    };

    r.failure_modes = {
        {"slack", {"Channel not found or not in workspace",
                   "Authentication token invalid or expired",
                   "Message format invalid (missing blocks, etc)", "Rate limited by Slack API"}},
        {"http", {"SSL/TLS certificate validation failed", "Timeout waiting for response",
                  "Authentication credentials wrong", "Rate limited by API"}},
        {"set", {"Trying to access non-existent properties", "Type mismatch (string vs number)",
                 "Malformed JSON syntax"}},
    };

    r.presets = {
        {"slack", {"notification: channel=#alerts, text=Notification from workflow",
                   "report: channel=#reports, text=Daily Report"}},
        {"http", {"get_request: method=GET, url=https://api.example.com/data",
                  "post_request: method=POST, url=https://api.example.com/data, body_type=JSON"}},
        {"schedule", {"daily_9am: mode=Cron, cron=0 9 * * *",
                      "every_hour: mode=Every Hour, interval=60"}},
    };

    r.prerequisites = {
        {{"slack", "email", "discord", "teams", "github", "stripe"},
         {"Must authenticate with service", "Need valid API credentials"}},
        {{"http", "api"}, {"Understand REST API concepts", "May need authentication token"}},
        {{"database", "sql", "postgres", "mysql"},
         {"Understand database structure", "Have database credentials"}},
        {{"schedule", "cron"}, {"Understand cron syntax or intervals", "Know your timezone"}},
    };
    return r;
}

class EntityExtractor {
public:
    explicit EntityExtractor(ExtractionRules rules = ExtractionRules::defaults())
        : rules_(std::move(rules)) {}

    // Throws ValidationError when the record cannot become an entity
    Entity extract(const CatalogRecord& record) const {
        if (record.id.empty()) throw ValidationError("record has no id");

        Entity e;
        e.id = record.id;
        e.label = record.label.empty() ? record.id : record.label;
        e.description = record.description;
        e.category = categorize(record);
        e.keywords = extract_keywords(e);

        auto& m = e.metadata;
        m[meta::USE_CASES] = use_cases(e);
        auto prereqs = prerequisites(e);
        if (!prereqs.empty()) m[meta::PREREQUISITES] = prereqs;
        m[meta::TIPS] = tips(e);
        m[meta::PITFALLS] = failure_modes(e);
        auto presets = lookup(rules_.presets, e, SIZE_MAX);
        if (!presets.empty()) m[meta::PRESETS] = presets;
        if (!record.patterns.empty()) m[meta::PATTERNS] = record.patterns;
        m[meta::COMPLEXITY] = complexity(e.description);
        m[meta::LEARNING_CURVE] = learning_curve(e.description);

        if (record.success_rate) m[meta::SUCCESS_RATE] = *record.success_rate;
        if (record.usage_count) m[meta::USAGE_COUNT] = static_cast<double>(*record.usage_count);
        if (record.rating) m[meta::RATING] = *record.rating;
        return e;
    }

    const ExtractionRules& rules() const { return rules_; }

    // Keyword-table category for free text; fallback when nothing matches
    std::string categorize_text(const std::string& text) const {
        auto tokens = tokenize(text);
        std::set<std::string> words(tokens.begin(), tokens.end());

        const CategoryRule* best = nullptr;
        size_t best_hits = 0;
        for (const auto& rule : rules_.categories) {
            size_t hits = 0;
            for (const auto& kw : rule.keywords) {
                if (words.count(kw)) hits++;
            }
            if (hits > best_hits) {
                best = &rule;
                best_hits = hits;
            }
        }
        return best ? best->slug : rules_.fallback_category;
    }

private:
    std::string categorize(const CatalogRecord& record) const {
        // id suffix and label weigh double: they name the block
        std::string key_text = node_key(record.id) + " " + record.label;
        std::string text = key_text + " " + key_text + " " + record.description;

        if (record.category) {
            if (auto slug = rules_.resolve_category(*record.category)) return *slug;
            std::string derived = categorize_text(text);
            if (log::enabled()) {
                std::cerr << "[Extractor] " << record.id << ": unknown category '"
                          << *record.category << "', using '" << derived << "'\n";
            }
            return derived;
        }
        return categorize_text(text);
    }

    // True when `key` names this entity: id suffix contains it, or it is a
    // label word
    static bool matches(const std::string& key, const Entity& e) {
        if (node_key(e.id).find(key) != std::string::npos) return true;
        for (const auto& word : tokenize(e.label)) {
            if (word == key) return true;
        }
        return false;
    }

    static std::vector<std::string> lookup(const std::vector<PhraseRule>& table,
                                           const Entity& e, size_t limit) {
        for (const auto& rule : table) {
            if (matches(rule.key, e)) {
                std::vector<std::string> lines = rule.lines;
                if (lines.size() > limit) lines.resize(limit);
                return lines;
            }
        }
        return {};
    }

    std::vector<std::string> extract_keywords(const Entity& e) const {
        std::set<std::string> keywords;
        keywords.insert(lowercase(e.label));

        size_t taken = 0;
        for (const auto& word : tokenize(e.description)) {
            if (taken >= rules_.max_description_words) break;
            if (word.size() <= 3 || stopwords().count(word)) continue;
            if (keywords.insert(word).second) taken++;
        }
        keywords.insert(node_key(e.id));

        std::vector<std::string> result(keywords.begin(), keywords.end());
        if (result.size() > rules_.max_keywords) result.resize(rules_.max_keywords);
        return result;
    }

    std::vector<std::string> use_cases(const Entity& e) const {
        std::vector<std::string> cases = lookup(rules_.use_cases, e, rules_.max_use_cases);

        std::vector<std::string> generated;
        std::string sentence = first_sentence(e.description);
        if (!sentence.empty()) {
            std::string lowered = sentence;
            lowered[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(lowered[0])));
            generated.push_back("Use for " + lowered);
        }
        generated.push_back("Integrate with workflows needing " + e.label);
        generated.push_back("Handle " + e.category + " tasks");
        generated.push_back("Automate " + e.label + " steps");

        for (const auto& g : generated) {
            if (cases.size() >= rules_.min_use_cases) break;
            if (std::find(cases.begin(), cases.end(), g) == cases.end()) cases.push_back(g);
        }
        return cases;
    }

    std::vector<std::string> prerequisites(const Entity& e) const {
        std::string key = lowercase(e.id + " " + e.label);
        std::vector<std::string> result;
        for (const auto& rule : rules_.prerequisites) {
            bool hit = false;
            for (const auto& t : rule.triggers) {
                if (key.find(t) != std::string::npos) { hit = true; break; }
            }
            if (!hit) continue;
            for (const auto& line : rule.lines) {
                if (result.size() >= rules_.max_prerequisites) return result;
                result.push_back(line);
            }
        }
        return result;
    }

    std::vector<std::string> tips(const Entity& e) const {
        auto found = lookup(rules_.tips, e, rules_.max_tips);
        if (!found.empty()) return found;
        std::string key = node_key(e.id);
        return {
            "Test " + key + " configuration before production use",
            "Check " + key + " documentation for all options",
            "Monitor " + key + " logs for debugging"
        };
    }

    std::vector<std::string> failure_modes(const Entity& e) const {
        auto found = lookup(rules_.failure_modes, e, rules_.max_pitfalls);
        if (!found.empty()) return found;
        return {
            "Configuration missing required fields",
            "Upstream data format unexpected",
            "External service unavailable"
        };
    }

    static std::string complexity(const std::string& description) {
        if (description.empty()) return "medium";
        size_t words = word_count(description);
        if (words < 20) return "simple";
        if (words < 50) return "medium";
        return "complex";
    }

    static std::string learning_curve(const std::string& description) {
        if (description.empty()) return "medium";
        auto tokens = tokenize(description);
        std::set<std::string> words(tokens.begin(), tokens.end());
        for (const char* kw : {"send", "get", "fetch", "trigger", "simple"}) {
            if (words.count(kw)) return "easy";
        }
        for (const char* kw : {"condition", "advanced", "complex", "transform", "aggregate"}) {
            if (words.count(kw)) return "hard";
        }
        return "medium";
    }

    ExtractionRules rules_;
};

} // namespace sutra
