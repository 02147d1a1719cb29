#pragma once
// OnnxEmbedder: sentence-transformer embeddings through ONNX Runtime
//
// - WordPiece tokenization against the model's vocab.txt
// - Mean pooling weighted by the attention mask (or pooled model output)
// - L2 normalization so cosine equals dot product
// - Input/output names and hidden size discovered from the model
//
// Only compiled when SUTRA_WITH_ONNX is defined.

#include "embedding.hpp"
#include <onnxruntime/core/session/onnxruntime_cxx_api.h>
#include <array>
#include <cctype>
#include <fstream>
#include <numeric>

namespace sutra {

// Collapse control characters and runs of spaces, trim
inline std::string normalize_text(const std::string& text) {
    std::string collapsed;
    collapsed.reserve(text.size());
    bool last_space = true;
    for (unsigned char c : text) {
        bool space = c == ' ' || c == '\t' || c == '\n' || c == '\r';
        if (!space && c < 0x20) continue;
        if (space) {
            if (!last_space) collapsed += ' ';
            last_space = true;
        } else {
            collapsed += static_cast<char>(c);
            last_space = false;
        }
    }
    while (!collapsed.empty() && collapsed.back() == ' ') collapsed.pop_back();
    return collapsed;
}

class WordPieceTokenizer {
public:
    bool load(const std::string& vocab_path) {
        std::ifstream file(vocab_path);
        if (!file) return false;

        vocab_.clear();
        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
                line.pop_back();
            }
            if (!line.empty()) vocab_[line] = id;
            id++;
        }

        cls_id_ = get_id("[CLS]");
        sep_id_ = get_id("[SEP]");
        pad_id_ = std::max<int64_t>(0, get_id("[PAD]"));
        unk_id_ = get_id("[UNK]");
        return unk_id_ >= 0;
    }

    struct Encoding {
        std::vector<int64_t> input_ids;
        std::vector<int64_t> attention_mask;
        std::vector<int64_t> token_type_ids;
    };

    // Padded to max_length
    Encoding encode(const std::string& text, size_t max_length) const {
        std::vector<int64_t> tokens;
        if (cls_id_ >= 0) tokens.push_back(cls_id_);

        for (const auto& word : split_words(text)) {
            for (int64_t tok : tokenize_word(word)) {
                if (tokens.size() >= max_length - 1) break;
                tokens.push_back(tok);
            }
            if (tokens.size() >= max_length - 1) break;
        }
        if (sep_id_ >= 0) tokens.push_back(sep_id_);

        Encoding enc;
        enc.input_ids = tokens;
        enc.attention_mask.assign(tokens.size(), 1);
        enc.token_type_ids.assign(tokens.size(), 0);
        while (enc.input_ids.size() < max_length) {
            enc.input_ids.push_back(pad_id_);
            enc.attention_mask.push_back(0);
            enc.token_type_ids.push_back(0);
        }
        return enc;
    }

    int64_t get_id(const std::string& token) const {
        auto it = vocab_.find(token);
        return it != vocab_.end() ? it->second : -1;
    }

    size_t vocab_size() const { return vocab_.size(); }

private:
    // Lowercased words; punctuation and multi-byte characters stand alone
    std::vector<std::string> split_words(const std::string& text) const {
        std::vector<std::string> words;
        std::string current;
        auto flush = [&] {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        };

        for (size_t i = 0; i < text.size(); ) {
            unsigned char c = text[i];
            if (c < 0x80) {
                if (std::isspace(c)) {
                    flush();
                } else if (std::ispunct(c)) {
                    flush();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current += static_cast<char>(std::tolower(c));
                }
                i++;
            } else {
                size_t len = 1;
                if ((c & 0xE0) == 0xC0) len = 2;
                else if ((c & 0xF0) == 0xE0) len = 3;
                else if ((c & 0xF8) == 0xF0) len = 4;
                flush();
                words.push_back(text.substr(i, len));
                i += len;
            }
        }
        flush();
        return words;
    }

    // Greedy longest-match-first
    std::vector<int64_t> tokenize_word(const std::string& word) const {
        std::vector<int64_t> tokens;
        auto whole = vocab_.find(word);
        if (whole != vocab_.end()) {
            tokens.push_back(whole->second);
            return tokens;
        }

        size_t start = 0;
        while (start < word.length()) {
            size_t end = word.length();
            int64_t cur_id = -1;
            while (start < end) {
                std::string piece = word.substr(start, end - start);
                if (start > 0) piece = "##" + piece;
                auto it = vocab_.find(piece);
                if (it != vocab_.end()) {
                    cur_id = it->second;
                    break;
                }
                end--;
            }
            if (cur_id < 0) {
                tokens.push_back(unk_id_);
                start++;
            } else {
                tokens.push_back(cur_id);
                start = end;
            }
        }
        return tokens;
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_id_ = -1;
    int64_t sep_id_ = -1;
    int64_t pad_id_ = 0;
    int64_t unk_id_ = -1;
};

class OnnxEmbedder : public EmbeddingProvider {
public:
    struct Config {
        size_t max_seq_length = 128;
        size_t batch_size = 32;
        int num_threads = 0;          // 0 = runtime default
        std::string model_name = "all-MiniLM-L6-v2";
    };

    OnnxEmbedder() : env_(ORT_LOGGING_LEVEL_WARNING, "sutra") {}

    explicit OnnxEmbedder(Config config)
        : env_(ORT_LOGGING_LEVEL_WARNING, "sutra"), config_(std::move(config)) {}

    // Throws EmbeddingUnavailable when the model or vocabulary cannot load
    void load(const std::string& model_path, const std::string& vocab_path) {
        if (!tokenizer_.load(vocab_path)) {
            throw EmbeddingUnavailable("cannot load vocabulary from " + vocab_path);
        }
        try {
            Ort::SessionOptions opts;
            if (config_.num_threads > 0) opts.SetIntraOpNumThreads(config_.num_threads);
            opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), opts);
            introspect();
        } catch (const Ort::Exception& e) {
            throw EmbeddingUnavailable(std::string("ONNX error: ") + e.what());
        }
        ready_ = true;
        if (log::enabled()) {
            std::cerr << "[Embed] loaded " << model_path << " (dim " << hidden_dim_ << ")\n";
        }
    }

    Vector embed(const std::string& text) override {
        auto results = embed_batch({text});
        return std::move(results.front());
    }

    std::vector<Vector> embed_batch(const std::vector<std::string>& texts) override {
        if (!ready_) throw EmbeddingUnavailable("ONNX model not loaded");
        std::vector<Vector> results;
        results.reserve(texts.size());
        for (size_t start = 0; start < texts.size(); start += config_.batch_size) {
            size_t end = std::min(texts.size(), start + config_.batch_size);
            std::vector<std::string> chunk(texts.begin() + start, texts.begin() + end);
            try {
                for (auto& v : run(chunk)) results.push_back(std::move(v));
            } catch (const Ort::Exception& e) {
                throw EmbeddingUnavailable(std::string("inference error: ") + e.what());
            }
        }
        return results;
    }

    size_t dimension() const override { return static_cast<size_t>(hidden_dim_); }
    std::string model_id() const override { return "onnx/" + config_.model_name; }
    bool ready() const override { return ready_; }

private:
    void introspect() {
        Ort::AllocatorWithDefaultOptions allocator;

        input_names_.clear();
        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            input_names_.push_back(session_->GetInputNameAllocated(i, allocator).get());
        }

        output_names_.clear();
        for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
            output_names_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
            auto shape = session_->GetOutputTypeInfo(i).GetTensorTypeAndShapeInfo().GetShape();
            if (i == 0) {
                outputs_pooled_ = shape.size() == 2;
                hidden_dim_ = shape.back();
            }
        }

        input_cstr_.clear();
        for (const auto& n : input_names_) input_cstr_.push_back(n.c_str());
        output_cstr_.clear();
        for (const auto& n : output_names_) output_cstr_.push_back(n.c_str());
    }

    std::vector<Vector> run(const std::vector<std::string>& texts) {
        size_t batch = texts.size();
        size_t seq_len = config_.max_seq_length;

        std::vector<WordPieceTokenizer::Encoding> encodings;
        std::vector<int64_t> ids, mask, types;
        ids.reserve(batch * seq_len);
        mask.reserve(batch * seq_len);
        types.reserve(batch * seq_len);
        for (const auto& text : texts) {
            encodings.push_back(tokenizer_.encode(normalize_text(text), seq_len));
            const auto& enc = encodings.back();
            ids.insert(ids.end(), enc.input_ids.begin(), enc.input_ids.end());
            mask.insert(mask.end(), enc.attention_mask.begin(), enc.attention_mask.end());
            types.insert(types.end(), enc.token_type_ids.begin(), enc.token_type_ids.end());
        }

        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::array<int64_t, 2> shape = {static_cast<int64_t>(batch), static_cast<int64_t>(seq_len)};

        std::vector<Ort::Value> inputs;
        for (const auto& name : input_names_) {
            std::vector<int64_t>* source = &ids;
            if (name == "attention_mask") source = &mask;
            else if (name == "token_type_ids") source = &types;
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memory_info, source->data(), source->size(), shape.data(), shape.size()));
        }

        auto outputs = session_->Run(Ort::RunOptions{nullptr},
            input_cstr_.data(), inputs.data(), inputs.size(),
            output_cstr_.data(), output_cstr_.size());

        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();

        std::vector<Vector> results;
        for (size_t b = 0; b < batch; ++b) {
            Vector v(static_cast<size_t>(hidden_dim_));
            if (outputs_pooled_ || out_shape.size() == 2) {
                for (int64_t d = 0; d < hidden_dim_; ++d) v[d] = data[b * hidden_dim_ + d];
            } else {
                int64_t tokens = out_shape[1];
                const float* base = data + b * tokens * hidden_dim_;
                float count = 0.0f;
                for (int64_t t = 0; t < tokens; ++t) {
                    if (encodings[b].attention_mask[t] != 1) continue;
                    count += 1.0f;
                    for (int64_t d = 0; d < hidden_dim_; ++d) v[d] += base[t * hidden_dim_ + d];
                }
                if (count > 0.0f) {
                    for (float& x : v.data) x /= count;
                }
            }
            v.normalize();
            results.push_back(std::move(v));
        }
        return results;
    }

    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    WordPieceTokenizer tokenizer_;
    Config config_;

    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<const char*> input_cstr_;
    std::vector<const char*> output_cstr_;
    int64_t hidden_dim_ = 384;
    bool outputs_pooled_ = false;
    bool ready_ = false;
};

} // namespace sutra
