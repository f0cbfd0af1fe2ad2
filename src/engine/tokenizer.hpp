#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <unordered_map>

namespace lectern::engine {

    /**
     * @brief Exact token counting used to enforce chunk token budgets.
     * Implementations must be safe to call from several ingestion workers at once.
     */
    class TokenCounter {
    public:
        virtual ~TokenCounter() = default;

        /**
         * @brief Returns the number of tokenizer units in text, without special tokens.
         */
        virtual size_t count(const std::string& text) const = 0;
    };

    /**
     * @brief BERT-style WordPiece tokenizer over a vocab.txt file.
     * Shared by the ONNX embedder (encode) and the chunker (count).
     */
    class Tokenizer : public TokenCounter {
    public:
        explicit Tokenizer(const std::string& vocab_path);

        /**
         * @brief Encodes text as [CLS] pieces... [SEP], truncated to max_length ids.
         */
        std::vector<int64_t> encode(const std::string& text, size_t max_length = 512) const;

        size_t count(const std::string& text) const override;

        size_t vocab_size() const { return m_vocab.size(); }

    private:
        std::unordered_map<std::string, int64_t> m_vocab;

        void load_vocab(const std::string& path);

        /**
         * @brief Lowercases, splits on whitespace and punctuation, then applies WordPiece.
         * Calls sink for every piece id; stops early when sink returns false.
         */
        template <typename Sink>
        void tokenize(const std::string& text, Sink&& sink) const;

        void word_pieces(const std::string& word, std::vector<int64_t>& out) const;
    };

    /**
     * @brief Approximate counter used when no vocabulary is configured: ceil(bytes / chars_per_token).
     */
    class CharRatioTokenCounter : public TokenCounter {
    public:
        explicit CharRatioTokenCounter(double chars_per_token = 4.0);

        size_t count(const std::string& text) const override;

    private:
        double m_chars_per_token;
    };

    std::unique_ptr<TokenCounter> create_token_counter(const std::string& vocab_path, double chars_per_token);

}
