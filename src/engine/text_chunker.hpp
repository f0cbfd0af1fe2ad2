#pragma once

#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "tokenizer.hpp"
#include "lectern/types.hpp"

namespace lectern::engine {

    /**
     * @brief Splits extracted text into ordered chunks under a byte and token budget.
     *
     * Strategy dispatch follows the content type (code, markdown, otherwise the configured
     * strategy) unless an override is given. Every chunk a strategy emits is re-measured with
     * the token counter and re-split with the fixed-size strategy until it fits.
     */
    class TextChunker {
    public:
        TextChunker(ChunkConfig config, const TokenCounter& counter);

        /**
         * @brief Chunks text. Indices start at first_index and are contiguous.
         * Empty or whitespace-only input yields no chunks.
         * @throws ChunkingError if the token counter fails, or if a piece cannot meet the
         * token budget and the oversize policy is Fail.
         */
        std::vector<TextChunk> chunk_text(const std::string& text,
                                          const std::string& content_type = "text",
                                          size_t first_index = 0,
                                          std::optional<ChunkStrategy> strategy = std::nullopt) const;

        ChunkStrategy select_strategy(const std::string& content_type, std::optional<ChunkStrategy> override_strategy = std::nullopt) const;

        const ChunkConfig& config() const { return m_config; }

    private:
        struct Piece {
            std::string text;
            std::optional<std::string> header;
            std::optional<int> header_level;
            bool undersized = false;
        };

        struct Span {
            size_t start = 0;
            size_t end = 0;
            bool unsplittable = false;
        };

        ChunkConfig m_config;
        const TokenCounter& m_counter;

        size_t count_tokens(const std::string& text) const;
        size_t count_tokens(const std::string& text, size_t start, size_t end) const;

        std::vector<Piece> chunk_fixed_size(const std::string& text) const;
        std::vector<Piece> chunk_sentences(const std::string& text) const;
        std::vector<Piece> chunk_paragraphs(const std::string& text) const;
        std::vector<Piece> chunk_code(const std::string& text) const;
        std::vector<Piece> chunk_markdown(const std::string& text) const;

        /**
         * @brief Greedy accumulation shared by the sentence and paragraph strategies.
         */
        std::vector<Piece> accumulate(const std::vector<std::string>& units, const std::string& separator) const;

        /**
         * @brief Token-safe fixed-size windows over text, with overlap.
         */
        std::vector<Span> split_fixed(const std::string& text) const;
        size_t token_safe_end(const std::string& text, size_t pos) const;
        size_t best_boundary(const std::string& text, size_t pos, size_t end) const;
        size_t overlap_start(const std::string& text, size_t pos, size_t cut) const;

        /**
         * @brief Enforces both budgets on one piece, re-splitting up to max_split_depth.
         */
        void enforce_budget(const Piece& piece, size_t depth, std::vector<TextChunk>& out, ChunkStrategy strategy) const;

        void handle_unsplittable(const std::string& text, size_t tokens) const;

        std::string overlap_tail(const std::string& text) const;
    };

}
