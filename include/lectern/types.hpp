#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lectern::engine {

    enum class DocumentStatus {
        Pending,
        Processing,
        Processed,
        Failed
    };

    const char* to_string(DocumentStatus status);
    DocumentStatus status_from_string(const std::string& value);

    enum class DistanceMetric {
        L2,
        Cosine
    };

    const char* to_string(DistanceMetric metric);
    DistanceMetric metric_from_string(const std::string& value);

    enum class ChunkStrategy {
        FixedSize,
        SentenceBased,
        ParagraphBased,
        CodeBased,
        MarkdownBased
    };

    const char* to_string(ChunkStrategy strategy);
    ChunkStrategy strategy_from_string(const std::string& value);

    /**
     * @brief A source file as observed on disk, before it is stored.
     */
    struct DocumentInfo {
        std::filesystem::path path;
        std::string filename;
        std::string hash;
        std::uintmax_t size = 0;
        std::string mime_type;
        std::string content_type;
        std::string extension;
        int64_t last_modified = 0; // Unix ms
    };

    /**
     * @brief A document row as persisted by the store.
     */
    struct DocumentRecord {
        int64_t id = 0;
        DocumentInfo info;
        DocumentStatus status = DocumentStatus::Pending;
        int64_t chunk_count = 0;
        int64_t created_at = 0;
        int64_t updated_at = 0;
        nlohmann::json metadata = nlohmann::json::object();
    };

    /**
     * @brief A byte range of an oversized source file, materialized as a temp file.
     * Only valid while the owning SegmentSet is alive.
     */
    struct FileSegment {
        std::string id;
        size_t index = 0;
        std::filesystem::path path;
        std::uintmax_t start_byte = 0;
        std::uintmax_t end_byte = 0;
        std::uintmax_t size = 0;
        std::optional<size_t> line_start;
        std::optional<size_t> line_end;
        std::optional<std::string> section_title;
        std::optional<int> header_level;
        bool sub_chunk = false;
        size_t sub_index = 0;

        /**
         * @brief Section and position metadata copied onto every text chunk cut from this segment.
         */
        nlohmann::json metadata() const;
    };

    /**
     * @brief An immutable slice of extracted text.
     * Build through make() so the hash and counts are computed once.
     */
    struct TextChunk {
        size_t index = 0;
        std::string content;
        std::string content_hash;
        size_t char_count = 0;
        size_t token_count = 0;
        ChunkStrategy strategy = ChunkStrategy::SentenceBased;
        std::optional<std::string> header;
        std::optional<int> header_level;
        nlohmann::json metadata = nlohmann::json::object();

        static TextChunk make(size_t index, std::string content, size_t token_count,
                              ChunkStrategy strategy, nlohmann::json metadata = nlohmann::json::object(),
                              std::optional<std::string> header = std::nullopt,
                              std::optional<int> header_level = std::nullopt);

        /**
         * @brief Returns a copy carrying a new ordinal.
         */
        TextChunk with_index(size_t new_index) const;

        /**
         * @brief Returns a copy with extra metadata merged over the existing keys.
         */
        TextChunk with_metadata(const nlohmann::json& extra) const;
    };

    struct ChunkRecord {
        TextChunk chunk;
        std::vector<float> embedding;
    };

    /**
     * @brief A persisted chunk joined with the document it belongs to.
     */
    struct StoredChunk {
        int64_t id = 0;
        int64_t document_id = 0;
        size_t chunk_index = 0;
        std::string content;
        nlohmann::json metadata = nlohmann::json::object();
        int64_t created_at = 0;
        std::string filename;
        std::string filepath;
        std::string content_type;
        std::vector<float> embedding;
    };

    struct SearchFilters {
        std::vector<int64_t> document_ids;
        std::vector<std::string> content_types;
        std::optional<std::pair<int64_t, int64_t>> date_range; // Unix ms, inclusive

        bool empty() const {
            return document_ids.empty() && content_types.empty() && !date_range;
        }
    };

    struct SearchQuery {
        std::string text;
        size_t max_results = 10;
        SearchFilters filters;
        DistanceMetric metric = DistanceMetric::L2;
        std::optional<double> min_similarity;
    };

    struct ScoredChunk {
        StoredChunk chunk;
        double distance = 0.0;
    };

    struct DocumentMatch {
        int64_t chunk_id = 0;
        int64_t document_id = 0;
        std::string content;
        double similarity_score = 0.0;
        size_t chunk_index = 0;
        std::string filename;
        std::string filepath;
        std::string content_type;
        nlohmann::json metadata = nlohmann::json::object();
        int64_t created_at = 0;
    };

    struct SearchResult {
        std::string query;
        std::vector<DocumentMatch> matches;
        size_t total_matches = 0;
        double search_time_ms = 0.0;
        double embedding_time_ms = 0.0;

        bool has_results() const { return !matches.empty(); }
        const DocumentMatch* best_match() const { return matches.empty() ? nullptr : &matches.front(); }
    };

    struct ContextualMatch {
        DocumentMatch main_match;
        std::vector<DocumentMatch> context_chunks; // ordered by chunk index, includes main_match
        size_t context_start_index = 0;
        size_t total_chunks_in_document = 0;
    };

    struct IngestionResult {
        size_t total_files = 0;
        size_t processed_files = 0;
        size_t skipped_files = 0;
        size_t failed_files = 0;
        size_t total_chunks = 0;
        std::vector<std::string> errors;
        bool cancelled = false;
        bool aborted = false;
    };

    struct StoreStats {
        std::vector<std::pair<std::string, int64_t>> documents_by_status;
        std::vector<std::pair<std::string, int64_t>> documents_by_content_type;
        int64_t total_chunks = 0;
        int64_t total_documents = 0;
    };

    nlohmann::json to_json(const DocumentMatch& match);
    nlohmann::json to_json(const SearchResult& result);

}
