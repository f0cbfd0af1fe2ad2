#include "lectern/types.hpp"
#include "lectern/sha256.h"
#include <stdexcept>

namespace lectern::engine {

    const char* to_string(DocumentStatus status) {
        switch (status) {
            case DocumentStatus::Pending: return "pending";
            case DocumentStatus::Processing: return "processing";
            case DocumentStatus::Processed: return "processed";
            case DocumentStatus::Failed: return "failed";
        }
        return "pending";
    }

    DocumentStatus status_from_string(const std::string& value) {
        if (value == "processing") return DocumentStatus::Processing;
        if (value == "processed") return DocumentStatus::Processed;
        if (value == "failed") return DocumentStatus::Failed;
        return DocumentStatus::Pending;
    }

    const char* to_string(DistanceMetric metric) {
        return metric == DistanceMetric::Cosine ? "cosine" : "l2";
    }

    DistanceMetric metric_from_string(const std::string& value) {
        if (value == "l2" || value == "euclidean") return DistanceMetric::L2;
        if (value == "cosine") return DistanceMetric::Cosine;
        throw std::invalid_argument("Invalid distance method: " + value);
    }

    const char* to_string(ChunkStrategy strategy) {
        switch (strategy) {
            case ChunkStrategy::FixedSize: return "fixed_size";
            case ChunkStrategy::SentenceBased: return "sentence_based";
            case ChunkStrategy::ParagraphBased: return "paragraph_based";
            case ChunkStrategy::CodeBased: return "code_based";
            case ChunkStrategy::MarkdownBased: return "markdown_based";
        }
        return "sentence_based";
    }

    ChunkStrategy strategy_from_string(const std::string& value) {
        if (value == "fixed_size") return ChunkStrategy::FixedSize;
        if (value == "sentence_based") return ChunkStrategy::SentenceBased;
        if (value == "paragraph_based") return ChunkStrategy::ParagraphBased;
        if (value == "code_based") return ChunkStrategy::CodeBased;
        if (value == "markdown_based") return ChunkStrategy::MarkdownBased;
        throw std::invalid_argument("Unknown chunk strategy: " + value);
    }

    nlohmann::json FileSegment::metadata() const {
        nlohmann::json j = {
            {"file_chunk_id", id},
            {"file_chunk_index", index}
        };
        if (line_start) j["line_start"] = *line_start;
        if (line_end) j["line_end"] = *line_end;
        if (section_title) j["section_title"] = *section_title;
        if (header_level) j["header_level"] = *header_level;
        if (sub_chunk) {
            j["sub_chunk"] = true;
            j["sub_index"] = sub_index;
        }
        return j;
    }

    TextChunk TextChunk::make(size_t index, std::string content, size_t token_count,
                              ChunkStrategy strategy, nlohmann::json metadata,
                              std::optional<std::string> header, std::optional<int> header_level) {
        TextChunk chunk;
        chunk.index = index;
        chunk.content_hash = crypto::SHA256::hash_string(content);
        chunk.char_count = content.size();
        chunk.content = std::move(content);
        chunk.token_count = token_count;
        chunk.strategy = strategy;
        chunk.header = std::move(header);
        chunk.header_level = header_level;
        chunk.metadata = metadata.is_object() ? std::move(metadata) : nlohmann::json::object();
        chunk.metadata["strategy"] = to_string(strategy);
        if (chunk.header) chunk.metadata["header"] = *chunk.header;
        if (chunk.header_level) chunk.metadata["header_level"] = *chunk.header_level;
        return chunk;
    }

    TextChunk TextChunk::with_index(size_t new_index) const {
        TextChunk copy = *this;
        copy.index = new_index;
        return copy;
    }

    TextChunk TextChunk::with_metadata(const nlohmann::json& extra) const {
        TextChunk copy = *this;
        if (extra.is_object()) copy.metadata.update(extra);
        return copy;
    }

    nlohmann::json to_json(const DocumentMatch& match) {
        return {
            {"chunk_id", match.chunk_id},
            {"document_id", match.document_id},
            {"chunk_index", match.chunk_index},
            {"similarity_score", match.similarity_score},
            {"filename", match.filename},
            {"filepath", match.filepath},
            {"content_type", match.content_type},
            {"created_at", match.created_at},
            {"metadata", match.metadata},
            {"content", match.content}
        };
    }

    nlohmann::json to_json(const SearchResult& result) {
        nlohmann::json matches = nlohmann::json::array();
        for (const auto& m : result.matches) matches.push_back(to_json(m));
        return {
            {"query", result.query},
            {"total_matches", result.total_matches},
            {"search_time_ms", result.search_time_ms},
            {"embedding_time_ms", result.embedding_time_ms},
            {"matches", matches}
        };
    }

}
