#pragma once

#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "embedder.hpp"
#include "librarian.hpp"
#include "store.hpp"
#include "lectern/types.hpp"

namespace lectern::engine {

    /**
     * @brief Ranks stored chunks against a query by vector distance.
     *
     * similarity = 1 / (1 + distance). Results are ascending by distance, ties broken by chunk id.
     * Embedding and storage failures propagate to the caller; an empty result is not an error.
     */
    class Retriever {
    public:
        /**
         * @param librarian Optional HNSW index, used as the candidate source for unfiltered queries.
         */
        Retriever(Store& store, Embedder& embedder, RetrievalConfig config = {}, Librarian* librarian = nullptr);

        /**
         * @brief Embeds the query text and returns the top max_results matches.
         * min_similarity, when set, filters the ranked set afterwards.
         * @throws EmbeddingError, StorageError
         */
        SearchResult search(const SearchQuery& query);

        SearchResult search_documents(const std::string& query, std::optional<size_t> max_results = std::nullopt);
        SearchResult search_in_documents(const std::string& query, const std::vector<int64_t>& document_ids,
                                         std::optional<size_t> max_results = std::nullopt);
        SearchResult search_by_content_type(const std::string& query, const std::vector<std::string>& content_types,
                                            std::optional<size_t> max_results = std::nullopt);

        /**
         * @brief Restricts the search to documents created within the last days.
         */
        SearchResult search_recent(const std::string& query, int days = 30, std::optional<size_t> max_results = std::nullopt);

        std::vector<DocumentMatch> best_matches(const std::string& query, size_t top_n = 3);

        /**
         * @brief All chunks of a document ordered by index, with similarity 0.
         */
        std::vector<DocumentMatch> get_document_chunks(int64_t document_id, std::optional<size_t> limit = std::nullopt);

        /**
         * @brief Chunks nearest to a stored chunk, excluding the chunk itself.
         * Unknown chunks, or chunks without an embedding, yield an empty list.
         */
        std::vector<DocumentMatch> find_similar(int64_t chunk_id, std::optional<size_t> max_results = std::nullopt);

        /**
         * @brief Top matches with up to context_size neighbouring chunks on each side.
         */
        std::vector<ContextualMatch> search_with_context(const std::string& query,
                                                         std::optional<size_t> context_size = std::nullopt,
                                                         std::optional<size_t> max_results = std::nullopt);

        const RetrievalConfig& config() const { return m_config; }

    private:
        Store& m_store;
        Embedder& m_embedder;
        RetrievalConfig m_config;
        Librarian* m_librarian;

        SearchQuery make_query(const std::string& text, std::optional<size_t> max_results) const;

        std::vector<ScoredChunk> rank(const std::vector<float>& vector, DistanceMetric metric,
                                      const SearchFilters& filters, size_t limit,
                                      std::optional<int64_t> exclude_chunk = std::nullopt);

        std::vector<ScoredChunk> rank_with_index(const std::vector<float>& vector, DistanceMetric metric,
                                                 size_t limit, std::optional<int64_t> exclude_chunk);
    };

    DocumentMatch make_match(const StoredChunk& chunk, double similarity);

}
