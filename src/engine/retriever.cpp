#include "retriever.hpp"
#include "distance.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <algorithm>
#include <chrono>

namespace lectern::engine {

    namespace {
        using Clock = std::chrono::steady_clock;

        double elapsed_ms(Clock::time_point since) {
            return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
        }

        int64_t now_ms() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
    }

    DocumentMatch make_match(const StoredChunk& chunk, double similarity) {
        DocumentMatch m;
        m.chunk_id = chunk.id;
        m.document_id = chunk.document_id;
        m.content = chunk.content;
        m.similarity_score = similarity;
        m.chunk_index = chunk.chunk_index;
        m.filename = chunk.filename;
        m.filepath = chunk.filepath;
        m.content_type = chunk.content_type;
        m.metadata = chunk.metadata;
        m.created_at = chunk.created_at;
        return m;
    }

    Retriever::Retriever(Store& store, Embedder& embedder, RetrievalConfig config, Librarian* librarian)
        : m_store(store), m_embedder(embedder), m_config(config), m_librarian(librarian) {}

    SearchResult Retriever::search(const SearchQuery& query) {
        auto start = Clock::now();
        SearchResult result;
        result.query = query.text;

        auto embedding_start = Clock::now();
        auto vector = m_embedder.embed(query.text);
        result.embedding_time_ms = elapsed_ms(embedding_start);
        if (vector.empty()) throw EmbeddingError("[Retriever] Embedder returned an empty query vector");

        auto ranked = rank(vector, query.metric, query.filters, query.max_results);
        for (const auto& scored : ranked) {
            double similarity = similarity_from_distance(scored.distance);
            if (query.min_similarity && similarity < *query.min_similarity) continue;
            result.matches.push_back(make_match(scored.chunk, similarity));
        }
        result.total_matches = result.matches.size();
        result.search_time_ms = elapsed_ms(start);

        log::debug("Retriever", "Search completed: ", result.total_matches, " matches in ", result.search_time_ms, "ms");
        return result;
    }

    SearchQuery Retriever::make_query(const std::string& text, std::optional<size_t> max_results) const {
        SearchQuery q;
        q.text = text;
        q.max_results = max_results.value_or(m_config.max_results);
        q.metric = m_config.metric;
        q.min_similarity = m_config.min_similarity;
        return q;
    }

    SearchResult Retriever::search_documents(const std::string& query, std::optional<size_t> max_results) {
        return search(make_query(query, max_results));
    }

    SearchResult Retriever::search_in_documents(const std::string& query, const std::vector<int64_t>& document_ids,
                                                std::optional<size_t> max_results) {
        auto q = make_query(query, max_results);
        q.filters.document_ids = document_ids;
        return search(q);
    }

    SearchResult Retriever::search_by_content_type(const std::string& query, const std::vector<std::string>& content_types,
                                                   std::optional<size_t> max_results) {
        auto q = make_query(query, max_results);
        q.filters.content_types = content_types;
        return search(q);
    }

    SearchResult Retriever::search_recent(const std::string& query, int days, std::optional<size_t> max_results) {
        auto q = make_query(query, max_results);
        int64_t end = now_ms();
        int64_t start = end - static_cast<int64_t>(std::max(days, 0)) * 24 * 60 * 60 * 1000;
        q.filters.date_range = std::make_pair(start, end);
        return search(q);
    }

    std::vector<DocumentMatch> Retriever::best_matches(const std::string& query, size_t top_n) {
        return search_documents(query, top_n).matches;
    }

    std::vector<DocumentMatch> Retriever::get_document_chunks(int64_t document_id, std::optional<size_t> limit) {
        std::vector<DocumentMatch> matches;
        for (const auto& chunk : m_store.chunks_for_document(document_id, limit)) {
            matches.push_back(make_match(chunk, 0.0));
        }
        return matches;
    }

    std::vector<DocumentMatch> Retriever::find_similar(int64_t chunk_id, std::optional<size_t> max_results) {
        std::vector<DocumentMatch> matches;
        auto reference = m_store.get_chunk(chunk_id);
        if (!reference || reference->embedding.empty()) {
            log::warn("Retriever", "No embedding found for chunk ", chunk_id);
            return matches;
        }

        auto ranked = rank(reference->embedding, m_config.metric, {}, max_results.value_or(m_config.max_results), chunk_id);
        for (const auto& scored : ranked) {
            matches.push_back(make_match(scored.chunk, similarity_from_distance(scored.distance)));
        }
        return matches;
    }

    std::vector<ContextualMatch> Retriever::search_with_context(const std::string& query, std::optional<size_t> context_size,
                                                                std::optional<size_t> max_results) {
        const size_t radius = context_size.value_or(m_config.context_size);
        auto result = search_documents(query, max_results);

        std::vector<ContextualMatch> contextual;
        for (const auto& match : result.matches) {
            auto all_chunks = m_store.chunks_for_document(match.document_id);
            auto it = std::find_if(all_chunks.begin(), all_chunks.end(),
                                   [&](const StoredChunk& c) { return c.id == match.chunk_id; });
            if (it == all_chunks.end()) continue;

            size_t pos = static_cast<size_t>(it - all_chunks.begin());
            size_t first = pos >= radius ? pos - radius : 0;
            size_t last = std::min(all_chunks.size(), pos + radius + 1);

            ContextualMatch cm;
            cm.main_match = match;
            cm.context_start_index = first;
            cm.total_chunks_in_document = all_chunks.size();
            for (size_t i = first; i < last; ++i) {
                cm.context_chunks.push_back(i == pos ? match : make_match(all_chunks[i], 0.0));
            }
            contextual.push_back(std::move(cm));
        }
        log::debug("Retriever", "Retrieved ", contextual.size(), " results with context");
        return contextual;
    }

    std::vector<ScoredChunk> Retriever::rank(const std::vector<float>& vector, DistanceMetric metric,
                                             const SearchFilters& filters, size_t limit,
                                             std::optional<int64_t> exclude_chunk) {
        if (limit == 0) return {};
        if (m_librarian && filters.empty() && m_librarian->metric() == metric && m_librarian->count() > 0) {
            auto ranked = rank_with_index(vector, metric, limit, exclude_chunk);
            if (!ranked.empty()) return ranked;
            log::debug("Retriever", "Index returned no candidates, falling back to exact scan");
        }
        return m_store.similarity_query(vector, metric, filters, limit, exclude_chunk);
    }

    std::vector<ScoredChunk> Retriever::rank_with_index(const std::vector<float>& vector, DistanceMetric metric,
                                                        size_t limit, std::optional<int64_t> exclude_chunk) {
        auto ids = m_librarian->search(vector, exclude_chunk ? limit + 1 : limit);
        if (exclude_chunk) ids.erase(std::remove(ids.begin(), ids.end(), *exclude_chunk), ids.end());

        std::vector<ScoredChunk> ranked;
        for (auto& chunk : m_store.get_chunks(ids)) {
            if (chunk.embedding.size() != vector.size()) continue;
            double d = distance(metric, vector, chunk.embedding);
            ranked.push_back({std::move(chunk), d});
        }
        std::sort(ranked.begin(), ranked.end(), [](const ScoredChunk& a, const ScoredChunk& b) {
            return a.distance != b.distance ? a.distance < b.distance : a.chunk.id < b.chunk.id;
        });
        if (ranked.size() > limit) ranked.resize(limit);
        return ranked;
    }

}
