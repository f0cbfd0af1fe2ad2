#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "lectern/types.hpp"

namespace lectern::engine {

    /**
     * @brief A staged replacement of one document's chunk set.
     *
     * Appended chunks stay invisible to readers until commit() swaps them in, in one
     * transaction, together with the document's status and chunk count. A batch that is
     * destroyed without commit() discards everything it staged.
     */
    class ChunkBatch {
    public:
        struct CommitResult {
            std::vector<int64_t> added;   // ids now visible
            std::vector<int64_t> removed; // ids of the chunk set that was replaced
        };

        virtual ~ChunkBatch() = default;

        /**
         * @brief Stages records and returns their new chunk ids.
         * @throws StorageError
         */
        virtual std::vector<int64_t> append(const std::vector<ChunkRecord>& records) = 0;

        /**
         * @brief Publishes the staged set and marks the document processed.
         * @throws StorageError
         */
        virtual CommitResult commit() = 0;

        /**
         * @brief File stats to store on the document when commit() succeeds.
         * Until then the document keeps its previous path, size and modification time.
         */
        virtual void refresh_document(const DocumentInfo& info) = 0;

        virtual size_t staged() const = 0;
    };

    /**
     * @brief Persistence of documents and their embedded chunks.
     * All operations throw StorageError; connection_lost() is set when the store itself is unusable.
     */
    class Store {
    public:
        virtual ~Store() = default;

        virtual std::optional<DocumentRecord> find_by_hash(const std::string& hash) = 0;
        virtual std::optional<DocumentRecord> get_document(int64_t document_id) = 0;

        /**
         * @brief Inserts a document in the pending state and returns its id.
         */
        virtual int64_t create_document(const DocumentInfo& info, const nlohmann::json& metadata = nlohmann::json::object()) = 0;

        virtual void update_status(int64_t document_id, DocumentStatus status, std::optional<int64_t> chunk_count = std::nullopt) = 0;

        /**
         * @brief Opens a staged chunk replacement for a document. One batch per document at a time.
         */
        virtual std::unique_ptr<ChunkBatch> begin_chunk_batch(int64_t document_id) = 0;

        /**
         * @brief Replaces a document's whole chunk set atomically.
         */
        ChunkBatch::CommitResult replace_chunks(int64_t document_id, const std::vector<ChunkRecord>& records) {
            auto batch = begin_chunk_batch(document_id);
            batch->append(records);
            return batch->commit();
        }

        /**
         * @brief Deletes a document by content hash, cascading to its chunks.
         * @return false if no document has that hash.
         */
        virtual bool delete_document(const std::string& hash) = 0;

        /**
         * @brief Exact nearest-neighbour scan, ascending by distance, ties by chunk id.
         */
        virtual std::vector<ScoredChunk> similarity_query(const std::vector<float>& vector, DistanceMetric metric,
                                                          const SearchFilters& filters, size_t limit,
                                                          std::optional<int64_t> exclude_chunk = std::nullopt) = 0;

        virtual std::vector<StoredChunk> chunks_for_document(int64_t document_id, std::optional<size_t> limit = std::nullopt) = 0;

        virtual std::optional<StoredChunk> get_chunk(int64_t chunk_id) = 0;

        /**
         * @brief Fetches chunks by id, in the order given. Unknown ids are skipped.
         */
        virtual std::vector<StoredChunk> get_chunks(const std::vector<int64_t>& chunk_ids) = 0;

        virtual StoreStats aggregate_stats() = 0;

        /**
         * @brief Visits the embedding of every visible chunk.
         */
        virtual void for_each_vector(const std::function<void(int64_t, const std::vector<float>&)>& callback) = 0;

        virtual size_t vector_count() = 0;
    };

}
