#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <mutex>
#include <sqlite3.h>
#include <functional>
#include "store.hpp"

namespace lectern::engine {

    /**
     * @brief SQLite-backed Store. One connection, serialized by a mutex.
     */
    class Database : public Store {
    public:
        Database();
        ~Database() override;

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        /**
         * @brief Opens (or creates) the database and initializes the schema.
         * Pass ":memory:" for a private in-memory database.
         * @throws StorageError
         */
        void open(const std::filesystem::path& path);
        void close();
        bool is_open() const { return m_db != nullptr; }

        std::optional<DocumentRecord> find_by_hash(const std::string& hash) override;
        std::optional<DocumentRecord> get_document(int64_t document_id) override;
        int64_t create_document(const DocumentInfo& info, const nlohmann::json& metadata = nlohmann::json::object()) override;
        void update_status(int64_t document_id, DocumentStatus status, std::optional<int64_t> chunk_count = std::nullopt) override;

        std::unique_ptr<ChunkBatch> begin_chunk_batch(int64_t document_id) override;

        bool delete_document(const std::string& hash) override;

        std::vector<ScoredChunk> similarity_query(const std::vector<float>& vector, DistanceMetric metric,
                                                  const SearchFilters& filters, size_t limit,
                                                  std::optional<int64_t> exclude_chunk = std::nullopt) override;

        std::vector<StoredChunk> chunks_for_document(int64_t document_id, std::optional<size_t> limit = std::nullopt) override;
        std::optional<StoredChunk> get_chunk(int64_t chunk_id) override;
        std::vector<StoredChunk> get_chunks(const std::vector<int64_t>& chunk_ids) override;

        StoreStats aggregate_stats() override;

        void for_each_vector(const std::function<void(int64_t, const std::vector<float>&)>& callback) override;
        size_t vector_count() override;

    private:
        friend class SqliteChunkBatch;

        sqlite3* m_db = nullptr;
        std::mutex m_mutex;

        void initialize_schema();
        void exec(const char* sql);
        sqlite3* handle();
    };

}
