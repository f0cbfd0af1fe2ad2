#pragma once

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "config.hpp"
#include "embedder.hpp"
#include "file_segmenter.hpp"
#include "librarian.hpp"
#include "store.hpp"
#include "text_chunker.hpp"
#include "tokenizer.hpp"
#include "lectern/types.hpp"

namespace lectern::engine {

    /**
     * @brief Drives files through extraction, segmentation, chunking, embedding and storage.
     *
     * Each file is one unit of failure: its errors are recorded in the IngestionResult and the
     * batch moves on. Only a lost store connection aborts a run. Batches are processed by a
     * pool of max_workers threads.
     */
    class Ingestor {
    public:
        /**
         * @param librarian Optional in-memory index kept in sync with committed chunk sets.
         * @param cancel_flag Optional external stop flag (e.g. set from a signal handler).
         */
        Ingestor(Store& store, Embedder& embedder, const TokenCounter& counter, IngestionConfig config,
                 Librarian* librarian = nullptr, const std::atomic<bool>* cancel_flag = nullptr);

        IngestionResult ingest_file(const std::filesystem::path& path);

        /**
         * @brief Ingests every supported file under a directory.
         */
        IngestionResult ingest_directory(const std::filesystem::path& path, bool recursive = true);

        IngestionResult ingest_paths(const std::vector<std::filesystem::path>& paths);

        /**
         * @brief Deletes a document and its chunks by content hash.
         * @return false if no such document exists.
         */
        bool delete_document(const std::string& hash);

        StoreStats stats();

        /**
         * @brief Stops taking new files. The file in flight is abandoned at its next segment boundary.
         */
        void cancel() { m_cancelled = true; }
        bool is_cancelled() const;

        const IngestionConfig& config() const { return m_config; }

    private:
        enum class Outcome {
            Processed,
            Skipped,
            Failed,
            Cancelled
        };

        struct FileOutcome {
            Outcome outcome = Outcome::Failed;
            size_t chunks = 0;
            std::string error;
        };

        /**
         * @brief Holds a content hash while one worker processes it.
         */
        class InFlight {
        public:
            InFlight(Ingestor& owner, const std::string& hash);
            ~InFlight();
            InFlight(const InFlight&) = delete;
            InFlight& operator=(const InFlight&) = delete;

        private:
            Ingestor& m_owner;
            std::string m_hash;
        };

        using IndexedVectors = std::vector<std::pair<int64_t, std::vector<float>>>;

        Store& m_store;
        Embedder& m_embedder;
        IngestionConfig m_config;
        TextChunker m_chunker;
        FileSegmenter m_segmenter;
        Librarian* m_librarian;
        const std::atomic<bool>* m_cancel_flag;
        std::atomic<bool> m_cancelled{false};

        std::mutex m_inflight_mutex;
        std::condition_variable m_inflight_cv;
        std::set<std::string> m_inflight;

        FileOutcome process_file(const std::filesystem::path& path);

        /**
         * @brief Stages the chunks of a whole file or of its segments.
         * @return the number of chunks staged, or nullopt if cancelled part way.
         */
        std::optional<size_t> stage_chunks(const std::filesystem::path& path, const DocumentInfo& info,
                                           ChunkBatch& batch, IndexedVectors& staged);

        size_t stage_text(const std::string& text, const DocumentInfo& info, size_t first_index,
                          const nlohmann::json& extra_metadata, ChunkBatch& batch, IndexedVectors& staged);

        void sync_librarian(const ChunkBatch::CommitResult& commit, IndexedVectors& staged);

        void mark_failed(int64_t document_id, std::optional<int64_t> chunk_count);
    };

}
