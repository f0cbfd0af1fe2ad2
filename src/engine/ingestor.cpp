#include "ingestor.hpp"
#include "extractor.hpp"
#include "job_queue.hpp"
#include "log.hpp"
#include "scanner.hpp"
#include "lectern/errors.hpp"
#include <algorithm>
#include <thread>

namespace lectern::engine {

    Ingestor::InFlight::InFlight(Ingestor& owner, const std::string& hash) : m_owner(owner), m_hash(hash) {
        std::unique_lock<std::mutex> lock(m_owner.m_inflight_mutex);
        m_owner.m_inflight_cv.wait(lock, [this] { return m_owner.m_inflight.count(m_hash) == 0; });
        m_owner.m_inflight.insert(m_hash);
    }

    Ingestor::InFlight::~InFlight() {
        {
            std::lock_guard<std::mutex> lock(m_owner.m_inflight_mutex);
            m_owner.m_inflight.erase(m_hash);
        }
        m_owner.m_inflight_cv.notify_all();
    }

    Ingestor::Ingestor(Store& store, Embedder& embedder, const TokenCounter& counter, IngestionConfig config,
                       Librarian* librarian, const std::atomic<bool>* cancel_flag)
        : m_store(store),
          m_embedder(embedder),
          m_config(std::move(config)),
          m_chunker(m_config.chunking, counter),
          m_segmenter(m_config.segmenting),
          m_librarian(librarian),
          m_cancel_flag(cancel_flag) {}

    bool Ingestor::is_cancelled() const {
        return m_cancelled.load() || (m_cancel_flag && m_cancel_flag->load());
    }

    IngestionResult Ingestor::ingest_file(const std::filesystem::path& path) {
        return ingest_paths({path});
    }

    IngestionResult Ingestor::ingest_directory(const std::filesystem::path& path, bool recursive) {
        log::info("Ingestor", "Starting ingestion of directory: ", path.string());

        std::vector<std::filesystem::path> files;
        try {
            files = Scanner().collect(path, recursive);
        } catch (const Error& e) {
            IngestionResult result;
            log::error("Ingestor", e.what());
            result.errors.push_back(std::string("Directory ingestion error: ") + e.what());
            return result;
        }

        if (files.empty()) {
            log::warn("Ingestor", "No supported files found in ", path.string());
            return {};
        }
        return ingest_paths(files);
    }

    IngestionResult Ingestor::ingest_paths(const std::vector<std::filesystem::path>& paths) {
        IngestionResult result;
        result.total_files = paths.size();
        if (paths.empty()) return result;

        JobQueue queue;
        for (const auto& p : paths) queue.push(p);
        queue.stop();

        std::mutex result_mutex;
        std::atomic<bool> aborted{false};

        auto worker = [&]() {
            std::filesystem::path path;
            while (queue.pop(path)) {
                if (aborted || is_cancelled()) continue;

                FileOutcome outcome;
                try {
                    outcome = process_file(path);
                } catch (const StorageError& e) {
                    if (e.connection_lost()) {
                        aborted = true;
                        queue.clear();
                        log::error("Ingestor", "Store connection lost, aborting run: ", e.what());
                        std::lock_guard<std::mutex> lock(result_mutex);
                        result.aborted = true;
                        result.failed_files++;
                        result.errors.push_back(path.string() + ": " + e.what());
                        continue;
                    }
                    outcome.outcome = Outcome::Failed;
                    outcome.error = e.what();
                } catch (const std::exception& e) {
                    outcome.outcome = Outcome::Failed;
                    outcome.error = e.what();
                }

                std::lock_guard<std::mutex> lock(result_mutex);
                switch (outcome.outcome) {
                    case Outcome::Processed:
                        result.processed_files++;
                        result.total_chunks += outcome.chunks;
                        break;
                    case Outcome::Skipped:
                        result.skipped_files++;
                        break;
                    case Outcome::Failed:
                        result.failed_files++;
                        result.errors.push_back(path.string() + ": " + outcome.error);
                        log::error("Ingestor", "Error processing ", path.string(), ": ", outcome.error);
                        break;
                    case Outcome::Cancelled:
                        break;
                }
            }
        };

        size_t worker_count = std::min(std::max<size_t>(1, m_config.max_workers), paths.size());
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) workers.emplace_back(worker);
        for (auto& t : workers) t.join();

        if (is_cancelled()) {
            result.cancelled = true;
            result.errors.push_back("Ingestion interrupted by user");
            log::info("Ingestor", "Interrupted, stopped taking new files");
        }

        log::info("Ingestor", "Ingestion completed: ", result.processed_files, " processed, ",
                  result.skipped_files, " skipped, ", result.failed_files, " failed, ",
                  result.total_chunks, " chunks created");
        return result;
    }

    Ingestor::FileOutcome Ingestor::process_file(const std::filesystem::path& path) {
        FileOutcome out;

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            out.error = "File does not exist";
            return out;
        }

        DocumentInfo info;
        try {
            info = Extractor::describe(path);
        } catch (const ExtractionError& e) {
            out.error = e.what();
            return out;
        }

        InFlight guard(*this, info.hash);
        if (is_cancelled()) {
            out.outcome = Outcome::Cancelled;
            return out;
        }

        auto existing = m_store.find_by_hash(info.hash);
        if (existing && m_config.skip_existing && existing->chunk_count > 0) {
            if (!m_config.update_existing) {
                log::debug("Ingestor", "Skipping existing file: ", path.string());
                out.outcome = Outcome::Skipped;
                return out;
            }
            if (existing->info.last_modified >= info.last_modified) {
                log::debug("Ingestor", "Skipping unchanged file: ", path.string());
                out.outcome = Outcome::Skipped;
                return out;
            }
        }

        int64_t document_id = 0;
        if (existing) {
            document_id = existing->id;
            log::info("Ingestor", "Reprocessing ", path.filename().string(), " (document ", document_id, ")");
        } else {
            document_id = m_store.create_document(info, {{"extension", info.extension}});
            log::info("Ingestor", "Indexing: ", path.filename().string());
        }
        m_store.update_status(document_id, DocumentStatus::Processing);

        try {
            IndexedVectors staged;
            auto batch = m_store.begin_chunk_batch(document_id);
            if (existing) batch->refresh_document(info);
            auto count = stage_chunks(path, info, *batch, staged);

            if (!count) {
                batch.reset();
                if (existing) {
                    m_store.update_status(document_id, existing->status, existing->chunk_count);
                } else {
                    mark_failed(document_id, 0);
                }
                out.outcome = Outcome::Cancelled;
                return out;
            }
            if (*count == 0) {
                batch.reset();
                log::warn("Ingestor", "No chunks created from ", path.string());
                mark_failed(document_id, 0);
                out.error = "No chunks created";
                return out;
            }

            auto commit = batch->commit();
            sync_librarian(commit, staged);

            log::debug("Ingestor", "Successfully processed ", path.string(), ": ", *count, " chunks");
            out.outcome = Outcome::Processed;
            out.chunks = *count;
            return out;
        } catch (const StorageError& e) {
            if (e.connection_lost()) throw;
            mark_failed(document_id, std::nullopt);
            out.error = e.what();
        } catch (const Error& e) {
            mark_failed(document_id, std::nullopt);
            out.error = e.what();
        }
        return out;
    }

    std::optional<size_t> Ingestor::stage_chunks(const std::filesystem::path& path, const DocumentInfo& info,
                                                 ChunkBatch& batch, IndexedVectors& staged) {
        if (m_segmenter.should_segment(path)) {
            std::optional<SegmentSet> segments;
            try {
                segments.emplace(m_segmenter.segment(path));
            } catch (const SegmentationError& e) {
                if (!m_config.segmentation_fallback) throw;
                log::warn("Ingestor", "Segmentation of ", path.string(), " failed, processing it whole: ", e.what());
            }

            if (segments && !segments->empty()) {
                log::info("Ingestor", "Processing ", segments->size(), " segments for ", path.filename().string());
                size_t offset = 0;
                for (const auto& segment : *segments) {
                    if (is_cancelled()) return std::nullopt;

                    std::string text = Extractor::extract(segment.path);
                    auto extra = segment.metadata();
                    extra["original_file_size"] = info.size;
                    size_t added = stage_text(text, info, offset, extra, batch, staged);
                    offset += added;
                    log::debug("Ingestor", "Staged ", added, " chunks from segment ", segment.index + 1, "/",
                               segments->size(), ". Total: ", offset);
                }
                return offset;
            }
        }

        return stage_text(Extractor::extract(path), info, 0, nlohmann::json::object(), batch, staged);
    }

    size_t Ingestor::stage_text(const std::string& text, const DocumentInfo& info, size_t first_index,
                                const nlohmann::json& extra_metadata, ChunkBatch& batch, IndexedVectors& staged) {
        auto chunks = m_chunker.chunk_text(text, info.content_type, first_index);
        if (chunks.empty()) return 0;

        std::vector<ChunkRecord> records;
        records.reserve(chunks.size());
        for (auto& chunk : chunks) {
            auto vector = m_embedder.embed(chunk.content);
            if (vector.empty()) {
                throw EmbeddingError("[Ingestor] Embedder returned an empty vector for chunk " + std::to_string(chunk.index));
            }
            if (extra_metadata.empty()) {
                records.push_back({std::move(chunk), std::move(vector)});
            } else {
                records.push_back({chunk.with_metadata(extra_metadata), std::move(vector)});
            }
        }

        auto ids = batch.append(records);
        if (m_librarian) {
            for (size_t i = 0; i < ids.size() && i < records.size(); ++i) {
                staged.emplace_back(ids[i], std::move(records[i].embedding));
            }
        }
        return records.size();
    }

    void Ingestor::sync_librarian(const ChunkBatch::CommitResult& commit, IndexedVectors& staged) {
        if (!m_librarian) return;
        try {
            for (int64_t id : commit.removed) m_librarian->remove_item(id);
            for (const auto& [id, vector] : staged) m_librarian->add_item(id, vector);
        } catch (const std::runtime_error& e) {
            // The store is authoritative; a stale index is rebuilt on next start.
            log::warn("Ingestor", "Vector index update failed: ", e.what());
        }
        staged.clear();
    }

    void Ingestor::mark_failed(int64_t document_id, std::optional<int64_t> chunk_count) {
        try {
            m_store.update_status(document_id, DocumentStatus::Failed, chunk_count);
        } catch (const StorageError& e) {
            if (e.connection_lost()) throw;
            log::warn("Ingestor", "Could not mark document ", document_id, " failed: ", e.what());
        }
    }

    bool Ingestor::delete_document(const std::string& hash) {
        std::vector<int64_t> chunk_ids;
        if (m_librarian) {
            if (auto doc = m_store.find_by_hash(hash)) {
                for (const auto& chunk : m_store.chunks_for_document(doc->id)) chunk_ids.push_back(chunk.id);
            }
        }

        bool deleted = m_store.delete_document(hash);
        if (deleted && m_librarian) {
            for (int64_t id : chunk_ids) m_librarian->remove_item(id);
        }
        log::info("Ingestor", deleted ? "Deleted document " : "No document with hash ", hash);
        return deleted;
    }

    StoreStats Ingestor::stats() {
        return m_store.aggregate_stats();
    }

}
