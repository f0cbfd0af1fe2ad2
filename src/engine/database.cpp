#include "database.hpp"
#include "distance.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <queue>

namespace lectern::engine {

    namespace {

        int64_t now_ms() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        bool is_connection_error(int rc) {
            switch (rc & 0xFF) {
                case SQLITE_CANTOPEN:
                case SQLITE_IOERR:
                case SQLITE_CORRUPT:
                case SQLITE_NOTADB:
                case SQLITE_FULL:
                case SQLITE_MISUSE:
                    return true;
                default:
                    return false;
            }
        }

        [[noreturn]] void fail(sqlite3* db, int rc, const std::string& what) {
            std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            throw StorageError("[Database] " + what + ": " + detail, is_connection_error(rc));
        }

        /**
         * @brief Prepared statement, finalized on scope exit.
         */
        class Statement {
        public:
            Statement(sqlite3* db, const std::string& sql) : m_db(db) {
                int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr);
                if (rc != SQLITE_OK) fail(db, rc, "prepare failed");
            }
            ~Statement() { sqlite3_finalize(m_stmt); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            void bind(int index, int64_t value) { check(sqlite3_bind_int64(m_stmt, index, value)); }
            void bind(int index, const std::string& value) {
                check(sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
            }
            void bind_vector(int index, const std::vector<float>& v) {
                if (v.empty()) {
                    check(sqlite3_bind_null(m_stmt, index));
                } else {
                    check(sqlite3_bind_blob(m_stmt, index, v.data(), static_cast<int>(v.size() * sizeof(float)), SQLITE_TRANSIENT));
                }
            }

            /**
             * @return true while rows are available.
             */
            bool step() {
                int rc = sqlite3_step(m_stmt);
                if (rc == SQLITE_ROW) return true;
                if (rc == SQLITE_DONE) return false;
                fail(m_db, rc, "step failed");
            }

            void reset() {
                sqlite3_reset(m_stmt);
                sqlite3_clear_bindings(m_stmt);
            }

            int64_t int64(int col) const { return sqlite3_column_int64(m_stmt, col); }

            std::string text(int col) const {
                const unsigned char* t = sqlite3_column_text(m_stmt, col);
                return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(m_stmt, col))) : std::string();
            }

            bool is_null(int col) const { return sqlite3_column_type(m_stmt, col) == SQLITE_NULL; }

            void floats(int col, std::vector<float>& out) const {
                const void* blob = sqlite3_column_blob(m_stmt, col);
                int bytes = sqlite3_column_bytes(m_stmt, col);
                if (!blob || bytes <= 0) {
                    out.clear();
                    return;
                }
                out.resize(static_cast<size_t>(bytes) / sizeof(float));
                std::memcpy(out.data(), blob, out.size() * sizeof(float));
            }

        private:
            sqlite3* m_db;
            sqlite3_stmt* m_stmt = nullptr;

            void check(int rc) {
                if (rc != SQLITE_OK) fail(m_db, rc, "bind failed");
            }
        };

        /**
         * @brief BEGIN IMMEDIATE ... COMMIT; rolls back if commit() was never reached.
         */
        class Transaction {
        public:
            explicit Transaction(sqlite3* db) : m_db(db) {
                int rc = sqlite3_exec(m_db, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr);
                if (rc != SQLITE_OK) fail(m_db, rc, "begin transaction failed");
            }
            ~Transaction() {
                if (!m_done && sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                    log::warn("Database", "Rollback failed: ", sqlite3_errmsg(m_db));
                }
            }
            void commit() {
                int rc = sqlite3_exec(m_db, "COMMIT;", nullptr, nullptr, nullptr);
                if (rc != SQLITE_OK) fail(m_db, rc, "commit failed");
                m_done = true;
            }

        private:
            sqlite3* m_db;
            bool m_done = false;
        };

        const char* kDocumentColumns =
            "id, filename, filepath, content_hash, file_size, mime_type, content_type, extension, "
            "created_at, updated_at, last_modified, metadata, status, chunk_count";

        const char* kChunkSelect =
            "SELECT c.id, c.document_id, c.chunk_index, c.content, c.metadata, c.created_at, "
            "d.filename, d.filepath, d.content_type, c.embedding "
            "FROM chunks c JOIN documents d ON d.id = c.document_id AND c.generation = d.generation ";

        nlohmann::json parse_metadata(const std::string& text) {
            if (text.empty()) return nlohmann::json::object();
            auto j = nlohmann::json::parse(text, nullptr, false);
            return (j.is_discarded() || !j.is_object()) ? nlohmann::json::object() : j;
        }

        DocumentRecord read_document(const Statement& s) {
            DocumentRecord r;
            r.id = s.int64(0);
            r.info.filename = s.text(1);
            r.info.path = s.text(2);
            r.info.hash = s.text(3);
            r.info.size = static_cast<std::uintmax_t>(s.int64(4));
            r.info.mime_type = s.text(5);
            r.info.content_type = s.text(6);
            r.info.extension = s.text(7);
            r.created_at = s.int64(8);
            r.updated_at = s.int64(9);
            r.info.last_modified = s.int64(10);
            r.metadata = parse_metadata(s.text(11));
            r.status = status_from_string(s.text(12));
            r.chunk_count = s.int64(13);
            return r;
        }

        StoredChunk read_chunk(const Statement& s) {
            StoredChunk c;
            c.id = s.int64(0);
            c.document_id = s.int64(1);
            c.chunk_index = static_cast<size_t>(s.int64(2));
            c.content = s.text(3);
            c.metadata = parse_metadata(s.text(4));
            c.created_at = s.int64(5);
            c.filename = s.text(6);
            c.filepath = s.text(7);
            c.content_type = s.text(8);
            s.floats(9, c.embedding);
            return c;
        }

        void bind_info(Statement& s, int first, const DocumentInfo& info) {
            s.bind(first, info.filename);
            s.bind(first + 1, info.path.string());
            s.bind(first + 2, static_cast<int64_t>(info.size));
            s.bind(first + 3, info.mime_type);
            s.bind(first + 4, info.content_type);
            s.bind(first + 5, info.extension);
            s.bind(first + 6, info.last_modified);
        }

        std::vector<StoredChunk> fetch_chunks(sqlite3* db, const std::vector<int64_t>& ids) {
            std::vector<StoredChunk> out;
            out.reserve(ids.size());
            Statement s(db, std::string(kChunkSelect) + "WHERE c.id = ?;");
            for (int64_t id : ids) {
                s.bind(1, id);
                if (s.step()) out.push_back(read_chunk(s));
                s.reset();
            }
            return out;
        }

    }

    /**
     * @brief Chunks are staged under a generation number the document does not point at yet.
     */
    class SqliteChunkBatch : public ChunkBatch {
    public:
        SqliteChunkBatch(Database& db, int64_t document_id, int64_t generation)
            : m_db(db), m_document_id(document_id), m_generation(generation) {}

        ~SqliteChunkBatch() override {
            if (!m_committed) discard();
        }

        std::vector<int64_t> append(const std::vector<ChunkRecord>& records) override {
            if (m_committed) throw StorageError("[Database] append after commit");
            std::lock_guard<std::mutex> lock(m_db.m_mutex);
            sqlite3* db = m_db.handle();

            std::vector<int64_t> ids;
            ids.reserve(records.size());
            Transaction tx(db);
            Statement s(db,
                "INSERT INTO chunks (document_id, generation, chunk_index, content, content_hash, char_count, "
                "token_count, embedding, created_at, metadata) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
            const int64_t created = now_ms();
            for (const auto& r : records) {
                s.bind(1, m_document_id);
                s.bind(2, m_generation);
                s.bind(3, static_cast<int64_t>(r.chunk.index));
                s.bind(4, r.chunk.content);
                s.bind(5, r.chunk.content_hash);
                s.bind(6, static_cast<int64_t>(r.chunk.char_count));
                s.bind(7, static_cast<int64_t>(r.chunk.token_count));
                s.bind_vector(8, r.embedding);
                s.bind(9, created);
                s.bind(10, r.chunk.metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
                s.step();
                ids.push_back(sqlite3_last_insert_rowid(db));
                s.reset();
            }
            tx.commit();

            m_added.insert(m_added.end(), ids.begin(), ids.end());
            return ids;
        }

        CommitResult commit() override {
            if (m_committed) throw StorageError("[Database] batch already committed");
            std::lock_guard<std::mutex> lock(m_db.m_mutex);
            sqlite3* db = m_db.handle();

            CommitResult result;
            Transaction tx(db);
            {
                Statement s(db, "SELECT id FROM chunks WHERE document_id = ? AND generation != ? ORDER BY id;");
                s.bind(1, m_document_id);
                s.bind(2, m_generation);
                while (s.step()) result.removed.push_back(s.int64(0));
            }
            {
                Statement s(db,
                    "UPDATE documents SET generation = ?, status = 'processed', chunk_count = ?, updated_at = ? "
                    "WHERE id = ?;");
                s.bind(1, m_generation);
                s.bind(2, static_cast<int64_t>(m_added.size()));
                s.bind(3, now_ms());
                s.bind(4, m_document_id);
                s.step();
                if (sqlite3_changes(db) == 0) {
                    throw StorageError("[Database] document " + std::to_string(m_document_id) + " vanished before commit");
                }
            }
            if (m_info) {
                Statement s(db,
                    "UPDATE documents SET filename = ?, filepath = ?, file_size = ?, mime_type = ?, content_type = ?, "
                    "extension = ?, last_modified = ? WHERE id = ?;");
                bind_info(s, 1, *m_info);
                s.bind(8, m_document_id);
                s.step();
            }
            {
                Statement s(db, "DELETE FROM chunks WHERE document_id = ? AND generation != ?;");
                s.bind(1, m_document_id);
                s.bind(2, m_generation);
                s.step();
            }
            tx.commit();

            m_committed = true;
            result.added = m_added;
            return result;
        }

        void refresh_document(const DocumentInfo& info) override { m_info = info; }

        size_t staged() const override { return m_added.size(); }

    private:
        Database& m_db;
        int64_t m_document_id;
        int64_t m_generation;
        std::vector<int64_t> m_added;
        std::optional<DocumentInfo> m_info;
        bool m_committed = false;

        void discard() {
            std::lock_guard<std::mutex> lock(m_db.m_mutex);
            if (!m_db.m_db) return;
            try {
                Statement s(m_db.m_db, "DELETE FROM chunks WHERE document_id = ? AND generation = ?;");
                s.bind(1, m_document_id);
                s.bind(2, m_generation);
                s.step();
                if (!m_added.empty()) {
                    log::debug("Database", "Discarded ", m_added.size(), " staged chunks of document ", m_document_id);
                }
            } catch (const StorageError& e) {
                log::warn("Database", "Failed to discard staged chunks: ", e.what());
            }
        }
    };

    Database::Database() = default;
    Database::~Database() { close(); }

    void Database::open(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db) throw StorageError("[Database] already open");

        const bool in_memory = path == ":memory:";
        if (!in_memory && path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        int rc = sqlite3_open_v2(path.c_str(), &m_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
            sqlite3_close(m_db);
            m_db = nullptr;
            throw StorageError("[Database] Failed to open " + path.string() + ": " + msg, true);
        }
        sqlite3_busy_timeout(m_db, 5000);

        if (!in_memory) exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA foreign_keys=ON;");
        exec("PRAGMA synchronous=NORMAL;");
        initialize_schema();
        log::debug("Database", "Opened ", path.string());
    }

    void Database::close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    sqlite3* Database::handle() {
        if (!m_db) throw StorageError("[Database] not open", true);
        return m_db;
    }

    void Database::exec(const char* sql) {
        char* err_msg = nullptr;
        int rc = sqlite3_exec(handle(), sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
            sqlite3_free(err_msg);
            throw StorageError("[Database] " + msg, is_connection_error(rc));
        }
    }

    void Database::initialize_schema() {
        exec(
            "CREATE TABLE IF NOT EXISTS documents ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  filename TEXT NOT NULL,"
            "  filepath TEXT NOT NULL,"
            "  content_hash TEXT UNIQUE NOT NULL,"
            "  file_size INTEGER,"
            "  mime_type TEXT,"
            "  content_type TEXT,"
            "  extension TEXT,"
            "  created_at INTEGER NOT NULL,"
            "  updated_at INTEGER NOT NULL,"
            "  last_modified INTEGER,"
            "  metadata TEXT,"
            "  status TEXT NOT NULL DEFAULT 'pending',"
            "  chunk_count INTEGER NOT NULL DEFAULT 0,"
            "  generation INTEGER NOT NULL DEFAULT 0"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_documents_status ON documents(status);"
            "CREATE INDEX IF NOT EXISTS idx_documents_content_type ON documents(content_type);"
            "CREATE TABLE IF NOT EXISTS chunks ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  document_id INTEGER NOT NULL,"
            "  generation INTEGER NOT NULL DEFAULT 0,"
            "  chunk_index INTEGER NOT NULL,"
            "  content TEXT NOT NULL,"
            "  content_hash TEXT NOT NULL,"
            "  char_count INTEGER,"
            "  token_count INTEGER,"
            "  embedding BLOB,"
            "  created_at INTEGER NOT NULL,"
            "  metadata TEXT,"
            "  UNIQUE(document_id, generation, chunk_index),"
            "  FOREIGN KEY(document_id) REFERENCES documents(id) ON DELETE CASCADE"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id, generation, chunk_index);");
    }

    std::optional<DocumentRecord> Database::find_by_hash(const std::string& hash) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement s(handle(), std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE content_hash = ?;");
        s.bind(1, hash);
        if (!s.step()) return std::nullopt;
        return read_document(s);
    }

    std::optional<DocumentRecord> Database::get_document(int64_t document_id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement s(handle(), std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id = ?;");
        s.bind(1, document_id);
        if (!s.step()) return std::nullopt;
        return read_document(s);
    }

    int64_t Database::create_document(const DocumentInfo& info, const nlohmann::json& metadata) {
        std::lock_guard<std::mutex> lock(m_mutex);
        sqlite3* db = handle();
        Statement s(db,
            "INSERT INTO documents (filename, filepath, file_size, mime_type, content_type, extension, last_modified, "
            "content_hash, created_at, updated_at, metadata, status, chunk_count) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 'pending', 0);");
        bind_info(s, 1, info);
        const int64_t now = now_ms();
        s.bind(8, info.hash);
        s.bind(9, now);
        s.bind(10, now);
        s.bind(11, metadata.is_object() ? metadata.dump() : std::string("{}"));
        s.step();
        return sqlite3_last_insert_rowid(db);
    }

    void Database::update_status(int64_t document_id, DocumentStatus status, std::optional<int64_t> chunk_count) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (chunk_count) {
            Statement s(handle(), "UPDATE documents SET status = ?, chunk_count = ?, updated_at = ? WHERE id = ?;");
            s.bind(1, std::string(to_string(status)));
            s.bind(2, *chunk_count);
            s.bind(3, now_ms());
            s.bind(4, document_id);
            s.step();
        } else {
            Statement s(handle(), "UPDATE documents SET status = ?, updated_at = ? WHERE id = ?;");
            s.bind(1, std::string(to_string(status)));
            s.bind(2, now_ms());
            s.bind(3, document_id);
            s.step();
        }
    }

    std::unique_ptr<ChunkBatch> Database::begin_chunk_batch(int64_t document_id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        sqlite3* db = handle();

        int64_t current = 0;
        {
            Statement s(db, "SELECT generation FROM documents WHERE id = ?;");
            s.bind(1, document_id);
            if (!s.step()) throw StorageError("[Database] unknown document " + std::to_string(document_id));
            current = s.int64(0);
        }
        int64_t highest = current;
        {
            Statement s(db, "SELECT COALESCE(MAX(generation), 0) FROM chunks WHERE document_id = ?;");
            s.bind(1, document_id);
            if (s.step()) highest = std::max(highest, s.int64(0));
        }
        {
            // Leftovers of an interrupted run are never visible; drop them.
            Statement s(db, "DELETE FROM chunks WHERE document_id = ? AND generation != ?;");
            s.bind(1, document_id);
            s.bind(2, current);
            s.step();
        }
        return std::make_unique<SqliteChunkBatch>(*this, document_id, highest + 1);
    }

    bool Database::delete_document(const std::string& hash) {
        std::lock_guard<std::mutex> lock(m_mutex);
        sqlite3* db = handle();
        Statement s(db, "DELETE FROM documents WHERE content_hash = ?;");
        s.bind(1, hash);
        s.step();
        return sqlite3_changes(db) > 0;
    }

    std::vector<ScoredChunk> Database::similarity_query(const std::vector<float>& vector, DistanceMetric metric,
                                                        const SearchFilters& filters, size_t limit,
                                                        std::optional<int64_t> exclude_chunk) {
        std::vector<ScoredChunk> results;
        if (limit == 0 || vector.empty()) return results;

        std::lock_guard<std::mutex> lock(m_mutex);
        sqlite3* db = handle();

        std::string sql =
            "SELECT c.id, c.embedding FROM chunks c "
            "JOIN documents d ON d.id = c.document_id AND c.generation = d.generation "
            "WHERE c.embedding IS NOT NULL";
        auto placeholders = [](size_t n) {
            std::string p = "(";
            for (size_t i = 0; i < n; ++i) p += i ? ", ?" : "?";
            return p + ")";
        };
        if (!filters.document_ids.empty()) sql += " AND c.document_id IN " + placeholders(filters.document_ids.size());
        if (!filters.content_types.empty()) sql += " AND d.content_type IN " + placeholders(filters.content_types.size());
        if (filters.date_range) sql += " AND d.created_at >= ? AND d.created_at <= ?";
        if (exclude_chunk) sql += " AND c.id != ?";
        sql += ";";

        Statement s(db, sql);
        int idx = 1;
        for (int64_t id : filters.document_ids) s.bind(idx++, id);
        for (const auto& type : filters.content_types) s.bind(idx++, type);
        if (filters.date_range) {
            s.bind(idx++, filters.date_range->first);
            s.bind(idx++, filters.date_range->second);
        }
        if (exclude_chunk) s.bind(idx++, *exclude_chunk);

        // Max-heap on (distance, id): the top is the worst candidate kept so far.
        using Candidate = std::pair<double, int64_t>;
        std::priority_queue<Candidate> heap;
        std::vector<float> embedding;
        size_t mismatched = 0;
        while (s.step()) {
            s.floats(1, embedding);
            if (embedding.size() != vector.size()) {
                ++mismatched;
                continue;
            }
            Candidate c{distance(metric, vector, embedding), s.int64(0)};
            if (heap.size() < limit) {
                heap.push(c);
            } else if (c < heap.top()) {
                heap.pop();
                heap.push(c);
            }
        }
        if (mismatched > 0) {
            log::warn("Database", "Skipped ", mismatched, " chunks whose embedding dimension differs from the query (", vector.size(), ")");
        }

        std::vector<Candidate> ranked;
        ranked.reserve(heap.size());
        while (!heap.empty()) {
            ranked.push_back(heap.top());
            heap.pop();
        }
        std::reverse(ranked.begin(), ranked.end());

        std::vector<int64_t> ids;
        ids.reserve(ranked.size());
        for (const auto& c : ranked) ids.push_back(c.second);
        auto chunks = fetch_chunks(db, ids);

        for (size_t i = 0, j = 0; i < ranked.size() && j < chunks.size(); ++i) {
            if (chunks[j].id != ranked[i].second) continue;
            results.push_back({std::move(chunks[j]), ranked[i].first});
            ++j;
        }
        return results;
    }

    std::vector<StoredChunk> Database::chunks_for_document(int64_t document_id, std::optional<size_t> limit) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string sql = std::string(kChunkSelect) + "WHERE c.document_id = ? ORDER BY c.chunk_index";
        if (limit) sql += " LIMIT ?";
        Statement s(handle(), sql + ";");
        s.bind(1, document_id);
        if (limit) s.bind(2, static_cast<int64_t>(*limit));

        std::vector<StoredChunk> out;
        while (s.step()) out.push_back(read_chunk(s));
        return out;
    }

    std::optional<StoredChunk> Database::get_chunk(int64_t chunk_id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto chunks = fetch_chunks(handle(), {chunk_id});
        if (chunks.empty()) return std::nullopt;
        return std::move(chunks.front());
    }

    std::vector<StoredChunk> Database::get_chunks(const std::vector<int64_t>& chunk_ids) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return fetch_chunks(handle(), chunk_ids);
    }

    StoreStats Database::aggregate_stats() {
        std::lock_guard<std::mutex> lock(m_mutex);
        sqlite3* db = handle();
        StoreStats stats;
        {
            Statement s(db, "SELECT status, COUNT(*) FROM documents GROUP BY status ORDER BY status;");
            while (s.step()) {
                stats.documents_by_status.emplace_back(s.text(0), s.int64(1));
                stats.total_documents += s.int64(1);
            }
        }
        {
            Statement s(db,
                "SELECT COALESCE(content_type, 'unknown'), COUNT(*) FROM documents "
                "GROUP BY COALESCE(content_type, 'unknown') ORDER BY 1;");
            while (s.step()) stats.documents_by_content_type.emplace_back(s.text(0), s.int64(1));
        }
        {
            Statement s(db,
                "SELECT COUNT(*) FROM chunks c JOIN documents d ON d.id = c.document_id AND c.generation = d.generation;");
            if (s.step()) stats.total_chunks = s.int64(0);
        }
        return stats;
    }

    void Database::for_each_vector(const std::function<void(int64_t, const std::vector<float>&)>& callback) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement s(handle(),
            "SELECT c.id, c.embedding FROM chunks c "
            "JOIN documents d ON d.id = c.document_id AND c.generation = d.generation "
            "WHERE c.embedding IS NOT NULL ORDER BY c.id;");
        std::vector<float> vec;
        while (s.step()) {
            s.floats(1, vec);
            if (!vec.empty()) callback(s.int64(0), vec);
        }
    }

    size_t Database::vector_count() {
        std::lock_guard<std::mutex> lock(m_mutex);
        Statement s(handle(),
            "SELECT COUNT(*) FROM chunks c "
            "JOIN documents d ON d.id = c.document_id AND c.generation = d.generation "
            "WHERE c.embedding IS NOT NULL;");
        return s.step() ? static_cast<size_t>(s.int64(0)) : 0;
    }

}
