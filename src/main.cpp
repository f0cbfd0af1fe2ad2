#include <algorithm>
#include <iostream>
#include <iomanip>
#include <optional>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/database.hpp"
#include "engine/embedder.hpp"
#include "engine/extractor.hpp"
#include "engine/ingestor.hpp"
#include "engine/librarian.hpp"
#include "engine/log.hpp"
#include "engine/retriever.hpp"
#include "engine/tokenizer.hpp"
#include "lectern/errors.hpp"
#include <nlohmann/json.hpp>

namespace engine = lectern::engine;

// Global stop signal
std::atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop = true;
}

namespace {

    constexpr size_t kMaxPrintedErrors = 10;

    const std::set<std::string> kFlags = {
        "force", "update-existing", "recursive", "no-recursive", "verbose", "quiet", "json", "help"
    };

    const std::set<std::string> kValueOptions = {
        "config", "db", "chunk-strategy", "chunk-size", "min-chunk-size", "overlap-size", "max-tokens",
        "max-workers", "max-results", "min-similarity", "metric", "doc-ids", "types", "days", "context-size"
    };

    struct Options {
        std::string command;
        std::vector<std::string> positional;
        std::map<std::string, std::string> values;
        std::set<std::string> flags;

        bool flag(const std::string& name) const { return flags.count(name) > 0; }

        std::optional<std::string> value(const std::string& name) const {
            auto it = values.find(name);
            if (it == values.end()) return std::nullopt;
            return it->second;
        }

        std::optional<size_t> size_value(const std::string& name) const {
            auto v = value(name);
            if (!v) return std::nullopt;
            try {
                size_t pos = 0;
                long long n = std::stoll(*v, &pos);
                if (pos != v->size() || n < 0) throw std::invalid_argument(*v);
                return static_cast<size_t>(n);
            } catch (const std::logic_error&) {
                throw engine::ConfigError("Invalid value for --" + name + ": " + *v);
            }
        }

        std::optional<double> double_value(const std::string& name) const {
            auto v = value(name);
            if (!v) return std::nullopt;
            try {
                size_t pos = 0;
                double d = std::stod(*v, &pos);
                if (pos != v->size()) throw std::invalid_argument(*v);
                return d;
            } catch (const std::logic_error&) {
                throw engine::ConfigError("Invalid value for --" + name + ": " + *v);
            }
        }

        std::vector<std::string> list_value(const std::string& name) const {
            std::vector<std::string> items;
            auto v = value(name);
            if (!v) return items;
            std::stringstream ss(*v);
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (!item.empty()) items.push_back(item);
            }
            return items;
        }

        const std::string& argument(const std::string& what) const {
            if (positional.empty()) throw engine::ConfigError(command + " requires " + what);
            return positional.front();
        }

        /**
         * @brief Joins all positional arguments, so unquoted multi-word queries work.
         */
        std::string query() const {
            if (positional.empty()) throw engine::ConfigError(command + " requires a query");
            std::string q;
            for (const auto& p : positional) {
                if (!q.empty()) q += ' ';
                q += p;
            }
            return q;
        }
    };

    Options parse_args(int argc, char* argv[]) {
        Options opts;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-v") arg = "--verbose";
            if (arg == "-q") arg = "--quiet";
            if (arg == "-h") arg = "--help";

            if (arg.rfind("--", 0) == 0 && arg.size() > 2) {
                std::string name = arg.substr(2);
                std::optional<std::string> inline_value;
                auto eq = name.find('=');
                if (eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name = name.substr(0, eq);
                }

                if (kFlags.count(name)) {
                    opts.flags.insert(name);
                } else if (kValueOptions.count(name)) {
                    if (inline_value) {
                        opts.values[name] = *inline_value;
                    } else if (i + 1 < argc) {
                        opts.values[name] = argv[++i];
                    } else {
                        throw engine::ConfigError("Missing value for --" + name);
                    }
                } else {
                    throw engine::ConfigError("Unknown option: " + arg);
                }
            } else if (opts.command.empty()) {
                opts.command = arg;
            } else {
                opts.positional.push_back(arg);
            }
        }
        return opts;
    }

    void print_usage() {
        std::cerr << "Usage: lectern <command> [args...] [options]\n"
                  << "Commands:\n"
                  << "  ingest-file <path>           Ingest a single document\n"
                  << "  ingest-dir <path>            Ingest every supported file in a directory\n"
                  << "  stats                        Show ingestion statistics\n"
                  << "  supported-types              List supported file extensions\n"
                  << "  delete <hash>                Delete a document by content hash\n"
                  << "  search <query>               Search all documents\n"
                  << "  search-docs <query>          Search within --doc-ids\n"
                  << "  search-type <query>          Search within content --types\n"
                  << "  search-recent <query>        Search documents from the last --days\n"
                  << "  get-content <doc-id>         Print a document's chunks in order\n"
                  << "  find-related <chunk-id>      Find chunks similar to a stored chunk\n"
                  << "  search-context <query>       Search with neighbouring chunks\n"
                  << "  best-matches <query>         Top matches only\n"
                  << "Options:\n"
                  << "  --config PATH  --db PATH  --verbose/-v  --quiet/-q  --json\n"
                  << "  --chunk-strategy S  --chunk-size N  --min-chunk-size N  --overlap-size N\n"
                  << "  --max-tokens N  --max-workers N  --force  --update-existing  --recursive/--no-recursive\n"
                  << "  --max-results N  --min-similarity F  --metric l2|cosine\n"
                  << "  --doc-ids 1,2  --types a,b  --days N  --context-size N\n";
    }

    void apply_overrides(engine::Config& config, const Options& opts) {
        auto& chunking = config.ingestion.chunking;
        try {
            if (auto v = opts.value("chunk-strategy")) chunking.strategy = engine::strategy_from_string(*v);
            if (auto v = opts.value("metric")) config.retrieval.metric = engine::metric_from_string(*v);
        } catch (const std::invalid_argument& e) {
            throw engine::ConfigError(e.what());
        }
        if (auto v = opts.size_value("chunk-size")) chunking.max_chunk_size = *v;
        if (auto v = opts.size_value("min-chunk-size")) chunking.min_chunk_size = *v;
        if (auto v = opts.size_value("overlap-size")) chunking.overlap_size = *v;
        if (auto v = opts.size_value("max-tokens")) chunking.max_tokens = *v;
        if (auto v = opts.size_value("max-workers")) config.ingestion.max_workers = std::max<size_t>(1, *v);
        if (opts.flag("force")) config.ingestion.skip_existing = false;
        if (opts.flag("update-existing")) config.ingestion.update_existing = true;
        if (auto v = opts.size_value("max-results")) config.retrieval.max_results = *v;
        if (auto v = opts.double_value("min-similarity")) config.retrieval.min_similarity = *v;
        if (auto v = opts.size_value("context-size")) config.retrieval.context_size = *v;
        if (auto v = opts.value("db")) config.database = *v;

        if (chunking.max_chunk_size == 0 || chunking.max_tokens == 0) {
            throw engine::ConfigError("--chunk-size and --max-tokens must be positive");
        }
        if (chunking.min_chunk_size > chunking.max_chunk_size) {
            throw engine::ConfigError("--min-chunk-size cannot exceed --chunk-size");
        }

        if (opts.flag("verbose")) {
            config.log_level = "debug";
        } else if (opts.flag("quiet")) {
            config.log_level = "error";
        } else if (opts.flag("json")) {
            // stdout carries the JSON document
            config.log_level = "warn";
        }
    }

    std::string preview(const std::string& content, size_t max_len = 200) {
        std::string text = content.size() > max_len ? content.substr(0, max_len) + "..." : content;
        for (char& c : text) {
            if (c == '\n' || c == '\r' || c == '\t') c = ' ';
        }
        return text;
    }

    void print_match(size_t rank, const engine::DocumentMatch& m) {
        std::cout << rank << ". " << m.filename << " [chunk " << m.chunk_index << ", id " << m.chunk_id
                  << ", doc " << m.document_id << "]";
        if (m.similarity_score > 0.0) {
            std::cout << " similarity " << std::fixed << std::setprecision(3) << m.similarity_score;
            std::cout.unsetf(std::ios::floatfield);
        }
        std::cout << "\n   " << preview(m.content) << "\n";
    }

    int print_search(const engine::SearchResult& result, bool json) {
        if (json) {
            std::cout << engine::to_json(result).dump(2) << "\n";
            return 0;
        }
        if (!result.has_results()) {
            std::cout << "No relevant results found for: " << result.query << "\n";
            return 0;
        }
        std::cout << "Found " << result.total_matches << " matches in " << std::fixed << std::setprecision(1)
                  << result.search_time_ms << "ms (embedding " << result.embedding_time_ms << "ms)\n";
        std::cout.unsetf(std::ios::floatfield);
        for (size_t i = 0; i < result.matches.size(); ++i) print_match(i + 1, result.matches[i]);
        return 0;
    }

    int print_matches(const std::vector<engine::DocumentMatch>& matches, bool json, const std::string& empty_message) {
        if (json) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& m : matches) arr.push_back(engine::to_json(m));
            std::cout << arr.dump(2) << "\n";
            return 0;
        }
        if (matches.empty()) {
            std::cout << empty_message << "\n";
            return 0;
        }
        for (size_t i = 0; i < matches.size(); ++i) print_match(i + 1, matches[i]);
        return 0;
    }

    void print_ingestion(const engine::IngestionResult& result, bool json) {
        if (json) {
            nlohmann::json j = {
                {"total_files", result.total_files},
                {"processed_files", result.processed_files},
                {"skipped_files", result.skipped_files},
                {"failed_files", result.failed_files},
                {"total_chunks", result.total_chunks},
                {"cancelled", result.cancelled},
                {"aborted", result.aborted},
                {"errors", result.errors}
            };
            std::cout << j.dump(2) << "\n";
            return;
        }
        std::cout << "Ingestion Results:\n"
                  << "  Total files found: " << result.total_files << "\n"
                  << "  Successfully processed: " << result.processed_files << "\n"
                  << "  Skipped (existing): " << result.skipped_files << "\n"
                  << "  Failed: " << result.failed_files << "\n"
                  << "  Total chunks created: " << result.total_chunks << "\n";
        if (result.cancelled) std::cout << "  Interrupted before completion\n";
        if (result.aborted) std::cout << "  Aborted: store connection lost\n";
        if (!result.errors.empty()) {
            std::cout << "\nErrors:\n";
            for (size_t i = 0; i < result.errors.size() && i < kMaxPrintedErrors; ++i) {
                std::cout << "  " << result.errors[i] << "\n";
            }
            if (result.errors.size() > kMaxPrintedErrors) {
                std::cout << "  ... and " << result.errors.size() - kMaxPrintedErrors << " more errors\n";
            }
        }
    }

    int print_stats(const engine::StoreStats& stats, bool json) {
        if (json) {
            nlohmann::json by_status = nlohmann::json::object();
            for (const auto& [status, count] : stats.documents_by_status) by_status[status] = count;
            nlohmann::json by_type = nlohmann::json::object();
            for (const auto& [type, count] : stats.documents_by_content_type) by_type[type] = count;
            std::cout << nlohmann::json({
                {"total_documents", stats.total_documents},
                {"total_chunks", stats.total_chunks},
                {"documents_by_status", by_status},
                {"documents_by_content_type", by_type}
            }).dump(2) << "\n";
            return 0;
        }
        std::cout << "Ingestion Statistics:\n"
                  << "  Total documents: " << stats.total_documents << "\n"
                  << "  Total chunks: " << stats.total_chunks << "\n\n"
                  << "Documents by status:\n";
        for (const auto& [status, count] : stats.documents_by_status) std::cout << "  " << status << ": " << count << "\n";
        std::cout << "\nDocuments by content type:\n";
        for (const auto& [type, count] : stats.documents_by_content_type) std::cout << "  " << type << ": " << count << "\n";
        return 0;
    }

    int print_supported_types(bool json) {
        auto types = engine::Extractor::supported_types();
        if (json) {
            nlohmann::json j = nlohmann::json::object();
            for (const auto& [ext, type] : types) j[ext] = type;
            std::cout << j.dump(2) << "\n";
            return 0;
        }
        std::cout << "Supported file types:\n\n";
        std::cout << "Text files:\n";
        for (const auto& [ext, type] : types) {
            if (type != "pdf" && type != "document") std::cout << "  " << ext << " (" << type << ")\n";
        }
        std::cout << "\nDocument files:\n";
        for (const auto& [ext, type] : types) {
            if (type == "pdf" || type == "document") std::cout << "  " << ext << " (" << type << ")\n";
        }
        std::cout << "\nNotes:\n"
                  << "  - PDF and office documents are recognized but have no built-in text extractor\n"
                  << "  - Text encoding is detected in order: UTF-8, UTF-16 (BOM), CP1252, Latin-1\n";
        return 0;
    }

    int64_t parse_id(const std::string& value, const std::string& what) {
        try {
            size_t pos = 0;
            long long id = std::stoll(value, &pos);
            if (pos != value.size()) throw std::invalid_argument(value);
            return id;
        } catch (const std::logic_error&) {
            throw engine::ConfigError("Invalid " + what + ": " + value);
        }
    }

    std::filesystem::path resolve_database(const engine::Config& config) {
        if (!config.database.empty()) return config.database;
        auto data_dir = lectern::platform::system::get_data_dir();
        if (data_dir.empty()) data_dir = std::filesystem::current_path(); // Fallback
        return data_dir / "lectern.db";
    }

    int run(const Options& opts) {
        const bool json = opts.flag("json");

        if (opts.command == "supported-types") return print_supported_types(json);

        // Config
        std::filesystem::path config_path;
        if (auto v = opts.value("config")) {
            config_path = *v;
        } else {
            auto config_dir = lectern::platform::system::get_config_dir();
            config_path = config_dir.empty() ? std::filesystem::path("config.json") : config_dir / "config.json";
        }
        auto config = engine::Config::load(config_path);
        config.apply_environment();
        apply_overrides(config, opts);
        engine::log::set_level(engine::log::level_from_string(config.log_level));
        engine::log::debug("Lectern", "Config path: ", config_path.string());

        // Store
        auto db_path = resolve_database(config);
        engine::log::debug("Lectern", "Database path: ", db_path.string());
        engine::Database db;
        db.open(db_path);

        if (opts.command == "stats") return print_stats(db.aggregate_stats(), json);

        if (opts.command == "delete") {
            const auto& hash = opts.argument("a content hash");
            std::vector<int64_t> chunk_ids;
            if (auto doc = db.find_by_hash(hash)) {
                for (const auto& chunk : db.chunks_for_document(doc->id)) chunk_ids.push_back(chunk.id);
            }
            bool deleted = db.delete_document(hash);

            if (deleted && config.memory_mode == engine::Config::MemoryMode::RAM && db_path != ":memory:") {
                auto index_path = db_path.parent_path() / "lectern.hnsw";
                engine::Librarian librarian(config.retrieval.metric);
                if (librarian.load(index_path)) {
                    for (int64_t id : chunk_ids) librarian.remove_item(id);
                    librarian.save(index_path);
                }
            }

            if (json) {
                std::cout << nlohmann::json({{"deleted", deleted}, {"hash", hash}, {"chunks", chunk_ids.size()}}).dump(2) << "\n";
            } else {
                std::cout << (deleted ? "Document deleted successfully\n" : "Document not found or could not be deleted\n");
            }
            return deleted ? 0 : 1;
        }

        // Model access
        auto embedder = engine::create_embedder(config.embedding);
        auto counter = engine::create_token_counter(config.tokenizer_vocab, config.ingestion.chunking.chars_per_token);

        std::unique_ptr<engine::Librarian> librarian;
        std::filesystem::path index_path;
        if (config.memory_mode == engine::Config::MemoryMode::RAM) {
            librarian = std::make_unique<engine::Librarian>(config.retrieval.metric);
            if (db_path != ":memory:") {
                index_path = db_path.parent_path() / "lectern.hnsw";
                librarian->restore(index_path, db);
            } else {
                librarian->rebuild(db);
            }
            engine::log::debug("Lectern", "Librarian ready with ", librarian->count(), " items");
        }

        if (opts.command == "ingest-file" || opts.command == "ingest-dir") {
            std::filesystem::path target = opts.argument("a path");
            engine::Ingestor ingestor(db, *embedder, *counter, config.ingestion, librarian.get(), &g_stop);

            engine::IngestionResult result;
            int code = 0;
            if (opts.command == "ingest-file") {
                std::error_code ec;
                if (!std::filesystem::is_regular_file(target, ec)) {
                    std::cerr << "Error: File does not exist: " << target.string() << "\n";
                    return 1;
                }
                if (!json) std::cout << "Ingesting file: " << target.string() << "\n";
                result = ingestor.ingest_file(target);
                code = (result.failed_files > 0 || result.aborted) ? 1 : 0;
            } else {
                std::error_code ec;
                if (!std::filesystem::is_directory(target, ec)) {
                    std::cerr << "Error: Path is not a directory: " << target.string() << "\n";
                    return 1;
                }
                bool recursive = !opts.flag("no-recursive");
                if (!json) {
                    std::cout << "Ingesting directory: " << target.string() << "\n"
                              << "Recursive: " << (recursive ? "yes" : "no") << "\n"
                              << "Chunk strategy: " << engine::to_string(config.ingestion.chunking.strategy) << "\n"
                              << "Chunk size: " << config.ingestion.chunking.max_chunk_size << " bytes\n\n";
                }
                result = ingestor.ingest_directory(target, recursive);
                code = result.aborted ? 1 : 0;
            }

            print_ingestion(result, json);
            if (librarian && !index_path.empty()) librarian->save(index_path);
            return code;
        }

        engine::Retriever retriever(db, *embedder, config.retrieval, librarian.get());
        const auto max_results = opts.size_value("max-results");

        if (opts.command == "search") {
            return print_search(retriever.search_documents(opts.query(), max_results), json);
        }
        if (opts.command == "search-docs") {
            std::vector<int64_t> ids;
            for (const auto& id : opts.list_value("doc-ids")) ids.push_back(parse_id(id, "document id"));
            if (ids.empty()) throw engine::ConfigError("search-docs requires --doc-ids");
            return print_search(retriever.search_in_documents(opts.query(), ids, max_results), json);
        }
        if (opts.command == "search-type") {
            auto types = opts.list_value("types");
            if (types.empty()) throw engine::ConfigError("search-type requires --types");
            return print_search(retriever.search_by_content_type(opts.query(), types, max_results), json);
        }
        if (opts.command == "search-recent") {
            int days = static_cast<int>(opts.size_value("days").value_or(30));
            return print_search(retriever.search_recent(opts.query(), days, max_results), json);
        }
        if (opts.command == "best-matches") {
            return print_matches(retriever.best_matches(opts.query(), max_results.value_or(3)), json, "No relevant results found.");
        }
        if (opts.command == "get-content") {
            int64_t doc_id = parse_id(opts.argument("a document id"), "document id");
            auto chunks = retriever.get_document_chunks(doc_id, max_results);
            if (chunks.empty() && !db.get_document(doc_id)) {
                std::cerr << "Error: Document not found: " << doc_id << "\n";
                return 1;
            }
            if (json) return print_matches(chunks, true, "");
            for (const auto& c : chunks) {
                std::cout << "--- chunk " << c.chunk_index << " (id " << c.chunk_id << ") ---\n" << c.content << "\n";
            }
            return 0;
        }
        if (opts.command == "find-related") {
            int64_t chunk_id = parse_id(opts.argument("a chunk id"), "chunk id");
            if (!db.get_chunk(chunk_id)) {
                std::cerr << "Error: Chunk not found: " << chunk_id << "\n";
                return 1;
            }
            return print_matches(retriever.find_similar(chunk_id, max_results), json, "No related content found.");
        }
        if (opts.command == "search-context") {
            auto results = retriever.search_with_context(opts.query(), opts.size_value("context-size"), max_results);
            if (json) {
                nlohmann::json arr = nlohmann::json::array();
                for (const auto& r : results) {
                    nlohmann::json context = nlohmann::json::array();
                    for (const auto& c : r.context_chunks) context.push_back(engine::to_json(c));
                    arr.push_back({
                        {"main_match", engine::to_json(r.main_match)},
                        {"context_chunks", context},
                        {"context_start_index", r.context_start_index},
                        {"total_chunks_in_document", r.total_chunks_in_document}
                    });
                }
                std::cout << arr.dump(2) << "\n";
                return 0;
            }
            if (results.empty()) {
                std::cout << "No relevant results found.\n";
                return 0;
            }
            for (size_t i = 0; i < results.size(); ++i) {
                const auto& r = results[i];
                print_match(i + 1, r.main_match);
                std::cout << "   context: chunks " << r.context_start_index << "-"
                          << r.context_start_index + r.context_chunks.size() - 1 << " of "
                          << r.total_chunks_in_document << "\n";
                for (const auto& c : r.context_chunks) {
                    std::cout << (c.chunk_id == r.main_match.chunk_id ? "   > " : "     ") << preview(c.content, 120) << "\n";
                }
            }
            return 0;
        }

        std::cerr << "Unknown command: " << opts.command << "\n";
        print_usage();
        return 1;
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const engine::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage();
        return 1;
    }

    if (opts.command.empty() || opts.command == "help" || opts.flag("help")) {
        print_usage();
        return opts.command.empty() && !opts.flag("help") ? 1 : 0;
    }

    try {
        return run(opts);
    } catch (const engine::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
    }
    return 1;
}
