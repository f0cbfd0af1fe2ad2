#pragma once

#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "lectern/types.hpp"

namespace lectern::engine {

    struct ChunkConfig {
        enum class OversizePolicy {
            Drop, // log and drop a piece that cannot meet the token budget
            Fail  // raise ChunkingError, failing the document
        };

        ChunkStrategy strategy = ChunkStrategy::SentenceBased;
        size_t max_chunk_size = 1000; // bytes
        size_t min_chunk_size = 100;
        size_t overlap_size = 100;
        size_t max_tokens = 256;
        double chars_per_token = 4.0; // initial window estimate for fixed-size cuts
        bool preserve_headers = true;
        size_t max_split_depth = 8;
        OversizePolicy oversize_policy = OversizePolicy::Drop;
    };

    struct SegmentConfig {
        enum class Strategy {
            SizeBased,
            LineBased,
            MarkdownSection
        };

        bool enabled = true;
        std::uintmax_t max_file_size = 100ull * 1024 * 1024;      // files above this are segmented
        std::uintmax_t preferred_segment_size = 50ull * 1024 * 1024;
        size_t overlap_lines = 50;
        Strategy strategy = Strategy::SizeBased;
        size_t lookahead_bytes = 4096;          // window scanned for a line break after a size cut
        size_t size_overlap_line_factor = 0;    // approx. bytes per line for size-based overlap, 0 = none
        size_t sample_lines = 1000;
        size_t min_lines_per_segment = 1000;
        std::filesystem::path temp_dir;         // empty = <system temp>/lectern_segments
    };

    struct IngestionConfig {
        ChunkConfig chunking;
        SegmentConfig segmenting;
        bool skip_existing = true;
        bool update_existing = false;
        size_t max_workers = 4;
        bool segmentation_fallback = true;
    };

    struct RetrievalConfig {
        size_t max_results = 5;
        double min_similarity = 0.3;
        size_t context_size = 1;
        DistanceMetric metric = DistanceMetric::L2;
    };

    struct EmbeddingConfig {
        std::string backend = "ollama"; // ollama, openai, onnx
        std::string model = "all-minilm";
        std::string endpoint = "http://localhost:11434/api/embeddings";
        std::string openai_key;
        std::string openai_base_url = "https://api.openai.com/v1";
        std::string onnx_model = "model.onnx";
        std::string onnx_vocab = "vocab.txt";
        long timeout_seconds = 60;
    };

    struct Config {
        enum class MemoryMode {
            RAM,  // Keep an HNSW index of all vectors (Fastest)
            DISK  // Exact scans over the database only (lowest RAM)
        };

        MemoryMode memory_mode = MemoryMode::DISK;
        std::filesystem::path database;   // empty = <data dir>/lectern.db
        std::string log_level = "info";
        std::string tokenizer_vocab;      // empty = character ratio estimate
        EmbeddingConfig embedding;
        IngestionConfig ingestion;
        RetrievalConfig retrieval;

        /**
         * @brief Loads a config file. A missing file yields defaults.
         * @throws ConfigError if the file exists but cannot be parsed.
         */
        static Config load(const std::filesystem::path& path);

        static Config from_json(const nlohmann::json& j);
        nlohmann::json to_json() const;

        void save(const std::filesystem::path& path) const;

        /**
         * @brief Applies environment overrides (OPENAI_API_KEY).
         */
        void apply_environment();
    };

}
