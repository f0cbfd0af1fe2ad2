#include "config.hpp"
#include "lectern/errors.hpp"
#include <cstdlib>
#include <fstream>

namespace lectern::engine {

    namespace {

        const char* to_string(SegmentConfig::Strategy strategy) {
            switch (strategy) {
                case SegmentConfig::Strategy::LineBased: return "line_based";
                case SegmentConfig::Strategy::MarkdownSection: return "markdown_section";
                case SegmentConfig::Strategy::SizeBased: break;
            }
            return "size_based";
        }

        SegmentConfig::Strategy segment_strategy_from_string(const std::string& value) {
            if (value == "size_based") return SegmentConfig::Strategy::SizeBased;
            if (value == "line_based") return SegmentConfig::Strategy::LineBased;
            if (value == "markdown_section") return SegmentConfig::Strategy::MarkdownSection;
            throw ConfigError("Unknown segmenting strategy: " + value);
        }

        template <typename T>
        void read(const nlohmann::json& j, const char* key, T& out) {
            if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
        }

        ChunkConfig parse_chunking(const nlohmann::json& j) {
            ChunkConfig c;
            if (j.contains("strategy")) {
                try {
                    c.strategy = strategy_from_string(j["strategy"].get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigError(e.what());
                }
            }
            read(j, "max_chunk_size", c.max_chunk_size);
            read(j, "min_chunk_size", c.min_chunk_size);
            read(j, "overlap_size", c.overlap_size);
            read(j, "max_tokens", c.max_tokens);
            read(j, "chars_per_token", c.chars_per_token);
            read(j, "preserve_headers", c.preserve_headers);
            read(j, "max_split_depth", c.max_split_depth);
            if (j.contains("oversize_policy")) {
                std::string policy = j["oversize_policy"];
                if (policy == "drop") c.oversize_policy = ChunkConfig::OversizePolicy::Drop;
                else if (policy == "fail") c.oversize_policy = ChunkConfig::OversizePolicy::Fail;
                else throw ConfigError("Unknown oversize_policy: " + policy);
            }
            return c;
        }

        SegmentConfig parse_segmenting(const nlohmann::json& j) {
            SegmentConfig s;
            read(j, "enabled", s.enabled);
            read(j, "max_file_size", s.max_file_size);
            read(j, "preferred_segment_size", s.preferred_segment_size);
            read(j, "overlap_lines", s.overlap_lines);
            if (j.contains("strategy")) s.strategy = segment_strategy_from_string(j["strategy"]);
            read(j, "lookahead_bytes", s.lookahead_bytes);
            read(j, "size_overlap_line_factor", s.size_overlap_line_factor);
            read(j, "sample_lines", s.sample_lines);
            read(j, "min_lines_per_segment", s.min_lines_per_segment);
            if (j.contains("temp_dir")) s.temp_dir = j["temp_dir"].get<std::string>();
            return s;
        }

    }

    Config Config::from_json(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) throw ConfigError("Config root must be an object");

        try {
            if (j.contains("memory_mode")) {
                std::string mode = j["memory_mode"];
                if (mode == "ram") cfg.memory_mode = MemoryMode::RAM;
                else if (mode == "disk") cfg.memory_mode = MemoryMode::DISK;
                else throw ConfigError("Unknown memory_mode: " + mode);
            }
            if (j.contains("database")) cfg.database = j["database"].get<std::string>();
            read(j, "log_level", cfg.log_level);

            if (j.contains("tokenizer")) {
                read(j["tokenizer"], "vocab", cfg.tokenizer_vocab);
                read(j["tokenizer"], "chars_per_token", cfg.ingestion.chunking.chars_per_token);
            }

            if (j.contains("embedding")) {
                const auto& e = j["embedding"];
                read(e, "backend", cfg.embedding.backend);
                read(e, "model", cfg.embedding.model);
                read(e, "endpoint", cfg.embedding.endpoint);
                read(e, "openai_key", cfg.embedding.openai_key);
                read(e, "openai_base_url", cfg.embedding.openai_base_url);
                read(e, "onnx_model", cfg.embedding.onnx_model);
                read(e, "onnx_vocab", cfg.embedding.onnx_vocab);
                read(e, "timeout_seconds", cfg.embedding.timeout_seconds);
            }

            if (j.contains("chunking")) {
                double cpt = cfg.ingestion.chunking.chars_per_token;
                cfg.ingestion.chunking = parse_chunking(j["chunking"]);
                if (!j["chunking"].contains("chars_per_token")) cfg.ingestion.chunking.chars_per_token = cpt;
            }
            if (j.contains("segmenting")) cfg.ingestion.segmenting = parse_segmenting(j["segmenting"]);

            if (j.contains("ingestion")) {
                const auto& i = j["ingestion"];
                read(i, "skip_existing", cfg.ingestion.skip_existing);
                read(i, "update_existing", cfg.ingestion.update_existing);
                read(i, "max_workers", cfg.ingestion.max_workers);
                read(i, "segmentation_fallback", cfg.ingestion.segmentation_fallback);
            }

            if (j.contains("retrieval")) {
                const auto& r = j["retrieval"];
                read(r, "max_results", cfg.retrieval.max_results);
                read(r, "min_similarity", cfg.retrieval.min_similarity);
                read(r, "context_size", cfg.retrieval.context_size);
                if (r.contains("distance")) cfg.retrieval.metric = metric_from_string(r["distance"]);
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("Invalid config value: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }

        if (cfg.ingestion.chunking.max_chunk_size == 0 || cfg.ingestion.chunking.max_tokens == 0) {
            throw ConfigError("chunking.max_chunk_size and chunking.max_tokens must be positive");
        }
        if (cfg.ingestion.chunking.min_chunk_size > cfg.ingestion.chunking.max_chunk_size) {
            throw ConfigError("chunking.min_chunk_size exceeds max_chunk_size");
        }
        if (cfg.ingestion.segmenting.preferred_segment_size == 0) {
            throw ConfigError("segmenting.preferred_segment_size must be positive");
        }
        if (cfg.ingestion.max_workers == 0) cfg.ingestion.max_workers = 1;
        return cfg;
    }

    Config Config::load(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) return Config{};

        std::ifstream f(path);
        if (!f) throw ConfigError("Cannot read config: " + path.string());
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(f);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("Malformed config " + path.string() + ": " + e.what());
        }
        return from_json(j);
    }

    nlohmann::json Config::to_json() const {
        const auto& c = ingestion.chunking;
        const auto& s = ingestion.segmenting;
        nlohmann::json j;
        j["memory_mode"] = (memory_mode == MemoryMode::RAM) ? "ram" : "disk";
        if (!database.empty()) j["database"] = database.string();
        j["log_level"] = log_level;
        j["tokenizer"] = {{"vocab", tokenizer_vocab}, {"chars_per_token", c.chars_per_token}};
        j["embedding"] = {
            {"backend", embedding.backend},
            {"model", embedding.model},
            {"endpoint", embedding.endpoint},
            {"openai_base_url", embedding.openai_base_url},
            {"onnx_model", embedding.onnx_model},
            {"onnx_vocab", embedding.onnx_vocab},
            {"timeout_seconds", embedding.timeout_seconds}
        };
        if (!embedding.openai_key.empty()) j["embedding"]["openai_key"] = embedding.openai_key;
        j["chunking"] = {
            {"strategy", engine::to_string(c.strategy)},
            {"max_chunk_size", c.max_chunk_size},
            {"min_chunk_size", c.min_chunk_size},
            {"overlap_size", c.overlap_size},
            {"max_tokens", c.max_tokens},
            {"chars_per_token", c.chars_per_token},
            {"preserve_headers", c.preserve_headers},
            {"max_split_depth", c.max_split_depth},
            {"oversize_policy", c.oversize_policy == ChunkConfig::OversizePolicy::Drop ? "drop" : "fail"}
        };
        j["segmenting"] = {
            {"enabled", s.enabled},
            {"max_file_size", s.max_file_size},
            {"preferred_segment_size", s.preferred_segment_size},
            {"overlap_lines", s.overlap_lines},
            {"strategy", to_string(s.strategy)},
            {"lookahead_bytes", s.lookahead_bytes},
            {"size_overlap_line_factor", s.size_overlap_line_factor},
            {"sample_lines", s.sample_lines},
            {"min_lines_per_segment", s.min_lines_per_segment},
            {"temp_dir", s.temp_dir.string()}
        };
        j["ingestion"] = {
            {"skip_existing", ingestion.skip_existing},
            {"update_existing", ingestion.update_existing},
            {"max_workers", ingestion.max_workers},
            {"segmentation_fallback", ingestion.segmentation_fallback}
        };
        j["retrieval"] = {
            {"max_results", retrieval.max_results},
            {"min_similarity", retrieval.min_similarity},
            {"context_size", retrieval.context_size},
            {"distance", engine::to_string(retrieval.metric)}
        };
        return j;
    }

    void Config::save(const std::filesystem::path& path) const {
        std::ofstream f(path);
        if (!f) throw ConfigError("Cannot write config: " + path.string());
        f << to_json().dump(4);
    }

    void Config::apply_environment() {
        const char* env_openai_key = std::getenv("OPENAI_API_KEY");
        if (env_openai_key && *env_openai_key) embedding.openai_key = env_openai_key;
    }

}
