#include <gtest/gtest.h>
#include <cstdlib>
#include "engine/config.hpp"
#include "lectern/errors.hpp"
#include "test_support.hpp"

using namespace lectern::engine;
using lectern::test::TempDir;

TEST(Config, MissingFileYieldsDefaults) {
    TempDir dir;
    auto cfg = Config::load(dir.path() / "config.json");

    EXPECT_EQ(cfg.memory_mode, Config::MemoryMode::DISK);
    EXPECT_EQ(cfg.embedding.backend, "ollama");
    EXPECT_EQ(cfg.ingestion.chunking.strategy, ChunkStrategy::SentenceBased);
    EXPECT_EQ(cfg.ingestion.chunking.max_chunk_size, 1000u);
    EXPECT_EQ(cfg.ingestion.chunking.min_chunk_size, 100u);
    EXPECT_EQ(cfg.ingestion.chunking.overlap_size, 100u);
    EXPECT_TRUE(cfg.ingestion.skip_existing);
    EXPECT_FALSE(cfg.ingestion.update_existing);
    EXPECT_EQ(cfg.ingestion.segmenting.max_file_size, 100ull * 1024 * 1024);
    EXPECT_EQ(cfg.ingestion.segmenting.preferred_segment_size, 50ull * 1024 * 1024);
    EXPECT_EQ(cfg.ingestion.segmenting.overlap_lines, 50u);
    EXPECT_EQ(cfg.retrieval.max_results, 5u);
    EXPECT_DOUBLE_EQ(cfg.retrieval.min_similarity, 0.3);
    EXPECT_EQ(cfg.retrieval.metric, DistanceMetric::L2);
}

TEST(Config, ParsesSections) {
    auto cfg = Config::from_json(nlohmann::json::parse(R"({
        "memory_mode": "ram",
        "log_level": "debug",
        "tokenizer": {"vocab": "/models/vocab.txt", "chars_per_token": 3.5},
        "embedding": {"backend": "openai", "model": "text-embedding-3-small"},
        "chunking": {"strategy": "paragraph_based", "max_chunk_size": 500, "min_chunk_size": 50,
                     "max_tokens": 128, "oversize_policy": "fail"},
        "segmenting": {"strategy": "line_based", "overlap_lines": 10},
        "ingestion": {"update_existing": true, "max_workers": 2},
        "retrieval": {"max_results": 7, "distance": "cosine", "min_similarity": 0.5}
    })"));

    EXPECT_EQ(cfg.memory_mode, Config::MemoryMode::RAM);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.tokenizer_vocab, "/models/vocab.txt");
    EXPECT_DOUBLE_EQ(cfg.ingestion.chunking.chars_per_token, 3.5);
    EXPECT_EQ(cfg.embedding.backend, "openai");
    EXPECT_EQ(cfg.ingestion.chunking.strategy, ChunkStrategy::ParagraphBased);
    EXPECT_EQ(cfg.ingestion.chunking.max_chunk_size, 500u);
    EXPECT_EQ(cfg.ingestion.chunking.max_tokens, 128u);
    EXPECT_EQ(cfg.ingestion.chunking.oversize_policy, ChunkConfig::OversizePolicy::Fail);
    EXPECT_EQ(cfg.ingestion.segmenting.strategy, SegmentConfig::Strategy::LineBased);
    EXPECT_EQ(cfg.ingestion.segmenting.overlap_lines, 10u);
    EXPECT_TRUE(cfg.ingestion.update_existing);
    EXPECT_EQ(cfg.ingestion.max_workers, 2u);
    EXPECT_EQ(cfg.retrieval.max_results, 7u);
    EXPECT_EQ(cfg.retrieval.metric, DistanceMetric::Cosine);
    EXPECT_DOUBLE_EQ(cfg.retrieval.min_similarity, 0.5);
}

TEST(Config, SaveThenLoadKeepsValues) {
    TempDir dir;
    Config cfg;
    cfg.memory_mode = Config::MemoryMode::RAM;
    cfg.ingestion.chunking.max_chunk_size = 321;
    cfg.retrieval.metric = DistanceMetric::Cosine;
    cfg.save(dir.path() / "config.json");

    auto loaded = Config::load(dir.path() / "config.json");
    EXPECT_EQ(loaded.memory_mode, Config::MemoryMode::RAM);
    EXPECT_EQ(loaded.ingestion.chunking.max_chunk_size, 321u);
    EXPECT_EQ(loaded.retrieval.metric, DistanceMetric::Cosine);
}

TEST(Config, MalformedFileIsConfigError) {
    TempDir dir;
    auto path = dir.write("config.json", "{ not json");
    EXPECT_THROW(Config::load(path), ConfigError);
}

TEST(Config, InvalidValuesAreConfigErrors) {
    using nlohmann::json;
    EXPECT_THROW(Config::from_json(json::array()), ConfigError);
    EXPECT_THROW(Config::from_json(json{{"memory_mode", "tape"}}), ConfigError);
    EXPECT_THROW(Config::from_json(json{{"chunking", {{"strategy", "random"}}}}), ConfigError);
    EXPECT_THROW(Config::from_json(json{{"chunking", {{"max_chunk_size", 0}}}}), ConfigError);
    EXPECT_THROW(Config::from_json(json{{"chunking", {{"max_chunk_size", 50}, {"min_chunk_size", 60}}}}), ConfigError);
    EXPECT_THROW(Config::from_json(json{{"retrieval", {{"distance", "manhattan"}}}}), ConfigError);
    EXPECT_THROW(Config::from_json(json{{"retrieval", {{"max_results", "many"}}}}), ConfigError);
    EXPECT_THROW(Config::from_json(json{{"segmenting", {{"preferred_segment_size", 0}}}}), ConfigError);
}

TEST(Config, EnvironmentSuppliesOpenAiKey) {
    ::setenv("OPENAI_API_KEY", "sk-test", 1);
    Config cfg;
    cfg.apply_environment();
    EXPECT_EQ(cfg.embedding.openai_key, "sk-test");
    ::unsetenv("OPENAI_API_KEY");
}
