#include <gtest/gtest.h>
#include "engine/tokenizer.hpp"
#include "lectern/errors.hpp"
#include "test_support.hpp"

using namespace lectern::engine;
using lectern::test::TempDir;

namespace {

    std::string write_vocab(const TempDir& dir) {
        return dir.write("vocab.txt", "hello\nworld\nplay\n##ing\n,\n").string();
    }

}

TEST(CharRatioTokenCounter, RoundsUp) {
    CharRatioTokenCounter counter(4.0);
    EXPECT_EQ(counter.count(""), 0u);
    EXPECT_EQ(counter.count("abcd"), 1u);
    EXPECT_EQ(counter.count("abcde"), 2u);

    CharRatioTokenCounter fallback(0.0);
    EXPECT_EQ(fallback.count("abcdefgh"), 2u);
}

TEST(Tokenizer, CountsWordPieces) {
    TempDir dir;
    Tokenizer tokenizer(write_vocab(dir));
    EXPECT_EQ(tokenizer.vocab_size(), 5u);
    EXPECT_EQ(tokenizer.count("Hello, playing world"), 5u);
    EXPECT_EQ(tokenizer.count("   "), 0u);
}

TEST(Tokenizer, EncodesWithSpecialTokens) {
    TempDir dir;
    Tokenizer tokenizer(write_vocab(dir));

    auto ids = tokenizer.encode("Hello, playing world");
    EXPECT_EQ(ids, (std::vector<int64_t>{101, 0, 4, 2, 3, 1, 102}));

    auto unknown = tokenizer.encode("zzz");
    EXPECT_EQ(unknown, (std::vector<int64_t>{101, 100, 102}));
}

TEST(Tokenizer, EncodeTruncatesToMaxLength) {
    TempDir dir;
    Tokenizer tokenizer(write_vocab(dir));
    auto ids = tokenizer.encode("hello world hello world hello", 4);
    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids.front(), 101);
    EXPECT_EQ(ids.back(), 102);
}

TEST(Tokenizer, MissingVocabIsConfigError) {
    EXPECT_THROW(Tokenizer("/nonexistent/vocab.txt"), ConfigError);
}

TEST(TokenCounterFactory, FallsBackWithoutVocab) {
    TempDir dir;
    auto estimate = create_token_counter("", 2.0);
    EXPECT_EQ(estimate->count("abcdef"), 3u);

    auto missing = create_token_counter((dir.path() / "absent.txt").string(), 2.0);
    EXPECT_EQ(missing->count("abcdef"), 3u);

    auto exact = create_token_counter(write_vocab(dir), 2.0);
    EXPECT_EQ(exact->count("hello world"), 2u);
}
