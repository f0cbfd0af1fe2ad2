#include <gtest/gtest.h>
#include <map>
#include "engine/database.hpp"
#include "engine/librarian.hpp"
#include "engine/retriever.hpp"
#include "test_support.hpp"

using namespace lectern::engine;
using lectern::test::make_info;
using lectern::test::make_record;

namespace {

    /**
     * @brief Fixed vectors per text, so rankings are known in advance.
     */
    class TableEmbedder : public Embedder {
    public:
        std::map<std::string, std::vector<float>> table;

        std::vector<float> embed(const std::string& text) override {
            auto it = table.find(text);
            if (it == table.end()) throw EmbeddingError("no vector for " + text);
            return it->second;
        }

        size_t dimension() const override { return 3; }
    };

    class RetrieverTest : public ::testing::Test {
    protected:
        void SetUp() override {
            db.open(":memory:");
            embedder.table = {
                {"red", {1, 0, 0}},
                {"orange", {0.9f, 0.1f, 0}},
                {"yellow", {0.5f, 0.5f, 0}},
                {"green", {0, 1, 0}},
                {"blue", {0, 0, 1}},
            };
            colours = add("colours.txt", "h1", "text", {"red", "orange", "yellow"});
            code = add("palette.py", "h2", "code", {"green", "blue"});
        }

        int64_t add(const std::string& name, const std::string& hash, const std::string& type,
                    const std::vector<std::string>& texts) {
            int64_t id = db.create_document(make_info(name, hash, type));
            std::vector<ChunkRecord> records;
            for (size_t i = 0; i < texts.size(); ++i) {
                records.push_back(make_record(i, texts[i], embedder.embed(texts[i])));
            }
            db.replace_chunks(id, records);
            return id;
        }

        SearchQuery query(const std::string& text, size_t max_results = 10) {
            SearchQuery q;
            q.text = text;
            q.max_results = max_results;
            return q;
        }

        Database db;
        TableEmbedder embedder;
        int64_t colours = 0;
        int64_t code = 0;
    };

}

TEST_F(RetrieverTest, IdenticalEmbeddingRanksFirstWithFullSimilarity) {
    Retriever retriever(db, embedder);
    auto result = retriever.search(query("red"));

    ASSERT_TRUE(result.has_results());
    EXPECT_EQ(result.best_match()->content, "red");
    EXPECT_DOUBLE_EQ(result.best_match()->similarity_score, 1.0);
    EXPECT_EQ(result.query, "red");
    EXPECT_EQ(result.total_matches, result.matches.size());
    EXPECT_GE(result.search_time_ms, result.embedding_time_ms);
}

TEST_F(RetrieverTest, MatchesAreOrderedAndBounded) {
    Retriever retriever(db, embedder);
    auto result = retriever.search(query("red"));

    ASSERT_EQ(result.matches.size(), 5u);
    std::vector<std::string> order;
    for (const auto& m : result.matches) order.push_back(m.content);
    EXPECT_EQ(order, (std::vector<std::string>{"red", "orange", "yellow", "green", "blue"}));
    for (size_t i = 1; i < result.matches.size(); ++i) {
        EXPECT_GE(result.matches[i - 1].similarity_score, result.matches[i].similarity_score);
    }

    EXPECT_EQ(retriever.search(query("red", 2)).matches.size(), 2u);
    EXPECT_TRUE(retriever.search(query("red", 0)).matches.empty());
}

TEST_F(RetrieverTest, MinSimilarityFiltersAfterRanking) {
    Retriever retriever(db, embedder);
    auto q = query("red");
    q.min_similarity = 0.5;
    auto result = retriever.search(q);

    ASSERT_EQ(result.matches.size(), 3u);
    for (const auto& m : result.matches) EXPECT_GE(m.similarity_score, 0.5);
}

TEST_F(RetrieverTest, ConvenienceSearchesUseRetrievalConfig) {
    RetrievalConfig config;
    config.max_results = 2;
    config.min_similarity = 0.0;
    Retriever retriever(db, embedder, config);

    EXPECT_EQ(retriever.search_documents("red").matches.size(), 2u);
    EXPECT_EQ(retriever.search_documents("red", 4).matches.size(), 4u);
    EXPECT_EQ(retriever.best_matches("red", 3).size(), 3u);
    EXPECT_EQ(retriever.search_recent("red", 30).matches.size(), 2u);
}

TEST_F(RetrieverTest, FiltersRestrictResults) {
    Retriever retriever(db, embedder);

    auto in_doc = retriever.search_in_documents("red", {code}, 10);
    ASSERT_EQ(in_doc.matches.size(), 2u);
    for (const auto& m : in_doc.matches) EXPECT_EQ(m.document_id, code);

    auto by_type = retriever.search_by_content_type("red", {"text"}, 10);
    ASSERT_EQ(by_type.matches.size(), 3u);
    for (const auto& m : by_type.matches) EXPECT_EQ(m.content_type, "text");
}

TEST_F(RetrieverTest, UnknownQueryTextPropagatesEmbeddingError) {
    Retriever retriever(db, embedder);
    EXPECT_THROW(retriever.search(query("purple")), EmbeddingError);
}

TEST_F(RetrieverTest, FindSimilarExcludesTheReferenceChunk) {
    Retriever retriever(db, embedder);
    int64_t red_id = db.chunks_for_document(colours)[0].id;

    auto similar = retriever.find_similar(red_id, 3);
    ASSERT_EQ(similar.size(), 3u);
    EXPECT_EQ(similar[0].content, "orange");
    for (const auto& m : similar) EXPECT_NE(m.chunk_id, red_id);

    EXPECT_TRUE(retriever.find_similar(987654).empty());
}

TEST_F(RetrieverTest, DocumentChunksAreOrderedByIndex) {
    Retriever retriever(db, embedder);
    auto chunks = retriever.get_document_chunks(colours);
    ASSERT_EQ(chunks.size(), 3u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].chunk_index, i);
        EXPECT_DOUBLE_EQ(chunks[i].similarity_score, 0.0);
    }
    EXPECT_EQ(retriever.get_document_chunks(colours, 2).size(), 2u);
}

TEST_F(RetrieverTest, ContextSurroundsTheMatch) {
    RetrievalConfig config;
    config.min_similarity = 0.0;
    Retriever retriever(db, embedder, config);

    auto results = retriever.search_with_context("orange", 1, 1);
    ASSERT_EQ(results.size(), 1u);
    const auto& cm = results[0];
    EXPECT_EQ(cm.main_match.content, "orange");
    EXPECT_EQ(cm.context_start_index, 0u);
    EXPECT_EQ(cm.total_chunks_in_document, 3u);
    ASSERT_EQ(cm.context_chunks.size(), 3u);
    EXPECT_EQ(cm.context_chunks[0].content, "red");
    EXPECT_EQ(cm.context_chunks[1].chunk_id, cm.main_match.chunk_id);
    EXPECT_EQ(cm.context_chunks[2].content, "yellow");

    auto edge = retriever.search_with_context("red", 1, 1);
    ASSERT_EQ(edge.size(), 1u);
    EXPECT_EQ(edge[0].context_chunks.size(), 2u);
}

TEST_F(RetrieverTest, IndexedSearchAgreesWithExactScan) {
    Librarian librarian;
    librarian.rebuild(db);
    ASSERT_EQ(librarian.count(), 5u);

    Retriever exact(db, embedder);
    Retriever indexed(db, embedder, RetrievalConfig{}, &librarian);

    auto a = exact.search(query("orange", 3));
    auto b = indexed.search(query("orange", 3));
    ASSERT_EQ(a.matches.size(), b.matches.size());
    for (size_t i = 0; i < a.matches.size(); ++i) {
        EXPECT_EQ(a.matches[i].chunk_id, b.matches[i].chunk_id);
        EXPECT_DOUBLE_EQ(a.matches[i].similarity_score, b.matches[i].similarity_score);
    }

    auto filtered = indexed.search_in_documents("red", {code}, 10);
    ASSERT_EQ(filtered.matches.size(), 2u);
}

TEST_F(RetrieverTest, ResultSerializesToJson) {
    Retriever retriever(db, embedder);
    auto json = to_json(retriever.search(query("red", 1)));
    EXPECT_EQ(json["query"], "red");
    ASSERT_EQ(json["matches"].size(), 1u);
    EXPECT_EQ(json["matches"][0]["content"], "red");
    EXPECT_EQ(json["matches"][0]["filename"], "colours.txt");
}
