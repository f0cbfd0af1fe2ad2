#include <gtest/gtest.h>
#include <chrono>
#include "engine/database.hpp"
#include "lectern/errors.hpp"
#include "test_support.hpp"

using namespace lectern::engine;
using lectern::test::make_info;
using lectern::test::make_record;
using lectern::test::TempDir;

namespace {

    class DatabaseTest : public ::testing::Test {
    protected:
        void SetUp() override { db.open(":memory:"); }

        int64_t add_document(const std::string& name, const std::string& hash,
                             std::vector<std::pair<std::string, std::vector<float>>> chunks,
                             const std::string& content_type = "text") {
            int64_t id = db.create_document(make_info(name, hash, content_type));
            std::vector<ChunkRecord> records;
            for (size_t i = 0; i < chunks.size(); ++i) {
                records.push_back(make_record(i, chunks[i].first, chunks[i].second));
            }
            db.replace_chunks(id, records);
            return id;
        }

        Database db;
    };

    int64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

}

TEST_F(DatabaseTest, CreateAndFindDocument) {
    int64_t id = db.create_document(make_info("a.txt", "hash-a"), {{"extension", ".txt"}});
    EXPECT_GT(id, 0);

    auto doc = db.find_by_hash("hash-a");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->id, id);
    EXPECT_EQ(doc->info.filename, "a.txt");
    EXPECT_EQ(doc->info.content_type, "text");
    EXPECT_EQ(doc->info.last_modified, 1000);
    EXPECT_EQ(doc->status, DocumentStatus::Pending);
    EXPECT_EQ(doc->chunk_count, 0);
    EXPECT_EQ(doc->metadata["extension"], ".txt");

    EXPECT_FALSE(db.find_by_hash("missing").has_value());
    EXPECT_FALSE(db.get_document(id + 100).has_value());
}

TEST_F(DatabaseTest, HashIsUnique) {
    db.create_document(make_info("a.txt", "same"));
    EXPECT_THROW(db.create_document(make_info("b.txt", "same")), StorageError);
}

TEST_F(DatabaseTest, UpdateStatus) {
    int64_t id = db.create_document(make_info("a.txt", "h"));
    db.update_status(id, DocumentStatus::Failed, 0);
    EXPECT_EQ(db.get_document(id)->status, DocumentStatus::Failed);
    EXPECT_EQ(db.get_document(id)->chunk_count, 0);
}

TEST_F(DatabaseTest, RefreshedFileStatsLandOnlyWithTheCommit) {
    int64_t id = add_document("a.txt", "h", {{"old", {1, 0}}});
    auto info = make_info("renamed.txt", "h");
    info.last_modified = 5000;

    {
        auto batch = db.begin_chunk_batch(id);
        batch->refresh_document(info);
        batch->append({make_record(0, "new", {0, 1})});
    }
    EXPECT_EQ(db.get_document(id)->info.filename, "a.txt");
    EXPECT_EQ(db.get_document(id)->info.last_modified, 1000);

    auto batch = db.begin_chunk_batch(id);
    batch->refresh_document(info);
    batch->append({make_record(0, "new", {0, 1})});
    batch->commit();

    auto doc = db.get_document(id);
    EXPECT_EQ(doc->info.filename, "renamed.txt");
    EXPECT_EQ(doc->info.last_modified, 5000);
    EXPECT_EQ(doc->chunk_count, 1);
}

TEST_F(DatabaseTest, CommittedBatchIsVisibleAndMarksProcessed) {
    int64_t id = add_document("a.txt", "h", {{"zero", {1, 0}}, {"one", {0, 1}}});

    auto doc = db.get_document(id);
    EXPECT_EQ(doc->status, DocumentStatus::Processed);
    EXPECT_EQ(doc->chunk_count, 2);

    auto chunks = db.chunks_for_document(id);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].content, "zero");
    EXPECT_EQ(chunks[1].chunk_index, 1u);
    EXPECT_EQ(chunks[0].filename, "a.txt");
    EXPECT_EQ(chunks[0].embedding, (std::vector<float>{1, 0}));
    EXPECT_EQ(db.vector_count(), 2u);

    EXPECT_EQ(db.chunks_for_document(id, 1).size(), 1u);
}

TEST_F(DatabaseTest, UncommittedBatchIsInvisibleAndDiscarded) {
    int64_t id = add_document("a.txt", "h", {{"old", {1, 0}}});
    {
        auto batch = db.begin_chunk_batch(id);
        batch->append({make_record(0, "new-0", {0, 1}), make_record(1, "new-1", {0, 1})});
        EXPECT_EQ(batch->staged(), 2u);

        auto visible = db.chunks_for_document(id);
        ASSERT_EQ(visible.size(), 1u);
        EXPECT_EQ(visible[0].content, "old");
    }

    auto chunks = db.chunks_for_document(id);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, "old");
    EXPECT_EQ(db.get_document(id)->chunk_count, 1);
    EXPECT_EQ(db.vector_count(), 1u);
}

TEST_F(DatabaseTest, CommitReplacesWholeChunkSet) {
    int64_t id = add_document("a.txt", "h", {{"a", {1, 0}}, {"b", {1, 0}}, {"c", {1, 0}}});
    auto old_ids = db.chunks_for_document(id);

    auto result = db.replace_chunks(id, {make_record(0, "x", {0, 1})});
    EXPECT_EQ(result.added.size(), 1u);
    ASSERT_EQ(result.removed.size(), 3u);
    EXPECT_EQ(result.removed[0], old_ids[0].id);

    auto chunks = db.chunks_for_document(id);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, "x");
    EXPECT_EQ(db.get_document(id)->chunk_count, 1);
    EXPECT_FALSE(db.get_chunk(old_ids[0].id).has_value());
}

TEST_F(DatabaseTest, BatchForUnknownDocumentThrows) {
    EXPECT_THROW(db.begin_chunk_batch(999), StorageError);
}

TEST_F(DatabaseTest, DeleteCascadesToChunks) {
    int64_t id = add_document("a.txt", "h", {{"a", {1, 0}}, {"b", {0, 1}}});
    int64_t chunk_id = db.chunks_for_document(id)[0].id;

    EXPECT_TRUE(db.delete_document("h"));
    EXPECT_FALSE(db.get_document(id).has_value());
    EXPECT_FALSE(db.get_chunk(chunk_id).has_value());
    EXPECT_EQ(db.vector_count(), 0u);
    EXPECT_FALSE(db.delete_document("h"));
}

TEST_F(DatabaseTest, SimilarityIsAscendingByDistanceThenId) {
    add_document("a.txt", "ha", {{"exact", {1, 0}}, {"far", {0, 1}}});
    add_document("b.txt", "hb", {{"tie-1", {1, 1}}, {"tie-2", {1, 1}}});

    auto ranked = db.similarity_query({1, 0}, DistanceMetric::L2, {}, 10);
    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0].chunk.content, "exact");
    EXPECT_DOUBLE_EQ(ranked[0].distance, 0.0);
    EXPECT_EQ(ranked[1].chunk.content, "tie-1");
    EXPECT_EQ(ranked[2].chunk.content, "tie-2");
    EXPECT_LT(ranked[1].chunk.id, ranked[2].chunk.id);
    EXPECT_EQ(ranked[3].chunk.content, "far");
    for (size_t i = 1; i < ranked.size(); ++i) EXPECT_LE(ranked[i - 1].distance, ranked[i].distance);

    EXPECT_EQ(db.similarity_query({1, 0}, DistanceMetric::L2, {}, 2).size(), 2u);
    EXPECT_TRUE(db.similarity_query({1, 0}, DistanceMetric::L2, {}, 0).empty());
}

TEST_F(DatabaseTest, CosineDistanceIgnoresMagnitude) {
    add_document("a.txt", "ha", {{"scaled", {3, 0}}, {"orthogonal", {0, 2}}});
    auto ranked = db.similarity_query({1, 0}, DistanceMetric::Cosine, {}, 10);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].chunk.content, "scaled");
    EXPECT_NEAR(ranked[0].distance, 0.0, 1e-9);
    EXPECT_NEAR(ranked[1].distance, 1.0, 1e-9);
}

TEST_F(DatabaseTest, FiltersRestrictCandidates) {
    int64_t a = add_document("a.txt", "ha", {{"text chunk", {1, 0}}}, "text");
    add_document("b.py", "hb", {{"code chunk", {1, 0}}}, "code");

    SearchFilters by_doc;
    by_doc.document_ids = {a};
    auto ranked = db.similarity_query({1, 0}, DistanceMetric::L2, by_doc, 10);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].chunk.document_id, a);

    SearchFilters by_type;
    by_type.content_types = {"code"};
    ranked = db.similarity_query({1, 0}, DistanceMetric::L2, by_type, 10);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].chunk.content, "code chunk");

    SearchFilters past;
    past.date_range = std::make_pair(int64_t{0}, int64_t{1000});
    EXPECT_TRUE(db.similarity_query({1, 0}, DistanceMetric::L2, past, 10).empty());

    SearchFilters recent;
    recent.date_range = std::make_pair(now_ms() - 60000, now_ms() + 60000);
    EXPECT_EQ(db.similarity_query({1, 0}, DistanceMetric::L2, recent, 10).size(), 2u);
}

TEST_F(DatabaseTest, ExcludedChunkAndMismatchedDimensionsAreSkipped) {
    int64_t id = add_document("a.txt", "ha", {{"self", {1, 0}}, {"other", {0, 1}}});
    add_document("b.txt", "hb", {{"wide", {1, 0, 0}}});
    int64_t self_id = db.chunks_for_document(id)[0].id;

    auto ranked = db.similarity_query({1, 0}, DistanceMetric::L2, {}, 10, self_id);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].chunk.content, "other");
}

TEST_F(DatabaseTest, GetChunksKeepsRequestedOrder) {
    int64_t id = add_document("a.txt", "ha", {{"a", {1, 0}}, {"b", {0, 1}}});
    auto chunks = db.chunks_for_document(id);

    auto fetched = db.get_chunks({chunks[1].id, 424242, chunks[0].id});
    ASSERT_EQ(fetched.size(), 2u);
    EXPECT_EQ(fetched[0].content, "b");
    EXPECT_EQ(fetched[1].content, "a");
}

TEST_F(DatabaseTest, StatsCountVisibleChunks) {
    add_document("a.txt", "ha", {{"a", {1, 0}}, {"b", {0, 1}}});
    add_document("b.py", "hb", {{"c", {1, 0}}}, "code");
    int64_t failed = db.create_document(make_info("c.txt", "hc"));
    db.update_status(failed, DocumentStatus::Failed, 0);

    auto stats = db.aggregate_stats();
    EXPECT_EQ(stats.total_documents, 3);
    EXPECT_EQ(stats.total_chunks, 3);

    int64_t processed = 0;
    for (const auto& [status, count] : stats.documents_by_status) {
        if (status == "processed") processed = count;
    }
    EXPECT_EQ(processed, 2);

    int64_t code = 0;
    for (const auto& [type, count] : stats.documents_by_content_type) {
        if (type == "code") code = count;
    }
    EXPECT_EQ(code, 1);
}

TEST_F(DatabaseTest, ForEachVectorVisitsVisibleChunks) {
    add_document("a.txt", "ha", {{"a", {1, 0}}, {"b", {0, 1}}});
    size_t seen = 0;
    db.for_each_vector([&](int64_t, const std::vector<float>& v) {
        EXPECT_EQ(v.size(), 2u);
        ++seen;
    });
    EXPECT_EQ(seen, 2u);
}

TEST(Database, PersistsAcrossReopen) {
    TempDir dir;
    auto path = dir.path() / "nested" / "lectern.db";
    {
        Database db;
        db.open(path);
        int64_t id = db.create_document(make_info("a.txt", "h"));
        db.replace_chunks(id, {make_record(0, "kept", {1, 0})});
    }
    Database db;
    db.open(path);
    auto doc = db.find_by_hash("h");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(db.chunks_for_document(doc->id).at(0).content, "kept");
}

TEST(Database, OperationsOnClosedStoreLoseConnection) {
    Database db;
    try {
        db.find_by_hash("h");
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_TRUE(e.connection_lost());
    }
}
