#include <gtest/gtest.h>
#include "engine/file_segmenter.hpp"
#include "test_support.hpp"

using namespace lectern::engine;
using lectern::test::TempDir;
using lectern::test::read_file;

namespace {

    std::string fixed_lines(size_t count, size_t width, char fill = 'x') {
        std::string out;
        out.reserve(count * width);
        for (size_t i = 0; i < count; ++i) {
            out.append(width - 1, fill);
            out.push_back('\n');
        }
        return out;
    }

    SegmentConfig config_in(const TempDir& dir) {
        SegmentConfig c;
        c.temp_dir = dir.path() / "segments";
        return c;
    }

}

TEST(FileSegmenter, SizeBasedSegmentsEndAtLineBreaks) {
    TempDir dir;
    const std::string content = fixed_lines(3072, 100);
    auto file = dir.write("big.txt", content);

    SegmentConfig config = config_in(dir);
    config.max_file_size = 102400;
    config.preferred_segment_size = 51200;
    FileSegmenter segmenter(config);

    ASSERT_TRUE(segmenter.should_segment(file));
    auto set = segmenter.segment(file);

    ASSERT_EQ(set.size(), 6u);
    std::string joined;
    for (size_t i = 0; i < set.size(); ++i) {
        const auto& seg = set[i];
        EXPECT_EQ(seg.index, i);
        EXPECT_LE(seg.size, config.max_file_size);
        std::string body = read_file(seg.path);
        ASSERT_FALSE(body.empty());
        EXPECT_EQ(body.back(), '\n');
        EXPECT_EQ(body.size(), seg.size);
        joined += body;
    }
    EXPECT_EQ(set[0].size, 51300u);
    EXPECT_EQ(set[5].size, 50700u);
    EXPECT_EQ(joined, content);
}

TEST(FileSegmenter, SegmentFilesAreRemovedWithTheSet) {
    TempDir dir;
    auto file = dir.write("big.txt", fixed_lines(200, 50));

    SegmentConfig config = config_in(dir);
    config.preferred_segment_size = 2000;
    FileSegmenter segmenter(config);

    std::filesystem::path run_dir;
    std::filesystem::path first_segment;
    {
        auto set = segmenter.segment(file);
        ASSERT_FALSE(set.empty());
        run_dir = set.directory();
        first_segment = set[0].path;
        EXPECT_TRUE(std::filesystem::exists(first_segment));
        EXPECT_EQ(first_segment.filename().string(), "big_segment_0.txt");
    }
    EXPECT_FALSE(std::filesystem::exists(first_segment));
    EXPECT_FALSE(std::filesystem::exists(run_dir));
}

TEST(FileSegmenter, ReleaseIsIdempotent) {
    TempDir dir;
    auto file = dir.write("big.txt", fixed_lines(100, 50));
    SegmentConfig config = config_in(dir);
    config.preferred_segment_size = 1000;

    auto set = FileSegmenter(config).segment(file);
    auto run_dir = set.directory();
    set.release();
    set.release();
    EXPECT_FALSE(std::filesystem::exists(run_dir));
    EXPECT_TRUE(set.empty());
}

TEST(FileSegmenter, EmptyFileYieldsNoSegments) {
    TempDir dir;
    auto file = dir.write("empty.txt", "");
    FileSegmenter segmenter(config_in(dir));
    EXPECT_TRUE(segmenter.segment(file).empty());
}

TEST(FileSegmenter, OnlyLargeTextFilesAreSegmented) {
    TempDir dir;
    SegmentConfig config = config_in(dir);
    config.max_file_size = 1000;
    FileSegmenter segmenter(config);

    EXPECT_FALSE(segmenter.should_segment(dir.write("small.txt", fixed_lines(5, 50))));
    EXPECT_TRUE(segmenter.should_segment(dir.write("large.md", fixed_lines(50, 50))));
    EXPECT_FALSE(segmenter.should_segment(dir.write("large.py", fixed_lines(50, 50))));

    config.enabled = false;
    EXPECT_FALSE(FileSegmenter(config).should_segment(dir.path() / "large.md"));
}

TEST(FileSegmenter, LineBasedSegmentsOverlap) {
    TempDir dir;
    auto file = dir.write("log.txt", fixed_lines(100, 60));

    SegmentConfig config = config_in(dir);
    config.strategy = SegmentConfig::Strategy::LineBased;
    config.preferred_segment_size = 1200;
    config.min_lines_per_segment = 1;
    config.overlap_lines = 5;
    auto set = FileSegmenter(config).segment(file);

    ASSERT_EQ(set.size(), 7u);
    EXPECT_EQ(*set[0].line_start, 1u);
    EXPECT_EQ(*set[0].line_end, 20u);
    EXPECT_EQ(*set[6].line_end, 100u);
    for (size_t i = 1; i < set.size(); ++i) {
        EXPECT_EQ(*set[i].line_start + 4, *set[i - 1].line_end);
    }
}

TEST(FileSegmenter, OversizedMarkdownSectionIsSplitIntoSubChunks) {
    TempDir dir;
    std::string content = "## Alpha\nintro line\n";
    content += "## Beta\n" + fixed_lines(800, 100, 'b');
    content += "## Gamma\nclosing line\n";
    auto file = dir.write("guide.md", content);

    SegmentConfig config = config_in(dir);
    config.preferred_segment_size = 51200;
    config.overlap_lines = 50;
    auto set = FileSegmenter(config).segment(file);

    ASSERT_EQ(set.size(), 4u);
    EXPECT_EQ(*set[0].section_title, "Alpha");
    EXPECT_FALSE(set[0].sub_chunk);

    for (size_t i : {1u, 2u}) {
        ASSERT_TRUE(set[i].section_title.has_value());
        EXPECT_EQ(*set[i].section_title, "Beta");
        EXPECT_EQ(*set[i].header_level, 2);
        EXPECT_TRUE(set[i].sub_chunk);
        EXPECT_LE(set[i].size, config.preferred_segment_size);
    }
    EXPECT_EQ(set[1].sub_index, 0u);
    EXPECT_EQ(set[2].sub_index, 1u);

    auto meta = set[2].metadata();
    EXPECT_EQ(meta["section_title"], "Beta");
    EXPECT_EQ(meta["sub_chunk"], true);
    EXPECT_EQ(meta["sub_index"], 1);

    EXPECT_EQ(*set[3].section_title, "Gamma");
    EXPECT_FALSE(set[3].sub_chunk);
}

TEST(FileSegmenter, CarriedLinesNeverPushASubChunkPastPreferredSize) {
    TempDir dir;
    std::string content = "# Head\n" + fixed_lines(9, 100);
    content += fixed_lines(1, 600, 'm') + fixed_lines(3, 100);
    content += fixed_lines(1, 1500, 'w') + fixed_lines(2, 100);
    auto file = dir.write("long.md", content);

    SegmentConfig config = config_in(dir);
    config.preferred_segment_size = 1000;
    config.overlap_lines = 50;
    auto set = FileSegmenter(config).segment(file);

    ASSERT_EQ(set.size(), 5u);
    EXPECT_EQ(set[0].size, 907u);
    EXPECT_EQ(set[1].size, 1000u);
    EXPECT_EQ(*set[1].line_start, 7u);
    for (size_t i = 0; i < set.size(); ++i) {
        EXPECT_TRUE(set[i].sub_chunk);
        if (*set[i].line_start != *set[i].line_end) {
            EXPECT_LE(set[i].size, config.preferred_segment_size) << "segment " << i;
        }
    }
    // A single line longer than the preferred size is never cut.
    EXPECT_EQ(set[3].size, 1500u);
    EXPECT_EQ(*set[3].line_start, *set[3].line_end);
}

TEST(FileSegmenter, MarkdownWithoutHeadersFallsBackToLines) {
    TempDir dir;
    auto file = dir.write("notes.md", fixed_lines(100, 60));

    SegmentConfig config = config_in(dir);
    config.preferred_segment_size = 1200;
    config.min_lines_per_segment = 1;
    config.overlap_lines = 5;
    auto set = FileSegmenter(config).segment(file);

    ASSERT_EQ(set.size(), 7u);
    EXPECT_FALSE(set[0].section_title.has_value());
    EXPECT_TRUE(set[0].line_start.has_value());
}
