#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "config.hpp"
#include "lectern/types.hpp"

namespace lectern::engine {

    /**
     * @brief Owns the temp files of one segmentation run.
     * The run directory and everything in it is removed when the set is destroyed.
     */
    class SegmentSet {
    public:
        SegmentSet() = default;
        explicit SegmentSet(std::filesystem::path directory);
        ~SegmentSet();

        SegmentSet(const SegmentSet&) = delete;
        SegmentSet& operator=(const SegmentSet&) = delete;
        SegmentSet(SegmentSet&& other) noexcept;
        SegmentSet& operator=(SegmentSet&& other) noexcept;

        const std::vector<FileSegment>& segments() const { return m_segments; }
        const FileSegment& operator[](size_t i) const { return m_segments[i]; }
        size_t size() const { return m_segments.size(); }
        bool empty() const { return m_segments.empty(); }
        std::vector<FileSegment>::const_iterator begin() const { return m_segments.begin(); }
        std::vector<FileSegment>::const_iterator end() const { return m_segments.end(); }

        const std::filesystem::path& directory() const { return m_directory; }

        void add(FileSegment segment) { m_segments.push_back(std::move(segment)); }

        /**
         * @brief Deletes the run directory now. Safe to call more than once.
         */
        void release();

    private:
        std::filesystem::path m_directory;
        std::vector<FileSegment> m_segments;
    };

    /**
     * @brief Splits oversized text files into bounded byte ranges before extraction.
     */
    class FileSegmenter {
    public:
        explicit FileSegmenter(SegmentConfig config = {});

        /**
         * @brief True for .txt .md .markdown .rst .log files larger than max_file_size.
         */
        bool should_segment(const std::filesystem::path& path) const;

        /**
         * @brief Segments a file with the strategy its extension selects.
         * Markdown files use sections; everything else uses the configured strategy.
         * An empty file yields an empty set.
         * @throws SegmentationError on I/O failure.
         */
        SegmentSet segment(const std::filesystem::path& path) const;

        static bool is_segmentable(const std::filesystem::path& path);

        const SegmentConfig& config() const { return m_config; }

    private:
        SegmentConfig m_config;

        std::filesystem::path make_run_directory() const;

        void segment_size_based(const std::filesystem::path& path, std::uintmax_t file_size, SegmentSet& set) const;
        void segment_line_based(const std::filesystem::path& path, SegmentSet& set) const;
        void segment_markdown(const std::filesystem::path& path, SegmentSet& set) const;

        std::uintmax_t find_line_break(std::ifstream& file, std::uintmax_t position, std::uintmax_t file_size) const;
        size_t estimate_line_length(const std::filesystem::path& path) const;
    };

}
