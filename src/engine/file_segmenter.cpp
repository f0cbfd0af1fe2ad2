#include "file_segmenter.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include "lectern/sha256.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <deque>
#include <optional>
#include <unistd.h>

namespace lectern::engine {

    namespace {

        struct Line {
            std::string text;          // raw bytes including the trailing '\n', if any
            std::uintmax_t offset = 0;
            size_t number = 0;         // 1-based
        };

        class LineReader {
        public:
            explicit LineReader(const std::filesystem::path& path) : m_file(path, std::ios::binary) {
                if (!m_file) throw SegmentationError("Cannot open " + path.string());
            }

            bool next(Line& out) {
                std::string text;
                if (!std::getline(m_file, text)) {
                    if (m_file.bad()) throw SegmentationError("Read failed while segmenting");
                    return false;
                }
                if (!m_file.eof()) text.push_back('\n');
                out.offset = m_offset;
                out.number = ++m_number;
                m_offset += text.size();
                out.text = std::move(text);
                return true;
            }

        private:
            std::ifstream m_file;
            std::uintmax_t m_offset = 0;
            size_t m_number = 0;
        };

        std::atomic<uint64_t> g_run_counter{0};

        std::string segment_id(const std::filesystem::path& path, size_t index, std::uintmax_t start, std::uintmax_t end) {
            std::string key = path.string() + ":" + std::to_string(index) + ":" + std::to_string(start) + ":" + std::to_string(end);
            return crypto::SHA256::hash_string(key).substr(0, 12);
        }

        std::filesystem::path segment_path(const SegmentSet& set, const std::filesystem::path& source, size_t index) {
            return set.directory() / (source.stem().string() + "_segment_" + std::to_string(index) + source.extension().string());
        }

        void write_content(const std::filesystem::path& dest, const std::string& content) {
            std::ofstream out(dest, std::ios::binary | std::ios::trunc);
            if (!out) throw SegmentationError("Cannot create segment file " + dest.string());
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            if (!out) throw SegmentationError("Write failed for segment file " + dest.string());
        }

        void copy_range(std::ifstream& source, std::uintmax_t start, std::uintmax_t end, const std::filesystem::path& dest) {
            std::ofstream out(dest, std::ios::binary | std::ios::trunc);
            if (!out) throw SegmentationError("Cannot create segment file " + dest.string());

            source.clear();
            source.seekg(static_cast<std::streamoff>(start));
            std::vector<char> buffer(1 << 20);
            std::uintmax_t remaining = end - start;
            while (remaining > 0) {
                auto want = static_cast<std::streamsize>(std::min<std::uintmax_t>(remaining, buffer.size()));
                source.read(buffer.data(), want);
                std::streamsize got = source.gcount();
                if (got <= 0) throw SegmentationError("Unexpected end of file while copying segment");
                out.write(buffer.data(), got);
                remaining -= static_cast<std::uintmax_t>(got);
            }
            if (!out) throw SegmentationError("Write failed for segment file " + dest.string());
        }

        bool is_fence(const std::string& line) {
            size_t i = 0;
            while (i < line.size() && i < 3 && line[i] == ' ') ++i;
            return line.compare(i, 3, "```") == 0 || line.compare(i, 3, "~~~") == 0;
        }

        /**
         * @brief Matches "#{1,6}<space>title"; returns the level and trimmed title.
         */
        std::optional<std::pair<int, std::string>> parse_header(const std::string& line) {
            size_t level = 0;
            while (level < line.size() && line[level] == '#') ++level;
            if (level == 0 || level > 6 || level >= line.size()) return std::nullopt;
            if (line[level] != ' ' && line[level] != '\t') return std::nullopt;

            size_t start = line.find_first_not_of(" \t", level);
            if (start == std::string::npos) return std::nullopt;
            size_t end = line.find_last_not_of(" \t\r\n");
            if (end == std::string::npos || end < start) return std::nullopt;
            return std::make_pair(static_cast<int>(level), line.substr(start, end - start + 1));
        }

        bool is_blank(const std::string& s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
        }

        std::string join(const std::deque<Line>& lines) {
            std::string out;
            for (const auto& l : lines) out += l.text;
            return out;
        }

        /**
         * @brief Trailing lines to carry into the next segment, capped at half the byte budget.
         */
        std::deque<Line> overlap_tail(const std::deque<Line>& lines, size_t max_lines, std::uintmax_t max_bytes) {
            std::deque<Line> tail;
            std::uintmax_t bytes = 0;
            for (auto it = lines.rbegin(); it != lines.rend() && tail.size() < max_lines; ++it) {
                if (bytes + it->text.size() > max_bytes) break;
                bytes += it->text.size();
                tail.push_front(*it);
            }
            return tail;
        }

    }

    SegmentSet::SegmentSet(std::filesystem::path directory) : m_directory(std::move(directory)) {}

    SegmentSet::~SegmentSet() {
        release();
    }

    SegmentSet::SegmentSet(SegmentSet&& other) noexcept
        : m_directory(std::move(other.m_directory)), m_segments(std::move(other.m_segments)) {
        other.m_directory.clear();
        other.m_segments.clear();
    }

    SegmentSet& SegmentSet::operator=(SegmentSet&& other) noexcept {
        if (this != &other) {
            release();
            m_directory = std::move(other.m_directory);
            m_segments = std::move(other.m_segments);
            other.m_directory.clear();
            other.m_segments.clear();
        }
        return *this;
    }

    void SegmentSet::release() {
        if (m_directory.empty()) return;
        std::error_code ec;
        auto removed = std::filesystem::remove_all(m_directory, ec);
        if (ec) {
            log::warn("FileSegmenter", "Failed to remove ", m_directory.string(), ": ", ec.message());
        } else if (removed > 0) {
            log::debug("FileSegmenter", "Removed ", m_segments.size(), " segment files in ", m_directory.string());
        }
        m_directory.clear();
        m_segments.clear();
    }

    FileSegmenter::FileSegmenter(SegmentConfig config) : m_config(std::move(config)) {}

    bool FileSegmenter::is_segmentable(const std::filesystem::path& path) {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext == ".txt" || ext == ".md" || ext == ".markdown" || ext == ".rst" || ext == ".log";
    }

    bool FileSegmenter::should_segment(const std::filesystem::path& path) const {
        if (!m_config.enabled || !is_segmentable(path)) return false;
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) return false;
        return size > m_config.max_file_size;
    }

    std::filesystem::path FileSegmenter::make_run_directory() const {
        std::filesystem::path base = m_config.temp_dir;
        std::error_code ec;
        if (base.empty()) {
            base = std::filesystem::temp_directory_path(ec);
            if (ec) throw SegmentationError("No temp directory available: " + ec.message());
            base /= "lectern_segments";
        }

        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        std::filesystem::path dir = base / ("run-" + std::to_string(::getpid()) + "-" +
                                            std::to_string(g_run_counter.fetch_add(1)) + "-" + std::to_string(ticks));
        std::filesystem::create_directories(dir, ec);
        if (ec) throw SegmentationError("Cannot create " + dir.string() + ": " + ec.message());
        return dir;
    }

    SegmentSet FileSegmenter::segment(const std::filesystem::path& path) const {
        std::error_code ec;
        std::uintmax_t file_size = std::filesystem::file_size(path, ec);
        if (ec) throw SegmentationError("Cannot stat " + path.string() + ": " + ec.message());
        if (file_size == 0) return SegmentSet{};
        if (m_config.preferred_segment_size == 0) throw SegmentationError("preferred_segment_size must be positive");

        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        SegmentConfig::Strategy strategy = (ext == ".md" || ext == ".markdown")
            ? SegmentConfig::Strategy::MarkdownSection
            : m_config.strategy;

        log::info("FileSegmenter", "Segmenting large file: ", path.string(), " (",
                  file_size / 1024 / 1024, "MB)");

        SegmentSet set(make_run_directory());
        try {
            switch (strategy) {
                case SegmentConfig::Strategy::MarkdownSection: segment_markdown(path, set); break;
                case SegmentConfig::Strategy::LineBased: segment_line_based(path, set); break;
                case SegmentConfig::Strategy::SizeBased: segment_size_based(path, file_size, set); break;
            }
        } catch (const std::filesystem::filesystem_error& e) {
            throw SegmentationError(std::string("Segmenting ") + path.string() + " failed: " + e.what());
        }

        log::info("FileSegmenter", "Created ", set.size(), " segments for ", path.filename().string());
        return set;
    }

    std::uintmax_t FileSegmenter::find_line_break(std::ifstream& file, std::uintmax_t position, std::uintmax_t file_size) const {
        if (position >= file_size) return file_size;
        file.clear();
        file.seekg(static_cast<std::streamoff>(position));
        std::string window(m_config.lookahead_bytes, '\0');
        file.read(&window[0], static_cast<std::streamsize>(window.size()));
        window.resize(static_cast<size_t>(file.gcount()));

        size_t newline = window.find('\n');
        if (newline == std::string::npos) {
            log::debug("FileSegmenter", "No line break within ", m_config.lookahead_bytes, " bytes of offset ", position);
            return position;
        }
        return position + newline + 1;
    }

    void FileSegmenter::segment_size_based(const std::filesystem::path& path, std::uintmax_t file_size, SegmentSet& set) const {
        std::ifstream source(path, std::ios::binary);
        if (!source) throw SegmentationError("Cannot open " + path.string());

        // Approximate: overlap_lines times an assumed average line length.
        const std::uintmax_t overlap_bytes =
            static_cast<std::uintmax_t>(m_config.overlap_lines) * m_config.size_overlap_line_factor;

        std::uintmax_t current = 0;
        size_t index = 0;
        while (current < file_size) {
            std::uintmax_t end = std::min(current + m_config.preferred_segment_size, file_size);
            if (end < file_size) end = find_line_break(source, end, file_size);

            FileSegment seg;
            seg.index = index;
            seg.start_byte = current;
            seg.end_byte = end;
            seg.size = end - current;
            seg.path = segment_path(set, path, index);
            seg.id = segment_id(path, index, current, end);
            copy_range(source, current, end, seg.path);
            set.add(std::move(seg));

            std::uintmax_t next = end;
            if (overlap_bytes > 0 && end < file_size) {
                std::uintmax_t candidate = end > overlap_bytes ? end - overlap_bytes : 0;
                std::uintmax_t snapped = find_line_break(source, candidate, file_size);
                if (snapped > current && snapped < end) next = snapped;
            }
            current = next;
            ++index;
        }
    }

    size_t FileSegmenter::estimate_line_length(const std::filesystem::path& path) const {
        LineReader reader(path);
        Line line;
        std::uintmax_t total = 0;
        size_t count = 0;
        while (count < m_config.sample_lines && reader.next(line)) {
            total += line.text.size();
            ++count;
        }
        size_t average = static_cast<size_t>(total / std::max<size_t>(1, count));
        return std::max<size_t>(50, average);
    }

    void FileSegmenter::segment_line_based(const std::filesystem::path& path, SegmentSet& set) const {
        const size_t avg = estimate_line_length(path);
        const size_t target = std::max<size_t>(std::max<size_t>(1, m_config.min_lines_per_segment),
                                               static_cast<size_t>(m_config.preferred_segment_size / avg));
        const size_t overlap = std::min(m_config.overlap_lines, target / 2);

        log::debug("FileSegmenter", "Line-based: ~", avg, " bytes/line, ", target, " lines per segment");

        std::deque<Line> buffer;
        size_t fresh = 0;
        size_t index = 0;

        auto emit = [&]() {
            FileSegment seg;
            seg.index = index;
            seg.start_byte = buffer.front().offset;
            seg.end_byte = buffer.back().offset + buffer.back().text.size();
            seg.size = seg.end_byte - seg.start_byte;
            seg.line_start = buffer.front().number;
            seg.line_end = buffer.back().number;
            seg.path = segment_path(set, path, index);
            seg.id = segment_id(path, index, seg.start_byte, seg.end_byte);
            write_content(seg.path, join(buffer));
            set.add(std::move(seg));
            ++index;
        };

        LineReader reader(path);
        Line line;
        while (reader.next(line)) {
            buffer.push_back(std::move(line));
            ++fresh;
            if (buffer.size() >= target) {
                emit();
                while (buffer.size() > overlap) buffer.pop_front();
                fresh = 0;
            }
        }
        if (fresh > 0 && !buffer.empty()) emit();
    }

    void FileSegmenter::segment_markdown(const std::filesystem::path& path, SegmentSet& set) const {
        // Headers inside fenced code blocks do not count.
        bool has_headers = false;
        {
            LineReader scan(path);
            Line line;
            bool in_fence = false;
            while (!has_headers && scan.next(line)) {
                if (is_fence(line.text)) in_fence = !in_fence;
                else if (!in_fence && parse_header(line.text)) has_headers = true;
            }
        }
        if (!has_headers) {
            log::debug("FileSegmenter", "No markdown headers in ", path.filename().string(), ", using line-based segmentation");
            segment_line_based(path, set);
            return;
        }

        const std::uintmax_t preferred = m_config.preferred_segment_size;

        struct Section {
            std::optional<std::string> title;
            std::optional<int> level;
            std::deque<Line> lines;
            std::uintmax_t bytes = 0;
            size_t sub_index = 0;
            bool split = false;
        } section;

        size_t index = 0;

        auto emit = [&](bool sub_chunk) {
            std::string content = join(section.lines);
            if (!sub_chunk && is_blank(content)) return;

            FileSegment seg;
            seg.index = index;
            seg.start_byte = section.lines.front().offset;
            seg.end_byte = section.lines.back().offset + section.lines.back().text.size();
            seg.size = content.size();
            seg.line_start = section.lines.front().number;
            seg.line_end = section.lines.back().number;
            seg.section_title = section.title;
            seg.header_level = section.level;
            seg.sub_chunk = sub_chunk;
            seg.sub_index = sub_chunk ? section.sub_index : 0;
            seg.path = segment_path(set, path, index);
            seg.id = segment_id(path, index, seg.start_byte, seg.end_byte);
            write_content(seg.path, content);
            set.add(std::move(seg));
            ++index;
        };

        auto finish = [&]() {
            if (section.lines.empty()) return;
            emit(section.split);
        };

        LineReader reader(path);
        Line line;
        bool in_fence = false;
        while (reader.next(line)) {
            if (is_fence(line.text)) {
                in_fence = !in_fence;
            } else if (!in_fence) {
                if (auto header = parse_header(line.text)) {
                    finish();
                    section = Section{};
                    section.level = header->first;
                    section.title = header->second;
                }
            }

            if (section.bytes + line.text.size() > preferred && !section.lines.empty()) {
                section.split = true;
                emit(true);
                ++section.sub_index;
                // Carried lines plus the incoming one stay within the preferred size.
                const std::uintmax_t room = preferred > line.text.size() ? preferred - line.text.size() : 0;
                section.lines = overlap_tail(section.lines, m_config.overlap_lines, std::min(preferred / 2, room));
                section.bytes = 0;
                for (const auto& l : section.lines) section.bytes += l.text.size();
            }
            section.bytes += line.text.size();
            section.lines.push_back(std::move(line));
        }
        finish();
    }

}
