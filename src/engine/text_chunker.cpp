#include "text_chunker.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace lectern::engine {

    namespace {

        bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
        bool is_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }
        bool is_terminator(char c) { return c == '.' || c == '!' || c == '?'; }

        size_t snap_back(const std::string& s, size_t pos) {
            if (pos >= s.size()) return s.size();
            while (pos > 0 && is_continuation(s[pos])) --pos;
            return pos;
        }

        size_t snap_forward(const std::string& s, size_t pos) {
            while (pos < s.size() && is_continuation(s[pos])) ++pos;
            return pos;
        }

        size_t next_boundary(const std::string& s, size_t pos) {
            if (pos >= s.size()) return s.size();
            return snap_forward(s, pos + 1);
        }

        std::string trim(const std::string& s) {
            size_t b = 0, e = s.size();
            while (b < e && is_space(s[b])) ++b;
            while (e > b && is_space(s[e - 1])) --e;
            return s.substr(b, e - b);
        }

        std::string rtrim(const std::string& s) {
            size_t e = s.size();
            while (e > 0 && is_space(s[e - 1])) --e;
            return s.substr(0, e);
        }

        std::vector<std::string> split_lines(const std::string& text) {
            std::vector<std::string> lines;
            size_t start = 0;
            while (true) {
                size_t nl = text.find('\n', start);
                if (nl == std::string::npos) {
                    lines.push_back(text.substr(start));
                    break;
                }
                lines.push_back(text.substr(start, nl - start));
                start = nl + 1;
            }
            return lines;
        }

        std::string join(const std::vector<std::string>& lines, const std::string& sep) {
            std::string out;
            for (size_t i = 0; i < lines.size(); ++i) {
                if (i) out += sep;
                out += lines[i];
            }
            return out;
        }

        std::optional<std::pair<int, std::string>> markdown_header(const std::string& line) {
            size_t level = 0;
            while (level < line.size() && line[level] == '#') ++level;
            if (level == 0 || level > 6 || level >= line.size()) return std::nullopt;
            if (line[level] != ' ' && line[level] != '\t') return std::nullopt;
            std::string title = trim(line.substr(level));
            if (title.empty()) return std::nullopt;
            return std::make_pair(static_cast<int>(level), title);
        }

        bool is_fence(const std::string& line) {
            size_t i = 0;
            while (i < line.size() && i < 3 && line[i] == ' ') ++i;
            return line.compare(i, 3, "```") == 0 || line.compare(i, 3, "~~~") == 0;
        }

        bool is_definition(const std::string& stripped) {
            static const std::regex pattern(
                "^(?:def|function|class|interface|public|private|protected|static|struct|fn|func|impl|template|async)\\s+\\w+",
                std::regex::icase | std::regex::optimize);
            return std::regex_search(stripped, pattern);
        }

    }

    TextChunker::TextChunker(ChunkConfig config, const TokenCounter& counter)
        : m_config(std::move(config)), m_counter(counter) {
        if (m_config.max_chunk_size == 0) m_config.max_chunk_size = 1;
        if (m_config.max_tokens == 0) m_config.max_tokens = 1;
        if (m_config.chars_per_token <= 0.0) m_config.chars_per_token = 4.0;
    }

    ChunkStrategy TextChunker::select_strategy(const std::string& content_type, std::optional<ChunkStrategy> override_strategy) const {
        if (override_strategy) return *override_strategy;
        if (content_type == "code") return ChunkStrategy::CodeBased;
        if (content_type == "markdown") return ChunkStrategy::MarkdownBased;
        return m_config.strategy;
    }

    std::vector<TextChunk> TextChunker::chunk_text(const std::string& text, const std::string& content_type,
                                                   size_t first_index, std::optional<ChunkStrategy> strategy) const {
        std::vector<TextChunk> out;
        if (std::all_of(text.begin(), text.end(), is_space)) return out;

        ChunkStrategy selected = select_strategy(content_type, strategy);
        std::vector<Piece> pieces;
        switch (selected) {
            case ChunkStrategy::FixedSize: pieces = chunk_fixed_size(text); break;
            case ChunkStrategy::SentenceBased: pieces = chunk_sentences(text); break;
            case ChunkStrategy::ParagraphBased: pieces = chunk_paragraphs(text); break;
            case ChunkStrategy::CodeBased: pieces = chunk_code(text); break;
            case ChunkStrategy::MarkdownBased: pieces = chunk_markdown(text); break;
        }

        for (auto& piece : pieces) {
            piece.text = trim(piece.text);
            if (piece.text.empty()) continue;
            enforce_budget(piece, 0, out, selected);
        }

        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = out[i].with_index(first_index + i);
        }

        log::debug("TextChunker", "Created ", out.size(), " chunks using ", to_string(selected), " strategy");
        return out;
    }

    size_t TextChunker::count_tokens(const std::string& text) const {
        try {
            return m_counter.count(text);
        } catch (const std::exception& e) {
            throw ChunkingError(std::string("Token counter failed: ") + e.what());
        }
    }

    size_t TextChunker::count_tokens(const std::string& text, size_t start, size_t end) const {
        return count_tokens(text.substr(start, end - start));
    }

    // --- Budget enforcement ---

    void TextChunker::handle_unsplittable(const std::string& text, size_t tokens) const {
        if (m_config.oversize_policy == ChunkConfig::OversizePolicy::Fail) {
            throw ChunkingError("Piece of " + std::to_string(text.size()) + " bytes needs " + std::to_string(tokens) +
                                " tokens (budget " + std::to_string(m_config.max_tokens) + ") and cannot be split further");
        }
        log::warn("TextChunker", "Dropping unsplittable piece of ", text.size(), " bytes (", tokens,
                  " tokens > ", m_config.max_tokens, ")");
    }

    void TextChunker::enforce_budget(const Piece& piece, size_t depth, std::vector<TextChunk>& out, ChunkStrategy strategy) const {
        size_t tokens = count_tokens(piece.text);
        bool fits_tokens = tokens <= m_config.max_tokens;

        if (fits_tokens && (piece.text.size() <= m_config.max_chunk_size || depth >= m_config.max_split_depth)) {
            nlohmann::json metadata = {
                {"max_chunk_size", m_config.max_chunk_size},
                {"overlap_size", m_config.overlap_size}
            };
            if (piece.undersized) metadata["undersized"] = true;
            out.push_back(TextChunk::make(0, piece.text, tokens, strategy, std::move(metadata), piece.header, piece.header_level));
            return;
        }

        if (depth >= m_config.max_split_depth) {
            handle_unsplittable(piece.text, tokens);
            return;
        }

        std::vector<Span> spans = split_fixed(piece.text);

        struct Sub {
            Span span;
            std::string text;
            bool undersized = false;
        };
        std::vector<Sub> subs;
        for (const auto& span : spans) {
            std::string text = trim(piece.text.substr(span.start, span.end - span.start));
            if (text.empty()) continue;
            subs.push_back({span, std::move(text), false});
        }

        // A short tail is folded into its predecessor when both budgets allow it.
        if (subs.size() >= 2) {
            Sub& tail = subs.back();
            Sub& prev = subs[subs.size() - 2];
            if (!tail.span.unsplittable && !prev.span.unsplittable && tail.text.size() < m_config.min_chunk_size) {
                std::string merged = trim(piece.text.substr(prev.span.start, tail.span.end - prev.span.start));
                if (merged.size() <= m_config.max_chunk_size && count_tokens(merged) <= m_config.max_tokens) {
                    prev.text = std::move(merged);
                    prev.span.end = tail.span.end;
                    subs.pop_back();
                } else {
                    tail.undersized = true;
                }
            }
        }

        for (const auto& sub : subs) {
            if (sub.span.unsplittable) {
                handle_unsplittable(sub.text, count_tokens(sub.text));
                continue;
            }
            Piece child{sub.text, piece.header, piece.header_level, sub.undersized};
            enforce_budget(child, depth + 1, out, strategy);
        }
    }

    // --- Fixed size ---

    size_t TextChunker::token_safe_end(const std::string& text, size_t pos) const {
        const size_t n = text.size();
        size_t limit = std::min(n, pos + m_config.max_chunk_size);
        if (limit < n) limit = snap_back(text, limit);
        if (limit <= pos) limit = next_boundary(text, pos);

        size_t estimate = static_cast<size_t>(std::ceil(static_cast<double>(m_config.max_tokens) * m_config.chars_per_token));
        size_t end = snap_back(text, pos + std::min(limit - pos, std::max<size_t>(1, estimate)));
        if (end <= pos) end = next_boundary(text, pos);

        if (count_tokens(text, pos, end) > m_config.max_tokens) {
            // Largest prefix within budget; good is always within budget, bad never is.
            size_t good = pos;
            size_t bad = end;
            while (true) {
                size_t mid = snap_back(text, good + (bad - good) / 2);
                if (mid <= good) mid = next_boundary(text, good);
                if (mid >= bad) break;
                if (count_tokens(text, pos, mid) <= m_config.max_tokens) good = mid;
                else bad = mid;
            }
            return good;
        }

        size_t step = std::max<size_t>(16, (end - pos) / 8);
        while (end < limit) {
            size_t candidate = snap_back(text, std::min(limit, end + step));
            if (candidate <= end) candidate = next_boundary(text, end);
            if (candidate > limit) break;
            if (count_tokens(text, pos, candidate) <= m_config.max_tokens) {
                end = candidate;
            } else {
                if (step == 1) break;
                step /= 2;
            }
        }
        return end;
    }

    size_t TextChunker::best_boundary(const std::string& text, size_t pos, size_t end) const {
        const size_t floor = pos + std::max<size_t>(1, m_config.min_chunk_size);
        if (floor >= end) return end;

        for (size_t c = end; c >= floor; --c) {
            if (c >= 2 && text[c - 1] == '\n' && text[c - 2] == '\n') return c;
        }
        for (size_t c = end; c >= floor; --c) {
            if (c < text.size() && is_terminator(text[c - 1]) && is_space(text[c])) return c;
        }
        for (size_t c = end; c >= floor; --c) {
            if (text[c - 1] == '\n') return c;
        }
        for (size_t c = end; c >= floor; --c) {
            if (c < text.size() && is_space(text[c])) return c;
        }
        return end;
    }

    size_t TextChunker::overlap_start(const std::string& text, size_t pos, size_t cut) const {
        if (m_config.overlap_size == 0) return cut;
        size_t overlap = std::min(m_config.overlap_size, (cut - pos) / 2);
        if (overlap == 0) return cut;

        size_t start = cut - overlap;
        size_t ws = start;
        while (ws < cut && !is_space(text[ws])) ++ws;
        while (ws < cut && is_space(text[ws])) ++ws;
        if (ws < cut) return ws;

        start = snap_forward(text, start);
        return (start > pos && start < cut) ? start : cut;
    }

    std::vector<TextChunker::Span> TextChunker::split_fixed(const std::string& text) const {
        std::vector<Span> spans;
        const size_t n = text.size();
        size_t pos = 0;
        size_t last_cut = 0;

        while (pos < n) {
            while (pos < n && is_space(text[pos])) ++pos;
            if (pos >= n) break;

            size_t end = token_safe_end(text, pos);
            if (end <= pos) {
                size_t cp_end = next_boundary(text, pos);
                spans.push_back({pos, cp_end, true});
                pos = last_cut = cp_end;
                continue;
            }

            size_t cut = end < n ? best_boundary(text, pos, end) : end;
            if (cut <= last_cut) {
                // Overlap window made no progress; restart at the previous cut.
                pos = last_cut;
                continue;
            }
            spans.push_back({pos, cut, false});
            last_cut = cut;
            if (cut >= n) break;
            pos = overlap_start(text, pos, cut);
        }
        return spans;
    }

    std::vector<TextChunker::Piece> TextChunker::chunk_fixed_size(const std::string& text) const {
        std::vector<Piece> pieces;
        for (const auto& span : split_fixed(text)) {
            std::string piece = text.substr(span.start, span.end - span.start);
            if (span.unsplittable) {
                handle_unsplittable(piece, count_tokens(piece));
                continue;
            }
            pieces.push_back({std::move(piece), std::nullopt, std::nullopt});
        }
        return pieces;
    }

    // --- Sentence / paragraph ---

    std::string TextChunker::overlap_tail(const std::string& text) const {
        if (m_config.overlap_size == 0 || text.empty()) return "";
        if (text.size() <= m_config.overlap_size) return trim(text);

        size_t start = snap_forward(text, text.size() - m_config.overlap_size);
        size_t ws = start;
        while (ws < text.size() && !is_space(text[ws])) ++ws;
        if (ws < text.size()) start = ws;
        return trim(text.substr(start));
    }

    std::vector<TextChunker::Piece> TextChunker::accumulate(const std::vector<std::string>& units, const std::string& separator) const {
        std::vector<Piece> pieces;
        std::string current;

        for (const auto& raw : units) {
            std::string unit = trim(raw);
            if (unit.empty()) continue;

            std::string potential = current.empty() ? unit : current + separator + unit;
            if (potential.size() <= m_config.max_chunk_size) {
                current = std::move(potential);
                continue;
            }

            if (current.size() >= m_config.min_chunk_size) {
                pieces.push_back({current, std::nullopt, std::nullopt});
                std::string tail = overlap_tail(current);
                current = tail.empty() ? unit : tail + separator + unit;
            } else {
                if (!current.empty()) {
                    log::debug("TextChunker", "Dropping ", current.size(), "-byte chunk below min_chunk_size");
                }
                current = unit;
            }
        }

        if (!trim(current).empty()) pieces.push_back({current, std::nullopt, std::nullopt});
        return pieces;
    }

    std::vector<TextChunker::Piece> TextChunker::chunk_sentences(const std::string& text) const {
        std::vector<std::string> sentences;
        const size_t n = text.size();
        size_t start = 0;
        for (size_t i = 0; i < n; ++i) {
            if (is_terminator(text[i]) && i + 1 < n && is_space(text[i + 1])) {
                sentences.push_back(text.substr(start, i + 1 - start));
                size_t j = i + 1;
                while (j < n && is_space(text[j])) ++j;
                start = j;
                i = j - 1;
            }
        }
        if (start < n) sentences.push_back(text.substr(start));
        return accumulate(sentences, " ");
    }

    std::vector<TextChunker::Piece> TextChunker::chunk_paragraphs(const std::string& text) const {
        std::vector<std::string> paragraphs;
        const size_t n = text.size();
        size_t start = 0;
        size_t i = 0;
        while (i < n) {
            if (text[i] == '\n') {
                size_t j = i + 1;
                bool blank_line = false;
                while (j < n && is_space(text[j])) {
                    if (text[j] == '\n') blank_line = true;
                    ++j;
                }
                if (blank_line) {
                    paragraphs.push_back(text.substr(start, i - start));
                    start = i = j;
                    continue;
                }
            }
            ++i;
        }
        if (start < n) paragraphs.push_back(text.substr(start));
        return accumulate(paragraphs, "\n\n");
    }

    // --- Code ---

    std::vector<TextChunker::Piece> TextChunker::chunk_code(const std::string& text) const {
        std::vector<Piece> pieces;
        std::vector<std::string> current;
        size_t current_size = 0;

        for (const auto& line : split_lines(text)) {
            size_t line_size = line.size() + 1;
            std::string stripped = trim(line);
            bool definition = !stripped.empty() && is_definition(stripped);
            size_t indent = stripped.empty() ? 0 : line.find_first_not_of(" \t");

            bool should_break = current_size + line_size > m_config.max_chunk_size &&
                                !current.empty() && (definition || indent == 0);

            if (should_break) {
                std::string chunk = join(current, "\n");
                // Blocks below the minimum keep growing instead of being cut.
                if (trim(chunk).size() >= m_config.min_chunk_size) {
                    pieces.push_back({chunk, std::nullopt, std::nullopt});

                    std::vector<std::string> overlap;
                    size_t overlap_size = 0;
                    const size_t budget = std::min(m_config.overlap_size, current_size / 2);
                    for (auto it = current.rbegin(); it != current.rend(); ++it) {
                        size_t len = it->size() + 1;
                        if (overlap_size + len > budget) break;
                        overlap.insert(overlap.begin(), *it);
                        overlap_size += len;
                    }
                    current = std::move(overlap);
                    current_size = overlap_size;
                }
            }

            current.push_back(line);
            current_size += line_size;
        }

        if (!current.empty()) pieces.push_back({join(current, "\n"), std::nullopt, std::nullopt});
        return pieces;
    }

    // --- Markdown ---

    std::vector<TextChunker::Piece> TextChunker::chunk_markdown(const std::string& text) const {
        std::vector<Piece> pieces;
        std::string current;
        std::optional<std::string> header_line;
        std::optional<std::string> title;
        std::optional<int> level;
        bool in_fence = false;

        auto commit = [&](const std::string& chunk) {
            if (!trim(chunk).empty()) pieces.push_back({rtrim(chunk), title, level});
        };

        if (m_config.preserve_headers) {
            for (const auto& line : split_lines(text)) {
                std::optional<std::pair<int, std::string>> header;
                if (is_fence(line)) in_fence = !in_fence;
                else if (!in_fence) header = markdown_header(line);

                if (header) {
                    if (trim(current).size() >= m_config.min_chunk_size) {
                        commit(current);
                        current.clear();
                    }
                    level = header->first;
                    title = header->second;
                    header_line = rtrim(line);
                    current += line + "\n";
                    continue;
                }

                std::string potential = current + line + "\n";
                if (potential.size() <= m_config.max_chunk_size || trim(current).size() < m_config.min_chunk_size) {
                    current = std::move(potential);
                    continue;
                }

                commit(current);
                std::string seed = header_line ? *header_line + "\n" : "";
                std::string tail = overlap_tail(current);
                bool tail_is_header = header_line && tail == *header_line;
                if (!tail.empty() && !tail_is_header &&
                    seed.size() + tail.size() + line.size() + 2 <= m_config.max_chunk_size) {
                    seed += tail + "\n";
                }
                current = seed + line + "\n";
            }
            commit(current);
            return pieces;
        }

        // Without header preservation: paragraph blocks, with headers as extra break points.
        struct Block {
            std::string text;
            std::optional<std::pair<int, std::string>> header;
        };
        std::vector<Block> blocks;
        Block block;
        auto flush_block = [&]() {
            if (!trim(block.text).empty()) blocks.push_back(block);
            block = Block{};
        };
        for (const auto& line : split_lines(text)) {
            std::optional<std::pair<int, std::string>> header;
            if (is_fence(line)) in_fence = !in_fence;
            else if (!in_fence) header = markdown_header(line);

            if (header) {
                flush_block();
                block.header = header;
                block.text = line;
            } else if (!in_fence && trim(line).empty()) {
                flush_block();
            } else {
                block.text += block.text.empty() ? line : "\n" + line;
            }
        }
        flush_block();

        for (const auto& b : blocks) {
            if (b.header) {
                if (trim(current).size() >= m_config.min_chunk_size) {
                    commit(current);
                    current.clear();
                }
                level = b.header->first;
                title = b.header->second;
            }

            std::string unit = trim(b.text);
            std::string potential = current.empty() ? unit : current + "\n\n" + unit;
            if (potential.size() <= m_config.max_chunk_size || trim(current).size() < m_config.min_chunk_size) {
                current = std::move(potential);
                continue;
            }
            commit(current);
            std::string tail = overlap_tail(current);
            current = tail.empty() ? unit : tail + "\n\n" + unit;
        }
        commit(current);
        return pieces;
    }

}
