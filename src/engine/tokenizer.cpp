#include "tokenizer.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace lectern::engine {

    namespace {
        constexpr int64_t kClsId = 101;
        constexpr int64_t kSepId = 102;
        constexpr int64_t kUnkId = 100;
        constexpr size_t kMaxWordLength = 100;

        bool is_space(unsigned char c) { return std::isspace(c) != 0; }
        bool is_punct(unsigned char c) { return c < 0x80 && std::ispunct(c) != 0; }
    }

    Tokenizer::Tokenizer(const std::string& vocab_path) {
        load_vocab(vocab_path);
    }

    void Tokenizer::load_vocab(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigError("Failed to load vocab: " + path);
        }
        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            m_vocab.emplace(line, id++);
        }
        if (m_vocab.empty()) {
            throw ConfigError("Vocab file is empty: " + path);
        }
        log::debug("Tokenizer", "Loaded ", m_vocab.size(), " vocab entries from ", path);
    }

    void Tokenizer::word_pieces(const std::string& word, std::vector<int64_t>& out) const {
        if (word.length() > kMaxWordLength) {
            out.push_back(kUnkId);
            return;
        }

        size_t start = 0;
        std::vector<int64_t> sub_tokens;
        while (start < word.length()) {
            size_t end = word.length();
            int64_t cur_substr = -1;

            while (start < end) {
                std::string substr = word.substr(start, end - start);
                if (start > 0) substr = "##" + substr;

                auto it = m_vocab.find(substr);
                if (it != m_vocab.end()) {
                    cur_substr = it->second;
                    break;
                }
                end--;
            }

            if (cur_substr == -1) {
                out.push_back(kUnkId);
                return;
            }
            sub_tokens.push_back(cur_substr);
            start = end;
        }
        out.insert(out.end(), sub_tokens.begin(), sub_tokens.end());
    }

    template <typename Sink>
    void Tokenizer::tokenize(const std::string& text, Sink&& sink) const {
        std::string word;
        std::vector<int64_t> pieces;

        auto flush = [&]() -> bool {
            if (word.empty()) return true;
            pieces.clear();
            word_pieces(word, pieces);
            word.clear();
            for (int64_t id : pieces) {
                if (!sink(id)) return false;
            }
            return true;
        };

        for (char ch : text) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (is_space(c)) {
                if (!flush()) return;
            } else if (is_punct(c)) {
                if (!flush()) return;
                word.push_back(ch);
                if (!flush()) return;
            } else {
                word.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
            }
        }
        flush();
    }

    std::vector<int64_t> Tokenizer::encode(const std::string& text, size_t max_length) const {
        std::vector<int64_t> ids;
        ids.push_back(kClsId);
        tokenize(text, [&](int64_t id) {
            ids.push_back(id);
            return ids.size() < max_length - 1; // Reserve 1 for [SEP]
        });
        ids.push_back(kSepId);
        return ids;
    }

    size_t Tokenizer::count(const std::string& text) const {
        size_t n = 0;
        tokenize(text, [&](int64_t) {
            ++n;
            return true;
        });
        return n;
    }

    CharRatioTokenCounter::CharRatioTokenCounter(double chars_per_token)
        : m_chars_per_token(chars_per_token > 0.0 ? chars_per_token : 4.0) {}

    size_t CharRatioTokenCounter::count(const std::string& text) const {
        return static_cast<size_t>(std::ceil(static_cast<double>(text.size()) / m_chars_per_token));
    }

    std::unique_ptr<TokenCounter> create_token_counter(const std::string& vocab_path, double chars_per_token) {
        if (!vocab_path.empty()) {
            if (std::filesystem::exists(vocab_path)) {
                return std::make_unique<Tokenizer>(vocab_path);
            }
            log::warn("Tokenizer", "Vocab not found at ", vocab_path, ", falling back to ", chars_per_token, " chars/token estimate.");
        }
        return std::make_unique<CharRatioTokenCounter>(chars_per_token);
    }

}
