#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <vector>
#include "engine/embedder.hpp"
#include "lectern/errors.hpp"
#include "lectern/types.hpp"

namespace lectern::test {

    /**
     * @brief Deterministic bag-of-words embedder. Equal texts give equal vectors.
     */
    class FakeEmbedder : public engine::Embedder {
    public:
        explicit FakeEmbedder(size_t dim = 16) : m_dim(dim) {}

        std::vector<float> embed(const std::string& text) override {
            m_calls++;
            if (!m_fail_on.empty() && text.find(m_fail_on) != std::string::npos) {
                throw engine::EmbeddingError("[FakeEmbedder] refused: " + m_fail_on);
            }

            std::vector<float> v(m_dim, 0.0f);
            std::string word;
            auto flush = [&]() {
                if (word.empty()) return;
                v[std::hash<std::string>{}(word) % m_dim] += 1.0f;
                word.clear();
            };
            for (char c : text) {
                if (std::isalnum(static_cast<unsigned char>(c))) word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
                else flush();
            }
            flush();

            double norm = 0.0;
            for (float x : v) norm += static_cast<double>(x) * x;
            if (norm == 0.0) {
                v[0] = 1.0f;
                return v;
            }
            for (float& x : v) x = static_cast<float>(x / std::sqrt(norm));
            return v;
        }

        size_t dimension() const override { return m_dim; }

        /**
         * @brief Any text containing needle makes embed() throw.
         */
        void fail_on(const std::string& needle) { m_fail_on = needle; }

        size_t calls() const { return m_calls.load(); }

    private:
        size_t m_dim;
        std::string m_fail_on;
        std::atomic<size_t> m_calls{0};
    };

    class TempDir {
    public:
        TempDir() {
            auto base = std::filesystem::temp_directory_path();
            auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            m_path = base / ("lectern_test_" + std::to_string(stamp) + "_" + std::to_string(s_counter++));
            std::filesystem::create_directories(m_path);
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const { return m_path; }

        std::filesystem::path write(const std::string& name, const std::string& content) const {
            auto p = m_path / name;
            std::filesystem::create_directories(p.parent_path());
            std::ofstream out(p, std::ios::binary | std::ios::trunc);
            out << content;
            return p;
        }

    private:
        std::filesystem::path m_path;
        static inline std::atomic<int> s_counter{0};
    };

    inline std::string read_file(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    inline engine::DocumentInfo make_info(const std::string& name, const std::string& hash,
                                          const std::string& content_type = "text") {
        engine::DocumentInfo info;
        info.path = "/tmp/" + name;
        info.filename = name;
        info.hash = hash;
        info.size = 42;
        info.mime_type = "text/plain";
        info.content_type = content_type;
        info.extension = ".txt";
        info.last_modified = 1000;
        return info;
    }

    inline engine::ChunkRecord make_record(size_t index, const std::string& content, std::vector<float> embedding) {
        return {engine::TextChunk::make(index, content, 1, engine::ChunkStrategy::SentenceBased), std::move(embedding)};
    }

}
