#include "embedder.hpp"
#include "lectern/errors.hpp"
#include <nlohmann/json.hpp>
#include <atomic>

using json = nlohmann::json;

namespace lectern::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, long timeout_seconds)
            : m_model(model), m_endpoint(endpoint), m_timeout(timeout_seconds) {}

        std::vector<float> embed(const std::string& text) override {
            std::string json_str;
            try {
                json body = {
                    {"model", m_model},
                    {"prompt", text}
                };
                json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            } catch (const json::exception& e) {
                throw EmbeddingError(std::string("[OllamaEmbedder] JSON serialization error: ") + e.what());
            }

            std::string response_string = http::post_json(m_endpoint, json_str, {}, m_timeout, "OllamaEmbedder");

            std::vector<float> embedding;
            try {
                auto resp_json = json::parse(response_string);
                if (resp_json.contains("embedding")) {
                    embedding = resp_json["embedding"].get<std::vector<float>>();
                }
            } catch (const json::exception& e) {
                throw EmbeddingError(std::string("[OllamaEmbedder] JSON parse error: ") + e.what());
            }

            if (embedding.empty()) {
                throw EmbeddingError("[OllamaEmbedder] Response carried no embedding for model " + m_model);
            }
            m_dimension = embedding.size();
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_model;
        std::string m_endpoint;
        long m_timeout;
        std::atomic<size_t> m_dimension{0};
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint, long timeout_seconds) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, timeout_seconds);
    }

}
