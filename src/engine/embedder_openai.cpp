#include "embedder.hpp"
#include "lectern/errors.hpp"
#include <nlohmann/json.hpp>
#include <atomic>

using json = nlohmann::json;

namespace lectern::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model, const std::string& base_url, long timeout_seconds)
            : m_api_key(api_key), m_model(model), m_url(base_url), m_timeout(timeout_seconds) {
            while (!m_url.empty() && m_url.back() == '/') m_url.pop_back();
            m_url += "/embeddings";
        }

        std::vector<float> embed(const std::string& text) override {
            json body = {
                {"model", m_model},
                {"input", text}
            };
            std::string json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

            std::string response_string = http::post_json(
                m_url, json_str, {"Authorization: Bearer " + m_api_key}, m_timeout, "OpenAIEmbedder");

            std::vector<float> embedding;
            try {
                auto resp_json = json::parse(response_string);
                if (resp_json.contains("error")) {
                    throw EmbeddingError("[OpenAIEmbedder] API Error: " + resp_json["error"].dump());
                }
                if (resp_json.contains("data") && !resp_json["data"].empty()) {
                    embedding = resp_json["data"][0]["embedding"].get<std::vector<float>>();
                }
            } catch (const json::exception& e) {
                throw EmbeddingError(std::string("[OpenAIEmbedder] JSON parse error: ") + e.what());
            }

            if (embedding.empty()) {
                throw EmbeddingError("[OpenAIEmbedder] Response carried no embedding");
            }
            m_dimension = embedding.size();
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_api_key;
        std::string m_model;
        std::string m_url;
        long m_timeout;
        std::atomic<size_t> m_dimension{0};
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model,
                                                     const std::string& base_url, long timeout_seconds) {
        return std::make_unique<OpenAIEmbedder>(api_key, model, base_url, timeout_seconds);
    }

}
