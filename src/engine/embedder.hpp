#pragma once

#include <string>
#include <vector>
#include <memory>
#include "config.hpp"

namespace lectern::engine {

    /**
     * @brief Abstract base class for embedding generation.
     * Implementations are called from several ingestion workers at once.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @param text The input text chunk.
         * @return A non-empty vector of floats representing the embedding.
         * @throws EmbeddingError on transport, HTTP or response errors.
         */
        virtual std::vector<float> embed(const std::string& text) = 0;

        /**
         * @brief Returns the dimension of the vectors produced by this embedder (0 until known).
         */
        virtual size_t dimension() const = 0;
    };

    namespace http {
        /**
         * @brief POSTs a JSON body and returns the response body.
         * @throws EmbeddingError on curl failure or a non-2xx status.
         */
        std::string post_json(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers, long timeout_seconds,
                              const std::string& component);
    }

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint, long timeout_seconds = 60);
    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model = "text-embedding-3-small",
                                                     const std::string& base_url = "https://api.openai.com/v1", long timeout_seconds = 60);

    /**
     * @brief Builds the backend named by config.backend (ollama, openai, onnx).
     * @throws ConfigError for an unknown backend or a missing OpenAI key.
     */
    std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& config);

}
