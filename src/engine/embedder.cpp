#include "embedder.hpp"
#include "lectern/errors.hpp"
#include <curl/curl.h>
#include <mutex>

namespace lectern::engine {

    namespace {
        std::once_flag g_curl_init;

        size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
            return size * nmemb;
        }
    }

    namespace http {

        std::string post_json(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers, long timeout_seconds,
                              const std::string& component) {
            std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

            CURL* curl = curl_easy_init();
            if (!curl) throw EmbeddingError("[" + component + "] curl_easy_init() failed");

            struct curl_slist* header_list = nullptr;
            header_list = curl_slist_append(header_list, "Content-Type: application/json");
            for (const auto& h : headers) header_list = curl_slist_append(header_list, h.c_str());

            std::string response_string;
            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            CURLcode res = curl_easy_perform(curl);
            long status = 0;
            if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

            curl_slist_free_all(header_list);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                throw EmbeddingError("[" + component + "] curl_easy_perform() failed: " + curl_easy_strerror(res));
            }
            if (status < 200 || status >= 300) {
                throw EmbeddingError("[" + component + "] HTTP " + std::to_string(status) + ": " + response_string.substr(0, 256));
            }
            return response_string;
        }

    }

    std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& config) {
        if (config.backend == "ollama") {
            return create_ollama_embedder(config.model, config.endpoint, config.timeout_seconds);
        }
        if (config.backend == "openai") {
            if (config.openai_key.empty()) {
                throw ConfigError("OpenAI backend selected but no key configured (set OPENAI_API_KEY)");
            }
            std::string model = config.model == "all-minilm" ? "text-embedding-3-small" : config.model;
            return create_openai_embedder(config.openai_key, model, config.openai_base_url, config.timeout_seconds);
        }
        if (config.backend == "onnx") {
            return create_onnx_embedder(config.onnx_model, config.onnx_vocab);
        }
        throw ConfigError("Unknown embedding backend: " + config.backend);
    }

}
