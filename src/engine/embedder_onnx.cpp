#include "embedder.hpp"
#include "tokenizer.hpp"
#include "distance.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <atomic>
#include <filesystem>
#include <vector>

#ifdef LECTERN_WITH_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace lectern::engine {

#ifdef LECTERN_WITH_ONNX
    namespace {

        /**
         * @brief Averages a [1, tokens, hidden] activation block over its token axis.
         */
        std::vector<float> mean_pool(const float* hidden, size_t tokens, size_t width) {
            std::vector<float> pooled(width, 0.0f);
            if (tokens == 0) return pooled;
            for (size_t t = 0; t < tokens; ++t) {
                const float* row = hidden + t * width;
                for (size_t k = 0; k < width; ++k) pooled[k] += row[k];
            }
            const float scale = 1.0f / static_cast<float>(tokens);
            for (float& x : pooled) x *= scale;
            return pooled;
        }

        Ort::Value int64_tensor(const Ort::MemoryInfo& memory, std::vector<int64_t>& values,
                                const std::vector<int64_t>& shape) {
            return Ort::Value::CreateTensor<int64_t>(memory, values.data(), values.size(), shape.data(), shape.size());
        }

    }
#endif

    /**
     * @brief Local sentence-transformer (MiniLM style) run through ONNX Runtime.
     * Output is the mean of last_hidden_state, scaled to unit length.
     */
    class OnnxEmbedder : public Embedder {
    public:
        OnnxEmbedder(const std::string& model_path, const std::string& vocab_path) {
            for (const auto& required : {model_path, vocab_path}) {
                if (!std::filesystem::is_regular_file(required)) {
                    throw ConfigError("[OnnxEmbedder] Missing model asset: " + required);
                }
            }
#ifdef LECTERN_WITH_ONNX
            try {
                m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "lectern");

                Ort::SessionOptions options;
                options.SetIntraOpNumThreads(1);
                options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
                m_session = std::make_unique<Ort::Session>(*m_env, model_path.c_str(), options);
            } catch (const Ort::Exception& e) {
                throw ConfigError(std::string("[OnnxEmbedder] Cannot open session: ") + e.what());
            }
            m_tokenizer = std::make_unique<Tokenizer>(vocab_path);
            log::info("OnnxEmbedder", "Session ready for ", model_path, " (", m_tokenizer->vocab_size(), " vocab entries)");
#else
            throw ConfigError("[OnnxEmbedder] This build has no ONNX Runtime; rebuild with LECTERN_WITH_ONNX");
#endif
        }

        std::vector<float> embed(const std::string& text) override {
#ifdef LECTERN_WITH_ONNX
            std::vector<int64_t> ids = m_tokenizer->encode(text);
            const size_t tokens = ids.size();
            std::vector<int64_t> mask(tokens, 1);
            std::vector<int64_t> segments(tokens, 0);
            const std::vector<int64_t> shape{1, static_cast<int64_t>(tokens)};

            auto memory = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
            std::vector<Ort::Value> inputs;
            inputs.push_back(int64_tensor(memory, ids, shape));
            inputs.push_back(int64_tensor(memory, mask, shape));
            inputs.push_back(int64_tensor(memory, segments, shape));

            static const char* const input_names[] = {"input_ids", "attention_mask", "token_type_ids"};
            static const char* const output_names[] = {"last_hidden_state"};

            std::vector<float> pooled;
            try {
                auto outputs = m_session->Run(Ort::RunOptions{nullptr}, input_names, inputs.data(), inputs.size(),
                                              output_names, 1);
                auto dims = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
                if (dims.size() != 3) {
                    throw EmbeddingError("[OnnxEmbedder] Unexpected output rank " + std::to_string(dims.size()));
                }
                pooled = mean_pool(outputs.front().GetTensorData<float>(), tokens, static_cast<size_t>(dims[2]));
            } catch (const Ort::Exception& e) {
                throw EmbeddingError(std::string("[OnnxEmbedder] Inference failed: ") + e.what());
            }

            if (pooled.empty()) throw EmbeddingError("[OnnxEmbedder] Model produced an empty vector");
            m_dimension = pooled.size();
            return normalized(std::move(pooled));
#else
            (void)text;
            throw EmbeddingError("[OnnxEmbedder] This build has no ONNX Runtime");
#endif
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::atomic<size_t> m_dimension{0};
#ifdef LECTERN_WITH_ONNX
        std::unique_ptr<Ort::Env> m_env;
        std::unique_ptr<Ort::Session> m_session;
        std::unique_ptr<Tokenizer> m_tokenizer;
#endif
    };

    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path) {
        return std::make_unique<OnnxEmbedder>(model_path, vocab_path);
    }

}
