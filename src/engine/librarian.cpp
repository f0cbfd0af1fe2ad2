#include "librarian.hpp"
#include "distance.hpp"
#include "log.hpp"
#include "lectern/errors.hpp"
#include <hnswlib/hnswlib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace lectern::engine {

    namespace {
        std::filesystem::path sidecar_path(const std::filesystem::path& path) {
            return std::filesystem::path(path.string() + ".json");
        }
    }

    struct Librarian::Impl {
        std::unique_ptr<hnswlib::SpaceInterface<float>> space;
        std::unique_ptr<hnswlib::HierarchicalNSW<float>> alg_hnsw;
        size_t dim = 0;

        Impl(size_t d, DistanceMetric metric) : dim(d) {
            if (metric == DistanceMetric::Cosine) {
                space = std::make_unique<hnswlib::InnerProductSpace>(d);
            } else {
                space = std::make_unique<hnswlib::L2Space>(d);
            }
        }

        std::vector<float> prepare(const std::vector<float>& v, DistanceMetric metric) const {
            return metric == DistanceMetric::Cosine ? normalized(v) : v;
        }
    };

    Librarian::Librarian(DistanceMetric metric, size_t initial_capacity)
        : m_metric(metric), m_initial_capacity(std::max<size_t>(initial_capacity, 16)) {}

    Librarian::~Librarian() = default;

    void Librarian::create_index(size_t dim, size_t capacity) {
        m_impl = std::make_unique<Impl>(dim, m_metric);
        m_impl->alg_hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(m_impl->space.get(), capacity);
    }

    void Librarian::add_item(int64_t id, const std::vector<float>& vector) {
        if (vector.empty()) return;
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_impl) create_index(vector.size(), m_initial_capacity);

        if (vector.size() != m_impl->dim) {
            log::warn("Librarian", "Vector dimension mismatch. Expected ", m_impl->dim, ", got ", vector.size());
            return;
        }

        auto& index = *m_impl->alg_hnsw;
        if (index.getCurrentElementCount() >= index.getMaxElements()) {
            index.resizeIndex(index.getMaxElements() * 2);
            log::debug("Librarian", "Resized index to ", index.getMaxElements(), " elements");
        }
        auto prepared = m_impl->prepare(vector, m_metric);
        index.addPoint(prepared.data(), static_cast<hnswlib::labeltype>(id));
    }

    void Librarian::remove_item(int64_t id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_impl) return;
        try {
            m_impl->alg_hnsw->markDelete(static_cast<hnswlib::labeltype>(id));
        } catch (const std::runtime_error& e) {
            // hnswlib throws for labels it never saw or already deleted.
            log::debug("Librarian", "Skip delete of ", id, ": ", e.what());
        }
    }

    std::vector<int64_t> Librarian::search(const std::vector<float>& query_vector, size_t k) const {
        std::vector<int64_t> results;
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_impl || k == 0) return results;
        if (query_vector.size() != m_impl->dim) {
            log::warn("Librarian", "Query dimension mismatch. Expected ", m_impl->dim, ", got ", query_vector.size());
            return results;
        }

        auto& index = *m_impl->alg_hnsw;
        size_t live = index.getCurrentElementCount() - index.getDeletedCount();
        if (live == 0) return results;
        k = std::min(k, live);
        index.setEf(std::max<size_t>(k, 64));

        auto prepared = m_impl->prepare(query_vector, m_metric);
        // searchKnn returns a max-heap of <dist, label>
        auto pq = index.searchKnn(prepared.data(), k);
        while (!pq.empty()) {
            results.push_back(static_cast<int64_t>(pq.top().second));
            pq.pop();
        }
        // Result is furthest to nearest, so reverse it
        std::reverse(results.begin(), results.end());
        return results;
    }

    void Librarian::save(const std::filesystem::path& path) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_impl) return;
        try {
            m_impl->alg_hnsw->saveIndex(path.string());
        } catch (const std::runtime_error& e) {
            throw StorageError("[Librarian] Save error: " + std::string(e.what()));
        }

        nlohmann::json meta = {
            {"dimension", m_impl->dim},
            {"metric", to_string(m_metric)},
            {"capacity", m_impl->alg_hnsw->getMaxElements()}
        };
        std::ofstream out(sidecar_path(path));
        if (!out) throw StorageError("[Librarian] Cannot write " + sidecar_path(path).string());
        out << meta.dump(4);
    }

    bool Librarian::load(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) || !std::filesystem::exists(sidecar_path(path), ec)) return false;

        std::ifstream in(sidecar_path(path));
        auto meta = nlohmann::json::parse(in, nullptr, false);
        if (meta.is_discarded() || !meta.contains("dimension") || !meta.contains("metric")) {
            log::warn("Librarian", "Ignoring unreadable index metadata at ", sidecar_path(path).string());
            return false;
        }
        if (meta.value("metric", std::string()) != to_string(m_metric)) {
            log::info("Librarian", "Saved index uses metric ", meta.value("metric", std::string()), ", rebuilding");
            return false;
        }

        size_t dim = meta.value("dimension", static_cast<size_t>(0));
        size_t capacity = std::max(meta.value("capacity", m_initial_capacity), m_initial_capacity);
        if (dim == 0) return false;

        auto impl = std::make_unique<Impl>(dim, m_metric);
        try {
            impl->alg_hnsw = std::make_unique<hnswlib::HierarchicalNSW<float>>(impl->space.get(), path.string(), false, capacity);
        } catch (const std::runtime_error& e) {
            log::warn("Librarian", "Load error: ", e.what());
            return false;
        }
        m_impl = std::move(impl);
        return true;
    }

    void Librarian::rebuild(Store& store) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_impl.reset();
        }
        size_t added = 0;
        store.for_each_vector([&](int64_t id, const std::vector<float>& vec) {
            add_item(id, vec);
            ++added;
        });
        log::info("Librarian", "Indexed ", added, " vectors");
    }

    void Librarian::restore(const std::filesystem::path& path, Store& store) {
        size_t expected = store.vector_count();
        if (load(path) && count() == expected) {
            log::debug("Librarian", "Loaded ", expected, " vectors from ", path.string());
            return;
        }
        rebuild(store);
        save(path);
    }

    size_t Librarian::count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_impl) return 0;
        return m_impl->alg_hnsw->getCurrentElementCount() - m_impl->alg_hnsw->getDeletedCount();
    }

    size_t Librarian::dimension() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_impl ? m_impl->dim : 0;
    }

}
