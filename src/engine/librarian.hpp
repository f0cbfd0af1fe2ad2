#pragma once

#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <filesystem>
#include "store.hpp"
#include "lectern/types.hpp"

namespace lectern::engine {

    /**
     * @brief In-memory HNSW index over chunk embeddings.
     *
     * Approximate candidate source for unfiltered queries. The index is created on the first
     * vector it sees (which fixes its dimension) or on load. Cosine indexes store normalized
     * vectors under an inner-product space. All operations are serialized.
     */
    class Librarian {
    public:
        explicit Librarian(DistanceMetric metric = DistanceMetric::L2, size_t initial_capacity = 10000);
        ~Librarian();

        /**
         * @brief Adds a vector to the index.
         * @param id The chunk id (from the database).
         * @param vector The embedding vector.
         */
        void add_item(int64_t id, const std::vector<float>& vector);

        /**
         * @brief Marks a chunk as deleted. Unknown ids are ignored.
         */
        void remove_item(int64_t id);

        /**
         * @brief Searches for the nearest neighbors.
         * @return Chunk ids, nearest first. Empty if the index is empty or the dimension differs.
         */
        std::vector<int64_t> search(const std::vector<float>& query_vector, size_t k = 5) const;

        /**
         * @brief Persists the index and its sidecar (dimension, metric) to disk.
         */
        void save(const std::filesystem::path& path) const;

        /**
         * @brief Loads an index saved by save().
         * @return false if nothing usable was found at path.
         */
        bool load(const std::filesystem::path& path);

        /**
         * @brief Drops the index and re-adds every visible vector of the store.
         */
        void rebuild(Store& store);

        /**
         * @brief Loads the index at path, rebuilding from the store when it is missing or stale.
         */
        void restore(const std::filesystem::path& path, Store& store);

        /**
         * @brief Returns the number of live (not deleted) elements.
         */
        size_t count() const;

        size_t dimension() const;
        DistanceMetric metric() const { return m_metric; }

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
        DistanceMetric m_metric;
        size_t m_initial_capacity;
        mutable std::mutex m_mutex;

        void create_index(size_t dim, size_t capacity);
    };

}
