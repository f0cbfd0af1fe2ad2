#pragma once

#include <cmath>
#include <vector>
#include "lectern/types.hpp"

namespace lectern::engine {

    /**
     * @brief Euclidean distance. Both vectors must have the same dimension.
     */
    inline double l2_distance(const std::vector<float>& a, const std::vector<float>& b) {
        double sum = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
            sum += d * d;
        }
        return std::sqrt(sum);
    }

    /**
     * @brief 1 - cosine similarity, in [0, 2]. A zero vector is at distance 1 from everything.
     */
    inline double cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
        double dot = 0.0, na = 0.0, nb = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            dot += static_cast<double>(a[i]) * b[i];
            na += static_cast<double>(a[i]) * a[i];
            nb += static_cast<double>(b[i]) * b[i];
        }
        if (na == 0.0 || nb == 0.0) return 1.0;
        double d = 1.0 - dot / (std::sqrt(na) * std::sqrt(nb));
        return d < 0.0 ? 0.0 : d;
    }

    inline double distance(DistanceMetric metric, const std::vector<float>& a, const std::vector<float>& b) {
        return metric == DistanceMetric::Cosine ? cosine_distance(a, b) : l2_distance(a, b);
    }

    inline double similarity_from_distance(double distance) {
        return 1.0 / (1.0 + distance);
    }

    inline std::vector<float> normalized(std::vector<float> v) {
        double norm = 0.0;
        for (float x : v) norm += static_cast<double>(x) * x;
        norm = std::sqrt(norm);
        if (norm > 0.0) {
            for (float& x : v) x = static_cast<float>(x / norm);
        }
        return v;
    }

}
