/// @file src/neighbors/ann_index.cpp
/// @brief ANN-backed radius and k-nearest queries with exact re-checks.

#include "ann_index.hpp"
#include "stint/constants.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace stint::detail {

namespace {

// Relative slack on ANN's squared bounds; candidates are re-checked exactly.
constexpr double kBoundSlack = 1e-9;

}  // anonymous namespace

AnnIndex::AnnIndex(const Eigen::MatrixXd& points) : points_(points) {
    const int n   = static_cast<int>(points_.rows());
    const int dim = static_cast<int>(points_.cols());

    data_.reset(annAllocPts(n, dim));
    for (int i = 0; i < n; ++i) {
        for (int c = 0; c < dim; ++c) {
            data_.get()[i][c] = points_(i, c);
        }
    }
    tree_ = std::make_unique<ANNkd_tree>(data_.get(), n, dim,
                                         static_cast<int>(constants::ANN_BUCKET_SIZE));
    // annClose() is not called here: ANN shares one trivial leaf across every
    // live tree, and releasing it would invalidate trees still in use.
}

double AnnIndex::squared_distance(std::size_t a, std::size_t b) const noexcept {
    double sq = 0.0;
    for (Eigen::Index c = 0; c < points_.cols(); ++c) {
        const double d = points_(static_cast<Eigen::Index>(a), c) -
                         points_(static_cast<Eigen::Index>(b), c);
        sq += d * d;
    }
    return sq;
}

IndexList AnnIndex::candidates(std::size_t query, double squared_radius) const {
    ANNpoint q = data_.get()[query];
    const int found = tree_->annkFRSearch(q, squared_radius, 0);

    std::vector<ANNidx>  idx(static_cast<std::size_t>(found));
    std::vector<ANNdist> dist(static_cast<std::size_t>(found));
    tree_->annkFRSearch(q, squared_radius, found, idx.data(), dist.data());

    IndexList out;
    out.reserve(idx.size());
    for (ANNidx j : idx) {
        if (j != ANN_NULL_IDX) out.push_back(static_cast<std::size_t>(j));
    }
    return out;
}

IndexList AnnIndex::within(std::size_t query, double radius) const {
    if (radius < 0.0) return {};

    IndexList out;
    for (std::size_t j : candidates(query, radius * radius * (1.0 + kBoundSlack))) {
        if (j != query && std::sqrt(squared_distance(query, j)) <= radius) {
            out.push_back(j);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

IndexList AnnIndex::nearest(std::size_t query, std::size_t k) const {
    const std::size_t n = size();
    k = std::min(k, n - 1);
    if (k == 0) return {};

    // k + 1 nearest so the query itself can be dropped.
    const int want = static_cast<int>(k + 1);
    std::vector<ANNidx>  idx(static_cast<std::size_t>(want));
    std::vector<ANNdist> dist(static_cast<std::size_t>(want));
    tree_->annkSearch(data_.get()[query], want, idx.data(), dist.data(), 0.0);

    // Squared distance of the k-th nearest other point.
    double bound = dist.back();
    std::size_t seen = 0;
    for (int h = 0; h < want; ++h) {
        if (static_cast<std::size_t>(idx[static_cast<std::size_t>(h)]) == query) continue;
        if (++seen == k) {
            bound = dist[static_cast<std::size_t>(h)];
            break;
        }
    }

    // Every point tied with the k-th must be seen to break ties by index.
    std::vector<std::pair<double, std::size_t>> ranked;
    for (std::size_t j : candidates(query, bound * (1.0 + kBoundSlack))) {
        if (j != query) ranked.emplace_back(squared_distance(query, j), j);
    }
    std::sort(ranked.begin(), ranked.end());

    IndexList out;
    out.reserve(k);
    for (std::size_t r = 0; r < std::min(k, ranked.size()); ++r) {
        out.push_back(ranked[r].second);
    }
    return out;
}

}  // namespace stint::detail
