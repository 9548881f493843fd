#pragma once

#include <cmath>
#include <concepts>
#include <cstddef>
#include <functional>
#include <ranges>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "dijkstra.hpp"
#include "search_options.hpp"

namespace lazy_paths {

/// @brief Finds the `k` closest nodes to `start` that satisfy `predicate`, without exploring the graph
///     any further than needed to find them.
/// @param start The start node.
/// @param neighbors Function returning the direct neighbors of a node and the weights of the edges to them.
/// @param k Maximum number of paths to return.
/// @param predicate Called on the destination node of each path in order of distance.
/// @return Up to `k` paths, in non-decreasing order of distance.
template <typename N, typename NeighborFunc, typename Predicate>
    requires NeighborFunction<NeighborFunc, N> && std::predicate<const Predicate&, const N&>
std::vector<Path<N>> NearestPaths(const N& start, NeighborFunc neighbors, std::size_t k, const Predicate& predicate) {
    std::vector<Path<N>> result;
    if (k == 0) {
        return result;
    }

    ShortestPathSearch<N, NeighborFunc> search(start, std::move(neighbors));
    auto matches = [&predicate](const Path<N>& path) { return std::invoke(predicate, path.to()); };
    for (const auto& path : search | std::views::filter(matches)) {
        result.push_back(path);
        if (result.size() == k) {
            break;
        }
    }
    return result;
}

/// @brief Finds the `k` closest nodes to `start`, including `start` itself.
template <typename N, typename NeighborFunc>
    requires NeighborFunction<NeighborFunc, N>
std::vector<Path<N>> NearestPaths(const N& start, NeighborFunc neighbors, std::size_t k) {
    return NearestPaths(start, std::move(neighbors), k, [](const N&) { return true; });
}

/// @brief Finds the shortest paths to every node within `max_distance` of `start`.
///     The first node farther away is finalized to detect the bound, nothing beyond it.
/// @throws std::invalid_argument if `max_distance` is negative or NaN.
template <typename N, typename NeighborFunc>
    requires NeighborFunction<NeighborFunc, N>
std::vector<Path<N>> PathsWithin(const N& start, NeighborFunc neighbors, double max_distance) {
    if (std::isnan(max_distance) || max_distance < 0) {
        throw std::invalid_argument(fmt::format("max_distance must be a non-negative number: {}", max_distance));
    }

    ShortestPathSearch<N, NeighborFunc> search(start, std::move(neighbors));
    auto within = [max_distance](const Path<N>& path) { return path.distance() <= max_distance; };

    std::vector<Path<N>> result;
    for (const auto& path : search | std::views::take_while(within)) {
        result.push_back(path);
    }
    return result;
}

/// @brief Collects shortest paths from `start` until one of the bounds in `options` is reached or the
///     reachable graph is exhausted. With no bounds set this traverses everything reachable.
template <typename N, typename NeighborFunc>
    requires NeighborFunction<NeighborFunc, N>
std::vector<Path<N>> CollectPaths(const N& start, NeighborFunc neighbors, const SearchOptions& options) {
    ShortestPathSearch<N, NeighborFunc> search(start, std::move(neighbors), options.check_abort);

    std::vector<Path<N>> result;
    while (!options.max_results.has_value() || result.size() < *options.max_results) {
        auto path = search.next();
        if (!path.has_value()) {
            break;
        }
        if (options.max_distance.has_value() && path->distance() > *options.max_distance) {
            break;
        }
        result.push_back(std::move(*path));
    }

    spdlog::debug(
        "lazy_paths: collected {} paths, {} nodes finalized, exhausted: {}",
        result.size(), search.num_finalized(), search.exhausted()
    );
    return result;
}

} // namespace lazy_paths
