#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace lazy_paths {

/// @brief Index of a path entry inside a PathArena.
using PathIndex = std::size_t;

/// @brief Append-only storage for the paths discovered by a single search.
///     Each entry records its last node, the index of its predecessor entry and the cumulative distance,
///     so extending a path is O(1) and prefixes are shared by every path derived from them.
/// @tparam N Node type.
template <typename N>
class PathArena {
public:
    /// @brief Marker for the predecessor of the start path.
    static constexpr const PathIndex NO_PREDECESSOR = std::numeric_limits<PathIndex>::max();

    struct Entry {
        N node;
        PathIndex predecessor;
        double distance;
    };

    /// @brief Adds the zero-distance path consisting only of `start`.
    PathIndex add_start(const N& start) {
        entries.push_back(Entry{start, NO_PREDECESSOR, 0.0});
        return entries.size() - 1;
    }

    /// @brief Adds a path that extends the path at `from` by one edge. The entry at `from` is not modified.
    /// @param from Index of the path being extended.
    /// @param next The node the new edge leads to.
    /// @param weight Weight of the new edge.
    /// @return Index of the new path.
    PathIndex extend(PathIndex from, const N& next, double weight) {
        double distance = entries[from].distance + weight;
        entries.push_back(Entry{next, from, distance});
        return entries.size() - 1;
    }

    const Entry& operator[](PathIndex index) const {
        return entries[index];
    }

    /// @brief Number of paths stored, including ones that were later superseded.
    std::size_t size() const noexcept {
        return entries.size();
    }

private:
    // A deque keeps references returned by Path::to() valid while the search keeps appending.
    std::deque<Entry> entries;
};

/// @brief The path from the start node of a search to a destination node.
///     Paths are immutable. A Path shares ownership of the arena it lives in, so it stays valid
///     after the search that produced it has been destroyed.
/// @tparam N Node type.
template <typename N>
class Path {
public:
    using ArenaType = PathArena<N>;
    /// @brief A node along the path with the cumulative distance from the start node up to it.
    using NodeDistance = std::pair<N, double>;

    Path(std::shared_ptr<const ArenaType> arena, PathIndex index): arena(std::move(arena)), index(index) {}

    Path(const Path<N>&) = default;
    Path(Path<N>&&) = default;
    Path<N>& operator=(const Path<N>&) = default;
    Path<N>& operator=(Path<N>&&) = default;

    /// @brief Returns the last node of this path.
    const N& to() const {
        return entry().node;
    }

    /// @brief Returns the distance between the start node and the last node of this path.
    ///     Zero for the first path produced by a search, in which case `to()` is the start node.
    double distance() const {
        return entry().distance;
    }

    /// @brief Returns the number of edges in the path.
    std::size_t length() const {
        std::size_t result = 0;
        for (PathIndex i = index; (*arena)[i].predecessor != ArenaType::NO_PREDECESSOR; i = (*arena)[i].predecessor) {
            result++;
        }
        return result;
    }

    /// @brief Returns the path without its last edge, or std::nullopt for the start path.
    std::optional<Path<N>> predecessor() const {
        auto pred = entry().predecessor;
        if (pred == ArenaType::NO_PREDECESSOR) {
            return std::nullopt;
        }
        return Path<N>(arena, pred);
    }

    /// @brief Returns all nodes from the start node along this path, each with the cumulative
    ///     distance from the start node. Walks the predecessor chain on every call.
    std::vector<NodeDistance> nodes() const {
        std::vector<NodeDistance> result;
        for (PathIndex i = index; i != ArenaType::NO_PREDECESSOR; i = (*arena)[i].predecessor) {
            const auto& e = (*arena)[i];
            result.emplace_back(e.node, e.distance);
        }
        std::ranges::reverse(result);
        return result;
    }

    /// @brief Formats the nodes of this path joined by "->". Requires a fmt formatter for N.
    std::string to_string() const {
        auto steps = nodes();
        auto node_ids = steps | std::views::keys;
        return fmt::format("{}", fmt::join(node_ids, "->"));
    }

private:
    const typename ArenaType::Entry& entry() const {
        return (*arena)[index];
    }

    std::shared_ptr<const ArenaType> arena;
    PathIndex index;
};

} // namespace lazy_paths
