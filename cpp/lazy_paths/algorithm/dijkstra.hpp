#pragma once

#include <cmath>
#include <compare>
#include <cstddef>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <boost/heap/fibonacci_heap.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "path.hpp"
#include "shortest_path.hpp"

namespace lazy_paths {

/// @brief Dijkstra's algorithm computed incrementally, one finalized node per pull.
///
/// The search starts with only the start node on the frontier. Each call to `next()` pops the closest
/// unfinalized path, finalizes its node, calls the neighbor function once for that node to relax its
/// out-edges, and then returns the path. Nothing beyond that is explored, so a caller that only needs
/// the first few results (or all results within some distance) never pays for the rest of the graph,
/// which may be infinite.
///
/// The search is single-pass: the frontier, the finalized set and the best-known distances are
/// consumed as results are produced. It is also an input range, so it composes with std::views:
/// @code
///   auto search = ShortestPathsFrom(home, streets_around);
///   for (const auto& path : search | std::views::take_while([](const auto& p) { return p.distance() <= 5.0; })) {
///       ...
///   }
/// @endcode
///
/// @tparam N Node type. Used as a hash key, so it must work with `Hash` and `KeyEqual`.
/// @tparam NeighborFunc Callable returning the (neighbor, weight) pairs of a node.
/// @tparam Hash Hash function for nodes.
/// @tparam KeyEqual Equality function for nodes.
template <
    typename N, typename NeighborFunc,
    typename Hash = std::hash<N>, typename KeyEqual = std::equal_to<N>
>
    requires NeighborFunction<NeighborFunc, N>
class ShortestPathSearch {
public:
    using Self = ShortestPathSearch<N, NeighborFunc, Hash, KeyEqual>;
    using NodeType = N;
    using PathType = Path<N>;
    /// @brief Set of finalized nodes.
    using NodeSet = std::unordered_set<N, Hash, KeyEqual>;
    /// @brief Lowest-distance path discovered so far to each unfinalized node.
    using BestKnownMap = std::unordered_map<N, PathIndex, Hash, KeyEqual>;

    /// @brief Single-pass iterator over the paths of a search. Results are pulled when the iterator is
    ///     dereferenced or compared with the end sentinel, never when it is incremented, so
    ///     `std::views::take(k)` finalizes exactly k nodes.
    class iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = PathType;

        iterator() = default;
        explicit iterator(Self* owner): owner(owner) {}

        const PathType& operator*() const {
            return owner->current();
        }

        const PathType* operator->() const {
            return &owner->current();
        }

        iterator& operator++() {
            owner->discard_current();
            return *this;
        }

        void operator++(int) {
            ++*this;
        }

        /// @brief Pulls the next result if needed and returns true if there is none.
        bool at_end() const {
            return !owner->has_current();
        }

        friend bool operator==(const iterator& it, std::default_sentinel_t) {
            return it.at_end();
        }

    private:
        Self* owner = nullptr;
    };

private:
    struct HeapData {
        PathIndex path;
        double distance;

        std::partial_ordering operator<=>(const HeapData& rhs) const {
            return distance <=> rhs.distance;
        }
    };

    // Type used for the frontier, sorted by distance from the start node.
    // Making the comparison function std::greater makes it a min-queue.
    // Entries are never updated in place: a shorter path to a node is pushed as a new entry and the
    // old one is skipped when it is popped after the node has been finalized.
    using HeapType = boost::heap::fibonacci_heap<HeapData, boost::heap::compare<std::greater<HeapData>>>;

    enum class State { Ready, Finalizing, Exhausted, Failed };

    NeighborFunc neighbors;
    CheckAbortFunc check_abort;
    std::shared_ptr<PathArena<N>> arena;
    HeapType frontier;
    NodeSet finalized;
    BestKnownMap best_known;
    State state;

    // Result pulled by an iterator but not yet stepped past.
    std::optional<PathType> pending;
    bool pulled;

public:
    /// @brief Seeds a search with the zero-distance path to `start`. No neighbors are looked up yet.
    /// @param start The start node.
    /// @param neighbors Function returning the direct neighbors of a node and the weights of the edges
    ///     to them. Called at most once per finalized node, in the order nodes are finalized.
    /// @param check_abort Function that should throw an exception if the search should be aborted.
    ///     Called at the beginning of every pull.
    /// @param hash Hash function for nodes.
    /// @param equal Equality function for nodes.
    /// @throws std::invalid_argument if `start`, `neighbors` or `check_abort` is null.
    ShortestPathSearch(
        const N& start, NeighborFunc neighbors, CheckAbortFunc check_abort = CheckAbortNoop,
        const Hash& hash = Hash(), const KeyEqual& equal = KeyEqual()
    ):
        neighbors(std::move(neighbors)),
        check_abort(std::move(check_abort)),
        arena(std::make_shared<PathArena<N>>()),
        frontier(),
        finalized(0, hash, equal),
        best_known(0, hash, equal),
        state(State::Ready),
        pending(),
        pulled(false)
    {
        if (NodeTraits<N>::is_null(start)) {
            throw std::invalid_argument("start node cannot be null");
        }
        if constexpr (NullableCallable<NeighborFunc>) {
            if (this->neighbors == nullptr) {
                throw std::invalid_argument("neighbor function cannot be null");
            }
        }
        if (!this->check_abort) {
            throw std::invalid_argument("check_abort function cannot be null");
        }

        auto start_index = arena->add_start(start);
        frontier.push(HeapData{start_index, 0.0});
    }

    ShortestPathSearch(const Self&) = delete;
    ShortestPathSearch(Self&&) = default;
    Self& operator=(const Self&) = delete;
    Self& operator=(Self&&) = default;

    /// @brief Finalizes the next closest node and returns the shortest path to it.
    /// @return The path, or std::nullopt once every reachable node has been produced or the search failed.
    /// @throws std::invalid_argument if the neighbor function yields a null node or a negative or NaN weight.
    ///     Exceptions thrown by the neighbor function or `check_abort` are propagated unchanged.
    ///     After any exception the search produces no further paths.
    std::optional<PathType> next() {
        if (exhausted()) {
            return std::nullopt;
        }

        try {
            check_abort();

            while (!frontier.empty()) {
                auto top = frontier.top();
                frontier.pop();

                const N& node = (*arena)[top.path].node;
                if (finalized.contains(node)) {
                    // Stale entry, a shorter path to this node was already finalized.
                    continue;
                }
                finalized.insert(node);
                best_known.erase(node);

                state = State::Finalizing;
                auto num_relaxed = relax(top.path);
                state = State::Ready;

                spdlog::trace(
                    "lazy_paths: finalized node {} at distance {}, {} neighbors relaxed",
                    finalized.size(), top.distance, num_relaxed
                );
                return PathType(arena, top.path);
            }
        } catch (const std::exception& e) {
            fail(e.what());
            throw;
        } catch (...) {
            fail("non-standard exception");
            throw;
        }

        state = State::Exhausted;
        spdlog::debug(
            "lazy_paths: search exhausted after finalizing {} nodes ({} paths discovered)",
            finalized.size(), arena->size()
        );
        return std::nullopt;
    }

    iterator begin() {
        return iterator(this);
    }

    std::default_sentinel_t end() const noexcept {
        return std::default_sentinel;
    }

    /// @brief Returns true once the search will produce no further paths.
    bool exhausted() const noexcept {
        return state == State::Exhausted || state == State::Failed;
    }

    /// @brief Returns true if the search was abandoned because of an exception.
    bool failed() const noexcept {
        return state == State::Failed;
    }

    /// @brief Returns the number of nodes finalized so far.
    std::size_t num_finalized() const noexcept {
        return finalized.size();
    }

    /// @brief Returns the number of frontier entries, including stale ones.
    std::size_t frontier_size() const noexcept {
        return frontier.size();
    }

private:
    std::size_t relax(PathIndex current) {
        // Deque-backed, so this reference survives the extensions below.
        const auto& current_entry = (*arena)[current];
        std::size_t num_relaxed = 0;

        for (auto&& [neighbor, weight] : std::invoke(neighbors, current_entry.node)) {
            const N& next_node = neighbor;
            if (NodeTraits<N>::is_null(next_node)) {
                throw std::invalid_argument("neighbor node cannot be null");
            }
            const double edge_weight = static_cast<double>(weight);
            if (std::isnan(edge_weight)) {
                throw std::invalid_argument("Distance cannot be NaN");
            }
            if (edge_weight < 0) {
                throw std::invalid_argument(fmt::format("Distance cannot be negative: {}", edge_weight));
            }
            if (finalized.contains(next_node)) {
                continue;
            }

            const double dist_to_next = current_entry.distance + edge_weight;
            auto known = best_known.find(next_node);
            // Ties keep the path found first.
            if (known != best_known.end() && !(dist_to_next < (*arena)[known->second].distance)) {
                continue;
            }

            auto shorter = arena->extend(current, next_node, edge_weight);
            if (known == best_known.end()) {
                best_known.emplace(next_node, shorter);
            } else {
                known->second = shorter;
            }
            frontier.push(HeapData{shorter, dist_to_next});
            num_relaxed++;
        }

        return num_relaxed;
    }

    void fail(std::string_view reason) {
        state = State::Failed;
        frontier.clear();
        best_known.clear();
        spdlog::debug(
            "lazy_paths: search failed after finalizing {} nodes: {}", finalized.size(), reason
        );
    }

    bool has_current() {
        if (!pulled) {
            pending = next();
            pulled = true;
        }
        return pending.has_value();
    }

    const PathType& current() {
        has_current();
        return *pending;
    }

    void discard_current() {
        has_current();
        pending.reset();
        pulled = false;
    }
};

/// @brief Returns a lazy search for the shortest paths from `start`.
///
/// `neighbors` is called on the fly to find the direct neighbors of the node being finalized. It returns
/// a range of (neighbor, weight) pairs such as `std::vector<std::pair<N, double>>` or `std::map<N, double>`.
///
/// `start` corresponds to the first path produced, with a distance of 0, followed by the next closest
/// node and so on, in non-decreasing order of distance. Nodes at equal distance come out in no
/// particular order.
///
/// @param start The start node.
/// @param neighbors Function returning the direct neighbors of a node and the weights of the edges to them.
/// @param check_abort Function that should throw an exception if execution should be aborted.
/// @throws std::invalid_argument if `start` or `neighbors` is null.
template <typename N, typename NeighborFunc>
    requires NeighborFunction<NeighborFunc, N>
ShortestPathSearch<N, NeighborFunc> ShortestPathsFrom(
    const N& start, NeighborFunc neighbors, const CheckAbortFunc& check_abort = CheckAbortNoop
) {
    return ShortestPathSearch<N, NeighborFunc>(start, std::move(neighbors), check_abort);
}

} // namespace lazy_paths
