#pragma once

#include <cstddef>
#include <optional>

#include "../util/options.hpp"
#include "shortest_path.hpp"

namespace lazy_paths {

/// @brief Bounds on how far a collecting query pulls from a search.
struct SearchOptions {
    /// @brief Stop after this many paths. Unbounded if empty.
    std::optional<std::size_t> max_results;
    /// @brief Stop at the first path farther than this from the start node. Unbounded if empty.
    std::optional<double> max_distance;
    /// @brief Function that should throw an exception if execution should be aborted.
    CheckAbortFunc check_abort = CheckAbortNoop;

    /// @brief Reads `max_results` and `max_distance` from a set of options.
    /// @throws std::invalid_argument on unknown keys, values of the wrong type, a negative `max_results`,
    ///     or a negative or NaN `max_distance`.
    static SearchOptions FromOptions(const util::Options& options);
};

} // namespace lazy_paths
