#include "search_options.hpp"
#include "procedures.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

namespace lazy_paths {

SearchOptions SearchOptions::FromOptions(const util::Options& options) {
    for (const auto& key : options.Keys()) {
        if (key != kOptionMaxResults && key != kOptionMaxDistance) {
            throw std::invalid_argument(fmt::format("unknown option {}", key));
        }
    }

    SearchOptions result;

    if (auto max_results = options.Integer(kOptionMaxResults)) {
        if (*max_results < 0) {
            throw std::invalid_argument(fmt::format("option {} cannot be negative: {}", kOptionMaxResults, *max_results));
        }
        result.max_results = static_cast<std::size_t>(*max_results);
    }

    if (auto max_distance = options.Numeric(kOptionMaxDistance)) {
        if (std::isnan(*max_distance) || *max_distance < 0) {
            throw std::invalid_argument(fmt::format("option {} must be a non-negative number: {}", kOptionMaxDistance, *max_distance));
        }
        result.max_distance = *max_distance;
    }

    return result;
}

} // namespace lazy_paths
