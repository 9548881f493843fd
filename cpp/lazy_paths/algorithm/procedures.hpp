#pragma once

#include <string_view>

namespace lazy_paths {

constexpr const std::string_view kOptionMaxResults = "max_results";
constexpr const std::string_view kOptionMaxDistance = "max_distance";

} // namespace lazy_paths
