#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace lazy_paths {
namespace util {

using OptionValue = std::variant<bool, int64_t, double, std::string>;
using OptionMap = std::unordered_map<std::string, OptionValue>;

// Each getter returns std::nullopt if `key` is absent and throws std::invalid_argument if the value
// stored under `key` has the wrong type.

std::optional<double> MapGetNumericOpt(const OptionMap &map, std::string_view key);

std::optional<int64_t> MapGetIntOpt(const OptionMap &map, std::string_view key);

}  // namespace util
}  // namespace lazy_paths
