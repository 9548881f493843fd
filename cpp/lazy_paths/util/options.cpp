#include "options.hpp"
#include "map.hpp"

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace lazy_paths {
namespace util {

Options::Options() : _map() {}
Options::Options(OptionMap &&map) : _map(std::move(map)) {}
Options::Options(const OptionMap &map) : _map(map) {}

std::optional<double> Options::Numeric(std::string_view key) const { return MapGetNumericOpt(_map, key); }

std::optional<int64_t> Options::Integer(std::string_view key) const { return MapGetIntOpt(_map, key); }

std::vector<std::string> Options::Keys() const {
  std::vector<std::string> result;
  result.reserve(_map.size());
  for (const auto &[key, value] : _map) {
    result.push_back(key);
  }
  return result;
}

}  // namespace util
}  // namespace lazy_paths
