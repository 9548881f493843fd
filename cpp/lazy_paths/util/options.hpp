#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "map.hpp"

namespace lazy_paths {
namespace util {

class Options {
 public:
  Options();
  Options(OptionMap &&map);
  Options(const OptionMap &map);

  std::optional<double> Numeric(std::string_view key) const;
  std::optional<int64_t> Integer(std::string_view key) const;

  /// Names of all options that were set, in no particular order.
  std::vector<std::string> Keys() const;

 private:
  OptionMap _map;
};

}  // namespace util
}  // namespace lazy_paths
