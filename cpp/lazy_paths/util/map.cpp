#include "map.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace lazy_paths {
namespace util {

namespace {

const OptionValue *Find(const OptionMap &map, std::string_view key) {
  auto it = map.find(std::string(key));
  if (it == map.end()) {
    return nullptr;
  }
  return &it->second;
}

std::string_view TypeName(const OptionValue &value) {
  switch (value.index()) {
    case 0:
      return "bool";
    case 1:
      return "integer";
    case 2:
      return "double";
    default:
      return "string";
  }
}

[[noreturn]] void ThrowWrongType(std::string_view key, std::string_view expected, const OptionValue &value) {
  throw std::invalid_argument(
      fmt::format("option {} must be {}, got {}", key, expected, TypeName(value)));
}

}  // namespace

std::optional<double> MapGetNumericOpt(const OptionMap &map, std::string_view key) {
  const auto *value = Find(map, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (const auto *as_double = std::get_if<double>(value)) {
    return *as_double;
  }
  if (const auto *as_int = std::get_if<int64_t>(value)) {
    return static_cast<double>(*as_int);
  }
  ThrowWrongType(key, "numeric", *value);
}

std::optional<int64_t> MapGetIntOpt(const OptionMap &map, std::string_view key) {
  const auto *value = Find(map, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (const auto *as_int = std::get_if<int64_t>(value)) {
    return *as_int;
  }
  ThrowWrongType(key, "an integer", *value);
}

}  // namespace util
}  // namespace lazy_paths
