#pragma once

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>

#include "path.hpp"

namespace lazy_paths {

/// @brief Signature of a function used to check if the execution should be aborted.
///     The function is expected to throw an exception if the execution should be aborted,
///     and do nothing otherwise.
using CheckAbortFunc = std::function<void()>;

/// @brief No-op function for passing in to searches when no checking is required.
void CheckAbortNoop();

/// @brief Describes how to tell whether a node identity is absent.
///     Value types are never null. Specialize for custom nullable handles.
/// @tparam N Node type.
template <typename N>
struct NodeTraits {
    static constexpr bool is_null(const N&) noexcept { return false; }
};

template <typename T>
struct NodeTraits<T*> {
    static constexpr bool is_null(T* const& node) noexcept { return node == nullptr; }
};

template <typename T>
struct NodeTraits<std::shared_ptr<T>> {
    static bool is_null(const std::shared_ptr<T>& node) noexcept { return node == nullptr; }
};

template <typename T>
struct NodeTraits<std::optional<T>> {
    static constexpr bool is_null(const std::optional<T>& node) noexcept { return !node.has_value(); }
};

/// @brief A callable that can hold no target, such as a function pointer or std::function.
template <typename F>
concept NullableCallable = requires(const F& func) {
    { func == nullptr } -> std::convertible_to<bool>;
};

/// @brief An element produced by a neighbor function: a (neighbor, edge weight) pair.
template <typename E, typename N>
concept NeighborEntry = requires(const E& entry) {
    { std::get<0>(entry) } -> std::convertible_to<const N&>;
    { std::get<1>(entry) } -> std::convertible_to<double>;
};

/// @brief A function from a node to a finite range of its direct neighbors and the weights of
///     the edges leading to them.
template <typename F, typename N>
concept NeighborFunction = std::invocable<F&, const N&>
    && std::ranges::input_range<std::invoke_result_t<F&, const N&>>
    && NeighborEntry<std::ranges::range_value_t<std::invoke_result_t<F&, const N&>>, N>;

} // namespace lazy_paths
