#pragma once

#include <cstddef>
#include <future>
#include <numeric>
#include <utility>
#include <vector>

#include <oneapi/tbb/parallel_for_each.h>

namespace haq::core {

/// @brief Run a given function asynchronous
/// @tparam F Function type
/// @tparam ...Ts Function parameters type
/// @param action The action to run
/// @param ...params The action parameters
/// @return The std::future referring to the function call.
template <class F, class... Ts> auto run_async(F &&action, Ts &&...params) {
    return std::async(std::launch::async, std::forward<F>(action), std::forward<Ts>(params)...);
};

/// @brief Parallel for each over a half-open index range
/// @tparam UnaryFunction Function type
/// @param count The number of indices, [0, count)
/// @param func The function object to apply to each index
template <class UnaryFunction> void parallel_for(std::size_t count, UnaryFunction func) {
    if (count == 0) {
        return;
    }

    auto range = std::vector<std::size_t>(count);
    std::iota(range.begin(), range.end(), std::size_t{0});
    tbb::parallel_for_each(range.begin(), range.end(), std::move(func));
}

} // namespace haq::core
