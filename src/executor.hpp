#pragma once

// Process-global work-stealing executor via Taskflow.
//
// Created on first use, destroyed at exit. Bulk work (index rebuilds)
// submits through it.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

#include <cstddef>
#include <utility>

namespace marksync::detail {

inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Run fn(i) for i in [0, count) on the global executor and wait.
template <typename Fn>
void parallel_for(std::size_t count, Fn&& fn) {
    if (count == 0) return;
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, count, std::size_t{1}, std::forward<Fn>(fn));
    global_executor().run(taskflow).wait();
}

}  // namespace marksync::detail
