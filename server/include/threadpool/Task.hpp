// Task.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <utility>

struct Task {
    std::size_t id{};
    std::function<void()> fn;

    Task() = default;

    Task(std::size_t id_, std::function<void()> fn_)
        : id(id_), fn(std::move(fn_)) {}
};
