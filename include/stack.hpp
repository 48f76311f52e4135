#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace intcalc {

// Простой стек (LIFO) поверх std::vector.
// Пустой стек при pop/peek означает нарушение внутренней согласованности,
// поэтому выбрасывается std::logic_error.
template <class T>
class Stack {
public:
    void push(T value) { items.push_back(std::move(value)); }

    T pop() {
        ensureNotEmpty();
        T value = std::move(items.back());
        items.pop_back();
        return value;
    }

    const T& peek() const {
        ensureNotEmpty();
        return items.back();
    }

    bool isEmpty() const { return items.empty(); }

    std::size_t size() const { return items.size(); }

private:
    std::vector<T> items;

    void ensureNotEmpty() const {
        if (items.empty()) {
            throw std::logic_error("Stack is empty");
        }
    }
};

} // namespace intcalc
