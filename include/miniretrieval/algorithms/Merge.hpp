#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include "miniretrieval/algorithms/Sequence.hpp"

namespace miniretrieval::algo {

namespace detail {

template <typename T>
struct MergeState {
    MergeState(Sequence<T> l, Sequence<T> r) : left(std::move(l)), right(std::move(r)) {}

    void prime() {
        if (primed) return;
        a = left.next();
        b = right.next();
        primed = true;
    }

    Sequence<T> left;
    Sequence<T> right;
    std::optional<T> a;
    std::optional<T> b;
    bool primed = false;
};

} // namespace detail

// Two-pointer merge-join over ascending, duplicate-free inputs. Nothing is
// pulled from either side until the result is first read.
template <typename T>
Sequence<T> intersectSorted(Sequence<T> left, Sequence<T> right) {
    auto state = std::make_shared<detail::MergeState<T>>(std::move(left), std::move(right));
    return Sequence<T>([state]() -> std::optional<T> {
        auto& s = *state;
        s.prime();
        while (s.a && s.b) {
            if (*s.a == *s.b) {
                T value = std::move(*s.a);
                s.a = s.left.next();
                s.b = s.right.next();
                return value;
            }
            if (*s.a < *s.b) {
                s.a = s.left.next();
            } else {
                s.b = s.right.next();
            }
        }
        return std::nullopt;
    });
}

template <typename T>
Sequence<T> unionSorted(Sequence<T> left, Sequence<T> right) {
    auto state = std::make_shared<detail::MergeState<T>>(std::move(left), std::move(right));
    return Sequence<T>([state]() -> std::optional<T> {
        auto& s = *state;
        s.prime();
        if (s.a && s.b) {
            if (*s.a < *s.b) {
                T value = std::move(*s.a);
                s.a = s.left.next();
                return value;
            }
            if (*s.b < *s.a) {
                T value = std::move(*s.b);
                s.b = s.right.next();
                return value;
            }
            T value = std::move(*s.a);
            s.a = s.left.next();
            s.b = s.right.next();
            return value;
        }
        // One side is exhausted: drain the other unchanged.
        if (s.a) {
            T value = std::move(*s.a);
            s.a = s.left.next();
            return value;
        }
        if (s.b) {
            T value = std::move(*s.b);
            s.b = s.right.next();
            return value;
        }
        return std::nullopt;
    });
}

// Left-to-right pairwise reduction. Ordering the inputs by length would only
// change intermediate work, never the result.
template <typename T>
Sequence<T> intersectAll(std::vector<Sequence<T>> lists) {
    if (lists.empty()) return Sequence<T>();
    Sequence<T> acc = std::move(lists.front());
    for (std::size_t i = 1; i < lists.size(); ++i) {
        acc = intersectSorted(std::move(acc), std::move(lists[i]));
    }
    return acc;
}

template <typename T>
Sequence<T> unionAll(std::vector<Sequence<T>> lists) {
    if (lists.empty()) return Sequence<T>();
    Sequence<T> acc = std::move(lists.front());
    for (std::size_t i = 1; i < lists.size(); ++i) {
        acc = unionSorted(std::move(acc), std::move(lists[i]));
    }
    return acc;
}

// Convenience overloads over borrowed lists.
template <typename T>
Sequence<T> intersectSorted(const std::vector<T>& left, const std::vector<T>& right) {
    return intersectSorted(fromList(left), fromList(right));
}

template <typename T>
Sequence<T> unionSorted(const std::vector<T>& left, const std::vector<T>& right) {
    return unionSorted(fromList(left), fromList(right));
}

} // namespace miniretrieval::algo
