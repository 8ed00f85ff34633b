#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace miniretrieval::algo {

// Lazy, single-pass producer of values. A sequence reports exhaustion once
// its generator returns nullopt and stays exhausted afterwards; re-running
// the query that made it is the only way to start over.
template <typename T>
class Sequence {
public:
    using value_type = T;
    using Generator = std::function<std::optional<T>()>;

    Sequence() = default;
    explicit Sequence(Generator gen) : gen_(std::move(gen)) {}

    Sequence(const Sequence&) = delete;
    Sequence& operator=(const Sequence&) = delete;
    Sequence(Sequence&&) = default;
    Sequence& operator=(Sequence&&) = default;

    std::optional<T> next() {
        if (done_ || !gen_) {
            done_ = true;
            return std::nullopt;
        }
        auto value = gen_();
        if (!value) {
            done_ = true;
            gen_ = nullptr;
        }
        return value;
    }

    bool exhausted() const { return done_; }

    // Pulls at most n values; the rest of the sequence is left untouched.
    std::vector<T> take(std::size_t n) {
        std::vector<T> out;
        while (out.size() < n) {
            auto value = next();
            if (!value) break;
            out.push_back(std::move(*value));
        }
        return out;
    }

    std::vector<T> collect() {
        std::vector<T> out;
        while (auto value = next()) {
            out.push_back(std::move(*value));
        }
        return out;
    }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;
        explicit iterator(Sequence* seq) : seq_(seq) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        friend bool operator==(const iterator& a, const iterator& b) { return a.seq_ == b.seq_; }
        friend bool operator!=(const iterator& a, const iterator& b) { return a.seq_ != b.seq_; }

    private:
        void advance() {
            current_ = seq_->next();
            if (!current_) seq_ = nullptr;
        }

        Sequence* seq_ = nullptr;
        std::optional<T> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    Generator gen_;
    bool done_ = false;
};

// Borrowing view over an already sorted list. The list must outlive the sequence.
template <typename T>
Sequence<T> fromList(const std::vector<T>& list) {
    return Sequence<T>([&list, pos = std::size_t{0}]() mutable -> std::optional<T> {
        if (pos >= list.size()) return std::nullopt;
        return list[pos++];
    });
}

template <typename T>
Sequence<T> fromVector(std::vector<T> values) {
    auto owned = std::make_shared<std::vector<T>>(std::move(values));
    return Sequence<T>([owned, pos = std::size_t{0}]() mutable -> std::optional<T> {
        if (pos >= owned->size()) return std::nullopt;
        return (*owned)[pos++];
    });
}

} // namespace miniretrieval::algo
