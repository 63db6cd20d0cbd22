#pragma once

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

namespace Slowosiec {

/**
 * @brief Forward iterator that applies a projection on dereference.
 *
 * Nothing is materialised up front; each dereference builds a fresh value.
 */
template <typename BaseIt, typename Fn>
class TransformIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::decay_t<std::invoke_result_t<const Fn&, typename std::iterator_traits<BaseIt>::reference>>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = value_type;

    TransformIterator() = default;
    TransformIterator(BaseIt it, Fn fn) : it_(std::move(it)), fn_(std::move(fn)) {}

    reference operator*() const { return fn_(*it_); }

    TransformIterator& operator++() {
        ++it_;
        return *this;
    }

    TransformIterator operator++(int) {
        auto tmp = *this;
        ++*this;
        return tmp;
    }

    bool operator==(const TransformIterator& other) const { return it_ == other.it_; }
    bool operator!=(const TransformIterator& other) const { return !(*this == other); }

private:
    BaseIt it_{};
    Fn fn_{};
};

/**
 * @brief Forward iterator that skips elements rejected by a predicate.
 */
template <typename BaseIt, typename Pred>
class FilterIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = typename std::iterator_traits<BaseIt>::value_type;
    using difference_type = std::ptrdiff_t;
    using pointer = typename std::iterator_traits<BaseIt>::pointer;
    using reference = typename std::iterator_traits<BaseIt>::reference;

    FilterIterator() = default;
    FilterIterator(BaseIt it, BaseIt end, Pred pred)
        : it_(std::move(it)), end_(std::move(end)), pred_(std::move(pred)) {
        satisfy();
    }

    reference operator*() const { return *it_; }
    pointer operator->() const { return &*it_; }

    FilterIterator& operator++() {
        ++it_;
        satisfy();
        return *this;
    }

    FilterIterator operator++(int) {
        auto tmp = *this;
        ++*this;
        return tmp;
    }

    bool operator==(const FilterIterator& other) const { return it_ == other.it_; }
    bool operator!=(const FilterIterator& other) const { return !(*this == other); }

private:
    void satisfy() {
        while (it_ != end_ && !pred_(*it_)) ++it_;
    }

    BaseIt it_{};
    BaseIt end_{};
    Pred pred_{};
};

/**
 * @brief A [begin, end) pair usable in range-for. Every begin() call starts a
 * fresh pass over the underlying collection.
 */
template <typename It>
class LazyRange {
public:
    using iterator = It;
    using value_type = typename std::iterator_traits<It>::value_type;

    LazyRange(It begin, It end) : begin_(std::move(begin)), end_(std::move(end)) {}

    It begin() const { return begin_; }
    It end() const { return end_; }

    bool empty() const { return begin_ == end_; }

    /// Walks the range; O(n).
    size_t count() const { return static_cast<size_t>(std::distance(begin_, end_)); }

private:
    It begin_;
    It end_;
};

template <typename BaseIt, typename Fn>
LazyRange<TransformIterator<BaseIt, Fn>> transform_range(BaseIt begin, BaseIt end, Fn fn) {
    return {TransformIterator<BaseIt, Fn>(begin, fn), TransformIterator<BaseIt, Fn>(end, fn)};
}

template <typename BaseIt, typename Pred>
LazyRange<FilterIterator<BaseIt, Pred>> filter_range(BaseIt begin, BaseIt end, Pred pred) {
    return {FilterIterator<BaseIt, Pred>(begin, end, pred), FilterIterator<BaseIt, Pred>(end, end, pred)};
}

} // namespace Slowosiec
