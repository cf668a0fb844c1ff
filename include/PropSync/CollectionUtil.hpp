/**
 * @file CollectionUtil.hpp
 * @brief Small range helpers
 *
 * - add_range: append every element of a range to a container, in order
 * - for_each: apply a function to each element and hand the range back
 */

#ifndef PROPSYNC_COLLECTION_UTIL_HPP
#define PROPSYNC_COLLECTION_UTIL_HPP

#include "detail/TypeTraits.hpp"

#include <iterator>
#include <utility>
#include <vector>

namespace propsync {

/**
 * @brief Append every element of items to container
 *
 * Uses push_back when the container has one, insert at end otherwise.
 * Appending a container to itself appends a snapshot of its contents.
 *
 * @code
 * std::vector<int> v{1};
 * add_range(v, std::list<int>{2, 3});   // v == {1, 2, 3}
 * @endcode
 */
template<typename Container, IterableRange Range>
void add_range(Container& container, const Range& items) {
    if (static_cast<const void*>(&container) == static_cast<const void*>(&items)) {
        const std::vector<typename Container::value_type> snapshot(std::begin(items), std::end(items));
        add_range(container, snapshot);
        return;
    }

    for (const auto& item : items) {
        if constexpr (requires { container.push_back(item); }) {
            container.push_back(item);
        } else {
            container.insert(container.end(), item);
        }
    }
}

/**
 * @brief Apply fn to each element of values in iteration order
 * @return values, for chaining
 */
template<IterableRange Range, typename Fn>
Range& for_each(Range& values, Fn&& fn) {
    for (auto& value : values) {
        fn(value);
    }
    return values;
}

} // namespace propsync

#endif // PROPSYNC_COLLECTION_UTIL_HPP
