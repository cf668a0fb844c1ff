/**
 * @file Merge.hpp
 * @brief In-place merge of one bindable list into another
 */

#ifndef PROPSYNC_DETAIL_MERGE_HPP
#define PROPSYNC_DETAIL_MERGE_HPP

#include "../CollectionUtil.hpp"

#include <memory>
#include <vector>

namespace propsync::detail {

/**
 * @brief Make target's contents equal source's, keeping target's instance
 *
 * Does nothing when either side is null. Otherwise clears target and appends
 * source's elements in order, so observers of target see one Reset followed
 * by one Add per element. When both pointers share one list, the elements are
 * snapshotted before the clear and the list ends with its original contents.
 */
template<typename List>
void merge_collection(const std::shared_ptr<List>& target, const std::shared_ptr<List>& source) {
    if (!target || !source) {
        return;
    }

    if (target == source) {
        const std::vector<typename List::value_type> snapshot(source->begin(), source->end());
        target->clear();
        add_range(*target, snapshot);
        return;
    }

    target->clear();
    add_range(*target, *source);
}

} // namespace propsync::detail

#endif // PROPSYNC_DETAIL_MERGE_HPP
