/**
 * @file Synchronizer.hpp
 * @brief In-place member copying between two instances of a registered type
 *
 * Entry points:
 * - copy_all: every copyable member, straight from the memoized shape
 * - copy_all_fast: same result through the precompiled Replace plan
 * - copy_excluding: Replace plan that skips named or selected members
 * - copy_merging_collections: bindable lists are merged into the target's
 *   existing list instead of being replaced
 *
 * Every entry point has a pointer form, which rejects null arguments with
 * InvalidArgumentError, and a reference form. Passing the same instance as
 * target and source does nothing.
 *
 * Usage:
 * @code
 * Customer edited = current;
 * edited.name = "Ada";
 * propsync::copy_merging_collections(current, edited);   // current.tags keeps its observers
 * propsync::copy_excluding(current, edited, {"Id"});
 * propsync::copy_excluding(current, edited, {&Customer::id});
 * @endcode
 */

#ifndef PROPSYNC_SYNCHRONIZER_HPP
#define PROPSYNC_SYNCHRONIZER_HPP

#include "CopyPlan.hpp"
#include "ExclusionSet.hpp"
#include "MemberSelector.hpp"
#include "PlanCache.hpp"
#include "Shape.hpp"
#include "detail/Exceptions.hpp"
#include "detail/TypeManager.hpp"
#include "detail/TypeTraits.hpp"

#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace propsync {

/**
 * @brief Memoized shape of T
 *
 * @throws TypeNotRegisteredError if T was never registered
 */
template<Reflectable T>
const Shape& shape_of() {
    static const std::shared_ptr<const Shape> shape =
        PlanCache::instance().shape(detail::type_info_of<T>());
    return *shape;
}

namespace detail {

template<typename T>
void require_arguments(const T* target, const T* source) {
    if (!target) [[unlikely]] {
        throw InvalidArgumentError("target");
    }
    if (!source) [[unlikely]] {
        throw InvalidArgumentError("source");
    }
}

// The exclusion-free plans of one type never change once built, so each
// instantiation holds its own reference and skips the cache lock.
template<Reflectable T, PlanKind Kind>
const CopyPlan& baseline_plan() {
    static const std::shared_ptr<const CopyPlan> plan =
        PlanCache::instance().get_plan(type_info_of<T>(), Kind);
    return *plan;
}

} // namespace detail

// ==================== copy_all ====================

/**
 * @brief Copy every readable and writable member of source onto target
 *
 * Collection members are replaced, never merged.
 *
 * @throws InvalidArgumentError if target or source is null
 * @throws TypeNotRegisteredError if T was never registered
 */
template<Reflectable T>
void copy_all(T* target, const std::type_identity_t<T>* source) {
    detail::require_arguments<T>(target, source);
    if (target == source) {
        return;
    }

    for (const auto& member : shape_of<T>().members()) {
        member.assign(target, source);
    }
}

template<Reflectable T>
void copy_all(T& target, const std::type_identity_t<T>& source) {
    copy_all<T>(std::addressof(target), std::addressof(source));
}

// ==================== copy_all_fast ====================

/**
 * @brief copy_all through the type's precompiled Replace plan
 */
template<Reflectable T>
void copy_all_fast(T* target, const std::type_identity_t<T>* source) {
    detail::require_arguments<T>(target, source);
    if (target == source) {
        return;
    }

    detail::baseline_plan<T, PlanKind::Replace>().apply(target, source);
}

template<Reflectable T>
void copy_all_fast(T& target, const std::type_identity_t<T>& source) {
    copy_all_fast<T>(std::addressof(target), std::addressof(source));
}

// ==================== copy_excluding ====================

/**
 * @brief copy_all_fast skipping the members named in excluded
 *
 * Excluded members are neither read nor written. Names that are not members
 * of T are ignored, and an empty set, including an empty brace list {},
 * behaves like copy_all_fast. Collection
 * members that are not excluded are replaced.
 */
template<Reflectable T>
void copy_excluding(T* target, const std::type_identity_t<T>* source, const ExclusionSet& excluded) {
    detail::require_arguments<T>(target, source);
    if (target == source) {
        return;
    }

    if (excluded.empty()) {
        detail::baseline_plan<T, PlanKind::Replace>().apply(target, source);
        return;
    }

    PlanCache::instance()
        .get_plan(detail::type_info_of<T>(), PlanKind::Replace, excluded)
        ->apply(target, source);
}

template<Reflectable T>
void copy_excluding(T& target, const std::type_identity_t<T>& source, const ExclusionSet& excluded) {
    copy_excluding<T>(std::addressof(target), std::addressof(source), excluded);
}

template<Reflectable T>
void copy_excluding(T* target, const std::type_identity_t<T>* source,
                    std::initializer_list<std::string_view> excluded) {
    copy_excluding<T>(target, source, ExclusionSet(excluded));
}

template<Reflectable T>
void copy_excluding(T& target, const std::type_identity_t<T>& source,
                    std::initializer_list<std::string_view> excluded) {
    copy_excluding<T>(std::addressof(target), std::addressof(source), ExclusionSet(excluded));
}

template<Reflectable T>
void copy_excluding(T* target, const std::type_identity_t<T>* source,
                    std::span<const std::string> excluded) {
    copy_excluding<T>(target, source, ExclusionSet(excluded));
}

template<Reflectable T>
void copy_excluding(T& target, const std::type_identity_t<T>& source,
                    std::span<const std::string> excluded) {
    copy_excluding<T>(std::addressof(target), std::addressof(source), ExclusionSet(excluded));
}

/**
 * @brief Resolve selectors against T's registration into an exclusion set
 *
 * Selectors that do not resolve are dropped.
 */
template<Reflectable T>
ExclusionSet resolve_exclusions(const MemberSelectorList<std::type_identity_t<T>>& selectors) {
    const auto& type = detail::type_info_of<T>();

    ExclusionSet excluded;
    for (const auto& selector : selectors) {
        if (auto name = selector.resolve(type)) {
            excluded.insert(*name);
        }
    }
    return excluded;
}

/**
 * @brief copy_excluding with members picked by member or getter pointer
 *
 * @code
 * copy_excluding(target, source, {&Customer::id, &Customer::display_name});
 * @endcode
 */
template<Reflectable T>
void copy_excluding(T* target, const std::type_identity_t<T>* source,
                    const MemberSelectorList<std::type_identity_t<T>>& selectors) {
    detail::require_arguments<T>(target, source);
    if (target == source) {
        return;
    }

    copy_excluding<T>(target, source, resolve_exclusions<T>(selectors));
}

template<Reflectable T>
void copy_excluding(T& target, const std::type_identity_t<T>& source,
                    const MemberSelectorList<std::type_identity_t<T>>& selectors) {
    copy_excluding<T>(std::addressof(target), std::addressof(source), selectors);
}

// ==================== copy_merging_collections ====================

/**
 * @brief copy_all_fast, merging bindable list members in place
 *
 * For a std::shared_ptr<ObservableList<E>> or std::shared_ptr<BindingList<E>>
 * member, the target keeps its list instance: the list is cleared and
 * refilled with the source's elements in order. Nothing happens to the
 * member when either side holds a null list. Every other member is
 * assigned as in copy_all_fast.
 */
template<Reflectable T>
void copy_merging_collections(T* target, const std::type_identity_t<T>* source) {
    detail::require_arguments<T>(target, source);
    if (target == source) {
        return;
    }

    detail::baseline_plan<T, PlanKind::MergeCollections>().apply(target, source);
}

template<Reflectable T>
void copy_merging_collections(T& target, const std::type_identity_t<T>& source) {
    copy_merging_collections<T>(std::addressof(target), std::addressof(source));
}

} // namespace propsync

#endif // PROPSYNC_SYNCHRONIZER_HPP
