/**
 * @file TypeTraits.hpp
 * @brief C++20 concepts and type traits for the PropSync library
 *
 * This file defines the concepts used to constrain registration templates
 * and the traits that classify member types when a shape is derived:
 * - Reflectable / Enumeration: what may be registered
 * - SequentialContainer: what the collection helpers can append to
 * - is_mergeable_collection: members merged in place instead of replaced
 */

#ifndef PROPSYNC_DETAIL_TYPE_TRAITS_HPP
#define PROPSYNC_DETAIL_TYPE_TRAITS_HPP

#include <concepts>
#include <type_traits>
#include <memory>
#include <string>
#include <string_view>
#include <iterator>

namespace propsync {

template<typename T>
class ObservableList;

template<typename T>
class BindingList;

/**
 * @brief Concept for types that can be registered
 *
 * A type is Reflectable if it is a class type and not abstract.
 *
 * @tparam T The type to check
 */
template<typename T>
concept Reflectable = std::is_class_v<T> && !std::is_abstract_v<T>;

/**
 * @brief Concept for enumeration types accepted by EnumRegistry
 */
template<typename T>
concept Enumeration = std::is_enum_v<T>;

template<typename T>
concept DefaultConstructible = std::is_default_constructible_v<T>;

template<typename T>
concept CopyAssignable = std::is_copy_assignable_v<T>;

/**
 * @brief Concept for sequential containers (vector, list, deque, observable lists)
 *
 * A sequential container must support:
 * - value_type and iterator type aliases
 * - size(), empty(), begin(), end() methods
 * - push_back() method for adding elements
 * - clear() method for removing all elements
 *
 * @tparam T The container type to check
 */
template<typename T>
concept SequentialContainer = requires(T t, typename T::value_type v) {
    typename T::value_type;
    typename T::iterator;
    typename T::const_iterator;
    typename T::size_type;

    { t.size() } -> std::convertible_to<std::size_t>;
    { t.empty() } -> std::convertible_to<bool>;

    { t.begin() } -> std::same_as<typename T::iterator>;
    { t.end() } -> std::same_as<typename T::iterator>;

    { t.push_back(v) };
    { t.clear() };
};

/**
 * @brief Concept for any forward-iterable range
 */
template<typename R>
concept IterableRange = requires(R& r) {
    std::begin(r);
    std::end(r);
};

/**
 * @brief Concept for getter member functions (R (T::*)() const)
 */
template<typename F, typename T>
concept GetterOf = std::is_member_function_pointer_v<F> &&
                   std::invocable<F, const T&>;

namespace detail {

/**
 * @brief Detects the two bindable list kinds
 */
template<typename T>
struct is_bindable_list : std::false_type {};

template<typename E>
struct is_bindable_list<ObservableList<E>> : std::true_type {};

template<typename E>
struct is_bindable_list<BindingList<E>> : std::true_type {};

template<typename T>
inline constexpr bool is_bindable_list_v = is_bindable_list<std::remove_cvref_t<T>>::value;

/**
 * @brief Detects members merged in place by the collection-aware copier
 *
 * Only a shared_ptr to a bindable list qualifies: the pointer carries the
 * identity observers are bound to and may be null.
 */
template<typename T>
struct is_mergeable_collection : std::false_type {};

template<typename E>
struct is_mergeable_collection<std::shared_ptr<ObservableList<E>>> : std::true_type {};

template<typename E>
struct is_mergeable_collection<std::shared_ptr<BindingList<E>>> : std::true_type {};

template<typename T>
inline constexpr bool is_mergeable_collection_v =
    is_mergeable_collection<std::remove_cvref_t<T>>::value;

template<typename T>
struct is_shared_ptr : std::false_type {};

template<typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_shared_ptr_v = is_shared_ptr<std::remove_cvref_t<T>>::value;

/**
 * @brief Detects std::basic_string and std::basic_string_view
 *
 * Strings model SequentialContainer but are values, not collections.
 */
template<typename T>
struct is_string : std::false_type {};

template<typename C, typename Traits, typename Alloc>
struct is_string<std::basic_string<C, Traits, Alloc>> : std::true_type {};

template<typename C, typename Traits>
struct is_string<std::basic_string_view<C, Traits>> : std::true_type {};

template<typename T>
inline constexpr bool is_string_v = is_string<std::remove_cvref_t<T>>::value;

template<typename T>
struct is_sequential_container : std::bool_constant<SequentialContainer<T>> {};

template<typename T>
inline constexpr bool is_sequential_container_v = is_sequential_container<T>::value;

/**
 * @brief Value type produced by a getter, with references and cv removed
 */
template<typename F, typename T>
using getter_value_t = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;

/**
 * @brief Extracts the class and argument type of a one-argument setter
 */
template<typename F>
struct setter_traits;

template<typename C, typename R, typename A>
struct setter_traits<R (C::*)(A)> {
    using class_type = C;
    using value_type = std::remove_cvref_t<A>;
};

template<typename C, typename R, typename A>
struct setter_traits<R (C::*)(A) noexcept> {
    using class_type = C;
    using value_type = std::remove_cvref_t<A>;
};

/**
 * @brief Compile-time type name generation
 *
 * Uses compiler-specific intrinsics to get type name at compile time.
 */
template<typename T>
consteval std::string_view type_name() {
#if defined(__clang__)
    constexpr std::string_view name = __PRETTY_FUNCTION__;
    constexpr std::string_view prefix = "std::string_view propsync::detail::type_name() [T = ";
    constexpr std::string_view suffix = "]";
#elif defined(__GNUC__)
    constexpr std::string_view name = __PRETTY_FUNCTION__;
    constexpr std::string_view prefix = "consteval std::string_view propsync::detail::type_name() [with T = ";
    constexpr std::string_view suffix = "]";
#elif defined(_MSC_VER)
    constexpr std::string_view name = __FUNCSIG__;
    constexpr std::string_view prefix = "std::string_view __cdecl propsync::detail::type_name<";
    constexpr std::string_view suffix = ">(void)";
#else
    #error "Unsupported compiler"
#endif

    constexpr auto start = name.find(prefix) + prefix.size();
    constexpr auto end = name.rfind(suffix);
    return name.substr(start, end - start);
}

/**
 * @brief Compile-time unique type ID
 *
 * Uses the address of a static variable as a unique identifier for each type.
 */
using TypeId = const void*;

template<typename T>
struct type_id_holder {
    static constexpr char id = 0;
};

template<typename T>
inline constexpr TypeId type_id = &type_id_holder<std::remove_cvref_t<T>>::id;

} // namespace detail

} // namespace propsync

#endif // PROPSYNC_DETAIL_TYPE_TRAITS_HPP
