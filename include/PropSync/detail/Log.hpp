/**
 * @file Log.hpp
 * @brief Debug trace macro
 *
 * PROPSYNC_DEBUG writes "[PropSync] file:line (function): message" to
 * std::cout when PROPSYNC_ENABLE_DEBUG_LOG is defined and expands to
 * nothing otherwise. Arguments are streamed in order.
 */

#ifndef PROPSYNC_DETAIL_LOG_HPP
#define PROPSYNC_DETAIL_LOG_HPP

#ifdef PROPSYNC_ENABLE_DEBUG_LOG

#include <iostream>
#include <type_traits>
#include <utility>

namespace propsync::detail {

template <typename T>
struct is_streamable
{
private:
    template <typename U>
    static auto test(int) -> decltype(std::declval<std::ostream&>() << std::declval<U>(), std::true_type{});

    template <typename U>
    static std::false_type test(...);

public:
    static constexpr bool value = decltype(test<T>(0))::value;
};

template <typename... Args>
void debug_write(const char* file, int line, const char* function, const Args&... args)
{
    std::cout << "[PropSync] " << file << ":" << line << " (" << function << "): ";
    ([&] {
        if constexpr (is_streamable<const Args&>::value) {
            std::cout << args;
        } else {
            std::cout << "<unprintable>";
        }
    }(), ...);
    std::cout << std::endl;
}

} // namespace propsync::detail

#define PROPSYNC_DEBUG(...) \
do { \
::propsync::detail::debug_write(__FILE__, __LINE__, __FUNCTION__, __VA_ARGS__); \
} while (0)

#else

#define PROPSYNC_DEBUG(...) do { } while (0)

#endif

#endif // PROPSYNC_DETAIL_LOG_HPP
