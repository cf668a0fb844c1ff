/**
 * @file ExclusionSet.hpp
 * @brief Member names skipped by a copy, with a canonical cache key
 */

#ifndef PROPSYNC_EXCLUSION_SET_HPP
#define PROPSYNC_EXCLUSION_SET_HPP

#include "detail/TypeTraits.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>

namespace propsync {

/**
 * @brief Set of member names to skip
 *
 * key() is independent of insertion order and duplicates: names are sorted
 * ordinally and joined with '|' (a literal '|' or '\' inside a name is
 * escaped with '\'). Two sets with the same names share a key and therefore
 * one cached plan.
 *
 * @code
 * ExclusionSet a{"Age", "Name"};
 * ExclusionSet b{"Name", "Age", "Age"};
 * assert(a.key() == b.key());   // "Age|Name"
 * @endcode
 */
class ExclusionSet {
public:
    using container_type = std::set<std::string, std::less<>>;

    ExclusionSet() = default;

    ExclusionSet(std::initializer_list<std::string_view> names) {
        for (auto name : names) {
            names_.emplace(name);
        }
        rebuild_key();
    }

    template<IterableRange Range>
    explicit ExclusionSet(const Range& names) {
        for (const auto& name : names) {
            names_.emplace(std::string_view{name});
        }
        rebuild_key();
    }

    void insert(std::string_view name) {
        if (names_.emplace(name).second) {
            rebuild_key();
        }
    }

    [[nodiscard]] bool contains(std::string_view name) const {
        return names_.find(name) != names_.end();
    }

    [[nodiscard]] bool empty() const noexcept { return names_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

    [[nodiscard]] const container_type& names() const noexcept { return names_; }

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    friend bool operator==(const ExclusionSet& lhs, const ExclusionSet& rhs) {
        return lhs.names_ == rhs.names_;
    }

private:
    void rebuild_key();

    container_type names_;
    std::string key_;
};

} // namespace propsync

#endif // PROPSYNC_EXCLUSION_SET_HPP
