/**
 * @file ExclusionSet.cpp
 * @brief Canonical cache key for a set of excluded member names
 */

#include "PropSync/ExclusionSet.hpp"

namespace propsync {

void ExclusionSet::rebuild_key() {
    key_.clear();
    bool first = true;
    for (const auto& name : names_) {
        if (!first) key_ += '|';
        first = false;
        for (char c : name) {
            if (c == '|' || c == '\\') {
                key_ += '\\';
            }
            key_ += c;
        }
    }
}

} // namespace propsync
