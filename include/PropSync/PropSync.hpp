/**
 * @file PropSync.hpp
 * @brief Main header for the PropSync library
 *
 * Includes the whole public API:
 * - Registry<T> / EnumRegistry<E>: type and enumerator registration
 * - copy_all, copy_all_fast, copy_excluding, copy_merging_collections
 * - ObservableList / BindingList
 * - JSON conversion, deep clone and path fragments
 * - string and collection helpers
 *
 * Usage:
 * @code
 * #include <PropSync/PropSync.hpp>
 *
 * PROPSYNC_REGISTRATION
 * {
 *     propsync::Registry<Customer>()
 *         .property("Name", &Customer::name)
 *         .property("Tags", &Customer::tags);
 * }
 * @endcode
 */

#ifndef PROPSYNC_HPP
#define PROPSYNC_HPP

#include "detail/TypeTraits.hpp"
#include "detail/TypeInfo.hpp"
#include "detail/Exceptions.hpp"
#include "detail/TypeManager.hpp"
#include "detail/Registry.hpp"

#include "ObservableCollections.hpp"
#include "CollectionUtil.hpp"
#include "ExclusionSet.hpp"
#include "MemberSelector.hpp"
#include "Shape.hpp"
#include "CopyPlan.hpp"
#include "PlanCache.hpp"
#include "Synchronizer.hpp"
#include "Json.hpp"
#include "EnumDescription.hpp"
#include "StringUtil.hpp"

#define PROPSYNC_CONCAT_IMPL(s1, s2) s1##s2
#define PROPSYNC_CONCAT(s1, s2) PROPSYNC_CONCAT_IMPL(s1, s2)

// Runs the following block once during static initialization
#define PROPSYNC_REGISTRATION                                   \
namespace {                                                     \
struct PROPSYNC_CONCAT(RegistrationHelper_, __LINE__) {         \
PROPSYNC_CONCAT(RegistrationHelper_, __LINE__)();               \
};}                                                             \
static PROPSYNC_CONCAT(RegistrationHelper_, __LINE__)           \
PROPSYNC_CONCAT(registrationHelperInstance_, __LINE__);         \
PROPSYNC_CONCAT(RegistrationHelper_, __LINE__)::PROPSYNC_CONCAT(RegistrationHelper_, __LINE__)()

#endif // PROPSYNC_HPP
