#ifndef CACHET_TRAITS_H
#define CACHET_TRAITS_H

#include <boost/hana.hpp>

namespace cachet::detail::traits {

// Traits for policy event handlers.
// A policy only declares the handlers it needs; the storage calls a handler iif it is declared.
namespace event {

template<typename P, typename K, typename E>
constexpr auto has_on_insert = boost::hana::is_valid(
    [](auto& policy_t, auto& key_t, auto& entry_t) -> decltype(boost::hana::traits::declval(policy_t).on_insert(boost::hana::traits::declval(key_t),
                                                                                                                boost::hana::traits::declval(entry_t))) {
    })(boost::hana::type_c<P>, boost::hana::type_c<K>, boost::hana::type_c<E>);

template<typename P, typename K, typename E>
constexpr auto has_on_update = boost::hana::is_valid(
    [](auto& policy_t, auto& key_t, auto& entry_t) -> decltype(boost::hana::traits::declval(policy_t).on_update(boost::hana::traits::declval(key_t),
                                                                                                                boost::hana::traits::declval(entry_t))) {
    })(boost::hana::type_c<P>, boost::hana::type_c<K>, boost::hana::type_c<E>);

template<typename P, typename K, typename E>
constexpr auto has_on_cachehit = boost::hana::is_valid(
    [](auto& policy_t, auto& key_t, auto& entry_t) -> decltype(boost::hana::traits::declval(policy_t).on_cache_hit(boost::hana::traits::declval(key_t),
                                                                                                                   boost::hana::traits::declval(entry_t))) {
    })(boost::hana::type_c<P>, boost::hana::type_c<K>, boost::hana::type_c<E>);

template<typename P, typename K, typename E>
constexpr auto has_on_evict = boost::hana::is_valid(
    [](auto& policy_t, auto& key_t, auto& entry_t) -> decltype(boost::hana::traits::declval(policy_t).on_evict(boost::hana::traits::declval(key_t),
                                                                                                               boost::hana::traits::declval(entry_t))) {
    })(boost::hana::type_c<P>, boost::hana::type_c<K>, boost::hana::type_c<E>);

}  // namespace event

// Traits for victim selection.
namespace victim {

template<typename P>
constexpr auto has_victims = boost::hana::is_valid([](auto& policy_t) -> decltype(boost::hana::traits::declval(policy_t).victim_begin()) {
})(boost::hana::type_c<P>);

}  // namespace victim

}  // namespace cachet::detail::traits

#endif
