#pragma once

#include <type_traits>
#include <tuple>
#include <utility>
#include <concepts>
#include <string_view>
#include <boost/pfr.hpp>
#include <fixed_string.hpp>

namespace forge
{

// Forward declarations needed by detail namespace
template <typename T, fixstr::fixed_string Name> class Field;
template <typename Output> class OnCreate;

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/**
 * @brief Filters a tuple, keeping only elements that satisfy the Predicate
 *
 * @tparam Predicate A template that provides a ::value bool for each type
 * @param tp The tuple to filter
 * @return A new tuple containing only elements where Predicate<T>::value is true
 */
template <template<typename> class Predicate, typename Tuple>
auto filter_tuple(Tuple&& tp)
{
    return std::apply([]<typename... Ts>(Ts&&... args) {
        // Helper that returns either a single-element tuple or empty tuple
        auto maybe_keep = []<typename T>(T&& arg) {
            if constexpr (Predicate<T>::value)
                return std::tuple<T>(std::forward<T>(arg));
            else
                return std::tuple<>();
        };
        return std::tuple_cat(maybe_keep(std::forward<Ts>(args))...);
    }, std::forward<Tuple>(tp));
}

//-----------------------------------------------------------------------------
// Field type detection
//-----------------------------------------------------------------------------

template <typename T> struct is_field_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name> struct is_field_helper<Field<T, Name>> : std::true_type {};

/// Predicate that is true if T is a Field<> specialization
template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::remove_cvref_t<T>>::value; };

/// Tuple of references to the Field<> members of a model. Other members (the on-create hooks) are skipped.
template <typename Model>
auto fields_of(Model& model)
{
    return filter_tuple<is_field>(boost::pfr::structure_tie(model));
}

/// Returns the number of Field<> members in struct T
template <typename T>
constexpr std::size_t num_fields()
{
    if constexpr (std::is_aggregate_v<T>)
        return std::tuple_size_v<decltype(fields_of(std::declval<T&>()))>;

    return 0;
}

/// Helper to decay all types in a tuple
template <typename T> struct decay_tuple;
template <typename... Types> struct decay_tuple<std::tuple<Types...>>
{
    using type = std::tuple<std::decay_t<Types>...>;
};

//-----------------------------------------------------------------------------
// Compile-time field lookup by name
//-----------------------------------------------------------------------------

/**
 * @brief Helper to find a field by compile-time name in a parameter pack
 *
 * Walks the fields front to back and returns a reference to the first one
 * whose name matches. Fails to compile if no field matches.
 */
template <fixstr::fixed_string FieldName>
struct FindFieldHelper
{
    template <typename Field0, typename... Fields>
    static constexpr auto& eval(Field0& field0, Fields& ...fields)
    {
        if constexpr (std::string_view(std::remove_const_t<Field0>::kName) == std::string_view(FieldName))
        {
            return field0;
        }
        else
        {
            static_assert(sizeof...(Fields) > 0, "The model has no field with this name");

            if constexpr (sizeof...(Fields) > 0)
                return eval(fields...);
            else
                return field0;
        }
    }
};

/// The protocol only accepts models it may consume: non-const rvalues
template <typename Self>
concept consumable = (! std::is_lvalue_reference_v<Self>) && (! std::is_const_v<std::remove_reference_t<Self>>);
} // namespace detail

} // namespace forge
