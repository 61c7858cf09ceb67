/**
 * @file forge.hpp
 * @brief Builder generation for plain aggregate "template models"
 *
 * A template model is an aggregate whose parameters are Field<T, Name>
 * members. Annotating it with FORGE_TEMPLATE(Output) and giving it a
 * `Output define() &&` member turns it into a single-use builder:
 *   - a default state via forge::defaults<M>() (or simply M{})
 *   - a continuation form: model.build(f) / model(f), returning f(output)
 *   - a terminal form: model.create() / model(), returning the output
 *   - on-create hooks that fire on the output before anybody else sees it
 *   - named field overrides via model.with("name"_fld, value)
 *
 * Usage example:
 *   struct Greeting {
 *       Field<std::string, "text"> text;
 *
 *       FORGE_TEMPLATE(std::string)
 *       Output define() && { return "Hello " + text(); }
 *   };
 *
 *   auto s = Greeting{ .text = "world"s }();
 *   auto n = Greeting{ .text = "world"s }([] (std::string s) { return s.size(); });
 */

#pragma once

#ifndef FORGE_CALL_SYNTAX
 #define FORGE_CALL_SYNTAX 1
#endif

#include <array>
#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <iostream>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <fixed_string.hpp>
#include "forge_detail.hpp"

namespace forge
{

/**
 * @brief Compile-time string wrapper for use with the "_fld" literal
 *
 * @tparam S The compile-time fixed string representing the field name
 *
 * @see operator""_fld
 */
template <fixstr::fixed_string S>
struct CompileTimeString { static constexpr auto value = S; };

/**
 * @brief A named parameter of a template model
 *
 * Field wraps a value of type T and carries its name as part of its type so
 * that fields can be looked up and overridden by name at compile time.
 * Fields convert implicitly from T, which keeps designated initialisers
 * readable:
 *
 * @code
 * struct Spacer {
 *     Field<int, "width">  width;        // defaults to int{}
 *     Field<int, "height"> height = 8;   // explicit default
 * };
 *
 * Spacer s { .width = 4 };
 * @endcode
 *
 * A Field only has a default constructor if T does. A model with a field
 * that has neither a default constructible type nor a default member
 * initializer therefore has no default state, which is a compile error
 * wherever one is needed.
 */
template <typename T, fixstr::fixed_string Name>
class Field
{
public:
    using Type = T;

    /// The compile-time field name as specified in the template parameter
    static constexpr auto kName = Name;

    /// Default constructor - value-initialises the underlying value
    Field() requires std::default_initializable<T> : underlying{} {}

    /// Construct from underlying value
    Field(T underlying_) : underlying(std::move(underlying_)) {}

    Field(Field const&) = default;
    Field(Field&&) = default;
    Field& operator=(Field const&) = default;
    Field& operator=(Field&&) = default;

    /// Assign new value to the field
    Field& operator=(T newValue);

    T const& operator()() const& { return underlying; }
    T&       operator()() &      { return underlying; }

    /// Moves the value out of an expiring field
    T&& operator()() && { return std::move(underlying); }

    T const* operator->() const { return &underlying; }
    T*       operator->()       { return &underlying; }

    /// Implicit conversion to the underlying type
    operator T const&() const { return underlying; }

    /// Returns the field name
    static constexpr std::string_view fieldname() { return kName; }

private:
    T underlying;
};

/**
 * @brief Callbacks that run on a freshly defined output
 *
 * Every annotated model carries one of these. Callbacks run exactly once,
 * in registration order, right after define() returned and before the
 * output is handed to a continuation or the caller. This is how a parent
 * object gets to adopt a child (see the widget example's Box::child()).
 *
 * OnCreate is move-only, which makes every model move-only.
 */
template <typename Output>
class OnCreate
{
public:
    using Callback = std::move_only_function<void(Output&)>;

    OnCreate() = default;
    OnCreate(OnCreate&&) noexcept = default;
    OnCreate& operator=(OnCreate&&) noexcept = default;
    OnCreate(OnCreate const&) = delete;
    OnCreate& operator=(OnCreate const&) = delete;

    /// Register a callback
    template <std::invocable<Output&> Lambda>
    void add(Lambda && lambda);

    /// Runs and drops all callbacks
    void fire(Output& output) &&;

    std::size_t size() const noexcept { return callbacks.size(); }
    bool empty() const noexcept       { return callbacks.empty(); }

private:
    std::vector<Callback> callbacks;
};

//=============================================================================
// Output binding
//=============================================================================

/**
 * @brief The link between a model and the object it builds
 *
 * A model names its output type as `Output` and turns itself into one with
 * `Output define() &&`. define() consumes the model and must accept every
 * combination of field values; rejecting a combination is up to define()
 * itself (throw, or use an Output that encodes failure).
 */
template <typename M>
concept Template = requires (M model)
{
    typename M::Output;
    requires std::move_constructible<typename M::Output>;
    { std::move(model).define() } -> std::same_as<typename M::Output>;
};

/**
 * @brief A model that went through FORGE_TEMPLATE
 *
 * In addition to the output binding it must have a default state and carry
 * the on-create hooks the annotation emits. Reference types never satisfy
 * this concept, so lvalues are rejected by everything constrained on it.
 */
template <typename M>
concept TemplateConstruction = Template<M>
    && std::default_initializable<M>
    && requires (M& model)
    {
        { model.forgeOnCreate } -> std::same_as<OnCreate<typename M::Output>&>;
    };

//=============================================================================
// Default state
//=============================================================================

/// Returns a model with every field at its default value
template <typename M>
M defaults();

/// Compile-time array of all field names of a model in declaration order
template <typename M>
constexpr auto fieldNames();

//=============================================================================
// Field access
//=============================================================================

/**
 * @brief Access a field of a model by compile-time name
 *
 * @code
 * get(model, "padding"_fld) = 6;
 * @endcode
 */
template <fixstr::fixed_string FieldName, typename M>
auto& get(M& model, CompileTimeString<FieldName>);

/**
 * @brief Override a single field and return the model
 *
 * This is the counterpart of starting from some base state and overriding
 * selected fields. The base is consumed.
 *
 * @code
 * auto label = box->child<LabelTemplate>().with("text"_fld, "Hello");
 * @endcode
 */
template <typename M, fixstr::fixed_string FieldName, typename V>
    requires detail::consumable<M&&>
M with(M&& model, CompileTimeString<FieldName> field, V&& value);

//=============================================================================
// Construction protocol
//=============================================================================

/**
 * @brief Terminal form: consume the model and return its output
 *
 * Detaches the on-create hooks, calls define(), fires the hooks on the
 * output and returns it. If define() throws, no hook runs.
 */
template <TemplateConstruction M>
typename M::Output create(M&& model);

/**
 * @brief Continuation form: consume the model and pass its output on
 *
 * Equivalent to `continuation(create(model))`. define(), the hooks and the
 * continuation each run once, in that order, on the calling thread. The
 * continuation's result is returned.
 */
template <TemplateConstruction M, std::invocable<typename M::Output> Continuation>
std::invoke_result_t<Continuation, typename M::Output> build(M&& model, Continuation && continuation);

/**
 * @brief Overloads picked for a consumable model that is not a complete template
 *
 * They only exist to fail with a readable message naming what the model
 * lacks (output binding, default state or the FORGE_TEMPLATE hooks).
 */
template <typename M>
    requires detail::consumable<M&&> && (! TemplateConstruction<std::remove_cvref_t<M>>)
void create(M&& model);

template <typename M, typename Continuation>
    requires detail::consumable<M&&> && (! TemplateConstruction<std::remove_cvref_t<M>>)
void build(M&& model, Continuation && continuation);

/**
 * @brief User-defined literal for creating compile-time field name tags
 *
 * @code
 * model.with("padding"_fld, 6);
 * @endcode
 *
 * @return CompileTimeString containing the field name
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld();
#pragma GCC diagnostic pop

template <typename T, fixstr::fixed_string Name>
std::ostream& operator<<(std::ostream& o, Field<T, Name> const& field);
} // namespace forge

//=============================================================================
// The annotation
//=============================================================================

#if FORGE_CALL_SYNTAX
 #define FORGE_DETAIL_CALL_SYNTAX                                                                   \
    template <typename Self, typename Continuation>                                                 \
    auto operator()(this Self&& self, Continuation && continuation)                                 \
        -> decltype(::forge::build(std::forward<Self>(self), std::forward<Continuation>(continuation))) \
    { return ::forge::build(std::forward<Self>(self), std::forward<Continuation>(continuation)); }   \
                                                                                                    \
    template <typename Self>                                                                        \
    auto operator()(this Self&& self) -> decltype(::forge::create(std::forward<Self>(self)))        \
    { return ::forge::create(std::forward<Self>(self)); }
#else
 #define FORGE_DETAIL_CALL_SYNTAX
#endif

/**
 * @brief Turns the enclosing aggregate into a template model
 *
 * Place it inside the struct after its fields, then declare define():
 *
 * @code
 * struct BoxTemplate {
 *     Field<int, "padding"> padding;
 *     Field<int, "spacing"> spacing;
 *
 *     FORGE_TEMPLATE(std::shared_ptr<Box>)
 *     Output define() &&;
 * };
 * @endcode
 *
 * Emits the `Output` alias, the on-create hooks and the build/create/with/
 * onCreate members (plus operator() unless FORGE_CALL_SYNTAX is 0). Every
 * member except onCreate only accepts rvalues, so consuming a named model
 * takes an explicit std::move. Declaring `Output` a second time in the
 * same struct is a compile error.
 */
#define FORGE_TEMPLATE(...)                                                                         \
    using Output = __VA_ARGS__;                                                                     \
                                                                                                    \
    ::forge::OnCreate<Output> forgeOnCreate = {};                                                   \
                                                                                                    \
    template <typename Self, typename Continuation>                                                 \
    auto build(this Self&& self, Continuation && continuation)                                      \
        -> decltype(::forge::build(std::forward<Self>(self), std::forward<Continuation>(continuation))) \
    { return ::forge::build(std::forward<Self>(self), std::forward<Continuation>(continuation)); }   \
                                                                                                    \
    template <typename Self>                                                                        \
    auto create(this Self&& self) -> decltype(::forge::create(std::forward<Self>(self)))            \
    { return ::forge::create(std::forward<Self>(self)); }                                           \
                                                                                                    \
    template <typename Self, ::fixstr::fixed_string FieldName, typename V>                          \
    auto with(this Self&& self, ::forge::CompileTimeString<FieldName> field, V && value)            \
        -> decltype(::forge::with(std::forward<Self>(self), field, std::forward<V>(value)))         \
    { return ::forge::with(std::forward<Self>(self), field, std::forward<V>(value)); }              \
                                                                                                    \
    template <typename Self, std::invocable<Output&> Lambda>                                        \
    void onCreate(this Self& self, Lambda && lambda)                                                \
    { self.forgeOnCreate.add(std::forward<Lambda>(lambda)); }                                       \
                                                                                                    \
    FORGE_DETAIL_CALL_SYNTAX

// std::formatter specializations
template <typename T, fixstr::fixed_string Name, typename CharT>
struct std::formatter<forge::Field<T, Name>, CharT> : std::formatter<T, CharT>
{
    template <class FmtContext>
    FmtContext::iterator format(forge::Field<T, Name> const& field, FmtContext& ctx) const
    {
        return std::formatter<T, CharT>::format(field(), ctx);
    }
};

// Include template implementations
#include "forge.tpp"
