#pragma once

namespace forge
{

//=============================================================================
// Field implementations
//=============================================================================
template <typename T, fixstr::fixed_string Name>
Field<T, Name>& Field<T, Name>::operator=(T newValue)
{
    underlying = std::move(newValue);
    return *this;
}

//=============================================================================
// OnCreate implementations
//=============================================================================
template <typename Output>
template <std::invocable<Output&> Lambda>
void OnCreate<Output>::add(Lambda && lambda)
{
    callbacks.emplace_back(std::forward<Lambda>(lambda));
}

template <typename Output>
void OnCreate<Output>::fire(Output& output) &&
{
    // take ownership first: a callback must never see itself again
    auto pending = std::move(callbacks);
    callbacks.clear();

    for (auto& callback : pending)
        callback(output);
}

//=============================================================================
// Default state
//=============================================================================
template <typename M>
M defaults()
{
    static_assert(std::default_initializable<M>,
                  "Every field of a model needs a default: use a default constructible type "
                  "or give the field a default member initializer");

    return M{};
}

template <typename M>
constexpr auto fieldNames()
{
    using FieldsAsTuple = typename detail::decay_tuple<decltype(detail::fields_of(std::declval<M&>()))>::type;

    return std::invoke([] <typename... Types> (std::type_identity<std::tuple<Types...>>)
    {
        return std::array<std::string_view, sizeof...(Types)> {{ Types::fieldname()... }};
    }, std::type_identity<FieldsAsTuple>());
}

//=============================================================================
// Field access
//=============================================================================
template <fixstr::fixed_string FieldName, typename M>
auto& get(M& model, CompileTimeString<FieldName>)
{
    static_assert(detail::num_fields<std::remove_const_t<M>>() >= 1, "The model has no fields");

    return std::apply([] <typename... Types> (Types& ...fields) -> auto&
    {
        return detail::FindFieldHelper<FieldName>::eval(fields...);
    }, detail::fields_of(model));
}

template <typename M, fixstr::fixed_string FieldName, typename V>
    requires detail::consumable<M&&>
M with(M&& model, CompileTimeString<FieldName> field, V&& value)
{
    forge::get(model, field) = std::forward<V>(value);
    return std::move(model);
}

//=============================================================================
// Construction protocol
//=============================================================================
template <TemplateConstruction M>
typename M::Output create(M&& model)
{
    // define() consumes the model, so the hooks have to come out first
    auto hooks = std::move(model.forgeOnCreate);
    auto output = std::move(model).define();
    std::move(hooks).fire(output);
    return output;
}

template <TemplateConstruction M, std::invocable<typename M::Output> Continuation>
std::invoke_result_t<Continuation, typename M::Output> build(M&& model, Continuation && continuation)
{
    return std::invoke(std::forward<Continuation>(continuation), forge::create(std::move(model)));
}

namespace detail
{
template <typename M>
void diagnoseIncompleteTemplate()
{
    static_assert(Template<M>,
                  "The model needs an Output type and an `Output define() &&` member returning exactly Output");
    static_assert(std::default_initializable<M>,
                  "Every field of a model needs a default: use a default constructible type "
                  "or give the field a default member initializer");
    static_assert(requires (M& model) { { model.forgeOnCreate } -> std::same_as<OnCreate<typename M::Output>&>; },
                  "The model is missing its FORGE_TEMPLATE annotation");
}
} // namespace detail

template <typename M>
    requires detail::consumable<M&&> && (! TemplateConstruction<std::remove_cvref_t<M>>)
void create(M&&)
{
    detail::diagnoseIncompleteTemplate<std::remove_cvref_t<M>>();
}

template <typename M, typename Continuation>
    requires detail::consumable<M&&> && (! TemplateConstruction<std::remove_cvref_t<M>>)
void build(M&&, Continuation &&)
{
    detail::diagnoseIncompleteTemplate<std::remove_cvref_t<M>>();
}

//=============================================================================
// operator""_fld implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld()
{
    return { };
}
#pragma GCC diagnostic pop

//=============================================================================
// Stream operators implementations
//=============================================================================
template <typename T, fixstr::fixed_string Name>
std::ostream& operator<<(std::ostream& o, Field<T, Name> const& field)
{
    return o << field();
}

} // namespace forge
