/**
 * @file widgets.hpp
 * @brief A tiny widget hierarchy built with forge templates
 *
 * This is example code showing how a widget library plugs into forge. The
 * widgets themselves are plain mutable objects; LabelTemplate and
 * BoxTemplate are their template models. A Box hands out pre-wired child
 * models via Box::child<M>(), so that children attach themselves to the
 * box as soon as they are built:
 *
 * @code
 * auto window = BoxTemplate{ .name = "window"s, .padding = 6, .spacing = 6 }(
 *     [] (std::shared_ptr<Box> box)
 *     {
 *         box->child<LabelTemplate>().with("text"_fld, "Hello")();
 *         box->child<LabelTemplate>().with("text"_fld, "World")();
 *         return box;
 *     });
 * @endcode
 */

#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "forge.hpp"

namespace forge::widgets
{
class Box;

enum class Orientation
{
    horizontal,
    vertical
};

std::string_view toString(Orientation orientation);
std::ostream& operator<<(std::ostream& o, Orientation orientation);

/**
 * @brief Base class of all widgets
 *
 * Widgets are always owned by std::shared_ptr. A widget knows the box it
 * was attached to, if any.
 */
class Widget : public std::enable_shared_from_this<Widget>
{
public:
    virtual ~Widget() = default;

    /// Short type name used when printing a hierarchy
    virtual std::string_view kind() const = 0;

    /// Returns the box this widget was attached to, or nullptr
    std::shared_ptr<Box> parent() const { return parentBox.lock(); }

    /// Writes this widget (and its children) as an indented tree
    virtual void print(std::ostream& o, int depth = 0) const;

    std::string name;

protected:
    friend class Box;

    void printHeader(std::ostream& o, int depth) const;

    std::weak_ptr<Box> parentBox;
};

class Label : public Widget
{
public:
    std::string_view kind() const override { return "Label"; }
    void print(std::ostream& o, int depth = 0) const override;

    std::string text;
};

class Box : public Widget
{
public:
    std::string_view kind() const override { return "Box"; }
    void print(std::ostream& o, int depth = 0) const override;

    /**
     * @brief Appends a child and makes this box its parent
     *
     * A child that already has a parent is removed from it first. Throws
     * std::invalid_argument for a null child or if the child is this box or
     * one of its ancestors.
     */
    void append(std::shared_ptr<Widget> child);

    /// Detaches a child. Returns false if it is not a child of this box.
    bool remove(Widget const& child);

    /// Children in the order they were attached
    std::vector<std::shared_ptr<Widget>> const& children() const { return childWidgets; }

    /**
     * @brief Returns a default child model wired to attach its output here
     *
     * The returned model can be overridden with with() before it is built.
     * Once built, its output is appended to this box before any
     * continuation runs. If the box is gone by then, nothing is attached.
     */
    template <TemplateConstruction M>
        requires std::convertible_to<typename M::Output, std::shared_ptr<Widget>>
    M child();

    int padding = 0;
    int spacing = 0;
    Orientation orientation = Orientation::vertical;

private:
    std::shared_ptr<Box> self();
    static void reportExpiredParent(std::shared_ptr<Widget> const& orphan);

    std::vector<std::shared_ptr<Widget>> childWidgets;
};

std::ostream& operator<<(std::ostream& o, Widget const& widget);

//=============================================================================
// Templates
//=============================================================================

struct LabelTemplate
{
    Field<std::string, "name"> name;
    Field<std::string, "text"> text;

    FORGE_TEMPLATE(std::shared_ptr<Label>)
    Output define() &&;
};

/// Negative padding or spacing is rejected with std::invalid_argument
struct BoxTemplate
{
    Field<std::string, "name">        name;
    Field<int, "padding">             padding;
    Field<int, "spacing">             spacing;
    Field<Orientation, "orientation"> orientation = Orientation::vertical;

    FORGE_TEMPLATE(std::shared_ptr<Box>)
    Output define() &&;
};

//=============================================================================
// Box template implementations
//=============================================================================
template <TemplateConstruction M>
    requires std::convertible_to<typename M::Output, std::shared_ptr<Widget>>
M Box::child()
{
    auto model = forge::defaults<M>();

    model.onCreate([parent = std::weak_ptr<Box>(self())] (typename M::Output& widget)
    {
        if (auto box = parent.lock())
            box->append(widget);
        else
            Box::reportExpiredParent(widget);
    });

    return model;
}
} // namespace forge::widgets
