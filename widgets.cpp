#include "widgets.hpp"
#include "forge_log.hpp"

#include <algorithm>
#include <stdexcept>

namespace forge::widgets
{
//=============================================================================
// Orientation
//=============================================================================
std::string_view toString(Orientation orientation)
{
    switch (orientation)
    {
    case Orientation::horizontal: return "horizontal";
    case Orientation::vertical:   return "vertical";
    }

    return "unknown";
}

std::ostream& operator<<(std::ostream& o, Orientation orientation)
{
    return o << toString(orientation);
}

//=============================================================================
// Widget implementations
//=============================================================================
void Widget::printHeader(std::ostream& o, int depth) const
{
    o << std::string(static_cast<std::size_t>(depth) * 2, ' ') << kind();

    if (! name.empty())
        o << " \"" << name << "\"";
}

void Widget::print(std::ostream& o, int depth) const
{
    printHeader(o, depth);
    o << '\n';
}

void Label::print(std::ostream& o, int depth) const
{
    printHeader(o, depth);
    o << " text=\"" << text << "\"\n";
}

void Box::print(std::ostream& o, int depth) const
{
    printHeader(o, depth);
    o << " padding=" << padding << " spacing=" << spacing << " orientation=" << orientation << '\n';

    for (auto const& child : childWidgets)
        child->print(o, depth + 1);
}

std::ostream& operator<<(std::ostream& o, Widget const& widget)
{
    widget.print(o);
    return o;
}

//=============================================================================
// Box implementations
//=============================================================================
void Box::append(std::shared_ptr<Widget> child)
{
    if (child == nullptr)
        throw std::invalid_argument("cannot append a null widget to box \"" + name + "\"");

    // a box may not contain itself or any of its ancestors
    for (std::shared_ptr<Widget> ancestor = self(); ancestor != nullptr; ancestor = ancestor->parent())
        if (ancestor == child)
            throw std::invalid_argument("appending " + std::string(child->kind()) + " \"" + child->name
                                        + "\" to box \"" + name + "\" would create a cycle");

    if (auto previous = child->parent())
        previous->remove(*child);

    child->parentBox = self();
    childWidgets.emplace_back(std::move(child));

    FORGE_LOG_DEBUG << "attached " << childWidgets.back()->kind() << " \"" << childWidgets.back()->name
                    << "\" to box \"" << name << "\" at index " << (childWidgets.size() - 1);
}

bool Box::remove(Widget const& child)
{
    auto it = std::find_if(childWidgets.begin(), childWidgets.end(),
                           [&child] (auto const& candidate) { return candidate.get() == &child; });

    if (it == childWidgets.end())
        return false;

    (*it)->parentBox.reset();
    childWidgets.erase(it);
    return true;
}

std::shared_ptr<Box> Box::self()
{
    return std::static_pointer_cast<Box>(shared_from_this());
}

void Box::reportExpiredParent(std::shared_ptr<Widget> const& orphan)
{
    FORGE_LOG_WARNING << orphan->kind() << " \"" << orphan->name << "\" was built after its box was destroyed";
}

//=============================================================================
// Template definitions
//=============================================================================
LabelTemplate::Output LabelTemplate::define() &&
{
    auto label = std::make_shared<Label>();
    label->name = std::move(name)();
    label->text = std::move(text)();

    FORGE_LOG_TRACE << "defined label \"" << label->name << "\"";
    return label;
}

BoxTemplate::Output BoxTemplate::define() &&
{
    if (padding() < 0)
        throw std::invalid_argument("box padding must not be negative, got " + std::to_string(padding()));

    if (spacing() < 0)
        throw std::invalid_argument("box spacing must not be negative, got " + std::to_string(spacing()));

    auto box = std::make_shared<Box>();
    box->name = std::move(name)();
    box->padding = padding;
    box->spacing = spacing;
    box->orientation = orientation;

    FORGE_LOG_TRACE << "defined box \"" << box->name << "\"";
    return box;
}
} // namespace forge::widgets
