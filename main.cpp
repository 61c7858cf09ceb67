#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include "forge.hpp"
#include "widgets.hpp"

// Example usage
using namespace forge;
using namespace forge::widgets;
using namespace std::string_literals;

// A template whose output is a plain value
struct Tripled
{
    Field<int, "factor"> factor;

    FORGE_TEMPLATE(int)
    Output define() && { return factor * 3; }
};

// Injection source on a plain int: the hook reports the product once the
// injected template has been built
Tripled multiplyWith(int multiplicand)
{
    auto model = defaults<Tripled>();
    model.onCreate([multiplicand] (int& product)
    {
        std::cout << multiplicand << " * " << product << " = " << multiplicand * product << std::endl;
    });
    return model;
}

void valueExamples()
{
    std::cout << "=== Value templates ===\n\n";

    auto eighteen = Tripled{ .factor = 6 } ([] (int w)
    {
        multiplyWith(w).with("factor"_fld, 7) ();
        return w;
    });

    std::cout << "result: " << eighteen << "\n";

    std::cout << "fields of Tripled:";
    for (auto const& key : fieldNames<Tripled>())
        std::cout << " " << key;
    std::cout << "\n";
}

void widgetExamples()
{
    std::cout << "\n=== Widget templates ===\n\n";

    auto window = BoxTemplate{ .name = "window"s, .padding = 6, .spacing = 6 } ([] (std::shared_ptr<Box> w)
    {
        w->child<LabelTemplate>()
            .with("name"_fld, "title")
            .with("text"_fld, "Hello from forge") ();

        w->child<BoxTemplate>()
            .with("name"_fld, "toolbar")
            .with("orientation"_fld, Orientation::horizontal)
            .build([] (std::shared_ptr<Box> toolbar)
            {
                toolbar->child<LabelTemplate>().with("text"_fld, "Open").create();
                toolbar->child<LabelTemplate>().with("text"_fld, "Save").create();
            });

        return w;
    });

    std::cout << *window;

    try
    {
        BoxTemplate{ .padding = -1 } ();
    }
    catch (std::invalid_argument const& e)
    {
        std::cout << "\nrejected: " << e.what() << "\n";
    }
}

int main(int argc, char* argv[])
{
    auto const verbose = argc > 1 && std::string_view(argv[1]) == "--verbose";

    boost::log::core::get()->set_filter(boost::log::trivial::severity >=
        (verbose ? boost::log::trivial::trace : boost::log::trivial::warning));

    valueExamples();
    widgetExamples();

    return 0;
}
