#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "forge.hpp"
#include <string>
#include <utility>

using namespace forge;

//=============================================================================
// Test model definitions
//=============================================================================

struct Doubled
{
    Field<int, "value"> value;

    FORGE_TEMPLATE(int)
    Output define() && { return value * 2; }
};

//=============================================================================
// Compile-time properties
//=============================================================================

static_assert(FORGE_CALL_SYNTAX == 0);
static_assert(TemplateConstruction<Doubled>);

static_assert(! requires (Doubled&& model) { std::move(model)(); });
static_assert(! requires (Doubled&& model) { std::move(model)([] (int v) { return v; }); });

static_assert(requires (Doubled&& model) { std::move(model).create(); });
static_assert(requires (Doubled&& model) { std::move(model).build([] (int v) { return v; }); });

//=============================================================================
// Construction protocol without call syntax
//=============================================================================

TEST_SUITE("Construction protocol without call syntax") {

TEST_CASE("create and build") {
    CHECK(Doubled{ .value = 4 }.create() == 8);
    CHECK(Doubled{ .value = 4 }.build([] (int v) { return std::to_string(v); }) == "8");
    CHECK(forge::create(Doubled{ .value = 5 }) == 10);
}

TEST_CASE("hooks and partial updates still work") {
    int seen = 0;

    auto model = defaults<Doubled>().with("value"_fld, 3);
    model.onCreate([&seen] (int& output) { seen = output; });

    CHECK(std::move(model).create() == 6);
    CHECK(seen == 6);
}

} // TEST_SUITE("Construction protocol without call syntax")
