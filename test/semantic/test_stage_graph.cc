//
// Tests for the stage registry
//

#include <doctest/doctest.h>
#include <dfscan/stage_graph.hh>

using namespace dfscan;

TEST_SUITE("Semantic - Stage Graph") {

    TEST_CASE("Declaration assigns contiguous indices") {
        stage_graph graph;
        CHECK(graph.empty());
        CHECK_FALSE(graph.current().has_value());

        graph.declare(std::string("build"), make_external_image("golang:1.22"), 1);
        graph.declare(std::nullopt, make_external_image("alpine:3"), 5);

        REQUIRE(graph.size() == 2);
        CHECK(graph.stages()[0].index == 0);
        CHECK(graph.stages()[1].index == 1);
        CHECK(graph.stages()[1].line == 5);
        CHECK(graph.current() == std::optional<std::size_t>(1));
        CHECK(graph.display_name(0) == "build");
        CHECK(graph.display_name(1) == "1");
    }

    TEST_CASE("Names resolve case-insensitively") {
        stage_graph graph({"Build"});
        graph.declare(std::string("Build"), make_external_image("golang:1.22"), 1);

        CHECK(graph.is_declared("build"));
        CHECK(graph.is_declared("BUILD"));

        auto lookup = graph.resolve("bUiLd", std::nullopt);
        CHECK(lookup.status == lookup_status::found);
        CHECK(lookup.index == 0);
        CHECK(graph.display_name(lookup.index) == "Build");
    }

    TEST_CASE("Later declaration shadows an earlier name") {
        stage_graph graph({"x", "x"});
        graph.declare(std::string("x"), make_external_image("a:1"), 1);
        graph.declare(std::string("x"), make_external_image("b:1"), 2);
        graph.declare(std::nullopt, make_external_image("c:1"), 3);

        auto lookup = graph.resolve("x", graph.current());
        CHECK(lookup.status == lookup_status::found);
        CHECK(lookup.index == 1);
    }

    TEST_CASE("Forward, self and external lookups") {
        stage_graph graph({"first", "second"});
        graph.declare(std::string("first"), make_external_image("a:1"), 1);

        CHECK(graph.resolve("second", graph.current()).status == lookup_status::forward);
        CHECK(graph.resolve("first", graph.current()).status == lookup_status::self_reference);
        CHECK(graph.resolve("0", graph.current()).status == lookup_status::self_reference);
        CHECK(graph.resolve("1", graph.current()).status == lookup_status::forward);
        CHECK(graph.resolve("99999999999999999999999", graph.current()).status == lookup_status::forward);
        CHECK(graph.resolve("nginx:latest", graph.current()).status == lookup_status::external);
    }

    TEST_CASE("Numeric text is a name when indices are not allowed") {
        stage_graph graph;
        graph.declare(std::nullopt, make_external_image("a:1"), 1);

        CHECK(graph.resolve("0", std::nullopt, true).status == lookup_status::found);
        CHECK(graph.resolve("0", std::nullopt, false).status == lookup_status::external);
    }

    TEST_CASE("to_lower") {
        CHECK(to_lower("MiXeD-Case_1") == "mixed-case_1");
    }
}
