//
// Tests for the ordered value tree, JSON encoding and the text report
//

#include <doctest/doctest.h>
#include <dfscan/serialize.hh>
#include <sstream>

using namespace dfscan;
using namespace dfscan::serialize;

TEST_SUITE("Serialize") {

    TEST_CASE("Single stage document as compact JSON") {
        auto facts = analyze_dockerfile("FROM ubuntu:20.04\nRUN echo hello\n");

        CHECK(to_json(to_value(facts), 0) ==
              R"({"num_stages":1,)"
              R"("images":[{"full":"ubuntu:20.04","components":{"registry":null,"name":"ubuntu","tag":"20.04","digest":null}}],)"
              R"("stage_names":[],"copy_from_stages":[],"add_from_stages":[],)"
              R"("multistage_analysis":{"is_multistage":false,"stages_used_as_base_images":[],)"
              R"("stages_copied_from":[],"stages_added_from":[],"unused_stages":[]},)"
              R"("exposed_ports":[],"instructions":{"total_count":2,"by_type":{"FROM":1,"RUN":1}},)"
              R"("args":{},"labels":{},"env_vars":{}})");
    }

    TEST_CASE("Stage images serialize without components") {
        auto facts = analyze_dockerfile("FROM alpine:3 AS base\nFROM base\n");
        auto tree = to_value(facts);

        const value* images = tree.get("images");
        REQUIRE(images != nullptr);
        const auto& list = std::get<array>(images->node);
        REQUIRE(list.size() == 2);
        REQUIRE(list[1].get("components") != nullptr);
        CHECK(list[1].get("components")->is_null());
    }

    TEST_CASE("Absent ARG default is null") {
        auto tree = to_value(analyze_dockerfile("ARG A\nARG B=2\nFROM alpine:3\n"));
        const value* args = tree.get("args");

        REQUIRE(args != nullptr);
        CHECK(args->get("A")->is_null());
        CHECK(*args->get("B") == value("2"));
    }

    TEST_CASE("Tree converts back to the same facts") {
        auto facts = analyze_dockerfile(
            "ARG V\n"
            "FROM registry.example.com:5000/team/builder@sha256:00ff AS build\n"
            "ENV A=1 B=\"two words\"\n"
            "LABEL maintainer=team\n"
            "FROM build AS test\n"
            "FROM alpine:3\n"
            "COPY --from=build /a /a\n"
            "ADD --from=0 /b /b\n"
            "EXPOSE 80 443/tcp\n");

        auto restored = analysis_from_value(to_value(facts));

        // Stage records are not part of the tree
        facts.stages.clear();
        CHECK(restored == facts);
    }

    TEST_CASE("ERROR: Shape violations") {
        CHECK_THROWS_AS(analysis_from_value(value(nullptr)), shape_error);

        auto tree = to_value(analyze_dockerfile("FROM alpine:3\n"));
        auto& fields = std::get<object>(tree.node);
        fields.erase(fields.begin());  // num_stages
        CHECK_THROWS_AS(analysis_from_value(tree), shape_error);

        auto wrong = to_value(analyze_dockerfile("FROM alpine:3\n"));
        std::get<object>(wrong.node)[0].second = value("one");
        CHECK_THROWS_AS(analysis_from_value(wrong), shape_error);
    }

    TEST_CASE("JSON string escaping") {
        CHECK(to_json(value("a\"b\\c\n\t\x01"), 0) == R"("a\"b\\c\n\t\u0001")");
    }

    TEST_CASE("JSON indentation") {
        value tree = object{
            {"a", array{value(std::int64_t{1}), value(true)}},
            {"b", object{}},
        };

        CHECK(to_json(tree, 2) == "{\n  \"a\": [\n    1,\n    true\n  ],\n  \"b\": {}\n}");

        std::ostringstream oss;
        write_json(oss, tree, 0);
        CHECK(oss.str() == R"({"a":[1,true],"b":{}})");
    }

    TEST_CASE("Text report") {
        auto facts = analyze_dockerfile(
            "FROM golang:1.22 AS build\n"
            "FROM alpine:3\n"
            "COPY --from=build /out /app\n"
            "EXPOSE 8080\n");

        const std::string text = describe(facts);
        CHECK(text.find("Stages: 2 (multistage)") != std::string::npos);
        CHECK(text.find("[0] build <- golang:1.22") != std::string::npos);
        CHECK(text.find("[1] <unnamed> <- alpine:3") != std::string::npos);
        CHECK(text.find("Copied from: build") != std::string::npos);
        CHECK(text.find("Exposed ports: 8080") != std::string::npos);
        CHECK(text.find("Unused stages: (none)") != std::string::npos);
    }
}
