//
// Tests for image reference decomposition
//

#include <doctest/doctest.h>
#include <dfscan/image_reference.hh>
#include <dfscan/parser_error.hh>

using namespace dfscan;

TEST_SUITE("Semantic - Image References") {

    TEST_CASE("Name with tag") {
        auto c = parse_image_components("ubuntu:20.04");

        CHECK_FALSE(c.registry.has_value());
        CHECK(c.name == "ubuntu");
        CHECK(c.tag == std::optional<std::string>("20.04"));
        CHECK_FALSE(c.digest.has_value());
    }

    TEST_CASE("Bare name means implicit latest") {
        auto c = parse_image_components("scratch");

        CHECK(c.name == "scratch");
        CHECK_FALSE(c.tag.has_value());
        CHECK_FALSE(c.digest.has_value());
    }

    TEST_CASE("Registry with port and nested path") {
        auto c = parse_image_components("localhost:5000/team/app:1.2");

        CHECK(c.registry == std::optional<std::string>("localhost:5000"));
        CHECK(c.name == "team/app");
        CHECK(c.tag == std::optional<std::string>("1.2"));
    }

    TEST_CASE("Registry detection") {
        CHECK(parse_image_components("gcr.io/distroless/static").registry ==
              std::optional<std::string>("gcr.io"));
        CHECK(parse_image_components("localhost/app").registry ==
              std::optional<std::string>("localhost"));
        // Docker Hub namespace is part of the name
        auto hub = parse_image_components("library/nginx:1.25");
        CHECK_FALSE(hub.registry.has_value());
        CHECK(hub.name == "library/nginx");
    }

    TEST_CASE("Digest") {
        auto c = parse_image_components("alpine@sha256:abcdef0123");

        CHECK(c.name == "alpine");
        CHECK_FALSE(c.tag.has_value());
        CHECK(c.digest == std::optional<std::string>("sha256:abcdef0123"));
    }

    TEST_CASE("Placeholders are literal text") {
        auto c = parse_image_components("${REGISTRY:-docker.io}/app:${VERSION}");

        // Separators inside ${...} do not count, so the registry is not recognised
        CHECK_FALSE(c.registry.has_value());
        CHECK(c.name == "${REGISTRY:-docker.io}/app");
        CHECK(c.tag == std::optional<std::string>("${VERSION}"));

        auto d = parse_image_components("${BASE:-debian}");
        CHECK(d.name == "${BASE:-debian}");
        CHECK_FALSE(d.tag.has_value());
    }

    TEST_CASE("ERROR: Grammar violations") {
        CHECK_THROWS_AS(parse_image_components(""), image_reference_error);
        CHECK_THROWS_AS(parse_image_components("a b"), image_reference_error);
        CHECK_THROWS_AS(parse_image_components("app:"), image_reference_error);
        CHECK_THROWS_AS(parse_image_components("app@"), image_reference_error);
        CHECK_THROWS_AS(parse_image_components("app@x@y"), image_reference_error);
        CHECK_THROWS_AS(parse_image_components("app:1.0@sha256:abc"), image_reference_error);
        CHECK_THROWS_AS(parse_image_components("team//app"), image_reference_error);
        CHECK_THROWS_AS(parse_image_components("gcr.io/"), image_reference_error);
        CHECK_THROWS_AS(parse_image_components(":tag"), image_reference_error);
    }

    TEST_CASE("Stage images carry no components") {
        auto stage_image = make_stage_image("build");
        auto external = make_external_image("node:20");

        CHECK(stage_image.is_stage_reference());
        CHECK(stage_image.full == "build");
        CHECK_FALSE(external.is_stage_reference());
        CHECK(external.full == "node:20");
    }

    TEST_CASE("Placeholder-only references") {
        CHECK(is_placeholder_only("$BASE"));
        CHECK(is_placeholder_only("${BASE_IMAGE}"));
        CHECK(is_placeholder_only("${REG}${NAME}"));
        CHECK_FALSE(is_placeholder_only("$BASE:1.0"));
        CHECK_FALSE(is_placeholder_only("alpine"));
        CHECK_FALSE(is_placeholder_only(""));
    }
}
