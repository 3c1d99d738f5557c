//
// Tests for the analysis pass: facts and terminal failures
//

#include <doctest/doctest.h>
#include <dfscan/parser.hh>
#include <dfscan/parser_error.hh>
#include <dfscan/semantic.hh>
#include <numeric>

using namespace dfscan;

namespace {
    std::vector<std::string> names(std::initializer_list<const char*> values) {
        return std::vector<std::string>(values.begin(), values.end());
    }

    template <typename Error>
    Error expect_failure(const std::string& text) {
        try {
            (void)analyze_dockerfile(text);
        } catch (const Error& e) {
            return e;
        }
        FAIL("expected analysis failure");
        throw std::logic_error("unreachable");
    }
}

TEST_SUITE("Semantic Analysis - Facts") {

    TEST_CASE("Single stage document") {
        auto facts = analyze_dockerfile("FROM ubuntu:20.04\nRUN echo hello\n");

        CHECK(facts.num_stages == 1);
        REQUIRE(facts.images.size() == 1);
        CHECK(facts.images[0].full == "ubuntu:20.04");
        REQUIRE(facts.images[0].components.has_value());
        CHECK_FALSE(facts.images[0].components->registry.has_value());
        CHECK(facts.images[0].components->name == "ubuntu");
        CHECK(facts.images[0].components->tag == std::optional<std::string>("20.04"));
        CHECK_FALSE(facts.images[0].components->digest.has_value());

        CHECK(facts.instructions.total_count == 2);
        CHECK(facts.instructions.by_type.size() == 2);
        CHECK(facts.instructions.by_type.at("FROM") == 1);
        CHECK(facts.instructions.by_type.at("RUN") == 1);
        CHECK_FALSE(facts.multistage.is_multistage);
        CHECK(facts.stage_names.empty());
    }

    TEST_CASE("Copy from a named build stage") {
        auto facts = analyze_dockerfile(
            "FROM a AS build\n"
            "RUN make\n"
            "FROM scratch AS final\n"
            "COPY --from=build /x /x\n");

        CHECK(facts.num_stages == 2);
        CHECK(facts.stage_names == names({"build", "final"}));
        CHECK(facts.copy_from_stages == names({"build"}));
        CHECK(facts.multistage.is_multistage);
        CHECK(facts.multistage.stages_copied_from == names({"build"}));
        CHECK(facts.multistage.stages_used_as_base_images.empty());
        CHECK(facts.multistage.unused_stages.empty());
        REQUIRE(facts.images.size() == 2);
        CHECK(facts.images[0].full == "a");
        CHECK(facts.images[1].full == "scratch");
    }

    TEST_CASE("Stage used as a base image") {
        auto facts = analyze_dockerfile(
            "FROM golang:1.22 AS build\n"
            "FROM build AS test\n"
            "RUN go test ./...\n"
            "FROM alpine:3\n"
            "COPY --from=test /out /bin\n");

        CHECK(facts.num_stages == 3);
        REQUIRE(facts.images.size() == 3);
        CHECK(facts.images[1].full == "build");
        CHECK(facts.images[1].is_stage_reference());
        CHECK(facts.stages[1].base_image.is_stage_reference());
        CHECK(facts.multistage.stages_used_as_base_images == names({"build"}));
        CHECK(facts.multistage.stages_copied_from == names({"test"}));
        CHECK(facts.multistage.unused_stages.empty());
    }

    TEST_CASE("Unused stage is reported, final stage is not") {
        auto facts = analyze_dockerfile(
            "FROM alpine:3 AS tools\n"
            "FROM alpine:3 AS deps\n"
            "FROM alpine:3 AS app\n"
            "COPY --from=deps /a /a\n");

        CHECK(facts.multistage.unused_stages == names({"tools"}));
    }

    TEST_CASE("Stage references by index and case-insensitive name") {
        auto facts = analyze_dockerfile(
            "FROM alpine:3\n"
            "FROM alpine:3 AS Assets\n"
            "FROM nginx:1.25\n"
            "COPY --from=0 /a /a\n"
            "COPY --from=assets /b /b\n"
            "ADD --from=ASSETS /c /c\n"
            "COPY --from=0 /d /d\n");

        CHECK(facts.copy_from_stages == names({"0", "Assets"}));
        CHECK(facts.add_from_stages == names({"Assets"}));
        CHECK(facts.multistage.stages_copied_from == names({"Assets"}));
        CHECK(facts.multistage.stages_added_from == names({"Assets"}));
        CHECK(facts.images.size() == 2);
    }

    TEST_CASE("External image as copy source") {
        auto facts = analyze_dockerfile(
            "FROM alpine:3\n"
            "COPY --from=nginx:latest /etc/nginx/nginx.conf /etc/nginx/\n");

        CHECK(facts.copy_from_stages == names({"nginx:latest"}));
        CHECK(facts.multistage.stages_copied_from.empty());
    }

    TEST_CASE("Ports keep their raw text and order") {
        auto facts = analyze_dockerfile("FROM node:20\nEXPOSE $PORT 9229\nEXPOSE 80/tcp 9229\n");

        CHECK(facts.exposed_ports == names({"$PORT", "9229", "80/tcp", "9229"}));
    }

    TEST_CASE("ARG, ENV and LABEL") {
        auto facts = analyze_dockerfile(
            "ARG BASE=alpine:3\n"
            "FROM $BASE\n"
            "ARG VERSION\n"
            "ENV APP_HOME=/app PATH=\"/app/bin:$PATH\"\n"
            "ENV LEGACY some value\n"
            "LABEL org.opencontainers.image.title=\"My App\" version=$VERSION\n"
            "ENV APP_HOME=/srv\n");

        REQUIRE(facts.args.size() == 2);
        CHECK(facts.args.at("BASE") == std::optional<std::string>("alpine:3"));
        CHECK_FALSE(facts.args.at("VERSION").has_value());

        REQUIRE(facts.env_vars.size() == 3);
        CHECK(facts.env_vars.begin()->first == "APP_HOME");
        CHECK(facts.env_vars.at("APP_HOME") == "/srv");
        CHECK(facts.env_vars.at("PATH") == "/app/bin:$PATH");
        CHECK(facts.env_vars.at("LEGACY") == "some value");

        CHECK(facts.labels.at("org.opencontainers.image.title") == "My App");
        CHECK(facts.labels.at("version") == "$VERSION");

        REQUIRE(facts.images.size() == 1);
        CHECK(facts.images[0].full == "$BASE");
    }

    TEST_CASE("Instructions before the first FROM and documents without FROM") {
        auto facts = analyze_dockerfile("ARG X=1\nRUN echo $X\n");

        CHECK(facts.num_stages == 0);
        CHECK_FALSE(facts.multistage.is_multistage);
        CHECK(facts.images.empty());
        CHECK(facts.instructions.total_count == 2);
    }

    TEST_CASE("Unknown instructions are counted under their own keyword") {
        auto facts = analyze_dockerfile("FROM alpine:3\nFOO bar\nfoo baz\n");

        CHECK(facts.instructions.by_type.at("FOO") == 2);
        CHECK(facts.instructions.total_count == 3);
    }

    TEST_CASE("Continuation lines count as one instruction") {
        auto facts = analyze_dockerfile(
            "FROM alpine:3\n"
            "RUN apk add \\\n"
            "    curl \\\n"
            "    git\n");

        CHECK(facts.instructions.by_type.at("RUN") == 1);
        CHECK(facts.instructions.total_count == 2);
    }

    TEST_CASE("Properties hold for a mixed document") {
        const std::string text =
            "# syntax=docker/dockerfile:1\n"
            "ARG GO=1.22\n"
            "FROM golang:${GO} AS build\n"
            "WORKDIR /src\n"
            "COPY . .\n"
            "RUN go build -o /out/app\n"
            "FROM build AS lint\n"
            "RUN golangci-lint run\n"
            "FROM gcr.io/distroless/static:nonroot\n"
            "COPY --from=build /out/app /app\n"
            "USER nonroot\n"
            "EXPOSE 8080\n"
            "ENTRYPOINT [\"/app\"]\n";

        auto facts = analyze_dockerfile(text);

        const auto sum = std::accumulate(facts.instructions.by_type.begin(), facts.instructions.by_type.end(),
                                         std::size_t{0},
                                         [](std::size_t acc, const auto& entry) { return acc + entry.second; });
        CHECK(sum == facts.instructions.total_count);
        CHECK(facts.multistage.is_multistage == (facts.num_stages > 1));
        CHECK(facts.stages.size() == facts.num_stages);

        // "lint" is built on build but nothing consumes it
        CHECK(facts.multistage.unused_stages == names({"lint"}));

        // Repeated analysis of the same text gives the same facts
        CHECK(analyze_dockerfile(text) == facts);
    }

    TEST_CASE("Byte-order mark does not hide the first FROM") {
        auto facts = analyze_dockerfile("\xEF\xBB\xBF" "FROM alpine:3\nRUN true\n");

        CHECK(facts.num_stages == 1);
        REQUIRE(facts.images.size() == 1);
        CHECK(facts.images[0].full == "alpine:3");
        CHECK(facts.instructions.by_type.at("FROM") == 1);
        CHECK(facts.instructions.by_type.size() == 2);
    }

    TEST_CASE("Long unknown keyword is counted") {
        const std::string word(65, 'X');
        auto facts = analyze_dockerfile("FROM alpine:3\n" + word + " arg\n");

        CHECK(facts.instructions.total_count == 2);
        CHECK(facts.instructions.by_type.at(word) == 1);
    }

    TEST_CASE("Quoted base image") {
        auto facts = analyze_dockerfile("FROM \"alpine:3\"\n");

        REQUIRE(facts.images.size() == 1);
        CHECK(facts.images[0].full == "alpine:3");
        REQUIRE(facts.images[0].components.has_value());
        CHECK(facts.images[0].components->name == "alpine");
    }

    TEST_CASE("Final named stage is never unused") {
        auto facts = analyze_dockerfile("FROM alpine:3 AS only\n");

        CHECK(facts.num_stages == 1);
        CHECK(facts.multistage.unused_stages.empty());
    }
}

TEST_SUITE("Semantic Analysis - Failures") {

    TEST_CASE("ERROR: Empty input") {
        auto e = expect_failure<empty_input_error>("\n# comment only\n\n");
        CHECK(e.kind() == error_kind::empty_input);
        CHECK(std::string(e.code()) == error_codes::E_EMPTY_INPUT);
        CHECK(e.line() == 0);

        CHECK_THROWS_AS(analyze_dockerfile(""), empty_input_error);
    }

    TEST_CASE("ERROR: LABEL without a key") {
        auto e = expect_failure<malformed_instruction_error>("FROM alpine:3\nLABEL =value\n");
        CHECK(e.line() == 2);
        CHECK(e.keyword() == "LABEL");
    }

    TEST_CASE("ERROR: Malformed arguments") {
        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3\nENV\n"), malformed_instruction_error);
        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3\nENV ONLYKEY\n"), malformed_instruction_error);
        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3\nARG\n"), malformed_instruction_error);
        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3\nEXPOSE\n"), malformed_instruction_error);
        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3\nCOPY --from= /a /b\n"), malformed_instruction_error);
        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3\nCOPY --from /a /b\n"), malformed_instruction_error);
    }

    TEST_CASE("ERROR: Stage index out of range") {
        auto e = expect_failure<invalid_stage_reference_error>("FROM alpine:3\nCOPY --from=2 /a /b\n");
        CHECK(e.line() == 2);
        CHECK(e.keyword() == "COPY");
        CHECK(std::string(e.code()) == error_codes::E_INVALID_STAGE_REFERENCE);
    }

    TEST_CASE("ERROR: Forward reference to a later stage") {
        auto e = expect_failure<invalid_stage_reference_error>(
            "FROM alpine:3 AS first\n"
            "COPY --from=second /a /b\n"
            "FROM alpine:3 AS second\n");
        CHECK(e.line() == 2);

        CHECK_THROWS_AS(analyze_dockerfile("FROM later\nFROM alpine:3 AS later\n"),
                        invalid_stage_reference_error);
    }

    TEST_CASE("ERROR: Stage built on itself") {
        CHECK_THROWS_AS(analyze_dockerfile("FROM base AS base\n"), invalid_stage_reference_error);
    }

    TEST_CASE("ERROR: Copy from the current stage") {
        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3 AS app\nCOPY --from=app /a /b\n"),
                        invalid_stage_reference_error);
        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3\nCOPY --from=0 /a /b\n"),
                        invalid_stage_reference_error);
    }

    TEST_CASE("ERROR: Invalid image references") {
        auto e = expect_failure<invalid_image_reference_error>("FROM app:1.0@sha256:abc\n");
        CHECK(e.line() == 1);
        CHECK(e.keyword() == "FROM");
        CHECK(std::string(e.code()) == error_codes::E_INVALID_IMAGE_REFERENCE);

        CHECK_THROWS_AS(analyze_dockerfile("FROM alpine:3\nCOPY --from=cache@ /a /b\n"),
                        invalid_image_reference_error);
    }

    TEST_CASE("First failure wins") {
        auto e = expect_failure<analysis_error>("FROM alpine:3\nLABEL =x\nCOPY --from=9 /a /b\n");
        CHECK(e.kind() == error_kind::malformed_instruction);
        CHECK(e.line() == 2);
    }
}
