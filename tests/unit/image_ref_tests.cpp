#include <doctest/doctest.h>

#include "common.hpp"

using namespace ocicfg;
using namespace ocicfg::cli;

TEST_CASE("parse_image_ref splits path and tag") {
    SUBCASE("tag defaults to latest") {
        auto r = parse_image_ref("images/app");
        REQUIRE(r.isOk());
        CHECK(r.value().layout == "images/app");
        CHECK(r.value().tag == "latest");
    }

    SUBCASE("explicit tag") {
        auto r = parse_image_ref("images/app:v1.2-rc_3");
        REQUIRE(r.isOk());
        CHECK(r.value().layout == "images/app");
        CHECK(r.value().tag == "v1.2-rc_3");
    }

    SUBCASE("a colon in a directory belongs to the path") {
        auto r = parse_image_ref("/mnt/c:/images/app");
        REQUIRE(r.isOk());
        CHECK(r.value().layout == "/mnt/c:/images/app");
        CHECK(r.value().tag == "latest");
    }
}

TEST_CASE("parse_image_ref rejects malformed tags") {
    SUBCASE("empty tag after the colon") {
        auto r = parse_image_ref("images/app:");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::NOT_FOUND);
        CHECK(r.error().message().find("invalid --image tag") != std::string::npos);
    }

    SUBCASE("characters outside the ref name grammar") {
        for (const char* image : {"app:v 1", "app:-v1", "app:v1.", "app:v..1", "app:v---1", "app:t$g"}) {
            CAPTURE(image);
            CHECK(parse_image_ref(image).isErr());
        }
    }

    SUBCASE("separators between alphanumeric runs") {
        for (const char* image : {"app:v1.0", "app:a--b", "app:1.0+build@x", "app:A_b-C"}) {
            CAPTURE(image);
            CHECK(parse_image_ref(image).isOk());
        }
    }

    SUBCASE("empty layout path") {
        CHECK(parse_image_ref("").isErr());
    }
}
