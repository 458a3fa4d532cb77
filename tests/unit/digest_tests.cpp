#include <doctest/doctest.h>
#include <ocicfg/digest.hpp>

using namespace ocicfg;

TEST_CASE("parse_digest accepts sha256 and sha512") {
    std::string hex256(64, 'a');
    auto d = parse_digest("sha256:" + hex256);
    REQUIRE(d.has_value());
    CHECK(d->algorithm == "sha256");
    CHECK(d->encoded == hex256);

    auto d512 = parse_digest("sha512:" + std::string(128, '0'));
    REQUIRE(d512.has_value());
    CHECK(d512->algorithm == "sha512");
}

TEST_CASE("parse_digest rejects malformed digests") {
    CHECK_FALSE(parse_digest("").has_value());
    CHECK_FALSE(parse_digest("sha256").has_value());
    CHECK_FALSE(parse_digest("sha256:" + std::string(63, 'a')).has_value());
    CHECK_FALSE(parse_digest("sha256:" + std::string(64, 'A')).has_value());
    CHECK_FALSE(parse_digest("md5:" + std::string(32, 'a')).has_value());
    CHECK_FALSE(parse_digest("sha512:" + std::string(64, 'a')).has_value());

    SUBCASE("path traversal in the encoded part") {
        CHECK_FALSE(is_valid_digest("sha256:../../../../etc/passwd"));
    }
}

TEST_CASE("compute_digest matches known vectors") {
    // sha256("abc")
    auto r = compute_digest("sha256", "abc");
    REQUIRE(r.ok);
    CHECK(r.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    CHECK(sha256_digest_of("") ==
          "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto r512 = compute_digest("sha512", "abc");
    REQUIRE(r512.ok);
    CHECK(r512.hex_digest.size() == 128);
    CHECK(r512.hex_digest.substr(0, 16) == "ddaf35a193617aba");
}

TEST_CASE("compute_digest rejects unknown algorithms") {
    auto r = compute_digest("md5", "abc");
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}
