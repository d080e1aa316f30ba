// tests/selector_parse.cpp
#include <catch2/catch_all.hpp>
#include "PromptTypes.hpp"

TEST_CASE("Selector: empty text and 'latest' mean latest", "[selector]") {
    REQUIRE(VersionSelector::parse("").kind() == VersionSelector::Kind::Latest);
    REQUIRE(VersionSelector::parse("latest").kind() == VersionSelector::Kind::Latest);
}

TEST_CASE("Selector: digit strings are version numbers", "[selector]") {
    auto s = VersionSelector::parse("42");
    REQUIRE(s.kind() == VersionSelector::Kind::Number);
    REQUIRE(s.versionNumber() == 42);

    auto zero = VersionSelector::parse("0");
    REQUIRE(zero.kind() == VersionSelector::Kind::Number);
    REQUIRE(zero.versionNumber() == 0);

    auto big = VersionSelector::parse("18446744073709551615");
    REQUIRE(big.kind() == VersionSelector::Kind::Number);
    REQUIRE(big.versionNumber() == 18446744073709551615ULL);
}

TEST_CASE("Selector: numeric overflow falls back to a tag name", "[selector]") {
    auto s = VersionSelector::parse("18446744073709551616");
    REQUIRE(s.kind() == VersionSelector::Kind::Tag);
    REQUIRE(s.tagName() == "18446744073709551616");
}

TEST_CASE("Selector: anything else is a tag", "[selector]") {
    for (const char* text : {"stable", "v2", "1.0", "-3", " 7", "LATEST"}) {
        auto s = VersionSelector::parse(text);
        INFO(text);
        REQUIRE(s.kind() == VersionSelector::Kind::Tag);
        REQUIRE(s.tagName() == text);
    }
}

TEST_CASE("Selector: describe names the selection", "[selector]") {
    REQUIRE(VersionSelector::latest().describe() == "latest");
    REQUIRE(VersionSelector::number(3).describe() == "v3");
    REQUIRE(VersionSelector::tag("stable").describe() == "tag 'stable'");
    REQUIRE(VersionSelector::at(1700000000).describe() == "time 1700000000");
}
