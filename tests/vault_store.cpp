// tests/vault_store.cpp
#include <catch2/catch_all.hpp>
#include "VaultStore.hpp"
#include "VaultErrors.hpp"

#include <memory>
#include <string>

// Clock that ticks one second per call, starting at 1000.
static VaultStore::Clock tickingClock() {
    auto now = std::make_shared<std::int64_t>(1000);
    return [now] { return (*now)++; };
}

TEST_CASE("Store: add creates v1 tagged dev", "[store]") {
    VaultStore store;
    REQUIRE(store.add("k", "x") == 1);

    REQUIRE(store.get("k", VersionSelector::latest()) == "x");
    REQUIRE(store.get("k", VersionSelector::number(1)) == "x");
    REQUIRE(store.get("k", VersionSelector::tag("dev")) == "x");
    REQUIRE(store.latestVersionNumber("k") == 1);
    REQUIRE(store.prompt("k").tags.at("dev") == 1);
}

TEST_CASE("Store: version numbers are gap-free and dev follows update", "[store]") {
    VaultStore store;
    store.add("k", "c1");
    for (std::uint32_t expected = 2; expected <= 10; ++expected) {
        REQUIRE(store.update("k", "c" + std::to_string(expected)) == expected);
        REQUIRE(store.prompt("k").tags.at("dev") == expected);
    }

    const auto& versions = store.prompt("k").versions;
    REQUIRE(versions.size() == 10);
    for (std::size_t i = 0; i < versions.size(); ++i) {
        REQUIRE(versions[i].number == i + 1);
    }
}

TEST_CASE("Store: update appends and never rewrites older versions", "[store]") {
    VaultStore store;
    store.add("k", "x");
    store.update("k", "y", std::string("second draft"));

    REQUIRE(store.get("k", VersionSelector::tag("dev")) == "y");
    REQUIRE(store.get("k", VersionSelector::number(1)) == "x");
    REQUIRE(store.get("k", VersionSelector::latest()) == "y");

    // Identical content still produces a new version.
    REQUIRE(store.update("k", "y") == 3);
    REQUIRE(store.get("k", VersionSelector::number(2)) == "y");
}

TEST_CASE("Store: tag then promote moves the tag to latest", "[store]") {
    VaultStore store;
    store.add("k", "one");
    store.update("k", "two");

    store.tag("k", "stable", 1);
    REQUIRE(store.get("k", VersionSelector::tag("stable")) == "one");

    store.promote("k", "stable");
    REQUIRE(store.get("k", VersionSelector::tag("stable")) == "two");

    // Overwrite in place, multiple tags on one version.
    store.tag("k", "release", 2);
    store.tag("k", "stable", 1);
    REQUIRE(store.get("k", VersionSelector::tag("stable")) == "one");
    REQUIRE(store.get("k", VersionSelector::tag("release")) == "two");
}

TEST_CASE("Store: error taxonomy", "[store]") {
    VaultStore store;
    store.add("k", "x");

    REQUIRE_THROWS_AS(store.get("missing-key", VersionSelector::latest()), KeyNotFoundError);
    REQUIRE_THROWS_AS(store.get("k", VersionSelector::number(99)), VersionNotFoundError);
    REQUIRE_THROWS_AS(store.get("k", VersionSelector::number(0)), VersionNotFoundError);
    REQUIRE_THROWS_AS(store.get("k", VersionSelector::tag("nope")), TagNotFoundError);

    REQUIRE_THROWS_AS(store.add("k", "again"), DuplicateKeyError);
    REQUIRE_THROWS_AS(store.update("missing-key", "y"), KeyNotFoundError);
    REQUIRE_THROWS_AS(store.tag("missing-key", "stable", 1), KeyNotFoundError);
    REQUIRE_THROWS_AS(store.tag("k", "stable", 2), VersionNotFoundError);
    REQUIRE_THROWS_AS(store.promote("missing-key", "stable"), KeyNotFoundError);
    REQUIRE_THROWS_AS(store.history("missing-key"), KeyNotFoundError);

    REQUIRE_THROWS_AS(store.add("", "x"), std::invalid_argument);
    REQUIRE_THROWS_AS(store.tag("k", "", 1), std::invalid_argument);

    try {
        store.get("k", VersionSelector::tag("nope"));
        FAIL("expected TagNotFoundError");
    } catch (const VaultError& e) {
        REQUIRE(e.code() == VaultErrc::TagNotFound);
    }

    // Failed calls leave the prompt untouched.
    REQUIRE(store.prompt("k").versions.size() == 1);
    REQUIRE(store.prompt("k").tags.size() == 1);
}

TEST_CASE("Store: history lists versions with inverted tag map", "[store]") {
    VaultStore store(tickingClock());
    store.add("k", "a");
    store.update("k", "b", std::string("msg b"));
    store.update("k", "c");
    store.tag("k", "stable", 1);
    store.tag("k", "alpha", 1);

    auto h = store.history("k");
    REQUIRE(h.size() == 3);

    REQUIRE(h[0].number == 1);
    REQUIRE(h[0].createdAt == 1000);
    REQUIRE_FALSE(h[0].message.has_value());
    REQUIRE(h[0].tags == std::vector<std::string>{"alpha", "stable"});

    REQUIRE(h[1].number == 2);
    REQUIRE(h[1].message == std::string("msg b"));
    REQUIRE(h[1].tags.empty());

    REQUIRE(h[2].number == 3);
    REQUIRE(h[2].tags == std::vector<std::string>{"dev"});

    // sha256("a")
    REQUIRE(h[0].contentHash == "ca978112ca1bbdcafac231b39a23dc4da786eff8147c4e72b9807785afee48bb");
}

TEST_CASE("Store: time selector picks newest version not after t", "[store][selector]") {
    VaultStore store(tickingClock());
    store.add("k", "v1");      // t=1000
    store.update("k", "v2");   // t=1001
    store.update("k", "v3");   // t=1002

    REQUIRE(store.get("k", VersionSelector::at(1001)) == "v2");
    REQUIRE(store.get("k", VersionSelector::at(5000)) == "v3");
    REQUIRE(store.get("k", VersionSelector::at(1000)) == "v1");
    REQUIRE_THROWS_AS(store.get("k", VersionSelector::at(999)), VersionNotFoundError);
}

TEST_CASE("Store: keys are listed in order", "[store]") {
    VaultStore store;
    store.add("zeta", "z");
    store.add("Alpha", "a");
    store.add("alpha", "a");

    REQUIRE(store.keys() == std::vector<std::string>{"Alpha", "alpha", "zeta"});
    REQUIRE(store.size() == 3);
    REQUIRE(store.contains("alpha"));
    REQUIRE_FALSE(store.contains("ALPHA"));
}

TEST_CASE("Store: fromPrompts rejects invariant violations", "[store]") {
    Prompt good;
    good.key = "k";
    good.versions = {Version{1, "a", 1, std::nullopt}, Version{2, "b", 2, std::string("m")}};
    good.tags = {{"dev", 2}, {"stable", 1}};

    REQUIRE_NOTHROW(VaultStore::fromPrompts({good}));

    SECTION("gap in version numbers") {
        Prompt p = good;
        p.versions[1].number = 3;
        REQUIRE_THROWS_AS(VaultStore::fromPrompts({p}), CorruptDataError);
    }
    SECTION("tag points past the last version") {
        Prompt p = good;
        p.tags["stable"] = 7;
        REQUIRE_THROWS_AS(VaultStore::fromPrompts({p}), CorruptDataError);
    }
    SECTION("prompt without versions") {
        Prompt p = good;
        p.versions.clear();
        p.tags.clear();
        REQUIRE_THROWS_AS(VaultStore::fromPrompts({p}), CorruptDataError);
    }
    SECTION("missing dev tag") {
        Prompt p = good;
        p.tags.erase("dev");
        REQUIRE_THROWS_AS(VaultStore::fromPrompts({p}), CorruptDataError);
    }
    SECTION("duplicate key") {
        REQUIRE_THROWS_AS(VaultStore::fromPrompts({good, good}), CorruptDataError);
    }
    SECTION("empty key") {
        Prompt p = good;
        p.key.clear();
        REQUIRE_THROWS_AS(VaultStore::fromPrompts({p}), CorruptDataError);
    }
}
