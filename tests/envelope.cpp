// tests/envelope.cpp
#include <catch2/catch_all.hpp>
#include "CryptoEnvelope.hpp"
#include "VaultErrors.hpp"
#include "test_helpers.hpp"

#include <cstring>

TEST_CASE("Envelope: plaintext mode wraps the payload as is", "[crypto]") {
    const auto payload = toBytes("codec bytes");
    const auto env = CryptoEnvelope::seal(payload, std::nullopt);

    REQUIRE(env.size() == CryptoEnvelope::HEADER_LEN + payload.size());
    REQUIRE(std::memcmp(env.data(), "PPEV", 4) == 0);
    REQUIRE(CryptoEnvelope::modeOf(env) == CryptoEnvelope::Mode::Plaintext);
    REQUIRE(CryptoEnvelope::open(env, std::nullopt) == payload);

    // An empty password also means plaintext; a password on open is ignored.
    const auto env2 = CryptoEnvelope::seal(payload, std::string(""));
    REQUIRE(CryptoEnvelope::modeOf(env2) == CryptoEnvelope::Mode::Plaintext);
    REQUIRE(CryptoEnvelope::open(env2, std::string("anything")) == payload);
}

TEST_CASE("Envelope: encrypted round trip", "[crypto]") {
    const auto payload = toBytes("prompt vault contents");
    const auto env = CryptoEnvelope::seal(payload, std::string("pw"));

    REQUIRE(CryptoEnvelope::modeOf(env) == CryptoEnvelope::Mode::Encrypted);
    REQUIRE(env.size() == 5 + 16 + 12 + payload.size() + 16);
    REQUIRE(CryptoEnvelope::open(env, std::string("pw")) == payload);

    // Fresh salt and nonce per seal.
    REQUIRE(CryptoEnvelope::seal(payload, std::string("pw")) != env);
}

TEST_CASE("Envelope: wrong or missing password fails authentication", "[crypto]") {
    const auto env = CryptoEnvelope::seal(toBytes("secret"), std::string("pw"));

    REQUIRE_THROWS_AS(CryptoEnvelope::open(env, std::string("wrong")), AuthenticationFailedError);
    REQUIRE_THROWS_AS(CryptoEnvelope::open(env, std::nullopt), AuthenticationFailedError);
    REQUIRE_THROWS_AS(CryptoEnvelope::open(env, std::string("")), AuthenticationFailedError);
}

TEST_CASE("Envelope: any flipped body byte fails authentication", "[crypto]") {
    const auto env = CryptoEnvelope::seal(toBytes("secret"), std::string("pw"));

    // salt, nonce, ciphertext and tag regions
    for (std::size_t pos : {std::size_t{5}, std::size_t{5 + 16}, std::size_t{5 + 16 + 12}, env.size() - 1}) {
        auto bad = env;
        bad[pos] ^= 0x80;
        INFO("offset " << pos);
        REQUIRE_THROWS_AS(CryptoEnvelope::open(bad, std::string("pw")), AuthenticationFailedError);
    }

    auto truncated = env;
    truncated.resize(5 + 16 + 12 + 10);
    REQUIRE_THROWS_AS(CryptoEnvelope::open(truncated, std::string("pw")), AuthenticationFailedError);
}

TEST_CASE("Envelope: malformed header is corrupt data", "[crypto]") {
    auto env = CryptoEnvelope::seal(toBytes("x"), std::nullopt);

    REQUIRE_THROWS_AS(CryptoEnvelope::open({'P', 'P', 'E'}, std::nullopt), CorruptDataError);

    auto badMagic = env;
    badMagic[1] = 'Q';
    REQUIRE_THROWS_AS(CryptoEnvelope::open(badMagic, std::nullopt), CorruptDataError);

    auto badMode = env;
    badMode[4] = 7;
    REQUIRE_THROWS_AS(CryptoEnvelope::modeOf(badMode), CorruptDataError);
    REQUIRE_THROWS_AS(CryptoEnvelope::open(badMode, std::string("pw")), CorruptDataError);
}
