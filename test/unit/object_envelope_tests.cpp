// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "primitives/object_envelope.hpp"
#include <stdexcept>

using namespace chaincraft::primitives;

namespace {

Digest MakeDigest(uint8_t tag) {
    std::array<uint8_t, Digest::SIZE> bytes;
    bytes.fill(tag);
    return Digest(bytes);
}

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("ObjectEnvelope - Encoding layout", "[primitives][envelope]") {
    SECTION("Bare envelope") {
        ObjectEnvelope env;
        env.body = Bytes("hi");
        auto raw = EncodeEnvelope(env);
        CHECK(raw == std::vector<uint8_t>{0x01, 0x00, 0x00, 'h', 'i'});
    }

    SECTION("Slot is little-endian") {
        ObjectEnvelope env;
        env.slot = 0x0102;
        auto raw = EncodeEnvelope(env);
        REQUIRE(raw.size() == 11);
        CHECK(raw[1] == ObjectEnvelope::FLAG_SLOT);
        CHECK(raw[2] == 0x02);
        CHECK(raw[3] == 0x01);
        CHECK(raw[10] == 0x00); // dependency count
    }

    SECTION("Full envelope decodes to the same fields") {
        ObjectEnvelope env;
        env.slot = 42;
        env.dependencies = {MakeDigest(1), MakeDigest(2)};
        env.public_key = std::vector<uint8_t>(32, 0xaa);
        env.signature = std::vector<uint8_t>(64, 0xbb);
        env.body = Bytes("payload body");

        auto decoded = DecodeEnvelope(EncodeEnvelope(env));
        REQUIRE(decoded.has_value());
        CHECK(decoded->slot == std::optional<uint64_t>(42));
        CHECK(decoded->dependencies == env.dependencies);
        CHECK(decoded->public_key == env.public_key);
        CHECK(decoded->signature == env.signature);
        CHECK(decoded->body == env.body);
        CHECK(decoded->has_signature());
    }
}

TEST_CASE("ObjectEnvelope - Field limits", "[primitives][envelope]") {
    ObjectEnvelope env;

    SECTION("Too many dependencies") {
        env.dependencies.assign(ObjectEnvelope::MAX_DEPENDENCIES + 1, MakeDigest(7));
        CHECK_THROWS_AS(EncodeEnvelope(env), std::length_error);
    }

    SECTION("Maximum dependency count is allowed") {
        env.dependencies.assign(ObjectEnvelope::MAX_DEPENDENCIES, MakeDigest(7));
        auto decoded = DecodeEnvelope(EncodeEnvelope(env));
        REQUIRE(decoded.has_value());
        CHECK(decoded->dependencies.size() == ObjectEnvelope::MAX_DEPENDENCIES);
    }

    SECTION("Oversized signature field") {
        env.public_key = std::vector<uint8_t>(32, 1);
        env.signature = std::vector<uint8_t>(65536, 2);
        CHECK_THROWS_AS(EncodeEnvelope(env), std::length_error);
    }
}

TEST_CASE("ObjectEnvelope - Malformed input", "[primitives][envelope]") {
    CHECK_FALSE(DecodeEnvelope(nullptr, 0).has_value());
    CHECK_FALSE(DecodeEnvelope(std::vector<uint8_t>{}).has_value());

    // Unknown version
    CHECK_FALSE(DecodeEnvelope(std::vector<uint8_t>{0x02, 0x00, 0x00}).has_value());
    // Unknown flag bits
    CHECK_FALSE(DecodeEnvelope(std::vector<uint8_t>{0x01, 0x04, 0x00}).has_value());
    // Missing dependency count
    CHECK_FALSE(DecodeEnvelope(std::vector<uint8_t>{0x01, 0x00}).has_value());
    // Truncated slot
    CHECK_FALSE(DecodeEnvelope(std::vector<uint8_t>{0x01, 0x01, 0x05}).has_value());

    SECTION("Truncated dependency list") {
        std::vector<uint8_t> raw{0x01, 0x00, 0x02};
        raw.insert(raw.end(), Digest::SIZE + 3, 0x11);
        CHECK_FALSE(DecodeEnvelope(raw).has_value());
    }

    SECTION("Signature length runs past the end") {
        std::vector<uint8_t> raw{0x01, ObjectEnvelope::FLAG_SIGNATURE, 0x00,
                                 0x20, 0x00, 0x01, 0x02};
        CHECK_FALSE(DecodeEnvelope(raw).has_value());
    }

    SECTION("Plain text is not an envelope") {
        CHECK_FALSE(DecodeEnvelope(Bytes("hello world")).has_value());
    }
}
