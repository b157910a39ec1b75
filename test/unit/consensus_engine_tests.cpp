// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Unit tests for the consensus engine and the stock validators

#include <catch2/catch_test_macros.hpp>
#include "consensus/consensus_engine.hpp"
#include "consensus/validators.hpp"
#include "crypto/openssl_crypto.hpp"
#include "primitives/object_envelope.hpp"

using namespace chaincraft;
using namespace chaincraft::consensus;

namespace {

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

primitives::SharedObjectPtr MakeObject(const std::vector<uint8_t>& payload) {
    crypto::OpenSslCrypto crypto;
    return primitives::MakeSharedObject(crypto.hash(payload),
                                        primitives::ObjectKind::Custom, payload,
                                        primitives::LOCAL_PEER_ID, 0);
}

primitives::SharedObjectPtr MakeEnvelopeObject(primitives::ObjectEnvelope env) {
    return MakeObject(primitives::EncodeEnvelope(env));
}

} // namespace

TEST_CASE("ConsensusEngine - Append-only ordering", "[consensus][unit]") {
    ConsensusEngine engine(std::make_shared<AppendOnlyValidator>(1024));

    auto a = MakeObject(Bytes("a"));
    auto b = MakeObject(Bytes("b"));

    auto da = engine.submit(*a);
    auto db = engine.submit(*b);
    REQUIRE(da.accepted());
    REQUIRE(db.accepted());
    CHECK(da.order_index == 1);
    CHECK(db.order_index == 2);
    CHECK(engine.committed_count() == 2);
    CHECK(engine.committed_history() == std::vector<primitives::Digest>{a->digest, b->digest});
    CHECK(engine.kind_of(a->digest) == primitives::ObjectKind::Custom);

    SECTION("Resubmission is rejected") {
        auto again = engine.submit(*a);
        CHECK(again.rejected());
        CHECK(again.reason == "already committed");
        CHECK(engine.committed_count() == 2);
        CHECK(engine.validation_count() == 3);
    }

    SECTION("Empty and oversized payloads are rejected") {
        CHECK(engine.submit(*MakeObject({})).rejected());
        CHECK(engine.submit(*MakeObject(std::vector<uint8_t>(1025, 0x42))).rejected());
        CHECK(engine.submit(*MakeObject(std::vector<uint8_t>(1024, 0x42))).accepted());
    }
}

TEST_CASE("ConsensusEngine - Requires a validator", "[consensus][unit]") {
    REQUIRE_THROWS_AS(ConsensusEngine(nullptr), std::invalid_argument);
}

TEST_CASE("ConsensusEngine - Round decides conflicts by lowest digest", "[consensus][unit]") {
    ConsensusEngine engine(std::make_shared<DependencyValidator>(1024));

    primitives::ObjectEnvelope one;
    one.slot = 7;
    one.body = Bytes("first claim");
    primitives::ObjectEnvelope two;
    two.slot = 7;
    two.body = Bytes("second claim");
    auto x = MakeEnvelopeObject(one);
    auto y = MakeEnvelopeObject(two);
    const auto& low = x->digest < y->digest ? x : y;
    const auto& high = x->digest < y->digest ? y : x;

    // Submission order does not matter within a round
    auto results = engine.submit_round({high, nullptr, low});
    REQUIRE(results.size() == 2);
    CHECK(results[0].first->digest == low->digest);
    CHECK(results[0].second.accepted());
    CHECK(results[1].first->digest == high->digest);
    CHECK(results[1].second.rejected());
    CHECK(engine.is_committed(low->digest));
    CHECK_FALSE(engine.is_committed(high->digest));
}

TEST_CASE("DependencyValidator - Decisions", "[consensus][validator][unit]") {
    ConsensusEngine engine(std::make_shared<DependencyValidator>(4096));

    primitives::ObjectEnvelope root;
    root.body = Bytes("root");
    auto root_obj = MakeEnvelopeObject(root);

    primitives::ObjectEnvelope child;
    child.dependencies.push_back(root_obj->digest);
    child.body = Bytes("child");
    auto child_obj = MakeEnvelopeObject(child);

    SECTION("Missing dependency defers") {
        auto decision = engine.submit(*child_obj);
        REQUIRE(decision.deferred());
        CHECK(decision.missing_dependency == root_obj->digest);
        CHECK(engine.committed_count() == 0);
    }

    SECTION("Committed dependency accepts") {
        REQUIRE(engine.submit(*root_obj).accepted());
        CHECK(engine.submit(*child_obj).accepted());
        CHECK(*engine.order_index_of(root_obj->digest) <
              *engine.order_index_of(child_obj->digest));
    }

    SECTION("First missing dependency in declaration order is reported") {
        primitives::ObjectEnvelope other;
        other.body = Bytes("other");
        auto other_obj = MakeEnvelopeObject(other);

        primitives::ObjectEnvelope multi;
        multi.dependencies = {other_obj->digest, root_obj->digest};
        multi.body = Bytes("multi");
        auto multi_obj = MakeEnvelopeObject(multi);

        REQUIRE(engine.submit(*root_obj).accepted());
        auto decision = engine.submit(*multi_obj);
        REQUIRE(decision.deferred());
        CHECK(decision.missing_dependency == other_obj->digest);
    }

    SECTION("Malformed envelope is rejected") {
        auto junk = MakeObject(Bytes("not an envelope"));
        auto decision = engine.submit(*junk);
        CHECK(decision.rejected());
        CHECK(decision.reason == "malformed envelope");
    }

    SECTION("Taken slot is rejected") {
        primitives::ObjectEnvelope first;
        first.slot = 1;
        first.body = Bytes("x");
        primitives::ObjectEnvelope second;
        second.slot = 1;
        second.body = Bytes("y");
        REQUIRE(engine.submit(*MakeEnvelopeObject(first)).accepted());
        CHECK(engine.submit(*MakeEnvelopeObject(second)).rejected());
    }
}

TEST_CASE("SignedEnvelopeValidator - Signatures", "[consensus][validator][crypto][unit]") {
    auto crypto = std::make_shared<crypto::OpenSslCrypto>();
    auto validator = CreateValidator("signed-dependency", crypto, 4096);
    REQUIRE(validator);
    ConsensusEngine engine(validator);

    auto keys = crypto::OpenSslCrypto::generate_keypair();
    REQUIRE(keys.has_value());

    primitives::ObjectEnvelope env;
    env.body = Bytes("signed body");
    env.public_key = keys->public_key;
    auto sig = crypto->sign(keys->private_key, env.body);
    REQUIRE(sig.has_value());
    env.signature = *sig;

    SECTION("Valid signature is accepted") {
        CHECK(engine.submit(*MakeEnvelopeObject(env)).accepted());
    }

    SECTION("Tampered body is rejected") {
        env.body = Bytes("signed bodY");
        auto decision = engine.submit(*MakeEnvelopeObject(env));
        CHECK(decision.rejected());
        CHECK(decision.reason == "bad signature");
    }

    SECTION("Unsigned envelope is rejected") {
        primitives::ObjectEnvelope bare;
        bare.body = Bytes("bare");
        auto decision = engine.submit(*MakeEnvelopeObject(bare));
        CHECK(decision.rejected());
        CHECK(decision.reason == "unsigned envelope");
    }
}

TEST_CASE("CreateValidator - Names", "[consensus][validator][unit]") {
    auto crypto = std::make_shared<crypto::OpenSslCrypto>();
    CHECK(CreateValidator("append-only", crypto, 10)->name() == "append-only");
    CHECK(CreateValidator("dependency", crypto, 10)->name() == "dependency");
    CHECK(CreateValidator("signed-dependency", crypto, 10)->name() ==
          "signed(dependency)");
    CHECK(CreateValidator("signed-dependency", nullptr, 10) == nullptr);
    CHECK(CreateValidator("nonsense", crypto, 10) == nullptr);
}
