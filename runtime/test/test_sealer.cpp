#include "Sealer.h"
#include "Executor.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <random>
#include <thread>
#include <utility>

using namespace tally;

namespace {

RuntimeConfig configWith(uint32_t difficulty, uint64_t maxAttempts = 0) {
    RuntimeConfig config;
    config.difficulty = difficulty;
    config.maxSealAttempts = maxAttempts;
    return config;
}

UnsealedBlock randomBlock(std::mt19937_64& rng) {
    UnsealedBlock block;
    Hash256 parent;
    for (auto& byte : parent) {
        byte = static_cast<uint8_t>(rng());
    }
    block.parentId = parent;
    size_t count = rng() % 4;
    for (size_t i = 0; i < count; ++i) {
        uint128 magnitude = (static_cast<uint128>(rng()) << 64) | rng();
        block.operations.push_back(Operation::add(magnitude));
    }
    return block;
}

} // namespace

TEST(SealerTest, SealedBlocksMeetDifficulty) {
    std::mt19937_64 rng(20261019);
    const std::pair<uint32_t, int> samples[] = {{1u, 200}, {2u, 8}};
    for (const auto& [difficulty, count] : samples) {
        Sealer sealer(configWith(difficulty));
        Executor executor(configWith(difficulty));
        for (int i = 0; i < count; ++i) {
            UnsealedBlock unsealed = randomBlock(rng);
            auto parent = unsealed.parentId;
            auto ops = unsealed.operations;

            auto sealed = sealer.seal(std::move(unsealed));
            ASSERT_TRUE(sealed.isOk()) << sealed.error().message;
            EXPECT_TRUE(hash::hasLeadingZeroBytes(sealed->identity(), difficulty));
            EXPECT_TRUE(executor.meetsDifficulty(sealed.value()));
            EXPECT_EQ(sealed->getParentId(), parent);
            EXPECT_EQ(sealed->getOperations(), ops);
            EXPECT_EQ(sealer.getLastAttempts(), sealed->getNonce() + 1);
        }
    }
}

TEST(SealerTest, FindsFirstValidNonce) {
    std::mt19937_64 rng(7);
    UnsealedBlock unsealed = randomBlock(rng);

    Sealer sealer(configWith(1));
    auto sealed = sealer.seal(UnsealedBlock(unsealed));
    ASSERT_TRUE(sealed.isOk());

    // No smaller nonce qualifies
    for (uint64_t nonce = 0; nonce < sealed->getNonce(); ++nonce) {
        Block earlier(unsealed.parentId, unsealed.operations, nonce);
        EXPECT_FALSE(hash::hasLeadingZeroBytes(earlier.identity(), 1)) << nonce;
    }

    // Same input, same result
    auto again = sealer.seal(UnsealedBlock(unsealed));
    ASSERT_TRUE(again.isOk());
    EXPECT_EQ(again->getNonce(), sealed->getNonce());
}

TEST(SealerTest, ZeroDifficultyTakesNonceZero) {
    Sealer sealer(configWith(0));
    UnsealedBlock unsealed;
    unsealed.parentId = Block::genesis().identity();
    unsealed.operations.push_back(Operation::add(1));

    auto sealed = sealer.seal(std::move(unsealed));
    ASSERT_TRUE(sealed.isOk());
    EXPECT_EQ(sealed->getNonce(), 0u);
    EXPECT_EQ(sealer.getLastAttempts(), 1u);
}

TEST(SealerTest, StopFlagCancels) {
    // Full-digest difficulty is never met in practice
    Sealer sealer(configWith(RuntimeConfig::MAX_DIFFICULTY));
    std::atomic<bool> stop{true};

    auto sealed = sealer.seal(UnsealedBlock(), &stop);
    ASSERT_TRUE(sealed.isError());
    EXPECT_EQ(sealed.error().code, RuntimeError::E_CANCELLED);
    EXPECT_EQ(sealer.getLastAttempts(), 0u);
}

TEST(SealerTest, StopFlagCancelsFromAnotherThread) {
    Sealer sealer(configWith(RuntimeConfig::MAX_DIFFICULTY));
    std::atomic<bool> stop{false};

    std::thread stopper([&stop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop = true;
    });
    auto sealed = sealer.seal(UnsealedBlock(), &stop);
    stopper.join();

    ASSERT_TRUE(sealed.isError());
    EXPECT_EQ(sealed.error().code, RuntimeError::E_CANCELLED);
    EXPECT_GT(sealer.getLastAttempts(), 0u);
}

TEST(SealerTest, AttemptLimitExhausts) {
    Sealer sealer(configWith(RuntimeConfig::MAX_DIFFICULTY, 100));

    auto sealed = sealer.seal(UnsealedBlock());
    ASSERT_TRUE(sealed.isError());
    EXPECT_EQ(sealed.error().code, RuntimeError::E_EXHAUSTED);
    EXPECT_EQ(sealer.getLastAttempts(), 100u);
}

TEST(SealerTest, UnsetStopFlagDoesNotInterfere) {
    Sealer sealer(configWith(1));
    std::atomic<bool> stop{false};

    auto sealed = sealer.seal(UnsealedBlock(), &stop);
    ASSERT_TRUE(sealed.isOk()) << sealed.error().message;
    EXPECT_TRUE(sealed->isRoot());
    EXPECT_TRUE(hash::hasLeadingZeroBytes(sealed->identity(), 1));
}

TEST(SealerTest, InvalidConfigIsRefused) {
    // Unbounded attempts at an unreachable target would never return
    Sealer sealer(configWith(RuntimeConfig::MAX_DIFFICULTY + 1));

    auto sealed = sealer.seal(UnsealedBlock());
    ASSERT_TRUE(sealed.isError());
    EXPECT_EQ(sealed.error().code, RuntimeError::E_INVALID_CONFIG);
    EXPECT_EQ(sealer.getLastAttempts(), 0u);
}
