#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "latchkey/service/remember_me_store.hpp"
#include "latchkey/service/user_repository.hpp"

using namespace latchkey::service;
using latchkey::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace {

const TimePoint kT0 = TimePoint{} + std::chrono::hours(24 * 365 * 50);

NewRememberMeRecord makeRecord(uint64_t user, std::string hash, TimePoint issuedAt = kT0,
                               std::chrono::seconds lifetime = 3600s) {
    NewRememberMeRecord record;
    record.userId = UserId(user);
    record.tokenHash = std::move(hash);
    record.issuedAt = issuedAt;
    record.expiresAt = issuedAt + lifetime;
    return record;
}

} // namespace

// =============================================================================
// InMemoryRememberMeStore
// =============================================================================

class InMemoryRememberMeStoreTest : public ::testing::Test {
protected:
    InMemoryRememberMeStore store_;
};

TEST_F(InMemoryRememberMeStoreTest, InsertAssignsDistinctIds) {
    auto a = store_.insert(makeRecord(1, "hash-a"));
    auto b = store_.insert(makeRecord(1, "hash-b"));
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_TRUE(a.value().isValid());
    EXPECT_NE(a.value(), b.value());
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(InMemoryRememberMeStoreTest, DuplicateDigestRejected) {
    ASSERT_TRUE(store_.insert(makeRecord(1, "same")).hasValue());
    auto dup = store_.insert(makeRecord(2, "same"));
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(InMemoryRememberMeStoreTest, FindByHashReturnsStoredFields) {
    auto record = makeRecord(7, "digest");
    record.deviceName = "Work laptop";
    record.userAgent = "Mozilla/5.0";
    record.ipAddress = "198.51.100.4";
    auto id = store_.insert(record);
    ASSERT_TRUE(id.hasValue());

    auto found = store_.findByHash("digest");
    ASSERT_TRUE(found.hasValue());
    ASSERT_TRUE(found.value().has_value());
    const auto& stored = *found.value();
    EXPECT_EQ(stored.id, id.value());
    EXPECT_EQ(stored.userId, UserId(7));
    EXPECT_EQ(stored.issuedAt, kT0);
    EXPECT_EQ(stored.expiresAt, kT0 + 3600s);
    EXPECT_FALSE(stored.lastUsedAt.has_value());
    EXPECT_EQ(stored.deviceName, "Work laptop");
    EXPECT_EQ(stored.userAgent, "Mozilla/5.0");
    EXPECT_EQ(stored.ipAddress, "198.51.100.4");
}

TEST_F(InMemoryRememberMeStoreTest, FindUnknownIsEmpty) {
    auto found = store_.findByHash("nope");
    ASSERT_TRUE(found.hasValue());
    EXPECT_FALSE(found.value().has_value());
}

TEST_F(InMemoryRememberMeStoreTest, TouchUpdatesLastUsed) {
    ASSERT_TRUE(store_.insert(makeRecord(1, "h")).hasValue());
    ASSERT_TRUE(store_.touchLastUsed("h", kT0 + 5s).hasValue());
    EXPECT_EQ(store_.findByHash("h").value()->lastUsedAt, kT0 + 5s);

    EXPECT_TRUE(store_.touchLastUsed("missing", kT0).hasValue());
}

TEST_F(InMemoryRememberMeStoreTest, DeleteIsIdempotent) {
    ASSERT_TRUE(store_.insert(makeRecord(1, "h")).hasValue());
    EXPECT_TRUE(store_.deleteByHash("h").hasValue());
    EXPECT_TRUE(store_.deleteByHash("h").hasValue());
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(InMemoryRememberMeStoreTest, DeleteAllForUserLeavesOthers) {
    ASSERT_TRUE(store_.insert(makeRecord(1, "u1-a")).hasValue());
    ASSERT_TRUE(store_.insert(makeRecord(1, "u1-b")).hasValue());
    ASSERT_TRUE(store_.insert(makeRecord(2, "u2-a")).hasValue());

    ASSERT_TRUE(store_.deleteAllForUser(UserId(1), kT0 + 1s).hasValue());
    EXPECT_TRUE(store_.listForUser(UserId(1)).value().empty());
    EXPECT_EQ(store_.listForUser(UserId(2)).value().size(), 1u);
    EXPECT_EQ(store_.revocationEpoch(UserId(1)).value(), kT0 + 1s);
    EXPECT_FALSE(store_.revocationEpoch(UserId(2)).value().has_value());
}

TEST_F(InMemoryRememberMeStoreTest, EpochNeverMovesBackwards) {
    ASSERT_TRUE(store_.deleteAllForUser(UserId(1), kT0 + 10s).hasValue());
    ASSERT_TRUE(store_.deleteAllForUser(UserId(1), kT0 + 5s).hasValue());
    EXPECT_EQ(store_.revocationEpoch(UserId(1)).value(), kT0 + 10s);

    ASSERT_TRUE(store_.deleteAllForUser(UserId(1), kT0 + 20s).hasValue());
    EXPECT_EQ(store_.revocationEpoch(UserId(1)).value(), kT0 + 20s);
}

TEST_F(InMemoryRememberMeStoreTest, PurgeRemovesExpiredAndEpochRevoked) {
    ASSERT_TRUE(store_.insert(makeRecord(1, "expired", kT0, 10s)).hasValue());
    ASSERT_TRUE(store_.insert(makeRecord(1, "live", kT0, 3600s)).hasValue());
    ASSERT_TRUE(store_.deleteAllForUser(UserId(2), kT0 + 1s).hasValue());
    // Arrived after the epoch was written but issued before it.
    ASSERT_TRUE(store_.insert(makeRecord(2, "late", kT0, 3600s)).hasValue());
    ASSERT_TRUE(store_.insert(makeRecord(2, "after", kT0 + 2s, 3600s)).hasValue());

    // A record is still live at exactly its expiresAt.
    auto atBoundary = store_.purgeExpired(kT0 + 10s);
    ASSERT_TRUE(atBoundary.hasValue());
    EXPECT_EQ(atBoundary.value(), 1u);
    EXPECT_TRUE(store_.findByHash("expired").value().has_value());

    auto removed = store_.purgeExpired(kT0 + 11s);
    ASSERT_TRUE(removed.hasValue());
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_FALSE(store_.findByHash("expired").value().has_value());
    EXPECT_FALSE(store_.findByHash("late").value().has_value());
    EXPECT_TRUE(store_.findByHash("live").value().has_value());
    EXPECT_TRUE(store_.findByHash("after").value().has_value());
}

TEST_F(InMemoryRememberMeStoreTest, ConcurrentInsertsAllLand) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto hash = std::to_string(t) + "-" + std::to_string(i);
                (void)store_.insert(makeRecord(1, hash));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(store_.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

// =============================================================================
// InMemoryUserRepository
// =============================================================================

TEST(InMemoryUserRepositoryTest, AddFindRemove) {
    InMemoryUserRepository users;
    users.add({UserId(5), "Grace", "grace@example.com"});

    auto found = users.findById(UserId(5));
    ASSERT_TRUE(found.hasValue());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->email, "grace@example.com");

    EXPECT_TRUE(users.remove(UserId(5)));
    EXPECT_FALSE(users.remove(UserId(5)));
    EXPECT_FALSE(users.findById(UserId(5)).value().has_value());
}
