#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "latchkey/foundation/auth_logger.hpp"
#include "latchkey/http/http_types.hpp"
#include "latchkey/security/crypto_primitives.hpp"
#include "latchkey/service/remember_me_service.hpp"
#include "latchkey/service/remember_me_store.hpp"
#include "latchkey/service/user_repository.hpp"

#include "support/test_doubles.hpp"

using namespace latchkey::service;
using latchkey::foundation::ErrorCode;
using latchkey::foundation::LogCategory;
using latchkey::foundation::LogLevel;
using latchkey::http::HttpRequest;
using latchkey::http::HttpResponse;
using latchkey::test_support::FailingRememberMeStore;
using latchkey::test_support::ManualClock;
using latchkey::test_support::MockLogger;
using namespace std::chrono_literals;

namespace crypto = latchkey::security::crypto;

namespace {

constexpr std::chrono::seconds kThirtyDays{2592000};

HttpRequest loginRequest() {
    HttpRequest request;
    request.setMethod("POST").setPath("/login");
    request.setHeader("User-Agent", "Mozilla/5.0 (X11; Linux x86_64)");
    request.setRemoteAddress("10.0.0.1");
    return request;
}

} // namespace

// =============================================================================
// Test fixture
// =============================================================================

class RememberMeServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockLogger_ = latchkey::test_support::installMockLogger();
        store_ = std::make_shared<FailingRememberMeStore>();
        users_ = std::make_shared<InMemoryUserRepository>();
        users_->add({UserId(1), "Ada", "ada@example.com"});
        users_->add({UserId(2), "Linus", "linus@example.com"});
        service_ = std::make_unique<RememberMeService>(RememberMeConfig{}, store_, users_,
                                                       clock_.source());
    }

    void TearDown() override {
        latchkey::foundation::AuthLogger::instance().setCategoryLevel(LogCategory::RememberMe,
                                                                      LogLevel::Info);
        latchkey::test_support::uninstallMockLogger();
    }

    /// Issue a token and assert success (keeps nodiscard results checked).
    std::string login(uint64_t user, std::optional<std::string> device = std::nullopt) {
        auto token = service_->create(UserId(user), loginRequest(), std::move(device));
        EXPECT_TRUE(token.hasValue());
        return token.hasValue() ? token.value() : std::string();
    }

    std::optional<RememberMeRecord> stored(const std::string& rawToken) const {
        auto found = store_->findByHash(crypto::hash(rawToken));
        EXPECT_TRUE(found.hasValue());
        return found.hasValue() ? found.value() : std::nullopt;
    }

    ManualClock clock_;
    std::shared_ptr<MockLogger> mockLogger_;
    std::shared_ptr<FailingRememberMeStore> store_;
    std::shared_ptr<InMemoryUserRepository> users_;
    std::unique_ptr<RememberMeService> service_;
};

// =============================================================================
// Issuance
// =============================================================================

TEST_F(RememberMeServiceTest, CreateStoresDigestNotRawToken) {
    auto token = login(1, "Work laptop");
    EXPECT_EQ(token.size(), 64u);

    auto record = stored(token);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->tokenHash, crypto::hash(token));
    EXPECT_NE(record->tokenHash, token);
    EXPECT_EQ(record->userId, UserId(1));
    EXPECT_EQ(record->issuedAt, clock_.now());
    EXPECT_EQ(record->expiresAt, clock_.now() + kThirtyDays);
    EXPECT_EQ(record->deviceName, "Work laptop");
    EXPECT_EQ(record->userAgent, "Mozilla/5.0 (X11; Linux x86_64)");
    EXPECT_EQ(record->ipAddress, "10.0.0.1");
    EXPECT_FALSE(record->lastUsedAt.has_value());
}

TEST_F(RememberMeServiceTest, EachLoginGetsItsOwnToken) {
    auto a = login(1);
    auto b = login(1);
    EXPECT_NE(a, b);
    EXPECT_EQ(store_->size(), 2u);
}

TEST_F(RememberMeServiceTest, CreateRejectsInvalidUser) {
    auto token = service_->create(UserId(), loginRequest());
    ASSERT_TRUE(token.hasError());
    EXPECT_EQ(token.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(RememberMeServiceTest, CreateRejectsUnrepresentableLifetime) {
    RememberMeConfig config;
    config.tokenLifetime = std::chrono::hours(24 * 110000);
    RememberMeService service(config, store_, users_, clock_.source());

    auto token = service.create(UserId(1), loginRequest());
    ASSERT_TRUE(token.hasError());
    EXPECT_EQ(token.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(RememberMeServiceTest, CreateRejectsNonPositiveLifetime) {
    RememberMeConfig config;
    config.tokenLifetime = std::chrono::seconds::zero();
    RememberMeService service(config, store_, users_, clock_.source());

    auto token = service.create(UserId(1), loginRequest());
    ASSERT_TRUE(token.hasError());
    EXPECT_EQ(token.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(RememberMeServiceTest, TenYearLifetimeVerifiesImmediately) {
    RememberMeConfig config;
    config.tokenLifetime = std::chrono::hours(24 * RememberMeConfig::kMaxLifetimeDays);
    RememberMeService service(config, store_, users_, clock_.source());

    auto token = service.create(UserId(1), loginRequest());
    ASSERT_TRUE(token.hasValue());
    auto record = stored(token.value());
    ASSERT_TRUE(record.has_value());
    EXPECT_GT(record->expiresAt, record->issuedAt);
    EXPECT_TRUE(service.verify(token.value()).has_value());
}

TEST_F(RememberMeServiceTest, ClientAddressPrefersFirstForwardedEntry) {
    auto request = loginRequest();
    request.setHeader("X-Forwarded-For", " 203.0.113.7 , 10.0.0.2");
    auto token = service_->create(UserId(1), request);
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(stored(token.value())->ipAddress, "203.0.113.7");
}

TEST_F(RememberMeServiceTest, ClientAddressFallsBackToUnknown) {
    HttpRequest request;
    auto token = service_->create(UserId(1), request);
    ASSERT_TRUE(token.hasValue());
    auto record = stored(token.value());
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->ipAddress, "unknown");
    EXPECT_FALSE(record->userAgent.has_value());
}

TEST_F(RememberMeServiceTest, OversizeForwardedForFallsBackToPeer) {
    auto request = loginRequest();
    request.setHeader("X-Forwarded-For", std::string(100, 'a') + ", 10.0.0.2");
    auto token = service_->create(UserId(1), request);
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(stored(token.value())->ipAddress, "10.0.0.1");
}

TEST_F(RememberMeServiceTest, NonAddressForwardedForFallsBackToPeer) {
    auto request = loginRequest();
    request.setHeader("X-Forwarded-For", "<script>alert(1)</script>");
    auto token = service_->create(UserId(1), request);
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(stored(token.value())->ipAddress, "10.0.0.1");
}

TEST_F(RememberMeServiceTest, ForwardedIpv6AddressKept) {
    auto request = loginRequest();
    request.setHeader("X-Forwarded-For", "2001:db8::1");
    auto token = service_->create(UserId(1), request);
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(stored(token.value())->ipAddress, "2001:db8::1");
}

TEST_F(RememberMeServiceTest, LongDeviceNameTruncated) {
    auto token = login(1, std::string(300, 'd'));
    auto record = stored(token);
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->deviceName.has_value());
    EXPECT_EQ(*record->deviceName, std::string(kMaxDeviceNameLength, 'd'));
}

TEST_F(RememberMeServiceTest, DeviceNameTruncatedOnCodePointBoundary) {
    std::string name;
    for (int i = 0; i < 150; ++i) {
        name += "\xC3\xA9";  // U+00E9, two bytes
    }
    auto token = login(1, name);
    auto record = stored(token);
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->deviceName.has_value());
    EXPECT_EQ(*record->deviceName, name);

    std::string longer = name + name;
    auto second = login(1, longer);
    auto truncated = stored(second)->deviceName;
    ASSERT_TRUE(truncated.has_value());
    EXPECT_EQ(truncated->size(), kMaxDeviceNameLength * 2);
    EXPECT_EQ(*truncated, longer.substr(0, kMaxDeviceNameLength * 2));
}

TEST_F(RememberMeServiceTest, EmptyDeviceNameIsNotStored) {
    auto token = login(1, "");
    EXPECT_FALSE(stored(token)->deviceName.has_value());
}

TEST_F(RememberMeServiceTest, CreatePropagatesStoreFailure) {
    store_->failInsert = true;

    HttpResponse response;
    auto token = service_->create(UserId(1), loginRequest());
    if (token.hasValue()) {
        service_->bindCookie(response, token.value());
    }
    ASSERT_TRUE(token.hasError());
    EXPECT_EQ(token.error().code(), ErrorCode::PersistenceWriteFailed);
    EXPECT_TRUE(response.setCookies().empty());
}

// =============================================================================
// Cookie transport
// =============================================================================

TEST_F(RememberMeServiceTest, BindCookieUsesLifetimeAsMaxAge) {
    HttpResponse response;
    service_->bindCookie(response, "rawtoken");
    auto cookies = response.setCookies();
    ASSERT_EQ(cookies.size(), 1u);
    EXPECT_EQ(cookies[0],
              "remember_me_token=rawtoken; Path=/; Max-Age=2592000; HttpOnly; Secure; SameSite=Strict");
}

TEST_F(RememberMeServiceTest, ClearCookieMatchesBindAttributes) {
    HttpResponse response;
    service_->clearCookie(response);
    auto cookies = response.setCookies();
    ASSERT_EQ(cookies.size(), 1u);
    EXPECT_EQ(cookies[0],
              "remember_me_token=; Path=/; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT; "
              "HttpOnly; Secure; SameSite=Strict");
}

TEST_F(RememberMeServiceTest, TokenFromRequest) {
    HttpRequest none;
    EXPECT_FALSE(service_->tokenFromRequest(none).has_value());

    HttpRequest empty;
    empty.addCookie("remember_me_token", "");
    EXPECT_FALSE(service_->tokenFromRequest(empty).has_value());

    HttpRequest present;
    present.addCookie("theme", "dark").addCookie("remember_me_token", "abc");
    EXPECT_EQ(service_->tokenFromRequest(present), "abc");
}

// =============================================================================
// Verification
// =============================================================================

TEST_F(RememberMeServiceTest, VerifyReturnsUserAndTouchesLastUsed) {
    auto token = login(1);
    clock_.advance(5min);

    auto user = service_->verify(token);
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->id, UserId(1));
    EXPECT_EQ(user->displayName, "Ada");
    EXPECT_EQ(stored(token)->lastUsedAt, clock_.now());
}

TEST_F(RememberMeServiceTest, VerifyIsRepeatable) {
    auto token = login(1);
    EXPECT_TRUE(service_->verify(token).has_value());
    clock_.advance(1h);
    EXPECT_TRUE(service_->verify(token).has_value());
    EXPECT_EQ(store_->touchCalls, 2u);
}

TEST_F(RememberMeServiceTest, VerifyUnknownOrEmptyToken) {
    EXPECT_FALSE(service_->verify("").has_value());
    EXPECT_FALSE(service_->verify(crypto::generateToken()).has_value());
    EXPECT_FALSE(service_->verify("not even hex").has_value());
}

TEST_F(RememberMeServiceTest, TokenStillValidAtExpiresAt) {
    auto token = login(1);
    clock_.advance(kThirtyDays);
    ASSERT_EQ(clock_.now(), stored(token)->expiresAt);

    EXPECT_TRUE(service_->verify(token).has_value());
    EXPECT_TRUE(stored(token).has_value());
}

TEST_F(RememberMeServiceTest, ExpiredTokenRejectedAndDeleted) {
    auto token = login(1);
    clock_.advance(kThirtyDays + 1s);
    EXPECT_FALSE(service_->verify(token).has_value());
    EXPECT_FALSE(stored(token).has_value());
}

TEST_F(RememberMeServiceTest, MissingUserYieldsAnonymous) {
    auto token = login(1);
    ASSERT_TRUE(users_->remove(UserId(1)));
    EXPECT_FALSE(service_->verify(token).has_value());
}

TEST_F(RememberMeServiceTest, StoreReadFailureYieldsAnonymous) {
    auto token = login(1);
    store_->failFind = true;

    EXPECT_FALSE(service_->verify(token).has_value());

    auto detailed = service_->tryVerify(token);
    ASSERT_TRUE(detailed.hasError());
    EXPECT_EQ(detailed.error().code(), ErrorCode::PersistenceTimeout);
}

TEST_F(RememberMeServiceTest, NonStandardExceptionYieldsAnonymous) {
    auto token = login(1);
    store_->throwHostFaultOnFind = true;

    std::optional<UserRecord> user;
    EXPECT_NO_THROW(user = service_->verify(token));
    EXPECT_FALSE(user.has_value());
    EXPECT_TRUE(mockLogger_->contains("non-standard exception"));
}

TEST_F(RememberMeServiceTest, EpochReadFailureYieldsAnonymous) {
    auto token = login(1);
    store_->failEpoch = true;
    EXPECT_FALSE(service_->verify(token).has_value());
}

TEST_F(RememberMeServiceTest, TouchFailureStillVerifies) {
    auto token = login(1);
    store_->failTouch = true;

    auto user = service_->verify(token);
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->id, UserId(1));
    EXPECT_EQ(store_->touchCalls, 1u);
    EXPECT_FALSE(stored(token)->lastUsedAt.has_value());
}

// =============================================================================
// Lifecycle classification
// =============================================================================

TEST(RememberMeClassifyTest, States) {
    const TimePoint t0 = TimePoint{} + std::chrono::hours(1000);
    RememberMeRecord record;
    record.issuedAt = t0;
    record.expiresAt = t0 + 1h;

    EXPECT_EQ(RememberMeService::classify(record, t0, std::nullopt), TokenState::Active);
    EXPECT_EQ(RememberMeService::classify(record, t0 + 1h, std::nullopt), TokenState::Active);
    EXPECT_EQ(RememberMeService::classify(record, t0 + 1h + 1ns, std::nullopt),
              TokenState::Expired);
    EXPECT_EQ(RememberMeService::classify(record, t0, t0), TokenState::Active);
    EXPECT_EQ(RememberMeService::classify(record, t0, t0 + 1s), TokenState::Revoked);
    EXPECT_EQ(RememberMeService::classify(record, t0 + 2h, t0 + 1s), TokenState::Expired);
}

TEST(RememberMeClassifyTest, StateNames) {
    EXPECT_EQ(tokenStateName(TokenState::Active), "Active");
    EXPECT_EQ(tokenStateName(TokenState::Expired), "Expired");
    EXPECT_EQ(tokenStateName(TokenState::Revoked), "Revoked");
}

// =============================================================================
// Revocation
// =============================================================================

TEST_F(RememberMeServiceTest, RevokeIsIdempotent) {
    auto token = login(1);
    EXPECT_TRUE(service_->revoke(token).hasValue());
    EXPECT_FALSE(service_->verify(token).has_value());
    EXPECT_TRUE(service_->revoke(token).hasValue());
    EXPECT_TRUE(service_->revoke("").hasValue());
    EXPECT_TRUE(service_->revoke(crypto::generateToken()).hasValue());
}

TEST_F(RememberMeServiceTest, RevokeLeavesOtherTokens) {
    auto phone = login(1);
    auto laptop = login(1);
    ASSERT_TRUE(service_->revoke(phone).hasValue());
    EXPECT_TRUE(service_->verify(laptop).has_value());
}

TEST_F(RememberMeServiceTest, RevokeReportsStoreFailure) {
    auto token = login(1);
    store_->failDelete = true;
    auto result = service_->revoke(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::PersistenceWriteFailed);
}

TEST_F(RememberMeServiceTest, RevokeAllOnlyAffectsThatUser) {
    auto a1 = login(1);
    auto a2 = login(1);
    auto b1 = login(2);
    clock_.advance(1s);

    ASSERT_TRUE(service_->revokeAllForUser(UserId(1)).hasValue());
    EXPECT_FALSE(service_->verify(a1).has_value());
    EXPECT_FALSE(service_->verify(a2).has_value());
    EXPECT_TRUE(service_->verify(b1).has_value());
}

TEST_F(RememberMeServiceTest, LoginAfterRevokeAllWorks) {
    (void)login(1);
    ASSERT_TRUE(service_->revokeAllForUser(UserId(1)).hasValue());

    // Same instant as the epoch: not issued before it.
    auto sameInstant = login(1);
    EXPECT_TRUE(service_->verify(sameInstant).has_value());

    clock_.advance(1s);
    auto later = login(1);
    EXPECT_TRUE(service_->verify(later).has_value());
}

TEST_F(RememberMeServiceTest, LateInsertBeforeEpochIsRevoked) {
    clock_.advance(1min);
    ASSERT_TRUE(service_->revokeAllForUser(UserId(1)).hasValue());

    // A write that raced the revocation lands afterwards with an older issuedAt.
    auto raw = crypto::generateToken();
    NewRememberMeRecord straggler;
    straggler.userId = UserId(1);
    straggler.tokenHash = crypto::hash(raw);
    straggler.issuedAt = clock_.now() - 1s;
    straggler.expiresAt = straggler.issuedAt + kThirtyDays;
    ASSERT_TRUE(store_->insert(straggler).hasValue());

    EXPECT_FALSE(service_->verify(raw).has_value());
    EXPECT_FALSE(stored(raw).has_value());
}

TEST_F(RememberMeServiceTest, RevokeAllReportsStoreFailure) {
    (void)login(1);
    store_->failDeleteAll = true;
    auto result = service_->revokeAllForUser(UserId(1));
    ASSERT_TRUE(result.hasError());
    EXPECT_TRUE(result.error().isPersistenceError());
}

// =============================================================================
// Device management
// =============================================================================

TEST_F(RememberMeServiceTest, ListActiveTokensOrderedByLastUse) {
    auto a = login(1, "Phone");
    clock_.advance(1s);
    auto b = login(1, "Laptop");
    clock_.advance(1s);
    (void)login(1);
    (void)login(2, "Someone else");

    clock_.advance(10s);
    ASSERT_TRUE(service_->verify(a).has_value());
    clock_.advance(10s);
    ASSERT_TRUE(service_->verify(b).has_value());

    auto listed = service_->listActiveTokens(UserId(1));
    ASSERT_TRUE(listed.hasValue());
    const auto& tokens = listed.value();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].deviceName, "Laptop");
    EXPECT_EQ(tokens[1].deviceName, "Phone");
    EXPECT_EQ(tokens[2].deviceName, "Unknown Device");
    EXPECT_FALSE(tokens[2].lastUsedAt.has_value());
    EXPECT_EQ(tokens[0].lastUsedAt, clock_.now());
    EXPECT_EQ(tokens[0].ipAddress, "10.0.0.1");
}

TEST_F(RememberMeServiceTest, ListExcludesExpiredTokens) {
    (void)login(1, "Old");
    clock_.advance(kThirtyDays - 1h);
    (void)login(1, "New");
    clock_.advance(2h);

    auto listed = service_->listActiveTokens(UserId(1));
    ASSERT_TRUE(listed.hasValue());
    ASSERT_EQ(listed.value().size(), 1u);
    EXPECT_EQ(listed.value()[0].deviceName, "New");
}

TEST_F(RememberMeServiceTest, ListReportsStoreFailure) {
    store_->failList = true;
    auto listed = service_->listActiveTokens(UserId(1));
    ASSERT_TRUE(listed.hasError());
    EXPECT_TRUE(listed.error().isPersistenceError());
}

TEST_F(RememberMeServiceTest, RevokeTokenByIdForOwner) {
    auto phone = login(1, "Phone");
    auto laptop = login(1, "Laptop");
    auto phoneId = stored(phone)->id;

    ASSERT_TRUE(service_->revokeTokenById(UserId(1), phoneId).hasValue());
    EXPECT_FALSE(service_->verify(phone).has_value());
    EXPECT_TRUE(service_->verify(laptop).has_value());
}

TEST_F(RememberMeServiceTest, RevokeTokenByIdRejectsOtherUsersToken) {
    auto victim = login(2);
    auto victimId = stored(victim)->id;

    auto result = service_->revokeTokenById(UserId(1), victimId);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    EXPECT_TRUE(service_->verify(victim).has_value());

    auto unknown = service_->revokeTokenById(UserId(1), TokenId(9999));
    ASSERT_TRUE(unknown.hasError());
    EXPECT_EQ(unknown.error().code(), ErrorCode::NotFound);
}

TEST_F(RememberMeServiceTest, PurgeExpiredRemovesDeadRows) {
    (void)login(1);
    (void)login(2);
    clock_.advance(kThirtyDays - 1s);
    (void)login(2);
    clock_.advance(1s);

    auto atBoundary = service_->purgeExpired();
    ASSERT_TRUE(atBoundary.hasValue());
    EXPECT_EQ(atBoundary.value(), 0u);

    clock_.advance(1s);
    auto removed = service_->purgeExpired();
    ASSERT_TRUE(removed.hasValue());
    EXPECT_EQ(removed.value(), 2u);
    EXPECT_EQ(store_->size(), 1u);
}

// =============================================================================
// Log hygiene
// =============================================================================

TEST_F(RememberMeServiceTest, RawTokenAndFullDigestNeverLogged) {
    latchkey::foundation::AuthLogger::instance().setCategoryLevel(LogCategory::RememberMe,
                                                                  LogLevel::Trace);
    auto token = login(1);
    ASSERT_TRUE(service_->verify(token).has_value());
    clock_.advance(kThirtyDays + 1s);
    EXPECT_FALSE(service_->verify(token).has_value());
    ASSERT_TRUE(service_->revoke(token).hasValue());
    ASSERT_TRUE(service_->revokeAllForUser(UserId(1)).hasValue());

    auto digest = crypto::hash(token);
    EXPECT_FALSE(mockLogger_->records().empty());
    EXPECT_FALSE(mockLogger_->contains(token));
    EXPECT_FALSE(mockLogger_->contains(digest));
    EXPECT_TRUE(mockLogger_->contains(digest.substr(0, 8) + "..."));
    EXPECT_TRUE(mockLogger_->contains("user_id=1"));
}
