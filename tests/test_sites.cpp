/**
 * @file test_sites.cpp
 * @brief Unit tests for host classification, resolvers and robots.txt
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include "sites/BunkrHandler.hpp"
#include "sites/CyberdropHandler.hpp"
#include "sites/RobotsPolicy.hpp"
#include "sites/SiteRegistry.hpp"

#include <atomic>
#include <thread>

namespace lockerfetch::test {

using sites::BunkrHandler;
using sites::CyberdropHandler;
using sites::HostKind;
using sites::RobotsRules;
using sites::RobotsTxtPolicy;
using sites::SiteRegistry;
using sites::hostKindFor;

// ============================================================================
// Host classification and registry
// ============================================================================

TEST(HostKindTest, ClassifiesByHostLabels) {
    EXPECT_EQ(hostKindFor("https://bunkr.sk/f/abc"), HostKind::Bunkr);
    EXPECT_EQ(hostKindFor("https://bunkrr.su/a/album"), HostKind::Bunkr);
    EXPECT_EQ(hostKindFor("https://i-burger.bunkr.ru/file.mp4"), HostKind::Bunkr);
    EXPECT_EQ(hostKindFor("cyberdrop.me/f/abc"), HostKind::Cyberdrop);
    EXPECT_EQ(hostKindFor("https://fs-01.cyberdrop.cc/file.mp4"), HostKind::Cyberdrop);
    EXPECT_EQ(hostKindFor("https://example.com/bunkr/f/abc"), HostKind::Unknown);
    EXPECT_EQ(hostKindFor(""), HostKind::Unknown);
}

TEST(SiteRegistryTest, DefaultRegistryHasBothHosts) {
    FakeHttpTransport transport;
    core::EngineConfig config = fast_config();
    auto registry = SiteRegistry::createDefault(transport, config);

    EXPECT_EQ(registry->size(), 2u);
    ASSERT_NE(registry->handlerFor("https://bunkr.la/f/x"), nullptr);
    EXPECT_EQ(registry->handlerFor("https://bunkr.la/f/x")->kind(), HostKind::Bunkr);
    EXPECT_EQ(registry->handlerFor("https://cyberdrop.me/f/x")->kind(), HostKind::Cyberdrop);
}

TEST(SiteRegistryTest, UnknownHostsFallBackToBunkr) {
    FakeHttpTransport transport;
    core::EngineConfig config = fast_config();
    auto registry = SiteRegistry::createDefault(transport, config);

    ASSERT_NE(registry->handlerFor("https://mirror.example.org/f/x"), nullptr);
    EXPECT_EQ(registry->handlerFor("https://mirror.example.org/f/x")->kind(), HostKind::Bunkr);

    SiteRegistry empty;
    EXPECT_EQ(empty.handlerFor("https://bunkr.sk/f/x"), nullptr);
}

// ============================================================================
// Bunkr
// ============================================================================

class BunkrHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = fast_config();
        handler_ = std::make_unique<BunkrHandler>(transport_, config_);
    }

    core::EngineConfig config_;
    FakeHttpTransport transport_;
    std::unique_ptr<BunkrHandler> handler_;
};

TEST_F(BunkrHandlerTest, ExtractsSlug) {
    EXPECT_EQ(BunkrHandler::extractSlug("https://bunkr.cr/f/abc123").value_or(""), "abc123");
    EXPECT_EQ(BunkrHandler::extractSlug("/f/xyz/").value_or(""), "xyz");
    EXPECT_EQ(BunkrHandler::extractSlug("bunkr.sk/f/Clip-01").value_or(""), "Clip-01");
    EXPECT_FALSE(BunkrHandler::extractSlug("https://bunkr.cr/a/album").has_value());
    EXPECT_FALSE(BunkrHandler::extractSlug("https://bunkr.cr/f/").has_value());
}

TEST_F(BunkrHandlerTest, ResolvesDirectUrl) {
    transport_.script({FakeReply::ok(R"({"url":"https://cdn9.bunkr.ru/abc123.mp4","encrypted":false})")});

    auto resolved = handler_->resolve("https://bunkr.sk/f/abc123");

    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->url, "https://cdn9.bunkr.ru/abc123.mp4");
    EXPECT_EQ(resolved->size, -1);

    auto requests = transport_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].url, "https://bunkr.cr/api/vs");
    EXPECT_EQ(requests[0].body, R"({"slug":"abc123"})");
    EXPECT_EQ(requests[0].options.userAgent, "TestAgent/1.0");
}

TEST_F(BunkrHandlerTest, EncryptedAnswerIsUnresolvable) {
    transport_.script({FakeReply::ok(R"({"url":"b64payload==","encrypted":true,"timestamp":1})")});
    EXPECT_FALSE(handler_->resolve("https://bunkr.sk/f/abc123").has_value());
}

TEST_F(BunkrHandlerTest, ApiFailuresAreUnresolvable) {
    transport_.script({FakeReply::status_only(403),
                       FakeReply::ok("<html>not json</html>"),
                       FakeReply::transport_failure(utils::TransportError::Timeout)});

    EXPECT_FALSE(handler_->resolve("https://bunkr.sk/f/a").has_value());
    EXPECT_FALSE(handler_->resolve("https://bunkr.sk/f/b").has_value());
    EXPECT_FALSE(handler_->resolve("https://bunkr.sk/f/c").has_value());
}

TEST_F(BunkrHandlerTest, UrlWithoutSlugSendsNoRequest) {
    EXPECT_FALSE(handler_->resolve("https://bunkr.sk/v/abc").has_value());
    EXPECT_EQ(transport_.request_count(), 0u);
}

TEST_F(BunkrHandlerTest, ParsesFilePageAsSingleFileAlbum) {
    auto album = handler_->parse("https://bunkr.sk/f/abc123");
    ASSERT_TRUE(album.has_value());
    EXPECT_TRUE(album->name.empty());
    ASSERT_EQ(album->files.size(), 1u);
    EXPECT_EQ(album->files[0].url, "https://bunkr.sk/f/abc123");

    EXPECT_FALSE(handler_->parse("https://bunkr.sk/a/album").has_value());
}

// ============================================================================
// Cyberdrop
// ============================================================================

TEST(CyberdropHandlerTest, UrlIsItsOwnDownloadLocation) {
    CyberdropHandler handler;
    auto resolved = handler.resolve("cyberdrop.me/f/clip.mp4");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->url, "https://cyberdrop.me/f/clip.mp4");
    EXPECT_FALSE(handler.resolve("  ").has_value());
}

TEST(CyberdropHandlerTest, ParsesFilePagesOnly) {
    CyberdropHandler handler;
    auto album = handler.parse("https://cyberdrop.me/f/clip.mp4");
    ASSERT_TRUE(album.has_value());
    ASSERT_EQ(album->files.size(), 1u);
    EXPECT_FALSE(handler.parse("https://cyberdrop.me/a/album").has_value());
    EXPECT_FALSE(handler.parse("https://cyberdrop.me/f/").has_value());
}

// ============================================================================
// robots.txt
// ============================================================================

TEST(RobotsRulesTest, LongestMatchWins) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /f/\n"
        "Allow: /f/public\n"
        "# comment\n"
        "Disallow:\n");

    EXPECT_TRUE(rules.allows("/", "AnyBot"));
    EXPECT_FALSE(rules.allows("/f/secret", "AnyBot"));
    EXPECT_TRUE(rules.allows("/f/public/clip.mp4", "AnyBot"));
}

TEST(RobotsRulesTest, AllowWinsTies) {
    auto rules = RobotsRules::parse("User-agent: *\nDisallow: /x\nAllow: /x\n");
    EXPECT_TRUE(rules.allows("/x/y", "bot"));
}

TEST(RobotsRulesTest, SpecificAgentGroupOverridesWildcard) {
    auto rules = RobotsRules::parse(
        "User-agent: *\n"
        "Disallow: /\n"
        "\n"
        "User-agent: GoodBot\n"
        "User-agent: OtherBot\n"
        "Disallow: /private\n");

    EXPECT_FALSE(rules.allows("/f/abc", "Mozilla/5.0"));
    EXPECT_TRUE(rules.allows("/f/abc", "Mozilla/5.0 (compatible; GoodBot/2.1)"));
    EXPECT_FALSE(rules.allows("/private/x", "otherbot"));
}

TEST(RobotsRulesTest, EmptyRulesAllowEverything) {
    EXPECT_TRUE(RobotsRules::parse("").allows("/anything", "bot"));
    EXPECT_TRUE(RobotsRules::allowAll().allows("/anything", "bot"));
    EXPECT_FALSE(RobotsRules::disallowAll().allows("/anything", "bot"));
}

TEST(RobotsTxtPolicyTest, FetchesOncePerOrigin) {
    FakeHttpTransport transport;
    transport.set_handler([](const RecordedRequest& request) {
        if (request.url == "https://bunkr.sk/robots.txt") {
            return FakeReply::ok("User-agent: *\nDisallow: /a/\n");
        }
        return FakeReply::status_only(404);
    });
    RobotsTxtPolicy policy(transport, utils::HttpOptions{});

    EXPECT_TRUE(policy.allowed("https://bunkr.sk/f/abc", "bot"));
    EXPECT_FALSE(policy.allowed("https://bunkr.sk/a/album?page=2", "bot"));
    EXPECT_TRUE(policy.allowed("https://cyberdrop.me/a/album", "bot"));

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].url, "https://bunkr.sk/robots.txt");
    EXPECT_EQ(requests[1].url, "https://cyberdrop.me/robots.txt");
}

TEST(RobotsTxtPolicyTest, SlowFetchDoesNotBlockCachedOrigins) {
    using namespace std::chrono_literals;

    std::atomic<bool> cached_answered{false};
    std::atomic<bool> slow_saw_answer{false};

    FakeHttpTransport transport;
    transport.set_handler([&](const RecordedRequest& request) {
        if (request.url == "https://cyberdrop.me/robots.txt") {
            auto deadline = std::chrono::steady_clock::now() + 2s;
            while (!cached_answered && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(5ms);
            }
            slow_saw_answer = cached_answered.load();
        }
        return FakeReply::ok("User-agent: *\nDisallow: /private/\n");
    });
    RobotsTxtPolicy policy(transport, utils::HttpOptions{});

    ASSERT_TRUE(policy.allowed("https://bunkr.sk/f/abc", "bot"));

    std::thread slow([&policy] { EXPECT_TRUE(policy.allowed("https://cyberdrop.me/f/abc", "bot")); });
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (transport.request_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_FALSE(policy.allowed("https://bunkr.sk/private/x", "bot"));
    cached_answered = true;
    slow.join();

    EXPECT_TRUE(slow_saw_answer);
    EXPECT_EQ(transport.request_count(), 2u);
}

TEST(RobotsTxtPolicyTest, ConcurrentChecksShareOneFetch) {
    FakeHttpTransport transport;
    transport.set_handler([](const RecordedRequest&) {
        FakeReply reply = FakeReply::ok("User-agent: *\nDisallow: /a/\n");
        reply.delay = std::chrono::milliseconds(50);
        return reply;
    });
    RobotsTxtPolicy policy(transport, utils::HttpOptions{});

    std::vector<std::thread> threads;
    std::atomic<int> allowed{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            if (policy.allowed("https://bunkr.sk/f/abc", "bot")) ++allowed;
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(allowed.load(), 4);
    EXPECT_EQ(transport.request_count(), 1u);
}

TEST(RobotsTxtPolicyTest, ForbiddenRobotsDeniesEverything) {
    FakeHttpTransport transport;
    transport.script({FakeReply::status_only(403)});
    RobotsTxtPolicy policy(transport, utils::HttpOptions{});
    EXPECT_FALSE(policy.allowed("https://bunkr.sk/f/abc", "bot"));
}

TEST(RobotsTxtPolicyTest, UnreachableRobotsAllowsEverything) {
    FakeHttpTransport transport;
    transport.script({FakeReply::transport_failure(utils::TransportError::Network)});
    RobotsTxtPolicy policy(transport, utils::HttpOptions{});
    EXPECT_TRUE(policy.allowed("https://bunkr.sk/f/abc", "bot"));
}

} // namespace lockerfetch::test
