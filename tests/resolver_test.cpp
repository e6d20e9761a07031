#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <gtest/gtest.h>

#include "rainmeta/resolver.hpp"

using namespace rainmeta;
using namespace rainmeta::v1;

TEST(RaceFirstSuccessTest, ReturnsFirstSuccess) {
    const std::vector<std::string> endpoints = {"slow", "fast", "broken"};
    auto result = RaceFirstSuccess<std::string>(endpoints, [](const std::string& endpoint) -> util::StatusOr<std::string> {
        if (endpoint == "broken") return util::Status::ResolverError("broken");
        if (endpoint == "slow") std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return endpoint;
    });
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_TRUE(result.value() == "fast" || result.value() == "slow");
}

TEST(RaceFirstSuccessTest, AllFailuresReportLastError) {
    std::atomic<int> calls{0};
    const std::vector<std::string> endpoints = {"a", "b", "c"};
    auto result = RaceFirstSuccess<int>(endpoints, [&calls](const std::string& endpoint) -> util::StatusOr<int> {
        ++calls;
        return util::Status::NotFound(endpoint + " has nothing");
    });
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), util::StatusCode::kResolverError);
    EXPECT_NE(result.status().message().find("has nothing"), std::string::npos);
    EXPECT_EQ(calls.load(), 3);
}

TEST(RaceFirstSuccessTest, NoEndpoints) {
    auto result = RaceFirstSuccess<int>({}, [](const std::string&) -> util::StatusOr<int> { return 1; });
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), util::StatusCode::kNotFound);
}

TEST(SearchTest, NullResolver) {
    const byte_vec hash(32, 0x01);
    EXPECT_EQ(Search(nullptr, hash, {"https://subgraph.test/a"}).status().code(), util::StatusCode::kResolverError);
    EXPECT_EQ(SearchDeployer(nullptr, hash, {"https://subgraph.test/a"}).status().code(),
              util::StatusCode::kResolverError);
}

TEST(DeployerResponseTest, AuthoringMetaFromMeta) {
    AuthoringMeta authoring;
    authoring.items.push_back({"constant", 16, "Copies a constant value onto the stack."});
    DeployerResponse response;
    response.meta_bytes = MetaDocumentItem::CborEncodeSeq(
        {DotrainSource{"#main _: 1;"}.ToDocumentItem(), authoring.ToDocumentItem().value()},
        KnownMagic::kRainMetaDocumentV1);
    auto parsed = response.AuthoringMetaFromMeta();
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, authoring);

    response.meta_bytes = {0x00};
    EXPECT_FALSE(response.AuthoringMetaFromMeta().has_value());
}

TEST(RaceFirstSuccessTest, SlowEndpointDoesNotDelayFastOne) {
    ThreadPool::GetInstance(1);
    const std::vector<std::string> endpoints = {"hung", "fast"};
    const auto start = std::chrono::steady_clock::now();
    auto result = RaceFirstSuccess<std::string>(endpoints, [](const std::string& endpoint) -> util::StatusOr<std::string> {
        if (endpoint == "hung") {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            return util::Status::ResolverError("timed out");
        }
        return endpoint;
    });
    const auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_EQ(result.value(), "fast");
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST(RaceFirstSuccessTest, BusyPoolStillStartsEveryEndpoint) {
    auto& pool = ThreadPool::GetInstance();
    auto release = std::make_shared<std::atomic<bool>>(false);
    const size_t busy = pool.size();
    for (size_t i = 0; i < busy; ++i) {
        ASSERT_TRUE(pool.Submit([release] {
            while (!release->load()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }).ok());
    }

    const std::vector<std::string> endpoints = {"a", "b", "c"};
    auto result = RaceFirstSuccess<int>(endpoints, [](const std::string& endpoint) -> util::StatusOr<int> {
        if (endpoint == "c") return 3;
        return util::Status::NotFound(endpoint);
    });
    release->store(true);
    ASSERT_TRUE(result.ok()) << result.status().ToString();
    EXPECT_EQ(result.value(), 3);
    EXPECT_GE(pool.size(), busy + endpoints.size());
}
