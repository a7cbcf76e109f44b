/**
 * quota_pipeline_test.cpp - QuotaFetchPipeline unit tests
 *
 * Tests:
 * - Results land in the QuotaStore on the loop thread
 * - A throwing fetcher only affects its own provider, whatever it throws
 * - Empty results remove the provider entry
 * - refresh_all() refuses to overlap and skips the IDE providers
 * - Low-quota alerts fire from applied results
 */

#include "quota/quota_pipeline.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "mocks/mock_management_api.hpp"
#include "mocks/mock_notifier.hpp"
#include "mocks/mock_quota_fetcher.hpp"
#include "runtime/event_loop.hpp"
#include "runtime/worker_pool.hpp"

using namespace proxyvisor;
using namespace proxyvisor::quota;
using namespace std::chrono_literals;
using proxyvisor::tests::MockManagementApi;
using proxyvisor::tests::MockNotifier;
using proxyvisor::tests::MockQuotaFetcher;
using ::testing::_;
using ::testing::Eq;
using ::testing::Invoke;
using ::testing::IsNull;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

AccountQuotaMap accounts_with(const std::string &email, double percentage) {
    ProviderQuotaData data;
    data.account_email = email;
    ModelQuota model;
    model.name = "default";
    model.percentage = percentage;
    data.add_model(model);
    return AccountQuotaMap{{email, data}};
}

std::shared_ptr<NiceMock<MockQuotaFetcher>> make_fetcher(Provider provider) {
    return std::make_shared<NiceMock<MockQuotaFetcher>>(provider);
}

}  // namespace

class QuotaPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        loop_.start();
        pool_.start();
    }

    void TearDown() override {
        pool_.stop();
        loop_.stop();
    }

    // Wraps a promise so a test can wait for on_complete
    QuotaFetchPipeline::Completion completion(std::promise<void> &done) {
        return [&done]() { done.set_value(); };
    }

    runtime::EventLoop loop_{"pipeline-test"};
    runtime::WorkerPool pool_{2, "pipeline-workers"};
    QuotaStore store_;
    QuotaFetchPipeline pipeline_{loop_, pool_, store_};
};

TEST_F(QuotaPipelineTest, RefreshAllStoresResults) {
    auto codex = make_fetcher(Provider::CODEX);
    auto claude = make_fetcher(Provider::CLAUDE);
    ON_CALL(*codex, fetch_all_quotas(_)).WillByDefault(Return(accounts_with("a@example.com", 80.0)));
    ON_CALL(*claude, fetch_all_quotas(_)).WillByDefault(Return(accounts_with("b@example.com", 40.0)));
    pipeline_.register_fetcher(codex);
    pipeline_.register_fetcher(claude);

    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

    EXPECT_FALSE(pipeline_.is_refreshing());
    EXPECT_EQ(store_.provider_count(), 2u);
    auto snapshot = store_.snapshot(Provider::CODEX);
    ASSERT_NE(snapshot, nullptr);
    ASSERT_EQ(snapshot->count("a@example.com"), 1u);
    EXPECT_DOUBLE_EQ(snapshot->at("a@example.com").models[0].percentage, 80.0);
}

TEST_F(QuotaPipelineTest, FailingFetcherIsIsolated) {
    store_.replace(Provider::CLAUDE, accounts_with("old@example.com", 10.0));

    auto codex = make_fetcher(Provider::CODEX);
    auto claude = make_fetcher(Provider::CLAUDE);
    ON_CALL(*codex, fetch_all_quotas(_)).WillByDefault(Return(accounts_with("a@example.com", 80.0)));
    ON_CALL(*claude, fetch_all_quotas(_)).WillByDefault(Invoke([](proxy::IManagementApi *) -> AccountQuotaMap {
        throw std::runtime_error("upstream unavailable");
    }));
    pipeline_.register_fetcher(codex);
    pipeline_.register_fetcher(claude);

    std::mutex mutex;
    std::map<Provider, bool> updates;  // provider -> had snapshot
    pipeline_.set_update_callback([&](Provider provider, QuotaStore::Snapshot snapshot) {
        std::lock_guard<std::mutex> lock(mutex);
        updates[provider] = snapshot != nullptr;
    });

    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

    EXPECT_TRUE(store_.contains(Provider::CODEX));
    EXPECT_FALSE(store_.contains(Provider::CLAUDE));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_TRUE(updates[Provider::CODEX]);
    EXPECT_FALSE(updates[Provider::CLAUDE]);
}

TEST_F(QuotaPipelineTest, NonStandardThrowIsIsolated) {
    store_.replace(Provider::CLAUDE, accounts_with("old@example.com", 10.0));

    auto codex = make_fetcher(Provider::CODEX);
    auto claude = make_fetcher(Provider::CLAUDE);
    ON_CALL(*codex, fetch_all_quotas(_)).WillByDefault(Return(accounts_with("a@example.com", 80.0)));
    ON_CALL(*claude, fetch_all_quotas(_)).WillByDefault(Invoke([](proxy::IManagementApi *) -> AccountQuotaMap {
        throw 42;
    }));
    pipeline_.register_fetcher(codex);
    pipeline_.register_fetcher(claude);

    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

    EXPECT_TRUE(store_.contains(Provider::CODEX));
    EXPECT_FALSE(store_.contains(Provider::CLAUDE));
}

TEST_F(QuotaPipelineTest, EmptyResultRemovesProvider) {
    store_.replace(Provider::QWEN, accounts_with("a@example.com", 50.0));
    auto qwen = make_fetcher(Provider::QWEN);
    ON_CALL(*qwen, fetch_all_quotas(_)).WillByDefault(Return(AccountQuotaMap{}));
    pipeline_.register_fetcher(qwen);

    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_provider(Provider::QWEN, completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

    EXPECT_FALSE(store_.contains(Provider::QWEN));
}

TEST_F(QuotaPipelineTest, UpdateCallbackRunsOnLoopThread) {
    auto codex = make_fetcher(Provider::CODEX);
    ON_CALL(*codex, fetch_all_quotas(_)).WillByDefault(Return(accounts_with("a@example.com", 80.0)));
    pipeline_.register_fetcher(codex);

    std::atomic<bool> on_loop{false};
    pipeline_.set_update_callback(
        [&](Provider, QuotaStore::Snapshot) { on_loop.store(loop_.is_loop_thread()); });

    std::promise<void> done;
    auto future = done.get_future();
    std::atomic<bool> completion_on_loop{false};
    ASSERT_TRUE(pipeline_.refresh_all([&]() {
        completion_on_loop.store(loop_.is_loop_thread());
        done.set_value();
    }));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

    EXPECT_TRUE(on_loop.load());
    EXPECT_TRUE(completion_on_loop.load());
}

TEST_F(QuotaPipelineTest, RefreshAllDoesNotOverlap) {
    std::promise<void> gate;
    std::shared_future<void> gate_future = gate.get_future().share();

    auto codex = make_fetcher(Provider::CODEX);
    ON_CALL(*codex, fetch_all_quotas(_)).WillByDefault(Invoke([gate_future](proxy::IManagementApi *) {
        gate_future.wait_for(2s);
        return accounts_with("a@example.com", 80.0);
    }));
    pipeline_.register_fetcher(codex);

    std::promise<void> first_done;
    auto first_future = first_done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(first_done)));
    EXPECT_TRUE(pipeline_.is_refreshing());
    EXPECT_FALSE(pipeline_.refresh_all());

    gate.set_value();
    ASSERT_EQ(first_future.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(pipeline_.is_refreshing());

    std::promise<void> second_done;
    auto second_future = second_done.get_future();
    EXPECT_TRUE(pipeline_.refresh_all(completion(second_done)));
    ASSERT_EQ(second_future.wait_for(2s), std::future_status::ready);
}

TEST_F(QuotaPipelineTest, RefreshAllSkipsIdeProviders) {
    auto codex = make_fetcher(Provider::CODEX);
    auto cursor = make_fetcher(Provider::CURSOR);
    auto trae = make_fetcher(Provider::TRAE);
    ON_CALL(*codex, fetch_all_quotas(_)).WillByDefault(Return(accounts_with("a@example.com", 80.0)));
    EXPECT_CALL(*cursor, fetch_all_quotas(_)).Times(0);
    EXPECT_CALL(*trae, fetch_all_quotas(_)).Times(0);
    pipeline_.register_fetcher(codex);
    pipeline_.register_fetcher(cursor);
    pipeline_.register_fetcher(trae);

    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

    EXPECT_TRUE(store_.contains(Provider::CODEX));
    EXPECT_FALSE(store_.contains(Provider::CURSOR));
    EXPECT_FALSE(store_.contains(Provider::TRAE));
}

TEST_F(QuotaPipelineTest, ScanIdeProvidersRunsOnlyIdeFetchers) {
    auto codex = make_fetcher(Provider::CODEX);
    auto cursor = make_fetcher(Provider::CURSOR);
    EXPECT_CALL(*codex, fetch_all_quotas(_)).Times(0);
    EXPECT_CALL(*cursor, fetch_all_quotas(_)).WillOnce(Return(accounts_with("ide@example.com", 60.0)));
    pipeline_.register_fetcher(codex);

    EXPECT_FALSE(pipeline_.scan_ide_providers());

    pipeline_.register_fetcher(cursor);
    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.scan_ide_providers(completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

    EXPECT_TRUE(store_.contains(Provider::CURSOR));
    EXPECT_FALSE(store_.contains(Provider::CODEX));
}

TEST_F(QuotaPipelineTest, RefreshProviderRequiresRegisteredFetcher) {
    EXPECT_FALSE(pipeline_.refresh_provider(Provider::KIRO));
}

TEST_F(QuotaPipelineTest, RegisterReplacesFetcherForSameProvider) {
    auto first = make_fetcher(Provider::CODEX);
    auto second = make_fetcher(Provider::CODEX);
    EXPECT_CALL(*first, fetch_all_quotas(_)).Times(0);
    EXPECT_CALL(*second, fetch_all_quotas(_)).WillOnce(Return(accounts_with("new@example.com", 70.0)));

    pipeline_.register_fetcher(first);
    pipeline_.register_fetcher(second);
    ASSERT_EQ(pipeline_.registered_providers().size(), 1u);

    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_provider(Provider::CODEX, completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);

    auto snapshot = store_.snapshot(Provider::CODEX);
    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->count("new@example.com"), 1u);
}

TEST_F(QuotaPipelineTest, ApiProviderResultIsPassedToFetchers) {
    auto api = std::make_shared<NiceMock<MockManagementApi>>();
    pipeline_.set_api_provider([api]() -> std::shared_ptr<proxy::IManagementApi> { return api; });

    auto codex = make_fetcher(Provider::CODEX);
    EXPECT_CALL(*codex, fetch_all_quotas(Eq(api.get()))).WillOnce(Return(accounts_with("a@example.com", 80.0)));
    pipeline_.register_fetcher(codex);

    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
}

TEST_F(QuotaPipelineTest, NoApiProviderPassesNull) {
    auto codex = make_fetcher(Provider::CODEX);
    EXPECT_CALL(*codex, fetch_all_quotas(IsNull())).WillOnce(Return(AccountQuotaMap{}));
    pipeline_.register_fetcher(codex);

    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
}

TEST_F(QuotaPipelineTest, EmptyFetcherListStillCompletes) {
    std::promise<void> done;
    auto future = done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(done)));
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(pipeline_.is_refreshing());
}

TEST_F(QuotaPipelineTest, SnapshotsAreNotMutatedByLaterRefresh) {
    auto codex = make_fetcher(Provider::CODEX);
    EXPECT_CALL(*codex, fetch_all_quotas(_))
        .WillOnce(Return(accounts_with("a@example.com", 80.0)))
        .WillOnce(Return(accounts_with("a@example.com", 30.0)));
    pipeline_.register_fetcher(codex);

    std::promise<void> first_done;
    auto first_future = first_done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(first_done)));
    ASSERT_EQ(first_future.wait_for(2s), std::future_status::ready);
    auto before = store_.snapshot(Provider::CODEX);

    std::promise<void> second_done;
    auto second_future = second_done.get_future();
    ASSERT_TRUE(pipeline_.refresh_all(completion(second_done)));
    ASSERT_EQ(second_future.wait_for(2s), std::future_status::ready);
    auto after = store_.snapshot(Provider::CODEX);

    ASSERT_NE(before, nullptr);
    ASSERT_NE(after, nullptr);
    EXPECT_DOUBLE_EQ(before->at("a@example.com").models[0].percentage, 80.0);
    EXPECT_DOUBLE_EQ(after->at("a@example.com").models[0].percentage, 30.0);
}

TEST(QuotaPipelineAlertTest, LowQuotaResultTriggersAlert) {
    runtime::EventLoop loop("alert-loop");
    runtime::WorkerPool pool(1, "alert-workers");
    loop.start();
    pool.start();

    NiceMock<MockNotifier> notifier;
    EXPECT_CALL(notifier, notify(_)).WillOnce(Return(true));
    AlertMonitor alerts(&notifier, AlertSettings{});

    QuotaStore store;
    {
        QuotaFetchPipeline pipeline(loop, pool, store, &alerts);
        auto claude = make_fetcher(Provider::CLAUDE);
        ON_CALL(*claude, fetch_all_quotas(_)).WillByDefault(Return(accounts_with("a@example.com", 5.0)));
        pipeline.register_fetcher(claude);

        std::promise<void> done;
        auto future = done.get_future();
        ASSERT_TRUE(pipeline.refresh_all([&done]() { done.set_value(); }));
        EXPECT_EQ(future.wait_for(2s), std::future_status::ready);

        pool.stop();
        loop.stop();
    }
}
