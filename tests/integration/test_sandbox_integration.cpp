#include <gtest/gtest.h>
#include <atomic>
#include <hyper-cri/core/config.hpp>
#include <hyper-cri/core/error.hpp>
#include <hyper-cri/core/logger.hpp>
#include <hyper-cri/runtime/hyper_runtime.hpp>
#include <hyper-cri/sandbox/label_annotation_splitter.hpp>
#include <hyper-cri/sandbox/sandbox_name_codec.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "fakes/in_memory_engine.hpp"

using namespace hyper_cri;
using hyper_cri::fakes::InMemoryEngine;

class SandboxIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Logger::resetInstance(kLoggerName);
        Logger::getInstance(kLoggerName)->setConsoleSinkEnabled(false);

        ConfigManager config;
        config.loadFromString("sandbox.default_cpu = 2\n"
                              "sandbox.default_memory_mb = 128\n"
                              "log.level = warning\n");

        engine_ = std::make_shared<InMemoryEngine>();
        runtime_ = HyperRuntimeFactory::createRuntime(engine_, config, kLoggerName);
    }

    void TearDown() override
    {
        runtime_.reset();
        Logger::resetInstance(kLoggerName);
    }

    static SandboxConfig makeConfig(const std::string& name, uint32_t attempt = 0)
    {
        SandboxConfig config;
        config.metadata = SandboxMetadata{name, "default", "uid-" + name, attempt};
        config.hostname = name;
        config.labels = {{"app", name}};
        config.annotations = {{"created-by", "integration"}};
        return config;
    }

    static constexpr const char* kLoggerName = "integration-test";
    std::shared_ptr<InMemoryEngine> engine_;
    std::unique_ptr<HyperRuntime> runtime_;
};

TEST_F(SandboxIntegrationTest, FullLifecycle)
{
    auto pod_id = runtime_->runPodSandbox(makeConfig("web_front", 3));

    auto spec = engine_->specOf(pod_id);
    EXPECT_EQ(spec.id, "k8s_web%5Ffront_default_uid-web%5Ffront_3");
    EXPECT_EQ(spec.resource.vcpu, 2);
    EXPECT_EQ(spec.resource.memory_mb, 128);

    auto status = runtime_->podSandboxStatus(pod_id);
    EXPECT_EQ(status.state, SandboxState::READY);
    EXPECT_EQ(status.metadata, (SandboxMetadata{"web_front", "default", "uid-web_front", 3}));
    ASSERT_TRUE(status.ip.has_value());
    EXPECT_EQ(*status.ip, "10.0.0.1");
    EXPECT_EQ(status.created_at, 1000 * kSecondToNano);
    EXPECT_EQ(status.labels.at("app"), "web_front");
    EXPECT_EQ(status.annotations.at("created-by"), "integration");

    runtime_->stopPodSandbox(pod_id);
    status = runtime_->podSandboxStatus(pod_id);
    EXPECT_EQ(status.state, SandboxState::NOT_READY);
    EXPECT_FALSE(status.ip.has_value());

    runtime_->removePodSandbox(pod_id);
    EXPECT_EQ(engine_->podCount(), 0u);
    EXPECT_THROW(runtime_->podSandboxStatus(pod_id), EngineError);
}

TEST_F(SandboxIntegrationTest, FailedStartLeavesNoPodBehind)
{
    auto config = makeConfig("broken");
    engine_->unstartable_names.push_back(SandboxNameCodec::encode(config.metadata));

    try {
        runtime_->runPodSandbox(config);
        FAIL() << "expected EngineError";
    }
    catch (const EngineError& e) {
        EXPECT_EQ(e.getCause(), "vm boot failed");
    }

    EXPECT_EQ(engine_->podCount(), 0u);
    EXPECT_TRUE(runtime_->listPodSandbox().empty());
}

TEST_F(SandboxIntegrationTest, ListingNewestFirstWithFilters)
{
    auto first = runtime_->runPodSandbox(makeConfig("a"));
    auto second = runtime_->runPodSandbox(makeConfig("b"));
    auto third = runtime_->runPodSandbox(makeConfig("c"));
    runtime_->stopPodSandbox(second);

    auto all = runtime_->listPodSandbox();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, third);
    EXPECT_EQ(all[1].id, second);
    EXPECT_EQ(all[2].id, first);
    EXPECT_EQ(all[2].metadata.name, "a");

    SandboxFilter ready;
    ready.state = SandboxState::READY;
    auto ready_items = runtime_->listPodSandbox(ready);
    ASSERT_EQ(ready_items.size(), 2u);
    EXPECT_EQ(ready_items[0].id, third);
    EXPECT_EQ(ready_items[1].id, first);

    SandboxFilter by_label;
    by_label.label_selector = StringMap{{"app", "b"}};
    auto labelled = runtime_->listPodSandbox(by_label);
    ASSERT_EQ(labelled.size(), 1u);
    EXPECT_EQ(labelled[0].id, second);

    SandboxFilter by_annotation;
    by_annotation.label_selector = StringMap{{"created-by", "integration"}};
    EXPECT_TRUE(runtime_->listPodSandbox(by_annotation).empty());
}

TEST_F(SandboxIntegrationTest, ForeignPodBreaksListing)
{
    runtime_->runPodSandbox(makeConfig("a"));

    EngineRecord foreign;
    foreign.engine_id = "manual-1";
    foreign.encoded_name = "handmade_pod";
    foreign.phase = "running";
    engine_->injectPod(foreign);

    EXPECT_THROW(runtime_->listPodSandbox(), NameDecodeError);
}

TEST_F(SandboxIntegrationTest, DuplicateSandboxRejectedByEngine)
{
    runtime_->runPodSandbox(makeConfig("dup"));

    EXPECT_THROW(runtime_->runPodSandbox(makeConfig("dup")), EngineError);
    EXPECT_EQ(engine_->podCount(), 1u);

    runtime_->runPodSandbox(makeConfig("dup", 1));
    EXPECT_EQ(engine_->podCount(), 2u);
}

TEST_F(SandboxIntegrationTest, ConcurrentCallers)
{
    constexpr int kThreads = 8;
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this, i, &failures]() {
            try {
                auto pod_id = runtime_->runPodSandbox(makeConfig("pod" + std::to_string(i)));
                runtime_->podSandboxStatus(pod_id);
                runtime_->listPodSandbox();
            }
            catch (const SandboxError&) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(runtime_->listPodSandbox().size(), static_cast<size_t>(kThreads));
}

TEST_F(SandboxIntegrationTest, RuntimeReportsReady)
{
    auto status = runtime_->status();
    EXPECT_TRUE(status.getCondition(kRuntimeReady)->status);
    EXPECT_EQ(runtime_->version().runtime_version, "0.8.1");
}
