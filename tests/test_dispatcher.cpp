#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "procpool/dispatcher.hpp"
#include "test_support.hpp"

using namespace procpool;
using namespace procpool::testing;

namespace {

Config testConfig(std::size_t capacity) {
    Config config;
    config.capacity = capacity;
    config.killGrace = std::chrono::milliseconds(200);
    return config;
}

TaskResult settle(const TaskFuture& future) {
    auto result = future.waitFor(std::chrono::seconds(15));
    EXPECT_TRUE(result.has_value());
    return result.value_or(TaskResult::launchFailure("timeout"));
}

const std::vector<std::string> kQueuedLines{"Waiting available resources to fork:", "echo hello", "..."};

}

TEST(DispatcherTest, RunsCommandAndReportsDiagnosticsInOrder) {
    Dispatcher dispatcher(testConfig(2));
    auto sink = std::make_shared<CapturingSink>();

    auto submission = dispatcher.exec("echo hello", PriorityKey{1, "job"}, sink);
    auto result = settle(submission.future);

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(submission.handle.command(), "echo hello");
    EXPECT_EQ(sink->infoText(), "hello\n");

    auto expected = kQueuedLines;
    expected.push_back("Running");
    EXPECT_EQ(sink->debugLines(), expected);
}

TEST(DispatcherTest, FailingCommandReportsExitCode) {
    Dispatcher dispatcher(testConfig(1));
    auto result = settle(dispatcher.exec("exit 3", PriorityKey{1, "job"}).future);

    EXPECT_EQ(result.error, TaskError::ProcessExitFailure);
    EXPECT_EQ(result.exitCode, 3);
}

TEST(DispatcherTest, CapacityIsRespectedAndQueuedTaskRunsAfterSlotFrees) {
    Dispatcher dispatcher(testConfig(1));
    auto firstSink = std::make_shared<CapturingSink>();
    auto secondSink = std::make_shared<CapturingSink>();

    auto first = dispatcher.exec("sleep 0.3; echo first", PriorityKey{1, "job"}, firstSink);
    auto second = dispatcher.exec("echo second", PriorityKey{2, "job"}, secondSink);

    EXPECT_EQ(dispatcher.pool().runningCount(), 1u);
    EXPECT_EQ(dispatcher.pool().waitingCount(), 1u);
    EXPECT_EQ(secondSink->debugLines().size(), 3u);

    EXPECT_TRUE(settle(first.future).ok);
    EXPECT_TRUE(settle(second.future).ok);
    EXPECT_EQ(secondSink->infoText(), "second\n");
    EXPECT_EQ(secondSink->debugLines().back(), "Running");
}

TEST(DispatcherTest, CancellingWaitingTaskNeverRunsIt) {
    Dispatcher dispatcher(testConfig(1));
    auto blockerSink = std::make_shared<CapturingSink>();
    auto queuedSink = std::make_shared<CapturingSink>();

    auto blocker = dispatcher.exec("sleep 30", PriorityKey{1, "job"}, blockerSink);
    auto queued = dispatcher.exec("echo hello", PriorityKey{2, "job"}, queuedSink);

    EXPECT_EQ(dispatcher.cancel(queued.handle.id()), CancelOutcome::RemovedWaiting);
    EXPECT_EQ(settle(queued.future).error, TaskError::Cancelled);
    EXPECT_EQ(queuedSink->debugLines(), kQueuedLines);

    EXPECT_EQ(dispatcher.cancel(blocker.handle.id()), CancelOutcome::SignalledRunning);
    EXPECT_EQ(settle(blocker.future).error, TaskError::Cancelled);
    EXPECT_TRUE(dispatcher.pool().waitIdleFor(std::chrono::seconds(5)));
    EXPECT_EQ(queuedSink->infoText(), "");
}

TEST(DispatcherTest, CancellingRunningTaskKillsProcess) {
    Dispatcher dispatcher(testConfig(2));
    auto sink = std::make_shared<CapturingSink>();

    auto submission = dispatcher.exec("echo started; sleep 30", PriorityKey{1, "job"}, sink);
    ASSERT_TRUE(waitUntil([&] { return sink->infoText() == "started\n"; }));

    auto begin = std::chrono::steady_clock::now();
    EXPECT_EQ(dispatcher.cancel(submission.handle.id()), CancelOutcome::SignalledRunning);
    EXPECT_EQ(settle(submission.future).error, TaskError::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
    EXPECT_EQ(dispatcher.cancel(submission.handle.id()), CancelOutcome::NotFound);
}

TEST(DispatcherTest, MonitorShowsRunningAndWaitingTasks) {
    Dispatcher dispatcher(testConfig(1));

    auto running = dispatcher.exec("sleep 30", PriorityKey{10, "backup"});
    auto waiting = dispatcher.exec("echo next", PriorityKey{20, "backup"});

    auto runningBody = nlohmann::json::parse(
        dispatcher.monitor().handle("GET", MonitoringView::kRunningPath).body);
    ASSERT_EQ(runningBody.size(), 1u);
    EXPECT_EQ(runningBody[0]["id"], running.handle.id());
    EXPECT_EQ(runningBody[0]["command"], "sleep 30");
    EXPECT_EQ(runningBody[0]["execution"]["job"], "backup");
    EXPECT_EQ(runningBody[0]["execution"]["context"], 10);

    auto waitingBody = nlohmann::json::parse(
        dispatcher.monitor().handle("GET", MonitoringView::kWaitingPath).body);
    ASSERT_EQ(waitingBody.size(), 1u);
    EXPECT_EQ(waitingBody[0]["id"], waiting.handle.id());

    dispatcher.shutdown();
    EXPECT_EQ(settle(running.future).error, TaskError::Cancelled);
    EXPECT_EQ(settle(waiting.future).error, TaskError::Cancelled);
    EXPECT_EQ(dispatcher.monitor().handle("GET", MonitoringView::kRunningPath).body, "[]");
}

TEST(DispatcherTest, RoundTripLeavesPoolEmpty) {
    Dispatcher dispatcher(testConfig(3));
    std::vector<Submission> submissions;
    for (int i = 0; i < 8; ++i) {
        submissions.push_back(dispatcher.exec("echo " + std::to_string(i), PriorityKey{i, "batch"}));
    }
    for (const auto& s : submissions) {
        EXPECT_TRUE(settle(s.future).ok);
    }

    EXPECT_TRUE(dispatcher.pool().waitIdleFor(std::chrono::seconds(5)));
    EXPECT_TRUE(dispatcher.monitor().listRunning().empty());
    EXPECT_TRUE(dispatcher.monitor().listWaiting().empty());
}

TEST(DispatcherTest, ExecAfterShutdownIsCancelled) {
    Dispatcher dispatcher(testConfig(1));
    dispatcher.shutdown();
    EXPECT_TRUE(dispatcher.isShutdown());

    auto sink = std::make_shared<CapturingSink>();
    auto submission = dispatcher.exec("echo late", PriorityKey{1, "job"}, sink);

    EXPECT_EQ(settle(submission.future).error, TaskError::Cancelled);
    EXPECT_TRUE(sink->debugLines().empty());
    EXPECT_FALSE(sink->errorText().empty());
}

TEST(DispatcherTest, DestructorKillsOutstandingWork) {
    TaskFuture future;
    auto begin = std::chrono::steady_clock::now();
    {
        Dispatcher dispatcher(testConfig(1));
        future = dispatcher.exec("sleep 30", PriorityKey{1, "job"}).future;
    }
    EXPECT_EQ(settle(future).error, TaskError::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}
