/*
 * test_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Tests for WorkflowEngine

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app/eventloop.hpp"
#include "workflow/workflow.hpp"

#include "fakes.hpp"

using namespace stormwatch;
using namespace stormwatch::workflow;
using namespace stormwatch::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

namespace {

auto ok() -> std::expected<void, NotifyError> { return {}; }

auto notifyFailure(NotifyErrorCode code, const std::string& message)
    -> std::expected<void, NotifyError> {
    return std::unexpected(NotifyError{code, message});
}

auto kindsOf(const std::vector<AuditRecord>& records)
    -> std::vector<AuditEventKind> {
    std::vector<AuditEventKind> kinds;
    for (const auto& record : records) {
        kinds.push_back(record.kind);
    }
    return kinds;
}

}  // namespace

class WorkflowEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        loop_ = std::make_shared<app::EventLoop>(4);
        source_ = std::make_shared<ScriptedSource>();
        classifier_ = std::make_shared<ScriptedClassifier>();
        notifier_ = std::make_shared<ScriptedNotifier>();
        sink_ = std::make_shared<MemoryAuditSink>();
        audit_ = std::make_shared<AuditLog>(sink_);

        const RetryConfig fast(RetryStrategy::Exponential, 3, 5ms, 20ms, 2.0);
        settings_.observationRetry = fast;
        settings_.classificationRetry = fast;
        settings_.dispatchRetry = fast;
        settings_.observationTimeout = 500ms;
        settings_.classificationTimeout = 500ms;
        settings_.dispatchTimeout = 500ms;
        settings_.approvalTimeout = 2s;
        settings_.recipients = {"ops@example.org"};
    }

    void TearDown() override {
        if (engine_) {
            engine_->shutdown();
        }
        loop_->stop();
    }

    void createEngine(std::shared_ptr<Notifier> notifier = nullptr,
                      std::shared_ptr<Classifier> classifier = nullptr) {
        engine_ = WorkflowEngine::create(
            loop_,
            Capabilities{source_,
                         classifier ? classifier : classifier_,
                         notifier ? notifier : notifier_},
            SeverityPolicy(), audit_, settings_);
    }

    auto runIncident(const std::string& location = "Harbor")
        -> std::optional<IncidentState> {
        const auto id = engine_->submit(location, 1);
        return engine_->waitFor(id, 5s);
    }

    auto waitForPending(size_t count) -> std::vector<ApprovalRequest> {
        const auto deadline = std::chrono::steady_clock::now() + 3s;
        while (std::chrono::steady_clock::now() < deadline) {
            auto pending = engine_->pendingApprovals();
            if (pending.size() >= count) {
                return pending;
            }
            std::this_thread::sleep_for(5ms);
        }
        return engine_->pendingApprovals();
    }

    std::shared_ptr<app::EventLoop> loop_;
    std::shared_ptr<ScriptedSource> source_;
    std::shared_ptr<ScriptedClassifier> classifier_;
    std::shared_ptr<ScriptedNotifier> notifier_;
    std::shared_ptr<MemoryAuditSink> sink_;
    std::shared_ptr<AuditLog> audit_;
    EngineSettings settings_;
    std::shared_ptr<WorkflowEngine> engine_;
};

// ============================================================================
// End-to-end Scenarios
// ============================================================================

TEST_F(WorkflowEngineTest, HighSeverityStormDispatchesWithoutApproval) {
    source_->push(stormObservation());
    classifier_->push(verdict("Severe Storm", "High"));
    notifier_->push(ok());
    createEngine();

    EXPECT_EQ(runIncident(), IncidentState::Dispatched);
    EXPECT_EQ(notifier_->calls(), 1);

    const auto snapshot = engine_->getIncident("Harbor#1");
    EXPECT_FALSE(snapshot.approval.has_value());
    ASSERT_TRUE(snapshot.dispatch.has_value());
    EXPECT_TRUE(snapshot.dispatch->delivered);
    EXPECT_EQ(snapshot.dispatch->attempts, 1);
    EXPECT_EQ(snapshot.dispatch->department, kEmergencyResponse);

    EXPECT_THAT(kindsOf(sink_->recordsFor("Harbor#1")),
                ::testing::ElementsAre(
                    AuditEventKind::Observed, AuditEventKind::Classified,
                    AuditEventKind::PolicyDecided, AuditEventKind::Dispatched));
}

TEST_F(WorkflowEngineTest, LowSeverityWithoutAnswerExpiresToDone) {
    settings_.approvalTimeout = 50ms;
    source_->push(stormObservation());
    classifier_->push(verdict("Severe Storm", "Low"));
    notifier_->push(ok());
    createEngine();

    EXPECT_EQ(runIncident(), IncidentState::Done);
    EXPECT_EQ(notifier_->calls(), 0);

    const auto snapshot = engine_->getIncident("Harbor#1");
    ASSERT_TRUE(snapshot.approval.has_value());
    EXPECT_EQ(snapshot.approval->resolution, ApprovalResolution::Expired);

    const auto records = sink_->recordsFor("Harbor#1");
    EXPECT_THAT(kindsOf(records),
                ::testing::ElementsAre(
                    AuditEventKind::Observed, AuditEventKind::Classified,
                    AuditEventKind::PolicyDecided,
                    AuditEventKind::ApprovalRequested,
                    AuditEventKind::ApprovalResolved, AuditEventKind::Closed));
    EXPECT_EQ(records[4].toState, IncidentState::Expired);
}

TEST_F(WorkflowEngineTest, ApprovedMediumAlertIsDispatchedOnce) {
    auto mock = std::make_shared<MockNotifier>();
    EXPECT_CALL(*mock, send(_, HasSubstr("Medium severity"),
                            HasSubstr("verified by a human operator"), _))
        .Times(1)
        .WillOnce(Return(ok()));

    source_->push(stormObservation());
    classifier_->push(verdict("Flood", "Medium"));
    createEngine(mock);

    const auto id = engine_->submit("Harbor", 1);
    const auto pending = waitForPending(1);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending.front().incidentId, id);

    const auto resolved =
        engine_->resolveApproval(pending.front().id, ApprovalDecision::Approve);
    EXPECT_EQ(resolved.resolution, ApprovalResolution::Approved);

    EXPECT_EQ(engine_->waitFor(id, 5s), IncidentState::Dispatched);
    const auto snapshot = engine_->getIncident(id);
    ASSERT_TRUE(snapshot.dispatch.has_value());
    EXPECT_EQ(snapshot.dispatch->department, kPublicWorks);
    ::testing::Mock::VerifyAndClearExpectations(mock.get());
}

TEST_F(WorkflowEngineTest, ObservationTimeoutsAbortWithoutDownstreamCalls) {
    settings_.observationTimeout = 20ms;
    settings_.observationRetry =
        RetryConfig(RetryStrategy::Linear, 2, 5ms, 10ms, 1.0);
    source_->setLatency(200ms);
    source_->push(stormObservation());
    classifier_->push(verdict("Severe Storm", "High"));
    notifier_->push(ok());
    createEngine();

    EXPECT_EQ(runIncident(), IncidentState::Aborted);

    const auto snapshot = engine_->getIncident("Harbor#1");
    ASSERT_TRUE(snapshot.abortReason.has_value());
    EXPECT_EQ(*snapshot.abortReason, "observation-unavailable");
    EXPECT_EQ(snapshot.observationAttempts, 3);
    EXPECT_EQ(classifier_->calls(), 0);
    EXPECT_EQ(notifier_->calls(), 0);
}

TEST_F(WorkflowEngineTest, TransientSendFailuresAreRetriedUntilDelivered) {
    auto mock = std::make_shared<MockNotifier>();
    EXPECT_CALL(*mock, send(_, _, _, _))
        .Times(3)
        .WillOnce(Return(notifyFailure(NotifyErrorCode::Transient, "busy")))
        .WillOnce(Return(notifyFailure(NotifyErrorCode::Transient, "busy")))
        .WillOnce(Return(ok()));

    source_->push(stormObservation());
    classifier_->push(verdict("Hurricane", "Critical"));
    createEngine(mock);

    EXPECT_EQ(runIncident(), IncidentState::Dispatched);
    const auto snapshot = engine_->getIncident("Harbor#1");
    ASSERT_TRUE(snapshot.dispatch.has_value());
    EXPECT_EQ(snapshot.dispatch->attempts, 3);

    const auto records = sink_->recordsFor("Harbor#1");
    const auto retries = std::count_if(
        records.begin(), records.end(), [](const AuditRecord& record) {
            return record.kind == AuditEventKind::RetryScheduled &&
                   record.payload.value("capability", "") == "dispatch";
        });
    EXPECT_EQ(retries, 2);
    ::testing::Mock::VerifyAndClearExpectations(mock.get());
}

// ============================================================================
// Failure Handling Tests
// ============================================================================

TEST_F(WorkflowEngineTest, DispatchStopsAtRetryBudget) {
    settings_.dispatchRetry =
        RetryConfig(RetryStrategy::Exponential, 2, 5ms, 20ms, 2.0);
    source_->push(stormObservation());
    classifier_->push(verdict("Hurricane", "Critical"));
    notifier_->push(notifyFailure(NotifyErrorCode::Transient, "smtp down"));
    createEngine();

    EXPECT_EQ(runIncident(), IncidentState::DispatchFailed);
    EXPECT_EQ(notifier_->calls(), 3);

    const auto snapshot = engine_->getIncident("Harbor#1");
    ASSERT_TRUE(snapshot.dispatch.has_value());
    EXPECT_FALSE(snapshot.dispatch->delivered);
    EXPECT_EQ(snapshot.dispatch->attempts, 3);
    ASSERT_TRUE(snapshot.dispatch->error.has_value());

    const auto records = sink_->recordsFor("Harbor#1");
    ASSERT_FALSE(records.empty());
    EXPECT_EQ(records.back().kind, AuditEventKind::DispatchFailed);
    EXPECT_EQ(records.back().payload["errorClass"], "transient");
}

TEST_F(WorkflowEngineTest, TerminalSendFailureIsNotRetried) {
    source_->push(stormObservation());
    classifier_->push(verdict("Hurricane", "Critical"));
    notifier_->push(notifyFailure(NotifyErrorCode::Terminal, "bad address"));
    createEngine();

    EXPECT_EQ(runIncident(), IncidentState::DispatchFailed);
    EXPECT_EQ(notifier_->calls(), 1);
    EXPECT_EQ(sink_->recordsFor("Harbor#1").back().payload["errorClass"],
              "terminal");
}

TEST_F(WorkflowEngineTest, UnknownLocationAbortsWithoutRetry) {
    source_->push(std::unexpected(
        ObservationError{ObservationErrorCode::NotFound, "no such place"}));
    createEngine();

    EXPECT_EQ(runIncident("Atlantis"), IncidentState::Aborted);
    EXPECT_EQ(source_->calls(), 1);
    EXPECT_EQ(*engine_->getIncident("Atlantis#1").abortReason,
              "observation-unavailable");
}

TEST_F(WorkflowEngineTest, TransientObservationFailureRecovers) {
    source_->push(std::unexpected(
        ObservationError{ObservationErrorCode::ProviderError, "503"}));
    source_->push(stormObservation());
    classifier_->push(verdict("Severe Storm", "High"));
    notifier_->push(ok());
    createEngine();

    EXPECT_EQ(runIncident(), IncidentState::Dispatched);
    EXPECT_EQ(engine_->getIncident("Harbor#1").observationAttempts, 2);
}

TEST_F(WorkflowEngineTest, MalformedClassifierOutputAbortsIncident) {
    source_->push(stormObservation());
    classifier_->push(std::unexpected(ClassificationError{
        ClassificationErrorCode::MalformedOutput, "not json"}));
    createEngine();

    EXPECT_EQ(runIncident(), IncidentState::Aborted);
    EXPECT_EQ(classifier_->calls(), 1);
    EXPECT_EQ(*engine_->getIncident("Harbor#1").abortReason,
              "classification-failed");
    EXPECT_EQ(notifier_->calls(), 0);
}

TEST_F(WorkflowEngineTest, ThrowingClassifierIsTreatedAsTransient) {
    auto mock = std::make_shared<MockClassifier>();
    EXPECT_CALL(*mock, classify(_, _))
        .Times(2)
        .WillOnce(Throw(std::runtime_error("model crashed")))
        .WillOnce(Return(std::expected<ClassifierVerdict, ClassificationError>(
            verdict("Hurricane", "Critical"))));

    source_->push(stormObservation());
    notifier_->push(ok());
    createEngine(nullptr, mock);

    EXPECT_EQ(runIncident(), IncidentState::Dispatched);
    EXPECT_EQ(engine_->getIncident("Harbor#1").classificationAttempts, 2);
    ::testing::Mock::VerifyAndClearExpectations(mock.get());
}

TEST_F(WorkflowEngineTest, UnrecognizedSeverityRequiresApproval) {
    source_->push(stormObservation());
    classifier_->push(verdict("Unknown Phenomenon", "apocalyptic"));
    notifier_->push(ok());
    createEngine();

    const auto id = engine_->submit("Harbor", 1);
    const auto pending = waitForPending(1);
    ASSERT_EQ(pending.size(), 1u);

    const auto snapshot = engine_->getIncident(id);
    ASSERT_TRUE(snapshot.assessment.has_value());
    EXPECT_TRUE(snapshot.assessment->ambiguous);
    EXPECT_EQ(snapshot.assessment->severity, Severity::Medium);
    EXPECT_EQ(snapshot.state, IncidentState::AwaitingApproval);

    engine_->resolveApproval(pending.front().id, ApprovalDecision::Reject);
    EXPECT_EQ(engine_->waitFor(id, 5s), IncidentState::Done);
    EXPECT_EQ(notifier_->calls(), 0);
}

TEST_F(WorkflowEngineTest, LowConfidenceVerdictRequiresApproval) {
    settings_.minConfidence = 0.6;
    auto lowConfidence = verdict("Hurricane", "Critical");
    lowConfidence.confidence = 0.3;
    source_->push(stormObservation());
    classifier_->push(lowConfidence);
    createEngine();

    engine_->submit("Harbor", 1);
    EXPECT_EQ(waitForPending(1).size(), 1u);
}

// ============================================================================
// Approval Tests
// ============================================================================

TEST_F(WorkflowEngineTest, ResolvingTwiceFailsAndKeepsFirstDecision) {
    source_->push(stormObservation());
    classifier_->push(verdict("Flood", "Low"));
    notifier_->push(ok());
    createEngine();

    const auto id = engine_->submit("Harbor", 1);
    const auto pending = waitForPending(1);
    ASSERT_EQ(pending.size(), 1u);
    const auto requestId = pending.front().id;

    engine_->resolveApproval(requestId, ApprovalDecision::Reject);
    EXPECT_THROW(engine_->resolveApproval(requestId, ApprovalDecision::Approve),
                 InvalidStateException);

    EXPECT_EQ(engine_->waitFor(id, 5s), IncidentState::Done);
    const auto request = engine_->approvalGate()->getRequest(requestId);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->resolution, ApprovalResolution::Rejected);
    EXPECT_EQ(notifier_->calls(), 0);
}

TEST_F(WorkflowEngineTest, ResolvingUnknownRequestFails) {
    createEngine();
    EXPECT_THROW(
        engine_->resolveApproval("no-such-request", ApprovalDecision::Approve),
        ApprovalNotFoundException);
}

TEST_F(WorkflowEngineTest, OneApprovalRequestPerIncident) {
    source_->push(stormObservation());
    classifier_->push(verdict("Flood", "Medium"));
    createEngine();

    const std::vector<std::string> locations{"Harbor", "Ridge", "Valley"};
    const auto ids = engine_->runCycle(locations, 1);
    ASSERT_EQ(ids.size(), 3u);

    const auto pending = waitForPending(3);
    ASSERT_EQ(pending.size(), 3u);
    std::vector<std::string> owners;
    for (const auto& request : pending) {
        owners.push_back(request.incidentId);
    }
    std::sort(owners.begin(), owners.end());
    EXPECT_EQ(std::adjacent_find(owners.begin(), owners.end()), owners.end());
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(WorkflowEngineTest, DuplicateSubmissionIsRejected) {
    source_->push(stormObservation());
    classifier_->push(verdict("Flood", "Medium"));
    createEngine();

    engine_->submit("Harbor", 1);
    EXPECT_THROW(engine_->submit("Harbor", 1), DuplicateIncidentException);
    EXPECT_NO_THROW(engine_->submit("Harbor", 2));
    EXPECT_EQ(engine_->listIncidents().size(), 2u);
}

TEST_F(WorkflowEngineTest, RunCycleSkipsDuplicates) {
    source_->push(stormObservation());
    classifier_->push(verdict("Hurricane", "Critical"));
    notifier_->push(ok());
    createEngine();

    const auto first = engine_->runCycle({"Harbor", "Ridge"}, 1);
    const auto second = engine_->runCycle({"Harbor", "Ridge"}, 1);
    EXPECT_EQ(first.size(), 2u);
    EXPECT_TRUE(second.empty());
    EXPECT_TRUE(engine_->waitForAll(first, 5s));
}

TEST_F(WorkflowEngineTest, UnknownIncidentLookupFails) {
    createEngine();
    EXPECT_THROW((void)engine_->getIncident("nowhere#9"),
                 IncidentNotFoundException);
}

TEST_F(WorkflowEngineTest, ShutdownAbortsIncidentsAwaitingApproval) {
    source_->push(stormObservation());
    classifier_->push(verdict("Flood", "Low"));
    createEngine();

    const auto id = engine_->submit("Harbor", 1);
    ASSERT_EQ(waitForPending(1).size(), 1u);

    engine_->shutdown();
    EXPECT_TRUE(engine_->isShutdown());
    EXPECT_EQ(engine_->waitFor(id, 1s), IncidentState::Aborted);
    EXPECT_EQ(*engine_->getIncident(id).abortReason, "shutdown");
    EXPECT_TRUE(engine_->pendingApprovals().empty());
    EXPECT_THROW(engine_->submit("Ridge", 1), InvalidStateException);
}

TEST_F(WorkflowEngineTest, ClosedGateAbortsIncidentReachingApproval) {
    source_->push(stormObservation());
    classifier_->push(verdict("Flood", "Low"));
    createEngine();
    // The gate closes between the shutdown check and the request
    engine_->approvalGate()->closeAll();

    const auto id = engine_->submit("Harbor", 1);
    EXPECT_EQ(engine_->waitFor(id, 5s), IncidentState::Aborted);
    EXPECT_EQ(*engine_->getIncident(id).abortReason, "shutdown");
    EXPECT_TRUE(engine_->pendingApprovals().empty());
    EXPECT_EQ(sink_->recordsFor(id).back().kind, AuditEventKind::Aborted);
}

TEST_F(WorkflowEngineTest, ForgetDropsOnlyFinishedIncidents) {
    source_->push(stormObservation());
    classifier_->push(verdict("Flood", "Low"));
    createEngine();

    const auto done = engine_->submit("Harbor", 1);
    auto pending = waitForPending(1);
    ASSERT_EQ(pending.size(), 1u);
    engine_->resolveApproval(pending.front().id, ApprovalDecision::Reject);
    ASSERT_EQ(engine_->waitFor(done, 5s), IncidentState::Done);

    const auto waiting = engine_->submit("Ridge", 1);
    pending = waitForPending(1);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(engine_->approvalGate()->size(), 2u);

    const auto kept = engine_->forget({done, waiting, "nowhere#1"});
    EXPECT_EQ(kept, std::vector<std::string>{waiting});
    EXPECT_EQ(engine_->incidentCount(), 1u);
    EXPECT_THROW((void)engine_->getIncident(done), IncidentNotFoundException);
    EXPECT_EQ(engine_->getIncident(waiting).state,
              IncidentState::AwaitingApproval);

    const auto gate = engine_->approvalGate();
    EXPECT_EQ(gate->size(), 1u);
    EXPECT_FALSE(gate->findByIncident(done).has_value());
    EXPECT_TRUE(gate->findByIncident(waiting).has_value());
}

TEST_F(WorkflowEngineTest, EngineReleasedWhileIncidentRunsFinishesIt) {
    source_->setLatency(50ms);
    source_->push(stormObservation());
    classifier_->push(verdict("Hurricane", "Critical"));
    notifier_->push(ok());

    std::weak_ptr<app::EventLoop> weakLoop;
    std::weak_ptr<WorkflowEngine> weakEngine;
    {
        auto loop = std::make_shared<app::EventLoop>(2);
        auto engine = WorkflowEngine::create(
            loop, Capabilities{source_, classifier_, notifier_},
            SeverityPolicy(), audit_, settings_);
        engine->submit("Harbor", 1);
        weakLoop = loop;
        weakEngine = engine;
    }

    // The last reference now lives in a task running on the loop itself
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while ((!weakEngine.expired() || !weakLoop.expired()) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(weakEngine.expired());
    EXPECT_TRUE(weakLoop.expired());

    const auto records = sink_->recordsFor("Harbor#1");
    ASSERT_FALSE(records.empty());
    EXPECT_EQ(records.back().kind, AuditEventKind::Dispatched);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST_F(WorkflowEngineTest, SlowLocationDoesNotDelayOthers) {
    loop_ = std::make_shared<app::EventLoop>(1);
    settings_.observationTimeout = 2s;
    classifier_->push(verdict("Severe Storm", "High"));
    notifier_->push(ok());
    auto source = std::make_shared<SlowLocationSource>(
        std::map<std::string, std::chrono::milliseconds>{{"Harbor", 800ms}});
    engine_ = WorkflowEngine::create(
        loop_, Capabilities{source, classifier_, notifier_}, SeverityPolicy(),
        audit_, settings_);

    const auto started = std::chrono::steady_clock::now();
    const auto slow = engine_->submit("Harbor", 1);
    const auto fast = engine_->submit("Ridge", 1);

    EXPECT_EQ(engine_->waitFor(fast, 5s), IncidentState::Dispatched);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 400ms);
    EXPECT_EQ(engine_->getIncident(slow).state,
              IncidentState::PendingObservation);
    EXPECT_EQ(engine_->waitFor(slow, 5s), IncidentState::Dispatched);
}

TEST_F(WorkflowEngineTest, HungProviderTimesOutOnSchedule) {
    loop_ = std::make_shared<app::EventLoop>(1);
    settings_.observationTimeout = 50ms;
    settings_.observationRetry =
        RetryConfig(RetryStrategy::None, 0, 0ms, 0ms, 1.0);
    auto source = std::make_shared<SlowLocationSource>(
        std::map<std::string, std::chrono::milliseconds>{{"Harbor", 1s}});
    engine_ = WorkflowEngine::create(
        loop_, Capabilities{source, classifier_, notifier_}, SeverityPolicy(),
        audit_, settings_);

    const auto started = std::chrono::steady_clock::now();
    const auto id = engine_->submit("Harbor", 1);
    EXPECT_EQ(engine_->waitFor(id, 5s), IncidentState::Aborted);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);

    const auto records = sink_->recordsFor(id);
    ASSERT_FALSE(records.empty());
    EXPECT_THAT(records.back().payload["detail"].get<std::string>(),
                HasSubstr("Timeout"));
}

TEST_F(WorkflowEngineTest, ApprovalExpiryIsNotDelayedBySlowProviders) {
    loop_ = std::make_shared<app::EventLoop>(1);
    settings_.observationTimeout = 5s;
    settings_.approvalTimeout = 100ms;
    classifier_->push(verdict("Flood", "Low"));
    auto source = std::make_shared<SlowLocationSource>(
        std::map<std::string, std::chrono::milliseconds>{{"Harbor", 1500ms}});
    engine_ = WorkflowEngine::create(
        loop_, Capabilities{source, classifier_, notifier_}, SeverityPolicy(),
        audit_, settings_);

    const auto started = std::chrono::steady_clock::now();
    engine_->submit("Harbor", 1);
    const auto ridge = engine_->submit("Ridge", 1);

    EXPECT_EQ(engine_->waitFor(ridge, 5s), IncidentState::Done);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 700ms);
    EXPECT_EQ(engine_->getIncident(ridge).approval->resolution,
              ApprovalResolution::Expired);
}

TEST_F(WorkflowEngineTest, LocationsProgressConcurrently) {
    loop_ = std::make_shared<app::EventLoop>(1);
    settings_.capabilityThreads = 6;
    classifier_->push(verdict("Severe Storm", "High"));
    notifier_->push(ok());
    const std::vector<std::string> locations{"Harbor", "Ridge",  "Valley",
                                             "Summit", "Marsh", "Delta"};
    std::map<std::string, std::chrono::milliseconds> latency;
    for (const auto& location : locations) {
        latency.emplace(location, 150ms);
    }
    engine_ = WorkflowEngine::create(
        loop_,
        Capabilities{std::make_shared<SlowLocationSource>(latency),
                     classifier_, notifier_},
        SeverityPolicy(), audit_, settings_);

    const auto started = std::chrono::steady_clock::now();
    const auto ids = engine_->runCycle(locations, 1);
    ASSERT_TRUE(engine_->waitForAll(ids, 5s));
    // One after another the observations alone would take 900 ms
    EXPECT_LT(std::chrono::steady_clock::now() - started, 600ms);

    for (const auto& id : ids) {
        EXPECT_EQ(engine_->getIncident(id).state, IncidentState::Dispatched);
        const auto replayed = AuditLog::replay(sink_->recordsFor(id));
        ASSERT_TRUE(replayed.has_value()) << replayed.error();
        EXPECT_EQ(*replayed, IncidentState::Dispatched);
    }
}

// ============================================================================
// Response Plan Tests
// ============================================================================

TEST_F(WorkflowEngineTest, ResponsePlanReachesAlertAndAudit) {
    auto mock = std::make_shared<MockNotifier>();
    EXPECT_CALL(*mock, send(_, _,
                            HasSubstr("Emergency Response Response Plan:\n"
                                      "1. Open shelters."),
                            _))
        .Times(1)
        .WillOnce(Return(ok()));
    auto planner = std::make_shared<ScriptedPlanner>();
    planner->push(std::string("1. Open shelters."));

    source_->push(stormObservation());
    classifier_->push(verdict("Severe Storm", "High"));
    engine_ = WorkflowEngine::create(
        loop_, Capabilities{source_, classifier_, mock, planner},
        SeverityPolicy(), audit_, settings_);

    EXPECT_EQ(runIncident(), IncidentState::Dispatched);
    EXPECT_EQ(planner->calls(), 1);

    const auto snapshot = engine_->getIncident("Harbor#1");
    ASSERT_TRUE(snapshot.responsePlan.has_value());
    EXPECT_EQ(*snapshot.responsePlan, "1. Open shelters.");
    EXPECT_EQ(snapshot.toJson()["responsePlan"], "1. Open shelters.");

    const auto records = sink_->recordsFor("Harbor#1");
    ASSERT_FALSE(records.empty());
    EXPECT_EQ(records.back().kind, AuditEventKind::Dispatched);
    EXPECT_EQ(records.back().payload["responsePlan"], "1. Open shelters.");
    ::testing::Mock::VerifyAndClearExpectations(mock.get());
}

TEST_F(WorkflowEngineTest, FailedPlanningStillDispatchesOnce) {
    auto mock = std::make_shared<MockNotifier>();
    EXPECT_CALL(*mock, send(_, _, ::testing::Not(HasSubstr("Response Plan:")),
                            _))
        .Times(1)
        .WillOnce(Return(ok()));
    auto planner = std::make_shared<ScriptedPlanner>();
    planner->push(std::unexpected(
        PlanningError{PlanningErrorCode::Unavailable, "model offline"}));

    source_->push(stormObservation());
    classifier_->push(verdict("Severe Storm", "High"));
    engine_ = WorkflowEngine::create(
        loop_, Capabilities{source_, classifier_, mock, planner},
        SeverityPolicy(), audit_, settings_);

    EXPECT_EQ(runIncident(), IncidentState::Dispatched);
    EXPECT_EQ(planner->calls(), 1);
    EXPECT_FALSE(engine_->getIncident("Harbor#1").responsePlan.has_value());
    EXPECT_FALSE(
        sink_->recordsFor("Harbor#1").back().payload.contains("responsePlan"));
    ::testing::Mock::VerifyAndClearExpectations(mock.get());
}

TEST_F(WorkflowEngineTest, SlowPlannerTimesOutBeforeApproval) {
    settings_.planningTimeout = 50ms;
    auto planner = std::make_shared<ScriptedPlanner>();
    planner->push(std::string("late plan"));
    planner->setLatency(1s);

    source_->push(stormObservation());
    classifier_->push(verdict("Flood", "Medium"));
    engine_ = WorkflowEngine::create(
        loop_, Capabilities{source_, classifier_, notifier_, planner},
        SeverityPolicy(), audit_, settings_);

    const auto started = std::chrono::steady_clock::now();
    const auto id = engine_->submit("Harbor", 1);
    const auto pending = waitForPending(1);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 800ms);
    EXPECT_FALSE(engine_->getIncident(id).responsePlan.has_value());
}

// ============================================================================
// Audit Tests
// ============================================================================

TEST_F(WorkflowEngineTest, ReplayReconstructsFinalStates) {
    source_->push(stormObservation());
    classifier_->push(verdict("Severe Storm", "High"));
    notifier_->push(notifyFailure(NotifyErrorCode::Transient, "busy"));
    notifier_->push(ok());
    createEngine();

    const auto ids = engine_->runCycle({"Harbor", "Ridge", "Valley"}, 1);
    ASSERT_TRUE(engine_->waitForAll(ids, 5s));

    for (const auto& id : ids) {
        const auto records = sink_->recordsFor(id);
        ASSERT_FALSE(records.empty());
        for (size_t i = 0; i < records.size(); ++i) {
            EXPECT_EQ(records[i].sequence, i + 1);
        }
        const auto replayed = AuditLog::replay(records);
        ASSERT_TRUE(replayed.has_value()) << replayed.error();
        EXPECT_EQ(*replayed, engine_->getIncident(id).state);
    }
}

TEST_F(WorkflowEngineTest, UnavailableAuditSinkDoesNotBlockIncidents) {
    sink_->setAvailable(false);
    source_->push(stormObservation());
    classifier_->push(verdict("Hurricane", "Critical"));
    notifier_->push(ok());
    createEngine();

    EXPECT_EQ(runIncident(), IncidentState::Dispatched);
    EXPECT_TRUE(audit_->isDegraded());
    EXPECT_GT(audit_->failureCount(), 0u);
    EXPECT_EQ(sink_->size(), 0u);
}
