#include <coloc/core/controller.hpp>
#include <coloc/core/error.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>

using namespace coloc::core;
using namespace coloc::test;

namespace {

JobSpec job(const std::string& name) {
    return JobSpec{name, {"/bin/true"}, "", std::nullopt};
}

Thresholds scenario_thresholds() {
    Thresholds t;
    t.high = 90.0;
    t.low = 50.0;
    t.eviction = 95.0;
    t.restore = 50.0;
    return t;
}

} // anonymous namespace

// ============================================================================
// Fixture
// ============================================================================

class ControllerTest : public ::testing::Test {
protected:
    static constexpr uint32_t kCores = 4;

    JobCatalog catalog{{job("alpha"), job("beta"), job("gamma")}};
    ManualClock clock;
    ScriptedMonitor monitor{kCores};
    FakeAffinityController affinity{"memcached"};
    FakeJobRunner runner{clock};
    RecordingWriter writer;
    EventLog log{writer, clock, catalog};
    std::unique_ptr<ColocationController> controller;

    ControllerConfig make_config(Thresholds thresholds = scenario_thresholds()) {
        ControllerConfig config;
        config.service_process = "memcached";
        config.layout = CoreLayout::standard(kCores);
        config.thresholds = thresholds;
        return config;
    }

    void build(Thresholds thresholds = scenario_thresholds()) {
        controller = std::make_unique<ColocationController>(make_config(thresholds), catalog,
                                                            monitor, affinity, runner, log, clock);
        controller->start();
    }

    JobId id(const std::string& name) const { return *catalog.find(name); }

    TickReport tick_at(double usage) {
        monitor.push_home(usage);
        return controller->tick();
    }
};

// ============================================================================
// Startup
// ============================================================================

TEST_F(ControllerTest, StartPinsServiceAndFillsSlot) {
    build();

    EXPECT_EQ(affinity.cores(), (CoreSet{0}));
    EXPECT_EQ(controller->service_cores(), (CoreSet{0}));
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);

    auto starts = writer.of_kind("job_start");
    ASSERT_EQ(starts.size(), 2u);
    EXPECT_EQ(starts[0].at("subject"), "service");
    EXPECT_EQ(starts[0].at("cores"), "[0]");
    EXPECT_EQ(starts[0].at("threads"), "4");
    EXPECT_EQ(starts[1].at("subject"), "alpha");
    EXPECT_EQ(starts[1].at("cores"), "[1,2,3]");
    EXPECT_EQ(starts[1].at("threads"), "3");
    EXPECT_EQ(starts[1].at("tick"), "0");

    EXPECT_EQ(controller->queue().pending().size(), 2u);
    EXPECT_THROW(controller->start(), InvalidStateError);
}

TEST_F(ControllerTest, TickBeforeStartThrows) {
    controller = std::make_unique<ColocationController>(make_config(), catalog, monitor, affinity,
                                                        runner, log, clock);
    EXPECT_THROW(controller->tick(), InvalidStateError);
}

TEST_F(ControllerTest, RejectsMonitorOfDifferentWidth) {
    ScriptedMonitor wide{8};
    EXPECT_THROW((void)ColocationController(make_config(), catalog, wide, affinity, runner, log, clock),
                 OutOfRangeError);
}

TEST_F(ControllerTest, MissingServiceIsRetriedEachTick) {
    affinity.set_present(false);
    build();

    EXPECT_FALSE(controller->service_pinned());
    EXPECT_TRUE(writer.has_note_containing("pin_failed not_found"));
    EXPECT_TRUE(runner.launched("alpha"));

    auto report = controller->tick();
    EXPECT_EQ(report.action, TickAction::ServiceMissing);
    EXPECT_EQ(monitor.calls(), 0);
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);

    affinity.set_present(true);
    report = tick_at(70.0);
    EXPECT_EQ(report.action, TickAction::None);
    EXPECT_TRUE(controller->service_pinned());
    EXPECT_EQ(writer.for_subject("service").front().kind, "custom_note");
    EXPECT_EQ(writer.of_kind("job_start").back().at("subject"), "service");
}

// ============================================================================
// Scenarios
// ============================================================================

// 4 cores, 3 jobs, samples 95/95/40 with high=90, eviction=95, low=50.
TEST_F(ControllerTest, ScaleUpWithoutEvictionThenScaleDown) {
    build();

    auto first = tick_at(95.0);
    EXPECT_EQ(first.action, TickAction::ScaledUp);
    EXPECT_EQ(controller->state(), ColocationState::Colocated);
    EXPECT_EQ(affinity.cores(), (CoreSet{0, 1}));

    auto second = tick_at(95.0);
    EXPECT_EQ(second.action, TickAction::None);
    EXPECT_EQ(controller->state(), ColocationState::Colocated);
    EXPECT_TRUE(controller->evicted().empty());

    auto third = tick_at(40.0);
    EXPECT_EQ(third.action, TickAction::ScaledDown);
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);
    EXPECT_EQ(affinity.cores(), (CoreSet{0}));

    EXPECT_EQ(runner.launch_of("alpha").reassignments, 0);
    auto updates = writer.of_kind("cores_updated");
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].at("old_cores"), "[0]");
    EXPECT_EQ(updates[0].at("cores"), "[0,1]");
    EXPECT_EQ(updates[0].at("tick"), "1");
    EXPECT_EQ(updates[1].at("old_cores"), "[0,1]");
    EXPECT_EQ(updates[1].at("cores"), "[0]");
    EXPECT_EQ(updates[1].at("tick"), "3");
}

TEST_F(ControllerTest, CompletionStartsNextJobInSameTick) {
    build();
    runner.finish("alpha");

    auto report = tick_at(70.0);

    auto ends = writer.of_kind("job_end");
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_EQ(ends[0].at("subject"), "alpha");
    EXPECT_EQ(ends[0].at("status"), "completed");

    auto starts = writer.of_kind("job_start");
    ASSERT_EQ(starts.size(), 3u);
    EXPECT_EQ(starts[2].at("subject"), "beta");
    EXPECT_EQ(starts[2].at("cores"), "[1,2,3]");
    EXPECT_EQ(starts[2].at("tick"), std::to_string(report.tick));
    EXPECT_EQ(ends[0].at("tick"), std::to_string(report.tick));

    EXPECT_TRUE(runner.launch_of("alpha").released);
    EXPECT_TRUE(writer.has_note_containing("execution_time_"));
    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Completed);
    EXPECT_EQ(controller->queue().state_of(id("beta")), JobState::Running);
}

TEST_F(ControllerTest, FailedAffinityCallLeavesStateAndRetries) {
    build();
    affinity.fail_next(ErrorKind::Transient);

    auto failed = tick_at(95.0);
    EXPECT_EQ(failed.action, TickAction::ActionFailed);
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);
    EXPECT_EQ(controller->service_cores(), (CoreSet{0}));
    EXPECT_TRUE(writer.has_note_containing("set_affinity_failed transient"));
    EXPECT_TRUE(writer.of_kind("cores_updated").empty());

    auto retried = tick_at(95.0);
    EXPECT_EQ(retried.action, TickAction::ScaledUp);
    EXPECT_EQ(controller->state(), ColocationState::Colocated);
    EXPECT_EQ(controller->service_cores(), (CoreSet{0, 1}));
}

TEST_F(ControllerTest, DrainLogsTotalTimeAndClosesOnce) {
    runner.complete_after("alpha", duration_from_seconds(10.0));
    runner.complete_after("beta", duration_from_seconds(5.0));
    runner.complete_after("gamma", duration_from_seconds(3.0));
    controller = std::make_unique<ColocationController>(make_config(), catalog, monitor, affinity,
                                                        runner, log, clock);
    std::atomic<bool> stop{false};

    auto outcome = controller->run(stop);

    EXPECT_EQ(outcome, RunOutcome::Drained);
    EXPECT_TRUE(controller->finished());
    EXPECT_EQ(writer.close_calls, 1);
    EXPECT_TRUE(log.closed());

    TimePoint first_start;
    TimePoint last_end;
    bool seen_start = false;
    for (const auto& record : writer.records) {
        if (record.at("subject") == "service") {
            continue;
        }
        if (record.kind == "job_start" && !seen_start) {
            first_start = record.time;
            seen_start = true;
        }
        if (record.kind == "job_end") {
            last_end = record.time;
        }
    }
    ASSERT_TRUE(seen_start);
    EXPECT_EQ(controller->queue().total_elapsed(), last_end - first_start);
    // Ticks every 800 ms: completions observed at 10.4 s, 16.0 s and 19.2 s.
    EXPECT_EQ(controller->queue().total_elapsed(), duration_from_seconds(19.2));
    EXPECT_TRUE(writer.has_note_containing("total_execution_time_19.200_seconds"));
    EXPECT_EQ(writer.of_kind("job_end").size(), 3u);
}

// ============================================================================
// Eviction and restoration
// ============================================================================

// Two shared cores, each lent to one job slot.
class TwoSlotControllerTest : public ControllerTest {
protected:
    static constexpr uint32_t kWideCores = 5;
    ScriptedMonitor wide_monitor{kWideCores};

    ControllerConfig make_wide_config(Thresholds thresholds = scenario_thresholds()) {
        ControllerConfig config;
        config.service_process = "memcached";
        config.layout.core_count = kWideCores;
        config.layout.home = CoreSet{0};
        config.layout.shared = CoreSet{1, 2};
        config.layout.slots = {CoreSet{1, 3}, CoreSet{2, 4}};
        config.thresholds = thresholds;
        return config;
    }

    void build_wide(Thresholds thresholds = scenario_thresholds()) {
        controller = std::make_unique<ColocationController>(
            make_wide_config(thresholds), catalog, wide_monitor, affinity, runner, log, clock);
        controller->start();
    }

    TickReport wide_tick(double usage) {
        wide_monitor.push_home(usage);
        return controller->tick();
    }

    CoreSet cores_of(const std::string& name) const {
        return controller->queue().find_running(id(name))->cores;
    }
};

TEST_F(TwoSlotControllerTest, EvictionIsMonotonicUnderSustainedLoad) {
    build_wide();
    EXPECT_EQ(cores_of("alpha"), (CoreSet{1, 3}));
    EXPECT_EQ(cores_of("beta"), (CoreSet{2, 4}));

    EXPECT_EQ(wide_tick(92.0).action, TickAction::ScaledUp);
    EXPECT_EQ(affinity.cores(), (CoreSet{0, 1, 2}));

    std::size_t previous = 0;
    EXPECT_EQ(wide_tick(99.0).action, TickAction::Evicted);
    EXPECT_EQ(cores_of("alpha"), (CoreSet{3}));
    EXPECT_EQ(controller->state(), ColocationState::Colocated);
    EXPECT_GE(controller->evicted().size(), previous);
    previous = controller->evicted().size();

    EXPECT_EQ(wide_tick(99.0).action, TickAction::Evicted);
    EXPECT_EQ(cores_of("beta"), (CoreSet{4}));
    EXPECT_EQ(controller->state(), ColocationState::Isolated);
    EXPECT_GE(controller->evicted().size(), previous);

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(wide_tick(99.0).action, TickAction::None);
        EXPECT_EQ(controller->evicted().size(), 2u);
        EXPECT_EQ(controller->state(), ColocationState::Isolated);
    }

    for (const auto& running : controller->queue().running()) {
        EXPECT_FALSE(running.cores.intersects(controller->service_cores()));
    }
}

TEST_F(TwoSlotControllerTest, RestorationIsLastInFirstOut) {
    build_wide();
    wide_tick(92.0);
    wide_tick(99.0);
    wide_tick(99.0);
    ASSERT_EQ(controller->state(), ColocationState::Isolated);
    ASSERT_EQ(controller->evicted(), (std::vector<JobId>{id("alpha"), id("beta")}));

    auto first = wide_tick(30.0);
    EXPECT_EQ(first.action, TickAction::Readmitted);
    EXPECT_EQ(controller->state(), ColocationState::Colocated);
    EXPECT_EQ(cores_of("beta"), (CoreSet{2, 4}));
    EXPECT_EQ(cores_of("alpha"), (CoreSet{3}));

    auto second = wide_tick(30.0);
    EXPECT_EQ(second.action, TickAction::Readmitted);
    EXPECT_EQ(cores_of("alpha"), (CoreSet{1, 3}));
    EXPECT_TRUE(controller->evicted().empty());

    auto third = wide_tick(30.0);
    EXPECT_EQ(third.action, TickAction::ScaledDown);
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);

    auto updates = writer.of_kind("cores_updated");
    std::vector<std::string> readmitted;
    for (const auto& record : updates) {
        if (record.at("subject") != "service" && record.at("old_cores").size() < record.at("cores").size()) {
            readmitted.push_back(record.at("subject"));
        }
    }
    EXPECT_EQ(readmitted, (std::vector<std::string>{"beta", "alpha"}));
}

TEST_F(TwoSlotControllerTest, EvictionFailureKeepsJobColocated) {
    build_wide();
    wide_tick(92.0);
    runner.fail_next_reassign(ErrorKind::Permanent);

    EXPECT_EQ(wide_tick(99.0).action, TickAction::ActionFailed);
    EXPECT_EQ(cores_of("alpha"), (CoreSet{1, 3}));
    EXPECT_TRUE(controller->evicted().empty());
    EXPECT_EQ(controller->state(), ColocationState::Colocated);
    EXPECT_TRUE(writer.has_note_containing("eviction_failed permanent"));

    EXPECT_EQ(wide_tick(99.0).action, TickAction::Evicted);
    EXPECT_EQ(cores_of("alpha"), (CoreSet{3}));
}

TEST_F(TwoSlotControllerTest, EvictedJobCompletionLeavesStack) {
    build_wide();
    wide_tick(92.0);
    wide_tick(99.0);
    ASSERT_EQ(controller->evicted(), (std::vector<JobId>{id("alpha")}));

    runner.finish("alpha");
    wide_tick(80.0);

    // With nothing left evicted the shared core is no longer reserved.
    EXPECT_TRUE(controller->evicted().empty());
    EXPECT_EQ(cores_of("gamma"), (CoreSet{1, 3}));
    EXPECT_FALSE(writer.has_note_containing("displaced_from_shared_cores"));
}

TEST_F(TwoSlotControllerTest, JobsStartedDuringEvictionAreDisplaced) {
    runner.complete_after("beta", duration_from_seconds(1.0));
    build_wide();
    wide_tick(92.0);
    wide_tick(99.0);
    ASSERT_EQ(controller->evicted(), (std::vector<JobId>{id("alpha")}));

    // beta finishes while alpha is still evicted: gamma must stay off core 2.
    clock.advance(duration_from_seconds(2.0));
    wide_tick(80.0);

    EXPECT_EQ(controller->state(), ColocationState::Colocated);
    EXPECT_EQ(cores_of("gamma"), (CoreSet{4}));
    EXPECT_EQ(controller->evicted(), (std::vector<JobId>{id("alpha"), id("gamma")}));
    EXPECT_TRUE(writer.has_note_containing("displaced_from_shared_cores"));
}

TEST_F(ControllerTest, JobsStartedWhileIsolatedAreDisplaced) {
    build();
    tick_at(92.0);
    EXPECT_EQ(tick_at(99.0).action, TickAction::Evicted);
    ASSERT_EQ(controller->state(), ColocationState::Isolated);
    EXPECT_EQ(runner.launch_of("alpha").cores, (CoreSet{2, 3}));

    runner.finish("alpha");
    tick_at(99.0);
    EXPECT_EQ(runner.launch_of("beta").cores, (CoreSet{2, 3}));
    EXPECT_EQ(controller->evicted(), (std::vector<JobId>{id("beta")}));

    EXPECT_EQ(tick_at(30.0).action, TickAction::Readmitted);
    EXPECT_EQ(controller->state(), ColocationState::Colocated);
    EXPECT_EQ(runner.launch_of("beta").cores, (CoreSet{1, 2, 3}));
}

TEST_F(ControllerTest, IsolatedWithNothingEvictedShrinksStraightBack) {
    build();
    tick_at(92.0);
    tick_at(99.0);
    ASSERT_EQ(controller->state(), ColocationState::Isolated);
    runner.finish("alpha");
    runner.fail_next_start(ErrorKind::Transient);
    tick_at(80.0);  // alpha retires; starting beta fails
    ASSERT_TRUE(controller->evicted().empty());
    ASSERT_TRUE(controller->queue().running().empty());

    EXPECT_EQ(tick_at(30.0).action, TickAction::ScaledDown);
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);
    EXPECT_EQ(affinity.cores(), (CoreSet{0}));
}

TEST_F(ControllerTest, NoColocatedJobMeansDirectIsolation) {
    build();
    // beta fails to start on the next two ticks, leaving the slot empty.
    runner.fail_next_start(ErrorKind::Transient);
    runner.fail_next_start(ErrorKind::Transient);
    runner.finish("alpha");
    tick_at(70.0);
    ASSERT_TRUE(controller->queue().running().empty());

    EXPECT_EQ(tick_at(92.0).action, TickAction::ScaledUp);
    ASSERT_TRUE(controller->queue().running().empty());
    EXPECT_EQ(tick_at(99.0).action, TickAction::Isolated);
    EXPECT_EQ(controller->state(), ColocationState::Isolated);
}

// ============================================================================
// Failure handling
// ============================================================================

TEST_F(ControllerTest, MonitorFailureSkipsEvaluation) {
    build();
    monitor.push_failure(ErrorKind::Transient);

    auto report = controller->tick();
    EXPECT_EQ(report.action, TickAction::SampleFailed);
    EXPECT_FALSE(report.utilization.has_value());
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);
    EXPECT_TRUE(writer.has_note_containing("sample_failed transient"));
}

TEST_F(ControllerTest, StartFailureKeepsJobQueuedAndRetriesLater) {
    runner.fail_next_start(ErrorKind::Transient);
    build();

    EXPECT_FALSE(runner.launched("alpha"));
    EXPECT_EQ(controller->queue().pending().front(), id("alpha"));
    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Queued);
    EXPECT_TRUE(writer.has_note_containing("start_failed transient"));
    EXPECT_EQ(runner.start_calls(), 1);

    tick_at(70.0);
    EXPECT_TRUE(runner.launched("alpha"));
    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Running);
}

TEST_F(ControllerTest, PermanentStartFailureFailsJobAndStartsNext) {
    runner.fail_starts_of("alpha", ErrorKind::Permanent);
    build();

    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Failed);
    EXPECT_EQ(controller->queue().state_of(id("beta")), JobState::Running);
    EXPECT_TRUE(runner.launched("beta"));
    EXPECT_EQ(runner.start_calls(), 2);
    EXPECT_TRUE(writer.has_note_containing("start_failed permanent"));
    EXPECT_TRUE(writer.has_note_containing("start_abandoned_after_1_attempts"));

    auto ends = writer.of_kind("job_end");
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_EQ(ends.front().at("subject"), "alpha");
    EXPECT_EQ(ends.front().at("status"), "failed");

    tick_at(70.0);
    EXPECT_EQ(runner.start_calls(), 2);
}

TEST_F(ControllerTest, TransientStartFailureGivesUpAfterAttemptLimit) {
    runner.fail_starts_of("alpha", ErrorKind::Transient);
    build();
    ASSERT_EQ(make_config().max_start_attempts, 3u);

    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Queued);
    EXPECT_FALSE(runner.launched("beta"));

    tick_at(70.0);
    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Queued);
    EXPECT_EQ(controller->queue().pending().front(), id("alpha"));
    EXPECT_FALSE(runner.launched("beta"));

    tick_at(70.0);
    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Failed);
    EXPECT_TRUE(runner.launched("beta"));
    EXPECT_EQ(runner.start_calls(), 4);
    EXPECT_TRUE(writer.has_note_containing("start_abandoned_after_3_attempts"));
}

TEST_F(ControllerTest, NotFoundStartFailureUsesConfiguredAttemptLimit) {
    runner.fail_starts_of("alpha", ErrorKind::NotFound);
    auto config = make_config();
    config.max_start_attempts = 1;
    controller = std::make_unique<ColocationController>(config, catalog, monitor, affinity,
                                                        runner, log, clock);
    controller->start();

    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Failed);
    EXPECT_TRUE(runner.launched("beta"));
    EXPECT_TRUE(writer.has_note_containing("start_failed not_found"));
}

TEST_F(ControllerTest, JobThatNeverStartsDoesNotBlockTheQueue) {
    JobCatalog jobs{{job("broken"), job("good")}};
    EventLog jobs_log{writer, clock, jobs};
    runner.fail_starts_of("broken", ErrorKind::Permanent);
    runner.complete_after("good", duration_from_seconds(2.0));
    ColocationController ctl(make_config(), jobs, monitor, affinity, runner, jobs_log, clock);
    std::atomic<bool> stop{false};

    EXPECT_EQ(ctl.run(stop), RunOutcome::Drained);
    EXPECT_TRUE(ctl.finished());
    EXPECT_TRUE(runner.launched("good"));
    EXPECT_EQ(ctl.queue().state_of(*jobs.find("broken")), JobState::Failed);
    EXPECT_EQ(ctl.queue().state_of(*jobs.find("good")), JobState::Completed);
    EXPECT_EQ(runner.start_calls(), 2);
    EXPECT_TRUE(writer.has_note_containing("total_execution_time_"));
}

TEST_F(ControllerTest, RunDrainsWhenNoJobCanStart) {
    runner.fail_starts_of("alpha", ErrorKind::Permanent);
    runner.fail_starts_of("beta", ErrorKind::Permanent);
    runner.fail_starts_of("gamma", ErrorKind::Transient);
    controller = std::make_unique<ColocationController>(make_config(), catalog, monitor, affinity,
                                                        runner, log, clock);
    std::atomic<bool> stop{false};

    EXPECT_EQ(controller->run(stop), RunOutcome::Drained);
    EXPECT_EQ(runner.launch_count(), 0u);
    EXPECT_EQ(runner.start_calls(), 5);
    EXPECT_EQ(controller->queue().completed().size(), 3u);
    EXPECT_FALSE(writer.has_note_containing("total_execution_time_"));
    EXPECT_EQ(writer.close_calls, 1);
}

TEST_F(ControllerTest, FailedJobIsRetiredAsFailed) {
    build();
    runner.finish("alpha", RunStatus::Failed);
    tick_at(70.0);

    EXPECT_EQ(controller->queue().state_of(id("alpha")), JobState::Failed);
    EXPECT_EQ(writer.of_kind("job_end").front().at("status"), "failed");
}

TEST_F(ControllerTest, ExceptionInsideTickIsLoggedAndLoopContinues) {
    runner.complete_after("alpha", duration_from_seconds(1.0));
    runner.complete_after("beta", duration_from_seconds(1.0));
    runner.complete_after("gamma", duration_from_seconds(1.0));
    monitor.throw_next();
    controller = std::make_unique<ColocationController>(make_config(), catalog, monitor, affinity,
                                                        runner, log, clock);
    std::atomic<bool> stop{false};

    EXPECT_EQ(controller->run(stop), RunOutcome::Drained);
    EXPECT_TRUE(writer.has_note_containing("tick 1 failed: monitor exploded"));
}

// ============================================================================
// Pause / resume
// ============================================================================

TEST_F(ControllerTest, PauseAndResumeJob) {
    build();
    auto alpha = id("alpha");

    ASSERT_TRUE(controller->pause_job(alpha).ok());
    EXPECT_EQ(controller->queue().state_of(alpha), JobState::Paused);
    EXPECT_EQ(runner.launch_of("alpha").status, RunStatus::Paused);
    EXPECT_FALSE(controller->pause_job(alpha).ok());

    tick_at(70.0);
    EXPECT_EQ(controller->queue().state_of(alpha), JobState::Paused);

    ASSERT_TRUE(controller->resume_job(alpha).ok());
    EXPECT_EQ(controller->queue().state_of(alpha), JobState::Running);
    EXPECT_FALSE(controller->resume_job(alpha).ok());
    EXPECT_FALSE(controller->pause_job(id("gamma")).ok());

    EXPECT_EQ(writer.of_kind("job_pause").size(), 1u);
    EXPECT_EQ(writer.of_kind("job_resume").size(), 1u);
}

// ============================================================================
// Interrupt
// ============================================================================

TEST_F(ControllerTest, InterruptStopsRunningJobs) {
    std::atomic<bool> stop{false};
    clock.on_sleep = [this, &stop] {
        if (clock.slept() >= duration_from_seconds(2.0)) {
            stop = true;
        }
    };
    controller = std::make_unique<ColocationController>(make_config(), catalog, monitor, affinity,
                                                        runner, log, clock);

    EXPECT_EQ(controller->run(stop), RunOutcome::Interrupted);

    EXPECT_EQ(runner.launch_of("alpha").stops, 1);
    EXPECT_TRUE(runner.launch_of("alpha").released);
    auto ends = writer.of_kind("job_end");
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_EQ(ends[0].at("status"), "stopped");
    EXPECT_TRUE(writer.has_note_containing("shutdown_with_2_pending_jobs"));
    EXPECT_EQ(writer.close_calls, 1);
    EXPECT_EQ(affinity.cores(), controller->service_cores());

    // Shutting down again has no further effect.
    EXPECT_TRUE(controller->shutdown());
    EXPECT_EQ(writer.close_calls, 1);
}

TEST_F(ControllerTest, InterruptWithFailedStopReportsIncompleteCleanup) {
    std::atomic<bool> stop{true};
    runner.fail_stops(true);
    controller = std::make_unique<ColocationController>(make_config(), catalog, monitor, affinity,
                                                        runner, log, clock);

    EXPECT_EQ(controller->run(stop), RunOutcome::InterruptedIncomplete);
    EXPECT_TRUE(writer.has_note_containing("stop_failed transient"));
    EXPECT_EQ(writer.close_calls, 1);
}

// ============================================================================
// Invariants over a long scripted run
// ============================================================================

TEST_F(TwoSlotControllerTest, InvariantsHoldEveryTick) {
    runner.complete_after("alpha", duration_from_seconds(6.0));
    runner.complete_after("beta", duration_from_seconds(9.0));
    runner.complete_after("gamma", duration_from_seconds(4.0));
    build_wide();

    const std::vector<double> usages = {70, 92, 99, 99, 99, 97, 40, 30, 30, 20, 93, 96, 99,
                                        60, 45, 99, 30, 98, 99, 20, 20, 20, 20, 70, 70, 70};
    const auto all = CoreSet::first_n(kWideCores);
    const auto& layout = controller->config().layout;

    for (double usage : usages) {
        if (controller->finished()) {
            break;
        }
        clock.advance(duration_from_milliseconds(800));
        wide_tick(usage);

        EXPECT_EQ(affinity.cores(), controller->service_cores());
        EXPECT_TRUE(controller->service_cores().is_subset_of(all));

        CoreSet used = controller->service_cores();
        for (const auto& running : controller->queue().running()) {
            EXPECT_FALSE(running.cores.empty());
            EXPECT_TRUE(running.cores.is_subset_of(layout.slots[running.slot]));
            used = used.unite(running.cores);
            if (controller->state() == ColocationState::Isolated) {
                EXPECT_FALSE(running.cores.intersects(controller->service_cores()));
            }
        }
        EXPECT_TRUE(used.is_subset_of(all));

        for (auto job_id : catalog.ids()) {
            int places = 0;
            for (auto pending : controller->queue().pending()) {
                places += pending == job_id ? 1 : 0;
            }
            places += controller->queue().find_running(job_id) != nullptr ? 1 : 0;
            for (const auto& finished : controller->queue().completed()) {
                places += finished.id == job_id ? 1 : 0;
            }
            EXPECT_EQ(places, 1);
        }

        for (auto evicted : controller->evicted()) {
            EXPECT_NE(controller->queue().find_running(evicted), nullptr);
        }
    }

    // Every cores_updated names the cores its subject held before.
    std::map<std::string, std::string> last;
    for (const auto& record : writer.records) {
        const auto& subject = record.at("subject");
        if (record.kind == "job_start") {
            last[subject] = record.at("cores");
        } else if (record.kind == "cores_updated") {
            EXPECT_EQ(record.at("old_cores"), last[subject]) << "subject " << subject;
            last[subject] = record.at("cores");
        } else if (record.kind == "job_end") {
            last.erase(subject);
        }
    }
}

// ============================================================================
// Threshold boundaries
// ============================================================================

struct ThresholdCase {
    Thresholds thresholds;
};

class ThresholdBoundaryTest : public ControllerTest,
                              public ::testing::WithParamInterface<ThresholdCase> {};

TEST_P(ThresholdBoundaryTest, ComparisonsAreStrict) {
    const auto t = GetParam().thresholds;
    build(t);

    EXPECT_EQ(tick_at(t.high).action, TickAction::None);
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);
    EXPECT_EQ(tick_at(t.high + 0.5).action, TickAction::ScaledUp);

    EXPECT_EQ(tick_at(t.eviction).action, TickAction::None);
    EXPECT_EQ(tick_at(t.eviction + 0.5).action, TickAction::Evicted);
    EXPECT_EQ(controller->state(), ColocationState::Isolated);

    EXPECT_EQ(tick_at(t.restore).action, TickAction::None);
    EXPECT_EQ(tick_at(t.restore - 0.5).action, TickAction::Readmitted);
    EXPECT_EQ(controller->state(), ColocationState::Colocated);

    EXPECT_EQ(tick_at(t.low).action, TickAction::None);
    EXPECT_EQ(tick_at(t.low - 0.5).action, TickAction::ScaledDown);
    EXPECT_EQ(controller->state(), ColocationState::SoloCore);
}

INSTANTIATE_TEST_SUITE_P(
    Watermarks, ThresholdBoundaryTest,
    ::testing::Values(ThresholdCase{Thresholds{90.0, 50.0, 95.0, 50.0}},
                      ThresholdCase{Thresholds{88.0, 50.0, 75.0, 50.0}},
                      ThresholdCase{Thresholds{60.0, 20.0, 80.0, 10.0}}));
