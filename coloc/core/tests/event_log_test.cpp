#include <coloc/core/event_log.hpp>
#include <coloc/core/error.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace coloc::core;
using coloc::test::ManualClock;
using coloc::test::RecordingWriter;

class EventLogTest : public ::testing::Test {
protected:
    JobCatalog catalog{{JobSpec{"blackscholes", {"run"}, "", std::nullopt}}};
    JobId job = *catalog.find("blackscholes");
    ManualClock clock{time_from_seconds(100.0)};
    RecordingWriter writer;
    EventLog log{writer, clock, catalog};
};

TEST_F(EventLogTest, RecordsCarryTimeTickAndSubject) {
    log.set_tick(3);
    log.job_start(ServiceSubject{}, CoreSet{0}, 4);
    clock.advance(duration_from_seconds(0.5));
    log.set_tick(4);
    log.job_start(job, CoreSet{1, 2, 3}, 3);

    ASSERT_EQ(writer.records.size(), 2u);
    const auto& first = writer.records[0];
    EXPECT_EQ(first.kind, "job_start");
    EXPECT_EQ(first.time, time_from_seconds(100.0));
    EXPECT_EQ(first.at("tick"), "3");
    EXPECT_EQ(first.at("subject"), "service");
    EXPECT_EQ(first.at("cores"), "[0]");
    EXPECT_EQ(first.at("threads"), "4");

    const auto& second = writer.records[1];
    EXPECT_EQ(second.time, time_from_seconds(100.5));
    EXPECT_EQ(second.at("subject"), "blackscholes");
    EXPECT_EQ(log.record_count(), 2u);
}

TEST_F(EventLogTest, CoresUpdatedCarriesPreviousCores) {
    log.job_start(ServiceSubject{}, CoreSet{0}, 4);
    log.cores_updated(ServiceSubject{}, CoreSet{0, 1}, 93.5);
    log.cores_updated(ServiceSubject{}, CoreSet{0});

    auto updates = writer.of_kind("cores_updated");
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].at("old_cores"), "[0]");
    EXPECT_EQ(updates[0].at("cores"), "[0,1]");
    EXPECT_TRUE(updates[0].has("utilization"));
    EXPECT_EQ(updates[1].at("old_cores"), "[0,1]");
    EXPECT_FALSE(updates[1].has("utilization"));
    EXPECT_EQ(log.recorded_cores(ServiceSubject{}), (CoreSet{0}));
}

TEST_F(EventLogTest, JobEndForgetsCores) {
    log.job_start(job, CoreSet{2, 3}, 2);
    log.job_end(job, "completed");

    EXPECT_FALSE(log.recorded_cores(job).has_value());
    EXPECT_EQ(writer.records.back().at("status"), "completed");
}

TEST_F(EventLogTest, NotesCarryLevelOnlyWhenNotInfo) {
    log.note(SchedulerSubject{}, "total_execution_time_12.000_seconds");
    log.note(job, "start_failed", NoteLevel::Error);

    auto notes = writer.of_kind("custom_note");
    ASSERT_EQ(notes.size(), 2u);
    EXPECT_EQ(notes[0].at("subject"), "scheduler");
    EXPECT_FALSE(notes[0].has("level"));
    EXPECT_EQ(notes[1].at("level"), "error");
}

TEST_F(EventLogTest, PauseAndResumeHaveNoPayload) {
    log.job_pause(job);
    log.job_resume(job);

    ASSERT_EQ(writer.records.size(), 2u);
    EXPECT_EQ(writer.records[0].kind, "job_pause");
    EXPECT_EQ(writer.records[1].kind, "job_resume");
    EXPECT_EQ(writer.records[1].fields.size(), 2u);  // tick + subject
}

TEST_F(EventLogTest, CloseReachesWriterOnce) {
    log.close();
    log.close();
    EXPECT_TRUE(log.closed());
    EXPECT_EQ(writer.close_calls, 1);
    EXPECT_THROW(log.note(SchedulerSubject{}, "late"), InvalidStateError);
}
