#include <coloc/io/event_writers.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace coloc::io;
using namespace coloc::core;

class EventWritersTest : public ::testing::Test {
protected:
    // 2025-05-14T10:29:28.123456 UTC
    static TimePoint at(int64_t micros_after = 0) {
        return time_from_epoch(duration_from_nanoseconds(1'747'218'568'123'456'000 + micros_after * 1000));
    }

    static void write_start(EventWriter& writer) {
        writer.begin(at());
        writer.kind("job_start");
        writer.field("tick", uint64_t{3});
        writer.field("subject", "blackscholes");
        writer.field("cores", CoreSet{1, 2, 3});
        writer.field("threads", uint64_t{3});
        writer.end();
    }

    static void write_note(EventWriter& writer, std::string_view text, std::string_view level = "") {
        writer.begin(at(500'000));
        writer.kind("custom_note");
        writer.field("tick", uint64_t{4});
        writer.field("subject", "scheduler");
        writer.field("note", text);
        if (!level.empty()) {
            writer.field("level", level);
        }
        writer.end();
    }
};

// =============================================================================
// NullEventWriter
// =============================================================================

TEST_F(EventWritersTest, NullWriterAcceptsAllCalls) {
    NullEventWriter writer;
    write_start(writer);
    write_note(writer, "ignored");
    writer.close();
}

// =============================================================================
// JsonEventWriter
// =============================================================================

TEST_F(EventWritersTest, JsonWriterEmptyArray) {
    std::ostringstream oss;
    {
        JsonEventWriter writer(oss);
    }
    EXPECT_EQ(oss.str(), "[\n]\n");
}

TEST_F(EventWritersTest, JsonWriterRecordLayout) {
    std::ostringstream oss;
    JsonEventWriter writer(oss);
    write_start(writer);
    writer.begin(at(1'000'000));
    writer.kind("cores_updated");
    writer.field("tick", uint64_t{4});
    writer.field("subject", "service");
    writer.field("cores", CoreSet{0, 1});
    writer.field("old_cores", CoreSet{0});
    writer.field("utilization", 93.5);
    writer.end();
    writer.close();

    EXPECT_EQ(oss.str(),
              "[\n"
              "  {\"time\": 1747218568.123456, \"kind\": \"job_start\", \"tick\": 3, "
              "\"subject\": \"blackscholes\", \"cores\": [1,2,3], \"threads\": 3},\n"
              "  {\"time\": 1747218569.123456, \"kind\": \"cores_updated\", \"tick\": 4, "
              "\"subject\": \"service\", \"cores\": [0,1], \"old_cores\": [0], "
              "\"utilization\": 93.5}\n"
              "]\n");
}

TEST_F(EventWritersTest, JsonWriterEscapesStrings) {
    std::ostringstream oss;
    JsonEventWriter writer(oss);
    write_note(writer, "tick 3 failed: \"bad\"\n\tnext");
    writer.close();
    EXPECT_NE(oss.str().find(R"("note": "tick 3 failed: \"bad\"\n\tnext")"), std::string::npos);
    EXPECT_EQ(JsonEventWriter::escape_json_string(std::string_view("\x01", 1)), "\\u0001");
}

TEST_F(EventWritersTest, JsonWriterCloseIsIdempotent) {
    std::ostringstream oss;
    {
        JsonEventWriter writer(oss);
        write_start(writer);
        writer.close();
        writer.close();
    }
    const auto text = oss.str();
    EXPECT_EQ(text.find("]\n"), text.size() - 2);
    EXPECT_EQ(text.find(']', text.find("]\n") + 1), std::string::npos);
}

// =============================================================================
// MemoryEventWriter
// =============================================================================

TEST_F(EventWritersTest, MemoryWriterKeepsTypedFields) {
    MemoryEventWriter writer;
    write_start(writer);
    write_note(writer, "state solo_core -> colocated at 93.0%");
    writer.close();

    ASSERT_EQ(writer.records().size(), 2u);
    const auto& start = writer.records()[0];
    EXPECT_EQ(start.kind, "job_start");
    EXPECT_NEAR(start.time, 1747218568.123456, 1e-6);
    EXPECT_EQ(start.integer("tick"), 3u);
    EXPECT_EQ(start.text("subject"), "blackscholes");
    EXPECT_EQ(start.cores("cores"), (CoreSet{1, 2, 3}));
    EXPECT_EQ(start.number("threads"), 3.0);
    EXPECT_FALSE(start.text("cores").has_value());
    EXPECT_FALSE(start.cores("missing").has_value());

    EXPECT_EQ(writer.records()[1].text("note"), "state solo_core -> colocated at 93.0%");
    EXPECT_EQ(writer.close_count(), 1);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
}

// =============================================================================
// SchedulerLogWriter
// =============================================================================

TEST_F(EventWritersTest, Iso8601Timestamps) {
    EXPECT_EQ(format_iso8601(TimePoint::epoch()), "1970-01-01T00:00:00.000000");
    EXPECT_EQ(format_iso8601(at()), "2025-05-14T10:29:28.123456");
}

TEST_F(EventWritersTest, SchedulerLogLineFormat) {
    std::ostringstream oss;
    SchedulerLogWriter writer(oss);
    write_start(writer);

    writer.begin(at(1'000'000));
    writer.kind("cores_updated");
    writer.field("tick", uint64_t{4});
    writer.field("subject", "service");
    writer.field("cores", CoreSet{0, 1});
    writer.field("old_cores", CoreSet{0});
    writer.end();

    writer.begin(at(2'000'000));
    writer.kind("job_pause");
    writer.field("subject", "blackscholes");
    writer.end();

    writer.begin(at(3'000'000));
    writer.kind("job_resume");
    writer.field("subject", "blackscholes");
    writer.end();

    writer.begin(at(4'000'000));
    writer.kind("job_end");
    writer.field("subject", "blackscholes");
    writer.field("status", "completed");
    writer.end();

    write_note(writer, "total_execution_time_4.000_seconds");
    writer.close();

    EXPECT_EQ(oss.str(),
              "2025-05-14T10:29:28.123456 start blackscholes [1,2,3] 3\n"
              "2025-05-14T10:29:29.123456 update_cores service [0,1]\n"
              "2025-05-14T10:29:30.123456 pause blackscholes\n"
              "2025-05-14T10:29:31.123456 unpause blackscholes\n"
              "2025-05-14T10:29:32.123456 end blackscholes completed\n"
              "2025-05-14T10:29:28.623456 custom scheduler total_execution_time_4.000_seconds\n");
}

TEST_F(EventWritersTest, SchedulerLogColorsWarnings) {
    std::ostringstream plain;
    SchedulerLogWriter plain_writer(plain);
    write_note(plain_writer, "sample_failed transient: boom", "warning");
    EXPECT_EQ(plain.str().find('\033'), std::string::npos);

    std::ostringstream colored;
    SchedulerLogWriter color_writer(colored, true);
    write_note(color_writer, "sample_failed transient: boom", "warning");
    write_note(color_writer, "start_failed permanent: no image", "error");
    write_note(color_writer, "displaced_from_shared_cores");

    const auto text = colored.str();
    EXPECT_EQ(text.rfind("\033[33m", 0), 0u);
    EXPECT_NE(text.find("\033[31m"), std::string::npos);
    EXPECT_NE(text.find("custom scheduler displaced_from_shared_cores\n"), std::string::npos);
    EXPECT_EQ(text.find("\033[", text.find("displaced")), std::string::npos);
}

// =============================================================================
// TeeEventWriter
// =============================================================================

TEST_F(EventWritersTest, TeeForwardsToEverySink) {
    MemoryEventWriter first;
    MemoryEventWriter second;
    TeeEventWriter tee({&first, &second});

    write_start(tee);
    write_note(tee, "hello");
    tee.close();

    ASSERT_EQ(first.records().size(), 2u);
    ASSERT_EQ(second.records().size(), 2u);
    EXPECT_EQ(second.records()[0].cores("cores"), (CoreSet{1, 2, 3}));
    EXPECT_EQ(first.close_count(), 1);
    EXPECT_EQ(second.close_count(), 1);
}

// =============================================================================
// Format selection
// =============================================================================

TEST_F(EventWritersTest, ParsesFormatNames) {
    EXPECT_EQ(parse_event_format("json"), EventFormat::Json);
    EXPECT_EQ(parse_event_format("log"), EventFormat::Log);
    EXPECT_EQ(parse_event_format("null"), EventFormat::Null);
    EXPECT_FALSE(parse_event_format("csv").has_value());
    EXPECT_FALSE(parse_event_format("JSON").has_value());
}

TEST_F(EventWritersTest, NullFormatLeavesOutputUntouched) {
    std::ostringstream oss;
    {
        auto writer = make_event_writer(EventFormat::Null, oss);
        write_start(*writer);
        write_note(*writer, "dropped");
        writer->close();
    }
    EXPECT_TRUE(oss.str().empty());
}

TEST_F(EventWritersTest, FormatSelectsWriter) {
    std::ostringstream json;
    {
        auto writer = make_event_writer(EventFormat::Json, json);
        write_start(*writer);
        writer->close();
    }
    EXPECT_EQ(json.str().front(), '[');
    EXPECT_NE(json.str().find("\"blackscholes\""), std::string::npos);

    std::ostringstream log;
    auto writer = make_event_writer(EventFormat::Log, log);
    write_start(*writer);
    EXPECT_NE(log.str().find("blackscholes"), std::string::npos);
    EXPECT_NE(log.str().front(), '[');
}
