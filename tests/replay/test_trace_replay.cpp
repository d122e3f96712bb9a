/*
Beacon — Trace Replay Tests
Role: Verify trace parsing errors and that recorded traces reproduce gestures through the full stack
Testing Strategy: Inline JSON traces; TraceReplayer drives its own virtual clock
*/
#include <gtest/gtest.h>
#include <string>
#include <QFile>
#include <QTemporaryDir>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include "replay/TraceReader.hpp"
#include "replay/TraceReplayer.hpp"

// =============================================================================
// TraceReader
// =============================================================================

TEST(TraceReader, ParsesSamplesAndOptions) {
    const PointerTrace trace = TraceReader::parse(R"({
        "scrollTop": 120,
        "refreshMs": 250,
        "refreshFails": true,
        "samples": [
            {"x": 1, "y": 2, "t": 10, "phase": "start"},
            {"x": 3, "y": 4, "t": 20, "phase": "move", "pointerId": 7},
            {"x": 3, "y": 4, "t": 20, "phase": "end", "pointerId": 7}
        ]
    })");

    EXPECT_DOUBLE_EQ(trace.scrollTop, 120.0);
    EXPECT_EQ(trace.refreshMs, 250);
    EXPECT_TRUE(trace.refreshFails);
    ASSERT_EQ(trace.samples.size(), 3u);
    EXPECT_EQ(trace.samples[0].pointerId, 0);
    EXPECT_EQ(trace.samples[1].phase, PointerPhase::Move);
    EXPECT_EQ(trace.samples[1].pointerId, 7);
    EXPECT_EQ(trace.samples[2].t, 20);
}

TEST(TraceReader, OptionalFieldsDefault) {
    const PointerTrace trace = TraceReader::parse(R"({"samples": []})");
    EXPECT_DOUBLE_EQ(trace.scrollTop, 0.0);
    EXPECT_EQ(trace.refreshMs, 0);
    EXPECT_FALSE(trace.refreshFails);
    EXPECT_TRUE(trace.samples.empty());
}

TEST(TraceReader, AcceptsParsedDocuments) {
    nlohmann::json document;
    document["scrollTop"] = 40;
    document["samples"] = nlohmann::json::array({
        {{"x", 1}, {"y", 1}, {"t", 0}, {"phase", "start"}},
        {{"x", 1}, {"y", 1}, {"t", 5}, {"phase", "cancel"}}
    });

    const PointerTrace trace = TraceReader::parse(document);
    EXPECT_DOUBLE_EQ(trace.scrollTop, 40.0);
    ASSERT_EQ(trace.samples.size(), 2u);
    EXPECT_EQ(trace.samples[1].phase, PointerPhase::Cancel);
}

TEST(TraceReader, RejectsMalformedTraces) {
    EXPECT_THROW(TraceReader::parse("{not json"), std::runtime_error);
    EXPECT_THROW(TraceReader::parse("[1, 2]"), std::runtime_error);
    EXPECT_THROW(TraceReader::parse(R"({"scrollTop": 0})"), std::runtime_error);
    EXPECT_THROW(TraceReader::parse(R"({"samples": [42]})"), std::runtime_error);
    EXPECT_THROW(TraceReader::parse(R"({"samples": [{"x": 1, "t": 0, "phase": "start"}]})"),
                 std::runtime_error);
    EXPECT_THROW(TraceReader::parse(R"({"samples": [{"x": 1, "y": 1, "t": 0, "phase": "hover"}]})"),
                 std::runtime_error);
    EXPECT_THROW(TraceReader::parse(R"({"samples": [
                    {"x": 1, "y": 1, "t": 50, "phase": "start"},
                    {"x": 1, "y": 1, "t": 40, "phase": "end"}]})"),
                 std::runtime_error);
}

TEST(TraceReader, ErrorNamesTheOffendingSample) {
    try {
        TraceReader::parse(R"({"samples": [{"x": 0, "y": 0, "t": 0, "phase": "start"},
                                           {"x": 0, "y": 0, "t": 5, "phase": "lift"}]})");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("sample 1"), std::string::npos);
    }
}

TEST(TraceReader, ReadsFromDisk) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("trace.json");

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(R"({"samples": [{"x": 5, "y": 6, "t": 1, "phase": "start"}]})");
    file.close();

    const PointerTrace trace = TraceReader::readFile(path.toStdString());
    ASSERT_EQ(trace.samples.size(), 1u);
    EXPECT_DOUBLE_EQ(trace.samples[0].x, 5.0);

    EXPECT_THROW(TraceReader::readFile(dir.filePath("missing.json").toStdString()), std::runtime_error);
}

// =============================================================================
// TraceReplayer
// =============================================================================

class TraceReplayerTest : public ::testing::Test {
protected:
    static std::vector<GestureType> typesOf(const ReplayResult& result) {
        std::vector<GestureType> types;
        for (const auto& event : result.gestures) types.push_back(event.type);
        return types;
    }

    TraceReplayer replayer;
};

TEST_F(TraceReplayerTest, QuickPressIsATapWithRipple) {
    replayer.setRippleTarget(QRectF(0, 0, 400, 400));
    const PointerTrace trace = TraceReader::parse(R"({
        "scrollTop": 300,
        "samples": [
            {"x": 100, "y": 100, "t": 1000, "phase": "start"},
            {"x": 103, "y": 101, "t": 1080, "phase": "end"}
        ]
    })");

    const ReplayResult result = replayer.run(trace);
    ASSERT_EQ(result.gestures.size(), 1u);
    EXPECT_EQ(result.gestures[0].type, GestureType::Tap);
    EXPECT_EQ(result.ripplesCreated, 1u);
    EXPECT_GT(result.endTimeMs, 1080);
}

TEST_F(TraceReplayerTest, HorizontalFlingIsASwipe) {
    const PointerTrace trace = TraceReader::parse(R"({
        "scrollTop": 300,
        "samples": [
            {"x": 200, "y": 100, "t": 0, "phase": "start"},
            {"x": 150, "y": 102, "t": 40, "phase": "move"},
            {"x": 100, "y": 104, "t": 80, "phase": "end"}
        ]
    })");

    const ReplayResult result = replayer.run(trace);
    EXPECT_EQ(typesOf(result), std::vector<GestureType>{GestureType::SwipeLeft});
    EXPECT_EQ(result.ripplesCreated, 0u);
}

TEST_F(TraceReplayerTest, HeldPressIsALongPress) {
    const PointerTrace trace = TraceReader::parse(R"({
        "scrollTop": 300,
        "samples": [
            {"x": 50, "y": 50, "t": 0, "phase": "start"},
            {"x": 52, "y": 51, "t": 700, "phase": "end"}
        ]
    })");

    const ReplayResult result = replayer.run(trace);
    EXPECT_EQ(typesOf(result),
              (std::vector<GestureType>{GestureType::LongPressStart, GestureType::LongPressEnd}));
}

TEST_F(TraceReplayerTest, PullAtTopTriggersRefresh) {
    const PointerTrace trace = TraceReader::parse(R"({
        "scrollTop": 0,
        "refreshMs": 300,
        "samples": [
            {"x": 100, "y": 10, "t": 0, "phase": "start"},
            {"x": 100, "y": 100, "t": 50, "phase": "move"},
            {"x": 100, "y": 200, "t": 100, "phase": "move"},
            {"x": 100, "y": 200, "t": 150, "phase": "end"}
        ]
    })");

    const ReplayResult result = replayer.run(trace);
    EXPECT_EQ(typesOf(result), std::vector<GestureType>{GestureType::RefreshTriggered});
    EXPECT_EQ(result.refreshesStarted, 1);
    EXPECT_EQ(result.refreshesSucceeded, 1);
    EXPECT_EQ(result.refreshesFailed, 0);
}

TEST_F(TraceReplayerTest, FailingRefreshIsReported) {
    const PointerTrace trace = TraceReader::parse(R"({
        "scrollTop": 0,
        "refreshMs": 100,
        "refreshFails": true,
        "samples": [
            {"x": 100, "y": 10, "t": 0, "phase": "start"},
            {"x": 100, "y": 250, "t": 80, "phase": "move"},
            {"x": 100, "y": 250, "t": 90, "phase": "end"}
        ]
    })");

    const ReplayResult result = replayer.run(trace);
    EXPECT_EQ(result.refreshesStarted, 1);
    EXPECT_EQ(result.refreshesFailed, 1);
}

TEST_F(TraceReplayerTest, ShortPullIsNotARefresh) {
    const PointerTrace trace = TraceReader::parse(R"({
        "scrollTop": 0,
        "samples": [
            {"x": 100, "y": 10, "t": 0, "phase": "start"},
            {"x": 100, "y": 60, "t": 50, "phase": "move"},
            {"x": 100, "y": 60, "t": 100, "phase": "end"}
        ]
    })");

    const ReplayResult result = replayer.run(trace);
    EXPECT_TRUE(result.gestures.empty());
    EXPECT_EQ(result.refreshesStarted, 0);
}

TEST_F(TraceReplayerTest, SwipeUpAtTopIsHandedToRecognizer) {
    const PointerTrace trace = TraceReader::parse(R"({
        "scrollTop": 0,
        "samples": [
            {"x": 100, "y": 300, "t": 0, "phase": "start"},
            {"x": 101, "y": 250, "t": 40, "phase": "move"},
            {"x": 102, "y": 200, "t": 80, "phase": "end"}
        ]
    })");

    const ReplayResult result = replayer.run(trace);
    EXPECT_EQ(typesOf(result), std::vector<GestureType>{GestureType::SwipeUp});
}

TEST_F(TraceReplayerTest, EmptyTraceProducesNothing) {
    const ReplayResult result = replayer.run(PointerTrace{});
    EXPECT_TRUE(result.gestures.empty());
    EXPECT_EQ(result.refreshesStarted, 0);
}

TEST_F(TraceReplayerTest, RecordedFixtureReplays) {
    const PointerTrace trace = TraceReader::readFile(std::string(BEACON_TEST_TRACES) + "/pull_to_refresh.json");

    const ReplayResult result = replayer.run(trace);
    EXPECT_EQ(typesOf(result), (std::vector<GestureType>{GestureType::RefreshTriggered, GestureType::Tap}));
    EXPECT_EQ(result.refreshesSucceeded, 1);
}
