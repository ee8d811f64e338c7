#include <gtest/gtest.h>
#include <flowcanvas/common/Logger.h>
#include <flowcanvas/backends/SpdlogBackend.h>

#include <memory>
#include <string>
#include <vector>

using namespace flowcanvas;

namespace {

/// Backend that records what reaches it
class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<std::string>* sink) : sink_(sink) {}

    void log(LogLevel level, const std::string& message, const std::source_location&) override {
        if (level >= level_) {
            sink_->push_back(message);
        }
    }
    void setLevel(LogLevel level) override { level_ = level; }
    void flush() override {}

private:
    std::vector<std::string>* sink_;
    LogLevel level_ = LogLevel::Trace;
};

}  // namespace

static void emitWarning(int index) {
    LOG_WARN("skipping malformed event at index {}", index);
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<RecordingBackend>(&received_));
        Logger::clearCapturedLogs();
        Logger::enableCapture(true);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::setCaptureCapacity(10000);
        Logger::clearCapturedLogs();
        Logger::setBackend(nullptr);
    }

    std::vector<std::string> received_;
};

// ============== Capture ==============

TEST_F(LoggerTest, CapturesFormattedMessage) {
    LOG_INFO("loaded {} event(s)", 3);

    auto logs = Logger::getCapturedLogs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("[info]"), std::string::npos);
    EXPECT_NE(logs[0].find("loaded 3 event(s)"), std::string::npos);
}

TEST_F(LoggerTest, PrefixesCallingFunction) {
    emitWarning(7);

    auto logs = Logger::getCapturedLogs("malformed");
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("emitWarning() - "), std::string::npos);
    EXPECT_NE(logs[0].find("index 7"), std::string::npos);
}

TEST_F(LoggerTest, PatternFilter) {
    LOG_DEBUG("alpha");
    LOG_WARN("beta");
    LOG_ERROR("alpha beta");

    EXPECT_EQ(Logger::getCapturedLogs("alpha").size(), 2u);
    EXPECT_EQ(Logger::getCapturedLogs("beta").size(), 2u);
    EXPECT_EQ(Logger::getCapturedLogs("gamma").size(), 0u);
}

TEST_F(LoggerTest, MaxLinesKeepsMostRecent) {
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("line {}", i);
    }

    auto logs = Logger::getCapturedLogs("", 2);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_NE(logs[0].find("line 3"), std::string::npos);
    EXPECT_NE(logs[1].find("line 4"), std::string::npos);
}

TEST_F(LoggerTest, MinLevelFilter) {
    LOG_DEBUG("reducer rejected event");
    LOG_WARN("skipping malformed event");
    LOG_ERROR("persist failed");

    auto logs = Logger::getCapturedLogs("", 0, LogLevel::Warn);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_NE(logs[0].find("[warn]"), std::string::npos);
    EXPECT_NE(logs[1].find("[error]"), std::string::npos);
}

TEST_F(LoggerTest, CaptureCapacityDropsOldest) {
    Logger::setCaptureCapacity(3);
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("event {}", i);
    }

    auto logs = Logger::getCapturedLogs();
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_NE(logs[0].find("event 2"), std::string::npos);
    EXPECT_NE(logs[2].find("event 4"), std::string::npos);
}

TEST_F(LoggerTest, DisabledCaptureStoresNothing) {
    Logger::enableCapture(false);
    EXPECT_FALSE(Logger::isCaptureEnabled());

    LOG_WARN("not kept");
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, ClearCapturedLogs) {
    LOG_INFO("something");
    Logger::clearCapturedLogs();
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

// ============== Backend injection ==============

TEST_F(LoggerTest, InjectedBackendReceivesMessages) {
    LOG_ERROR("store unavailable");

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_NE(received_[0].find("store unavailable"), std::string::npos);
}

TEST_F(LoggerTest, BackendLevelFiltersOutput) {
    Logger::setLevel(LogLevel::Warn);

    LOG_DEBUG("hidden");
    LOG_WARN("shown");

    ASSERT_EQ(received_.size(), 1u);
    EXPECT_NE(received_[0].find("shown"), std::string::npos);

    // Capture is independent of the backend level
    EXPECT_EQ(Logger::getCapturedLogs("hidden").size(), 1u);
}

// ============== Level names ==============

TEST(SpdlogBackendTest, ParseLevel) {
    EXPECT_EQ(SpdlogBackend::parseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(SpdlogBackend::parseLevel("WARNING"), LogLevel::Warn);
    EXPECT_EQ(SpdlogBackend::parseLevel("err"), LogLevel::Error);
    EXPECT_EQ(SpdlogBackend::parseLevel("off"), LogLevel::Off);
    EXPECT_FALSE(SpdlogBackend::parseLevel("verbose").has_value());
}

TEST(SpdlogBackendTest, ConvertLevel) {
    EXPECT_EQ(SpdlogBackend::convertLevel(LogLevel::Warn), spdlog::level::warn);
    EXPECT_EQ(SpdlogBackend::convertLevel(LogLevel::Error), spdlog::level::err);
    EXPECT_STREQ(logLevelTag(LogLevel::Critical), "critical");
}
