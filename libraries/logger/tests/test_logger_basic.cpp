#include <gtest/gtest.h>
#include "Logger.h"
#include "ILoggable.h"
#include <memory>

using namespace Cellvox::Log;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger = std::make_unique<Logger>("TestLogger", true);
    }

    std::unique_ptr<Logger> logger;
};

// ============================================================================
// Basic Logging Tests
// ============================================================================

TEST_F(LoggerTest, LoggerCreationEnabled) {
    EXPECT_TRUE(logger->IsEnabled());
    EXPECT_EQ(logger->GetName(), "TestLogger");
}

TEST_F(LoggerTest, LoggerCreationDisabledByDefault) {
    Logger disabledLogger("Disabled");
    EXPECT_FALSE(disabledLogger.IsEnabled());
}

TEST_F(LoggerTest, LevelNameAppearsInEntry) {
    logger->Warning("Group limit approaching");
    std::string logs = logger->ExtractLogs();
    EXPECT_NE(logs.find("Group limit approaching"), std::string::npos);
    EXPECT_NE(logs.find("[WARNING]"), std::string::npos);
    EXPECT_NE(logs.find("[TestLogger]"), std::string::npos);
}

TEST_F(LoggerTest, DisabledLoggerDoesNotLog) {
    logger->SetEnabled(false);
    logger->Info("Should not log");

    EXPECT_EQ(logger->GetEntryCount(), 0u);
    EXPECT_EQ(logger->ExtractLogs().find("Should not log"), std::string::npos);
}

TEST_F(LoggerTest, MinLevelFiltersLowerLevels) {
    logger->SetMinLevel(LogLevel::LOG_WARNING);
    logger->Debug("debug entry");
    logger->Info("info entry");
    logger->Error("error entry");

    EXPECT_EQ(logger->GetEntryCount(), 1u);
    EXPECT_NE(logger->ExtractLogs().find("error entry"), std::string::npos);
}

TEST_F(LoggerTest, ClearRemovesLogs) {
    logger->Info("Message 1");
    logger->Clear();
    EXPECT_EQ(logger->ExtractLogs().find("Message 1"), std::string::npos);
}

// ============================================================================
// Hierarchical Logging Tests
// ============================================================================

TEST_F(LoggerTest, ExtractLogsIncludesChildren) {
    logger->Info("Parent message");

    auto childLogger = std::make_shared<Logger>("Child", true);
    childLogger->Info("Child message");
    logger->AddChild(childLogger);

    std::string logs = logger->ExtractLogs();
    EXPECT_NE(logs.find("Parent message"), std::string::npos);
    EXPECT_NE(logs.find("Child message"), std::string::npos);
    EXPECT_NE(logs.find("=== Logger: Child ==="), std::string::npos);
}

TEST_F(LoggerTest, RemoveChildLogger) {
    auto childLogger = std::make_shared<Logger>("ChildLogger", true);
    logger->AddChild(childLogger);
    ASSERT_EQ(logger->GetChildren().size(), 1u);

    logger->RemoveChild(childLogger.get());
    EXPECT_TRUE(logger->GetChildren().empty());
}

TEST_F(LoggerTest, ClearAllClearsChildrenToo) {
    auto childLogger = std::make_shared<Logger>("Child", true);
    childLogger->Info("Child message");
    logger->AddChild(childLogger);

    logger->ClearAll();

    EXPECT_EQ(childLogger->GetEntryCount(), 0u);
}

// ============================================================================
// Level parsing
// ============================================================================

TEST(LogLevelParseTest, AcceptsKnownNamesCaseInsensitive) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::LOG_DEBUG);
    EXPECT_EQ(ParseLogLevel("Info"), LogLevel::LOG_INFO);
    EXPECT_EQ(ParseLogLevel("WARNING"), LogLevel::LOG_WARNING);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::LOG_ERROR);
    EXPECT_EQ(ParseLogLevel("critical"), LogLevel::LOG_CRITICAL);
}

TEST(LogLevelParseTest, RejectsUnknownNames) {
    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
    EXPECT_FALSE(ParseLogLevel("").has_value());
}

// ============================================================================
// ILoggable
// ============================================================================

namespace {

class LoggableSubsystem : public ILoggable {
public:
    LoggableSubsystem() { InitializeLogger("Subsystem", true); }
    void doWork() { LOG_INFO("working"); }
};

class SilentSubsystem : public ILoggable {
public:
    void doWork() { LOG_INFO("never recorded"); }
};

} // namespace

TEST(ILoggableTest, SubsystemLogsUnderParent) {
    Logger parent("Parent", true);
    LoggableSubsystem subsystem;
    subsystem.RegisterToParentLogger(&parent);

    subsystem.doWork();

    ASSERT_EQ(parent.GetChildren().size(), 1u);
    EXPECT_NE(parent.ExtractLogs().find("working"), std::string::npos);

    subsystem.DeregisterFromParentLogger(&parent);
    EXPECT_TRUE(parent.GetChildren().empty());
}

TEST(ILoggableTest, MissingLoggerIsNoOp) {
    SilentSubsystem subsystem;
    EXPECT_EQ(subsystem.GetLogger(), nullptr);
    subsystem.doWork();
}

TEST(ILoggableTest, MinLevelForwardsToLogger) {
    LoggableSubsystem subsystem;
    subsystem.SetLoggerMinLevel(LogLevel::LOG_ERROR);
    subsystem.doWork();
    EXPECT_EQ(subsystem.GetLogger()->GetEntryCount(), 0u);
}

// ============================================================================
// Structured entries
// ============================================================================

TEST_F(LoggerTest, EntriesKeepLevelAndMessage) {
    logger->Info("first");
    logger->Error("second");

    const auto& entries = logger->GetEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::LOG_INFO);
    EXPECT_EQ(entries[0].message, "first");
    EXPECT_EQ(entries[1].level, LogLevel::LOG_ERROR);

    const std::string line = logger->FormatEntry(entries[1]);
    EXPECT_NE(line.find("[TestLogger] [ERROR] second"), std::string::npos);
}

TEST_F(LoggerTest, CountEntriesAcrossTree) {
    auto child = std::make_shared<Logger>("Child", true);
    logger->AddChild(child);

    logger->Warning("parent warning");
    logger->Debug("parent debug");
    child->Error("child error");

    EXPECT_EQ(logger->CountEntries(LogLevel::LOG_WARNING), 1u);
    EXPECT_EQ(logger->CountEntries(LogLevel::LOG_WARNING, true), 2u);
    EXPECT_EQ(logger->CountEntries(LogLevel::LOG_DEBUG, true), 3u);
}

TEST(LogLevelNameTest, NamesRoundTripThroughParse) {
    for (LogLevel level : {LogLevel::LOG_DEBUG, LogLevel::LOG_INFO, LogLevel::LOG_WARNING,
                           LogLevel::LOG_ERROR, LogLevel::LOG_CRITICAL}) {
        EXPECT_EQ(ParseLogLevel(std::string(LogLevelName(level))), level);
    }
}
