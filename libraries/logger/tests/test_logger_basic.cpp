#include <gtest/gtest.h>
#include "Logger.h"
#include "ILoggable.h"
#include <memory>

using namespace Octaview::Log;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger = std::make_unique<Logger>("SliceLog", true);
    }

    std::unique_ptr<Logger> logger;
};

// ============================================================================
// Entry Formatting
// ============================================================================

TEST_F(LoggerTest, EntryCarriesNameAndLevel) {
    logger->Info("sampled 512 voxels");

    std::string logs = logger->ExtractLogs();
    EXPECT_NE(logs.find("[SliceLog]"), std::string::npos);
    EXPECT_NE(logs.find("[INFO]"), std::string::npos);
    EXPECT_NE(logs.find("sampled 512 voxels"), std::string::npos);
}

TEST_F(LoggerTest, EveryLevelHasItsTag) {
    logger->Log(LogLevel::LOG_DEBUG, "d");
    logger->Log(LogLevel::LOG_INFO, "i");
    logger->Log(LogLevel::LOG_WARNING, "w");
    logger->Log(LogLevel::LOG_ERROR, "e");
    logger->Log(LogLevel::LOG_CRITICAL, "c");

    std::string logs = logger->ExtractLogs();
    EXPECT_NE(logs.find("DEBUG"), std::string::npos);
    EXPECT_NE(logs.find("INFO"), std::string::npos);
    EXPECT_NE(logs.find("WARNING"), std::string::npos);
    EXPECT_NE(logs.find("ERROR"), std::string::npos);
    EXPECT_NE(logs.find("CRITICAL"), std::string::npos);
    EXPECT_EQ(logger->GetEntryCount(), 5u);
}

// ============================================================================
// Filtering
// ============================================================================

TEST_F(LoggerTest, DisabledLoggerDropsEntries) {
    logger->SetEnabled(false);
    EXPECT_FALSE(logger->IsEnabled());
    logger->Warning("dropped");

    EXPECT_EQ(logger->GetEntryCount(), 0u);
    EXPECT_EQ(logger->ExtractLogs().find("dropped"), std::string::npos);
}

TEST_F(LoggerTest, MinimumLevelDropsQuieterEntries) {
    logger->SetMinimumLevel(LogLevel::LOG_WARNING);
    logger->Debug("column scan");
    logger->Info("frame done");
    logger->Warning("zero step component");

    EXPECT_EQ(logger->GetEntryCount(), 1u);
    std::string logs = logger->ExtractLogs();
    EXPECT_EQ(logs.find("column scan"), std::string::npos);
    EXPECT_NE(logs.find("zero step component"), std::string::npos);
}

TEST_F(LoggerTest, ClearRemovesEntries) {
    logger->Info("one");
    logger->Info("two");
    logger->Clear();

    EXPECT_EQ(logger->GetEntryCount(), 0u);
}

// ============================================================================
// Hierarchy
// ============================================================================

TEST_F(LoggerTest, ChildrenAppearIndentedInExtract) {
    auto child = std::make_shared<Logger>("FrameRenderer", true);
    child->Info("rendered 300x300");
    logger->AddChild(child);

    std::string logs = logger->ExtractLogs();
    EXPECT_NE(logs.find("=== Logger: SliceLog ==="), std::string::npos);
    EXPECT_NE(logs.find("  === Logger: FrameRenderer ==="), std::string::npos);
    EXPECT_NE(logs.find("rendered 300x300"), std::string::npos);
}

TEST_F(LoggerTest, RemoveChildByPointer) {
    auto child = std::make_shared<Logger>("Child", true);
    logger->AddChild(child);
    logger->AddChild(nullptr);
    ASSERT_EQ(logger->GetChildren().size(), 1u);

    logger->RemoveChild(child.get());
    EXPECT_TRUE(logger->GetChildren().empty());
}

TEST_F(LoggerTest, ClearAllReachesChildren) {
    auto child = std::make_shared<Logger>("Child", true);
    child->Info("child entry");
    logger->Info("parent entry");
    logger->AddChild(child);

    logger->ClearAll();

    EXPECT_EQ(logger->GetEntryCount(), 0u);
    EXPECT_EQ(child->GetEntryCount(), 0u);
}

TEST_F(LoggerTest, ClearChildrenKeepsChildEntries) {
    auto child = std::make_shared<Logger>("Child", true);
    child->Info("kept");
    logger->AddChild(child);

    logger->ClearChildren();

    EXPECT_TRUE(logger->GetChildren().empty());
    EXPECT_EQ(child->GetEntryCount(), 1u);
}

// ============================================================================
// ILoggable
// ============================================================================

namespace {

class LoggableComponent : public ILoggable {
public:
    explicit LoggableComponent(bool withLogger) {
        if (withLogger) {
            InitializeLogger("Component", true);
        }
    }

    void DoWork() {
        OCTAVIEW_LOG_INFO("working");
    }
};

} // namespace

TEST(ILoggableTest, MacroIsNoOpWithoutLogger) {
    LoggableComponent component(false);
    EXPECT_EQ(component.GetLogger(), nullptr);
    component.DoWork();
}

TEST(ILoggableTest, RegisteredLoggerSharesEntriesWithParent) {
    Logger parent("App", true);
    LoggableComponent component(true);
    component.RegisterToParentLogger(&parent);

    component.DoWork();

    ASSERT_EQ(parent.GetChildren().size(), 1u);
    EXPECT_NE(parent.ExtractLogs().find("working"), std::string::npos);

    component.DeregisterFromParentLogger(&parent);
    EXPECT_TRUE(parent.GetChildren().empty());
}

TEST(ILoggableTest, TerminalOutputIsOffUntilRequested) {
    LoggableComponent component(true);
    EXPECT_FALSE(component.GetLogger()->HasTerminalOutput());

    component.SetLoggerTerminalOutput(true);
    EXPECT_TRUE(component.GetLogger()->HasTerminalOutput());
}

TEST(ILoggableTest, SetLoggerEnabledTogglesOutput) {
    LoggableComponent component(true);
    component.SetLoggerEnabled(false);
    component.DoWork();
    EXPECT_EQ(component.GetLogger()->GetEntryCount(), 0u);

    component.SetLoggerEnabled(true);
    component.DoWork();
    EXPECT_EQ(component.GetLogger()->GetEntryCount(), 1u);
}
