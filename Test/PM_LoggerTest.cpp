#include "PM_Logger.h"
#include "PM_Config.h"
#include "PM_Timer.h"
#include "PM_PdfMatrix.h"
#include "PM_Error.h"
#include "PM_TestEnvironment.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace
{
class LoggerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ResetTestConfig();
        logFilePath = GetTestRootDir() + "/" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log";
    }

    // 开启日志并写入文件，不回显控制台。
    void EnableFileLogging(PM_LogLevel filterLevel)
    {
        SetLogEnabled(true);
        SetLogToConsole(false);
        SetLogFilterLevel(filterLevel);
        SetLogFilePath(logFilePath);
    }

    std::string logFilePath;
};
}

TEST(LogLevelTest, ToStringAndParse)
{
    const std::vector<PM_LogLevel> levels = {
        PM_LogLevel::PMLOGLEVEL_TRACE, PM_LogLevel::PMLOGLEVEL_DEBUG, PM_LogLevel::PMLOGLEVEL_INFO,
        PM_LogLevel::PMLOGLEVEL_WARNING, PM_LogLevel::PMLOGLEVEL_ERROR, PM_LogLevel::PMLOGLEVEL_FATAL,
        PM_LogLevel::PMLOGLEVEL_DISABLELOG };
    for (size_t i = 0; i < levels.size(); i++)
    {
        PM_LogLevel parsed = PM_LogLevel::PMLOGLEVEL_TRACE;
        ASSERT_TRUE(ParseLogLevel(LogLevelToString(levels[i]), parsed));
        EXPECT_EQ(levels[i], parsed);

        parsed = PM_LogLevel::PMLOGLEVEL_TRACE;
        ASSERT_TRUE(ParseLogLevel(std::to_string(i), parsed));
        EXPECT_EQ(levels[i], parsed);
    }

    PM_LogLevel untouched = PM_LogLevel::PMLOGLEVEL_INFO;
    EXPECT_FALSE(ParseLogLevel("warning", untouched));
    EXPECT_FALSE(ParseLogLevel("7", untouched));
    EXPECT_FALSE(ParseLogLevel("", untouched));
    EXPECT_EQ(PM_LogLevel::PMLOGLEVEL_INFO, untouched);
}

TEST(TimerTest, LocalTimeStrLayout)
{
    const std::string withMs = GetLocalTimeStr();
    ASSERT_EQ(23u, withMs.size());
    EXPECT_EQ('-', withMs[4]);
    EXPECT_EQ('T', withMs[10]);
    EXPECT_EQ(':', withMs[16]);
    EXPECT_EQ('.', withMs[19]);

    EXPECT_EQ(19u, GetLocalTimeStr(false).size());
}

TEST(LogItemTest, JsonEscapesMessage)
{
    PM_LogItem item;
    item.timestamp = "2026-10-19T08:00:00.000";
    item.level = PM_LogLevel::PMLOGLEVEL_WARNING;
    item.threadId = "42";
    item.file = "Geometry/PM_PdfMatrix.cpp";
    item.line = 17;
    item.message = "quote \" backslash \\ tab \t";

    EXPECT_EQ("{\"ts\":\"2026-10-19T08:00:00.000\",\"level\":\"WARNING\",\"thread\":\"42\","
        "\"file\":\"Geometry/PM_PdfMatrix.cpp\",\"line\":17,\"msg\":\"quote \\\" backslash \\\\ tab \\t\"}\n",
        item.ToJsonString());
    EXPECT_EQ("[2026-10-19T08:00:00.000] [WARNING] [42] [Geometry/PM_PdfMatrix.cpp:17] quote \" backslash \\ tab \t\n",
        item.ToPlainTextString());
}

TEST_F(LoggerTest, DisabledByDefault)
{
    EXPECT_FALSE(IsLogEnabled());
    EXPECT_FALSE(IsLogToConsole());
    EXPECT_EQ(PM_LogLevel::PMLOGLEVEL_DISABLELOG, GetLogFilterLevel());
    EXPECT_FALSE(CheckLogLevel(PM_LogLevel::PMLOGLEVEL_FATAL));
    EXPECT_TRUE(GetLogFilePath().empty());
    EXPECT_FALSE(PMLOG_ERROR("not written"));
}

TEST_F(LoggerTest, FilterLevelDropsLowerRecords)
{
    EnableFileLogging(PM_LogLevel::PMLOGLEVEL_WARNING);
    EXPECT_EQ(PM_LogLevel::PMLOGLEVEL_WARNING, GetLogFilterLevel());
    EXPECT_FALSE(CheckLogLevel(PM_LogLevel::PMLOGLEVEL_INFO));
    EXPECT_TRUE(CheckLogLevel(PM_LogLevel::PMLOGLEVEL_ERROR));

    EXPECT_FALSE(PMLOG_INFO("dropped"));
    EXPECT_TRUE(PMLOG_ERROR("kept"));

    const std::string content = ReadWholeFile(logFilePath);
    EXPECT_EQ(std::string::npos, content.find("dropped"));
    EXPECT_NE(std::string::npos, content.find("\"level\":\"ERROR\""));
    EXPECT_NE(std::string::npos, content.find("\"msg\":\"kept\""));
    EXPECT_NE(std::string::npos, content.find("PM_LoggerTest.cpp"));
}

TEST_F(LoggerTest, DisableLogLevelSuppressesEverything)
{
    EnableFileLogging(PM_LogLevel::PMLOGLEVEL_DISABLELOG);
    EXPECT_FALSE(PMLOG_FATAL("never"));
    EXPECT_TRUE(ReadWholeFile(logFilePath).empty());
}

TEST_F(LoggerTest, InvalidConstructionIsLogged)
{
    EnableFileLogging(PM_LogLevel::PMLOGLEVEL_TRACE);
    EXPECT_THROW(PM_PdfMatrix::CreateFromShorthand(std::vector<double>{ 1, 2, 3, 4 }), PM_InvalidArgument);

    const std::string content = ReadWholeFile(logFilePath);
    EXPECT_NE(std::string::npos, content.find("\"level\":\"WARNING\""));
    EXPECT_NE(std::string::npos, content.find("CreateFromShorthand rejected arguments [1, 2, 3, 4]"));
}

TEST_F(LoggerTest, ClearingFilePathStopsFileOutput)
{
    EnableFileLogging(PM_LogLevel::PMLOGLEVEL_TRACE);
    EXPECT_EQ(logFilePath, GetLogFilePath());
    SetLogFilePath("");
    EXPECT_TRUE(GetLogFilePath().empty());

    EXPECT_TRUE(PMLOG_INFO("no sink configured"));
    EXPECT_TRUE(ReadWholeFile(logFilePath).empty());
}

TEST_F(LoggerTest, ReloadConfigAppliesFileKeys)
{
    WriteTestConfig(
        "PM_EnableLog=1\n"
        "PM_IsLogToConsole=0\n"
        "PM_LogLevel=ERROR\n"
        "PM_LogFile=" + logFilePath + "\n");
    ASSERT_TRUE(PM_Logger::GetInstance().ReloadConfig(GetPmConfigPath()));

    EXPECT_TRUE(IsLogEnabled());
    EXPECT_FALSE(IsLogToConsole());
    EXPECT_EQ(PM_LogLevel::PMLOGLEVEL_ERROR, GetLogFilterLevel());
    EXPECT_EQ(logFilePath, GetLogFilePath());

    EXPECT_FALSE(PMLOG_WARNING("below filter"));
    EXPECT_TRUE(PMLOG_FATAL("from file config"));
    const std::string content = ReadWholeFile(logFilePath);
    EXPECT_EQ(std::string::npos, content.find("below filter"));
    EXPECT_NE(std::string::npos, content.find("\"msg\":\"from file config\""));
}

TEST_F(LoggerTest, ReloadConfigKeepsFileUntouched)
{
    const std::string content = "PM_EnableLog=1\nPM_LogLevel=INFO\n";
    WriteTestConfig(content);
    ASSERT_TRUE(PM_Logger::GetInstance().ReloadConfig(GetPmConfigPath()));

    SetLogFilterLevel(PM_LogLevel::PMLOGLEVEL_FATAL);
    SetLogEnabled(false);
    EXPECT_EQ(content, ReadWholeFile(GetPmConfigPath()));
}

TEST_F(LoggerTest, ReloadConfigFromMissingFileRestoresDefaults)
{
    EnableFileLogging(PM_LogLevel::PMLOGLEVEL_ERROR);
    EXPECT_FALSE(PM_Logger::GetInstance().ReloadConfig(GetTestRootDir() + "/missing.conf"));

    EXPECT_FALSE(IsLogEnabled());
    EXPECT_TRUE(GetLogFilePath().empty());
    EXPECT_FALSE(PMLOG_FATAL("not written"));
}

TEST_F(LoggerTest, UnknownLevelFallsBackToTrace)
{
    WriteTestConfig("PM_EnableLog=1\nPM_LogLevel=verbose\n");
    ASSERT_TRUE(PM_Logger::GetInstance().ReloadConfig(GetPmConfigPath()));
    EXPECT_EQ(PM_LogLevel::PMLOGLEVEL_TRACE, GetLogFilterLevel());
    EXPECT_TRUE(CheckLogLevel(PM_LogLevel::PMLOGLEVEL_TRACE));
}

TEST_F(LoggerTest, EnableFlagMustBeOne)
{
    WriteTestConfig("PM_EnableLog=true\nPM_IsLogToConsole=yes\n");
    ASSERT_TRUE(PM_Logger::GetInstance().ReloadConfig(GetPmConfigPath()));
    EXPECT_FALSE(IsLogEnabled());
    EXPECT_FALSE(IsLogToConsole());
}
