#ifndef PDFMATRIX_LOGGER_H_H
#define PDFMATRIX_LOGGER_H_H

#include "PdfMatrixPort.h"
#include <string>
#include <mutex>

enum class PM_LogLevel : int
{
    PMLOGLEVEL_TRACE = 0,
    PMLOGLEVEL_DEBUG = 1,
    PMLOGLEVEL_INFO = 2,
    PMLOGLEVEL_WARNING = 3,
    PMLOGLEVEL_ERROR = 4,
    PMLOGLEVEL_FATAL = 5,
    PMLOGLEVEL_DISABLELOG = 6
};

struct PDFMATRIX_PORT PM_LogItem
{
	std::string timestamp; // 时间戳
	PM_LogLevel level = PM_LogLevel::PMLOGLEVEL_TRACE; // 日志级别
	std::string message; // 日志消息
	std::string threadId; // 线程 ID
	std::string file; // 文件名
	int line = 0; // 行号

	// 单行 JSON（以 '\n' 结尾），写日志文件用。
	std::string ToJsonString() const;

	// "[ts] [LEVEL] [thread] [file:line] msg\n"，控制台输出用。
	std::string ToPlainTextString() const;
};

// 日志器的全部开关，默认不输出。
struct PDFMATRIX_PORT PM_LogSettings
{
	bool enabled = false; // PM_EnableLog
	bool toConsole = false; // PM_IsLogToConsole
	PM_LogLevel filterLevel = PM_LogLevel::PMLOGLEVEL_TRACE; // PM_LogLevel
	std::string filePath; // PM_LogFile，空表示不写文件
};

/*
 * @brief 进程级日志器。
 *
 * 首次使用时从 GetPmConfigPath() 读取一次 PM_EnableLog / PM_LogLevel / PM_IsLogToConsole / PM_LogFile，
 * 之后的修改只存在于内存中，不会写回配置文件。
 */
class PDFMATRIX_PORT PM_Logger
{
public:
    static PM_Logger& GetInstance();

    // 记录未被过滤且全部输出成功时返回 true；被过滤或未启用返回 false。
    bool Log(PM_LogLevel level, const std::string& msgUtf8, const char* file, int line);

    bool LogTrace(const std::string& msgUtf8, const char* file, int line);
    bool LogDebug(const std::string& msgUtf8, const char* file, int line);
    bool LogInfo(const std::string& msgUtf8, const char* file, int line);
    bool LogWarning(const std::string& msgUtf8, const char* file, int line);
    bool LogError(const std::string& msgUtf8, const char* file, int line);
    bool LogFatal(const std::string& msgUtf8, const char* file, int line);

    // 按配置文件重置设置；文件无法打开时恢复默认设置并返回 false。无法识别的级别按 TRACE 处理。
    bool ReloadConfig(const std::string& configFilePath);

    PM_LogSettings GetSettings() const;
    void SetSettings(const PM_LogSettings& newSettings);

private:
    mutable std::mutex settingsMtx;
    PM_LogSettings settings;
    std::mutex outputMtx; // 串行化控制台与文件输出

    PM_Logger();
    ~PM_Logger() = default;
	PM_Logger(const PM_Logger&) = delete;
    PM_Logger& operator=(const PM_Logger&) = delete;
};

#define PMLOG_TRACE(msg) PM_Logger::GetInstance().LogTrace((msg), __FILE__, __LINE__)
#define PMLOG_DEBUG(msg) PM_Logger::GetInstance().LogDebug((msg), __FILE__, __LINE__)
#define PMLOG_INFO(msg) PM_Logger::GetInstance().LogInfo((msg), __FILE__, __LINE__)
#define PMLOG_WARNING(msg) PM_Logger::GetInstance().LogWarning((msg), __FILE__, __LINE__)
#define PMLOG_ERROR(msg) PM_Logger::GetInstance().LogError((msg), __FILE__, __LINE__)
#define PMLOG_FATAL(msg) PM_Logger::GetInstance().LogFatal((msg), __FILE__, __LINE__)

PDFMATRIX_PORT std::string LogLevelToString(PM_LogLevel level);

// 接受 "TRACE".."DISABLELOG" 或 "0".."6"；无法识别时返回 false。
PDFMATRIX_PORT bool ParseLogLevel(const std::string& text, PM_LogLevel& level);

PDFMATRIX_PORT bool IsLogEnabled();
PDFMATRIX_PORT void SetLogEnabled(bool enable);

PDFMATRIX_PORT bool IsLogToConsole();
PDFMATRIX_PORT void SetLogToConsole(bool enable);

PDFMATRIX_PORT PM_LogLevel GetLogFilterLevel();
PDFMATRIX_PORT void SetLogFilterLevel(PM_LogLevel level);
PDFMATRIX_PORT bool CheckLogLevel(PM_LogLevel level);

// 空字符串表示不写文件。
PDFMATRIX_PORT std::string GetLogFilePath();
PDFMATRIX_PORT void SetLogFilePath(const std::string& filePathUtf8);









#endif
