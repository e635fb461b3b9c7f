#include "PM_Logger.h"
#include "PM_Config.h"
#include "PM_Timer.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <utility>

using namespace std;

namespace internal
{
	const static string enableLogKey = "PM_EnableLog";
	const static string logToConsoleKey = "PM_IsLogToConsole";
	const static string logLevelKey = "PM_LogLevel";
	const static string logFileKey = "PM_LogFile";

	static bool IsFlagOn(const unordered_map<string, string>& config, const string& key)
	{
		const auto it = config.find(key);
		return it != config.end() && it->second == "1";
	}

	static void AppendJsonEscaped(string& out, const string& s)
	{
		out.reserve(out.size() + s.size());
		for (size_t i = 0; i < s.size(); i++)
		{
			const unsigned char ch = static_cast<unsigned char>(s[i]);
			switch (ch)
			{
			case '\"': out += "\\\""; break;
			case '\\': out += "\\\\"; break;
			case '\b': out += "\\b";  break;
			case '\f': out += "\\f";  break;
			case '\n': out += "\\n";  break;
			case '\r': out += "\\r";  break;
			case '\t': out += "\\t";  break;
			default:
				if (ch < 0x20)
				{
					static const char* hex = "0123456789ABCDEF";
					out += "\\u00";
					out += hex[(ch >> 4) & 0xF];
					out += hex[ch & 0xF];
				}
				else
				{
					out += static_cast<char>(ch);
				}
				break;
			}
		}
	}

	// VT/ANSI 颜色转义
	static const char* GetAnsiColorByLevel(PM_LogLevel level)
	{
		switch (level)
		{
		case PM_LogLevel::PMLOGLEVEL_TRACE:   return "\x1b[90m"; // 灰
		case PM_LogLevel::PMLOGLEVEL_DEBUG:   return "\x1b[36m"; // 青
		case PM_LogLevel::PMLOGLEVEL_INFO:    return "\x1b[32m"; // 绿
		case PM_LogLevel::PMLOGLEVEL_WARNING: return "\x1b[33m"; // 黄
		case PM_LogLevel::PMLOGLEVEL_ERROR:   return "\x1b[31m"; // 红
		case PM_LogLevel::PMLOGLEVEL_FATAL:   return "\x1b[35m"; // 品红
		default:                              return "\x1b[0m";
		}
	}

	static std::ostream& SelectStream(PM_LogLevel level)
	{
		return (level >= PM_LogLevel::PMLOGLEVEL_ERROR) ? std::cerr : std::cout;
	}

	static void ConsoleWriteColored(const string& text, PM_LogLevel level)
	{
		std::ostream& os = SelectStream(level);
		os << GetAnsiColorByLevel(level) << text << "\x1b[0m";
		os.flush();
	}

	static bool AppendToFile(const string& filePath, const string& content)
	{
		ofstream ofs(filePath.c_str(), ios::out | ios::app | ios::binary);
		if (!ofs.is_open())
		{
			return false;
		}
		ofs << content;
		ofs.flush();
		return ofs.good();
	}
}

string LogLevelToString(PM_LogLevel level)
{
	switch (level)
	{
	case PM_LogLevel::PMLOGLEVEL_TRACE:			return "TRACE";
	case PM_LogLevel::PMLOGLEVEL_DEBUG:			return "DEBUG";
	case PM_LogLevel::PMLOGLEVEL_INFO:			return "INFO";
	case PM_LogLevel::PMLOGLEVEL_WARNING:		return "WARNING";
	case PM_LogLevel::PMLOGLEVEL_ERROR:			return "ERROR";
	case PM_LogLevel::PMLOGLEVEL_FATAL:			return "FATAL";
	case PM_LogLevel::PMLOGLEVEL_DISABLELOG:	return "DISABLELOG";
	default:									return "UNKNOWN";
	}
}

bool ParseLogLevel(const string& text, PM_LogLevel& level)
{
	static const pair<const char*, PM_LogLevel> table[] = {
		{ "TRACE", PM_LogLevel::PMLOGLEVEL_TRACE },
		{ "DEBUG", PM_LogLevel::PMLOGLEVEL_DEBUG },
		{ "INFO", PM_LogLevel::PMLOGLEVEL_INFO },
		{ "WARNING", PM_LogLevel::PMLOGLEVEL_WARNING },
		{ "ERROR", PM_LogLevel::PMLOGLEVEL_ERROR },
		{ "FATAL", PM_LogLevel::PMLOGLEVEL_FATAL },
		{ "DISABLELOG", PM_LogLevel::PMLOGLEVEL_DISABLELOG }
	};

	for (size_t i = 0; i < sizeof(table) / sizeof(table[0]); i++)
	{
		const string numeric(1, static_cast<char>('0' + i));
		if (text == table[i].first || text == numeric)
		{
			level = table[i].second;
			return true;
		}
	}
	return false;
}

string PM_LogItem::ToJsonString() const
{
	string out;
	out.reserve(64 + message.size() + threadId.size() + file.size());

	out += "{\"ts\":\"";
	internal::AppendJsonEscaped(out, timestamp);
	out += "\",\"level\":\"";
	out += LogLevelToString(level);
	out += "\",\"thread\":\"";
	internal::AppendJsonEscaped(out, threadId);
	out += "\",\"file\":\"";
	internal::AppendJsonEscaped(out, file);
	out += "\",\"line\":";
	out += to_string(line);
	out += ",\"msg\":\"";
	internal::AppendJsonEscaped(out, message);
	out += "\"}\n";
	return out;
}

string PM_LogItem::ToPlainTextString() const
{
	ostringstream oss;
	oss << "[" << timestamp << "] [" << LogLevelToString(level) << "] [" << threadId << "] ["
		<< file << ":" << line << "] " << message << "\n";
	return oss.str();
}

PM_Logger::PM_Logger()
{
	// 没有配置文件是常态，此时保持默认设置（不输出）
	ReloadConfig(GetPmConfigPath());
}

PM_Logger& PM_Logger::GetInstance()
{
	static PM_Logger instance;
	return instance;
}

bool PM_Logger::Log(PM_LogLevel level, const string& msgUtf8, const char* file, int line)
{
	const PM_LogSettings settings = GetSettings();
	if (!settings.enabled || settings.filterLevel == PM_LogLevel::PMLOGLEVEL_DISABLELOG || level < settings.filterLevel)
	{
		return false;
	}

	PM_LogItem logItem;
	logItem.timestamp = GetLocalTimeStr();
	logItem.level = level;
	logItem.message = msgUtf8;
	{
		ostringstream oss;
		oss << this_thread::get_id();
		logItem.threadId = oss.str();
	}
	logItem.file = file ? string(file) : string();
	replace(logItem.file.begin(), logItem.file.end(), '\\', '/');
	logItem.line = line;

	lock_guard<mutex> lock(outputMtx);
	bool success = true;
	if (!settings.filePath.empty())
	{
		success = internal::AppendToFile(settings.filePath, logItem.ToJsonString());
	}
	if (settings.toConsole)
	{
		internal::ConsoleWriteColored(logItem.ToPlainTextString(), level);
	}
	return success;
}

bool PM_Logger::ReloadConfig(const string& configFilePath)
{
	unordered_map<string, string> config;
	const bool loaded = LoadPmConfig(configFilePath, config);

	PM_LogSettings loadedSettings;
	loadedSettings.enabled = internal::IsFlagOn(config, internal::enableLogKey);
	loadedSettings.toConsole = internal::IsFlagOn(config, internal::logToConsoleKey);

	const auto levelIt = config.find(internal::logLevelKey);
	PM_LogLevel level = PM_LogLevel::PMLOGLEVEL_TRACE;
	if (levelIt != config.end() && ParseLogLevel(levelIt->second, level))
	{
		loadedSettings.filterLevel = level;
	}

	const auto fileIt = config.find(internal::logFileKey);
	if (fileIt != config.end())
	{
		loadedSettings.filePath = fileIt->second;
	}

	SetSettings(loadedSettings);
	return loaded;
}

PM_LogSettings PM_Logger::GetSettings() const
{
	lock_guard<mutex> lock(settingsMtx);
	return settings;
}

void PM_Logger::SetSettings(const PM_LogSettings& newSettings)
{
	lock_guard<mutex> lock(settingsMtx);
	settings = newSettings;
}

bool PM_Logger::LogTrace(const string& msgUtf8, const char* file, int line)
{
	return Log(PM_LogLevel::PMLOGLEVEL_TRACE, msgUtf8, file, line);
}

bool PM_Logger::LogDebug(const string& msgUtf8, const char* file, int line)
{
	return Log(PM_LogLevel::PMLOGLEVEL_DEBUG, msgUtf8, file, line);
}

bool PM_Logger::LogInfo(const string& msgUtf8, const char* file, int line)
{
	return Log(PM_LogLevel::PMLOGLEVEL_INFO, msgUtf8, file, line);
}

bool PM_Logger::LogWarning(const string& msgUtf8, const char* file, int line)
{
	return Log(PM_LogLevel::PMLOGLEVEL_WARNING, msgUtf8, file, line);
}

bool PM_Logger::LogError(const string& msgUtf8, const char* file, int line)
{
	return Log(PM_LogLevel::PMLOGLEVEL_ERROR, msgUtf8, file, line);
}

bool PM_Logger::LogFatal(const string& msgUtf8, const char* file, int line)
{
	return Log(PM_LogLevel::PMLOGLEVEL_FATAL, msgUtf8, file, line);
}

bool IsLogEnabled()
{
	return PM_Logger::GetInstance().GetSettings().enabled;
}

void SetLogEnabled(bool enable)
{
	PM_LogSettings settings = PM_Logger::GetInstance().GetSettings();
	settings.enabled = enable;
	PM_Logger::GetInstance().SetSettings(settings);
}

bool IsLogToConsole()
{
	return PM_Logger::GetInstance().GetSettings().toConsole;
}

void SetLogToConsole(bool enable)
{
	PM_LogSettings settings = PM_Logger::GetInstance().GetSettings();
	settings.toConsole = enable;
	PM_Logger::GetInstance().SetSettings(settings);
}

PM_LogLevel GetLogFilterLevel()
{
	const PM_LogSettings settings = PM_Logger::GetInstance().GetSettings();
	return settings.enabled ? settings.filterLevel : PM_LogLevel::PMLOGLEVEL_DISABLELOG;
}

void SetLogFilterLevel(PM_LogLevel level)
{
	PM_LogSettings settings = PM_Logger::GetInstance().GetSettings();
	settings.filterLevel = level;
	PM_Logger::GetInstance().SetSettings(settings);
}

bool CheckLogLevel(PM_LogLevel level)
{
	const PM_LogLevel filterLevel = GetLogFilterLevel();
	return (level >= filterLevel && filterLevel != PM_LogLevel::PMLOGLEVEL_DISABLELOG);
}

string GetLogFilePath()
{
	return PM_Logger::GetInstance().GetSettings().filePath;
}

void SetLogFilePath(const string& filePathUtf8)
{
	PM_LogSettings settings = PM_Logger::GetInstance().GetSettings();
	settings.filePath = filePathUtf8;
	PM_Logger::GetInstance().SetSettings(settings);
}
