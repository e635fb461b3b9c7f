#include "PM_Timer.h"
#include <chrono>
#include <cstdio>
#include <ctime>

using namespace std;

string GetLocalTimeStr(bool withMs)
{
	const auto now = chrono::system_clock::now();
	const time_t seconds = chrono::system_clock::to_time_t(now);

	tm localTm = {};
	localtime_r(&seconds, &localTm);

	// strftime 的 %Y 等数字字段与 locale 无关
	char buffer[32] = { 0 };
	size_t length = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &localTm);
	if (withMs && length > 0)
	{
		const long long ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
		snprintf(buffer + length, sizeof(buffer) - length, ".%03lld", ms);
	}
	return string(buffer);
}
