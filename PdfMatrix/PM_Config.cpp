#include "PM_Config.h"
#include <cstdlib>
#include <fstream>

using namespace std;

namespace internal
{
	static const char* const whitespace = " \t\r";

	static string Trim(const string& text)
	{
		const size_t begin = text.find_first_not_of(whitespace);
		if (begin == string::npos)
		{
			return string();
		}
		const size_t end = text.find_last_not_of(whitespace);
		return text.substr(begin, end - begin + 1);
	}

	static string GetEnv(const char* name)
	{
		const char* value = getenv(name);
		return (value && *value) ? string(value) : string();
	}
}

string GetPmConfigPath()
{
	string base = internal::GetEnv("XDG_CONFIG_HOME");
	if (base.empty())
	{
		const string home = internal::GetEnv("HOME");
		base = home.empty() ? string(".") : home + "/.config";
	}
	return base + "/PdfMatrix/PdfMatrix.conf";
}

bool LoadPmConfig(const string& filePath, unordered_map<string, string>& values)
{
	values.clear();
	ifstream ifs(filePath.c_str(), ios::in | ios::binary);
	if (!ifs.is_open())
	{
		return false;
	}

	string line;
	while (getline(ifs, line))
	{
		const string content = internal::Trim(line);
		if (content.empty() || content[0] == '#')
		{
			continue;
		}

		const size_t pos = content.find('=');
		if (pos == string::npos)
		{
			continue;
		}
		const string key = internal::Trim(content.substr(0, pos));
		if (key.empty())
		{
			continue;
		}
		values[key] = internal::Trim(content.substr(pos + 1));
	}
	return true;
}
