#include "PM_Error.h"
#include <iomanip>
#include <locale>
#include <sstream>

using namespace std;

namespace internal
{
	static void AppendRow(ostringstream& oss, const vector<double>& values)
	{
		oss << '[';
		for (size_t i = 0; i < values.size(); i++)
		{
			if (i > 0)
			{
				oss << ", ";
			}
			oss << values[i];
		}
		oss << ']';
	}
}

PM_InvalidArgument::PM_InvalidArgument(const string& argumentsText)
	: std::invalid_argument("invalid arguments: " + argumentsText), arguments(argumentsText)
{
}

const string& PM_InvalidArgument::GetArguments() const
{
	return arguments;
}

string PM_FormatArguments(const vector<double>& values)
{
	ostringstream oss;
	oss.imbue(locale::classic());
	oss << setprecision(17);
	internal::AppendRow(oss, values);
	return oss.str();
}

string PM_FormatArguments(const vector<vector<double>>& rows)
{
	ostringstream oss;
	oss.imbue(locale::classic());
	oss << setprecision(17);
	oss << '[';
	for (size_t i = 0; i < rows.size(); i++)
	{
		if (i > 0)
		{
			oss << ", ";
		}
		internal::AppendRow(oss, rows[i]);
	}
	oss << ']';
	return oss.str();
}
