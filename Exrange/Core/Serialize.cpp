#include "Serialize.hpp"

#include <algorithm>
#include <cctype>

using namespace ex;

static std::string quoted(const std::string& str)
{
	return "`" + str + "`";
}

std::string detail::missingField(const std::string& field)
{
	return "missing field " + quoted(field);
}

std::string detail::duplicateField(const std::string& field)
{
	return "duplicate field " + quoted(field);
}

std::string detail::unknownField(const std::string& field, const std::vector<std::string>& expected)
{
	std::string msg = "unknown field " + quoted(field) + ", ";
	if(expected.empty())
		return msg + "there are no fields";
	if(expected.size() == 1)
		return msg + "expected " + quoted(expected[0]);
	if(expected.size() == 2)
		return msg + "expected " + quoted(expected[0]) + " or " + quoted(expected[1]);

	msg += "expected one of ";
	for(size_t i=0;i<expected.size();i++)
		msg += quoted(expected[i]) + (i == expected.size()-1 ? "" : ", ");
	return msg;
}

std::string detail::invalidLength(size_t length, const std::string& expected)
{
	return "invalid length " + std::to_string(length) + ", expected " + expected;
}

bool detail::isJsonPath(const std::string& path)
{
	size_t dot_pos = path.find_last_of('.');
	if(dot_pos == std::string::npos)
		return false;
	size_t slash_pos = path.find_last_of("/\\");
	if(slash_pos != std::string::npos && slash_pos > dot_pos)
		return false;

	std::string ext = path.substr(dot_pos + 1);
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
	return ext == "json";
}
