#include "common/util/strings.h"
#include <algorithm>
#include <cctype>

bool Strings::BeginsWith(const std::string& subject, const std::string& search)
{
	if (subject.length() < search.length()) {
		return false;
	}
	return subject.compare(0, search.length(), search) == 0;
}

bool Strings::Contains(const std::string& subject, const std::string& search)
{
	if (subject.length() < search.length()) {
		return false;
	}
	return subject.find(search) != std::string::npos;
}

// Digits only; an empty string is not a number.
bool Strings::IsNumber(const std::string &s)
{
	if (s.empty()) {
		return false;
	}

	for (char const &c: s) {
		if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
			return false;
		}
	}

	return true;
}

uint64_t Strings::ToUnsignedBigInt(const std::string &s, uint64_t fallback)
{
	if (!Strings::IsNumber(s)) {
		return fallback;
	}

	try {
		return std::stoull(s);
	}
	catch (std::exception &) {
		return fallback;
	}
}

bool Strings::ToPort(const std::string &s, int lowest, int &out)
{
	if (!Strings::IsNumber(s) || s.size() > 5) {
		return false;
	}

	auto value = Strings::ToUnsignedBigInt(s);
	if (value < (uint64_t)lowest || value > 65535) {
		return false;
	}

	out = (int)value;
	return true;
}

const std::string Strings::ToLower(std::string s)
{
	std::transform(
		s.begin(), s.end(), s.begin(),
		[](unsigned char c) { return ::tolower(c); }
	);
	return s;
}

std::string &Strings::LTrim(std::string &str, std::string_view chars)
{
	str.erase(0, str.find_first_not_of(chars));
	return str;
}

std::string &Strings::RTrim(std::string &str, std::string_view chars)
{
	str.erase(str.find_last_not_of(chars) + 1);
	return str;
}

std::string &Strings::Trim(std::string &str, const std::string &chars)
{
	return LTrim(RTrim(str, chars), chars);
}

std::string Strings::Commify(const std::string &number)
{
	std::string temp_string;

	auto string_length = static_cast<int>(number.length());

	int i = 0;
	for (i = string_length - 3; i >= 0; i -= 3) {
		if (i > 0) {
			temp_string = "," + number.substr(static_cast<unsigned long>(i), 3) + temp_string;
		} else {
			temp_string = number.substr(static_cast<unsigned long>(i), 3) + temp_string;
		}
	}

	temp_string = number.substr(0, static_cast<unsigned long>(3 + i)) + temp_string;

	return temp_string;
}

std::vector<std::string> Strings::Split(const std::string &str, const char delim)
{
	std::vector<std::string> ret;
	std::string::size_type   start = 0;
	auto                     end   = str.find(delim);
	while (end != std::string::npos) {
		ret.emplace_back(str, start, end - start);
		start = end + 1;
		end   = str.find(delim, start);
	}
	if (str.length() > start) {
		ret.emplace_back(str, start, str.length() - start);
	}
	return ret;
}
