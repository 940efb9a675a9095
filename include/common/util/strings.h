#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <strings.h>

class Strings {
public:
	static bool BeginsWith(const std::string& subject, const std::string& search);
	static bool Contains(const std::string& subject, const std::string& search);
	static bool IsNumber(const std::string &s);
	static uint64_t ToUnsignedBigInt(const std::string &s, uint64_t fallback = 0);
	// False unless s is a decimal number in [lowest, 65535].
	static bool ToPort(const std::string &s, int lowest, int &out);
	static const std::string ToLower(std::string s);
	static std::string &LTrim(std::string &str, std::string_view chars = "\t\n\v\f\r ");
	static std::string &RTrim(std::string &str, std::string_view chars = "\t\n\v\f\r ");
	static std::string &Trim(std::string &str, const std::string &chars = "\t\n\v\f\r ");
	static std::string Commify(const std::string &number);
	static std::string Commify(uint64_t number) { return Strings::Commify(std::to_string(number)); };
	static std::vector<std::string> Split(const std::string &s, const char delim = ' ');
	static inline bool EqualFold(const std::string &string_one, const std::string &string_two) { return strcasecmp(string_one.c_str(), string_two.c_str()) == 0; }
};
