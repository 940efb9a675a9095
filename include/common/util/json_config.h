#pragma once

#include <json/json.h>
#include <string>

namespace RDSH
{
	class JsonConfigFile
	{
	public:
		JsonConfigFile();
		JsonConfigFile(const Json::Value &value);
		~JsonConfigFile();

		// A missing or unreadable file yields an empty config; every lookup then
		// returns its default.
		static JsonConfigFile Load(const std::string &filename);
		static JsonConfigFile Parse(const std::string &text);

		std::string GetVariableString(const std::string &title, const std::string &parameter, const std::string &default_value);
		int GetVariableInt(const std::string &title, const std::string &parameter, const int default_value);
		bool GetVariableBool(const std::string &title, const std::string &parameter, const bool default_value);

		Json::Value& RawHandle() { return m_root; }
		bool Loaded() const { return m_loaded; }

	private:
		Json::Value m_root;
		bool m_loaded;
	};
}
