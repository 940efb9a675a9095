#include "common/util/json_config.h"
#include "common/logging.h"
#include <fstream>
#include <sstream>

RDSH::JsonConfigFile::JsonConfigFile()
	: m_loaded(false)
{
}

RDSH::JsonConfigFile::JsonConfigFile(const Json::Value &value)
	: m_root(value), m_loaded(true)
{
}

RDSH::JsonConfigFile::~JsonConfigFile() = default;

RDSH::JsonConfigFile RDSH::JsonConfigFile::Load(const std::string &filename)
{
	JsonConfigFile ret;
	if (filename.empty()) {
		return ret;
	}

	std::ifstream input(filename);
	if (!input.is_open()) {
		LOG_WARN(MOD_CONFIG, "Config file {} not found, using defaults", filename);
		return ret;
	}

	Json::CharReaderBuilder builder;
	std::string errors;
	Json::Value root;
	if (!Json::parseFromStream(builder, input, &root, &errors)) {
		LOG_ERROR(MOD_CONFIG, "Failed to parse {}: {}", filename, errors);
		return ret;
	}

	LOG_DEBUG(MOD_CONFIG, "Loaded config from {}", filename);
	ret.m_root = root;
	ret.m_loaded = true;
	return ret;
}

RDSH::JsonConfigFile RDSH::JsonConfigFile::Parse(const std::string &text)
{
	JsonConfigFile ret;
	std::istringstream input(text);

	Json::CharReaderBuilder builder;
	std::string errors;
	Json::Value root;
	if (!Json::parseFromStream(builder, input, &root, &errors)) {
		LOG_ERROR(MOD_CONFIG, "Failed to parse config: {}", errors);
		return ret;
	}

	ret.m_root = root;
	ret.m_loaded = true;
	return ret;
}

std::string RDSH::JsonConfigFile::GetVariableString(const std::string &title, const std::string &parameter, const std::string &default_value)
{
	if (!m_root.isObject() || !m_root.isMember(title) || !m_root[title].isObject()) {
		return default_value;
	}

	const Json::Value &value = m_root[title][parameter];
	if (value.isString()) {
		return value.asString();
	}

	return default_value;
}

int RDSH::JsonConfigFile::GetVariableInt(const std::string &title, const std::string &parameter, const int default_value)
{
	if (!m_root.isObject() || !m_root.isMember(title) || !m_root[title].isObject()) {
		return default_value;
	}

	const Json::Value &value = m_root[title][parameter];
	if (value.isInt()) {
		return value.asInt();
	}

	if (value.isString()) {
		try {
			return std::stoi(value.asString());
		}
		catch (std::exception &) {
			LOG_WARN(MOD_CONFIG, "Config {}.{} is not an integer", title, parameter);
		}
	}

	return default_value;
}

bool RDSH::JsonConfigFile::GetVariableBool(const std::string &title, const std::string &parameter, const bool default_value)
{
	if (!m_root.isObject() || !m_root.isMember(title) || !m_root[title].isObject()) {
		return default_value;
	}

	const Json::Value &value = m_root[title][parameter];
	if (value.isBool()) {
		return value.asBool();
	}

	if (value.isString()) {
		auto s = value.asString();
		if (s == "true" || s == "1") {
			return true;
		}
		if (s == "false" || s == "0") {
			return false;
		}
	}

	return default_value;
}
