#include "server/echo_command_handler.h"
#include "common/util/strings.h"
#include "common/logging.h"
#include <fmt/format.h>

namespace {
	// "upload <name> 0" carries no content after its header line.
	bool DeclaresEmptyFile(std::string header)
	{
		Strings::Trim(header);
		auto parts = Strings::Split(header, ' ');
		return parts.size() == 3 && Strings::IsNumber(parts[2]) && Strings::ToUnsignedBigInt(parts[2], 1) == 0;
	}
}

std::string RDSH::EchoCommandHandler::Greeting()
{
	return "Welcome to rdsh server!\r\n$ ";
}

RDSH::CommandResult RDSH::EchoCommandHandler::Execute(const std::string &session_id, const std::string &message)
{
	auto newline = message.find('\n');
	if (Strings::BeginsWith(message, "upload ") && newline != std::string::npos) {
		auto header = message.substr(0, newline);
		auto content = message.substr(newline + 1);
		if (!content.empty() || DeclaresEmptyFile(header)) {
			return HandleUpload(session_id, header, content);
		}
	}

	std::string cmd = message;
	Strings::Trim(cmd);

	CommandResult result;
	if (Strings::EqualFold(cmd, "exit")) {
		LOG_INFO(MOD_SHELL, "Client requested exit: [{}]", session_id);
		result.output = "Goodbye!\r\n";
		result.end_session = true;
		return result;
	}

	LOG_INFO(MOD_SHELL, "Executing command: {}", cmd);
	result.output = fmt::format("Executing: {}\r\n$ ", cmd);
	return result;
}

RDSH::CommandResult RDSH::EchoCommandHandler::HandleUpload(const std::string &session_id, const std::string &header, const std::string &content)
{
	std::string line = header;
	Strings::Trim(line);

	auto parts = Strings::Split(line, ' ');
	std::string name = parts.size() > 1 ? parts[1] : "unnamed";

	if (parts.size() > 2 && Strings::IsNumber(parts[2])) {
		auto declared = Strings::ToUnsignedBigInt(parts[2]);
		if (declared != content.size()) {
			LOG_WARN(MOD_SHELL, "Upload {} for [{}] declared {} bytes, received {}", name, session_id, declared, content.size());
		}
	}

	LOG_INFO(MOD_SHELL, "Received upload {} ({} bytes) for [{}]", name, content.size(), session_id);

	CommandResult result;
	result.output = fmt::format("Received {}: {} bytes\r\n$ ", name, content.size());
	return result;
}
