#pragma once

#include "server/command_handler.h"

namespace RDSH
{
	// Stand-in shell: echoes commands, accepts uploads, ends on "exit".
	class EchoCommandHandler : public CommandHandler
	{
	public:
		virtual std::string Greeting();
		virtual CommandResult Execute(const std::string &session_id, const std::string &message);

	private:
		CommandResult HandleUpload(const std::string &session_id, const std::string &header, const std::string &content);
	};
}
