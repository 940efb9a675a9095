#pragma once

#include <string>

namespace RDSH
{
	struct CommandResult
	{
		std::string output;
		bool end_session = false;
	};

	// Consumes complete messages for a session. Execute is called from that
	// session's handler thread, so one instance may run on several threads at once.
	class CommandHandler
	{
	public:
		virtual ~CommandHandler() { }

		virtual std::string Greeting() = 0;
		virtual CommandResult Execute(const std::string &session_id, const std::string &message) = 0;
	};
}
