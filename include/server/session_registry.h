#pragma once

#include "server/session.h"
#include "common/util/random.h"
#include <map>
#include <string>
#include <vector>

namespace RDSH
{
	namespace Net
	{
		// Session table of the accepting side. Not thread-safe; the server only
		// uses it from its loop thread.
		class SessionRegistry
		{
		public:
			// Uses requested_id when it is non-empty and unused, otherwise generates one.
			SessionPtr Create(const std::string &endpoint, int port, const std::string &requested_id, Timestamp now);
			SessionPtr Find(const std::string &id) const;

			bool Touch(const std::string &id, Timestamp now);

			// Closes the session and drops it from the table.
			SessionPtr Remove(const std::string &id);

			// Removes every session idle for longer than idle and returns their ids.
			std::vector<std::string> ExpireIdle(Timestamp now, std::chrono::milliseconds idle);

			size_t Size() const { return m_sessions.size(); }
			std::vector<std::string> Ids() const;

			static std::string GenerateId(const std::string &endpoint, int port, Timestamp now, uint64_t nonce);

		private:
			std::map<std::string, SessionPtr> m_sessions;
			Random m_rand;
		};
	}
}
