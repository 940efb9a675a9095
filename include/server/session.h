#pragma once

#include "common/net/chunker.h"
#include "common/net/reliable_sender.h"
#include "common/util/channel.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace RDSH
{
	namespace Net
	{
		typedef std::chrono::steady_clock Clock;
		typedef Clock::time_point Timestamp;

		// Per-peer state on the accepting side. Identity and activity fields are
		// only touched on the loop thread; the channels and the closed flag are
		// shared with the session's handler thread.
		struct Session
		{
			Session(const std::string &session_id, const std::string &peer_endpoint, int peer_port, Timestamp now)
				: id(session_id), endpoint(peer_endpoint), port(peer_port), created(now), last_activity(now), closed(false) { }

			Session(const Session&) = delete;
			Session& operator=(const Session&) = delete;

			void Close() {
				closed = true;
				inbox.Close();
				acks.Close();
			}

			std::string id;
			std::string endpoint;
			int port;
			Timestamp created;
			Timestamp last_activity;

			Channel<InboundChunk> inbox;
			Channel<uint64_t> acks;
			std::unique_ptr<ReliableSender> sender;
			std::atomic<bool> closed;
		};

		typedef std::shared_ptr<Session> SessionPtr;
	}
}
