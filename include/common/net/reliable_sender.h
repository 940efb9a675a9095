#pragma once

#include "common/net/chunker.h"
#include "common/net/packet.h"
#include "common/util/channel.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace RDSH
{
	class JsonConfigFile;

	namespace Net
	{
		struct ReliableSenderOptions
		{
			ReliableSenderOptions() {
				ack_timeout_ms = 1000;
				max_retries = 5;
				max_chunk_size = MaxPayloadSize;
			}

			static ReliableSenderOptions FromConfig(JsonConfigFile &config);

			size_t ack_timeout_ms;
			int max_retries;
			size_t max_chunk_size;
		};

		struct PendingSend
		{
			uint64_t sequence;
			PacketType packet_type;
			int retry_count;
		};

		struct ReliableSenderStats
		{
			ReliableSenderStats() { Reset(); }

			void Reset() {
				payloads_sent = 0;
				payloads_failed = 0;
				packets_sent = 0;
				retransmits = 0;
				acks_matched = 0;
				stale_acks = 0;
			}

			uint64_t payloads_sent;
			uint64_t payloads_failed;
			uint64_t packets_sent;
			uint64_t retransmits;
			uint64_t acks_matched;
			uint64_t stale_acks;
		};

		// Stop-and-wait sender for one peer. One chunk is in flight at a time;
		// SendPayload blocks the calling thread until every chunk is acknowledged
		// or one of them exhausts its retry budget.
		class ReliableSender
		{
		public:
			// Hands an encoded packet to the socket. Returning false aborts the payload.
			typedef std::function<bool(const std::string &packet)> TransmitFunction;

			ReliableSender(const ReliableSenderOptions &opts, TransmitFunction transmit, Channel<uint64_t> &acks);

			ReliableSender(const ReliableSender&) = delete;
			ReliableSender& operator=(const ReliableSender&) = delete;

			// Concurrent callers are serialized. No partial success is reported.
			bool SendPayload(const std::string &payload, const std::string &session_id);

			uint64_t NextSequence() const;
			ReliableSenderStats GetStats() const;
			const ReliableSenderOptions &Options() const { return m_options; }

		private:
			bool SendChunk(const Chunk &chunk, const std::string &session_id);
			bool AwaitAck(uint64_t sequence);

			ReliableSenderOptions m_options;
			TransmitFunction m_transmit;
			Channel<uint64_t> &m_acks;

			std::mutex m_send_mutex;
			mutable std::mutex m_state_mutex;
			uint64_t m_next_sequence;
			ReliableSenderStats m_stats;
		};
	}
}
