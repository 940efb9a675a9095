#pragma once

#include "common/event/event_loop.h"
#include "common/net/chunker.h"
#include "common/net/datagram_socket.h"
#include "common/net/reliable_sender.h"
#include "common/shell_transport.h"
#include "common/util/channel.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace RDSH
{
	class JsonConfigFile;

	namespace Net
	{
		struct ReliableClientOptions
		{
			ReliableClientOptions() {
				host = "127.0.0.1";
				port = 2223;
				connect_attempts = 5;
				connect_timeout_ms = 1000;
				welcome_timeout_ms = 2000;
				response_timeout_ms = 2000;
				disconnect_timeout_ms = 500;
				discard_duplicate_chunks = false;
				simulated_in_packet_loss = 0;
			}

			static ReliableClientOptions FromConfig(JsonConfigFile &config);

			std::string host;
			int port;
			int connect_attempts;
			size_t connect_timeout_ms;
			size_t welcome_timeout_ms;
			size_t response_timeout_ms;
			size_t disconnect_timeout_ms;
			bool discard_duplicate_chunks;
			int simulated_in_packet_loss;
			ReliableSenderOptions sender;
		};

		// Initiating side. Its loop thread acknowledges inbound data and routes
		// ACKs to the sender; the public calls block the caller and must come from
		// one thread.
		class ReliableClient : public ShellTransport
		{
		public:
			ReliableClient(const ReliableClientOptions &opts);
			virtual ~ReliableClient();

			virtual ConnectResult Connect();
			virtual std::optional<CommandResponse> SendCommand(const std::string &command);
			virtual std::optional<TransferResult> SendFile(const std::string &content, const std::string &filename);
			virtual void Disconnect();

			virtual TransportCounters GetCounters() const;
			virtual std::string ProtocolName() const { return "UDP"; }

			bool Connected() const { return m_connected; }
			std::string SessionId() const;
			const std::string &Welcome() const { return m_welcome; }
			ReliableSenderStats GetSenderStats() const;

		private:
			void ProcessPacket(const std::string &endpoint, int port, const char *data, size_t size);
			void HandleConnectAck(const Packet &p);
			void HandleData(const Packet &p);
			bool SendControl(const std::string &payload, uint64_t sequence, PacketType type, const std::string &session_id);

			bool WaitForSession(std::chrono::milliseconds timeout);
			std::optional<std::string> AwaitMessage(std::chrono::milliseconds timeout);
			void Shutdown();

			ReliableClientOptions m_options;
			std::string m_server_address;

			std::unique_ptr<EventLoop> m_loop;
			std::unique_ptr<DatagramSocket> m_socket;
			std::unique_ptr<Channel<uint64_t>> m_acks;
			std::unique_ptr<Channel<InboundChunk>> m_inbox;
			std::unique_ptr<ReliableSender> m_sender;
			std::unique_ptr<Reassembler> m_reassembler;

			mutable std::mutex m_session_mutex;
			std::condition_variable m_session_cv;
			std::string m_session_id;

			std::atomic<bool> m_connected;
			std::string m_welcome;
			double m_connection_time;
			DatagramSocketStats m_final_stats;
			ReliableSenderStats m_final_sender_stats;
		};
	}
}
