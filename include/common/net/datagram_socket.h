#pragma once

#include "common/event/event_loop.h"
#include "common/util/random.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace RDSH
{
	namespace Net
	{
		struct DatagramSocketStats
		{
			uint64_t sent_packets = 0;
			uint64_t sent_bytes = 0;
			uint64_t recv_packets = 0;
			uint64_t recv_bytes = 0;
			uint64_t send_errors = 0;
			uint64_t dropped_packets = 0;
		};

		// Resolves a host name or dotted quad to a dotted quad. Blocking.
		bool ResolveIPv4(uv_loop_t *loop, const std::string &host, std::string &out);

		// One UDP socket on an EventLoop. Bind before the loop starts. The owner
		// must stop the loop before the socket is destroyed.
		class DatagramSocket
		{
		public:
			typedef std::function<void(const std::string &endpoint, int port, const char *data, size_t size)> ReceiveCallback;

			DatagramSocket(EventLoop &loop);
			~DatagramSocket();

			DatagramSocket(const DatagramSocket&) = delete;
			DatagramSocket& operator=(const DatagramSocket&) = delete;

			// Port 0 binds an ephemeral port.
			bool Bind(const std::string &host, int port);

			// Runs on the loop thread.
			void OnReceive(ReceiveCallback cb) { m_on_receive = cb; }

			// Thread-safe. Off the loop thread the send is queued and the result
			// only reflects whether it was accepted by the loop.
			bool SendTo(const std::string &endpoint, int port, const std::string &data);

			int LocalPort() const { return m_local_port; }
			bool Bound() const { return m_bound; }

			// Percentage of inbound datagrams to discard, 0 to 100.
			void SetSimulatedInPacketLoss(int percent) { m_simulated_in_packet_loss = percent; }

			DatagramSocketStats GetStats() const;

		private:
			bool SendOnLoop(const std::string &endpoint, int port, const std::string &data);
			void ProcessReceive(const char *data, size_t size, const struct sockaddr *addr);

			EventLoop &m_loop;
			uv_udp_t m_socket;
			bool m_initialized;
			bool m_bound;
			int m_local_port;
			ReceiveCallback m_on_receive;

			std::atomic<int> m_simulated_in_packet_loss;
			Random m_rand;

			std::atomic<uint64_t> m_sent_packets;
			std::atomic<uint64_t> m_sent_bytes;
			std::atomic<uint64_t> m_recv_packets;
			std::atomic<uint64_t> m_recv_bytes;
			std::atomic<uint64_t> m_send_errors;
			std::atomic<uint64_t> m_dropped_packets;
		};
	}
}
