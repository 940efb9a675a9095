#pragma once

#include "common/event/event_loop.h"
#include "common/event/timer.h"
#include "common/net/datagram_socket.h"
#include "common/net/reliable_sender.h"
#include "server/command_handler.h"
#include "server/session_registry.h"
#include <atomic>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace RDSH
{
	class JsonConfigFile;

	namespace Net
	{
		struct ReliableServerOptions
		{
			ReliableServerOptions() {
				host = "127.0.0.1";
				port = 2223;
				idle_timeout_ms = 60000;
				sweep_interval_ms = 1000;
				inbox_poll_ms = 100;
				discard_duplicate_chunks = false;
				simulated_in_packet_loss = 0;
			}

			static ReliableServerOptions FromConfig(JsonConfigFile &config);

			std::string host;
			int port;
			size_t idle_timeout_ms;
			size_t sweep_interval_ms;
			size_t inbox_poll_ms;
			bool discard_duplicate_chunks;
			int simulated_in_packet_loss;
			ReliableSenderOptions sender;
		};

		// Accepting side. The loop thread owns the socket, the session registry and
		// the idle sweep; every session gets a handler thread that reassembles its
		// messages, runs them through the CommandHandler and sends the replies.
		class ReliableServer
		{
		public:
			ReliableServer(const ReliableServerOptions &opts, std::shared_ptr<CommandHandler> handler);
			~ReliableServer();

			ReliableServer(const ReliableServer&) = delete;
			ReliableServer& operator=(const ReliableServer&) = delete;

			bool Start();
			void Stop();
			bool Running() const { return m_running; }

			int LocalPort() const;

			// Safe from any thread; answered by the loop thread.
			size_t SessionCount();
			bool HasSession(const std::string &id);
			std::vector<std::string> SessionIds();

			// Both run on the loop thread.
			void OnNewSession(std::function<void(const std::string &)> func) { m_on_new_session = func; }
			void OnSessionClosed(std::function<void(const std::string &, const std::string &)> func) { m_on_session_closed = func; }

			DatagramSocketStats GetSocketStats() const;
			const ReliableServerOptions &Options() const { return m_options; }

		private:
			struct HandlerThread
			{
				std::string session_id;
				std::thread thread;
				std::shared_ptr<std::atomic<bool>> done;
			};

			void ProcessPacket(const std::string &endpoint, int port, const char *data, size_t size);
			void HandleConnect(const Packet &p, const std::string &endpoint, int port);
			void HandleData(const Packet &p, const std::string &endpoint, int port);
			void HandleAck(const Packet &p);
			void SendControl(const std::string &endpoint, int port, const std::string &payload, uint64_t sequence, PacketType type, const std::string &session_id);

			void SweepIdleSessions();
			void CloseSession(const std::string &id, const std::string &reason);

			void StartHandler(SessionPtr session);
			void RunHandler(SessionPtr session);
			void ReapHandlers(bool all);

			template<typename T>
			T QueryLoop(std::function<T()> query, T fallback);

			ReliableServerOptions m_options;
			std::shared_ptr<CommandHandler> m_handler;

			std::unique_ptr<EventLoop> m_loop;
			std::unique_ptr<DatagramSocket> m_socket;
			std::unique_ptr<Timer> m_sweep_timer;
			SessionRegistry m_registry;
			std::atomic<bool> m_running;

			std::mutex m_handlers_mutex;
			std::list<HandlerThread> m_handlers;

			std::function<void(const std::string &)> m_on_new_session;
			std::function<void(const std::string &, const std::string &)> m_on_session_closed;
		};
	}
}
