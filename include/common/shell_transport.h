#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace RDSH
{
	struct ConnectResult
	{
		bool success = false;
		double elapsed_seconds = 0.0;
	};

	struct CommandResponse
	{
		std::string output;
		double elapsed_seconds = 0.0;
	};

	struct TransferResult
	{
		uint64_t file_size = 0;
		double elapsed_seconds = 0.0;
		double bytes_per_second = 0.0;
	};

	struct TransportCounters
	{
		uint64_t bytes_sent = 0;
		uint64_t bytes_received = 0;
		double connection_time = 0.0;
	};

	// Client side of a command session, whatever carries it.
	class ShellTransport
	{
	public:
		virtual ~ShellTransport() { }

		virtual ConnectResult Connect() = 0;
		virtual std::optional<CommandResponse> SendCommand(const std::string &command) = 0;
		virtual std::optional<TransferResult> SendFile(const std::string &content, const std::string &filename) = 0;
		virtual void Disconnect() = 0;

		virtual TransportCounters GetCounters() const = 0;
		virtual std::string ProtocolName() const = 0;
	};
}
