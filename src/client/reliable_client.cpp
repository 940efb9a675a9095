#include "client/reliable_client.h"
#include "common/util/json_config.h"
#include "common/util/data_verification.h"
#include "common/logging.h"
#include <fmt/format.h>

namespace {
	double SecondsSince(std::chrono::steady_clock::time_point start)
	{
		return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
	}
}

RDSH::Net::ReliableClientOptions RDSH::Net::ReliableClientOptions::FromConfig(JsonConfigFile &config)
{
	ReliableClientOptions opts;
	opts.host = config.GetVariableString("client", "host", opts.host);
	opts.port = RDSH::Clamp(config.GetVariableInt("client", "port", opts.port), 1, 65535);
	opts.connect_attempts = RDSH::Clamp(config.GetVariableInt("client", "connect_attempts", opts.connect_attempts), 1, 100);
	opts.connect_timeout_ms = (size_t)RDSH::ClampLower(config.GetVariableInt("client", "connect_timeout_ms", (int)opts.connect_timeout_ms), 1);
	opts.welcome_timeout_ms = (size_t)RDSH::ClampLower(config.GetVariableInt("client", "welcome_timeout_ms", (int)opts.welcome_timeout_ms), 1);
	opts.response_timeout_ms = (size_t)RDSH::ClampLower(config.GetVariableInt("client", "response_timeout_ms", (int)opts.response_timeout_ms), 1);
	opts.disconnect_timeout_ms = (size_t)RDSH::ClampLower(config.GetVariableInt("client", "disconnect_timeout_ms", (int)opts.disconnect_timeout_ms), 1);
	opts.discard_duplicate_chunks = config.GetVariableBool("transport", "discard_duplicate_chunks", opts.discard_duplicate_chunks);
	opts.simulated_in_packet_loss = RDSH::Clamp(config.GetVariableInt("transport", "simulated_in_packet_loss", opts.simulated_in_packet_loss), 0, 100);
	opts.sender = ReliableSenderOptions::FromConfig(config);
	return opts;
}

RDSH::Net::ReliableClient::ReliableClient(const ReliableClientOptions &opts)
	: m_options(opts), m_connected(false), m_connection_time(0.0)
{
}

RDSH::Net::ReliableClient::~ReliableClient()
{
	Shutdown();
}

RDSH::ConnectResult RDSH::Net::ReliableClient::Connect()
{
	ConnectResult result;
	auto start = std::chrono::steady_clock::now();

	if (m_connected || m_loop) {
		LOG_ERROR(MOD_NET, "Connect called on an active client");
		return result;
	}

	m_loop.reset(new EventLoop());
	if (!m_loop->Valid()) {
		LOG_ERROR(MOD_NET, "Failed to initialize event loop");
		m_loop.reset();
		return result;
	}

	if (!ResolveIPv4(m_loop->Handle(), m_options.host, m_server_address)) {
		Shutdown();
		return result;
	}

	{
		std::lock_guard<std::mutex> lock(m_session_mutex);
		m_session_id.clear();
	}
	m_welcome.clear();
	m_acks.reset(new Channel<uint64_t>());
	m_inbox.reset(new Channel<InboundChunk>());
	m_reassembler.reset(new Reassembler(m_options.discard_duplicate_chunks));

	m_socket.reset(new DatagramSocket(*m_loop));
	m_socket->SetSimulatedInPacketLoss(m_options.simulated_in_packet_loss);
	m_socket->OnReceive([this](const std::string &endpoint, int port, const char *data, size_t size) {
		ProcessPacket(endpoint, port, data, size);
	});

	if (!m_socket->Bind("0.0.0.0", 0)) {
		LOG_ERROR(MOD_NET, "Failed to bind client socket");
		Shutdown();
		return result;
	}

	DatagramSocket *socket = m_socket.get();
	std::string address = m_server_address;
	int port = m_options.port;
	m_sender.reset(new ReliableSender(m_options.sender, [socket, address, port](const std::string &packet) {
		return socket->SendTo(address, port, packet);
	}, *m_acks));

	if (!m_loop->Start()) {
		LOG_ERROR(MOD_NET, "Failed to start event loop");
		Shutdown();
		return result;
	}

	LOG_INFO(MOD_NET, "Connecting to {}:{} via UDP...", m_server_address, m_options.port);

	for (int attempt = 1; attempt <= m_options.connect_attempts; ++attempt) {
		LOG_DEBUG(MOD_NET, "Sending CONNECT, attempt {}/{}", attempt, m_options.connect_attempts);
		if (!SendControl("CONNECT", 0, PacketConnect, SessionId())) {
			break;
		}

		if (WaitForSession(std::chrono::milliseconds(m_options.connect_timeout_ms))) {
			m_connection_time = SecondsSince(start);
			m_connected = true;
			break;
		}
	}

	if (!m_connected) {
		LOG_ERROR(MOD_NET, "Connection to {}:{} failed after {} attempts", m_server_address, m_options.port, m_options.connect_attempts);
		Shutdown();
		result.elapsed_seconds = SecondsSince(start);
		return result;
	}

	LOG_INFO(MOD_NET, "Connection established with session ID: {}", SessionId());

	auto welcome = AwaitMessage(std::chrono::milliseconds(m_options.welcome_timeout_ms));
	if (welcome) {
		m_welcome = *welcome;
		LOG_DEBUG(MOD_SHELL, "Welcome message: {}", m_welcome);
	}
	else {
		LOG_WARN(MOD_SHELL, "No welcome message within {} ms", m_options.welcome_timeout_ms);
	}

	result.success = true;
	result.elapsed_seconds = m_connection_time;
	LOG_INFO(MOD_NET, "Connected successfully in {:.2f} seconds", m_connection_time);
	return result;
}

std::optional<RDSH::CommandResponse> RDSH::Net::ReliableClient::SendCommand(const std::string &command)
{
	if (!m_connected) {
		LOG_ERROR(MOD_SHELL, "Not connected");
		return std::nullopt;
	}

	auto start = std::chrono::steady_clock::now();
	LOG_INFO(MOD_SHELL, "Sending command: {}", command);

	if (!m_sender->SendPayload(command + "\n", SessionId())) {
		LOG_ERROR(MOD_SHELL, "Failed to send command: {}", command);
		return std::nullopt;
	}

	auto reply = AwaitMessage(std::chrono::milliseconds(m_options.response_timeout_ms));
	if (!reply) {
		LOG_ERROR(MOD_SHELL, "No response to command within {} ms", m_options.response_timeout_ms);
		return std::nullopt;
	}

	CommandResponse response;
	response.output = *reply;
	response.elapsed_seconds = SecondsSince(start);
	LOG_INFO(MOD_SHELL, "Command executed in {:.2f} seconds", response.elapsed_seconds);
	return response;
}

std::optional<RDSH::TransferResult> RDSH::Net::ReliableClient::SendFile(const std::string &content, const std::string &filename)
{
	if (!m_connected) {
		LOG_ERROR(MOD_SHELL, "Not connected");
		return std::nullopt;
	}

	auto start = std::chrono::steady_clock::now();
	std::string payload = fmt::format("upload {} {}\n", filename, content.size());
	payload.append(content);

	if (!m_sender->SendPayload(payload, SessionId())) {
		LOG_ERROR(MOD_SHELL, "File transfer of {} failed", filename);
		return std::nullopt;
	}

	auto reply = AwaitMessage(std::chrono::milliseconds(m_options.response_timeout_ms));
	if (!reply) {
		LOG_ERROR(MOD_SHELL, "No confirmation for {} within {} ms", filename, m_options.response_timeout_ms);
		return std::nullopt;
	}

	TransferResult result;
	result.file_size = content.size();
	result.elapsed_seconds = SecondsSince(start);
	result.bytes_per_second = result.elapsed_seconds > 0.0 ? (double)result.file_size / result.elapsed_seconds : 0.0;

	LOG_INFO(MOD_SHELL, "File transfer completed in {:.2f} seconds ({:.2f} bytes/sec)", result.elapsed_seconds, result.bytes_per_second);
	return result;
}

void RDSH::Net::ReliableClient::Disconnect()
{
	if (m_connected) {
		if (m_sender->SendPayload("exit", SessionId())) {
			auto goodbye = AwaitMessage(std::chrono::milliseconds(m_options.disconnect_timeout_ms));
			if (goodbye) {
				LOG_DEBUG(MOD_SHELL, "Server said: {}", *goodbye);
			}
		}
		else {
			LOG_WARN(MOD_SHELL, "Server did not acknowledge exit");
		}
	}

	Shutdown();
	LOG_INFO(MOD_NET, "Connection closed");
}

RDSH::TransportCounters RDSH::Net::ReliableClient::GetCounters() const
{
	DatagramSocketStats stats = m_socket ? m_socket->GetStats() : m_final_stats;

	TransportCounters counters;
	counters.bytes_sent = stats.sent_bytes;
	counters.bytes_received = stats.recv_bytes;
	counters.connection_time = m_connection_time;
	return counters;
}

std::string RDSH::Net::ReliableClient::SessionId() const
{
	std::lock_guard<std::mutex> lock(m_session_mutex);
	return m_session_id;
}

RDSH::Net::ReliableSenderStats RDSH::Net::ReliableClient::GetSenderStats() const
{
	if (m_sender) {
		return m_sender->GetStats();
	}

	return m_final_sender_stats;
}

void RDSH::Net::ReliableClient::ProcessPacket(const std::string &endpoint, int port, const char *data, size_t size)
{
	Packet p;
	if (!DecodePacket(data, size, p)) {
		LOG_DEBUG(MOD_NET, "Dropped undecodable packet from {}:{} ({} bytes)", endpoint, port, size);
		return;
	}

	try {
		switch (p.type) {
		case PacketAck:
			if (!m_acks->Push(p.sequence)) {
				LOG_DEBUG(MOD_NET, "ACK {} arrived after shutdown", p.sequence);
			}
			break;
		case PacketConnectAck:
			HandleConnectAck(p);
			break;
		case PacketData:
		case PacketLast:
			HandleData(p);
			break;
		default:
			LOG_DEBUG(MOD_NET, "Ignoring {} packet from {}:{}", PacketTypeName(p.type), endpoint, port);
			break;
		}
	}
	catch (std::exception &ex) {
		LOG_ERROR(MOD_NET, "Error in receiver: {}", ex.what());
	}
}

void RDSH::Net::ReliableClient::HandleConnectAck(const Packet &p)
{
	std::string id = p.session_id.empty() ? p.payload : p.session_id;
	if (id.empty()) {
		LOG_WARN(MOD_NET, "CONNECT_ACK without a session id");
		return;
	}

	{
		std::lock_guard<std::mutex> lock(m_session_mutex);
		if (!m_session_id.empty()) {
			LOG_TRACE(MOD_NET, "Duplicate CONNECT_ACK for [{}]", id);
			return;
		}
		m_session_id = id;
	}

	m_session_cv.notify_all();
}

void RDSH::Net::ReliableClient::HandleData(const Packet &p)
{
	// Echo the sender's session so greetings from sessions opened by a lost
	// CONNECT_ACK are acknowledged to their own sender.
	SendControl("ACK", p.sequence, PacketAck, p.session_id.empty() ? SessionId() : p.session_id);

	InboundChunk chunk;
	chunk.sequence = p.sequence;
	chunk.type = p.type;
	chunk.data = p.payload;
	if (!m_inbox->Push(std::move(chunk))) {
		LOG_DEBUG(MOD_NET, "Data packet {} arrived after shutdown", p.sequence);
		return;
	}

	LOG_TRACE(MOD_NET, "Received data packet {}", p.sequence);
}

bool RDSH::Net::ReliableClient::SendControl(const std::string &payload, uint64_t sequence, PacketType type, const std::string &session_id)
{
	std::string out;
	try {
		out = EncodePacket(payload, sequence, type, session_id);
	}
	catch (PacketEncodeError &ex) {
		LOG_ERROR(MOD_NET, "Failed to encode {}: {}", PacketTypeName(type), ex.what());
		return false;
	}

	if (!m_socket->SendTo(m_server_address, m_options.port, out)) {
		LOG_WARN(MOD_NET, "Failed to send {} {}", PacketTypeName(type), sequence);
		return false;
	}

	return true;
}

bool RDSH::Net::ReliableClient::WaitForSession(std::chrono::milliseconds timeout)
{
	std::unique_lock<std::mutex> lock(m_session_mutex);
	return m_session_cv.wait_for(lock, timeout, [this]() { return !m_session_id.empty(); });
}

std::optional<std::string> RDSH::Net::ReliableClient::AwaitMessage(std::chrono::milliseconds timeout)
{
	auto deadline = std::chrono::steady_clock::now() + timeout;

	for (;;) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			return std::nullopt;
		}

		auto chunk = m_inbox->PopFor(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) + std::chrono::milliseconds(1));
		if (!chunk) {
			if (m_inbox->Closed()) {
				return std::nullopt;
			}
			continue;
		}

		auto message = m_reassembler->Push(*chunk);
		if (message) {
			return message;
		}
	}
}

void RDSH::Net::ReliableClient::Shutdown()
{
	m_connected = false;

	if (m_loop) {
		m_loop->Stop();
	}

	if (m_acks) {
		m_acks->Close();
	}

	if (m_inbox) {
		m_inbox->Close();
	}

	if (m_sender) {
		m_final_sender_stats = m_sender->GetStats();
		m_sender.reset();
	}

	if (m_socket) {
		m_final_stats = m_socket->GetStats();
		m_socket.reset();
	}

	m_loop.reset();
}
