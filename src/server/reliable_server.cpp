#include "server/reliable_server.h"
#include "common/net/chunker.h"
#include "common/util/json_config.h"
#include "common/util/data_verification.h"
#include "common/logging.h"
#include <fmt/format.h>

RDSH::Net::ReliableServerOptions RDSH::Net::ReliableServerOptions::FromConfig(JsonConfigFile &config)
{
	ReliableServerOptions opts;
	opts.host = config.GetVariableString("server", "host", opts.host);
	opts.port = RDSH::Clamp(config.GetVariableInt("server", "port", opts.port), 0, 65535);
	opts.idle_timeout_ms = (size_t)RDSH::ClampLower(config.GetVariableInt("server", "idle_timeout_ms", (int)opts.idle_timeout_ms), 1);
	opts.sweep_interval_ms = (size_t)RDSH::ClampLower(config.GetVariableInt("server", "sweep_interval_ms", (int)opts.sweep_interval_ms), 1);
	opts.discard_duplicate_chunks = config.GetVariableBool("transport", "discard_duplicate_chunks", opts.discard_duplicate_chunks);
	opts.simulated_in_packet_loss = RDSH::Clamp(config.GetVariableInt("transport", "simulated_in_packet_loss", opts.simulated_in_packet_loss), 0, 100);
	opts.sender = ReliableSenderOptions::FromConfig(config);
	return opts;
}

RDSH::Net::ReliableServer::ReliableServer(const ReliableServerOptions &opts, std::shared_ptr<CommandHandler> handler)
	: m_options(opts), m_handler(std::move(handler)), m_running(false)
{
}

RDSH::Net::ReliableServer::~ReliableServer()
{
	Stop();
}

bool RDSH::Net::ReliableServer::Start()
{
	if (m_loop) {
		LOG_ERROR(MOD_NET, "Server already started");
		return false;
	}

	if (!m_handler) {
		LOG_ERROR(MOD_NET, "Server has no command handler");
		return false;
	}

	m_loop.reset(new EventLoop());
	if (!m_loop->Valid()) {
		LOG_ERROR(MOD_NET, "Failed to initialize event loop");
		m_loop.reset();
		return false;
	}

	m_socket.reset(new DatagramSocket(*m_loop));
	m_socket->SetSimulatedInPacketLoss(m_options.simulated_in_packet_loss);
	m_socket->OnReceive([this](const std::string &endpoint, int port, const char *data, size_t size) {
		ProcessPacket(endpoint, port, data, size);
	});

	m_sweep_timer.reset(new Timer(*m_loop, [this](Timer *) {
		SweepIdleSessions();
	}));

	if (!m_socket->Bind(m_options.host, m_options.port)) {
		LOG_ERROR(MOD_NET, "Failed to bind {}:{}", m_options.host, m_options.port);
		m_loop->Stop();
		m_sweep_timer.reset();
		m_socket.reset();
		m_loop.reset();
		return false;
	}

	m_sweep_timer->Start(m_options.sweep_interval_ms);

	m_running = true;
	if (!m_loop->Start()) {
		LOG_ERROR(MOD_NET, "Failed to start event loop");
		m_running = false;
		m_loop->Stop();
		m_sweep_timer.reset();
		m_socket.reset();
		m_loop.reset();
		return false;
	}

	LOG_INFO(MOD_NET, "Server listening on {}:{}", m_options.host, m_socket->LocalPort());
	return true;
}

void RDSH::Net::ReliableServer::Stop()
{
	if (!m_loop) {
		return;
	}

	LOG_INFO(MOD_NET, "Server shutting down, {} sessions active", m_registry.Size());

	m_running = false;
	m_loop->Stop();

	// The loop thread is gone; the registry is ours now.
	for (auto &id : m_registry.Ids()) {
		m_registry.Remove(id);
		if (m_on_session_closed) {
			m_on_session_closed(id, "shutdown");
		}
	}

	ReapHandlers(true);

	m_sweep_timer.reset();
	m_socket.reset();
	m_loop.reset();
}

int RDSH::Net::ReliableServer::LocalPort() const
{
	if (!m_socket) {
		return 0;
	}

	return m_socket->LocalPort();
}

template<typename T>
T RDSH::Net::ReliableServer::QueryLoop(std::function<T()> query, T fallback)
{
	if (!m_loop) {
		return query();
	}

	if (m_loop->IsLoopThread()) {
		return query();
	}

	auto promise = std::make_shared<std::promise<T>>();
	auto result = promise->get_future();
	if (!m_loop->Post([promise, query]() { promise->set_value(query()); })) {
		return fallback;
	}

	if (result.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
		LOG_WARN(MOD_NET, "Timed out querying the event loop");
		return fallback;
	}

	return result.get();
}

size_t RDSH::Net::ReliableServer::SessionCount()
{
	return QueryLoop<size_t>([this]() { return m_registry.Size(); }, 0);
}

bool RDSH::Net::ReliableServer::HasSession(const std::string &id)
{
	return QueryLoop<bool>([this, id]() { return m_registry.Find(id) != nullptr; }, false);
}

std::vector<std::string> RDSH::Net::ReliableServer::SessionIds()
{
	return QueryLoop<std::vector<std::string>>([this]() { return m_registry.Ids(); }, std::vector<std::string>());
}

RDSH::Net::DatagramSocketStats RDSH::Net::ReliableServer::GetSocketStats() const
{
	if (!m_socket) {
		return DatagramSocketStats();
	}

	return m_socket->GetStats();
}

void RDSH::Net::ReliableServer::ProcessPacket(const std::string &endpoint, int port, const char *data, size_t size)
{
	Packet p;
	if (!DecodePacket(data, size, p)) {
		LOG_DEBUG(MOD_NET, "Dropped undecodable packet from {}:{} ({} bytes)", endpoint, port, size);
		return;
	}

	try {
		switch (p.type) {
		case PacketConnect:
			HandleConnect(p, endpoint, port);
			break;
		case PacketData:
		case PacketLast:
			HandleData(p, endpoint, port);
			break;
		case PacketAck:
			HandleAck(p);
			break;
		default:
			LOG_DEBUG(MOD_NET, "Ignoring {} packet from {}:{}", PacketTypeName(p.type), endpoint, port);
			break;
		}
	}
	catch (std::exception &ex) {
		LOG_ERROR(MOD_NET, "Error handling packet from {}:{}: {}", endpoint, port, ex.what());
	}
}

void RDSH::Net::ReliableServer::HandleConnect(const Packet &p, const std::string &endpoint, int port)
{
	auto now = Clock::now();

	SessionPtr session;
	if (!p.session_id.empty()) {
		session = m_registry.Find(p.session_id);
	}

	if (session) {
		m_registry.Touch(session->id, now);
		LOG_DEBUG(MOD_SESSION, "Repeated CONNECT for [{}], resending CONNECT_ACK", session->id);
		SendControl(endpoint, port, session->id, 0, PacketConnectAck, session->id);
		return;
	}

	// The requested id has to fit a CONNECT_ACK, which carries it twice.
	std::string requested_id = p.session_id;
	if (!requested_id.empty()) {
		try {
			EncodePacket(requested_id, 0, PacketConnectAck, requested_id);
		}
		catch (PacketEncodeError &ex) {
			LOG_WARN(MOD_SESSION, "Requested session id from {}:{} is unusable ({}), generating one", endpoint, port, ex.what());
			requested_id.clear();
		}
	}

	session = m_registry.Create(endpoint, port, requested_id, now);

	DatagramSocket *socket = m_socket.get();
	std::atomic<bool> *running = &m_running;
	session->sender.reset(new ReliableSender(m_options.sender, [socket, running, endpoint, port](const std::string &packet) {
		return running->load() && socket->SendTo(endpoint, port, packet);
	}, session->acks));

	SendControl(endpoint, port, session->id, 0, PacketConnectAck, session->id);

	LOG_INFO(MOD_SESSION, "New client connected: [{}] from {}:{}", session->id, endpoint, port);

	StartHandler(session);

	if (m_on_new_session) {
		m_on_new_session(session->id);
	}
}

void RDSH::Net::ReliableServer::HandleData(const Packet &p, const std::string &endpoint, int port)
{
	auto session = m_registry.Find(p.session_id);
	if (!session) {
		LOG_WARN(MOD_SESSION, "Received data for unknown session: [{}] from {}:{}", p.session_id, endpoint, port);
		return;
	}

	m_registry.Touch(session->id, Clock::now());

	SendControl(endpoint, port, "ACK", p.sequence, PacketAck, session->id);

	InboundChunk chunk;
	chunk.sequence = p.sequence;
	chunk.type = p.type;
	chunk.data = p.payload;
	if (!session->inbox.Push(std::move(chunk))) {
		LOG_DEBUG(MOD_SESSION, "Inbox of [{}] closed, chunk {} dropped", session->id, p.sequence);
		return;
	}

	LOG_TRACE(MOD_NET, "Received {} packet {} for session [{}]", PacketTypeName(p.type), p.sequence, session->id);
}

void RDSH::Net::ReliableServer::HandleAck(const Packet &p)
{
	auto session = m_registry.Find(p.session_id);
	if (!session) {
		LOG_DEBUG(MOD_SESSION, "ACK {} for unknown session [{}] dropped", p.sequence, p.session_id);
		return;
	}

	m_registry.Touch(session->id, Clock::now());
	if (!session->acks.Push(p.sequence)) {
		LOG_DEBUG(MOD_SESSION, "ACK channel of [{}] closed", session->id);
	}
}

void RDSH::Net::ReliableServer::SendControl(const std::string &endpoint, int port, const std::string &payload, uint64_t sequence, PacketType type, const std::string &session_id)
{
	std::string out;
	try {
		out = EncodePacket(payload, sequence, type, session_id);
	}
	catch (PacketEncodeError &ex) {
		LOG_ERROR(MOD_NET, "Failed to encode {} for [{}]: {}", PacketTypeName(type), session_id, ex.what());
		return;
	}

	if (!m_socket->SendTo(endpoint, port, out)) {
		LOG_WARN(MOD_NET, "Failed to send {} {} to {}:{}", PacketTypeName(type), sequence, endpoint, port);
	}
}

void RDSH::Net::ReliableServer::SweepIdleSessions()
{
	auto expired = m_registry.ExpireIdle(Clock::now(), std::chrono::milliseconds(m_options.idle_timeout_ms));
	for (auto &id : expired) {
		LOG_INFO(MOD_SESSION, "Removing inactive session: [{}]", id);
		if (m_on_session_closed) {
			m_on_session_closed(id, "idle");
		}
	}

	ReapHandlers(false);
}

void RDSH::Net::ReliableServer::CloseSession(const std::string &id, const std::string &reason)
{
	if (!m_registry.Remove(id)) {
		return;
	}

	LOG_INFO(MOD_SESSION, "Closed session [{}]: {}", id, reason);
	if (m_on_session_closed) {
		m_on_session_closed(id, reason);
	}
}

void RDSH::Net::ReliableServer::StartHandler(SessionPtr session)
{
	std::lock_guard<std::mutex> lock(m_handlers_mutex);

	HandlerThread handler;
	handler.session_id = session->id;
	handler.done = std::make_shared<std::atomic<bool>>(false);

	auto done = handler.done;
	handler.thread = std::thread([this, session, done]() {
		RunHandler(session);
		*done = true;
	});

	m_handlers.push_back(std::move(handler));
}

void RDSH::Net::ReliableServer::RunHandler(SessionPtr session)
{
	LOG_DEBUG(MOD_SESSION, "Handler started for [{}]", session->id);

	Reassembler reassembler(m_options.discard_duplicate_chunks);

	if (!session->sender->SendPayload(m_handler->Greeting(), session->id)) {
		LOG_WARN(MOD_SESSION, "Failed to deliver greeting to [{}]", session->id);
	}

	while (m_running && !session->closed) {
		auto chunk = session->inbox.PopFor(std::chrono::milliseconds(m_options.inbox_poll_ms));
		if (!chunk) {
			continue;
		}

		auto message = reassembler.Push(*chunk);
		if (!message) {
			continue;
		}

		CommandResult result;
		try {
			result = m_handler->Execute(session->id, *message);
		}
		catch (std::exception &ex) {
			LOG_ERROR(MOD_SHELL, "Error processing command for [{}]: {}", session->id, ex.what());
			result.output = fmt::format("Error: {}\r\n$ ", ex.what());
		}

		if (!session->sender->SendPayload(result.output, session->id)) {
			LOG_WARN(MOD_SESSION, "Failed to deliver reply to [{}]", session->id);
		}

		if (result.end_session) {
			auto id = session->id;
			if (!m_loop->Post([this, id]() { CloseSession(id, "exit"); })) {
				LOG_DEBUG(MOD_SESSION, "Loop stopping, [{}] will close with the server", id);
			}
			break;
		}
	}

	LOG_DEBUG(MOD_SESSION, "Handler finished for [{}]", session->id);
}

void RDSH::Net::ReliableServer::ReapHandlers(bool all)
{
	std::list<HandlerThread> finished;
	{
		std::lock_guard<std::mutex> lock(m_handlers_mutex);
		auto iter = m_handlers.begin();
		while (iter != m_handlers.end()) {
			if (all || iter->done->load()) {
				finished.push_back(std::move(*iter));
				iter = m_handlers.erase(iter);
			}
			else {
				++iter;
			}
		}
	}

	for (auto &handler : finished) {
		if (handler.thread.joinable()) {
			handler.thread.join();
		}
	}
}
