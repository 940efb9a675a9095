#include "common/net/datagram_socket.h"
#include "common/logging.h"
#include <cstring>

bool RDSH::Net::ResolveIPv4(uv_loop_t *loop, const std::string &host, std::string &out)
{
	sockaddr_in addr;
	if (uv_ip4_addr(host.c_str(), 0, &addr) == 0) {
		out = host;
		return true;
	}

	addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_DGRAM;

	// No callback makes uv_getaddrinfo synchronous.
	uv_getaddrinfo_t req;
	int rc = uv_getaddrinfo(loop, &req, nullptr, host.c_str(), nullptr, &hints);
	if (rc != 0) {
		LOG_ERROR(MOD_NET, "Failed to resolve {}: {}", host, uv_strerror(rc));
		return false;
	}

	bool found = false;
	for (addrinfo *ai = req.addrinfo; ai != nullptr; ai = ai->ai_next) {
		if (ai->ai_family != AF_INET) {
			continue;
		}

		char name[16];
		uv_ip4_name((const sockaddr_in*)ai->ai_addr, name, sizeof(name));
		out = name;
		found = true;
		break;
	}

	uv_freeaddrinfo(req.addrinfo);

	if (!found) {
		LOG_ERROR(MOD_NET, "No IPv4 address for {}", host);
	}

	return found;
}

RDSH::Net::DatagramSocket::DatagramSocket(EventLoop &loop)
	: m_loop(loop), m_initialized(false), m_bound(false), m_local_port(0), m_simulated_in_packet_loss(0)
{
	memset(&m_socket, 0, sizeof(uv_udp_t));
	m_sent_packets = 0;
	m_sent_bytes = 0;
	m_recv_packets = 0;
	m_recv_bytes = 0;
	m_send_errors = 0;
	m_dropped_packets = 0;

	if (!loop.Valid()) {
		return;
	}

	int rc = uv_udp_init(loop.Handle(), &m_socket);
	if (rc != 0) {
		LOG_ERROR(MOD_NET, "uv_udp_init failed: {}", uv_strerror(rc));
		return;
	}

	m_socket.data = this;
	m_initialized = true;
}

RDSH::Net::DatagramSocket::~DatagramSocket()
{
	if (m_loop.Running()) {
		LOG_ERROR(MOD_NET, "DatagramSocket destroyed while its loop is running");
	}
}

bool RDSH::Net::DatagramSocket::Bind(const std::string &host, int port)
{
	if (!m_initialized || m_bound) {
		return false;
	}

	std::string address;
	if (!ResolveIPv4(m_loop.Handle(), host, address)) {
		return false;
	}

	sockaddr_in recv_addr;
	uv_ip4_addr(address.c_str(), port, &recv_addr);
	int rc = uv_udp_bind(&m_socket, (const struct sockaddr *)&recv_addr, 0);
	if (rc != 0) {
		LOG_ERROR(MOD_NET, "Bind to {}:{} failed: {}", address, port, uv_strerror(rc));
		return false;
	}

	sockaddr_storage bound_addr;
	int namelen = sizeof(bound_addr);
	rc = uv_udp_getsockname(&m_socket, (struct sockaddr *)&bound_addr, &namelen);
	if (rc != 0) {
		LOG_ERROR(MOD_NET, "uv_udp_getsockname failed: {}", uv_strerror(rc));
		return false;
	}
	m_local_port = ntohs(((const sockaddr_in*)&bound_addr)->sin_port);

	rc = uv_udp_recv_start(
		&m_socket,
		[](uv_handle_t *handle, size_t suggested_size, uv_buf_t *buf) {
			static thread_local char temp_buf[65536];
			buf->base = temp_buf;
			buf->len  = sizeof(temp_buf);
		},
		[](uv_udp_t *handle, ssize_t nread, const uv_buf_t *buf, const struct sockaddr *addr, unsigned flags) {
			DatagramSocket *s = (DatagramSocket*)handle->data;
			if (nread < 0) {
				LOG_WARN(MOD_NET, "Receive error: {}", uv_strerror((int)nread));
				return;
			}

			if (addr == nullptr) {
				return;
			}

			s->ProcessReceive(buf->base, (size_t)nread, addr);
		});

	if (rc != 0) {
		LOG_ERROR(MOD_NET, "uv_udp_recv_start failed: {}", uv_strerror(rc));
		return false;
	}

	LOG_DEBUG(MOD_NET, "Bound datagram socket to {}:{}", address, m_local_port);
	m_bound = true;
	return true;
}

void RDSH::Net::DatagramSocket::ProcessReceive(const char *data, size_t size, const struct sockaddr *addr)
{
	if (addr->sa_family != AF_INET) {
		return;
	}

	int loss = m_simulated_in_packet_loss;
	if (loss > 0 && m_rand.Roll(loss)) {
		m_dropped_packets++;
		return;
	}

	m_recv_packets++;
	m_recv_bytes += size;

	char endpoint[16];
	uv_ip4_name((const sockaddr_in*)addr, endpoint, 16);
	auto port = ntohs(((const sockaddr_in*)addr)->sin_port);

	if (m_on_receive) {
		m_on_receive(endpoint, port, data, size);
	}
}

bool RDSH::Net::DatagramSocket::SendTo(const std::string &endpoint, int port, const std::string &data)
{
	if (!m_initialized) {
		return false;
	}

	if (m_loop.IsLoopThread()) {
		return SendOnLoop(endpoint, port, data);
	}

	return m_loop.Post([this, endpoint, port, data]() {
		SendOnLoop(endpoint, port, data);
	});
}

bool RDSH::Net::DatagramSocket::SendOnLoop(const std::string &endpoint, int port, const std::string &data)
{
	if (uv_is_closing((uv_handle_t*)&m_socket)) {
		return false;
	}

	sockaddr_in send_addr;
	if (uv_ip4_addr(endpoint.c_str(), port, &send_addr) != 0) {
		LOG_ERROR(MOD_NET, "Invalid destination {}:{}", endpoint, port);
		m_send_errors++;
		return false;
	}

	uv_udp_send_t *send_req = new uv_udp_send_t;
	uv_buf_t send_buffers[1];

	char *buffer = new char[data.size()];
	memcpy(buffer, data.data(), data.size());
	send_buffers[0] = uv_buf_init(buffer, (unsigned int)data.size());
	send_req->data = send_buffers[0].base;

	int rc = uv_udp_send(send_req, &m_socket, send_buffers, 1, (sockaddr*)&send_addr,
		[](uv_udp_send_t *req, int status) {
			if (status < 0 && status != UV_ECANCELED) {
				LOG_ERROR(MOD_NET, "uv_udp_send failed: {}", uv_strerror(status));
			}

			delete[](char*)req->data;
			delete req;
		});

	if (rc < 0) {
		LOG_ERROR(MOD_NET, "uv_udp_send() failed: {}", uv_strerror(rc));
		delete[] buffer;
		delete send_req;
		m_send_errors++;
		return false;
	}

	m_sent_packets++;
	m_sent_bytes += data.size();
	return true;
}

RDSH::Net::DatagramSocketStats RDSH::Net::DatagramSocket::GetStats() const
{
	DatagramSocketStats stats;
	stats.sent_packets = m_sent_packets;
	stats.sent_bytes = m_sent_bytes;
	stats.recv_packets = m_recv_packets;
	stats.recv_bytes = m_recv_bytes;
	stats.send_errors = m_send_errors;
	stats.dropped_packets = m_dropped_packets;
	return stats;
}
