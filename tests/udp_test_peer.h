#pragma once

/**
 * Raw UDP test peer
 *
 * Speaks the wire format directly over a blocking POSIX socket so server
 * behaviour can be checked packet by packet: exact ACKs, retransmissions,
 * corrupted frames and sessions that never answer.
 */

#include "common/net/chunker.h"
#include "common/net/packet.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <chrono>
#include <cstring>
#include <deque>
#include <optional>
#include <string>

namespace RDSH {
namespace Test {

class UdpTestPeer {
public:
    UdpTestPeer() {
        m_fd = socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));

        socklen_t len = sizeof(addr);
        getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len);
        m_port = ntohs(addr.sin_port);
    }

    ~UdpTestPeer() {
        if (m_fd >= 0) {
            close(m_fd);
        }
    }

    UdpTestPeer(const UdpTestPeer&) = delete;
    UdpTestPeer& operator=(const UdpTestPeer&) = delete;

    bool Valid() const { return m_fd >= 0 && m_port != 0; }
    int Port() const { return m_port; }

    void SetServerPort(int port) { m_server_port = port; }

    bool SendRaw(const std::string& data) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(static_cast<uint16_t>(m_server_port));
        auto sent = sendto(m_fd, data.data(), data.size(), 0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        return sent == static_cast<ssize_t>(data.size());
    }

    bool Send(const std::string& payload, uint64_t seq, Net::PacketType type, const std::string& session) {
        return SendRaw(Net::EncodePacket(payload, seq, type, session));
    }

    std::optional<std::string> ReceiveRaw(std::chrono::milliseconds timeout) {
        timeval tv;
        tv.tv_sec = static_cast<long>(timeout.count() / 1000);
        tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
        if (tv.tv_sec == 0 && tv.tv_usec == 0) {
            tv.tv_usec = 1000;
        }
        setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        char buffer[65536];
        auto n = recv(m_fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            return std::nullopt;
        }
        return std::string(buffer, static_cast<size_t>(n));
    }

    // Next decodable packet, including ones set aside by earlier waits.
    std::optional<Net::Packet> Receive(std::chrono::milliseconds timeout) {
        if (!m_backlog.empty()) {
            auto p = m_backlog.front();
            m_backlog.pop_front();
            return p;
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return std::nullopt;
            }

            auto raw = ReceiveRaw(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
            if (!raw) {
                return std::nullopt;
            }

            Net::Packet p;
            if (Net::DecodePacket(*raw, p)) {
                return p;
            }
        }
    }

    // Waits for a packet of the given type; anything else goes to the backlog.
    std::optional<Net::Packet> WaitFor(Net::PacketType type, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::deque<Net::Packet> skipped;
        std::optional<Net::Packet> found;

        while (!found) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }

            std::optional<Net::Packet> p;
            if (!m_backlog.empty()) {
                p = m_backlog.front();
                m_backlog.pop_front();
            } else {
                p = Receive(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
            }

            if (!p) {
                break;
            }

            if (p->type == type) {
                found = p;
            } else {
                skipped.push_back(*p);
            }
        }

        for (auto it = skipped.rbegin(); it != skipped.rend(); ++it) {
            m_backlog.push_front(*it);
        }
        return found;
    }

    std::optional<std::string> Connect(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        if (!Send("CONNECT", 0, Net::PacketConnect, "")) {
            return std::nullopt;
        }

        auto ack = WaitFor(Net::PacketConnectAck, timeout);
        if (!ack) {
            return std::nullopt;
        }

        m_session = ack->session_id;
        return m_session;
    }

    // Sends a payload stop-and-wait, expecting the server to ACK each chunk.
    bool SendMessage(const std::string& payload, std::chrono::milliseconds ack_timeout = std::chrono::milliseconds(1000)) {
        for (auto& chunk : Net::SplitPayload(payload)) {
            uint64_t seq = m_next_seq++;
            if (!Send(chunk.data, seq, chunk.type, m_session)) {
                return false;
            }

            bool acked = false;
            while (!acked) {
                auto ack = WaitFor(Net::PacketAck, ack_timeout);
                if (!ack) {
                    return false;
                }
                acked = ack->sequence == seq;
            }
        }
        return true;
    }

    // Acknowledges every DATA/LAST and drops retransmitted sequences.
    std::optional<std::string> ReceiveMessage(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::string message;

        for (;;) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return std::nullopt;
            }

            auto p = Receive(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
            if (!p) {
                return std::nullopt;
            }

            if (!Net::IsDataPacket(p->type)) {
                continue;
            }

            if (m_auto_ack) {
                Send("ACK", p->sequence, Net::PacketAck, m_session);
            }

            if (m_has_received && p->sequence <= m_last_received) {
                continue;
            }
            m_has_received = true;
            m_last_received = p->sequence;

            message.append(p->payload);
            if (p->type == Net::PacketLast) {
                return message;
            }
        }
    }

    const std::string& Session() const { return m_session; }
    void SetSession(const std::string& session) { m_session = session; }
    void SetAutoAck(bool enabled) { m_auto_ack = enabled; }
    uint64_t NextSequence() const { return m_next_seq; }

private:
    int m_fd = -1;
    int m_port = 0;
    int m_server_port = 0;
    std::string m_session;
    uint64_t m_next_seq = 0;
    bool m_auto_ack = true;
    bool m_has_received = false;
    uint64_t m_last_received = 0;
    std::deque<Net::Packet> m_backlog;
};

}  // namespace Test
}  // namespace RDSH
