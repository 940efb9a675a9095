#include "common/net/reliable_sender.h"
#include "common/util/json_config.h"
#include "common/util/data_verification.h"
#include "common/logging.h"

RDSH::Net::ReliableSenderOptions RDSH::Net::ReliableSenderOptions::FromConfig(JsonConfigFile &config)
{
	ReliableSenderOptions opts;
	opts.ack_timeout_ms = (size_t)RDSH::ClampLower(config.GetVariableInt("transport", "ack_timeout_ms", (int)opts.ack_timeout_ms), 1);
	opts.max_retries = RDSH::Clamp(config.GetVariableInt("transport", "max_retries", opts.max_retries), 1, 100);
	opts.max_chunk_size = (size_t)RDSH::Clamp(config.GetVariableInt("transport", "max_chunk_size", (int)opts.max_chunk_size), 1, (int)MaxPayloadSize);
	return opts;
}

RDSH::Net::ReliableSender::ReliableSender(const ReliableSenderOptions &opts, TransmitFunction transmit, Channel<uint64_t> &acks)
	: m_options(opts), m_transmit(std::move(transmit)), m_acks(acks), m_next_sequence(0)
{
}

bool RDSH::Net::ReliableSender::SendPayload(const std::string &payload, const std::string &session_id)
{
	std::lock_guard<std::mutex> send_lock(m_send_mutex);

	std::vector<Chunk> chunks;
	try {
		chunks = SplitPayload(payload, m_options.max_chunk_size);
	}
	catch (std::invalid_argument &ex) {
		LOG_ERROR(MOD_NET, "Cannot split payload: {}", ex.what());
		return false;
	}

	LOG_TRACE(MOD_NET, "SendPayload: {} bytes in {} chunks for session [{}]", payload.size(), chunks.size(), session_id);

	for (auto &chunk : chunks) {
		if (!SendChunk(chunk, session_id)) {
			std::lock_guard<std::mutex> lock(m_state_mutex);
			m_stats.payloads_failed++;
			return false;
		}
	}

	std::lock_guard<std::mutex> lock(m_state_mutex);
	m_stats.payloads_sent++;
	return true;
}

bool RDSH::Net::ReliableSender::SendChunk(const Chunk &chunk, const std::string &session_id)
{
	PendingSend pending;
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		pending.sequence = m_next_sequence++;
	}
	pending.packet_type = chunk.type;
	pending.retry_count = 0;

	std::string packet;
	try {
		packet = EncodePacket(chunk.data, pending.sequence, pending.packet_type, session_id);
	}
	catch (PacketEncodeError &ex) {
		LOG_ERROR(MOD_NET, "Failed to encode packet {}: {}", pending.sequence, ex.what());
		return false;
	}

	while (pending.retry_count < m_options.max_retries) {
		if (!m_transmit(packet)) {
			LOG_ERROR(MOD_NET, "Transmit failed for packet {}", pending.sequence);
			return false;
		}

		{
			std::lock_guard<std::mutex> lock(m_state_mutex);
			m_stats.packets_sent++;
			if (pending.retry_count > 0) {
				m_stats.retransmits++;
			}
		}

		if (AwaitAck(pending.sequence)) {
			return true;
		}

		if (m_acks.Closed()) {
			LOG_DEBUG(MOD_NET, "ACK channel closed while waiting for {}", pending.sequence);
			return false;
		}

		pending.retry_count++;
		LOG_WARN(MOD_NET, "Timeout waiting for ACK {}, retry {}", pending.sequence, pending.retry_count);
	}

	LOG_ERROR(MOD_NET, "Failed to send packet {} after {} retries", pending.sequence, m_options.max_retries);
	return false;
}

bool RDSH::Net::ReliableSender::AwaitAck(uint64_t sequence)
{
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_options.ack_timeout_ms);

	for (;;) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			return false;
		}

		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
		if (remaining.count() == 0) {
			remaining = std::chrono::milliseconds(1);
		}

		auto ack = m_acks.PopFor(remaining);
		if (!ack) {
			if (m_acks.Closed()) {
				return false;
			}
			continue;
		}

		std::lock_guard<std::mutex> lock(m_state_mutex);
		if (*ack == sequence) {
			m_stats.acks_matched++;
			return true;
		}

		m_stats.stale_acks++;
		LOG_TRACE(MOD_NET, "Ignoring ACK {} while waiting for {}", *ack, sequence);
	}
}

uint64_t RDSH::Net::ReliableSender::NextSequence() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_next_sequence;
}

RDSH::Net::ReliableSenderStats RDSH::Net::ReliableSender::GetStats() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_stats;
}
