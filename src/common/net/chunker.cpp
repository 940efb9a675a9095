#include "common/net/chunker.h"
#include "common/logging.h"
#include <algorithm>
#include <stdexcept>

std::vector<RDSH::Net::Chunk> RDSH::Net::SplitPayload(const std::string &payload, size_t max_chunk_size)
{
	if (max_chunk_size == 0 || max_chunk_size > MaxPayloadSize) {
		throw std::invalid_argument(fmt::format("chunk size {} outside 1..{}", max_chunk_size, MaxPayloadSize));
	}

	std::vector<Chunk> chunks;
	if (payload.empty()) {
		chunks.push_back(Chunk{ PacketLast, std::string() });
		return chunks;
	}

	chunks.reserve((payload.size() + max_chunk_size - 1) / max_chunk_size);
	for (size_t offset = 0; offset < payload.size(); offset += max_chunk_size) {
		size_t length = std::min(max_chunk_size, payload.size() - offset);
		bool last = offset + length >= payload.size();
		chunks.push_back(Chunk{ last ? PacketLast : PacketData, payload.substr(offset, length) });
	}

	return chunks;
}

std::optional<std::string> RDSH::Net::Reassembler::Push(const InboundChunk &chunk)
{
	if (m_discard_stale) {
		if (m_has_watermark && chunk.sequence <= m_watermark) {
			m_discarded++;
			LOG_DEBUG(MOD_NET, "Reassembler discarding stale chunk {} (watermark {})", chunk.sequence, m_watermark);
			return std::nullopt;
		}

		m_watermark = chunk.sequence;
		m_has_watermark = true;
	}

	m_buffer.append(chunk.data);

	if (chunk.type != PacketLast) {
		return std::nullopt;
	}

	std::string message;
	message.swap(m_buffer);
	return message;
}

void RDSH::Net::Reassembler::Reset()
{
	m_buffer.clear();
	m_has_watermark = false;
	m_watermark = 0;
	m_discarded = 0;
}
