#pragma once

#include "common/net/packet.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace RDSH
{
	namespace Net
	{
		struct Chunk
		{
			PacketType type;
			std::string data;
		};

		// Every chunk but the last is PacketData, the last is PacketLast. An empty
		// payload produces one empty PacketLast chunk so the peer still sees the
		// message boundary. Throws std::invalid_argument unless
		// 1 <= max_chunk_size <= MaxPayloadSize.
		std::vector<Chunk> SplitPayload(const std::string &payload, size_t max_chunk_size = MaxPayloadSize);

		struct InboundChunk
		{
			uint64_t sequence = 0;
			PacketType type = PacketData;
			std::string data;
		};

		// Joins chunks in arrival order until a PacketLast chunk completes the
		// message. There is no reordering window. Duplicates are appended again
		// unless discard_stale is set, in which case chunks at or below the
		// highest sequence already accepted are dropped.
		class Reassembler
		{
		public:
			explicit Reassembler(bool discard_stale = false) : m_discard_stale(discard_stale) { }

			std::optional<std::string> Push(const InboundChunk &chunk);

			size_t BufferedBytes() const { return m_buffer.size(); }
			uint64_t DiscardedChunks() const { return m_discarded; }
			void Reset();

		private:
			bool m_discard_stale;
			bool m_has_watermark = false;
			uint64_t m_watermark = 0;
			uint64_t m_discarded = 0;
			std::string m_buffer;
		};
	}
}
