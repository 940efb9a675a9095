#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace RDSH
{
	namespace Net
	{
		// Wire layout: a JSON header record padded with spaces to exactly
		// PacketHeaderSize bytes, immediately followed by the payload.
		constexpr size_t PacketCapacity   = 1400;
		constexpr size_t PacketHeaderSize = 200;
		constexpr size_t MaxPayloadSize   = PacketCapacity - PacketHeaderSize;

		enum PacketType
		{
			PacketConnect = 0,
			PacketConnectAck,
			PacketData,
			PacketLast,
			PacketAck
		};

		const char *PacketTypeName(PacketType type);
		bool ParsePacketType(const std::string &name, PacketType &out);

		inline bool IsDataPacket(PacketType type) {
			return type == PacketData || type == PacketLast;
		}

		struct Packet
		{
			uint64_t sequence = 0;
			std::string checksum;
			PacketType type = PacketData;
			size_t length = 0;
			std::string session_id;
			std::string payload;
		};

		class PacketEncodeError : public std::runtime_error
		{
		public:
			using std::runtime_error::runtime_error;
		};

		// Throws PacketEncodeError if the payload is larger than MaxPayloadSize or
		// the header record does not fit in PacketHeaderSize.
		std::string EncodePacket(const std::string &payload, uint64_t sequence, PacketType type, const std::string &session_id);

		// Returns false for malformed or truncated packets and for DATA/LAST
		// packets whose checksum does not match. Control packets are never
		// checksum-verified.
		bool DecodePacket(const char *data, size_t size, Packet &out);

		inline bool DecodePacket(const std::string &data, Packet &out) {
			return DecodePacket(data.data(), data.size(), out);
		}
	}
}
