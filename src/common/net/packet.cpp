#include "common/net/packet.h"
#include "common/net/checksum.h"
#include "common/logging.h"
#include <json/json.h>
#include <memory>

namespace
{
	struct PacketTypeMapping
	{
		RDSH::Net::PacketType type;
		const char *name;
	};

	const PacketTypeMapping packet_type_names[] = {
		{ RDSH::Net::PacketConnect,    "CONNECT" },
		{ RDSH::Net::PacketConnectAck, "CONNECT_ACK" },
		{ RDSH::Net::PacketData,       "DATA" },
		{ RDSH::Net::PacketLast,       "LAST" },
		{ RDSH::Net::PacketAck,        "ACK" },
	};
}

const char *RDSH::Net::PacketTypeName(PacketType type)
{
	for (auto &m : packet_type_names) {
		if (m.type == type) {
			return m.name;
		}
	}

	return "UNKNOWN";
}

bool RDSH::Net::ParsePacketType(const std::string &name, PacketType &out)
{
	for (auto &m : packet_type_names) {
		if (name == m.name) {
			out = m.type;
			return true;
		}
	}

	return false;
}

std::string RDSH::Net::EncodePacket(const std::string &payload, uint64_t sequence, PacketType type, const std::string &session_id)
{
	if (payload.size() > MaxPayloadSize) {
		throw PacketEncodeError(fmt::format("payload of {} bytes exceeds the {} byte frame limit", payload.size(), MaxPayloadSize));
	}

	Json::Value header;
	header["seq"] = Json::UInt64(sequence);
	header["checksum"] = Md5Hex(payload);
	header["type"] = PacketTypeName(type);
	header["length"] = Json::UInt64(payload.size());
	header["session"] = session_id;

	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	std::string encoded = Json::writeString(builder, header);

	if (encoded.size() > PacketHeaderSize) {
		throw PacketEncodeError(fmt::format("header of {} bytes exceeds the {} byte header region", encoded.size(), PacketHeaderSize));
	}

	encoded.resize(PacketHeaderSize, ' ');
	encoded.append(payload);
	return encoded;
}

bool RDSH::Net::DecodePacket(const char *data, size_t size, Packet &out)
{
	if (size < PacketHeaderSize) {
		LOG_WARN(MOD_NET_PACKET, "Dropping packet of {} bytes, shorter than the {} byte header", size, PacketHeaderSize);
		return false;
	}

	if (size > PacketCapacity) {
		LOG_WARN(MOD_NET_PACKET, "Dropping packet of {} bytes, larger than capacity {}", size, PacketCapacity);
		return false;
	}

	const char *header_begin = data;
	const char *header_end = data + PacketHeaderSize;
	while (header_end > header_begin && (header_end[-1] == ' ' || header_end[-1] == '\0')) {
		--header_end;
	}

	Json::CharReaderBuilder builder;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
	Json::Value header;
	std::string errors;
	if (!reader->parse(header_begin, header_end, &header, &errors) || !header.isObject()) {
		LOG_WARN(MOD_NET_PACKET, "Dropping packet with malformed header: {}", errors);
		return false;
	}

	if (!header["seq"].isUInt64() || !header["type"].isString() || !header["length"].isUInt64()) {
		LOG_WARN(MOD_NET_PACKET, "Dropping packet with missing or mistyped header fields");
		return false;
	}

	PacketType type;
	if (!ParsePacketType(header["type"].asString(), type)) {
		LOG_WARN(MOD_NET_PACKET, "Dropping packet with unknown type '{}'", header["type"].asString());
		return false;
	}

	uint64_t length = header["length"].asUInt64();
	if (length > MaxPayloadSize) {
		LOG_WARN(MOD_NET_PACKET, "Dropping packet declaring {} payload bytes", length);
		return false;
	}

	if (size - PacketHeaderSize < length) {
		LOG_WARN(MOD_NET_PACKET, "Dropping truncated packet: {} payload bytes present, {} declared", size - PacketHeaderSize, length);
		return false;
	}

	const Json::Value &session = header["session"];
	const Json::Value &checksum = header["checksum"];
	if ((!session.isNull() && !session.isString()) || (!checksum.isNull() && !checksum.isString())) {
		LOG_WARN(MOD_NET_PACKET, "Dropping packet with non-string session or checksum");
		return false;
	}

	Packet p;
	p.sequence = header["seq"].asUInt64();
	p.type = type;
	p.length = (size_t)length;
	p.session_id = session.isString() ? session.asString() : std::string();
	p.checksum = checksum.isString() ? checksum.asString() : std::string();
	p.payload.assign(data + PacketHeaderSize, (size_t)length);

	if (IsDataPacket(type)) {
		auto calculated = Md5Hex(p.payload);
		if (p.checksum != calculated) {
			LOG_WARN(MOD_NET_PACKET, "Checksum mismatch for packet {}", p.sequence);
			return false;
		}
	}

	out = std::move(p);
	return true;
}
