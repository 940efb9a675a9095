#include "server/session_registry.h"
#include "common/net/checksum.h"
#include "common/logging.h"
#include <fmt/format.h>

RDSH::Net::SessionPtr RDSH::Net::SessionRegistry::Create(const std::string &endpoint, int port, const std::string &requested_id, Timestamp now)
{
	std::string id = requested_id;
	while (id.empty() || m_sessions.count(id) != 0) {
		id = GenerateId(endpoint, port, now, m_rand.Nonce());
	}

	auto session = std::make_shared<Session>(id, endpoint, port, now);
	m_sessions.emplace(id, session);

	LOG_DEBUG(MOD_SESSION, "Created session [{}] for {}:{}, {} active", id, endpoint, port, m_sessions.size());
	return session;
}

RDSH::Net::SessionPtr RDSH::Net::SessionRegistry::Find(const std::string &id) const
{
	auto iter = m_sessions.find(id);
	if (iter != m_sessions.end()) {
		return iter->second;
	}

	return nullptr;
}

bool RDSH::Net::SessionRegistry::Touch(const std::string &id, Timestamp now)
{
	auto iter = m_sessions.find(id);
	if (iter == m_sessions.end()) {
		return false;
	}

	if (now > iter->second->last_activity) {
		iter->second->last_activity = now;
	}

	return true;
}

RDSH::Net::SessionPtr RDSH::Net::SessionRegistry::Remove(const std::string &id)
{
	auto iter = m_sessions.find(id);
	if (iter == m_sessions.end()) {
		return nullptr;
	}

	auto session = iter->second;
	m_sessions.erase(iter);
	session->Close();

	LOG_DEBUG(MOD_SESSION, "Removed session [{}], {} active", id, m_sessions.size());
	return session;
}

std::vector<std::string> RDSH::Net::SessionRegistry::ExpireIdle(Timestamp now, std::chrono::milliseconds idle)
{
	std::vector<std::string> expired;

	auto iter = m_sessions.begin();
	while (iter != m_sessions.end()) {
		auto &session = iter->second;
		if (now - session->last_activity > idle) {
			expired.push_back(iter->first);
			session->Close();
			iter = m_sessions.erase(iter);
		}
		else {
			++iter;
		}
	}

	return expired;
}

std::vector<std::string> RDSH::Net::SessionRegistry::Ids() const
{
	std::vector<std::string> ids;
	ids.reserve(m_sessions.size());
	for (auto &e : m_sessions) {
		ids.push_back(e.first);
	}

	return ids;
}

std::string RDSH::Net::SessionRegistry::GenerateId(const std::string &endpoint, int port, Timestamp now, uint64_t nonce)
{
	auto ticks = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
	return Md5Hex(fmt::format("{}:{}:{}:{}", endpoint, port, ticks, nonce));
}
