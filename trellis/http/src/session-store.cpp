#include "trellis/session-store.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/log.hpp"
#include "trellis/random-id.hpp"
#include "trellis/timedef.hpp"

namespace trellis {

SessionStore::SessionStore(IdGenerator idGenerator, PresentFunction present)
    : _idGenerator(std::move(idGenerator)), _present(std::move(present)) {
  if (!_idGenerator) {
    throw std::invalid_argument("SessionStore requires an identifier generator");
  }
  if (!_present) {
    _present = [] { return SysClock::now(); };
  }
}

std::shared_ptr<Session> SessionStore::create(const SessionFactory& factory) {
  for (int attempt = 0; attempt < kMaxIdGenerationAttempts; ++attempt) {
    std::string id = _idGenerator();
    if (id.empty() || _sessions.contains(id)) {
      log::warn("Session identifier collision, generating another one");
      continue;
    }
    auto session = std::make_shared<Session>();
    session->id = std::move(id);
    session->lastAccess = now();
    session->route = factory(*session);
    _sessions.emplace(session->id, session);
    log::debug("Created session {} ({} live sessions)", session->id, _sessions.size());
    return session;
  }
  throw std::runtime_error("Unable to generate an unused session identifier");
}

std::shared_ptr<Session> SessionStore::get(std::string_view id) const {
  const auto it = _sessions.find(id);
  if (it == _sessions.end()) {
    return nullptr;
  }
  return it->second;
}

}  // namespace trellis
