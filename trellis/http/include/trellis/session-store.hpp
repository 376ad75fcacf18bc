#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "trellis/app.hpp"
#include "trellis/random-id.hpp"
#include "trellis/timedef.hpp"

namespace trellis {

struct Session {
  std::string id;
  SysTimePoint lastAccess;
  // Sub application serving the requests of this session, created once with the session.
  App route;
};

// Creates the App of a new session.
using SessionFactory = std::function<App(const Session& session)>;

// Registry of live sessions, owned by the application graph and shared by the session routers.
// Sessions never expire. Not thread safe: all requests are expected to be handled by the same thread.
class SessionStore {
 public:
  static constexpr int kMaxIdGenerationAttempts = 16;

  explicit SessionStore(IdGenerator idGenerator = RandomUuid, PresentFunction present = {});

  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  // Registers a new session with a fresh identifier and builds its route with 'factory'.
  // Throws std::runtime_error if no unused identifier could be generated.
  std::shared_ptr<Session> create(const SessionFactory& factory);

  // Live session with given identifier, nullptr if none.
  [[nodiscard]] std::shared_ptr<Session> get(std::string_view id) const;

  [[nodiscard]] bool contains(std::string_view id) const { return _sessions.contains(id); }

  [[nodiscard]] std::size_t size() const noexcept { return _sessions.size(); }

  // Current time, as seen by the store.
  [[nodiscard]] SysTimePoint now() const { return _present(); }

 private:
  std::map<std::string, std::shared_ptr<Session>, std::less<>> _sessions;
  IdGenerator _idGenerator;
  PresentFunction _present;
};

}  // namespace trellis
