#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "trellis/app.hpp"
#include "trellis/session-store.hpp"

namespace trellis {

// Name of the cookie carrying the session identifier.
inline constexpr std::string_view kSessionCookieName = "session.id";

// Cookie based sessions.
//  - a request with the cookie of a live session is routed to that session (request.session() is set and the
//    session last access time is refreshed)
//  - a new visitor gets a session, the cookie (with path 'scriptName') and a temporary redirect to
//    '<scriptName>~session/', which checks that the cookie is sent back
//  - '/~session/' redirects to '../' when the cookie was sent, and is answered 404 "Access requires cookies"
//    otherwise
// Two concurrent first requests of the same visitor create two sessions.
App CookieSession(SessionFactory factory, std::shared_ptr<SessionStore> store);

// Sessions addressed by the first path segment.
//  - "/" creates a session and responds {"id": ..., "lastAccess": <ISO 8601>} as JSON
//  - "/<id>[/...]" is routed to the session <id>, with the identifier segment consumed
//  - anything else is answered 404 "Session does not exist"
App PathSession(SessionFactory factory, std::shared_ptr<SessionStore> store);

}  // namespace trellis
