// include/mvr/ServiceContext.hpp
#pragma once

#include "mvr/rt/ThreadPool.hpp"
#include "mvr/server/HttpEndpoints.hpp"
#include "mvr/session/SessionManager.hpp"
#include "mvr/ws/RequestRouter.hpp"

namespace mvr {

// Non-owning bundle of what a connection needs. Everything referenced here
// outlives the server.
class ServiceContext {
public:
  ServiceContext(ws::RequestRouter* router,
                 session::SessionManager* sessions,
                 server::HttpEndpoints* http,
                 rt::ThreadPool* pool)
    : _router(router), _sessions(sessions), _http(http), _pool(pool) {}

  ws::RequestRouter* router() const noexcept { return _router; }
  session::SessionManager* sessions() const noexcept { return _sessions; }
  server::HttpEndpoints* http() const noexcept { return _http; }
  rt::ThreadPool* pool() const noexcept { return _pool; }

private:
  ws::RequestRouter*       _router   = nullptr;
  session::SessionManager* _sessions = nullptr;
  server::HttpEndpoints*   _http     = nullptr;
  rt::ThreadPool*          _pool     = nullptr;
};

} // namespace mvr
