/* Msg-Corr: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "msgcorr/session/session_factory.hpp"
#include "msgcorr/session/session.hpp"
#include <boost/chrono/chrono_io.hpp>

namespace msgcorr::session
{

// Implementations.

Session_factory::Session_factory(flow::log::Logger* logger_ptr, const Session_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_config(config),
  m_sweep_period(m_config.m_sweep_period)
{
  if ((m_sweep_period <= util::Fine_duration::zero()) || (m_sweep_period >= Session_config::S_MIN_TIMEOUT))
  {
    FLOW_LOG_WARNING("Session_factory [" << this << "]: Configured sweep period [" << m_sweep_period << "] must be "
                     "positive and below the minimum timeout [" << Session_config::S_MIN_TIMEOUT << "]; "
                     "using [" << Session_config::S_DEFAULT_SWEEP_PERIOD << "] instead.");
    m_sweep_period = Session_config::S_DEFAULT_SWEEP_PERIOD;
  }

  FLOW_LOG_INFO("Session_factory [" << this << "]: Created; session config: [" << m_config << "].");
}

Session_factory::~Session_factory()
{
  FLOW_LOG_INFO("Session_factory [" << this << "]: Shutting down.");
  close_all();
}

Session_ptr Session_factory::open_session(const std::string& from, const std::string& to)
{
  Session_ptr session;
  {
    Lock_guard lock(m_mutex);

    auto& session_ref = m_sessions[Endpoint_pair(from, to)];
    if (session_ref)
    {
      return session_ref;
    }
    // else

    // The Session ctor is private, hence no make_shared<>().
    session_ref.reset(new Session(get_logger(), from, to, m_config, this));
    session = session_ref;
  }

  FLOW_LOG_INFO("Session_factory [" << this << "]: Opened session [" << *session << "].");
  return session;
} // Session_factory::open_session()

Session_ptr Session_factory::session(const std::string& from, const std::string& to) const
{
  Lock_guard lock(m_mutex);

  const auto it = m_sessions.find(Endpoint_pair(from, to));
  return (it == m_sessions.end()) ? Session_ptr() : it->second;
}

size_t Session_factory::session_count() const
{
  Lock_guard lock(m_mutex);
  return m_sessions.size();
}

bool Session_factory::close_session(const Session& session)
{
  Session_ptr doomed;
  {
    Lock_guard lock(m_mutex);

    const auto it = m_sessions.find(Endpoint_pair(session.from(), session.to()));
    if ((it == m_sessions.end()) || (it->second.get() != &session))
    {
      FLOW_LOG_TRACE("Session_factory [" << this << "]: Session [" << session << "] not registered; "
                     "already closed?  No-op.");
      return false;
    }
    // else

    doomed = std::move(it->second);
    m_sessions.erase(it);
  }

  // No lock held: this drops envelopes, which may in turn drop the last references to user handlers.
  doomed->teardown();

  FLOW_LOG_INFO("Session_factory [" << this << "]: Closed session [" << session << "].");
  return true;
} // Session_factory::close_session()

size_t Session_factory::close_all()
{
  size_t n = 0;
  for (const auto& session : sessions_snapshot())
  {
    if (close_session(*session))
    {
      ++n;
    }
  }
  return n;
}

size_t Session_factory::check_response_timeouts()
{
  return check_response_timeouts(util::Fine_clock::now());
}

size_t Session_factory::check_response_timeouts(const util::Fine_time_pt& now)
{
  size_t n = 0;
  for (const auto& session : sessions_snapshot())
  {
    n += session->check_response_timeout(now);
  }

  if (n != 0)
  {
    FLOW_LOG_TRACE("Session_factory [" << this << "]: Sweep found [" << n << "] response timeouts.");
  }
  return n;
}

std::vector<Session_ptr> Session_factory::sessions_snapshot() const
{
  std::vector<Session_ptr> sessions;

  Lock_guard lock(m_mutex);
  sessions.reserve(m_sessions.size());
  for (const auto& entry : m_sessions)
  {
    sessions.emplace_back(entry.second);
  }
  return sessions;
}

util::Fine_duration Session_factory::sweep_period() const
{
  return m_sweep_period;
}

const Session_config& Session_factory::config() const
{
  return m_config;
}

} // namespace msgcorr::session
