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
#pragma once

#include "msgcorr/session/config.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/unordered_map.hpp>
#include <boost/noncopyable.hpp>
#include <utility>
#include <vector>

namespace msgcorr::session
{

// Types.

/**
 * Creates, registers and closes Session objects, one per (from, to) endpoint pair.  It is the only way to get a
 * Session.  All sessions it makes share one Session_config and one `Logger`.
 *
 * Closing a session (close_session(), or Session::close(), or close_all(), or `*this` dying) unregisters it and
 * forgets all its envelopes without informing their handlers.  The Session object itself lives on as long as the
 * user holds #Session_ptr copies; but it will never see another open_session() for its pair: that makes a new one.
 *
 * check_response_timeouts() is the intended payload of a Timeout_sweeper: it reaps response timeouts in every
 * registered session.  sweep_period() is how often to do it.
 *
 * ### Thread safety ###
 * All methods may be called concurrently.  `*this` must outlive every Session::close() call on its sessions.
 */
class Session_factory :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs factory with no sessions.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently, here and in the sessions.
   * @param config
   *        Config for each session.  A bad Session_config::m_sweep_period is replaced (see sweep_period()).
   */
  explicit Session_factory(flow::log::Logger* logger_ptr, const Session_config& config = Session_config());

  /// Closes all sessions as-if via close_all().
  ~Session_factory();

  // Methods.

  /**
   * Returns the registered session for the given pair; if there is none, creates and registers one first.
   *
   * @param from
   *        Local endpoint name.
   * @param to
   *        Opposing endpoint name.
   * @return See above.  Not null.
   */
  Session_ptr open_session(const std::string& from, const std::string& to);

  /**
   * Returns the registered session for the given pair, or null.
   *
   * @param from
   *        Local endpoint name.
   * @param to
   *        Opposing endpoint name.
   * @return See above.
   */
  Session_ptr session(const std::string& from, const std::string& to) const;

  /**
   * Number of registered sessions.
   * @return See above.
   */
  size_t session_count() const;

  /**
   * Unregisters the given session and forgets all its envelopes (queued and awaiting response) without informing
   * handlers.
   *
   * @param session
   *        A session made by `*this`.
   * @return `false` if it was not registered (already closed); else `true`.
   */
  bool close_session(const Session& session);

  /**
   * close_session() on every registered session.
   * @return How many were closed.
   */
  size_t close_all();

  /**
   * Equivalent to `check_response_timeouts(util::Fine_clock::now())`.
   * @return See other overload.
   */
  size_t check_response_timeouts();

  /**
   * Session::check_response_timeout() on every registered session.
   *
   * @param now
   *        Time against which deadlines are checked.
   * @return Total number of timed-out envelopes.
   */
  size_t check_response_timeouts(const util::Fine_time_pt& now);

  /**
   * Period with which check_response_timeouts() should run: Session_config::m_sweep_period, unless that was not
   * positive or not below Session_config::S_MIN_TIMEOUT, in which case Session_config::S_DEFAULT_SWEEP_PERIOD.
   *
   * @return See above.
   */
  util::Fine_duration sweep_period() const;

  /**
   * Config from ctor.
   * @return See above.
   */
  const Session_config& config() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// (from, to).
  using Endpoint_pair = std::pair<std::string, std::string>;

  /// Short-hand for the registry type.
  using Session_map = boost::unordered_map<Endpoint_pair, Session_ptr>;

  // Methods.

  /**
   * Snapshot of the registered sessions; so that they can be operated on without #m_mutex locked.
   * @return See above.
   */
  std::vector<Session_ptr> sessions_snapshot() const;

  // Data.

  /// See config().
  const Session_config m_config;

  /// See sweep_period().  Set in ctor; immutable after that.
  util::Fine_duration m_sweep_period;

  /// Protects #m_sessions.
  mutable Mutex m_mutex;

  /// The registered sessions.  Protected by #m_mutex.
  Session_map m_sessions;
}; // class Session_factory

} // namespace msgcorr::session
