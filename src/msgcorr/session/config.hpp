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

#include "msgcorr/session/session_fwd.hpp"
#include <boost/chrono/duration.hpp>

namespace msgcorr::session
{

/**
 * Knobs shared by all the Session objects a Session_factory creates.  Copyable; the factory keeps a copy,
 * and each Session keeps a copy of the factory's.  Default-constructed values are the recommended ones.
 */
struct Session_config
{
  // Constants.

  /**
   * The lowest timeout a Session will honor: any requested timeout below it is raised to it.  Not configurable.
   * It is also the upper bound for #m_sweep_period, so that a response timeout is reaped reasonably promptly.
   */
  static constexpr util::Fine_duration S_MIN_TIMEOUT = boost::chrono::milliseconds(500);

  /// Default for #m_sweep_period.
  static constexpr util::Fine_duration S_DEFAULT_SWEEP_PERIOD = boost::chrono::milliseconds(100);

  // Data.

  /**
   * Timeout applied by Session::send_msg() and Session::reply_msg() when the caller does not supply one.
   * The default, `Fine_duration::max()`, means the message effectively never times out.  Values below
   * #S_MIN_TIMEOUT are raised to it, as with any timeout.
   */
  util::Fine_duration m_default_timeout = util::Fine_duration::max();

  /**
   * Capacity of each Session's outbound queue; 0 means unbounded.
   *
   * With 0 there is no backpressure: a producer that calls Session::send_msg() faster than the transport drains
   * the queue will grow memory without limit.  That is the default behavior.  With a positive value,
   * Session::send_msg() and Session::reply_msg() fail with error::Code::S_OUTBOUND_QUEUE_FULL when the queue
   * already holds that many envelopes.  Re-enqueueing after a failed transmission (Session::failure_sent_msg())
   * ignores the capacity, so a message once accepted is never lost to it.
   */
  size_t m_max_wait_send_msgs = 0;

  /**
   * How often a Timeout_sweeper started for a Session_factory should reap response timeouts
   * (see Session_factory::sweep_period()).  Must be positive and below #S_MIN_TIMEOUT; otherwise
   * Session_factory uses #S_DEFAULT_SWEEP_PERIOD instead.
   */
  util::Fine_duration m_sweep_period = S_DEFAULT_SWEEP_PERIOD;
}; // struct Session_config

} // namespace msgcorr::session
