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
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>

namespace msgcorr::session
{

/**
 * Runs a given task periodically in a dedicated thread; intended to run Session_factory::check_response_timeouts()
 * (or Session::check_response_timeout()) every Session_factory::sweep_period().
 *
 * Until start() the thread is idle.  stop() (or destruction) stops the thread; a task invocation in progress is
 * allowed to finish first.  A stopped sweeper cannot be restarted.
 *
 * The task is invoked in the sweeper's thread, with nothing locked.  It must not call stop() or destroy `*this`.
 * Since the next period is scheduled only after the task returns, a slow task stretches the period rather than
 * piling up.
 *
 * ### Thread safety ###
 * start(), stop(), sweep_count() may be called concurrently.
 */
class Timeout_sweeper :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs sweeper with idle thread.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param period
   *        Time between task invocations.  Must be positive, or behavior is undefined (assertion may trip).
   * @param sweep_func
   *        The task.
   */
  explicit Timeout_sweeper(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                           util::Fine_duration period, util::Task&& sweep_func);

  /// Stops, as-if via stop().
  ~Timeout_sweeper();

  // Methods.

  /**
   * Begins invoking the task every period; the first invocation is one period from now.
   * @return `false` if already started (including if since stopped); else `true`.
   */
  bool start();

  /**
   * Stops invoking the task, waiting for an in-progress invocation to finish.  Idempotent.
   * @return `false` if not running; else `true`.
   */
  bool stop();

  /**
   * How many times the task has finished so far.
   * @return See above.
   */
  uint64_t sweep_count() const;

  /**
   * Period from ctor.
   * @return See above.
   */
  util::Fine_duration period() const;

  /**
   * Nickname from ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Lifecycle.
  enum class State
  {
    /// Thread idle; start() not yet called.
    S_NOT_STARTED,
    /// Sweeping.
    S_RUNNING,
    /// Thread gone.
    S_STOPPED
  };

  // Methods.

  /// Schedules the next task invocation one period from now.  Runs in thread W.
  void schedule_sweep();

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See period().
  const util::Fine_duration m_period;

  /// See ctor.
  const util::Task m_sweep_func;

  /// See sweep_count().
  std::atomic<uint64_t> m_sweep_count;

  /// Protects #m_state; held throughout start() and stop().
  Mutex m_state_mutex;

  /// Where we are in the lifecycle.  Protected by #m_state_mutex.
  State m_state;

  /// Thread W: runs #m_timer's handlers, hence the task.
  flow::async::Single_thread_task_loop m_worker;

  /// The period timer.  Accessed only from thread W (after ctor).
  flow::util::Timer m_timer;
}; // class Timeout_sweeper

} // namespace msgcorr::session
