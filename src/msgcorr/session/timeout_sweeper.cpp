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
#include "msgcorr/session/timeout_sweeper.hpp"
#include <flow/error/error.hpp>
#include <boost/chrono/chrono_io.hpp>

namespace msgcorr::session
{

// Implementations.

Timeout_sweeper::Timeout_sweeper(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                 util::Fine_duration period, util::Task&& sweep_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_nickname(nickname_str),
  m_period(period),
  m_sweep_func(std::move(sweep_func)),
  m_sweep_count(0),
  m_state(State::S_NOT_STARTED),
  m_worker(get_logger(), std::string("sweep-") + m_nickname),
  m_timer(*(m_worker.task_engine()))
{
  assert((m_period > util::Fine_duration::zero()) && "Broke contract.");
  assert(m_sweep_func && "Broke contract.");

  FLOW_LOG_TRACE("Timeout_sweeper [" << *this << "]: Created with period [" << m_period << "]; idle.");
}

Timeout_sweeper::~Timeout_sweeper()
{
  stop();
}

bool Timeout_sweeper::start()
{
  Lock_guard lock(m_state_mutex);

  if (m_state != State::S_NOT_STARTED)
  {
    FLOW_LOG_WARNING("Timeout_sweeper [" << *this << "]: start() called, but it was already started; ignoring.");
    return false;
  }
  // else

  m_state = State::S_RUNNING;
  m_worker.start();
  m_worker.post([this]() { schedule_sweep(); });

  FLOW_LOG_INFO("Timeout_sweeper [" << *this << "]: Started; sweeping every [" << m_period << "].");
  return true;
}

bool Timeout_sweeper::stop()
{
  Lock_guard lock(m_state_mutex);

  if (m_state != State::S_RUNNING)
  {
    m_state = State::S_STOPPED;
    return false;
  }
  // else

  /* This joins thread W, having first interrupted its event loop; so the timer handler either already finished
   * or will never run. */
  m_worker.stop();
  m_state = State::S_STOPPED;

  FLOW_LOG_INFO("Timeout_sweeper [" << *this << "]: Stopped after [" << sweep_count() << "] sweeps.");
  return true;
}

void Timeout_sweeper::schedule_sweep()
{
  m_timer.expires_after(m_period);
  m_timer.async_wait([this](const Error_code& async_err_code)
  {
    auto sys_err_code = async_err_code;

    if (sys_err_code == boost::asio::error::operation_aborted)
    {
      return; // Stuff is shutting down.
    }
    // else

    if (sys_err_code)
    {
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      FLOW_LOG_WARNING("Timeout_sweeper [" << *this << "]: "
                       "Timer system error; just logged; totally unexpected; pretending it fired normally.");
    }

    FLOW_LOG_TRACE("Timeout_sweeper [" << *this << "]: Timer fired; sweeping.");
    m_sweep_func();
    ++m_sweep_count;

    schedule_sweep();
  }); // m_timer.async_wait()
} // Timeout_sweeper::schedule_sweep()

uint64_t Timeout_sweeper::sweep_count() const
{
  return m_sweep_count;
}

util::Fine_duration Timeout_sweeper::period() const
{
  return m_period;
}

const std::string& Timeout_sweeper::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Timeout_sweeper& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace msgcorr::session
