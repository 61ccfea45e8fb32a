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
#include "msgcorr/session/config.hpp"
#include <boost/chrono/chrono_io.hpp>
#include <boost/chrono/round.hpp>

namespace msgcorr::session
{

// Implementations.

std::ostream& operator<<(std::ostream& os, const Session_config& val)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  os << "default_timeout[";
  if (val.m_default_timeout == util::Fine_duration::max())
  {
    os << "never";
  }
  else
  {
    os << round<milliseconds>(val.m_default_timeout);
  }
  os << "] max_wait_send_msgs[";
  if (val.m_max_wait_send_msgs == 0)
  {
    os << "unbounded";
  }
  else
  {
    os << val.m_max_wait_send_msgs;
  }
  return os << "] sweep_period[" << round<milliseconds>(val.m_sweep_period) << ']';
}

} // namespace msgcorr::session
