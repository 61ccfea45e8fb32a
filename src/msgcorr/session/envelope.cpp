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
#include "msgcorr/session/envelope.hpp"
#include "msgcorr/session/msg.hpp"
#include "msgcorr/session/handler.hpp"
#include <boost/lexical_cast.hpp>

namespace msgcorr::session
{

Envelope::Envelope(Session* belong, Msg_ptr msg, std::string tag, const util::Fine_time_pt& deadline,
                   Handler_ptr handler, bool need_response) :
  m_belong(belong),
  m_msg(std::move(msg)),
  m_tag(std::move(tag)),
  m_deadline(deadline),
  m_handler(handler ? std::move(handler) : null_handler()),
  m_need_response(need_response),
  m_settled(false)
{
  assert(m_msg && "Broke contract.");
}

Envelope::Envelope(Session* belong, Msg_ptr msg, std::string tag) :
  Envelope(belong, std::move(msg), std::move(tag), util::Fine_time_pt::max(), Handler_ptr(), false)
{
  // Cool.
}

Session* Envelope::belong() const
{
  return m_belong;
}

const Msg_ptr& Envelope::msg() const
{
  return m_msg;
}

const std::string& Envelope::tag() const
{
  return m_tag;
}

const util::Fine_time_pt& Envelope::deadline() const
{
  return m_deadline;
}

const Handler_ptr& Envelope::handler() const
{
  return m_handler;
}

bool Envelope::need_response() const
{
  return m_need_response;
}

bool Envelope::is_timeout(const util::Fine_time_pt& now) const
{
  return now >= m_deadline;
}

bool Envelope::settle() const
{
  return !m_settled.exchange(true);
}

bool Envelope::settled() const
{
  return m_settled.load();
}

std::string Envelope::tag_of(msg_id_t id) // Static.
{
  return boost::lexical_cast<std::string>(id);
}

std::ostream& operator<<(std::ostream& os, const Envelope& val)
{
  return os << "[tag[" << val.tag() << "] need_rsp[" << val.need_response() << "] msg" << *val.msg()
            << "]@" << static_cast<const void*>(&val);
}

} // namespace msgcorr::session
