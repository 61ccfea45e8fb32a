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
#include "msgcorr/session/msg.hpp"

namespace msgcorr::session
{

Msg::Msg(std::string body) :
  Msg(0, std::move(body))
{
  // Yay.
}

Msg::Msg(msg_id_t id, std::string body) :
  m_id(id),
  m_body(std::move(body))
{
  // That's it.
}

msg_id_t Msg::id() const
{
  return m_id;
}

void Msg::set_id(msg_id_t id)
{
  m_id = id;
}

const std::string& Msg::body() const
{
  return m_body;
}

void Msg::set_body(std::string body)
{
  m_body = std::move(body);
}

std::ostream& operator<<(std::ostream& os, const Msg& val)
{
  return os << "[id[" << val.id() << "] body_sz[" << val.body().size() << "]]@" << static_cast<const void*>(&val);
}

} // namespace msgcorr::session
