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
#include "msgcorr/session/handler.hpp"

namespace msgcorr::session
{

// Handler implementations.

Handler::~Handler() = default;

// Null_handler implementations.

bool Null_handler::on_receive(Session&, const Msg_ptr&)
{
  return false;
}

bool Null_handler::on_exception(Session&, const Msg_ptr&, const Error_code&)
{
  return false;
}

// Function_handler implementations.

Function_handler::Function_handler(On_receive_func&& on_receive_func, On_exception_func&& on_exception_func) :
  m_on_receive_func(std::move(on_receive_func)),
  m_on_exception_func(std::move(on_exception_func))
{
  // Yep.
}

bool Function_handler::on_receive(Session& session, const Msg_ptr& msg)
{
  return m_on_receive_func && m_on_receive_func(session, msg);
}

bool Function_handler::on_exception(Session& session, const Msg_ptr& msg, const Error_code& err_code)
{
  return m_on_exception_func && m_on_exception_func(session, msg, err_code);
}

// Free function implementations.

const Handler_ptr& null_handler()
{
  // Initialized thread-safely on first use.
  static const Handler_ptr S_NULL_HANDLER = std::make_shared<Null_handler>();
  return S_NULL_HANDLER;
}

} // namespace msgcorr::session
