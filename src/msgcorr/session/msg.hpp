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

namespace msgcorr::session
{

/**
 * An application-level message: an opaque payload plus a message ID.  Msg-Corr never looks inside the body;
 * turning it into bytes on the wire (and back) is the transport's business.
 *
 * The ID is 0 (unassigned) until either the user sets it or Session::send_msg() assigns the next ID of that
 * Session.  Session::reply_msg() sets a response's ID to that of the message it responds to.
 *
 * ### Thread safety ###
 * The standard default assumptions apply: do not mutate a Msg concurrently with any other access to it.
 * In practice: fill it out, then hand it to a Session, then leave it alone (reading is fine).
 */
class Msg
{
public:
  // Constructors/destructor.

  /**
   * Constructs message with the given body and unassigned (0) ID.
   *
   * @param body
   *        Payload.
   */
  explicit Msg(std::string body = std::string());

  /**
   * Constructs message with the given ID and body; typically used by a transport to construct an in-message.
   *
   * @param id
   *        Message ID; 0 means unassigned.
   * @param body
   *        Payload.
   */
  explicit Msg(msg_id_t id, std::string body);

  // Methods.

  /**
   * Message ID or 0 if unassigned.
   * @return See above.
   */
  msg_id_t id() const;

  /**
   * Sets the message ID.
   * @param id
   *        See id().
   */
  void set_id(msg_id_t id);

  /**
   * Payload.
   * @return See above.
   */
  const std::string& body() const;

  /**
   * Replaces payload.
   * @param body
   *        See body().
   */
  void set_body(std::string body);

private:
  // Data.

  /// See id().
  msg_id_t m_id;

  /// See body().
  std::string m_body;
}; // class Msg

} // namespace msgcorr::session
