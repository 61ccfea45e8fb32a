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
#include <atomic>

namespace msgcorr::session
{

/**
 * A Msg plus the delivery metadata a Session needs in order to transmit it, correlate a response with it, and
 * time it out.  It is created by Session::send_msg() and Session::reply_msg() (out-messages), or by a transport
 * wishing to deliver an in-message with a correlation tag of its own choosing (see the 3-arg ctor), and it is
 * immutable afterwards, save for the one-shot settle() flag.
 *
 * Fields:
 *   - belong(): the owning Session.  A back-reference only (not ownership); the Session outlives any of its
 *     envelopes that matter, as they are owned by the Session's containers or by its transport driver.
 *   - msg(): the wrapped message.
 *   - tag(): the *correlation tag*, the string form of the message ID.  This is the key in a Session's
 *     Response_table; keeping it a string tolerates transports whose IDs are not pure integers.
 *   - deadline(): absolute time point (Fine_clock) after which the envelope is considered timed out.
 *   - handler(): one-shot handler for a response to and/or errors concerning the message.  Never null:
 *     null_handler() if the user supplied none.
 *   - need_response(): whether a response is expected (iff the user supplied a handler to Session::send_msg()).
 *
 * An Envelope is held via #Envelope_ptr; identity of the Envelope (the pointer) is meaningful: e.g.,
 * Session::success_sent_msg() reporting the same Envelope twice is harmless, but a different Envelope with the
 * same tag is a duplicate.
 *
 * An out-envelope is *settled* at most once: by whichever of its outcomes -- a response, a response timeout,
 * a send timeout, a duplicate tag, a transport error -- is reported first.  Session informs the handler only of
 * the outcome that settled it.
 */
class Envelope
{
public:
  // Constructors/destructor.

  /**
   * Constructs out-message envelope.
   *
   * @param belong
   *        See belong().  May be null only in tests that never dispatch the envelope.
   * @param msg
   *        See msg().  Not null, or undefined behavior (assertion may trip).
   * @param tag
   *        See tag().
   * @param deadline
   *        See deadline().
   * @param handler
   *        See handler().  If null, null_handler() is stored instead.
   * @param need_response
   *        See need_response().
   */
  explicit Envelope(Session* belong, Msg_ptr msg, std::string tag, const util::Fine_time_pt& deadline,
                    Handler_ptr handler, bool need_response);

  /**
   * Constructs in-message envelope: no deadline, no handler, no response expected.
   *
   * @param belong
   *        See belong().
   * @param msg
   *        See msg().  Not null, or undefined behavior (assertion may trip).
   * @param tag
   *        See tag().
   */
  explicit Envelope(Session* belong, Msg_ptr msg, std::string tag);

  // Methods.

  /**
   * Owning Session (not owned by `*this`).
   * @return See above.
   */
  Session* belong() const;

  /**
   * The wrapped message.
   * @return See above.
   */
  const Msg_ptr& msg() const;

  /**
   * Correlation tag.
   * @return See above.
   */
  const std::string& tag() const;

  /**
   * Absolute deadline; `Fine_time_pt::max()` means never.
   * @return See above.
   */
  const util::Fine_time_pt& deadline() const;

  /**
   * One-shot handler; never null.
   * @return See above.
   */
  const Handler_ptr& handler() const;

  /**
   * Whether a response is expected.
   * @return See above.
   */
  bool need_response() const;

  /**
   * Whether the deadline has been reached at the given time.
   *
   * @param now
   *        Current time (normally `util::Fine_clock::now()`).
   * @return `now >= deadline()`.
   */
  bool is_timeout(const util::Fine_time_pt& now) const;

  /**
   * Marks `*this` settled, returning whether it was not settled already.  Exactly one call returns `true`,
   * even if several threads race.
   *
   * @return See above.
   */
  bool settle() const;

  /**
   * Whether settle() has been called.  Of course the answer may be stale by the time it is examined.
   * @return See above.
   */
  bool settled() const;

  /**
   * Returns the correlation tag for the given message ID.  A Session uses this for both out-messages (their own ID)
   * and in-messages (the ID they echo).
   *
   * @param id
   *        Message ID.
   * @return See above.
   */
  static std::string tag_of(msg_id_t id);

private:
  // Data.

  /// See belong().
  Session* const m_belong;

  /// See msg().
  const Msg_ptr m_msg;

  /// See tag().
  const std::string m_tag;

  /// See deadline().
  const util::Fine_time_pt m_deadline;

  /// See handler().
  const Handler_ptr m_handler;

  /// See need_response().
  const bool m_need_response;

  /// See settle().
  mutable std::atomic<bool> m_settled;
}; // class Envelope

} // namespace msgcorr::session
