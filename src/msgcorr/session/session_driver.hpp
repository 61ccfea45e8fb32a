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

#include "msgcorr/session/session.hpp"
#include "msgcorr/session/envelope.hpp"
#include "msgcorr/session/msg.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>

namespace msgcorr::session
{

// Types.

#ifdef MSGCORR_DOXYGEN_ONLY

/**
 * A documentation-only *concept* defining the behavior of an object capable of transmitting one out-message
 * to the opposing side, as required by Session_driver.  It is typically a thin layer over a connected socket
 * that serializes Envelope::msg() somehow (and sends Envelope::tag() along, if the wire format does not carry the
 * message ID already).
 */
class Msg_sender
{
public:
  /**
   * Transmits the envelope's message, synchronously, or at least takes responsibility for it.
   *
   * @param envelope
   *        Envelope to send.
   * @param err_code
   *        Not null.  Set to falsy on success; to the transport error otherwise.
   */
  void send_msg(const Envelope& envelope, Error_code* err_code);
};

#endif

/**
 * Implements the transport-driver side of the Session contract over a user-supplied `Msg_sender` (see the
 * doc-only class of that name): pulling envelopes to send, reporting send outcomes, and delivering in-messages
 * and transport errors.
 *
 * The user calls send_pending() whenever the transport is writable (and after send_msg() on the session, if the
 * transport is always writable); on_msg_received() with each in-message read off the transport; and
 * on_transport_error() if something went wrong with an envelope after it was handed to the sender.
 *
 * send_pending() stops at the first failed transmission: the envelope is re-enqueued by
 * Session::failure_sent_msg(), and the user should call send_pending() again once the transport recovers.
 * Otherwise a broken transport would have us spin on the same envelope.
 *
 * @tparam Msg_sender
 *         See above.
 */
template<typename Msg_sender>
class Session_driver :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs driver.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param session
   *        The session to drive.  Not null.
   * @param sender
   *        The sender; must outlive `*this`.  Not null.
   */
  explicit Session_driver(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                          Session_ptr session, Msg_sender* sender);

  // Methods.

  /**
   * Sends queued out-messages until the queue is empty or a transmission fails.
   * @return How many were sent successfully.
   */
  size_t send_pending();

  /**
   * Delivers an in-message to the session (Session::dispatch_msg()).
   *
   * @param msg
   *        In-message.  Not null.
   * @return See Session::dispatch_msg().
   */
  bool on_msg_received(const Msg_ptr& msg);

  /**
   * Delivers a transport error concerning an out-envelope (Session::dispatch_exception()).
   *
   * @param envelope
   *        Envelope concerned.
   * @param err_code
   *        The error.  Must be truthy.
   * @return See Session::dispatch_exception().
   */
  bool on_transport_error(const Envelope& envelope, const Error_code& err_code);

  /**
   * The session being driven.
   * @return See above.
   */
  const Session_ptr& session() const;

  /**
   * Nickname from ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See session().
  const Session_ptr m_session;

  /// See ctor.
  Msg_sender* const m_sender;
}; // class Session_driver

// Template implementations.

template<typename Msg_sender>
Session_driver<Msg_sender>::Session_driver(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                           Session_ptr session, Msg_sender* sender) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_nickname(nickname_str),
  m_session(std::move(session)),
  m_sender(sender)
{
  assert(m_session && m_sender && "Broke contract.");

  FLOW_LOG_TRACE("Session_driver [" << *this << "]: Created for session [" << *m_session << "].");
}

template<typename Msg_sender>
size_t Session_driver<Msg_sender>::send_pending()
{
  size_t n_sent = 0;
  Error_code err_code;

  while (const auto envelope = m_session->next_wait_send_msg())
  {
    m_sender->send_msg(*envelope, &err_code);
    if (err_code)
    {
      FLOW_LOG_WARNING("Session_driver [" << *this << "]: Sending envelope [" << *envelope << "] failed with "
                       "[" << err_code << "] [" << err_code.message() << "]; it will be retried.  "
                       "Stopping for now after [" << n_sent << "] successful sends.");
      m_session->failure_sent_msg(envelope);
      break;
    }
    // else

    m_session->success_sent_msg(envelope);
    ++n_sent;
  }

  FLOW_LOG_TRACE("Session_driver [" << *this << "]: Sent [" << n_sent << "] envelopes.");
  return n_sent;
} // Session_driver::send_pending()

template<typename Msg_sender>
bool Session_driver<Msg_sender>::on_msg_received(const Msg_ptr& msg)
{
  return m_session->dispatch_msg(msg);
}

template<typename Msg_sender>
bool Session_driver<Msg_sender>::on_transport_error(const Envelope& envelope, const Error_code& err_code)
{
  FLOW_LOG_INFO("Session_driver [" << *this << "]: Transport reports error [" << err_code << "] "
                "[" << err_code.message() << "] concerning envelope [" << envelope << "].");
  return m_session->dispatch_exception(envelope, err_code);
}

template<typename Msg_sender>
const Session_ptr& Session_driver<Msg_sender>::session() const
{
  return m_session;
}

template<typename Msg_sender>
const std::string& Session_driver<Msg_sender>::nickname() const
{
  return m_nickname;
}

template<typename Msg_sender>
std::ostream& operator<<(std::ostream& os, const Session_driver<Msg_sender>& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace msgcorr::session
