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
 * Interface for reacting to in-messages and errors concerning out-messages of a Session.  An implementation is
 * supplied either per out-message (Session::send_msg() with a handler: a one-shot handler for the response to that
 * message and for errors concerning it) or per Session (Session::set_default_response(): the fallback for
 * everything a one-shot handler did not fully handle, and for every in-message that is not a response to a
 * response-expecting out-message).
 *
 * Each method returns `true` if it fully handled the event or `false` to decline it.  Declining is a normal
 * "not interested" outcome, not a failure: the event is then offered to the Session's default handler; and if
 * that one also declines it is dropped.
 *
 * ### Thread safety ###
 * Handlers are invoked synchronously from inside Session methods, hence from whatever thread called those:
 * typically the transport thread (dispatch_msg(), next_wait_send_msg(), success_sent_msg()) or the timeout-sweeping
 * thread (check_response_timeout()).  An implementation must be safe to invoke from those threads.  No Session
 * lock is held during the invocation, so a handler may call back into the Session (e.g., to reply_msg()).
 */
class Handler
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Handler();

  // Methods.

  /**
   * Invoked with an in-message: a response to the out-message this handler was registered with; or, for
   * the default handler, any in-message not fully handled otherwise.
   *
   * @param session
   *        The Session that received it.
   * @param msg
   *        The in-message.  Not null.
   * @return `true` if fully handled; `false` to decline.
   */
  virtual bool on_receive(Session& session, const Msg_ptr& msg) = 0;

  /**
   * Invoked with an error concerning an out-message: error::Code::S_SEND_TIMEOUT, error::Code::S_RESPONSE_TIMEOUT,
   * error::Code::S_DUPLICATE_CORRELATION_TAG, or whatever the transport reported.
   *
   * @param session
   *        The Session that owns the out-message.
   * @param msg
   *        The out-message.  Not null.
   * @param err_code
   *        The error.  Truthy.
   * @return `true` if fully handled; `false` to decline.
   */
  virtual bool on_exception(Session& session, const Msg_ptr& msg, const Error_code& err_code) = 0;
}; // class Handler

/// Handler that declines everything.  Use null_handler() to get the shared instance.
class Null_handler :
  public Handler
{
public:
  // Methods.

  /**
   * Declines.
   *
   * @param session
   *        Ignored.
   * @param msg
   *        Ignored.
   * @return `false`.
   */
  bool on_receive(Session& session, const Msg_ptr& msg) override;

  /**
   * Declines.
   *
   * @param session
   *        Ignored.
   * @param msg
   *        Ignored.
   * @param err_code
   *        Ignored.
   * @return `false`.
   */
  bool on_exception(Session& session, const Msg_ptr& msg, const Error_code& err_code) override;
}; // class Null_handler

/**
 * Handler that forwards to a pair of function objects, either of which may be empty.  An empty one declines.
 * Convenient when a lambda is all one needs.
 */
class Function_handler :
  public Handler
{
public:
  // Types.

  /// Signature of the on_receive() forwardee.
  using On_receive_func = Function<bool (Session& session, const Msg_ptr& msg)>;

  /// Signature of the on_exception() forwardee.
  using On_exception_func = Function<bool (Session& session, const Msg_ptr& msg, const Error_code& err_code)>;

  // Constructors/destructor.

  /**
   * Constructs handler.
   *
   * @param on_receive_func
   *        Forwardee for on_receive(); may be empty.
   * @param on_exception_func
   *        Forwardee for on_exception(); may be empty.
   */
  explicit Function_handler(On_receive_func&& on_receive_func,
                            On_exception_func&& on_exception_func = On_exception_func());

  // Methods.

  /**
   * Forwards to the `on_receive_func` from ctor, or declines if it was empty.
   *
   * @param session
   *        See Handler.
   * @param msg
   *        See Handler.
   * @return See above.
   */
  bool on_receive(Session& session, const Msg_ptr& msg) override;

  /**
   * Forwards to the `on_exception_func` from ctor, or declines if it was empty.
   *
   * @param session
   *        See Handler.
   * @param msg
   *        See Handler.
   * @param err_code
   *        See Handler.
   * @return See above.
   */
  bool on_exception(Session& session, const Msg_ptr& msg, const Error_code& err_code) override;

private:
  // Data.

  /// See ctor.
  const On_receive_func m_on_receive_func;

  /// See ctor.
  const On_exception_func m_on_exception_func;
}; // class Function_handler

} // namespace msgcorr::session
