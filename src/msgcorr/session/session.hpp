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

#include "msgcorr/session/outbound_queue.hpp"
#include "msgcorr/session/response_table.hpp"
#include "msgcorr/session/config.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>

namespace msgcorr::session
{

// Types.

/**
 * The correlation state for one (from, to) endpoint pair: out-messages waiting to be transmitted, out-messages
 * transmitted and waiting for a response, and the default handler for in-messages nobody else claims.  Sessions
 * are created and registered only by Session_factory (at most one per pair) and are accessed via #Session_ptr.
 *
 * ### Life of an out-message ###
 * The application calls send_msg() (or reply_msg() to respond to an in-message).  That wraps the Msg into an
 * Envelope -- assigning it a message ID if it has none, computing its deadline, and recording the handler, if
 * any -- and pushes it onto the outbound queue.  The transport-driving code then, whenever the wire is writable:
 *   - calls next_wait_send_msg() to obtain the next envelope to transmit.  Envelopes whose deadline has passed
 *     are discarded on the way, each one reported to its handler as error::Code::S_SEND_TIMEOUT.
 *   - transmits it; then reports success_sent_msg() or failure_sent_msg().  On failure the envelope goes back to
 *     the end of the queue (no retry limit; it will eventually time out).  On success, if the envelope expects a
 *     response (it was sent with a handler), it moves into the response table, keyed by its correlation tag;
 *     otherwise it is forgotten.
 *
 * When an in-message arrives the transport-driving code calls dispatch_msg().  The in-message's ID is its
 * correlation tag; if the response table holds an envelope with that tag, that envelope is removed, and its
 * handler is offered the in-message.  If there is no such envelope, or the handler declines, the default handler
 * (see set_default_response()) is offered it.
 *
 * Meanwhile something -- typically a Timeout_sweeper -- calls check_response_timeout() periodically (more
 * often than Session_config::S_MIN_TIMEOUT); it removes every envelope whose deadline has passed from the response
 * table and reports each to its handler as error::Code::S_RESPONSE_TIMEOUT.
 *
 * The Session_driver template packages up the transport-driving role for a user-supplied sender.
 *
 * ### Handlers ###
 * A handler given to send_msg() hears about its out-message at most once: either on_receive() with the response,
 * or on_exception() with an error.  Whichever outcome settles the envelope first (see Envelope::settle()) is the
 * one reported; any later one -- e.g., a transport error reported via dispatch_exception() after the response
 * arrived -- goes to nobody.  (It may hear neither, if the message is cancelled, or the session is closed,
 * or the message never gets a response and nobody sweeps for response timeouts.)  If it declines (returns
 * `false`), the event is offered to the default handler; if that declines too, the event is dropped (and logged).
 * The default handler is never null: initially, and after remove_default_response(), it is null_handler().
 *
 * Handlers are always invoked with no lock of `*this` held.  So a handler may call any method of `*this`,
 * including send_msg() and reply_msg().  (It must not call close() though, if the session's last #Session_ptr
 * is the one in the factory.)
 *
 * ### Timeouts ###
 * Each out-message has a deadline: send time plus the timeout given to send_msg() or reply_msg(), or
 * Session_config::m_default_timeout if none was given.  Any timeout below Session_config::S_MIN_TIMEOUT is raised
 * to it.  The default default timeout is effectively infinite.  The deadline covers the envelope's whole life:
 * waiting in the queue, and then waiting for the response.
 *
 * ### Thread safety ###
 * All public methods may be called concurrently with each other, from any threads.  None of them blocks
 * other than to acquire short-lived internal locks.  In particular check_response_timeout() and dispatch_msg()
 * racing for the same envelope will result in exactly one of the two invoking its handler.
 *
 * cancel_msg() is best-effort: if it races with the transport moving the envelope from the queue to the table
 * it may find neither and return `false`, and the message will be transmitted after all.
 */
class Session :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Logs; no handler is invoked.  Use Session_factory::close_session() (or close()) to forget envelopes first.
  ~Session();

  // Methods.

  /**
   * Local endpoint name.
   * @return See above.
   */
  const std::string& from() const;

  /**
   * Opposing endpoint name.
   * @return See above.
   */
  const std::string& to() const;

  /**
   * Config given to the owning Session_factory.
   * @return See above.
   */
  const Session_config& config() const;

  /**
   * Enqueues the given out-message for transmission, with Session_config::m_default_timeout.  If `handler` is
   * not null, a response is expected, and `handler` will be informed of it (or of a timeout or error);
   * otherwise the message is fire-and-forget.
   *
   * If `msg->id()` is 0, it is assigned the next ID from this session's sequence.  Otherwise it is left alone
   * (the user takes responsibility for uniqueness).
   *
   * @param msg
   *        Message to send.  Must not be null.
   * @param handler
   *        Handler for the response; or null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`msg` is null), error::Code::S_OUTBOUND_QUEUE_FULL
   *        (see Session_config::m_max_wait_send_msgs).
   * @return `true` if enqueued; `false` if an error was emitted.
   */
  bool send_msg(const Msg_ptr& msg, const Handler_ptr& handler = Handler_ptr(), Error_code* err_code = 0);

  /**
   * Identical to the other send_msg() but with the given timeout instead of the default.
   *
   * @param msg
   *        See other send_msg().
   * @param handler
   *        See other send_msg().
   * @param timeout
   *        Timeout after which the message is given up on; values below Session_config::S_MIN_TIMEOUT
   *        are raised to it.
   * @param err_code
   *        See other send_msg().
   * @return See other send_msg().
   */
  bool send_msg(const Msg_ptr& msg, const Handler_ptr& handler, util::Fine_duration timeout,
                Error_code* err_code = 0);

  /**
   * Fire-and-forget send_msg() with the given timeout.
   *
   * @param msg
   *        See other send_msg().
   * @param timeout
   *        See other send_msg().
   * @param err_code
   *        See other send_msg().
   * @return See other send_msg().
   */
  bool send_msg(const Msg_ptr& msg, util::Fine_duration timeout, Error_code* err_code = 0);

  /**
   * Enqueues the given out-message as a response to the given in-message, with Session_config::m_default_timeout.
   * `reply` gets `original`'s ID, so that the opposing Session correlates it with the out-message it sent.  No
   * response to a response is expected.
   *
   * @param reply
   *        The response.  Must not be null.
   * @param original
   *        The in-message being responded to.  Must not be null; must have a nonzero ID.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT, error::Code::S_OUTBOUND_QUEUE_FULL.
   * @return `true` if enqueued; `false` if an error was emitted.
   */
  bool reply_msg(const Msg_ptr& reply, const Msg_ptr& original, Error_code* err_code = 0);

  /**
   * Identical to the other reply_msg() but with the given timeout instead of the default.
   *
   * @param reply
   *        See other reply_msg().
   * @param original
   *        See other reply_msg().
   * @param timeout
   *        See send_msg().
   * @param err_code
   *        See other reply_msg().
   * @return See other reply_msg().
   */
  bool reply_msg(const Msg_ptr& reply, const Msg_ptr& original, util::Fine_duration timeout,
                 Error_code* err_code = 0);

  /**
   * Forgets the given out-message, whether it is still waiting to be transmitted or waiting for a response.
   * Its handler is not informed.  No-op if it is in neither place (e.g., response already dispatched).
   * Best-effort: see class doc header.
   *
   * @param msg
   *        Message given to send_msg() or reply_msg() (matched by pointer).
   * @return `true` if something was removed.
   */
  bool cancel_msg(const Msg_ptr& msg);

  /**
   * Replaces the default handler.  A null `handler` is ignored.
   *
   * @param handler
   *        New default handler.
   */
  void set_default_response(const Handler_ptr& handler);

  /// Resets the default handler to null_handler().
  void remove_default_response();

  /**
   * The current default handler.
   * @return See above.  Never null.
   */
  Handler_ptr default_response() const;

  /**
   * Asks the owning Session_factory to close `*this`: see Session_factory::close_session().
   * @return `false` if already closed.
   */
  bool close();

  // Methods: for the transport driver.

  /**
   * Whether the outbound queue is non-empty.  Never blocks; the answer may be stale immediately.
   * @return See above.
   */
  bool has_wait_send_msg() const;

  /**
   * Equivalent to `next_wait_send_msg(util::Fine_clock::now())`.
   * @return See other overload.
   */
  Envelope_ptr next_wait_send_msg();

  /**
   * Pops envelopes from the outbound queue until a non-expired one is found, and returns it; every expired one
   * is dispatched to its handler as error::Code::S_SEND_TIMEOUT and forgotten.  The caller should transmit the
   * result and then report success_sent_msg() or failure_sent_msg().
   *
   * @param now
   *        Time against which deadlines are checked.
   * @return See above.  Null if the queue ran out.
   */
  Envelope_ptr next_wait_send_msg(const util::Fine_time_pt& now);

  /**
   * Reports that the given envelope (from next_wait_send_msg()) was transmitted.  If it expects a response, it
   * is added to the response table; otherwise forgotten.  If another envelope with the same tag is already
   * awaiting a response, this one is dispatched to its handler as error::Code::S_DUPLICATE_CORRELATION_TAG
   * instead.  Reporting the same envelope twice is harmless.
   *
   * @param envelope
   *        Envelope of `*this`.  Not null.
   */
  void success_sent_msg(const Envelope_ptr& envelope);

  /**
   * Reports that the given envelope (from next_wait_send_msg()) failed to be transmitted.  It is put at the end
   * of the outbound queue (regardless of Session_config::m_max_wait_send_msgs).
   *
   * @param envelope
   *        Envelope of `*this`.  Not null.
   */
  void failure_sent_msg(const Envelope_ptr& envelope);

  /**
   * Delivers an in-message: see class doc header.
   *
   * @param in_envelope
   *        In-message envelope; its tag() is what is looked up in the response table.
   * @return `true` if some handler fully handled it.  Informational only.
   */
  bool dispatch_msg(const Envelope& in_envelope);

  /**
   * Delivers an in-message whose correlation tag is the string form of its ID.
   *
   * @param msg
   *        In-message.  Not null.
   * @return See other overload.
   */
  bool dispatch_msg(const Msg_ptr& msg);

  /**
   * Reports an error concerning the given out-envelope, typically from the transport.  The envelope is removed
   * from the outbound queue and the response table, if it is in either; then, unless it was already settled (by
   * a response, a timeout, or an earlier error), the error is offered to its handler and, if that declines, to the
   * default handler.
   *
   * @param envelope
   *        The out-message envelope concerned.
   * @param err_code
   *        The error.  Must be truthy.
   * @return `true` if some handler fully handled it.  Informational only.
   */
  bool dispatch_exception(const Envelope& envelope, const Error_code& err_code);

  /**
   * Forgets every envelope awaiting a response, without informing handlers.
   * @return How many were forgotten.
   */
  size_t clear_wait_response_msg();

  /**
   * Forgets every envelope awaiting a response whose tag is a message ID below `threshold`, without informing
   * handlers.  Envelopes with tags that are not message IDs are kept (and a warning is logged).
   *
   * @param threshold
   *        See above.
   * @return How many were forgotten.
   */
  size_t clear_wait_responses_before(msg_id_t threshold);

  /**
   * Equivalent to `check_response_timeout(util::Fine_clock::now())`.
   * @return See other overload.
   */
  size_t check_response_timeout();

  /**
   * Removes every envelope whose deadline has passed from the response table, and dispatches each as
   * error::Code::S_RESPONSE_TIMEOUT.  The outbound queue is not examined: expired envelopes there are reported
   * only when next_wait_send_msg() pops them.
   *
   * @param now
   *        Time against which deadlines are checked.
   * @return How many timed out.
   */
  size_t check_response_timeout(const util::Fine_time_pt& now);

  /**
   * Outbound queue size.  Informational; may be stale immediately.
   * @return See above.
   */
  size_t wait_send_msg_count() const;

  /**
   * Response table size.  Informational; may be stale immediately.
   * @return See above.
   */
  size_t wait_response_msg_count() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Friends.

  /// The only creator of Session objects; also tears them down.
  friend class Session_factory;

  // Constructors.

  /**
   * Constructs session.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param from
   *        See from().
   * @param to
   *        See to().
   * @param config
   *        See config().
   * @param factory
   *        Owner; close() forwards to it.  Not null.
   */
  explicit Session(flow::log::Logger* logger_ptr, const std::string& from, const std::string& to,
                   const Session_config& config, Session_factory* factory);

  // Methods.

  /**
   * Builds envelope and enqueues it; the common part of send_msg() and reply_msg().
   *
   * @param msg
   *        Message.  Not null.
   * @param tag
   *        Correlation tag.
   * @param handler
   *        Handler or null.
   * @param timeout
   *        Requested timeout.
   * @param err_code
   *        Not null.
   * @return See send_msg().
   */
  bool enqueue(const Msg_ptr& msg, std::string&& tag, const Handler_ptr& handler, util::Fine_duration timeout,
               Error_code* err_code);

  /**
   * Offers the given error to the envelope's handler and, if it declines, to the default handler.  The caller
   * must have settled the envelope.
   *
   * @param envelope
   *        See dispatch_exception().
   * @param err_code
   *        See dispatch_exception().
   * @return See dispatch_exception().
   */
  bool notify_exception(const Envelope& envelope, const Error_code& err_code);

  /**
   * Forgets all envelopes (both containers) without informing handlers.  Session_factory invokes it on close.
   */
  void teardown();

  // Data.

  /// See from().
  const std::string m_from;

  /// See to().
  const std::string m_to;

  /// See config().
  const Session_config m_config;

  /// See close().
  Session_factory* const m_factory;

  /// Next message ID to assign in send_msg().
  std::atomic<msg_id_t> m_next_msg_id;

  /// Envelopes waiting to be transmitted.
  Outbound_queue m_out_queue;

  /// Envelopes transmitted and waiting for a response.
  Response_table m_rsp_table;

  /// Protects #m_default_handler.
  mutable Mutex m_default_handler_mutex;

  /// See default_response().  Never null.  Protected by #m_default_handler_mutex.
  Handler_ptr m_default_handler;
}; // class Session

} // namespace msgcorr::session
