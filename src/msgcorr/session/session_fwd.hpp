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

#include "msgcorr/util/util_fwd.hpp"
#include <memory>

/**
 * Msg-Corr module containing the per-peer message correlation engine: session::Session and its helpers.
 *
 * The big daddy here is Session.  It is obtained from a Session_factory (one Session per (from, to) endpoint pair),
 * and it is used concurrently by (1) application code, which calls Session::send_msg(), Session::reply_msg(),
 * Session::cancel_msg(); (2) the user's transport-driving code, which pulls envelopes to transmit
 * (Session::next_wait_send_msg()), reports the outcome (Session::success_sent_msg(), Session::failure_sent_msg()),
 * and delivers in-messages and transport errors (Session::dispatch_msg(), Session::dispatch_exception());
 * and (3) a periodic timer that expires stale response expectations (Session::check_response_timeout(); see
 * Timeout_sweeper).  Session_driver packages up item (2) for a user-supplied sender.
 *
 * Internally a Session keeps exactly two pieces of shared mutable state: an Outbound_queue of envelopes not yet
 * transmitted and a Response_table of envelopes transmitted and awaiting a response.  A given Envelope lives in
 * at most one of them at a time; this is what guarantees a given out-message's handler hears about it at most once.
 */
namespace msgcorr::session
{

// Types.

// Find doc headers near the bodies of these compound types.

class Msg;
class Envelope;
class Handler;
class Null_handler;
class Function_handler;
class Outbound_queue;
class Response_table;
class Session;
class Session_factory;
class Timeout_sweeper;
struct Session_config;
template<typename Msg_sender>
class Session_driver;

/**
 * Message ID uniquely identifying an out-message, per Session.  0 is a sentinel value meaning "not assigned"
 * and is not a valid message ID.
 *
 * Session assigns IDs from sequence 1, 2, ... at Session::send_msg() time, unless the user pre-set a nonzero ID.
 * A response echoes the ID of the message it is responding to (see Session::reply_msg()); that is how the
 * receiving side's Session finds the originating out-message's handler.
 *
 * ### Rationale for type used ###
 * Needs to be big enough to where there's no chance it overflows in a given session.  At 2^30 msg/s it would take
 * over 500 years to wrap around 64 bits.
 */
using msg_id_t = uint64_t;

/// Short-hand for ref-counted pointer to a Msg.  Its identity (the pointer) is what Session::cancel_msg() matches.
using Msg_ptr = std::shared_ptr<Msg>;

/**
 * Short-hand for ref-counted pointer to an immutable Envelope.  An Envelope is shared between whichever
 * container is holding it and the transport-driving code that pulled it out for transmission.
 */
using Envelope_ptr = std::shared_ptr<const Envelope>;

/// Short-hand for ref-counted pointer to a Handler.  Handlers may be stateful and may be shared among envelopes.
using Handler_ptr = std::shared_ptr<Handler>;

/// Short-hand for ref-counted pointer to a Session.
using Session_ptr = std::shared_ptr<Session>;

// Free functions.

/**
 * Returns the shared no-op Handler: it declines everything (returns `false` from both methods).
 * It is what an Envelope without a user handler uses, and what Session::remove_default_response() installs.
 *
 * @return See above.  Never null.
 */
const Handler_ptr& null_handler();

/**
 * Prints string representation of the given Msg to the given `ostream`.
 *
 * @relatesalso Msg
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Msg& val);

/**
 * Prints string representation of the given Envelope to the given `ostream`.
 *
 * @relatesalso Envelope
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Envelope& val);

/**
 * Prints string representation of the given Session to the given `ostream`.
 *
 * @relatesalso Session
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session& val);

/**
 * Prints string representation of the given Session_config to the given `ostream`.
 *
 * @relatesalso Session_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session_config& val);

/**
 * Prints string representation of the given Timeout_sweeper to the given `ostream`.
 *
 * @relatesalso Timeout_sweeper
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Timeout_sweeper& val);

/**
 * Prints string representation of the given Session_driver to the given `ostream`.
 *
 * @relatesalso Session_driver
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Msg_sender>
std::ostream& operator<<(std::ostream& os, const Session_driver<Msg_sender>& val);

} // namespace msgcorr::session
