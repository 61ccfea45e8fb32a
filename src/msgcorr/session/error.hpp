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

#include "msgcorr/common.hpp"

/**
 * Namespace containing the msgcorr::session module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that errors reported by
 * the user's transport (passed through session::Session::dispatch_exception() unchanged) would not draw from this
 * set of codes/messages but from whatever category the transport uses, often `boost::asio::error` or
 * `boost::system::errc`.  (If you're familiar with the boost.system framework, you'll know such mixing is
 * normal -- in fact arguably one of its strengths.)
 *
 * A session::Handler's `on_exception()` receives an #Error_code; to tell a send timeout from a response timeout
 * from a transport failure, compare it against these `Code`s, e.g., `err_code == error::Code::S_RESPONSE_TIMEOUT`.
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace msgcorr::session::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) or dispatched (via session::Handler::on_exception())
 * by msgcorr::session functions/methods *outside of* transport-reported errors.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.  This mirrors Flow's convention.
 *
 * When you add a value to this `enum`, also add its symbolic representation to
 * error.cpp's Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_INVALID_ARGUMENT => `"INVALID_ARGUMENT"`.  This enables the consistent and human-friendly
 * serialization `<<` and deserialization `>>` of a Code w/r/t standard streams.
 *
 * If, when adding a new revision of the code, you add a value to this `enum`, add it to the end, but ahead of
 * Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Out-message expired while waiting in the outbound queue; it was never transmitted and will not be retried.
  S_SEND_TIMEOUT = S_CODE_LOWEST_INT_VALUE,

  /// Out-message was transmitted, but no response to it arrived before its timeout expired.
  S_RESPONSE_TIMEOUT,

  /// User called an API with 1 or more arguments against the API contract.
  S_INVALID_ARGUMENT,

  /// Will not enqueue out-message: the outbound queue is configured with a capacity, and it is at capacity.
  S_OUTBOUND_QUEUE_FULL,

  /**
   * Transmitted out-message cannot await a response: another transmitted message with the same correlation tag
   * is already awaiting one.  Probably the user pre-set a message ID that collides with an earlier one.
   */
  S_DUPLICATE_CORRELATION_TAG,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.  Or, slightly more in English,
 * it glues the (completely general) #Error_code to the (`msgcorr::session`-specific) error code set
 * msgcorr::session::error::Code, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a session::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "SEND_TIMEOUT" (or "send_timeout" or "Send_timeout" or...) for Code::S_SEND_TIMEOUT.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);
// @todo - `@relatesalso Code` makes Doxygen complain; maybe it doesn't work with `enum class`es like Code.

/**
 * Serializes a session::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.  E.g., Code::S_SEND_TIMEOUT => `"SEND_TIMEOUT"`.
 *
 * When printing an #Error_code storing a Code, continue to do the standard thing: output the #Error_code itself
 * plus its `.message()`.  The present operator exists to provide symbolic [de]serialization specifically of Code.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);
// @todo - `@relatesalso Code` makes Doxygen complain; maybe it doesn't work with `enum class`es like Code.

} // namespace msgcorr::session::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::msgcorr::session::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
