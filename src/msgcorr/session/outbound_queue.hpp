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
#include <flow/util/util.hpp>
#include <boost/noncopyable.hpp>
#include <deque>

namespace msgcorr::session
{

/**
 * Internally synchronized FIFO of envelopes awaiting their first transmission; the outbound half of a Session's
 * state.  Session pushes at the tail on send_msg()/reply_msg() and on failure_sent_msg() (retry), and pops from
 * the head on next_wait_send_msg(); cancel_msg() may pull an envelope out of the middle.
 *
 * The queue knows nothing of timeouts: Session::next_wait_send_msg() discards expired envelopes it pops.
 *
 * ### Thread safety ###
 * All methods may be called concurrently with each other on the same `*this`.  Each one is a short critical
 * section; none blocks otherwise.
 */
class Outbound_queue :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs empty queue.
   *
   * @param capacity
   *        Maximum number of envelopes push() will accept (unless told to ignore it); 0 means unbounded.
   */
  explicit Outbound_queue(size_t capacity = 0);

  // Methods.

  /**
   * Appends envelope at the tail, unless at capacity.
   *
   * @param envelope
   *        Envelope to append.  Not null, or undefined behavior (assertion may trip).
   * @param ignore_capacity
   *        If `true`, appends even if at capacity.
   * @return `true` if appended; `false` if at capacity (and `!ignore_capacity`).
   */
  bool push(Envelope_ptr envelope, bool ignore_capacity = false);

  /**
   * Removes and returns the envelope at the head; or null if empty.
   * @return See above.
   */
  Envelope_ptr pop();

  /**
   * Removes the first envelope wrapping the given message (by `Msg_ptr` identity), if any.
   *
   * @param msg
   *        Message to look for.
   * @return `true` if an envelope was removed.
   */
  bool remove(const Msg_ptr& msg);

  /**
   * Removes the given envelope (by identity), if present.
   *
   * @param envelope
   *        Envelope to look for.
   * @return The removed envelope; or null if it was not present.
   */
  Envelope_ptr remove(const Envelope& envelope);

  /**
   * Removes all envelopes.
   * @return How many were removed.
   */
  size_t clear();

  /**
   * Whether there are no envelopes.  Of course the answer may be stale by the time it is examined.
   * @return See above.
   */
  bool empty() const;

  /**
   * Number of envelopes.  Of course the answer may be stale by the time it is examined.
   * @return See above.
   */
  size_t size() const;

  /**
   * Capacity from ctor.
   * @return See above.
   */
  size_t capacity() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See capacity().
  const size_t m_capacity;

  /// Protects #m_envelopes.
  mutable Mutex m_mutex;

  /// The envelopes, head at front.  Protected by #m_mutex.
  std::deque<Envelope_ptr> m_envelopes;
}; // class Outbound_queue

} // namespace msgcorr::session
