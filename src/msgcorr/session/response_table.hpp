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
#include <boost/unordered_map.hpp>
#include <boost/noncopyable.hpp>
#include <vector>

namespace msgcorr::session
{

/**
 * Internally synchronized table, keyed by correlation tag (Envelope::tag()), of envelopes that have been
 * transmitted and are awaiting a response; the inbound half of a Session's state.
 *
 * The key operation is take(): it finds *and* erases under one lock, so that when two threads race to claim the
 * same entry -- the transport thread delivering the response (Session::dispatch_msg()) and the sweeping thread
 * expiring it (Session::check_response_timeout(), via take_expired()) -- exactly one of them gets it.  The winner
 * alone invokes the entry's handler.
 *
 * ### Thread safety ###
 * All methods may be called concurrently with each other on the same `*this`.  Each one is a short critical
 * section; none blocks otherwise.  No handler is ever invoked by `*this`.
 */
class Response_table :
  private boost::noncopyable
{
public:
  // Types.

  /// Result of insert().
  enum class Insert_result
  {
    /// The envelope was inserted.
    S_INSERTED,

    /// The very same envelope was already present; nothing changed.
    S_ALREADY_PRESENT,

    /// A different envelope with the same tag was present; nothing changed.
    S_DUPLICATE_TAG
  }; // enum class Insert_result

  // Methods.

  /**
   * Inserts envelope keyed by its tag, unless the tag is already present.
   *
   * @param envelope
   *        Envelope to insert.  Not null, or undefined behavior (assertion may trip).
   * @return See Insert_result.
   */
  Insert_result insert(Envelope_ptr envelope);

  /**
   * Removes and returns the envelope with the given tag; or null if none.
   *
   * @param tag
   *        Correlation tag.
   * @return See above.
   */
  Envelope_ptr take(const std::string& tag);

  /**
   * Removes the envelope wrapping the given message (by `Msg_ptr` identity), if any.
   *
   * @param msg
   *        Message to look for.
   * @return `true` if an envelope was removed.
   */
  bool remove(const Msg_ptr& msg);

  /**
   * Removes the given envelope (by identity), if present.  A different envelope with the same tag is left alone.
   *
   * @param envelope
   *        Envelope to look for.
   * @return The removed envelope; or null if it was not present.
   */
  Envelope_ptr remove(const Envelope& envelope);

  /**
   * Removes and returns every envelope whose deadline has been reached as of `now`.  The returned envelopes are
   * no longer in the table when this returns: the caller owns their fate.
   *
   * @param now
   *        Current time.
   * @return See above.  Order is unspecified.
   */
  std::vector<Envelope_ptr> take_expired(const util::Fine_time_pt& now);

  /**
   * Removes every envelope whose tag, interpreted as a decimal #msg_id_t, is strictly less than `threshold`.
   * Tags that are not such a number (anything but 1+ decimal digits fitting into #msg_id_t) are left alone.
   *
   * @param threshold
   *        See above.
   * @param non_numeric_count
   *        If not null, `*non_numeric_count` is set to the number of entries skipped due to a non-numeric tag.
   * @return How many were removed.
   */
  size_t erase_before(msg_id_t threshold, size_t* non_numeric_count = 0);

  /**
   * Removes all envelopes.
   * @return How many were removed.
   */
  size_t clear();

  /**
   * Whether an envelope with the given tag is present.  Of course the answer may be stale by the time it is
   * examined.
   *
   * @param tag
   *        Correlation tag.
   * @return See above.
   */
  bool contains(const std::string& tag) const;

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
   * Parses a tag as a decimal #msg_id_t.
   *
   * @param tag
   *        Correlation tag.
   * @param id
   *        On success `*id` is set to the result.  Not null.
   * @return `false` if `tag` is not 1+ decimal digits or does not fit; `true` otherwise.
   */
  static bool tag_to_msg_id(const std::string& tag, msg_id_t* id);

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Short-hand for the map type: tag => envelope.
  using Envelope_map = boost::unordered_map<std::string, Envelope_ptr>;

  // Data.

  /// Protects #m_envelopes.
  mutable Mutex m_mutex;

  /// The envelopes keyed by tag.  Protected by #m_mutex.
  Envelope_map m_envelopes;
}; // class Response_table

} // namespace msgcorr::session
