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
#include "msgcorr/session/outbound_queue.hpp"
#include "msgcorr/session/envelope.hpp"
#include <algorithm>

namespace msgcorr::session
{

Outbound_queue::Outbound_queue(size_t capacity) :
  m_capacity(capacity)
{
  // Nothing else.
}

bool Outbound_queue::push(Envelope_ptr envelope, bool ignore_capacity)
{
  assert(envelope && "Broke contract.");

  Lock_guard lock(m_mutex);
  if ((!ignore_capacity) && (m_capacity != 0) && (m_envelopes.size() >= m_capacity))
  {
    return false;
  }
  // else
  m_envelopes.emplace_back(std::move(envelope));
  return true;
}

Envelope_ptr Outbound_queue::pop()
{
  Lock_guard lock(m_mutex);
  if (m_envelopes.empty())
  {
    return Envelope_ptr();
  }
  // else
  auto envelope = std::move(m_envelopes.front());
  m_envelopes.pop_front();
  return envelope;
}

bool Outbound_queue::remove(const Msg_ptr& msg)
{
  Lock_guard lock(m_mutex);
  const auto it = std::find_if(m_envelopes.begin(), m_envelopes.end(),
                               [&](const Envelope_ptr& envelope) { return envelope->msg() == msg; });
  if (it == m_envelopes.end())
  {
    return false;
  }
  // else
  m_envelopes.erase(it);
  return true;
}

Envelope_ptr Outbound_queue::remove(const Envelope& envelope)
{
  Lock_guard lock(m_mutex);
  const auto it = std::find_if(m_envelopes.begin(), m_envelopes.end(),
                               [&](const Envelope_ptr& queued) { return queued.get() == &envelope; });
  if (it == m_envelopes.end())
  {
    return Envelope_ptr();
  }
  // else
  auto removed = std::move(*it);
  m_envelopes.erase(it);
  return removed;
}

size_t Outbound_queue::clear()
{
  /* Swap out under the lock; let the envelopes (and whatever handlers only they were keeping alive) die after
   * unlocking. */
  std::deque<Envelope_ptr> doomed;
  {
    Lock_guard lock(m_mutex);
    doomed.swap(m_envelopes);
  }
  return doomed.size();
}

bool Outbound_queue::empty() const
{
  Lock_guard lock(m_mutex);
  return m_envelopes.empty();
}

size_t Outbound_queue::size() const
{
  Lock_guard lock(m_mutex);
  return m_envelopes.size();
}

size_t Outbound_queue::capacity() const
{
  return m_capacity;
}

} // namespace msgcorr::session
