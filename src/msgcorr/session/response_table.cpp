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
#include "msgcorr/session/response_table.hpp"
#include "msgcorr/session/envelope.hpp"
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <algorithm>
#include <cctype>

namespace msgcorr::session
{

Response_table::Insert_result Response_table::insert(Envelope_ptr envelope)
{
  assert(envelope && "Broke contract.");

  Lock_guard lock(m_mutex);
  const auto it = m_envelopes.find(envelope->tag());
  if (it != m_envelopes.end())
  {
    return (it->second == envelope) ? Insert_result::S_ALREADY_PRESENT : Insert_result::S_DUPLICATE_TAG;
  }
  // else
  const auto& tag = envelope->tag();
  m_envelopes.emplace(tag, std::move(envelope));
  return Insert_result::S_INSERTED;
}

Envelope_ptr Response_table::take(const std::string& tag)
{
  Lock_guard lock(m_mutex);
  const auto it = m_envelopes.find(tag);
  if (it == m_envelopes.end())
  {
    return Envelope_ptr();
  }
  // else
  auto envelope = std::move(it->second);
  m_envelopes.erase(it);
  return envelope;
}

bool Response_table::remove(const Msg_ptr& msg)
{
  Lock_guard lock(m_mutex);

  // Usually the tag is just the message's ID; try that first.
  auto it = m_envelopes.find(Envelope::tag_of(msg->id()));
  if ((it == m_envelopes.end()) || (it->second->msg() != msg))
  {
    it = std::find_if(m_envelopes.begin(), m_envelopes.end(),
                      [&](const Envelope_map::value_type& entry) { return entry.second->msg() == msg; });
    if (it == m_envelopes.end())
    {
      return false;
    }
  }
  // else

  m_envelopes.erase(it);
  return true;
}

Envelope_ptr Response_table::remove(const Envelope& envelope)
{
  Lock_guard lock(m_mutex);
  const auto it = m_envelopes.find(envelope.tag());
  if ((it == m_envelopes.end()) || (it->second.get() != &envelope))
  {
    return Envelope_ptr();
  }
  // else
  auto removed = std::move(it->second);
  m_envelopes.erase(it);
  return removed;
}

std::vector<Envelope_ptr> Response_table::take_expired(const util::Fine_time_pt& now)
{
  std::vector<Envelope_ptr> expired;

  Lock_guard lock(m_mutex);
  for (auto it = m_envelopes.begin(); it != m_envelopes.end(); )
  {
    if (it->second->is_timeout(now))
    {
      expired.emplace_back(std::move(it->second));
      it = m_envelopes.erase(it);
    }
    else
    {
      ++it;
    }
  }
  return expired;
}

size_t Response_table::erase_before(msg_id_t threshold, size_t* non_numeric_count)
{
  size_t n_erased = 0;
  size_t n_skipped = 0;
  msg_id_t id;

  {
    Lock_guard lock(m_mutex);
    for (auto it = m_envelopes.begin(); it != m_envelopes.end(); )
    {
      if (!tag_to_msg_id(it->first, &id))
      {
        ++n_skipped;
        ++it;
      }
      else if (id < threshold)
      {
        ++n_erased;
        it = m_envelopes.erase(it);
      }
      else
      {
        ++it;
      }
    }
  } // Lock_guard lock(m_mutex);

  if (non_numeric_count)
  {
    *non_numeric_count = n_skipped;
  }
  return n_erased;
}

size_t Response_table::clear()
{
  Envelope_map doomed;
  {
    Lock_guard lock(m_mutex);
    doomed.swap(m_envelopes);
  }
  return doomed.size();
}

bool Response_table::contains(const std::string& tag) const
{
  Lock_guard lock(m_mutex);
  return m_envelopes.find(tag) != m_envelopes.end();
}

bool Response_table::empty() const
{
  Lock_guard lock(m_mutex);
  return m_envelopes.empty();
}

size_t Response_table::size() const
{
  Lock_guard lock(m_mutex);
  return m_envelopes.size();
}

bool Response_table::tag_to_msg_id(const std::string& tag, msg_id_t* id) // Static.
{
  assert(id);

  /* lexical_cast<> into an unsigned type happily accepts a leading '-' (and wraps around); we want none of that,
   * nor any '+' or whitespace.  So only digits; then let it check for overflow. */
  if (tag.empty()
      || (!std::all_of(tag.begin(), tag.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); })))
  {
    return false;
  }
  // else
  return boost::conversion::try_lexical_convert(tag, *id);
}

} // namespace msgcorr::session
