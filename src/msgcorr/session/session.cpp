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
#include "msgcorr/session/session.hpp"
#include "msgcorr/session/session_factory.hpp"
#include "msgcorr/session/envelope.hpp"
#include "msgcorr/session/handler.hpp"
#include "msgcorr/session/msg.hpp"
#include "msgcorr/session/error.hpp"
#include <flow/error/error.hpp>
#include <boost/chrono/chrono_io.hpp>
#include <algorithm>

namespace msgcorr::session
{

// Implementations.

Session::Session(flow::log::Logger* logger_ptr, const std::string& from, const std::string& to,
                 const Session_config& config, Session_factory* factory) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_from(from),
  m_to(to),
  m_config(config),
  m_factory(factory),
  m_next_msg_id(1),
  m_out_queue(m_config.m_max_wait_send_msgs),
  m_default_handler(null_handler())
{
  assert(m_factory && "Broke contract.");

  FLOW_LOG_INFO("Session [" << *this << "]: Created; config: [" << m_config << "].");
}

Session::~Session()
{
  FLOW_LOG_INFO("Session [" << *this << "]: Shutting down; "
                "[" << wait_send_msg_count() << "] out-messages were still waiting to be sent; "
                "[" << wait_response_msg_count() << "] were still waiting for responses.  "
                "No handlers will be informed.");
}

const std::string& Session::from() const
{
  return m_from;
}

const std::string& Session::to() const
{
  return m_to;
}

const Session_config& Session::config() const
{
  return m_config;
}

bool Session::send_msg(const Msg_ptr& msg, const Handler_ptr& handler, Error_code* err_code)
{
  return send_msg(msg, handler, m_config.m_default_timeout, err_code);
}

bool Session::send_msg(const Msg_ptr& msg, util::Fine_duration timeout, Error_code* err_code)
{
  return send_msg(msg, Handler_ptr(), timeout, err_code);
}

bool Session::send_msg(const Msg_ptr& msg, const Handler_ptr& handler, util::Fine_duration timeout,
                       Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, send_msg, msg, handler, timeout, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!msg)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: send_msg() invoked with null message.  Ignoring.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else

  if (msg->id() == 0)
  {
    msg->set_id(m_next_msg_id++);
  }

  return enqueue(msg, Envelope::tag_of(msg->id()), handler, timeout, err_code);
} // Session::send_msg()

bool Session::reply_msg(const Msg_ptr& reply, const Msg_ptr& original, Error_code* err_code)
{
  return reply_msg(reply, original, m_config.m_default_timeout, err_code);
}

bool Session::reply_msg(const Msg_ptr& reply, const Msg_ptr& original, util::Fine_duration timeout,
                        Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, reply_msg, reply, original, timeout, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((!reply) || (!original) || (original->id() == 0))
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: reply_msg() invoked with null reply [" << (!reply) << "], "
                     "or null original [" << (!original) << "], or an original without ID.  Ignoring.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else

  // The response carries the ID of what it responds to; we do not generate one.
  reply->set_id(original->id());
  return enqueue(reply, Envelope::tag_of(original->id()), Handler_ptr(), timeout, err_code);
} // Session::reply_msg()

bool Session::enqueue(const Msg_ptr& msg, std::string&& tag, const Handler_ptr& handler,
                      util::Fine_duration timeout, Error_code* err_code)
{
  assert(err_code);

  const auto eff_timeout = std::max(timeout, Session_config::S_MIN_TIMEOUT);
  const bool need_response = bool(handler);
  auto envelope = std::make_shared<const Envelope>(this, msg, std::move(tag),
                                                   util::time_pt_after_saturated(util::Fine_clock::now(),
                                                                                 eff_timeout),
                                                   handler, need_response);

  if (!m_out_queue.push(envelope))
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Cannot enqueue out-message envelope [" << *envelope << "]: "
                     "outbound queue is at capacity [" << m_out_queue.capacity() << "].");
    *err_code = error::Code::S_OUTBOUND_QUEUE_FULL;
    return false;
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Enqueued out-message envelope [" << *envelope << "]; "
                 "effective timeout [" << eff_timeout << "].");
  err_code->clear();
  return true;
} // Session::enqueue()

bool Session::cancel_msg(const Msg_ptr& msg)
{
  if (!msg)
  {
    return false;
  }
  // else

  /* Try the queue first, as that is where it goes first.  If it is in transit between the two at this moment, we
   * will find it in neither; that's accepted. */
  if (m_out_queue.remove(msg))
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Cancelled out-message [" << *msg << "] before it was sent.");
    return true;
  }
  // else
  if (m_rsp_table.remove(msg))
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Cancelled out-message [" << *msg << "] awaiting response.");
    return true;
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Cancel of out-message [" << *msg << "] found nothing; "
                 "already handled, in transit, or never sent.");
  return false;
} // Session::cancel_msg()

void Session::set_default_response(const Handler_ptr& handler)
{
  if (!handler)
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Null default handler given; ignoring.");
    return;
  }
  // else

  Handler_ptr prev;
  {
    Lock_guard lock(m_default_handler_mutex);
    prev = std::move(m_default_handler);
    m_default_handler = handler;
  }
  FLOW_LOG_INFO("Session [" << *this << "]: Default handler replaced: "
                "[" << prev.get() << "] => [" << handler.get() << "].");
}

void Session::remove_default_response()
{
  Handler_ptr prev;
  {
    Lock_guard lock(m_default_handler_mutex);
    prev = std::move(m_default_handler);
    m_default_handler = null_handler();
  }
  FLOW_LOG_INFO("Session [" << *this << "]: Default handler [" << prev.get() << "] removed.");
}

Handler_ptr Session::default_response() const
{
  Lock_guard lock(m_default_handler_mutex);
  return m_default_handler;
}

bool Session::close()
{
  return m_factory->close_session(*this);
}

bool Session::has_wait_send_msg() const
{
  return !m_out_queue.empty();
}

Envelope_ptr Session::next_wait_send_msg()
{
  return next_wait_send_msg(util::Fine_clock::now());
}

Envelope_ptr Session::next_wait_send_msg(const util::Fine_time_pt& now)
{
  Envelope_ptr envelope;
  while ((envelope = m_out_queue.pop()))
  {
    if (envelope->settled())
    {
      // A transport error already reported it while it was being re-enqueued.
      FLOW_LOG_TRACE("Session [" << *this << "]: Envelope [" << *envelope << "] already settled; discarding.");
      continue;
    }
    // else
    if (!envelope->is_timeout(now))
    {
      FLOW_LOG_TRACE("Session [" << *this << "]: Dequeued envelope [" << *envelope << "] for sending.");
      return envelope;
    }
    // else

    FLOW_LOG_WARNING("Session [" << *this << "]: Envelope [" << *envelope << "] expired before it could be sent; "
                     "discarding and informing handler.");
    if (envelope->settle())
    {
      notify_exception(*envelope, error::Code::S_SEND_TIMEOUT);
    }
  }

  return envelope; // Null.
} // Session::next_wait_send_msg()

void Session::success_sent_msg(const Envelope_ptr& envelope)
{
  assert(envelope && (envelope->belong() == this) && "Broke contract.");

  if (envelope->settled())
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Sent envelope [" << *envelope << "] reported; but it is already "
                   "settled; forgetting it.");
    return;
  }
  // else
  if (!envelope->need_response())
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Sent envelope [" << *envelope << "]; no response expected; "
                   "forgetting it.");
    return;
  }
  // else

  switch (m_rsp_table.insert(envelope))
  {
  case Response_table::Insert_result::S_INSERTED:
    FLOW_LOG_TRACE("Session [" << *this << "]: Sent envelope [" << *envelope << "]; awaiting response.");
    return;
  case Response_table::Insert_result::S_ALREADY_PRESENT:
    FLOW_LOG_TRACE("Session [" << *this << "]: Sent envelope [" << *envelope << "] reported again; "
                   "already awaiting response; no-op.");
    return;
  case Response_table::Insert_result::S_DUPLICATE_TAG:
    break;
  }

  FLOW_LOG_WARNING("Session [" << *this << "]: Sent envelope [" << *envelope << "]; but a different envelope with "
                   "the same tag is already awaiting response.  Its response would be ambiguous; informing handler.");
  if (envelope->settle())
  {
    notify_exception(*envelope, error::Code::S_DUPLICATE_CORRELATION_TAG);
  }
} // Session::success_sent_msg()

void Session::failure_sent_msg(const Envelope_ptr& envelope)
{
  assert(envelope && (envelope->belong() == this) && "Broke contract.");

  if (envelope->settled())
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Envelope [" << *envelope << "] failed to send; but it is already "
                   "settled; forgetting it.");
    return;
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Envelope [" << *envelope << "] failed to send; re-enqueuing "
                 "at end of outbound queue.");
#ifndef NDEBUG
  const bool ok =
#endif
  m_out_queue.push(envelope, true); // Ignore capacity.
  assert(ok);
}

bool Session::dispatch_msg(const Msg_ptr& msg)
{
  assert(msg && "Broke contract.");
  return dispatch_msg(Envelope(this, msg, Envelope::tag_of(msg->id())));
}

bool Session::dispatch_msg(const Envelope& in_envelope)
{
  const auto& msg = in_envelope.msg();

  // This take() is what makes us and check_response_timeout() mutually exclusive for a given envelope.
  const auto out_envelope = m_rsp_table.take(in_envelope.tag());
  if (out_envelope && out_envelope->settle())
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: In-message [" << *msg << "] is response to out-envelope "
                   "[" << *out_envelope << "]; offering it to its handler.");
    if (out_envelope->handler()->on_receive(*this, msg))
    {
      return true;
    }
    // else
    FLOW_LOG_TRACE("Session [" << *this << "]: Handler declined; offering to default handler.");
  }
  else
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: In-message [" << *msg << "] with tag [" << in_envelope.tag() << "] "
                   "is not awaited; offering it to default handler.");
  }

  if (default_response()->on_receive(*this, msg))
  {
    return true;
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: In-message [" << *msg << "] handled by nobody; dropping.");
  return false;
} // Session::dispatch_msg()

bool Session::dispatch_exception(const Envelope& envelope, const Error_code& err_code)
{
  assert(err_code && "Broke contract.");

  /* Whatever happens next, it must not be transmitted again, nor time out later.  Hold on to what we remove:
   * `envelope` may be a reference into it. */
  const auto queued = m_out_queue.remove(envelope);
  const auto awaiting = m_rsp_table.remove(envelope);
  FLOW_LOG_TRACE("Session [" << *this << "]: Error [" << err_code << "] reported concerning envelope "
                 "[" << envelope << "]; was queued [" << bool(queued) << "]; "
                 "was awaiting response [" << bool(awaiting) << "].");

  if (!envelope.settle())
  {
    FLOW_LOG_TRACE("Session [" << *this << "]: Error [" << err_code << "] [" << err_code.message() << "] "
                   "concerning envelope [" << envelope << "] arrived after it was settled; dropping.");
    return false;
  }
  // else
  return notify_exception(envelope, err_code);
}

bool Session::notify_exception(const Envelope& envelope, const Error_code& err_code)
{
  FLOW_LOG_TRACE("Session [" << *this << "]: Offering error [" << err_code << "] [" << err_code.message() << "] "
                 "concerning envelope [" << envelope << "] to its handler.");
  if (envelope.handler()->on_exception(*this, envelope.msg(), err_code))
  {
    return true;
  }
  // else
  if (default_response()->on_exception(*this, envelope.msg(), err_code))
  {
    return true;
  }
  // else

  FLOW_LOG_TRACE("Session [" << *this << "]: Error [" << err_code << "] concerning envelope [" << envelope << "] "
                 "handled by nobody; dropping.");
  return false;
} // Session::notify_exception()

size_t Session::clear_wait_response_msg()
{
  const auto n = m_rsp_table.clear();
  FLOW_LOG_INFO("Session [" << *this << "]: Forgot all [" << n << "] envelopes awaiting response.");
  return n;
}

size_t Session::clear_wait_responses_before(msg_id_t threshold)
{
  size_t n_skipped;
  const auto n = m_rsp_table.erase_before(threshold, &n_skipped);

  FLOW_LOG_INFO("Session [" << *this << "]: Forgot [" << n << "] envelopes awaiting response with "
                "message ID below [" << threshold << "].");
  if (n_skipped != 0)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: While forgetting envelopes awaiting response with message ID below "
                     "[" << threshold << "], encountered [" << n_skipped << "] with non-numeric tags; "
                     "those were kept.");
  }
  return n;
}

size_t Session::check_response_timeout()
{
  return check_response_timeout(util::Fine_clock::now());
}

size_t Session::check_response_timeout(const util::Fine_time_pt& now)
{
  // They're out of the table once this returns, so a racing dispatch_msg() cannot see them.
  const auto expired = m_rsp_table.take_expired(now);

  size_t n_timed_out = 0;
  for (const auto& envelope : expired)
  {
    if (!envelope->settle())
    {
      continue; // A transport error got to it first.
    }
    // else
    ++n_timed_out;
    FLOW_LOG_WARNING("Session [" << *this << "]: Envelope [" << *envelope << "] got no response before "
                     "its deadline; informing handler.");
    notify_exception(*envelope, error::Code::S_RESPONSE_TIMEOUT);
  }
  return n_timed_out;
}

size_t Session::wait_send_msg_count() const
{
  return m_out_queue.size();
}

size_t Session::wait_response_msg_count() const
{
  return m_rsp_table.size();
}

void Session::teardown()
{
  const auto n_out = m_out_queue.clear();
  const auto n_rsp = m_rsp_table.clear();
  FLOW_LOG_INFO("Session [" << *this << "]: Closed; forgot [" << n_out << "] envelopes waiting to be sent and "
                "[" << n_rsp << "] awaiting response.  No handlers informed.");
}

std::ostream& operator<<(std::ostream& os, const Session& val)
{
  return os << '[' << val.from() << "->" << val.to() << "]@" << static_cast<const void*>(&val);
}

} // namespace msgcorr::session
