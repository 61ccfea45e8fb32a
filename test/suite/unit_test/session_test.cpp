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

#include "msgcorr/session/session.hpp"
#include "msgcorr/session/session_factory.hpp"
#include "msgcorr/session/envelope.hpp"
#include "msgcorr/session/handler.hpp"
#include "msgcorr/session/msg.hpp"
#include "msgcorr/session/error.hpp"
#include "msgcorr/test/test_logger.hpp"
#include "msgcorr/test/recording_handler.hpp"
#include <flow/error/error.hpp>
#include <boost/asio/error.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

namespace msgcorr::session::test
{

namespace
{

using msgcorr::test::Test_logger;
using msgcorr::test::Recording_handler;
using boost::chrono::milliseconds;
using boost::chrono::seconds;

/// Fixture: one factory, one session.
class Session_test :
  public ::testing::Test
{
protected:
  explicit Session_test(const Session_config& config = Session_config()) :
    m_factory(&m_logger, config),
    m_session(m_factory.open_session("local", "remote")),
    m_default_handler(std::make_shared<Recording_handler>())
  {
    m_session->set_default_response(m_default_handler);
  }

  /// Makes message with no ID.
  static Msg_ptr new_msg(const std::string& body = "req")
  {
    return std::make_shared<Msg>(body);
  }

  /// Sends with handler, pulls the envelope, reports it sent; returns the envelope.
  Envelope_ptr send_and_transmit(const Msg_ptr& msg, const Handler_ptr& handler,
                                 util::Fine_duration timeout = seconds(60))
  {
    EXPECT_TRUE(m_session->send_msg(msg, handler, timeout));
    auto envelope = m_session->next_wait_send_msg();
    EXPECT_TRUE(envelope);
    if (envelope)
    {
      EXPECT_EQ(envelope->msg(), msg);
      m_session->success_sent_msg(envelope);
    }
    return envelope;
  }

  Test_logger m_logger;
  Session_factory m_factory;
  Session_ptr m_session;
  std::shared_ptr<Recording_handler> m_default_handler;
}; // class Session_test

/// Same but with a bounded outbound queue.
class Bounded_session_test :
  public Session_test
{
protected:
  static Session_config bounded_config()
  {
    Session_config config;
    config.m_max_wait_send_msgs = 2;
    return config;
  }

  Bounded_session_test() :
    Session_test(bounded_config())
  {
  }
}; // class Bounded_session_test

} // Anonymous namespace.

TEST_F(Session_test, Identity)
{
  EXPECT_EQ(m_session->from(), "local");
  EXPECT_EQ(m_session->to(), "remote");
  EXPECT_FALSE(m_session->has_wait_send_msg());
  EXPECT_EQ(m_session->wait_send_msg_count(), 0u);
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);
  EXPECT_FALSE(m_session->next_wait_send_msg());
}

TEST_F(Session_test, Timeout_floor)
{
  const auto handler = std::make_shared<Recording_handler>();
  for (const util::Fine_duration timeout : { util::Fine_duration(milliseconds(1)), util::Fine_duration(milliseconds(499)),
                                             util::Fine_duration::zero(), util::Fine_duration(milliseconds(-5)) })
  {
    const auto before = util::Fine_clock::now();
    ASSERT_TRUE(m_session->send_msg(new_msg(), handler, timeout));
    const auto after = util::Fine_clock::now();

    const auto envelope = m_session->next_wait_send_msg(before);
    ASSERT_TRUE(envelope);
    EXPECT_GE(envelope->deadline(), before + Session_config::S_MIN_TIMEOUT);
    EXPECT_LE(envelope->deadline(), after + Session_config::S_MIN_TIMEOUT);
  }

  // Above the floor: honored as is.
  const auto before = util::Fine_clock::now();
  ASSERT_TRUE(m_session->send_msg(new_msg(), handler, seconds(3)));
  const auto after = util::Fine_clock::now();
  const auto envelope = m_session->next_wait_send_msg(before);
  ASSERT_TRUE(envelope);
  EXPECT_GE(envelope->deadline(), before + seconds(3));
  EXPECT_LE(envelope->deadline(), after + seconds(3));

  // No timeout given: default is effectively never.
  ASSERT_TRUE(m_session->send_msg(new_msg()));
  EXPECT_EQ(m_session->next_wait_send_msg()->deadline(), util::Fine_time_pt::max());

  EXPECT_EQ(handler->call_count(), 0u);
}

TEST_F(Session_test, Fifo_dequeue_and_id_assignment)
{
  const auto msg1 = new_msg();
  const auto msg2 = new_msg();
  const auto preset = std::make_shared<Msg>(1000, "preset");
  ASSERT_TRUE(m_session->send_msg(msg1));
  ASSERT_TRUE(m_session->send_msg(preset));
  ASSERT_TRUE(m_session->send_msg(msg2));
  EXPECT_EQ(m_session->wait_send_msg_count(), 3u);
  EXPECT_TRUE(m_session->has_wait_send_msg());

  EXPECT_EQ(msg1->id(), 1u);
  EXPECT_EQ(preset->id(), 1000u);
  EXPECT_EQ(msg2->id(), 2u);

  auto envelope = m_session->next_wait_send_msg();
  ASSERT_TRUE(envelope);
  EXPECT_EQ(envelope->msg(), msg1);
  EXPECT_EQ(envelope->tag(), "1");
  EXPECT_EQ(envelope->belong(), m_session.get());
  EXPECT_FALSE(envelope->need_response());
  EXPECT_EQ(m_session->next_wait_send_msg()->msg(), preset);
  EXPECT_EQ(m_session->next_wait_send_msg()->msg(), msg2);
  EXPECT_FALSE(m_session->next_wait_send_msg());
  EXPECT_FALSE(m_session->has_wait_send_msg());
}

TEST_F(Session_test, Send_timeout_dispatched_exactly_once)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto stale = new_msg();
  const auto fresh = new_msg();
  const auto now = util::Fine_clock::now();
  ASSERT_TRUE(m_session->send_msg(stale, handler, milliseconds(500)));
  ASSERT_TRUE(m_session->send_msg(fresh, handler, seconds(60)));

  // One second later the first one is stale: skipped, reported; the second is returned.
  const auto envelope = m_session->next_wait_send_msg(now + seconds(1));
  ASSERT_TRUE(envelope);
  EXPECT_EQ(envelope->msg(), fresh);

  auto exceptions = handler->exceptions();
  ASSERT_EQ(exceptions.size(), 1u);
  EXPECT_EQ(exceptions[0].first, stale);
  EXPECT_EQ(exceptions[0].second, error::Code::S_SEND_TIMEOUT);
  EXPECT_TRUE(handler->received().empty());

  // Never comes back.
  EXPECT_FALSE(m_session->next_wait_send_msg(now + seconds(1)));
  EXPECT_EQ(handler->exceptions().size(), 1u);
  EXPECT_EQ(m_default_handler->call_count(), 0u); // Handler accepted it.
}

TEST_F(Session_test, Send_timeout_declined_goes_to_default_handler)
{
  const auto handler = std::make_shared<Recording_handler>(true, false);
  const auto msg = new_msg();
  ASSERT_TRUE(m_session->send_msg(msg, handler, milliseconds(500)));
  EXPECT_FALSE(m_session->next_wait_send_msg(util::Fine_clock::now() + seconds(1)));

  EXPECT_EQ(handler->exceptions().size(), 1u);
  const auto exceptions = m_default_handler->exceptions();
  ASSERT_EQ(exceptions.size(), 1u);
  EXPECT_EQ(exceptions[0].first, msg);
  EXPECT_EQ(exceptions[0].second, error::Code::S_SEND_TIMEOUT);
}

TEST_F(Session_test, Response_resolves_to_own_handler)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  const auto envelope = send_and_transmit(msg, handler);
  ASSERT_TRUE(envelope);
  EXPECT_TRUE(envelope->need_response());
  EXPECT_EQ(m_session->wait_response_msg_count(), 1u);

  const auto rsp = std::make_shared<Msg>(msg->id(), "rsp");
  EXPECT_TRUE(m_session->dispatch_msg(rsp));
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);

  const auto received = handler->received();
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0], rsp);
  EXPECT_EQ(m_default_handler->call_count(), 0u);

  // One-shot: a second response goes to the default handler.
  const auto rsp2 = std::make_shared<Msg>(msg->id(), "rsp2");
  EXPECT_TRUE(m_session->dispatch_msg(rsp2));
  EXPECT_EQ(handler->received().size(), 1u);
  ASSERT_EQ(m_default_handler->received().size(), 1u);
  EXPECT_EQ(m_default_handler->received()[0], rsp2);
}

TEST_F(Session_test, Fire_and_forget_never_in_table)
{
  const auto msg = new_msg();
  const auto envelope = send_and_transmit(msg, Handler_ptr());
  ASSERT_TRUE(envelope);
  EXPECT_FALSE(envelope->need_response());
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);

  const auto rsp = std::make_shared<Msg>(msg->id(), "rsp");
  EXPECT_TRUE(m_session->dispatch_msg(rsp));
  ASSERT_EQ(m_default_handler->received().size(), 1u);
  EXPECT_EQ(m_default_handler->received()[0], rsp);
}

TEST_F(Session_test, Declined_response_goes_to_default_handler)
{
  const auto handler = std::make_shared<Recording_handler>(false, false);
  const auto msg = new_msg();
  send_and_transmit(msg, handler);

  const auto rsp = std::make_shared<Msg>(msg->id(), "rsp");
  EXPECT_TRUE(m_session->dispatch_msg(rsp));
  EXPECT_EQ(handler->received().size(), 1u);
  EXPECT_EQ(m_default_handler->received().size(), 1u);

  // Nobody wants it.
  m_session->remove_default_response();
  EXPECT_FALSE(m_session->dispatch_msg(std::make_shared<Msg>(12345, "unsolicited")));
}

TEST_F(Session_test, Dispatch_custom_tag)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  send_and_transmit(msg, handler);

  // The transport may build in-envelopes itself, with whatever tag it got off the wire.
  const auto rsp = std::make_shared<Msg>("rsp-without-id");
  EXPECT_TRUE(m_session->dispatch_msg(Envelope(m_session.get(), rsp, Envelope::tag_of(msg->id()))));
  ASSERT_EQ(handler->received().size(), 1u);
  EXPECT_EQ(handler->received()[0], rsp);
}

TEST_F(Session_test, Reply_uses_original_tag)
{
  const auto original = std::make_shared<Msg>(77, "req");
  const auto reply = std::make_shared<Msg>("rsp");
  ASSERT_TRUE(m_session->reply_msg(reply, original));
  EXPECT_EQ(reply->id(), 77u);

  const auto envelope = m_session->next_wait_send_msg();
  ASSERT_TRUE(envelope);
  EXPECT_EQ(envelope->msg(), reply);
  EXPECT_EQ(envelope->tag(), "77");
  EXPECT_FALSE(envelope->need_response());
  m_session->success_sent_msg(envelope);
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);

  // No ID was consumed from the sequence.
  const auto msg = new_msg();
  ASSERT_TRUE(m_session->send_msg(msg));
  EXPECT_EQ(msg->id(), 1u);
}

TEST_F(Session_test, Invalid_arguments)
{
  Error_code err_code;
  EXPECT_FALSE(m_session->send_msg(Msg_ptr(), Handler_ptr(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  err_code.clear();
  EXPECT_FALSE(m_session->reply_msg(new_msg(), Msg_ptr(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  err_code.clear();
  EXPECT_FALSE(m_session->reply_msg(Msg_ptr(), std::make_shared<Msg>(5, "req"), &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  err_code.clear();
  EXPECT_FALSE(m_session->reply_msg(new_msg(), new_msg(), &err_code)); // Original has no ID.
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  EXPECT_THROW(m_session->send_msg(Msg_ptr()), flow::error::Runtime_error);
  EXPECT_THROW(m_session->reply_msg(new_msg(), Msg_ptr()), flow::error::Runtime_error);

  EXPECT_TRUE(m_session->send_msg(new_msg(), Handler_ptr(), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(m_session->wait_send_msg_count(), 1u);
}

TEST_F(Bounded_session_test, Queue_full)
{
  Error_code err_code;
  EXPECT_TRUE(m_session->send_msg(new_msg(), Handler_ptr(), &err_code));
  EXPECT_TRUE(m_session->send_msg(new_msg(), Handler_ptr(), &err_code));
  EXPECT_FALSE(m_session->send_msg(new_msg(), Handler_ptr(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_OUTBOUND_QUEUE_FULL);
  EXPECT_FALSE(m_session->reply_msg(new_msg(), std::make_shared<Msg>(3, "req"), &err_code));
  EXPECT_EQ(err_code, error::Code::S_OUTBOUND_QUEUE_FULL);
  EXPECT_EQ(m_session->wait_send_msg_count(), 2u);

  // Failed sends are re-enqueued even when that exceeds capacity.
  const auto envelope = m_session->next_wait_send_msg();
  EXPECT_TRUE(m_session->send_msg(new_msg()));
  m_session->failure_sent_msg(envelope);
  EXPECT_EQ(m_session->wait_send_msg_count(), 3u);
}

TEST_F(Session_test, Failed_send_goes_to_tail)
{
  const auto msg1 = new_msg();
  const auto msg2 = new_msg();
  m_session->send_msg(msg1);
  m_session->send_msg(msg2);

  const auto envelope1 = m_session->next_wait_send_msg();
  ASSERT_TRUE(envelope1);
  m_session->failure_sent_msg(envelope1);

  EXPECT_EQ(m_session->next_wait_send_msg()->msg(), msg2);
  EXPECT_EQ(m_session->next_wait_send_msg(), envelope1); // The very same envelope: same deadline, same handler.
  EXPECT_FALSE(m_session->next_wait_send_msg());
}

TEST_F(Session_test, Cancel_in_queue)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  const auto other = new_msg();
  m_session->send_msg(msg, handler);
  m_session->send_msg(other, handler);

  EXPECT_TRUE(m_session->cancel_msg(msg));
  const auto envelope = m_session->next_wait_send_msg();
  ASSERT_TRUE(envelope);
  EXPECT_EQ(envelope->msg(), other);
  EXPECT_FALSE(m_session->next_wait_send_msg());
  EXPECT_EQ(handler->call_count(), 0u);
}

TEST_F(Session_test, Cancel_awaiting_response)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  send_and_transmit(msg, handler);
  ASSERT_EQ(m_session->wait_response_msg_count(), 1u);

  EXPECT_TRUE(m_session->cancel_msg(msg));
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);

  // The response now goes to the default handler.
  m_session->dispatch_msg(std::make_shared<Msg>(msg->id(), "rsp"));
  EXPECT_EQ(handler->call_count(), 0u);
  EXPECT_EQ(m_default_handler->received().size(), 1u);
}

TEST_F(Session_test, Cancel_after_dispatch_is_noop)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  const auto other = new_msg();
  send_and_transmit(msg, handler);
  send_and_transmit(other, handler);
  m_session->dispatch_msg(std::make_shared<Msg>(msg->id(), "rsp"));

  EXPECT_FALSE(m_session->cancel_msg(msg));
  EXPECT_FALSE(m_session->cancel_msg(Msg_ptr()));
  EXPECT_FALSE(m_session->cancel_msg(new_msg()));
  EXPECT_EQ(m_session->wait_response_msg_count(), 1u);
  EXPECT_EQ(handler->received().size(), 1u);
}

TEST_F(Session_test, Clear_wait_responses_before)
{
  const auto handler = std::make_shared<Recording_handler>();
  for (const msg_id_t id : { 3, 5, 9 })
  {
    send_and_transmit(std::make_shared<Msg>(id, "req"), handler);
  }
  ASSERT_EQ(m_session->wait_response_msg_count(), 3u);

  EXPECT_EQ(m_session->clear_wait_responses_before(5), 1u);
  EXPECT_EQ(m_session->wait_response_msg_count(), 2u);

  // 3 is gone: its response is unsolicited now.  5 and 9 are intact.
  m_session->dispatch_msg(std::make_shared<Msg>(3, "rsp"));
  m_session->dispatch_msg(std::make_shared<Msg>(5, "rsp"));
  m_session->dispatch_msg(std::make_shared<Msg>(9, "rsp"));
  EXPECT_EQ(handler->received().size(), 2u);
  EXPECT_EQ(m_default_handler->received().size(), 1u);
  EXPECT_EQ(handler->exceptions().size(), 0u);
}

TEST_F(Session_test, Clear_wait_response_msg)
{
  const auto handler = std::make_shared<Recording_handler>();
  send_and_transmit(new_msg(), handler);
  send_and_transmit(new_msg(), handler);
  EXPECT_EQ(m_session->clear_wait_response_msg(), 2u);
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);
  EXPECT_EQ(m_session->check_response_timeout(util::Fine_time_pt::max()), 0u);
  EXPECT_EQ(handler->call_count(), 0u);
}

TEST_F(Session_test, Response_timeout)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  const auto envelope = send_and_transmit(msg, handler, milliseconds(500));
  ASSERT_TRUE(envelope);

  EXPECT_EQ(m_session->check_response_timeout(), 0u); // Not yet.
  EXPECT_EQ(m_session->check_response_timeout(envelope->deadline()), 1u);
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);

  const auto exceptions = handler->exceptions();
  ASSERT_EQ(exceptions.size(), 1u);
  EXPECT_EQ(exceptions[0].first, msg);
  EXPECT_EQ(exceptions[0].second, error::Code::S_RESPONSE_TIMEOUT);

  // The late response is unsolicited.
  m_session->dispatch_msg(std::make_shared<Msg>(msg->id(), "late"));
  EXPECT_EQ(handler->call_count(), 1u);
  EXPECT_EQ(m_default_handler->received().size(), 1u);
}

TEST_F(Session_test, Duplicate_correlation_tag)
{
  const auto handler1 = std::make_shared<Recording_handler>();
  const auto handler2 = std::make_shared<Recording_handler>();
  const auto msg1 = std::make_shared<Msg>(5, "one");
  const auto msg2 = std::make_shared<Msg>(5, "two");

  const auto envelope1 = send_and_transmit(msg1, handler1);
  send_and_transmit(msg2, handler2);
  EXPECT_EQ(m_session->wait_response_msg_count(), 1u);

  const auto exceptions = handler2->exceptions();
  ASSERT_EQ(exceptions.size(), 1u);
  EXPECT_EQ(exceptions[0].first, msg2);
  EXPECT_EQ(exceptions[0].second, error::Code::S_DUPLICATE_CORRELATION_TAG);

  // Re-reporting the one in the table is harmless.
  m_session->success_sent_msg(envelope1);
  EXPECT_EQ(m_session->wait_response_msg_count(), 1u);
  EXPECT_EQ(handler1->call_count(), 0u);

  m_session->dispatch_msg(std::make_shared<Msg>(5, "rsp"));
  EXPECT_EQ(handler1->received().size(), 1u);
  EXPECT_EQ(handler2->received().size(), 0u);
}

TEST_F(Session_test, Dispatch_exception_from_transport)
{
  const auto handler = std::make_shared<Recording_handler>(true, false);
  const auto msg = new_msg();
  m_session->send_msg(msg, handler);
  const auto envelope = m_session->next_wait_send_msg();
  ASSERT_TRUE(envelope);

  const Error_code transport_err(boost::asio::error::broken_pipe);
  EXPECT_TRUE(m_session->dispatch_exception(*envelope, transport_err));
  ASSERT_EQ(handler->exceptions().size(), 1u);
  EXPECT_EQ(handler->exceptions()[0].second, transport_err);
  ASSERT_EQ(m_default_handler->exceptions().size(), 1u);

  // Already settled: nobody hears of it again.
  EXPECT_FALSE(m_session->dispatch_exception(*envelope, transport_err));
  EXPECT_EQ(handler->exceptions().size(), 1u);
  EXPECT_EQ(m_default_handler->exceptions().size(), 1u);

  // Nor does a late report from the transport resurrect it.
  m_session->success_sent_msg(envelope);
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);
  m_session->failure_sent_msg(envelope);
  EXPECT_EQ(m_session->wait_send_msg_count(), 0u);
}

TEST_F(Session_test, Transport_error_after_sent_then_sweep)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  const auto envelope = send_and_transmit(msg, handler, milliseconds(500));
  ASSERT_TRUE(envelope);
  EXPECT_EQ(m_session->wait_response_msg_count(), 1u);

  const Error_code transport_err(boost::asio::error::broken_pipe);
  EXPECT_TRUE(m_session->dispatch_exception(*envelope, transport_err));
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);

  EXPECT_EQ(m_session->check_response_timeout(envelope->deadline()), 0u);

  const auto exceptions = handler->exceptions();
  ASSERT_EQ(exceptions.size(), 1u);
  EXPECT_EQ(exceptions[0].first, msg);
  EXPECT_EQ(exceptions[0].second, transport_err);

  // The response, if it arrives anyway, is unsolicited.
  m_session->dispatch_msg(std::make_shared<Msg>(msg->id(), "late"));
  EXPECT_EQ(handler->call_count(), 1u);
  EXPECT_EQ(m_default_handler->received().size(), 1u);
}

TEST_F(Session_test, Transport_error_after_response_is_dropped)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  const auto envelope = send_and_transmit(msg, handler);
  ASSERT_TRUE(envelope);

  EXPECT_TRUE(m_session->dispatch_msg(std::make_shared<Msg>(msg->id(), "rsp")));
  EXPECT_FALSE(m_session->dispatch_exception(*envelope, Error_code(boost::asio::error::connection_reset)));

  EXPECT_EQ(handler->received().size(), 1u);
  EXPECT_EQ(handler->exceptions().size(), 0u);
  EXPECT_EQ(m_default_handler->call_count(), 0u);
}

TEST_F(Session_test, Transport_error_while_requeued)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  m_session->send_msg(msg, handler);
  const auto envelope = m_session->next_wait_send_msg();
  ASSERT_TRUE(envelope);
  m_session->failure_sent_msg(envelope);
  EXPECT_EQ(m_session->wait_send_msg_count(), 1u);

  EXPECT_TRUE(m_session->dispatch_exception(*envelope, Error_code(boost::asio::error::broken_pipe)));
  EXPECT_EQ(m_session->wait_send_msg_count(), 0u);
  EXPECT_FALSE(m_session->next_wait_send_msg());
  EXPECT_EQ(handler->exceptions().size(), 1u);
}

TEST_F(Session_test, Sweep_leaves_outbound_queue_alone)
{
  const auto handler = std::make_shared<Recording_handler>();
  const auto msg = new_msg();
  m_session->send_msg(msg, handler, milliseconds(500));
  const auto far_future = util::Fine_clock::now() + seconds(3600);

  // Queued envelopes are only timed out when dequeued.
  EXPECT_EQ(m_session->check_response_timeout(far_future), 0u);
  EXPECT_EQ(m_session->wait_send_msg_count(), 1u);
  EXPECT_EQ(handler->call_count(), 0u);

  EXPECT_FALSE(m_session->next_wait_send_msg(far_future));
  const auto exceptions = handler->exceptions();
  ASSERT_EQ(exceptions.size(), 1u);
  EXPECT_EQ(exceptions[0].second, error::Code::S_SEND_TIMEOUT);
}

TEST_F(Session_test, Default_handler)
{
  EXPECT_EQ(m_session->default_response(), m_default_handler);

  m_session->set_default_response(Handler_ptr());
  EXPECT_EQ(m_session->default_response(), m_default_handler);

  m_session->remove_default_response();
  const auto handler = m_session->default_response();
  ASSERT_TRUE(handler);
  EXPECT_EQ(handler, null_handler());
  EXPECT_FALSE(handler->on_receive(*m_session, new_msg()));
  EXPECT_FALSE(handler->on_exception(*m_session, new_msg(), error::Code::S_SEND_TIMEOUT));

  m_session->remove_default_response();
  EXPECT_EQ(m_session->default_response(), null_handler());
}

TEST_F(Session_test, Handler_may_reenter_session)
{
  const auto msg = new_msg();
  Msg_ptr follow_up;
  const auto handler = std::make_shared<Function_handler>([&](Session& session, const Msg_ptr& rsp) -> bool
  {
    follow_up = std::make_shared<Msg>("follow-up");
    EXPECT_TRUE(session.send_msg(follow_up));
    EXPECT_TRUE(session.reply_msg(std::make_shared<Msg>("ack"), rsp));
    EXPECT_EQ(session.wait_response_msg_count(), 0u);
    return true;
  });
  send_and_transmit(msg, handler);

  EXPECT_TRUE(m_session->dispatch_msg(std::make_shared<Msg>(msg->id(), "rsp")));
  EXPECT_EQ(m_session->wait_send_msg_count(), 2u);
  ASSERT_TRUE(follow_up);
  EXPECT_EQ(m_session->next_wait_send_msg()->msg(), follow_up);
}

TEST_F(Session_test, Concurrent_sweep_and_dispatch_exactly_once)
{
  constexpr size_t N_ROUNDS = 300;

  for (size_t round = 0; round != N_ROUNDS; ++round)
  {
    const auto handler = std::make_shared<Recording_handler>();
    const auto msg = new_msg();
    const auto envelope = send_and_transmit(msg, handler, milliseconds(500));
    ASSERT_TRUE(envelope);
    const auto rsp = std::make_shared<Msg>(msg->id(), "rsp");

    std::atomic<bool> go(false);
    std::thread sweeper([&]()
    {
      while (!go) {}
      m_session->check_response_timeout(envelope->deadline());
    });
    std::thread dispatcher([&]()
    {
      while (!go) {}
      m_session->dispatch_msg(rsp);
    });
    go = true;
    sweeper.join();
    dispatcher.join();

    ASSERT_EQ(handler->call_count(), 1u) << "Round [" << round << "].";
    ASSERT_EQ(m_session->wait_response_msg_count(), 0u);
  }

  // With no response at all the sweep alone fires; never neither.
  const auto handler = std::make_shared<Recording_handler>();
  const auto envelope = send_and_transmit(new_msg(), handler, milliseconds(500));
  ASSERT_TRUE(envelope);
  m_session->check_response_timeout(envelope->deadline());
  EXPECT_EQ(handler->exceptions().size(), 1u);
}

TEST_F(Session_test, Close)
{
  const auto handler = std::make_shared<Recording_handler>();
  send_and_transmit(new_msg(), handler);
  m_session->send_msg(new_msg(), handler);

  EXPECT_TRUE(m_session->close());
  EXPECT_FALSE(m_session->close());
  EXPECT_EQ(m_session->wait_send_msg_count(), 0u);
  EXPECT_EQ(m_session->wait_response_msg_count(), 0u);
  EXPECT_EQ(handler->call_count(), 0u);
  EXPECT_FALSE(m_factory.session("local", "remote"));
}

} // namespace msgcorr::session::test
