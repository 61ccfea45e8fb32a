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

#include "msgcorr/session/outbound_queue.hpp"
#include "msgcorr/session/envelope.hpp"
#include "msgcorr/session/msg.hpp"
#include "msgcorr/session/handler.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace msgcorr::session::test
{

namespace
{

Envelope_ptr make_envelope(msg_id_t id)
{
  return std::make_shared<const Envelope>(nullptr, std::make_shared<Msg>(id, "x"), Envelope::tag_of(id),
                                          util::Fine_time_pt::max(), Handler_ptr(), false);
}

} // Anonymous namespace.

TEST(Outbound_queue_test, Fifo)
{
  Outbound_queue queue;
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.capacity(), 0u);
  EXPECT_FALSE(queue.pop());

  const auto env1 = make_envelope(1);
  const auto env2 = make_envelope(2);
  const auto env3 = make_envelope(3);
  EXPECT_TRUE(queue.push(env1));
  EXPECT_TRUE(queue.push(env2));
  EXPECT_TRUE(queue.push(env3));
  EXPECT_EQ(queue.size(), 3u);

  EXPECT_EQ(queue.pop(), env1);
  EXPECT_EQ(queue.pop(), env2);
  EXPECT_EQ(queue.pop(), env3);
  EXPECT_FALSE(queue.pop());
  EXPECT_TRUE(queue.empty());
}

TEST(Outbound_queue_test, Capacity)
{
  Outbound_queue queue(2);
  EXPECT_EQ(queue.capacity(), 2u);
  EXPECT_TRUE(queue.push(make_envelope(1)));
  EXPECT_TRUE(queue.push(make_envelope(2)));
  EXPECT_FALSE(queue.push(make_envelope(3)));
  EXPECT_EQ(queue.size(), 2u);

  // Re-enqueue path may exceed it.
  EXPECT_TRUE(queue.push(make_envelope(4), true));
  EXPECT_EQ(queue.size(), 3u);

  queue.pop();
  queue.pop();
  EXPECT_FALSE(queue.push(make_envelope(5)));
  queue.pop();
  EXPECT_TRUE(queue.push(make_envelope(6)));
}

TEST(Outbound_queue_test, Remove_by_msg_identity)
{
  Outbound_queue queue;
  const auto env1 = make_envelope(1);
  const auto env2 = make_envelope(2);
  queue.push(env1);
  queue.push(env2);

  // Same ID, different Msg object: not a match.
  EXPECT_FALSE(queue.remove(std::make_shared<Msg>(1, "x")));
  EXPECT_TRUE(queue.remove(env1->msg()));
  EXPECT_FALSE(queue.remove(env1->msg()));
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_EQ(queue.pop(), env2);
}

TEST(Outbound_queue_test, Remove_by_envelope_identity)
{
  Outbound_queue queue;
  const auto env1 = make_envelope(1);
  const auto env2 = make_envelope(2);
  queue.push(env1);
  queue.push(env2);

  EXPECT_FALSE(queue.remove(*make_envelope(2)));
  EXPECT_EQ(queue.remove(*env2), env2);
  EXPECT_FALSE(queue.remove(*env2));
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_EQ(queue.pop(), env1);
}

TEST(Outbound_queue_test, Clear)
{
  Outbound_queue queue;
  queue.push(make_envelope(1));
  queue.push(make_envelope(2));
  EXPECT_EQ(queue.clear(), 2u);
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.clear(), 0u);
}

TEST(Outbound_queue_test, Concurrent_push_pop)
{
  constexpr size_t N_PER_THREAD = 1000;
  constexpr size_t N_THREADS = 4;

  Outbound_queue queue;
  std::vector<std::thread> pushers;
  for (size_t thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    pushers.emplace_back([&, thread_idx]()
    {
      for (size_t idx = 0; idx != N_PER_THREAD; ++idx)
      {
        queue.push(make_envelope((thread_idx * N_PER_THREAD) + idx + 1));
      }
    });
  }

  size_t n_popped = 0;
  while (n_popped != N_PER_THREAD * N_THREADS)
  {
    if (queue.pop())
    {
      ++n_popped;
    }
  }
  for (auto& pusher : pushers)
  {
    pusher.join();
  }
  EXPECT_TRUE(queue.empty());
}

} // namespace msgcorr::session::test
