//
// Created by Yao ACHI on 19/10/2025.
//

#include "fspool/sync/batch_queue.h"

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace fspool::sync;

TEST(BatchQueueTest, ZeroCapacityIsRejected) { EXPECT_THROW(BatchQueue<int>(0), std::invalid_argument); }

TEST(BatchQueueTest, DrainReturnsItemsInPushOrder)
{
    BatchQueue<std::string> q(8);
    ASSERT_TRUE(q.TryPush("a"));
    ASSERT_TRUE(q.TryPush("b"));
    ASSERT_TRUE(q.TryPush("c"));

    std::vector<std::string> out{"stale"};
    ASSERT_EQ(q.Drain(out), 3u);
    EXPECT_EQ(out, (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_EQ(q.Drain(out), 0u);
    EXPECT_TRUE(out.empty());
}

TEST(BatchQueueTest, FullQueueRefusesUntilDrained)
{
    BatchQueue<int> q(2);
    EXPECT_TRUE(q.TryPush(1));
    EXPECT_TRUE(q.TryPush(2));
    EXPECT_FALSE(q.TryPush(3));

    std::vector<int> out;
    ASSERT_EQ(q.Drain(out), 2u);
    EXPECT_EQ(out, (std::vector<int>{1, 2}));

    EXPECT_TRUE(q.TryPush(3));
    ASSERT_EQ(q.Drain(out), 1u);
    EXPECT_EQ(out.front(), 3);
}

TEST(BatchQueueTest, ConcurrentProducersLoseNothing)
{
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 1000;
    BatchQueue<int> q(kProducers * kPerProducer);

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back(
                [&q, p]
                {
                    for (int i = 0; i < kPerProducer; ++i)
                    {
                        int v = p * kPerProducer + i;
                        ASSERT_TRUE(q.TryPush(std::move(v)));
                    }
                });
    }

    std::vector<int> last_seen(kProducers, -1);
    std::vector<int> out;
    size_t total = 0;
    while (total < static_cast<size_t>(kProducers * kPerProducer))
    {
        total += q.Drain(out);
        for (int v : out)
        {
            // per-producer order survives interleaving
            const int p = v / kPerProducer;
            EXPECT_GT(v, last_seen[p]);
            last_seen[p] = v;
        }
    }

    for (auto& t : producers)
    {
        t.join();
    }
    EXPECT_EQ(total, static_cast<size_t>(kProducers * kPerProducer));
}
