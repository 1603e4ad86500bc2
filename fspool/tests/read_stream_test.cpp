//
// Created by Yao ACHI on 03/02/2026.
//

#include "fspool/fs/read_stream.h"

#include <cerrno>
#include <fcntl.h>
#include <limits>
#include <memory>
#include <string>
#include <tuple>

#include <gtest/gtest.h>

#include "fspool/core/blocking_pool.h"
#include "fspool/fs/blocking.h"
#include "fspool/sync/block_on.h"
#include "test_helpers.h"

using namespace fspool;
using fspool::testing::CountingWaker;
using fspool::testing::ManualExecutor;

class ReadStreamTest : public fspool::testing::TempDirTest
{
protected:
    std::shared_ptr<Executor> pool_;

    void SetUp() override
    {
        TempDirTest::SetUp();
        pool_ = std::make_shared<BlockingPool>(PoolConfig{.threads = 2});
    }

    static Result<std::optional<Chunk>> Next(ReadStream& stream)
    {
        return sync::BlockOn([&](const Waker& waker) { return stream.PollNext(waker); });
    }
};

TEST_F(ReadStreamTest, EmptyFileEndsWithoutError)
{
    const auto path = PathFor("empty");
    WriteContents(path, "");

    ReadStream stream(pool_, path, ReadOptions{});
    auto first = Next(stream);
    ASSERT_TRUE(first.has_value()) << first.error().message();
    EXPECT_FALSE(first->has_value());
    EXPECT_TRUE(stream.IsTerminated());
    EXPECT_EQ(stream.BytesRead(), 0u);
}

TEST_F(ReadStreamTest, ChunksNeverExceedChunkSize)
{
    const auto path = PathFor("data");
    const auto payload = MakePayload(10'000);
    WriteContents(path, payload);

    ReadStream stream(pool_, path, ReadOptions{.chunk_size = 4096});
    std::string collected;
    while (true)
    {
        auto next = Next(stream);
        ASSERT_TRUE(next.has_value()) << next.error().message();
        if (!*next)
        {
            break;
        }
        ASSERT_FALSE((*next)->empty());
        ASSERT_LE((*next)->size(), 4096u);
        collected.append((*next)->begin(), (*next)->end());
    }
    EXPECT_EQ(collected, payload);
    EXPECT_EQ(stream.BytesRead(), payload.size());
}

TEST_F(ReadStreamTest, PollAfterEndKeepsReportingEnd)
{
    const auto path = PathFor("short");
    WriteContents(path, "abc");

    ReadStream stream(pool_, path, ReadOptions{});
    ASSERT_TRUE(CollectAll(stream).has_value());

    for (int i = 0; i < 3; ++i)
    {
        auto next = Next(stream);
        ASSERT_TRUE(next.has_value());
        EXPECT_FALSE(next->has_value());
    }
}

TEST_F(ReadStreamTest, MissingFileFailsOnceThenEnds)
{
    ReadStream stream(pool_, PathFor("does-not-exist"), ReadOptions{});

    auto first = Next(stream);
    ASSERT_FALSE(first.has_value());
    EXPECT_TRUE(first.error().IsIo());
    EXPECT_EQ(first.error().value, ENOENT);
    EXPECT_EQ(first.error().category, ErrorCategory::File);

    auto second = Next(stream);
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second->has_value());
}

TEST_F(ReadStreamTest, ReadsFromAlreadyOpenFile)
{
    const auto path = PathFor("opened");
    WriteContents(path, "from a descriptor");

    auto file = File::Open(path, O_RDONLY);
    ASSERT_TRUE(file.has_value()) << file.error().message();

    ReadStream stream(pool_, std::move(*file), ReadOptions{.chunk_size = 4});
    auto all = CollectAll(stream);
    ASSERT_TRUE(all.has_value()) << all.error().message();
    EXPECT_EQ(std::string(all->begin(), all->end()), "from a descriptor");
}

TEST_F(ReadStreamTest, AdoptsDescriptorCheckedByFromFd)
{
    const auto path = PathFor("adopted");
    WriteContents(path, "adopted descriptor");

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    ASSERT_GE(fd, 0);
    auto file = File::FromFd(fd);
    ASSERT_TRUE(file.has_value()) << file.error().message();

    ReadStream stream(pool_, std::move(*file), ReadOptions{});
    auto all = CollectAll(stream);
    ASSERT_TRUE(all.has_value()) << all.error().message();
    EXPECT_EQ(std::string(all->begin(), all->end()), "adopted descriptor");
}

TEST_F(ReadStreamTest, FromFdRejectsClosedDescriptor)
{
    auto file = File::FromFd(-1);
    ASSERT_FALSE(file.has_value());
    EXPECT_EQ(file.error().value, EBADF);
}

TEST_F(ReadStreamTest, ZeroChunkSizeIsRejected)
{
    EXPECT_THROW(ReadStream(pool_, PathFor("x"), ReadOptions{.chunk_size = 0}), std::invalid_argument);
}

TEST_F(ReadStreamTest, UnallocatableChunkSizeIsRejected)
{
    const ReadOptions huge{.chunk_size = std::numeric_limits<size_t>::max()};
    EXPECT_THROW(ReadStream(pool_, PathFor("x"), huge), std::invalid_argument);
}

TEST_F(ReadStreamTest, AtMostOneReadInFlight)
{
    const auto path = PathFor("data");
    WriteContents(path, "0123456789");

    auto exec = std::make_shared<ManualExecutor>();
    ReadStream stream(exec, path, ReadOptions{.chunk_size = 4});
    CountingWaker w;

    EXPECT_TRUE(stream.PollNext(w.waker()).IsPending());
    EXPECT_EQ(exec->Queued(), 1u);

    // polling again while the job is outstanding must not queue another
    EXPECT_TRUE(stream.PollNext(w.waker()).IsPending());
    EXPECT_EQ(exec->Submitted(), 1u);

    ASSERT_TRUE(exec->RunOne());
    EXPECT_EQ(w.count(), 1);

    auto first = stream.PollNext(w.waker());
    ASSERT_TRUE(first.IsReady());
    ASSERT_TRUE(first.Value().has_value());
    EXPECT_EQ(std::string((*first.Value())->begin(), (*first.Value())->end()), "0123");

    // nothing is read ahead until the consumer asks
    EXPECT_EQ(exec->Queued(), 0u);
    EXPECT_EQ(exec->Submitted(), 1u);

    EXPECT_TRUE(stream.PollNext(w.waker()).IsPending());
    EXPECT_EQ(exec->Submitted(), 2u);
}

TEST_F(ReadStreamTest, OneJobPerChunk)
{
    const auto path = PathFor("data");
    WriteContents(path, "0123456789");

    auto exec = std::make_shared<ManualExecutor>();
    ReadStream stream(exec, path, ReadOptions{.chunk_size = 4});
    CountingWaker w;

    std::string collected;
    bool done = false;
    while (!done)
    {
        auto polled = stream.PollNext(w.waker());
        if (polled.IsPending())
        {
            ASSERT_EQ(exec->Queued(), 1u);
            exec->RunOne();
            continue;
        }
        ASSERT_TRUE(polled.Value().has_value());
        if (!*polled.Value())
        {
            done = true;
            continue;
        }
        collected.append((*polled.Value())->begin(), (*polled.Value())->end());
    }

    EXPECT_EQ(collected, "0123456789");
    // 4 + 4 + 2 bytes, then the read that hit end of file
    EXPECT_EQ(exec->Submitted(), 4u);
}

TEST_F(ReadStreamTest, DroppingStreamWithReadInFlightIsSafe)
{
    const auto path = PathFor("data");
    WriteContents(path, MakePayload(100));

    auto exec = std::make_shared<ManualExecutor>();
    {
        ReadStream stream(exec, path, ReadOptions{});
        CountingWaker w;
        EXPECT_TRUE(stream.PollNext(w.waker()).IsPending());
    }
    // the orphaned job still runs and its result is discarded
    EXPECT_EQ(exec->RunAll(), 1u);
}

TEST_F(ReadStreamTest, DroppingIdleStreamClosesFileOnExecutor)
{
    const auto path = PathFor("data");
    WriteContents(path, MakePayload(100));

    auto exec = std::make_shared<ManualExecutor>();
    {
        ReadStream stream(exec, path, ReadOptions{.chunk_size = 10});
        CountingWaker w;
        EXPECT_TRUE(stream.PollNext(w.waker()).IsPending());
        exec->RunOne();
        ASSERT_TRUE(stream.PollNext(w.waker()).IsReady());
    }
    // the open file went to the executor to be closed
    EXPECT_EQ(exec->Queued(), 1u);
    EXPECT_EQ(exec->RunAll(), 1u);
}

TEST_F(ReadStreamTest, RefusedDispatchIsReportedThenEnds)
{
    const auto path = PathFor("data");
    WriteContents(path, "abc");

    auto exec = std::make_shared<ManualExecutor>();
    exec->Shutdown();

    ReadStream stream(exec, path, ReadOptions{});
    CountingWaker w;
    auto first = stream.PollNext(w.waker());
    ASSERT_TRUE(first.IsReady());
    ASSERT_FALSE(first.Value().has_value());
    EXPECT_TRUE(first.Value().error().IsDispatchRefused());

    auto second = stream.PollNext(w.waker());
    ASSERT_TRUE(second.IsReady());
    ASSERT_TRUE(second.Value().has_value());
    EXPECT_FALSE(second.Value()->has_value());
}

class ReadStreamOrderTest : public fspool::testing::TempDirTest,
                            public ::testing::WithParamInterface<std::tuple<size_t, size_t>>
{
};

TEST_P(ReadStreamOrderTest, ConcatenationEqualsFileContents)
{
    const auto [file_size, chunk_size] = GetParam();
    const auto path = PathFor("data");
    const auto payload = MakePayload(file_size);
    WriteContents(path, payload);

    auto pool = std::make_shared<BlockingPool>(PoolConfig{.threads = 3});
    ReadStream stream(pool, path, ReadOptions{.chunk_size = chunk_size});
    auto all = CollectAll(stream);
    ASSERT_TRUE(all.has_value()) << all.error().message();
    EXPECT_EQ(std::string(all->begin(), all->end()), payload);
    EXPECT_TRUE(stream.IsTerminated());
}

INSTANTIATE_TEST_SUITE_P(Sizes, ReadStreamOrderTest,
                         ::testing::Values(std::make_tuple(0, 1), std::make_tuple(1, 1), std::make_tuple(7, 3),
                                           std::make_tuple(1000, 1), std::make_tuple(8192, 8192),
                                           std::make_tuple(8193, 8192), std::make_tuple(300'000, 8192),
                                           std::make_tuple(300'000, 65536)));
