//
// Created by Yao ACHI on 08/02/2026.
//

#include <benchmark/benchmark.h>
#include <cstdio>
#include <fstream>
#include <string>

#include "fspool/core/async_logger.h"
#include "fspool/fs/blocking.h"
#include "fspool/fs/forward.h"
#include "fspool/fs/fs_pool.h"
#include "fspool/sync/block_on.h"

using namespace fspool;

// --- Test Fixture ---
// Writes an 8MB file once per run for the benchmarks to read.
class ReadStreamFixture : public benchmark::Fixture
{
public:
    const char* source_file = "fspool_read_benchmark.bin";
    const char* copy_file = "fspool_copy_benchmark.bin";
    static constexpr size_t kFileSize = 8 * 1024 * 1024;

    void SetUp(const ::benchmark::State&) override
    {
        alog::Configure(1024, LogLevel::kWarn);

        std::ofstream out(source_file, std::ios::binary | std::ios::trunc);
        const std::string block(64 * 1024, 'k');
        for (size_t written = 0; written < kFileSize; written += block.size())
        {
            out << block;
        }
    }

    void TearDown(const ::benchmark::State&) override
    {
        std::remove(source_file);
        std::remove(copy_file);
    }
};

// Drains the stream on the calling thread, one chunk in flight at a time.
BENCHMARK_DEFINE_F(ReadStreamFixture, ReadWholeFile)(benchmark::State& state)
{
    const FsPool fs(2);
    const auto chunk_size = static_cast<size_t>(state.range(0));

    for (auto _: state)
    {
        auto stream = fs.Read(source_file, ReadOptions{.chunk_size = chunk_size});
        uint64_t total = 0;
        while (true)
        {
            auto next = sync::BlockOn([&](const Waker& waker) { return stream.PollNext(waker); });
            if (!next || !*next)
            {
                break;
            }
            total += (*next)->size();
        }
        benchmark::DoNotOptimize(total);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * kFileSize));
}

BENCHMARK_REGISTER_F(ReadStreamFixture, ReadWholeFile)->RangeMultiplier(4)->Range(4 * 1024, 1024 * 1024)->UseRealTime();

// Read and write overlap: the next read runs while the previous chunk is written.
BENCHMARK_DEFINE_F(ReadStreamFixture, ForwardCopy)(benchmark::State& state)
{
    const FsPool fs(2);
    const auto chunk_size = static_cast<size_t>(state.range(0));

    for (auto _: state)
    {
        Forward copy(fs.Read(source_file, ReadOptions{.chunk_size = chunk_size}), fs.Write(copy_file));
        auto copied = sync::BlockOn([&](const Waker& waker) { return copy.PollResult(waker); });
        if (!copied)
        {
            state.SkipWithError("copy failed");
            break;
        }
        benchmark::DoNotOptimize(*copied);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * kFileSize));
}

BENCHMARK_REGISTER_F(ReadStreamFixture, ForwardCopy)->RangeMultiplier(4)->Range(16 * 1024, 1024 * 1024)->UseRealTime();

BENCHMARK_MAIN();
