//
// Created by Yao ACHI on 07/02/2026.
//
// File tool running every syscall on the blocking pool.
//
//   fs_copy --mode=copy --src=in.bin --dst=out.bin --chunk_size=65536 --threads=4
//   fs_copy --mode=cat --src=notes.txt
//   fs_copy --mode=rm --src=stale.bin

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <gflags/gflags.h>

#include "fspool/core/async_logger.h"
#include "fspool/fs/blocking.h"
#include "fspool/fs/forward.h"
#include "fspool/fs/fs_pool.h"
#include "fspool/sync/block_on.h"

DEFINE_string(mode, "copy", "copy, cat or rm");
DEFINE_string(src, "", "Source file");
DEFINE_string(dst, "", "Destination file (copy only)");
DEFINE_uint64(chunk_size, fspool::kDefaultChunkSize, "Bytes per read");
DEFINE_uint64(threads, fspool::kDefaultPoolThreads, "Blocking pool threads");
DEFINE_bool(delete_src, false, "Delete the source once copied (copy only)");
DEFINE_bool(sync, false, "fsync() the destination before closing it");
DEFINE_int32(log_level, 3, "0=disabled 1=trace 2=debug 3=info 4=warn 5=error");

namespace
{
fspool::Result<void> DeleteFile(const fspool::FsPool& fs, const std::string& path)
{
    auto deleted = fs.Delete(path);
    return fspool::Wait(deleted);
}

// Streams the file to stdout chunk by chunk.
fspool::Result<uint64_t> CatFile(const fspool::FsPool& fs)
{
    auto stream = fs.Read(FLAGS_src, fspool::ReadOptions{.chunk_size = FLAGS_chunk_size});
    while (true)
    {
        auto next = fspool::sync::BlockOn([&](const fspool::Waker& waker) { return stream.PollNext(waker); });
        if (!next)
        {
            return std::unexpected(next.error());
        }
        if (!*next)
        {
            std::cout.flush();
            return stream.BytesRead();
        }
        std::cout.write((*next)->data(), static_cast<std::streamsize>((*next)->size()));
    }
}

fspool::Result<uint64_t> CopyFile(const fspool::FsPool& fs)
{
    fspool::Forward copy(fs.Read(FLAGS_src, fspool::ReadOptions{.chunk_size = FLAGS_chunk_size}),
                         fs.Write(FLAGS_dst, fspool::WriteOptions().SyncOnClose(FLAGS_sync)));

    const auto copied = fspool::sync::BlockOn([&](const fspool::Waker& waker) { return copy.PollResult(waker); });
    if (!copied)
    {
        return copied;
    }

    if (FLAGS_delete_src)
    {
        if (auto removed = DeleteFile(fs, FLAGS_src); !removed)
        {
            return std::unexpected(removed.error());
        }
    }
    return copied;
}
}  // namespace

int main(int argc, char** argv)
{
    gflags::SetUsageMessage("fs_copy --mode=copy|cat|rm --src=<file> [--dst=<file>]");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (FLAGS_src.empty())
    {
        std::cerr << "--src is required\n";
        return EXIT_FAILURE;
    }
    if (FLAGS_mode == "copy" && FLAGS_dst.empty())
    {
        std::cerr << "--dst is required to copy\n";
        return EXIT_FAILURE;
    }

    // stdout carries file contents in cat mode
    fspool::alog::Configure(4096, static_cast<fspool::LogLevel>(FLAGS_log_level), std::cerr);

    try
    {
        const fspool::FsPool fs(fspool::PoolConfig{.threads = FLAGS_threads});

        if (FLAGS_mode == "rm")
        {
            if (auto removed = DeleteFile(fs, FLAGS_src); !removed)
            {
                ALOG_ERROR("rm {} failed: {}", FLAGS_src, removed.error());
                return EXIT_FAILURE;
            }
        }
        else if (FLAGS_mode == "cat")
        {
            if (auto printed = CatFile(fs); !printed)
            {
                ALOG_ERROR("cat {} failed: {}", FLAGS_src, printed.error());
                return EXIT_FAILURE;
            }
        }
        else if (FLAGS_mode == "copy")
        {
            ALOG_INFO("copying {} -> {} ({} byte chunks)", FLAGS_src, FLAGS_dst, FLAGS_chunk_size);
            const auto result = CopyFile(fs);
            if (!result)
            {
                ALOG_ERROR("copy failed: {}", result.error());
                return EXIT_FAILURE;
            }
            std::cout << fmt::format("copied {} bytes\n", *result);
        }
        else
        {
            std::cerr << "unknown --mode " << FLAGS_mode << '\n';
            return EXIT_FAILURE;
        }
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "invalid option: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
