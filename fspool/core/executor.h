//
// Created by Yao ACHI on 02/02/2026.
//

#ifndef FSPOOL_CORE_EXECUTOR_H
#define FSPOOL_CORE_EXECUTOR_H

#include <functional>

#include "fspool/core/errors.h"

namespace fspool
{
/**
 * @brief Capability to run blocking closures off the scheduler thread.
 *
 * This is the only shared resource of the library. FsPool holds it through a
 * shared_ptr, so any implementation can back it: the built-in BlockingPool, an
 * application-wide pool, or a test double that runs jobs on demand.
 */
class Executor
{
public:
    using Job = std::move_only_function<void() noexcept>;

    virtual ~Executor() = default;

    /**
     * Queues a job. On refusal the job is destroyed without running and
     * kDispatchRefused is returned. An executor that refused once keeps refusing.
     */
    virtual Result<void> Submit(Job job) = 0;
};
}  // namespace fspool

#endif  // FSPOOL_CORE_EXECUTOR_H
