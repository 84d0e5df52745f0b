/*
 * Copyright (c) 2017-present Samsung Electronics Co., Ltd
 *
 *  This library is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public
 *  License as published by the Free Software Foundation; either
 *  version 2.1 of the License, or (at your option) any later version.
 *
 *  This library is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 *  Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public
 *  License along with this library; if not, write to the Free Software
 *  Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301
 *  USA
 */

#ifndef __InteropJobQueue__
#define __InteropJobQueue__

#include "runtime/Job.h"

namespace Interop {

// FIFO of ready work. The host drains it one job at a time.
class JobQueue : public gc {
public:
    JobQueue() {}

    void enqueueJob(Job* job);
    // drops the queued PromiseCallbacksJob of promise, if any
    void cancelPromiseCallbacksJob(PromiseObject* promise);

    bool hasNextJob() const
    {
        return !m_jobs.empty();
    }

    size_t size() const
    {
        return m_jobs.size();
    }

    Job* nextJob()
    {
        ASSERT(!m_jobs.empty());
        Job* job = m_jobs.front();
        m_jobs.pop_front();
        return job;
    }

private:
    std::list<Job*, gc_allocator<Job*>> m_jobs;
};
} // namespace Interop

#endif // __InteropJobQueue__
