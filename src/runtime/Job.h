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

#ifndef __InteropJob__
#define __InteropJob__

#include "runtime/PromiseObject.h"

namespace Interop {

class Environment;
class ExecutionState;

class Job : public gc {
public:
    virtual ~Job() {}

    virtual void run(ExecutionState& state) = 0;
    virtual bool isPromiseCallbacksJob() const
    {
        return false;
    }

    Environment* relatedEnvironment() const
    {
        return m_relatedEnvironment;
    }

protected:
    explicit Job(Environment* relatedEnvironment)
        : m_relatedEnvironment(relatedEnvironment)
    {
    }

private:
    Environment* m_relatedEnvironment;
};

// Runs the pending callbacks of one terminal promise
class PromiseCallbacksJob : public Job {
public:
    PromiseCallbacksJob(Environment* relatedEnvironment, PromiseObject* promise)
        : Job(relatedEnvironment)
        , m_promise(promise)
    {
    }

    virtual void run(ExecutionState& state);
    virtual bool isPromiseCallbacksJob() const
    {
        return true;
    }

    PromiseObject* promise() const
    {
        return m_promise;
    }

private:
    PromiseObject* m_promise;
};

} // namespace Interop
#endif // __InteropJob__
