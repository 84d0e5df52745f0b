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

#include "Interop.h"
#include "SandBox.h"
#include "runtime/Environment.h"
#include "runtime/ExecutionState.h"

namespace Interop {

SandBox::SandBox(Environment* environment)
    : m_environment(environment)
{
    m_oldSandBox = m_environment->m_currentSandBox;
    m_environment->m_currentSandBox = this;
}

SandBox::~SandBox()
{
    ASSERT(m_environment->m_currentSandBox == this);
    m_environment->m_currentSandBox = m_oldSandBox;
}

void SandBox::processCatch(const Payload& error, SandBoxResult& result)
{
    result.result = CallbackResult();
    result.error = error;
    result.failed = true;
}

SandBox::SandBoxResult SandBox::run(ExecutionState& parentState, Address caller, CallbackContext* callbackContext, Runner runner, void* data)
{
    SandBox::SandBoxResult result;
    try {
        ExecutionState state(&parentState, caller, callbackContext);
        result.result = runner(state, data);
    } catch (const Payload& failure) {
        processCatch(failure, result);
    } catch (const ErrorObject& error) {
        INTEROP_LOG_TRACE("[chain %llu] callback failed with %s\n", (unsigned long long)m_environment->chainId(), ErrorObject::codeName(error.code()));
        processCatch(error.toPayload(), result);
    }
    return result;
}
} // namespace Interop
