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
#include "Heap.h"

namespace Interop {

static bool g_isInited = false;

void Heap::initialize()
{
    if (g_isInited)
        return;

    GC_INIT();
    GC_set_force_unmap_on_gcollect(1);
    g_isInited = true;
}

void Heap::finalize()
{
    if (!g_isInited)
        return;

    for (size_t i = 0; i < 5; i++) {
        GC_gcollect_and_unmap();
    }
}

bool Heap::isInitialized()
{
    return g_isInited;
}

void Heap::printGCHeapUsage()
{
    INTEROP_LOG_INFO("[GC] heap size %zu, free %zu, total allocated %zu\n",
                     (size_t)GC_get_heap_size(), (size_t)GC_get_free_bytes(), (size_t)GC_get_total_bytes());
}
} // namespace Interop
