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

#ifndef __InteropPromiseId__
#define __InteropPromiseId__

#include <openssl/evp.h>

namespace Interop {

// 256-bit opaque promise identifier
class PromiseId {
public:
    static constexpr size_t Size = 32;

    PromiseId()
    {
        memset(m_bytes, 0, Size);
    }

    explicit PromiseId(const uint8_t* bytes)
    {
        memcpy(m_bytes, bytes, Size);
    }

    const uint8_t* data() const
    {
        return m_bytes;
    }

    bool isZero() const;

    bool operator==(const PromiseId& other) const
    {
        return memcmp(m_bytes, other.m_bytes, Size) == 0;
    }

    bool operator!=(const PromiseId& other) const
    {
        return !operator==(other);
    }

    bool operator<(const PromiseId& other) const
    {
        return memcmp(m_bytes, other.m_bytes, Size) < 0;
    }

    // "0x" followed by 64 hex digits
    std::string toHexString() const;
    // first 4 bytes, for log lines
    std::string toShortString() const;

    static Optional<PromiseId> fromHexString(const std::string& hex);

private:
    uint8_t m_bytes[Size];
};

struct PromiseIdHash {
    size_t operator()(const PromiseId& id) const
    {
        // the id is already a digest; any 8 bytes are uniformly distributed
        size_t result;
        memcpy(&result, id.data(), sizeof(size_t));
        return result;
    }
};

typedef std::vector<PromiseId> PromiseIdVector;

template <typename T>
using PromiseIdMap = HashMap<PromiseId, T, PromiseIdHash, std::equal_to<PromiseId>, gc_allocator<std::pair<PromiseId, T>>>;

// Builds deterministic identifiers: SHA-256 over a domain tag followed by the
// big-endian encoding of each input. The tag keeps ids of different kinds
// (created, continuation, remote, ...) apart even for equal inputs.
class IdentifierHasher {
    MAKE_STACK_ALLOCATED();

public:
    explicit IdentifierHasher(const char* domainTag);

    IdentifierHasher& add(const PromiseId& id);
    IdentifierHasher& add(uint64_t value);

    PromiseId finish();

private:
    struct EVPMDContextDestroyer {
        void operator()(EVP_MD_CTX* context) const
        {
            EVP_MD_CTX_free(context);
        }
    };
    typedef std::unique_ptr<EVP_MD_CTX, EVPMDContextDestroyer> ScopedEVPMDContext;

    ScopedEVPMDContext m_context;
    bool m_finished;
};

} // namespace Interop

#endif
