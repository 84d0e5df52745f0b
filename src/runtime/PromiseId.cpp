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
#include "PromiseId.h"

namespace Interop {

constexpr size_t PromiseId::Size;

static const char* g_hexDigits = "0123456789abcdef";

static int hexValue(char ch)
{
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

bool PromiseId::isZero() const
{
    for (size_t i = 0; i < Size; i++) {
        if (m_bytes[i]) {
            return false;
        }
    }
    return true;
}

std::string PromiseId::toHexString() const
{
    std::string result("0x");
    result.reserve(2 + Size * 2);
    for (size_t i = 0; i < Size; i++) {
        result += g_hexDigits[m_bytes[i] >> 4];
        result += g_hexDigits[m_bytes[i] & 0xf];
    }
    return result;
}

std::string PromiseId::toShortString() const
{
    std::string result("0x");
    for (size_t i = 0; i < 4; i++) {
        result += g_hexDigits[m_bytes[i] >> 4];
        result += g_hexDigits[m_bytes[i] & 0xf];
    }
    return result;
}

Optional<PromiseId> PromiseId::fromHexString(const std::string& hex)
{
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if (hex.size() - start != Size * 2) {
        return nullptr;
    }

    uint8_t bytes[Size];
    for (size_t i = 0; i < Size; i++) {
        int high = hexValue(hex[start + i * 2]);
        int low = hexValue(hex[start + i * 2 + 1]);
        if (high < 0 || low < 0) {
            return nullptr;
        }
        bytes[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return PromiseId(bytes);
}

IdentifierHasher::IdentifierHasher(const char* domainTag)
    : m_context(EVP_MD_CTX_new())
    , m_finished(false)
{
    RELEASE_ASSERT(!!m_context);
    RELEASE_ASSERT(EVP_DigestInit_ex(m_context.get(), EVP_sha256(), nullptr) == 1);
    RELEASE_ASSERT(EVP_DigestUpdate(m_context.get(), domainTag, strlen(domainTag)) == 1);
}

IdentifierHasher& IdentifierHasher::add(const PromiseId& id)
{
    ASSERT(!m_finished);
    RELEASE_ASSERT(EVP_DigestUpdate(m_context.get(), id.data(), PromiseId::Size) == 1);
    return *this;
}

IdentifierHasher& IdentifierHasher::add(uint64_t value)
{
    ASSERT(!m_finished);
    uint8_t buffer[8];
    for (size_t i = 0; i < 8; i++) {
        buffer[i] = static_cast<uint8_t>(value >> (56 - i * 8));
    }
    RELEASE_ASSERT(EVP_DigestUpdate(m_context.get(), buffer, sizeof(buffer)) == 1);
    return *this;
}

PromiseId IdentifierHasher::finish()
{
    ASSERT(!m_finished);
    uint8_t digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    RELEASE_ASSERT(EVP_DigestFinal_ex(m_context.get(), digest, &length) == 1);
    RELEASE_ASSERT(length == PromiseId::Size);
    m_finished = true;
    return PromiseId(digest);
}
} // namespace Interop
