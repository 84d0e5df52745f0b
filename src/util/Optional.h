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

#ifndef __InteropOptional__
#define __InteropOptional__

namespace Interop {

// Optional handler selectors, absent Promise.all results and lookups
// that may miss all go through this type.
template <typename T>
class Optional {
public:
    Optional()
        : m_hasValue(false)
        , m_value()
    {
    }

    Optional(const T& value)
        : m_hasValue(true)
        , m_value(value)
    {
    }

    Optional(std::nullptr_t)
        : m_hasValue(false)
        , m_value()
    {
    }

    T& value()
    {
        ASSERT(m_hasValue);
        return m_value;
    }

    const T& value() const
    {
        ASSERT(m_hasValue);
        return m_value;
    }

    T valueOr(const T& fallback) const
    {
        return m_hasValue ? m_value : fallback;
    }

    bool hasValue() const
    {
        return m_hasValue;
    }

    operator bool() const
    {
        return hasValue();
    }

    void reset()
    {
        m_value = T();
        m_hasValue = false;
    }

    bool operator==(const Optional<T>& other) const
    {
        if (m_hasValue != other.hasValue()) {
            return false;
        }
        return m_hasValue ? m_value == other.m_value : true;
    }

    bool operator!=(const Optional<T>& other) const
    {
        return !this->operator==(other);
    }

protected:
    bool m_hasValue;
    T m_value;
};

// table lookups hand out gc pointers; absence is a null pointer
template <typename T>
class Optional<T*> {
public:
    Optional()
        : m_value(nullptr)
    {
    }

    Optional(T* value)
        : m_value(value)
    {
    }

    Optional(std::nullptr_t)
        : m_value(nullptr)
    {
    }

    T* value() const
    {
        ASSERT(hasValue());
        return m_value;
    }

    bool hasValue() const
    {
        return !!m_value;
    }

    operator bool() const
    {
        return hasValue();
    }

    T* operator->() const
    {
        ASSERT(hasValue());
        return m_value;
    }

    bool operator==(const Optional<T*>& other) const
    {
        return m_value == other.m_value;
    }

    bool operator!=(const Optional<T*>& other) const
    {
        return !this->operator==(other);
    }

protected:
    T* m_value;
};

} // namespace Interop

#endif
