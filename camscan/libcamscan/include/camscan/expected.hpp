/**
 * Copyright (c) 2019-2025 Hailo Technologies Ltd. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file expected.hpp
 * @brief Expected<T> is either a T or the ::camscan_status preventing T to be created.
 *
 * Example - construct a new object:
 *
 * class Widget {
 * private:
 *     Widget(int port, camscan_status &status)
 *     {
 *         status = (port > 0) ? CAMSCAN_SUCCESS : CAMSCAN_INVALID_ARGUMENT;
 *     }
 *
 * public:
 *     static Expected<Widget> create(int port)
 *     {
 *         camscan_status status = CAMSCAN_UNINITIALIZED;
 *         Widget object(port, status);
 *         if (CAMSCAN_SUCCESS != status) {
 *             LOGGER__ERROR("Failed creating Widget");
 *             return make_unexpected(status);
 *         }
 *         return object;
 *     }
 * };
 *
 * The constructor is private so that Widget::create is the only way to get a Widget, and the caller
 * has to look at the returned status before using the object.
 **/

#ifndef _CAMSCAN_EXPECTED_HPP_
#define _CAMSCAN_EXPECTED_HPP_

#include "camscan/camscan.h"

#include <assert.h>
#include <utility>
#include <type_traits>

/** camscan namespace */
namespace camscan
{

/*! Unexpected is an object containing ::camscan_status error, used when an unexpected outcome occurred. */
class Unexpected final
{
public:
    explicit Unexpected(camscan_status status) :
        m_status(status)
    {}

    operator camscan_status() { return m_status; }

    camscan_status m_status;
};

inline Unexpected make_unexpected(camscan_status status)
{
    return Unexpected(status);
}

template<typename T>
class Expected;

/**
 * A secret key (passkey idiom) used to call public constructors only from Expected<T>.
 */
class ExpectedKey {
private:
    template<typename> friend class Expected;
    constexpr explicit ExpectedKey() = default;
};

/*! Expected<T> is either a T or the ::camscan_status preventing T to be created.*/
template<typename T>
class Expected final
{
public:
    /**
     * Construct a new Expected<T> from an Unexpected status.
     *
     * NOTE: Asserting that status is not CAMSCAN_SUCCESS if NDEBUG is not defined.
     */
    Expected(Unexpected unexpected) :
        m_status(unexpected.m_status)
    {
        assert(unexpected.m_status != CAMSCAN_SUCCESS);
    }

    explicit Expected(const Expected<T> &other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, other.m_value);
        }
    }

    /**
     * Move constructor. If other had a value, it is left valid but in an unspecified state.
     */
    Expected(Expected<T> &&other) :
        m_status(other.m_status)
    {
        if (other.has_value()) {
            construct(&m_value, std::move(other.m_value));
        }
    }

    Expected(T &&value) :
        m_value(std::move(value)),
        m_status(CAMSCAN_SUCCESS)
    {}

    /**
     * Prevents T from being camscan_status, so a status can't be returned by mistake instead of
     * make_unexpected().
     */
    Expected(camscan_status status) = delete;

    /**
     * Construct a new Expected<T> by forwarding arguments to T constructors.
     *
     * NOTE: std::enable_if_t is used because the variadic constructor can sometimes have a better cv-qualifier
     *       match than the other constructors.
     */
    template <typename... Args, std::enable_if_t<std::is_constructible<T, Args...>::value, int> = 0>
    explicit Expected(Args &&...args) :
        m_value(std::forward<Args>(args)...),
        m_status(CAMSCAN_SUCCESS)
    {}

    template <typename... Args, std::enable_if_t<std::is_constructible<T, ExpectedKey, Args...>::value, int> = 0>
    explicit Expected(Args &&...args) :
        m_value(ExpectedKey(), std::forward<Args>(args)...),
        m_status(CAMSCAN_SUCCESS)
    {}

    Expected<T>& operator=(const Expected<T> &other) = delete;
    Expected<T>& operator=(Expected<T> &&other) noexcept = delete;
    Expected<T>& operator=(const T &other) = delete;
    Expected<T>& operator=(T &&other) noexcept = delete;
    Expected<T>& operator=(camscan_status status) = delete;

    ~Expected()
    {
        if (has_value()) {
            m_status = CAMSCAN_UNINITIALIZED;
            m_value.~T();
        }
    }

    /**
     * Make an existing Expected<T> to Unexpected. Destructs T if has value.
     */
    void make_unexpected(camscan_status status)
    {
        assert(status != CAMSCAN_SUCCESS);
        if (has_value()) {
            m_value.~T();
        }
        m_status = status;
    }

    bool has_value() const
    {
        return (CAMSCAN_SUCCESS == m_status);
    }

    /**
     * Returns the contained value.
     * @note This method must be called with a valid value inside! otherwise it can lead to undefined behavior.
     */
    T& value() &
    {
        assert(has_value());
        return m_value;
    }

    const T& value() const&
    {
        assert(has_value());
        return m_value;
    }

    camscan_status status() const
    {
        return m_status;
    }

    /**
     * Releases ownership of its stored value, by returning its value and making this object Unexpected.
     * @note This method must be called with a valid value inside! otherwise it can lead to undefined behavior.
     */
    T release()
    {
        assert(has_value());
        T tmp = std::move(m_value);
        make_unexpected(CAMSCAN_UNINITIALIZED);
        return tmp;
    }

    T* operator->()
    {
        assert(has_value());
        return &(value());
    }

    const T* operator->() const
    {
        assert(has_value());
        return &(value());
    }

    T& operator*() &
    {
        assert(has_value());
        return value();
    }

    const T& operator*() const&
    {
        assert(has_value());
        return value();
    }

    explicit operator bool() const
    {
        return has_value();
    }

private:
    template<typename... Args>
    static void construct(T *value, Args &&...args)
    {
        new ((void*)value) T(std::forward<Args>(args)...);
    }

    union {
        T m_value;
    };
    camscan_status m_status;
};

} /* namespace camscan */

#endif  // _CAMSCAN_EXPECTED_HPP_
