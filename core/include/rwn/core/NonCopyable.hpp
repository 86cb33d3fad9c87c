/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_NON_COPYABLE_HPP
    #define RWN_CORE_NON_COPYABLE_HPP

namespace rwn::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 *
 * Sessions, queues and transports own rollback history or OS handles;
 * copying one would fork that history silently.
 *
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable
{
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace rwn::core

#endif // RWN_CORE_NON_COPYABLE_HPP
