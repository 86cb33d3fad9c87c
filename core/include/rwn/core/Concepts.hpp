/**
 * @file Concepts.hpp
 * @brief Concepts constraining the generic helpers of the engine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_CONCEPTS_HPP
    #define RWN_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <type_traits>

namespace rwn::core {

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe to memcpy into an input payload or a state snapshot.
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

} // namespace rwn::core

#endif // RWN_CORE_CONCEPTS_HPP
