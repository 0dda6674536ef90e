#pragma once

/** \file build_control.hpp
 *  \brief Cooperative cancellation and deadline for index builds.
 */

#include <chrono>
#include <expected>
#include <stop_token>
#include <string>

#include "vista/error.hpp"

namespace vista::index {

/** \brief Checked by long-running build loops between units of work. */
struct BuildControl {
    std::stop_token stop;                                   /**< cancellation request */
    std::chrono::steady_clock::time_point deadline{
        std::chrono::steady_clock::time_point::max()};      /**< build timeout */

    /** \brief cancelled if stop was requested, build_timeout past the deadline. */
    [[nodiscard]] auto check(const char* component) const -> std::expected<void, core::error> {
        if (stop.stop_requested()) {
            return core::make_unexpected(core::error_code::cancelled, "build cancelled", component);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return core::make_unexpected(core::error_code::build_timeout, "build deadline exceeded",
                                         component);
        }
        return {};
    }
};

} // namespace vista::index
