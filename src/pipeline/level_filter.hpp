/**
 * @file level_filter.hpp
 * @brief Admission check evaluated before any payload work.
 * @author log_courier contributors
 */

#pragma once

#include "core/types.hpp"

namespace log_courier {

struct FilterState {
    bool client_enabled = false;
    Level client_level = Level::Debug;
    bool session_active = true;
    Level session_level = Level::Debug;
};

/**
 * @brief Whether a packet at @p level may enter the pipeline.
 *
 * Control packets bypass the level thresholds and the session's active
 * flag; everything requires an enabled client.
 */
[[nodiscard]] constexpr bool is_admitted(const FilterState& state, Level level) noexcept {
    if (!state.client_enabled) return false;
    if (level == Level::Control) return true;
    return state.session_active &&
           level >= state.session_level &&
           level >= state.client_level;
}

}  // namespace log_courier
