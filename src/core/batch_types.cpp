/**
 * @file batch_types.cpp
 * @brief Rendering helpers for batch events
 */

#include "kcenon/batch_transfer/core/batch_types.h"

#include "kcenon/batch_transfer/core/countdown_waiter.h"

namespace kcenon::batch_transfer {

auto countdown_tick::to_display_string() const -> std::string {
    if (is_clear()) {
        return {};
    }
    std::string text = label + "  " + format_countdown(remaining_seconds);
    if (next_file_index) {
        text += "  [" + std::to_string(*next_file_index) + "]";
    }
    return text;
}

}  // namespace kcenon::batch_transfer
