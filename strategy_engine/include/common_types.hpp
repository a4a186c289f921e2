#pragma once

namespace strategy_engine {

    enum class CrossType {
        None,
        CrossesAbove,
        CrossesBelow
    };

    // Did series A cross series B between the previous and the current bar?
    // Touching counts as the "before" state, matching the classic
    // golden/death cross definitions.
    inline CrossType detectCross(double a_prev, double b_prev, double a_now, double b_now) {
        if (a_prev <= b_prev && a_now > b_now) {
            return CrossType::CrossesAbove;
        }
        if (a_prev >= b_prev && a_now < b_now) {
            return CrossType::CrossesBelow;
        }
        return CrossType::None;
    }

} // namespace strategy_engine
