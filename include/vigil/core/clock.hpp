/**
 * @file clock.hpp
 * @brief Injectable time source for the durability core
 *
 * Every component that stamps an event or measures a wait obtains the
 * current time through clock_source, so recovery and timestamp-precision
 * behaviour can be exercised deterministically.
 */

#pragma once

#include <chrono>

namespace vigil::core {

/**
 * @class clock_source
 * @brief Abstract wall-clock provider
 */
class clock_source {
public:
    virtual ~clock_source() = default;

    /**
     * @brief Current wall-clock time
     */
    [[nodiscard]] virtual auto now() const -> std::chrono::system_clock::time_point = 0;
};

/**
 * @class system_clock_source
 * @brief clock_source backed by std::chrono::system_clock
 */
class system_clock_source final : public clock_source {
public:
    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point override {
        return std::chrono::system_clock::now();
    }

    /**
     * @brief Process-wide default instance
     */
    [[nodiscard]] static auto instance() -> const system_clock_source& {
        static const system_clock_source clock;
        return clock;
    }
};

}  // namespace vigil::core
