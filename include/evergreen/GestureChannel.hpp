#pragma once

#include "GestureMapper.hpp"
#include <atomic>
#include <cstdint>
#include <optional>

namespace evergreen {

/**
 * @brief Latest-value hand-off from the detection thread to the render tick
 *
 * One writer publishes, one reader takes. There is no queue: a publish
 * overwrites whatever the reader has not yet taken, and a take returns the
 * newest sample exactly once. Both floats travel in a single 64-bit atomic
 * word so the reader never sees a torn pair.
 */
class GestureChannel {
public:
    GestureChannel() = default;
    GestureChannel(const GestureChannel&) = delete;
    GestureChannel& operator=(const GestureChannel&) = delete;

    /**
     * @brief Overwrite the pending sample (writer side)
     */
    void publish(const GestureSample& sample);

    /**
     * @brief Remove and return the pending sample, if any (reader side)
     */
    [[nodiscard]] std::optional<GestureSample> take();

    [[nodiscard]] bool has_pending() const;

    /**
     * @brief Drop the pending sample, if any
     */
    void clear();

    /// Total number of publish() calls, including overwritten samples.
    [[nodiscard]] uint64_t published_count() const { return m_published.load(std::memory_order_relaxed); }

private:
    // Both halves all-ones is a NaN pattern that no finite sample produces
    static constexpr uint64_t EMPTY = ~uint64_t{0};

    [[nodiscard]] static uint64_t pack(const GestureSample& sample);
    [[nodiscard]] static GestureSample unpack(uint64_t bits);

    std::atomic<uint64_t> m_slot{EMPTY};
    std::atomic<uint64_t> m_published{0};
};

} // namespace evergreen
