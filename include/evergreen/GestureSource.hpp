#pragma once

#include "GestureChannel.hpp"
#include <array>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <stop_token>
#include <thread>

namespace evergreen {

/**
 * @brief Asynchronous producer of hand measurements
 *
 * Implementations run their own detection loop and write into a
 * GestureChannel. The scene never waits on a source; it only reads
 * the channel once per tick.
 *
 * Contract:
 * - start() acquires the capture device and launches the loop, or reports
 *   why it could not. Starting a running source is an error.
 * - stop() is idempotent, halts the loop and releases the device before it
 *   returns. The destructor stops a running source.
 */
class GestureSource {
public:
    virtual ~GestureSource() = default;

    virtual std::expected<void, std::string> start(GestureChannel& channel) = 0;
    virtual void stop() = 0;
    [[nodiscard]] virtual bool running() const = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/**
 * @brief Scripted hand for demos and tests
 */
struct SyntheticGestureConfig {
    std::chrono::milliseconds interval{33};   ///< Detection cadence (~30 fps)
    float sweep_period = 12.0f;               ///< Seconds per left-right wrist sweep
    float sweep_amplitude = 0.35f;            ///< Wrist excursion around the centre
    float toggle_period = 6.0f;               ///< Seconds between open and close
    float open_ratio = 1.7f;
    float closed_ratio = 1.0f;

    [[nodiscard]] bool is_valid() const {
        return interval.count() > 0 && sweep_period > 0.0f && toggle_period > 0.0f &&
               sweep_amplitude >= 0.0f && sweep_amplitude <= 0.5f;
    }
};

/**
 * @brief GestureSource that synthesizes a hand on a worker thread
 *
 * Each cadence step it lays out 21 landmarks for a hand at the scripted
 * position and openness, measures them with measure_hand() and publishes
 * the result, so it exercises the same path a camera pipeline would.
 */
class SyntheticGestureSource final : public GestureSource {
public:
    explicit SyntheticGestureSource(const SyntheticGestureConfig& config = {});
    ~SyntheticGestureSource() override;

    SyntheticGestureSource(const SyntheticGestureSource&) = delete;
    SyntheticGestureSource& operator=(const SyntheticGestureSource&) = delete;

    std::expected<void, std::string> start(GestureChannel& channel) override;
    void stop() override;
    [[nodiscard]] bool running() const override { return m_worker.joinable(); }
    [[nodiscard]] std::string_view name() const override { return "synthetic"; }

    /**
     * @brief Scripted landmarks at @p seconds after start
     */
    [[nodiscard]] std::array<glm::vec2, HAND_LANDMARK_COUNT> landmarks_at(float seconds) const;

private:
    void run(std::stop_token token, GestureChannel& channel) const;

    SyntheticGestureConfig m_config;
    std::jthread m_worker;
};

} // namespace evergreen
