#include <evergreen/GestureChannel.hpp>
#include <bit>
#include <cmath>

namespace evergreen {

uint64_t GestureChannel::pack(const GestureSample& sample) {
    uint64_t ratio = std::bit_cast<uint32_t>(sample.open_ratio);
    uint64_t x = std::bit_cast<uint32_t>(sample.wrist_x);
    return (ratio << 32) | x;
}

GestureSample GestureChannel::unpack(uint64_t bits) {
    return {
        .open_ratio = std::bit_cast<float>(static_cast<uint32_t>(bits >> 32)),
        .wrist_x = std::bit_cast<float>(static_cast<uint32_t>(bits & 0xFFFFFFFFu))
    };
}

void GestureChannel::publish(const GestureSample& sample) {
    if (!std::isfinite(sample.open_ratio) || !std::isfinite(sample.wrist_x)) {
        return;
    }
    m_slot.store(pack(sample), std::memory_order_release);
    m_published.fetch_add(1, std::memory_order_relaxed);
}

std::optional<GestureSample> GestureChannel::take() {
    uint64_t bits = m_slot.exchange(EMPTY, std::memory_order_acquire);
    if (bits == EMPTY) {
        return std::nullopt;
    }
    return unpack(bits);
}

void GestureChannel::clear() {
    m_slot.store(EMPTY, std::memory_order_release);
}

bool GestureChannel::has_pending() const {
    return m_slot.load(std::memory_order_acquire) != EMPTY;
}

} // namespace evergreen
