/**
 * @file   ready_source.cpp
 * @brief  Implements the Immediate and Throttled gates of ReadySource.
 *
 * @author recurrent contributors
 * @date   2026-10-19
 */

#include "ready_source.hpp"

#include <stdexcept>
#include <type_traits>

namespace recurrent {

ReadySource::ReadySource(Gate gate)
: m_gate(std::move(gate))
{}

ReadySource ReadySource::immediate() {
    return ReadySource(Immediate{});
}

ReadySource ReadySource::throttled(TimerPtr ticker) {
    if (!ticker)
        throw std::invalid_argument("throttled gate needs a ticker");
    return ReadySource(Throttled{std::move(ticker)});
}

bool ReadySource::ready(SignalBuffer& signals) {
    return std::visit([&signals](auto& gate) -> bool {
        using T = std::decay_t<decltype(gate)>;
        if constexpr (std::is_same_v<T, Immediate>) {
            return signals.take();
        } else {
            if (!gate.ticker->fired()) return false;
            return signals.take();
        }
    }, m_gate);
}

std::optional<TimePoint> ReadySource::deadline() const {
    if (auto t = std::get_if<Throttled>(&m_gate))
        return t->ticker->deadline();
    return std::nullopt;
}

bool ReadySource::isThrottled() const noexcept {
    return std::holds_alternative<Throttled>(m_gate);
}

void ReadySource::release() {
    if (auto t = std::get_if<Throttled>(&m_gate))
        t->ticker->stop();
}

} // namespace recurrent
