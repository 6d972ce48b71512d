#include "placer/core/Time.hpp"

#include <algorithm>
#include <chrono>

namespace placer::core
{
std::int64_t WallClockMillis()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

void Time::BeginFrame(double nowSeconds)
{
    if (m_lastFrameSeconds < 0.0)
    {
        m_lastFrameSeconds = nowSeconds;
        return;
    }

    // Stalls (window drag, breakpoint) are clamped so one frame cannot dominate the average.
    m_deltaSeconds = static_cast<float>(std::clamp(nowSeconds - m_lastFrameSeconds, 0.0, 0.25));
    m_lastFrameSeconds = nowSeconds;
    if (m_deltaSeconds <= 0.0F)
    {
        return;
    }
    const float instant = 1.0F / m_deltaSeconds;
    m_smoothedFps = m_smoothedFps <= 0.0F ? instant : m_smoothedFps + (instant - m_smoothedFps) * 0.1F;
}
} // namespace placer::core
