#pragma once

#include <cstdint>

namespace placer::core
{
// Milliseconds since the Unix epoch. Used for generated asset ids.
[[nodiscard]] std::int64_t WallClockMillis();

// Frame pacing for the editor loop; the panels show the smoothed rate.
class Time
{
public:
    void BeginFrame(double nowSeconds);

    [[nodiscard]] float DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] float SmoothedFps() const { return m_smoothedFps; }

private:
    float m_deltaSeconds = 0.0F;
    float m_smoothedFps = 0.0F;
    double m_lastFrameSeconds = -1.0;
};
} // namespace placer::core
