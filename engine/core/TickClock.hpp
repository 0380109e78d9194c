#pragma once

namespace engine::core
{
/// Fixed-step accumulator. Frame time is fed in, whole simulation steps come out.
class TickClock
{
public:
    explicit TickClock(double fixedDeltaSeconds = 1.0 / 60.0, int maxStepsPerFrame = 8);

    void SetFixedDeltaSeconds(double fixedDeltaSeconds);
    void SetMaxStepsPerFrame(int maxSteps);

    void BeginFrame(double nowSeconds);
    [[nodiscard]] bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] double TotalSeconds() const { return m_totalSeconds; }
    [[nodiscard]] double SimulatedSeconds() const { return static_cast<double>(m_stepIndex) * m_fixedDeltaSeconds; }
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }
    [[nodiscard]] unsigned long long StepIndex() const { return m_stepIndex; }
    [[nodiscard]] unsigned long long DroppedSteps() const { return m_droppedSteps; }

private:
    double m_fixedDeltaSeconds;
    double m_deltaSeconds = 0.0;
    double m_totalSeconds = 0.0;
    double m_lastFrameSeconds = 0.0;
    double m_accumulator = 0.0;
    int m_maxStepsPerFrame;
    int m_stepsThisFrame = 0;
    unsigned long long m_frameIndex = 0;
    unsigned long long m_stepIndex = 0;
    unsigned long long m_droppedSteps = 0;
    bool m_firstFrame = true;
};
} // namespace engine::core
