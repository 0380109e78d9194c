#pragma once

namespace game::ai
{
/// Bounded suspicion level in [0, maxLevel] with linear decay.
class SuspicionMeter
{
public:
    explicit SuspicionMeter(float maxLevel = 10.0F, float decayRate = 0.5F);

    void Configure(float maxLevel, float decayRate);

    /// Negative amounts are ignored; use Decay or Set to lower the level.
    void Add(float amount);
    void Decay(float deltaSeconds);
    void Set(float level);
    void PinToMax() { m_level = m_maxLevel; }
    void Reset() { m_level = 0.0F; }

    [[nodiscard]] float Level() const { return m_level; }
    [[nodiscard]] float MaxLevel() const { return m_maxLevel; }
    [[nodiscard]] float DecayRate() const { return m_decayRate; }
    [[nodiscard]] float Ratio() const { return m_maxLevel > 0.0F ? m_level / m_maxLevel : 0.0F; }
    [[nodiscard]] bool IsAtMax() const { return m_level >= m_maxLevel; }

private:
    float m_level = 0.0F;
    float m_maxLevel;
    float m_decayRate;
};
} // namespace game::ai
