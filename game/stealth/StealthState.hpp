#pragma once

#include <functional>

#include <glm/vec3.hpp>

#include "engine/lighting/LightField.hpp"

namespace game::stealth
{
struct StealthSettings
{
    float hideThreshold = 0.3F;
    /// Multiplier applied to the threshold while moving. Below 1 means moving
    /// needs deeper shadow to stay hidden.
    float movementPenalty = 0.7F;
    float sampleInterval = 0.1F;
    float movementThreshold = 0.1F;
};

struct StealthStatus
{
    float lightLevel = 0.0F;
    bool hidden = false;
    float threshold = 0.3F;
};

/// Light-driven hidden/visible flag for one agent. Illumination is sampled on
/// a fixed interval, not every tick, and the flag only changes when the
/// sampled level crosses the effective threshold.
class StealthState
{
public:
    using HiddenChangedCallback = std::function<void(bool hidden)>;

    explicit StealthState(const engine::lighting::LightField& field, const StealthSettings& settings = {});

    void Update(const glm::vec3& position, bool isMoving, float deltaSeconds);
    /// Samples now regardless of the interval timer.
    void ForceSample(const glm::vec3& position, bool isMoving);

    [[nodiscard]] bool IsHidden() const { return m_status.hidden; }
    [[nodiscard]] float CurrentLight() const { return m_status.lightLevel; }
    [[nodiscard]] const StealthStatus& Status() const { return m_status; }
    [[nodiscard]] float EffectiveThreshold(bool isMoving) const;
    [[nodiscard]] std::size_t CandidateLightCount() const { return m_sampler.Candidates().size(); }
    [[nodiscard]] const StealthSettings& Settings() const { return m_settings; }

    void SetHideThreshold(float threshold);
    void SetMovementPenalty(float penalty);
    void SetSampleInterval(float seconds);

    /// Disabled state keeps its last status until re-enabled.
    void SetEnabled(bool enabled);
    [[nodiscard]] bool IsEnabled() const { return m_enabled; }

    void SetHiddenChangedCallback(HiddenChangedCallback callback) { m_hiddenChanged = std::move(callback); }

private:
    void Sample(const glm::vec3& position, bool isMoving, float elapsedSeconds);

    const engine::lighting::LightField* m_field;
    engine::lighting::LightSampler m_sampler;
    StealthSettings m_settings;
    StealthStatus m_status;
    HiddenChangedCallback m_hiddenChanged;
    float m_sampleTimer = 0.0F;
    bool m_hasSampled = false;
    bool m_enabled = true;
};
} // namespace game::stealth
