#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

#include "engine/lighting/LightField.hpp"

namespace engine::lighting
{
enum class FlickerMode
{
    Noise,
    Sine,
    Random
};

/// Intensity and radius are expressed as multipliers of the light's base values.
struct FlickerProfile
{
    float minIntensity = 0.8F;
    float maxIntensity = 1.2F;
    float speed = 1.0F;
    FlickerMode mode = FlickerMode::Noise;

    bool flickerRadius = false;
    float minRadius = 0.9F;
    float maxRadius = 1.1F;
    float radiusSpeed = 0.7F;
};

[[nodiscard]] FlickerProfile CandleFlicker();
[[nodiscard]] FlickerProfile TorchFlicker();
[[nodiscard]] FlickerProfile LanternFlicker();
[[nodiscard]] FlickerProfile FireplaceFlicker();
[[nodiscard]] std::optional<FlickerProfile> FlickerPresetByName(const std::string& name);

/// Drives time-varying light parameters (flicker, extinguish fades) on a LightField.
class LightAnimator
{
public:
    explicit LightAnimator(std::uint32_t seed = 0x5EEDU);

    /// Captures the light's current intensity and radius as its base values.
    bool AttachFlicker(LightField& field, LightId id, const FlickerProfile& profile);
    /// Stops animating and restores the base values.
    bool Detach(LightField& field, LightId id);

    bool Extinguish(LightField& field, LightId id, float fadeSeconds);
    bool Relight(LightField& field, LightId id);
    bool SetIntensityMultiplier(LightId id, float multiplier);

    void Update(LightField& field, float deltaSeconds);

    [[nodiscard]] bool IsTracked(LightId id) const { return m_tracks.contains(id); }
    [[nodiscard]] bool IsLit(LightId id) const;
    [[nodiscard]] std::size_t TrackedCount() const { return m_tracks.size(); }

private:
    enum class Phase
    {
        Lit,
        Fading,
        Out
    };

    struct Track
    {
        float baseIntensity = 1.0F;
        float baseRadius = 1.0F;
        float multiplier = 1.0F;
        float timeOffset = 0.0F;
        std::optional<FlickerProfile> flicker;

        Phase phase = Phase::Lit;
        float fadeSeconds = 0.0F;
        float fadeElapsed = 0.0F;
        float fadeFromIntensity = 0.0F;
    };

    Track* EnsureTrack(const LightField& field, LightId id);
    [[nodiscard]] float Wave(const FlickerProfile& profile, float speed, float offset);

    std::unordered_map<LightId, Track> m_tracks;
    std::mt19937 m_rng;
    float m_timeSeconds = 0.0F;
};
} // namespace engine::lighting
