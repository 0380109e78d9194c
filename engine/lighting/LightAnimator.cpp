#include "engine/lighting/LightAnimator.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <glm/common.hpp>
#include <glm/gtc/noise.hpp>
#include <glm/vec2.hpp>

namespace engine::lighting
{
namespace
{
// Offsets keep the radius channel decorrelated from intensity.
constexpr float kRadiusChannelOffset = 200.0F;
} // namespace

FlickerProfile CandleFlicker()
{
    FlickerProfile profile;
    profile.minIntensity = 0.8F;
    profile.maxIntensity = 1.2F;
    profile.speed = 2.0F;
    profile.flickerRadius = true;
    profile.minRadius = 0.9F;
    profile.maxRadius = 1.1F;
    profile.radiusSpeed = 1.5F;
    return profile;
}

FlickerProfile TorchFlicker()
{
    FlickerProfile profile;
    profile.minIntensity = 0.7F;
    profile.maxIntensity = 1.3F;
    profile.speed = 3.0F;
    profile.flickerRadius = true;
    profile.minRadius = 0.85F;
    profile.maxRadius = 1.15F;
    profile.radiusSpeed = 2.0F;
    return profile;
}

FlickerProfile LanternFlicker()
{
    FlickerProfile profile;
    profile.minIntensity = 0.9F;
    profile.maxIntensity = 1.1F;
    profile.speed = 1.0F;
    profile.flickerRadius = true;
    profile.minRadius = 0.95F;
    profile.maxRadius = 1.05F;
    profile.radiusSpeed = 0.8F;
    return profile;
}

FlickerProfile FireplaceFlicker()
{
    FlickerProfile profile;
    profile.minIntensity = 0.6F;
    profile.maxIntensity = 1.4F;
    profile.speed = 3.5F;
    profile.flickerRadius = true;
    profile.minRadius = 0.8F;
    profile.maxRadius = 1.2F;
    profile.radiusSpeed = 2.5F;
    return profile;
}

std::optional<FlickerProfile> FlickerPresetByName(const std::string& name)
{
    if (name == "candle")
        return CandleFlicker();
    if (name == "torch")
        return TorchFlicker();
    if (name == "lantern")
        return LanternFlicker();
    if (name == "fireplace")
        return FireplaceFlicker();
    return std::nullopt;
}

LightAnimator::LightAnimator(std::uint32_t seed)
    : m_rng(seed)
{
}

LightAnimator::Track* LightAnimator::EnsureTrack(const LightField& field, LightId id)
{
    const LightSource* light = field.FindLight(id);
    if (light == nullptr)
    {
        m_tracks.erase(id);
        return nullptr;
    }

    auto it = m_tracks.find(id);
    if (it == m_tracks.end())
    {
        std::uniform_real_distribution<float> offsetDist(0.0F, 1000.0F);
        Track track;
        track.baseIntensity = light->intensity;
        track.baseRadius = light->radius;
        track.timeOffset = offsetDist(m_rng);
        track.phase = light->enabled ? Phase::Lit : Phase::Out;
        it = m_tracks.emplace(id, track).first;
    }
    return &it->second;
}

bool LightAnimator::AttachFlicker(LightField& field, LightId id, const FlickerProfile& profile)
{
    Track* track = EnsureTrack(field, id);
    if (track == nullptr)
    {
        return false;
    }

    FlickerProfile sanitized = profile;
    if (sanitized.minIntensity > sanitized.maxIntensity)
    {
        std::swap(sanitized.minIntensity, sanitized.maxIntensity);
    }
    if (sanitized.minRadius > sanitized.maxRadius)
    {
        std::swap(sanitized.minRadius, sanitized.maxRadius);
    }
    sanitized.minIntensity = std::max(0.0F, sanitized.minIntensity);
    sanitized.minRadius = std::max(0.0F, sanitized.minRadius);
    track->flicker = sanitized;
    return true;
}

bool LightAnimator::Detach(LightField& field, LightId id)
{
    const auto it = m_tracks.find(id);
    if (it == m_tracks.end())
    {
        return false;
    }

    const Track& track = it->second;
    field.SetLightIntensity(id, track.baseIntensity);
    field.SetLightRadius(id, track.baseRadius);
    field.SetLightEnabled(id, true);
    m_tracks.erase(it);
    return true;
}

bool LightAnimator::Extinguish(LightField& field, LightId id, float fadeSeconds)
{
    Track* track = EnsureTrack(field, id);
    if (track == nullptr || track->phase != Phase::Lit)
    {
        return false;
    }

    const LightSource* light = field.FindLight(id);
    track->fadeFromIntensity = light->intensity;
    track->fadeSeconds = std::max(0.0F, fadeSeconds);
    track->fadeElapsed = 0.0F;
    track->phase = Phase::Fading;

    if (track->fadeSeconds <= 0.0F)
    {
        field.SetLightIntensity(id, 0.0F);
        field.SetLightEnabled(id, false);
        track->phase = Phase::Out;
    }
    return true;
}

bool LightAnimator::Relight(LightField& field, LightId id)
{
    Track* track = EnsureTrack(field, id);
    if (track == nullptr || track->phase == Phase::Lit)
    {
        return false;
    }

    track->phase = Phase::Lit;
    field.SetLightEnabled(id, true);
    field.SetLightIntensity(id, track->baseIntensity * track->multiplier);
    field.SetLightRadius(id, track->baseRadius);
    return true;
}

bool LightAnimator::SetIntensityMultiplier(LightId id, float multiplier)
{
    const auto it = m_tracks.find(id);
    if (it == m_tracks.end())
    {
        return false;
    }
    it->second.multiplier = std::max(0.0F, multiplier);
    return true;
}

bool LightAnimator::IsLit(LightId id) const
{
    const auto it = m_tracks.find(id);
    return it == m_tracks.end() || it->second.phase == Phase::Lit;
}

float LightAnimator::Wave(const FlickerProfile& profile, float speed, float offset)
{
    const float phase = m_timeSeconds * speed + offset;
    switch (profile.mode)
    {
        case FlickerMode::Noise:
        {
            const float noise = glm::perlin(glm::vec2{phase, 0.0F});
            return glm::clamp(noise * 0.5F + 0.5F, 0.0F, 1.0F);
        }
        case FlickerMode::Sine:
            return std::sin(phase) * 0.5F + 0.5F;
        case FlickerMode::Random:
        {
            std::uniform_real_distribution<float> dist(0.0F, 1.0F);
            return dist(m_rng);
        }
        default:
            return 0.5F;
    }
}

void LightAnimator::Update(LightField& field, float deltaSeconds)
{
    m_timeSeconds += std::max(0.0F, deltaSeconds);

    std::vector<LightId> removed;
    for (auto& [id, track] : m_tracks)
    {
        if (field.FindLight(id) == nullptr)
        {
            removed.push_back(id);
            continue;
        }

        switch (track.phase)
        {
            case Phase::Lit:
            {
                if (!track.flicker.has_value())
                {
                    break;
                }
                const FlickerProfile& profile = *track.flicker;
                const float t = Wave(profile, profile.speed, track.timeOffset);
                const float scale = glm::mix(profile.minIntensity, profile.maxIntensity, t);
                field.SetLightIntensity(id, scale * track.baseIntensity * track.multiplier);

                if (profile.flickerRadius)
                {
                    const float r = Wave(profile, profile.radiusSpeed, track.timeOffset + kRadiusChannelOffset);
                    field.SetLightRadius(id, glm::mix(profile.minRadius, profile.maxRadius, r) * track.baseRadius);
                }
                break;
            }
            case Phase::Fading:
            {
                track.fadeElapsed += std::max(0.0F, deltaSeconds);
                const float progress = std::min(1.0F, track.fadeElapsed / track.fadeSeconds);
                field.SetLightIntensity(id, track.fadeFromIntensity * (1.0F - progress));
                if (progress >= 1.0F)
                {
                    field.SetLightEnabled(id, false);
                    track.phase = Phase::Out;
                }
                break;
            }
            case Phase::Out:
            default:
                break;
        }
    }

    for (const LightId id : removed)
    {
        m_tracks.erase(id);
    }
}
} // namespace engine::lighting
