#include "engine/lighting/LightField.hpp"

#include <algorithm>

#include <glm/geometric.hpp>

namespace engine::lighting
{
namespace
{
float Clamp01(float value)
{
    return std::clamp(value, 0.0F, 1.0F);
}
} // namespace

const char* LightKindToText(LightKind kind)
{
    switch (kind)
    {
        case LightKind::Point: return "point";
        case LightKind::Area: return "area";
        case LightKind::Global: return "global";
        default: return "point";
    }
}

std::optional<LightKind> ParseLightKind(const std::string& text)
{
    if (text == "point")
        return LightKind::Point;
    if (text == "area")
        return LightKind::Area;
    if (text == "global")
        return LightKind::Global;
    return std::nullopt;
}

LightField::LightField(const LightFieldSettings& settings)
{
    SetSettings(settings);
}

void LightField::SetSettings(const LightFieldSettings& settings)
{
    m_settings = settings;
    m_settings.ambientFloor = Clamp01(settings.ambientFloor);
    m_settings.candidateRefreshInterval = std::max(0.0F, settings.candidateRefreshInterval);
    m_settings.candidateQueryMargin = std::max(0.0F, settings.candidateQueryMargin);
}

LightId LightField::RegisterLight(const glm::vec3& position, float intensity, float radius, LightKind kind)
{
    LightSource light;
    light.id = m_nextId++;
    light.position = position;
    light.intensity = std::max(0.0F, intensity);
    light.radius = std::max(0.0F, radius);
    light.kind = kind;
    m_lights.emplace(light.id, light);
    ++m_registrationRevision;
    return light.id;
}

bool LightField::UnregisterLight(LightId id)
{
    return m_lights.erase(id) > 0;
}

void LightField::Clear()
{
    m_lights.clear();
    ++m_registrationRevision;
}

bool LightField::SetLightEnabled(LightId id, bool enabled)
{
    const auto it = m_lights.find(id);
    if (it == m_lights.end())
    {
        return false;
    }
    it->second.enabled = enabled;
    return true;
}

bool LightField::SetLightIntensity(LightId id, float intensity)
{
    const auto it = m_lights.find(id);
    if (it == m_lights.end())
    {
        return false;
    }
    it->second.intensity = std::max(0.0F, intensity);
    return true;
}

bool LightField::SetLightRadius(LightId id, float radius)
{
    const auto it = m_lights.find(id);
    if (it == m_lights.end())
    {
        return false;
    }
    it->second.radius = std::max(0.0F, radius);
    return true;
}

bool LightField::SetLightPosition(LightId id, const glm::vec3& position)
{
    const auto it = m_lights.find(id);
    if (it == m_lights.end())
    {
        return false;
    }
    it->second.position = position;
    return true;
}

const LightSource* LightField::FindLight(LightId id) const
{
    const auto it = m_lights.find(id);
    return it == m_lights.end() ? nullptr : &it->second;
}

std::vector<LightId> LightField::LightIds() const
{
    std::vector<LightId> ids;
    ids.reserve(m_lights.size());
    for (const auto& [id, light] : m_lights)
    {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

float LightField::Contribution(const LightSource& light, const glm::vec3& point)
{
    if (!light.enabled || light.intensity <= 0.0F)
    {
        return 0.0F;
    }

    if (light.kind == LightKind::Global)
    {
        return light.intensity;
    }

    // Area lights use the point falloff.
    if (light.radius <= 0.0F)
    {
        return 0.0F;
    }

    const float distance = glm::distance(light.position, point);
    if (distance > light.radius)
    {
        return 0.0F;
    }
    return light.intensity * Clamp01(1.0F - distance / light.radius);
}

float LightField::Sample(const glm::vec3& point) const
{
    float sum = 0.0F;
    for (const auto& [id, light] : m_lights)
    {
        sum += Contribution(light, point);
    }
    return Finish(sum);
}

float LightField::SampleCandidates(const glm::vec3& point, const std::vector<LightId>& candidates) const
{
    float sum = 0.0F;
    for (const LightId id : candidates)
    {
        const auto it = m_lights.find(id);
        if (it == m_lights.end())
        {
            continue;
        }
        sum += Contribution(it->second, point);
    }
    return Finish(sum);
}

void LightField::CollectCandidates(const glm::vec3& origin, std::vector<LightId>& outIds) const
{
    outIds.clear();
    for (const auto& [id, light] : m_lights)
    {
        if (light.kind == LightKind::Global)
        {
            outIds.push_back(id);
            continue;
        }

        const float reach = light.radius + m_settings.candidateQueryMargin;
        const glm::vec3 delta = light.position - origin;
        if (glm::dot(delta, delta) <= reach * reach)
        {
            outIds.push_back(id);
        }
    }
}

float LightField::Finish(float sum) const
{
    return Clamp01(m_settings.ambientFloor + sum);
}

float LightSampler::Sample(const LightField& field, const glm::vec3& point, float elapsedSeconds)
{
    m_secondsSinceRefresh += std::max(0.0F, elapsedSeconds);

    const bool intervalElapsed = m_secondsSinceRefresh >= field.Settings().candidateRefreshInterval;
    const bool lightsAdded = m_seenRevision != field.RegistrationRevision();
    if (!m_valid || intervalElapsed || lightsAdded)
    {
        Refresh(field, point);
    }

    return field.SampleCandidates(point, m_candidates);
}

void LightSampler::Invalidate()
{
    m_valid = false;
}

void LightSampler::Refresh(const LightField& field, const glm::vec3& point)
{
    field.CollectCandidates(point, m_candidates);
    m_secondsSinceRefresh = 0.0F;
    m_seenRevision = field.RegistrationRevision();
    m_valid = true;
}
} // namespace engine::lighting
