#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

namespace engine::lighting
{
using LightId = std::uint32_t;

constexpr LightId kInvalidLightId = 0;

enum class LightKind
{
    Point,
    Area,
    Global
};

[[nodiscard]] const char* LightKindToText(LightKind kind);
[[nodiscard]] std::optional<LightKind> ParseLightKind(const std::string& text);

struct LightSource
{
    LightId id = kInvalidLightId;
    glm::vec3 position{0.0F};
    float radius = 5.0F;
    float intensity = 1.0F;
    LightKind kind = LightKind::Point;
    bool enabled = true;
};

struct LightFieldSettings
{
    float ambientFloor = 0.1F;             // moonlight; never darker than this
    float candidateRefreshInterval = 2.0F; // seconds between sampler candidate rebuilds
    float candidateQueryMargin = 1.0F;     // extra reach added to a light's radius when culling
};

/// Scene light registry and illumination query. Illumination at a point is
/// the ambient floor plus each light's linear falloff contribution, clamped to [0, 1].
class LightField
{
public:
    explicit LightField(const LightFieldSettings& settings = {});

    void SetSettings(const LightFieldSettings& settings);
    [[nodiscard]] const LightFieldSettings& Settings() const { return m_settings; }

    LightId RegisterLight(const glm::vec3& position, float intensity, float radius, LightKind kind = LightKind::Point);
    bool UnregisterLight(LightId id);
    void Clear();

    bool SetLightEnabled(LightId id, bool enabled);
    bool SetLightIntensity(LightId id, float intensity);
    bool SetLightRadius(LightId id, float radius);
    bool SetLightPosition(LightId id, const glm::vec3& position);

    [[nodiscard]] const LightSource* FindLight(LightId id) const;
    [[nodiscard]] std::size_t LightCount() const { return m_lights.size(); }
    [[nodiscard]] std::vector<LightId> LightIds() const;

    /// Bumped whenever a light is registered. Samplers use it to pick up new lights early.
    [[nodiscard]] std::uint64_t RegistrationRevision() const { return m_registrationRevision; }

    /// Full scan over every registered light.
    [[nodiscard]] float Sample(const glm::vec3& point) const;

    /// Aggregates only the listed lights. Ids no longer registered are skipped.
    [[nodiscard]] float SampleCandidates(const glm::vec3& point, const std::vector<LightId>& candidates) const;

    /// Lights whose radius plus query margin reaches origin. Global lights always qualify.
    void CollectCandidates(const glm::vec3& origin, std::vector<LightId>& outIds) const;

    [[nodiscard]] static float Contribution(const LightSource& light, const glm::vec3& point);

private:
    [[nodiscard]] float Finish(float sum) const;

    LightFieldSettings m_settings;
    std::unordered_map<LightId, LightSource> m_lights;
    LightId m_nextId = 1;
    std::uint64_t m_registrationRevision = 0;
};

/// Per-agent cached candidate set. Rebuilt on a coarse interval instead of
/// every sample; between rebuilds only the cached lights are aggregated.
class LightSampler
{
public:
    float Sample(const LightField& field, const glm::vec3& point, float elapsedSeconds);
    void Invalidate();

    [[nodiscard]] const std::vector<LightId>& Candidates() const { return m_candidates; }
    [[nodiscard]] float SecondsSinceRefresh() const { return m_secondsSinceRefresh; }

private:
    void Refresh(const LightField& field, const glm::vec3& point);

    std::vector<LightId> m_candidates;
    float m_secondsSinceRefresh = 0.0F;
    std::uint64_t m_seenRevision = 0;
    bool m_valid = false;
};
} // namespace engine::lighting
