#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace game::ai
{
using AgentId = std::uint32_t;

constexpr AgentId kInvalidAgentId = 0;

enum class AgentState : std::uint8_t
{
    Idle = 0,
    Patrol,
    Investigate,
    Chase,
    Alert,
    Dead,
    Sleeping
};

[[nodiscard]] const char* AgentStateToText(AgentState state);
[[nodiscard]] std::optional<AgentState> ParseAgentState(const std::string& text);

/// States in which the agent is standing still by definition.
[[nodiscard]] bool IsStationaryState(AgentState state);
} // namespace game::ai
