#include "game/ai/AgentState.hpp"

namespace game::ai
{
const char* AgentStateToText(AgentState state)
{
    switch (state)
    {
        case AgentState::Idle: return "Idle";
        case AgentState::Patrol: return "Patrol";
        case AgentState::Investigate: return "Investigate";
        case AgentState::Chase: return "Chase";
        case AgentState::Alert: return "Alert";
        case AgentState::Dead: return "Dead";
        case AgentState::Sleeping: return "Sleeping";
        default: return "Unknown";
    }
}

std::optional<AgentState> ParseAgentState(const std::string& text)
{
    if (text == "idle" || text == "Idle")
        return AgentState::Idle;
    if (text == "patrol" || text == "Patrol")
        return AgentState::Patrol;
    if (text == "investigate" || text == "Investigate")
        return AgentState::Investigate;
    if (text == "chase" || text == "Chase")
        return AgentState::Chase;
    if (text == "alert" || text == "Alert")
        return AgentState::Alert;
    if (text == "dead" || text == "Dead")
        return AgentState::Dead;
    if (text == "sleeping" || text == "Sleeping")
        return AgentState::Sleeping;
    return std::nullopt;
}

bool IsStationaryState(AgentState state)
{
    switch (state)
    {
        case AgentState::Idle:
        case AgentState::Alert:
        case AgentState::Dead:
        case AgentState::Sleeping:
            return true;
        default:
            return false;
    }
}
} // namespace game::ai
