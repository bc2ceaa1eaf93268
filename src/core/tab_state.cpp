#include <tabweave/commands.hpp>
#include <tabweave/tab_state.hpp>

#include <type_traits>

namespace tabweave
{

const char* surface_state_name(SurfaceState state)
{
    switch (state)
    {
        case SurfaceState::Uninitialized:
            return "Uninitialized";
        case SurfaceState::Creating:
            return "Creating";
        case SurfaceState::Live:
            return "Live";
        case SurfaceState::Freezing:
            return "Freezing";
        case SurfaceState::Frozen:
            return "Frozen";
        case SurfaceState::Unfreezing:
            return "Unfreezing";
        case SurfaceState::Destroying:
            return "Destroying";
        case SurfaceState::Destroyed:
            return "Destroyed";
    }
    return "Unknown";
}

const char* command_name(const Command& cmd)
{
    return std::visit(
        [](const auto& c) -> const char*
        {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, CreateTab>)
                return "CreateTab";
            else if constexpr (std::is_same_v<T, CloseTab>)
                return "CloseTab";
            else if constexpr (std::is_same_v<T, SwitchActiveTab>)
                return "SwitchActiveTab";
            else if constexpr (std::is_same_v<T, ReorderTab>)
                return "ReorderTab";
            else if constexpr (std::is_same_v<T, Navigate>)
                return "Navigate";
            else if constexpr (std::is_same_v<T, NavigationAction>)
                return "NavigationAction";
            else if constexpr (std::is_same_v<T, SetBounds>)
                return "SetBounds";
            else if constexpr (std::is_same_v<T, TransferTab>)
                return "TransferTab";
            else
                return "RequestFocus";
        },
        cmd);
}

}   // namespace tabweave
