#include "surface_host.hpp"

namespace tabweave
{

const char* host_event_kind_name(HostEvent::Kind kind)
{
    switch (kind)
    {
        case HostEvent::Kind::Created:
            return "Created";
        case HostEvent::Kind::CreateFailed:
            return "CreateFailed";
        case HostEvent::Kind::LoadStarted:
            return "LoadStarted";
        case HostEvent::Kind::LoadFinished:
            return "LoadFinished";
        case HostEvent::Kind::LoadFailed:
            return "LoadFailed";
        case HostEvent::Kind::Navigated:
            return "Navigated";
        case HostEvent::Kind::TitleChanged:
            return "TitleChanged";
        case HostEvent::Kind::FaviconChanged:
            return "FaviconChanged";
        case HostEvent::Kind::NavFlagsChanged:
            return "NavFlagsChanged";
        case HostEvent::Kind::Crashed:
            return "Crashed";
        case HostEvent::Kind::OpenUrlRequested:
            return "OpenUrlRequested";
    }
    return "Unknown";
}

}   // namespace tabweave
