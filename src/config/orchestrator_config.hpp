#pragma once

#include <cstdint>
#include <string>

namespace tabweave
{

// Tunables for the orchestrator and the daemon, persisted as a small JSON
// document:
//
//   {
//     "version": 1,
//     "destroy_debounce_ms": 50,
//     "freeze_grace_ms": 3000,
//     ...
//   }
//
// Unknown keys are ignored and missing keys keep their defaults, so older
// and newer files both load.
struct OrchestratorConfig
{
    int64_t     destroy_debounce_ms = 50;
    int64_t     freeze_grace_ms     = 3000;
    int64_t     capture_timeout_ms  = 500;
    int64_t     max_snapshots       = 10;
    int64_t     max_live_surfaces   = 5;
    bool        freeze_enabled      = true;
    std::string default_url         = "about:blank";
    std::string log_level           = "info";
    std::string log_file;       // empty: console only
    std::string socket_path;    // empty: default_socket_path()

    std::string serialize() const;

    // False for empty input or a future format version.  A malformed number
    // is logged and leaves that field at its current value.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/tabweave/orchestrator.json, falling back to
    // ~/.config/tabweave/orchestrator.json.
    static std::string default_path();
};

}   // namespace tabweave
