#include "orchestrator_config.hpp"

#include <tabweave/logger.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tabweave
{

static constexpr int CONFIG_VERSION = 1;

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static std::string unescape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 == s.size())
        {
            out += s[i];
            continue;
        }
        char c = s[++i];
        switch (c)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string OrchestratorConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CONFIG_VERSION << ",\n";
    os << "  \"destroy_debounce_ms\": " << destroy_debounce_ms << ",\n";
    os << "  \"freeze_grace_ms\": " << freeze_grace_ms << ",\n";
    os << "  \"capture_timeout_ms\": " << capture_timeout_ms << ",\n";
    os << "  \"max_snapshots\": " << max_snapshots << ",\n";
    os << "  \"max_live_surfaces\": " << max_live_surfaces << ",\n";
    os << "  \"freeze_enabled\": " << (freeze_enabled ? "true" : "false") << ",\n";
    os << "  \"default_url\": \"" << escape_json(default_url) << "\",\n";
    os << "  \"log_level\": \"" << escape_json(log_level) << "\",\n";
    os << "  \"log_file\": \"" << escape_json(log_file) << "\",\n";
    os << "  \"socket_path\": \"" << escape_json(socket_path) << "\"\n";
    os << "}\n";
    return os.str();
}

// Position just past the ':' following "key", or npos.
static size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return pos + 1;
}

static void read_json_string(const std::string& json, const std::string& key, std::string& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return;
    pos = json.find('"', pos);
    if (pos == std::string::npos)
        return;
    size_t end = pos + 1;
    while (end < json.size())
    {
        if (json[end] == '"' && json[end - 1] != '\\')
            break;
        ++end;
    }
    out = unescape_json(json.substr(pos + 1, end - pos - 1));
}

static void read_json_bool(const std::string& json, const std::string& key, bool& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return;
    auto   rest  = json.substr(pos, 10);
    size_t start = rest.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        return;
    if (rest.substr(start, 4) == "true")
        out = true;
    else if (rest.substr(start, 5) == "false")
        out = false;
}

static void read_json_int(const std::string& json, const std::string& key, int64_t& out)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return;
    auto end = json.find_first_of(",}\n", pos);
    auto raw = json.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    try
    {
        size_t used  = 0;
        auto   value = std::stoll(raw, &used);
        if (raw.find_first_not_of(" \t\r", used) != std::string::npos)
            throw std::invalid_argument("trailing characters");
        out = value;
    }
    catch (const std::exception& e)
    {
        TABWEAVE_LOG_WARN("config", "Ignoring malformed value for '{}': {}", key, e.what());
    }
}

bool OrchestratorConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    int64_t version = CONFIG_VERSION;
    read_json_int(json, "version", version);
    if (version > CONFIG_VERSION)
    {
        TABWEAVE_LOG_WARN("config", "Config version {} is newer than {}", version, CONFIG_VERSION);
        return false;
    }

    read_json_int(json, "destroy_debounce_ms", destroy_debounce_ms);
    read_json_int(json, "freeze_grace_ms", freeze_grace_ms);
    read_json_int(json, "capture_timeout_ms", capture_timeout_ms);
    read_json_int(json, "max_snapshots", max_snapshots);
    read_json_int(json, "max_live_surfaces", max_live_surfaces);
    read_json_bool(json, "freeze_enabled", freeze_enabled);
    read_json_string(json, "default_url", default_url);
    read_json_string(json, "log_level", log_level);
    read_json_string(json, "log_file", log_file);
    read_json_string(json, "socket_path", socket_path);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool OrchestratorConfig::save(const std::string& path) const
{
    try
    {
        auto dir = std::filesystem::path(path).parent_path();
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir);
        }
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        TABWEAVE_LOG_DEBUG("config", "create_directories failed: {}", e.what());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        TABWEAVE_LOG_ERROR("config", "Cannot write {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool OrchestratorConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    bool        ok = deserialize(json);
    if (ok)
        TABWEAVE_LOG_INFO("config", "Loaded {}", path);
    return ok;
}

std::string OrchestratorConfig::default_path()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return (std::filesystem::path(xdg) / "tabweave" / "orchestrator.json").string();

    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "orchestrator.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "tabweave";
    return (dir / "orchestrator.json").string();
}

}   // namespace tabweave
