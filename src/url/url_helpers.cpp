#include "url_helpers.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace tabweave
{

namespace
{

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

struct UrlParts
{
    std::string scheme;
    std::string host;
    std::string path;
    std::string query;
};

bool split_url(std::string_view url, UrlParts& out)
{
    auto colon = url.find("://");
    if (colon == std::string_view::npos || colon == 0)
        return false;
    out.scheme = to_lower(url.substr(0, colon));

    std::string_view rest = url.substr(colon + 3);
    auto             end  = rest.find_first_of("/?#");
    std::string_view auth = rest.substr(0, end);
    // Drop userinfo and port
    if (auto at = auth.rfind('@'); at != std::string_view::npos)
        auth = auth.substr(at + 1);
    if (auto port = auth.find(':'); port != std::string_view::npos)
        auth = auth.substr(0, port);
    out.host = to_lower(auth);

    if (end == std::string_view::npos)
        return !out.host.empty();
    rest = rest.substr(end);

    auto hash = rest.find('#');
    if (hash != std::string_view::npos)
        rest = rest.substr(0, hash);
    auto q = rest.find('?');
    out.path = to_lower(rest.substr(0, q));
    if (q != std::string_view::npos)
        out.query = std::string(rest.substr(q + 1));
    return !out.host.empty();
}

bool has_query_param(std::string_view query, std::string_view name)
{
    size_t pos = 0;
    while (pos <= query.size())
    {
        auto amp = query.find('&', pos);
        auto key = query.substr(pos, (amp == std::string_view::npos ? query.size() : amp) - pos);
        if (auto eq = key.find('='); eq != std::string_view::npos)
            key = key.substr(0, eq);
        if (key == name)
            return true;
        if (amp == std::string_view::npos)
            break;
        pos = amp + 1;
    }
    return false;
}

constexpr std::array<std::string_view, 18> AUTH_PATTERNS = {
    "accounts.google.com",
    "accounts.youtube.com",
    "github.com/login",
    "login.microsoftonline.com",
    "login.microsoft.com",
    "login.live.com",
    "facebook.com/login",
    "facebook.com/dialog/oauth",
    "twitter.com/oauth",
    "x.com/oauth",
    "linkedin.com/oauth",
    "/oauth/",
    "/auth/",
    "/signin",
    "/login",
    "/sso/",
    "/oauth2/",
    "storagerelay://",
};

constexpr std::array<std::string_view, 4> OAUTH_PARAMS = {
    "client_id",
    "redirect_uri",
    "response_type",
    "scope",
};

}   // namespace

std::string normalize_url(std::string_view input)
{
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = input.find_last_not_of(" \t\r\n");
    std::string_view trimmed = input.substr(first, last - first + 1);

    const std::string lower = to_lower(trimmed.substr(0, std::min<size_t>(trimmed.size(), 8)));
    for (std::string_view scheme : {"http://", "https://", "file://", "about:", "data:"})
    {
        if (starts_with(lower, scheme))
            return std::string(trimmed);
    }
    return "https://" + std::string(trimmed);
}

bool is_authentication_url(std::string_view url)
{
    if (starts_with(to_lower(url), "storagerelay://"))
        return true;

    UrlParts parts;
    if (!split_url(url, parts))
        return false;

    const std::string host_and_path = parts.host + parts.path;
    for (auto pattern : AUTH_PATTERNS)
    {
        if (host_and_path.find(pattern) != std::string::npos)
            return true;
    }

    for (auto param : OAUTH_PARAMS)
    {
        if (has_query_param(parts.query, param))
            return true;
    }
    return false;
}

}   // namespace tabweave
