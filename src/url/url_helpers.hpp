#pragma once

#include <string>
#include <string_view>

namespace tabweave
{

// Trims whitespace and gives scheme-less input an https:// prefix.  Inputs
// already carrying http, https, file, about or data schemes pass through.
// Returns an empty string for blank input.
std::string normalize_url(std::string_view input);

// OAuth / SSO pages (provider sign-in hosts, /oauth/ and /login paths,
// OAuth2 query parameters).  Such pages lose their flow if their surface is
// torn down, so they are never frozen.
bool is_authentication_url(std::string_view url);

}   // namespace tabweave
