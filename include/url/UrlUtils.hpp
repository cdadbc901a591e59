#pragma once

#include "model/MediaHandle.hpp"
#include <string>
#include <vector>

namespace tessera::url {

// Empty, whitespace-only, or the literal "null" some backends emit
bool is_blank_source(const std::string& url);

// Lower-cased host of an absolute URL ("scheme://[user@]host[:port]/...").
// Returns an empty string when the URL has no scheme or no host.
std::string hostname(const std::string& url);

// Appends "a=1&b=2" to the query string, using '?' or '&' as needed and
// keeping any #fragment at the end. Existing parameters are left alone.
std::string append_query(const std::string& url, const std::string& params);

// Removes every query parameter whose name is in `names`.
std::string remove_query_params(const std::string& url, const std::vector<std::string>& names);

model::MediaType classify_media(const std::string& url);

}  // namespace tessera::url
