#include "url/UrlUtils.hpp"
#include <algorithm>
#include <cctype>

namespace tessera::url {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Splits "base?query#fragment" into its three parts (separators dropped)
struct UrlParts {
    std::string base;
    std::string query;
    std::string fragment;
    bool has_query = false;
    bool has_fragment = false;
};

UrlParts split(const std::string& url) {
    UrlParts parts;
    std::string rest = url;

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        parts.fragment = rest.substr(hash + 1);
        parts.has_fragment = true;
        rest.resize(hash);
    }

    auto q = rest.find('?');
    if (q != std::string::npos) {
        parts.query = rest.substr(q + 1);
        parts.has_query = true;
        rest.resize(q);
    }

    parts.base = std::move(rest);
    return parts;
}

std::string join(const UrlParts& parts) {
    std::string out = parts.base;
    if (parts.has_query) {
        out += '?';
        out += parts.query;
    }
    if (parts.has_fragment) {
        out += '#';
        out += parts.fragment;
    }
    return out;
}

}  // namespace

bool is_blank_source(const std::string& url) {
    if (url == "null") return true;
    return std::all_of(url.begin(), url.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string hostname(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return "";
    }

    size_t start = scheme_end + 3;
    size_t end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    auto colon = authority.find(':');
    if (colon != std::string::npos) {
        authority.resize(colon);
    }
    return to_lower(authority);
}

std::string append_query(const std::string& url, const std::string& params) {
    if (params.empty()) {
        return url;
    }

    UrlParts parts = split(url);
    if (!parts.has_query) {
        parts.has_query = true;
        parts.query = params;
    } else if (parts.query.empty() || parts.query.back() == '&') {
        parts.query += params;
    } else {
        parts.query += '&';
        parts.query += params;
    }
    return join(parts);
}

std::string remove_query_params(const std::string& url, const std::vector<std::string>& names) {
    UrlParts parts = split(url);
    if (!parts.has_query) {
        return url;
    }

    std::string kept;
    size_t pos = 0;
    while (pos <= parts.query.size()) {
        size_t amp = parts.query.find('&', pos);
        if (amp == std::string::npos) amp = parts.query.size();
        std::string param = parts.query.substr(pos, amp - pos);
        pos = amp + 1;

        if (param.empty()) continue;
        std::string name = param.substr(0, param.find('='));
        if (std::find(names.begin(), names.end(), name) != names.end()) continue;

        if (!kept.empty()) kept += '&';
        kept += param;
    }

    parts.query = kept;
    parts.has_query = !kept.empty();
    return join(parts);
}

model::MediaType classify_media(const std::string& url) {
    std::string lower = to_lower(url);
    if (lower.find(".mp4") != std::string::npos || lower.find(".webm") != std::string::npos ||
        lower.find(".mov") != std::string::npos || lower.find("video/") != std::string::npos) {
        return model::MediaType::Video;
    }
    if (lower.find(".gif") != std::string::npos) {
        return model::MediaType::Gif;
    }
    return model::MediaType::Image;
}

}  // namespace tessera::url
