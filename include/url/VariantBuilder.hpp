#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tessera::url {

enum class SizeClass {
    Thumb,
    Small,
    Medium,
    Large,
    Full,
    Blur,   // LQIP placeholder
};

struct SizeSpec {
    int width;
    int height;
    int quality;
};

const char* to_string(SizeClass size);
bool parse_size_class(const std::string& name, SizeClass& out);
SizeSpec size_spec(SizeClass size);

enum class RewriteMode {
    PathSegment,   // Insert a transformation segment after a path marker
    QueryAppend,   // Append parameters to the query string
    QueryReplace,  // Drop strip_params from the query, then append
};

// How one CDN provider expects size and quality to be requested.
// These encode observed provider behaviour and are data, not logic: add or
// adjust entries rather than generalising the rewrite code.
struct ProviderRule {
    std::string name;
    std::vector<std::string> hosts;        // Matched as hostname substrings
    std::vector<std::string> extensions;   // Or matched by path suffix (".jpg"), case-insensitive
    RewriteMode mode = RewriteMode::QueryAppend;
    std::string path_marker;               // PathSegment only, e.g. "/upload/"
    std::string width_key;                 // "w_" for path segments, "w" for queries
    std::string height_key;                // Empty: provider gets width only
    std::string quality_key;
    std::vector<std::string> size_extras;  // Between size and quality, e.g. "c_limit"
    std::vector<std::string> extras;       // After quality
    std::vector<std::string> strip_params; // QueryReplace only
    std::string blur_effect;               // Added for SizeClass::Blur when set
    std::string next_gen_param;            // Added only when the runtime decodes WebP
};

/**
 * Maps (original URL, size class) to a CDN-transformed URL.
 *
 * The first rule whose host pattern (or path extension) matches wins;
 * unmatched URLs, relative URLs and blank sources pass through unchanged. Output is deterministic for
 * a given rule table and format-support answer.
 *
 * Applying a variant to its own output is not guarded against: query rules
 * append their parameters a second time and path rules insert a second
 * transformation segment. QueryReplace rules are stable only when they
 * strip every key they add.
 */
class VariantBuilder {
public:
    using FormatSupport = std::function<bool()>;

    explicit VariantBuilder(FormatSupport next_gen_supported = {},
                            std::vector<ProviderRule> rules = default_rules());

    std::string variant_url(const std::string& original, SizeClass size) const;

    // Tiny blurred preview for providers with a path-segment rule, else nullopt
    std::optional<std::string> blur_placeholder(const std::string& original) const;

    // "url 200w, url 400w, ..." for matched providers, empty otherwise
    std::string responsive_srcset(const std::string& original) const;

    const std::vector<ProviderRule>& rules() const { return rules_; }

    static std::vector<ProviderRule> default_rules();

private:
    const ProviderRule* match(const std::string& original) const;
    std::string apply(const std::string& original, const ProviderRule& rule,
                      int width, int height, int quality, bool blur) const;

    FormatSupport next_gen_supported_;
    std::vector<ProviderRule> rules_;
};

}  // namespace tessera::url
