#include "url/VariantBuilder.hpp"
#include "url/UrlUtils.hpp"
#include <algorithm>
#include <cctype>

namespace tessera::url {

namespace {

constexpr int SRCSET_WIDTHS[] = {200, 400, 800, 1200, 1600};

}  // namespace

const char* to_string(SizeClass size) {
    switch (size) {
        case SizeClass::Thumb: return "thumb";
        case SizeClass::Small: return "small";
        case SizeClass::Medium: return "medium";
        case SizeClass::Large: return "large";
        case SizeClass::Full: return "full";
        case SizeClass::Blur: return "blur";
    }
    return "medium";
}

bool parse_size_class(const std::string& name, SizeClass& out) {
    for (SizeClass size : {SizeClass::Thumb, SizeClass::Small, SizeClass::Medium,
                           SizeClass::Large, SizeClass::Full, SizeClass::Blur}) {
        if (name == to_string(size)) {
            out = size;
            return true;
        }
    }
    return false;
}

SizeSpec size_spec(SizeClass size) {
    switch (size) {
        case SizeClass::Thumb:  return {100, 100, 40};
        case SizeClass::Small:  return {200, 200, 50};
        case SizeClass::Medium: return {400, 400, 70};
        case SizeClass::Large:  return {800, 800, 80};
        case SizeClass::Full:   return {1600, 1600, 85};
        case SizeClass::Blur:   return {20, 20, 20};
    }
    return {400, 400, 70};
}

std::vector<ProviderRule> VariantBuilder::default_rules() {
    std::vector<ProviderRule> rules;

    // c_limit keeps the aspect ratio; f_auto lets Cloudinary negotiate WebP/AVIF itself
    ProviderRule cloudinary;
    cloudinary.name = "cloudinary";
    cloudinary.hosts = {"cloudinary.com"};
    cloudinary.mode = RewriteMode::PathSegment;
    cloudinary.path_marker = "/upload/";
    cloudinary.width_key = "w_";
    cloudinary.height_key = "h_";
    cloudinary.quality_key = "q_";
    cloudinary.size_extras = {"c_limit"};
    cloudinary.extras = {"f_auto"};
    cloudinary.blur_effect = "e_blur:500";
    rules.push_back(cloudinary);

    ProviderRule supabase;
    supabase.name = "supabase";
    supabase.hosts = {"supabase.co", "supabase.in"};
    supabase.width_key = "width";
    supabase.height_key = "height";
    supabase.quality_key = "quality";
    supabase.extras = {"resize=cover"};
    supabase.next_gen_param = "format=webp";
    rules.push_back(supabase);

    // auto=format negotiates the format server-side
    ProviderRule imgix;
    imgix.name = "imgix";
    imgix.hosts = {"imgix.net"};
    imgix.width_key = "w";
    imgix.height_key = "h";
    imgix.quality_key = "q";
    imgix.extras = {"fit=crop", "auto=format"};
    rules.push_back(imgix);

    ProviderRule agencies;
    agencies.name = "model-agencies";
    agencies.hosts = {"matchmodels.co.uk", "modelhunt.co.uk"};
    agencies.width_key = "w";
    agencies.height_key = "h";
    agencies.quality_key = "q";
    agencies.next_gen_param = "format=webp";
    rules.push_back(agencies);

    // WordPress resizer honours w/q only and chokes on duplicates
    ProviderRule wordpress;
    wordpress.name = "wordpress";
    wordpress.hosts = {"edgetalent.co.uk", "wp-content"};
    wordpress.mode = RewriteMode::QueryReplace;
    wordpress.width_key = "w";
    wordpress.quality_key = "q";
    wordpress.strip_params = {"w", "q"};
    rules.push_back(wordpress);

    // Size hint for any other image URL; servers that do not resize ignore it
    ProviderRule generic;
    generic.name = "generic-image";
    generic.extensions = {".jpg", ".jpeg", ".png", ".webp", ".gif"};
    generic.mode = RewriteMode::QueryReplace;
    generic.width_key = "w";
    generic.quality_key = "q";
    generic.strip_params = {"q"};
    rules.push_back(generic);

    return rules;
}

VariantBuilder::VariantBuilder(FormatSupport next_gen_supported, std::vector<ProviderRule> rules)
    : next_gen_supported_(std::move(next_gen_supported)), rules_(std::move(rules)) {}

const ProviderRule* VariantBuilder::match(const std::string& original) const {
    if (is_blank_source(original)) {
        return nullptr;
    }
    std::string host = hostname(original);
    if (host.empty()) {
        return nullptr;
    }

    std::string path = original.substr(0, original.find('?'));
    std::transform(path.begin(), path.end(), path.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& rule : rules_) {
        for (const auto& pattern : rule.hosts) {
            if (host.find(pattern) != std::string::npos) {
                return &rule;
            }
        }
        for (const auto& ext : rule.extensions) {
            if (path.size() >= ext.size() && path.compare(path.size() - ext.size(), ext.size(), ext) == 0) {
                return &rule;
            }
        }
    }
    return nullptr;
}

std::string VariantBuilder::apply(const std::string& original, const ProviderRule& rule,
                                  int width, int height, int quality, bool blur) const {
    const bool next_gen = !rule.next_gen_param.empty() && next_gen_supported_ && next_gen_supported_();

    if (rule.mode == RewriteMode::PathSegment) {
        auto marker = original.find(rule.path_marker);
        if (rule.path_marker.empty() || marker == std::string::npos) {
            return original;
        }

        std::string segment = rule.width_key + std::to_string(width);
        if (height > 0 && !rule.height_key.empty()) {
            segment += "," + rule.height_key + std::to_string(height);
        }
        // A blurred placeholder is never size-limited
        if (!blur) {
            for (const auto& extra : rule.size_extras) {
                segment += "," + extra;
            }
        }
        if (quality > 0) {
            segment += "," + rule.quality_key + std::to_string(quality);
        } else {
            segment += "," + rule.quality_key + "auto";
        }
        if (blur && !rule.blur_effect.empty()) {
            segment += "," + rule.blur_effect;
        }
        for (const auto& extra : rule.extras) {
            segment += "," + extra;
        }
        if (next_gen) {
            segment += "," + rule.next_gen_param;
        }

        std::string out = original;
        out.insert(marker + rule.path_marker.size(), segment + "/");
        return out;
    }

    std::string base = original;
    if (rule.mode == RewriteMode::QueryReplace) {
        base = remove_query_params(base, rule.strip_params);
    }

    std::string params = rule.width_key + "=" + std::to_string(width);
    if (height > 0 && !rule.height_key.empty()) {
        params += "&" + rule.height_key + "=" + std::to_string(height);
    }
    for (const auto& extra : rule.size_extras) {
        params += "&" + extra;
    }
    if (quality > 0) {
        params += "&" + rule.quality_key + "=" + std::to_string(quality);
    }
    if (blur && !rule.blur_effect.empty()) {
        params += "&" + rule.blur_effect;
    }
    for (const auto& extra : rule.extras) {
        params += "&" + extra;
    }
    if (next_gen) {
        params += "&" + rule.next_gen_param;
    }

    return append_query(base, params);
}

std::string VariantBuilder::variant_url(const std::string& original, SizeClass size) const {
    const ProviderRule* rule = match(original);
    if (!rule) {
        return original;
    }
    SizeSpec spec = size_spec(size);
    return apply(original, *rule, spec.width, spec.height, spec.quality, size == SizeClass::Blur);
}

std::optional<std::string> VariantBuilder::blur_placeholder(const std::string& original) const {
    const ProviderRule* rule = match(original);
    if (!rule || rule->mode != RewriteMode::PathSegment ||
        original.find(rule->path_marker) == std::string::npos) {
        return std::nullopt;
    }
    return variant_url(original, SizeClass::Blur);
}

std::string VariantBuilder::responsive_srcset(const std::string& original) const {
    const ProviderRule* rule = match(original);
    if (!rule) {
        return "";
    }

    std::string srcset;
    for (int width : SRCSET_WIDTHS) {
        if (!srcset.empty()) srcset += ", ";
        srcset += apply(original, *rule, width, 0, 0, false) + " " + std::to_string(width) + "w";
    }
    return srcset;
}

}  // namespace tessera::url
