#pragma once

#include <array>
#include <string>
#include <string_view>

namespace roleicon::core {

enum class Variant { Tab, Score, Sprite, Icon };

// How a variant treats its template file in the template directory.
enum class TemplatePolicy {
    None,     // no canvas step; the layer itself is saved
    Ignored,  // always a blank canvas, even if the template file exists
    Optional, // template used as canvas when present, blank canvas otherwise
};

struct VariantSpec {
    Variant variant;
    std::string_view prefix;
    int default_size;
    int blur_radius;
    int shadow_offset;
    int margin;
    std::string_view template_name;
    TemplatePolicy template_policy;
};

// Output order. Score keeps a zero margin and never reads its template; the
// icon margin of 10 is the current value.
inline constexpr std::array<VariantSpec, 4> k_variant_specs = {{
    {Variant::Tab, "tab", 16, 0, 0, 0, "", TemplatePolicy::None},
    {Variant::Score, "score", 64, 0, 0, 0, "score_template.png", TemplatePolicy::Ignored},
    {Variant::Sprite, "sprite", 256, 3, 2, 3, "sprite_template.png", TemplatePolicy::Optional},
    {Variant::Icon, "icon", 256, 5, 4, 10, "icon_template.png", TemplatePolicy::Optional},
}};

const VariantSpec& variant_spec(Variant variant);

// "<prefix>_<ns>", e.g. sprite_traitor.
std::string variant_base_name(Variant variant, std::string_view ns);
std::string variant_png_name(Variant variant, std::string_view ns);

} // namespace roleicon::core
