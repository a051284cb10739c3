#include "variants.h"

namespace roleicon::core {

const VariantSpec& variant_spec(Variant variant) {
    // k_variant_specs is ordered like the enum.
    return k_variant_specs[static_cast<size_t>(variant)];
}

std::string variant_base_name(Variant variant, std::string_view ns) {
    std::string name(variant_spec(variant).prefix);
    name += '_';
    name += ns;
    return name;
}

std::string variant_png_name(Variant variant, std::string_view ns) {
    return variant_base_name(variant, ns) + ".png";
}

} // namespace roleicon::core
