#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace roleicon::core {

constexpr std::string_view k_material_base_path = "vgui/ttt/roles";

struct DescriptorSpec {
    std::string file_name;
    std::string texture;
    bool ignore_z = false;
};

// The three materials for `ns`: sprite, sprite_noz and icon.
std::vector<DescriptorSpec> descriptor_specs(std::string_view ns);

// UnlitGeneric material text; `$ignorez 1` only when ignore_z is set.
std::string build_descriptor_text(std::string_view ns, const std::string& texture, bool ignore_z);

bool generate_descriptors(const std::filesystem::path& output_dir,
                          std::string_view ns,
                          std::vector<std::filesystem::path>& written,
                          std::string& error);

} // namespace roleicon::core
