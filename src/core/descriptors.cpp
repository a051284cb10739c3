#include "descriptors.h"

#include <fstream>

#include "cli_parse.h"
#include "variants.h"

namespace fs = std::filesystem;

namespace roleicon::core {

std::vector<DescriptorSpec> descriptor_specs(std::string_view ns) {
    const std::string sprite = variant_base_name(Variant::Sprite, ns);
    const std::string icon = variant_base_name(Variant::Icon, ns);
    return {
        {sprite + ".vmt", sprite, false},
        {sprite + "_noz.vmt", sprite, true},
        {icon + ".vmt", icon, false},
    };
}

std::string build_descriptor_text(std::string_view ns, const std::string& texture, bool ignore_z) {
    std::string out;
    out += "\"UnlitGeneric\"\n";
    out += "{\n";
    out += "\t\"$basetexture\" \"";
    out += k_material_base_path;
    out += '/';
    out += ns;
    out += '/';
    out += texture;
    out += "\"\n";
    out += "\t$nocull 1\n";
    if (ignore_z) {
        out += "\t$ignorez 1\n";
    }
    out += "\t$nodecal 1\n";
    out += "\t$nolod 1\n";
    out += "\t$vertexcolor 1\n";
    out += "\t$vertexalpha 1\n";
    out += "\t$translucent 1\n";
    out += "}\n";
    return out;
}

bool generate_descriptors(const fs::path& output_dir,
                          std::string_view ns,
                          std::vector<fs::path>& written,
                          std::string& error) {
    written.clear();
    for (const DescriptorSpec& spec : descriptor_specs(ns)) {
        const fs::path path = output_dir / spec.file_name;
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            error = "Failed to open " + to_quoted(path.string()) + " for writing";
            return false;
        }
        file << build_descriptor_text(ns, spec.texture, spec.ignore_z);
        file.close();
        if (!file) {
            error = "Failed to write " + to_quoted(path.string());
            return false;
        }
        written.push_back(path);
    }
    return true;
}

} // namespace roleicon::core
