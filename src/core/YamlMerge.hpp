#pragma once

#include <yaml-cpp/yaml.h>

namespace mdq {

// Overlay wins. Maps merge key by key; sequences and scalars are replaced
// whole. Keys absent from the overlay keep their defaults.
inline YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (!base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        merged[key] = merged[key] ? mergeYaml(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

} // namespace mdq
