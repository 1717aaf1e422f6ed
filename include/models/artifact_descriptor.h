#pragma once

#include <cstdint>
#include <string>

namespace modelfetch {

// Supplied by the registry; never modified by the pipeline.
struct ArtifactDescriptor {
    std::string name;
    std::string version;
    std::string url;
    std::string sha256;
    uint64_t size{0};
    std::string format;
    int dimensions{0};

    // name@version, the key for transfers, cache entries and fallbacks.
    std::string key() const { return name + "@" + version; }

    // <name>-<version>.<format>
    std::string fileName() const {
        std::string out = name + "-" + version;
        if (!format.empty()) out += "." + format;
        return out;
    }

    std::string partialFileName() const { return fileName() + ".partial"; }
};

inline bool operator==(const ArtifactDescriptor& a, const ArtifactDescriptor& b) {
    return a.name == b.name && a.version == b.version && a.url == b.url && a.sha256 == b.sha256 &&
           a.size == b.size && a.format == b.format && a.dimensions == b.dimensions;
}

inline bool operator!=(const ArtifactDescriptor& a, const ArtifactDescriptor& b) {
    return !(a == b);
}

}  // namespace modelfetch
