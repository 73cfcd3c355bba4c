// =============================================================================
// lrf - Common Type Helpers
// =============================================================================

#include "lrf/common/types.h"

#include <charconv>
#include <format>
#include <string_view>

namespace lrf {

namespace {

/// @brief Parse a signed 32-bit decimal that must consume the whole view.
std::optional<std::int32_t> parseInt32(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::int32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string regionFileName(RegionCoord coord) {
    return std::format("r.{}.{}{}", coord.x, coord.z, kRegionFileExtension);
}

std::optional<RegionCoord> parseRegionFileName(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    std::string_view view(name);

    if (!view.starts_with("r.") || !view.ends_with(kRegionFileExtension)) {
        return std::nullopt;
    }
    view.remove_prefix(2);
    view.remove_suffix(kRegionFileExtension.size());

    const auto dot = view.find('.');
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }

    auto x = parseInt32(view.substr(0, dot));
    auto z = parseInt32(view.substr(dot + 1));
    if (!x || !z) {
        return std::nullopt;
    }
    return RegionCoord{*x, *z};
}

}  // namespace lrf
