#pragma once
#include "core/Error.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace STS::Asset {

using Rgb = std::array<double, 3>; // 0..1 per channel
using Lab = std::array<double, 3>;

[[nodiscard]] auto rgbToLab(Rgb const& rgb) -> Lab;
[[nodiscard]] auto labToRgb(Lab const& lab) -> Rgb;

/*
 * Control points sorted by data value. Lookups between two points are
 * interpolated in CIELab space; values outside the range clamp to the end
 * colors. An empty map is black.
 */
class Colormap {
public:
    void addControlPoint(double value, Rgb color);
    [[nodiscard]] auto lookup(double value) const -> Rgb;
    [[nodiscard]] auto size() const -> std::size_t { return points.size(); }

    // Reads <ColorMaps><ColorMap><Point x r g b/>...</ColorMap></ColorMaps>,
    // or a bare <ColorMap> root.
    [[nodiscard]] static auto fromXml(std::string_view xml) -> Expected<Colormap>;

private:
    std::vector<std::pair<double, Rgb>> points;
};

// Packed RGB8 rows; each column samples the map at col / width.
[[nodiscard]] auto renderColormap(Colormap const& colormap, int width, int height) -> std::vector<std::uint8_t>;

auto writeRgbPng(std::span<const std::uint8_t> pixels, int width, int height, std::filesystem::path const& path)
    -> Expected<void>;

auto writeColormapPreview(std::string_view xml, int width, int height, std::filesystem::path const& path)
    -> Expected<void>;

} // namespace STS::Asset
