#include "asset/ColormapPreview.hpp"
#include "utils/FileUtils.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <optional>
#include <string>

namespace STS::Asset {

namespace {

// D65 reference white.
constexpr double RefX = 0.95047;
constexpr double RefY = 1.00000;
constexpr double RefZ = 1.08883;

auto pivotXyz(double v) -> double {
    return v > 0.008856 ? std::cbrt(v) : (7.787 * v) + 16.0 / 116.0;
}

auto unpivotXyz(double v) -> double {
    auto cube = v * v * v;
    return cube > 0.008856 ? cube : (v - 16.0 / 116.0) / 7.787;
}

auto linearize(double c) -> double {
    return c > 0.04045 ? std::pow((c + 0.055) / 1.055, 2.4) : c / 12.92;
}

auto compand(double c) -> double {
    return c > 0.0031308 ? 1.055 * std::pow(c, 1.0 / 2.4) - 0.055 : 12.92 * c;
}

auto parseDouble(std::string_view text) -> std::optional<double> {
    while (!text.empty() && (text.front() == ' ' || text.front() == '+'))
        text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')
        text.remove_suffix(1);
    double value = 0.0;
    auto   end   = text.data() + text.size();
    auto   res   = std::from_chars(text.data(), end, value);
    if (text.empty() || res.ec != std::errc{} || res.ptr != end)
        return std::nullopt;
    return value;
}

// Value of `name="..."` (or single quotes) inside one start tag.
auto attributeValue(std::string_view tag, std::string_view name) -> std::optional<std::string_view> {
    std::size_t pos = 0;
    while ((pos = tag.find(name, pos)) != std::string_view::npos) {
        bool boundary = pos > 0 && (tag[pos - 1] == ' ' || tag[pos - 1] == '\t' || tag[pos - 1] == '\n'
                                    || tag[pos - 1] == '\r');
        auto cursor = pos + name.size();
        while (cursor < tag.size() && tag[cursor] == ' ')
            ++cursor;
        if (!boundary || cursor >= tag.size() || tag[cursor] != '=') {
            pos += name.size();
            continue;
        }
        ++cursor;
        while (cursor < tag.size() && tag[cursor] == ' ')
            ++cursor;
        if (cursor >= tag.size() || (tag[cursor] != '"' && tag[cursor] != '\''))
            return std::nullopt;
        auto quote = tag[cursor];
        auto close = tag.find(quote, cursor + 1);
        if (close == std::string_view::npos)
            return std::nullopt;
        return tag.substr(cursor + 1, close - cursor - 1);
    }
    return std::nullopt;
}

auto toByte(double c) -> std::uint8_t {
    return static_cast<std::uint8_t>(std::clamp(static_cast<int>(c * 255.0), 0, 255));
}

} // namespace

auto rgbToLab(Rgb const& rgb) -> Lab {
    auto r = linearize(rgb[0]);
    auto g = linearize(rgb[1]);
    auto b = linearize(rgb[2]);

    auto x = pivotXyz((r * 0.4124 + g * 0.3576 + b * 0.1805) / RefX);
    auto y = pivotXyz((r * 0.2126 + g * 0.7152 + b * 0.0722) / RefY);
    auto z = pivotXyz((r * 0.0193 + g * 0.1192 + b * 0.9505) / RefZ);

    return Lab{(116.0 * y) - 16.0, 500.0 * (x - y), 200.0 * (y - z)};
}

auto labToRgb(Lab const& lab) -> Rgb {
    auto y = (lab[0] + 16.0) / 116.0;
    auto x = lab[1] / 500.0 + y;
    auto z = y - lab[2] / 200.0;

    x = RefX * unpivotXyz(x);
    y = RefY * unpivotXyz(y);
    z = RefZ * unpivotXyz(z);

    auto r = compand(x * 3.2406 + y * -1.5372 + z * -0.4986);
    auto g = compand(x * -0.96890 + y * 1.8758 + z * 0.0415);
    auto b = compand(x * 0.05570 + y * -0.2040 + z * 1.0570);

    return Rgb{std::clamp(r, 0.0, 1.0), std::clamp(g, 0.0, 1.0), std::clamp(b, 0.0, 1.0)};
}

void Colormap::addControlPoint(double value, Rgb color) {
    auto it = std::upper_bound(points.begin(), points.end(), value, [](double v, auto const& point) {
        return v < point.first;
    });
    points.insert(it, {value, color});
}

auto Colormap::lookup(double value) const -> Rgb {
    if (points.empty())
        return Rgb{0.0, 0.0, 0.0};
    if (points.size() == 1 || value <= points.front().first)
        return points.front().second;
    if (value >= points.back().first)
        return points.back().second;

    std::size_t upper = 1;
    while (points[upper].first < value)
        ++upper;
    auto const& [v1, c1] = points[upper - 1];
    auto const& [v2, c2] = points[upper];

    auto const lab1  = rgbToLab(c1);
    auto const lab2  = rgbToLab(c2);
    auto const alpha = (value - v1) / (v2 - v1);
    Lab        mixed{};
    for (std::size_t i = 0; i < mixed.size(); ++i)
        mixed[i] = lab1[i] * (1.0 - alpha) + lab2[i] * alpha;
    return labToRgb(mixed);
}

auto Colormap::fromXml(std::string_view xml) -> Expected<Colormap> {
    Colormap    colormap;
    std::size_t pos = 0;
    while ((pos = xml.find("<Point", pos)) != std::string_view::npos) {
        auto end = xml.find('>', pos);
        if (end == std::string_view::npos)
            return std::unexpected(Error{Error::Code::MalformedInput, "Unterminated <Point> element"});
        auto tag = xml.substr(pos, end - pos);
        pos      = end + 1;
        if (tag.size() > 6 && tag[6] != ' ' && tag[6] != '/' && tag[6] != '\t' && tag[6] != '\n')
            continue; // e.g. <Points>

        std::array<double, 4> values{};
        constexpr std::array<std::string_view, 4> names{"x", "r", "g", "b"};
        for (std::size_t i = 0; i < names.size(); ++i) {
            auto raw = attributeValue(tag, names[i]);
            auto num = raw ? parseDouble(*raw) : std::nullopt;
            if (!num) {
                return std::unexpected(Error{Error::Code::MalformedInput,
                                             "Colormap point is missing a numeric '" + std::string{names[i]}
                                                 + "' attribute"});
            }
            values[i] = *num;
        }
        colormap.addControlPoint(values[0], Rgb{values[1], values[2], values[3]});
    }
    if (colormap.size() == 0)
        return std::unexpected(Error{Error::Code::MalformedInput, "Colormap has no control points"});
    return colormap;
}

auto renderColormap(Colormap const& colormap, int width, int height) -> std::vector<std::uint8_t> {
    if (width <= 0 || height <= 0)
        return {};
    auto const rowBytes = static_cast<std::size_t>(width) * 3u;
    std::vector<std::uint8_t> pixels(rowBytes * static_cast<std::size_t>(height));
    for (int col = 0; col < width; ++col) {
        auto color                                  = colormap.lookup(static_cast<double>(col) / width);
        pixels[static_cast<std::size_t>(col) * 3u]      = toByte(color[0]);
        pixels[static_cast<std::size_t>(col) * 3u + 1u] = toByte(color[1]);
        pixels[static_cast<std::size_t>(col) * 3u + 2u] = toByte(color[2]);
    }
    for (int row = 1; row < height; ++row)
        std::copy_n(pixels.begin(), rowBytes, pixels.begin() + static_cast<std::ptrdiff_t>(rowBytes * row));
    return pixels;
}

auto writeRgbPng(std::span<const std::uint8_t> pixels, int width, int height, std::filesystem::path const& path)
    -> Expected<void> {
    if (width <= 0 || height <= 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Invalid preview dimensions"});
    }
    auto rowBytes = static_cast<std::size_t>(width) * 3u;
    if (pixels.size() != rowBytes * static_cast<std::size_t>(height)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Preview pixel buffer has unexpected length"});
    }
    if (auto dir = Utils::ensureParentDirectory(path); !dir) {
        return dir;
    }
    if (stbi_write_png(path.string().c_str(), width, height, 3, pixels.data(), static_cast<int>(rowBytes)) == 0) {
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to encode preview png " + path.string()});
    }
    return {};
}

auto writeColormapPreview(std::string_view xml, int width, int height, std::filesystem::path const& path)
    -> Expected<void> {
    auto colormap = Colormap::fromXml(xml);
    if (!colormap)
        return std::unexpected(colormap.error());
    auto pixels = renderColormap(*colormap, width, height);
    return writeRgbPng(std::span<const std::uint8_t>(pixels.data(), pixels.size()), width, height, path);
}

} // namespace STS::Asset
