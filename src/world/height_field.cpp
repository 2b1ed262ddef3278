#include "world/height_field.hpp"

#include <algorithm>
#include <cmath>

namespace salvo::world {

std::optional<Theme> parseTheme(const std::string& name) {
    if (name == "grassland") return Theme::Grassland;
    if (name == "desert")    return Theme::Desert;
    if (name == "arctic")    return Theme::Arctic;
    return std::nullopt;
}

const char* themeName(Theme theme) {
    switch (theme) {
        case Theme::Grassland: return "grassland";
        case Theme::Desert:    return "desert";
        case Theme::Arctic:    return "arctic";
    }
    return "unknown";
}

Vec3 HeightField::normalAt(f32 x, f32 z, f32 sampleDistance) const {
    const f32 hL = heightAt(x - sampleDistance, z);
    const f32 hR = heightAt(x + sampleDistance, z);
    const f32 hD = heightAt(x, z - sampleDistance);
    const f32 hU = heightAt(x, z + sampleDistance);

    const Vec3 normal{hL - hR, 2.0f * sampleDistance, hD - hU};
    return math::safeNormalize(normal);
}

// ============================================================================
// GridHeightField
// ============================================================================

GridHeightField::GridHeightField(f32 width, f32 depth, u32 segments, Theme theme)
    : m_width(width)
    , m_depth(depth)
    , m_segments(segments > 0 ? segments : 1)
    , m_theme(theme)
    , m_heights(static_cast<size_t>(m_segments + 1) * (m_segments + 1), 0.0f) {
}

void GridHeightField::generate(const std::function<f32(f32, f32)>& heightFn) {
    for (u32 z = 0; z <= m_segments; ++z) {
        for (u32 x = 0; x <= m_segments; ++x) {
            m_heights[index(x, z)] = heightFn(gridToWorldX(x), gridToWorldZ(z));
        }
    }
}

void GridHeightField::fill(f32 height) {
    std::fill(m_heights.begin(), m_heights.end(), height);
}

f32 GridHeightField::gridToWorldX(u32 gridX) const {
    return (static_cast<f32>(gridX) / static_cast<f32>(m_segments)) * m_width - m_width * 0.5f;
}

f32 GridHeightField::gridToWorldZ(u32 gridZ) const {
    return (static_cast<f32>(gridZ) / static_cast<f32>(m_segments)) * m_depth - m_depth * 0.5f;
}

f32 GridHeightField::getHeight(u32 gridX, u32 gridZ) const {
    return m_heights[index(std::min(gridX, m_segments), std::min(gridZ, m_segments))];
}

void GridHeightField::setHeight(u32 gridX, u32 gridZ, f32 height) {
    if (gridX > m_segments || gridZ > m_segments) {
        return;
    }
    m_heights[index(gridX, gridZ)] = height;
}

f32 GridHeightField::heightAt(f32 x, f32 z) const {
    const f32 segs = static_cast<f32>(m_segments);
    const f32 gridX = math::clamp(((x + m_width * 0.5f) / m_width) * segs, 0.0f, segs);
    const f32 gridZ = math::clamp(((z + m_depth * 0.5f) / m_depth) * segs, 0.0f, segs);

    const u32 x1 = static_cast<u32>(std::floor(gridX));
    const u32 z1 = static_cast<u32>(std::floor(gridZ));
    const u32 x2 = std::min(x1 + 1, m_segments);
    const u32 z2 = std::min(z1 + 1, m_segments);

    const f32 h11 = getHeight(x1, z1);
    const f32 h21 = getHeight(x2, z1);
    const f32 h12 = getHeight(x1, z2);
    const f32 h22 = getHeight(x2, z2);

    const f32 fx = gridX - static_cast<f32>(x1);
    const f32 fz = gridZ - static_cast<f32>(z1);
    const f32 h1 = h11 * (1.0f - fx) + h21 * fx;
    const f32 h2 = h12 * (1.0f - fx) + h22 * fx;
    return h1 * (1.0f - fz) + h2 * fz;
}

f32 GridHeightField::groundLevelAt(f32 x, f32 z) const {
    const f32 height = heightAt(x, z);
    if (m_theme == Theme::Arctic) {
        return std::max(height, ARCTIC_ICE_LEVEL);
    }
    return height;
}

std::vector<HeightPatchCell> GridHeightField::deform(f32 centerX, f32 centerZ, f32 radius, DeformMode mode) {
    std::vector<HeightPatchCell> patch;
    if (radius <= 0.0f) {
        return patch;
    }

    const f32 startHeight = heightAt(centerX, centerZ);
    const f32 halfRadius = radius * 0.5f;

    for (u32 z = 0; z <= m_segments; ++z) {
        for (u32 x = 0; x <= m_segments; ++x) {
            const f32 dx = gridToWorldX(x) - centerX;
            const f32 dz = gridToWorldZ(z) - centerZ;
            const f32 distance = std::sqrt(dx * dx + dz * dz);
            if (distance > radius) continue;

            const f32 currentHeight = m_heights[index(x, z)];
            f32 newHeight = currentHeight;

            switch (mode) {
                case DeformMode::Flatten: {
                    const f32 t = math::clamp(distance / radius, 0.0f, 1.0f);
                    const f32 blend = t * t * (3.0f - 2.0f * t);
                    newHeight = startHeight * (1.0f - blend) + currentHeight * blend;
                    break;
                }
                case DeformMode::Crater: {
                    // Full depth inside half the radius, quadratic rim outside it
                    const f32 blend = distance > halfRadius
                        ? 1.0f - (distance - halfRadius) / halfRadius
                        : 1.0f;
                    newHeight -= radius * blend * (distance <= halfRadius ? 1.0f : blend);
                    break;
                }
            }

            if (std::abs(newHeight - currentHeight) > 0.001f) {
                m_heights[index(x, z)] = newHeight;
                patch.push_back({index(x, z), newHeight});
            }
        }
    }

    return patch;
}

} // namespace salvo::world
