#pragma once

/**
 * @file height_field.hpp
 * @brief Terrain height queries and deformation
 */

#include "core/types.hpp"
#include "core/math/math.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace salvo::world {

/// Terrain deformation operation
enum class DeformMode : u8 {
    Flatten,    ///< Smoothly level the area to the height at the center
    Crater      ///< Dig a bowl of depth `radius`
};

/// Map theme (affects the collision floor)
enum class Theme : u8 {
    Grassland,
    Desert,
    Arctic      ///< Frozen water plane: nothing sinks below ARCTIC_ICE_LEVEL
};

constexpr f32 ARCTIC_ICE_LEVEL = -1.0f;

std::optional<Theme> parseTheme(const std::string& name);
const char* themeName(Theme theme);

/**
 * @brief One grid vertex changed by a deformation
 */
struct HeightPatchCell {
    u32 index;      ///< z * (segments + 1) + x
    f32 height;     ///< New height
};

/**
 * @brief Height field collaborator
 *
 * Answers ground queries for the projectile simulator and applies craters
 * when impacts are played back.
 */
class HeightField {
public:
    virtual ~HeightField() = default;

    /// Raw terrain height at a world position
    virtual f32 heightAt(f32 x, f32 z) const = 0;

    /// Height a projectile collides with (terrain or theme floor)
    virtual f32 groundLevelAt(f32 x, f32 z) const { return heightAt(x, z); }

    /// Deform the terrain, returning the cells that changed
    virtual std::vector<HeightPatchCell> deform(f32 x, f32 z, f32 radius, DeformMode mode) = 0;

    /// Surface normal from the height gradient (central differences)
    Vec3 normalAt(f32 x, f32 z, f32 sampleDistance = 1.0f) const;
};

/**
 * @brief Regular grid height field with bilinear sampling
 *
 * The grid covers [-width/2, width/2] x [-depth/2, depth/2] with
 * (segments + 1)^2 vertices.
 */
class GridHeightField final : public HeightField {
public:
    GridHeightField(f32 width, f32 depth, u32 segments, Theme theme = Theme::Grassland);

    /// Fill every vertex from a function of world (x, z)
    void generate(const std::function<f32(f32, f32)>& heightFn);

    /// Set every vertex to the same height
    void fill(f32 height);

    f32 heightAt(f32 x, f32 z) const override;
    f32 groundLevelAt(f32 x, f32 z) const override;
    std::vector<HeightPatchCell> deform(f32 x, f32 z, f32 radius, DeformMode mode) override;

    f32 getHeight(u32 gridX, u32 gridZ) const;
    void setHeight(u32 gridX, u32 gridZ, f32 height);

    f32 gridToWorldX(u32 gridX) const;
    f32 gridToWorldZ(u32 gridZ) const;

    f32 getWidth() const { return m_width; }
    f32 getDepth() const { return m_depth; }
    u32 getSegments() const { return m_segments; }
    Theme getTheme() const { return m_theme; }
    const std::vector<f32>& getHeightData() const { return m_heights; }

private:
    u32 index(u32 gridX, u32 gridZ) const { return gridZ * (m_segments + 1) + gridX; }

    f32 m_width;
    f32 m_depth;
    u32 m_segments;
    Theme m_theme;
    std::vector<f32> m_heights;
};

} // namespace salvo::world
