#pragma once

#include "SliceRender/SliceTypes.h"
#include "SliceRender/SliceCamera.h"
#include <glm/glm.hpp>
#include <optional>

namespace Octaview::SliceRender {

/**
 * Named output colours (RGBA, 0-1).
 */
struct CasterPalette {
    glm::vec4 hit{1.0f, 1.0f, 1.0f, 1.0f};           // scaled by opacity/255
    glm::vec4 miss{0.05f, 0.05f, 0.08f, 1.0f};       // ray outside slice footprint
    glm::vec4 background{0.0f, 0.0f, 0.0f, 0.0f};    // column with no opaque voxel
};

enum class CastStatus {
    Hit,
    ColumnEmpty,
    OutsideFootprint
};

const char* CastStatusToString(CastStatus status);

struct CastResult {
    CastStatus status = CastStatus::OutsideFootprint;
    glm::vec4 color{0.0f};
    uint32_t column = 0;   // sliceIndex(x, y, 0) of the column, valid unless OutsideFootprint
    uint32_t z = 0;        // valid for Hit
    uint8_t opacity = 0;   // valid for Hit
};

/**
 * Per-frame inputs shared by every pixel.
 */
struct CastParameters {
    glm::mat4 projection{1.0f};
    glm::mat4 view{1.0f};
    Viewport viewport;
    SliceGeometry geometry;

    static CastParameters FromCamera(const CameraState& camera, float fov,
                                     const Viewport& viewport, const SliceGeometry& geometry);
};

// Short-circuit scan over z = 0..7 for the first non-zero opacity.
std::optional<uint32_t> firstOpaqueInColumn(const Slice& slice, uint32_t x, uint32_t y);

/**
 * CPU implementation of the per-pixel slice caster.
 *
 * For a pixel, the ray from the eye through the pixel is intersected with the
 * plane through the camera-space slice origin whose normal is the ray itself.
 * The intersection offset, divided by the camera-space step, gives the
 * continuous slice index. Integer (x, y) select a column, which is scanned
 * for the first non-zero opacity.
 *
 * Per-frame values (inverse projection, camera-space origin and step) are
 * computed once in the constructor. castPixel is const and may be called
 * concurrently from any number of threads.
 */
class SliceCaster {
public:
    SliceCaster(const Slice& slice, const CastParameters& params,
                const CasterPalette& palette = CasterPalette{});

    /**
     * Continuous slice-space index for a pixel.
     * @param fragCoord Pixel position, bottom-left origin, centres at +0.5
     */
    glm::vec3 sliceSpaceIndex(const glm::vec2& fragCoord) const;

    // Column hit by the pixel's ray, or nullopt when outside [0,8) on x or y.
    std::optional<glm::uvec2> locateColumn(const glm::vec2& fragCoord) const;

    CastResult castPixel(const glm::vec2& fragCoord) const;

    const CastParameters& parameters() const { return m_params; }
    const CasterPalette& palette() const { return m_palette; }

private:
    glm::vec3 rayDirection(const glm::vec2& fragCoord) const;

    Slice m_slice;
    CastParameters m_params;
    CasterPalette m_palette;

    glm::mat4 m_inverseProjection{1.0f};
    glm::vec3 m_cameraOrigin{0.0f};
    glm::vec3 m_cameraStep{0.0f};
};

} // namespace Octaview::SliceRender
