#include "SliceRender/SliceUniforms.h"
#include <glm/gtc/type_ptr.hpp>
#include <cstring>
#include <fstream>

namespace Octaview::SliceRender {

SliceUniforms makeSliceUniforms(const SampledSlice& sampled, const CameraState& camera,
                                float fov, const Viewport& viewport) {
    SliceUniforms uniforms;
    uniforms.projection = makeProjectionMatrix(fov, viewport);
    uniforms.view = makeViewMatrix(camera);
    uniforms.resolution = glm::vec2(static_cast<float>(viewport.width),
                                    static_cast<float>(viewport.height));
    uniforms.fov = fov;
    uniforms.sliceOrigin = sampled.geometry.origin;
    uniforms.step = sampled.geometry.step;
    uniforms.slice = sampled.voxels;
    return uniforms;
}

namespace {

void writeBytes(std::vector<uint8_t>& block, size_t offset, const void* src, size_t size) {
    std::memcpy(block.data() + offset, src, size);
}

} // namespace

std::vector<uint8_t> packStd140(const SliceUniforms& uniforms) {
    std::vector<uint8_t> block(Std140::BLOCK_SIZE, 0);

    // glm matrices are column-major, matching std140 mat4
    writeBytes(block, Std140::PROJECTION_OFFSET, glm::value_ptr(uniforms.projection), sizeof(glm::mat4));
    writeBytes(block, Std140::VIEW_OFFSET, glm::value_ptr(uniforms.view), sizeof(glm::mat4));
    writeBytes(block, Std140::RESOLUTION_OFFSET, glm::value_ptr(uniforms.resolution), sizeof(glm::vec2));
    writeBytes(block, Std140::FOV_OFFSET, &uniforms.fov, sizeof(float));
    writeBytes(block, Std140::SLICE_ORIGIN_OFFSET, glm::value_ptr(uniforms.sliceOrigin), sizeof(glm::vec3));
    writeBytes(block, Std140::STEP_OFFSET, glm::value_ptr(uniforms.step), sizeof(glm::vec3));

    for (size_t i = 0; i < SLICE_VOXEL_COUNT; ++i) {
        writeBytes(block, Std140::SLICE_OFFSET + i * Std140::SLICE_STRIDE,
                   &uniforms.slice[i], sizeof(uint32_t));
    }

    return block;
}

bool writeStd140(const SliceUniforms& uniforms, const std::filesystem::path& path, std::string& error) {
    const std::vector<uint8_t> block = packStd140(uniforms);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        error = "Failed to open " + path.string() + " for writing";
        return false;
    }

    file.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(block.size()));
    if (!file) {
        error = "Failed to write uniform block to " + path.string();
        return false;
    }

    return true;
}

} // namespace Octaview::SliceRender
