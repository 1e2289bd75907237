#include "core/log.h"
#include "render/pipeline_variants.h"
#include "render/render_config.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

// Build-time tool: compiles every chunk shader variant the Vulkan backend loads.
// Usage: voxquad_shaderc <slangc> <shader-source-dir> <output-dir>
//        voxquad_shaderc --list
// Orientation masks and atlas layout come from the VOXQUAD_* environment overrides.
namespace {

const char* slangStageName(voxquad::render::ShaderStage stage) {
    switch (stage) {
    case voxquad::render::ShaderStage::Vertex:
        return "vertex";
    case voxquad::render::ShaderStage::Fragment:
        return "fragment";
    case voxquad::render::ShaderStage::Compute:
    default:
        return "compute";
    }
}

std::string quoted(std::string_view text) {
    std::string result = "\"";
    result += text;
    result += "\"";
    return result;
}

std::string slangCommand(
    const std::string& slangc,
    const std::filesystem::path& sourceDir,
    const std::filesystem::path& outputDir,
    const voxquad::render::ChunkShaderVariant& variant
) {
    std::string command = ::quoted(slangc);
    command += " " + ::quoted((sourceDir / variant.sourceFile).string());
    command += " -target spirv -entry main -stage ";
    command += slangStageName(variant.stage);
    command += " -I " + ::quoted(sourceDir.string());
    for (const voxquad::render::ShaderDefine& define : variant.defines) {
        command += " " + voxquad::render::formatDefineArgument(define);
    }
    command += " -o " + ::quoted((outputDir / variant.outputFile).string());
    return command;
}

} // namespace

int main(int argc, char** argv) {
    voxquad::core::initializeLogLevelFromEnvironment();

    voxquad::render::RenderConfig config{};
    voxquad::render::applyEnvironmentOverrides(config);
    const std::vector<voxquad::render::ChunkShaderVariant> variants =
        voxquad::render::chunkShaderVariants(config, voxquad::render::defaultChunkPipelineKeys());

    if (argc == 2 && std::string_view(argv[1]) == "--list") {
        for (const voxquad::render::ChunkShaderVariant& variant : variants) {
            std::cout << variant.outputFile << "\n";
        }
        return 0;
    }
    if (argc != 4) {
        VQ_LOGE("shaderc") << "usage: voxquad_shaderc <slangc> <shader-source-dir> <output-dir> | --list";
        return 2;
    }

    const std::string slangc = argv[1];
    const std::filesystem::path sourceDir = argv[2];
    const std::filesystem::path outputDir = argv[3];

    std::error_code error;
    std::filesystem::create_directories(outputDir, error);
    if (error) {
        VQ_LOGE("shaderc") << "cannot create " << outputDir.string() << ": " << error.message();
        return 1;
    }

    int failures = 0;
    for (const voxquad::render::ChunkShaderVariant& variant : variants) {
        const std::string command = slangCommand(slangc, sourceDir, outputDir, variant);
        VQ_LOGD("shaderc") << command;
        const int status = std::system(command.c_str());
        if (status != 0) {
            VQ_LOGE("shaderc") << "slangc failed (" << status << ") for " << variant.outputFile;
            ++failures;
            continue;
        }
        VQ_LOGI("shaderc") << "compiled " << variant.outputFile;
    }

    if (failures != 0) {
        VQ_LOGE("shaderc") << failures << " of " << variants.size() << " shader variants failed";
        return 1;
    }
    return 0;
}
