#include <gfxhal/pipeline_desc.hpp>

#include <cstring>
#include <fstream>

namespace gfxhal {

ShaderSource ShaderSource::fromWords(ShaderStage stage, const std::vector<std::uint32_t>& words,
                                     std::string entryPoint) {
    ShaderSource s;
    s.stage = stage;
    s.bytecode.resize(words.size() * sizeof(std::uint32_t));
    if (!words.empty()) std::memcpy(s.bytecode.data(), words.data(), s.bytecode.size());
    s.entryPoint = std::move(entryPoint);
    return s;
}

ShaderSource ShaderSource::fromText(ShaderStage stage, std::string_view text,
                                    std::string entryPoint) {
    ShaderSource s;
    s.stage = stage;
    s.bytecode.assign(text.begin(), text.end());
    s.entryPoint = std::move(entryPoint);
    return s;
}

Result<ShaderSource> ShaderSource::fromFile(ShaderStage stage, const std::filesystem::path& path,
                                            std::string entryPoint) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error{"read shader", ErrorCode::InvalidUsage, 0,
                     "could not open file: " + path.string()};
    }

    auto pos = file.tellg();
    if (pos <= 0) {
        return Error{"read shader", ErrorCode::InvalidUsage, 0,
                     "file is empty or unreadable: " + path.string()};
    }

    ShaderSource s;
    s.stage = stage;
    s.entryPoint = std::move(entryPoint);
    s.bytecode.resize(static_cast<std::size_t>(pos));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(s.bytecode.data()),
              static_cast<std::streamsize>(s.bytecode.size()));
    return s;
}

} // namespace gfxhal
