// SPIRV-Reflect: compiled as a single translation unit, same pattern as VMA.
// Suppress warnings from third-party code.
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-variable"
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wswitch"
#pragma GCC diagnostic ignored "-Wunused-function"
#pragma GCC diagnostic ignored "-Woverflow"
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif
#endif

#include <spirv_reflect.h>
#include <spirv_reflect.c>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include "device.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gfxhal::vulkan::detail {

namespace {

std::optional<DescriptorKind> kindOf(SpvReflectDescriptorType t) {
    switch (t) {
    case SPV_REFLECT_DESCRIPTOR_TYPE_SAMPLER:
        return DescriptorKind::Sampler;
    case SPV_REFLECT_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER:
        return DescriptorKind::CombinedImageSampler;
    case SPV_REFLECT_DESCRIPTOR_TYPE_SAMPLED_IMAGE:
        return DescriptorKind::SampledImage;
    case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_IMAGE:
        return DescriptorKind::StorageImage;
    case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_TEXEL_BUFFER:
        return DescriptorKind::UniformTexelBuffer;
    case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_TEXEL_BUFFER:
        return DescriptorKind::StorageTexelBuffer;
    case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_BUFFER:
        return DescriptorKind::UniformBuffer;
    case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_BUFFER:
        return DescriptorKind::StorageBuffer;
    case SPV_REFLECT_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC:
        return DescriptorKind::UniformBufferDynamic;
    case SPV_REFLECT_DESCRIPTOR_TYPE_STORAGE_BUFFER_DYNAMIC:
        return DescriptorKind::StorageBufferDynamic;
    case SPV_REFLECT_DESCRIPTOR_TYPE_INPUT_ATTACHMENT:
        return DescriptorKind::InputAttachment;
    default:
        return std::nullopt;
    }
}

// glslang puts NonWritable on each member of a readonly buffer block and on
// the variable of a readonly image.
bool writable(const SpvReflectDescriptorBinding& b, DescriptorKind kind) {
    if (!isStorageKind(kind)) return false;
    if (b.decoration_flags & SPV_REFLECT_DECORATION_NON_WRITABLE) return false;
    if (b.block.member_count == 0) return true;
    for (std::uint32_t m = 0; m < b.block.member_count; ++m) {
        if (!(b.block.members[m].decoration_flags & SPV_REFLECT_DECORATION_NON_WRITABLE)) {
            return true;
        }
    }
    return false;
}

// Destroys the reflection module on every exit path.
class ReflectModule {
public:
    ReflectModule() = default;
    ~ReflectModule() {
        if (valid_) spvReflectDestroyShaderModule(&module_);
    }
    ReflectModule(const ReflectModule&) = delete;
    ReflectModule& operator=(const ReflectModule&) = delete;

    SpvReflectResult create(const std::vector<std::uint8_t>& code) {
        SpvReflectResult r = spvReflectCreateShaderModule(code.size(), code.data(), &module_);
        valid_             = r == SPV_REFLECT_RESULT_SUCCESS;
        return r;
    }

    SpvReflectShaderModule* get() { return &module_; }

private:
    SpvReflectShaderModule module_{};
    bool                   valid_ = false;
};

} // namespace

// Bindings already use (set, binding) addresses, so the module is created
// from the unmodified words; the assignment only has to agree with them.
Result<TranslatedShader> SpirvTranslator::translate(const ShaderSource& source,
                                                    const RegisterAssignment& /*assignment*/) {
    constexpr const char* op = "translate shader";
    if (source.bytecode.empty() || source.bytecode.size() % 4 != 0) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "SPIR-V size " + std::to_string(source.bytecode.size()) +
                         " is not a non-zero multiple of 4 bytes"};
    }

    ReflectModule module;
    if (SpvReflectResult r = module.create(source.bytecode); r != SPV_REFLECT_RESULT_SUCCESS) {
        return Error{op, ErrorCode::InvalidUsage, static_cast<std::int32_t>(r),
                     "spvReflectCreateShaderModule failed"};
    }

    const char* entryName = source.entryPoint.c_str();
    const SpvReflectEntryPoint* entry = spvReflectGetEntryPoint(module.get(), entryName);
    if (!entry) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "entry point '" + source.entryPoint + "' not found"};
    }
    if (static_cast<VkShaderStageFlags>(entry->shader_stage) !=
        static_cast<VkShaderStageFlags>(toVkStage(source.stage))) {
        return Error{op, ErrorCode::InvalidUsage, 0,
                     "entry point '" + source.entryPoint + "' is not a " +
                         toString(source.stage) + " shader"};
    }

    TranslatedShader out;

    std::uint32_t bindingCount = 0;
    SpvReflectResult result = spvReflectEnumerateEntryPointDescriptorBindings(
        module.get(), entryName, &bindingCount, nullptr);
    if (result == SPV_REFLECT_RESULT_SUCCESS && bindingCount > 0) {
        std::vector<SpvReflectDescriptorBinding*> bindings(bindingCount);
        spvReflectEnumerateEntryPointDescriptorBindings(module.get(), entryName, &bindingCount,
                                                        bindings.data());

        for (auto* b : bindings) {
            auto kind = kindOf(b->descriptor_type);
            if (!kind) {
                return Error{op, ErrorCode::InvalidUsage, 0,
                             "binding " + std::to_string(b->binding) + " of set " +
                                 std::to_string(b->set) + " has an unsupported descriptor type"};
            }
            ReflectedBinding rb;
            rb.set      = b->set;
            rb.binding  = b->binding;
            rb.kind     = *kind;
            rb.count    = std::max<std::uint32_t>(b->count, 1);
            rb.writable = writable(*b, *kind);
            if (b->name) rb.name = b->name;
            out.reflected.push_back(rb);
        }
    }

    std::uint32_t pcCount = 0;
    result = spvReflectEnumerateEntryPointPushConstantBlocks(module.get(), entryName, &pcCount,
                                                             nullptr);
    if (result == SPV_REFLECT_RESULT_SUCCESS && pcCount > 0) {
        std::vector<SpvReflectBlockVariable*> blocks(pcCount);
        spvReflectEnumerateEntryPointPushConstantBlocks(module.get(), entryName, &pcCount,
                                                        blocks.data());
        for (auto* block : blocks) {
            ReflectedBinding rb;
            rb.pushConstant = true;
            if (block->name) rb.name = block->name;
            out.reflected.push_back(rb);
        }
    }

    VkShaderModuleCreateInfo ci{};
    ci.sType    = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    ci.codeSize = source.bytecode.size();
    ci.pCode    = reinterpret_cast<const std::uint32_t*>(source.bytecode.data());

    VkShaderModule shader = VK_NULL_HANDLE;
    VkResult vr = vkCreateShaderModule(device_.vkDevice(), &ci, nullptr, &shader);
    if (vr != VK_SUCCESS) return device_.fail(op, vr, "vkCreateShaderModule failed");
    out.module = toNative(shader);
    return out;
}

void SpirvTranslator::release(NativeHandle module) {
    if (module == NullHandle) return;
    vkDestroyShaderModule(device_.vkDevice(), fromNative<VkShaderModule>(module), nullptr);
}

} // namespace gfxhal::vulkan::detail
