#include <gfxhal/gfxhal.hpp>
#include <gfxhal/soft/soft.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <variant>
#include <vector>

using gfxhal::Backend;
using gfxhal::Buffer;
using gfxhal::BufferDescriptor;
using gfxhal::BufferDesc;
using gfxhal::BufferUsage;
using gfxhal::CommandBuffer;
using gfxhal::ComputePipelineDesc;
using gfxhal::DescriptorCopy;
using gfxhal::DescriptorKind;
using gfxhal::DescriptorPoolDesc;
using gfxhal::DescriptorPoolSize;
using gfxhal::DescriptorSet;
using gfxhal::DescriptorSetLayoutBuilder;
using gfxhal::DescriptorWrite;
using gfxhal::Device;
using gfxhal::ErrorCode;
using gfxhal::ImageDescriptor;
using gfxhal::MemoryUsage;
using gfxhal::PipelineBindPoint;
using gfxhal::ReflectedBinding;
using gfxhal::ShaderSource;
using gfxhal::ShaderStage;
using gfxhal::SubmitInfo;
namespace soft = gfxhal::soft;

namespace {

// values[i] = values[i] * scale + bias
void addAffineProgram(soft::ProgramLibrary& programs) {
    programs.add("affine", soft::Program{
        ShaderStage::Compute,
        {
            ReflectedBinding{"params", 0, 0, DescriptorKind::UniformBuffer, 1, false},
            ReflectedBinding{"values", 0, 1, DescriptorKind::StorageBuffer, 1, true},
            ReflectedBinding{"scale", 1, 0, DescriptorKind::UniformBuffer, 1, false},
        },
        [](soft::Invocation& inv) {
            const std::uint64_t at = std::uint64_t{inv.workgroup()[0]} * 4;
            const auto bias        = inv.load<std::uint32_t>("params");
            const auto scale       = inv.load<std::uint32_t>("scale");
            inv.store<std::uint32_t>("values", inv.load<std::uint32_t>("values", at) * scale + bias,
                                     at);
        }});
}

Device makeDevice(soft::AdapterConfig adapter) {
    soft::InstanceConfig config;
    config.adapters = {std::move(adapter)};
    addAffineProgram(*config.programs);

    auto instance = gfxhal::InstanceBuilder(soft::createInstance(std::move(config)))
                        .appName("test_descriptors")
                        .validation(gfxhal::Validation::Report)
                        .build();
    assert(instance.ok());
    auto adapters = instance.value().adapters();
    assert(adapters.size() == 1);
    auto device = gfxhal::DeviceBuilder(adapters[0]).build();
    assert(device.ok());
    return std::move(device).value();
}

Buffer makeBuffer(Device& device, std::uint64_t size, BufferUsage usage, MemoryUsage memory) {
    auto b = device.createBuffer(BufferDesc{size, usage}, memory);
    assert(b.ok());
    return std::move(b).value();
}

void writeWords(Buffer& buffer, std::uint64_t offset, std::uint32_t value) {
    auto mapped = buffer.map();
    assert(mapped.ok());
    std::memcpy(static_cast<std::uint8_t*>(mapped.value()) + offset, &value, 4);
    buffer.unmap();
}

bool submitAndWait(Device& device, CommandBuffer& cmd) {
    auto fence = device.createFence();
    assert(fence.ok());
    SubmitInfo info;
    info.commandBuffers = {&cmd};
    info.fence          = &fence.value();
    auto queue = device.queue(0);
    if (!queue.submit(info).ok()) return false;
    assert(device.waitForFence(fence.value()).ok());
    return true;
}

// Two sets holding a uniform, a storage and a dynamic uniform buffer, read
// through the backend's binding model.
void runAffine(Backend backend) {
    Device device = makeDevice(soft::AdapterConfig::forBackend(backend));
    assert(device.backend() == backend);

    auto set0 = DescriptorSetLayoutBuilder()
                    .uniformBuffer(0, ShaderStage::Compute)
                    .storageBuffer(1, ShaderStage::Compute)
                    .build();
    auto set1 = DescriptorSetLayoutBuilder().dynamicUniformBuffer(0, ShaderStage::Compute).build();
    assert(set0.ok() && set1.ok());
    auto layout = device.createPipelineLayout({set0.value(), set1.value()});
    assert(layout.ok());

    auto pipeline = device.createComputePipeline(ComputePipelineDesc{
        &layout.value(), ShaderSource::fromText(ShaderStage::Compute, "affine")});
    assert(pipeline.ok());

    auto pool = device.createDescriptorPool(DescriptorPoolDesc{
        2,
        {DescriptorPoolSize{DescriptorKind::UniformBuffer, 1},
         DescriptorPoolSize{DescriptorKind::StorageBuffer, 1},
         DescriptorPoolSize{DescriptorKind::UniformBufferDynamic, 1}}});
    assert(pool.ok());
    auto sets = pool.value().allocate(std::vector<gfxhal::SetLayoutRef>{set0.value(), set1.value()});
    assert(sets.ok());
    assert(sets.value().size() == 2);

    Buffer params = makeBuffer(device, 256, BufferUsage::Uniform, MemoryUsage::Upload);
    Buffer scales = makeBuffer(device, 512, BufferUsage::Uniform, MemoryUsage::Upload);
    Buffer values = makeBuffer(device, 8 * 4, BufferUsage::Storage, MemoryUsage::Readback);
    writeWords(params, 0, 5);
    writeWords(scales, 0, 2);
    writeWords(scales, 256, 3);
    for (std::uint32_t i = 0; i < 8; ++i) writeWords(values, i * 4, i);

    auto w = device.writeDescriptorSets({
        DescriptorWrite{&sets.value()[0], 0, 0, {BufferDescriptor{params.ref(), 0, 16}}},
        DescriptorWrite{&sets.value()[0], 1, 0, {BufferDescriptor{values.ref()}}},
        DescriptorWrite{&sets.value()[1], 0, 0, {BufferDescriptor{scales.ref(), 0, 16}}},
    });
    assert(w.ok());

    auto commands = device.createCommandPool(0);
    assert(commands.ok());
    auto cmd = commands.value().allocate();
    assert(cmd.ok());
    CommandBuffer& cb = cmd.value();
    assert(cb.begin().ok());
    assert(cb.bindPipeline(pipeline.value()).ok());
    assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, layout.value(), 0,
                                 {&sets.value()[0], &sets.value()[1]}, {256})
               .ok());
    assert(cb.dispatch(8).ok());
    assert(cb.finish().ok());
    assert(submitAndWait(device, cb));

    auto mapped = values.map();
    assert(mapped.ok());
    const auto* v = static_cast<const std::uint32_t*>(mapped.value());
    for (std::uint32_t i = 0; i < 8; ++i) assert(v[i] == i * 3 + 5);
    values.unmap();

    auto* hooks = soft::hooks(device.native());
    assert(hooks && hooks->bindingErrors() == 0);
}

} // namespace

int main() {
    // The same program reads the same resources under every binding model
    {
        const Backend backends[] = {Backend::Vulkan, Backend::Dx11, Backend::Dx12, Backend::Metal,
                                    Backend::Gl};
        for (Backend b : backends) {
            runAffine(b);
            std::printf("  affine on %s: ok\n", gfxhal::toString(b));
        }
    }

    Device device = makeDevice(soft::AdapterConfig{});
    auto storageLayout = DescriptorSetLayoutBuilder().storageBuffer(0, ShaderStage::Compute).build();
    assert(storageLayout.ok());
    Buffer storage =
        makeBuffer(device, 1024, BufferUsage::Storage | BufferUsage::Uniform, MemoryUsage::Upload);

    // A pool runs out of sets before it runs out of descriptors
    {
        auto pool = device.createDescriptorPool(
            DescriptorPoolDesc{1, {DescriptorPoolSize{DescriptorKind::StorageBuffer, 8}}});
        assert(pool.ok());
        auto first = pool.value().allocate(storageLayout.value());
        assert(first.ok());
        auto second = pool.value().allocate(storageLayout.value());
        assert(!second.ok());
        assert(second.error().code == ErrorCode::TooManyObjects);

        first.value().destroy();
        assert(pool.value().liveSets() == 0);
        auto again = pool.value().allocate(storageLayout.value());
        assert(again.ok());
        std::printf("  pool set limit: ok\n");
    }

    // A pool runs out of one descriptor kind
    {
        auto pairLayout =
            DescriptorSetLayoutBuilder().storageBuffer(0, ShaderStage::Compute, false, 2).build();
        assert(pairLayout.ok());
        auto pool = device.createDescriptorPool(
            DescriptorPoolDesc{4, {DescriptorPoolSize{DescriptorKind::StorageBuffer, 3}}});
        assert(pool.ok());
        auto first = pool.value().allocate(pairLayout.value());
        assert(first.ok());
        auto second = pool.value().allocate(pairLayout.value());
        assert(!second.ok());
        assert(second.error().code == ErrorCode::OutOfHostMemory);

        auto uniformOnly = DescriptorSetLayoutBuilder().uniformBuffer(0, ShaderStage::Compute).build();
        assert(uniformOnly.ok());
        auto missing = pool.value().allocate(uniformOnly.value());
        assert(!missing.ok());
        assert(missing.error().code == ErrorCode::OutOfHostMemory);
        std::printf("  pool kind capacity: ok\n");
    }

    // Resetting a pool frees every set it handed out
    {
        auto pool = device.createDescriptorPool(
            DescriptorPoolDesc{2, {DescriptorPoolSize{DescriptorKind::StorageBuffer, 2}}});
        assert(pool.ok());
        auto a = pool.value().allocate(storageLayout.value());
        auto b = pool.value().allocate(storageLayout.value());
        assert(a.ok() && b.ok());
        assert(pool.value().liveSets() == 2);
        assert(pool.value().reset().ok());
        assert(pool.value().liveSets() == 0);

        auto w = device.writeDescriptorSets(
            {DescriptorWrite{&a.value(), 0, 0, {BufferDescriptor{storage.ref()}}}});
        assert(!w.ok());
        assert(w.error().code == ErrorCode::InvalidUsage);
        std::printf("  pool reset: ok\n");
    }

    auto pool = device.createDescriptorPool(DescriptorPoolDesc{
        16,
        {DescriptorPoolSize{DescriptorKind::StorageBuffer, 32},
         DescriptorPoolSize{DescriptorKind::UniformBuffer, 8},
         DescriptorPoolSize{DescriptorKind::UniformBufferDynamic, 8}}});
    assert(pool.ok());

    // Malformed writes are rejected and leave the set untouched
    {
        auto set = pool.value().allocate(storageLayout.value());
        assert(set.ok());
        DescriptorSet& s = set.value();
        const std::uint64_t before = s.version();

        auto shape = device.writeDescriptorSets(
            {DescriptorWrite{&s, 0, 0, {ImageDescriptor{storage.ref()}}}});
        assert(!shape.ok() && shape.error().code == ErrorCode::InvalidUsage);

        auto misaligned = device.writeDescriptorSets(
            {DescriptorWrite{&s, 0, 0, {BufferDescriptor{storage.ref(), 8, 16}}}});
        assert(!misaligned.ok() && misaligned.error().code == ErrorCode::InvalidUsage);

        auto empty = device.writeDescriptorSets(
            {DescriptorWrite{&s, 0, 0, {BufferDescriptor{storage.ref(), 0, 0}}}});
        assert(!empty.ok() && empty.error().code == ErrorCode::InvalidUsage);

        auto unwritten = device.writeDescriptorSets({DescriptorWrite{&s, 0, 0, {gfxhal::Descriptor{}}}});
        assert(!unwritten.ok() && unwritten.error().code == ErrorCode::InvalidUsage);

        auto past = device.writeDescriptorSets(
            {DescriptorWrite{&s, 0, 1, {BufferDescriptor{storage.ref()}}}});
        assert(!past.ok() && past.error().code == ErrorCode::InvalidUsage);

        Buffer doomed = makeBuffer(device, 64, BufferUsage::Storage, MemoryUsage::Upload);
        const gfxhal::ResourceRef ref = doomed.ref();
        doomed.destroy();
        auto stale = device.writeDescriptorSets({DescriptorWrite{&s, 0, 0, {BufferDescriptor{ref}}}});
        assert(!stale.ok() && stale.error().code == ErrorCode::InvalidUsage);

        assert(s.version() == before);
        assert(std::holds_alternative<std::monostate>(s.descriptor(0)));

        auto good = device.writeDescriptorSets(
            {DescriptorWrite{&s, 0, 0, {BufferDescriptor{storage.ref(), 16, 64}}}});
        assert(good.ok());
        assert(s.version() == before + 1);
        const auto* written = std::get_if<BufferDescriptor>(&s.descriptor(0));
        assert(written && written->offset == 16 && written->range == 64);
        std::printf("  write validation: ok\n");
    }

    // A write past the end of an array continues into the next binding
    {
        auto layout = DescriptorSetLayoutBuilder()
                          .storageBuffer(0, ShaderStage::Compute, false, 2)
                          .storageBuffer(1, ShaderStage::Compute)
                          .uniformBuffer(2, ShaderStage::Compute)
                          .build();
        assert(layout.ok());
        auto set = pool.value().allocate(layout.value());
        assert(set.ok());

        auto w = device.writeDescriptorSets({DescriptorWrite{
            &set.value(), 0, 1,
            {BufferDescriptor{storage.ref(), 0, 16}, BufferDescriptor{storage.ref(), 16, 16}}}});
        assert(w.ok());
        assert(std::holds_alternative<std::monostate>(set.value().descriptor(0, 0)));
        const auto* tail = std::get_if<BufferDescriptor>(&set.value().descriptor(0, 1));
        const auto* next = std::get_if<BufferDescriptor>(&set.value().descriptor(1, 0));
        assert(tail && tail->offset == 0);
        assert(next && next->offset == 16);

        // Binding 2 is a different kind; the rollover stops there.
        auto across = device.writeDescriptorSets({DescriptorWrite{
            &set.value(), 1, 0,
            {BufferDescriptor{storage.ref(), 0, 16}, BufferDescriptor{storage.ref(), 256, 16}}}});
        assert(!across.ok() && across.error().code == ErrorCode::InvalidUsage);
        std::printf("  array rollover: ok\n");
    }

    // Copies carry descriptors between sets of matching kinds
    {
        auto mixed = DescriptorSetLayoutBuilder()
                         .storageBuffer(0, ShaderStage::Compute, false, 2)
                         .uniformBuffer(1, ShaderStage::Compute)
                         .build();
        assert(mixed.ok());
        auto src = pool.value().allocate(mixed.value());
        auto dst = pool.value().allocate(mixed.value());
        assert(src.ok() && dst.ok());
        auto w = device.writeDescriptorSets({
            DescriptorWrite{&src.value(), 0, 0,
                            {BufferDescriptor{storage.ref(), 32, 32},
                             BufferDescriptor{storage.ref(), 64, 32}}},
            DescriptorWrite{&src.value(), 1, 0, {BufferDescriptor{storage.ref(), 256, 64}}},
        });
        assert(w.ok());

        const std::uint64_t before = dst.value().version();
        auto c = device.copyDescriptorSets({
            DescriptorCopy{&src.value(), 0, 0, &dst.value(), 0, 0, 2},
            DescriptorCopy{&src.value(), 1, 0, &dst.value(), 1, 0, 1},
        });
        assert(c.ok());
        assert(dst.value().version() > before);
        const auto* first  = std::get_if<BufferDescriptor>(&dst.value().descriptor(0, 0));
        const auto* second = std::get_if<BufferDescriptor>(&dst.value().descriptor(0, 1));
        const auto* uniformCopy = std::get_if<BufferDescriptor>(&dst.value().descriptor(1));
        assert(first && first->offset == 32);
        assert(second && second->offset == 64);
        assert(uniformCopy && uniformCopy->offset == 256);

        // Binding 0 holds two storage buffers; a third element would land in
        // the uniform binding.
        auto rollover = device.copyDescriptorSets(
            {DescriptorCopy{&src.value(), 0, 1, &dst.value(), 0, 1, 2}});
        assert(!rollover.ok() && rollover.error().code == ErrorCode::InvalidUsage);

        auto mismatch = device.copyDescriptorSets(
            {DescriptorCopy{&src.value(), 0, 0, &dst.value(), 1, 0, 1}});
        assert(!mismatch.ok() && mismatch.error().code == ErrorCode::InvalidUsage);
        std::printf("  descriptor copy: ok\n");
    }

    auto dynamicLayout = DescriptorSetLayoutBuilder()
                             .dynamicUniformBuffer(0, ShaderStage::Compute)
                             .storageBuffer(1, ShaderStage::Compute)
                             .build();
    assert(dynamicLayout.ok());
    auto pipelineLayout = device.createPipelineLayout({dynamicLayout.value()});
    assert(pipelineLayout.ok());
    auto commands = device.createCommandPool(0);
    assert(commands.ok());

    // Dynamic offsets: one per dynamic descriptor, each aligned
    {
        auto set = pool.value().allocate(dynamicLayout.value());
        assert(set.ok());
        const DescriptorSet* sets[] = {&set.value()};

        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();

        assert(cb.begin().ok());
        auto missing = cb.bindDescriptorSets(PipelineBindPoint::Compute, pipelineLayout.value(), 0,
                                             {sets[0]});
        assert(!missing.ok() && missing.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        assert(cb.begin().ok());
        auto extra = cb.bindDescriptorSets(PipelineBindPoint::Compute, pipelineLayout.value(), 0,
                                           {sets[0]}, {0, 256});
        assert(!extra.ok() && extra.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        assert(cb.begin().ok());
        auto misaligned = cb.bindDescriptorSets(PipelineBindPoint::Compute, pipelineLayout.value(),
                                                0, {sets[0]}, {128});
        assert(!misaligned.ok() && misaligned.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        assert(cb.begin().ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, pipelineLayout.value(), 0,
                                     {sets[0]}, {512})
                   .ok());
        assert(cb.finish().ok());

        // A set from another layout is rejected.
        auto other = pool.value().allocate(storageLayout.value());
        assert(other.ok());
        assert(cb.begin().ok());
        auto incompatible = cb.bindDescriptorSets(PipelineBindPoint::Compute,
                                                  pipelineLayout.value(), 0, {&other.value()});
        assert(!incompatible.ok() && incompatible.error().code == ErrorCode::InvalidUsage);
        std::printf("  dynamic offsets: ok\n");
    }

    // Writing a bound set after finish invalidates the recording at submit
    {
        auto set = pool.value().allocate(dynamicLayout.value());
        assert(set.ok());
        auto w = device.writeDescriptorSets(
            {DescriptorWrite{&set.value(), 0, 0, {BufferDescriptor{storage.ref(), 0, 16}}},
             DescriptorWrite{&set.value(), 1, 0, {BufferDescriptor{storage.ref(), 0, 64}}}});
        assert(w.ok());

        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        assert(cb.begin().ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, pipelineLayout.value(), 0,
                                     {&set.value()}, {0})
                   .ok());
        assert(cb.finish().ok());

        auto rewrite = device.writeDescriptorSets(
            {DescriptorWrite{&set.value(), 1, 0, {BufferDescriptor{storage.ref(), 64, 64}}}});
        assert(rewrite.ok());
        assert(!submitAndWait(device, cb));
        assert(cb.state() == gfxhal::CommandBufferState::Executable);

        // Recording again picks up the new version.
        assert(cb.reset().ok());
        assert(cb.begin().ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, pipelineLayout.value(), 0,
                                     {&set.value()}, {0})
                   .ok());
        assert(cb.finish().ok());
        assert(submitAndWait(device, cb));

        // Freed sets are caught the same way.
        assert(cb.begin().ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, pipelineLayout.value(), 0,
                                     {&set.value()}, {0})
                   .ok());
        assert(cb.finish().ok());
        set.value().destroy();
        assert(!submitAndWait(device, cb));
        std::printf("  write after finish: ok\n");
    }

    assert(device.waitIdle().ok());
    std::printf("descriptor tests passed\n");
    return 0;
}
