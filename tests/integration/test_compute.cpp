#include <gfxhal/gfxhal.hpp>
#include <gfxhal/soft/soft.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstring>

using gfxhal::Buffer;
using gfxhal::BufferCopy;
using gfxhal::BufferDescriptor;
using gfxhal::BufferDesc;
using gfxhal::BufferUsage;
using gfxhal::CommandBuffer;
using gfxhal::ComputePipelineDesc;
using gfxhal::DescriptorKind;
using gfxhal::DescriptorPoolDesc;
using gfxhal::DescriptorPoolSize;
using gfxhal::DescriptorSetLayoutBuilder;
using gfxhal::DescriptorWrite;
using gfxhal::Device;
using gfxhal::ErrorCode;
using gfxhal::MemoryUsage;
using gfxhal::PipelineBindPoint;
using gfxhal::PushConstantRange;
using gfxhal::ReflectedBinding;
using gfxhal::ShaderSource;
using gfxhal::ShaderStage;
using gfxhal::SubmitInfo;
namespace soft = gfxhal::soft;

static Device makeDevice(soft::InstanceConfig config) {
    auto instance = gfxhal::InstanceBuilder(soft::createInstance(std::move(config)))
                        .appName("test_compute")
                        .validation(gfxhal::Validation::Report)
                        .build();
    assert(instance.ok());
    auto adapter = instance.value().pickAdapter(gfxhal::AdapterType::Cpu);
    assert(adapter.ok());
    auto device = gfxhal::DeviceBuilder(adapter.value()).build();
    assert(device.ok());
    return std::move(device).value();
}

static void submitAndWait(Device& device, CommandBuffer& cmd) {
    auto fence = device.createFence();
    assert(fence.ok());
    SubmitInfo info;
    info.commandBuffers = {&cmd};
    info.fence          = &fence.value();
    auto queue = device.queue(0);
    auto r     = queue.submit(info);
    assert(r.ok());
    assert(device.waitForFence(fence.value()).ok());
}

int main() {
    soft::InstanceConfig config;

    // out[i] = i * i
    config.programs->add("squares", soft::Program{
        ShaderStage::Compute,
        {ReflectedBinding{"out", 0, 0, DescriptorKind::StorageBuffer, 1, true}},
        [](soft::Invocation& inv) {
            const std::uint32_t i = inv.workgroup()[0];
            inv.store<std::uint32_t>("out", i * i, std::uint64_t{i} * 4);
        }});

    // data[i] *= push.factor
    ReflectedBinding push;
    push.name         = "factor";
    push.pushConstant = true;
    config.programs->add("scale", soft::Program{
        ShaderStage::Compute,
        {ReflectedBinding{"data", 0, 0, DescriptorKind::StorageBuffer, 1, true}, push},
        [](soft::Invocation& inv) {
            const std::uint64_t at = std::uint64_t{inv.workgroup()[0]} * 4;
            const auto factor      = inv.push<std::uint32_t>(0);
            inv.store<std::uint32_t>("data", inv.load<std::uint32_t>("data", at) * factor, at);
        }});

    // One invocation per (x, y, z) in the grid.
    config.programs->add("grid", soft::Program{
        ShaderStage::Compute,
        {ReflectedBinding{"out", 0, 0, DescriptorKind::StorageBuffer, 1, true}},
        [](soft::Invocation& inv) {
            const auto g = inv.workgroup();
            const std::uint32_t index = g[0] + g[1] * 4 + g[2] * 8;
            inv.store<std::uint32_t>("out", 1, std::uint64_t{index} * 4);
        }});

    Device device = makeDevice(std::move(config));
    auto* hooks   = soft::hooks(device.native());
    assert(hooks);

    auto setLayout = DescriptorSetLayoutBuilder().storageBuffer(0, ShaderStage::Compute).build();
    assert(setLayout.ok());
    auto layout = device.createPipelineLayout(
        {setLayout.value()}, {PushConstantRange{ShaderStage::Compute, 0, 4}});
    assert(layout.ok());
    auto pool = device.createDescriptorPool(
        DescriptorPoolDesc{4, {DescriptorPoolSize{DescriptorKind::StorageBuffer, 4}}});
    assert(pool.ok());
    auto commands = device.createCommandPool(0);
    assert(commands.ok());

    auto pipelineFor = [&](const char* program) {
        auto p = device.createComputePipeline(ComputePipelineDesc{
            &layout.value(), ShaderSource::fromText(ShaderStage::Compute, program)});
        assert(p.ok());
        return std::move(p).value();
    };
    auto storageFor = [&](std::uint64_t size) {
        auto b = device.createBuffer(
            BufferDesc{size, BufferUsage::Storage | BufferUsage::TransferSrc |
                                 BufferUsage::TransferDst | BufferUsage::Indirect},
            MemoryUsage::Readback);
        assert(b.ok());
        return std::move(b).value();
    };
    auto bindTo = [&](Buffer& buffer) {
        auto set = pool.value().allocate(setLayout.value());
        assert(set.ok());
        auto w = device.writeDescriptorSets(
            {DescriptorWrite{&set.value(), 0, 0, {BufferDescriptor{buffer.ref()}}}});
        assert(w.ok());
        return std::move(set).value();
    };

    // Dispatch writes a storage buffer
    {
        auto pipeline = pipelineFor("squares");
        Buffer out    = storageFor(64 * 4);
        auto set      = bindTo(out);

        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        assert(cb.begin().ok());
        assert(cb.bindPipeline(pipeline).ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, layout.value(), 0, {&set}).ok());
        assert(cb.dispatch(64).ok());
        assert(cb.finish().ok());
        submitAndWait(device, cb);

        auto mapped = out.map();
        assert(mapped.ok());
        const auto* values = static_cast<const std::uint32_t*>(mapped.value());
        for (std::uint32_t i = 0; i < 64; ++i) assert(values[i] == i * i);
        out.unmap();
        assert(hooks->bindingErrors() == 0);
        std::printf("  dispatch storage write: ok\n");
    }

    // Push constants reach the program
    {
        auto pipeline = pipelineFor("scale");
        Buffer data   = storageFor(16 * 4);
        {
            auto mapped = data.map();
            assert(mapped.ok());
            auto* values = static_cast<std::uint32_t*>(mapped.value());
            for (std::uint32_t i = 0; i < 16; ++i) values[i] = i + 1;
            data.unmap();
        }
        auto set = bindTo(data);

        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        const std::uint32_t factor = 3;
        assert(cb.begin().ok());
        assert(cb.bindPipeline(pipeline).ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, layout.value(), 0, {&set}).ok());
        assert(cb.pushConstants(layout.value(), ShaderStage::Compute, 0, &factor, 4).ok());
        assert(cb.dispatch(16).ok());
        assert(cb.finish().ok());
        submitAndWait(device, cb);

        auto mapped = data.map();
        assert(mapped.ok());
        const auto* values = static_cast<const std::uint32_t*>(mapped.value());
        for (std::uint32_t i = 0; i < 16; ++i) assert(values[i] == (i + 1) * 3);
        data.unmap();
        std::printf("  push constants: ok\n");
    }

    // Push constant ranges are checked
    {
        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        const std::uint32_t values[2] = {1, 2};
        assert(cb.begin().ok());
        auto outside = cb.pushConstants(layout.value(), ShaderStage::Compute, 4, values, 8);
        assert(!outside.ok());
        assert(outside.error().code == ErrorCode::InvalidUsage);
        assert(cb.poisoned());
        std::printf("  push constant range: ok\n");
    }

    // Grid dispatch covers x, y and z
    {
        auto pipeline = pipelineFor("grid");
        Buffer out    = storageFor(16 * 4);
        auto set      = bindTo(out);

        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        assert(cb.begin().ok());
        assert(cb.fillBuffer(out, 0, gfxhal::WholeSize, 0).ok());
        assert(cb.bindPipeline(pipeline).ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, layout.value(), 0, {&set}).ok());
        assert(cb.dispatch(4, 2, 2).ok());
        assert(cb.finish().ok());
        submitAndWait(device, cb);

        auto mapped = out.map();
        assert(mapped.ok());
        const auto* values = static_cast<const std::uint32_t*>(mapped.value());
        for (std::uint32_t i = 0; i < 16; ++i) assert(values[i] == 1);
        out.unmap();
        std::printf("  dispatch grid: ok\n");
    }

    // Indirect dispatch reads its group counts from a buffer
    {
        auto pipeline = pipelineFor("squares");
        Buffer out    = storageFor(16 * 4);
        Buffer args   = storageFor(16);
        auto set      = bindTo(out);

        const std::uint32_t groups[4] = {8, 1, 1, 0};
        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        assert(cb.begin().ok());
        assert(cb.fillBuffer(out, 0, gfxhal::WholeSize, 0xFFFFFFFFu).ok());
        assert(cb.updateBuffer(args, 0, groups, sizeof(groups)).ok());
        gfxhal::BarrierSet barrier;
        barrier.memory.push_back(gfxhal::MemoryBarrier{
            gfxhal::PipelineStage::Transfer, gfxhal::Access::TransferWrite,
            gfxhal::PipelineStage::DrawIndirect | gfxhal::PipelineStage::ComputeShader,
            gfxhal::Access::IndirectCommandRead | gfxhal::Access::ShaderWrite});
        assert(cb.pipelineBarrier(barrier).ok());
        assert(cb.bindPipeline(pipeline).ok());
        assert(cb.bindDescriptorSets(PipelineBindPoint::Compute, layout.value(), 0, {&set}).ok());
        assert(cb.dispatchIndirect(args, 0).ok());
        assert(cb.finish().ok());
        submitAndWait(device, cb);

        auto mapped = out.map();
        assert(mapped.ok());
        const auto* values = static_cast<const std::uint32_t*>(mapped.value());
        for (std::uint32_t i = 0; i < 8; ++i) assert(values[i] == i * i);
        for (std::uint32_t i = 8; i < 16; ++i) assert(values[i] == 0xFFFFFFFFu);
        out.unmap();
        std::printf("  dispatch indirect: ok\n");
    }

    // Fill, update and copy
    {
        Buffer src = storageFor(64);
        Buffer dst = storageFor(64);
        const std::uint32_t words[4] = {10, 20, 30, 40};

        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        assert(cb.begin().ok());
        assert(cb.fillBuffer(src, 0, gfxhal::WholeSize, 0x01010101u).ok());
        assert(cb.updateBuffer(src, 16, words, sizeof(words)).ok());
        assert(cb.fillBuffer(dst, 0, 64, 0).ok());
        assert(cb.copyBuffer(src, dst, {BufferCopy{0, 0, 32}, BufferCopy{16, 48, 16}}).ok());
        assert(cb.copyBuffer(src, src, {BufferCopy{16, 32, 16}}).ok());
        assert(cb.finish().ok());
        submitAndWait(device, cb);

        auto mapped = dst.map();
        assert(mapped.ok());
        const auto* d = static_cast<const std::uint32_t*>(mapped.value());
        for (int i = 0; i < 4; ++i) assert(d[i] == 0x01010101u);
        assert(d[4] == 10 && d[5] == 20 && d[6] == 30 && d[7] == 40);
        for (int i = 8; i < 12; ++i) assert(d[i] == 0);
        assert(d[12] == 10 && d[15] == 40);
        dst.unmap();

        auto srcMapped = src.map();
        assert(srcMapped.ok());
        const auto* s = static_cast<const std::uint32_t*>(srcMapped.value());
        assert(s[8] == 10 && s[11] == 40);
        src.unmap();
        std::printf("  fill, update, copy: ok\n");
    }

    // Transfer misuse is rejected at record time
    {
        Buffer buf = storageFor(64);
        const std::uint32_t word = 7;

        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();

        assert(cb.begin().ok());
        auto odd = cb.updateBuffer(buf, 0, &word, 3);
        assert(!odd.ok() && odd.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        assert(cb.begin().ok());
        auto overlap = cb.copyBuffer(buf, buf, {BufferCopy{0, 8, 16}});
        assert(!overlap.ok() && overlap.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        assert(cb.begin().ok());
        auto past = cb.fillBuffer(buf, 32, 64, 0);
        assert(!past.ok() && past.error().code == ErrorCode::InvalidUsage);
        assert(cb.reset().ok());

        auto vertexOnly = device.createBuffer(BufferDesc{64, BufferUsage::Vertex},
                                              MemoryUsage::Upload);
        assert(vertexOnly.ok());
        assert(cb.begin().ok());
        auto usage = cb.fillBuffer(vertexOnly.value(), 0, 64, 0);
        assert(!usage.ok() && usage.error().code == ErrorCode::InvalidUsage);
        std::printf("  transfer validation: ok\n");
    }

    // Dispatch needs a bound compute pipeline
    {
        auto cmd = commands.value().allocate();
        assert(cmd.ok());
        CommandBuffer& cb = cmd.value();
        assert(cb.begin().ok());
        auto r = cb.dispatch(1);
        assert(!r.ok());
        assert(r.error().code == ErrorCode::InvalidUsage);
        assert(cb.state() == gfxhal::CommandBufferState::Recording);
        assert(!cb.finish().ok());
        std::printf("  dispatch without pipeline: ok\n");
    }

    // A program whose writable binding sits on a read-only layout binding
    {
        auto readOnly =
            DescriptorSetLayoutBuilder().storageBuffer(0, ShaderStage::Compute, true).build();
        assert(readOnly.ok());
        auto roLayout = device.createPipelineLayout({readOnly.value()});
        assert(roLayout.ok());
        auto p = device.createComputePipeline(ComputePipelineDesc{
            &roLayout.value(), ShaderSource::fromText(ShaderStage::Compute, "squares")});
        assert(!p.ok());
        assert(p.error().code == ErrorCode::InvalidUsage);

        auto wrongStage = device.createComputePipeline(ComputePipelineDesc{
            &layout.value(), ShaderSource::fromText(ShaderStage::Vertex, "squares")});
        assert(!wrongStage.ok());
        std::printf("  pipeline reflection checks: ok\n");
    }

    assert(device.waitIdle().ok());
    std::printf("compute tests passed\n");
    return 0;
}
