#include "recorder.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace gfxhal::vulkan::detail {

namespace {

VkPipelineBindPoint toVk(PipelineBindPoint point) {
    return point == PipelineBindPoint::Compute ? VK_PIPELINE_BIND_POINT_COMPUTE
                                               : VK_PIPELINE_BIND_POINT_GRAPHICS;
}

VkSubpassContents toVk(SubpassContents contents) {
    return contents == SubpassContents::SecondaryBuffers
               ? VK_SUBPASS_CONTENTS_SECONDARY_COMMAND_BUFFERS
               : VK_SUBPASS_CONTENTS_INLINE;
}

// Copies address one aspect; depth wins for depth/stencil formats.
VkImageAspectFlags copyAspect(VkImageAspectFlags aspects) {
    if (aspects & VK_IMAGE_ASPECT_DEPTH_BIT) return VK_IMAGE_ASPECT_DEPTH_BIT;
    if (aspects & VK_IMAGE_ASPECT_STENCIL_BIT) return VK_IMAGE_ASPECT_STENCIL_BIT;
    return VK_IMAGE_ASPECT_COLOR_BIT;
}

std::vector<VkBufferImageCopy> toVk(const std::vector<BufferImageCopy>& regions,
                                    VkImageAspectFlags aspects) {
    std::vector<VkBufferImageCopy> out;
    out.reserve(regions.size());
    for (const auto& r : regions) {
        VkBufferImageCopy c{};
        c.bufferOffset      = r.bufferOffset;
        c.bufferRowLength   = r.bufferRowLength;
        c.bufferImageHeight = r.bufferImageHeight;
        c.imageSubresource  = {copyAspect(aspects), r.mipLevel, r.baseLayer, r.layerCount};
        c.imageOffset       = {r.imageOffset.x, r.imageOffset.y, r.imageOffset.z};
        c.imageExtent       = {r.imageExtent.width, r.imageExtent.height, r.imageExtent.depth};
        out.push_back(c);
    }
    return out;
}

Error stale(const char* what) {
    return Error{"record command buffer", ErrorCode::InvalidUsage, 0,
                 std::string("a recorded command references a destroyed ") + what};
}

} // namespace

Result<VkCommandBuffer> StreamRecorder::allocate(VkCommandBufferLevel level) {
    VkCommandBufferAllocateInfo ai{};
    ai.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    ai.commandPool        = queue_.pool;
    ai.level              = level;
    ai.commandBufferCount = 1;

    VkCommandBuffer cmd = VK_NULL_HANDLE;
    VkResult vr = vkAllocateCommandBuffers(device_.vkDevice(), &ai, &cmd);
    if (vr != VK_SUCCESS) {
        return device_.fail("record command buffer", vr, "vkAllocateCommandBuffers failed");
    }
    batch_.commandBuffers.push_back(cmd);
    return cmd;
}

Result<VkCommandBuffer> StreamRecorder::recordPrimary(const CommandStream& stream) {
    auto cmd = allocate(VK_COMMAND_BUFFER_LEVEL_PRIMARY);
    if (!cmd.ok()) return cmd;

    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    VkResult vr = vkBeginCommandBuffer(cmd.value(), &bi);
    if (vr != VK_SUCCESS) return device_.fail("record command buffer", vr, "vkBeginCommandBuffer failed");

    if (auto r = recordCommands(cmd.value(), stream); !r.ok()) return std::move(r.error());

    vr = vkEndCommandBuffer(cmd.value());
    if (vr != VK_SUCCESS) return device_.fail("record command buffer", vr, "vkEndCommandBuffer failed");
    return cmd;
}

// Inside a pass the secondary continues it; outside, it inherits nothing.
Result<VkCommandBuffer> StreamRecorder::recordSecondary(const CommandStream& stream,
                                                        const PassState* pass) {
    auto cmd = allocate(VK_COMMAND_BUFFER_LEVEL_SECONDARY);
    if (!cmd.ok()) return cmd;

    VkCommandBufferInheritanceInfo inheritance{};
    inheritance.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_INHERITANCE_INFO;
    if (pass) {
        inheritance.renderPass  = pass->renderPass;
        inheritance.subpass     = pass->subpass;
        inheritance.framebuffer = pass->framebuffer;
    }

    VkCommandBufferBeginInfo bi{};
    bi.sType            = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags            = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    if (pass) bi.flags |= VK_COMMAND_BUFFER_USAGE_RENDER_PASS_CONTINUE_BIT;
    bi.pInheritanceInfo = &inheritance;
    VkResult vr = vkBeginCommandBuffer(cmd.value(), &bi);
    if (vr != VK_SUCCESS) return device_.fail("record command buffer", vr, "vkBeginCommandBuffer failed");

    if (auto r = recordCommands(cmd.value(), stream); !r.ok()) return std::move(r.error());

    vr = vkEndCommandBuffer(cmd.value());
    if (vr != VK_SUCCESS) return device_.fail("record command buffer", vr, "vkEndCommandBuffer failed");
    return cmd;
}

Result<void> StreamRecorder::recordCommands(VkCommandBuffer cmd, const CommandStream& stream) {
    std::optional<PassState> pass;

    struct OpenSplit {
        VkEvent                         event = VK_NULL_HANDLE;
        std::unique_ptr<DependencyInfo> dependency;
    };
    std::map<std::uint32_t, OpenSplit> splits;

    for (const Command& command : stream.commands) {
        Result<void> r = std::visit(
            [&](const auto& c) -> Result<void> {
                using T = std::decay_t<decltype(c)>;

                if constexpr (std::is_same_v<T, op::BindPipeline>) {
                    vkCmdBindPipeline(cmd, toVk(c.bindPoint), fromNative<VkPipeline>(c.pipeline));

                } else if constexpr (std::is_same_v<T, op::BindDescriptorSets>) {
                    auto layout = device_.layout(c.layout);
                    if (!layout) return stale("pipeline layout");
                    std::vector<VkDescriptorSet> sets;
                    sets.reserve(c.sets.size());
                    for (NativeHandle h : c.sets) {
                        auto s = device_.set(h);
                        if (!s) return stale("descriptor set");
                        sets.push_back(s->set);
                    }
                    // Offsets arrive in declaration order; Vulkan consumes
                    // them in binding-number order.
                    std::vector<std::uint32_t> offsets;
                    offsets.reserve(c.dynamicOffsets.size());
                    std::size_t base = 0;
                    for (std::size_t i = 0; i < c.sets.size(); ++i) {
                        const std::size_t index = c.firstSet + i;
                        if (index >= layout->dynamicOrder.size()) break;
                        const auto& order = layout->dynamicOrder[index];
                        for (std::uint32_t k : order) {
                            if (base + k < c.dynamicOffsets.size()) {
                                offsets.push_back(c.dynamicOffsets[base + k]);
                            }
                        }
                        base += order.size();
                    }
                    vkCmdBindDescriptorSets(cmd, toVk(c.bindPoint), layout->layout, c.firstSet,
                                            static_cast<std::uint32_t>(sets.size()), sets.data(),
                                            static_cast<std::uint32_t>(offsets.size()),
                                            offsets.data());

                } else if constexpr (std::is_same_v<T, op::PushConstants>) {
                    auto layout = device_.layout(c.layout);
                    if (!layout) return stale("pipeline layout");
                    vkCmdPushConstants(cmd, layout->layout, toVkStages(c.stages), c.offset,
                                       static_cast<std::uint32_t>(c.data.size()), c.data.data());

                } else if constexpr (std::is_same_v<T, op::BindVertexBuffers>) {
                    std::vector<VkBuffer>     buffers;
                    std::vector<VkDeviceSize> offsets;
                    for (std::size_t i = 0; i < c.buffers.size(); ++i) {
                        auto b = device_.buffer(c.buffers[i].native);
                        if (!b) return stale("vertex buffer");
                        buffers.push_back(b->buffer);
                        offsets.push_back(i < c.offsets.size() ? c.offsets[i] : 0);
                    }
                    vkCmdBindVertexBuffers(cmd, c.firstBinding,
                                           static_cast<std::uint32_t>(buffers.size()),
                                           buffers.data(), offsets.data());

                } else if constexpr (std::is_same_v<T, op::BindIndexBuffer>) {
                    auto b = device_.buffer(c.buffer.native);
                    if (!b) return stale("index buffer");
                    vkCmdBindIndexBuffer(cmd, b->buffer, c.offset, detail::toVk(c.type));

                } else if constexpr (std::is_same_v<T, op::SetViewport>) {
                    VkViewport v{c.viewport.x,     c.viewport.y,        c.viewport.width,
                                 c.viewport.height, c.viewport.minDepth, c.viewport.maxDepth};
                    vkCmdSetViewport(cmd, 0, 1, &v);

                } else if constexpr (std::is_same_v<T, op::SetScissor>) {
                    VkRect2D s{{c.scissor.x, c.scissor.y},
                               {c.scissor.extent.width, c.scissor.extent.height}};
                    vkCmdSetScissor(cmd, 0, 1, &s);

                } else if constexpr (std::is_same_v<T, op::Draw>) {
                    vkCmdDraw(cmd, c.vertexCount, c.instanceCount, c.firstVertex, c.firstInstance);

                } else if constexpr (std::is_same_v<T, op::DrawIndexed>) {
                    vkCmdDrawIndexed(cmd, c.indexCount, c.instanceCount, c.firstIndex,
                                     c.vertexOffset, c.firstInstance);

                } else if constexpr (std::is_same_v<T, op::DrawIndirect>) {
                    auto b = device_.buffer(c.buffer.native);
                    if (!b) return stale("indirect buffer");
                    vkCmdDrawIndirect(cmd, b->buffer, c.offset, c.drawCount, c.stride);

                } else if constexpr (std::is_same_v<T, op::Dispatch>) {
                    vkCmdDispatch(cmd, c.x, c.y, c.z);

                } else if constexpr (std::is_same_v<T, op::DispatchIndirect>) {
                    auto b = device_.buffer(c.buffer.native);
                    if (!b) return stale("indirect buffer");
                    vkCmdDispatchIndirect(cmd, b->buffer, c.offset);

                } else if constexpr (std::is_same_v<T, op::CopyBuffer>) {
                    auto src = device_.buffer(c.src.native);
                    auto dst = device_.buffer(c.dst.native);
                    if (!src || !dst) return stale("buffer");
                    std::vector<VkBufferCopy> regions;
                    for (const auto& r : c.regions) regions.push_back({r.srcOffset, r.dstOffset, r.size});
                    vkCmdCopyBuffer(cmd, src->buffer, dst->buffer,
                                    static_cast<std::uint32_t>(regions.size()), regions.data());

                } else if constexpr (std::is_same_v<T, op::CopyBufferToImage>) {
                    auto src = device_.buffer(c.src.native);
                    auto dst = device_.image(c.dst.native);
                    if (!src || !dst) return stale("copy resource");
                    auto regions = toVk(c.regions, dst->aspects);
                    vkCmdCopyBufferToImage(cmd, src->buffer, dst->image, detail::toVk(c.dstLayout),
                                           static_cast<std::uint32_t>(regions.size()),
                                           regions.data());

                } else if constexpr (std::is_same_v<T, op::CopyImageToBuffer>) {
                    auto src = device_.image(c.src.native);
                    auto dst = device_.buffer(c.dst.native);
                    if (!src || !dst) return stale("copy resource");
                    auto regions = toVk(c.regions, src->aspects);
                    vkCmdCopyImageToBuffer(cmd, src->image, detail::toVk(c.srcLayout), dst->buffer,
                                           static_cast<std::uint32_t>(regions.size()),
                                           regions.data());

                } else if constexpr (std::is_same_v<T, op::FillBuffer>) {
                    auto b = device_.buffer(c.buffer.native);
                    if (!b) return stale("buffer");
                    vkCmdFillBuffer(cmd, b->buffer, c.offset,
                                    c.size == WholeSize ? VK_WHOLE_SIZE : c.size, c.value);

                } else if constexpr (std::is_same_v<T, op::UpdateBuffer>) {
                    auto b = device_.buffer(c.buffer.native);
                    if (!b) return stale("buffer");
                    vkCmdUpdateBuffer(cmd, b->buffer, c.offset, c.data.size(), c.data.data());

                } else if constexpr (std::is_same_v<T, op::PipelineBarrier>) {
                    DependencyInfo dep(device_, c.barriers);
                    if (!dep.empty()) vkCmdPipelineBarrier2(cmd, dep.get());

                } else if constexpr (std::is_same_v<T, op::SplitBarrierBegin>) {
                    auto event = device_.acquireEvent();
                    if (!event.ok()) return std::move(event.error());
                    batch_.events.push_back(event.value());

                    OpenSplit split;
                    split.event      = event.value();
                    split.dependency = std::make_unique<DependencyInfo>(device_, c.barriers);
                    vkCmdSetEvent2(cmd, split.event, split.dependency->get());
                    splits[c.id] = std::move(split);

                } else if constexpr (std::is_same_v<T, op::SplitBarrierEnd>) {
                    auto it = splits.find(c.id);
                    if (it == splits.end()) {
                        return Error{"record command buffer", ErrorCode::InvalidUsage, 0,
                                     "split barrier " + std::to_string(c.id) + " ends without a begin"};
                    }
                    // The wait must name the dependency the set used.
                    const DependencyInfo& dep = *it->second.dependency;
                    vkCmdWaitEvents2(cmd, 1, &it->second.event, dep.get());
                    vkCmdResetEvent2(cmd, it->second.event,
                                     dep.dstStages() ? dep.dstStages()
                                                     : VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT);
                    splits.erase(it);

                } else if constexpr (std::is_same_v<T, op::BeginRenderPass>) {
                    auto record = device_.renderPass(c.renderPass);
                    if (!record) return stale("render pass");

                    std::vector<VkClearValue> clears(record->desc.attachments.size());
                    for (std::size_t a = 0; a < clears.size() && a < c.clears.size(); ++a) {
                        const ClearValue& v = c.clears[a];
                        if (aspectsOf(record->desc.attachments[a].format) &
                            (VK_IMAGE_ASPECT_DEPTH_BIT | VK_IMAGE_ASPECT_STENCIL_BIT)) {
                            clears[a].depthStencil = {v.depth, v.stencil};
                        } else {
                            clears[a].color = {{v.color[0], v.color[1], v.color[2], v.color[3]}};
                        }
                    }

                    VkRenderPassBeginInfo bi{};
                    bi.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
                    bi.renderPass      = record->pass;
                    bi.framebuffer     = fromNative<VkFramebuffer>(c.framebuffer);
                    bi.renderArea      = {{c.area.x, c.area.y},
                                          {c.area.extent.width, c.area.extent.height}};
                    bi.clearValueCount = static_cast<std::uint32_t>(clears.size());
                    bi.pClearValues    = clears.data();

                    VkSubpassBeginInfo si{};
                    si.sType    = VK_STRUCTURE_TYPE_SUBPASS_BEGIN_INFO;
                    si.contents = toVk(c.contents);
                    vkCmdBeginRenderPass2(cmd, &bi, &si);
                    pass = PassState{record->pass, bi.framebuffer, 0};

                } else if constexpr (std::is_same_v<T, op::NextSubpass>) {
                    VkSubpassBeginInfo bi{};
                    bi.sType    = VK_STRUCTURE_TYPE_SUBPASS_BEGIN_INFO;
                    bi.contents = toVk(c.contents);
                    VkSubpassEndInfo ei{};
                    ei.sType = VK_STRUCTURE_TYPE_SUBPASS_END_INFO;
                    vkCmdNextSubpass2(cmd, &bi, &ei);
                    if (pass) ++pass->subpass;

                } else if constexpr (std::is_same_v<T, op::EndRenderPass>) {
                    VkSubpassEndInfo ei{};
                    ei.sType = VK_STRUCTURE_TYPE_SUBPASS_END_INFO;
                    vkCmdEndRenderPass2(cmd, &ei);
                    pass.reset();

                } else {
                    static_assert(std::is_same_v<T, op::ExecuteCommands>);
                    std::vector<VkCommandBuffer> secondaries;
                    secondaries.reserve(c.secondaries.size());
                    for (const auto& s : c.secondaries) {
                        auto secondary = recordSecondary(*s, pass ? &*pass : nullptr);
                        if (!secondary.ok()) return std::move(secondary.error());
                        secondaries.push_back(secondary.value());
                    }
                    vkCmdExecuteCommands(cmd, static_cast<std::uint32_t>(secondaries.size()),
                                         secondaries.data());
                }
                return {};
            },
            command);
        if (!r.ok()) return r;
    }
    return {};
}

} // namespace gfxhal::vulkan::detail
