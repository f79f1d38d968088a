#include "soft_executor.hpp"

#include <gfxhal/format.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>
#include <variant>

namespace gfxhal::soft::detail {

namespace {

std::uint32_t readU32(std::span<const std::uint8_t> bytes, std::uint64_t offset) {
    std::uint32_t v = 0;
    if (offset + sizeof(v) <= bytes.size()) std::memcpy(&v, bytes.data() + offset, sizeof(v));
    return v;
}

bool compare(CompareOp op, float fragment, float stored) {
    switch (op) {
    case CompareOp::Never:          return false;
    case CompareOp::Less:           return fragment < stored;
    case CompareOp::Equal:          return fragment == stored;
    case CompareOp::LessOrEqual:    return fragment <= stored;
    case CompareOp::Greater:        return fragment > stored;
    case CompareOp::NotEqual:       return fragment != stored;
    case CompareOp::GreaterOrEqual: return fragment >= stored;
    case CompareOp::Always:         return true;
    }
    return true;
}

std::uint64_t rowBytes(Format format, std::uint32_t texels) {
    return std::uint64_t{formatInfo(format).bytesPerBlock} * texels;
}

} // namespace

Executor::Executor(SoftDevice& device) : device_(device) {}

void Executor::run(const CommandStream& stream) {
    for (const auto& command : stream.commands) {
        std::visit([this](const auto& c) { exec(c); }, command);
    }
}

bool Executor::implicitTransitions() const {
    return device_.adapter().features.implicitPassTransitions;
}

// Layout tracking

void Executor::transition(const ResourceRef& ref, ImageLayout from, ImageLayout to,
                          const char* what) {
    auto image = device_.image(ref.native);
    if (!image) return;
    if (from != ImageLayout::Undefined && image->layout != from) {
        device_.layoutError(what, ref.native, from, image->layout);
    }
    image->layout = to;
}

void Executor::expectLayout(const ResourceRef& ref, ImageLayout expected, const char* what) {
    auto image = device_.image(ref.native);
    if (image && image->layout != expected) {
        device_.layoutError(what, ref.native, expected, image->layout);
    }
}

void Executor::apply(const BarrierSet& barriers, const char* what) {
    for (const auto& b : barriers.images) transition(b.image, b.oldLayout, b.newLayout, what);
}

void Executor::exec(const op::PipelineBarrier& c) { apply(c.barriers, "pipeline barrier"); }

void Executor::exec(const op::SplitBarrierBegin& c) { openSplits_[c.id] = c.barriers; }

// The transition lands when the second half executes.
void Executor::exec(const op::SplitBarrierEnd& c) {
    openSplits_.erase(c.id);
    apply(c.barriers, "split barrier");
}

// Binding

void Executor::exec(const op::BindPipeline& c) {
    BindState& bind = c.bindPoint == PipelineBindPoint::Compute ? compute_ : graphics_;
    bind.pipeline   = device_.pipeline(c.pipeline);
}

void Executor::exec(const op::BindDescriptorSets& c) {
    BindState& bind = c.bindPoint == PipelineBindPoint::Compute ? compute_ : graphics_;
    auto layout     = device_.pipelineLayout(c.layout);
    if (!layout) return;
    const RegisterAssignment& assignment = layout->assignment;

    std::size_t nextOffset = 0;
    for (std::size_t i = 0; i < c.sets.size(); ++i) {
        const std::uint32_t setIndex = c.firstSet + static_cast<std::uint32_t>(i);
        auto set = device_.readSet(c.sets[i]);
        if (!set) continue;
        const auto& bindings = set->layout->bindings();

        // Dynamic offsets arrive per set in declaration order, one per element.
        std::vector<std::vector<std::uint32_t>> dynamic(bindings.size());
        for (std::size_t b = 0; b < bindings.size(); ++b) {
            if (!isDynamicKind(bindings[b].kind)) continue;
            for (std::uint32_t e = 0; e < bindings[b].count; ++e) {
                dynamic[b].push_back(nextOffset < c.dynamicOffsets.size()
                                         ? c.dynamicOffsets[nextOffset]
                                         : 0u);
                ++nextOffset;
            }
        }

        if (setIndex < assignment.sets().size()) {
            const SetAddressing& addressing = assignment.sets()[setIndex];
            if (addressing.resourceTable) bind.tables[*addressing.resourceTable] = set->runs.resources.start;
            if (addressing.samplerTable) bind.tables[*addressing.samplerTable] = set->runs.samplers.start;
        }

        for (const RegisterEntry& entry : assignment.entries()) {
            if (entry.set != setIndex) continue;
            auto index = set->layout->indexOf(entry.binding);
            if (!index) continue;
            const std::uint32_t count = bindings[*index].count;

            for (const AddressPart& p : entry.parts) {
                for (std::uint32_t e = 0; e < count; ++e) {
                    Descriptor d;
                    if (p.address.kind == AddressKind::TableOffset) {
                        auto table = bind.tables.find(p.address.group);
                        if (table == bind.tables.end()) continue;
                        d = device_.heapDescriptor(p.address.space,
                                                   table->second + p.address.slot(e));
                    } else {
                        d = descriptorPart(set->descriptors[*index][e], p.part);
                    }
                    if (auto* buf = std::get_if<BufferDescriptor>(&d); buf && !dynamic[*index].empty()) {
                        buf->offset += dynamic[*index][e];
                    }
                    bind.registers[InvocationContext::keyOf(entry.stage, p.address, e)] = std::move(d);
                }
            }
        }
    }
}

void Executor::exec(const op::PushConstants& c) {
    for (BindState* bind : {&graphics_, &compute_}) {
        if (bind->push.size() < c.offset + c.data.size()) bind->push.resize(c.offset + c.data.size());
        std::copy(c.data.begin(), c.data.end(), bind->push.begin() + c.offset);
    }
}

void Executor::exec(const op::BindVertexBuffers& c) {
    for (std::size_t i = 0; i < c.buffers.size(); ++i) {
        const std::uint64_t offset = i < c.offsets.size() ? c.offsets[i] : 0;
        vertexBuffers_[c.firstBinding + static_cast<std::uint32_t>(i)] =
            VertexBuffer{device_.buffer(c.buffers[i].native), offset};
    }
}

void Executor::exec(const op::BindIndexBuffer& c) {
    indexBuffer_ = IndexBuffer{device_.buffer(c.buffer.native), c.offset, c.type};
}

void Executor::exec(const op::SetViewport& c) { viewport_ = c.viewport; }
void Executor::exec(const op::SetScissor& c) { scissor_ = c.scissor; }

// Render passes

void Executor::exec(const op::BeginRenderPass& c) {
    auto rp = device_.renderPass(c.renderPass);
    auto fb = device_.framebuffer(c.framebuffer);
    if (!rp || !fb) return;
    pass_ = PassState{rp, fb, c.area, 0, false};

    if (implicitTransitions()) {
        const RenderPassPlan& plan = rp->plan;
        for (std::uint32_t a : plan.implicitEntry) {
            if (a >= fb->attachments.size()) continue;
            const AttachmentDesc& desc = rp->desc.attachments[a];
            ImageLayout first = desc.finalLayout;
            for (const auto& layouts : plan.layouts) {
                if (layouts[a]) {
                    first = *layouts[a];
                    break;
                }
            }
            auto& image = *fb->attachments[a];
            if (desc.initialLayout != ImageLayout::Undefined && image.layout != desc.initialLayout) {
                device_.layoutError("render pass begin", c.framebuffer, desc.initialLayout,
                                    image.layout);
            }
            image.layout = first;
        }
    }
    clearAttachments(c);
}

void Executor::clearAttachments(const op::BeginRenderPass& c) {
    const auto& desc = pass_->renderPass->desc;
    const auto& fb   = *pass_->framebuffer;
    for (std::size_t a = 0; a < desc.attachments.size() && a < fb.attachments.size(); ++a) {
        if (desc.attachments[a].load != LoadOp::Clear || a >= c.clears.size()) continue;
        const SoftImage& image = *fb.attachments[a];
        const ClearValue& clear = c.clears[a];
        const Color value = isDepthFormat(image.desc.format)
                                ? Color{clear.depth, 0.0f, 0.0f, 0.0f}
                                : clear.color;

        const auto x0 = static_cast<std::uint32_t>(std::max(0, c.area.x));
        const auto y0 = static_cast<std::uint32_t>(std::max(0, c.area.y));
        const std::uint32_t x1 = std::min(x0 + c.area.extent.width, image.desc.extent.width);
        const std::uint32_t y1 = std::min(y0 + c.area.extent.height, image.desc.extent.height);
        for (std::uint32_t layer = 0; layer < fb.layers && layer < image.desc.arrayLayers; ++layer) {
            for (std::uint32_t y = y0; y < y1; ++y) {
                for (std::uint32_t x = x0; x < x1; ++x) {
                    if (std::uint8_t* t = image.texelAddress(0, layer, x, y)) {
                        encodeTexel(image.desc.format, value, t);
                    }
                }
            }
        }
    }
}

// Every attachment the current subpass references must already be in the
// layout the plan derived for it.
void Executor::checkSubpass() {
    if (!pass_ || pass_->checked) return;
    pass_->checked = true;

    const RenderPassPlan& plan = pass_->renderPass->plan;
    if (pass_->subpass >= plan.layouts.size()) return;
    const auto& layouts = plan.layouts[pass_->subpass];
    const auto& images  = pass_->framebuffer->attachments;
    for (std::size_t a = 0; a < layouts.size() && a < images.size(); ++a) {
        if (layouts[a] && images[a]->layout != *layouts[a]) {
            device_.layoutError("subpass attachment", NullHandle, *layouts[a], images[a]->layout);
        }
    }
}

void Executor::resolveSubpass() {
    const SubpassDesc& sp = pass_->renderPass->desc.subpasses[pass_->subpass];
    const auto& images    = pass_->framebuffer->attachments;
    for (std::size_t i = 0; i < sp.resolves.size() && i < sp.colors.size(); ++i) {
        const std::uint32_t dst = sp.resolves[i];
        const std::uint32_t src = sp.colors[i];
        if (dst == UnusedAttachment || src == UnusedAttachment) continue;
        const SoftImage& from = *images[src];
        const SoftImage& to   = *images[dst];
        const Rect2D& area    = pass_->area;
        for (std::uint32_t y = 0; y < area.extent.height; ++y) {
            for (std::uint32_t x = 0; x < area.extent.width; ++x) {
                const std::uint32_t px = static_cast<std::uint32_t>(area.x) + x;
                const std::uint32_t py = static_cast<std::uint32_t>(area.y) + y;
                if (px >= to.desc.extent.width || py >= to.desc.extent.height) continue;
                const std::uint8_t* s = from.texelAddress(0, 0, px, py);
                std::uint8_t*       d = to.texelAddress(0, 0, px, py);
                if (s && d) encodeTexel(to.desc.format, decodeTexel(from.desc.format, s), d);
            }
        }
    }
}

void Executor::enterSubpassImplicit() {
    const RenderPassPlan& plan = pass_->renderPass->plan;
    const auto& layouts = plan.layouts[pass_->subpass];
    const auto& images  = pass_->framebuffer->attachments;
    for (std::size_t a = 0; a < layouts.size() && a < images.size(); ++a) {
        if (layouts[a]) images[a]->layout = *layouts[a];
    }
}

void Executor::exec(const op::NextSubpass&) {
    if (!pass_) return;
    checkSubpass();
    resolveSubpass();
    ++pass_->subpass;
    pass_->checked = false;
    if (implicitTransitions()) enterSubpassImplicit();
}

void Executor::exec(const op::EndRenderPass&) {
    if (!pass_) return;
    checkSubpass();
    resolveSubpass();
    if (implicitTransitions()) {
        const auto& desc   = pass_->renderPass->desc;
        const auto& images = pass_->framebuffer->attachments;
        for (std::uint32_t a : pass_->renderPass->plan.implicitExit) {
            if (a < images.size()) images[a]->layout = desc.attachments[a].finalLayout;
        }
    }
    pass_.reset();
}

void Executor::exec(const op::ExecuteCommands& c) {
    for (const auto& secondary : c.secondaries) {
        graphics_ = BindState{};
        compute_  = BindState{};
        vertexBuffers_.clear();
        indexBuffer_.reset();
        run(*secondary);
    }
    graphics_ = BindState{};
    compute_  = BindState{};
}

// Drawing

InvocationContext Executor::context(BindState& bind, const SoftStage& stage) {
    InvocationContext ctx;
    ctx.device        = &device_;
    ctx.stage         = stage.stage;
    ctx.remaps        = &stage.remaps;
    ctx.registers     = &bind.registers;
    ctx.push          = &bind.push;
    ctx.checkedImages = &checkedImages_;
    return ctx;
}

void Executor::drawVertices(const std::vector<std::uint32_t>& vertices,
                            std::uint32_t instanceCount, std::uint32_t firstInstance) {
    if (!pass_ || !graphics_.pipeline) return;
    checkSubpass();
    checkedImages_.clear();
    const SoftPipeline& pipeline = *graphics_.pipeline;

    if (const SoftStage* vs = pipeline.find(ShaderStage::Vertex); vs && vs->program->body) {
        for (std::uint32_t inst = firstInstance; inst < firstInstance + instanceCount; ++inst) {
            for (std::uint32_t v : vertices) {
                InvocationContext ctx = context(graphics_, *vs);
                ctx.vertexIndex       = v;
                ctx.instanceIndex     = inst;
                for (const auto& attr : pipeline.vertexAttributes) {
                    auto vb = vertexBuffers_.find(attr.binding);
                    if (vb == vertexBuffers_.end() || !vb->second.buffer) continue;
                    const VertexBinding* binding = nullptr;
                    for (const auto& b : pipeline.vertexBindings) {
                        if (b.binding == attr.binding) binding = &b;
                    }
                    if (!binding) continue;
                    const std::uint32_t index = binding->rate == VertexRate::Vertex ? v : inst;
                    const std::uint64_t at =
                        vb->second.offset + std::uint64_t{index} * binding->stride + attr.offset;
                    const std::uint64_t size  = formatInfo(attr.format).bytesPerBlock;
                    auto bytes                = vb->second.buffer->bytes();
                    if (at + size <= bytes.size()) {
                        ctx.attributes[attr.location] = std::span<const std::uint8_t>(
                            bytes.data() + at, static_cast<std::size_t>(size));
                    }
                }
                Invocation invocation = ctx.invocation();
                vs->program->body(invocation);
            }
        }
    }
    shadeFragments();
}

void Executor::shadeFragments() {
    const SoftPipeline& pipeline = *graphics_.pipeline;
    const SoftStage* fs = pipeline.find(ShaderStage::Fragment);
    if (!fs || !fs->program->body) return;

    const auto& rp      = *pass_->renderPass;
    const auto& images  = pass_->framebuffer->attachments;
    const SubpassDesc& sp = rp.desc.subpasses[pass_->subpass];

    std::int32_t x0 = pass_->area.x;
    std::int32_t y0 = pass_->area.y;
    std::int32_t x1 = x0 + static_cast<std::int32_t>(pass_->area.extent.width);
    std::int32_t y1 = y0 + static_cast<std::int32_t>(pass_->area.extent.height);
    if (scissor_) {
        x0 = std::max(x0, scissor_->x);
        y0 = std::max(y0, scissor_->y);
        x1 = std::min(x1, scissor_->x + static_cast<std::int32_t>(scissor_->extent.width));
        y1 = std::min(y1, scissor_->y + static_cast<std::int32_t>(scissor_->extent.height));
    }
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min(x1, static_cast<std::int32_t>(pass_->framebuffer->extent.width));
    y1 = std::min(y1, static_cast<std::int32_t>(pass_->framebuffer->extent.height));

    const float defaultDepth = viewport_ ? viewport_->minDepth : 0.0f;
    std::shared_ptr<SoftImage> depthImage;
    if (sp.depthStencil && *sp.depthStencil < images.size()) depthImage = images[*sp.depthStencil];

    for (std::int32_t y = y0; y < y1; ++y) {
        for (std::int32_t x = x0; x < x1; ++x) {
            const auto px = static_cast<std::uint32_t>(x);
            const auto py = static_cast<std::uint32_t>(y);

            InvocationContext ctx = context(graphics_, *fs);
            ctx.pixel             = {px, py};
            ctx.colors.assign(sp.colors.size(), std::nullopt);
            Invocation invocation = ctx.invocation();
            fs->program->body(invocation);
            if (ctx.discarded) continue;

            if (depthImage && pipeline.depth.test) {
                std::uint8_t* t = depthImage->texelAddress(0, 0, px, py);
                if (!t) continue;
                const float stored   = decodeTexel(depthImage->desc.format, t)[0];
                const float fragment = ctx.depth.value_or(defaultDepth);
                if (!compare(pipeline.depth.compare, fragment, stored)) continue;
                if (pipeline.depth.write && !sp.depthReadOnly) {
                    encodeTexel(depthImage->desc.format, Color{fragment, 0.0f, 0.0f, 0.0f}, t);
                }
            }

            for (std::size_t i = 0; i < sp.colors.size(); ++i) {
                if (!ctx.colors[i] || sp.colors[i] == UnusedAttachment) continue;
                const SoftImage& target = *images[sp.colors[i]];
                std::uint8_t* t = target.texelAddress(0, 0, px, py);
                if (!t) continue;
                Color out = *ctx.colors[i];
                if (i < pipeline.blend.size() && pipeline.blend[i].enable) {
                    const Color dst = decodeTexel(target.desc.format, t);
                    const float a   = out[3];
                    for (int k = 0; k < 3; ++k) out[k] = out[k] * a + dst[k] * (1.0f - a);
                    out[3] = a + dst[3] * (1.0f - a);
                }
                encodeTexel(target.desc.format, out, t);
            }
        }
    }
}

void Executor::exec(const op::Draw& c) {
    std::vector<std::uint32_t> vertices(c.vertexCount);
    for (std::uint32_t i = 0; i < c.vertexCount; ++i) vertices[i] = c.firstVertex + i;
    drawVertices(vertices, c.instanceCount, c.firstInstance);
}

void Executor::exec(const op::DrawIndexed& c) {
    if (!indexBuffer_ || !indexBuffer_->buffer) return;
    auto bytes = indexBuffer_->buffer->bytes();
    const std::uint64_t stride = indexBuffer_->type == IndexType::Uint16 ? 2 : 4;

    std::vector<std::uint32_t> vertices;
    vertices.reserve(c.indexCount);
    for (std::uint32_t i = 0; i < c.indexCount; ++i) {
        const std::uint64_t at = indexBuffer_->offset + (c.firstIndex + i) * stride;
        if (at + stride > bytes.size()) {
            device_.bindingError("indexed draw reads past the end of the index buffer");
            break;
        }
        std::uint32_t index = 0;
        if (stride == 2) {
            std::uint16_t v16 = 0;
            std::memcpy(&v16, bytes.data() + at, 2);
            index = v16;
        } else {
            std::memcpy(&index, bytes.data() + at, 4);
        }
        vertices.push_back(static_cast<std::uint32_t>(static_cast<std::int64_t>(index) + c.vertexOffset));
    }
    drawVertices(vertices, c.instanceCount, c.firstInstance);
}

void Executor::exec(const op::DrawIndirect& c) {
    auto buffer = device_.buffer(c.buffer.native);
    if (!buffer) return;
    auto bytes = buffer->bytes();
    for (std::uint32_t d = 0; d < c.drawCount; ++d) {
        const std::uint64_t at = c.offset + std::uint64_t{d} * c.stride;
        op::Draw draw;
        draw.vertexCount   = readU32(bytes, at);
        draw.instanceCount = readU32(bytes, at + 4);
        draw.firstVertex   = readU32(bytes, at + 8);
        draw.firstInstance = readU32(bytes, at + 12);
        exec(draw);
    }
}

void Executor::exec(const op::Dispatch& c) {
    if (!compute_.pipeline) return;
    const SoftStage* cs = compute_.pipeline->find(ShaderStage::Compute);
    if (!cs || !cs->program->body) return;
    checkedImages_.clear();
    for (std::uint32_t z = 0; z < c.z; ++z) {
        for (std::uint32_t y = 0; y < c.y; ++y) {
            for (std::uint32_t x = 0; x < c.x; ++x) {
                InvocationContext ctx = context(compute_, *cs);
                ctx.workgroup         = {x, y, z};
                Invocation invocation = ctx.invocation();
                cs->program->body(invocation);
            }
        }
    }
}

void Executor::exec(const op::DispatchIndirect& c) {
    auto buffer = device_.buffer(c.buffer.native);
    if (!buffer) return;
    auto bytes = buffer->bytes();
    exec(op::Dispatch{readU32(bytes, c.offset), readU32(bytes, c.offset + 4),
                      readU32(bytes, c.offset + 8)});
}

// Transfers

void Executor::exec(const op::CopyBuffer& c) {
    auto src = device_.buffer(c.src.native);
    auto dst = device_.buffer(c.dst.native);
    if (!src || !dst) return;
    auto from = src->bytes();
    auto to   = dst->bytes();
    for (const auto& r : c.regions) {
        if (r.srcOffset + r.size > from.size() || r.dstOffset + r.size > to.size()) continue;
        std::memmove(to.data() + r.dstOffset, from.data() + r.srcOffset, r.size);
    }
}

void Executor::exec(const op::CopyBufferToImage& c) {
    auto src   = device_.buffer(c.src.native);
    auto image = device_.image(c.dst.native);
    if (!src || !image) return;
    expectLayout(c.dst, c.dstLayout, "copy buffer to image");

    auto bytes = src->bytes();
    const Format format = image->desc.format;
    for (const auto& r : c.regions) {
        const std::uint32_t rowLength = r.bufferRowLength ? r.bufferRowLength : r.imageExtent.width;
        const std::uint32_t height    = r.bufferImageHeight ? r.bufferImageHeight : r.imageExtent.height;
        const std::uint64_t row       = rowBytes(format, r.imageExtent.width);
        for (std::uint32_t layer = 0; layer < r.layerCount; ++layer) {
            for (std::uint32_t z = 0; z < r.imageExtent.depth; ++z) {
                for (std::uint32_t y = 0; y < r.imageExtent.height; ++y) {
                    const std::uint64_t at =
                        r.bufferOffset +
                        ((std::uint64_t{layer} * r.imageExtent.depth + z) * height + y) *
                            rowBytes(format, rowLength);
                    std::uint8_t* t = image->texelAddress(
                        r.mipLevel, r.baseLayer + layer, static_cast<std::uint32_t>(r.imageOffset.x),
                        static_cast<std::uint32_t>(r.imageOffset.y) + y,
                        static_cast<std::uint32_t>(r.imageOffset.z) + z);
                    if (!t || at + row > bytes.size()) continue;
                    std::memcpy(t, bytes.data() + at, row);
                }
            }
        }
    }
}

void Executor::exec(const op::CopyImageToBuffer& c) {
    auto image = device_.image(c.src.native);
    auto dst   = device_.buffer(c.dst.native);
    if (!image || !dst) return;
    expectLayout(c.src, c.srcLayout, "copy image to buffer");

    auto bytes = dst->bytes();
    const Format format = image->desc.format;
    for (const auto& r : c.regions) {
        const std::uint32_t rowLength = r.bufferRowLength ? r.bufferRowLength : r.imageExtent.width;
        const std::uint32_t height    = r.bufferImageHeight ? r.bufferImageHeight : r.imageExtent.height;
        const std::uint64_t row       = rowBytes(format, r.imageExtent.width);
        for (std::uint32_t layer = 0; layer < r.layerCount; ++layer) {
            for (std::uint32_t z = 0; z < r.imageExtent.depth; ++z) {
                for (std::uint32_t y = 0; y < r.imageExtent.height; ++y) {
                    const std::uint64_t at =
                        r.bufferOffset +
                        ((std::uint64_t{layer} * r.imageExtent.depth + z) * height + y) *
                            rowBytes(format, rowLength);
                    const std::uint8_t* t = image->texelAddress(
                        r.mipLevel, r.baseLayer + layer, static_cast<std::uint32_t>(r.imageOffset.x),
                        static_cast<std::uint32_t>(r.imageOffset.y) + y,
                        static_cast<std::uint32_t>(r.imageOffset.z) + z);
                    if (!t || at + row > bytes.size()) continue;
                    std::memcpy(bytes.data() + at, t, row);
                }
            }
        }
    }
}

void Executor::exec(const op::FillBuffer& c) {
    auto buffer = device_.buffer(c.buffer.native);
    if (!buffer) return;
    auto bytes = buffer->bytes();
    if (c.offset >= bytes.size()) return;
    std::uint64_t size = c.size == WholeSize ? (bytes.size() - c.offset) & ~std::uint64_t{3} : c.size;
    size = std::min<std::uint64_t>(size, bytes.size() - c.offset);
    for (std::uint64_t at = 0; at + 4 <= size; at += 4) {
        std::memcpy(bytes.data() + c.offset + at, &c.value, 4);
    }
}

void Executor::exec(const op::UpdateBuffer& c) {
    auto buffer = device_.buffer(c.buffer.native);
    if (!buffer) return;
    auto bytes = buffer->bytes();
    if (c.offset + c.data.size() > bytes.size()) return;
    std::memcpy(bytes.data() + c.offset, c.data.data(), c.data.size());
}

} // namespace gfxhal::soft::detail
