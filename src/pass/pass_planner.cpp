#include <gfxhal/pass_planner.hpp>

#include <algorithm>
#include <map>
#include <string>

namespace gfxhal {

namespace {

bool has(const std::vector<std::uint32_t>& v, std::uint32_t a) {
    return std::find(v.begin(), v.end(), a) != v.end();
}

Error invalid(std::string message) {
    return Error{"create render pass", ErrorCode::InvalidUsage, 0, std::move(message)};
}

// How one subpass uses one attachment.
struct Role {
    ImageLayout   layout = ImageLayout::Undefined;
    PipelineStage stages = PipelineStage::None;
    Access        access = Access::None;
};

std::optional<Role> roleOf(const RenderPassDesc& desc, std::uint32_t subpass, std::uint32_t a) {
    const SubpassDesc& sp = desc.subpasses[subpass];
    const bool color = has(sp.colors, a) || has(sp.resolves, a);
    const bool depth = sp.depthStencil && *sp.depthStencil == a;
    const bool input = has(sp.inputs, a);
    if (!color && !depth && !input) return std::nullopt;

    Role r;
    if (color) {
        r.stages |= PipelineStage::ColorAttachmentOutput;
        r.access |= Access::ColorAttachmentRead | Access::ColorAttachmentWrite;
    }
    if (depth) {
        r.stages |= PipelineStage::EarlyFragmentTests | PipelineStage::LateFragmentTests;
        r.access |= Access::DepthStencilAttachmentRead;
        if (!sp.depthReadOnly) r.access |= Access::DepthStencilAttachmentWrite;
    }
    if (input) {
        r.stages |= PipelineStage::FragmentShader;
        r.access |= Access::InputAttachmentRead;
    }

    const bool written = color || (depth && !sp.depthReadOnly);
    if (written && input) {
        r.layout = ImageLayout::General;
    } else if (color) {
        r.layout = ImageLayout::ColorAttachment;
    } else if (depth) {
        r.layout = sp.depthReadOnly ? ImageLayout::DepthStencilReadOnly
                                    : ImageLayout::DepthStencilAttachment;
    } else {
        r.layout = isDepthFormat(desc.attachments[a].format) ? ImageLayout::DepthStencilReadOnly
                                                             : ImageLayout::ShaderReadOnly;
    }
    return r;
}

PlannedBarrier between(std::uint32_t a, ImageLayout from, PipelineStage srcStages,
                       Access srcAccess, const Role& to) {
    PlannedBarrier b;
    b.attachment = a;
    b.oldLayout  = from;
    b.newLayout  = to.layout;
    b.srcStages  = srcStages;
    b.srcAccess  = srcAccess & kWriteAccess;
    b.dstStages  = to.stages;
    b.dstAccess  = to.access;
    return b;
}

} // namespace

Result<void> validateRenderPass(const RenderPassDesc& desc) {
    if (desc.subpasses.empty()) return invalid("a render pass needs at least one subpass");

    const auto count = static_cast<std::uint32_t>(desc.attachments.size());
    for (std::uint32_t a = 0; a < count; ++a) {
        const auto finalLayout = desc.attachments[a].finalLayout;
        if (finalLayout == ImageLayout::Undefined || finalLayout == ImageLayout::Preinitialized) {
            return invalid("attachment " + std::to_string(a) +
                           " has an undefined final layout");
        }
    }

    for (std::uint32_t i = 0; i < desc.subpasses.size(); ++i) {
        const SubpassDesc& sp = desc.subpasses[i];
        const std::string where = "subpass " + std::to_string(i) + ": ";

        auto inRange = [&](std::uint32_t a) { return a < count; };

        for (std::size_t c = 0; c < sp.colors.size(); ++c) {
            const std::uint32_t a = sp.colors[c];
            if (!inRange(a)) return invalid(where + "color attachment out of range");
            if (isDepthFormat(desc.attachments[a].format)) {
                return invalid(where + "color attachment " + std::to_string(a) +
                               " has a depth format");
            }
            if (std::count(sp.colors.begin(), sp.colors.end(), a) > 1) {
                return invalid(where + "attachment " + std::to_string(a) +
                               " bound to two color slots");
            }
        }
        if (!sp.resolves.empty() && sp.resolves.size() != sp.colors.size()) {
            return invalid(where + "resolve list must be empty or match the color list");
        }
        for (std::uint32_t a : sp.resolves) {
            if (a != UnusedAttachment && !inRange(a)) {
                return invalid(where + "resolve attachment out of range");
            }
        }
        if (sp.depthStencil) {
            if (!inRange(*sp.depthStencil)) return invalid(where + "depth attachment out of range");
            if (!isDepthFormat(desc.attachments[*sp.depthStencil].format)) {
                return invalid(where + "depth attachment has a color format");
            }
        }
        for (std::uint32_t a : sp.inputs) {
            if (!inRange(a)) return invalid(where + "input attachment out of range");
        }
        for (std::uint32_t a : sp.preserves) {
            if (!inRange(a)) return invalid(where + "preserve attachment out of range");
            if (has(sp.colors, a) || has(sp.inputs, a) || has(sp.resolves, a) ||
                (sp.depthStencil && *sp.depthStencil == a)) {
                return invalid(where + "attachment " + std::to_string(a) +
                               " is both preserved and used");
            }
        }
    }
    return {};
}

std::size_t RenderPassPlan::interSubpassBarrierCount() const {
    std::size_t n = 0;
    for (const auto& s : subpasses) {
        // A split pair counts once, at its begin half.
        for (const auto& b : s.before) {
            if (b.timing == BarrierTiming::Full) ++n;
        }
        for (const auto& b : s.after) {
            if (b.timing == BarrierTiming::SplitBegin) ++n;
        }
    }
    return n;
}

std::size_t RenderPassPlan::barrierCount() const {
    return entry.size() + exit.size() + interSubpassBarrierCount();
}

Result<RenderPassPlan> planRenderPass(const RenderPassDesc& desc, const PlannerOptions& options) {
    auto valid = validateRenderPass(desc);
    if (!valid.ok()) return std::move(valid.error());

    const auto attachmentCount = static_cast<std::uint32_t>(desc.attachments.size());
    const auto subpassCount    = static_cast<std::uint32_t>(desc.subpasses.size());

    RenderPassPlan plan;
    plan.subpasses.resize(subpassCount);
    plan.layouts.assign(subpassCount,
                        std::vector<std::optional<ImageLayout>>(attachmentCount, std::nullopt));

    std::uint32_t nextSplitId = 0;

    for (std::uint32_t a = 0; a < attachmentCount; ++a) {
        const AttachmentDesc& att = desc.attachments[a];

        std::vector<std::pair<std::uint32_t, Role>> refs;
        for (std::uint32_t i = 0; i < subpassCount; ++i) {
            if (auto r = roleOf(desc, i, a)) {
                refs.emplace_back(i, *r);
                plan.layouts[i][a] = r->layout;
            }
        }

        if (refs.empty()) {
            // Only carried through the pass; a single transition at exit.
            if (att.initialLayout != att.finalLayout) {
                if (options.implicitEntryExit) {
                    plan.implicitExit.push_back(a);
                } else {
                    const LayoutUsage src = usageOf(att.initialLayout);
                    const LayoutUsage dst = usageOf(att.finalLayout);
                    Role to{att.finalLayout, dst.stages, dst.access};
                    plan.exit.push_back(between(a, att.initialLayout, src.stages, src.access, to));
                }
            }
            continue;
        }

        // Entry.
        const Role& first = refs.front().second;
        if (att.initialLayout != first.layout) {
            if (options.implicitEntryExit) {
                plan.implicitEntry.push_back(a);
            } else {
                const LayoutUsage src = usageOf(att.initialLayout);
                plan.entry.push_back(between(a, att.initialLayout, src.stages, src.access, first));
            }
        }

        // Consecutive referencing subpasses.
        for (std::size_t k = 0; k + 1 < refs.size(); ++k) {
            const auto& [fromSubpass, from] = refs[k];
            const auto& [toSubpass, to]     = refs[k + 1];
            if (from.layout == to.layout || options.implicitSubpassTransitions) continue;

            PlannedBarrier b = between(a, from.layout, from.stages, from.access, to);
            if (options.splitBarriers) {
                b.splitId = nextSplitId++;

                PlannedBarrier begin = b;
                begin.timing = BarrierTiming::SplitBegin;
                plan.subpasses[fromSubpass].after.push_back(begin);

                PlannedBarrier end = b;
                end.timing = BarrierTiming::SplitEnd;
                plan.subpasses[toSubpass].before.push_back(end);
            } else {
                plan.subpasses[toSubpass].before.push_back(b);
            }
        }

        // Exit.
        const Role& last = refs.back().second;
        if (att.finalLayout != last.layout) {
            if (options.implicitEntryExit) {
                plan.implicitExit.push_back(a);
            } else {
                const LayoutUsage dst = usageOf(att.finalLayout);
                Role to{att.finalLayout, dst.stages, dst.access};
                plan.exit.push_back(between(a, last.layout, last.stages, last.access, to));
            }
        }
    }

    return plan;
}

Result<void> validateSplitPairs(const RenderPassPlan& plan) {
    struct Half {
        std::uint32_t  subpass;
        PlannedBarrier barrier;
    };
    std::map<std::uint32_t, Half> open;
    std::map<std::uint32_t, bool> closed;

    auto fail = [](const std::string& m) {
        return Error{"validate split barriers", ErrorCode::InvalidUsage, 0, m};
    };

    for (std::uint32_t i = 0; i < plan.subpasses.size(); ++i) {
        // Ends sit before the subpass, begins after it.
        for (const auto& b : plan.subpasses[i].before) {
            if (b.timing == BarrierTiming::SplitBegin) {
                return fail("split begin " + std::to_string(b.splitId) +
                            " placed before a subpass");
            }
            if (b.timing != BarrierTiming::SplitEnd) continue;
            auto it = open.find(b.splitId);
            if (it == open.end()) {
                return fail("split end " + std::to_string(b.splitId) + " has no begin");
            }
            if (it->second.subpass >= i) {
                return fail("split end " + std::to_string(b.splitId) + " precedes its begin");
            }
            const PlannedBarrier& begin = it->second.barrier;
            if (begin.attachment != b.attachment || begin.oldLayout != b.oldLayout ||
                begin.newLayout != b.newLayout) {
                return fail("split pair " + std::to_string(b.splitId) +
                            " halves describe different transitions");
            }
            open.erase(it);
            closed[b.splitId] = true;
        }
        for (const auto& b : plan.subpasses[i].after) {
            if (b.timing == BarrierTiming::SplitEnd) {
                return fail("split end " + std::to_string(b.splitId) + " placed after a subpass");
            }
            if (b.timing != BarrierTiming::SplitBegin) continue;
            if (open.count(b.splitId) || closed.count(b.splitId)) {
                return fail("split begin " + std::to_string(b.splitId) + " issued twice");
            }
            open[b.splitId] = Half{i, b};
        }
    }

    if (!open.empty()) {
        return fail("split begin " + std::to_string(open.begin()->first) +
                    " is never ended");
    }
    return {};
}

} // namespace gfxhal
