#include <gfxhal/soft/soft.hpp>

#include "soft_device.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <variant>

namespace gfxhal::soft {

namespace detail {

InvocationContext::RegisterKey InvocationContext::keyOf(ShaderStage stage,
                                                        const NativeAddress& address,
                                                        std::uint32_t element) {
    // An explicit binding keeps its array elements apart from its neighbours'.
    if (address.kind == AddressKind::SetBinding) {
        return {stage, address.space, address.group, address.index, element};
    }
    return {stage, address.space, address.group, address.slot(element), 0};
}

const Descriptor* InvocationContext::resolve(std::string_view name, DescriptorPart part,
                                             std::uint32_t element) const {
    if (!remaps || !registers) return nullptr;
    auto remap = std::find_if(remaps->begin(), remaps->end(),
                              [&](const ShaderRemap& r) { return r.name == name; });
    if (remap == remaps->end() || remap->pushConstant || remap->parts.empty()) return nullptr;

    // Split backends carry the image and sampler halves at separate
    // addresses; everything else has one whole address.
    const AddressPart* chosen = &remap->parts.front();
    for (const auto& p : remap->parts) {
        if (p.part == part) chosen = &p;
    }
    if (element >= chosen->address.count) return nullptr;

    auto it = registers->find(keyOf(stage, chosen->address, element));
    if (it == registers->end() || std::holds_alternative<std::monostate>(it->second)) {
        return nullptr;
    }
    return &it->second;
}

} // namespace detail

namespace {

struct ImageView {
    std::shared_ptr<detail::SoftImage> image;
    NativeHandle                       handle = NullHandle;
    ImageLayout                        layout = ImageLayout::Undefined;
};

std::optional<ImageView> imageOf(detail::SoftDevice& device, const Descriptor& d) {
    if (const auto* img = std::get_if<ImageDescriptor>(&d)) {
        return ImageView{device.image(img->image.native), img->image.native, img->layout};
    }
    if (const auto* c = std::get_if<CombinedImageSamplerDescriptor>(&d)) {
        return ImageView{device.image(c->image.native), c->image.native, c->layout};
    }
    return std::nullopt;
}

std::uint32_t wrap(AddressMode mode, float coord, std::uint32_t size) {
    auto i = static_cast<std::int64_t>(std::floor(coord * static_cast<float>(size)));
    const auto n = static_cast<std::int64_t>(size);
    switch (mode) {
    case AddressMode::Repeat:
        i %= n;
        if (i < 0) i += n;
        break;
    case AddressMode::MirroredRepeat: {
        std::int64_t period = i % (2 * n);
        if (period < 0) period += 2 * n;
        i = period < n ? period : 2 * n - 1 - period;
        break;
    }
    case AddressMode::ClampToEdge:
    case AddressMode::ClampToBorder:
        i = std::clamp<std::int64_t>(i, 0, n - 1);
        break;
    }
    return static_cast<std::uint32_t>(i);
}

} // namespace

ShaderStage Invocation::stage() const { return context_.stage; }
std::uint32_t Invocation::vertexIndex() const { return context_.vertexIndex; }
std::uint32_t Invocation::instanceIndex() const { return context_.instanceIndex; }
std::array<std::uint32_t, 3> Invocation::workgroup() const { return context_.workgroup; }
std::array<std::uint32_t, 2> Invocation::pixel() const { return context_.pixel; }

const ShaderRemap* Invocation::remap(std::string_view name) const {
    if (!context_.remaps) return nullptr;
    for (const auto& r : *context_.remaps) {
        if (r.name == name) return &r;
    }
    return nullptr;
}

void Invocation::fault(const char* what, std::string_view name) const {
    context_.device->bindingError(std::string(toString(context_.stage)) + " program: " + what +
                                  " '" + std::string(name) + "'");
}

std::span<std::uint8_t> Invocation::buffer(std::string_view name, std::uint32_t element) {
    const Descriptor* d = context_.resolve(name, DescriptorPart::Whole, element);
    if (!d) {
        fault("nothing is bound at", name);
        return {};
    }

    NativeHandle  handle = NullHandle;
    std::uint64_t offset = 0;
    std::uint64_t range  = WholeSize;
    if (const auto* b = std::get_if<BufferDescriptor>(d)) {
        handle = b->buffer.native;
        offset = b->offset;
        range  = b->range;
    } else if (const auto* t = std::get_if<TexelBufferDescriptor>(d)) {
        handle = t->buffer.native;
        offset = t->offset;
        range  = t->range;
    } else {
        fault("a non-buffer descriptor is bound at", name);
        return {};
    }

    auto buf = context_.device->buffer(handle);
    if (!buf) {
        fault("a destroyed buffer is bound at", name);
        return {};
    }
    auto bytes = buf->bytes();
    if (offset >= bytes.size()) return {};
    const std::uint64_t available = bytes.size() - offset;
    return bytes.subspan(offset, range == WholeSize ? available : std::min(range, available));
}

std::span<const std::uint8_t> Invocation::pushConstants() const {
    if (!context_.push) return {};
    return {context_.push->data(), context_.push->size()};
}

std::span<const std::uint8_t> Invocation::attribute(std::uint32_t location) const {
    auto it = context_.attributes.find(location);
    return it == context_.attributes.end() ? std::span<const std::uint8_t>{} : it->second;
}

Color Invocation::texel(std::string_view name, std::uint32_t x, std::uint32_t y,
                        std::uint32_t element) {
    const Descriptor* d = context_.resolve(name, DescriptorPart::Texture, element);
    auto view           = d ? imageOf(*context_.device, *d) : std::nullopt;
    if (!view || !view->image) {
        fault("no image is bound at", name);
        return {};
    }
    if (context_.checkedImages && context_.checkedImages->insert(view->handle).second &&
        view->image->layout != view->layout) {
        context_.device->layoutError("shader read", view->handle, view->layout,
                                     view->image->layout);
    }
    const auto& extent = view->image->desc.extent;
    if (x >= extent.width || y >= extent.height) return {};
    const std::uint8_t* t = view->image->texelAddress(0, 0, x, y);
    return t ? detail::decodeTexel(view->image->desc.format, t) : Color{};
}

void Invocation::writeTexel(std::string_view name, std::uint32_t x, std::uint32_t y,
                            const Color& color, std::uint32_t element) {
    const Descriptor* d = context_.resolve(name, DescriptorPart::Texture, element);
    auto view           = d ? imageOf(*context_.device, *d) : std::nullopt;
    if (!view || !view->image) {
        fault("no image is bound at", name);
        return;
    }
    if (context_.checkedImages && context_.checkedImages->insert(view->handle).second &&
        view->image->layout != ImageLayout::General) {
        context_.device->layoutError("shader write", view->handle, ImageLayout::General,
                                     view->image->layout);
    }
    const auto& extent = view->image->desc.extent;
    if (x >= extent.width || y >= extent.height) return;
    if (std::uint8_t* t = view->image->texelAddress(0, 0, x, y)) {
        detail::encodeTexel(view->image->desc.format, color, t);
    }
}

Color Invocation::sample(std::string_view name, float u, float v, std::uint32_t element) {
    const Descriptor* samplerDesc = context_.resolve(name, DescriptorPart::Sampler, element);
    NativeHandle samplerHandle    = NullHandle;
    if (samplerDesc) {
        if (const auto* s = std::get_if<SamplerDescriptor>(samplerDesc)) {
            samplerHandle = s->sampler.native;
        } else if (const auto* c = std::get_if<CombinedImageSamplerDescriptor>(samplerDesc)) {
            samplerHandle = c->sampler.native;
        }
    }
    auto sampler = context_.device->sampler(samplerHandle);
    if (!sampler) {
        fault("no sampler is bound at", name);
        return {};
    }

    const Descriptor* imageDesc = context_.resolve(name, DescriptorPart::Texture, element);
    auto view = imageDesc ? imageOf(*context_.device, *imageDesc) : std::nullopt;
    if (!view || !view->image) {
        fault("no image is bound at", name);
        return {};
    }
    const auto& extent = view->image->desc.extent;
    return texel(name, wrap(sampler->desc.addressU, u, extent.width),
                 wrap(sampler->desc.addressV, v, extent.height), element);
}

Color Invocation::input(std::string_view name) {
    return texel(name, context_.pixel[0], context_.pixel[1]);
}

void Invocation::setColor(std::uint32_t target, const Color& color) {
    if (target >= context_.colors.size()) {
        fault("no color attachment for output", std::to_string(target));
        return;
    }
    context_.colors[target] = color;
}

void Invocation::setDepth(float depth) { context_.depth = depth; }

void Invocation::discard() { context_.discarded = true; }

} // namespace gfxhal::soft
