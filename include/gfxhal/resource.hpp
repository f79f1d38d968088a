#pragma once

#include <gfxhal/device_object.hpp>
#include <gfxhal/error.hpp>
#include <gfxhal/memory.hpp>
#include <gfxhal/resource_desc.hpp>
#include <gfxhal/result.hpp>

#include <cstdint>
#include <memory>
#include <optional>

namespace gfxhal {

class Device;

// One native memory allocation of a single memory type.
class Memory : public DeviceObject {
public:
    Memory() = default;

    [[nodiscard]] std::uint64_t  size()       const { return size_; }
    [[nodiscard]] std::uint32_t  typeIndex()  const { return typeIndex_; }
    [[nodiscard]] MemoryProperty properties() const { return properties_; }
    [[nodiscard]] bool           mapped()     const { return mapped_; }

    // Non host-visible memory is WrongMemoryType. Mapping twice is
    // InvalidUsage.
    [[nodiscard]] Result<void*> map(std::uint64_t offset = 0, std::uint64_t size = WholeSize);
    void unmap();

private:
    friend class Device;

    std::uint64_t  size_       = 0;
    std::uint32_t  typeIndex_  = 0;
    MemoryProperty properties_ = MemoryProperty::None;
    bool           mapped_     = false;
};

// Buffer and image binds share the same checks: type in the requirement
// mask (WrongMemoryType), offset aligned and range inside the allocation
// (OutOfBounds), bound at most once (InvalidUsage).
class Buffer : public DeviceObject {
public:
    Buffer() = default;

    [[nodiscard]] const BufferDesc&         desc()         const { return desc_; }
    [[nodiscard]] std::uint64_t             size()         const { return desc_.size; }
    [[nodiscard]] const MemoryRequirements& requirements() const { return requirements_; }
    [[nodiscard]] bool                      bound()        const { return bound_; }

    [[nodiscard]] Result<void> bindMemory(const Memory& memory, std::uint64_t offset = 0);

    // Set when the buffer was created together with its own allocation.
    [[nodiscard]] Memory* ownedMemory() { return owned_ ? owned_.get() : nullptr; }

    // Maps the owned allocation at the buffer's offset.
    [[nodiscard]] Result<void*> map();
    void unmap();

private:
    friend class Device;

    BufferDesc              desc_;
    MemoryRequirements      requirements_;
    bool                    bound_ = false;
    std::unique_ptr<Memory> owned_;
};

class Image : public DeviceObject {
public:
    Image() = default;

    [[nodiscard]] const ImageDesc&          desc()         const { return desc_; }
    [[nodiscard]] Format                    format()       const { return desc_.format; }
    [[nodiscard]] Extent3D                  extent()       const { return desc_.extent; }
    [[nodiscard]] const MemoryRequirements& requirements() const { return requirements_; }
    [[nodiscard]] bool                      bound()        const { return bound_; }

    [[nodiscard]] Result<void> bindMemory(const Memory& memory, std::uint64_t offset = 0);

private:
    friend class Device;

    ImageDesc               desc_;
    MemoryRequirements      requirements_;
    bool                    bound_ = false;
    std::unique_ptr<Memory> owned_;
};

class Sampler : public DeviceObject {
public:
    Sampler() = default;

    [[nodiscard]] const SamplerDesc& desc() const { return desc_; }

private:
    friend class Device;

    SamplerDesc desc_;
};

} // namespace gfxhal
