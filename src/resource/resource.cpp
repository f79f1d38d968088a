#include <gfxhal/resource.hpp>

#include "../core/device_core.hpp"

#include <string>

namespace gfxhal {

namespace {

Result<void> checkBind(const char* operation, const MemoryRequirements& req, const Memory& memory,
                       std::uint64_t offset, bool alreadyBound) {
    if (alreadyBound) {
        return Error{operation, ErrorCode::InvalidUsage, 0,
                     "memory is bound once; create a new resource to rebind"};
    }
    if (!memory.valid()) {
        return Error{operation, ErrorCode::InvalidUsage, 0, "memory object is empty"};
    }
    if ((req.typeMask & (1u << memory.typeIndex())) == 0) {
        return Error{operation, ErrorCode::WrongMemoryType, 0,
                     "memory type " + std::to_string(memory.typeIndex()) +
                         " is not in the resource's type mask"};
    }
    if (req.alignment > 1 && offset % req.alignment != 0) {
        return Error{operation, ErrorCode::OutOfBounds, 0,
                     "offset " + std::to_string(offset) + " is not a multiple of the required " +
                         std::to_string(req.alignment) + "-byte alignment"};
    }
    if (offset > memory.size() || req.size > memory.size() - offset) {
        return Error{operation, ErrorCode::OutOfBounds, 0,
                     std::to_string(req.size) + " bytes at offset " + std::to_string(offset) +
                         " do not fit a " + std::to_string(memory.size()) + "-byte allocation"};
    }
    return {};
}

} // namespace

Result<void*> Memory::map(std::uint64_t offset, std::uint64_t size) {
    if (!core_) return Error{"map memory", ErrorCode::InvalidUsage, 0, "memory object is empty"};
    if (auto lost = core_->checkLost("map memory"); !lost.ok()) return std::move(lost.error());

    if (!any(properties_ & MemoryProperty::HostVisible)) {
        return Error{"map memory", ErrorCode::WrongMemoryType, 0,
                     "memory type " + std::to_string(typeIndex_) +
                         " is not host visible; allocate with MemoryUsage::Upload or Readback"};
    }
    if (mapped_) {
        return Error{"map memory", ErrorCode::InvalidUsage, 0, "memory is already mapped"};
    }
    if (offset > size_ || (size != WholeSize && size > size_ - offset)) {
        return Error{"map memory", ErrorCode::OutOfBounds, 0,
                     "mapped range exceeds the " + std::to_string(size_) + "-byte allocation"};
    }

    auto ptr = core_->observed(core_->native().mapMemory(native_, offset, size));
    if (!ptr.ok()) return ptr;
    mapped_ = true;
    return ptr;
}

void Memory::unmap() {
    if (!core_ || !mapped_) return;
    core_->native().unmapMemory(native_);
    mapped_ = false;
}

Result<void> Buffer::bindMemory(const Memory& memory, std::uint64_t offset) {
    if (!core_) return Error{"bind buffer memory", ErrorCode::InvalidUsage, 0, "buffer is empty"};
    if (auto lost = core_->checkLost("bind buffer memory"); !lost.ok()) return lost;

    auto check = checkBind("bind buffer memory", requirements_, memory, offset, bound_);
    if (!check.ok()) return check;

    auto r = core_->native().bindBufferMemory(native_, memory.native(), offset);
    if (!r.ok()) {
        core_->observe(r.error());
        return r;
    }
    bound_ = true;
    return {};
}

Result<void*> Buffer::map() {
    if (!owned_) {
        return Error{"map buffer", ErrorCode::InvalidUsage, 0,
                     "buffer does not own its memory; map the Memory object instead"};
    }
    return owned_->map(0, requirements_.size);
}

void Buffer::unmap() {
    if (owned_) owned_->unmap();
}

Result<void> Image::bindMemory(const Memory& memory, std::uint64_t offset) {
    if (!core_) return Error{"bind image memory", ErrorCode::InvalidUsage, 0, "image is empty"};
    if (auto lost = core_->checkLost("bind image memory"); !lost.ok()) return lost;

    auto check = checkBind("bind image memory", requirements_, memory, offset, bound_);
    if (!check.ok()) return check;

    auto r = core_->native().bindImageMemory(native_, memory.native(), offset);
    if (!r.ok()) {
        core_->observe(r.error());
        return r;
    }
    bound_ = true;
    return {};
}

} // namespace gfxhal
