#include <gfxhal/device_object.hpp>

#include "device_core.hpp"

#include <utility>

namespace gfxhal {

void DeviceObject::attach(std::shared_ptr<detail::DeviceCore> core, ObjectKind kind,
                          NativeHandle native) {
    destroy();
    core_   = std::move(core);
    kind_   = kind;
    native_ = native;
    handle_ = core_->track(kind, native);
}

void DeviceObject::destroy() {
    if (!core_) return;
    core_->retire(handle_);
    core_.reset();
    handle_ = Handle{};
    native_ = NullHandle;
}

DeviceObject::~DeviceObject() { destroy(); }

DeviceObject::DeviceObject(DeviceObject&& o) noexcept
    : core_(std::move(o.core_)), kind_(o.kind_), handle_(o.handle_), native_(o.native_) {
    o.handle_ = Handle{};
    o.native_ = NullHandle;
}

DeviceObject& DeviceObject::operator=(DeviceObject&& o) noexcept {
    if (this != &o) {
        destroy();
        core_     = std::move(o.core_);
        kind_     = o.kind_;
        handle_   = o.handle_;
        native_   = o.native_;
        o.handle_ = Handle{};
        o.native_ = NullHandle;
    }
    return *this;
}

} // namespace gfxhal
