#pragma once

#include <gfxhal/handle.hpp>
#include <gfxhal/resource_desc.hpp>
#include <gfxhal/types.hpp>

#include <memory>

namespace gfxhal {

class Device;

namespace detail {
class DeviceCore;
} // namespace detail

// Base of every wrapper that owns one native object. The object is tracked in
// the device's arena; destroy() (or the destructor) removes it from the arena
// and retires the native handle to the garbage collector, which frees it once
// every queue has finished the work submitted before the retire.
//
// Thread safety: thread-confined. Dropping may happen on any thread.
class DeviceObject {
public:
    ~DeviceObject();
    DeviceObject(DeviceObject&&) noexcept;
    DeviceObject& operator=(DeviceObject&&) noexcept;
    DeviceObject(const DeviceObject&) = delete;
    DeviceObject& operator=(const DeviceObject&) = delete;

    void destroy();

    [[nodiscard]] bool         valid()  const { return core_ != nullptr; }
    [[nodiscard]] ObjectKind   kind()   const { return kind_; }
    [[nodiscard]] Handle       handle() const { return handle_; }
    [[nodiscard]] NativeHandle native() const { return native_; }
    [[nodiscard]] ResourceRef  ref()    const { return ResourceRef{handle_, native_}; }

protected:
    DeviceObject() = default;

    std::shared_ptr<detail::DeviceCore> core_;
    ObjectKind   kind_   = ObjectKind::Buffer;
    Handle       handle_;
    NativeHandle native_ = NullHandle;

private:
    friend class Device;

    // Takes ownership of a freshly created native object.
    void attach(std::shared_ptr<detail::DeviceCore> core, ObjectKind kind, NativeHandle native);
};

} // namespace gfxhal
