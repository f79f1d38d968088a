#pragma once

#include <gfxhal/native.hpp>
#include <gfxhal/register_allocator.hpp>
#include <gfxhal/types.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Host-memory native shim. Executes recorded command streams on CPU worker
// threads, one per queue, and emulates whichever binding model its adapter
// advertises. Shader programs are C++ callables registered by name; a
// ShaderSource whose text is that name selects the program.

namespace gfxhal::soft {

using Color = std::array<float, 4>;

namespace detail {
struct InvocationContext;
} // namespace detail

// One shader invocation. Resources are looked up by their reflected name,
// through the native address the translator rebound it to, so a program sees
// exactly what the emulated binding model placed at that address.
class Invocation {
public:
    [[nodiscard]] ShaderStage stage() const;
    [[nodiscard]] std::uint32_t vertexIndex() const;
    [[nodiscard]] std::uint32_t instanceIndex() const;
    [[nodiscard]] std::array<std::uint32_t, 3> workgroup() const;
    [[nodiscard]] std::array<std::uint32_t, 2> pixel() const;

    // Where `name` was rebound for this stage, or null.
    [[nodiscard]] const ShaderRemap* remap(std::string_view name) const;

    // The buffer range a buffer descriptor bound to `name` covers, from its
    // (dynamic) offset. Empty when nothing is bound there.
    [[nodiscard]] std::span<std::uint8_t> buffer(std::string_view name, std::uint32_t element = 0);

    template <typename T>
    [[nodiscard]] T load(std::string_view name, std::uint64_t offset = 0,
                         std::uint32_t element = 0) {
        T value{};
        auto bytes = buffer(name, element);
        if (offset + sizeof(T) > bytes.size()) {
            fault("read past the end of", name);
            return value;
        }
        std::memcpy(&value, bytes.data() + offset, sizeof(T));
        return value;
    }

    template <typename T>
    void store(std::string_view name, const T& value, std::uint64_t offset = 0,
               std::uint32_t element = 0) {
        auto bytes = buffer(name, element);
        if (offset + sizeof(T) > bytes.size()) {
            fault("write past the end of", name);
            return;
        }
        std::memcpy(bytes.data() + offset, &value, sizeof(T));
    }

    [[nodiscard]] std::span<const std::uint8_t> pushConstants() const;

    template <typename T>
    [[nodiscard]] T push(std::uint32_t offset = 0) const {
        T value{};
        auto bytes = pushConstants();
        if (offset + sizeof(T) <= bytes.size()) std::memcpy(&value, bytes.data() + offset, sizeof(T));
        return value;
    }

    // Raw bytes of a vertex attribute for the current vertex / instance.
    [[nodiscard]] std::span<const std::uint8_t> attribute(std::uint32_t location) const;

    template <typename T>
    [[nodiscard]] T vertex(std::uint32_t location) const {
        T value{};
        auto bytes = attribute(location);
        if (sizeof(T) <= bytes.size()) std::memcpy(&value, bytes.data(), sizeof(T));
        return value;
    }

    // Images: integer texel fetch from mip 0, layer 0.
    [[nodiscard]] Color texel(std::string_view name, std::uint32_t x, std::uint32_t y,
                              std::uint32_t element = 0);
    void writeTexel(std::string_view name, std::uint32_t x, std::uint32_t y, const Color& color,
                    std::uint32_t element = 0);

    // Nearest-neighbour sample through the sampler paired with the image.
    [[nodiscard]] Color sample(std::string_view name, float u, float v, std::uint32_t element = 0);

    // Input attachment read at the current pixel.
    [[nodiscard]] Color input(std::string_view name);

    // Fragment outputs.
    void setColor(std::uint32_t target, const Color& color);
    void setDepth(float depth);
    void discard();

private:
    friend struct detail::InvocationContext;

    explicit Invocation(detail::InvocationContext& context) : context_(context) {}

    void fault(const char* what, std::string_view name) const;

    detail::InvocationContext& context_;
};

// A registered shader program. `bindings` is what reflection reports for it.
struct Program {
    ShaderStage                        stage = ShaderStage::None;
    std::vector<ReflectedBinding>      bindings;
    std::function<void(Invocation&)>   body;
};

// Name -> program table shared by every device of an instance.
//
// Thread safety: internally synchronized.
class ProgramLibrary {
public:
    void add(std::string name, Program program);
    [[nodiscard]] std::shared_ptr<const Program> find(std::string_view name) const;

private:
    mutable std::mutex                                             mutex_;
    std::map<std::string, std::shared_ptr<const Program>, std::less<>> programs_;
};

// Device-local, host-visible coherent and host-visible cached types over one
// device heap and one host heap.
[[nodiscard]] MemoryProperties defaultMemory();

struct AdapterConfig {
    std::string              name    = "gfxhal soft adapter";
    Backend                  backend = Backend::Vulkan;
    AdapterType              type    = AdapterType::Cpu;
    AdapterFeatures          features{.splitBarriers = true};
    AdapterLimits            limits;
    MemoryProperties         memory = defaultMemory();
    std::vector<QueueFamily> queueFamilies{
        {QueueCapability::Graphics | QueueCapability::Compute | QueueCapability::Transfer |
             QueueCapability::Present,
         2},
        {QueueCapability::Compute | QueueCapability::Transfer, 1},
    };

    [[nodiscard]] static AdapterConfig forBackend(Backend backend);
};

struct InstanceConfig {
    std::vector<AdapterConfig>      adapters{AdapterConfig{}};
    std::shared_ptr<ProgramLibrary> programs = std::make_shared<ProgramLibrary>();
};

[[nodiscard]] std::shared_ptr<NativeInstance> createInstance(InstanceConfig config = {});

enum class SurfaceState : std::uint8_t {
    Ok,
    OutOfDate,
    Lost,
};

// Fault injection and inspection for tests. Reached through hooks() on the
// native device of a soft-backed Device.
//
// Thread safety: internally synchronized.
class DeviceHooks {
public:
    virtual ~DeviceHooks() = default;

    // A held queue accepts submissions but executes none until released.
    virtual void holdQueue(std::uint32_t queue, bool held) = 0;

    // Every later native call fails with DeviceLost.
    virtual void loseDevice() = 0;

    [[nodiscard]] virtual NativeHandle  createSurface(std::uint32_t imageCount) = 0;
    virtual void                        setSurfaceState(NativeHandle surface,
                                                        SurfaceState state) = 0;
    [[nodiscard]] virtual std::uint64_t presentCount(NativeHandle surface) const = 0;

    // Layout the executor last tracked for an image.
    [[nodiscard]] virtual ImageLayout imageLayout(NativeHandle image) const = 0;

    // Images used in a layout other than the one the executor tracked.
    [[nodiscard]] virtual std::uint64_t layoutErrors() const = 0;
    // Program accesses that found nothing (or the wrong thing) bound.
    [[nodiscard]] virtual std::uint64_t bindingErrors() const = 0;
    // Native objects still alive.
    [[nodiscard]] virtual std::size_t liveObjects() const = 0;
};

// Null when `device` is not a soft device.
[[nodiscard]] DeviceHooks* hooks(NativeDevice& device);

} // namespace gfxhal::soft
