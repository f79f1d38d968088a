#include <gfxhal/soft/soft.hpp>

#include "soft_device.hpp"

#include <cctype>
#include <cstdio>
#include <numeric>
#include <string>
#include <utility>

namespace gfxhal::soft {

void ProgramLibrary::add(std::string name, Program program) {
    std::lock_guard lock(mutex_);
    programs_[std::move(name)] = std::make_shared<const Program>(std::move(program));
}

std::shared_ptr<const Program> ProgramLibrary::find(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = programs_.find(name);
    return it == programs_.end() ? nullptr : it->second;
}

MemoryProperties defaultMemory() {
    MemoryProperties m;
    m.heaps.push_back(MemoryHeap{256ull << 20, true});
    m.heaps.push_back(MemoryHeap{256ull << 20, false});
    m.types.push_back(MemoryType{MemoryProperty::DeviceLocal, 0});
    m.types.push_back(MemoryType{MemoryProperty::HostVisible | MemoryProperty::HostCoherent, 1});
    m.types.push_back(MemoryType{
        MemoryProperty::HostVisible | MemoryProperty::HostCoherent | MemoryProperty::HostCached, 1});
    return m;
}

AdapterConfig AdapterConfig::forBackend(Backend backend) {
    AdapterConfig c;
    c.backend = backend;
    c.name    = std::string("gfxhal soft adapter (") + toString(backend) + ")";
    switch (backend) {
    case Backend::Vulkan:
        c.features.splitBarriers           = true;
        c.features.implicitPassTransitions = true;
        break;
    case Backend::Dx12:
        c.features.splitBarriers = true;
        break;
    case Backend::Dx11:
        c.features.splitBarriers      = false;
        c.features.stageGranularWaits = false;
        c.features.implicitPassTransitions = true;
        break;
    case Backend::Metal:
        c.features.splitBarriers           = false;
        c.features.implicitPassTransitions = true;
        break;
    case Backend::Gl:
        c.features.splitBarriers           = false;
        c.features.stageGranularWaits      = false;
        c.features.implicitPassTransitions = true;
        break;
    }
    return c;
}

namespace detail {

namespace {

std::string programName(const std::vector<std::uint8_t>& bytecode) {
    std::string name(bytecode.begin(), bytecode.end());
    while (!name.empty() && (name.back() == '\0' || std::isspace(static_cast<unsigned char>(name.back())))) {
        name.pop_back();
    }
    return name;
}

} // namespace

Result<TranslatedShader> SoftTranslator::translate(const ShaderSource& source,
                                                   const RegisterAssignment& /*assignment*/) {
    const std::string name = programName(source.bytecode);
    auto program = programs_->find(name);
    if (!program) {
        return Error{"translate shader", ErrorCode::InvalidUsage, 0,
                     "no program named '" + name + "' is registered"};
    }
    if (program->stage != source.stage) {
        return Error{"translate shader", ErrorCode::InvalidUsage, 0,
                     "program '" + name + "' is a " + toString(program->stage) +
                         " program, not " + toString(source.stage)};
    }

    std::lock_guard lock(mutex_);
    const NativeHandle module = next_++;
    modules_.emplace(module, program);
    return TranslatedShader{module, program->bindings};
}

void SoftTranslator::release(NativeHandle module) {
    std::lock_guard lock(mutex_);
    modules_.erase(module);
}

std::shared_ptr<const Program> SoftTranslator::program(NativeHandle module) const {
    std::lock_guard lock(mutex_);
    auto it = modules_.find(module);
    return it == modules_.end() ? nullptr : it->second;
}

std::size_t SoftTranslator::moduleCount() const {
    std::lock_guard lock(mutex_);
    return modules_.size();
}

class SoftInstance final : public NativeInstance {
public:
    explicit SoftInstance(InstanceConfig config) : config_(std::move(config)) {}

    [[nodiscard]] Backend backend() const override {
        return config_.adapters.empty() ? Backend::Vulkan : config_.adapters.front().backend;
    }

    [[nodiscard]] std::vector<AdapterInfo> enumerateAdapters() override {
        std::vector<AdapterInfo> out;
        out.reserve(config_.adapters.size());
        for (const auto& a : config_.adapters) out.push_back(info(a));
        return out;
    }

    [[nodiscard]] Result<std::unique_ptr<NativeDevice>> createDevice(
        std::uint32_t adapter, const std::vector<QueueRequest>& queues) override {
        if (adapter >= config_.adapters.size()) {
            return Error{"create device", ErrorCode::InvalidUsage, 0,
                         "adapter " + std::to_string(adapter) + " does not exist"};
        }
        const std::uint32_t count = std::accumulate(
            queues.begin(), queues.end(), 0u,
            [](std::uint32_t n, const QueueRequest& r) { return n + r.count; });

        std::unique_ptr<NativeDevice> device = std::make_unique<SoftDevice>(
            info(config_.adapters[adapter]), config_.programs, count);
        return device;
    }

private:
    static AdapterInfo info(const AdapterConfig& c) {
        AdapterInfo i;
        i.name          = c.name;
        i.type          = c.type;
        i.backend       = c.backend;
        i.memory        = c.memory;
        i.queueFamilies = c.queueFamilies;
        i.features      = c.features;
        i.limits        = c.limits;
        return i;
    }

    InstanceConfig config_;
};

} // namespace detail

std::shared_ptr<NativeInstance> createInstance(InstanceConfig config) {
    if (!config.programs) config.programs = std::make_shared<ProgramLibrary>();
    return std::make_shared<detail::SoftInstance>(std::move(config));
}

DeviceHooks* hooks(NativeDevice& device) {
    return dynamic_cast<detail::SoftDevice*>(&device);
}

} // namespace gfxhal::soft
