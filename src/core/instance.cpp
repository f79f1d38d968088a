#include <gfxhal/device.hpp>

#include "device_core.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

namespace gfxhal {

const char* toString(Validation validation) {
    switch (validation) {
    case Validation::FailFast: return "fail-fast";
    case Validation::Report:   return "report";
    }
    return "unknown";
}

const char* toString(AdapterType type) {
    switch (type) {
    case AdapterType::Discrete:   return "discrete";
    case AdapterType::Integrated: return "integrated";
    case AdapterType::Virtual:    return "virtual";
    case AdapterType::Cpu:        return "cpu";
    case AdapterType::Other:      return "other";
    }
    return "unknown";
}

InstanceBuilder::InstanceBuilder(std::shared_ptr<NativeInstance> native)
    : native_(std::move(native)) {}

InstanceBuilder& InstanceBuilder::appName(std::string_view name) {
    appName_ = name;
    return *this;
}

InstanceBuilder& InstanceBuilder::validation(Validation v) {
    validation_ = v;
    return *this;
}

Result<Instance> InstanceBuilder::build() {
    if (!native_) {
        return Error{"create instance", ErrorCode::InvalidUsage, 0,
                     "no native instance given; create one with soft::createInstance() or "
                     "vulkan::createInstance()"};
    }

    auto state        = std::make_shared<detail::InstanceState>();
    state->native     = native_;
    state->appName    = appName_;
    state->validation = validation_;
    state->adapters   = native_->enumerateAdapters();

    if (state->adapters.empty()) {
        return Error{"create instance", ErrorCode::UnsupportedUsage, 0,
                     std::string("the ") + toString(native_->backend()) +
                         " shim reports no adapters"};
    }

    Instance instance;
    instance.state_ = std::move(state);
    return instance;
}

Backend Instance::backend() const { return state_->native->backend(); }

Validation Instance::validation() const { return state_->validation; }

const std::string& Instance::appName() const { return state_->appName; }

std::vector<Adapter> Instance::adapters() const {
    std::vector<Adapter> out;
    out.reserve(state_->adapters.size());
    for (std::uint32_t i = 0; i < state_->adapters.size(); ++i) {
        Adapter a;
        a.instance_ = state_;
        a.index_    = i;
        out.push_back(std::move(a));
    }
    return out;
}

Result<Adapter> Instance::pickAdapter(AdapterType prefer) const {
    auto all = adapters();
    if (all.empty()) {
        return Error{"pick adapter", ErrorCode::UnsupportedUsage, 0, "no adapters"};
    }
    auto it = std::find_if(all.begin(), all.end(),
                           [&](const Adapter& a) { return a.info().type == prefer; });
    return it != all.end() ? *it : all.front();
}

const AdapterInfo& Adapter::info() const { return instance_->adapters[index_]; }

std::optional<std::uint32_t> Adapter::findQueueFamily(QueueCapability caps) const {
    const auto& families = info().queueFamilies;
    for (std::uint32_t i = 0; i < families.size(); ++i) {
        if (contains(families[i].capabilities, caps)) return i;
    }
    return std::nullopt;
}

DeviceBuilder::DeviceBuilder(const Adapter& adapter) : adapter_(adapter) {}

DeviceBuilder& DeviceBuilder::queues(std::uint32_t family, std::uint32_t count) {
    queues_.push_back(QueueRequest{family, count});
    return *this;
}

DeviceBuilder& DeviceBuilder::validation(Validation v) {
    validation_ = v;
    return *this;
}

DeviceBuilder& DeviceBuilder::registerAllocator(RegisterAllocator allocator) {
    allocator_ = std::move(allocator);
    return *this;
}

Result<Device> DeviceBuilder::build() {
    if (!adapter_.instance_) {
        return Error{"create device", ErrorCode::InvalidUsage, 0, "adapter is empty"};
    }
    const AdapterInfo& info = adapter_.info();

    std::vector<QueueRequest> requests = queues_;
    if (requests.empty()) {
        auto family = adapter_.findQueueFamily(QueueCapability::Graphics);
        if (!family) family = adapter_.findQueueFamily(QueueCapability::Compute);
        if (!family) {
            return Error{"create device", ErrorCode::UnsupportedUsage, 0,
                         "adapter '" + info.name + "' has no graphics or compute queue"};
        }
        requests.push_back(QueueRequest{*family, 1});
    }

    std::vector<std::uint32_t> families;
    for (const auto& r : requests) {
        if (r.family >= info.queueFamilies.size()) {
            return Error{"create device", ErrorCode::InvalidUsage, 0,
                         "queue family " + std::to_string(r.family) + " does not exist"};
        }
        if (r.count == 0 || r.count > info.queueFamilies[r.family].count) {
            return Error{"create device", ErrorCode::InvalidUsage, 0,
                         "queue family " + std::to_string(r.family) + " has " +
                             std::to_string(info.queueFamilies[r.family].count) +
                             " queues, " + std::to_string(r.count) + " requested"};
        }
        families.insert(families.end(), r.count, r.family);
    }

    RegisterAllocator allocator =
        allocator_ ? *allocator_ : RegisterAllocator::forBackend(info.backend);
    if (allocator.backend() != info.backend) {
        return Error{"create device", ErrorCode::InvalidUsage, 0,
                     std::string("register allocator targets ") + toString(allocator.backend()) +
                         " but the adapter is " + toString(info.backend)};
    }

    auto native = adapter_.instance_->native->createDevice(adapter_.index_, requests);
    if (!native.ok()) return std::move(native.error());

    const Validation validation = validation_.value_or(adapter_.instance_->validation);

    Device device;
    device.core_ = std::make_shared<detail::DeviceCore>(
        adapter_.instance_, std::move(native).value(), std::move(allocator), validation,
        std::move(families));
    return device;
}

} // namespace gfxhal
