#include <gfxhal/registers/assignment.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace gfxhal {

const char* toString(RegisterSpace space) {
    switch (space) {
    case RegisterSpace::Set:             return "set";
    case RegisterSpace::ConstantBuffer:  return "b";
    case RegisterSpace::Texture:         return "t";
    case RegisterSpace::Sampler:         return "s";
    case RegisterSpace::UnorderedAccess: return "u";
    case RegisterSpace::ResourceHeap:    return "resource table";
    case RegisterSpace::SamplerHeap:     return "sampler table";
    case RegisterSpace::RootConstants:   return "root constants";
    case RegisterSpace::Buffer:          return "buffer";
    case RegisterSpace::MetalTexture:    return "texture";
    case RegisterSpace::MetalSampler:    return "sampler";
    case RegisterSpace::Argument:        return "argument";
    case RegisterSpace::GlTexture:       return "texture unit";
    case RegisterSpace::GlSampler:       return "sampler unit";
    case RegisterSpace::GlImage:         return "image unit";
    case RegisterSpace::GlUniformBlock:  return "uniform block";
    case RegisterSpace::GlStorageBlock:  return "storage block";
    case RegisterSpace::PushConstant:    return "push constant";
    }
    return "unknown";
}

const char* toString(AddressKind kind) {
    switch (kind) {
    case AddressKind::SetBinding:     return "set binding";
    case AddressKind::FlatSlot:       return "flat slot";
    case AddressKind::TableOffset:    return "table offset";
    case AddressKind::ArgumentIndex:  return "argument index";
    case AddressKind::UniformIndices: return "uniform indices";
    case AddressKind::PushConstant:   return "push constant";
    }
    return "unknown";
}

std::string NativeAddress::format() const {
    std::string s;
    switch (kind) {
    case AddressKind::SetBinding:
        s = "set " + std::to_string(group) + " binding " + std::to_string(index);
        break;
    case AddressKind::FlatSlot:
        s = std::string(toString(space)) + std::to_string(index);
        if (count > 1) s += ".." + std::string(toString(space)) + std::to_string(index + count - 1);
        break;
    case AddressKind::TableOffset:
        s = std::string(toString(space)) + " " + std::to_string(group) + " offset " +
            std::to_string(index);
        if (count > 1) s += " x" + std::to_string(count);
        break;
    case AddressKind::ArgumentIndex:
        s = "argument buffer " + std::to_string(group) + " id " + std::to_string(index);
        if (count > 1) s += " x" + std::to_string(count);
        break;
    case AddressKind::UniformIndices:
        s = std::string(toString(space)) + " [";
        for (std::size_t i = 0; i < elements.size(); ++i) {
            if (i) s += ", ";
            s += std::to_string(elements[i]);
        }
        s += "]";
        break;
    case AddressKind::PushConstant:
        s = std::string("push constants (") + toString(space) + " " + std::to_string(index) + ")";
        break;
    }
    return s;
}

const RegisterEntry* RegisterAssignment::find(std::uint32_t set, std::uint32_t binding,
                                              ShaderStage stage) const {
    auto it = index_.find(Key{set, binding, stage});
    return it == index_.end() ? nullptr : &entries_[it->second];
}

void RegisterAssignment::addEntry(RegisterEntry entry) {
    index_[Key{entry.set, entry.binding, entry.stage}] = entries_.size();
    entries_.push_back(std::move(entry));
}

void RegisterAssignment::reserve(ShaderStage stage, NativeAddress address, std::string what) {
    reserved_.push_back(ReservedAddress{stage, std::move(address), std::move(what)});
}

void RegisterAssignment::setPushConstants(ShaderStage stages, NativeAddress address) {
    pushStages_ = stages;
    for (ShaderStage s : kShaderStages) {
        if (any(stages & s)) reserve(s, address, "push constants");
    }
    pushConstants_ = std::move(address);
}

namespace {

struct Occupant {
    std::uint32_t first = 0;
    std::uint32_t last  = 0; // inclusive
    std::string   owner;
};

struct SpaceKey {
    ShaderStage   stage;
    RegisterSpace space;
    std::uint32_t group;

    bool operator<(const SpaceKey& o) const {
        return std::tie(stage, space, group) < std::tie(o.stage, o.space, o.group);
    }
};

std::string ownerName(const RegisterEntry& e) {
    return "set " + std::to_string(e.set) + " binding " + std::to_string(e.binding);
}

} // namespace

Result<void> verifyNoAliasing(const RegisterAssignment& assignment) {
    std::map<SpaceKey, std::vector<Occupant>> spaces;

    auto claim = [&](ShaderStage stage, const NativeAddress& a,
                     const std::string& owner) -> Result<void> {
        auto& occupants = spaces[SpaceKey{stage, a.space, a.group}];

        std::vector<std::pair<std::uint32_t, std::uint32_t>> runs;
        if (a.kind == AddressKind::UniformIndices) {
            for (std::uint32_t e : a.elements) runs.emplace_back(e, e);
        } else if (a.width() > 0) {
            runs.emplace_back(a.index, a.index + a.width() - 1);
        }

        for (const auto& [first, last] : runs) {
            for (const auto& o : occupants) {
                if (first <= o.last && o.first <= last) {
                    return Error{"create pipeline layout", ErrorCode::InvalidUsage, 0,
                                 "register collision in " + std::string(toString(stage)) +
                                     " stage: " + owner + " and " + o.owner +
                                     " both resolve to " + toString(a.space) + " " +
                                     std::to_string(std::max(first, o.first))};
                }
            }
            occupants.push_back(Occupant{first, last, owner});
        }
        return {};
    };

    for (const auto& r : assignment.reserved()) {
        auto res = claim(r.stage, r.address, r.what);
        if (!res.ok()) return res;
    }
    for (const auto& e : assignment.entries()) {
        for (const auto& p : e.parts) {
            auto res = claim(e.stage, p.address, ownerName(e));
            if (!res.ok()) return res;
        }
    }
    return {};
}

} // namespace gfxhal
