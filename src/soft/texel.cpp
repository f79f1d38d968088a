#include "soft_device.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>

namespace gfxhal::soft::detail {

namespace {

float unorm8(std::uint8_t v) { return static_cast<float>(v) / 255.0f; }

std::uint8_t toUnorm8(float v) {
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

float srgbToLinear(float c) {
    return c <= 0.04045f ? c / 12.92f : std::pow((c + 0.055f) / 1.055f, 2.4f);
}

float linearToSrgb(float c) {
    c = std::clamp(c, 0.0f, 1.0f);
    return c <= 0.0031308f ? c * 12.92f : 1.055f * std::pow(c, 1.0f / 2.4f) - 0.055f;
}

float halfToFloat(std::uint16_t h) {
    const std::uint32_t sign = (h & 0x8000u) << 16;
    std::uint32_t       exp  = (h >> 10) & 0x1Fu;
    std::uint32_t       man  = h & 0x3FFu;
    std::uint32_t       bits = 0;
    if (exp == 0) {
        if (man != 0) {
            // Subnormal: renormalize.
            exp = 127 - 15 + 1;
            while ((man & 0x400u) == 0) {
                man <<= 1;
                --exp;
            }
            man &= 0x3FFu;
            bits = sign | (exp << 23) | (man << 13);
        } else {
            bits = sign;
        }
    } else if (exp == 0x1F) {
        bits = sign | 0x7F800000u | (man << 13);
    } else {
        bits = sign | ((exp + 127 - 15) << 23) | (man << 13);
    }
    return std::bit_cast<float>(bits);
}

std::uint16_t floatToHalf(float f) {
    const std::uint32_t bits = std::bit_cast<std::uint32_t>(f);
    const std::uint16_t sign = static_cast<std::uint16_t>((bits >> 16) & 0x8000u);
    const std::int32_t  exp  = static_cast<std::int32_t>((bits >> 23) & 0xFFu) - 127 + 15;
    const std::uint32_t man  = bits & 0x7FFFFFu;
    if (((bits >> 23) & 0xFFu) == 0xFFu) return static_cast<std::uint16_t>(sign | 0x7C00u | (man ? 0x200u : 0));
    if (exp >= 0x1F) return static_cast<std::uint16_t>(sign | 0x7C00u);
    if (exp <= 0) return sign; // flush tiny values to zero
    return static_cast<std::uint16_t>(sign | (exp << 10) | (man >> 13));
}

template <typename T>
T read(const std::uint8_t* p, std::size_t index = 0) {
    T v{};
    std::memcpy(&v, p + index * sizeof(T), sizeof(T));
    return v;
}

template <typename T>
void write(std::uint8_t* p, T v, std::size_t index = 0) {
    std::memcpy(p + index * sizeof(T), &v, sizeof(T));
}

} // namespace

Color decodeTexel(Format format, const std::uint8_t* t) {
    switch (format) {
    case Format::R8Unorm:
        return {unorm8(t[0]), 0.0f, 0.0f, 1.0f};
    case Format::R8G8Unorm:
        return {unorm8(t[0]), unorm8(t[1]), 0.0f, 1.0f};
    case Format::R8G8B8Unorm:
        return {unorm8(t[0]), unorm8(t[1]), unorm8(t[2]), 1.0f};
    case Format::R8G8B8A8Unorm:
        return {unorm8(t[0]), unorm8(t[1]), unorm8(t[2]), unorm8(t[3])};
    case Format::R8G8B8A8Srgb:
        return {srgbToLinear(unorm8(t[0])), srgbToLinear(unorm8(t[1])),
                srgbToLinear(unorm8(t[2])), unorm8(t[3])};
    case Format::B8G8R8A8Unorm:
        return {unorm8(t[2]), unorm8(t[1]), unorm8(t[0]), unorm8(t[3])};
    case Format::B8G8R8A8Srgb:
        return {srgbToLinear(unorm8(t[2])), srgbToLinear(unorm8(t[1])),
                srgbToLinear(unorm8(t[0])), unorm8(t[3])};
    case Format::R16G16B16A16Sfloat:
        return {halfToFloat(read<std::uint16_t>(t, 0)), halfToFloat(read<std::uint16_t>(t, 1)),
                halfToFloat(read<std::uint16_t>(t, 2)), halfToFloat(read<std::uint16_t>(t, 3))};
    case Format::R32Uint:
        return {static_cast<float>(read<std::uint32_t>(t)), 0.0f, 0.0f, 1.0f};
    case Format::R32Sfloat:
    case Format::D32Sfloat:
    case Format::D32SfloatS8Uint:
        return {read<float>(t), 0.0f, 0.0f, 1.0f};
    case Format::R32G32Sfloat:
        return {read<float>(t, 0), read<float>(t, 1), 0.0f, 1.0f};
    case Format::R32G32B32Sfloat:
        return {read<float>(t, 0), read<float>(t, 1), read<float>(t, 2), 1.0f};
    case Format::R32G32B32A32Sfloat:
        return {read<float>(t, 0), read<float>(t, 1), read<float>(t, 2), read<float>(t, 3)};
    case Format::A2B10G10R10Unorm: {
        const auto v = read<std::uint32_t>(t);
        return {static_cast<float>(v & 0x3FFu) / 1023.0f,
                static_cast<float>((v >> 10) & 0x3FFu) / 1023.0f,
                static_cast<float>((v >> 20) & 0x3FFu) / 1023.0f,
                static_cast<float>(v >> 30) / 3.0f};
    }
    case Format::D16Unorm:
        return {static_cast<float>(read<std::uint16_t>(t)) / 65535.0f, 0.0f, 0.0f, 1.0f};
    case Format::D24UnormS8Uint:
        return {static_cast<float>(read<std::uint32_t>(t) & 0xFFFFFFu) / 16777215.0f, 0.0f, 0.0f,
                1.0f};
    default:
        return {0.0f, 0.0f, 0.0f, 0.0f};
    }
}

void encodeTexel(Format format, const Color& c, std::uint8_t* t) {
    switch (format) {
    case Format::R8Unorm:
        t[0] = toUnorm8(c[0]);
        break;
    case Format::R8G8Unorm:
        t[0] = toUnorm8(c[0]);
        t[1] = toUnorm8(c[1]);
        break;
    case Format::R8G8B8Unorm:
        for (int i = 0; i < 3; ++i) t[i] = toUnorm8(c[i]);
        break;
    case Format::R8G8B8A8Unorm:
        for (int i = 0; i < 4; ++i) t[i] = toUnorm8(c[i]);
        break;
    case Format::R8G8B8A8Srgb:
        for (int i = 0; i < 3; ++i) t[i] = toUnorm8(linearToSrgb(c[i]));
        t[3] = toUnorm8(c[3]);
        break;
    case Format::B8G8R8A8Unorm:
        t[0] = toUnorm8(c[2]);
        t[1] = toUnorm8(c[1]);
        t[2] = toUnorm8(c[0]);
        t[3] = toUnorm8(c[3]);
        break;
    case Format::B8G8R8A8Srgb:
        t[0] = toUnorm8(linearToSrgb(c[2]));
        t[1] = toUnorm8(linearToSrgb(c[1]));
        t[2] = toUnorm8(linearToSrgb(c[0]));
        t[3] = toUnorm8(c[3]);
        break;
    case Format::R16G16B16A16Sfloat:
        for (int i = 0; i < 4; ++i) write<std::uint16_t>(t, floatToHalf(c[i]), i);
        break;
    case Format::R32Uint:
        write<std::uint32_t>(t, static_cast<std::uint32_t>(std::max(0.0f, c[0])));
        break;
    case Format::R32Sfloat:
    case Format::D32Sfloat:
    case Format::D32SfloatS8Uint:
        write<float>(t, c[0]);
        break;
    case Format::R32G32Sfloat:
        for (int i = 0; i < 2; ++i) write<float>(t, c[i], i);
        break;
    case Format::R32G32B32Sfloat:
        for (int i = 0; i < 3; ++i) write<float>(t, c[i], i);
        break;
    case Format::R32G32B32A32Sfloat:
        for (int i = 0; i < 4; ++i) write<float>(t, c[i], i);
        break;
    case Format::A2B10G10R10Unorm: {
        auto q = [](float v, float max) {
            return static_cast<std::uint32_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * max));
        };
        write<std::uint32_t>(t, q(c[0], 1023.0f) | (q(c[1], 1023.0f) << 10) |
                                    (q(c[2], 1023.0f) << 20) | (q(c[3], 3.0f) << 30));
        break;
    }
    case Format::D16Unorm:
        write<std::uint16_t>(
            t, static_cast<std::uint16_t>(std::lround(std::clamp(c[0], 0.0f, 1.0f) * 65535.0f)));
        break;
    case Format::D24UnormS8Uint: {
        const auto stencil = read<std::uint32_t>(t) & 0xFF000000u;
        write<std::uint32_t>(
            t, stencil | static_cast<std::uint32_t>(
                             std::lround(std::clamp(c[0], 0.0f, 1.0f) * 16777215.0f)));
        break;
    }
    default:
        break;
    }
}

} // namespace gfxhal::soft::detail
