// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>

enum class StencilOp : std::uint8_t {
    Keep,
    Invert,
    IncrementWrap,
};

// One stencil byte as seen by the capping passes. Bit 0 holds the crossing
// parity, bit 2 the far cap inclusion and bit 1 is reserved for other cap
// classes, so no pass may write it.
struct StencilCapState {
    static constexpr std::uint8_t NearParityBit = 0b001;
    static constexpr std::uint8_t ReservedBit = 0b010;
    static constexpr std::uint8_t FarInclusionBit = 0b100;
    static constexpr std::uint8_t CapMask = NearParityBit | FarInclusionBit;

    std::uint8_t value { 0 };

    [[nodiscard]] bool nearParity() const { return (value & NearParityBit) != 0; }
    [[nodiscard]] bool reserved() const { return (value & ReservedBit) != 0; }
    [[nodiscard]] bool farInclusion() const { return (value & FarInclusionBit) != 0; }

    // Odd number of volume boundaries in front of the geometry, after the near
    // cap has accounted for a camera that starts inside the lit volume.
    [[nodiscard]] bool geometryInsideVolume() const { return nearParity(); }
    [[nodiscard]] bool exitsIntoOpenMedium() const { return farInclusion(); }

    // Mirrors glStencilOp followed by a glStencilMask write: only bits set in
    // writeMask take the result of the operation.
    void apply(StencilOp op, std::uint8_t writeMask)
    {
        std::uint8_t result = value;
        switch (op) {
        case StencilOp::Keep:
            return;
        case StencilOp::Invert:
            result = static_cast<std::uint8_t>(~value);
            break;
        case StencilOp::IncrementWrap:
            result = static_cast<std::uint8_t>(value + 1u);
            break;
        }
        value = static_cast<std::uint8_t>((value & ~writeMask) | (result & writeMask));
    }

    void reset() { value = 0; }
};

struct StencilFaceOps {
    StencilOp depthPass { StencilOp::Keep };
    std::uint8_t writeMask { 0 };
};

// Per-face stencil behaviour of one capping draw. Stencil and depth failures
// always keep the stored value.
struct StencilCapPass {
    StencilFaceOps front;
    StencilFaceOps back;
    bool testSceneDepth { true };

    [[nodiscard]] const StencilFaceOps& face(bool frontFacing) const { return frontFacing ? front : back; }
};

// Pass A: cap surface against the scene depth. Front faces flip both tracked
// bits, back faces only advance the parity bit.
constexpr StencilCapPass farCapPass()
{
    return StencilCapPass {
        StencilFaceOps { StencilOp::Invert, StencilCapState::CapMask },
        StencilFaceOps { StencilOp::IncrementWrap, StencilCapState::CapMask },
        true,
    };
}

// Pass B: near plane fragments that lie inside the lit volume. Both faces
// write bit 0 only, so bit 2 keeps its pass A value.
constexpr StencilCapPass nearCapPass()
{
    return StencilCapPass {
        StencilFaceOps { StencilOp::Invert, StencilCapState::NearParityBit },
        StencilFaceOps { StencilOp::IncrementWrap, StencilCapState::NearParityBit },
        false,
    };
}
