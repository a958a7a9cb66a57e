// SPDX-License-Identifier: MIT

#include "volumetric/StencilCapState.h"

#include <gtest/gtest.h>

TEST(StencilCapState, NamedBits)
{
    StencilCapState state;
    EXPECT_FALSE(state.nearParity());
    EXPECT_FALSE(state.reserved());
    EXPECT_FALSE(state.farInclusion());

    state.value = 0b101;
    EXPECT_TRUE(state.nearParity());
    EXPECT_FALSE(state.reserved());
    EXPECT_TRUE(state.farInclusion());
    EXPECT_TRUE(state.geometryInsideVolume());
    EXPECT_TRUE(state.exitsIntoOpenMedium());

    state.reset();
    EXPECT_EQ(state.value, 0);
}

TEST(StencilCapState, KeepLeavesValue)
{
    StencilCapState state { 0b110 };
    state.apply(StencilOp::Keep, 0xff);
    EXPECT_EQ(state.value, 0b110);
}

TEST(StencilCapState, InvertOnlyTouchesMaskedBits)
{
    StencilCapState state;
    state.apply(StencilOp::Invert, StencilCapState::CapMask);
    EXPECT_EQ(state.value, 0b101);
    state.apply(StencilOp::Invert, StencilCapState::NearParityBit);
    EXPECT_EQ(state.value, 0b100);
}

TEST(StencilCapState, IncrementWrapCarryIsMaskedOut)
{
    StencilCapState state;
    state.apply(StencilOp::IncrementWrap, StencilCapState::CapMask);
    EXPECT_EQ(state.value, 0b001);
    // 1 + 1 carries into the reserved bit, which the mask drops.
    state.apply(StencilOp::IncrementWrap, StencilCapState::CapMask);
    EXPECT_EQ(state.value, 0b000);

    state.value = 0b101;
    state.apply(StencilOp::IncrementWrap, StencilCapState::CapMask);
    EXPECT_EQ(state.value, 0b100);

    state.value = 0xff;
    state.apply(StencilOp::IncrementWrap, 0xff);
    EXPECT_EQ(state.value, 0);
}

TEST(StencilCapState, FarCapPassDescriptor)
{
    constexpr StencilCapPass pass = farCapPass();
    EXPECT_EQ(pass.front.depthPass, StencilOp::Invert);
    EXPECT_EQ(pass.front.writeMask, StencilCapState::CapMask);
    EXPECT_EQ(pass.back.depthPass, StencilOp::IncrementWrap);
    EXPECT_EQ(pass.back.writeMask, StencilCapState::CapMask);
    EXPECT_TRUE(pass.testSceneDepth);
    EXPECT_EQ(&pass.face(true), &pass.front);
    EXPECT_EQ(&pass.face(false), &pass.back);
}

TEST(StencilCapState, NearCapPassDescriptor)
{
    constexpr StencilCapPass pass = nearCapPass();
    EXPECT_EQ(pass.front.depthPass, StencilOp::Invert);
    EXPECT_EQ(pass.front.writeMask, StencilCapState::NearParityBit);
    EXPECT_EQ(pass.back.depthPass, StencilOp::IncrementWrap);
    EXPECT_EQ(pass.back.writeMask, StencilCapState::NearParityBit);
    EXPECT_FALSE(pass.testSceneDepth);
}

TEST(StencilCapState, ParityCountsCrossings)
{
    const StencilCapPass pass = farCapPass();
    const bool crossings[] = { true, false, true, true, false, false, true };

    StencilCapState state;
    int count = 0;
    for (bool frontFacing : crossings) {
        const StencilFaceOps& ops = pass.face(frontFacing);
        state.apply(ops.depthPass, ops.writeMask);
        ++count;
        EXPECT_EQ(state.nearParity(), count % 2 == 1);
    }
}

TEST(StencilCapState, FarInclusionTracksFrontFacesOnly)
{
    const StencilCapPass pass = farCapPass();
    StencilCapState state;

    state.apply(pass.back.depthPass, pass.back.writeMask);
    EXPECT_FALSE(state.farInclusion());
    state.apply(pass.front.depthPass, pass.front.writeMask);
    EXPECT_TRUE(state.farInclusion());
    state.apply(pass.back.depthPass, pass.back.writeMask);
    EXPECT_TRUE(state.farInclusion());
    state.apply(pass.front.depthPass, pass.front.writeMask);
    EXPECT_FALSE(state.farInclusion());
}

TEST(StencilCapState, NearCapFrontFaceKeepsFarInclusion)
{
    StencilCapState state { StencilCapState::FarInclusionBit };
    const StencilFaceOps& ops = nearCapPass().face(true);
    state.apply(ops.depthPass, ops.writeMask);
    EXPECT_TRUE(state.farInclusion());
    EXPECT_TRUE(state.nearParity());
}

TEST(StencilCapState, PassesNeverWriteReservedBit)
{
    for (const StencilCapPass& pass : { farCapPass(), nearCapPass() }) {
        for (bool frontFacing : { true, false }) {
            for (int start = 0; start < 256; ++start) {
                StencilCapState state { static_cast<std::uint8_t>(start) };
                const StencilFaceOps& ops = pass.face(frontFacing);
                state.apply(ops.depthPass, ops.writeMask);
                EXPECT_EQ(state.value & ~StencilCapState::CapMask, start & ~StencilCapState::CapMask);
            }
        }
    }
}

TEST(StencilCapState, NearCapBackFaceOnlyTogglesParity)
{
    const StencilFaceOps& ops = nearCapPass().face(false);
    for (int start = 0; start < 256; ++start) {
        StencilCapState state { static_cast<std::uint8_t>(start) };
        state.apply(ops.depthPass, ops.writeMask);
        EXPECT_EQ(state.value, start ^ StencilCapState::NearParityBit) << "start " << start;
    }
}
