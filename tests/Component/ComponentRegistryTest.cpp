#include <gtest/gtest.h>
#include "Flux/Component/Bundle.hpp"
#include "Flux/Component/ComponentRegistry.hpp"
#include "../TestComponents.hpp"

class ComponentRegistryTest : public ::testing::Test
{
protected:
    Flux::ComponentRegistry registry;
};

// Use test components from shared header
using namespace Flux::Test;

TEST_F(ComponentRegistryTest, IdsAreDenseInFirstSeenOrder)
{
    EXPECT_EQ(registry.Register<Velocity>(), 0u);
    EXPECT_EQ(registry.Register<Position>(), 1u);
    EXPECT_EQ(registry.Register<Health>(), 2u);
    EXPECT_EQ(registry.Size(), 3u);
}

TEST_F(ComponentRegistryTest, RegisterIsIdempotent)
{
    const Flux::ComponentID first = registry.Register<Position>();
    registry.Register<Velocity>();
    const Flux::ComponentID again = registry.Register<Position>();

    EXPECT_EQ(first, again);
    EXPECT_EQ(registry.Size(), 2u);
}

TEST_F(ComponentRegistryTest, RegisterAllReturnsIdsInArgumentOrder)
{
    registry.Register<Health>();

    const auto ids = registry.RegisterAll<Position, Health, Velocity>();
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], 1u);
    EXPECT_EQ(ids[1], 0u);
    EXPECT_EQ(ids[2], 2u);
    EXPECT_EQ(registry.Size(), 3u);
}

TEST_F(ComponentRegistryTest, LookupOfUnregisteredType)
{
    EXPECT_FALSE(registry.GetID<Position>().has_value());
    EXPECT_FALSE(registry.IsRegistered<Position>());
    EXPECT_EQ(registry.GetInfo(0), nullptr);

    registry.Register<Position>();
    ASSERT_TRUE(registry.GetID<Position>().has_value());
    EXPECT_EQ(*registry.GetID<Position>(), 0u);
}

TEST_F(ComponentRegistryTest, InfoDescribesLayout)
{
    const Flux::ComponentID id = registry.Register<RenderData>();
    const Flux::ComponentInfo* info = registry.GetInfo(id);

    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->id, id);
    EXPECT_EQ(info->size, sizeof(RenderData));
    EXPECT_EQ(info->alignment, 32u);
    EXPECT_EQ(info->typeKey, Flux::TypeID<RenderData>::Key());
    EXPECT_NE(info->name.find("RenderData"), std::string_view::npos);
    EXPECT_FALSE(info->IsZeroSized());
}

TEST_F(ComponentRegistryTest, TagComponentsAreZeroSized)
{
    const Flux::ComponentInfo* info = registry.GetInfo(registry.Register<Player>());

    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->size, 0u);
    EXPECT_TRUE(info->IsZeroSized());
}

TEST_F(ComponentRegistryTest, BundleRegistersInDeclarationOrder)
{
    registry.Register<Health>();

    auto ids = Flux::ComponentBundle<Velocity, Position, Health>::Register(registry);
    EXPECT_EQ(ids[0], 1u);
    EXPECT_EQ(ids[1], 2u);
    EXPECT_EQ(ids[2], 0u);

    Flux::Signature signature = Flux::ComponentBundle<Velocity, Position, Health>::GetSignature(registry);
    EXPECT_EQ(signature, (Flux::Signature{0, 1, 2}));
}

TEST_F(ComponentRegistryTest, BundleExposesValuePointers)
{
    std::tuple<Position, Velocity> values{Position{1, 2, 3}, Velocity{4, 5, 6}};
    auto pointers = Flux::ComponentBundle<Position, Velocity>::GetPointers(values);

    EXPECT_EQ(pointers[0], &std::get<0>(values));
    EXPECT_EQ(pointers[1], &std::get<1>(values));

    static_assert(Flux::AreUniqueTypes<Position, Velocity>);
    static_assert(!Flux::AreUniqueTypes<Position, Velocity, Position>);
}
