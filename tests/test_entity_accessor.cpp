#include <gtest/gtest.h>
#include "EntityAccessor.hpp"
#include "TestSupport.hpp"

TEST(EntityAccessor, ProbesCapabilitiesOnce)
{
    FakeHost host;
    populateSmallNetwork(host);
    EntityAccessor accessor(host);
    EXPECT_EQ(host.probes, 5);

    for (int i = 0; i < 10; ++i)
    {
        accessor.enumerate(EntityKind::Vehicle);
        accessor.getEntity(30);
        EXPECT_TRUE(accessor.provides(HostCall::GetComponent));
    }
    EXPECT_EQ(host.probes, 5);
}

TEST(EntityAccessor, MissingCapabilityYieldsNothing)
{
    FakeHost host;
    populateSmallNetwork(host);
    host.calls = {HostCall::GetEntityList};
    EntityAccessor accessor(host);

    EXPECT_FALSE(accessor.getEntity(10).has_value());
    EXPECT_FALSE(accessor.getComponent(50, "BASE_EDGE").has_value());
    EXPECT_FALSE(accessor.gameTime().has_value());
    EXPECT_TRUE(accessor.enumerateRegion(Bounds{0, 0, 1, 1}, EntityKind::Signal).empty());
    EXPECT_EQ(host.entityCalls, 0);

    EXPECT_EQ(accessor.enumerate(EntityKind::Station), std::vector<EntityId>({10}));
}

TEST(EntityAccessor, HostFailuresBecomeEmptyResults)
{
    FakeHost host;
    populateSmallNetwork(host);
    host.failEntities = true;
    EntityAccessor accessor(host);

    EXPECT_FALSE(accessor.getEntity(10).has_value());
    EXPECT_FALSE(accessor.getEntity(999).has_value());
    EXPECT_FALSE(accessor.getEntity(0).has_value());
    EXPECT_TRUE(accessor.enumerate(EntityKind::StationGroup).empty());
}

TEST(EntityAccessor, NonStandardExceptionsStayInside)
{
    FakeHost host;
    populateSmallNetwork(host);
    host.foreignFailure = true;
    EntityAccessor accessor(host);

    EXPECT_NO_THROW({
        EXPECT_FALSE(accessor.getEntity(10).has_value());
        EXPECT_TRUE(accessor.enumerate(EntityKind::Station).empty());
        EXPECT_FALSE(accessor.gameTime().has_value());
    });
    EXPECT_EQ(host.entityCalls, 1);

    host.foreignFailure = false;
    EXPECT_TRUE(accessor.getEntity(10).has_value());
}

TEST(EntityAccessor, NullAnswersAreAbsent)
{
    FakeHost host;
    EntityAccessor accessor(host);

    EXPECT_FALSE(accessor.getComponent(50, "BASE_EDGE").has_value());
    EXPECT_FALSE(accessor.gameTime().has_value());
}

TEST(EntityAccessor, FallsBackThroughTypeKeys)
{
    FakeHost host;
    host.list("TRANSPORT_VEHICLE", {7, 8});
    EntityAccessor accessor(host);

    EXPECT_EQ(accessor.enumerate(EntityKind::Vehicle), std::vector<EntityId>({7, 8}));

    std::string report = accessor.describe();
    EXPECT_NE(report.find("vehicle: TRANSPORT_VEHICLE"), std::string::npos);
    EXPECT_NE(report.find("line: (no hit)"), std::string::npos);
    EXPECT_NE(report.find("getGameTime: available"), std::string::npos);
}

TEST(EntityAccessor, WinningKeyIsTriedFirst)
{
    FakeHost host;
    host.list("TRANSPORT_VEHICLE", {7});
    EntityAccessor accessor(host);
    accessor.enumerate(EntityKind::Vehicle);

    // Both keys answer now; the key that won before keeps winning.
    host.list("VEHICLE", {1});
    EXPECT_EQ(accessor.enumerate(EntityKind::Vehicle), std::vector<EntityId>({7}));
}

TEST(EntityAccessor, ListElementsMayBeRecords)
{
    FakeHost host;
    host.lists["LINE"] = list({record({{"id", 5}}), 6, "junk"});
    EntityAccessor accessor(host);

    EXPECT_EQ(accessor.enumerate(EntityKind::Line), std::vector<EntityId>({5, 6}));
}
