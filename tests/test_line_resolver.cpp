#include <gtest/gtest.h>
#include "EntityAccessor.hpp"
#include "LineResolver.hpp"
#include "StationResolver.hpp"
#include "TestSupport.hpp"

class LineResolverTest : public ::testing::Test
{
protected:
    FakeHost host;

    void SetUp() override
    {
        host.list("STATION", {10, 11});
        host.entities[10] = record({{"name", "Central"}, {"terminals", list({101})}});
        host.entities[11] = record({});
        host.entities[55] = record({{"name", "Stop #55"}, {"station", 11}});
    }
};

TEST_F(LineResolverTest, StopsKeepOrderAndOneBasedIndex)
{
    host.list("LINE", {20});
    host.entities[20] = record({
        {"name", "Blue"},
        {"transportMode", "TRAM"},
        {"stops", list({10, record({{"terminalEntity", 101}}), record({{"stationEntity", 42}})})},
    });

    EntityAccessor accessor(host);
    StationResolver stations(accessor);
    stations.build();
    std::vector<Line> lines = LineResolver::resolveLines(accessor, stations);

    ASSERT_EQ(lines.size(), 1u);
    Line const& line = lines[0];
    EXPECT_EQ(line.name, "Blue");
    EXPECT_EQ(line.vehicleType, "TRAM");
    ASSERT_EQ(line.stopCount(), 3u);

    EXPECT_EQ(line.stops[0].index, 1);
    EXPECT_EQ(line.stops[0].stationId, 10);
    EXPECT_EQ(line.stops[0].name, "Central");

    EXPECT_EQ(line.stops[1].index, 2);
    EXPECT_EQ(line.stops[1].stationId, 10);
    EXPECT_EQ(line.stops[1].rawStopId, 101);

    EXPECT_EQ(line.stops[2].index, 3);
    EXPECT_EQ(line.stops[2].stationId, 42);
    EXPECT_EQ(line.stops[2].rawStopId, 42);
    EXPECT_EQ(line.stops[2].name, "Stop #42");
}

TEST_F(LineResolverTest, ExplicitStopNameWins)
{
    EntityAccessor accessor(host);
    StationResolver stations(accessor);
    stations.build();

    Line line = LineResolver::resolveLine(7, nullptr, stations, accessor);
    EXPECT_EQ(line.name, "Line #7");
    EXPECT_EQ(line.vehicleType, "UNKNOWN");
    EXPECT_TRUE(line.stops.empty());

    Value stop = record({{"stopName", "Market Square"}, {"station", 10}});
    auto [sid, raw] = LineResolver::extractStationIdFromStop(stop, stations);
    EXPECT_EQ(LineResolver::resolveStopDisplayName(sid, raw, stop, stations, accessor), "Market Square");
}

TEST_F(LineResolverTest, PlaceholderStopNameLosesToStationName)
{
    EntityAccessor accessor(host);
    StationResolver stations(accessor);
    stations.build();

    Value stop = record({{"name", "Stop #3"}, {"station", 10}});
    auto [sid, raw] = LineResolver::extractStationIdFromStop(stop, stations);
    EXPECT_EQ(sid, 10);
    EXPECT_EQ(LineResolver::resolveStopDisplayName(sid, raw, stop, stations, accessor), "Central");
}

TEST_F(LineResolverTest, StopEntityResolvesThroughReferenceField)
{
    EntityAccessor accessor(host);
    StationResolver stations(accessor);
    stations.build();

    Value stop = record({{"stopEntity", 55}});
    auto [sid, raw] = LineResolver::extractStationIdFromStop(stop, stations);
    EXPECT_EQ(sid, 11);
    EXPECT_EQ(raw, 55);
    // Station 11 only has its placeholder, and stop 55 is a placeholder too.
    EXPECT_EQ(LineResolver::resolveStopDisplayName(sid, raw, stop, stations, accessor), "Station #11");
}

TEST_F(LineResolverTest, LineRecordFromComponentWhenEntityMissing)
{
    host.list("LINE", {21});
    host.component(21, "LINE", record({{"waypoints", list({10})}}));

    EntityAccessor accessor(host);
    StationResolver stations(accessor);
    stations.build();
    std::vector<Line> lines = LineResolver::resolveLines(accessor, stations);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].name, "Line #21");
    ASSERT_EQ(lines[0].stopCount(), 1u);
    EXPECT_EQ(lines[0].stops[0].name, "Central");
}

TEST(LineResolverTypes, RoadAndTramLines)
{
    EXPECT_TRUE(LineResolver::isRoadOrTram("ROAD"));
    EXPECT_TRUE(LineResolver::isRoadOrTram("TRAM"));
    EXPECT_TRUE(LineResolver::isRoadOrTram("BUS"));
    EXPECT_FALSE(LineResolver::isRoadOrTram("RAIL"));
    EXPECT_FALSE(LineResolver::isRoadOrTram("UNKNOWN"));
}
