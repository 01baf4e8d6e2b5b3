#pragma once
#include <vector>
#include "Types.hpp"
#include "Value.hpp"

// Maps a Snapshot onto the published document layout. The six collections
// are always present, even when empty.
class SnapshotDocument
{
public:
    static Value toValue(Snapshot const& snapshot);

    // Schema-valid document with empty collections.
    static Snapshot fallback(std::int64_t writeCount);

    static Stats buildStats(std::vector<Vehicle> const& vehicles, std::size_t lineCount, std::size_t stationCount);

    static Value vehicleValue(Vehicle const& v);
    static Value lineValue(Line const& line);
    static Value stationValue(Station const& s);
    static Value pathValue(Path const& p);
    static Value trackValue(TrackEdge const& t);
    static Value signalValue(Signal const& s);
};
