#pragma once
#include <optional>
#include <string>
#include <vector>
#include "EntityAccessor.hpp"
#include "Types.hpp"

struct CollectorOptions
{
    bool includeCargo = true;
    bool includeBuses = true;
};

class VehicleCollector
{
public:
    static inline const std::vector<std::string> LINE_ID_FIELDS = {"lineIdx", "line", "lineId", "lineEntity", "lineEntityId"};
    static inline const std::vector<std::string> SPEED_FIELDS = {"speed", "velocity"};

    static std::vector<Vehicle> collect(EntityAccessor& accessor, CollectorOptions const& options);

    static Vehicle readVehicle(EntityId id, Value const& record);
    static bool keep(Vehicle const& v, CollectorOptions const& options);

    // Fills line name and last/next stop from the vehicle's resolved line.
    static void enrich(std::vector<Vehicle>& vehicles, std::vector<Line> const& lines);
    static void applyStopIndex(Vehicle& v, Line const& line);

    static double msToKmh(double ms) noexcept;
};
