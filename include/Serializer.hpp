#pragma once
#include <string>
#include "Value.hpp"

// Deterministic JSON text for a Value. The same input always yields the same
// bytes: object keys are sorted by their string form.
class Serializer
{
public:
    static constexpr int MAX_DEPTH = 20;

    static std::string encode(Value const& value);

    // A table is written as an array iff its keys are exactly 1..N, N > 0.
    static bool isArrayTable(Value::Table const& table);

    static std::string escape(std::string const& s);

private:
    static void encodeInto(std::string& out, Value const& value, int depth);
    static void encodeNumber(std::string& out, double d);
};
