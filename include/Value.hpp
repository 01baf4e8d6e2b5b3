#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using EntityId = std::int64_t;

// A record as the host hands it out: null, bool, integer, number, string,
// list or table. Tables may mix integer and string keys; integer keys use the
// host's 1-based convention. Opaque stands for anything that cannot be
// encoded (callables, userdata handles).
class Value
{
public:
    struct Opaque
    {
        bool operator==(Opaque const&) const noexcept { return true; }
    };

    using Key      = std::variant<std::int64_t, std::string>;
    using Sequence = std::vector<Value>;
    using Table    = std::map<Key, Value>;
    using Storage  = std::variant<std::monostate, bool, std::int64_t, double, std::string, Sequence, Table, Opaque>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : storage(b) {}
    Value(int i) : storage(static_cast<std::int64_t>(i)) {}
    Value(long i) : storage(static_cast<std::int64_t>(i)) {}
    Value(long long i) : storage(static_cast<std::int64_t>(i)) {}
    Value(unsigned long i) : storage(static_cast<std::int64_t>(i)) {}
    Value(double d) : storage(d) {}
    Value(char const* s) : storage(std::string(s)) {}
    Value(std::string s) : storage(std::move(s)) {}
    Value(Sequence s) : storage(std::move(s)) {}
    Value(Table t) : storage(std::move(t)) {}

    static Value opaque();
    static Value table();
    static Value sequence();

    [[nodiscard]] bool isNull() const noexcept;
    [[nodiscard]] bool isBool() const noexcept;
    [[nodiscard]] bool isInt() const noexcept;
    [[nodiscard]] bool isDouble() const noexcept;
    [[nodiscard]] bool isNumber() const noexcept;
    [[nodiscard]] bool isString() const noexcept;
    [[nodiscard]] bool isSequence() const noexcept;
    [[nodiscard]] bool isTable() const noexcept;
    [[nodiscard]] bool isOpaque() const noexcept;

    // Host truthiness: only null and false are falsy.
    [[nodiscard]] bool truthy() const noexcept;

    [[nodiscard]] std::optional<double> asNumber() const noexcept;
    [[nodiscard]] std::optional<std::int64_t> asInt() const noexcept;
    [[nodiscard]] std::string const* asString() const noexcept;
    [[nodiscard]] Sequence const* asSequence() const noexcept;
    [[nodiscard]] Table const* asTable() const noexcept;

    Value const* field(std::string const& key) const;
    Value const* index(std::int64_t position) const;

    // Elements 1..n of a list, or of a table whose integer keys run 1..n
    // without gaps (iteration stops at the first hole).
    std::vector<Value const*> elements() const;

    // Builders; a null value turns into a table / list on first use.
    Value& operator[](std::string const& key);
    Value& set(Key key, Value v);
    Value& push(Value v);

    [[nodiscard]] Storage const& data() const noexcept { return storage; }

    bool operator==(Value const& other) const { return storage == other.storage; }
    bool operator!=(Value const& other) const { return !(*this == other); }

private:
    Storage storage;
};

std::string keyToString(Value::Key const& key);
