#include "CapturedHost.hpp"

#include <type_traits>
#include <variant>

HostCall CapturedHost::fromProto(transit_capture::Capability c)
{
    switch (c)
    {
        case transit_capture::GET_ENTITY:             return HostCall::GetEntity;
        case transit_capture::GET_ENTITY_LIST:        return HostCall::GetEntityList;
        case transit_capture::GET_COMPONENT:          return HostCall::GetComponent;
        case transit_capture::GET_ENTITIES_IN_REGION: return HostCall::GetEntitiesInRegion;
        case transit_capture::GET_GAME_TIME:          return HostCall::GetGameTime;
        default:
            throw HostError("unknown capability in capture: " + std::to_string(static_cast<int>(c)));
    }
}

transit_capture::Capability CapturedHost::toProto(HostCall call)
{
    switch (call)
    {
        case HostCall::GetEntity:           return transit_capture::GET_ENTITY;
        case HostCall::GetEntityList:       return transit_capture::GET_ENTITY_LIST;
        case HostCall::GetComponent:        return transit_capture::GET_COMPONENT;
        case HostCall::GetEntitiesInRegion: return transit_capture::GET_ENTITIES_IN_REGION;
        case HostCall::GetGameTime:         return transit_capture::GET_GAME_TIME;
    }
    return transit_capture::GET_ENTITY;
}

Value CapturedHost::fromProto(transit_capture::HostValue const& v)
{
    switch (v.kind_case())
    {
        case transit_capture::HostValue::kBoolValue:   return Value(v.bool_value());
        case transit_capture::HostValue::kIntValue:    return Value(static_cast<std::int64_t>(v.int_value()));
        case transit_capture::HostValue::kNumberValue: return Value(v.number_value());
        case transit_capture::HostValue::kStringValue: return Value(v.string_value());
        case transit_capture::HostValue::kOpaque:      return Value::opaque();

        case transit_capture::HostValue::kListValue:
        {
            Value out = Value::sequence();
            for (auto const& item : v.list_value().items())
                out.push(fromProto(item));
            return out;
        }

        case transit_capture::HostValue::kTableValue:
        {
            Value out = Value::table();
            for (auto const& entry : v.table_value().entries())
            {
                if (entry.key_case() == transit_capture::HostTableEntry::kIntKey)
                    out.set(Value::Key{static_cast<std::int64_t>(entry.int_key())}, fromProto(entry.value()));
                else
                    out.set(Value::Key{entry.string_key()}, fromProto(entry.value()));
            }
            return out;
        }

        case transit_capture::HostValue::KIND_NOT_SET:
            break;
    }
    return Value();
}

transit_capture::HostValue CapturedHost::toProto(Value const& value)
{
    transit_capture::HostValue out;
    std::visit([&](auto const& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, bool>)
            out.set_bool_value(v);
        else if constexpr (std::is_same_v<T, std::int64_t>)
            out.set_int_value(v);
        else if constexpr (std::is_same_v<T, double>)
            out.set_number_value(v);
        else if constexpr (std::is_same_v<T, std::string>)
            out.set_string_value(v);
        else if constexpr (std::is_same_v<T, Value::Opaque>)
            out.set_opaque(true);
        else if constexpr (std::is_same_v<T, Value::Sequence>)
        {
            auto* list = out.mutable_list_value();
            for (auto const& item : v)
                *list->add_items() = toProto(item);
        }
        else if constexpr (std::is_same_v<T, Value::Table>)
        {
            auto* table = out.mutable_table_value();
            for (auto const& [key, item] : v)
            {
                auto* entry = table->add_entries();
                if (auto const* i = std::get_if<std::int64_t>(&key))
                    entry->set_int_key(*i);
                else
                    entry->set_string_key(std::get<std::string>(key));
                *entry->mutable_value() = toProto(item);
            }
        }
    }, value.data());
    return out;
}

void CapturedHost::load(transit_capture::HostFrame const& frame)
{
    calls.clear();
    lists.clear();
    regionLists.clear();
    entities.clear();
    components.clear();

    for (int c : frame.capabilities())
        calls.insert(fromProto(static_cast<transit_capture::Capability>(c)));

    for (auto const& list : frame.lists())
    {
        auto& target = list.region() ? regionLists : lists;
        target[list.type_key()] = fromProto(list.entities());
    }

    for (auto const& e : frame.entities())
        entities[e.id()] = fromProto(e.record());

    for (auto const& c : frame.components())
        components[{c.id(), c.component_type()}] = fromProto(c.record());

    time = frame.has_game_time() ? fromProto(frame.game_time()) : Value();
    timestamp = frame.timestamp();
    dt = frame.dt();
}

bool CapturedHost::provides(HostCall call) const
{
    return calls.count(call) > 0;
}

Value CapturedHost::getEntity(EntityId id)
{
    auto it = entities.find(id);
    if (it == entities.end())
        throw HostError("no entity " + std::to_string(id) + " in frame");
    return it->second;
}

Value CapturedHost::getEntityList(std::string const& typeKey)
{
    auto it = lists.find(typeKey);
    if (it == lists.end())
        throw HostError("unknown entity type " + typeKey);
    return it->second;
}

Value CapturedHost::getComponent(EntityId id, std::string const& componentType)
{
    auto it = components.find({id, componentType});
    if (it == components.end())
        return Value();
    return it->second;
}

Value CapturedHost::getEntitiesInRegion(Bounds const&, std::string const& typeKey)
{
    auto it = regionLists.find(typeKey);
    if (it == regionLists.end())
        return Value::sequence();
    return it->second;
}

Value CapturedHost::getGameTime()
{
    return time;
}
