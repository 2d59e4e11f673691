// main.cpp
// Generated Struct Example - A record with a map field stored as an array of values
//
// A rule program declares a relation over Interface records and keeps an
// index of interfaces by name. The name is part of each Interface, so the
// generated Router struct serializes the index as a bare array and rebuilds
// the keys on load.

#include <dltypes/array_map.h>
#include <dltypes/concepts.h>
#include <dltypes/numeric.h>
#include <dltypes/string_ops.h>

#include <boost/container_hash/hash.hpp>

#include <compare>
#include <iostream>
#include <optional>
#include <string>

using namespace dltypes;

// ============================================================
// Generated Types
// ============================================================

struct Interface
{
    std::string name;
    std_usize mtu = 1500;
    std::optional<std::string> address;

    auto operator<=>(const Interface&) const = default;
    bool operator==(const Interface&) const = default;

    std::size_t hash() const
    {
        std::size_t seed = 0;
        boost::hash_combine(seed, hash_value(name));
        boost::hash_combine(seed, hash_value(mtu));
        boost::hash_combine(seed, hash_value(address));
        return seed;
    }

    void serialize(Serializer& s) const
    {
        s.begin_struct("Interface", 3);
        write_field(s, "name", name);
        write_field(s, "mtu", mtu);
        write_field(s, "address", address);
        s.end_struct();
    }

    static Interface deserialize(Deserializer& d)
    {
        Interface i;
        d.begin_struct("Interface", 3);
        i.name    = read_field<std::string>(d, "name");
        i.mtu     = read_field<std_usize>(d, "mtu");
        i.address = read_field<std::optional<std::string>>(d, "address");
        d.end_struct();
        return i;
    }
};

inline std::string interface_name(const Interface& i)
{
    return i.name;
}

DLTYPES_MAP_FROM_ARRAY(InterfacesByName, std::string, Interface, interface_name);

struct Router
{
    std::string hostname;
    OrderedMap<std::string, Interface> interfaces;

    auto operator<=>(const Router&) const = default;
    bool operator==(const Router&) const = default;

    std::size_t hash() const
    {
        std::size_t seed = 0;
        boost::hash_combine(seed, hash_value(hostname));
        boost::hash_combine(seed, hash_value(interfaces));
        return seed;
    }

    void serialize(Serializer& s) const
    {
        s.begin_struct("Router", 2);
        write_field(s, "hostname", hostname);
        write_field_with<InterfacesByName>(s, "interfaces", interfaces);
        s.end_struct();
    }

    static Router deserialize(Deserializer& d)
    {
        Router r;
        d.begin_struct("Router", 2);
        r.hostname   = read_field<std::string>(d, "hostname");
        r.interfaces = read_field_with<InterfacesByName>(d, "interfaces");
        d.end_struct();
        return r;
    }
};

DLTYPES_ASSERT_VAL(Interface);
DLTYPES_ASSERT_VAL(Router);

// ============================================================
// Main
// ============================================================

int main()
{
    Router router{"edge-1", {}};
    for (const auto& iface : {Interface{"eth0", 1500, "10.0.0.1"},
                              Interface{"eth1", 9000, std::nullopt},
                              Interface{"lo", 65536, "127.0.0.1"}}) {
        router.interfaces.insert_or_assign(interface_name(iface), iface);
    }

    std::cout << "=== Generated Struct Example ===\n\n";

    std::string json = to_json(router, false);
    std::cout << "JSON document:\n" << json << "\n\n";

    auto bytes = to_bytes(router);
    std::cout << "Binary document: " << bytes.size() << " bytes\n";

    Router from_text  = from_json<Router>(json);
    Router from_binary = from_bytes<Router>(bytes);
    std::cout << "JSON round trip:   " << (from_text == router ? "ok" : "MISMATCH") << "\n";
    std::cout << "Binary round trip: " << (from_binary == router ? "ok" : "MISMATCH") << "\n\n";

    // Two values deriving the same key: the later one wins.
    const char* colliding = R"({"hostname":"edge-2","interfaces":[)"
                            R"({"name":"eth0","mtu":1500,"address":null},)"
                            R"({"name":"eth0","mtu":9000,"address":"10.1.0.1"}]})";
    Router merged = from_json<Router>(colliding);
    const auto& eth0 = merged.interfaces.at("eth0");
    std::cout << string_append_str("Collision on eth0 kept mtu ", std::to_string(eth0.mtu)) << "\n";

    // A malformed element rejects the whole document.
    std::string error;
    auto rejected = try_from_json<Router>(
        R"({"hostname":"edge-3","interfaces":[{"name":"eth0","mtu":-1,"address":null}]})", &error);
    std::cout << "Malformed element: " << (rejected ? "accepted" : string_append("rejected: ", error)) << "\n";

    bool ok = from_text == router && from_binary == router && eth0.mtu == 9000 && !rejected;
    return ok ? 0 : 1;
}
