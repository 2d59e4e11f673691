// test_types.h - Value types shaped like the code generator's output, shared by tests

#pragma once

#include <dltypes/array_map.h>
#include <dltypes/concepts.h>
#include <dltypes/numeric.h>

#include <boost/container_hash/hash.hpp>

#include <compare>
#include <cstdint>
#include <string>

namespace test_types {

using namespace dltypes;

// A generated record: two fields, member codec and member hash.
struct Endpoint {
    std::string host;
    uint16_t port = 0;

    auto operator<=>(const Endpoint&) const = default;
    bool operator==(const Endpoint&) const = default;

    std::size_t hash() const {
        std::size_t seed = 0;
        boost::hash_combine(seed, hash_value(host));
        boost::hash_combine(seed, hash_value(port));
        return seed;
    }

    void serialize(Serializer& s) const {
        s.begin_struct("Endpoint", 2);
        write_field(s, "host", host);
        write_field(s, "port", port);
        s.end_struct();
    }

    static Endpoint deserialize(Deserializer& d) {
        Endpoint e;
        d.begin_struct("Endpoint", 2);
        e.host = read_field<std::string>(d, "host");
        e.port = read_field<uint16_t>(d, "port");
        d.end_struct();
        return e;
    }
};

inline std::string endpoint_host(const Endpoint& e) {
    return e.host;
}

inline std_usize string_length(const std::string& s) {
    return s.size();
}

DLTYPES_MAP_FROM_ARRAY(EndpointsByHost, std::string, Endpoint, endpoint_host);
DLTYPES_MAP_FROM_ARRAY(StringsByLength, std_usize, std::string, string_length);

// A generated record embedding an array-backed map field.
struct Topology {
    std::string name;
    OrderedMap<std::string, Endpoint> endpoints;

    auto operator<=>(const Topology&) const = default;
    bool operator==(const Topology&) const = default;

    std::size_t hash() const {
        std::size_t seed = 0;
        boost::hash_combine(seed, hash_value(name));
        boost::hash_combine(seed, hash_value(endpoints));
        return seed;
    }

    void serialize(Serializer& s) const {
        s.begin_struct("Topology", 2);
        write_field(s, "name", name);
        write_field_with<EndpointsByHost>(s, "endpoints", endpoints);
        s.end_struct();
    }

    static Topology deserialize(Deserializer& d) {
        Topology t;
        d.begin_struct("Topology", 2);
        t.name = read_field<std::string>(d, "name");
        t.endpoints = read_field_with<EndpointsByHost>(d, "endpoints");
        d.end_struct();
        return t;
    }
};

DLTYPES_ASSERT_VAL(Endpoint);
DLTYPES_ASSERT_VAL(Topology);

} // namespace test_types
