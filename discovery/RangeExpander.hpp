#pragma once

#include <string>
#include <vector>
#include "../common/Ipv4Address.hpp"

namespace host_sweep::discovery
{
    using common::Ipv4Address;

    // Turns one range specification into the ordered list of addresses it
    // covers. Implementations throw RangeFormatError on malformed input.
    class RangeExpander
    {
    public:
        virtual ~RangeExpander() = default;
        virtual std::vector<Ipv4Address> Expand(const std::string &spec) const = 0;
    };

    // "a.b.c.d/n". Network and broadcast addresses are dropped when the block
    // holds more than two addresses.
    class CidrRangeExpander : public RangeExpander
    {
    public:
        std::vector<Ipv4Address> Expand(const std::string &spec) const override;
    };

    // Four dot-separated fields, each "n" or "lo-hi" (inclusive, 0..255).
    // Produces the full cartesian product, first field outermost.
    class OctetRangeExpander : public RangeExpander
    {
    public:
        std::vector<Ipv4Address> Expand(const std::string &spec) const override;
    };

    // Picks the CIDR expander when the spec contains '/', the octet expander otherwise.
    const RangeExpander &SelectExpander(const std::string &spec);

    // Trims the spec, dispatches it and expands it.
    std::vector<Ipv4Address> ExpandRange(const std::string &spec);
}
