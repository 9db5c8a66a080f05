#include "RangeExpander.hpp"
#include "../common/Errors.hpp"
#include <cctype>
#include <cstdint>
#include <utility>

namespace host_sweep::discovery
{
    namespace
    {
        bool IsDigits(const std::string &text)
        {
            if (text.empty())
                return false;
            for (char c : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return false;
            }
            return true;
        }

        // Digits only, bounded by `max`. Longer inputs are rejected before
        // conversion so stoul never overflows.
        bool ParseBounded(const std::string &text, unsigned long max, unsigned long &out)
        {
            if (!IsDigits(text) || text.size() > 3)
                return false;
            out = std::stoul(text);
            return out <= max;
        }

        std::string Trim(const std::string &text)
        {
            size_t begin = 0;
            size_t end = text.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
                ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
                --end;
            return text.substr(begin, end - begin);
        }

        std::vector<std::string> Split(const std::string &text, char delimiter)
        {
            std::vector<std::string> parts;
            size_t start = 0;
            while (true)
            {
                size_t pos = text.find(delimiter, start);
                if (pos == std::string::npos)
                {
                    parts.push_back(text.substr(start));
                    break;
                }
                parts.push_back(text.substr(start, pos - start));
                start = pos + 1;
            }
            return parts;
        }

        std::pair<uint8_t, uint8_t> ParseOctetField(const std::string &spec, const std::string &field)
        {
            unsigned long lo = 0;
            unsigned long hi = 0;

            size_t dash = field.find('-');
            if (dash == std::string::npos)
            {
                if (!ParseBounded(field, 255, lo))
                    throw RangeFormatError(spec, "octet '" + field + "' is not an integer in 0-255");
                return {static_cast<uint8_t>(lo), static_cast<uint8_t>(lo)};
            }

            std::string lo_text = field.substr(0, dash);
            std::string hi_text = field.substr(dash + 1);
            if (!ParseBounded(lo_text, 255, lo) || !ParseBounded(hi_text, 255, hi))
                throw RangeFormatError(spec, "octet range '" + field + "' must be lo-hi with bounds in 0-255");
            if (lo > hi)
                throw RangeFormatError(spec, "octet range '" + field + "' has lower bound above upper bound");

            return {static_cast<uint8_t>(lo), static_cast<uint8_t>(hi)};
        }
    }

    std::vector<Ipv4Address> CidrRangeExpander::Expand(const std::string &spec) const
    {
        size_t slash = spec.find('/');
        if (slash == std::string::npos)
            throw RangeFormatError(spec, "missing '/prefix'");

        auto base = Ipv4Address::Parse(spec.substr(0, slash));
        if (!base)
            throw RangeFormatError(spec, "'" + spec.substr(0, slash) + "' is not an IPv4 address");

        unsigned long prefix = 0;
        if (!ParseBounded(spec.substr(slash + 1), 32, prefix))
            throw RangeFormatError(spec, "prefix length must be an integer in 0-32");

        const uint32_t mask = (prefix == 0) ? 0u : (0xFFFFFFFFu << (32 - prefix));
        const uint32_t network = base->Value() & mask;
        const uint64_t count = uint64_t{1} << (32 - prefix);

        std::vector<Ipv4Address> addresses;
        addresses.reserve(static_cast<size_t>(count));
        for (uint64_t offset = 0; offset < count; ++offset)
        {
            addresses.emplace_back(static_cast<uint32_t>(network + offset));
        }

        if (addresses.size() > 2)
        {
            addresses.pop_back();
            addresses.erase(addresses.begin());
        }
        return addresses;
    }

    std::vector<Ipv4Address> OctetRangeExpander::Expand(const std::string &spec) const
    {
        std::vector<std::string> fields = Split(spec, '.');
        if (fields.size() != 4)
            throw RangeFormatError(spec, "expected 4 dot-separated octets, got " + std::to_string(fields.size()));

        std::pair<uint8_t, uint8_t> bounds[4];
        size_t total = 1;
        for (int i = 0; i < 4; ++i)
        {
            bounds[i] = ParseOctetField(spec, fields[i]);
            total *= static_cast<size_t>(bounds[i].second - bounds[i].first + 1);
        }

        std::vector<Ipv4Address> addresses;
        addresses.reserve(total);
        for (unsigned a = bounds[0].first; a <= bounds[0].second; ++a)
        {
            for (unsigned b = bounds[1].first; b <= bounds[1].second; ++b)
            {
                for (unsigned c = bounds[2].first; c <= bounds[2].second; ++c)
                {
                    for (unsigned d = bounds[3].first; d <= bounds[3].second; ++d)
                    {
                        addresses.push_back(Ipv4Address::FromOctets(static_cast<uint8_t>(a), static_cast<uint8_t>(b),
                                                                    static_cast<uint8_t>(c), static_cast<uint8_t>(d)));
                    }
                }
            }
        }
        return addresses;
    }

    const RangeExpander &SelectExpander(const std::string &spec)
    {
        static const CidrRangeExpander cidr;
        static const OctetRangeExpander octets;

        if (spec.find('/') != std::string::npos)
            return cidr;
        return octets;
    }

    std::vector<Ipv4Address> ExpandRange(const std::string &spec)
    {
        std::string trimmed = Trim(spec);
        if (trimmed.empty())
            throw RangeFormatError(spec, "empty range");

        return SelectExpander(trimmed).Expand(trimmed);
    }
}
