#include "units.hpp"

#include <array>

namespace paramdb::hass
{

namespace
{

struct Synonym
{
    const char* raw;
    const char* canonical;
    const char* display; // nullptr: no unit
};

// "uur" is Dutch for hour; the tables also spell cubic metres three ways.
// Canonical spellings map onto themselves so normalization is idempotent.
constexpr std::array<Synonym, 6> kSynonyms{{
    {"M3/h", "m3/h", "m³/h"},
    {"m3/h", "m3/h", "m³/h"},
    {"m³/h", "m3/h", "m³/h"},
    {"uur", "hour", "h"},
    {"hour", "hour", "h"},
    {"-", "-", nullptr},
}};

} // namespace

NormalizedUnit normalizeUnit(const std::string& raw)
{
    for (const auto& s : kSynonyms)
    {
        if (raw == s.raw)
        {
            NormalizedUnit u{s.canonical, std::nullopt};
            if (s.display)
                u.display = s.display;
            return u;
        }
    }
    return NormalizedUnit{raw, raw};
}

} // namespace paramdb::hass
