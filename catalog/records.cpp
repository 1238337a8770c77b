#include "records.hpp"

#include <stdexcept>

namespace paramdb::catalog
{

Language parseLanguage(const std::string& s)
{
    if (s == "NL")
        return Language::NL;
    if (s == "GB")
        return Language::GB;
    if (s == "D")
        return Language::D;
    throw std::runtime_error("Unknown label language: " + s +
                             " (expected NL, GB or D)");
}

const char* languageSuffix(Language l)
{
    switch (l)
    {
        case Language::NL:
            return "NL";
        case Language::GB:
            return "GB";
        case Language::D:
            return "D";
    }
    return "GB";
}

const LocalizedText& Parameter::text(Language l) const
{
    switch (l)
    {
        case Language::NL:
            return nl;
        case Language::D:
            return d;
        case Language::GB:
            break;
    }
    return gb;
}

const LocalizedText& Datalabel::text(Language l) const
{
    switch (l)
    {
        case Language::NL:
            return nl;
        case Language::D:
            return d;
        case Language::GB:
            break;
    }
    return gb;
}

} // namespace paramdb::catalog
