#include <cctype>
#include <cstdio>
#include <cstdlib>

#include "proto/features.hpp"
#include "util/constants.hpp"

namespace feature
{

namespace
{
struct NameEntry
{
    FeatureKind kind;
    const char *name;
};

constexpr NameEntry NAMES[] = {
    {FeatureKind::AudioAdpcmSync, "AudioADPCMSync"},
    {FeatureKind::AudioAdpcm, "AudioADPCM"},
    {FeatureKind::MicLevel, "MicLevel"},
    {FeatureKind::Proximity, "Proximity"},
    {FeatureKind::Luminosity, "Luminosity"},
    {FeatureKind::Accelerometer, "Accelerometer"},
    {FeatureKind::Gyroscope, "Gyroscope"},
    {FeatureKind::Magnetometer, "Magnetometer"},
    {FeatureKind::Pressure, "Pressure"},
    {FeatureKind::Humidity, "Humidity"},
    {FeatureKind::Temperature, "Temperature"},
    {FeatureKind::Battery, "Battery"},
    {FeatureKind::AccelerometerEvent, "AccelerometerEvent"},
    {FeatureKind::Switch, "Switch"},
    {FeatureKind::ActivityRecognition, "ActivityRecognition"},
    {FeatureKind::Custom, "Custom"},
};

std::string lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}
}  // namespace

const char *feature_name(FeatureKind k)
{
    for (const auto &e : NAMES)
        if (e.kind == k)
            return e.name;
    return "?";
}

std::optional<FeatureKind> feature_from_name(const std::string &name)
{
    const std::string want = lower(name);
    for (const auto &e : NAMES)
        if (lower(e.name) == want)
            return e.kind;
    return std::nullopt;
}

const MaskToFeature &default_mask_to_feature()
{
    // two temperature sensors share the kind, they differ only by characteristic
    static const MaskToFeature table = {
        {0x40000000u, FeatureKind::AudioAdpcmSync}, {0x08000000u, FeatureKind::AudioAdpcm},
        {0x04000000u, FeatureKind::MicLevel},       {0x02000000u, FeatureKind::Proximity},
        {0x01000000u, FeatureKind::Luminosity},     {0x00800000u, FeatureKind::Accelerometer},
        {0x00400000u, FeatureKind::Gyroscope},      {0x00200000u, FeatureKind::Magnetometer},
        {0x00100000u, FeatureKind::Pressure},       {0x00080000u, FeatureKind::Humidity},
        {0x00040000u, FeatureKind::Temperature},    {0x00020000u, FeatureKind::Battery},
        {0x00010000u, FeatureKind::Temperature},    {0x00000400u, FeatureKind::AccelerometerEvent},
    };
    return table;
}

std::string characteristic_uuid(std::uint32_t mask)
{
    char head[9];
    std::snprintf(head, sizeof(head), "%08x", mask);
    return std::string(head) + std::string(constants::FEATURE_UUID_SUFFIX);
}

std::uint32_t mask_from_characteristic_uuid(const std::string &uuid)
{
    const std::string u      = lower(uuid);
    const std::string suffix = std::string(constants::FEATURE_UUID_SUFFIX);
    if (u.size() != 8 + suffix.size() || u.compare(8, std::string::npos, suffix) != 0)
        return 0;
    for (std::size_t i = 0; i < 8; ++i)
        if (!std::isxdigit(static_cast<unsigned char>(u[i])))
            return 0;
    return static_cast<std::uint32_t>(std::strtoul(u.substr(0, 8).c_str(), nullptr, 16));
}

}  // namespace feature
