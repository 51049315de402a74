#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace feature
{

enum class FeatureKind
{
    AudioAdpcmSync,
    AudioAdpcm,
    MicLevel,
    Proximity,
    Luminosity,
    Accelerometer,
    Gyroscope,
    Magnetometer,
    Pressure,
    Humidity,
    Temperature,
    Battery,
    AccelerometerEvent,
    // registered by applications, no built-in mask
    Switch,
    ActivityRecognition,
    Custom
};

const char                *feature_name(FeatureKind k);
std::optional<FeatureKind> feature_from_name(const std::string &name);  // case-insensitive

// single-bit feature mask -> kind, one table per device id
using MaskToFeature = std::map<std::uint32_t, FeatureKind>;

// mapping used for every device id nobody registered
const MaskToFeature &default_mask_to_feature();

inline bool is_single_bit(std::uint32_t mask)
{
    return mask != 0 && (mask & (mask - 1)) == 0;
}

// "<mask as %08x>-0001-11e1-ac36-0002a5d5c51b"
std::string characteristic_uuid(std::uint32_t mask);
// 0 when uuid is not a BlueST feature characteristic
std::uint32_t mask_from_characteristic_uuid(const std::string &uuid);

// One feature exported by a connected node.
struct Feature
{
    std::uint32_t mask{0};
    FeatureKind   kind{FeatureKind::Custom};
    std::string   char_uuid;

    const char *name() const { return feature_name(kind); }
};

}  // namespace feature
