#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "util/error.hpp"

/*
Manufacturer-specific AD content of a BlueST node:

  [0]     protocol version (0x01)
  [1]     device id   bit7: Nucleo family, full byte is the id
                      bit6: sleeping
                      bit5: has general purpose features
                      bit4..0: board id
  [2..5]  feature mask, big-endian, one bit per exported feature
  [6..11] optional MAC address
*/

namespace advert
{

// --- Protocol constants ---
inline constexpr std::uint8_t PROTOCOL_VERSION = 0x01;
inline constexpr std::size_t  LEN_NO_MAC       = 6;
inline constexpr std::size_t  LEN_WITH_MAC     = 12;

inline constexpr std::uint8_t NUCLEO_BIT          = 0x80;
inline constexpr std::uint8_t SLEEPING_BIT        = 0x40;
inline constexpr std::uint8_t GENERAL_PURPOSE_BIT = 0x20;
inline constexpr std::uint8_t BOARD_ID_MASK       = 0x1F;

enum class NodeType
{
    Generic,
    SteValWesu1,
    SensorTile,
    BlueCoin,
    SteValIdb008Vx,
    SteValBcn002V1,
    SensorTileBox,
    DiscoveryIot01A,
    Nucleo
};

const char *node_type_name(NodeType t);
NodeType    node_type_from_id(std::uint8_t device_id);

struct AdvertisingData
{
    std::uint8_t                               protocol_version{PROTOCOL_VERSION};
    std::uint8_t                               device_id{0};  // board id, full byte for Nucleo
    NodeType                                   type{NodeType::Generic};
    bool                                       sleeping{false};
    bool                                       has_general_purpose{false};
    std::uint32_t                              feature_mask{0};
    std::optional<std::array<std::uint8_t, 6>> mac;

    std::string mac_string() const;  // "" when the payload carried none
};

// nullopt (and malformed_advertisement) on a bad length or unknown protocol version
std::optional<AdvertisingData> parse(const std::vector<std::uint8_t> &payload,
                                     bluest::Error                  *err = nullptr);

}  // namespace advert
