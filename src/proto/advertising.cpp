#include <cstdio>

#include "proto/advertising.hpp"
#include "util/log.hpp"

namespace advert
{

const char *node_type_name(NodeType t)
{
    switch (t)
    {
        case NodeType::Generic:
            return "GENERIC";
        case NodeType::SteValWesu1:
            return "STEVAL_WESU1";
        case NodeType::SensorTile:
            return "SENSOR_TILE";
        case NodeType::BlueCoin:
            return "BLUE_COIN";
        case NodeType::SteValIdb008Vx:
            return "STEVAL_IDB008VX";
        case NodeType::SteValBcn002V1:
            return "STEVAL_BCN002V1";
        case NodeType::SensorTileBox:
            return "SENSOR_TILE_BOX";
        case NodeType::DiscoveryIot01A:
            return "DISCOVERY_IOT01A";
        case NodeType::Nucleo:
            return "NUCLEO";
    }
    return "?";
}

NodeType node_type_from_id(std::uint8_t device_id)
{
    if (device_id & NUCLEO_BIT)
        return NodeType::Nucleo;
    switch (device_id)
    {
        case 0x01:
            return NodeType::SteValWesu1;
        case 0x02:
            return NodeType::SensorTile;
        case 0x03:
            return NodeType::BlueCoin;
        case 0x04:
            return NodeType::SteValIdb008Vx;
        case 0x05:
            return NodeType::SteValBcn002V1;
        case 0x06:
            return NodeType::SensorTileBox;
        case 0x07:
            return NodeType::DiscoveryIot01A;
        default:
            return NodeType::Generic;
    }
}

std::string AdvertisingData::mac_string() const
{
    if (!mac)
        return {};
    char buf[18];
    const auto &m = *mac;
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X", m[0], m[1], m[2], m[3], m[4],
                  m[5]);
    return buf;
}

std::optional<AdvertisingData> parse(const std::vector<std::uint8_t> &payload, bluest::Error *err)
{
    if (payload.size() != LEN_NO_MAC && payload.size() != LEN_WITH_MAC)
    {
        bluest::set_error(err, bluest::Errc::malformed_advertisement,
                          "advertising data must be 6 or 12 bytes, got " +
                              std::to_string(payload.size()));
        return std::nullopt;
    }
    if (payload[0] != PROTOCOL_VERSION)
    {
        bluest::set_error(err, bluest::Errc::malformed_advertisement,
                          "unsupported protocol version " + std::to_string(payload[0]));
        return std::nullopt;
    }

    AdvertisingData d;
    d.protocol_version = payload[0];

    const std::uint8_t raw_id = payload[1];
    d.device_id           = (raw_id & NUCLEO_BIT) ? raw_id : (raw_id & BOARD_ID_MASK);
    d.type                = node_type_from_id(d.device_id);
    d.sleeping            = (raw_id & SLEEPING_BIT) != 0;
    d.has_general_purpose = (raw_id & GENERAL_PURPOSE_BIT) != 0;

    // big-endian
    d.feature_mask = (std::uint32_t(payload[2]) << 24) | (std::uint32_t(payload[3]) << 16) |
                     (std::uint32_t(payload[4]) << 8) | std::uint32_t(payload[5]);

    if (payload.size() == LEN_WITH_MAC)
    {
        std::array<std::uint8_t, 6> m{};
        for (std::size_t i = 0; i < m.size(); ++i)
            m[i] = payload[LEN_NO_MAC + i];
        d.mac = m;
    }
    LOG_DEBUG("[ADV] id=0x%02x type=%s mask=0x%08x", d.device_id, node_type_name(d.type),
              d.feature_mask);
    return d;
}

}  // namespace advert
