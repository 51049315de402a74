#pragma once
#include <cstdint>
#include <memory>

#include "driver/iscan_driver.hpp"
#include "proto/features.hpp"

namespace discovery
{

class DiscoveryManager;
class Node;

enum class NodeStatus
{
    Idle,
    Connecting,
    Connected,
    Disconnected
};

const char *node_status_name(NodeStatus s);

// One notification from a feature characteristic. Values are not decoded.
struct Sample
{
    std::uint16_t timestamp{0};  // first two bytes, little-endian
    driver::Bytes raw;
};

Sample make_sample(const driver::Bytes &raw);

// Receives scan session and new-node events. Both run on a listener pool thread.
class DiscoveryListener
{
  public:
    virtual ~DiscoveryListener() = default;

    virtual void on_discovery_change(DiscoveryManager &manager, bool enabled)             = 0;
    virtual void on_node_discovered(DiscoveryManager &manager, std::shared_ptr<Node> node) = 0;
};

// Called from the thread that changed the status (caller of connect/disconnect,
// or the driver thread that saw the link go down).
class NodeListener
{
  public:
    virtual ~NodeListener() = default;

    virtual void on_status_change(Node &node, NodeStatus new_status, NodeStatus old_status) = 0;
};

// Called from the thread pumping the driver, normally inside Node::wait_for_notifications().
class FeatureListener
{
  public:
    virtual ~FeatureListener() = default;

    virtual void on_update(Node &node, const feature::Feature &f, const Sample &sample) = 0;
};

}  // namespace discovery
