#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "discovery/listeners.hpp"
#include "driver/iscan_driver.hpp"
#include "proto/advertising.hpp"
#include "proto/features.hpp"
#include "util/error.hpp"

namespace discovery
{

// One discovered peripheral. Tag (hardware address) never changes; everything
// else is guarded by the node's own mutex and can be read from any thread.
class Node : public std::enable_shared_from_this<Node>
{
  public:
    using Clock = std::chrono::steady_clock;

    // nullptr and malformed_advertisement if adv.payload is not BlueST advertising data
    static std::shared_ptr<Node> create(std::shared_ptr<driver::IScanDriver> drv,
                                        const driver::Advertisement         &adv,
                                        feature::MaskToFeature               features,
                                        bluest::Error                       *err = nullptr);
    ~Node();

    Node(const Node &)            = delete;
    Node &operator=(const Node &) = delete;

    const std::string &tag() const { return tag_; }
    std::string        name() const;
    std::int16_t       rssi() const;
    Clock::time_point  last_seen() const;
    NodeStatus         status() const;
    bool               is_connected() const { return status() == NodeStatus::Connected; }

    driver::Bytes           advertising_payload() const;
    advert::AdvertisingData advertising_data() const;
    advert::NodeType        type() const { return advertising_data().type; }

    // refresh liveness with a new sighting
    void is_alive(std::int16_t rssi);
    // false (previous data kept) if payload is malformed
    bool update_advertising_data(const driver::Bytes &payload, bluest::Error *err = nullptr);

    bool connect(bluest::Error *err = nullptr);
    bool disconnect(bluest::Error *err = nullptr);

    void add_listener(const std::shared_ptr<NodeListener> &l);
    void remove_listener(const std::shared_ptr<NodeListener> &l);

    // Exported characteristics that are both advertised and known to the feature map.
    // Needs a connection.
    std::vector<feature::Feature> features(bluest::Error *err = nullptr);

    bool enable_notifications(const feature::Feature                 &f,
                              const std::shared_ptr<FeatureListener> &l,
                              bluest::Error                          *err = nullptr);
    bool disable_notifications(const feature::Feature &f, bluest::Error *err = nullptr);
    bool is_notifying(const feature::Feature &f) const;

    // Pump the driver for `timeout` so pending notifications reach their listeners.
    bool wait_for_notifications(std::chrono::milliseconds timeout, bluest::Error *err = nullptr);

  private:
    Node(std::shared_ptr<driver::IScanDriver> drv,
         const driver::Advertisement         &adv,
         advert::AdvertisingData              data,
         feature::MaskToFeature               features);

    void set_status(NodeStatus s);
    void notify_status(NodeStatus s, NodeStatus old);
    void on_link_lost();
    void on_notification(std::uint32_t mask, const driver::Bytes &raw);

    std::shared_ptr<driver::IScanDriver> drv_;
    const std::string                    tag_;
    const feature::MaskToFeature         features_;

    mutable std::mutex      mu_;
    std::string             name_;
    std::int16_t            rssi_{0};
    Clock::time_point       last_seen_;
    NodeStatus              status_{NodeStatus::Idle};
    driver::Bytes           payload_;
    advert::AdvertisingData data_;
    // feature mask -> listeners with notifications enabled
    std::map<std::uint32_t, std::vector<std::shared_ptr<FeatureListener>>> notify_;

    mutable std::mutex                         listeners_mu_;
    std::vector<std::shared_ptr<NodeListener>> listeners_;
};

}  // namespace discovery
