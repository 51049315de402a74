#include "discovery/discovery_delegate.hpp"
#include "discovery/discovery_manager.hpp"
#include "discovery/node.hpp"
#include "proto/advertising.hpp"
#include "util/log.hpp"

namespace discovery
{

void DiscoveryDelegate::on_advertisement(const driver::Advertisement &adv)
{
    if (adv.addr.empty())
        return;

    if (auto node = manager_.get_node_with_tag(adv.addr))
    {
        node->is_alive(adv.rssi);
        // an empty or broken refresh keeps what we already have
        if (!adv.payload.empty() && !node->update_advertising_data(adv.payload))
            ++malformed_;
        return;
    }

    bluest::Error err;
    auto          data = advert::parse(adv.payload, &err);
    std::shared_ptr<Node> node;
    if (data)
        node = Node::create(manager_.driver(), adv, manager_.get_node_features(data->device_id),
                            &err);
    if (!node)
    {
        ++malformed_;
        if (show_warnings_)
            LOG_WARN("[DISCOVERY] ignoring %s (%s): %s", adv.addr.c_str(), adv.name.c_str(),
                     err.message.c_str());
        return;
    }

    if (manager_.add_node(node))
        LOG_DEBUG("[DISCOVERY] new node %s '%s' rssi=%d", adv.addr.c_str(), adv.name.c_str(),
                  (int)adv.rssi);
}

}  // namespace discovery
