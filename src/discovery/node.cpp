#include <algorithm>
#include <utility>

#include "discovery/node.hpp"
#include "util/log.hpp"

namespace discovery
{

const char *node_status_name(NodeStatus s)
{
    switch (s)
    {
        case NodeStatus::Idle:
            return "IDLE";
        case NodeStatus::Connecting:
            return "CONNECTING";
        case NodeStatus::Connected:
            return "CONNECTED";
        case NodeStatus::Disconnected:
            return "DISCONNECTED";
    }
    return "?";
}

Sample make_sample(const driver::Bytes &raw)
{
    Sample s;
    if (raw.size() >= 2)
        s.timestamp = static_cast<std::uint16_t>(raw[0] | (raw[1] << 8));
    s.raw = raw;
    return s;
}

std::shared_ptr<Node> Node::create(std::shared_ptr<driver::IScanDriver> drv,
                                   const driver::Advertisement         &adv,
                                   feature::MaskToFeature               features,
                                   bluest::Error                       *err)
{
    auto data = advert::parse(adv.payload, err);
    if (!data)
        return nullptr;
    return std::shared_ptr<Node>(new Node(std::move(drv), adv, *data, std::move(features)));
}

Node::Node(std::shared_ptr<driver::IScanDriver> drv,
           const driver::Advertisement         &adv,
           advert::AdvertisingData              data,
           feature::MaskToFeature               features)
    : drv_(std::move(drv)),
      tag_(adv.addr),
      features_(std::move(features)),
      name_(adv.name),
      rssi_(adv.rssi),
      last_seen_(Clock::now()),
      payload_(adv.payload),
      data_(std::move(data))
{
}

Node::~Node()
{
    // the driver must not call back into a dead node
    if (status() == NodeStatus::Connected && drv_)
    {
        bluest::Error err;
        if (!drv_->disconnect(tag_, err))
            LOG_WARN("[NODE] %s: disconnect on teardown: %s", tag_.c_str(),
                     bluest::to_string(err).c_str());
    }
}

std::string Node::name() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return name_;
}

std::int16_t Node::rssi() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return rssi_;
}

Node::Clock::time_point Node::last_seen() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return last_seen_;
}

NodeStatus Node::status() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return status_;
}

driver::Bytes Node::advertising_payload() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return payload_;
}

advert::AdvertisingData Node::advertising_data() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return data_;
}

void Node::is_alive(std::int16_t rssi)
{
    std::lock_guard<std::mutex> lk(mu_);
    rssi_      = rssi;
    last_seen_ = Clock::now();
}

bool Node::update_advertising_data(const driver::Bytes &payload, bluest::Error *err)
{
    auto data = advert::parse(payload, err);
    if (!data)
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    payload_ = payload;
    data_    = std::move(*data);
    return true;
}

void Node::set_status(NodeStatus s)
{
    NodeStatus old;
    {
        std::lock_guard<std::mutex> lk(mu_);
        old     = status_;
        status_ = s;
        if (s != NodeStatus::Connected)
            notify_.clear();
    }
    if (old != s)
        notify_status(s, old);
}

void Node::notify_status(NodeStatus s, NodeStatus old)
{
    LOG_INFO("[NODE] %s: %s -> %s", tag_.c_str(), node_status_name(old), node_status_name(s));

    std::vector<std::shared_ptr<NodeListener>> snapshot;
    {
        std::lock_guard<std::mutex> lk(listeners_mu_);
        snapshot = listeners_;
    }
    for (const auto &l : snapshot)
        l->on_status_change(*this, s, old);
}

void Node::on_link_lost()
{
    LOG_WARN("[NODE] %s: link lost", tag_.c_str());
    set_status(NodeStatus::Disconnected);
}

bool Node::connect(bluest::Error *err)
{
    NodeStatus before;
    {
        // claim the attempt: only one caller moves the node to Connecting
        std::lock_guard<std::mutex> lk(mu_);
        before = status_;
        if (before == NodeStatus::Connected)
            return true;
        if (before == NodeStatus::Connecting)
            return bluest::set_error(err, bluest::Errc::already_exists,
                                     "connection to " + tag_ + " already in progress");
        status_ = NodeStatus::Connecting;
        notify_.clear();
    }
    notify_status(NodeStatus::Connecting, before);

    std::weak_ptr<Node> weak    = weak_from_this();
    driver::OnLinkLost  on_lost = [weak] {
        if (auto self = weak.lock())
            self->on_link_lost();
    };
    bluest::Error e;
    if (!drv_->connect(tag_, std::move(on_lost), e))
    {
        LOG_ERROR("[NODE] %s: connect failed: %s", tag_.c_str(), bluest::to_string(e).c_str());
        set_status(before);
        return bluest::set_error(err, e);
    }
    set_status(NodeStatus::Connected);
    return true;
}

bool Node::disconnect(bluest::Error *err)
{
    if (status() != NodeStatus::Connected)
        return bluest::set_error(err, bluest::Errc::not_connected, tag_ + " is not connected");

    bluest::Error e;
    if (!drv_->disconnect(tag_, e))
    {
        LOG_ERROR("[NODE] %s: disconnect failed: %s", tag_.c_str(), bluest::to_string(e).c_str());
        return bluest::set_error(err, e);
    }
    set_status(NodeStatus::Disconnected);
    return true;
}

void Node::add_listener(const std::shared_ptr<NodeListener> &l)
{
    if (!l)
        return;
    std::lock_guard<std::mutex> lk(listeners_mu_);
    if (std::find(listeners_.begin(), listeners_.end(), l) == listeners_.end())
        listeners_.push_back(l);
}

void Node::remove_listener(const std::shared_ptr<NodeListener> &l)
{
    std::lock_guard<std::mutex> lk(listeners_mu_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), l), listeners_.end());
}

std::vector<feature::Feature> Node::features(bluest::Error *err)
{
    if (!is_connected())
    {
        bluest::set_error(err, bluest::Errc::not_connected, tag_ + " is not connected");
        return {};
    }

    std::vector<std::string> uuids;
    bluest::Error            e;
    if (!drv_->list_characteristics(tag_, uuids, e))
    {
        bluest::set_error(err, e);
        return {};
    }

    const std::uint32_t           advertised = advertising_data().feature_mask;
    std::vector<feature::Feature> out;
    for (const auto &uuid : uuids)
    {
        const std::uint32_t mask = feature::mask_from_characteristic_uuid(uuid);
        if (!mask || !(advertised & mask))
            continue;
        auto it = features_.find(mask);
        if (it == features_.end())
            continue;
        out.push_back(feature::Feature{mask, it->second, feature::characteristic_uuid(mask)});
    }
    // highest bit first, the order boards list them in
    std::sort(out.begin(), out.end(),
              [](const feature::Feature &a, const feature::Feature &b) { return a.mask > b.mask; });
    return out;
}

bool Node::enable_notifications(const feature::Feature                 &f,
                                const std::shared_ptr<FeatureListener> &l,
                                bluest::Error                          *err)
{
    if (!is_connected())
        return bluest::set_error(err, bluest::Errc::not_connected, tag_ + " is not connected");

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = notify_.find(f.mask);
        if (it != notify_.end())
        {
            // already on, only add the listener
            if (l && std::find(it->second.begin(), it->second.end(), l) == it->second.end())
                it->second.push_back(l);
            return true;
        }
    }

    std::weak_ptr<Node> weak = weak_from_this();
    const std::uint32_t mask = f.mask;
    driver::OnNotify    on_value = [weak, mask](const driver::Bytes &raw) {
        if (auto self = weak.lock())
            self->on_notification(mask, raw);
    };
    bluest::Error e;
    if (!drv_->start_notify(tag_, f.char_uuid, std::move(on_value), e))
    {
        LOG_WARN("[NODE] %s: enable %s failed: %s", tag_.c_str(), f.name(),
                 bluest::to_string(e).c_str());
        return bluest::set_error(err, e);
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto                       &list = notify_[f.mask];
    if (l && std::find(list.begin(), list.end(), l) == list.end())
        list.push_back(l);
    return true;
}

bool Node::disable_notifications(const feature::Feature &f, bluest::Error *err)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (notify_.erase(f.mask) == 0)
            return true;
    }
    bluest::Error e;
    if (!drv_->stop_notify(tag_, f.char_uuid, e))
        return bluest::set_error(err, e);
    return true;
}

bool Node::is_notifying(const feature::Feature &f) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return notify_.count(f.mask) != 0;
}

void Node::on_notification(std::uint32_t mask, const driver::Bytes &raw)
{
    std::vector<std::shared_ptr<FeatureListener>> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = notify_.find(mask);
        if (it == notify_.end())
            return;
        targets = it->second;
    }
    auto kind = features_.find(mask);
    const feature::Feature f{mask,
                             kind == features_.end() ? feature::FeatureKind::Custom : kind->second,
                             feature::characteristic_uuid(mask)};
    const Sample           sample = make_sample(raw);
    for (const auto &l : targets)
        l->on_update(*this, f, sample);
}

bool Node::wait_for_notifications(std::chrono::milliseconds timeout, bluest::Error *err)
{
    bluest::Error e;
    if (!drv_->process(timeout, e))
        return bluest::set_error(err, e);
    return true;
}

}  // namespace discovery
