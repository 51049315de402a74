#include <algorithm>
#include <cstdio>
#include <utility>

#include "discovery/discovery_delegate.hpp"
#include "discovery/discovery_manager.hpp"
#include "util/log.hpp"

namespace discovery
{

namespace
{
std::mutex                      g_instance_mu;
std::weak_ptr<DiscoveryManager> g_instance;
}  // namespace

Options Options::from_config(const bluest::Config &cfg)
{
    Options o;
    o.default_timeout_s = cfg.scan_timeout_s;
    o.listener_threads  = cfg.listener_threads;
    return o;
}

std::shared_ptr<DiscoveryManager> DiscoveryManager::create(std::shared_ptr<driver::IScanDriver> drv,
                                                           Options        opts,
                                                           bluest::Error *err)
{
    if (!drv)
    {
        bluest::set_error(err, bluest::Errc::driver_failure, "no scan driver");
        return nullptr;
    }
    std::lock_guard<std::mutex> lk(g_instance_mu);
    if (!g_instance.expired())
    {
        bluest::set_error(err, bluest::Errc::already_exists,
                          "a discovery manager already exists, use instance()");
        return nullptr;
    }
    std::shared_ptr<DiscoveryManager> mgr(new DiscoveryManager(std::move(drv), opts));
    g_instance = mgr;
    LOG_DEBUG("[DISCOVERY] manager created (driver=%s, listener threads=%zu)",
              mgr->drv_->name().c_str(), mgr->pool_.size());
    return mgr;
}

std::shared_ptr<DiscoveryManager> DiscoveryManager::instance()
{
    std::lock_guard<std::mutex> lk(g_instance_mu);
    return g_instance.lock();
}

DiscoveryManager::DiscoveryManager(std::shared_ptr<driver::IScanDriver> drv, Options opts)
    : drv_(std::move(drv)),
      opts_(opts),
      pool_(opts.listener_threads ? opts.listener_threads : constants::LISTENER_THREADS)
{
}

DiscoveryManager::~DiscoveryManager()
{
    std::unique_ptr<ScanWorker> worker;
    {
        std::lock_guard<std::mutex> lk(scan_mu_);
        worker = std::move(worker_);
    }
    if (worker)
    {
        worker->stop();
        bluest::Error e = worker->join();
        if (e)
            LOG_WARN("[DISCOVERY] scan failure at teardown: %s", bluest::to_string(e).c_str());
    }
    scanning_.store(false);
    pool_.shutdown();
}

int DiscoveryManager::effective_timeout(int timeout_s) const
{
    if (timeout_s > 0)
        return timeout_s;
    return opts_.default_timeout_s > 0 ? opts_.default_timeout_s : constants::SCAN_TIMEOUT_DEFAULT_S;
}

// permission problems get the hint the user can act on
bluest::Error DiscoveryManager::scan_failure(const bluest::Error &e) const
{
    if (e.code != bluest::Errc::permission_denied)
        return e;
    return bluest::make_error(e.code, std::string(constants::PRIVILEGE_HINT) + " (" + e.message + ")",
                              e.sys);
}

// scan_mu_ held. Drops a worker whose scan already ended by timeout.
void DiscoveryManager::reap_worker_locked()
{
    if (!worker_ || !worker_->finished() || scanning_.load())
        return;
    bluest::Error e = worker_->join();
    if (e)
        LOG_WARN("[DISCOVERY] previous scan ended with: %s", bluest::to_string(e).c_str());
    worker_.reset();
}

// Leave Scanning. Only the caller that flips the flag sends discovery-stop.
void DiscoveryManager::end_session(bool drain)
{
    if (!scanning_.exchange(false))
    {
        if (drain)
            pool_.wait_idle();
        return;
    }
    if (drain)
        pool_.wait_idle();  // node events of this session go first
    notify_discovery_change(false);
    if (drain)
        pool_.wait_idle();
    LOG_SYSTEM("[DISCOVERY] discovery stopped");
}

bool DiscoveryManager::discover(bool show_warnings, int timeout_s, bluest::Error *err)
{
    {
        std::lock_guard<std::mutex> lk(scan_mu_);
        reap_worker_locked();
        bool expected = false;
        if (!scanning_.compare_exchange_strong(expected, true))
        {
            LOG_DEBUG("[DISCOVERY] discover: already scanning");
            return bluest::set_error(err, bluest::Errc::already_exists, "a scan is already running");
        }
    }

    const int timeout = effective_timeout(timeout_s);
    LOG_SYSTEM("[DISCOVERY] discovery started (sync, %ds)", timeout);
    notify_discovery_change(true);

    DiscoveryDelegate delegate(*this, show_warnings);
    bluest::Error     e;
    const bool        ok = drv_->scan(
        timeout, [&delegate](const driver::Advertisement &adv) { delegate.on_advertisement(adv); },
        e);

    // every exit of a synchronous scan returns to Idle
    end_session(!pool_.on_pool_thread());

    if (!ok)
    {
        const bluest::Error f = scan_failure(e);
        LOG_ERROR("[DISCOVERY] discover failed: %s", f.message.c_str());
        return bluest::set_error(err, f);
    }
    return true;
}

bool DiscoveryManager::start_discovery(bool show_warnings, int timeout_s, bluest::Error *err)
{
    // failures of the background scan itself come back from stop_discovery()
    std::lock_guard<std::mutex> lk(scan_mu_);
    reap_worker_locked();
    bool expected = false;
    if (!scanning_.compare_exchange_strong(expected, true))
    {
        LOG_DEBUG("[DISCOVERY] start_discovery: already scanning");
        return bluest::set_error(err, bluest::Errc::already_exists, "a scan is already running");
    }

    const int timeout = effective_timeout(timeout_s);
    LOG_SYSTEM("[DISCOVERY] discovery started (async, %ds)", timeout);
    notify_discovery_change(true);

    auto delegate = std::make_shared<DiscoveryDelegate>(*this, show_warnings);
    worker_       = std::make_unique<ScanWorker>(
        drv_, [delegate](const driver::Advertisement &adv) { delegate->on_advertisement(adv); },
        timeout, opts_.scan_slice,
        // worker thread: must not wait for the pool or take scan_mu_
        [this] { end_session(false); });
    worker_->start();
    return true;
}

bool DiscoveryManager::stop_discovery(bluest::Error *err)
{
    std::unique_ptr<ScanWorker> worker;
    bluest::Error               e;
    {
        std::lock_guard<std::mutex> lk(scan_mu_);
        if (!scanning_.load())
        {
            reap_worker_locked();
            return false;
        }
        if (!worker_)
        {
            LOG_INFO("[DISCOVERY] stop_discovery: a synchronous discover cannot be stopped");
            return false;
        }
        worker = std::move(worker_);
        worker->stop();
        e = worker->join();
    }
    // no advertisement reaches the delegate after join(); scan_mu_ is released
    // before draining so listeners may call back into the manager
    end_session(!pool_.on_pool_thread());
    if (e)
    {
        const bluest::Error f = scan_failure(e);
        LOG_ERROR("[DISCOVERY] scan failed: %s", f.message.c_str());
        return bluest::set_error(err, f);
    }
    return true;
}

bool DiscoveryManager::reset_discovery(bluest::Error *err)
{
    // a false stop without error means the timeout already closed the session
    bluest::Error e;
    if (is_discovering())
        stop_discovery(&e);
    remove_nodes();
    if (e)
        return bluest::set_error(err, e);
    return true;
}

bool DiscoveryManager::add_node(const std::shared_ptr<Node> &node)
{
    if (!node)
        return false;
    {
        std::lock_guard<std::mutex> lk(nodes_mu_);
        for (const auto &n : nodes_)
        {
            if (n->tag() == node->tag())
                return false;
        }
        nodes_.push_back(node);
    }
    notify_new_node(node);
    return true;
}

std::vector<std::shared_ptr<Node>> DiscoveryManager::get_nodes() const
{
    std::lock_guard<std::mutex> lk(nodes_mu_);
    return nodes_;
}

std::shared_ptr<Node> DiscoveryManager::get_node_with_tag(const std::string &tag) const
{
    std::lock_guard<std::mutex> lk(nodes_mu_);
    for (const auto &n : nodes_)
    {
        if (n->tag() == tag)
            return n;
    }
    return nullptr;
}

std::shared_ptr<Node> DiscoveryManager::get_node_with_name(const std::string &name) const
{
    std::lock_guard<std::mutex> lk(nodes_mu_);
    for (const auto &n : nodes_)
    {
        if (n->name() == name)
            return n;
    }
    return nullptr;
}

void DiscoveryManager::remove_nodes()
{
    std::lock_guard<std::mutex> lk(nodes_mu_);
    nodes_.erase(std::remove_if(nodes_.begin(), nodes_.end(),
                                [](const std::shared_ptr<Node> &n) { return !n->is_connected(); }),
                 nodes_.end());
}

void DiscoveryManager::add_listener(const std::shared_ptr<DiscoveryListener> &l)
{
    if (!l)
        return;
    std::lock_guard<std::mutex> lk(listeners_mu_);
    if (std::find(listeners_.begin(), listeners_.end(), l) == listeners_.end())
        listeners_.push_back(l);
}

void DiscoveryManager::remove_listener(const std::shared_ptr<DiscoveryListener> &l)
{
    std::lock_guard<std::mutex> lk(listeners_mu_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), l), listeners_.end());
}

std::size_t DiscoveryManager::listener_count() const
{
    std::lock_guard<std::mutex> lk(listeners_mu_);
    return listeners_.size();
}

std::vector<std::shared_ptr<DiscoveryListener>> DiscoveryManager::listeners_snapshot() const
{
    std::lock_guard<std::mutex> lk(listeners_mu_);
    return listeners_;
}

void DiscoveryManager::notify_discovery_change(bool enabled)
{
    for (const auto &l : listeners_snapshot())
    {
        if (!pool_.submit([this, l, enabled] { l->on_discovery_change(*this, enabled); }))
            LOG_WARN("[DISCOVERY] listener pool is shut down, dropped discovery change");
    }
}

void DiscoveryManager::notify_new_node(const std::shared_ptr<Node> &node)
{
    for (const auto &l : listeners_snapshot())
    {
        if (!pool_.submit([this, l, node] { l->on_node_discovered(*this, node); }))
            LOG_WARN("[DISCOVERY] listener pool is shut down, dropped node %s",
                     node->tag().c_str());
    }
}

bool DiscoveryManager::add_features_to_node(std::uint8_t                  device_id,
                                            const feature::MaskToFeature &mask_to_feature,
                                            bluest::Error                *err)
{
    // take every single-bit key; anything left over has zero or several bits set
    feature::MaskToFeature staged;
    for (int i = 0; i < 32; ++i)
    {
        const std::uint32_t mask = 1u << i;
        auto                it   = mask_to_feature.find(mask);
        if (it != mask_to_feature.end())
            staged.emplace(mask, it->second);
    }
    if (staged.size() != mask_to_feature.size())
    {
        for (const auto &kv : mask_to_feature)
        {
            if (staged.count(kv.first))
                continue;
            char hex[9];
            std::snprintf(hex, sizeof(hex), "%08x", kv.first);
            return bluest::set_error(err, bluest::Errc::invalid_mask,
                                     std::string("feature mask 0x") + hex +
                                         " must have exactly one bit set");
        }
    }

    std::lock_guard<std::mutex> lk(features_mu_);
    auto                       &table = features_[device_id];
    for (const auto &kv : staged)
        table[kv.first] = kv.second;
    return true;
}

feature::MaskToFeature DiscoveryManager::get_node_features(std::uint8_t device_id) const
{
    std::lock_guard<std::mutex> lk(features_mu_);
    auto                        it = features_.find(device_id);
    if (it != features_.end())
        return it->second;
    return feature::default_mask_to_feature();
}

}  // namespace discovery
