#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "discovery/listeners.hpp"
#include "discovery/node.hpp"
#include "discovery/scan_worker.hpp"
#include "driver/iscan_driver.hpp"
#include "proto/features.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"
#include "util/worker_pool.hpp"

/*
Scan session:

  Idle --discover/start_discovery--> Scanning --stop_discovery / timeout--> Idle

discover()         blocks the caller for the whole scan
start_discovery()  ScanWorker thread: start_async, process(slice)..., stop_async
stop_discovery()   stop + join the worker, drain node events, then discovery-stop

Events (discovery start/stop, new node) go to every listener as separate tasks on
the listener pool, never with one of the manager's locks held.
*/

namespace discovery
{

struct Options
{
    int                       default_timeout_s = constants::SCAN_TIMEOUT_DEFAULT_S;  // for timeout 0
    std::chrono::milliseconds scan_slice        = constants::SCAN_SLICE;
    std::size_t               listener_threads  = constants::LISTENER_THREADS;

    static Options from_config(const bluest::Config &cfg);
};

class DiscoveryManager
{
  public:
    // Only one manager may be alive; a second create() fails with already_exists.
    static std::shared_ptr<DiscoveryManager> create(std::shared_ptr<driver::IScanDriver> drv,
                                                    Options        opts = Options{},
                                                    bluest::Error *err  = nullptr);
    // the live manager, nullptr if there is none
    static std::shared_ptr<DiscoveryManager> instance();

    ~DiscoveryManager();

    DiscoveryManager(const DiscoveryManager &)            = delete;
    DiscoveryManager &operator=(const DiscoveryManager &) = delete;

    // ---- scanning ----
    bool discover(bool show_warnings = false, int timeout_s = 0, bluest::Error *err = nullptr);
    bool start_discovery(bool show_warnings = false, int timeout_s = 0, bluest::Error *err = nullptr);
    bool stop_discovery(bluest::Error *err = nullptr);
    bool is_discovering() const { return scanning_.load(); }
    bool reset_discovery(bluest::Error *err = nullptr);

    // ---- nodes ----
    bool                               add_node(const std::shared_ptr<Node> &node);
    std::vector<std::shared_ptr<Node>> get_nodes() const;
    std::shared_ptr<Node>              get_node_with_tag(const std::string &tag) const;
    std::shared_ptr<Node>              get_node_with_name(const std::string &name) const;
    void                               remove_nodes();

    // ---- listeners ----
    void        add_listener(const std::shared_ptr<DiscoveryListener> &l);
    void        remove_listener(const std::shared_ptr<DiscoveryListener> &l);
    std::size_t listener_count() const;

    // ---- feature maps ----
    bool add_features_to_node(std::uint8_t                  device_id,
                              const feature::MaskToFeature &mask_to_feature,
                              bluest::Error                *err = nullptr);
    feature::MaskToFeature get_node_features(std::uint8_t device_id) const;

    const std::shared_ptr<driver::IScanDriver> &driver() const { return drv_; }
    const Options                              &options() const { return opts_; }

  private:
    DiscoveryManager(std::shared_ptr<driver::IScanDriver> drv, Options opts);

    int           effective_timeout(int timeout_s) const;
    bluest::Error scan_failure(const bluest::Error &e) const;
    void          reap_worker_locked();
    void          end_session(bool drain);
    void          notify_discovery_change(bool enabled);
    void          notify_new_node(const std::shared_ptr<Node> &node);
    std::vector<std::shared_ptr<DiscoveryListener>> listeners_snapshot() const;

    std::shared_ptr<driver::IScanDriver> drv_;
    const Options                        opts_;
    std::atomic_bool                     scanning_{false};

    // start/stop/reset of scan sessions, owns the active worker
    std::mutex                  scan_mu_;
    std::unique_ptr<ScanWorker> worker_;

    mutable std::mutex                 nodes_mu_;
    std::vector<std::shared_ptr<Node>> nodes_;

    mutable std::mutex                              listeners_mu_;
    std::vector<std::shared_ptr<DiscoveryListener>> listeners_;

    mutable std::mutex                             features_mu_;
    std::map<std::uint8_t, feature::MaskToFeature> features_;

    bluest::WorkerPool pool_;
};

}  // namespace discovery
