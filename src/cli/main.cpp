#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "discovery/discovery_manager.hpp"
#include "discovery/listeners.hpp"
#include "discovery/node.hpp"
#include "driver/bluez_scan_driver.hpp"
#include "driver/simulated_scan_driver.hpp"
#include "proto/advertising.hpp"
#include "proto/features.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

static std::string to_upper_mac(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  bluest-scan [--timeout N] [--warnings] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  scan                          synchronous discovery, list nodes\n"
                         "  watch                         asynchronous discovery, print events\n"
                         "  features AA:BB:CC:DD:EE:FF    connect and list exported features\n"
                         "  notify AA:BB:CC:DD:EE:FF <feature> [count]\n"
                         "                                print raw notifications of a feature\n"
                         "\n"
                         "Environment:\n"
                         "  BLUEST_DRIVER=bluez|sim  BLUEST_ADAPTER=hci0  BLUEST_SCAN_TIMEOUT=10\n"
                         "  BLUEST_LISTENER_THREADS=5  BLUEST_LOG_LEVEL=info\n");
}

static int exit_code_for(const bluest::Error &e)
{
    switch (e.code)
    {
        case bluest::Errc::permission_denied:
            return exitc::no_perm;
        case bluest::Errc::not_found:
            return exitc::no_device;
        default:
            return exitc::driver_fail;
    }
}

static int report(const char *what, const bluest::Error &e)
{
    std::fprintf(stderr, "error: %s: %s\n", what, bluest::to_string(e).c_str());
    return exit_code_for(e);
}

// --------------------------------------------------------------------
// Simulated radio: two BlueST boards and one foreign advertiser
// --------------------------------------------------------------------
static std::shared_ptr<driver::IScanDriver> make_sim_driver()
{
    auto sim = std::make_shared<driver::SimulatedScanDriver>();
    sim->set_ms_per_second(100);

    const std::uint32_t tile_mask = 0x00E00000u | 0x00040000u;  // acc, gyro, mag, temp
    const std::vector<driver::Advertisement> canned = {
        {"C0:FF:EE:00:00:01", "STile01", -52, true,
         {0x01, 0x02, std::uint8_t(tile_mask >> 24), std::uint8_t(tile_mask >> 16),
          std::uint8_t(tile_mask >> 8), std::uint8_t(tile_mask)}},
        {"C0:FF:EE:00:00:02", "Nucleo7", -70, true, {0x01, 0x80, 0x00, 0x1C, 0x00, 0x00}},
        {"C0:FF:EE:00:00:03", "Beacon", -81, false, {0x4C, 0x00, 0x02, 0x15, 0x01}},
    };
    sim->set_generator([canned](std::size_t) { return canned; });

    for (std::uint32_t bit : {0x00800000u, 0x00400000u, 0x00200000u, 0x00040000u})
    {
        const std::string uuid = feature::characteristic_uuid(bit);
        sim->add_characteristic("C0:FF:EE:00:00:01", uuid);
        for (std::uint16_t ts = 1; ts <= 10; ++ts)
            sim->queue_notification("C0:FF:EE:00:00:01", uuid,
                                    {std::uint8_t(ts & 0xFF), std::uint8_t(ts >> 8), 0x10, 0x20});
    }
    return sim;
}

static std::shared_ptr<driver::IScanDriver> make_driver(const bluest::Config &cfg)
{
    if (cfg.driver == "sim")
        return make_sim_driver();
    driver::BluezConfig bc;
    bc.adapter = cfg.adapter;
    return std::make_shared<driver::BluezScanDriver>(bc);
}

// --------------------------------------------------------------------
// listeners
// --------------------------------------------------------------------
class PrintingDiscoveryListener final : public discovery::DiscoveryListener
{
  public:
    void on_discovery_change(discovery::DiscoveryManager &, bool enabled) override
    {
        std::printf("discovery %s\n", enabled ? "started" : "stopped");
        std::fflush(stdout);
    }

    void on_node_discovered(discovery::DiscoveryManager &, std::shared_ptr<discovery::Node> node) override
    {
        std::printf("new node: %s '%s' rssi=%d\n", node->tag().c_str(), node->name().c_str(),
                    (int)node->rssi());
        std::fflush(stdout);
    }
};

class PrintingFeatureListener final : public discovery::FeatureListener
{
  public:
    std::size_t received = 0;

    void on_update(discovery::Node &node, const feature::Feature &f, const discovery::Sample &s) override
    {
        ++received;
        std::printf("%s %s ts=%u raw=", node.tag().c_str(), f.name(), (unsigned)s.timestamp);
        for (auto b : s.raw)
            std::printf("%02x", b);
        std::printf("\n");
        std::fflush(stdout);
    }
};

static void print_nodes(const discovery::DiscoveryManager &mgr)
{
    const auto nodes = mgr.get_nodes();
    std::printf("%zu node(s)\n", nodes.size());
    for (const auto &n : nodes)
    {
        const auto d = n->advertising_data();
        std::printf("%s  %-16s rssi=%-4d type=%-16s mask=0x%08x  %s\n", n->tag().c_str(),
                    n->name().c_str(), (int)n->rssi(), advert::node_type_name(d.type),
                    d.feature_mask, discovery::node_status_name(n->status()));
    }
}

struct Session
{
    std::shared_ptr<discovery::DiscoveryManager> mgr;
    bool                                         warnings = false;
    int                                          timeout_s = 0;
};

// discover, then connect to addr
static int connect_node(Session &s, const std::string &addr, std::shared_ptr<discovery::Node> &out)
{
    bluest::Error err;
    if (!s.mgr->discover(s.warnings, s.timeout_s, &err))
        return report("discover", err);

    out = s.mgr->get_node_with_tag(addr);
    if (!out)
    {
        std::fprintf(stderr, "error: %s not found\n", addr.c_str());
        return exitc::no_device;
    }
    if (!out->connect(&err))
        return report("connect", err);
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args, Session &s)
{
    auto mac_arg = [&](std::string &mac) -> bool {
        if (args.size() < 2)
        {
            print_usage();
            return false;
        }
        mac = to_upper_mac(args[1]);
        if (!is_valid_mac(mac))
        {
            std::fprintf(stderr, "error: invalid MAC address: %s\n", args[1].c_str());
            return false;
        }
        return true;
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"scan",
         [&]() -> int {
             if (args.size() != 1)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             bluest::Error err;
             if (!s.mgr->discover(s.warnings, s.timeout_s, &err))
                 return report("discover", err);
             print_nodes(*s.mgr);
             return exitc::ok;
         }},
        {"watch",
         [&]() -> int {
             if (args.size() != 1)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             auto listener = std::make_shared<PrintingDiscoveryListener>();
             s.mgr->add_listener(listener);
             bluest::Error err;
             if (!s.mgr->start_discovery(s.warnings, s.timeout_s, &err))
                 return report("start_discovery", err);

             // a failed scan stays "discovering" until stopped, so bound the wait
             const int  timeout  = s.timeout_s > 0 ? s.timeout_s : s.mgr->options().default_timeout_s;
             const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout + 2);
             while (s.mgr->is_discovering() && std::chrono::steady_clock::now() < deadline)
                 std::this_thread::sleep_for(std::chrono::milliseconds(100));

             if (s.mgr->is_discovering() && !s.mgr->stop_discovery(&err) && err)
                 return report("scan", err);
             s.mgr->remove_listener(listener);
             print_nodes(*s.mgr);
             return exitc::ok;
         }},
        {"features",
         [&]() -> int {
             std::string mac;
             if (args.size() != 2 || !mac_arg(mac))
                 return exitc::bad_args;
             std::shared_ptr<discovery::Node> node;
             if (int rc = connect_node(s, mac, node); rc != exitc::ok)
                 return rc;

             bluest::Error err;
             auto          feats = node->features(&err);
             if (err)
                 return report("features", err);
             for (const auto &f : feats)
                 std::printf("%-20s mask=0x%08x  %s\n", f.name(), f.mask, f.char_uuid.c_str());
             if (!node->disconnect(&err))
                 return report("disconnect", err);
             return exitc::ok;
         }},
        {"notify",
         [&]() -> int {
             std::string mac;
             if (args.size() < 3 || args.size() > 4 || !mac_arg(mac))
                 return exitc::bad_args;
             auto kind = feature::feature_from_name(args[2]);
             if (!kind)
             {
                 std::fprintf(stderr, "error: unknown feature: %s\n", args[2].c_str());
                 return exitc::bad_args;
             }
             unsigned long count = 5;
             if (args.size() == 4 && !bluest::parse_uint_in_range(args[3].c_str(), 1, 100000, count))
             {
                 std::fprintf(stderr, "error: invalid count: %s\n", args[3].c_str());
                 return exitc::bad_args;
             }

             std::shared_ptr<discovery::Node> node;
             if (int rc = connect_node(s, mac, node); rc != exitc::ok)
                 return rc;

             bluest::Error err;
             auto          feats = node->features(&err);
             if (err)
                 return report("features", err);
             const feature::Feature *target = nullptr;
             for (const auto &f : feats)
             {
                 if (f.kind == *kind)
                 {
                     target = &f;
                     break;
                 }
             }
             if (!target)
             {
                 std::fprintf(stderr, "error: %s does not export %s\n", mac.c_str(), args[2].c_str());
                 return exitc::no_device;
             }

             auto listener = std::make_shared<PrintingFeatureListener>();
             if (!node->enable_notifications(*target, listener, &err))
                 return report("enable notifications", err);

             const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
             while (listener->received < count && std::chrono::steady_clock::now() < deadline)
             {
                 if (!node->wait_for_notifications(std::chrono::milliseconds(1000), &err))
                     return report("notifications", err);
             }
             if (!node->disable_notifications(*target, &err))
                 LOG_WARN("disable notifications: %s", bluest::to_string(err).c_str());
             if (!node->disconnect(&err))
                 return report("disconnect", err);
             return exitc::ok;
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }
    bluest::set_log_level_by_name(std::getenv("BLUEST_LOG_LEVEL"));

    Session                  s;
    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--warnings")
        {
            s.warnings = true;
        }
        else if (a == "--timeout")
        {
            unsigned long v = 0;
            if (i + 1 >= argc || !bluest::parse_uint_in_range(argv[i + 1], 1, 3600, v))
            {
                std::fprintf(stderr, "error: --timeout expects 1..3600 seconds\n");
                return exitc::bad_args;
            }
            s.timeout_s = static_cast<int>(v);
            ++i;
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const bluest::Config cfg = bluest::load_config_from_env();
    bluest::Error        err;
    s.mgr = discovery::DiscoveryManager::create(make_driver(cfg),
                                                discovery::Options::from_config(cfg), &err);
    if (!s.mgr)
        return report("create manager", err);

    const std::string &cmd = args[0];
    return run_cmd(cmd, args, s);
}
