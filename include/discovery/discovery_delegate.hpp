#pragma once
#include <atomic>
#include <cstddef>

#include "driver/iscan_driver.hpp"

namespace discovery
{

class DiscoveryManager;

// Turns advertisement reports into node list updates: a known tag refreshes
// the node in place, an unknown one becomes a new Node handed to add_node().
class DiscoveryDelegate
{
  public:
    DiscoveryDelegate(DiscoveryManager &manager, bool show_warnings)
        : manager_(manager), show_warnings_(show_warnings)
    {
    }

    void on_advertisement(const driver::Advertisement &adv);

    std::size_t malformed() const { return malformed_.load(); }

  private:
    DiscoveryManager        &manager_;
    const bool               show_warnings_;
    std::atomic<std::size_t> malformed_{0};
};

}  // namespace discovery
