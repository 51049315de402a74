#include "driver/simulated_scan_driver.hpp"

#include <cctype>
#include <thread>

#include "util/log.hpp"

namespace driver
{

namespace
{
std::string upper(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}
}  // namespace

bool SimulatedScanDriver::take_failure(Op op, bluest::Error &err)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = failures_.find(op);
    if (it == failures_.end())
        return false;
    err = it->second;
    failures_.erase(it);
    return true;
}

void SimulatedScanDriver::deliver_slice(const OnAdvertisement &cb, std::size_t slice)
{
    std::vector<Advertisement> batch;
    Generator                  gen;
    {
        std::lock_guard<std::mutex> lk(mu_);
        batch.swap(queued_);
        gen = generator_;
    }
    if (gen)
    {
        auto more = gen(slice);
        batch.insert(batch.end(), more.begin(), more.end());
    }
    if (!cb)
        return;
    for (const auto &a : batch)
        cb(a);
}

bool SimulatedScanDriver::scan(int timeout_s, const OnAdvertisement &cb, bluest::Error &err)
{
    ++scan_calls_;
    if (take_failure(Op::Scan, err))
        return false;

    deliver_slice(cb, 0);
    const auto ms = static_cast<long long>(timeout_s) * ms_per_second_.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    return true;
}

bool SimulatedScanDriver::start_async(OnAdvertisement cb, bluest::Error &err)
{
    ++start_calls_;
    if (take_failure(Op::Start, err))
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    sink_     = std::move(cb);
    async_on_ = true;
    slice_no_ = 0;
    return true;
}

bool SimulatedScanDriver::process(std::chrono::milliseconds slice, bluest::Error &err)
{
    ++process_calls_;
    if (take_failure(Op::Process, err))
        return false;

    OnAdvertisement                    sink;
    std::size_t                        n = 0;
    std::vector<std::pair<Key, Bytes>> values;
    std::vector<OnNotify>              targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (async_on_)
        {
            sink = sink_;
            n    = slice_no_++;
        }
        values.swap(pending_notify_);
        for (const auto &v : values)
        {
            auto it = notify_.find(v.first);
            targets.push_back(it == notify_.end() ? OnNotify{} : it->second);
        }
    }
    if (sink)
        deliver_slice(sink, n);
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (targets[i])
            targets[i](values[i].second);
    }

    std::this_thread::sleep_for(slice);
    return true;
}

bool SimulatedScanDriver::stop_async(bluest::Error &err)
{
    ++stop_calls_;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sink_     = nullptr;
        async_on_ = false;
    }
    return !take_failure(Op::Stop, err);
}

bool SimulatedScanDriver::connect(const std::string &addr, OnLinkLost on_lost, bluest::Error &err)
{
    ++connect_calls_;
    if (take_failure(Op::Connect, err))
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    links_[upper(addr)] = std::move(on_lost);
    return true;
}

bool SimulatedScanDriver::disconnect(const std::string &addr, bluest::Error &err)
{
    if (take_failure(Op::Disconnect, err))
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    const std::string           a = upper(addr);
    links_.erase(a);
    for (auto it = notify_.begin(); it != notify_.end();)
    {
        if (it->first.first == a)
            it = notify_.erase(it);
        else
            ++it;
    }
    return true;
}

bool SimulatedScanDriver::list_characteristics(const std::string        &addr,
                                               std::vector<std::string> &uuids,
                                               bluest::Error            &err)
{
    if (take_failure(Op::List, err))
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    const std::string           a = upper(addr);
    if (links_.find(a) == links_.end())
    {
        err = bluest::make_error(bluest::Errc::not_connected, "not connected to " + a);
        return false;
    }
    uuids.clear();
    auto it = chars_.find(a);
    if (it != chars_.end())
        uuids.assign(it->second.begin(), it->second.end());
    return true;
}

bool SimulatedScanDriver::start_notify(const std::string &addr,
                                       const std::string &char_uuid,
                                       OnNotify           cb,
                                       bluest::Error     &err)
{
    if (take_failure(Op::Notify, err))
        return false;
    std::lock_guard<std::mutex> lk(mu_);
    const std::string           a = upper(addr);
    const std::string           u = lower(char_uuid);
    if (links_.find(a) == links_.end())
    {
        err = bluest::make_error(bluest::Errc::not_connected, "not connected to " + a);
        return false;
    }
    auto it = chars_.find(a);
    if (it == chars_.end() || it->second.count(u) == 0)
    {
        err = bluest::make_error(bluest::Errc::not_found, "no characteristic " + u + " on " + a);
        return false;
    }
    notify_[Key{a, u}] = std::move(cb);
    return true;
}

bool SimulatedScanDriver::stop_notify(const std::string &addr,
                                      const std::string &char_uuid,
                                      bluest::Error     &err)
{
    (void)err;
    std::lock_guard<std::mutex> lk(mu_);
    notify_.erase(Key{upper(addr), lower(char_uuid)});
    return true;
}

void SimulatedScanDriver::queue_advertisement(Advertisement a)
{
    std::lock_guard<std::mutex> lk(mu_);
    queued_.push_back(std::move(a));
}

void SimulatedScanDriver::set_generator(Generator g)
{
    std::lock_guard<std::mutex> lk(mu_);
    generator_ = std::move(g);
}

void SimulatedScanDriver::fail_next(Op op, bluest::Error e)
{
    std::lock_guard<std::mutex> lk(mu_);
    failures_[op] = std::move(e);
}

void SimulatedScanDriver::add_characteristic(const std::string &addr, const std::string &uuid)
{
    std::lock_guard<std::mutex> lk(mu_);
    chars_[upper(addr)].insert(lower(uuid));
}

void SimulatedScanDriver::queue_notification(const std::string &addr,
                                             const std::string &uuid,
                                             Bytes              value)
{
    std::lock_guard<std::mutex> lk(mu_);
    pending_notify_.emplace_back(Key{upper(addr), lower(uuid)}, std::move(value));
}

bool SimulatedScanDriver::drop_link(const std::string &addr)
{
    OnLinkLost cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = links_.find(upper(addr));
        if (it == links_.end())
            return false;
        cb = std::move(it->second);
        links_.erase(it);
    }
    LOG_DEBUG("[SIM] link to %s dropped", addr.c_str());
    if (cb)
        cb();
    return true;
}

bool SimulatedScanDriver::async_active() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return async_on_;
}

bool SimulatedScanDriver::is_connected(const std::string &addr) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return links_.count(upper(addr)) != 0;
}

bool SimulatedScanDriver::is_notifying(const std::string &addr, const std::string &uuid) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return notify_.count(Key{upper(addr), lower(uuid)}) != 0;
}

}  // namespace driver
