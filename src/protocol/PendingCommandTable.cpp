#include "protocol/PendingCommandTable.hpp"
#include "protocol/exceptions/CommandInFlightError.h"
#include "protocol/exceptions/ConnectionLostError.h"
#include "protocol/exceptions/TimeoutError.h"

#include "spdlog/spdlog.h"

#include <utility>
#include <vector>

namespace renkei::protocol {

PendingCommandTable::~PendingCommandTable() {
    abandonAll("command table destroyed");
}

std::future<PendingCommandTable::Data> PendingCommandTable::registerCommand(const std::string& name,
                                                                            Clock::duration timeout,
                                                                            uint64_t* sequence) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (pending_.count(name)) {
        throw CommandInFlightError(name);
    }
    Entry entry;
    entry.deadline = Clock::now() + timeout;
    entry.timeout = timeout;
    entry.sequence = nextSequence_++;
    if (sequence) *sequence = entry.sequence;
    auto fut = entry.promise.get_future();
    pending_.emplace(name, std::move(entry));
    return fut;
}

bool PendingCommandTable::resolve(const std::string& name, const Data& data) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = pending_.find(name);
        if (it == pending_.end()) {
            spdlog::warn("No pending command for response {}; discarding", name);
            return false;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }
    try {
        entry.promise.set_value(data);
    } catch (const std::future_error& fe) {
        spdlog::error("[PendingCommandTable] set_value for {} failed: {}", name, fe.what());
        return false;
    }
    spdlog::debug("Response correlated for {}", name);
    return true;
}

bool PendingCommandTable::fail(const std::string& name, std::exception_ptr error) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = pending_.find(name);
        if (it == pending_.end()) return false;
        entry = std::move(it->second);
        pending_.erase(it);
    }
    complete(name, entry, std::move(error));
    return true;
}

bool PendingCommandTable::fail(const std::string& name, uint64_t sequence, std::exception_ptr error) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = pending_.find(name);
        if (it == pending_.end() || it->second.sequence != sequence) return false;
        entry = std::move(it->second);
        pending_.erase(it);
    }
    complete(name, entry, std::move(error));
    return true;
}

bool PendingCommandTable::failOldest(std::exception_ptr error, std::string* failedName) {
    std::string name;
    Entry entry;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (pending_.empty()) return false;
        auto oldest = pending_.begin();
        for (auto it = pending_.begin(); it != pending_.end(); ++it) {
            if (it->second.sequence < oldest->second.sequence) oldest = it;
        }
        name = oldest->first;
        entry = std::move(oldest->second);
        pending_.erase(oldest);
    }
    if (failedName) *failedName = name;
    complete(name, entry, std::move(error));
    return true;
}

std::size_t PendingCommandTable::timeoutSweep(Clock::time_point now) {
    std::vector<std::pair<std::string, Entry>> expired;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& kv : expired) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(kv.second.timeout).count();
        spdlog::error("Timeout waiting for response to {} ({} ms)", kv.first, ms);
        complete(kv.first, kv.second,
                 std::make_exception_ptr(TimeoutError(
                     "no response to " + kv.first + " within " + std::to_string(ms) + " ms")));
    }
    return expired.size();
}

std::size_t PendingCommandTable::abandonAll(const std::string& reason) {
    std::unordered_map<std::string, Entry> moved;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        moved.swap(pending_);
    }
    for (auto& kv : moved) {
        complete(kv.first, kv.second, std::make_exception_ptr(ConnectionLostError(reason)));
    }
    if (!moved.empty()) {
        spdlog::debug("Abandoned {} pending command(s): {}", moved.size(), reason);
    }
    return moved.size();
}

std::size_t PendingCommandTable::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_.size();
}

bool PendingCommandTable::isPending(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_.count(name) != 0;
}

void PendingCommandTable::complete(const std::string& name, Entry& entry, std::exception_ptr error) {
    try {
        entry.promise.set_exception(std::move(error));
    } catch (const std::future_error& fe) {
        spdlog::error("[PendingCommandTable] set_exception for {} failed: {}", name, fe.what());
    }
}

} // namespace renkei::protocol
