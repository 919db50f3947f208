#pragma once
/**
 * PendingCommandTable.hpp
 *
 * In-flight commands awaiting a response, keyed by command name.
 *
 * - The device protocol has no request ids; responses are correlated by name only.
 *   registerCommand() therefore refuses a second waiter for a name that is still
 *   pending (CommandInFlightError). Distinct names may be outstanding concurrently.
 * - Each entry carries its own deadline. timeoutSweep(now) fails expired entries with
 *   TimeoutError; it is driven from the read path, the supervisor tick and the waiting
 *   caller itself.
 * - Every entry is resolved at most once: resolve / fail / timeoutSweep / abandonAll
 *   remove it from the table before completing the promise, so a late frame finds
 *   nothing to resolve.
 *
 * 사용:
 *   auto fut = table.registerCommand("GET_STATUS", 10s);
 *   // ... write frame
 *   auto data = fut.get();
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace renkei::protocol {

class PendingCommandTable {
public:
    using Clock = std::chrono::steady_clock;
    using Data = nlohmann::json;

    PendingCommandTable() = default;
    ~PendingCommandTable();

    PendingCommandTable(const PendingCommandTable&) = delete;
    PendingCommandTable& operator=(const PendingCommandTable&) = delete;

    // register a waiter for `name`; throws CommandInFlightError if one already exists.
    // The entry's sequence number is written to `sequence` if given.
    std::future<Data> registerCommand(const std::string& name, Clock::duration timeout,
                                      uint64_t* sequence = nullptr);

    // fulfil the waiter for `name`. Returns false (stray response) if there is none.
    bool resolve(const std::string& name, const Data& data);

    // fail the waiter for `name` with `error`. Returns false if there is none.
    bool fail(const std::string& name, std::exception_ptr error);

    // as above, but only if the waiter for `name` is still the one registered as `sequence`
    bool fail(const std::string& name, uint64_t sequence, std::exception_ptr error);

    // fail the earliest-registered waiter; its name is written to `failedName` if given
    bool failOldest(std::exception_ptr error, std::string* failedName = nullptr);

    // fail every waiter whose deadline is <= now with TimeoutError; returns the count
    std::size_t timeoutSweep(Clock::time_point now);

    // fail every waiter with ConnectionLostError(reason); returns the count
    std::size_t abandonAll(const std::string& reason);

    std::size_t size() const;
    bool isPending(const std::string& name) const;

private:
    struct Entry {
        std::promise<Data> promise;
        Clock::time_point deadline;
        Clock::duration timeout;
        uint64_t sequence{0};
    };

    static void complete(const std::string& name, Entry& entry, std::exception_ptr error);

    std::unordered_map<std::string, Entry> pending_;
    mutable std::mutex mtx_;
    uint64_t nextSequence_{0};
};

} // namespace renkei::protocol
