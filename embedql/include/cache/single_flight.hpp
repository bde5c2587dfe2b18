//! # Single Flight
//!
//! Coalesces concurrent computations of the same key. The first caller for
//! a key becomes the leader and runs the computation outside the lock;
//! callers that arrive while it runs block on a shared future and receive
//! the leader's value, or rethrow the exception it threw. The leader
//! releases the slot before publishing, so a caller that sees the result
//! and calls again starts a fresh flight instead of rejoining a landed one.
//!
//! ```text
//! caller A ──run(k)──► leader ──compute()──► erase slot ──► publish
//! caller B ──run(k)──► join ──────────── wait ──────────────┘
//! caller C ──run(j)──► leader (independent key, never waits on k)
//! ```
//!
//! Nothing is retained after a flight lands; committing results is the
//! owner's job, done inside `compute` so that it happens before the slot is
//! released.

#ifndef EMBEDQL_CACHE_SINGLE_FLIGHT_HPP
#define EMBEDQL_CACHE_SINGLE_FLIGHT_HPP

#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace embedql::cache {

template <typename Key, typename Value, typename Hash = std::hash<Key>,
          typename Equal = std::equal_to<Key>>
class SingleFlight {
public:
    /// Outcome of `run`: the value, and whether this caller computed it.
    struct Landing {
        Value value;
        bool leader = false;
    };

    /// Runs `compute` for `key`, or waits for the run already in flight.
    template <typename F> auto run(const Key& key, F&& compute) -> Landing {
        std::promise<Value> promise;
        std::shared_future<Value> future;
        bool leader = false;

        {
            std::lock_guard lock(mutex_);
            auto it = flights_.find(key);
            if (it != flights_.end()) {
                future = it->second;
            } else {
                future = promise.get_future().share();
                flights_.emplace(key, future);
                leader = true;
            }
        }

        if (!leader) {
            return Landing{future.get(), false};
        }

        std::optional<Value> value;
        try {
            value.emplace(std::forward<F>(compute)());
        } catch (...) {
            release(key);
            promise.set_exception(std::current_exception());
            throw;
        }
        release(key);
        promise.set_value(*value);
        return Landing{std::move(*value), true};
    }

    /// Number of keys with a computation currently running.
    [[nodiscard]] auto in_flight() const -> size_t {
        std::lock_guard lock(mutex_);
        return flights_.size();
    }

private:
    void release(const Key& key) {
        std::lock_guard lock(mutex_);
        flights_.erase(key);
    }

    mutable std::mutex mutex_;
    std::unordered_map<Key, std::shared_future<Value>, Hash, Equal> flights_;
};

} // namespace embedql::cache

#endif // EMBEDQL_CACHE_SINGLE_FLIGHT_HPP
