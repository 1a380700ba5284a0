#pragma once
/**
 * @file event.h
 * @brief Typed listener lists and scoped subscription handles
 *
 * Event<Args...> is a single-threaded notification point. Listeners are
 * identified by the ListenerId returned from add_listener() and may be
 * removed at any time, including from inside a listener while the event is
 * being raised. ScopedListener owns one subscription and releases it exactly
 * once, even if the event itself has already been destroyed.
 *
 * Usage:
 * @code
 * Event<> changed;
 * ScopedListener listener(changed, [] { ... });
 * changed.raise();
 * listener.release(); // or let it go out of scope
 * @endcode
 */

#include "geoclamp/core/types.h"
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace geoclamp::events {

/**
 * @brief Listener identifier
 */
using ListenerId = UInt64;

/**
 * @brief Invalid listener ID constant
 */
constexpr ListenerId INVALID_LISTENER_ID = 0;

namespace detail {

/**
 * @brief Type-erased removal interface shared with ScopedListener
 */
class ListenerRegistry {
public:
    virtual ~ListenerRegistry() = default;
    virtual bool remove_listener(ListenerId id) = 0;
};

} // namespace detail

// ============================================================================
// Event
// ============================================================================

template<typename... Args>
class Event {
public:
    using Listener = std::function<void(Args...)>;

    Event() : state_(std::make_shared<State>()) {}
    ~Event() = default;

    // Non-copyable
    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    // Movable
    Event(Event&&) noexcept = default;
    Event& operator=(Event&&) noexcept = default;

    /**
     * @brief Register a listener
     *
     * Listeners added while the event is being raised are first called on
     * the next raise.
     *
     * @return Listener ID, or INVALID_LISTENER_ID for an empty function
     */
    ListenerId add_listener(Listener listener) {
        if (!listener) {
            return INVALID_LISTENER_ID;
        }
        ListenerId id = state_->next_id++;
        state_->entries.push_back(Entry{id, std::move(listener), false});
        return id;
    }

    /**
     * @brief Remove a listener
     * @return true if the listener was registered
     */
    bool remove_listener(ListenerId id) {
        return state_->remove_listener(id);
    }

    /**
     * @brief Check whether a listener is registered
     */
    bool contains(ListenerId id) const {
        for (const auto& entry : state_->entries) {
            if (entry.id == id && !entry.removed) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Number of registered listeners
     */
    SizeT listener_count() const {
        SizeT count = 0;
        for (const auto& entry : state_->entries) {
            if (!entry.removed) {
                ++count;
            }
        }
        return count;
    }

    /**
     * @brief Call every registered listener in registration order
     */
    void raise(Args... args) {
        // Keep the listener storage alive if a listener destroys the event
        std::shared_ptr<State> state = state_;

        const SizeT count = state->entries.size();
        ++state->raise_depth;
        for (SizeT i = 0; i < count; ++i) {
            if (state->entries[i].removed) {
                continue;
            }
            // Copy so the listener may remove itself safely
            Listener listener = state->entries[i].listener;
            listener(args...);
        }
        --state->raise_depth;

        if (state->raise_depth == 0 && state->needs_compaction) {
            state->compact();
        }
    }

private:
    friend class ScopedListener;

    struct Entry {
        ListenerId id{INVALID_LISTENER_ID};
        Listener listener;
        bool removed{false};
    };

    struct State : detail::ListenerRegistry {
        std::vector<Entry> entries;
        ListenerId next_id{1};
        int raise_depth{0};
        bool needs_compaction{false};

        bool remove_listener(ListenerId id) override {
            for (auto& entry : entries) {
                if (entry.id == id && !entry.removed) {
                    entry.removed = true;
                    needs_compaction = true;
                    if (raise_depth == 0) {
                        compact();
                    }
                    return true;
                }
            }
            return false;
        }

        void compact() {
            std::vector<Entry> kept;
            kept.reserve(entries.size());
            for (auto& entry : entries) {
                if (!entry.removed) {
                    kept.push_back(std::move(entry));
                }
            }
            entries = std::move(kept);
            needs_compaction = false;
        }
    };

    std::shared_ptr<State> state_;
};

// ============================================================================
// Scoped Listener
// ============================================================================

/**
 * @brief Owns one event subscription
 *
 * Move-only. release() is idempotent; the destructor releases.
 */
class ScopedListener {
public:
    ScopedListener() = default;

    template<typename... Args, typename F>
    ScopedListener(Event<Args...>& event, F&& listener)
        : registry_(event.state_)
        , id_(event.add_listener(std::forward<F>(listener))) {}

    ~ScopedListener() { release(); }

    ScopedListener(const ScopedListener&) = delete;
    ScopedListener& operator=(const ScopedListener&) = delete;

    ScopedListener(ScopedListener&& other) noexcept
        : registry_(std::move(other.registry_))
        , id_(std::exchange(other.id_, INVALID_LISTENER_ID)) {}

    ScopedListener& operator=(ScopedListener&& other) noexcept {
        if (this != &other) {
            release();
            registry_ = std::move(other.registry_);
            id_ = std::exchange(other.id_, INVALID_LISTENER_ID);
        }
        return *this;
    }

    /**
     * @brief Remove the listener if still registered
     * @return true if a registration was removed by this call
     */
    bool release() {
        if (id_ == INVALID_LISTENER_ID) {
            return false;
        }
        ListenerId id = std::exchange(id_, INVALID_LISTENER_ID);
        auto registry = registry_.lock();
        registry_.reset();
        return registry && registry->remove_listener(id);
    }

    bool active() const {
        return id_ != INVALID_LISTENER_ID && !registry_.expired();
    }

    ListenerId id() const { return id_; }

private:
    std::weak_ptr<detail::ListenerRegistry> registry_;
    ListenerId id_{INVALID_LISTENER_ID};
};

} // namespace geoclamp::events
