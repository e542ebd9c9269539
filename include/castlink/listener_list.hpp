#ifndef CASTLINK_LISTENER_LIST_HPP
#define CASTLINK_LISTENER_LIST_HPP

#include <algorithm>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "castlink/cast_event.hpp"
#include "castlink/executor.hpp"
#include "castlink/log.hpp"

namespace castlink
{

// Describes how events of a type are filtered and delivered
template<typename event_type>
struct event_traits;

template<>
struct event_traits<cast_event>
{
    using listener_type = cast_event_listener;
    using kind_type = cast_event_type;

    static kind_type kind(const cast_event& event)
    {
        return event.type();
    }

    // Unknown events carry a mutable JSON node which must not be shared between listeners
    static bool has_mutable_data(const cast_event& event)
    {
        return event.type() == cast_event_type::unknown && event.unknown_payload() != nullptr;
    }

    static cast_event copy(const cast_event& event)
    {
        return event.deep_copy();
    }

    static void deliver(listener_type& listener, const cast_event& event)
    {
        listener.on_event(event);
    }
};

template<>
struct event_traits<connection_event>
{
    using listener_type = connection_listener;
    using kind_type = connection_state;

    static kind_type kind(const connection_event& event)
    {
        return event.current;
    }

    static bool has_mutable_data(const connection_event&)
    {
        return false;
    }

    static connection_event copy(const connection_event& event)
    {
        return event;
    }

    static void deliver(listener_type& listener, const connection_event& event)
    {
        listener.on_connection_event(event);
    }
};

// Thread safe list of listeners, each with an optional set of event kinds it is interested in.
// The listeners and their filters are kept in two separately locked structures: the listener vector is
// copy on write so fire() only needs the lock to grab the current snapshot.
template<typename event_type, typename traits = event_traits<event_type>>
class listener_list
{
public:

    using listener_type = typename traits::listener_type;
    using kind_type = typename traits::kind_type;
    using listener_ptr = std::shared_ptr<listener_type>;
    using snapshot_type = std::shared_ptr<const std::vector<listener_ptr>>;
    using filter_map = std::unordered_map<const listener_type*, std::set<kind_type>>;

    listener_list(const listener_list&) = delete;
    listener_list& operator=(const listener_list&) = delete;
    listener_list(listener_list&&) = delete;
    listener_list& operator=(listener_list&&) = delete;
    virtual ~listener_list() = default;

    explicit listener_list(std::string remote_name)
        : m_remote_name {std::move(remote_name)}, m_listeners {std::make_shared<const std::vector<listener_ptr>>()}
    {}

    // Registers the listener for the given kinds, or for everything if no kind is given.
    // For a listener which is already registered the kinds are merged into its filter and
    // an empty kind set removes its filter. Returns true if anything changed.
    bool add(const listener_ptr& listener, const std::set<kind_type>& kinds = {})
    {
        if(!listener)
            throw std::invalid_argument {"listener must not be null"};

        std::lock_guard<std::mutex> lock {m_filters_mutex};
        return add_locked(listener, kinds);
    }

    bool add(const listener_ptr& listener, std::initializer_list<kind_type> kinds)
    {
        return add(listener, std::set<kind_type> {kinds});
    }

    // Returns the number of listeners for which something changed
    size_t add_all(const std::vector<listener_ptr>& listeners, const std::set<kind_type>& kinds = {})
    {
        size_t result = 0;
        std::lock_guard<std::mutex> lock {m_filters_mutex};
        for(const auto& listener : listeners)
        {
            if(!listener)
                throw std::invalid_argument {"listener must not be null"};
            if(add_locked(listener, kinds))
                ++result;
        }
        return result;
    }

    bool remove(const listener_ptr& listener)
    {
        if(!listener)
            throw std::invalid_argument {"listener must not be null"};

        std::lock_guard<std::mutex> lock {m_filters_mutex};
        return remove_locked(listener);
    }

    bool remove_all(const std::vector<listener_ptr>& listeners)
    {
        bool result = false;
        std::lock_guard<std::mutex> lock {m_filters_mutex};
        for(const auto& listener : listeners)
        {
            if(listener)
                result |= remove_locked(listener);
        }
        return result;
    }

    bool contains(const listener_ptr& listener) const
    {
        if(!listener)
            return false;

        snapshot_type current = listeners();
        return std::find(current->begin(), current->end(), listener) != current->end();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock {m_filters_mutex};
        publish(std::make_shared<const std::vector<listener_ptr>>());
        m_filters.clear();
    }

    bool empty() const
    {
        return listeners()->empty();
    }

    size_t size() const
    {
        return listeners()->size();
    }

    // Point in time view of the registered listeners in registration order.
    // The returned vector never changes, later registrations are not visible in it.
    snapshot_type listeners() const
    {
        std::lock_guard<std::mutex> lock {m_listeners_mutex};
        return m_listeners;
    }

    // Delivers the event to every listener whose filter matches its kind
    virtual void fire(const event_type& event) = 0;

    const std::string& remote_name() const
    {
        return m_remote_name;
    }

protected:

    std::pair<snapshot_type, filter_map> take_snapshot() const
    {
        snapshot_type current = listeners();
        std::lock_guard<std::mutex> lock {m_filters_mutex};
        return {std::move(current), m_filters};
    }

    static void dispatch(const event_type& event, const snapshot_type& snapshot, const filter_map& filters)
    {
        const kind_type kind = traits::kind(event);
        for(const auto& listener : *snapshot)
        {
            auto it = filters.find(listener.get());
            if(it != filters.end() && it->second.count(kind) == 0)
                continue;

            try {
                if(traits::has_mutable_data(event))
                    traits::deliver(*listener, traits::copy(event));
                else
                    traits::deliver(*listener, event);
            } catch(std::exception& e) {
                log::warn("Listener failed while handling {} event: {}", to_string(kind), e.what());
            } catch(...) {
                log::warn("Listener failed while handling {} event with an unknown exception", to_string(kind));
            }
        }
    }

private:

    bool add_locked(const listener_ptr& listener, const std::set<kind_type>& kinds)
    {
        snapshot_type current = listeners();
        if(std::find(current->begin(), current->end(), listener) != current->end())
        {
            if(kinds.empty())
                return m_filters.erase(listener.get()) > 0;

            auto it = m_filters.find(listener.get());
            if(it == m_filters.end())
            {
                m_filters.emplace(listener.get(), kinds);
                return true;
            }

            const size_t before = it->second.size();
            it->second.insert(kinds.begin(), kinds.end());
            return it->second.size() != before;
        }

        auto next = std::make_shared<std::vector<listener_ptr>>(*current);
        next->push_back(listener);
        publish(std::move(next));
        if(!kinds.empty())
            m_filters[listener.get()] = kinds;
        return true;
    }

    bool remove_locked(const listener_ptr& listener)
    {
        snapshot_type current = listeners();
        auto it = std::find(current->begin(), current->end(), listener);
        if(it == current->end())
            return false;

        auto next = std::make_shared<std::vector<listener_ptr>>(*current);
        next->erase(next->begin() + (it - current->begin()));
        publish(std::move(next));
        m_filters.erase(listener.get());
        return true;
    }

    void publish(snapshot_type next)
    {
        std::lock_guard<std::mutex> lock {m_listeners_mutex};
        m_listeners = std::move(next);
    }

    const std::string m_remote_name;

    mutable std::mutex m_listeners_mutex;

    snapshot_type m_listeners;

    mutable std::mutex m_filters_mutex;

    filter_map m_filters;

};

// Notifies the listeners on the thread calling fire()
template<typename event_type, typename traits = event_traits<event_type>>
class simple_listener_list : public listener_list<event_type, traits>
{
    using base = listener_list<event_type, traits>;

public:

    explicit simple_listener_list(std::string remote_name)
        : base {std::move(remote_name)}
    {}

    void fire(const event_type& event) override
    {
        auto [snapshot, filters] = base::take_snapshot();
        if(snapshot->empty())
        {
            log::debug("No listener, but would have notified them of a {} event from {}",
                to_string(traits::kind(event)), base::remote_name());
            return;
        }

        log::debug("Notifying listeners of a {} event from {}", to_string(traits::kind(event)), base::remote_name());
        base::dispatch(event, snapshot, filters);
    }
};

// Hands every broadcast as one task to an executor so fire() never waits for the listeners
template<typename event_type, typename traits = event_traits<event_type>>
class threaded_listener_list : public listener_list<event_type, traits>
{
    using base = listener_list<event_type, traits>;

public:

    threaded_listener_list(std::shared_ptr<executor> notifier, std::string remote_name)
        : base {std::move(remote_name)}, m_notifier {std::move(notifier)}
    {
        if(!m_notifier)
            throw std::invalid_argument {"notifier must not be null"};
    }

    const std::shared_ptr<executor>& notifier() const
    {
        return m_notifier;
    }

    void fire(const event_type& event) override
    {
        auto [snapshot, filters] = base::take_snapshot();
        if(snapshot->empty())
        {
            log::debug("No listener, but would have notified them of a {} event from {}",
                to_string(traits::kind(event)), base::remote_name());
            return;
        }

        log::debug("Notifying listeners of a {} event from {}", to_string(traits::kind(event)), base::remote_name());
        try {
            m_notifier->execute([event, snapshot = std::move(snapshot), filters = std::move(filters)]()
            {
                base::dispatch(event, snapshot, filters);
            });
        } catch(rejected_execution& e) {
            log::warn("Unable to notify listeners of a {} event from {}: {}",
                to_string(traits::kind(event)), base::remote_name(), e.what());
        }
    }

private:

    std::shared_ptr<executor> m_notifier;

};

using cast_event_listener_list = listener_list<cast_event>;

using connection_listener_list = listener_list<connection_event>;

} // namespace castlink

#endif
