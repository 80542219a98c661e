#include "core/color_stream.hpp"

#include "core/logging.hpp"

#include <exception>
#include <map>
#include <utility>

namespace {
std::shared_future<bool> ready_future(bool value) {
    std::promise<bool> promise;
    promise.set_value(value);
    return promise.get_future().share();
}
}  // namespace

namespace core {
struct ColorStreamDistributor::Registry {
    struct Entry {
        Subscriber callback;
        bool active = true;
    };

    // Recursive so a subscriber may unsubscribe or read the cache from inside
    // its own notification.
    mutable std::recursive_mutex mutex;
    bool closed = false;
    std::map<std::string, std::vector<std::shared_ptr<Entry>>> subscribers;
    std::map<std::string, std::vector<LedColor>> latest;

    void publish(const LedFrame& frame) {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        if (closed) {
            return;
        }

        latest[frame.port] = frame.colors;

        auto it = subscribers.find(frame.port);
        if (it == subscribers.end() || it->second.empty()) {
            return;
        }

        const std::vector<std::shared_ptr<Entry>> snapshot = it->second;
        for (const auto& entry : snapshot) {
            if (!entry->active) {
                continue;
            }
            try {
                entry->callback(frame.colors);
            } catch (const std::exception& e) {
                logging::error("stream.subscriber_failed", {{"port", frame.port}, {"error", e.what()}});
            }
        }
    }

    void remove(const std::string& port, const std::shared_ptr<Entry>& entry) {
        std::lock_guard<std::recursive_mutex> lock(mutex);
        entry->active = false;

        auto it = subscribers.find(port);
        if (it == subscribers.end()) {
            return;
        }

        auto& entries = it->second;
        for (auto e = entries.begin(); e != entries.end(); ++e) {
            if (*e == entry) {
                entries.erase(e);
                break;
            }
        }
        if (entries.empty()) {
            subscribers.erase(it);
        }
    }
};

ColorStreamDistributor::ColorStreamDistributor(LedFrameSource& source)
    : m_source(source), m_registry(std::make_shared<Registry>()) {}

ColorStreamDistributor::~ColorStreamDistributor() {
    shutdown();
}

std::shared_future<bool> ColorStreamDistributor::ensure_listening() {
    std::lock_guard<std::mutex> lock(m_setup_mutex);
    if (m_listening) {
        if (m_source.is_listening()) {
            return ready_future(true);
        }
        logging::warn("stream.lost");
        m_listening = false;
    }
    if (m_shut_down) {
        return ready_future(false);
    }
    if (m_pending.valid()) {
        return m_pending;
    }

    // A previous attempt has already released its state.
    if (m_setup_thread.joinable()) {
        m_setup_thread.join();
    }

    auto promise = std::make_shared<std::promise<bool>>();
    m_pending = promise->get_future().share();

    std::weak_ptr<Registry> weak_registry = m_registry;
    m_setup_thread = std::thread([this, promise, weak_registry]() {
        bool ok = false;
        std::string error;
        try {
            ok = m_source.listen_led_updates(
                [weak_registry](const LedFrame& frame) {
                    if (auto registry = weak_registry.lock()) {
                        registry->publish(frame);
                    }
                },
                error);
        } catch (const std::exception& e) {
            ok = false;
            error = e.what();
        }

        if (ok) {
            logging::info("stream.listening");
        } else {
            logging::error("stream.listen_failed", {{"error", error}});
        }

        {
            std::lock_guard<std::mutex> state_lock(m_setup_mutex);
            m_listening = ok;
            m_pending = std::shared_future<bool>();
        }
        promise->set_value(ok);
    });

    return m_pending;
}

bool ColorStreamDistributor::is_listening() const {
    std::lock_guard<std::mutex> lock(m_setup_mutex);
    return m_listening && m_source.is_listening();
}

ColorStreamDistributor::Unsubscribe ColorStreamDistributor::subscribe(const std::string& port,
                                                                      Subscriber callback) {
    auto entry = std::make_shared<Registry::Entry>();
    entry->callback = std::move(callback);

    {
        std::lock_guard<std::recursive_mutex> lock(m_registry->mutex);
        if (m_registry->closed) {
            return []() {};
        }
        m_registry->subscribers[port].push_back(entry);
    }

    std::weak_ptr<Registry> weak_registry = m_registry;
    return [weak_registry, port, entry]() {
        if (auto registry = weak_registry.lock()) {
            registry->remove(port, entry);
        }
    };
}

std::optional<std::vector<LedColor>> ColorStreamDistributor::get_latest(const std::string& port) const {
    std::lock_guard<std::recursive_mutex> lock(m_registry->mutex);
    auto it = m_registry->latest.find(port);
    if (it == m_registry->latest.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ColorStreamDistributor::subscriber_count(const std::string& port) const {
    std::lock_guard<std::recursive_mutex> lock(m_registry->mutex);
    auto it = m_registry->subscribers.find(port);
    return it == m_registry->subscribers.end() ? 0 : it->second.size();
}

void ColorStreamDistributor::publish(const LedFrame& frame) {
    m_registry->publish(frame);
}

void ColorStreamDistributor::shutdown() {
    std::thread setup;
    {
        std::lock_guard<std::mutex> lock(m_setup_mutex);
        m_shut_down = true;
        setup = std::move(m_setup_thread);
    }
    if (setup.joinable()) {
        setup.join();
    }

    bool was_listening = false;
    {
        std::lock_guard<std::mutex> lock(m_setup_mutex);
        was_listening = m_listening;
        m_listening = false;
    }
    if (was_listening) {
        m_source.stop_listening();
    }

    std::lock_guard<std::recursive_mutex> lock(m_registry->mutex);
    m_registry->closed = true;
    m_registry->subscribers.clear();
    m_registry->latest.clear();
}
}  // namespace core
