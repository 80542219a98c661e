#ifndef TESTS_FAKE_DAEMON_HPP
#define TESTS_FAKE_DAEMON_HPP

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_daemon {
// Loopback stand-in for the lighting daemon. Answers each command with a
// canned line and keeps "listen" connections open for pushed events.
class FakeDaemon {
public:
    explicit FakeDaemon(std::string path) : m_path(std::move(path)) {
        ::unlink(m_path.c_str());
        m_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, m_path.c_str(), sizeof(addr.sun_path) - 1);
        ::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(m_fd, 8);
        m_thread = std::thread([this]() { serve(); });
    }

    ~FakeDaemon() {
        m_stopping = true;
        if (m_thread.joinable()) {
            m_thread.join();
        }
        close_listener();
        ::close(m_fd);
        ::unlink(m_path.c_str());
    }

    FakeDaemon(const FakeDaemon&) = delete;
    FakeDaemon& operator=(const FakeDaemon&) = delete;

    const std::string& path() const { return m_path; }

    void respond(const std::string& cmd, const std::string& line) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_responses[cmd] = line;
    }

    std::vector<std::string> requests() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

    std::size_t request_count(const std::string& cmd) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t count = 0;
        for (const auto& request : m_requests) {
            if (command_of(request) == cmd) {
                ++count;
            }
        }
        return count;
    }

    bool wait_for_listener() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, std::chrono::seconds(5), [this]() { return m_listener >= 0; });
    }

    bool push_event(const std::string& line) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_listener < 0) {
            return false;
        }
        const std::string data = line + "\n";
        return ::send(m_listener, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
    }

    void close_listener() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_listener >= 0) {
            ::close(m_listener);
            m_listener = -1;
        }
    }

    static std::string command_of(const std::string& request) {
        const std::string key = "\"cmd\"";
        std::size_t pos = request.find(key);
        if (pos == std::string::npos) {
            return "";
        }
        pos = request.find('"', request.find(':', pos + key.size()) + 1);
        std::size_t end = request.find('"', pos + 1);
        if (pos == std::string::npos || end == std::string::npos) {
            return "";
        }
        return request.substr(pos + 1, end - pos - 1);
    }

private:
    void serve() {
        while (!m_stopping) {
            pollfd pfd{m_fd, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            int client = ::accept(m_fd, nullptr, nullptr);
            if (client < 0) {
                continue;
            }
            handle(client);
        }
    }

    void handle(int client) {
        std::string line;
        char c = 0;
        while (::recv(client, &c, 1, 0) == 1 && c != '\n') {
            line.push_back(c);
        }

        const std::string cmd = command_of(line);
        std::string response;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(line);
            auto it = m_responses.find(cmd);
            response = it != m_responses.end() ? it->second : "{\"ok\":false,\"error\":\"unknown command\"}";
        }

        response += "\n";
        ::send(client, response.data(), response.size(), MSG_NOSIGNAL);

        if (cmd == "listen" && response.find("\"ok\":true") != std::string::npos) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_listener >= 0) {
                ::close(m_listener);
            }
            m_listener = client;
            m_cv.notify_all();
            return;
        }
        ::close(client);
    }

    std::string m_path;
    int m_fd = -1;
    int m_listener = -1;
    std::atomic<bool> m_stopping{false};
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, std::string> m_responses;
    std::vector<std::string> m_requests;
    std::thread m_thread;
};

inline std::string socket_path(const std::string& name) {
    return "/tmp/lightdesk-" + name + "-" + std::to_string(::getpid()) + ".sock";
}
}  // namespace test_daemon

#endif
