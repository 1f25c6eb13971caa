#pragma once
#include "impact_queue.hpp"
#include "config/config.hpp"
#include <thread>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>
#include <httplib.h>

class SessionManager;
class SessionStore;

// HTTP/JSON control surface: commands, status, stored sessions, preview and a server-sent event stream
class ControlService
{
public:
    ControlService(SessionManager &manager, std::shared_ptr<SessionStore> store,
                   std::shared_ptr<ImpactQueue> queue, const ServiceParams &params = ServiceParams());
    ~ControlService();

    // Binds the port and starts serving; false when the port cannot be bound
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Port actually bound, useful when configured with port 0
    int port() const { return bound_port_; }

    // Connected /api/events streams
    size_t eventClients();

private:
    struct EventClient;

    void run();
    void registerRoutes();
    void broadcastEvent(const std::string &json_message);
    std::string formatEventJson(const SessionEvent &event);

    SessionManager &manager_;
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<ImpactQueue> event_queue_;
    ServiceParams params_;

    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};
    std::unique_ptr<httplib::Server> server_;

    std::mutex clients_mutex_;
    std::vector<std::shared_ptr<EventClient>> clients_;
};
