#include "control_service.hpp"
#include "session/session_manager.hpp"
#include "session/session_store.hpp"
#include "session/serialization.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <opencv2/opencv.hpp>

using namespace std;
using json = nlohmann::json;

// One connected /api/events stream
struct ControlService::EventClient
{
    mutex mutex_;
    condition_variable condition_;
    deque<string> pending;
    atomic<bool> active{true};
};

namespace
{
    int httpStatusFor(const CommandResult &result)
    {
        if (result.success)
            return 200;

        switch (result.error)
        {
        case ErrorKind::INVALID_STATE:
        case ErrorKind::NOT_CALIBRATED:
            return 409;
        case ErrorKind::NO_TARGET_FOUND:
        case ErrorKind::AMBIGUOUS_TARGET:
        case ErrorKind::POOR_GEOMETRY:
            return 422;
        case ErrorKind::CAPTURE_TIMEOUT:
            return 504;
        case ErrorKind::CAMERA_UNAVAILABLE:
        case ErrorKind::SHUTTING_DOWN:
            return 503;
        default:
            return 500;
        }
    }

    void reply(httplib::Response &res, const CommandResult &result)
    {
        res.status = httpStatusFor(result);
        res.set_content(serialization::commandToJson(result).dump(), "application/json");
    }

    void badRequest(httplib::Response &res, const string &message)
    {
        json j;
        j["success"] = false;
        j["error"] = "InvalidRequest";
        j["message"] = message;
        res.status = 400;
        res.set_content(j.dump(), "application/json");
    }
}

ControlService::ControlService(SessionManager &manager, shared_ptr<SessionStore> store, shared_ptr<ImpactQueue> queue, const ServiceParams &params)
    : manager_(manager), store_(store), event_queue_(queue), params_(params) {}

ControlService::~ControlService()
{
    stop();
}

bool ControlService::start()
{
    if (running_)
        return true;

    server_ = make_unique<httplib::Server>();
    registerRoutes();

    // Bind here so the caller learns about a busy port right away
    int bound = 0;
    if (params_.port == 0)
    {
        bound = server_->bind_to_any_port(params_.host);
    }
    else if (server_->bind_to_port(params_.host, params_.port))
    {
        bound = params_.port;
    }

    if (bound <= 0)
    {
        log_error("Control service could not bind " + params_.host + ":" + to_string(params_.port));
        server_.reset();
        return false;
    }

    bound_port_ = bound;
    running_ = true;
    worker_thread_ = thread(&ControlService::run, this);

    // stop() only reaches a server that is already listening
    auto deadline = chrono::steady_clock::now() + chrono::seconds(2);
    while (running_ && !server_->is_running() && chrono::steady_clock::now() < deadline)
    {
        this_thread::sleep_for(chrono::milliseconds(5));
    }

    log_info("Control service listening on http://" + params_.host + ":" + to_string(bound_port_) + "/");
    return true;
}

size_t ControlService::eventClients()
{
    lock_guard<mutex> lock(clients_mutex_);
    return clients_.size();
}

void ControlService::stop()
{
    if (!running_ && !worker_thread_.joinable())
        return;

    running_ = false;

    // Wake every event stream so its provider returns
    {
        lock_guard<mutex> lock(clients_mutex_);
        for (auto &client : clients_)
        {
            client->active = false;
            client->condition_.notify_all();
        }
    }

    if (server_)
    {
        server_->stop();
    }
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    log_info("Control service stopped");
}

void ControlService::registerRoutes()
{
    // CORS headers
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                  {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                                  {"Access-Control-Allow-Headers", "Content-Type"}});

    server_->Options(R"(/api/.*)", [](const httplib::Request &, httplib::Response &res)
                     { res.status = 204; });

    // Health check
    server_->Get("/health", [this](const httplib::Request &, httplib::Response &res)
                 {
        json j;
        j["status"] = "ok";
        j["service"] = "OpenArchery";
        j["event_clients"] = eventClients();
        res.set_content(j.dump(), "application/json"); });

    server_->Get("/api/status", [this](const httplib::Request &, httplib::Response &res)
                 {
        json status = serialization::statusToJson(manager_.status());
        status["success"] = true;
        res.set_content(status.dump(), "application/json"); });

    // Calibration: {"target_size": "80cm" | "122cm"}, empty body uses the configured default
    server_->Post("/api/calibrate", [this](const httplib::Request &req, httplib::Response &res)
                  {
        string target;
        if (!req.body.empty()) {
            try {
                json body = json::parse(req.body);
                if (body.contains("target_size")) {
                    const json &size = body["target_size"];
                    target = size.is_number() ? to_string(size.get<int>()) : size.get<string>();
                }
            } catch (const json::exception &e) {
                badRequest(res, "Invalid JSON: " + string(e.what()));
                return;
            }
        }

        TargetSize parsed;
        if (!target.empty() && !target_geometry::parseTargetSize(target, parsed)) {
            badRequest(res, "Unknown target size '" + target + "', use 80cm or 122cm");
            return;
        }

        reply(res, manager_.calibrate(target)); });

    server_->Post("/api/start", [this](const httplib::Request &, httplib::Response &res)
                  { reply(res, manager_.startDetection()); });

    server_->Post("/api/stop", [this](const httplib::Request &, httplib::Response &res)
                  { reply(res, manager_.stopDetection()); });

    server_->Post("/api/reset", [this](const httplib::Request &, httplib::Response &res)
                  { reply(res, manager_.resetSession()); });

    server_->Post("/api/shutdown", [this](const httplib::Request &, httplib::Response &res)
                  {
        log_info("Shutdown requested over HTTP");
        reply(res, manager_.shutdown()); });

    // Impacts of the active (or last) session newer than ?since=N
    server_->Get("/api/impacts", [this](const httplib::Request &req, httplib::Response &res)
                 {
        int since = 0;
        if (req.has_param("since")) {
            try {
                since = stoi(req.get_param_value("since"));
            } catch (const exception &) {
                badRequest(res, "since must be an integer");
                return;
            }
        }

        string session_id;
        vector<Impact> impacts = manager_.impactsSince(since, session_id);

        json j;
        j["success"] = true;
        j["session_id"] = session_id.empty() ? json(nullptr) : json(session_id);
        j["impacts"] = impacts;
        res.set_content(j.dump(), "application/json"); });

    server_->Get("/api/sessions", [this](const httplib::Request &, httplib::Response &res)
                 {
        json j;
        j["success"] = true;
        j["sessions"] = store_->list();
        res.set_content(j.dump(), "application/json"); });

    server_->Get(R"(/api/sessions/([A-Za-z0-9_-]+))", [this](const httplib::Request &req, httplib::Response &res)
                 {
        Session session;
        if (!store_->load(req.matches[1].str(), session)) {
            json j;
            j["success"] = false;
            j["error"] = "NotFound";
            j["message"] = "No session " + req.matches[1].str();
            res.status = 404;
            res.set_content(j.dump(), "application/json");
            return;
        }

        json j;
        j["success"] = true;
        j["session"] = serialization::sessionToJson(session);
        res.set_content(j.dump(), "application/json"); });

    // Latest frame with the fitted target and impacts drawn on it
    server_->Get("/api/preview", [this](const httplib::Request &, httplib::Response &res)
                 {
        cv::Mat frame;
        if (!manager_.previewFrame(frame)) {
            res.status = 503;
            res.set_content("{\"success\":false,\"error\":\"CaptureTimeout\",\"message\":\"No frame yet\"}", "application/json");
            return;
        }

        if (params_.preview_width > 0 && frame.cols > params_.preview_width) {
            double scale = (double)params_.preview_width / frame.cols;
            cv::resize(frame, frame, cv::Size(), scale, scale, cv::INTER_AREA);
        }

        vector<uchar> jpeg;
        if (!cv::imencode(".jpg", frame, jpeg, {cv::IMWRITE_JPEG_QUALITY, params_.preview_quality})) {
            res.status = 500;
            return;
        }

        res.set_header("Cache-Control", "no-store");
        res.set_content(string(jpeg.begin(), jpeg.end()), "image/jpeg"); });

    // Server-sent events, one JSON message per impact / session change
    server_->Get("/api/events", [this](const httplib::Request &, httplib::Response &res)
                 {
        auto client = make_shared<EventClient>();
        size_t connected = 0;
        {
            lock_guard<mutex> lock(clients_mutex_);
            clients_.push_back(client);
            connected = clients_.size();
        }
        log_info("Event client connected (" + to_string(connected) + " total)");

        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, client](size_t, httplib::DataSink &sink) -> bool {
                while (running_ && client->active) {
                    deque<string> batch;
                    {
                        unique_lock<mutex> lock(client->mutex_);
                        client->condition_.wait_for(lock, chrono::seconds(max(1, params_.event_keepalive_s)), [&client] {
                            return !client->pending.empty() || !client->active;
                        });
                        batch.swap(client->pending);
                    }

                    // Comment line keeps proxies and browsers from timing out an idle stream
                    if (batch.empty()) {
                        batch.push_back(": keepalive\n\n");
                    }

                    for (const auto &message : batch) {
                        if (!sink.write(message.data(), message.size())) {
                            client->active = false;
                            break;
                        }
                    }
                }

                sink.done();
                return true;
            },
            [this, client](bool) {
                client->active = false;
                lock_guard<mutex> lock(clients_mutex_);
                clients_.erase(remove(clients_.begin(), clients_.end(), client), clients_.end());
                log_info("Event client disconnected");
            }); });
}

void ControlService::run()
{
    try
    {
        // Start server thread, the port is already bound
        thread server_thread([&]()
                             {
            if (!server_->listen_after_bind() && running_) {
                log_error("Control service stopped listening on port " + to_string(bound_port_));
                running_ = false;
            } });

        // Broadcast loop: event queue -> every connected stream
        while (running_)
        {
            SessionEvent event;
            if (event_queue_->pop(event, 100))
            {
                broadcastEvent(formatEventJson(event));
            }
        }

        server_->stop();
        if (server_thread.joinable())
        {
            server_thread.join();
        }
    }
    catch (const exception &e)
    {
        log_error("Control service error: " + string(e.what()));
        running_ = false;
    }
}

void ControlService::broadcastEvent(const string &json_message)
{
    string frame = "data: " + json_message + "\n\n";

    lock_guard<mutex> lock(clients_mutex_);

    for (auto &client : clients_)
    {
        if (!client->active)
            continue;

        {
            lock_guard<mutex> client_lock(client->mutex_);
            client->pending.push_back(frame);
        }
        client->condition_.notify_one();
    }

    if (!clients_.empty())
    {
        log_debug("Broadcasted event to " + to_string(clients_.size()) + " clients");
    }
}

string ControlService::formatEventJson(const SessionEvent &event)
{
    const Impact *impact = event.type == "impact" ? &event.impact : nullptr;
    return serialization::eventToJson(event.type, event.session_id, impact, event.state, event.timestamp).dump();
}
