#include "EventLogHttpServer.hpp"

#include <algorithm>
#include <stdexcept>
#include "eventlog/EventJson.hpp"
#include "eventlog/Log.hpp"

using json = nlohmann::json;

EventLogHttpServer::EventLogHttpServer(std::string host, int port, const eventlog::Settings& settings, const std::string& dataDir)
    : host_(std::move(host)),
      port_(port),
      store_(std::make_shared<eventlog::FileRecordStore>(dataDir)),
      log_(std::make_unique<eventlog::EventLog>(settings, store_)) {
    setupRoutes();
}

void EventLogHttpServer::run() {
    eventlog::log::info("EventLogHttpServer", "listening on " + host_ + ":" + std::to_string(port_));
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("failed to listen on " + host_ + ":" + std::to_string(port_));
    }
}

void EventLogHttpServer::stop() {
    server_.stop();
    log_->close();
}

void EventLogHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        json records = json::array();
        for (const auto& r : log_->healthCheck()) {
            records.push_back({
                {"status", eventlog::healthStatusName(r.status)},
                {"topic", r.topic},
                {"message", r.message}
            });
        }
        json data = {
            {"state", eventlog::statusName(log_->status())},
            {"records", records}
        };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });

    // --- STATS ---
    server_.Get("/v1/stats", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        const auto s = log_->stats();
        auto oldest = log_->oldestTimestamp();
        json data = {
            {"stored", log_->storedEventCount()},
            {"pending", log_->pendingEventCount()},
            {"size", log_->sizeToDebugString()},
            {"oldest", oldest ? json(eventlog::toEpochMs(*oldest)) : json(nullptr)},
            {"transactionSize", log_->transactionSize()},
            {"dirtyQueueMs", log_->dirtyQueueTime().count()},
            {"written", s.written},
            {"purged", s.purged},
            {"droppedOversize", s.droppedOversize},
            {"droppedBackpressure", s.droppedBackpressure},
            {"writeFailures", s.writeFailures}
        };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });

    // --- WRITE EVENTS (single object or array) ---
    server_.Post("/v1/events", [this, ok, err, isJsonContent, addCors](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            res.status = 415;
            res.set_content(err(415, "Content-Type must be application/json").dump(), "application/json");
            addCors(res);
            return;
        }
        try {
            auto j = json::parse(req.body);
            std::vector<eventlog::LogEvent> events;
            if (j.is_array()) {
                for (const auto& item : j) events.push_back(eventlog::eventFromJson(item));
            } else {
                events.push_back(eventlog::eventFromJson(j));
            }
            for (const auto& e : events) log_->writeEvent(e);
            res.status = 202;
            res.set_content(ok(json{{"accepted", events.size()}}).dump(), "application/json");
        } catch (const std::exception& e) {
            res.status = 400;
            res.set_content(err(400, std::string("Invalid event: ") + e.what()).dump(), "application/json");
        }
        addCors(res);
    });

    // --- SEARCH ---
    server_.Get("/v1/events", [this, ok, err, addCors](const httplib::Request& req, httplib::Response& res) {
        auto parseBounded = [](const std::string& val, long long def, long long min, long long max) -> long long {
            if (val.empty()) return def;
            try {
                long long v = std::stoll(val);
                return std::min(std::max(v, min), max);
            }
            catch (const std::exception&) { return def; }
        };

        eventlog::SearchQuery query;
        const auto levelParam = req.get_param_value("level");
        if (!levelParam.empty()) {
            query.minimumLevel = eventlog::parseLevel(levelParam);
            if (!query.minimumLevel) {
                res.status = 400;
                res.set_content(err(400, "Unknown level '" + levelParam + "'").dump(), "application/json");
                addCors(res);
                return;
            }
        }
        auto type = eventlog::algo::parseEventType(req.get_param_value("type"));
        if (!type) {
            res.status = 400;
            res.set_content(err(400, "type must be one of user, system, both").dump(), "application/json");
            addCors(res);
            return;
        }
        query.eventType = *type;
        query.maxCount = static_cast<std::size_t>(parseBounded(req.get_param_value("count"), 100, 1, 100'000));
        query.maxQueryTime = std::chrono::milliseconds(parseBounded(req.get_param_value("maxTime"), 30'000, 0, 300'000));
        query.username = req.get_param_value("user");
        query.text = req.get_param_value("text");

        auto results = log_->search(query);
        json events = json::array();
        for (const auto& e : results.events) events.push_back(eventlog::toJson(e));

        json data = {
            {"events", events},
            {"examined", results.examined},
            {"elapsedMs", results.elapsed.count()},
            {"timeExceeded", results.timeExceeded}
        };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });
}
