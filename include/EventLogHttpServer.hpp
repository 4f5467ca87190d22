#pragma once

#include <memory>
#include <string>
#include "httplib.h"
#include "EventLog.hpp"
#include "eventlog/FileRecordStore.hpp"
#include <nlohmann/json.hpp>

// JSON API over an EventLog persisted in `dataDir`.
class EventLogHttpServer {
public:
    EventLogHttpServer(std::string host, int port, const eventlog::Settings& settings, const std::string& dataDir);
    void run();
    void stop();

    eventlog::EventLog& eventLog() { return *log_; }

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    std::shared_ptr<eventlog::FileRecordStore> store_;
    std::unique_ptr<eventlog::EventLog> log_;
};
