#include "EventLogHttpServer.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <thread>

namespace {

// Waits for SIGINT/SIGTERM on its own thread and stops the server. The thread is
// woken and joined on destruction, before the server it refers to goes away.
class SignalWatcher {
public:
    SignalWatcher(const sigset_t& signals, EventLogHttpServer& app)
        : thread_([this, signals, &app]() {
              int sig = 0;
              if (sigwait(&signals, &sig) != 0 || shuttingDown_.load()) return;
              std::cerr << "Received signal " << sig << ", shutting down\n";
              app.stop();
          }) {}

    ~SignalWatcher() {
        shuttingDown_.store(true);
        pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

private:
    std::atomic<bool> shuttingDown_{false};
    std::thread thread_;
};

} // namespace

int main() {
    const char* envHost = std::getenv("EVENTLOG_HOST");
    const char* envPort = std::getenv("EVENTLOG_PORT");
    const char* envDir = std::getenv("EVENTLOG_DATA_DIR");
    const std::string host = envHost ? envHost : "0.0.0.0";
    const std::string dataDir = envDir ? envDir : "data";
    int port = 8080;
    if (envPort) {
        try { port = std::stoi(envPort); } catch (const std::exception&) {
            std::cerr << "ignoring malformed EVENTLOG_PORT=" << envPort << "\n";
        }
    }

    // SIGINT/SIGTERM are taken by a dedicated thread so shutdown runs outside a signal handler.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        EventLogHttpServer app(host, port, eventlog::Settings::fromEnvironment(), dataDir);
        SignalWatcher watcher(signals, app);
        std::cout << "Starting server...\n";
        app.run();
        app.eventLog().close();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
