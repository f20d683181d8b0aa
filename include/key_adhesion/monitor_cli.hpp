#pragma once

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>
#include <thread>

#include "key_adhesion/adhesion_monitor.hpp"
#include "key_adhesion/session_store.hpp"

namespace kb::adh {

class MonitorCLI {
public:
    MonitorCLI(AdhesionMonitor& monitor, SessionStore store, std::ostream& out);
    MonitorCLI(AdhesionMonitor& monitor, SessionStore store);
    ~MonitorCLI();

    // Starts the tick thread and reads commands from stdin until quit or EOF.
    void run();

    // Executes one command line. Returns false when the line asks to quit.
    bool execute(const std::string& line);

    // Runs one tick of the monitor at `now`. A failing tick is logged and
    // the loop keeps going.
    void tickOnce(double now);

    [[nodiscard]] bool watching() const noexcept { return watch_.load(); }
    [[nodiscard]] bool logging() const noexcept { return log_.load(); }

private:
    AdhesionMonitor& monitor_;
    SessionStore store_;
    std::ostream& out_;

    // Protects monitor_ and out_ between the command loop and the tick thread
    std::mutex monitor_mutex_;

    std::atomic<bool> stop_flag_;
    std::atomic<bool> watch_;
    std::atomic<bool> log_;
    std::atomic<int> tick_interval_ms_;
    std::atomic<bool> loop_running_;
    std::thread tick_thread_;

    // Echoes accepted events while `log` is on
    KeyEventListenerPtr event_log_;

    void printHelp();
    void printDashboard();
    void printConfig();
    void printSessions();

    void startRecording();
    void stopRecording();
    void saveSession();
    void loadSession(const std::string& path);
    void setValue(const std::string& path, const std::string& value);

    void startTickLoop();
    void stopTickLoop();
    void syncTickInterval();
};

}  // namespace kb::adh
