#include "key_adhesion/monitor_cli.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include "key_adhesion/dashboard.hpp"

namespace kb::adh {

namespace {

int tickMillis(const RuntimeConfig& config) {
    return std::max(1, static_cast<int>(std::lround(config.timeline.tick_seconds * 1000.0)));
}

std::string upper(const std::string& value) {
    std::string out = value;
    for (auto& ch : out) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return out;
}

}  // namespace

MonitorCLI::MonitorCLI(AdhesionMonitor& monitor, SessionStore store, std::ostream& out)
    : monitor_(monitor),
      store_(std::move(store)),
      out_(out),
      stop_flag_(false),
      watch_(false),
      log_(false),
      tick_interval_ms_(tickMillis(monitor.config())),
      loop_running_(false) {
    // Listeners run inside drain(), which is always called under monitor_mutex_.
    event_log_ = std::make_shared<CallbackListener>([this](const KeyEvent& event, const ActiveKeyState&) {
        if (!log_.load()) {
            return;
        }
        const auto flags = out_.flags();
        const auto precision = out_.precision();
        out_ << '[' << (event.isPress() ? "press" : "release") << "] " << upper(event.key()) << " @"
             << std::fixed << std::setprecision(3) << event.timestamp() << '\n';
        out_.flags(flags);
        out_.precision(precision);
    });
    monitor_.addListener(event_log_);
}

MonitorCLI::MonitorCLI(AdhesionMonitor& monitor, SessionStore store)
    : MonitorCLI(monitor, std::move(store), std::cout) {}

MonitorCLI::~MonitorCLI() {
    stopTickLoop();
    monitor_.removeListener(event_log_);
}

void MonitorCLI::printHelp() {
    out_ << "Commands:" << '\n'
         << "  help                  - show this help" << '\n'
         << "  show                  - print the dashboard now" << '\n'
         << "  watch                 - toggle printing the dashboard on every analysis tick" << '\n'
         << "  log                   - toggle echoing every accepted key event" << '\n'
         << "  record                - start recording a session" << '\n'
         << "  stop                  - stop recording" << '\n'
         << "  save                  - write the recorded session to the session directory" << '\n'
         << "  load <path>           - analyze a saved session" << '\n'
         << "  sessions              - list saved sessions" << '\n'
         << "  clear                 - forget held keys, live events and the recording" << '\n'
         << "  config                - show current settings" << '\n'
         << "  set <section.key> <v> - change a setting" << '\n'
         << "  quit                  - exit" << '\n';
}

void MonitorCLI::printDashboard() {
    const auto& config = monitor_.config();
    out_ << formatTimeline(monitor_.lastTimeline(), config.timeline) << '\n';
    if (monitor_.hasReport()) {
        out_ << formatReport(monitor_.lastReport(), monitor_.analyzer());
    } else {
        out_ << "No analysis yet" << '\n';
    }
    const auto& recorder = monitor_.recorder();
    out_ << formatStatus(monitor_.status(), recorder.isRecording(), recorder.eventCount());
}

void MonitorCLI::printConfig() {
    for (const auto& [path, value] : describeConfig(monitor_.config())) {
        out_ << "  " << path << " = " << value << '\n';
    }
}

void MonitorCLI::printSessions() {
    const auto sessions = store_.listSessions();
    if (sessions.empty()) {
        out_ << "No saved sessions in " << store_.directory().string() << '\n';
        return;
    }
    out_ << "Sessions in " << store_.directory().string() << ":" << '\n';
    for (const auto& path : sessions) {
        out_ << "  " << path.filename().string() << '\n';
    }
}

void MonitorCLI::startRecording() {
    auto& recorder = monitor_.recorder();
    if (recorder.isRecording()) {
        out_ << "Already recording" << '\n';
        return;
    }
    recorder.start(monotonicNowSeconds());
    out_ << "Recording started" << '\n';
}

void MonitorCLI::stopRecording() {
    auto& recorder = monitor_.recorder();
    if (!recorder.isRecording()) {
        out_ << "Not recording" << '\n';
        return;
    }
    recorder.stop(monotonicNowSeconds());
    out_ << "Recording stopped (" << recorder.eventCount() << " events)" << '\n';
}

void MonitorCLI::saveSession() {
    const auto& recorder = monitor_.recorder();
    if (!recorder.hasSession() || recorder.eventCount() == 0) {
        out_ << "No session to save." << '\n';
        return;
    }
    KeySession session = recorder.session();
    session.metadata["source"] = "key-adhesion-monitor";
    session.metadata["device_filter"] = monitor_.config().capture.device_filter;
    try {
        const auto path = store_.save(session);
        out_ << "Saved " << session.events.size() << " events to " << path.string() << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "[MonitorCLI] Save failed: " << ex.what() << '\n';
    }
}

void MonitorCLI::loadSession(const std::string& path) {
    KeySession session;
    try {
        session = store_.load(path);
    } catch (const std::exception& ex) {
        std::cerr << "[MonitorCLI] Load failed: " << ex.what() << '\n';
        return;
    }
    // A non-positive window analyzes the whole recording as one batch.
    const auto report = monitor_.analyzer().analyzeWindow(
        session.events, session.end_time, 0.0, monitor_.config().hotspot_count);
    out_ << "Session " << path << ": " << session.events.size() << " events, "
         << (session.end_time - session.start_time) << "s" << '\n';
    out_ << formatReport(report, monitor_.analyzer());
}

void MonitorCLI::setValue(const std::string& path, const std::string& value) {
    RuntimeConfig config = monitor_.config();
    std::string error;
    if (!applySetting(config, path, value, &error)) {
        out_ << "Invalid setting: " << error << '\n';
        return;
    }
    monitor_.applyConfig(config);
    store_.setDirectory(config.session_directory);
    syncTickInterval();
    out_ << "Updated " << path << '\n';
}

bool MonitorCLI::execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) {
        return true;
    }
    if (cmd == "quit" || cmd == "exit") {
        return false;
    }

    std::lock_guard<std::mutex> guard(monitor_mutex_);
    if (cmd == "help") {
        printHelp();
    } else if (cmd == "show") {
        const double now = monotonicNowSeconds();
        monitor_.drain(now);
        monitor_.renderTimeline(now);
        monitor_.runAnalysis(now);
        printDashboard();
    } else if (cmd == "watch") {
        const bool enabled = !watch_.load();
        watch_.store(enabled);
        out_ << (enabled ? "Watching" : "Stopped watching") << '\n';
    } else if (cmd == "log") {
        const bool enabled = !log_.load();
        log_.store(enabled);
        out_ << (enabled ? "Logging events" : "Stopped logging events") << '\n';
    } else if (cmd == "record") {
        startRecording();
    } else if (cmd == "stop") {
        stopRecording();
    } else if (cmd == "save") {
        saveSession();
    } else if (cmd == "load") {
        std::string path;
        if (!(iss >> path)) {
            out_ << "Usage: load <path>" << '\n';
        } else {
            loadSession(path);
        }
    } else if (cmd == "sessions") {
        printSessions();
    } else if (cmd == "clear") {
        monitor_.clear();
        out_ << "Cleared" << '\n';
    } else if (cmd == "config") {
        printConfig();
    } else if (cmd == "set") {
        std::string path;
        std::string value;
        if (!(iss >> path >> value)) {
            out_ << "Invalid set command" << '\n';
        } else {
            setValue(path, value);
        }
    } else {
        out_ << "Unknown command" << '\n';
    }
    return true;
}

void MonitorCLI::startTickLoop() {
    if (loop_running_.load()) {
        return;
    }

    stop_flag_.store(false);
    loop_running_.store(true);

    tick_thread_ = std::thread([this]() {
        while (!stop_flag_.load()) {
            tickOnce(monotonicNowSeconds());

            int interval = tick_interval_ms_.load();
            if (interval < 1) {
                interval = 1;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(interval));
        }
        loop_running_.store(false);
    });
}

void MonitorCLI::tickOnce(double now) {
    std::lock_guard<std::mutex> guard(monitor_mutex_);
    try {
        const auto result = monitor_.tick(now);
        if (result.analyzed && watch_.load()) {
            printDashboard();
            out_ << std::flush;
        }
    } catch (const std::exception& ex) {
        std::cerr << "[MonitorCLI] Tick failed: " << ex.what() << '\n';
    }
}

void MonitorCLI::stopTickLoop() {
    stop_flag_.store(true);
    if (tick_thread_.joinable()) {
        tick_thread_.join();
        tick_thread_ = std::thread();
    }
    loop_running_.store(false);
}

void MonitorCLI::syncTickInterval() {
    tick_interval_ms_.store(tickMillis(monitor_.config()));
}

void MonitorCLI::run() {
    printHelp();
    startTickLoop();

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (!execute(line)) {
            break;
        }
    }

    stopTickLoop();
    out_ << "Exiting monitor" << '\n';
}

}  // namespace kb::adh
