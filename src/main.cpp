#include <exception>
#include <iostream>
#include <memory>

#include "key_adhesion/adhesion_monitor.hpp"
#include "key_adhesion/config_loader.hpp"
#include "key_adhesion/event_queue.hpp"
#include "key_adhesion/key_capture.hpp"
#include "key_adhesion/monitor_cli.hpp"
#include "key_adhesion/session_store.hpp"

using kb::adh::AdhesionMonitor;
using kb::adh::BoundedEventQueue;
using kb::adh::ConfigLoader;
using kb::adh::KeyCapture;
using kb::adh::MonitorCLI;
using kb::adh::RuntimeConfig;
using kb::adh::SessionStore;

int main(int argc, char** argv) {
    try {
        ConfigLoader loader;

        std::string config_path = "configs/default.toml";
        if (argc > 1) {
            config_path = argv[1];
        }

        RuntimeConfig runtime = loader.loadFromFile(config_path);

        auto queue = std::make_shared<BoundedEventQueue>(runtime.capture.queue_capacity);
        AdhesionMonitor monitor(runtime, queue);

        KeyCapture capture(runtime.capture, queue);
        capture.start();

        MonitorCLI cli(monitor, SessionStore(runtime.session_directory));
        cli.run();

        capture.stop();
        if (queue->droppedCount() > 0) {
            std::cerr << "[KeyCapture] Dropped " << queue->droppedCount() << " events on a full queue" << '\n';
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
