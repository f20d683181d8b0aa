#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

struct libevdev;

#include "key_adhesion/config_loader.hpp"
#include "key_adhesion/event_queue.hpp"

namespace kb::adh {

// Reads EV_KEY events from every matching evdev keyboard node on its own
// thread and pushes them into the queue. Kernel auto-repeat is forwarded as a
// press; the tracker suppresses it.
class KeyCapture {
public:
    KeyCapture(CaptureConfig config, BoundedEventQueuePtr queue);
    ~KeyCapture();

    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }
    [[nodiscard]] std::size_t deviceCount() const noexcept { return devices_.size(); }

private:
    CaptureConfig config_;
    BoundedEventQueuePtr queue_;

    // Owns one opened evdev node; closing happens on destruction.
    class DevHandle {
    public:
        DevHandle(int fd, libevdev* dev, std::string name);
        ~DevHandle();
        DevHandle(const DevHandle&) = delete;
        DevHandle& operator=(const DevHandle&) = delete;

        [[nodiscard]] libevdev* device() const noexcept { return dev_; }
        [[nodiscard]] const std::string& name() const noexcept { return name_; }

    private:
        int fd_{-1};
        libevdev* dev_{nullptr};
        std::string name_;

        void release() noexcept;
    };

    static std::unique_ptr<DevHandle> openKeyboardNode(const std::string& node, const std::string& name);

    std::vector<std::unique_ptr<DevHandle>> devices_;
    std::atomic<bool> stop_{false};
    std::thread thread_;

    void runLoop();
    void pollDevice(libevdev* dev);
    void openDevices();
    void closeDevices();
};

}  // namespace kb::adh
