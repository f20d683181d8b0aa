#include "key_adhesion/key_capture.hpp"

#include <filesystem>
#include <linux/input-event-codes.h>
#include <libevdev/libevdev.h>
#include <unistd.h>
#include <fcntl.h>
#include <time.h>

#include <cerrno>
#include <chrono>
#include <iostream>
#include <system_error>

#include "key_adhesion/key_names.hpp"

namespace kb::adh {

namespace {

std::string keyNameForCode(unsigned int code) {
    const char* name = libevdev_event_code_get_name(EV_KEY, code);
    if (name == nullptr) {
        return "code" + std::to_string(code);
    }
    return keyNameFromEvdev(name);
}

double eventSeconds(const input_event& ev) {
    return static_cast<double>(ev.input_event_sec) + static_cast<double>(ev.input_event_usec) * 1e-6;
}

// 0 = release, 1 = press, 2 = auto-repeat. A full queue counts the drop;
// capture never waits on the consumer.
void forwardKey(BoundedEventQueue& queue, const input_event& ev) {
    if (ev.type != EV_KEY) {
        return;
    }
    const auto type = ev.value == 0 ? KeyEventType::Release : KeyEventType::Press;
    queue.tryPush(KeyEvent(keyNameForCode(ev.code), type, eventSeconds(ev)));
}

struct NodeEntry {
    std::filesystem::path node;
    std::string name;
};

// by-path entries are symlinks into /dev/input; resolve them so the error
// messages name the real event node.
std::vector<NodeEntry> keyboardNodes(const CaptureConfig& config) {
    std::vector<NodeEntry> nodes;
    std::error_code ec;
    std::filesystem::directory_iterator it(config.device_dir, ec);
    if (ec) {
        return nodes;
    }
    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (name.find(config.device_filter) == std::string::npos) {
            continue;
        }
        if (!entry.is_symlink(ec) && !entry.is_character_file(ec)) {
            continue;
        }
        const auto target = std::filesystem::read_symlink(entry.path(), ec);
        if (ec || target.empty()) {
            nodes.push_back({entry.path(), name});
        } else {
            nodes.push_back({entry.path().parent_path() / target, name});
        }
    }
    return nodes;
}

}  // namespace

KeyCapture::DevHandle::DevHandle(int fd, libevdev* dev, std::string name)
    : fd_(fd), dev_(dev), name_(std::move(name)) {}

KeyCapture::DevHandle::~DevHandle() { release(); }

void KeyCapture::DevHandle::release() noexcept {
    // libevdev does not own the descriptor, so it is closed separately.
    if (dev_ != nullptr) {
        libevdev_free(dev_);
        dev_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::unique_ptr<KeyCapture::DevHandle> KeyCapture::openKeyboardNode(const std::string& node,
                                                                     const std::string& name) {
    const int fd = ::open(node.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        std::cerr << "[KeyCapture] Cannot open " << node << ": "
                  << std::generic_category().message(errno) << '\n';
        return nullptr;
    }
    libevdev* dev = nullptr;
    const int rc = libevdev_new_from_fd(fd, &dev);
    auto handle = std::make_unique<DevHandle>(fd, rc == 0 ? dev : nullptr, name);
    if (rc != 0) {
        std::cerr << "[KeyCapture] " << name << " is not an evdev device: "
                  << std::generic_category().message(-rc) << '\n';
        return nullptr;
    }
    // Kernel timestamps must share the monotonic clock the consumer ticks on.
    if (libevdev_set_clock_id(dev, CLOCK_MONOTONIC) != 0) {
        std::cerr << "[KeyCapture] Cannot switch " << name << " to the monotonic clock" << '\n';
        return nullptr;
    }
    return handle;
}

KeyCapture::KeyCapture(CaptureConfig config, BoundedEventQueuePtr queue)
    : config_(std::move(config)), queue_(std::move(queue)) {}

KeyCapture::~KeyCapture() { stop(); }

void KeyCapture::start() {
    if (!queue_) return;
    if (thread_.joinable()) return;
    stop_.store(false);
    openDevices();
    if (devices_.empty()) {
        std::cerr << "[KeyCapture] No keyboard devices matching '" << config_.device_filter
                  << "' under " << config_.device_dir << '\n';
        return;
    }
    for (const auto& handle : devices_) {
        std::cout << "[KeyCapture] Listening on " << handle->name() << '\n';
    }
    thread_ = std::thread(&KeyCapture::runLoop, this);
}

void KeyCapture::stop() {
    stop_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
    closeDevices();
}

void KeyCapture::openDevices() {
    devices_.clear();
    for (const auto& entry : keyboardNodes(config_)) {
        if (auto handle = openKeyboardNode(entry.node.string(), entry.name)) {
            devices_.push_back(std::move(handle));
        }
    }
}

void KeyCapture::closeDevices() {
    devices_.clear();
}

void KeyCapture::pollDevice(libevdev* dev) {
    input_event ev{};
    while (!stop_.load()) {
        int rc = libevdev_next_event(dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
            forwardKey(*queue_, ev);
            continue;
        }
        if (rc != LIBEVDEV_READ_STATUS_SYNC) {
            return;
        }
        // The kernel dropped events. `ev` is the SYN_DROPPED marker; libevdev
        // then replays the state changes we missed, releases included, and
        // those are forwarded like any other event.
        do {
            rc = libevdev_next_event(dev, LIBEVDEV_READ_FLAG_SYNC, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                forwardKey(*queue_, ev);
            }
        } while (rc == LIBEVDEV_READ_STATUS_SYNC && !stop_.load());
    }
}

void KeyCapture::runLoop() {
    while (!stop_.load()) {
        for (const auto& handle : devices_) {
            pollDevice(handle->device());
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

}  // namespace kb::adh
