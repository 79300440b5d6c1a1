#pragma once

#include <chrono>
#include <cstdint>
#include <string>

using WindowHandle = std::uintptr_t;

// Window/message introspection. Every query returns 0 or an empty string
// when the OS call fails.
class WindowSystem {
public:
    virtual ~WindowSystem() = default;
    virtual WindowHandle foreground_window() = 0;
    virtual uint32_t window_thread(WindowHandle window) = 0;
    // Control with keyboard focus in that thread, else its active window.
    virtual WindowHandle focused_control(uint32_t thread_id) = 0;
    virtual std::string class_name(WindowHandle window) = 0;
    // True only if the paste message completed within the timeout.
    virtual bool send_paste(WindowHandle window, std::chrono::milliseconds timeout) = 0;
};
