#pragma once

#include "platform/window_system.hpp"

class Win32WindowSystem : public WindowSystem {
public:
    static constexpr int CLASS_NAME_CAPACITY = 256;

    WindowHandle foreground_window() override;
    uint32_t window_thread(WindowHandle window) override;
    WindowHandle focused_control(uint32_t thread_id) override;
    std::string class_name(WindowHandle window) override;
    bool send_paste(WindowHandle window, std::chrono::milliseconds timeout) override;
};
