#include "platform/windows/win32_window_system.hpp"

#include "platform/windows/win32_text.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>

namespace {

HWND to_hwnd(WindowHandle h) {
    return reinterpret_cast<HWND>(h);
}

WindowHandle from_hwnd(HWND h) {
    return reinterpret_cast<WindowHandle>(h);
}

} // namespace

WindowHandle Win32WindowSystem::foreground_window() {
    return from_hwnd(GetForegroundWindow());
}

uint32_t Win32WindowSystem::window_thread(WindowHandle window) {
    return GetWindowThreadProcessId(to_hwnd(window), nullptr);
}

WindowHandle Win32WindowSystem::focused_control(uint32_t thread_id) {
    GUITHREADINFO gi{};
    gi.cbSize = sizeof(gi);
    if (!GetGUIThreadInfo(thread_id, &gi)) return 0;
    if (gi.hwndFocus) return from_hwnd(gi.hwndFocus);
    return from_hwnd(gi.hwndActive);
}

std::string Win32WindowSystem::class_name(WindowHandle window) {
    wchar_t buf[CLASS_NAME_CAPACITY];
    int n = GetClassNameW(to_hwnd(window), buf, CLASS_NAME_CAPACITY);
    if (n <= 0) return {};
    return win32::narrow(buf, n);
}

bool Win32WindowSystem::send_paste(WindowHandle window, std::chrono::milliseconds timeout) {
    DWORD_PTR result = 0;
    LRESULT ok = SendMessageTimeoutW(to_hwnd(window), WM_PASTE, 0, 0, SMTO_ABORTIFHUNG,
                                     static_cast<UINT>(timeout.count()), &result);
    return ok != 0;
}
