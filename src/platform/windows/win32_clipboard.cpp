#include "platform/windows/win32_clipboard.hpp"

#include "platform/windows/win32_text.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>

#include <cstring>
#include <format>

namespace {

// Closes the clipboard on every exit path.
struct ClipboardLock {
    bool open;
    ClipboardLock() : open(OpenClipboard(nullptr) != 0) {}
    ~ClipboardLock() { if (open) CloseClipboard(); }
};

std::string last_error(const char* call) {
    return std::format("{} failed (error {})", call, GetLastError());
}

} // namespace

std::expected<std::string, std::string> Win32Clipboard::read() {
    ClipboardLock lock;
    if (!lock.open) return std::unexpected(last_error("OpenClipboard"));

    HANDLE data = GetClipboardData(CF_UNICODETEXT);
    if (!data) return std::unexpected("clipboard holds no text");

    auto* wide = static_cast<const wchar_t*>(GlobalLock(data));
    if (!wide) return std::unexpected(last_error("GlobalLock"));
    std::string text = win32::narrow(wide);
    GlobalUnlock(data);
    return text;
}

std::expected<void, std::string> Win32Clipboard::write(const std::string& text) {
    std::wstring wide = win32::widen(text);
    size_t bytes = (wide.size() + 1) * sizeof(wchar_t);

    HGLOBAL mem = GlobalAlloc(GMEM_MOVEABLE, bytes);
    if (!mem) return std::unexpected(last_error("GlobalAlloc"));

    void* dst = GlobalLock(mem);
    if (!dst) {
        GlobalFree(mem);
        return std::unexpected(last_error("GlobalLock"));
    }
    std::memcpy(dst, wide.c_str(), bytes);
    GlobalUnlock(mem);

    ClipboardLock lock;
    if (!lock.open) {
        GlobalFree(mem);
        return std::unexpected(last_error("OpenClipboard"));
    }

    EmptyClipboard();
    if (!SetClipboardData(CF_UNICODETEXT, mem)) {
        GlobalFree(mem);
        return std::unexpected(last_error("SetClipboardData"));
    }
    // The clipboard owns mem from here on.
    return {};
}
