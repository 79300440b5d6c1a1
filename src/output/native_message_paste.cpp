#include "output/native_message_paste.hpp"

#include <algorithm>
#include <cctype>

bool is_native_edit_class(std::string_view class_name) {
    auto iequal = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    };
    return std::any_of(NATIVE_EDIT_CLASSES.begin(), NATIVE_EDIT_CLASSES.end(),
                       [&](std::string_view allowed) {
                           return std::equal(allowed.begin(), allowed.end(),
                                             class_name.begin(), class_name.end(), iequal);
                       });
}

NativeMessagePaste::NativeMessagePaste(std::unique_ptr<WindowSystem> windows)
    : windows_(std::move(windows)) {}

std::optional<FocusedControlInfo> NativeMessagePaste::resolve_focus() {
    FocusedControlInfo info;

    info.foreground = windows_->foreground_window();
    if (!info.foreground) return std::nullopt;

    info.thread_id = windows_->window_thread(info.foreground);
    if (!info.thread_id) return std::nullopt;

    info.control = windows_->focused_control(info.thread_id);
    if (!info.control) return std::nullopt;

    info.class_name = windows_->class_name(info.control);
    if (info.class_name.empty()) return std::nullopt;

    return info;
}

bool NativeMessagePaste::paste() {
    auto info = resolve_focus();
    if (!info) return false;
    if (!is_native_edit_class(info->class_name)) return false;
    return windows_->send_paste(info->control, PASTE_TIMEOUT);
}
