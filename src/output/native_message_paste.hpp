#pragma once

#include "output/paste_capability.hpp"
#include "platform/window_system.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Resolved fresh on every paste attempt.
struct FocusedControlInfo {
    WindowHandle foreground = 0;
    uint32_t thread_id = 0;
    WindowHandle control = 0;
    std::string class_name;
};

// Native edit controls that handle a paste message reliably.
inline constexpr std::array<std::string_view, 6> NATIVE_EDIT_CLASSES = {
    "Edit", "RichEdit", "RichEdit20A", "RichEdit20W", "RICHEDIT50W", "RICHEDIT60W",
};

// Case-insensitive match against NATIVE_EDIT_CLASSES.
bool is_native_edit_class(std::string_view class_name);

class NativeMessagePaste : public PasteCapability {
public:
    static constexpr std::chrono::milliseconds PASTE_TIMEOUT{100};

    explicit NativeMessagePaste(std::unique_ptr<WindowSystem> windows);

    bool paste() override;
    std::string_view name() const override { return "native-message"; }

    std::optional<FocusedControlInfo> resolve_focus();

private:
    std::unique_ptr<WindowSystem> windows_;
};
