#include "platform/windows/windows_platform.hpp"

#include "output/native_message_paste.hpp"
#include "platform/windows/sendinput_key_synthesizer.hpp"
#include "platform/windows/win32_clipboard.hpp"
#include "platform/windows/win32_window_system.hpp"

std::expected<int, std::string> WindowsProcessLauncher::run(const std::vector<std::string>& argv) {
    return std::unexpected((argv.empty() ? std::string("external tool") : argv.front()) +
                           " is not supported on Windows");
}

std::expected<std::unique_ptr<ChildProcess>, std::string>
WindowsProcessLauncher::spawn(const std::vector<std::string>& argv) {
    return std::unexpected((argv.empty() ? std::string("helper process") : argv.front()) +
                           " is not supported on Windows");
}

std::expected<std::unique_ptr<KeySynthesizer>, std::string> WindowsPlatform::key_synthesizer() {
    return std::unique_ptr<KeySynthesizer>(std::make_unique<SendInputKeySynthesizer>());
}

std::expected<std::unique_ptr<Clipboard>, std::string> WindowsPlatform::clipboard() {
    return std::unique_ptr<Clipboard>(std::make_unique<Win32Clipboard>());
}

std::unique_ptr<PasteCapability> WindowsPlatform::native_paste() {
    return std::make_unique<NativeMessagePaste>(std::make_unique<Win32WindowSystem>());
}

namespace platform {

std::unique_ptr<Platform> make_platform() {
    return std::make_unique<WindowsPlatform>();
}

} // namespace platform
