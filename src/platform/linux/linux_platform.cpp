#include "platform/linux/linux_platform.hpp"

#include "platform/linux/command_clipboard.hpp"
#include "platform/linux/xtest_key_synthesizer.hpp"

std::expected<std::unique_ptr<KeySynthesizer>, std::string> LinuxPlatform::key_synthesizer() {
    auto keys = XTestKeySynthesizer::open();
    if (!keys) return std::unexpected(keys.error());
    return std::unique_ptr<KeySynthesizer>(std::move(*keys));
}

std::expected<std::unique_ptr<Clipboard>, std::string> LinuxPlatform::clipboard() {
    return std::unique_ptr<Clipboard>(CommandClipboard::detect());
}

namespace platform {

std::unique_ptr<Platform> make_platform() {
    return std::make_unique<LinuxPlatform>();
}

} // namespace platform
