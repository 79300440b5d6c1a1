#pragma once

#include "platform/linux/posix_process.hpp"
#include "platform/platform.hpp"

class LinuxPlatform : public Platform {
public:
    std::expected<std::unique_ptr<KeySynthesizer>, std::string> key_synthesizer() override;
    std::expected<std::unique_ptr<Clipboard>, std::string> clipboard() override;
    std::unique_ptr<PasteCapability> native_paste() override { return nullptr; }
    ProcessLauncher& processes() override { return launcher_; }
    Modifier paste_modifier() const override { return platform::default_paste_modifier(); }

private:
    PosixProcessLauncher launcher_;
};
