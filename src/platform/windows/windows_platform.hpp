#pragma once

#include "platform/platform.hpp"

// Process-based input methods rely on Linux tools and are refused here.
class WindowsProcessLauncher : public ProcessLauncher {
public:
    std::expected<int, std::string> run(const std::vector<std::string>& argv) override;
    std::expected<std::unique_ptr<ChildProcess>, std::string>
    spawn(const std::vector<std::string>& argv) override;
};

class WindowsPlatform : public Platform {
public:
    std::expected<std::unique_ptr<KeySynthesizer>, std::string> key_synthesizer() override;
    std::expected<std::unique_ptr<Clipboard>, std::string> clipboard() override;
    std::unique_ptr<PasteCapability> native_paste() override;
    ProcessLauncher& processes() override { return launcher_; }
    Modifier paste_modifier() const override { return platform::default_paste_modifier(); }

private:
    WindowsProcessLauncher launcher_;
};
