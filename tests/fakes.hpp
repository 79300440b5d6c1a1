#pragma once

#include "output/paste_capability.hpp"
#include "platform/clipboard.hpp"
#include "platform/key_synthesizer.hpp"
#include "platform/platform.hpp"
#include "platform/process.hpp"
#include "platform/window_system.hpp"
#include "utf8.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct KeyEvent {
    enum class Kind { Press, Release, ModifierDown, ModifierUp };
    Kind kind;
    char32_t ch = 0;
    Modifier mod = Modifier::Control;
    Clock::time_point at;
};

inline std::string describe(const KeyEvent& e) {
    auto mod_name = [](Modifier m) { return m == Modifier::Command ? "cmd" : "ctrl"; };
    switch (e.kind) {
        case KeyEvent::Kind::Press: return "press " + utf8::encode(e.ch);
        case KeyEvent::Kind::Release: return "release " + utf8::encode(e.ch);
        case KeyEvent::Kind::ModifierDown: return std::string("down ") + mod_name(e.mod);
        case KeyEvent::Kind::ModifierUp: return std::string("up ") + mod_name(e.mod);
    }
    return "?";
}

inline std::vector<std::string> describe(const std::vector<KeyEvent>& events) {
    std::vector<std::string> out;
    for (auto& e : events) out.push_back(describe(e));
    return out;
}

class FakeKeySynthesizer : public KeySynthesizer {
public:
    explicit FakeKeySynthesizer(std::vector<KeyEvent>& events) : events_(events) {}

    void press(char32_t ch) override { events_.push_back({KeyEvent::Kind::Press, ch, {}, Clock::now()}); }
    void release(char32_t ch) override { events_.push_back({KeyEvent::Kind::Release, ch, {}, Clock::now()}); }
    void press_modifier(Modifier mod) override {
        events_.push_back({KeyEvent::Kind::ModifierDown, 0, mod, Clock::now()});
    }
    void release_modifier(Modifier mod) override {
        events_.push_back({KeyEvent::Kind::ModifierUp, 0, mod, Clock::now()});
    }

private:
    std::vector<KeyEvent>& events_;
};

struct ClipboardState {
    std::string contents;
    bool fail_reads = false;
    bool fail_writes = false;
    std::vector<std::string> writes;
    Clock::time_point last_write;
};

class FakeClipboard : public Clipboard {
public:
    explicit FakeClipboard(ClipboardState& state) : state_(state) {}

    std::expected<std::string, std::string> read() override {
        if (state_.fail_reads) return std::unexpected("read refused");
        return state_.contents;
    }

    std::expected<void, std::string> write(const std::string& text) override {
        if (state_.fail_writes) return std::unexpected("write refused");
        state_.contents = text;
        state_.writes.push_back(text);
        state_.last_write = Clock::now();
        return {};
    }

private:
    ClipboardState& state_;
};

struct WindowState {
    WindowHandle foreground = 0x100;
    uint32_t thread = 42;
    WindowHandle control = 0x200;
    std::string class_name = "Edit";
    bool paste_completes = true;

    int thread_queries = 0;
    int control_queries = 0;
    int class_queries = 0;
    std::vector<WindowHandle> paste_targets;
    std::chrono::milliseconds last_timeout{0};
};

class FakeWindowSystem : public WindowSystem {
public:
    explicit FakeWindowSystem(WindowState& state) : state_(state) {}

    WindowHandle foreground_window() override { return state_.foreground; }
    uint32_t window_thread(WindowHandle) override {
        state_.thread_queries++;
        return state_.thread;
    }
    WindowHandle focused_control(uint32_t) override {
        state_.control_queries++;
        return state_.control;
    }
    std::string class_name(WindowHandle) override {
        state_.class_queries++;
        return state_.class_name;
    }
    bool send_paste(WindowHandle window, std::chrono::milliseconds timeout) override {
        state_.paste_targets.push_back(window);
        state_.last_timeout = timeout;
        return state_.paste_completes;
    }

private:
    WindowState& state_;
};

class FakePasteCapability : public PasteCapability {
public:
    FakePasteCapability(bool handled, int& calls) : handled_(handled), calls_(calls) {}

    bool paste() override {
        calls_++;
        return handled_;
    }
    std::string_view name() const override { return "native-message"; }

private:
    bool handled_;
    int& calls_;
};

struct HelperState {
    std::vector<std::string> writes;
    int interrupts = 0;
    bool alive = true;
    bool fail_writes = false;
    bool destroyed = false;
};

class FakeChildProcess : public ChildProcess {
public:
    explicit FakeChildProcess(HelperState& state) : state_(state) {}
    ~FakeChildProcess() override { state_.destroyed = true; }

    std::expected<void, std::string> write(std::string_view data) override {
        if (state_.fail_writes) return std::unexpected("broken pipe");
        state_.writes.emplace_back(data);
        return {};
    }
    void interrupt() override {
        state_.interrupts++;
        state_.alive = false;
    }
    bool running() override { return state_.alive; }

private:
    HelperState& state_;
};

class FakeProcessLauncher : public ProcessLauncher {
public:
    std::vector<std::vector<std::string>> runs;
    int exit_status = 0;
    std::optional<std::string> run_error;

    std::vector<std::vector<std::string>> spawns;
    std::optional<std::string> spawn_error;
    HelperState helper;

    std::expected<int, std::string> run(const std::vector<std::string>& argv) override {
        runs.push_back(argv);
        if (run_error) return std::unexpected(*run_error);
        return exit_status;
    }

    std::expected<std::unique_ptr<ChildProcess>, std::string>
    spawn(const std::vector<std::string>& argv) override {
        spawns.push_back(argv);
        if (spawn_error) return std::unexpected(*spawn_error);
        return std::unique_ptr<ChildProcess>(std::make_unique<FakeChildProcess>(helper));
    }
};

class FakePlatform : public Platform {
public:
    std::vector<KeyEvent> key_events;
    ClipboardState clipboard_state;
    FakeProcessLauncher launcher;
    std::optional<std::string> keys_error;
    Modifier modifier = Modifier::Control;
    std::function<std::unique_ptr<PasteCapability>()> make_native;

    std::expected<std::unique_ptr<KeySynthesizer>, std::string> key_synthesizer() override {
        if (keys_error) return std::unexpected(*keys_error);
        return std::unique_ptr<KeySynthesizer>(std::make_unique<FakeKeySynthesizer>(key_events));
    }

    std::expected<std::unique_ptr<Clipboard>, std::string> clipboard() override {
        return std::unique_ptr<Clipboard>(std::make_unique<FakeClipboard>(clipboard_state));
    }

    std::unique_ptr<PasteCapability> native_paste() override {
        return make_native ? make_native() : nullptr;
    }

    ProcessLauncher& processes() override { return launcher; }
    Modifier paste_modifier() const override { return modifier; }
};
