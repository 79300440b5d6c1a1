#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "input_simulator.hpp"
#include "output/native_message_paste.hpp"

namespace {

Config::Input settings_for(InputMethod method) {
    Config::Input input;
    input.method = method;
    input.key_press_delay = 0.01;
    return input;
}

} // namespace

TEST_CASE("make_preview", "[simulator]") {

    SECTION("ShortTextUnchanged") {
        REQUIRE(make_preview("hello") == "hello");
    }

    SECTION("NewlinesEscaped") {
        REQUIRE(make_preview("a\nb") == "a\\nb");
    }

    SECTION("ExactlyAtLimitNotTruncated") {
        std::string text(InputSimulator::PREVIEW_LIMIT, 'x');
        REQUIRE(make_preview(text) == text);
    }

    SECTION("LongTextTruncatedWithEllipsis") {
        std::string text(200, 'x');
        REQUIRE(make_preview(text) == std::string(120, 'x') + "…");
    }

    SECTION("TruncationCountsCodePoints") {
        std::string text;
        for (int i = 0; i < 130; i++) text += "\xC3\xA9";
        std::string expected;
        for (int i = 0; i < 120; i++) expected += "\xC3\xA9";
        REQUIRE(make_preview(text) == expected + "…");
    }
}

TEST_CASE("InputSimulator", "[simulator]") {
    FakePlatform platform;
    std::vector<std::string> status;
    auto sink = [&status](const std::string& line) { status.push_back(line); };

    SECTION("TypewriteBeforeInitFails") {
        InputSimulator sim(settings_for(InputMethod::Keystroke), platform, sink);
        REQUIRE_FALSE(sim.typewrite("Hi").has_value());
        REQUIRE(platform.key_events.empty());
    }

    SECTION("KeystrokeMethod") {
        InputSimulator sim(settings_for(InputMethod::Keystroke), platform, sink);
        REQUIRE(sim.init());
        REQUIRE(sim.typewrite("Hi"));

        REQUIRE(describe(platform.key_events) == std::vector<std::string>{
            "press H", "release H", "press i", "release i",
        });
        REQUIRE(status == std::vector<std::string>{"Inserting via keystroke: Hi"});
        REQUIRE(platform.launcher.spawns.empty());
    }

    SECTION("StatusLineUsesPreview") {
        InputSimulator sim(settings_for(InputMethod::ExternalProcess), platform, sink);
        REQUIRE(sim.init());
        REQUIRE(sim.typewrite("line one\nline two"));
        REQUIRE(status.front() == "Inserting via external-process: line one\\nline two");
    }

    SECTION("KeySynthesizerUnavailable") {
        platform.keys_error = "cannot open X display";
        InputSimulator sim(settings_for(InputMethod::Clipboard), platform, sink);
        auto res = sim.init();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "cannot open X display");
    }

    SECTION("StreamingProcessScenario") {
        platform.launcher.helper = HelperState{};
        auto input = settings_for(InputMethod::StreamingProcess);
        input.helper_command = {"dotool"};
        InputSimulator sim(input, platform, sink);
        REQUIRE(sim.init());
        REQUIRE(sim.typewrite("Hi"));

        REQUIRE(platform.launcher.spawns == std::vector<std::vector<std::string>>{{"dotool"}});
        REQUIRE(platform.launcher.helper.writes ==
                std::vector<std::string>{"typedelay 10.0\n", "type Hi\n"});
    }

    SECTION("HelperSpawnedOnceAndCleanedUpOnce") {
        InputSimulator sim(settings_for(InputMethod::StreamingProcess), platform, sink);
        REQUIRE(sim.init());
        REQUIRE(sim.init());
        REQUIRE(platform.launcher.spawns.size() == 1);

        sim.cleanup();
        sim.cleanup();
        REQUIRE(platform.launcher.helper.interrupts == 1);

        REQUIRE_FALSE(sim.typewrite("late").has_value());
        REQUIRE(sim.init());
        REQUIRE(platform.launcher.spawns.size() == 1);
    }

    SECTION("DestructionCleansUp") {
        {
            InputSimulator sim(settings_for(InputMethod::StreamingProcess), platform, sink);
            REQUIRE(sim.init());
        }
        REQUIRE(platform.launcher.helper.interrupts == 1);
    }

    SECTION("HelperSpawnFailure") {
        platform.launcher.spawn_error = "No such file or directory";
        InputSimulator sim(settings_for(InputMethod::StreamingProcess), platform, sink);
        auto res = sim.init();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("dotool") != std::string::npos);
    }

    SECTION("ExternalToolFailureIsReturned") {
        platform.launcher.exit_status = 1;
        InputSimulator sim(settings_for(InputMethod::ExternalProcess), platform, sink);
        REQUIRE(sim.init());
        auto res = sim.typewrite("Hi");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "ydotool exited with code 1");
    }

    SECTION("NonStreamingMethodsSpawnNothing") {
        for (auto m : {InputMethod::Keystroke, InputMethod::Clipboard, InputMethod::ExternalProcess}) {
            InputSimulator sim(settings_for(m), platform, sink);
            REQUIRE(sim.init());
            sim.cleanup();
        }
        REQUIRE(platform.launcher.spawns.empty());
    }

    SECTION("ClipboardScenarioWithRejectedNativeControl") {
        WindowState windows;
        windows.class_name = "Chrome_WidgetWin_1";
        platform.make_native = [&windows]() -> std::unique_ptr<PasteCapability> {
            return std::make_unique<NativeMessagePaste>(std::make_unique<FakeWindowSystem>(windows));
        };
        platform.clipboard_state.contents = "prior";

        auto input = settings_for(InputMethod::Clipboard);
        input.clipboard_paste_delay = 0.03;
        input.restore_clipboard = true;
        InputSimulator sim(input, platform, sink);
        REQUIRE(sim.init());
        REQUIRE(sim.typewrite("Hi"));

        REQUIRE(windows.paste_targets.empty());
        REQUIRE(describe(platform.key_events) == std::vector<std::string>{
            "down ctrl", "press v", "release v", "up ctrl",
        });
        REQUIRE(platform.clipboard_state.contents == "prior");
        auto waited = platform.clipboard_state.last_write - platform.key_events.back().at;
        REQUIRE(waited >= std::chrono::milliseconds(29));
        REQUIRE(status == std::vector<std::string>{"Inserting via clipboard: Hi", "Pasted via hotkey"});
    }

    SECTION("ClipboardUsesPlatformModifier") {
        platform.modifier = Modifier::Command;
        auto input = settings_for(InputMethod::Clipboard);
        input.restore_clipboard = false;
        InputSimulator sim(input, platform, sink);
        REQUIRE(sim.init());
        REQUIRE(sim.typewrite("Hi"));
        REQUIRE(describe(platform.key_events).front() == "down cmd");
    }

    SECTION("MethodFixedAtConstruction") {
        auto input = settings_for(InputMethod::ExternalProcess);
        InputSimulator sim(input, platform, sink);
        input.method = InputMethod::Keystroke;
        REQUIRE(sim.method() == InputMethod::ExternalProcess);
    }
}
