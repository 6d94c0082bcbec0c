#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "platform/platform_paths.hpp"

TEST_CASE("Platform paths", "[platform]") {
    EnvGuard home("HOME", "/home/tester");

    SECTION("XdgVariablesWin") {
        EnvGuard config("XDG_CONFIG_HOME", "/xdg/config");
        EnvGuard data("XDG_DATA_HOME", "/xdg/data");
        REQUIRE(platform::config_dir() == "/xdg/config/voicenote");
        REQUIRE(platform::data_dir() == "/xdg/data/voicenote");
    }

    SECTION("FallsBackToHome") {
        EnvGuard config("XDG_CONFIG_HOME", nullptr);
        EnvGuard data("XDG_DATA_HOME", nullptr);
        REQUIRE(platform::config_dir() == "/home/tester/.config/voicenote");
        REQUIRE(platform::data_dir() == "/home/tester/.local/share/voicenote");
    }

    SECTION("EmptyOrRelativeXdgIgnored") {
        EnvGuard config("XDG_CONFIG_HOME", "");
        EnvGuard data("XDG_DATA_HOME", "relative/data");
        REQUIRE(platform::config_dir() == "/home/tester/.config/voicenote");
        REQUIRE(platform::data_dir() == "/home/tester/.local/share/voicenote");
    }

    SECTION("NoHomeGivesEmpty") {
        EnvGuard config("XDG_CONFIG_HOME", nullptr);
        EnvGuard unset_home("HOME", nullptr);
        REQUIRE(platform::config_dir().empty());
    }

    SECTION("ScratchUnderTempDir") {
        auto dir = platform::scratch_dir();
        REQUIRE(std::filesystem::path(dir).filename() == "voicenote");
    }
}
