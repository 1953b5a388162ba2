#include "core/config.hpp"

#include <filesystem>
#include <iostream>
#include <string>

#include "support/synthetic_scene.hpp"

int main() {
    camio::AppConfig cfg;
    std::string error;

    if (!camio::validateConfig(cfg, error)) {
        std::cerr << "defaults must validate: " << error << "\n";
        return 1;
    }
    if (cfg.interaction.zone_filter_size != 10 || cfg.interaction.touch_threshold_cm != 2.0 ||
        cfg.interaction.cue_cooldown_s != 0.5) {
        std::cerr << "interaction defaults mismatch\n";
        return 1;
    }

    cfg.camera.source_mode = "gstreamer";
    if (camio::validateConfig(cfg, error)) {
        std::cerr << "expected invalid source_mode\n";
        return 1;
    }
    cfg.camera.source_mode = "file";
    if (camio::validateConfig(cfg, error)) {
        std::cerr << "file mode without video_path must fail\n";
        return 1;
    }
    cfg.camera.video_path = "recording.mp4";
    if (!camio::validateConfig(cfg, error)) {
        std::cerr << "file mode with a path must validate: " << error << "\n";
        return 1;
    }

    cfg = camio::AppConfig{};
    cfg.interaction.zone_filter_size = 0;
    if (camio::validateConfig(cfg, error)) {
        std::cerr << "expected invalid zone_filter_size\n";
        return 1;
    }

    cfg = camio::AppConfig{};
    cfg.interaction.touch_threshold_cm = 0.0;
    if (camio::validateConfig(cfg, error)) {
        std::cerr << "expected invalid touch_threshold_cm\n";
        return 1;
    }

    cfg = camio::AppConfig{};
    cfg.interaction.cue_cooldown_s = -0.1;
    if (camio::validateConfig(cfg, error)) {
        std::cerr << "expected invalid cue_cooldown_s\n";
        return 1;
    }

    cfg = camio::AppConfig{};
    cfg.audio.player_command.clear();
    if (camio::validateConfig(cfg, error)) {
        std::cerr << "expected invalid player_command\n";
        return 1;
    }

    cfg.audio.player_command = "  \t";
    if (camio::validateConfig(cfg, error)) {
        std::cerr << "blank player_command must fail\n";
        return 1;
    }

    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "camio_test_config";
    std::error_code ec;
    fs::create_directories(dir, ec);
    const std::string path = (dir / "camio.yaml").string();
    camio::testing::writeTextFile(path,
        "%YAML:1.0\n"
        "camera:\n"
        "  source_mode: file\n"
        "  video_path: \"session.mp4\"\n"
        "  width: 1280\n"
        "  height: 720\n"
        "interaction:\n"
        "  zone_filter_size: 6\n"
        "  cue_cooldown_s: 0.75\n"
        "audio:\n"
        "  player_command: aplay\n"
        "debug:\n"
        "  show_window: 0\n"
        "  log_stats: 1\n");

    camio::AppConfig loaded;
    if (!camio::loadConfig(path, loaded, error)) {
        std::cerr << "config load failed: " << error << "\n";
        return 1;
    }
    if (loaded.camera.source_mode != "file" || loaded.camera.video_path != "session.mp4" ||
        loaded.camera.width != 1280 || loaded.camera.height != 720) {
        std::cerr << "camera section mismatch\n";
        return 1;
    }
    if (loaded.interaction.zone_filter_size != 6 || loaded.interaction.cue_cooldown_s != 0.75 ||
        loaded.interaction.touch_threshold_cm != 2.0) {
        std::cerr << "interaction section mismatch\n";
        return 1;
    }
    if (loaded.audio.player_command != "aplay" || loaded.debug.show_window || !loaded.debug.log_stats ||
        loaded.debug.log_frame_skips) {
        std::cerr << "audio/debug section mismatch\n";
        return 1;
    }

    fs::remove_all(dir, ec);
    return 0;
}
