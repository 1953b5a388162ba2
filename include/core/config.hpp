#pragma once

#include <string>

namespace camio {

struct CameraConfig {
    std::string source_mode{"v4l2"};  // v4l2 | file
    int device_index{0};
    std::string video_path;
    int width{1920};
    int height{1080};
    bool disable_autofocus{true};
};

struct InteractionConfig {
    int zone_filter_size{10};
    double touch_threshold_cm{2.0};  // max |z| above the map plane that counts as touching
    double cue_cooldown_s{0.5};
};

struct AudioConfig {
    std::string player_command{"paplay"};
};

struct DebugConfig {
    bool show_window{true};
    bool log_frame_skips{false};
    bool log_stats{false};
};

struct AppConfig {
    CameraConfig camera;
    InteractionConfig interaction;
    AudioConfig audio;
    DebugConfig debug;
};

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

}  // namespace camio
