#include "core/config.hpp"

#include <fstream>

#include <opencv2/core.hpp>

namespace camio {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

// FileStorage has no boolean type: accept 0/1 or a true/false string.
void readBoolOrDefault(const cv::FileNode& node, const char* key, bool& out) {
    const cv::FileNode child = node[key];
    if (child.empty()) {
        return;
    }
    if (child.isString()) {
        const std::string v = static_cast<std::string>(child);
        out = (v == "true" || v == "True" || v == "1");
        return;
    }
    int v = out ? 1 : 0;
    child >> v;
    out = (v != 0);
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool toBool(const std::string& v, bool& out) {
    const std::string t = trim(v);
    if (t == "true" || t == "True" || t == "1") {
        out = true;
        return true;
    }
    if (t == "false" || t == "False" || t == "0") {
        out = false;
        return true;
    }
    return false;
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == '%') {
            continue;
        }

        // section header, e.g. "camera:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (section == "camera") {
                if (key == "source_mode") out.camera.source_mode = value;
                else if (key == "device_index") out.camera.device_index = std::stoi(value);
                else if (key == "video_path") out.camera.video_path = value;
                else if (key == "width") out.camera.width = std::stoi(value);
                else if (key == "height") out.camera.height = std::stoi(value);
                else if (key == "disable_autofocus") {
                    bool b = out.camera.disable_autofocus;
                    if (toBool(value, b)) out.camera.disable_autofocus = b;
                }
            } else if (section == "interaction") {
                if (key == "zone_filter_size") out.interaction.zone_filter_size = std::stoi(value);
                else if (key == "touch_threshold_cm") out.interaction.touch_threshold_cm = std::stod(value);
                else if (key == "cue_cooldown_s") out.interaction.cue_cooldown_s = std::stod(value);
            } else if (section == "audio") {
                if (key == "player_command") out.audio.player_command = value;
            } else if (section == "debug") {
                bool b = false;
                if (!toBool(value, b)) continue;
                if (key == "show_window") out.debug.show_window = b;
                else if (key == "log_frame_skips") out.debug.log_frame_skips = b;
                else if (key == "log_stats") out.debug.log_stats = b;
            }
        } catch (const std::exception&) {
            // keep defaults/previous values on parse failure
        }
    }

    return validateConfig(out, error);
}

}  // namespace

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (cfg.camera.source_mode != "v4l2" && cfg.camera.source_mode != "file") {
        error = "camera.source_mode must be 'v4l2' or 'file'";
        return false;
    }
    if (cfg.camera.source_mode == "file" && cfg.camera.video_path.empty()) {
        error = "camera.video_path must not be empty when source_mode=file";
        return false;
    }
    if (cfg.camera.device_index < 0) {
        error = "camera.device_index must be >= 0";
        return false;
    }
    if (cfg.camera.width <= 0 || cfg.camera.height <= 0) {
        error = "camera dimensions must be > 0";
        return false;
    }
    if (cfg.interaction.zone_filter_size <= 0) {
        error = "interaction.zone_filter_size must be > 0";
        return false;
    }
    if (cfg.interaction.touch_threshold_cm <= 0.0) {
        error = "interaction.touch_threshold_cm must be > 0";
        return false;
    }
    if (cfg.interaction.cue_cooldown_s < 0.0) {
        error = "interaction.cue_cooldown_s must be >= 0";
        return false;
    }
    if (cfg.audio.player_command.find_first_not_of(" \t") == std::string::npos) {
        error = "audio.player_command must not be empty";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode camera = fs["camera"];
            const cv::FileNode interaction = fs["interaction"];
            const cv::FileNode audio = fs["audio"];
            const cv::FileNode debug = fs["debug"];

            readOrDefault(camera, "source_mode", out.camera.source_mode);
            readOrDefault(camera, "device_index", out.camera.device_index);
            readOrDefault(camera, "video_path", out.camera.video_path);
            readOrDefault(camera, "width", out.camera.width);
            readOrDefault(camera, "height", out.camera.height);
            readBoolOrDefault(camera, "disable_autofocus", out.camera.disable_autofocus);

            readOrDefault(interaction, "zone_filter_size", out.interaction.zone_filter_size);
            readOrDefault(interaction, "touch_threshold_cm", out.interaction.touch_threshold_cm);
            readOrDefault(interaction, "cue_cooldown_s", out.interaction.cue_cooldown_s);

            readOrDefault(audio, "player_command", out.audio.player_command);

            readBoolOrDefault(debug, "show_window", out.debug.show_window);
            readBoolOrDefault(debug, "log_frame_skips", out.debug.log_frame_skips);
            readBoolOrDefault(debug, "log_stats", out.debug.log_stats);

            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace camio
