#include "interaction/audio_backend.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace camio {

CommandAudioBackend::CommandAudioBackend(std::string player_command)
    : player_command_(std::move(player_command)) {
    std::istringstream words(player_command_);
    std::string word;
    while (words >> word) {
        player_args_.push_back(word);
    }
}

CommandAudioBackend::~CommandAudioBackend() {
    // Let running cues finish; only collect the ones already done.
    reapFinished();
}

bool CommandAudioBackend::load(const std::string& path, int& handle, std::string& error) {
    if (path.empty() || ::access(path.c_str(), R_OK) != 0) {
        error = "file not found: " + path;
        handle = -1;
        return false;
    }
    assets_.push_back(path);
    handle = static_cast<int>(assets_.size()) - 1;
    error.clear();
    return true;
}

bool CommandAudioBackend::play(int handle, std::string& error) {
    reapFinished();
    if (handle < 0 || handle >= static_cast<int>(assets_.size())) {
        error = "invalid audio handle " + std::to_string(handle);
        return false;
    }

    if (player_args_.empty()) {
        error = "no audio player command configured";
        return false;
    }

    // "<player> [options...] <asset>"
    std::vector<std::string> args = player_args_;
    args.push_back(assets_[static_cast<std::size_t>(handle)]);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) {
        argv.push_back(&a[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        error = "failed to start " + player_command_ + ": " + std::strerror(rc);
        return false;
    }
    children_.push_back(static_cast<int>(pid));
    error.clear();
    return true;
}

void CommandAudioBackend::reapFinished() {
    std::vector<int> still_running;
    still_running.reserve(children_.size());
    for (const int pid : children_) {
        int status = 0;
        const pid_t r = ::waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
        if (r == 0 || (r < 0 && errno == EINTR)) {
            still_running.push_back(pid);
        }
    }
    children_.swap(still_running);
}

}  // namespace camio
