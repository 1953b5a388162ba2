#pragma once

#include <string>
#include <vector>

namespace camio {

// Load once, play on demand. play() must not block on playback.
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    virtual bool load(const std::string& path, int& handle, std::string& error) = 0;
    virtual bool play(int handle, std::string& error) = 0;
};

// Plays each cue by spawning "<player_command> <asset>". The command is split
// on whitespace, so options are allowed (e.g. "aplay -q").
class CommandAudioBackend : public AudioBackend {
public:
    explicit CommandAudioBackend(std::string player_command);
    ~CommandAudioBackend() override;

    CommandAudioBackend(const CommandAudioBackend&) = delete;
    CommandAudioBackend& operator=(const CommandAudioBackend&) = delete;

    bool load(const std::string& path, int& handle, std::string& error) override;
    bool play(int handle, std::string& error) override;

private:
    void reapFinished();

    std::string player_command_;
    std::vector<std::string> player_args_;
    std::vector<std::string> assets_;
    std::vector<int> children_;
};

}  // namespace camio
