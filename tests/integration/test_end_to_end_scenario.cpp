#include "pipeline/interaction_pipeline.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "support/synthetic_scene.hpp"

namespace {

class FakeAudioBackend : public camio::AudioBackend {
public:
    bool load(const std::string& path, int& handle, std::string&) override {
        assets.push_back(path);
        handle = static_cast<int>(assets.size()) - 1;
        return true;
    }
    bool play(int handle, std::string&) override {
        played.push_back(assets[static_cast<std::size_t>(handle)]);
        return true;
    }

    std::vector<std::string> assets;
    std::vector<std::string> played;
};

constexpr int64_t kFrameNs = 33000000LL;

std::vector<camio::MarkerObservation> sceneAt(const cv::Point3d& tip) {
    const cv::Matx33d K = camio::testing::testCameraMatrix();
    const camio::Pose map_pose = camio::testing::mapPose();
    const camio::Pose stylus_pose = camio::testing::stylusPoseForTip(map_pose, tip, map_pose.rvec);
    std::vector<camio::MarkerObservation> obs = camio::testing::observe(camio::testing::mapLayout(), map_pose, K);
    const std::vector<camio::MarkerObservation> stylus =
        camio::testing::observe(camio::testing::stylusLayout(), stylus_pose, K);
    obs.insert(obs.end(), stylus.begin(), stylus.end());
    return obs;
}

}  // namespace

int main() {
    const camio::PoseEstimator estimator(camio::testing::testCameraMatrix());
    FakeAudioBackend audio;
    camio::InteractionPipeline pipeline(
        camio::ModelLocator(camio::testing::mapLayout(), estimator, nullptr),
        camio::PointerLocator(camio::testing::stylusLayout(), estimator, nullptr),
        camio::ZoneClassifier(camio::ZoneMap(camio::testing::twoZoneImageBgr(), 10.0, camio::testing::twoZoneHotspots())),
        camio::InteractionDispatcher(camio::testing::twoZoneHotspots(), audio, 0.5, 0));

    int64_t now_ns = 0;
    int cues = 0;
    camio::FrameResult last;

    // Touch the west region for ~1 s: one cue, once the startup cooldown ends.
    const std::vector<camio::MarkerObservation> west = sceneAt(cv::Point3d(5.0, 5.0, 0.5));
    for (int i = 0; i < 30; ++i, now_ns += kFrameNs) {
        last = pipeline.processObservations(west, now_ns);
        if (!last.map_pose || !last.tip_cm) {
            std::cerr << "frame " << i << ": map and pointer must be located\n";
            return 1;
        }
        if (last.cue_triggered) {
            ++cues;
            if (now_ns < 500000000LL) {
                std::cerr << "cue before the startup cooldown at " << now_ns << " ns\n";
                return 1;
            }
        }
    }
    if (cues != 1 || audio.played.size() != 1U || audio.played[0] != "west.wav") {
        std::cerr << "expected exactly one west cue, got " << cues << "\n";
        return 1;
    }
    if (!last.touching() || *last.zone != 0) {
        std::cerr << "expected zone 0 while touching west\n";
        return 1;
    }
    const cv::Point3d tip = *last.tip_cm;
    if (std::abs(tip.x - 5.0) > 0.05 || std::abs(tip.y - 5.0) > 0.05 || std::abs(tip.z - 0.5) > 0.05) {
        std::cerr << "tip position off: " << tip << "\n";
        return 1;
    }

    // Slide east: the debounced zone flips and a second cue plays.
    const std::vector<camio::MarkerObservation> east = sceneAt(cv::Point3d(15.0, 5.0, 0.5));
    cues = 0;
    for (int i = 0; i < 30; ++i, now_ns += kFrameNs) {
        last = pipeline.processObservations(east, now_ns);
        if (last.cue_triggered) {
            ++cues;
        }
    }
    if (cues != 1 || audio.played.size() != 2U || audio.played[1] != "east.wav" || *last.zone != 1) {
        std::cerr << "expected exactly one east cue, got " << cues << "\n";
        return 1;
    }

    // Lift the stylus: still tracked, but hovering never reports a zone.
    const std::vector<camio::MarkerObservation> lifted = sceneAt(cv::Point3d(15.0, 5.0, 3.0));
    for (int i = 0; i < 10; ++i, now_ns += kFrameNs) {
        last = pipeline.processObservations(lifted, now_ns);
        if (!last.tip_cm || !last.zone || *last.zone != camio::kNoZone || last.touching() || last.cue_triggered) {
            std::cerr << "hovering frame must have a tip but no zone\n";
            return 1;
        }
    }

    // Touch down in the same zone again: no repeat cue.
    for (int i = 0; i < 20; ++i, now_ns += kFrameNs) {
        last = pipeline.processObservations(east, now_ns);
        if (last.cue_triggered) {
            std::cerr << "re-entering the last zone must stay silent\n";
            return 1;
        }
    }

    const camio::TelemetrySnapshot stats = pipeline.telemetry().snapshot();
    if (stats.frames != 90U || stats.map_located != 90U || stats.pointer_located != 90U || stats.cues != 2U) {
        std::cerr << "telemetry mismatch: frames=" << stats.frames << " cues=" << stats.cues << "\n";
        return 1;
    }
    return 0;
}
