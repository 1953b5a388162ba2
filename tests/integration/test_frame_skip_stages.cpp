#include "pipeline/interaction_pipeline.hpp"

#include <iostream>
#include <string>
#include <vector>

#include "support/synthetic_scene.hpp"

namespace {

class SilentAudioBackend : public camio::AudioBackend {
public:
    bool load(const std::string&, int& handle, std::string&) override {
        handle = 0;
        return true;
    }
    bool play(int, std::string&) override {
        ++plays;
        return true;
    }

    int plays{0};
};

// Replays a fixed observation list as if it came from the camera.
class ScriptedDetector : public camio::MarkerDetector {
public:
    explicit ScriptedDetector(std::vector<camio::MarkerObservation>* source) : source_(source) {}

    std::vector<camio::MarkerObservation> detect(const cv::Mat&) override {
        return *source_;
    }

private:
    std::vector<camio::MarkerObservation>* source_;
};

}  // namespace

int main() {
    const cv::Matx33d K = camio::testing::testCameraMatrix();
    const camio::Pose map_pose = camio::testing::mapPose();
    const camio::PoseEstimator estimator(K);

    std::vector<camio::MarkerObservation> visible;
    SilentAudioBackend audio;
    camio::InteractionPipeline pipeline(
        camio::ModelLocator(camio::testing::mapLayout(), estimator, std::make_unique<ScriptedDetector>(&visible)),
        camio::PointerLocator(camio::testing::stylusLayout(), estimator, std::make_unique<ScriptedDetector>(&visible)),
        camio::ZoneClassifier(camio::ZoneMap(camio::testing::twoZoneImageBgr(), 10.0, camio::testing::twoZoneHotspots())),
        camio::InteractionDispatcher(camio::testing::twoZoneHotspots(), audio, 0.5, 0));

    const cv::Mat frame(720, 1280, CV_8UC3, cv::Scalar(255, 255, 255));

    // Nothing visible: map stage fails, later stages never run.
    camio::FrameResult r = pipeline.processFrame(frame, 0);
    if (r.map_pose || r.tip_cm || r.zone || r.cue_triggered) {
        std::cerr << "empty frame must skip every stage\n";
        return 1;
    }
    if (pipeline.modelLocator().solver().lastStatus() != camio::LayoutStatus::NoMarkers ||
        pipeline.pointerLocator().solver().lastStatus() != camio::LayoutStatus::NotRun) {
        std::cerr << "pointer stage must not run without a map pose\n";
        return 1;
    }

    // Stylus alone does not locate the map.
    const camio::Pose stylus_pose = camio::testing::stylusPoseForTip(map_pose, cv::Point3d(5.0, 5.0, 0.0), map_pose.rvec);
    visible = camio::testing::observe(camio::testing::stylusLayout(), stylus_pose, K);
    r = pipeline.processFrame(frame, 1000000000LL);
    if (r.map_pose || r.tip_cm) {
        std::cerr << "stylus without map must not produce a tip\n";
        return 1;
    }

    // One map marker is exactly four correspondences: enough for a pose.
    std::vector<camio::MarkerObservation> map_obs = camio::testing::observe(camio::testing::mapLayout(), map_pose, K);
    visible = {map_obs[2]};
    r = pipeline.processFrame(frame, 2000000000LL);
    if (!r.map_pose || r.tip_cm || r.zone) {
        std::cerr << "map without pointer must stop after the map stage\n";
        return 1;
    }
    if (pipeline.pointerLocator().solver().lastStatus() != camio::LayoutStatus::NoMarkers) {
        std::cerr << "pointer stage must report no markers\n";
        return 1;
    }

    // Unknown ids are ignored rather than failing the frame.
    camio::MarkerObservation stray = map_obs[0];
    stray.id = 42;
    visible = {stray};
    r = pipeline.processFrame(frame, 3000000000LL);
    if (r.map_pose) {
        std::cerr << "ids outside the layout must not locate the map\n";
        return 1;
    }

    // Full scene, tip off the zone image: tracked, never touching.
    visible = map_obs;
    const camio::Pose off_map = camio::testing::stylusPoseForTip(map_pose, cv::Point3d(-5.0, 5.0, 0.0), map_pose.rvec);
    const std::vector<camio::MarkerObservation> stylus_obs = camio::testing::observe(camio::testing::stylusLayout(), off_map, K);
    visible.insert(visible.end(), stylus_obs.begin(), stylus_obs.end());
    for (int i = 0; i < 12; ++i) {
        r = pipeline.processFrame(frame, 4000000000LL + i * 33000000LL);
        if (!r.map_pose || !r.tip_cm || !r.zone || *r.zone != camio::kNoZone || r.cue_triggered) {
            std::cerr << "tip outside the zone image must classify as no zone\n";
            return 1;
        }
    }
    if (audio.plays != 0) {
        std::cerr << "no cue may play in this scenario\n";
        return 1;
    }

    const camio::TelemetrySnapshot stats = pipeline.telemetry().snapshot();
    if (stats.frames != 16U || stats.map_located != 13U || stats.pointer_located != 12U || stats.touching != 0U) {
        std::cerr << "telemetry mismatch\n";
        return 1;
    }
    return 0;
}
