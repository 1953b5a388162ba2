#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "camera/camera_calibration.hpp"
#include "core/config.hpp"
#include "core/telemetry.hpp"
#include "core/types.hpp"
#include "interaction/interaction_dispatcher.hpp"
#include "interaction/zone_classifier.hpp"
#include "model/model_config.hpp"
#include "pose/model_locator.hpp"
#include "pose/pointer_locator.hpp"

namespace camio {

// Per-stage outcome of one frame. A stage only runs when the previous one
// produced a value; an empty optional means "skipped", never an error.
struct FrameResult {
    std::optional<Pose> map_pose;
    std::optional<cv::Point3d> tip_cm;
    std::optional<int> zone;  // debounced, kNoZone when hovering or off-zone
    bool cue_triggered{false};

    bool touching() const { return zone.has_value() && *zone != kNoZone; }
};

class InteractionPipeline {
public:
    InteractionPipeline(
        ModelLocator model_locator,
        PointerLocator pointer_locator,
        ZoneClassifier zone_classifier,
        InteractionDispatcher dispatcher);

    // frame: BGR or gray.
    FrameResult processFrame(const cv::Mat& frame, int64_t now_ns);
    // Same stages, fed with detector output directly (replay and tests).
    FrameResult processObservations(const std::vector<MarkerObservation>& observations, int64_t now_ns);

    const ModelLocator& modelLocator() const { return model_locator_; }
    const PointerLocator& pointerLocator() const { return pointer_locator_; }
    const ZoneClassifier& zoneClassifier() const { return zone_classifier_; }
    const InteractionDispatcher& dispatcher() const { return dispatcher_; }
    const Telemetry& telemetry() const { return telemetry_; }
    Telemetry& telemetry() { return telemetry_; }

private:
    FrameResult finishFrame(FrameResult result, int64_t now_ns);

    ModelLocator model_locator_;
    PointerLocator pointer_locator_;
    ZoneClassifier zone_classifier_;
    InteractionDispatcher dispatcher_;
    Telemetry telemetry_;
};

// Wires ArUco detectors, the zone image and the dispatcher from loaded
// configuration. Fails when the zone image or a dictionary is unusable.
std::unique_ptr<InteractionPipeline> makeArucoPipeline(
    const MapModel& map,
    const MarkerLayout& stylus,
    const CameraCalibrationData& calibration,
    const InteractionConfig& interaction,
    AudioBackend& audio,
    int64_t start_ns,
    std::string& error);

}  // namespace camio
