#include "pipeline/interaction_pipeline.hpp"

#include <utility>

#include <opencv2/imgproc.hpp>

#include "markers/marker_detector.hpp"

namespace camio {

namespace {

cv::Mat toGray(const cv::Mat& frame) {
    if (frame.empty() || frame.channels() == 1) {
        return frame;
    }
    cv::Mat gray;
    cv::cvtColor(frame, gray, frame.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    return gray;
}

std::unique_ptr<MarkerDetector> makeDetector(const MarkerLayout& layout, std::string& error) {
    int dict_id = 0;
    if (!arucoDictionaryFromString(layout.dictionary, dict_id)) {
        error = "unsupported arucoType: " + layout.dictionary;
        return nullptr;
    }
    return std::make_unique<ArucoMarkerDetector>(dict_id);
}

}  // namespace

InteractionPipeline::InteractionPipeline(
    ModelLocator model_locator,
    PointerLocator pointer_locator,
    ZoneClassifier zone_classifier,
    InteractionDispatcher dispatcher)
    : model_locator_(std::move(model_locator)),
      pointer_locator_(std::move(pointer_locator)),
      zone_classifier_(std::move(zone_classifier)),
      dispatcher_(std::move(dispatcher)) {}

FrameResult InteractionPipeline::processFrame(const cv::Mat& frame, int64_t now_ns) {
    const cv::Mat gray = toGray(frame);
    FrameResult result;
    result.map_pose = model_locator_.locate(gray);
    if (result.map_pose) {
        result.tip_cm = pointer_locator_.locate(gray, *result.map_pose);
    }
    return finishFrame(std::move(result), now_ns);
}

FrameResult InteractionPipeline::processObservations(
    const std::vector<MarkerObservation>& observations,
    int64_t now_ns) {
    FrameResult result;
    result.map_pose = model_locator_.locateFromObservations(observations);
    if (result.map_pose) {
        result.tip_cm = pointer_locator_.locateFromObservations(observations, *result.map_pose);
    }
    return finishFrame(std::move(result), now_ns);
}

FrameResult InteractionPipeline::finishFrame(FrameResult result, int64_t now_ns) {
    if (result.tip_cm) {
        result.zone = zone_classifier_.classify(*result.tip_cm);
    }
    if (result.touching()) {
        result.cue_triggered = dispatcher_.dispatch(*result.zone, now_ns);
    }
    telemetry_.recordFrame(
        result.map_pose.has_value(),
        result.tip_cm.has_value(),
        result.touching(),
        result.cue_triggered);
    return result;
}

std::unique_ptr<InteractionPipeline> makeArucoPipeline(
    const MapModel& map,
    const MarkerLayout& stylus,
    const CameraCalibrationData& calibration,
    const InteractionConfig& interaction,
    AudioBackend& audio,
    int64_t start_ns,
    std::string& error) {
    ZoneMap zone_map(cv::Mat(), map.pixels_per_cm, map.hotspots);
    if (!zone_map.loadImage(map.zone_image_path, error)) {
        return nullptr;
    }

    auto map_detector = makeDetector(map.layout, error);
    if (!map_detector) {
        return nullptr;
    }
    auto stylus_detector = makeDetector(stylus, error);
    if (!stylus_detector) {
        return nullptr;
    }

    const PoseEstimator estimator(calibration.K);
    error.clear();
    return std::make_unique<InteractionPipeline>(
        ModelLocator(map.layout, estimator, std::move(map_detector)),
        PointerLocator(stylus, estimator, std::move(stylus_detector)),
        ZoneClassifier(std::move(zone_map), interaction.zone_filter_size, interaction.touch_threshold_cm),
        InteractionDispatcher(map.hotspots, audio, interaction.cue_cooldown_s, start_ns));
}

}  // namespace camio
