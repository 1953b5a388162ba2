#include "camera/camera_calibration.hpp"
#include "camera/camera_ingest.hpp"
#include "core/config.hpp"
#include "core/telemetry.hpp"
#include "core/time_utils.hpp"
#include "debug/overlay_renderer.hpp"
#include "interaction/audio_backend.hpp"
#include "model/model_config.hpp"
#include "pipeline/interaction_pipeline.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

#include <opencv2/highgui.hpp>

namespace {
std::atomic<bool> g_running{true};

void onSigInt(int) {
    g_running.store(false);
}

constexpr const char* kWindowName = "image reprojection";
constexpr const char* kDefaultRuntimeConfig = "config/camio.yaml";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onSigInt);

    const std::string map_path = (argc > 1) ? argv[1] : "UkraineMap.json";
    const std::string camera_path = (argc > 2) ? argv[2] : "camera_parameters.json";
    const std::string stylus_path = (argc > 3) ? argv[3] : "TeardropStylus.json";
    const std::string config_path = (argc > 4) ? argv[4] : kDefaultRuntimeConfig;

    std::string error;
    camio::AppConfig config;
    std::error_code ec;
    if (argc > 4 || std::filesystem::exists(config_path, ec)) {
        if (!camio::loadConfig(config_path, config, error)) {
            std::cerr << "Config load failed: " << error << '\n';
            return 1;
        }
    } else {
        std::cout << "[Config] " << config_path << " not found, using defaults\n";
    }

    camio::MapModel map;
    if (!camio::loadMapModel(map_path, map, error)) {
        std::cerr << "Map load failed: " << error << '\n';
        return 1;
    }
    std::cout << "[CamIO] loaded map parameters from " << map_path
              << " (" << map.layout.markers.size() << " markers, " << map.hotspots.size() << " hotspots)\n";

    camio::CameraCalibration calibration;
    if (!calibration.loadFromFile(camera_path, error)) {
        std::cerr << "Camera parameters load failed: " << error << '\n';
        return 1;
    }
    std::cout << "[CamIO] loaded camera parameters from " << camera_path << '\n';

    camio::MarkerLayout stylus;
    if (!camio::loadStylusLayout(stylus_path, stylus, error)) {
        std::cerr << "Stylus load failed: " << error << '\n';
        return 1;
    }
    std::cout << "[CamIO] loaded stylus parameters from " << stylus_path << '\n';

    camio::CommandAudioBackend audio(config.audio.player_command);
    auto pipeline = camio::makeArucoPipeline(
        map, stylus, calibration.data(), config.interaction, audio, camio::nowSteadyNs(), error);
    if (!pipeline) {
        std::cerr << "Pipeline setup failed: " << error << '\n';
        return 1;
    }

    camio::CameraIngest camera;
    if (!camera.openDevice(config.camera, error)) {
        std::cerr << "Camera open failed: " << error << '\n';
        return 1;
    }
    std::cout << "[CamIO] camera source: " << camera.activeSourceDescription() << '\n';
    std::cout << "[CamIO] press Esc or q in the window (or Ctrl+C) to stop.\n";

    int frame_counter = 0;
    int64_t window_start_ns = camio::nowSteadyNs();

    while (g_running.load()) {
        camio::FramePacket packet;
        if (!camera.captureFrame(packet, error)) {
            std::cout << "[CamIO] " << error << ", stopping.\n";
            break;
        }

        const camio::FrameResult result = pipeline->processFrame(packet.gray, packet.timestamp_ns);

        if (config.debug.log_frame_skips) {
            if (!result.map_pose) {
                const camio::LayoutPoseSolver& solver = pipeline->modelLocator().solver();
                std::cout << "[CamIO] no map markers found (" << camio::layoutStatusName(solver.lastStatus())
                          << ", " << camio::poseErrorName(solver.lastPoseError()) << ")\n";
            } else if (!result.tip_cm) {
                const camio::LayoutPoseSolver& solver = pipeline->pointerLocator().solver();
                std::cout << "[CamIO] no pointer detected (" << camio::layoutStatusName(solver.lastStatus())
                          << ", " << camio::poseErrorName(solver.lastPoseError()) << ")\n";
            }
        }
        if (result.cue_triggered) {
            std::cout << "[CamIO] zone " << *result.zone << ": "
                      << pipeline->dispatcher().state().last_zone_name << '\n';
        }

        frame_counter++;
        const int64_t now_ns = camio::nowSteadyNs();
        if (now_ns - window_start_ns >= 1000000000LL) {
            pipeline->telemetry().setFps(frame_counter);
            frame_counter = 0;
            window_start_ns = now_ns;
            if (config.debug.log_stats) {
                const camio::TelemetrySnapshot s = pipeline->telemetry().snapshot();
                std::cout << "[Stats] fps=" << s.fps << " frames=" << s.frames
                          << " map=" << s.map_located << " pointer=" << s.pointer_located
                          << " touching=" << s.touching << " cues=" << s.cues << '\n';
            }
        }

        if (!config.debug.show_window) {
            continue;
        }

        cv::Mat annotated = packet.raw_bgr.clone();
        camio::OverlayRenderer::drawObservations(
            annotated, pipeline->modelLocator().solver().lastObservations(), cv::Scalar(0, 200, 255));
        if (result.tip_cm) {
            camio::OverlayRenderer::drawObservations(
                annotated, pipeline->pointerLocator().solver().lastObservations(), cv::Scalar(255, 0, 255));
        }
        if (result.map_pose) {
            camio::OverlayRenderer::drawLayoutProjection(
                annotated,
                pipeline->modelLocator().solver().layout(),
                *result.map_pose,
                calibration.data().K);
        }
        camio::OverlayStatus status;
        status.fps = pipeline->telemetry().snapshot().fps;
        status.map_located = result.map_pose.has_value();
        status.map_reprojection_px = pipeline->modelLocator().solver().lastReprojectionError();
        status.pointer_located = result.tip_cm.has_value();
        if (result.tip_cm) {
            status.tip_cm = *result.tip_cm;
        }
        if (result.touching()) {
            status.zone = *result.zone;
            status.zone_name = map.hotspots[static_cast<std::size_t>(*result.zone)].text_description.c_str();
        }
        camio::OverlayRenderer::drawStatus(annotated, status);

        cv::imshow(kWindowName, annotated);
        const int key = cv::waitKey(1);
        if (key == 27 || key == 'q') {
            std::cout << "[CamIO] escape.\n";
            break;
        }
    }

    camera.close();
    if (config.debug.show_window) {
        cv::destroyAllWindows();
    }
    return 0;
}
