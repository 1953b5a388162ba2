#include "core/time_utils.hpp"
#include "interaction/interaction_dispatcher.hpp"
#include "interaction/zone_classifier.hpp"
#include "pose/model_locator.hpp"
#include "pose/pointer_locator.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "support/synthetic_scene.hpp"

namespace {

class NullAudioBackend : public camio::AudioBackend {
public:
    bool load(const std::string&, int& handle, std::string&) override {
        handle = 0;
        return true;
    }
    bool play(int, std::string&) override {
        ++plays;
        return true;
    }

    uint64_t plays{0};
};

int64_t pct(std::vector<int64_t>& v, double p) {
    if (v.empty()) return 0;
    std::sort(v.begin(), v.end());
    const std::size_t idx = static_cast<std::size_t>(p * static_cast<double>(v.size() - 1));
    return v[idx];
}

}  // namespace

int main() {
    constexpr int kCount = 20000;
    constexpr int64_t kFrameNs = 33000000LL;

    const cv::Matx33d K = camio::testing::testCameraMatrix();
    const camio::Pose map_pose = camio::testing::mapPose();
    const camio::PoseEstimator estimator(K);

    // Stylus sweeps across both zones so the filter and dispatcher see traffic.
    std::vector<std::vector<camio::MarkerObservation>> scenes;
    for (int i = 0; i < 64; ++i) {
        const cv::Point3d tip(2.0 + 0.25 * i, 7.5, (i % 16 == 0) ? 3.0 : 0.3);
        const camio::Pose stylus_pose = camio::testing::stylusPoseForTip(map_pose, tip, map_pose.rvec);
        std::vector<camio::MarkerObservation> obs = camio::testing::observe(camio::testing::mapLayout(), map_pose, K);
        const auto stylus = camio::testing::observe(camio::testing::stylusLayout(), stylus_pose, K);
        obs.insert(obs.end(), stylus.begin(), stylus.end());
        scenes.push_back(obs);
    }

    camio::ModelLocator model_locator(camio::testing::mapLayout(), estimator, nullptr);
    camio::PointerLocator pointer_locator(camio::testing::stylusLayout(), estimator, nullptr);
    camio::ZoneClassifier classifier(
        camio::ZoneMap(camio::testing::twoZoneImageBgr(), 10.0, camio::testing::twoZoneHotspots()));
    NullAudioBackend audio;
    camio::InteractionDispatcher dispatcher(camio::testing::twoZoneHotspots(), audio, 0.5, 0);

    std::vector<int64_t> map_ns;
    std::vector<int64_t> pointer_ns;
    std::vector<int64_t> zone_ns;
    std::vector<int64_t> e2e;
    map_ns.reserve(kCount);
    pointer_ns.reserve(kCount);
    zone_ns.reserve(kCount);
    e2e.reserve(kCount);

    uint64_t located = 0;
    const int64_t t_start = camio::nowSteadyNs();
    for (int i = 0; i < kCount; ++i) {
        const auto& obs = scenes[static_cast<std::size_t>(i / 8) % scenes.size()];
        const int64_t t0 = camio::nowSteadyNs();
        const auto pose = model_locator.locateFromObservations(obs);
        const int64_t t1 = camio::nowSteadyNs();
        std::optional<cv::Point3d> tip;
        if (pose) {
            tip = pointer_locator.locateFromObservations(obs, *pose);
        }
        const int64_t t2 = camio::nowSteadyNs();
        if (tip) {
            ++located;
            const int zone = classifier.classify(*tip);
            (void)dispatcher.dispatch(zone, static_cast<int64_t>(i) * kFrameNs);
        }
        const int64_t t3 = camio::nowSteadyNs();
        map_ns.push_back(t1 - t0);
        pointer_ns.push_back(t2 - t1);
        zone_ns.push_back(t3 - t2);
        e2e.push_back(t3 - t0);
    }
    const int64_t t_end = camio::nowSteadyNs();
    const double elapsed_s = camio::nsToSeconds(t_end - t_start);
    const double fps = elapsed_s > 0.0 ? static_cast<double>(kCount) / elapsed_s : 0.0;

    std::cout << "benchmark pose_zone_pipeline\n";
    std::cout << "samples " << e2e.size() << "\n";
    std::cout << "located " << located << "\n";
    std::cout << "fps " << fps << "\n";
    std::cout << "map_ns_p50 " << pct(map_ns, 0.50) << "\n";
    std::cout << "map_ns_p95 " << pct(map_ns, 0.95) << "\n";
    std::cout << "map_ns_p99 " << pct(map_ns, 0.99) << "\n";
    std::cout << "pointer_ns_p50 " << pct(pointer_ns, 0.50) << "\n";
    std::cout << "pointer_ns_p95 " << pct(pointer_ns, 0.95) << "\n";
    std::cout << "pointer_ns_p99 " << pct(pointer_ns, 0.99) << "\n";
    std::cout << "zone_ns_p50 " << pct(zone_ns, 0.50) << "\n";
    std::cout << "zone_ns_p95 " << pct(zone_ns, 0.95) << "\n";
    std::cout << "zone_ns_p99 " << pct(zone_ns, 0.99) << "\n";
    std::cout << "e2e_ns_p50 " << pct(e2e, 0.50) << "\n";
    std::cout << "e2e_ns_p95 " << pct(e2e, 0.95) << "\n";
    std::cout << "e2e_ns_p99 " << pct(e2e, 0.99) << "\n";
    std::cout << "cues " << audio.plays << "\n";
    return 0;
}
