#include "interaction/zone_classifier.hpp"

#include <iostream>

#include "support/synthetic_scene.hpp"

namespace {

camio::ZoneMap makeZoneMap() {
    return camio::ZoneMap(camio::testing::twoZoneImageBgr(), 10.0, camio::testing::twoZoneHotspots());
}

}  // namespace

int main() {
    const camio::ZoneMap zones = makeZoneMap();

    // Raw lookup: BGR image vs RGB hotspot colors.
    if (zones.rawZoneAt(5.0, 5.0) != 0 || zones.rawZoneAt(15.0, 5.0) != 1) {
        std::cerr << "raw zone lookup mismatch\n";
        return 1;
    }
    if (zones.zoneForColor(cv::Vec3b(255, 0, 0)) != camio::kNoZone) {
        std::cerr << "BGR blue must not match RGB red\n";
        return 1;
    }
    if (zones.rawZoneAt(5.0, 0.5) != camio::kNoZone) {
        std::cerr << "unregistered color must be kNoZone\n";
        return 1;
    }
    if (zones.rawZoneAt(-2.0, 5.0) != camio::kNoZone || zones.rawZoneAt(20.0, 5.0) != camio::kNoZone ||
        zones.rawZoneAt(5.0, 15.0) != camio::kNoZone) {
        std::cerr << "out-of-bounds lookup must be kNoZone\n";
        return 1;
    }
    if (zones.rawZoneAt(-0.05, 5.0) != 0) {
        std::cerr << "pixel coordinate must truncate toward zero\n";
        return 1;
    }
    // Exact match only: one step off in any channel misses.
    cv::Mat nearly = camio::testing::twoZoneImageBgr();
    nearly.at<cv::Vec3b>(50, 50) = cv::Vec3b(0, 0, 254);
    const camio::ZoneMap nearly_zones(nearly, 10.0, camio::testing::twoZoneHotspots());
    if (nearly_zones.rawZoneAt(5.0, 5.0) != camio::kNoZone) {
        std::cerr << "color match must be exact\n";
        return 1;
    }

    // Same zone K times yields that zone.
    camio::ZoneClassifier classifier(makeZoneMap());
    int zone = camio::kNoZone;
    for (int i = 0; i < camio::ZoneClassifier::kDefaultFilterSize; ++i) {
        zone = classifier.classify(cv::Point3d(15.0, 5.0, 0.5));
    }
    if (zone != 1) {
        std::cerr << "10 identical samples must yield zone 1, got " << zone << "\n";
        return 1;
    }

    // Tie regression: cursor wrapped, so the buffer reads 0 0 0 0 0 1 1 1 1 1
    // and the value in slot 0 wins.
    for (int i = 0; i < 4; ++i) {
        zone = classifier.classify(cv::Point3d(5.0, 5.0, 0.0));
    }
    if (zone != 1) {
        std::cerr << "4/6 minority must not switch zones, got " << zone << "\n";
        return 1;
    }
    zone = classifier.classify(cv::Point3d(5.0, 5.0, 0.0));
    if (zone != 0) {
        std::cerr << "5/5 tie must resolve to slot 0 value (zone 0), got " << zone << "\n";
        return 1;
    }

    // Alternating pattern from a fresh filter: 0 1 0 1 0 1 0 1 0 1.
    camio::ZoneClassifier alternating(makeZoneMap());
    for (int i = 0; i < 10; ++i) {
        zone = alternating.classify(cv::Point3d(i % 2 == 0 ? 5.0 : 15.0, 5.0, 0.0));
    }
    if (zone != 0) {
        std::cerr << "alternating 0/1 tie must resolve to zone 0, got " << zone << "\n";
        return 1;
    }

    // Z gate: hovering is never a zone, but the sample is still recorded.
    camio::ZoneClassifier gated(makeZoneMap());
    for (int i = 0; i < 10; ++i) {
        zone = gated.classify(cv::Point3d(5.0, 5.0, 2.0));
        if (zone != camio::kNoZone) {
            std::cerr << "|z| >= 2 cm must yield kNoZone\n";
            return 1;
        }
    }
    if (gated.classify(cv::Point3d(5.0, 5.0, -2.5)) != camio::kNoZone) {
        std::cerr << "negative standoff beyond threshold must yield kNoZone\n";
        return 1;
    }
    if (gated.classify(cv::Point3d(5.0, 5.0, -1.9)) != 0) {
        std::cerr << "samples recorded while hovering must count once touching\n";
        return 1;
    }
    if (gated.lastRawZone() != 0) {
        std::cerr << "lastRawZone mismatch\n";
        return 1;
    }

    camio::ZoneClassifier custom(makeZoneMap(), 3, 0.5);
    custom.classify(cv::Point3d(15.0, 5.0, 0.1));
    if (custom.classify(cv::Point3d(15.0, 5.0, 0.1)) != 1 || custom.classify(cv::Point3d(15.0, 5.0, 0.6)) != camio::kNoZone) {
        std::cerr << "configured window/threshold mismatch\n";
        return 1;
    }

    return 0;
}
