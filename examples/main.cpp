#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

#include <datapod/datapod.hpp>

#include "tinwarp/corrector.hpp"
#include "tinwarp/utils/visualize.hpp"

int main() {
    // Control points surveyed in the trusted frame (ENU metres around the datum)
    std::vector<tinwarp::GcpPoint> standard{
        {1, {-120.0, -180.0, 2.1}}, {2, {-10.0, -150.0, 2.6}}, {3, {-115.0, 30.0, 3.4}},
        {4, {5.0, 110.0, 4.0}},     {5, {-80.0, 165.0, 3.7}},  {6, {-195.0, 55.0, 2.9}},
        {7, {-140.0, -85.0, 2.4}},  {8, {-60.0, -20.0, 3.1}},
    };

    // The same points as digitised in the map being corrected: shifted, slightly rotated, flat
    std::vector<tinwarp::GcpPoint> target;
    const double angle = 0.01;
    for (const auto &g : standard) {
        double x = g.position.x * std::cos(angle) - g.position.y * std::sin(angle) - 3.0;
        double y = g.position.x * std::sin(angle) + g.position.y * std::cos(angle) + 1.5;
        target.push_back(tinwarp::GcpPoint{g.id, {x, y, 0.0}});
    }

    // A polyline feature crossing the network, plus one vertex outside it
    std::vector<tinwarp::FeatureVertex> features;
    std::int64_t id = 0;
    for (double t = 0.0; t <= 1.0; t += 0.05)
        features.push_back(tinwarp::FeatureVertex{id++, {-150.0 + 140.0 * t, -120.0 + 220.0 * t, 0.0}});
    features.push_back(tinwarp::FeatureVertex{id++, {400.0, 400.0, 0.0}});

    tinwarp::Config config;
    config.mode = tinwarp::CorrectMode::Vertical3D;
    config.split_unit_number = 8;
    config.verbose = true;

    auto before = features;
    tinwarp::Corrector corrector(target, standard, config);
    auto report = corrector.correct(features);

    std::cout << "Corrected " << report.transformed << " of " << report.vertices << " vertices ("
              << report.unlocated << " outside the network)\n";
    for (std::size_t i = 0; i < 3 && i < features.size(); ++i) {
        const auto &a = before[i].position;
        const auto &b = features[i].position;
        std::cout << "  vertex " << features[i].id << ": (" << a.x << ", " << a.y << ", " << a.z << ") -> (" << b.x
                  << ", " << b.y << ", " << b.z << ")\n";
    }

#ifdef HAS_RERUN
    auto rec = std::make_shared<rerun::RecordingStream>("tinwarp", "space");
    if (rec->connect_grpc("rerun+http://0.0.0.0:9876/proxy").is_err()) {
        std::cerr << "Failed to connect to rerun\n";
        return 1;
    }

    datapod::Geo world_datum{51.98954034749562, 5.6584737410504715, 53.801823};

    tinwarp::visualize::show_tin(corrector.tins().target, rec, "/tin/target", rerun::Color(200, 120, 60));
    tinwarp::visualize::show_tin(corrector.tins().standard, rec, "/tin/standard", world_datum);
    tinwarp::visualize::show_gcps(standard, rec, "/gcps/standard");
    tinwarp::visualize::show_features(before, rec, "/features/before", rerun::Color(120, 70, 70));
    tinwarp::visualize::show_features(features, rec, "/features/after");
#endif

    return 0;
}
