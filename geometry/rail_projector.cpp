#include "rail_projector.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>

namespace coasterpath {

int RailConfig::support_interval(size_t sample_intervals, size_t point_count) const {
    size_t slots = std::min(point_count * static_cast<size_t>(std::max(supports_per_point, 0)),
                            static_cast<size_t>(std::max(max_supports, 0)));
    if (slots == 0) {
        return 0;
    }
    return std::max(1, static_cast<int>(sample_intervals / slots));
}

Vec3 rail_normal(const Vec3& tangent, const Vec3& fallback, float min_length) {
    return Vec3(-tangent.z, 0.0f, tangent.x).normalized_or(fallback, min_length);
}

RailGeometry project_rails(const std::vector<CurveSample>& samples,
                           size_t point_count,
                           const RailConfig& config) {
    RailGeometry rails;
    if (samples.empty()) {
        return rails;
    }

    rails.left_rail.reserve(samples.size());
    rails.right_rail.reserve(samples.size());
    rails.normals.reserve(samples.size());

    // Heading +X gives +Z; also the seed for a vertical first sample
    Vec3 normal = vec3::unit_z();
    size_t degenerate = 0;

    for (const auto& sample : samples) {
        if (sample.tangent.horizontal().length() < config.min_normal_length) {
            ++degenerate;
        }
        normal = rail_normal(sample.tangent, normal, config.min_normal_length);

        rails.normals.push_back(normal);
        rails.left_rail.push_back(sample.position + normal * config.rail_offset);
        rails.right_rail.push_back(sample.position - normal * config.rail_offset);
    }

    const size_t intervals = samples.size() - 1;
    int stride = config.support_interval(intervals, point_count);
    if (stride > 0) {
        for (size_t i = 0; i <= intervals; i += static_cast<size_t>(stride)) {
            const Vec3& top = samples[i].position;
            if (top.y <= config.ground_threshold) {
                continue;
            }

            SupportPillar pillar;
            pillar.top = top;
            pillar.base = Vec3(top.x, config.ground_level, top.z);
            pillar.height = top.y - config.ground_level;
            pillar.top_radius = config.support_top_radius;
            pillar.base_radius = config.support_base_radius;
            rails.supports.push_back(pillar);
        }
    }

    if (config.crosstie_interval > 0) {
        for (size_t i = 0; i < samples.size(); i += static_cast<size_t>(config.crosstie_interval)) {
            const auto& sample = samples[i];
            Crosstie tie;
            tie.center = sample.position - Vec3(0.0f, config.crosstie_drop, 0.0f);
            tie.yaw = std::atan2(sample.tangent.x, sample.tangent.z);
            tie.width = config.crosstie_width;
            rails.crossties.push_back(tie);
        }
    }

    logging::get_logger()->debug(
        "RailProjector: {} samples, {} supports, {} crossties ({} vertical samples)",
        samples.size(), rails.supports.size(), rails.crossties.size(), degenerate);

    return rails;
}

RailGeometry project_rails(const TrackCurve& curve, const RailConfig& config) {
    return project_rails(curve.sample(), curve.point_count(), config);
}

}  // namespace coasterpath
