#include "gatesense/discovery/SpatialClusterer.h"
#include "gatesense/discovery/Geo.h"
#include "../db_core/TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>
#include <utility>

namespace gatesense {

namespace {

constexpr double kMetersPerDegree = kEarthRadiusMeters * 3.14159265358979323846 / 180.0;

// Union-find with path halving; roots are the smallest index of a component
class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), size_t{0});
    }
    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }
    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }
private:
    std::vector<size_t> parent_;
};

struct CellHash {
    size_t operator()(const std::pair<int64_t, int64_t>& c) const {
        return std::hash<int64_t>()(c.first * 73856093LL) ^ std::hash<int64_t>()(c.second * 19349663LL);
    }
};

} // namespace

SpatialClusterer::SpatialClusterer(const AdaptiveThresholdConfig& cfg)
    : epsilon_m_(cfg.cluster_epsilon_meters),
      min_samples_(cfg.min_samples_for_gate),
      max_variance_m2_(cfg.max_spatial_variance_m2) {}

ClusterRun SpatialClusterer::run(const std::vector<CheckinEvent>& scans) const {
    ClusterRun out;

    std::vector<const CheckinEvent*> points;
    points.reserve(scans.size());
    for (const auto& s : scans) {
        if (s.location && isValidCoordinate(s.location->lat, s.location->lon)) points.push_back(&s);
    }
    std::sort(points.begin(), points.end(),
              [](const CheckinEvent* a, const CheckinEvent* b) { return a->id < b->id; });
    out.input_points = static_cast<int>(points.size());
    if (points.empty()) return out;

    // grid cell size from the widest latitude so a cell never spans less than epsilon
    double max_abs_lat = 0.0;
    for (const auto* p : points) max_abs_lat = std::max(max_abs_lat, std::fabs(p->location->lat));
    const double cos_lat = std::max(std::cos(std::min(max_abs_lat, 89.9) * 3.14159265358979323846 / 180.0), 1e-6);
    const double lat_step = epsilon_m_ / kMetersPerDegree;
    const double lon_step = epsilon_m_ / (kMetersPerDegree * cos_lat);

    auto cellOf = [&](const CheckinEvent* p) {
        return std::make_pair(static_cast<int64_t>(std::floor(p->location->lat / lat_step)),
                              static_cast<int64_t>(std::floor(p->location->lon / lon_step)));
    };

    std::unordered_map<std::pair<int64_t, int64_t>, std::vector<size_t>, CellHash> grid;
    for (size_t i = 0; i < points.size(); ++i) grid[cellOf(points[i])].push_back(i);

    DisjointSet sets(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        const auto cell = cellOf(points[i]);
        const GeoPoint pi = toPoint(*points[i]->location);
        for (int64_t dy = -1; dy <= 1; ++dy) {
            for (int64_t dx = -1; dx <= 1; ++dx) {
                auto it = grid.find({cell.first + dy, cell.second + dx});
                if (it == grid.end()) continue;
                for (size_t j : it->second) {
                    if (j <= i) continue;
                    if (haversineMeters(pi, toPoint(*points[j]->location)) <= epsilon_m_) {
                        sets.unite(i, j);
                    }
                }
            }
        }
    }

    // components keyed by root; members stay in ascending id order
    std::map<size_t, std::vector<const CheckinEvent*>> components;
    for (size_t i = 0; i < points.size(); ++i) components[sets.find(i)].push_back(points[i]);

    for (const auto& [root, members] : components) {
        if (static_cast<int>(members.size()) < min_samples_) {
            out.noise_points += static_cast<int>(members.size());
            continue;
        }
        ScanCluster c = summarize(members);
        if (c.spatial_variance_m2 > max_variance_m2_) {
            ++out.rejected_by_variance;
            continue;
        }
        out.clusters.push_back(std::move(c));
    }

    std::sort(out.clusters.begin(), out.clusters.end(), [](const ScanCluster& a, const ScanCluster& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a.member_ids.front() < b.member_ids.front();
    });
    return out;
}

ScanCluster SpatialClusterer::summarize(const std::vector<const CheckinEvent*>& members) const {
    ScanCluster c;
    double sum_lat = 0.0, sum_lon = 0.0, sum_acc = 0.0;
    int with_acc = 0;
    for (const auto* m : members) {
        c.member_ids.push_back(m->id);
        sum_lat += m->location->lat;
        sum_lon += m->location->lon;
        if (m->location->accuracy_m) { sum_acc += *m->location->accuracy_m; ++with_acc; }

        if (c.first_seen.empty() || m->timestamp < c.first_seen) c.first_seen = m->timestamp;
        if (c.last_seen.empty() || m->timestamp > c.last_seen) c.last_seen = m->timestamp;
        c.categories[m->category] += 1;
        c.hourly[TimeUtils::getHourOfDay(m->timestamp)] += 1;
    }
    const double n = static_cast<double>(members.size());
    c.centroid = GeoPoint{sum_lat / n, sum_lon / n};
    c.mean_accuracy_m = with_acc > 0 ? sum_acc / with_acc : 0.0;

    double sum_sq = 0.0;
    for (const auto* m : members) {
        const double d = haversineMeters(c.centroid, toPoint(*m->location));
        sum_sq += d * d;
    }
    c.spatial_variance_m2 = sum_sq / n;
    return c;
}

} // namespace gatesense
