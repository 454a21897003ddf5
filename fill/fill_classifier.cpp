#include "fill_classifier.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace snowflake {

namespace {

struct Edge {
    Vec2 a;
    Vec2 b;
};

std::vector<Edge> collect_edges(const std::vector<BakedPath>& paths, int samples_per_curve) {
    std::vector<Edge> edges;
    for (const auto& baked : paths) {
        for (const auto& polyline : baked.path.to_polylines(samples_per_curve)) {
            if (polyline.size() < 2) {
                continue;
            }
            for (size_t i = 0; i + 1 < polyline.size(); ++i) {
                edges.push_back(Edge{polyline[i], polyline[i + 1]});
            }
            if (polyline.front() != polyline.back()) {
                edges.push_back(Edge{polyline.back(), polyline.front()});
            }
        }
    }
    return edges;
}

}  // namespace

FillMask::FillMask(int width, int height)
    : width_(width), height_(height),
      cells_(static_cast<size_t>(width) * static_cast<size_t>(height), 0) {}

size_t FillMask::cut_count() const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), uint8_t{1}));
}

double FillMask::cut_fraction() const {
    if (cells_.empty()) {
        return 0.0;
    }
    return static_cast<double>(cut_count()) / static_cast<double>(cells_.size());
}

std::string FillMask::to_pgm() const {
    std::ostringstream ss;
    ss << "P5\n" << width_ << ' ' << height_ << "\n255\n";
    for (uint8_t cell : cells_) {
        ss.put(cell ? static_cast<char>(255) : static_cast<char>(0));
    }
    return ss.str();
}

FillClassifier::FillClassifier(const FillConfig& config) : config_(config) {
    if (config_.resolution <= 0) {
        throw std::invalid_argument("fill resolution must be positive");
    }
}

FillMask FillClassifier::classify(const std::vector<BakedPath>& paths) const {
    const int n = config_.resolution;
    const double cell = config_.canvas_size / static_cast<double>(n);
    FillMask mask(n, n);

    std::vector<Edge> edges = collect_edges(paths, config_.samples_per_curve);
    if (edges.empty()) {
        return mask;
    }

#ifdef _OPENMP
    if (config_.num_threads > 0) {
        omp_set_num_threads(config_.num_threads);
    }
#endif

    // Rows are independent: each writes only its own cells
    #pragma omp parallel for schedule(static) if(n > 50)
    for (int row = 0; row < n; ++row) {
        double y = (static_cast<double>(row) + 0.5) * cell;
        std::vector<double> crossings;

        for (const auto& edge : edges) {
            // Half-open rule so shared vertices are counted once
            if ((edge.a.y <= y) != (edge.b.y <= y)) {
                double t = (y - edge.a.y) / (edge.b.y - edge.a.y);
                crossings.push_back(edge.a.x + t * (edge.b.x - edge.a.x));
            }
        }

        std::sort(crossings.begin(), crossings.end());

        for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
            // Cells whose centre lies in [x0, x1)
            int first = static_cast<int>(std::ceil(crossings[i] / cell - 0.5));
            int last = static_cast<int>(std::ceil(crossings[i + 1] / cell - 0.5)) - 1;
            first = std::max(first, 0);
            last = std::min(last, n - 1);
            for (int col = first; col <= last; ++col) {
                mask.set_cut(col, row, true);
            }
        }
    }

    logging::get_logger()->debug("Fill classification: {} edges, {:.1f}% cut",
                                 edges.size(), mask.cut_fraction() * 100.0);
    return mask;
}

}  // namespace snowflake
