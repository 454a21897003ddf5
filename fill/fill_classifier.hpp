#ifndef SNOWFLAKE_FILL_FILL_CLASSIFIER_HPP
#define SNOWFLAKE_FILL_FILL_CLASSIFIER_HPP

#include <symmetry/transform_baker.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace snowflake {

struct FillConfig {
    int resolution = 500;          // raster cells per side
    double canvas_size = 1000.0;   // user units covered by the raster
    int samples_per_curve = 16;    // flattening of curve commands
    int num_threads = 0;           // 0 = auto-detect, > 0 = use specific count
};

// Binary cut / paper classification of the canvas, row-major
class FillMask {
public:
    FillMask() = default;
    FillMask(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    bool is_cut(int x, int y) const { return cells_[index(x, y)] != 0; }
    void set_cut(int x, int y, bool cut) { cells_[index(x, y)] = cut ? 1 : 0; }

    size_t cut_count() const;
    double cut_fraction() const;

    // Binary PGM (P5), cut cells white, paper black
    std::string to_pgm() const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> cells_;

    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }
};

// Even-odd classification of raster cell centres against the combined baked
// path set. Open subpaths are closed implicitly, as a fill would close them.
class FillClassifier {
public:
    explicit FillClassifier(const FillConfig& config = FillConfig{});

    FillMask classify(const std::vector<BakedPath>& paths) const;

    const FillConfig& config() const { return config_; }

private:
    FillConfig config_;
};

}  // namespace snowflake

#endif // SNOWFLAKE_FILL_FILL_CLASSIFIER_HPP
