#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "pc_engine/board.hpp"

namespace pc_engine {

class ModelLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Activation { Linear, Relu, Tanh };

struct Layer {
    std::size_t inputs{0};
    std::size_t outputs{0};
    // Row-major, one row of `inputs` weights per output.
    std::vector<float> weights;
    std::vector<float> biases;
    Activation activation{Activation::Linear};
};

inline constexpr std::size_t kFeatureCount = 6;

struct Features {
    float holes{0.0f};
    float bumpiness{0.0f};
    float row_transitions{0.0f};
    float column_transitions{0.0f};
    float max_height{0.0f};
    float covered_cells{0.0f};

    std::vector<float> to_vector() const {
        return {holes, bumpiness, row_transitions, column_transitions, max_height, covered_cells};
    }
};

// Features of the rows below `height`.
Features extract_features(const Board& board, int height);

// Feed-forward scorer used to order candidate placements. Higher is better.
class Model {
public:
    explicit Model(std::vector<Layer> layers);

    static Model from_json(std::string_view text);

    double forward(const std::vector<float>& input) const;
    double score(const Board& board, int height) const;
    std::size_t layer_count() const { return layers_.size(); }

private:
    std::vector<Layer> layers_;
};

std::string_view default_model_json();
std::unique_ptr<Model> load_default_model();
std::unique_ptr<Model> load_model_file(const std::string& path);

}  // namespace pc_engine
