#include "pc_engine/model.hpp"

namespace pc_engine {

namespace {

// Inputs: holes, bumpiness, row transitions, column transitions, max height,
// covered cells. Hidden units track buried cells, surface roughness and height.
constexpr std::string_view kDefaultModel = R"json({
  "inputs": 6,
  "layers": [
    {
      "weights": [
        [1.0, 0.0, 0.0, 0.0, 0.0, 0.25],
        [0.0, 0.5, 0.25, 0.25, 0.0, 0.0],
        [0.0, 0.0, 0.0, 0.0, 1.0, 0.0]
      ],
      "biases": [0.0, 0.0, 0.0],
      "activation": "relu"
    },
    {
      "weights": [[-4.0, -1.0, -0.2]],
      "biases": [0.0],
      "activation": "linear"
    }
  ]
})json";

}  // namespace

std::string_view default_model_json() { return kDefaultModel; }

}  // namespace pc_engine
