#include "pc_engine/model.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "nlohmann/json.hpp"

namespace pc_engine {

namespace {

Activation activation_from_string(const std::string& s) {
    if (s == "linear") {
        return Activation::Linear;
    } else if (s == "relu") {
        return Activation::Relu;
    } else if (s == "tanh") {
        return Activation::Tanh;
    }
    throw ModelLoadError("unknown activation: " + s);
}

float activate(Activation activation, float v) {
    switch (activation) {
        case Activation::Linear:
            return v;
        case Activation::Relu:
            return v > 0.0f ? v : 0.0f;
        case Activation::Tanh:
            return std::tanh(v);
    }
    throw std::logic_error("unreachable activation");
}

Layer parse_layer(const nlohmann::json& j) {
    Layer layer;
    const auto& rows = j.at("weights");
    if (!rows.is_array() || rows.empty()) {
        throw ModelLoadError("weights must be a non-empty matrix");
    }
    layer.outputs = rows.size();
    layer.inputs = rows.at(0).size();
    layer.weights.reserve(layer.outputs * layer.inputs);
    for (const auto& row : rows) {
        if (!row.is_array() || row.size() != layer.inputs) {
            throw ModelLoadError("ragged weight matrix");
        }
        for (const auto& w : row) {
            layer.weights.push_back(w.get<float>());
        }
    }
    layer.biases = j.at("biases").get<std::vector<float>>();
    if (j.contains("activation")) {
        layer.activation = activation_from_string(j.at("activation").get<std::string>());
    }
    return layer;
}

inline int column_height(const Board& board, int x, int height) {
    for (int y = height; y > 0; --y) {
        if (board.occupied(x, y - 1)) {
            return y;
        }
    }
    return 0;
}

}  // namespace

Model::Model(std::vector<Layer> layers) : layers_(std::move(layers)) {
    if (layers_.empty()) {
        throw ModelLoadError("model has no layers");
    }
    std::size_t expected_inputs = kFeatureCount;
    for (const auto& layer : layers_) {
        if (layer.inputs != expected_inputs) {
            std::ostringstream oss;
            oss << "layer expects " << layer.inputs << " inputs, previous layer provides " << expected_inputs;
            throw ModelLoadError(oss.str());
        }
        if (layer.outputs == 0 || layer.biases.size() != layer.outputs ||
            layer.weights.size() != layer.inputs * layer.outputs) {
            throw ModelLoadError("layer shape does not match its biases");
        }
        expected_inputs = layer.outputs;
    }
    if (expected_inputs != 1) {
        throw ModelLoadError("final layer must have a single output");
    }
}

Model Model::from_json(std::string_view text) {
    try {
        auto j = nlohmann::json::parse(text.begin(), text.end());
        auto declared_inputs = j.at("inputs").get<std::size_t>();
        if (declared_inputs != kFeatureCount) {
            throw ModelLoadError("model declares " + std::to_string(declared_inputs) + " inputs");
        }
        std::vector<Layer> layers;
        for (const auto& layer : j.at("layers")) {
            layers.push_back(parse_layer(layer));
        }
        return Model(std::move(layers));
    } catch (const nlohmann::json::exception& e) {
        throw ModelLoadError(std::string("malformed model: ") + e.what());
    }
}

double Model::forward(const std::vector<float>& input) const {
    std::vector<float> current = input;
    std::vector<float> next;
    for (const auto& layer : layers_) {
        next.assign(layer.outputs, 0.0f);
        for (std::size_t o = 0; o < layer.outputs; ++o) {
            float sum = layer.biases[o];
            for (std::size_t i = 0; i < layer.inputs; ++i) {
                sum += layer.weights[o * layer.inputs + i] * current[i];
            }
            next[o] = activate(layer.activation, sum);
        }
        std::swap(current, next);
    }
    return static_cast<double>(current.front());
}

double Model::score(const Board& board, int height) const {
    return forward(extract_features(board, height).to_vector());
}

Features extract_features(const Board& board, int height) {
    Features f;
    std::array<int, kBoardWidth> heights{};
    for (int x = 0; x < kBoardWidth; ++x) {
        heights[static_cast<std::size_t>(x)] = column_height(board, x, height);
    }

    for (int x = 0; x < kBoardWidth; ++x) {
        int top = heights[static_cast<std::size_t>(x)];
        int holes_below = 0;
        for (int y = 0; y < top; ++y) {
            if (!board.occupied(x, y)) {
                ++holes_below;
            } else if (holes_below > 0) {
                f.covered_cells += 1.0f;
            }
        }
        f.holes += static_cast<float>(holes_below);
        f.max_height = std::max(f.max_height, static_cast<float>(top));
        if (x + 1 < kBoardWidth) {
            f.bumpiness += static_cast<float>(std::abs(top - heights[static_cast<std::size_t>(x + 1)]));
        }

        bool previous = true;
        for (int y = 0; y < height; ++y) {
            bool filled = board.occupied(x, y);
            if (filled != previous) {
                f.column_transitions += 1.0f;
            }
            previous = filled;
        }
    }

    for (int y = 0; y < height; ++y) {
        bool previous = true;
        for (int x = 0; x < kBoardWidth; ++x) {
            bool filled = board.occupied(x, y);
            if (filled != previous) {
                f.row_transitions += 1.0f;
            }
            previous = filled;
        }
        if (!previous) {
            f.row_transitions += 1.0f;
        }
    }
    return f;
}

std::unique_ptr<Model> load_default_model() {
    return std::make_unique<Model>(Model::from_json(default_model_json()));
}

std::unique_ptr<Model> load_model_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ModelLoadError("failed to open model file: " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return std::make_unique<Model>(Model::from_json(contents.str()));
}

}  // namespace pc_engine
