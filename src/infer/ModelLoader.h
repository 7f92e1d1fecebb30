#pragma once
#include "ncnn/net.h"
#include "ylt/easylog.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace db_text {

// ncnn stores a network as a .param/.bin pair. `model_path` may name either
// file, the exported .onnx, or a bare stem; both the plain and the
// "<stem>.ncnn<ext>" spellings are tried.
static std::vector<std::filesystem::path>
modelFileCandidates(std::string_view model_path, std::string_view ext) {
  std::filesystem::path path(model_path);
  std::filesystem::path stem = path;
  stem.replace_extension();
  if (stem.extension() == ".ncnn") {
    stem.replace_extension();
  }

  std::vector<std::filesystem::path> candidates;
  auto add = [&candidates](const std::filesystem::path &p) {
    if (std::ranges::find(candidates, p) == candidates.end()) {
      candidates.push_back(p);
    }
  };

  if (path.extension() == ext) {
    add(path);
  }
  auto plain = stem;
  add(plain.concat(ext));
  auto exported = stem;
  add(exported.concat(".ncnn").concat(ext));
  return candidates;
}

static std::string
joinCandidates(const std::vector<std::filesystem::path> &paths) {
  std::string joined;
  for (const auto &p : paths) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += p.string();
  }
  return joined;
}

static std::unique_ptr<ncnn::Net> loadModel(std::string_view model_path,
                                            const ncnn::Option &opt) {
  auto net = std::make_unique<ncnn::Net>();
  net->opt = opt;

  auto param_paths = modelFileCandidates(model_path, ".param");
  auto bin_paths = modelFileCandidates(model_path, ".bin");

  auto param = std::ranges::find_if(param_paths, [](const auto &p) {
    return std::filesystem::exists(p);
  });
  if (param == param_paths.end()) {
    throw std::runtime_error("Parameter file not found, tried: " +
                             joinCandidates(param_paths));
  }
  if (net->load_param(param->string().c_str()) != 0) {
    throw std::runtime_error("Failed to parse parameter file: " +
                             param->string());
  }

  auto bin = std::ranges::find_if(
      bin_paths, [](const auto &b) { return std::filesystem::exists(b); });
  if (bin == bin_paths.end()) {
    throw std::runtime_error("Model file not found, tried: " +
                             joinCandidates(bin_paths));
  }
  if (net->load_model(bin->string().c_str()) != 0) {
    throw std::runtime_error("Failed to load model weights: " + bin->string());
  }

  ELOGFMT(INFO, "Loaded model {} / {}", param->string(), bin->string());
  return net;
}
} // namespace db_text
