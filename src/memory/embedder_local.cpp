#include "engram/memory/embedder_local.hpp"

#include "engram/common/fs.hpp"

#include <cmath>
#include <cstdint>

namespace engram::memory {

namespace {

constexpr float kWordWeight = 1.0F;
constexpr float kTrigramWeight = 0.5F;

std::uint64_t fnv1a(const std::string_view text, const std::uint64_t seed) {
  std::uint64_t hash = 14695981039346656037ULL ^ seed;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

void add_feature(std::vector<float> &values, const std::string_view feature, const float weight) {
  const std::uint64_t hash = fnv1a(feature, 0);
  const std::size_t idx = static_cast<std::size_t>(hash % values.size());
  const float sign = ((hash >> 63) & 1U) != 0 ? -1.0F : 1.0F;
  values[idx] += sign * weight;
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? kDefaultDimensions : dimensions) {}

std::string_view LocalEmbedder::name() const { return "local"; }

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);

  for (const auto &word : common::split_words(std::string(text))) {
    add_feature(values, word, kWordWeight);

    const std::string padded = "#" + word + "#";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, std::string_view(padded).substr(i, 3), kTrigramWeight);
    }
  }

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

common::Result<std::vector<std::vector<float>>>
LocalEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure_from(emb);
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace engram::memory
