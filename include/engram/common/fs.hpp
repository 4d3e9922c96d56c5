#pragma once

#include "engram/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace engram::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Lower-cased alphanumeric runs of `text`; apostrophes inside a word are kept.
[[nodiscard]] std::vector<std::string> split_words(const std::string &text);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace engram::common
