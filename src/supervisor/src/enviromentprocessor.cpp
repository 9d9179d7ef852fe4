#include "../include/enviromentprocessor.hpp"

#include <cstdlib>

namespace {

const std::string kPrefix = "$ENV{";
const std::string kDefaultSeparator = ":-";

}  // namespace

void EnvironmentProcessor::process(nlohmann::json &config) const {
  walkJson(config, [this](std::string &value) { resolveVariable(value); });
}

void EnvironmentProcessor::walkJson(
    nlohmann::json &node,
    const std::function<void(std::string &)> &func) const {
  if (node.is_string()) {
    auto &value = node.get_ref<std::string &>();
    func(value);
    return;
  }
  if (node.is_structured()) {
    for (auto &child : node) walkJson(child, func);
  }
}

void EnvironmentProcessor::resolveVariable(std::string &value) const {
  std::string result;
  result.reserve(value.size());

  std::size_t pos = 0;
  while (pos < value.size()) {
    const std::size_t start = value.find(kPrefix, pos);
    if (start == std::string::npos) break;

    const std::size_t close = value.find('}', start + kPrefix.size());
    if (close == std::string::npos) break;

    result.append(value, pos, start - pos);

    std::string expr =
        value.substr(start + kPrefix.size(), close - start - kPrefix.size());
    std::string name = expr;
    std::optional<std::string> fallback;
    if (const auto sep = expr.find(kDefaultSeparator);
        sep != std::string::npos) {
      name = expr.substr(0, sep);
      fallback = expr.substr(sep + kDefaultSeparator.size());
    }

    if (const char *env_val = std::getenv(name.c_str())) {
      result += env_val;
    } else if (fallback) {
      result += *fallback;
    } else {
      // Неизвестная переменная без значения по умолчанию остается как есть
      result.append(value, start, close - start + 1);
    }
    pos = close + 1;
  }

  result.append(value, pos, std::string::npos);
  value = std::move(result);
}
