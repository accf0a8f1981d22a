#include "evichain/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace evichain {

CaptureOptions EvidenceConfig::captureOptions() const {
  CaptureOptions options;
  options.format = screenshotFormat;
  if (screenshotFormat == ImageFormat::Jpeg)
    options.quality = jpegQuality;
  options.fullPage = fullPage;
  return options;
}

void to_json(nlohmann::json &j, const CaptureOptions &options) {
  j = nlohmann::json{{"format", formatToString(options.format)},
                     {"quality", nullptr},
                     {"fullPage", options.fullPage}};
  if (options.quality)
    j["quality"] = *options.quality;
}

void to_json(nlohmann::json &j, const EvidenceConfig &cfg) {
  j = nlohmann::json{{"evidenceDir", cfg.evidenceDir},
                     {"logFile", cfg.logFile},
                     {"logLevel", Logger::levelToString(cfg.logLevel)},
                     {"screenshotFormat", formatToString(cfg.screenshotFormat)},
                     {"jpegQuality", cfg.jpegQuality},
                     {"fullPage", cfg.fullPage},
                     {"captureOptions", cfg.captureOptions()}};
}

LogLevel parseLogLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return LogLevel::TRACE;
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "INFO")
    return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "FATAL")
    return LogLevel::FATAL;
  throw std::invalid_argument("Unknown log level: " + name);
}

EvidenceConfig loadConfig(const std::string &path) {
  EvidenceConfig cfg;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec))
    return cfg;

  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    std::cerr << "Warning: ignoring malformed config " << path << ": "
              << e.what() << std::endl;
    return cfg;
  }
  if (node.IsNull())
    return cfg;
  if (!node.IsMap()) {
    std::cerr << "Warning: ignoring config " << path
              << ": top level is not a mapping" << std::endl;
    return cfg;
  }

  auto apply = [&](const char *key, auto &&assign) {
    const YAML::Node value = node[key];
    if (!value)
      return;
    try {
      assign(value);
    } catch (const YAML::Exception &e) {
      std::cerr << "Warning: invalid " << key << " in " << path << ": "
                << e.what() << std::endl;
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning: invalid " << key << " in " << path << ": "
                << e.what() << std::endl;
    }
  };

  apply("evidence_dir", [&](const YAML::Node &v) {
    cfg.evidenceDir = v.as<std::string>();
  });
  apply("log_file",
        [&](const YAML::Node &v) { cfg.logFile = v.as<std::string>(); });
  apply("log_level", [&](const YAML::Node &v) {
    cfg.logLevel = parseLogLevel(v.as<std::string>());
  });
  apply("screenshot_format", [&](const YAML::Node &v) {
    cfg.screenshotFormat = formatFromString(v.as<std::string>());
  });
  apply("jpeg_quality", [&](const YAML::Node &v) {
    int quality = v.as<int>();
    if (quality < 1 || quality > 100)
      throw std::invalid_argument("must be between 1 and 100");
    cfg.jpegQuality = quality;
  });
  apply("full_page",
        [&](const YAML::Node &v) { cfg.fullPage = v.as<bool>(); });
  return cfg;
}

EvidenceConfig loadConfigFromEnvironment() {
  const char *path = std::getenv("EVICHAIN_CONFIG");
  EvidenceConfig cfg = loadConfig(path ? path : "evichain_config.yaml");

  if (const char *dir = std::getenv("EVICHAIN_EVIDENCE_DIR"))
    if (dir[0] != '\0')
      cfg.evidenceDir = dir;
  if (const char *level = std::getenv("EVICHAIN_LOG_LEVEL")) {
    try {
      cfg.logLevel = parseLogLevel(level);
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning: " << e.what() << std::endl;
    }
  }
  return cfg;
}

} // namespace evichain
