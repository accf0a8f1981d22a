#pragma once
#ifndef EVICHAIN_CONFIG_HPP
#define EVICHAIN_CONFIG_HPP

#include "evichain/capture_channel.hpp"
#include "evichain/logger.h"

#include <nlohmann/json.hpp>
#include <string>

namespace evichain {

/**
 * @brief Runtime settings, read from YAML.
 *
 * Recognized keys: evidence_dir, log_file, log_level, screenshot_format,
 * jpeg_quality, full_page. An empty evidenceDir means "use the default
 * evidence root".
 *
 * jpeg_quality and full_page only shape requests sent over a CaptureChannel
 * (pass captureOptions() to ScreenshotCapturer::capture). Screenshots handed
 * over as finished image files are stored as they are.
 */
struct EvidenceConfig {
  std::string evidenceDir;
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel logLevel = LogLevel::INFO;
  ImageFormat screenshotFormat = ImageFormat::Png;
  int jpegQuality = 80;
  bool fullPage = false;

  /// Screenshot request parameters derived from these settings.
  CaptureOptions captureOptions() const;
};

/// Effective settings with camelCase keys, including "captureOptions".
void to_json(nlohmann::json &j, const EvidenceConfig &cfg);

void to_json(nlohmann::json &j, const CaptureOptions &options);

/// @throw std::invalid_argument For an unknown level name (case-insensitive).
LogLevel parseLogLevel(const std::string &name);

/**
 * @brief Load settings from @p path.
 *
 * A missing file gives the defaults. Malformed files and invalid values are
 * reported on stderr and the affected settings keep their defaults.
 */
EvidenceConfig loadConfig(const std::string &path);

/**
 * @brief Load from $EVICHAIN_CONFIG (default "evichain_config.yaml") and
 * apply $EVICHAIN_EVIDENCE_DIR and $EVICHAIN_LOG_LEVEL on top.
 */
EvidenceConfig loadConfigFromEnvironment();

} // namespace evichain

#endif // EVICHAIN_CONFIG_HPP
