#include "evichain/anchor_builder.hpp"
#include "evichain/chain_store.hpp"
#include "evichain/chain_verifier.hpp"
#include "evichain/config.hpp"
#include "evichain/errors.hpp"
#include "evichain/evidence_paths.hpp"
#include "evichain/logger.h"
#include "evichain/screenshot_capturer.hpp"
#include "evichain/storage.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

using namespace evichain;

static void usage(const char *prog) {
  std::cout << "Usage: " << prog << " <command> [args]\n"
            << "  list\n"
            << "  create <chain-id>\n"
            << "  append <chain-id> <source-url> <json-value> [css xpath text]\n"
            << "  show <chain-id>\n"
            << "  verify <chain-id>\n"
            << "  export <chain-id>\n"
            << "  verify-file <path>\n"
            << "  screenshot <chain-id> <image-file> [png|jpeg]\n"
            << "  config\n";
}

static int verify_file_command(const std::string &path) {
  VerificationResult result = verifyChainDocument(loadChainDocument(path));
  std::cout << describe(result) << std::endl;
  return result.valid ? 0 : 1;
}

static int append_command(ChainStore &store, int argc, char **argv) {
  AppendRequest request;
  request.sourceUrl = argv[3];
  try {
    request.extractedValue = nlohmann::json::parse(argv[4]);
  } catch (const nlohmann::json::parse_error &) {
    // Plain text values are stored as JSON strings.
    request.extractedValue = argv[4];
  }
  if (argc >= 8)
    request.anchors.push_back(AnchorBuilder().build(argv[5], argv[6], argv[7]));

  EvidenceRecord record = store.append(argv[2], request);
  std::cout << "Appended record " << record.id << " (" << record.recordHash
            << ")" << std::endl;
  return 0;
}

static int screenshot_command(ScreenshotCapturer &capturer,
                              const std::string &chainId,
                              const std::string &file, ImageFormat format) {
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    std::cerr << "Cannot open " << file << std::endl;
    return 1;
  }
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  ScreenshotMeta meta = capturer.finalize(
      chainId, std::as_bytes(std::span<const char>(tmp)), format);
  std::cout << nlohmann::json(meta).dump(2) << std::endl;
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage(argv[0]);
    return 1;
  }

  EvidenceConfig cfg = loadConfigFromEnvironment();
  if (!cfg.evidenceDir.empty())
    setEvidenceRoot(cfg.evidenceDir);
  Logger::init(cfg.logFile, cfg.logLevel);

  const std::string cmd = argv[1];
  try {
    if (cmd == "verify-file" && argc >= 3)
      return verify_file_command(argv[2]);
    if (cmd == "config") {
      nlohmann::json settings = cfg;
      settings["evidenceDir"] = getEvidenceRoot();
      std::cout << settings.dump(2) << std::endl;
      return 0;
    }

    FileStorage storage(getEvidenceRoot());
    ChainStore store(storage);

    if (cmd == "list") {
      for (const auto &id : store.list())
        std::cout << id << std::endl;
      return 0;
    } else if (cmd == "create" && argc >= 3) {
      EvidenceChain chain = store.create(argv[2]);
      std::cout << "Created chain " << chain.chainId << std::endl;
      return 0;
    } else if (cmd == "append" && argc >= 5) {
      return append_command(store, argc, argv);
    } else if (cmd == "show" && argc >= 3) {
      auto chain = store.get(argv[2]);
      if (!chain) {
        std::cout << "Chain not found" << std::endl;
        return 1;
      }
      std::cout << serializeChain(*chain) << std::endl;
      return 0;
    } else if (cmd == "verify" && argc >= 3) {
      VerificationResult result = store.verify(argv[2]);
      std::cout << describe(result) << std::endl;
      return result.valid ? 0 : 1;
    } else if (cmd == "export" && argc >= 3) {
      std::cout << store.exportChain(argv[2]) << std::endl;
      return 0;
    } else if (cmd == "screenshot" && argc >= 4) {
      ImageFormat format =
          argc >= 5 ? formatFromString(argv[4]) : cfg.screenshotFormat;
      ScreenshotCapturer capturer(storage);
      return screenshot_command(capturer, argv[2], argv[3], format);
    }
  } catch (const EvidenceError &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "Invalid evidence data: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Unknown command" << std::endl;
  usage(argv[0]);
  return 1;
}
