#include "utilities/chunk_store.hpp"
#include "utilities/config.hpp"
#include "utilities/digest.hpp"
#include "utilities/file_registry.hpp"
#include "utilities/key_value_store.hpp"
#include "utilities/logger.h"
#include "utilities/merkle_tree.hpp"
#include "utilities/query_api.hpp"
#include "utilities/self_test.h"
#include "utilities/var_dir.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

static std::vector<std::byte> readFileBytes(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Cannot open " + path);
  }
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  std::vector<std::byte> data;
  data.reserve(tmp.size());
  for (char c : tmp)
    data.push_back(std::byte(c));
  return data;
}

static uint32_t parsePosition(const std::string &text) {
  unsigned long value = std::stoul(text);
  if (value > UINT32_MAX) {
    throw std::out_of_range("Position out of range: " + text);
  }
  return static_cast<uint32_t>(value);
}

static int upload_command(tfs::FileRegistry &registry, ChunkStore &chunks,
                          const std::string &path, const std::string &owner) {
  auto bytes = readFileBytes(path);
  auto receipt = registry.uploadFile(owner, bytes);
  chunks.saveDirectory(tfs::chunksDir());
  std::cout << tfs::utils::to_hex(receipt.merkleRoot) << '\t'
            << receipt.pieces << " pieces\t" << receipt.size << " bytes"
            << std::endl;
  return 0;
}

static int proof_command(const tfs::QueryApi &api, const std::string &rootHex,
                         uint32_t position) {
  auto response = api.getProof(rootHex, position);
  std::cout << response.dump(2) << std::endl;
  return tfs::QueryApi::isError(response) ? 1 : 0;
}

static int verify_command(const std::string &chunkPath, uint32_t position,
                          const std::string &rootHex,
                          const std::string &proofPath) {
  auto chunk = readFileBytes(chunkPath);
  std::ifstream pf(proofPath);
  if (!pf.is_open()) {
    std::cout << "Proof file not found" << std::endl;
    return 1;
  }
  nlohmann::json response = nlohmann::json::parse(pf);
  tfs::ChunkProof parsed = tfs::QueryApi::parseProof(response);

  auto rootBytes = tfs::utils::from_hex(rootHex);
  if (rootBytes.size() != tfs::utils::DIGEST_SIZE) {
    std::cout << "Root must be 32 bytes of hex" << std::endl;
    return 1;
  }
  tfs::Hash root;
  std::copy(rootBytes.begin(), rootBytes.end(), root.begin());

  auto leaf = tfs::utils::sha256(chunk.data(), chunk.size());
  bool ok = tfs::FileMerkleTree::verify(leaf, position, parsed.proof, root);
  std::cout << (ok ? "Verification succeeded" : "Verification FAILED")
            << std::endl;
  return ok ? 0 : 1;
}

static void usage() {
  std::cout << "Usage: tfs_ctl upload <file> [owner]\n"
            << "       tfs_ctl list\n"
            << "       tfs_ctl proof <root_hex> <position>\n"
            << "       tfs_ctl verify <chunk_file> <position> <root_hex> "
               "<proof_json>\n";
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }

  tfs::RuntimeOptions opts;
  try {
    opts = tfs::loadRuntimeOptions();
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }
  if (!opts.varDir.empty())
    tfs::setVarDir(opts.varDir);

  try {
    std::filesystem::create_directories(tfs::logsDir());
    const std::string logFile =
        opts.logFile.empty() ? tfs::logsDir() + "/tfs.log" : opts.logFile;
    Logger::init(logFile, opts.logLevel, opts.maxLogSize, opts.maxLogBackups);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  if (!crypto_self_test()) {
    std::cerr << "FATAL: crypto self test failed" << std::endl;
    return 1;
  }

  const std::string cmd = argv[1];
  try {
    if (cmd == "verify" && argc >= 6) {
      return verify_command(argv[2], parsePosition(argv[3]), argv[4], argv[5]);
    }

    tfs::DirectoryKeyValueStore ledger(tfs::ledgerDir());
    ChunkStore chunks;
    tfs::FileRegistry registry(ledger, &chunks);
    tfs::QueryApi api(registry);

    if (cmd == "upload" && argc >= 3) {
      const std::string owner = argc >= 4 ? argv[3] : opts.owner;
      return upload_command(registry, chunks, argv[2], owner);
    } else if (cmd == "list") {
      std::cout << api.listFiles().dump(2) << std::endl;
      return 0;
    } else if (cmd == "proof" && argc >= 4) {
      return proof_command(api, argv[2], parsePosition(argv[3]));
    }
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, cmd + " failed: " + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  usage();
  return 1;
}
