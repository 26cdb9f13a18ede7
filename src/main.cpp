#include "manifest/file_groups.hpp"
#include "manifest/manifest_builder.hpp"
#include "manifest/manifest_hash.hpp"
#include "statesync/config.hpp"
#include "statesync/state_sync.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "util/threadpool.hpp"
#include "version.hpp"
#include <cstring>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <command> [args]\n"
      << "\n"
      << "Commands:\n"
      << "  manifest <checkpoint_dir>             Print the manifest of a "
         "checkpoint as JSON\n"
      << "  sync <source_root> <dest_root> <height>\n"
      << "                                        Transfer checkpoint <height> "
         "between two state roots\n"
      << "\n"
      << "Options:\n"
      << "  --config=<path>      Load settings from a JSON file\n"
      << "  --chunk-size=<n>     Chunk size in bytes (default: 1048576)\n"
      << "  --threads=<n>        Number of hashing threads (default: 0 = "
         "auto)\n"
      << "  --manifest-version=<n>  Manifest version to produce (default: "
      << statesync::manifest::CURRENT_STATE_SYNC_VERSION << ")\n"
      << "  --full               Print every file and chunk (manifest)\n"
      << "  --output=<path>      Write the JSON result to a file instead of "
         "stdout\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: manifest, sync, cache, app, all\n"
      << "                       Can be comma-separated: --debug=sync,cache\n"
      << "  --logfile=<path>     Log to a file instead of stderr\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

namespace {

// JSON goes to stdout, or atomically to `output` when set
bool EmitJson(const json &value, const std::string &output) {
  const std::string text = value.dump(2) + "\n";
  if (output.empty()) {
    std::cout << text << std::flush;
    return true;
  }
  if (!statesync::util::atomic_write_file(output, text)) {
    LOG_APP_ERROR("Failed to write {}", output);
    std::cerr << "Error: failed to write " << output << std::endl;
    return false;
  }
  return true;
}

json ManifestToJson(const statesync::manifest::Manifest &manifest, bool full) {
  using namespace statesync;
  json root;
  root["version"] = manifest.version;
  root["root_hash"] = util::HexStr(manifest::ManifestRootHash(manifest));
  root["file_count"] = manifest.file_table.size();
  root["chunk_count"] = manifest.chunk_table.size();
  root["total_bytes"] = manifest.TotalBytes();
  root["group_count"] = manifest::ComputeFileGroups(manifest).size();

  if (full) {
    json files = json::array();
    for (const auto &file : manifest.file_table) {
      json entry;
      entry["path"] = file.relative_path;
      entry["size"] = file.size_bytes;
      entry["hash"] = util::HexStr(file.hash);
      files.push_back(entry);
    }
    root["files"] = files;

    json chunks = json::array();
    for (const auto &chunk : manifest.chunk_table) {
      json entry;
      entry["file_index"] = chunk.file_index;
      entry["offset"] = chunk.offset;
      entry["size"] = chunk.size_bytes;
      entry["hash"] = util::HexStr(chunk.hash);
      chunks.push_back(entry);
    }
    root["chunks"] = chunks;
  }
  return root;
}

int RunManifest(const statesync::StateSyncConfig &config,
                const std::string &checkpoint_dir, bool full,
                const std::string &output) {
  using namespace statesync;
  util::ThreadPool pool(config.hashing_threads);
  manifest::ManifestMetrics metrics;
  try {
    manifest::Manifest computed =
        manifest::ComputeManifest(pool, metrics, config.manifest_version,
                                  checkpoint_dir, config.chunk_size,
                                  std::nullopt);
    return EmitJson(ManifestToJson(computed, full), output) ? 0 : 1;
  } catch (const manifest::ManifestError &e) {
    LOG_APP_ERROR("Failed to compute manifest of {}: {}", checkpoint_dir,
                  e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int RunSync(const statesync::StateSyncConfig &config,
            const std::string &source_root, const std::string &dest_root,
            statesync::Height height, const std::string &output) {
  using namespace statesync;

  StateSyncConfig source_config = config;
  source_config.root = source_root;
  StateSyncConfig dest_config = config;
  dest_config.root = dest_root;

  StateSync source(source_config);
  StateSync dest(dest_config);
  if (!source.Initialize() || !dest.Initialize()) {
    std::cerr << "Error: failed to initialize state roots" << std::endl;
    return 1;
  }

  std::optional<StateSyncArtifactId> id;
  for (const auto &candidate : source.ListCheckpoints()) {
    if (candidate.height == height) {
      id = candidate;
    }
  }
  if (!id) {
    std::cerr << "Error: no checkpoint at height " << height << " in "
              << source_root << std::endl;
    return 1;
  }

  dest.FetchState(id->height, id->root_hash);
  if (dest.GetPriorityFunction()(*id) != Priority::Fetch) {
    std::cerr << "Error: height " << height << " is not fetchable" << std::endl;
    return 1;
  }

  auto chunkable = dest.CreateChunkable(*id);
  if (!chunkable) {
    std::cerr << "Error: checkpoint at height " << height
              << " already exists in " << dest_root << std::endl;
    return 1;
  }

  std::optional<StateSyncMessage> artifact;
  uint64_t transferred = 0;
  // Manifest, chunks, and at most one retry round after validation
  constexpr int kMaxRounds = 3;
  for (int round = 0; round < kMaxRounds && !artifact; ++round) {
    auto wanted = chunkable->ChunksToDownload();
    if (wanted.empty()) {
      break;
    }
    for (manifest::ChunkId chunk : wanted) {
      auto bytes = source.GetChunk(*id, chunk);
      if (!bytes) {
        std::cerr << "Error: source cannot serve chunk " << chunk << std::endl;
        return 1;
      }
      transferred += bytes->size();
      AddChunkResult result = chunkable->AddChunk(chunk, *bytes);
      if (result.IsInvalid()) {
        LOG_APP_ERROR("Chunk {} rejected: {} ({})", chunk,
                      AddChunkCodeToString(result.GetCode()),
                      result.GetRejectReason());
        if (result.IsFatal() || chunk == manifest::MANIFEST_CHUNK) {
          std::cerr << "Error: " << result.GetRejectReason() << std::endl;
          return 1;
        }
      } else if (result.IsCompleted()) {
        artifact = result.GetArtifact();
        break;
      }
    }
  }

  if (!artifact || !dest.DeliverStateSync(*artifact)) {
    std::cerr << "Error: sync did not complete" << std::endl;
    return 1;
  }

  const StateSyncMetrics &metrics = dest.metrics();
  json summary;
  summary["height"] = artifact->height;
  summary["root_hash"] = util::HexStr(artifact->root_hash);
  summary["checkpoint"] = artifact->checkpoint_root.string();
  summary["bytes_transferred"] = transferred;
  summary["chunks_received"] = metrics.chunks_received.load();
  summary["chunks_copied_from_cache"] = metrics.chunks_copied_from_cache.load();
  summary["chunks_copied_from_checkpoint"] =
      metrics.chunks_copied_from_checkpoint.load();
  summary["files_copied_from_checkpoint"] =
      metrics.files_copied_from_checkpoint.load();
  summary["corrupted_chunks"] = metrics.corrupted_chunks.load();
  return EmitJson(summary, output) ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    statesync::StateSyncConfig config;
    std::string log_level = "warn";
    std::string log_file;
    std::vector<std::string> debug_components;
    std::vector<std::string> positional;
    std::string output;
    bool full = false;

    // --config first, so explicit flags override it
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.find("--config=") == 0) {
        auto loaded = statesync::LoadStateSyncConfig(arg.substr(9));
        if (!loaded) {
          std::cerr << "Failed to load config: " << arg.substr(9) << std::endl;
          return 1;
        }
        config = *loaded;
      }
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << statesync::GetFullVersionString() << std::endl;
        std::cout << statesync::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--config=") == 0) {
        continue;
      } else if (arg.find("--chunk-size=") == 0) {
        config.chunk_size = static_cast<uint32_t>(std::stoul(arg.substr(13)));
      } else if (arg.find("--threads=") == 0) {
        config.hashing_threads = std::stoul(arg.substr(10));
      } else if (arg.find("--manifest-version=") == 0) {
        config.manifest_version =
            static_cast<uint32_t>(std::stoul(arg.substr(19)));
      } else if (arg.find("--output=") == 0) {
        output = arg.substr(9);
      } else if (arg == "--full") {
        full = true;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=sync,cache
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      } else {
        positional.push_back(arg);
      }
    }

    std::string error;
    if (!config.Validate(error)) {
      std::cerr << "Invalid configuration: " << error << std::endl;
      return 1;
    }

    statesync::util::LogManager::Initialize(log_level, !log_file.empty(),
                                            log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        statesync::util::LogManager::SetLogLevel("trace");
      } else {
        statesync::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int rc = 1;
    if (positional.size() == 2 && positional[0] == "manifest") {
      rc = RunManifest(config, positional[1], full, output);
    } else if (positional.size() == 4 && positional[0] == "sync") {
      rc = RunSync(config, positional[1], positional[2],
                   std::stoull(positional[3]), output);
    } else {
      print_usage(argv[0]);
    }

    // Shutdown logging
    statesync::util::LogManager::Shutdown();

    return rc;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    statesync::util::LogManager::Shutdown();
    return 1;
  }
}
