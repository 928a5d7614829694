// src/main.cpp
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/master/MasterClient.hpp"
#include "core/volume/VolumeClient.hpp"
#include "services/cli/CliSettings.hpp"
#include "services/http/HttplibTransport.hpp"

// ---------- helpers ----------

static std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static void init_logging() {
  const std::string level = get_env_or("WEED_LOG_LEVEL", "info");
  spdlog::set_level(weed::cli::logLevelFrom(level));
}

static std::shared_ptr<weed::HttpTransport> make_transport() {
  weed::TransportOptions opts;
  const std::string timeout = get_env_or("WEED_TIMEOUT_SEC", "");
  if (!timeout.empty()) {
    try {
      const int sec = std::stoi(timeout);
      opts.connect_timeout_sec = sec;
      opts.read_timeout_sec = sec;
      opts.write_timeout_sec = sec;
    } catch (const std::exception&) {
      spdlog::warn("ignoring WEED_TIMEOUT_SEC={}", timeout);
    }
  }
  return std::make_shared<weed::HttplibTransport>(opts);
}

static std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void write_file(const std::string& path, const std::string& bytes) {
  std::ofstream os(path, std::ios::binary);
  if (!os) throw std::runtime_error("cannot create " + path);
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!os) throw std::runtime_error("write failed: " + path);
}

// Volume server currently holding fid, first location the master reports.
static weed::VolumeClient locate(const weed::MasterClient& master,
                                 const weed::FileId& fid,
                                 const std::shared_ptr<weed::HttpTransport>& transport) {
  auto found = master.lookup(fid);
  if (found.locations.empty()) {
    throw weed::WeedError(weed::ErrorKind::FileNotFound, "no location for volume " +
                          std::to_string(fid.volume_id));
  }
  return weed::VolumeClient::fromLocation(found.locations.front(), transport);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " assign                      # new file id and its volume\n"
            << "  " << argv0 << " lookup <fid>                # volume servers holding fid\n"
            << "  " << argv0 << " upload <file> [collection]  # assign, then store the file\n"
            << "  " << argv0 << " download <fid> <file>       # fetch fid into file\n"
            << "  " << argv0 << " delete <fid>                # delete fid\n"
            << "Environment: WEED_MASTER (localhost:9333), WEED_LOG_LEVEL (info),\n"
            << "             WEED_TIMEOUT_SEC (transport default)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  init_logging();

  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }
  const std::string cmd = argv[1];

  try {
    auto transport = make_transport();
    const auto master = weed::MasterClient::fromString(
        get_env_or("WEED_MASTER", "localhost:9333"), transport);

    if (cmd == "assign" && argc == 2) {
      auto a = master.assign();
      std::cout << a.fid << " " << a.location.url << " " << a.location.public_url << "\n";
      return 0;
    }

    if (cmd == "lookup" && argc == 3) {
      const auto fid = weed::FileId::parse(argv[2]);
      for (const auto& loc : master.lookup(fid).locations) {
        std::cout << loc.url << " " << loc.public_url << "\n";
      }
      return 0;
    }

    if (cmd == "upload" && (argc == 3 || argc == 4)) {
      const std::string path = argv[2];
      const std::string bytes = read_file(path);

      weed::AssignOptions opts;
      if (argc == 4) opts.collection = std::string(argv[3]);
      auto a = master.assign(opts);

      auto volume = weed::VolumeClient::fromLocation(a.location, transport);
      auto stored = volume.storeForm(
          a.fid, {{"file", bytes, weed::cli::uploadName(path), "application/octet-stream"}});
      spdlog::info("stored {} ({} bytes) on {}", a.fid.toString(), stored.size, a.location.url);
      std::cout << a.fid << " " << stored.size << "\n";
      return 0;
    }

    if (cmd == "download" && argc == 4) {
      const auto fid = weed::FileId::parse(argv[2]);
      const std::string bytes = locate(master, fid, transport).fetchBytes(fid);
      write_file(argv[3], bytes);
      std::cout << bytes.size() << "\n";
      return 0;
    }

    if (cmd == "delete" && argc == 3) {
      const auto fid = weed::FileId::parse(argv[2]);
      auto deleted = locate(master, fid, transport).remove(fid);
      std::cout << deleted.size << "\n";
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const weed::WeedError& e) {
    spdlog::error("{}", e.what());
    return e.kind() == weed::ErrorKind::FileNotFound ? 3 : 2;
  } catch (const std::exception& e) {
    spdlog::error("Fatal: {}", e.what());
    return 2;
  }
}
