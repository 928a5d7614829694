#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/types/Endpoint.hpp"
#include "core/types/FileId.hpp"
#include "core/types/Location.hpp"
#include "core/types/Replication.hpp"
#include "core/types/Ttl.hpp"

namespace weed {

class HttpTransport;

struct AssignOptions {
  std::optional<uint32_t>        count;
  std::optional<std::string>     collection;
  std::optional<std::string>     data_center;
  std::optional<std::string>     rack;
  std::optional<std::string>     data_node;
  std::optional<ReplicationType> replication;
  std::optional<Ttl>             ttl;
  // If no volume matches, preallocate this many bytes for new volumes.
  std::optional<uint64_t>        preallocate;
  // If no volume matches, create this many new volumes.
  std::optional<uint64_t>        writable_volume_count;
  // Disk type label to allocate on, when disks are labelled.
  std::optional<std::string>     disk;
};

struct AssignResult {
  uint64_t count = 0;
  FileId   fid;
  Location location;
};

struct LookupOptions {
  std::optional<std::string> collection;
  std::optional<FileId>      file_id;
  std::optional<bool>        read;
};

struct LookupResult {
  std::vector<Location> locations;
};

// Talks to the master: hands out new file ids and says which volume
// servers hold a given volume.
class MasterClient {
public:
  explicit MasterClient(Endpoint endpoint,
                        std::shared_ptr<HttpTransport> transport = nullptr);

  // "host:port"; throws WeedError(MalformedAddress).
  static MasterClient fromString(std::string_view address,
                                 std::shared_ptr<HttpTransport> transport = nullptr);

  AssignResult assign(const AssignOptions& options = {}) const;
  LookupResult lookup(const FileId& fid, const LookupOptions& options = {}) const;

  const Endpoint& endpoint() const { return endpoint_; }
  std::string baseUrl() const { return endpoint_.baseUrl(); }

private:
  Endpoint endpoint_;
  std::shared_ptr<HttpTransport> transport_;
};

} // namespace weed
