#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/types/Endpoint.hpp"
#include "core/types/FileId.hpp"
#include "core/types/Location.hpp"
#include "services/http/HttpTransport.hpp"

namespace weed {

// Image resize mode understood by the volume server.
enum class FetchMode { Fit, Fill };

const char* toString(FetchMode mode);

struct FetchOptions {
  std::optional<bool>      read_deleted;
  std::optional<uint32_t>  width;
  std::optional<uint32_t>  height;
  std::optional<FetchMode> mode;
  std::optional<uint32_t>  crop_x1;
  std::optional<uint32_t>  crop_x2;
  std::optional<uint32_t>  crop_y1;
  std::optional<uint32_t>  crop_y2;
};

struct StoreOptions {
  // true sends type=replicate; false and unset send nothing.
  std::optional<bool>     replicated;
  // modification time, epoch seconds
  std::optional<uint64_t> ts;
  // the body is a chunk manifest
  std::optional<bool>     cm;
};

struct StoreResult {
  std::size_t                size = 0;
  std::optional<std::string> etag;
};

struct DeleteResult {
  std::size_t size = 0;
};

// Reads and writes file content on one volume server. Build it from the
// Location returned by MasterClient::assign or MasterClient::lookup.
class VolumeClient {
public:
  explicit VolumeClient(Endpoint endpoint,
                        std::shared_ptr<HttpTransport> transport = nullptr);

  // "host:port"; throws WeedError(MalformedAddress).
  static VolumeClient fromString(std::string_view address,
                                 std::shared_ptr<HttpTransport> transport = nullptr);
  static VolumeClient fromLocation(const Location& location,
                                   std::shared_ptr<HttpTransport> transport = nullptr);

  // Full response on 200, for callers that need headers. Any other status,
  // 404 included, is InvalidRequest.
  HttpResponse fetch(const FileId& fid, const FetchOptions& options = {}) const;

  // Body on 200; FileNotFound on 404; InvalidRequest otherwise.
  std::string fetchBytes(const FileId& fid, const FetchOptions& options = {}) const;

  StoreResult store(const FileId& fid, std::string_view bytes,
                    const StoreOptions& options = {}) const;
  StoreResult storeForm(const FileId& fid, const std::vector<FormPart>& parts,
                        const StoreOptions& options = {}) const;

  DeleteResult remove(const FileId& fid) const;

  const Endpoint& endpoint() const { return endpoint_; }
  std::string baseUrl() const { return endpoint_.baseUrl(); }

private:
  Endpoint endpoint_;
  std::shared_ptr<HttpTransport> transport_;
};

} // namespace weed
