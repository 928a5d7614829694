#include "VolumeClient.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "services/http/HttplibTransport.hpp"
#include "services/http/Query.hpp"

using nlohmann::json;

namespace weed {

// -------- helpers --------

static std::string fid_path(const FileId& fid) {
  return "/" + percentEncode(fid.toString(), ",");
}

static std::string fetch_target(const FileId& fid, const FetchOptions& o) {
  Query q;
  q.add("readDeleted", o.read_deleted)
   .add("width", o.width)
   .add("height", o.height);
  if (o.mode) q.add("mode", toString(*o.mode));
  q.add("crop_x1", o.crop_x1)
   .add("crop_x2", o.crop_x2)
   .add("crop_y1", o.crop_y1)
   .add("crop_y2", o.crop_y2);
  return makeTarget(fid_path(fid), q);
}

static std::string store_target(const FileId& fid, const StoreOptions& o) {
  Query q;
  // not a plain bool: only true is sent, and it is sent as type=replicate
  if (o.replicated.value_or(false)) q.add("type", "replicate");
  q.add("ts", o.ts)
   .add("cm", o.cm);
  return makeTarget(fid_path(fid), q);
}

// Reply field holding a byte count; a negative or fractional value is a
// malformed reply, not a huge size.
static std::size_t size_field(const json& j) {
  const json& size = j.at("size");
  if (!size.is_number_unsigned()) {
    throw WeedError(ErrorKind::TransportFailure, "size is not an unsigned integer: " + size.dump());
  }
  return size.get<std::size_t>();
}

static StoreResult store_result(const HttpResponse& res) {
  try {
    json j = json::parse(res.body);
    StoreResult out;
    out.size = size_field(j);
    if (j.contains("eTag") && j["eTag"].is_string()) out.etag = j["eTag"].get<std::string>();
    return out;
  } catch (const json::exception& e) {
    throw WeedError(ErrorKind::TransportFailure, std::string("upload response: ") + e.what());
  }
}

const char* toString(FetchMode mode) {
  switch (mode) {
    case FetchMode::Fit:  return "fit";
    case FetchMode::Fill: return "fill";
  }
  return "fit";
}

// -------- client --------

VolumeClient::VolumeClient(Endpoint endpoint, std::shared_ptr<HttpTransport> transport)
  : endpoint_(std::move(endpoint)),
    transport_(transport ? std::move(transport) : defaultTransport()) {}

VolumeClient VolumeClient::fromString(std::string_view address,
                                      std::shared_ptr<HttpTransport> transport) {
  return VolumeClient(Endpoint::parse(address), std::move(transport));
}

VolumeClient VolumeClient::fromLocation(const Location& location,
                                        std::shared_ptr<HttpTransport> transport) {
  return fromString(location.url, std::move(transport));
}

HttpResponse VolumeClient::fetch(const FileId& fid, const FetchOptions& options) const {
  const std::string target = fetch_target(fid, options);
  spdlog::debug("GET {}{}", baseUrl(), target);
  HttpResponse res = transport_->get(baseUrl(), target);

  if (res.status != 200) {
    spdlog::warn("fetch {} returned {}", fid.toString(), res.status);
    throw WeedError(ErrorKind::InvalidRequest, res.body);
  }
  return res;
}

std::string VolumeClient::fetchBytes(const FileId& fid, const FetchOptions& options) const {
  const std::string target = fetch_target(fid, options);
  spdlog::debug("GET {}{}", baseUrl(), target);
  HttpResponse res = transport_->get(baseUrl(), target);

  switch (res.status) {
    case 200:
      return std::move(res.body);
    case 404:
      throw WeedError(ErrorKind::FileNotFound, fid.toString());
    default:
      spdlog::warn("fetch {} returned {}", fid.toString(), res.status);
      throw WeedError(ErrorKind::InvalidRequest, res.body);
  }
}

StoreResult VolumeClient::store(const FileId& fid, std::string_view bytes,
                                const StoreOptions& options) const {
  const std::string target = store_target(fid, options);
  spdlog::debug("PUT {}{} ({} bytes)", baseUrl(), target, bytes.size());
  HttpResponse res = transport_->put(baseUrl(), target, std::string(bytes),
                                     "application/octet-stream");

  if (res.status != 201) {
    spdlog::warn("store {} returned {}", fid.toString(), res.status);
    throw WeedError(ErrorKind::NotCreated, res.body);
  }
  return store_result(res);
}

StoreResult VolumeClient::storeForm(const FileId& fid, const std::vector<FormPart>& parts,
                                    const StoreOptions& options) const {
  const std::string target = store_target(fid, options);
  spdlog::debug("POST {}{} ({} parts)", baseUrl(), target, parts.size());
  HttpResponse res = transport_->postForm(baseUrl(), target, parts);

  if (res.status != 201) {
    spdlog::warn("store {} returned {}", fid.toString(), res.status);
    throw WeedError(ErrorKind::NotCreated, res.body);
  }
  return store_result(res);
}

DeleteResult VolumeClient::remove(const FileId& fid) const {
  const std::string target = fid_path(fid);
  spdlog::debug("DELETE {}{}", baseUrl(), target);
  HttpResponse res = transport_->del(baseUrl(), target);

  if (res.status != 202) {
    spdlog::warn("delete {} returned {}", fid.toString(), res.status);
    throw WeedError(ErrorKind::NotAccepted, res.body);
  }
  try {
    return DeleteResult{size_field(json::parse(res.body))};
  } catch (const json::exception& e) {
    throw WeedError(ErrorKind::TransportFailure, std::string("delete response: ") + e.what());
  }
}

} // namespace weed
