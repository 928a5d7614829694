#include "MasterClient.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "services/http/HttplibTransport.hpp"
#include "services/http/Query.hpp"

using nlohmann::json;

namespace weed {

static Location location_from(const json& j) {
  return Location{j.at("publicUrl").get<std::string>(), j.at("url").get<std::string>()};
}

static json parse_body(const HttpResponse& res, const std::string& what) {
  try {
    return json::parse(res.body);
  } catch (const json::exception& e) {
    throw WeedError(ErrorKind::TransportFailure, what + ": " + e.what());
  }
}

MasterClient::MasterClient(Endpoint endpoint, std::shared_ptr<HttpTransport> transport)
  : endpoint_(std::move(endpoint)),
    transport_(transport ? std::move(transport) : defaultTransport()) {}

MasterClient MasterClient::fromString(std::string_view address,
                                      std::shared_ptr<HttpTransport> transport) {
  return MasterClient(Endpoint::parse(address), std::move(transport));
}

AssignResult MasterClient::assign(const AssignOptions& o) const {
  Query q;
  q.add("count", o.count)
   .add("collection", o.collection)
   .add("dataCenter", o.data_center)
   .add("rack", o.rack)
   .add("dataNode", o.data_node);
  if (o.replication) q.add("replication", o.replication->toString());
  if (o.ttl) q.add("ttl", o.ttl->toString());
  q.add("preallocate", o.preallocate)
   .add("writableVolumeCount", o.writable_volume_count)
   .add("disk", o.disk);

  const std::string target = makeTarget("/dir/assign", q);
  spdlog::debug("GET {}{}", baseUrl(), target);
  HttpResponse res = transport_->get(baseUrl(), target);

  if (res.status != 200) {
    spdlog::warn("assign on {} returned {}", baseUrl(), res.status);
    throw WeedError(ErrorKind::InvalidRequest, res.body);
  }

  json j = parse_body(res, "assign response");
  try {
    AssignResult out;
    out.count = j.at("count").get<uint64_t>();
    out.fid = FileId::parse(j.at("fid").get<std::string>());
    out.location = location_from(j);
    return out;
  } catch (const json::exception& e) {
    throw WeedError(ErrorKind::TransportFailure, std::string("assign response: ") + e.what());
  }
}

LookupResult MasterClient::lookup(const FileId& fid, const LookupOptions& o) const {
  Query q;
  q.add("volumeId", fid.volume_id)
   .add("collection", o.collection);
  if (o.file_id) q.add("fileId", o.file_id->toString());
  q.add("read", o.read);

  const std::string target = makeTarget("/dir/lookup", q);
  spdlog::debug("GET {}{}", baseUrl(), target);
  HttpResponse res = transport_->get(baseUrl(), target);

  if (res.status != 200) {
    spdlog::warn("lookup of volume {} on {} returned {}", fid.volume_id, baseUrl(), res.status);
    throw WeedError(ErrorKind::InvalidRequest, res.body);
  }

  json j = parse_body(res, "lookup response");
  try {
    const json& locations = j.at("locations");
    if (!locations.is_array()) {
      throw WeedError(ErrorKind::TransportFailure, "lookup response: locations is not an array");
    }
    LookupResult out;
    for (const auto& loc : locations) {
      out.locations.push_back(location_from(loc));
    }
    return out;
  } catch (const json::exception& e) {
    throw WeedError(ErrorKind::TransportFailure, std::string("lookup response: ") + e.what());
  }
}

} // namespace weed
