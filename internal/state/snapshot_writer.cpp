#include "snapshot_writer.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <system_error>

#include "internal/util/errors.hpp"

namespace swarm::state {

std::filesystem::path SessionSnapshotPath(const std::filesystem::path& dir, const std::string& session_id) {
  return dir / (session_id + ".json");
}

void WriteSessionSnapshot(const std::filesystem::path& dir, const swarm::engine::v1::SessionSnapshot& snapshot) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.add_whitespace             = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(snapshot, &json, options);
  if (!status.ok()) {
    throw util::StoreError("encode session snapshot: " + std::string(status.message()));
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) throw util::StoreError("create state dir " + dir.string() + ": " + ec.message());

  const auto target = SessionSnapshotPath(dir, snapshot.session_id());
  auto       tmp    = target;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw util::StoreError("open " + tmp.string());
    out << json;
    out.flush();
    if (!out) throw util::StoreError("write " + tmp.string());
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw util::StoreError("rename " + tmp.string() + " -> " + target.string());
  }
}

} // namespace swarm::state
