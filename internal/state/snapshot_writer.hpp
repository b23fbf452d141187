#pragma once

#include <filesystem>

#include "swarm/engine/v1/types.pb.h"

namespace swarm::state {

/*
  Writes <dir>/<session_id>.json atomically (temp file + rename).
  Throws util::StoreError.
*/
void WriteSessionSnapshot(const std::filesystem::path& dir, const swarm::engine::v1::SessionSnapshot& snapshot);

std::filesystem::path SessionSnapshotPath(const std::filesystem::path& dir, const std::string& session_id);

} // namespace swarm::state
