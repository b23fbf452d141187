#pragma once

#include <string>

#include "swarm/engine/v1/types.pb.h"

namespace swarm::db::model {

/*
  Current topology graph of a session. The graph is stored as a
  serialized TopologyGraph; kind/leader/version are duplicated into
  columns for inspection.
*/
struct TopologyRecord {
  std::string                      session_id;
  swarm::engine::v1::TopologyGraph graph;
};

} // namespace swarm::db::model
