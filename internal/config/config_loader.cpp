#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace swarm::config {

using swarm::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1s", "0.0.0.0:50051")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  RuntimeConfig config;
  if (json_value.kind_case() == google::protobuf::Value::kNullValue) {
    ConfigLoader::ApplyDefaults(&config);
    ConfigLoader::Validate(config);
    return config;
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw swarm::util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* swarm = config->mutable_swarm();
  if (swarm->default_topology().empty()) swarm->set_default_topology("mesh");
  if (swarm->max_agents() == 0) swarm->set_max_agents(64);
  if (swarm->consensus_algorithm().empty()) swarm->set_consensus_algorithm("quorum");
  if (swarm->state_sync_interval_ms() == 0) swarm->set_state_sync_interval_ms(1000);
  if (!swarm->has_bottleneck_detection_enabled()) swarm->set_bottleneck_detection_enabled(true);
  if (!swarm->has_self_healing_enabled()) swarm->set_self_healing_enabled(true);
  if (!swarm->has_predictive_healing_enabled()) swarm->set_predictive_healing_enabled(true);
  if (!swarm->has_metrics_enabled()) swarm->set_metrics_enabled(true);
  if (!swarm->has_health_checks_enabled()) swarm->set_health_checks_enabled(true);
  if (swarm->max_sessions() == 0) swarm->set_max_sessions(128);

  auto* topology = config->mutable_topology();
  if (topology->hierarchical_branching_factor() == 0) topology->set_hierarchical_branching_factor(4);
  if (topology->adaptive_mesh_max_agents() == 0) topology->set_adaptive_mesh_max_agents(5);
  if (topology->adaptive_star_max_agents() == 0) topology->set_adaptive_star_max_agents(20);

  auto* consensus = config->mutable_consensus();
  if (consensus->default_timeout_ms() == 0) consensus->set_default_timeout_ms(30000);
  auto* gossip = consensus->mutable_gossip();
  if (gossip->fanout() == 0) gossip->set_fanout(3);
  if (gossip->max_rounds() == 0) gossip->set_max_rounds(10);
  if (gossip->convergence_threshold() == 0.0) gossip->set_convergence_threshold(0.9);
  if (gossip->round_delay_ms() == 0) gossip->set_round_delay_ms(50);

  auto* healing = config->mutable_healing();
  if (healing->window_size() == 0) healing->set_window_size(20);
  if (healing->degraded_latency_factor() == 0.0) healing->set_degraded_latency_factor(2.0);
  if (healing->missed_probes_threshold() == 0) healing->set_missed_probes_threshold(3);
  if (healing->max_restart_attempts() == 0) healing->set_max_restart_attempts(3);
  if (healing->predictive_windows() == 0) healing->set_predictive_windows(5);
  if (healing->bottleneck_throughput_ratio() == 0.0) healing->set_bottleneck_throughput_ratio(0.7);
  if (healing->bottleneck_intervals() == 0) healing->set_bottleneck_intervals(3);
  if (healing->baseline_intervals() == 0) healing->set_baseline_intervals(10);
  if (healing->min_samples() == 0) healing->set_min_samples(5);
  if (healing->probe_timeout_ms() == 0) healing->set_probe_timeout_ms(500);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  using swarm::util::InvalidConfig;

  const auto& swarm = config.swarm();
  if (!swarm::util::ParseTopologyKind(swarm.default_topology())) {
    throw InvalidConfig("unknown swarm.default_topology: " + swarm.default_topology());
  }
  if (!swarm::util::ParseConsensusAlgorithm(swarm.consensus_algorithm())) {
    throw InvalidConfig("unknown swarm.consensus_algorithm: " + swarm.consensus_algorithm());
  }
  if (swarm.max_agents() == 0) {
    throw InvalidConfig("swarm.max_agents must be positive");
  }

  const auto& topology = config.topology();
  if (topology.hierarchical_branching_factor() < 1) {
    throw InvalidConfig("topology.hierarchical_branching_factor must be at least 1");
  }
  if (topology.adaptive_mesh_max_agents() > topology.adaptive_star_max_agents()) {
    throw InvalidConfig("topology.adaptive_mesh_max_agents exceeds adaptive_star_max_agents");
  }

  const auto& gossip = config.consensus().gossip();
  if (gossip.convergence_threshold() <= 0.5 || gossip.convergence_threshold() > 1.0) {
    throw InvalidConfig("consensus.gossip.convergence_threshold must be in (0.5, 1.0]");
  }

  const auto& healing = config.healing();
  if (healing.degraded_latency_factor() <= 1.0) {
    throw InvalidConfig("healing.degraded_latency_factor must exceed 1.0");
  }
  if (healing.bottleneck_throughput_ratio() <= 0.0 || healing.bottleneck_throughput_ratio() >= 1.0) {
    throw InvalidConfig("healing.bottleneck_throughput_ratio must be in (0, 1)");
  }
  if (healing.min_samples() > healing.window_size()) {
    throw InvalidConfig("healing.min_samples exceeds healing.window_size");
  }
}

} // namespace swarm::config
