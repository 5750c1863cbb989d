#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace lorasim {
namespace sim {

// NodeEndpoint - what the rest of the orchestrator needs from a node
// Allows dependency injection of different implementations:
// - NodeProcess: external program over stdin/stdout pipes
// - FakeNode: in-memory recorder for testing (in test/)
class NodeEndpoint {
public:
  virtual ~NodeEndpoint() = default;

  virtual const std::string &name() const = 0;

  // Write one command line (delimiter appended). Fire-and-forget; returns
  // false if the command could not be written (node gone, pipe closed).
  virtual bool send(const std::string &command_line) = 0;

  // Discard any unconsumed response, send get_state and wait up to
  // `timeout` for a state response. std::nullopt on timeout.
  virtual std::optional<std::string>
  query_state(std::chrono::milliseconds timeout) = 0;

  // Best-effort termination; never throws
  virtual void terminate() = 0;
};

using NodeEndpointPtr = std::shared_ptr<NodeEndpoint>;

} // namespace sim
} // namespace lorasim
