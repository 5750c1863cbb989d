#include "sim/node_protocol.hpp"
#include "util/string_parsing.hpp"
#include <climits>

namespace lorasim {
namespace sim {

std::string StripLineEnding(std::string line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  return line;
}

NodeLine ClassifyNodeLine(const std::string &raw) {
  std::string line = StripLineEnding(raw);

  auto fields = util::SplitFields(line, protocol::FIELD_DELIMITER, 3);
  if (fields[0] != protocol::commands::TRANSMIT_PACKET) {
    return ResponseLine{std::move(line)};
  }

  if (fields.size() < 3) {
    return MalformedTransmit{std::move(line), "missing length or payload field"};
  }

  // A zero-length packet is "transmit_packet,0," and is forwarded as such
  const std::string &hexdata = fields[2];
  if (!hexdata.empty() && !util::IsValidHex(hexdata)) {
    return MalformedTransmit{std::move(line), "payload is not hex data"};
  }

  TransmitPacket packet;
  packet.declared_length = util::SafeParseInt(fields[1], 0, INT_MAX);
  packet.hexdata = hexdata;
  return packet;
}

bool IsStateResponse(const std::string &line) {
  const std::string prefix = protocol::commands::GET_STATE;
  if (line.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  return line.size() == prefix.size() || line[prefix.size()] == protocol::FIELD_DELIMITER;
}

std::string MakeReceivePacketCommand(const std::string &hexdata) {
  return std::string(protocol::commands::NETWORK_RECEIVE_PACKET) +
         protocol::FIELD_DELIMITER + hexdata;
}

std::optional<StateReport> ParseStateReport(const std::string &line) {
  if (!IsStateResponse(line)) {
    return std::nullopt;
  }

  auto fields = util::SplitFields(StripLineEnding(line), protocol::FIELD_DELIMITER);
  if (fields.size() < 2 || fields[1].empty()) {
    return std::nullopt;
  }

  StateReport report;
  report.uptime_ms = fields[1];
  for (size_t i = 2; i + 4 <= fields.size(); i += 4) {
    report.entries.push_back(StateEntry{fields[i], fields[i + 1], fields[i + 2], fields[i + 3]});
  }
  return report;
}

} // namespace sim
} // namespace lorasim
