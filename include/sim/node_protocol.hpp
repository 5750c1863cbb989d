#pragma once

/*
 Node line protocol

 Each simulated node is an external program speaking newline-terminated,
 comma-delimited text on stdin/stdout.

 Commands written to a node:
   network_receive_packet,<HEXDATA>   deliver a payload heard on the air
   get_state                          ask for the node's current view
   anything else (e.g. node_update,<name>,<ts>,<lat>,<lon>) passes through

 Lines read from a node:
   transmit_packet,<LEN>,<HEXDATA>    push notification: the node spoke
   get_state,<uptime_ms>,<name>,<ts>,<lat>,<lon>,...   state response
   anything else                      opaque response

 The node does not know about the orchestrator's request/response pairing,
 so push traffic and responses share one stream and are told apart here.
*/

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lorasim {
namespace sim {

namespace protocol {
namespace commands {
constexpr const char *TRANSMIT_PACKET = "transmit_packet";
constexpr const char *NETWORK_RECEIVE_PACKET = "network_receive_packet";
constexpr const char *GET_STATE = "get_state";
} // namespace commands

constexpr char FIELD_DELIMITER = ',';
constexpr char LINE_DELIMITER = '\n';
} // namespace protocol

// A node announced it transmitted a packet
struct TransmitPacket {
  std::optional<int> declared_length;  // LEN field, bytes
  std::string hexdata;
};

// Any line that is not push traffic; candidate query response
struct ResponseLine {
  std::string text;
};

// Line tagged as transmit_packet that cannot be routed
struct MalformedTransmit {
  std::string text;
  std::string reason;
};

using NodeLine = std::variant<TransmitPacket, ResponseLine, MalformedTransmit>;

/**
 * Classify one line of node output (trailing CR/LF already removed or not)
 *
 * Examples:
 *   "transmit_packet,2,DEAD"   -> TransmitPacket{2, "DEAD"}
 *   "transmit_packet,0,"       -> TransmitPacket{0, ""}
 *   "transmit_packet,2"        -> MalformedTransmit (missing payload)
 *   "get_state,1200"           -> ResponseLine
 */
NodeLine ClassifyNodeLine(const std::string &line);

/**
 * True if the response line answers a get_state query
 */
bool IsStateResponse(const std::string &line);

/**
 * Build the command that hands a forwarded payload to a node
 */
std::string MakeReceivePacketCommand(const std::string &hexdata);

/**
 * Strip trailing "\r" and "\n" characters
 */
std::string StripLineEnding(std::string line);

// One entry of a node's view of the network
struct StateEntry {
  std::string name;
  std::string timestamp;
  std::string lat;
  std::string lon;
};

struct StateReport {
  std::string uptime_ms;
  std::vector<StateEntry> entries;
};

/**
 * Parse a get_state response
 *
 * Format: get_state,<uptime_ms>,<name1>,<ts1>,<lat1>,<lon1>,...
 * Trailing fields that do not complete a 4-tuple are ignored.
 *
 * @return std::nullopt if the line is not a state response or lacks uptime
 */
std::optional<StateReport> ParseStateReport(const std::string &line);

} // namespace sim
} // namespace lorasim
