#pragma once

#include "ymodem/transport.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ymodem {

// Shell commands understood by the target firmware around a transfer.
inline constexpr std::string_view kReceiveCommand = "yrcv";
inline constexpr std::string_view kStopScriptCommand = "js --stop";
inline constexpr int kDefaultScriptStack = 1024;

// '\r' + cmd + '\r': the leading CR flushes any half-typed line on the target.
std::vector<uint8_t> make_command_line(std::string_view cmd);

// "js <name> --stack <stack>"
std::string run_script_command(std::string_view remote_name, int stack_size);

// Writes make_command_line(cmd). Transport exceptions propagate.
void send_command(ITransport& transport, std::string_view cmd);

} // namespace ymodem
