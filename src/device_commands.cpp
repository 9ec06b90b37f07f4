#include "ymodem/device_commands.hpp"

#include <stdexcept>

namespace ymodem {

std::vector<uint8_t> make_command_line(std::string_view cmd) {
    std::vector<uint8_t> line;
    line.reserve(cmd.size() + 2);
    line.push_back('\r');
    line.insert(line.end(), cmd.begin(), cmd.end());
    line.push_back('\r');
    return line;
}

std::string run_script_command(std::string_view remote_name, int stack_size) {
    if (stack_size <= 0) {
        throw std::invalid_argument("Script stack size must be positive");
    }
    return "js " + std::string(remote_name) + " --stack " + std::to_string(stack_size);
}

void send_command(ITransport& transport, std::string_view cmd) {
    transport.write(make_command_line(cmd));
}

} // namespace ymodem
