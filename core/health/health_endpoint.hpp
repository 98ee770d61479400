#pragma once

#include <string>

namespace minekeeper {
namespace health {

enum class ResponseFormat { JSON };

// Where and how to read the worker's reported throughput.
struct HealthEndpoint {
    std::string host = "localhost";
    int port = 80;
    std::string page;      // Path without leading '/', may be empty
    std::string user;      // Basic auth, used only when password is also set
    std::string password;
    ResponseFormat format = ResponseFormat::JSON;
    std::string parser;    // Name registered in throughput_parsers
    int timeout_seconds = 6;
};

}  // namespace health
}  // namespace minekeeper
