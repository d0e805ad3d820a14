#include <pill_match/errors.hpp>

namespace pill_match {

std::string to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "none";
    case ErrorCode::InvalidInput:
        return "invalid_input";
    case ErrorCode::InvalidConfig:
        return "invalid_config";
    }
    return "unknown";
}

}  // namespace pill_match
