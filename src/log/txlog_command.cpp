#include "log/txlog_command.hpp"
#include <sstream>

namespace txlog {

std::string Command::toString() const {
    std::ostringstream oss;
    if (op == Operation::LOG) {
        oss << "// " << (args.empty() ? std::string() : args.front());
        return oss.str();
    }

    oss << Utils::operationToString(op) << "(";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << args[i];
    }
    oss << ")";

    if (!result.empty()) {
        oss << " => " << result;
    }
    if (error) {
        oss << " => [" << Utils::errorCodeToString(error->code) << "] " << error->message;
    }
    return oss.str();
}

} // namespace txlog
