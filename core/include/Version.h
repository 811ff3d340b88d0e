#pragma once

#include <string>
#include <cstdint>

namespace RelayPipe {
    struct Version {
        static constexpr int MAJOR = 1;
        static constexpr int MINOR = 2;
        static constexpr int PATCH = 0;
        static constexpr const char* STRING = "1.2.0";

        // Bumped whenever the chunk frame or the HTTP headers change incompatibly
        static constexpr uint8_t PROTOCOL = 1;

        static std::string toString() {
            return std::string(STRING);
        }
    };
}
