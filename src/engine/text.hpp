#pragma once

#include <string>

namespace cibridge::engine {

    inline std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }

}
