#include "option.hpp"

namespace config {

    std::string trim(const std::string& s) {
        static const char* const whitespace = " \t\n\r";
        const auto first = s.find_first_not_of(whitespace);
        if (first == std::string::npos) {
            return "";
        }
        const auto last = s.find_last_not_of(whitespace);
        return s.substr(first, last - first + 1);
    }

}  // namespace config
