#include "cli/error_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace docanalyst::cli {

bool is_rate_limit_message(const std::string& message) {
    std::string lowered = message;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("rate") != std::string::npos ||
           lowered.find("limit") != std::string::npos;
}

ErrorClassifier default_error_classifier() {
    return is_rate_limit_message;
}

}  // namespace docanalyst::cli
