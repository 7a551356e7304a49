#pragma once

#include <functional>
#include <string>

namespace docanalyst::cli {

// Decides from an error message whether a failed call is worth retrying.
using ErrorClassifier = std::function<bool(const std::string& message)>;

// Case-insensitive match on "rate" or "limit".
bool is_rate_limit_message(const std::string& message);

ErrorClassifier default_error_classifier();

}  // namespace docanalyst::cli
