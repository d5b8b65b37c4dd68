#pragma once

#include <exception>
#include <functional>
#include <string>

namespace reactdom {

enum class ReportSeverity {
  Error,
  Warning,
};

using ErrorReporter = std::function<void(ReportSeverity, const std::string&)>;

// Errors that escaped to the top of a host loop.
void reportGlobalError(const std::exception& ex);

void reportWarning(const std::string& message);

// An empty reporter restores the default std::cerr sink.
void setErrorReporter(ErrorReporter reporter);

} // namespace reactdom
