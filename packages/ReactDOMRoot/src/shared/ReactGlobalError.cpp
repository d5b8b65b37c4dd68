#include "shared/ReactGlobalError.h"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace reactdom {

namespace {

ErrorReporter& currentReporter() {
  static ErrorReporter reporter;
  return reporter;
}

void writeMessage(ReportSeverity severity, const std::string& message) {
  const auto& reporter = currentReporter();
  if (reporter) {
    reporter(severity, message);
    return;
  }
  if (severity == ReportSeverity::Warning) {
    std::cerr << "Warning: " << message << std::endl;
  } else {
    std::cerr << "React global error: " << message << std::endl;
  }
}

} // namespace

void reportGlobalError(const std::exception& ex) {
  writeMessage(ReportSeverity::Error, ex.what());
}

void reportWarning(const std::string& message) {
  writeMessage(ReportSeverity::Warning, message);
}

void setErrorReporter(ErrorReporter reporter) {
  currentReporter() = std::move(reporter);
}

} // namespace reactdom
