#include "Reporting.h"

namespace ws {
namespace blistener {

LogReporter::LogReporter() : Module("wallet.reporting") {}

void LogReporter::reportOrLogW(const std::string &prefix,
                               const std::string &detail) {
  ++reportCount_;
  log().warning << prefix << detail;
}

} // namespace blistener
} // namespace ws
