#ifndef WS_SYNC_REPORTING_H
#define WS_SYNC_REPORTING_H

#include "../lib/Module.h"

#include <atomic>
#include <cstddef>
#include <string>

namespace ws {
namespace blistener {

/**
 * Sink for non-fatal errors: reported where a reporting backend exists,
 * logged as a warning otherwise
 */
class IReporter {
public:
  virtual ~IReporter() = default;
  virtual void reportOrLogW(const std::string &prefix,
                            const std::string &detail) = 0;
};

class LogReporter : public Module, public IReporter {
public:
  LogReporter();
  ~LogReporter() override = default;

  void reportOrLogW(const std::string &prefix,
                    const std::string &detail) override;

  size_t getReportCount() const { return reportCount_; }

private:
  std::atomic<size_t> reportCount_{ 0 };
};

} // namespace blistener
} // namespace ws

#endif // WS_SYNC_REPORTING_H
