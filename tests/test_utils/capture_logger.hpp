#pragma once

#include <memory>
#include <string>
#include <vector>
#include <torctl/utils/logger_fwd.hpp>

namespace torctl::test {

struct LogRecord {
  logger::Level lvl;
  std::string msg;
};

using LogRecords = std::vector<LogRecord>;
using LogRecordsPtr = std::shared_ptr<LogRecords>;

// Logger that appends every delivered message to records.
inline logger::Logger MakeCaptureLogger(const LogRecordsPtr& records,
                                        logger::Level lvl = logger::trace) {
  return logger::MakeCallbackLogger(
      [records](const char*, int, const char*, logger::Level msg_lvl,
                const std::string& msg) {
        records->push_back(LogRecord{msg_lvl, msg});
      },
      lvl);
}

}  // namespace torctl::test
