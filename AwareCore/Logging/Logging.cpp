// Category handles for the unified log. Every category shares the "com.aware.core"
// subsystem; the AWR_LOG macros add readable prefixes for filtering.
#include "Logging.hpp"
#include <os/log.h>

namespace {
constexpr const char* kSubsystem = "com.aware.core";

inline os_log_t MakeCategory(const char* category) {
    return os_log_create(kSubsystem, category);
}
} // namespace

namespace AWR::Logging {

os_log_t Core()      { static os_log_t log = MakeCategory("core");      return log; }
os_log_t Session()   { static os_log_t log = MakeCategory("session");   return log; }
os_log_t Hal()       { static os_log_t log = MakeCategory("hal");       return log; }
os_log_t DataPath()  { static os_log_t log = MakeCategory("datapath");  return log; }
os_log_t Transport() { static os_log_t log = MakeCategory("transport"); return log; }
os_log_t Config()    { static os_log_t log = MakeCategory("config");    return log; }

} // namespace AWR::Logging
