//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include <string_view>

#include <absl/base/call_once.h>
#include <absl/base/internal/raw_logging.h>
#include <absl/base/log_severity.h>
#include <absl/log/absl_log.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/internal/globals.h>
#include <absl/log/log_entry.h>
#include <absl/log/log_sink.h>
#include <absl/log/log_sink_registry.h>
#include <pybind11/gil.h>
#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>

#include "molutil/python/config.h"

namespace molutil {
namespace python_internal {
namespace {
int absl_severity_to_py_loglevel(absl::LogSeverity s) {
  switch (absl::NormalizeLogSeverity(s)) {
  case absl::LogSeverity::kFatal:
    return 50;
  case absl::LogSeverity::kError:
    return 40;
  case absl::LogSeverity::kWarning:
    return 30;
  case absl::LogSeverity::kInfo:
    return 20;
  }
  return 0;
}

absl::LogSeverityAtLeast py_loglevel_to_absl_severity(int level) {
  if (level <= 0)
    return absl::LogSeverityAtLeast::kWarning;

  if (level >= 50)
    return absl::LogSeverityAtLeast::kFatal;
  if (level >= 40)
    return absl::LogSeverityAtLeast::kError;
  if (level >= 30)
    return absl::LogSeverityAtLeast::kWarning;

  return absl::LogSeverityAtLeast::kInfo;
}

int message_loglevel(const absl::LogEntry &entry) {
  // rejected annotations and engine traces -> debug level
  if (entry.verbosity() != absl::LogEntry::kNoVerbosityLevel)
    return 10;
  return absl_severity_to_py_loglevel(entry.log_severity());
}

/**
 * @brief Set the abseil log level from a Python log level.
 *
 * DEBUG (or any level in `(0, 10]`) also enables verbose logging up to level
 * 2, which reports ignored atom and bond references.
 */
void set_log_level(int level) {
  absl::LogSeverityAtLeast severity = py_loglevel_to_absl_severity(level);
  absl::SetMinLogLevel(severity);

  const int vlevel = level > 0 && level <= 10 ? 2 : 0;
  const int prev = absl::SetGlobalVLogLevel(vlevel);
  ABSL_VLOG(1) << "Setting verbose log level " << prev << " -> " << vlevel;
}

// Strips the severity, timestamp and thread id from the prefix
std::string_view strip_prefix(std::string_view msg) {
  // [IWEF]mmdd HH:MM:SS.UUUUUU <thrid> file:line] message
  constexpr std::string_view::size_type kFixedWidth = 22;
  if (msg.size() <= kFixedWidth)
    return msg;

  msg.remove_prefix(kFixedWidth);
  auto pos = msg.find(' ');
  return pos == std::string_view::npos ? msg : msg.substr(pos + 1);
}

class PyLogSink: public absl::LogSink {
public:
  /**
   * @pre The GIL must be held.
   */
  static void init() {
    static absl::once_flag flag;

    auto initializer = []() {
      if (!absl::log_internal::IsInitialized())
        absl::InitializeLog();

      logger_ = py::module_::import("logging").attr("getLogger")("molutil");
      logger_.inc_ref();

      // NOLINTNEXTLINE(*-owning-memory)
      absl::AddLogSink(new PyLogSink);
      absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfinity);
      set_log_level(20);
    };

    absl::call_once(flag, initializer);
  }

  void Send(const absl::LogEntry &entry) override try {
    const py::gil_scoped_acquire gil;

    try {
      logger_.attr("log")(message_loglevel(entry),
                          strip_prefix(entry.text_message_with_prefix()));
    } catch (py::error_already_set &e) {
      e.discard_as_unraisable("molutil internal logging");
    }
  } catch (...) {
    ABSL_RAW_LOG(ERROR, "unknown error while logging (original message: %s)",
                 entry.text_message_with_prefix_and_newline_c_str());
  }

private:
  // NOLINTNEXTLINE(*-identifier-naming,*-global-variables)
  static py::handle logger_;
};

// NOLINTNEXTLINE(*-global-variables)
py::handle PyLogSink::logger_;

MOLUTIL_PYTHON_MODULE(m) {
  m.def("_init", &PyLogSink::init);
  m.def("set_log_level", set_log_level, py::arg("level"), R"doc(
    Set the log level of the native library.

    :param level: A :mod:`logging` level. ``logging.DEBUG`` also reports
      atom and bond references that were ignored while drawing.
  )doc");
}
}  // namespace
}  // namespace python_internal
}  // namespace molutil
