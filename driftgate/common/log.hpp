/*
   Copyright 2022 The Driftgate Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#ifndef DRIFTGATE_COMMON_LOG_HPP_
#define DRIFTGATE_COMMON_LOG_HPP_

#include <absl/strings/string_view.h>

#include <mutex>
#include <ostream>
#include <string>

namespace driftgate {

// available verbosity levels
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, None };

// silence
std::ostream& null_stream();

//
// Below are for access via macros ONLY.
//
extern LogLevel log_verbosity_;
extern bool log_thread_enabled_;
void log_set_streams_(std::ostream& o1, std::ostream& o2);
class log_ {
  public:
    explicit log_(LogLevel level) : level_(level) { log_mtx_.lock(); }
    ~log_() { log_mtx_.unlock(); }
    std::ostream& header_(LogLevel);
    template <class T>
    std::ostream& operator<<(const T& message) {
        return header_(level_) << message;
    }

  private:
    LogLevel level_;
    static std::mutex log_mtx_;
};

using Logger = log_;

#define DRIFTGATE_LOG_(level_) if ((level_) < driftgate::log_verbosity_) {} else driftgate::log_(level_) << " " // NOLINT

// LogTrace, LogDebug, LogInfo, LogWarn, LogError, LogCritical, LogNone
#define DRIFTGATE_TRACE DRIFTGATE_LOG_(driftgate::LogLevel::Trace)
#define DRIFTGATE_DEBUG DRIFTGATE_LOG_(driftgate::LogLevel::Debug)
#define DRIFTGATE_INFO  DRIFTGATE_LOG_(driftgate::LogLevel::Info)
#define DRIFTGATE_WARN  DRIFTGATE_LOG_(driftgate::LogLevel::Warn)
#define DRIFTGATE_ERROR DRIFTGATE_LOG_(driftgate::LogLevel::Error)
#define DRIFTGATE_CRIT  DRIFTGATE_LOG_(driftgate::LogLevel::Critical)
#define DRIFTGATE_LOG   DRIFTGATE_LOG_(driftgate::LogLevel::None)

#define DRIFTGATE_LOG_VERBOSITY(level_) (driftgate::log_verbosity_ = (level_))

#define DRIFTGATE_LOG_THREAD(log_thread_) (driftgate::log_thread_enabled_ = (log_thread_))

#define DRIFTGATE_LOG_STREAMS(stream1_, stream2_) driftgate::log_set_streams_((stream1_), (stream2_))

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error);
std::string AbslUnparseFlag(LogLevel level);

} // namespace driftgate

#endif  // DRIFTGATE_COMMON_LOG_HPP_
