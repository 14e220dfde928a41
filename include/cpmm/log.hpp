#ifndef CPMM_LOG_HPP
#define CPMM_LOG_HPP

#include <boost/log/core/core.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace cpmm::util {

// Skips evaluation of the streamed arguments when the logger is disabled
// for the requested severity.
#define LOG(x)                                 \
    if (auto cpmm_pump__ = x; !cpmm_pump__) {  \
    } else                                     \
        cpmm_pump__

// =============================================================================
// Severity
// =============================================================================

enum class Severity {
    TRC,
    DBG,
    NFO,
    WRN,
    ERR,
    FTL,
};

BOOST_LOG_ATTRIBUTE_KEYWORD(log_severity, "Severity", Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(log_channel, "Channel", std::string)

std::ostream& operator<<(std::ostream& stream, Severity sev);

// "trace", "debug", "info", "warning"/"warn", "error", "fatal" (case-insensitive)
std::optional<Severity> severity_from_string(std::string_view level);

// =============================================================================
// Logger - thread-safe channel logger, cheap to copy
// =============================================================================

class Logger final {
    using LoggerType = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;
    mutable LoggerType logger_;

public:
    // Streams into a single log record; the record is pushed on destruction
    class Pump final {
        using PumpOptType = std::optional<boost::log::aux::record_pump<LoggerType>>;

        boost::log::record rec_;
        PumpOptType pump_ = std::nullopt;

    public:
        Pump(LoggerType& logger, Severity sev)
            : rec_{logger.open_record(boost::log::keywords::severity = sev)} {
            if (rec_) {
                pump_.emplace(boost::log::aux::make_record_pump(logger, rec_));
            }
        }
        ~Pump() = default;

        Pump(Pump&&) = delete;
        Pump(const Pump&) = delete;
        Pump& operator=(const Pump&) = delete;
        Pump& operator=(Pump&&) = delete;

        template <typename T>
        Pump& operator<<(T&& data) {
            if (pump_) pump_->stream() << std::forward<T>(data);
            return *this;
        }

        explicit operator bool() const { return pump_.has_value(); }
    };

    explicit Logger(std::string channel)
        : logger_{boost::log::keywords::channel = std::move(channel)} {}

    [[nodiscard]] Pump trace() const { return {logger_, Severity::TRC}; }
    [[nodiscard]] Pump debug() const { return {logger_, Severity::DBG}; }
    [[nodiscard]] Pump info() const { return {logger_, Severity::NFO}; }
    [[nodiscard]] Pump warn() const { return {logger_, Severity::WRN}; }
    [[nodiscard]] Pump error() const { return {logger_, Severity::ERR}; }
    [[nodiscard]] Pump fatal() const { return {logger_, Severity::FTL}; }
};

// =============================================================================
// LogService - process-wide sink setup
// =============================================================================

struct LogConfig {
    Severity level = Severity::NFO;
    bool console = true;
    std::optional<std::string> file;
};

class LogService {
public:
    LogService() = delete;

    // Installs console/file sinks and the per-channel severity filter.
    // Calling it again replaces the previous sinks.
    static void init(const LogConfig& config);
};

} // namespace cpmm::util

#endif // CPMM_LOG_HPP
