#include "pchheader.hpp"
#include "util/util.hpp"
#include "tclog.hpp"

namespace tclog
{
    // Labels indexed by plog::Severity (none, fatal, error, warning, info, debug, verbose).
    constexpr const char *SEVERITY_LABELS[] = {"---", "fat", "err", "wrn", "inf", "dbg", "ver"};

    // Single line log records: "YYYYMMDD HH:MM:SS [sev][tpc] message"
    class line_formatter
    {
    public:
        static plog::util::nstring header()
        {
            return plog::util::nstring();
        }

        static plog::util::nstring format(const plog::Record &record)
        {
            tm t;
            plog::util::localtime_s(&t, &record.getTime().time);

            char timestamp[20];
            strftime(timestamp, sizeof(timestamp), "%Y%m%d %H:%M:%S", &t);

            plog::util::nostringstream ss;
            ss << timestamp << " [" << get_severity_label(record.getSeverity()) << "][tpc] "
               << record.getMessage() << "\n";
            return ss.str();
        }
    };

    /**
     * Maps the configured log level to the plog severity threshold.
     */
    plog::Severity get_plog_severity(const conf::LOG_SEVERITY severity)
    {
        switch (severity)
        {
        case conf::LOG_SEVERITY::DEBUG:
            return plog::Severity::debug;
        case conf::LOG_SEVERITY::INFO:
            return plog::Severity::info;
        case conf::LOG_SEVERITY::WARN:
            return plog::Severity::warning;
        default:
            return plog::Severity::error;
        }
    }

    const char *get_severity_label(const plog::Severity severity)
    {
        const size_t index = (size_t)severity;
        return index < sizeof(SEVERITY_LABELS) / sizeof(SEVERITY_LABELS[0]) ? SEVERITY_LABELS[index] : "def";
    }

    /**
     * Starts logging with the appenders enabled in the log config.
     * Console records go to stderr because stdout carries the feed replies.
     * File records roll over at <log dir>/tipcore.log within the configured size and count limits.
     * @return 0 on success. -1 if file logging is enabled but the log directory is missing.
     */
    int init(const conf::log_config &log, const std::string &log_dir)
    {
        const bool to_file = log.loggers.count("file") == 1;
        if (to_file && !util::is_dir_exists(log_dir))
        {
            std::cerr << "Log directory " << log_dir << " does not exist.\n";
            return -1;
        }

        plog::Logger<0> &logger = plog::init(get_plog_severity(log.log_level_type));

        if (log.loggers.count("console") == 1)
        {
            static plog::ConsoleAppender<line_formatter> console_appender(plog::streamStdErr);
            logger.addAppender(&console_appender);
        }

        if (to_file)
        {
            const std::string log_file = log_dir + "/tipcore.log";
            static plog::RollingFileAppender<line_formatter> file_appender(
                log_file.c_str(), log.max_mbytes_per_file * 1024 * 1024, (int)log.max_file_count);
            logger.addAppender(&file_appender);
        }

        return 0;
    }
} // namespace tclog
