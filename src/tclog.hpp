#ifndef _TC_TCLOG_
#define _TC_TCLOG_

#include "pchheader.hpp"
#include "conf.hpp"

namespace tclog
{
    plog::Severity get_plog_severity(const conf::LOG_SEVERITY severity);

    const char *get_severity_label(const plog::Severity severity);

    int init(const conf::log_config &log, const std::string &log_dir);
} // namespace tclog

#endif
