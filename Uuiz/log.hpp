#ifndef UUIZ_LOG_HPP
#define UUIZ_LOG_HPP

#include<functional>
#include<string>

namespace Uuiz {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

typedef std::function<void(LogLevel, std::string const&)> LogSink;

void log(LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 2, 3)))
#endif
;

/* Messages below this level are dropped.  Default Warn.  */
void set_log_level(LogLevel l);
LogLevel get_log_level();
/* Replaces where messages go, returning the previous sink.
 * An empty sink restores the standard-error default.
 */
LogSink set_log_sink(LogSink sink);

std::string to_string(LogLevel l);
/* Accepts the output of to_string.  Throws
 * std::invalid_argument otherwise.
 */
LogLevel log_level_from_string(std::string const& s);

}

#endif /* UUIZ_LOG_HPP */
