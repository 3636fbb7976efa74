#include"Util/Str.hpp"
#include"Uuiz/log.hpp"
#include<iostream>
#include<mutex>
#include<stdarg.h>
#include<stdexcept>

namespace {

void default_sink(Uuiz::LogLevel l, std::string const& msg) {
	std::cerr << "uuiz: " << Uuiz::to_string(l) << ": " << msg
		  << std::endl;
}

std::mutex& log_mutex() {
	static std::mutex m;
	return m;
}
Uuiz::LogLevel level = Uuiz::Warn;
Uuiz::LogSink& sink() {
	static Uuiz::LogSink s = &default_sink;
	return s;
}

}

namespace Uuiz {

void log(LogLevel l, const char *fmt, ...) {
	auto out = LogSink();
	{
		auto lock = std::unique_lock<std::mutex>(log_mutex());
		if (l < level)
			return;
		out = sink();
	}

	/* Called unlocked, so the sink may itself log.  */
	va_list ap;
	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	out(l, msg);
}

void set_log_level(LogLevel l) {
	auto lock = std::unique_lock<std::mutex>(log_mutex());
	level = l;
}
LogLevel get_log_level() {
	auto lock = std::unique_lock<std::mutex>(log_mutex());
	return level;
}
LogSink set_log_sink(LogSink s) {
	auto lock = std::unique_lock<std::mutex>(log_mutex());
	if (!s)
		s = &default_sink;
	auto old = std::move(sink());
	sink() = std::move(s);
	return old;
}

std::string to_string(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}
LogLevel log_level_from_string(std::string const& s) {
	if (s == "trace")
		return Trace;
	if (s == "debug")
		return Debug;
	if (s == "info")
		return Info;
	if (s == "warn")
		return Warn;
	if (s == "error")
		return Error;
	throw std::invalid_argument("Unknown log level: " + s);
}

}
