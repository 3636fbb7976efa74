#undef NDEBUG
#include"Uuiz/log.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>
#include<vector>

namespace {

struct Entry {
	Uuiz::LogLevel level;
	std::string msg;
};

}

int main() {
	auto entries = std::vector<Entry>();
	auto prev = Uuiz::set_log_sink([&entries](Uuiz::LogLevel l, std::string const& msg) {
		entries.push_back(Entry{l, msg});
	});
	assert(prev);

	assert(Uuiz::get_log_level() == Uuiz::Warn);
	Uuiz::log(Uuiz::Debug, "dropped %d", 1);
	Uuiz::log(Uuiz::Warn, "kept %d", 2);
	Uuiz::log(Uuiz::Error, "kept %s", "too");
	assert(entries.size() == 2);
	assert(entries[0].level == Uuiz::Warn);
	assert(entries[0].msg == "kept 2");
	assert(entries[1].msg == "kept too");

	Uuiz::set_log_level(Uuiz::Trace);
	Uuiz::log(Uuiz::Trace, "now %s", "visible");
	assert(entries.size() == 3);
	assert(entries[2].level == Uuiz::Trace);

	{
		/* A sink may log from inside itself.  */
		auto nested = std::vector<Entry>();
		Uuiz::set_log_sink([&nested](Uuiz::LogLevel l, std::string const& msg) {
			nested.push_back(Entry{l, msg});
			if (msg == "outer")
				Uuiz::log(Uuiz::Error, "inner %d", 1);
		});
		Uuiz::log(Uuiz::Warn, "outer");
		assert(nested.size() == 2);
		assert(nested[0].msg == "outer");
		assert(nested[1].level == Uuiz::Error);
		assert(nested[1].msg == "inner 1");
		/* So may a sink that replaces itself.  */
		Uuiz::set_log_sink([&nested](Uuiz::LogLevel l, std::string const& msg) {
			Uuiz::set_log_sink([&nested](Uuiz::LogLevel l2, std::string const& msg2) {
				nested.push_back(Entry{l2, "second " + msg2});
			});
			nested.push_back(Entry{l, "first " + msg});
		});
		Uuiz::log(Uuiz::Warn, "a");
		Uuiz::log(Uuiz::Warn, "b");
		assert(nested.size() == 4);
		assert(nested[2].msg == "first a");
		assert(nested[3].msg == "second b");
		Uuiz::set_log_sink([&entries](Uuiz::LogLevel l, std::string const& msg) {
			entries.push_back(Entry{l, msg});
		});
	}

	/* Restore the default.  */
	Uuiz::set_log_sink(Uuiz::LogSink());
	Uuiz::set_log_level(Uuiz::Error);
	Uuiz::log(Uuiz::Warn, "not captured");
	assert(entries.size() == 3);

	assert(Uuiz::to_string(Uuiz::Info) == "info");
	assert(Uuiz::log_level_from_string("debug") == Uuiz::Debug);
	assert(Uuiz::log_level_from_string(Uuiz::to_string(Uuiz::Error)) == Uuiz::Error);
	auto thrown = false;
	try {
		Uuiz::log_level_from_string("loud");
	} catch (std::invalid_argument const&) {
		thrown = true;
	}
	assert(thrown);

	return 0;
}
