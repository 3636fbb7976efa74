#include<assert.h>
#include<iostream>
#include<string>
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Uuiz/Clock.hpp"
#include"Uuiz/Fields.hpp"
#include"Uuiz/Main.hpp"
#include"Uuiz/Namespace.hpp"
#include"Uuiz/SecureRandom.hpp"
#include"Uuiz/V1.hpp"
#include"Uuiz/V3.hpp"
#include"Uuiz/V4.hpp"
#include"Uuiz/V5.hpp"
#include"Uuiz/Variant.hpp"
#include"Uuiz/Version.hpp"
#include"Uuiz/log.hpp"

#ifndef PACKAGE_STRING
# define PACKAGE_STRING "uuiz"
#endif
#ifndef PACKAGE_BUGREPORT
# define PACKAGE_BUGREPORT "the uuiz maintainers"
#endif

namespace {

/* Splits "--key=value".  */
bool split_option( std::string const& arg
		 , std::string& key
		 , std::string& value
		 ) {
	auto eq = arg.find('=');
	if (arg.compare(0, 2, "--") != 0 || eq == std::string::npos)
		return false;
	key = arg.substr(2, eq - 2);
	value = arg.substr(eq + 1);
	return true;
}

bool parse_count(std::string const& s, unsigned long& out) {
	if (s.empty() || s.size() > 9)
		return false;
	auto rv = 0UL;
	for (auto c : s) {
		if (c < '0' || c > '9')
			return false;
		rv = rv * 10 + (c - '0');
	}
	out = rv;
	return true;
}

}

namespace Uuiz {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;
	Clock& clock;
	RandomSource& rand;

	LogSink prev_sink;
	LogLevel prev_level;

	std::string argv0;
	bool is_version;
	bool is_help;
	bool is_error;

	int type;
	unsigned long count;
	std::string ns;
	std::string name;
	bool has_name;
	std::string inspect;

	void fail(std::string const& msg) {
		cerr << argv0 << ": " << msg << std::endl;
		is_error = true;
	}

	void parse_arg(std::string const& arg) {
		if (arg == "--version" || arg == "-V") {
			is_version = true;
			return;
		}
		if (arg == "--help" || arg == "-H") {
			is_help = true;
			return;
		}

		auto key = std::string();
		auto value = std::string();
		if (!split_option(arg, key, value)) {
			fail("Unrecognized option: " + arg);
			return;
		}

		if (key == "type") {
			if (value == "1" || value == "3" || value == "4" || value == "5")
				type = value[0] - '0';
			else
				fail("--type must be 1, 3, 4 or 5, not " + value);
		} else if (key == "count") {
			if (!parse_count(value, count))
				fail("--count must be a number, not " + value);
		} else if (key == "namespace") {
			ns = value;
		} else if (key == "name") {
			name = value;
			has_name = true;
		} else if (key == "inspect") {
			inspect = value;
		} else if (key == "log-level") {
			try {
				set_log_level(log_level_from_string(value));
			} catch (std::invalid_argument const& e) {
				fail(e.what());
			}
		} else
			fail("Unrecognized option: " + arg);
	}

	int usage() {
		cout << "Usage: " << argv0 << " [options]" << std::endl
		     << std::endl
		     << "Options:" << std::endl
		     << " --type=N           Generate version N UUIDs; 1, 3, 4 (default) or 5." << std::endl
		     << " --count=N          Generate N UUIDs (default 1)." << std::endl
		     << " --namespace=NS     dns, url, oid, x500 or a UUID (types 3 and 5)." << std::endl
		     << " --name=NAME        Name to hash (types 3 and 5)." << std::endl
		     << " --inspect=UUID     Show the fields, version and variant of UUID." << std::endl
		     << " --log-level=LEVEL  trace, debug, info, warn (default) or error." << std::endl
		     << " --version, -V      Show version." << std::endl
		     << " --help, -H         Show this help." << std::endl
		     << std::endl
		     << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
		     ;
		return 0;
	}

	int do_inspect() {
		auto u = Uuid();
		try {
			u = Uuid(inspect);
		} catch (FormatError const& e) {
			cerr << argv0 << ": " << e.what() << std::endl;
			return 1;
		}

		auto f = to_fields(u);
		cout << "uuid: " << u << std::endl
		     << "time_low: " << Util::Str::fmt("%08x", unsigned(f.time_low)) << std::endl
		     << "time_mid: " << Util::Str::fmt("%04x", unsigned(f.time_mid)) << std::endl
		     << "time_hi_and_version: " << Util::Str::fmt("%04x", unsigned(f.time_hi_and_version)) << std::endl
		     << "clock_seq_hi_and_res: " << Util::Str::hexbyte(f.clock_seq_hi_and_res) << std::endl
		     << "clock_seq_low: " << Util::Str::hexbyte(f.clock_seq_low) << std::endl
		     << "node: " << Util::Str::fmt("%04x%08x", unsigned(f.node >> 32), unsigned(f.node & 0xFFFFFFFF)) << std::endl
		     ;
		try {
			auto v = version(u);
			cout << "version: " << v << std::endl;
			if (v == Version::v1)
				cout << "timestamp: " << timestamp(f) << std::endl
				     << "clock_seq: " << clock_seq(f) << std::endl
				     ;
		} catch (VersionError const&) {
			cout << "version: undefined" << std::endl;
		}
		cout << "variant: " << variant(u) << std::endl;
		return 0;
	}

	int do_generate() {
		if (type == 3 || type == 5) {
			if (!has_name) {
				cerr << argv0 << ": --type=" << type
				     << " needs --name" << std::endl;
				return 1;
			}
			auto nsid = Uuid();
			try {
				nsid = Namespace::lookup(ns);
			} catch (FormatError const& e) {
				cerr << argv0 << ": --namespace: " << e.what() << std::endl;
				return 1;
			}
			log(Debug, "Main: namespace %s, name \"%s\"", std::string(nsid).c_str(), name.c_str());

			/* Deterministic, so every copy is the same.  */
			auto u = (type == 3) ? V3::Generator(nsid).generate(name)
					     : V5::Generator(nsid).generate(name)
					     ;
			for (auto i = 0UL; i < count; ++i)
				cout << u << std::endl;
			return 0;
		}

		if (type == 1) {
			auto gen = V1::Generator(clock, rand);
			for (auto i = 0UL; i < count; ++i)
				cout << gen.generate() << std::endl;
			return 0;
		}

		for (auto i = 0UL; i < count; ++i)
			cout << V4::generate(rand) << std::endl;
		return 0;
	}

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , Clock& clock_
	    , RandomSource& rand_
	    ) : cout(cout_)
	      , cerr(cerr_)
	      , clock(clock_)
	      , rand(rand_)
	      , prev_level(get_log_level())
	      , is_version(false)
	      , is_help(false)
	      , is_error(false)
	      , type(4)
	      , count(1)
	      , ns("dns")
	      , has_name(false)
	      {
		assert(argv.size() >= 1);
		argv0 = argv[0];

		auto& err = cerr;
		prev_sink = set_log_sink([&err](LogLevel l, std::string const& msg) {
			err << "uuiz: " << to_string(l) << ": " << msg << std::endl;
		});

		for (auto i = std::size_t(1); i < argv.size(); ++i)
			parse_arg(argv[i]);
	}
	~Impl() {
		set_log_sink(std::move(prev_sink));
		set_log_level(prev_level);
	}

	int run() {
		if (is_error)
			return 1;
		if (is_version) {
			cout << PACKAGE_STRING << std::endl;
			return 0;
		}
		if (is_help)
			return usage();

		try {
			if (!inspect.empty())
				return do_inspect();
			return do_generate();
		} catch (std::exception const& e) {
			cerr << "Uncaught exception: " << e.what() << std::endl;
			return 1;
		}
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  ) : Main( std::move(argv), cout, cerr
		  , SystemClock::instance()
		  , SecureRandom::instance()
		  ) { }
Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  , Clock& clock
	  , RandomSource& rand
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cout
					   , cerr
					   , clock
					   , rand
					   ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

int Main::run() {
	assert(pimpl);
	return pimpl->run();
}

}
