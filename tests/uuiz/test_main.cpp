#undef NDEBUG
#include"Uuiz/Clock.hpp"
#include"Uuiz/Main.hpp"
#include"Uuiz/RandomSource.hpp"
#include"Uuiz/Uuid.hpp"
#include"Uuiz/Version.hpp"
#include"Uuiz/log.hpp"
#include<assert.h>
#include<cstdint>
#include<sstream>
#include<string>
#include<vector>

namespace {

class FixedClock : public Uuiz::Clock {
public:
	std::uint64_t nanoseconds() override {
		return 1700000000123456700ULL;
	}
};
class CountingRandom : public Uuiz::RandomSource {
public:
	void fill(void* p, std::size_t size) override {
		auto b = (std::uint8_t*) p;
		for (auto i = std::size_t(0); i < size; ++i)
			b[i] = std::uint8_t(i + 1);
	}
};

struct Result {
	int code;
	std::string out;
	std::string err;
};

Result run(std::vector<std::string> args) {
	auto clock = FixedClock();
	auto rand = CountingRandom();
	auto out = std::ostringstream();
	auto err = std::ostringstream();
	args.insert(args.begin(), "uuiz");
	auto code = Uuiz::Main(args, out, err, clock, rand).run();
	return Result{code, out.str(), err.str()};
}

std::vector<std::string> lines(std::string const& s) {
	auto rv = std::vector<std::string>();
	auto is = std::istringstream(s);
	auto line = std::string();
	while (std::getline(is, line))
		rv.push_back(line);
	return rv;
}

}

int main() {
	{
		auto r = run({"--version"});
		assert(r.code == 0);
		assert(r.out.find("uuiz") == 0);
	}
	{
		auto r = run({"-H"});
		assert(r.code == 0);
		assert(r.out.find("--inspect=UUID") != std::string::npos);
	}
	{
		/* Default is one version 4 UUID.  */
		auto r = run({});
		assert(r.code == 0);
		assert(r.out == "01020304-0506-4708-890a-0b0c0d0e0f10\n");
	}
	{
		auto r = run({"--type=4", "--count=3"});
		assert(r.code == 0);
		auto ls = lines(r.out);
		assert(ls.size() == 3);
		for (auto const& l : ls)
			assert(Uuiz::version(Uuiz::Uuid(l)) == Uuiz::Version::v4);
	}
	{
		auto r = run({"--type=1", "--count=2"});
		assert(r.code == 0);
		auto ls = lines(r.out);
		assert(ls.size() == 2);
		assert(ls[0] == "04c29687-833b-11ee-8708-010203040506");
		assert(ls[1] == "04c29687-833b-11ee-8709-010203040506");
	}
	{
		auto r = run({"--type=3", "--name=python.org"});
		assert(r.code == 0);
		assert(r.out == "6fa459ea-ee8a-3ca4-894e-db77e160355e\n");
	}
	{
		auto r = run({"--type=5", "--namespace=6ba7b810-9dad-11d1-80b4-00c04fd430c8", "--name=python.org"});
		assert(r.code == 0);
		assert(r.out == "886313e1-3b8a-5372-9b90-0c9aee199e5d\n");
	}
	{
		auto r = run({"--type=5", "--namespace=url", "--name=https://example.com/"});
		assert(r.code == 0);
		assert(r.out == "dd2c1780-811a-5296-81c5-178a0ef488bc\n");
	}
	{
		auto r = run({"--inspect=a8098c1a-f86e-11da-bd1a-00112444be1e"});
		assert(r.code == 0);
		auto ls = lines(r.out);
		assert(ls.size() == 11);
		assert(ls[0] == "uuid: a8098c1a-f86e-11da-bd1a-00112444be1e");
		assert(ls[1] == "time_low: a8098c1a");
		assert(ls[2] == "time_mid: f86e");
		assert(ls[3] == "time_hi_and_version: 11da");
		assert(ls[4] == "clock_seq_hi_and_res: bd");
		assert(ls[5] == "clock_seq_low: 1a");
		assert(ls[6] == "node: 00112444be1e");
		assert(ls[7] == "version: v1");
		assert(ls[8] == "timestamp: 133692293110139930");
		assert(ls[9] == "clock_seq: 15642");
		assert(ls[10] == "variant: rfc4122");
	}
	{
		auto r = run({"--inspect=ffffffff-ffff-ffff-ffff-ffffffffffff"});
		assert(r.code == 0);
		assert(r.out.find("version: undefined\n") != std::string::npos);
		assert(r.out.find("variant: ms\n") != std::string::npos);
	}

	/* Errors.  */
	{
		auto r = run({"--inspect=not-a-uuid"});
		assert(r.code == 1);
		assert(r.out.empty());
		assert(r.err.find("FormatError") != std::string::npos);
	}
	{
		auto r = run({"--type=2"});
		assert(r.code == 1);
		assert(r.err.find("--type") != std::string::npos);
	}
	{
		auto r = run({"--count=-1"});
		assert(r.code == 1);
	}
	{
		auto r = run({"--type=3"});
		assert(r.code == 1);
		assert(r.err.find("--name") != std::string::npos);
	}
	{
		auto r = run({"--type=5", "--namespace=bogus", "--name=x"});
		assert(r.code == 1);
	}
	{
		auto r = run({"--frobnicate"});
		assert(r.code == 1);
		assert(r.err.find("Unrecognized option") != std::string::npos);
	}
	{
		auto r = run({"--log-level=loud"});
		assert(r.code == 1);
	}

	/* Log messages go to the error stream while running,
	 * and the previous level comes back afterwards.
	 */
	{
		auto before = Uuiz::get_log_level();
		auto r = run({"--type=1", "--log-level=debug"});
		assert(r.code == 0);
		assert(r.err.find("uuiz: debug: V1::Generator: node 010203040506") != std::string::npos);
		assert(Uuiz::get_log_level() == before);
	}

	return 0;
}
