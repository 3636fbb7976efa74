#ifndef UUIZ_MAIN_HPP
#define UUIZ_MAIN_HPP

#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Uuiz { class Clock; }
namespace Uuiz { class RandomSource; }

namespace Uuiz {

/** class Uuiz::Main
 *
 * @brief the `uuiz` command line front end.
 *
 * @desc parses `argv` on construction; `run` then
 * generates or inspects UUIDs, writing results to
 * `cout` and diagnostics and log messages to `cerr`,
 * and returns the process exit code.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    );
	/* With the given collaborators instead of the
	 * system clock and secure randomness.
	 */
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    , Clock& clock
	    , RandomSource& rand
	    );
	Main(Main&&);
	~Main();

	int run();
};

}

#endif /* !defined(UUIZ_MAIN_HPP) */
