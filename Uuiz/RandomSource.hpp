#ifndef UUIZ_RANDOMSOURCE_HPP
#define UUIZ_RANDOMSOURCE_HPP

#include<cstddef>
#include<stdexcept>
#include<string>

namespace Uuiz {

struct RandomSourceError : public std::runtime_error {
	RandomSourceError(std::string const& msg)
		: std::runtime_error("Uuiz::RandomSourceError: " + msg) { }
};

/** class Uuiz::RandomSource
 *
 * @brief abstract source of random bytes used by the
 * generators.
 *
 * @desc implementations must either fill the entire
 * buffer or throw Uuiz::RandomSourceError.
 */
class RandomSource {
public:
	virtual ~RandomSource() { }
	virtual void fill(void* p, std::size_t size) =0;
};

}

#endif /* !defined(UUIZ_RANDOMSOURCE_HPP) */
