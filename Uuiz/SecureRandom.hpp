#ifndef UUIZ_SECURERANDOM_HPP
#define UUIZ_SECURERANDOM_HPP

#include"Uuiz/RandomSource.hpp"

namespace Uuiz {

/** class Uuiz::SecureRandom
 *
 * @brief cryptographic randomness from the operating
 * system.
 *
 * @desc safe to share across threads.
 * If the system cannot provide randomness at all the
 * process aborts; it never hands out weak bytes.
 */
class SecureRandom : public RandomSource {
public:
	void fill(void* p, std::size_t size) override;

	/* Process-wide instance.  */
	static SecureRandom& instance();
};

}

#endif /* !defined(UUIZ_SECURERANDOM_HPP) */
