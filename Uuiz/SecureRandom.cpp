#include"Uuiz/SecureRandom.hpp"
#include<basicsecure.h>

namespace Uuiz {

void SecureRandom::fill(void* p, std::size_t size) {
	BASICSECURE_RAND(p, size);
}

SecureRandom& SecureRandom::instance() {
	static SecureRandom rv;
	return rv;
}

}
