#undef NDEBUG
#include"Uuiz/RandomSource.hpp"
#include"Uuiz/Uuid.hpp"
#include"Uuiz/V4.hpp"
#include"Uuiz/Variant.hpp"
#include"Uuiz/Version.hpp"
#include<assert.h>
#include<cstdint>
#include<cstring>
#include<unordered_set>

namespace {

class ByteRandom : public Uuiz::RandomSource {
public:
	std::uint8_t b;
	ByteRandom(std::uint8_t b_) : b(b_) { }
	void fill(void* p, std::size_t size) override {
		std::memset(p, b, size);
	}
};

class EmptyRandom : public Uuiz::RandomSource {
public:
	void fill(void*, std::size_t) override {
		throw Uuiz::RandomSourceError("entropy pool is empty");
	}
};

}

int main() {
	auto seen = std::unordered_set<Uuiz::Uuid>();
	for (auto i = 0; i < 10000; ++i) {
		auto u = Uuiz::V4::generate();
		assert(Uuiz::version(u) == Uuiz::Version::v4);
		assert(Uuiz::variant(u) == Uuiz::Variant::rfc4122);
		seen.insert(u);
	}
	assert(seen.size() == 10000);

	/* Only the six fixed bits are touched.  */
	auto zeros = ByteRandom(0x00);
	assert( std::string(Uuiz::V4::generate(zeros))
	     == "00000000-0000-4000-8000-000000000000"
	      );
	auto ones = ByteRandom(0xFF);
	assert( std::string(Uuiz::V4::generate(ones))
	     == "ffffffff-ffff-4fff-bfff-ffffffffffff"
	      );

	auto empty = EmptyRandom();
	auto thrown = false;
	try {
		Uuiz::V4::generate(empty);
	} catch (Uuiz::RandomSourceError const&) {
		thrown = true;
	}
	assert(thrown);

	return 0;
}
