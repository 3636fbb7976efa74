#undef NDEBUG
#include"Sha1/Hash.hpp"
#include"Sha1/Hasher.hpp"
#include<assert.h>
#include<stdexcept>
#include<string.h>
#include<string>

namespace {

std::string sha1(char const* text) {
	auto h = Sha1::Hasher();
	h.feed(text, strlen(text));
	return std::string(std::move(h).finalize());
}

}

int main() {
	/* FIPS 180 examples.  */
	assert(sha1("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
	assert(sha1("") == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
	assert( sha1("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")
	     == "84983e441c3bd26ebaae4aa1f95129e5e54670f1"
	      );

	auto hasher = Sha1::Hasher();
	hasher.feed("ab", 2);
	auto copy = Sha1::Hasher(hasher);
	hasher.feed("c", 1);
	assert(std::string(hasher.get()) == "a9993e364706816aba3e25717850c26c9cd0d89d");
	auto abc = std::move(hasher).finalize();
	assert(std::string(abc) == "a9993e364706816aba3e25717850c26c9cd0d89d");
	assert(!hasher);
	copy.feed("c", 1);
	assert(std::move(copy).finalize() == abc);

	{
		char const* text = "the quick brown fox jumps over the lazy dog.";
		auto h = Sha1::Hasher();
		h.feed(text, strlen(text));
		h.feed(text, strlen(text));
		assert( std::string(std::move(h).finalize())
		     == "4603bb9210b6db72ec58834c4f5d8aad8a2bc0aa"
		      );
	}

	/* Finalized hashers refuse more input.  */
	auto done = Sha1::Hasher();
	auto h = std::move(done).finalize();
	assert(std::string(h) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
	auto thrown = false;
	try {
		done.feed("x", 1);
	} catch (std::logic_error const&) {
		thrown = true;
	}
	assert(thrown);

	assert(std::string(Sha1::Hash()) == "0000000000000000000000000000000000000000");
	assert(Sha1::Hash() != abc);
	std::uint8_t buf[Sha1::Hash::size];
	abc.to_buffer(buf);
	assert(buf[0] == 0xa9);
	assert(buf[19] == 0x9d);

	return 0;
}
