#ifndef SHA1_HASHER_HPP
#define SHA1_HASHER_HPP

#include<cstddef>
#include<memory>

namespace Sha1 { class Hash; }

namespace Sha1 {

/** class Sha1::Hasher
 *
 * @brief object that lets you stream bytes
 * to be fed to the hasher, then generate
 * the hash of all the bytes streamed in.
 */
class Hasher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hasher();
	Hasher(Hasher&&);
	~Hasher();
	/* Duplicates midstate.  */
	Hasher(Hasher const&);

	Hasher& operator=(Hasher&&);
	Hasher& operator=(Hasher const&);

	/* Is it still valid, or has it been finalized?  */
	explicit
	operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	void feed(void const* p, std::size_t size);

	Sha1::Hash finalize()&&;
	/* Copies the midstate, so it costs more than finalize.  */
	Sha1::Hash get() const;
};

}

#endif /* !defined(SHA1_HASHER_HPP) */
