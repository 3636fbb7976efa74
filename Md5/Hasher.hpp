#ifndef MD5_HASHER_HPP
#define MD5_HASHER_HPP

#include<cstddef>
#include<memory>

namespace Md5 { class Hash; }

namespace Md5 {

/** class Md5::Hasher
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

	Md5::Hash finalize()&&;
	/* Copies the midstate, so it costs more than finalize.  */
	Md5::Hash get() const;
};

}

#endif /* !defined(MD5_HASHER_HPP) */
