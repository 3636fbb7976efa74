#ifndef MD5_HASH_HPP
#define MD5_HASH_HPP

#include<cstddef>
#include<cstdint>
#include<memory>
#include<string>

namespace Md5 { class Hasher; }

namespace Md5 {

/** class Md5::Hash
 *
 * @brief a 16-byte MD5 digest.
 *
 * @desc MD5 is broken as a collision-resistant hash;
 * it is kept only because name-based version 3 UUIDs
 * are defined in terms of it.
 * Only a Hasher creates non-zero digests.
 */
class Hash {
private:
	struct Impl {
		std::uint8_t d[16];
	};
	std::shared_ptr<Impl> pimpl;

	explicit
	Hash(std::uint8_t const d[16]) {
		pimpl = std::make_shared<Impl>();
		for (auto i = std::size_t(0); i < 16; ++i)
			pimpl->d[i] = d[i];
	}

	friend class Md5::Hasher;

public:
	static constexpr std::size_t size = 16;

	Hash() =default;
	Hash(Hash const&) =default;
	Hash(Hash&&) =default;
	Hash& operator=(Hash const&) =default;
	Hash& operator=(Hash&&) =default;
	~Hash() =default;

	explicit
	operator std::string() const;

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& i) const {
		return !(*this == i);
	}

	void to_buffer(std::uint8_t d[16]) const {
		if (pimpl)
			for (auto i = std::size_t(0); i < 16; ++i)
				d[i] = pimpl->d[i];
		else
			for (auto i = std::size_t(0); i < 16; ++i)
				d[i] = 0;
	}
};

}

#endif /* !defined(MD5_HASH_HPP) */
