#ifndef SHA1_HASH_HPP
#define SHA1_HASH_HPP

#include<cstddef>
#include<cstdint>
#include<memory>
#include<string>

namespace Sha1 { class Hasher; }

namespace Sha1 {

/** class Sha1::Hash
 *
 * @brief a 20-byte SHA-1 digest, as produced by
 * Sha1::Hasher.
 */
class Hash {
private:
	struct Impl {
		std::uint8_t d[20];
	};
	std::shared_ptr<Impl> pimpl;

	explicit
	Hash(std::uint8_t const d[20]) {
		pimpl = std::make_shared<Impl>();
		for (auto i = std::size_t(0); i < 20; ++i)
			pimpl->d[i] = d[i];
	}

	friend class Sha1::Hasher;

public:
	static constexpr std::size_t size = 20;

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

	void to_buffer(std::uint8_t d[20]) const {
		if (pimpl)
			for (auto i = std::size_t(0); i < 20; ++i)
				d[i] = pimpl->d[i];
		else
			for (auto i = std::size_t(0); i < 20; ++i)
				d[i] = 0;
	}
};

}

#endif /* !defined(SHA1_HASH_HPP) */
