#include"Sha1/Hash.hpp"
#include"Sha1/Hasher.hpp"
#include"Util/make_unique.hpp"
#include<basicsecure.h>
#include<openssl/evp.h>
#include<stdexcept>

namespace Sha1 {

class Hasher::Impl {
private:
	EVP_MD_CTX* ctx;

public:
	Impl() : ctx(EVP_MD_CTX_new()) {
		if (!ctx)
			throw std::runtime_error("Sha1::Hasher: EVP_MD_CTX_new failed.");
		if (!EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr)) {
			EVP_MD_CTX_free(ctx);
			throw std::runtime_error("Sha1::Hasher: EVP_DigestInit_ex failed.");
		}
	}
	Impl(Impl const& o) : ctx(EVP_MD_CTX_new()) {
		if (!ctx)
			throw std::runtime_error("Sha1::Hasher: EVP_MD_CTX_new failed.");
		if (!EVP_MD_CTX_copy_ex(ctx, o.ctx)) {
			EVP_MD_CTX_free(ctx);
			throw std::runtime_error("Sha1::Hasher: EVP_MD_CTX_copy_ex failed.");
		}
	}
	Impl& operator=(Impl const&) =delete;
	~Impl() {
		/* EVP_MD_CTX_free cleanses the digest state.  */
		EVP_MD_CTX_free(ctx);
	}

	void feed(void const* p, std::size_t len) {
		if (!EVP_DigestUpdate(ctx, p, len))
			throw std::runtime_error("Sha1::Hasher: EVP_DigestUpdate failed.");
	}
	void finalize(std::uint8_t buff[20]) {
		auto len = (unsigned int) 0;
		if (!EVP_DigestFinal_ex(ctx, buff, &len) || len != 20)
			throw std::runtime_error("Sha1::Hasher: EVP_DigestFinal_ex failed.");
	}
};

Hasher::Hasher() : pimpl(Util::make_unique<Impl>()) { }
Hasher::Hasher(Hasher&&) =default;
Hasher::~Hasher() =default;
Hasher::Hasher(Hasher const& o
	      ) : pimpl(o.pimpl ? Util::make_unique<Impl>(*o.pimpl) : nullptr) { }

Hasher& Hasher::operator=(Hasher&&) =default;
Hasher& Hasher::operator=(Hasher const& i) {
	*this = Hasher(i);
	return *this;
}

Hasher::operator bool() const {
	return !!pimpl;
}
void Hasher::feed(void const* p, std::size_t len) {
	if (!pimpl)
		throw std::logic_error("Sha1::Hasher: feed after finalize.");
	return pimpl->feed(p, len);
}

Sha1::Hash Hasher::finalize()&& {
	if (!pimpl)
		throw std::logic_error("Sha1::Hasher: already finalized.");
	std::uint8_t buff[20];
	pimpl->finalize(buff);
	pimpl = nullptr;

	auto tmp = Sha1::Hash(buff);
	basicsecure_clear(buff, sizeof(buff));

	return tmp;
}
Sha1::Hash Hasher::get() const {
	/* Copies are expensive!!  */
	auto tmp = *this;
	return std::move(tmp).finalize();
}

}
