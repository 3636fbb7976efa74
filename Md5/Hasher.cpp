#include"Md5/Hash.hpp"
#include"Md5/Hasher.hpp"
#include"Util/make_unique.hpp"
#include<basicsecure.h>
#include<openssl/evp.h>
#include<stdexcept>

namespace Md5 {

class Hasher::Impl {
private:
	EVP_MD_CTX* ctx;

public:
	Impl() : ctx(EVP_MD_CTX_new()) {
		if (!ctx)
			throw std::runtime_error("Md5::Hasher: EVP_MD_CTX_new failed.");
		if (!EVP_DigestInit_ex(ctx, EVP_md5(), nullptr)) {
			EVP_MD_CTX_free(ctx);
			throw std::runtime_error("Md5::Hasher: EVP_DigestInit_ex failed.");
		}
	}
	Impl(Impl const& o) : ctx(EVP_MD_CTX_new()) {
		if (!ctx)
			throw std::runtime_error("Md5::Hasher: EVP_MD_CTX_new failed.");
		if (!EVP_MD_CTX_copy_ex(ctx, o.ctx)) {
			EVP_MD_CTX_free(ctx);
			throw std::runtime_error("Md5::Hasher: EVP_MD_CTX_copy_ex failed.");
		}
	}
	Impl& operator=(Impl const&) =delete;
	~Impl() {
		/* EVP_MD_CTX_free cleanses the digest state.  */
		EVP_MD_CTX_free(ctx);
	}

	void feed(void const* p, std::size_t len) {
		if (!EVP_DigestUpdate(ctx, p, len))
			throw std::runtime_error("Md5::Hasher: EVP_DigestUpdate failed.");
	}
	void finalize(std::uint8_t buff[16]) {
		auto len = (unsigned int) 0;
		if (!EVP_DigestFinal_ex(ctx, buff, &len) || len != 16)
			throw std::runtime_error("Md5::Hasher: EVP_DigestFinal_ex failed.");
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
		throw std::logic_error("Md5::Hasher: feed after finalize.");
	return pimpl->feed(p, len);
}

Md5::Hash Hasher::finalize()&& {
	if (!pimpl)
		throw std::logic_error("Md5::Hasher: already finalized.");
	std::uint8_t buff[16];
	pimpl->finalize(buff);
	pimpl = nullptr;

	auto tmp = Md5::Hash(buff);
	basicsecure_clear(buff, sizeof(buff));

	return tmp;
}
Md5::Hash Hasher::get() const {
	/* Copies are expensive!!  */
	auto tmp = *this;
	return std::move(tmp).finalize();
}

}
