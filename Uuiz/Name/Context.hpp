#ifndef UUIZ_NAME_CONTEXT_HPP
#define UUIZ_NAME_CONTEXT_HPP

#include"Uuiz/Name/from_digest.hpp"
#include"Uuiz/Uuid.hpp"
#include"Uuiz/Version.hpp"
#include"Uuiz/log.hpp"
#include<cstddef>
#include<stdexcept>
#include<string>
#include<utility>

namespace Uuiz {

/* A one-shot context was asked for a second UUID.  */
struct ReuseError : public std::logic_error {
	ReuseError()
		: std::logic_error("Uuiz::ReuseError: name context already consumed.") { }
};

namespace Name {

/** class Uuiz::Name::Context<Hasher, V>
 *
 * @brief one-shot name-based UUID generator.
 *
 * @desc the hasher is fed the namespace at construction
 * and consumed by the single call to `generate`, which
 * must be made on an rvalue:
 *
 *     auto uuid = std::move(context).generate("name");
 *
 * A second call, or a call on a moved-from context,
 * throws Uuiz::ReuseError.
 * Prefer Uuiz::Name::Generator, which is reusable.
 */
template<typename Hasher, Version V>
class Context {
private:
	Uuid ns;
	Hasher hasher;

public:
	explicit
	Context(Uuid ns_) : ns(std::move(ns_)), hasher() {
		feed_namespace(hasher, ns);
	}
	Context(Context&&) =default;
	Context& operator=(Context&&) =default;
	Context(Context const&) =delete;
	Context& operator=(Context const&) =delete;

	Uuid const& get_namespace() const { return ns; }

	/* Can this still generate?  */
	explicit
	operator bool() const { return bool(hasher); }
	bool operator!() const {
		return !bool(*this);
	}

	Uuid generate(void const* p, std::size_t len)&& {
		if (!hasher)
			throw ReuseError();
		hasher.feed(p, len);
		auto rv = from_digest(std::move(hasher).finalize(), V);
		log( Debug
		   , "Name::Context: consumed for namespace %s"
		   , std::string(ns).c_str()
		   );
		return rv;
	}
	Uuid generate(std::string const& name)&& {
		return std::move(*this).generate(name.data(), name.size());
	}
};

}}

#endif /* !defined(UUIZ_NAME_CONTEXT_HPP) */
