#ifndef UUIZ_NAME_GENERATOR_HPP
#define UUIZ_NAME_GENERATOR_HPP

#include"Uuiz/Name/from_digest.hpp"
#include"Uuiz/Uuid.hpp"
#include"Uuiz/Version.hpp"
#include<cstddef>
#include<string>
#include<utility>

namespace Uuiz {
namespace Name {

/** class Uuiz::Name::Generator<Hasher, V>
 *
 * @brief reusable name-based UUID generator.
 *
 * @desc holds a hasher that has already been fed the
 * namespace, and copies its midstate for every name, so
 * each output is the hash of namespace || name.
 * The same namespace and name always give the same UUID.
 *
 * `generate` does not modify the generator, so a single
 * generator may be shared by threads.
 */
template<typename Hasher, Version V>
class Generator {
private:
	Uuid ns;
	Hasher seeded;

public:
	explicit
	Generator(Uuid ns_) : ns(std::move(ns_)), seeded() {
		feed_namespace(seeded, ns);
	}

	Uuid const& get_namespace() const { return ns; }

	Uuid generate(void const* p, std::size_t len) const {
		auto hasher = seeded;
		hasher.feed(p, len);
		return from_digest(std::move(hasher).finalize(), V);
	}
	Uuid generate(std::string const& name) const {
		return generate(name.data(), name.size());
	}
};

}}

#endif /* !defined(UUIZ_NAME_GENERATOR_HPP) */
