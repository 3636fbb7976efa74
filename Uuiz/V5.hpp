#ifndef UUIZ_V5_HPP
#define UUIZ_V5_HPP

#include"Sha1/Hash.hpp"
#include"Sha1/Hasher.hpp"
#include"Uuiz/Name/Context.hpp"
#include"Uuiz/Name/Generator.hpp"
#include<string>

namespace Uuiz {
namespace V5 {

/* Name-based UUIDs hashed with SHA-1.  */
typedef Name::Generator<Sha1::Hasher, Version::v5> Generator;
typedef Name::Context<Sha1::Hasher, Version::v5> Context;

Uuid generate(Uuid const& ns, std::string const& name);

}}

#endif /* !defined(UUIZ_V5_HPP) */
