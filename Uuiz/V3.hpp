#ifndef UUIZ_V3_HPP
#define UUIZ_V3_HPP

#include"Md5/Hash.hpp"
#include"Md5/Hasher.hpp"
#include"Uuiz/Name/Context.hpp"
#include"Uuiz/Name/Generator.hpp"
#include<string>

namespace Uuiz {
namespace V3 {

/* Name-based UUIDs hashed with MD5.  */
typedef Name::Generator<Md5::Hasher, Version::v3> Generator;
typedef Name::Context<Md5::Hasher, Version::v3> Context;

Uuid generate(Uuid const& ns, std::string const& name);

}}

#endif /* !defined(UUIZ_V3_HPP) */
