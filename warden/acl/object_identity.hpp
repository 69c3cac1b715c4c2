//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/object_identity.hpp
//

//
//  IAPPA CM Revision # : $Revision$
//  IAPPA CM Tag        : $Name$
//  Last user to change : $Author$
//  Date of change      : $Date$
//  File Path           : $Source$
//  Source of funding   : IAPPA
//
//  CAUTION:  CONTROLLED SOURCE.  DO NOT MODIFY ANYTHING ABOVE THIS LINE.
//

#ifndef WARDEN_ACL_OBJECT_IDENTITY_HPP
#define WARDEN_ACL_OBJECT_IDENTITY_HPP

#include "warden/acl/config.hpp"
#include "warden/acl/domain_object.hpp"
#include "warden/acl/error.hpp"
#include "warden/acl/identifier.hpp"
#include "warden/acl/type.hpp"
#include "warden/acl/type_registry.hpp"
#include "warden/acl/type_resolver.hpp"
#include "boost/operators.hpp"
#include <cstddef>
#include <exception>
#include <functional>
#include <iosfwd>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Object Identity

    Names one domain object:  the type it belongs to and its identifier
    within that type.  Used as the key of access control lists and of the
    caches built over them, so two identities are equal exactly when they
    name the same object.  Types must match by name; identifiers compare
    as Identifiers do (integers of any width by value).

    An Object_identity is never null and has no modifiers.  Identities
    are built from a type name (resolved through a Type_resolver), from a
    Type handle, or from a domain object (see make_object_identity).
*/
class WARDEN_ACL_DECL Object_identity : boost::totally_ordered<Object_identity> {
public:
    // Construct/Copy
    Object_identity(const Type_name&, Identifier, const Type_resolver&);
    Object_identity(const Type_name&, Identifier);
    Object_identity(Type, Identifier);
    Object_identity(const Object_identity&) = default;
    Object_identity& operator=(const Object_identity&) = default;
    friend void swap(Object_identity&, Object_identity&);

    // Observers
    const Type&         type() const;
    const Identifier&   identifier() const;

    // Comparisons
    friend bool operator==(const Object_identity&, const Object_identity&);
    friend bool operator< (const Object_identity&, const Object_identity&);

    // Hashing
    friend WARDEN_ACL_DECL std::size_t hash_value(const Object_identity&);

private:
    // Data
    Type        what;
    Identifier  which;
};


/*
    Object Identity Construction

    Derive the identity of a domain object from its effective type (see
    Canonical_object) and its identity accessor (see Identity_accessor).
    Throws Invalid_type if the effective type is not known to the
    resolver, and Identity_unavailable if the accessor fails, is missing
    from a Dynamic_object, or yields null.
*/
template<class T> Object_identity   make_object_identity(const T& object, const Type_resolver&);
template<class T> Object_identity   make_object_identity(const T& object);
WARDEN_ACL_DECL Object_identity     make_object_identity(const Dynamic_object&, const Type_resolver&);
WARDEN_ACL_DECL Object_identity     make_object_identity(const Dynamic_object&);


/*
    Object Identity Formatting
*/
WARDEN_ACL_DECL std::string     to_string(const Object_identity&);
WARDEN_ACL_DECL std::ostream&   operator<<(std::ostream&, const Object_identity&);


}   // Acl
}   // Warden


/*
    Standard Hashing
*/
namespace std {


template<>
struct hash<Warden::Acl::Object_identity> {
    std::size_t operator()(const Warden::Acl::Object_identity& x) const { return hash_value(x); }
};


}   // std


// External Definitions
#include "warden/acl/object_identity.inl"

#endif  // WARDEN_ACL_OBJECT_IDENTITY_HPP

//  $CUSTOM_FOOTER$
