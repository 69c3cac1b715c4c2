//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/type.hpp
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

#ifndef WARDEN_ACL_TYPE_HPP
#define WARDEN_ACL_TYPE_HPP

#include "warden/acl/config.hpp"
#include "warden/acl/error.hpp"
#include "boost/container_hash/hash.hpp"
#include "boost/operators.hpp"
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Names/Types
*/
using Type_name = std::string;


/*
    Type

    Handle to a resolved domain type.  Two handles denote the same type
    only if their names are identical; no subtype relation is considered.
*/
class Type : boost::totally_ordered<Type> {
public:
    // Construct/Copy/Move
    Type() = default;
    explicit Type(Type_name);
    Type(const Type&) = default;
    Type& operator=(const Type&) = default;
    Type(Type&&);
    Type& operator=(Type&&);
    friend void swap(Type&, Type&);

    // Observers
    const Type_name& name() const;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    friend bool operator==(const Type&, const Type&);
    friend bool operator< (const Type&, const Type&);

    // Hashing
    friend std::size_t hash_value(const Type&);

private:
    // Data
    Type_name id;
};


/*
    Type Formatting
*/
std::ostream& operator<<(std::ostream&, const Type&);


}   // Acl
}   // Warden


/*
    Standard Hashing
*/
namespace std {


template<>
struct hash<Warden::Acl::Type> {
    std::size_t operator()(const Warden::Acl::Type& x) const { return hash_value(x); }
};


}   // std


// External Definitions
#include "warden/acl/type.inl"

#endif  // WARDEN_ACL_TYPE_HPP

//  $CUSTOM_FOOTER$
