//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/type_resolver.hpp
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

#ifndef WARDEN_ACL_TYPE_RESOLVER_HPP
#define WARDEN_ACL_TYPE_RESOLVER_HPP

#include "warden/acl/config.hpp"
#include "warden/acl/type.hpp"
#include "boost/operators.hpp"
#include "boost/optional.hpp"
#include <memory>
#include <typeindex>
#include <utility>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Type Resolver

    Maps type names, and the native C++ types bound to them, onto Type
    handles.
*/
class WARDEN_ACL_DECL Type_resolver : boost::totally_ordered<Type_resolver> {
public:
    // Names/Types
    class Interface;
    using Interface_ptr = std::shared_ptr<Interface>;

    // Construct/Copy/Move
    Type_resolver(Interface_ptr = Interface_ptr());
    Type_resolver(const Type_resolver&) = default;
    Type_resolver& operator=(const Type_resolver&) = default;
    Type_resolver(Type_resolver&&);
    Type_resolver& operator=(Type_resolver&&);
    friend void swap(Type_resolver&, Type_resolver&);

    // Lookup
    boost::optional<Type> find(const Type_name&) const;
    boost::optional<Type> find(std::type_index) const;

    // Resolution
    Type resolve(const Type_name&) const;
    Type resolve(std::type_index) const;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    friend bool operator==(const Type_resolver&, const Type_resolver&);
    friend bool operator< (const Type_resolver&, const Type_resolver&);

private:
    // Data
    Interface_ptr ifacep;
};


/*
    Type Resolver Interface
*/
class Type_resolver::Interface {
public:
    // Construct/Copy/Destroy
    Interface() = default;
    Interface(const Interface&) = delete;
    Interface& operator=(const Interface&) = delete;
    virtual ~Interface() = default;

    // Lookup
    virtual boost::optional<Type> find(const Type_name&) const = 0;
    virtual boost::optional<Type> find(std::type_index) const = 0;
};


}   // Acl
}   // Warden


// External Definitions
#include "warden/acl/type_resolver.inl"

#endif  // WARDEN_ACL_TYPE_RESOLVER_HPP

//  $CUSTOM_FOOTER$
