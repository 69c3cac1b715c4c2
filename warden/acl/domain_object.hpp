//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/domain_object.hpp
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

#ifndef WARDEN_ACL_DOMAIN_OBJECT_HPP
#define WARDEN_ACL_DOMAIN_OBJECT_HPP

#include "warden/acl/config.hpp"
#include "warden/acl/identifier.hpp"
#include "warden/acl/type.hpp"
#include "boost/operators.hpp"
#include "boost/optional.hpp"
#include <memory>
#include <string>
#include <type_traits>
#include <utility>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Names/Types
*/
using Accessor_name = std::string;


/*
    Constants
*/
constexpr const char* identity_accessor_name = "id";


/*
    Identity Accessor

    Yields the identifier of a domain object.  By default the object's
    id() member is called.  Specialize for domain types whose identifier is
    obtained some other way.  The result must be convertible to an
    Identifier, or be a boost::optional of such a type (empty meaning
    null).
*/
template<class T>
struct Identity_accessor {
    template<class U = T>
    static auto get(const U& x) -> decltype(x.id())
    {
        return x.id();
    }
};


/*
    Identity Accessor Detection
*/
template<class T, class = void>
struct Has_identity_accessor : std::false_type {
};


template<class T>
struct Has_identity_accessor<T, std::void_t<decltype(Identity_accessor<T>::get(std::declval<const T&>()))>>
    : std::true_type {
};


/*
    Canonical Object

    Unwraps a domain object to the object whose type is its effective
    type.  Components that wrap domain objects (proxies, decorators)
    specialize this for their wrapper types; a plain object is its own
    canonical object.
*/
template<class T>
struct Canonical_object {
    static const T& get(const T& x)
    {
        return x;
    }
};


/*
    Dynamic Object

    A domain object whose type and accessors are only known at run time.
*/
class WARDEN_ACL_DECL Dynamic_object : boost::totally_ordered<Dynamic_object> {
public:
    // Names/Types
    class Interface;
    using Interface_ptr = std::shared_ptr<Interface>;

    // Construct/Copy/Move
    Dynamic_object(Interface_ptr = Interface_ptr());
    Dynamic_object(const Dynamic_object&) = default;
    Dynamic_object& operator=(const Dynamic_object&) = default;
    Dynamic_object(Dynamic_object&&);
    Dynamic_object& operator=(Dynamic_object&&);
    friend void swap(Dynamic_object&, Dynamic_object&);

    // Type
    Type_name type_name() const;

    // Accessor Invocation
    boost::optional<Identifier> invoke(const Accessor_name&) const;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    friend bool operator==(const Dynamic_object&, const Dynamic_object&);
    friend bool operator< (const Dynamic_object&, const Dynamic_object&);

private:
    // Data
    Interface_ptr ifacep;
};


/*
    Dynamic Object Interface

    type_name() answers the effective type, with any wrapping already
    removed.  invoke() answers boost::none if the object has no accessor
    of the given name, and may throw if the accessor fails.
*/
class Dynamic_object::Interface {
public:
    // Construct/Copy/Destroy
    Interface() = default;
    Interface(const Interface&) = delete;
    Interface& operator=(const Interface&) = delete;
    virtual ~Interface() = default;

    // Type
    virtual Type_name type_name() const = 0;

    // Accessor Invocation
    virtual boost::optional<Identifier> invoke(const Accessor_name&) const = 0;
};


/*
    Implementation Details
*/
namespace Detail {


inline Identifier
make_identifier(Identifier id)
{
    return id;
}


template<class T>
inline Identifier
make_identifier(const boost::optional<T>& x)
{
    return x ? Identifier(*x) : Identifier();
}


}   // Detail


}   // Acl
}   // Warden


// External Definitions
#include "warden/acl/domain_object.inl"

#endif  // WARDEN_ACL_DOMAIN_OBJECT_HPP

//  $CUSTOM_FOOTER$
