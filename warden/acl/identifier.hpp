//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/identifier.hpp
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

#ifndef WARDEN_ACL_IDENTIFIER_HPP
#define WARDEN_ACL_IDENTIFIER_HPP

#include "warden/acl/config.hpp"
#include "boost/blank.hpp"
#include "boost/operators.hpp"
#include "boost/uuid/uuid.hpp"
#include "boost/variant.hpp"
#include <cstddef>
#include <functional>
#include <iosfwd>
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
using Identifier_value = boost::variant<
      boost::blank
    , short
    , unsigned short
    , int
    , unsigned int
    , long
    , long long
    , std::string
    , boost::uuids::uuid
>;


/*
    Identifier Kind
*/
enum class Identifier_kind : int {
    nil,
    integer,
    string,
    uuid
};


/*
    Identifier

    Identifies one instance of a domain type.  Integers of every width are
    interchangeable:  they compare and hash by their value widened to
    long long, whatever width they were stored at.  All other kinds compare
    by exact value.  A default-constructed Identifier is nil.

    Characters and booleans are not identifiers; constructing one from
    either does not compile.  Neither does unsigned long or unsigned long
    long, which cannot be widened to long long without loss.
*/
class WARDEN_ACL_DECL Identifier : boost::totally_ordered<Identifier> {
public:
    // Construct/Copy/Move
    Identifier() = default;
    Identifier(short);
    Identifier(unsigned short);
    Identifier(int);
    Identifier(unsigned int);
    Identifier(long);
    Identifier(long long);
    Identifier(const char*);
    Identifier(std::string);
    Identifier(const boost::uuids::uuid&);
    Identifier(char) = delete;
    Identifier(bool) = delete;
    Identifier(const Identifier&) = default;
    Identifier& operator=(const Identifier&) = default;
    Identifier(Identifier&&);
    Identifier& operator=(Identifier&&);
    friend void swap(Identifier&, Identifier&);

    // Observers
    Identifier_kind         kind() const;
    bool                    is_integer() const;
    long long               integer() const;
    const Identifier_value& value() const;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    friend WARDEN_ACL_DECL bool operator==(const Identifier&, const Identifier&);
    friend WARDEN_ACL_DECL bool operator< (const Identifier&, const Identifier&);

    // Hashing
    friend WARDEN_ACL_DECL std::size_t hash_value(const Identifier&);

private:
    // Data
    Identifier_value val;
};


/*
    Identifier Formatting
*/
WARDEN_ACL_DECL std::string     to_string(const Identifier&);
WARDEN_ACL_DECL std::ostream&   operator<<(std::ostream&, const Identifier&);


}   // Acl
}   // Warden


/*
    Standard Hashing
*/
namespace std {


template<>
struct hash<Warden::Acl::Identifier> {
    std::size_t operator()(const Warden::Acl::Identifier& x) const { return hash_value(x); }
};


}   // std


// External Definitions
#include "warden/acl/identifier.inl"

#endif  // WARDEN_ACL_IDENTIFIER_HPP

//  $CUSTOM_FOOTER$
