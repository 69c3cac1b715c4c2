//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/type_resolver.inl
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


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Type Resolver
*/
inline
Type_resolver::Type_resolver(Interface_ptr p)
    : ifacep{std::move(p)}
{
}


inline
Type_resolver::Type_resolver(Type_resolver&& other)
    : ifacep{std::move(other.ifacep)}
{
}


inline Type_resolver&
Type_resolver::operator=(Type_resolver&& other)
{
    ifacep = std::move(other.ifacep);
    return *this;
}


inline
Type_resolver::operator bool() const
{
    return ifacep ? true : false;
}


inline bool
operator==(const Type_resolver& x, const Type_resolver& y)
{
    return x.ifacep == y.ifacep;
}


inline bool
operator< (const Type_resolver& x, const Type_resolver& y)
{
    return x.ifacep < y.ifacep;
}


inline void
swap(Type_resolver& x, Type_resolver& y)
{
    using std::swap;

    swap(x.ifacep, y.ifacep);
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
