//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/identifier.inl
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
    Identifier
*/
inline
Identifier::Identifier(short n)
    : val{n}
{
}


inline
Identifier::Identifier(unsigned short n)
    : val{n}
{
}


inline
Identifier::Identifier(int n)
    : val{n}
{
}


inline
Identifier::Identifier(unsigned int n)
    : val{n}
{
}


inline
Identifier::Identifier(long n)
    : val{n}
{
}


inline
Identifier::Identifier(long long n)
    : val{n}
{
}


inline
Identifier::Identifier(const char* s)
{
    if (s)
        val = std::string(s);
}


inline
Identifier::Identifier(std::string s)
    : val{std::move(s)}
{
}


inline
Identifier::Identifier(const boost::uuids::uuid& u)
    : val{u}
{
}


inline
Identifier::Identifier(Identifier&& other)
    : val{std::move(other.val)}
{
    other.val = boost::blank();
}


inline Identifier&
Identifier::operator=(Identifier&& other)
{
    if (this != &other) {
        val = std::move(other.val);
        other.val = boost::blank();
    }

    return *this;
}


inline bool
Identifier::is_integer() const
{
    return kind() == Identifier_kind::integer;
}


inline const Identifier_value&
Identifier::value() const
{
    return val;
}


inline
Identifier::operator bool() const
{
    return kind() != Identifier_kind::nil;
}


inline void
swap(Identifier& x, Identifier& y)
{
    using std::swap;

    swap(x.val, y.val);
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
