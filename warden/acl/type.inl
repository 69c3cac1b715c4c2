//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/type.inl
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
    Type
*/
inline
Type::Type(Type_name name)
    : id{std::move(name)}
{
    if (id.empty())
        throw Invalid_argument("type name required");
}


inline
Type::Type(Type&& other)
    : id{std::move(other.id)}
{
    other.id.clear();
}


inline Type&
Type::operator=(Type&& other)
{
    if (this != &other) {
        id = std::move(other.id);
        other.id.clear();
    }

    return *this;
}


inline const Type_name&
Type::name() const
{
    return id;
}


inline
Type::operator bool() const
{
    return !id.empty();
}


inline bool
operator==(const Type& x, const Type& y)
{
    return x.id == y.id;
}


inline bool
operator< (const Type& x, const Type& y)
{
    return x.id < y.id;
}


inline std::size_t
hash_value(const Type& x)
{
    return boost::hash<Type_name>()(x.id);
}


inline void
swap(Type& x, Type& y)
{
    using std::swap;

    swap(x.id, y.id);
}


inline std::ostream&
operator<<(std::ostream& os, const Type& x)
{
    return os << x.name();
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
