//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/object_identity.inl
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
    Object Identity
*/
inline const Type&
Object_identity::type() const
{
    return what;
}


inline const Identifier&
Object_identity::identifier() const
{
    return which;
}


inline bool
operator==(const Object_identity& x, const Object_identity& y)
{
    if (x.which != y.which) return false;
    if (x.what != y.what) return false;
    return true;
}


inline bool
operator< (const Object_identity& x, const Object_identity& y)
{
    if (x.what < y.what) return true;
    if (y.what < x.what) return false;
    if (x.which < y.which) return true;
    return false;
}


inline void
swap(Object_identity& x, Object_identity& y)
{
    using std::swap;

    swap(x.what, y.what);
    swap(x.which, y.which);
}


/*
    Object Identity Construction
*/
template<class T>
Object_identity
make_object_identity(const T& object, const Type_resolver& types)
{
    static_assert(Has_identity_accessor<T>::value, "domain object type has no identity accessor");

    const auto& target  = Canonical_object<T>::get(object);
    const Type  type    = types.resolve(std::type_index(typeid(target)));
    Identifier  id;

    try {
        id = Detail::make_identifier(Identity_accessor<T>::get(object));
    } catch (...) {
        throw Identity_unavailable("could not extract identity from object of type " + type.name(), std::current_exception());
    }

    if (!id) {
        const Invalid_argument null{"identity accessor of " + type.name() + " returned null"};
        throw Identity_unavailable(null.what(), std::make_exception_ptr(null));
    }

    return Object_identity(type, std::move(id));
}


template<class T>
inline Object_identity
make_object_identity(const T& object)
{
    return make_object_identity(object, default_type_resolver());
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
