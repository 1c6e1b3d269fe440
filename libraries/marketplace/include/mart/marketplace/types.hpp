#pragma once

#include <mart/db/field_store.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <fc/optional.hpp>
#include <fc/variant.hpp>
#include <fc/reflect/variant.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mart { namespace marketplace {

    typedef boost::multiprecision::uint256_t  uint256;
    typedef mart::db::word_type               word_type;

    typedef uint256                           listing_id_type;
    typedef uint256                           bid_id_type;
    typedef uint256                           token_id_type;
    typedef uint32_t                          method_selector_type;
    typedef std::vector<char>                 bytes;

    using std::string;
    using std::vector;
    using std::pair;
    using std::shared_ptr;
    using fc::variant;
    using fc::optional;

    /** 32 byte big endian encoding, the layout of every integer in storage and on the wire */
    word_type                                 to_word( const uint256& value );
    word_type                                 to_word( bool value );
    void                                      from_word( const word_type& w, uint256& value );
    void                                      from_word( const word_type& w, bool& value );

    /** @throws addition_overflow rather than wrapping */
    uint256                                   safe_add( const uint256& a, const uint256& b );

} } // mart::marketplace

namespace fc
{
    void to_variant( const mart::marketplace::uint256& var,  fc::variant& vo );
    void from_variant( const fc::variant& var,  mart::marketplace::uint256& vo );
}
