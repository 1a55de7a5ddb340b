#include "crypto/sha/sha256.hpp"

#include <memory>

#include <openssl/evp.h>

namespace qstore::crypto
{
    base::Hash256 sha256( std::string_view input )
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto *bytes_ptr = reinterpret_cast<const uint8_t *>( input.data() );
        return sha256( gsl::make_span( bytes_ptr, input.length() ) );
    }

    base::Hash256 sha256( gsl::span<const uint8_t> input )
    {
        base::Hash256 out;
        unsigned int  digest_len = 0;

        std::unique_ptr<EVP_MD_CTX, decltype( &EVP_MD_CTX_free )> ctx( EVP_MD_CTX_new(), &EVP_MD_CTX_free );
        EVP_DigestInit_ex( ctx.get(), EVP_sha256(), nullptr );
        EVP_DigestUpdate( ctx.get(), input.data(), input.size() );
        EVP_DigestFinal_ex( ctx.get(), out.data(), &digest_len );

        return out;
    }
} // namespace qstore::crypto
