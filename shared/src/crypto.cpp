#include "vidyeet/crypto.hpp"

#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace vidyeet::crypto
{

    namespace
    {

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           {
                               if (sodium_init() < 0)
                               {
                                   throw std::runtime_error("libsodium initialization failed");
                               } });
        }

    } // namespace

    std::uint32_t random_uniform(std::uint32_t upper_bound)
    {
        if (upper_bound == 0)
        {
            return 0;
        }
        ensure_initialized_once();
        return randombytes_uniform(upper_bound);
    }

    void secure_wipe(std::string &secret)
    {
        if (!secret.empty())
        {
            sodium_memzero(secret.data(), secret.size());
        }
        secret.clear();
    }

} // namespace vidyeet::crypto
