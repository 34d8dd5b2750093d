#include "errors.hpp"

#define STRERROR_GEN(code, name, str) \
    case code:                        \
        return str;
const char* Error::strerror() const
{
    switch (code) {
        ADDITIONAL_ERRNO_MAP(STRERROR_GEN)
    }
    return "unknown error";
}
#undef STRERROR_GEN

#define ERR_NAME_GEN(code, name, _) \
    case code:                      \
        return #name;
const char* Error::err_name() const
{

    switch (code) {
        ADDITIONAL_ERRNO_MAP(ERR_NAME_GEN)
    }
    return "unknown";
#undef ERR_NAME_GEN
}

std::string Error::format() const { return std::string(err_name()) + " (" + strerror() + ")"; }

bool Error::retryable() const
{
    switch (code) {
    case ELOCKEDOP:
        return true;
    default:
        return false;
    }
}
